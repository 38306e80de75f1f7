/*
 * Bittorrent Client using Qt and libtorrent.
 * Copyright (C) 2026  qTransfer project
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License
 * as published by the Free Software Foundation; either version 2
 * of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301, USA.
 *
 * In addition, as a special exception, the copyright holders give permission to
 * link this program with the OpenSSL project's "OpenSSL" library (or with
 * modified versions of it that use the same license as the "OpenSSL" library),
 * and distribute the linked executables. You must obey the GNU General Public
 * License in all respects for all of the code used other than "OpenSSL".  If you
 * modify file(s), you may extend this exception to your version of the file(s),
 * but you are not obligated to do so. If you do not wish to do so, delete this
 * exception statement from your version.
 */

#include "lttransferengine.h"

#include <chrono>
#include <vector>

#include <libtorrent/alert_types.hpp>
#include <libtorrent/error_code.hpp>
#include <libtorrent/load_torrent.hpp>
#include <libtorrent/magnet_uri.hpp>
#include <libtorrent/session.hpp>
#include <libtorrent/session_params.hpp>
#include <libtorrent/settings_pack.hpp>
#include <libtorrent/torrent_info.hpp>

#include <QTimer>

#include "base/global.h"
#include "base/logger.h"
#include "base/utils/fs.h"
#include "base/utils/misc.h"
#include "base/version.h"
#include "lttransferhandle.h"

using namespace std::chrono_literals;

namespace
{
    const auto ALERTS_POLL_INTERVAL = 500ms;

    QString toMagnetURI(const QString &reference)
    {
        if (reference.startsWith(MAGNET_URI_PREFIX, Qt::CaseInsensitive))
            return reference;

        // bare info hashes, 0x12 0x20 is the multihash tag of SHA-256
        if (reference.size() == 64)
            return u"magnet:?xt=urn:btmh:1220" + reference;
        return u"magnet:?xt=urn:btih:" + reference;
    }
}

Transfer::LTTransferEngine::LTTransferEngine(const QString &savePath, QObject *parent)
    : TransferEngine(parent)
    , m_savePath {savePath}
    , m_alertsTimer {new QTimer(this)}
{
    lt::settings_pack pack;
    pack.set_int(lt::settings_pack::alert_mask, (lt::alert_category::error | lt::alert_category::status | lt::alert_category::storage));
    pack.set_str(lt::settings_pack::user_agent, QTR_USER_AGENT);
    m_nativeSession = std::make_unique<lt::session>(lt::session_params(pack));

    if (!Utils::Fs::mkpath(m_savePath))
        LogMsg(tr("Could not create download folder. Path: \"%1\"").arg(m_savePath), Log::WARNING);

    m_alertsTimer->setInterval(ALERTS_POLL_INTERVAL);
    connect(m_alertsTimer, &QTimer::timeout, this, &LTTransferEngine::readAlerts);
    m_alertsTimer->start();

    LogMsg(tr("Transfer engine started. libtorrent %1, Boost %2. Download folder: \"%3\"")
        .arg(Utils::Misc::libtorrentVersionString(), Utils::Misc::boostVersionString(), m_savePath));
}

Transfer::LTTransferEngine::~LTTransferEngine()
{
    m_alertsTimer->stop();
    // lt::session destructor blocks until the network threads are done
    m_nativeSession.reset();
}

QString Transfer::LTTransferEngine::savePath() const
{
    return m_savePath;
}

Transfer::TransferEngine::AddResult Transfer::LTTransferEngine::addFromMagnet(const QString &reference)
{
    lt::error_code ec;
    lt::add_torrent_params params = lt::parse_magnet_uri(toMagnetURI(reference).toStdString(), ec);
    if (ec)
        return nonstd::make_unexpected(tr("Invalid magnet link. Reason: %1").arg(QString::fromLocal8Bit(ec.message().c_str())));

    return addTransfer(std::move(params));
}

Transfer::TransferEngine::AddResult Transfer::LTTransferEngine::addFromFile(const QString &path)
try
{
    return addTransfer(lt::load_torrent_file(path.toStdString()));
}
catch (const lt::system_error &err)
{
    return nonstd::make_unexpected(tr("Invalid torrent file. File: \"%1\". Reason: %2").arg(path, QString::fromLocal8Bit(err.what())));
}

Transfer::TransferEngine::AddResult Transfer::LTTransferEngine::addTransfer(lt::add_torrent_params params)
try
{
    const lt::info_hash_t infoHashes = params.ti ? params.ti->info_hashes() : params.info_hashes;
    if (const std::shared_ptr<LTTransferHandle> existing = findHandle(infoHashes))
        return existing;

    params.save_path = m_savePath.toStdString();

    lt::error_code ec;
    const lt::torrent_handle nativeHandle = m_nativeSession->add_torrent(std::move(params), ec);
    if (ec)
        return nonstd::make_unexpected(QString::fromLocal8Bit(ec.message().c_str()));

    const auto handle = std::make_shared<LTTransferHandle>(m_nativeSession.get(), nativeHandle
        , nativeHandle.status(LTTransferHandle::STATUS_QUERY_FLAGS));
    m_handles.insert(handle->id(), handle);
    return handle;
}
catch (const lt::system_error &err)
{
    return nonstd::make_unexpected(QString::fromLocal8Bit(err.what()));
}

std::shared_ptr<Transfer::LTTransferHandle> Transfer::LTTransferEngine::findHandle(const lt::info_hash_t &infoHashes) const
{
    const std::shared_ptr<LTTransferHandle> handle = m_handles.value(transferIDFor(infoHashes)).lock();
    if (!handle || !handle->isValid())
        return nullptr;

    return handle;
}

Transfer::TransferID Transfer::LTTransferEngine::transferIDFor(const lt::info_hash_t &infoHashes) const
{
    // a hybrid transfer registered by its v1 hash keeps that id once the v2 hash is known
    if (infoHashes.has_v1() && infoHashes.has_v2())
    {
        const TransferID v1ID = LTTransferHandle::idFromInfoHashes(lt::info_hash_t(infoHashes.v1));
        if (m_handles.contains(v1ID))
            return v1ID;
    }

    return LTTransferHandle::idFromInfoHashes(infoHashes);
}

void Transfer::LTTransferEngine::readAlerts()
{
    std::vector<lt::alert *> alerts;
    m_nativeSession->pop_alerts(&alerts);
    for (const lt::alert *alert : alerts)
        handleAlert(alert);

    // answered by a state_update_alert on the next poll
    m_nativeSession->post_torrent_updates(LTTransferHandle::STATUS_QUERY_FLAGS);
}

void Transfer::LTTransferEngine::handleAlert(const lt::alert *alert)
try
{
    switch (alert->type())
    {
    case lt::metadata_received_alert::alert_type:
        handleMetadataReceivedAlert(static_cast<const lt::metadata_received_alert *>(alert));
        break;
    case lt::state_update_alert::alert_type:
        handleStateUpdateAlert(static_cast<const lt::state_update_alert *>(alert));
        break;
    case lt::torrent_deleted_alert::alert_type:
        handleTorrentDeletedAlert(static_cast<const lt::torrent_deleted_alert *>(alert));
        break;
    case lt::torrent_delete_failed_alert::alert_type:
        handleTorrentDeleteFailedAlert(static_cast<const lt::torrent_delete_failed_alert *>(alert));
        break;
    case lt::metadata_failed_alert::alert_type:
    case lt::torrent_error_alert::alert_type:
    case lt::file_error_alert::alert_type:
        LogMsg(QString::fromStdString(alert->message()), Log::WARNING);
        break;
    default:
        break;
    }
}
catch (const lt::system_error &err)
{
    LogMsg(tr("Failed to process engine alert. Reason: %1").arg(QString::fromLocal8Bit(err.what())), Log::WARNING);
}

void Transfer::LTTransferEngine::handleMetadataReceivedAlert(const lt::metadata_received_alert *alert)
{
    // refresh the cached status right away so the session can promote the transfer
    const lt::torrent_status nativeStatus = alert->handle.status(LTTransferHandle::STATUS_QUERY_FLAGS);
    const std::shared_ptr<LTTransferHandle> handle = findHandle(nativeStatus.info_hashes);
    if (!handle)
        return;

    handle->handleStateUpdate(nativeStatus);
    emit metadataReceived(handle->id());
}

void Transfer::LTTransferEngine::handleStateUpdateAlert(const lt::state_update_alert *alert)
{
    for (const lt::torrent_status &nativeStatus : alert->status)
    {
        if (const std::shared_ptr<LTTransferHandle> handle = findHandle(nativeStatus.info_hashes))
            handle->handleStateUpdate(nativeStatus);
    }
}

void Transfer::LTTransferEngine::handleTorrentDeletedAlert(const lt::torrent_deleted_alert *alert)
{
    const TransferID id = transferIDFor(alert->info_hashes);
    m_handles.remove(id);
    emit transferDropped(id, {});
}

void Transfer::LTTransferEngine::handleTorrentDeleteFailedAlert(const lt::torrent_delete_failed_alert *alert)
{
    const TransferID id = transferIDFor(alert->info_hashes);
    m_handles.remove(id);
    emit transferDropped(id, (alert->error ? QString::fromLocal8Bit(alert->error.message().c_str()) : QString()));
}
