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

#include "lttransferhandle.h"

#include <vector>

#include <libtorrent/file_storage.hpp>
#include <libtorrent/session.hpp>
#include <libtorrent/torrent_flags.hpp>
#include <libtorrent/torrent_info.hpp>

#include <QByteArray>
#include <QDir>

#include "base/exceptions.h"
#include "base/logger.h"

namespace
{
    RuntimeError toRuntimeError(const lt::system_error &err)
    {
        return RuntimeError(QString::fromLocal8Bit(err.what()));
    }
}

const lt::status_flags_t Transfer::LTTransferHandle::STATUS_QUERY_FLAGS = lt::torrent_handle::query_name
    | lt::torrent_handle::query_save_path | lt::torrent_handle::query_torrent_file | lt::torrent_handle::query_pieces;

Transfer::LTTransferHandle::LTTransferHandle(lt::session *nativeSession, const lt::torrent_handle &nativeHandle
        , const lt::torrent_status &nativeStatus)
    : m_nativeSession {nativeSession}
    , m_nativeHandle {nativeHandle}
    , m_id {idFromInfoHashes(nativeStatus.info_hashes)}
{
    handleStateUpdate(nativeStatus);
}

Transfer::TransferID Transfer::LTTransferHandle::idFromInfoHashes(const lt::info_hash_t &infoHashes)
{
    const lt::sha1_hash hash = infoHashes.get_best();
    return QString::fromLatin1(QByteArray(hash.data(), static_cast<int>(hash.size())).toHex());
}

Transfer::TransferID Transfer::LTTransferHandle::id() const
{
    return m_id;
}

bool Transfer::LTTransferHandle::isValid() const noexcept
{
    return m_nativeHandle.is_valid();
}

bool Transfer::LTTransferHandle::hasMetadata() const
{
    const QReadLocker locker {&m_statusLock};
    return m_nativeStatus.has_metadata;
}

QString Transfer::LTTransferHandle::name() const
{
    const QReadLocker locker {&m_statusLock};
    return QString::fromStdString(m_nativeStatus.name);
}

qint64 Transfer::LTTransferHandle::totalSize() const
{
    const QReadLocker locker {&m_statusLock};
    return m_torrentInfo ? m_torrentInfo->total_size() : 0;
}

qint64 Transfer::LTTransferHandle::completedSize() const
{
    const QReadLocker locker {&m_statusLock};
    return m_nativeStatus.total_done;
}

qint64 Transfer::LTTransferHandle::totalUpload() const
{
    const QReadLocker locker {&m_statusLock};
    return m_nativeStatus.all_time_upload;
}

QList<Transfer::TransferFile> Transfer::LTTransferHandle::files() const
{
    const QReadLocker locker {&m_statusLock};
    if (!m_torrentInfo)
        return {};

    const lt::file_storage &storage = m_torrentInfo->files();
    QList<TransferFile> result;
    result.reserve(storage.num_files());
    for (const lt::file_index_t index : storage.file_range())
        result.append({QString::fromStdString(storage.file_path(index)), storage.file_size(index)});
    return result;
}

QList<qint64> Transfer::LTTransferHandle::filesCompletedSize() const
{
    const QReadLocker locker {&m_statusLock};
    return m_filesProgress;
}

int Transfer::LTTransferHandle::peersCount() const
{
    const QReadLocker locker {&m_statusLock};
    return m_nativeStatus.num_peers;
}

int Transfer::LTTransferHandle::seedsCount() const
{
    const QReadLocker locker {&m_statusLock};
    return m_nativeStatus.num_seeds;
}

bool Transfer::LTTransferHandle::isSeeding() const
{
    const QReadLocker locker {&m_statusLock};
    return m_nativeStatus.is_seeding;
}

QString Transfer::LTTransferHandle::contentPath() const
{
    const QReadLocker locker {&m_statusLock};
    if (m_nativeStatus.name.empty())
        return {};

    return QDir(QString::fromStdString(m_nativeStatus.save_path)).filePath(QString::fromStdString(m_nativeStatus.name));
}

lt::torrent_handle Transfer::LTTransferHandle::nativeHandle() const
{
    return m_nativeHandle;
}

void Transfer::LTTransferHandle::handleStateUpdate(const lt::torrent_status &nativeStatus)
{
    const QWriteLocker locker {&m_statusLock};
    if (!m_torrentInfo)
        m_torrentInfo = nativeStatus.torrent_file.lock();

    m_nativeStatus = nativeStatus;
    updateFilesProgress(nativeStatus.pieces);
}

// Must be called with m_statusLock held for writing
void Transfer::LTTransferHandle::updateFilesProgress(const lt::typed_bitfield<lt::piece_index_t> &pieces)
{
    if (!m_torrentInfo || pieces.empty())
        return;

    const lt::file_storage &storage = m_torrentInfo->files();
    if (m_filesProgress.size() != storage.num_files())
    {
        m_filesProgress = QList<qint64>(storage.num_files(), 0);
        m_countedPieces.clear();
    }
    if (m_countedPieces.size() != pieces.size())
        m_countedPieces.resize(pieces.size(), false);

    for (int i = 0; i < pieces.size(); ++i)
    {
        const lt::piece_index_t index {i};
        const bool have = pieces.get_bit(index);
        if (have == m_countedPieces.get_bit(index))
            continue;

        // a recheck can take pieces away again
        const qint64 sign = have ? 1 : -1;
        if (have)
            m_countedPieces.set_bit(index);
        else
            m_countedPieces.clear_bit(index);

        for (const lt::file_slice &slice : storage.map_block(index, 0, storage.piece_size(index)))
            m_filesProgress[static_cast<int>(slice.file_index)] += sign * slice.size;
    }
}

void Transfer::LTTransferHandle::setAllPiecesPriority(const lt::download_priority_t priority)
{
    std::shared_ptr<const lt::torrent_info> info;
    {
        const QReadLocker locker {&m_statusLock};
        info = m_torrentInfo;
    }
    if (!info)
        return;

    m_nativeHandle.prioritize_pieces(std::vector<lt::download_priority_t>(info->num_pieces(), priority));
}

void Transfer::LTTransferHandle::downloadAll()
try
{
    setAllPiecesPriority(lt::default_priority);
    m_nativeHandle.set_flags(lt::torrent_flags::auto_managed);
    m_nativeHandle.resume();
}
catch (const lt::system_error &err)
{
    throw toRuntimeError(err);
}

void Transfer::LTTransferHandle::cancelAllPieces()
try
{
    setAllPiecesPriority(lt::dont_download);
    // a paused torrent neither requests pieces nor serves them
    m_nativeHandle.unset_flags(lt::torrent_flags::auto_managed);
    m_nativeHandle.pause();
}
catch (const lt::system_error &err)
{
    throw toRuntimeError(err);
}

void Transfer::LTTransferHandle::drop() noexcept
{
    if (!m_nativeHandle.is_valid())
        return;

    try
    {
        m_nativeSession->remove_torrent(m_nativeHandle, lt::session::delete_partfile);
    }
    catch (const lt::system_error &err)
    {
        LogMsg(QString::fromLocal8Bit(err.what()), Log::WARNING);
    }
}
