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

#pragma once

#include <memory>

#include <libtorrent/add_torrent_params.hpp>
#include <libtorrent/fwd.hpp>
#include <libtorrent/info_hash.hpp>

#include <QHash>
#include <QString>

#include "transferengine.h"

class QTimer;

namespace Transfer
{
    class LTTransferHandle;

    class LTTransferEngine final : public TransferEngine
    {
        Q_OBJECT
        Q_DISABLE_COPY_MOVE(LTTransferEngine)

    public:
        explicit LTTransferEngine(const QString &savePath, QObject *parent = nullptr);
        ~LTTransferEngine() override;

        QString savePath() const;

        AddResult addFromMagnet(const QString &reference) override;
        AddResult addFromFile(const QString &path) override;

    private:
        AddResult addTransfer(lt::add_torrent_params params);
        std::shared_ptr<LTTransferHandle> findHandle(const lt::info_hash_t &infoHashes) const;
        TransferID transferIDFor(const lt::info_hash_t &infoHashes) const;

        void readAlerts();
        void handleAlert(const lt::alert *alert);
        void handleMetadataReceivedAlert(const lt::metadata_received_alert *alert);
        void handleStateUpdateAlert(const lt::state_update_alert *alert);
        void handleTorrentDeletedAlert(const lt::torrent_deleted_alert *alert);
        void handleTorrentDeleteFailedAlert(const lt::torrent_delete_failed_alert *alert);

        QString m_savePath;
        std::unique_ptr<lt::session> m_nativeSession;
        QTimer *m_alertsTimer = nullptr;
        // keyed by the id the transfer was registered with
        QHash<TransferID, std::weak_ptr<LTTransferHandle>> m_handles;
    };
}
