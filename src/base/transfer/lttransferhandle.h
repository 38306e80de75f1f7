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

#include <libtorrent/bitfield.hpp>
#include <libtorrent/download_priority.hpp>
#include <libtorrent/fwd.hpp>
#include <libtorrent/torrent_handle.hpp>
#include <libtorrent/torrent_status.hpp>

#include <QList>
#include <QReadWriteLock>

#include "transferhandle.h"

namespace Transfer
{
    // libtorrent backed handle. `nativeSession` must outlive it.
    // Accessors read the status cached from the last engine update, only
    // the control operations talk to the libtorrent network thread.
    class LTTransferHandle final : public TransferHandle
    {
    public:
        static const lt::status_flags_t STATUS_QUERY_FLAGS;

        LTTransferHandle(lt::session *nativeSession, const lt::torrent_handle &nativeHandle, const lt::torrent_status &nativeStatus);

        static TransferID idFromInfoHashes(const lt::info_hash_t &infoHashes);

        TransferID id() const override;
        bool isValid() const noexcept override;
        bool hasMetadata() const override;

        QString name() const override;
        qint64 totalSize() const override;
        qint64 completedSize() const override;
        qint64 totalUpload() const override;
        QList<TransferFile> files() const override;
        QList<qint64> filesCompletedSize() const override;
        int peersCount() const override;
        int seedsCount() const override;
        bool isSeeding() const override;
        QString contentPath() const override;

        void downloadAll() override;
        void cancelAllPieces() override;
        void drop() noexcept override;

        lt::torrent_handle nativeHandle() const;

        // Called by the engine from its own thread
        void handleStateUpdate(const lt::torrent_status &nativeStatus);

    private:
        void updateFilesProgress(const lt::typed_bitfield<lt::piece_index_t> &pieces);
        void setAllPiecesPriority(lt::download_priority_t priority);

        lt::session *m_nativeSession = nullptr;
        lt::torrent_handle m_nativeHandle;
        const TransferID m_id;

        mutable QReadWriteLock m_statusLock;
        lt::torrent_status m_nativeStatus;
        std::shared_ptr<const lt::torrent_info> m_torrentInfo;
        lt::typed_bitfield<lt::piece_index_t> m_countedPieces;
        QList<qint64> m_filesProgress;
    };
}
