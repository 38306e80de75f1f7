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

#include <QList>
#include <QString>
#include <QtTypes>

namespace Transfer
{
    using TransferID = QString;

    struct TransferFile
    {
        QString path;
        qint64 size = 0;
    };

    // Engine side of one registered transfer.
    // Accessors throw RuntimeError when the engine cannot answer right now.
    class TransferHandle
    {
    public:
        virtual ~TransferHandle() = default;

        virtual TransferID id() const = 0;
        virtual bool isValid() const noexcept = 0;
        virtual bool hasMetadata() const = 0;

        virtual QString name() const = 0;
        virtual qint64 totalSize() const = 0;
        virtual qint64 completedSize() const = 0;
        virtual qint64 totalUpload() const = 0;
        virtual QList<TransferFile> files() const = 0;
        // Completed bytes of each file, in files() order.
        // Empty when the engine does not track per-file progress.
        virtual QList<qint64> filesCompletedSize() const = 0;
        virtual int peersCount() const = 0;
        virtual int seedsCount() const = 0;
        virtual bool isSeeding() const = 0;
        virtual QString contentPath() const = 0;

        virtual void downloadAll() = 0;
        virtual void cancelAllPieces() = 0;
        // Stops all network activity and forgets the transfer. Safe to call on an invalid handle.
        virtual void drop() noexcept = 0;
    };
}
