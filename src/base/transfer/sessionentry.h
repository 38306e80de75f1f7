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

#include <QDateTime>
#include <QList>
#include <QMetaType>
#include <QString>

#include "transferhandle.h"

namespace Transfer
{
    enum class TransferState
    {
        Discovering,
        Downloading,
        Paused,
        Seeding,
        Completed
    };

    struct FileEntry
    {
        QString path;
        qint64 size = 0;
        qreal progress = 0;
    };

    // Display record of one transfer, derived from its handle on every refresh cycle
    struct SessionEntry
    {
        TransferID id;
        QString name;
        qint64 totalSize = 0;
        qint64 downloadedBytes = 0;
        qint64 uploadedBytes = 0;
        qreal progress = 0;
        qint64 downloadRate = 0;
        qint64 uploadRate = 0;
        TransferState state = TransferState::Discovering;
        QString statusText;
        QString eta;
        int peers = 0;
        int seeds = 0;
        QList<FileEntry> files;
        bool isPaused = false;
        QString contentPath;
        QDateTime addedAt;
        QDateTime lastSampledAt;

        qsizetype fileCount() const;
        qint64 remainingBytes() const;
    };

    // `completed / total` clamped to [0, 1]; 0 while the total is unknown
    qreal computeProgress(qint64 completed, qint64 total);
}

Q_DECLARE_METATYPE(Transfer::SessionEntry)
