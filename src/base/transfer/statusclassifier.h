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

#include <QString>
#include <QtTypes>

#include "sessionentry.h"

namespace Transfer
{
    inline const qint64 DEFAULT_MINIMUM_ETA_RATE = 1024;

    struct StatusInput
    {
        bool hasMetadata = false;
        bool isPaused = false;
        bool isSeeding = false;
        qint64 totalSize = 0;
        qint64 previousBytes = 0;
        qint64 currentBytes = 0;
        qint64 downloadRate = 0;
        TransferState previousState = TransferState::Discovering;
    };

    struct StatusResult
    {
        TransferState state = TransferState::Discovering;
        QString statusText;
        QString eta;
        bool newlyCompleted = false;
    };

    class StatusClassifier
    {
    public:
        explicit StatusClassifier(qint64 minimumETARate = DEFAULT_MINIMUM_ETA_RATE);

        StatusResult classify(const StatusInput &input) const;
        QString estimateETA(qint64 remainingBytes, qint64 downloadRate) const;

        static QString formatETA(double seconds);
        static QString unknownETA();

    private:
        qint64 m_minimumETARate = DEFAULT_MINIMUM_ETA_RATE;
    };
}
