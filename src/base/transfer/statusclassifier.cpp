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

#include "statusclassifier.h"

#include <QCoreApplication>

#include "base/utils/string.h"

namespace
{
    const double SECONDS_PER_MINUTE = 60;
    const double SECONDS_PER_HOUR = 60 * SECONDS_PER_MINUTE;
    const double SECONDS_PER_DAY = 24 * SECONDS_PER_HOUR;
}

Transfer::StatusClassifier::StatusClassifier(const qint64 minimumETARate)
    : m_minimumETARate {minimumETARate}
{
}

Transfer::StatusResult Transfer::StatusClassifier::classify(const StatusInput &input) const
{
    StatusResult result;

    if (!input.hasMetadata)
    {
        result.state = TransferState::Discovering;
        result.statusText = QCoreApplication::translate("StatusClassifier", "Discovering");
        return result;
    }

    if (input.isPaused)
    {
        result.state = TransferState::Paused;
        result.statusText = QCoreApplication::translate("StatusClassifier", "Paused");
        return result;
    }

    const qreal progress = computeProgress(input.currentBytes, input.totalSize);
    if (progress >= 1)
    {
        result.state = TransferState::Completed;
        result.statusText = QCoreApplication::translate("StatusClassifier", "Completed");
        result.newlyCompleted = (input.previousState != TransferState::Completed)
            && (input.previousBytes < input.totalSize)
            && (input.totalSize <= input.currentBytes);
        return result;
    }

    // partial or selective downloads may already serve pieces to others
    if (input.isSeeding)
    {
        result.state = TransferState::Seeding;
        result.statusText = QCoreApplication::translate("StatusClassifier", "Seeding");
        return result;
    }

    result.state = TransferState::Downloading;
    result.statusText = QCoreApplication::translate("StatusClassifier", "Downloading (%1%)", "Downloading (10.0%)")
        .arg(Utils::String::fromDouble((progress * 100), 1));
    result.eta = estimateETA((input.totalSize - input.currentBytes), input.downloadRate);
    return result;
}

QString Transfer::StatusClassifier::estimateETA(const qint64 remainingBytes, const qint64 downloadRate) const
{
    // slow rates give a meaningless estimate
    if (downloadRate <= m_minimumETARate)
        return unknownETA();

    return formatETA(static_cast<double>(remainingBytes) / downloadRate);
}

QString Transfer::StatusClassifier::formatETA(const double seconds)
{
    if (seconds < SECONDS_PER_MINUTE)
        return QCoreApplication::translate("StatusClassifier", "%1 sec").arg(QString::number(seconds, 'f', 0));
    if (seconds < SECONDS_PER_HOUR)
        return QCoreApplication::translate("StatusClassifier", "%1 min").arg(QString::number((seconds / SECONDS_PER_MINUTE), 'f', 1));
    if (seconds < SECONDS_PER_DAY)
        return QCoreApplication::translate("StatusClassifier", "%1 hours").arg(QString::number((seconds / SECONDS_PER_HOUR), 'f', 1));

    return QCoreApplication::translate("StatusClassifier", "%1 days").arg(QString::number((seconds / SECONDS_PER_DAY), 'f', 1));
}

QString Transfer::StatusClassifier::unknownETA()
{
    return QCoreApplication::translate("StatusClassifier", "unknown");
}
