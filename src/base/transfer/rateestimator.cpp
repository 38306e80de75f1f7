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

#include "rateestimator.h"

qint64 Transfer::computeRate(const qint64 previousBytes, const QDateTime &previousTime
    , const qint64 currentBytes, const QDateTime &currentTime, const qint64 previousRate)
{
    const qint64 elapsedMSecs = previousTime.msecsTo(currentTime);
    if (elapsedMSecs <= 0)
        return previousRate;

    const qint64 delta = currentBytes - previousBytes;
    if (delta <= 0)
        return 0;

    return (delta * 1000) / elapsedMSecs;
}

Transfer::SpeedSample Transfer::RateEstimator::addSample(const ByteSample &bytes, const QDateTime &timestamp)
{
    if (!m_baseline)
    {
        m_baseline = Baseline {bytes, timestamp};
        m_rate = {};
        return m_rate;
    }

    // two samples within the same tick keep the older baseline
    if (m_baseline->timestamp.msecsTo(timestamp) <= 0)
        return m_rate;

    m_rate.download = computeRate(m_baseline->bytes.download, m_baseline->timestamp, bytes.download, timestamp, m_rate.download);
    m_rate.upload = computeRate(m_baseline->bytes.upload, m_baseline->timestamp, bytes.upload, timestamp, m_rate.upload);
    m_baseline = Baseline {bytes, timestamp};
    return m_rate;
}

Transfer::SpeedSample Transfer::RateEstimator::rate() const
{
    return m_rate;
}

bool Transfer::RateEstimator::hasHistory() const
{
    return m_baseline.has_value();
}

void Transfer::RateEstimator::reset()
{
    m_baseline.reset();
    m_rate = {};
}
