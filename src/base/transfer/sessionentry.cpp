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

#include "sessionentry.h"

#include <algorithm>

const int SESSIONENTRY_TYPEID = qRegisterMetaType<Transfer::SessionEntry>();

qsizetype Transfer::SessionEntry::fileCount() const
{
    return files.size();
}

qint64 Transfer::SessionEntry::remainingBytes() const
{
    return std::max<qint64>(0, (totalSize - downloadedBytes));
}

qreal Transfer::computeProgress(const qint64 completed, const qint64 total)
{
    if (total <= 0)
        return 0;

    return std::clamp((static_cast<qreal>(completed) / total), qreal(0), qreal(1));
}
