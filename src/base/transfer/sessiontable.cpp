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

#include "sessiontable.h"

#include <QCoreApplication>

nonstd::expected<void, Transfer::SessionError> Transfer::SessionTable::add(SessionRecord record)
{
    const TransferID id = record.entry.id;

    const QWriteLocker locker {&m_lock};
    if (m_records.contains(id))
    {
        return nonstd::make_unexpected(SessionError {SessionErrorKind::Duplicate
            , QCoreApplication::translate("SessionTable", "Transfer is already in the session. ID: \"%1\"").arg(id)});
    }

    m_records.insert(id, std::move(record));
    m_order.append(id);
    return {};
}

nonstd::expected<Transfer::SessionEntry, Transfer::SessionError> Transfer::SessionTable::remove(const TransferID &id)
{
    const QWriteLocker locker {&m_lock};
    const auto iter = m_records.find(id);
    if (iter == m_records.end())
    {
        return nonstd::make_unexpected(SessionError {SessionErrorKind::NotFound
            , QCoreApplication::translate("SessionTable", "Transfer not found. ID: \"%1\"").arg(id)});
    }

    SessionRecord record = iter.value();
    if (record.handle)
        record.handle->drop();

    m_records.erase(iter);
    m_order.removeOne(id);
    return record.entry;
}

QList<Transfer::TransferID> Transfer::SessionTable::purgeInvalid()
{
    QList<TransferID> purgedIDs;

    const QWriteLocker locker {&m_lock};
    for (auto iter = m_records.begin(); iter != m_records.end();)
    {
        if (hasValidHandle(iter.value()))
        {
            ++iter;
            continue;
        }

        purgedIDs.append(iter.key());
        iter = m_records.erase(iter);
    }

    for (const TransferID &id : asConst(purgedIDs))
        m_order.removeOne(id);

    return purgedIDs;
}

bool Transfer::SessionTable::contains(const TransferID &id) const
{
    const QReadLocker locker {&m_lock};
    return m_records.contains(id);
}

std::optional<Transfer::SessionEntry> Transfer::SessionTable::entry(const TransferID &id) const
{
    const QReadLocker locker {&m_lock};
    const auto iter = m_records.constFind(id);
    if ((iter == m_records.cend()) || !hasValidHandle(iter.value()))
        return std::nullopt;

    return iter.value().entry;
}

QList<Transfer::SessionEntry> Transfer::SessionTable::snapshot() const
{
    const QReadLocker locker {&m_lock};

    QList<SessionEntry> entries;
    entries.reserve(m_order.size());
    for (const TransferID &id : m_order)
    {
        const SessionRecord &record = m_records.constFind(id).value();
        if (hasValidHandle(record))
            entries.append(record.entry);
    }
    return entries;
}

qsizetype Transfer::SessionTable::size() const
{
    const QReadLocker locker {&m_lock};
    return m_records.size();
}

bool Transfer::SessionTable::hasValidHandle(const SessionRecord &record) noexcept
{
    return record.handle && record.handle->isValid();
}
