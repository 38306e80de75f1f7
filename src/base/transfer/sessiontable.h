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
#include <optional>

#include <nonstd/expected.hpp>

#include <QHash>
#include <QList>
#include <QReadWriteLock>

#include "base/global.h"
#include "rateestimator.h"
#include "sessionentry.h"
#include "sessionerror.h"
#include "transferhandle.h"

namespace Transfer
{
    struct SessionRecord
    {
        SessionEntry entry;
        std::shared_ptr<TransferHandle> handle;
        RateEstimator rateEstimator;
        // last seeding flag reported by the engine, the entry state hides it while paused
        bool engineSeeding = false;
    };

    // Thread safe registry of session records keyed by transfer id.
    // Every access goes through one lock; readers only ever get copies.
    class SessionTable
    {
        Q_DISABLE_COPY_MOVE(SessionTable)

    public:
        SessionTable() = default;

        nonstd::expected<void, SessionError> add(SessionRecord record);
        // Drops the handle before the entry leaves the table
        nonstd::expected<SessionEntry, SessionError> remove(const TransferID &id);
        // Removes records whose handle is missing or no longer valid
        QList<TransferID> purgeInvalid();

        bool contains(const TransferID &id) const;
        // Readers never see records whose handle went invalid since the last purge
        std::optional<SessionEntry> entry(const TransferID &id) const;
        QList<SessionEntry> snapshot() const;
        qsizetype size() const;

        // Runs `func(SessionRecord &)` on one record under the write lock.
        // Returns false when `id` is unknown.
        template <typename Func>
        bool modify(const TransferID &id, Func &&func)
        {
            const QWriteLocker locker {&m_lock};
            const auto iter = m_records.find(id);
            if (iter == m_records.end())
                return false;

            func(iter.value());
            return true;
        }

        // Runs `func(SessionRecord &)` on every record, in insertion order, under one write lock
        template <typename Func>
        void forEach(Func &&func)
        {
            const QWriteLocker locker {&m_lock};
            for (const TransferID &id : asConst(m_order))
                func(m_records[id]);
        }

    private:
        static bool hasValidHandle(const SessionRecord &record) noexcept;

        mutable QReadWriteLock m_lock;
        QHash<TransferID, SessionRecord> m_records;
        QList<TransferID> m_order;
    };
}
