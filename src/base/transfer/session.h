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

#include <atomic>
#include <memory>
#include <optional>

#include <nonstd/expected.hpp>

#include <QDateTime>
#include <QHash>
#include <QList>
#include <QMutex>
#include <QObject>
#include <QReadWriteLock>
#include <QString>
#include <QStringList>

#include "base/settingvalue.h"
#include "base/utils/thread.h"
#include "sessionentry.h"
#include "sessionerror.h"
#include "sessionstatus.h"
#include "sessiontable.h"
#include "transferhandle.h"

class QTimer;

namespace Transfer
{
    class ContentRemover;
    class StatusClassifier;
    class TransferEngine;

    // Q_NAMESPACE needs a namespace that is not reopened in other headers
    inline namespace SessionSettingsEnums
    {
        Q_NAMESPACE

        enum class DuplicateTransferPolicy : int
        {
            // a second add of known content fails with a registration error
            Reject,
            // a second add of known content returns the existing id
            Ignore
        };
        Q_ENUM_NS(DuplicateTransferPolicy)
    }

    enum class TransferRemoveOption
    {
        KeepContent,
        RemoveContent
    };

    struct TransferCompletion
    {
        TransferID id;
        QString name;
    };

    class Session final : public QObject
    {
        Q_OBJECT
        Q_DISABLE_COPY_MOVE(Session)

    public:
        using AddResult = nonstd::expected<TransferID, SessionError>;
        using MutationResult = nonstd::expected<void, SessionError>;

        // `engine` must outlive the session
        explicit Session(TransferEngine *engine, QObject *parent = nullptr);
        ~Session() override;

        int refreshInterval() const;
        void setRefreshInterval(int msecs);
        qint64 minimumETARate() const;
        void setMinimumETARate(qint64 rate);
        DuplicateTransferPolicy duplicatePolicy() const;
        void setDuplicatePolicy(DuplicateTransferPolicy policy);

        // Registers a magnet link, bare info hash or .torrent file path.
        // The entry shows up once the engine has resolved the metadata.
        AddResult addTransfer(const QString &source);
        // One result per non-empty line/item, in input order
        QList<AddResult> addTransfers(const QStringList &sources);
        QList<AddResult> addTransfers(const QString &sourcesText);
        MutationResult removeTransfer(const TransferID &id, TransferRemoveOption option = TransferRemoveOption::KeepContent);
        MutationResult setPaused(const TransferID &id, bool paused);

        QList<SessionEntry> entries() const;
        std::optional<SessionEntry> entry(const TransferID &id) const;
        SessionStatus status() const;
        int pendingCount() const;
        bool isPending(const TransferID &id) const;

        // Runs one refresh cycle, sampling every handle against `now`
        void refresh(const QDateTime &now);

        void startRefreshing();
        void stopRefreshing();
        bool isRefreshing() const;

        static QStringList splitSources(const QString &sourcesText);

    signals:
        void transferAdded(const Transfer::SessionEntry &entry);
        void transferRemoved(const Transfer::TransferID &id);
        void transferFinished(const Transfer::TransferCompletion &completion);
        void addTransferFailed(const QString &source, const QString &reason);
        void contentRemoved(const Transfer::TransferID &id, const QString &errorMessage);
        void transfersUpdated(const QList<Transfer::SessionEntry> &entries);
        void statsUpdated(const Transfer::SessionStatus &status);

    private slots:
        void handleMetadataReceived(const Transfer::TransferID &id);
        void handleTransferDropped(const Transfer::TransferID &id, const QString &errorMessage);
        void handleContentRemovingFinished(const Transfer::TransferID &id, const QString &transferName, const QString &errorMessage);

    private:
        struct PendingTransfer
        {
            std::shared_ptr<TransferHandle> handle;
            QString source;
            QDateTime addedAt;
        };

        struct RemovingTransferData
        {
            QString name;
            QString contentPath;
        };

        enum class PromotionResult
        {
            Waiting,
            Promoted,
            Discarded
        };

        PromotionResult promotePendingTransfer(const PendingTransfer &pending, const QDateTime &now, SessionEntry &promotedEntry);
        QList<SessionEntry> promotePendingTransfers(const QDateTime &now);
        void updateRecord(SessionRecord &record, const StatusClassifier &classifier, const QDateTime &now
            , QList<TransferCompletion> &completions) const;
        void publish(const QList<SessionEntry> &snapshot);
        void removeContent(const TransferID &id, const RemovingTransferData &data);

        TransferEngine *m_engine = nullptr;

        CachedSettingValue<int> m_storedRefreshInterval;
        CachedSettingValue<qint64> m_storedMinimumETARate;
        CachedSettingValue<DuplicateTransferPolicy> m_storedDuplicatePolicy;
        std::atomic<qint64> m_minimumETARate;

        SessionTable m_table;

        // Lock order: m_pendingMutex, then the table lock
        mutable QMutex m_pendingMutex;
        QHash<TransferID, PendingTransfer> m_pendingTransfers;

        // transfers whose content gets deleted once the engine has released it
        QMutex m_removingMutex;
        QHash<TransferID, RemovingTransferData> m_removingTransfers;

        mutable QReadWriteLock m_statusLock;
        SessionStatus m_status;

        QMutex m_refreshMutex;
        Utils::Thread::UniquePtr m_refreshThread;
        QTimer *m_refreshTimer = nullptr;

        Utils::Thread::UniquePtr m_ioThread;
        ContentRemover *m_contentRemover = nullptr;
    };
}

Q_DECLARE_METATYPE(Transfer::TransferCompletion)
