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

#include "session.h"

#include <algorithm>

#include <QMetaObject>
#include <QMutexLocker>
#include <QThread>
#include <QTimer>

#include "base/exceptions.h"
#include "base/global.h"
#include "base/logger.h"
#include "base/utils/fs.h"
#include "base/utils/misc.h"
#include "contentremover.h"
#include "statusclassifier.h"
#include "transferengine.h"

#define TRANSFER_SESSION_KEY(name) (u"TransferSession/" name)

const int TRANSFERCOMPLETION_TYPEID = qRegisterMetaType<Transfer::TransferCompletion>();

using namespace Transfer;

namespace
{
    const int DEFAULT_REFRESH_INTERVAL = 1000;
    const int MIN_REFRESH_INTERVAL = 100;

    bool isFileSource(const QString &source)
    {
        if (Utils::Misc::isMagnetLink(source))
            return false;

        return source.endsWith(TORRENT_FILE_EXTENSION, Qt::CaseInsensitive) || Utils::Fs::isRegularFile(source);
    }

    // Uses per-file counters when the engine reports them for every file,
    // the overall progress otherwise
    void updateFilesProgress(QList<FileEntry> &files, const QList<qint64> &filesCompleted, const qreal overallProgress)
    {
        if (filesCompleted.size() != files.size())
        {
            for (FileEntry &file : files)
                file.progress = overallProgress;
            return;
        }

        for (qsizetype i = 0; i < files.size(); ++i)
        {
            FileEntry &file = files[i];
            file.progress = (file.size > 0) ? computeProgress(filesCompleted[i], file.size) : 1;
        }
    }

    struct HandleSample
    {
        bool hasMetadata = false;
        qint64 completedSize = 0;
        qint64 totalUpload = 0;
        int peers = 0;
        int seeds = 0;
        bool isSeeding = false;
        QList<qint64> filesCompletedSize;
    };

    HandleSample sampleHandle(const TransferHandle &handle)
    {
        HandleSample sample;
        sample.hasMetadata = handle.hasMetadata();
        sample.completedSize = handle.completedSize();
        sample.totalUpload = handle.totalUpload();
        sample.peers = handle.peersCount();
        sample.seeds = handle.seedsCount();
        sample.isSeeding = handle.isSeeding();
        if (sample.hasMetadata)
            sample.filesCompletedSize = handle.filesCompletedSize();
        return sample;
    }
}

Session::Session(TransferEngine *engine, QObject *parent)
    : QObject(parent)
    , m_engine {engine}
    , m_storedRefreshInterval(TRANSFER_SESSION_KEY(u"RefreshInterval"_s), DEFAULT_REFRESH_INTERVAL
        , [](const int value) { return std::max(value, MIN_REFRESH_INTERVAL); })
    , m_storedMinimumETARate(TRANSFER_SESSION_KEY(u"MinimumETARate"_s), DEFAULT_MINIMUM_ETA_RATE)
    , m_storedDuplicatePolicy(TRANSFER_SESSION_KEY(u"DuplicatePolicy"_s), DuplicateTransferPolicy::Reject)
    , m_minimumETARate {m_storedMinimumETARate.get()}
    , m_ioThread {new QThread}
{
    Q_ASSERT(m_engine);

    connect(m_engine, &TransferEngine::metadataReceived, this, &Session::handleMetadataReceived);
    connect(m_engine, &TransferEngine::transferDropped, this, &Session::handleTransferDropped);

    m_contentRemover = new ContentRemover;
    m_contentRemover->moveToThread(m_ioThread.get());
    connect(m_ioThread.get(), &QThread::finished, m_contentRemover, &QObject::deleteLater);
    connect(m_contentRemover, &ContentRemover::jobFinished, this, &Session::handleContentRemovingFinished);

    m_ioThread->setObjectName("Session m_ioThread");
    m_ioThread->start();
}

Session::~Session()
{
    stopRefreshing();
}

int Session::refreshInterval() const
{
    return m_storedRefreshInterval;
}

void Session::setRefreshInterval(const int msecs)
{
    const int interval = std::max(msecs, MIN_REFRESH_INTERVAL);
    if (interval == refreshInterval())
        return;

    m_storedRefreshInterval = interval;
    if (m_refreshTimer)
    {
        QMetaObject::invokeMethod(m_refreshTimer, [timer = m_refreshTimer, interval]
        {
            timer->setInterval(interval);
        });
    }
}

qint64 Session::minimumETARate() const
{
    return m_minimumETARate;
}

void Session::setMinimumETARate(const qint64 rate)
{
    m_storedMinimumETARate = rate;
    m_minimumETARate = rate;
}

DuplicateTransferPolicy Session::duplicatePolicy() const
{
    return m_storedDuplicatePolicy;
}

void Session::setDuplicatePolicy(const DuplicateTransferPolicy policy)
{
    m_storedDuplicatePolicy = policy;
}

Session::AddResult Session::addTransfer(const QString &source)
{
    const QString trimmedSource = source.trimmed();
    if (trimmedSource.isEmpty())
        return nonstd::make_unexpected(SessionError {SessionErrorKind::Registration, tr("Transfer source is empty")});

    const TransferEngine::AddResult addResult = isFileSource(trimmedSource)
        ? m_engine->addFromFile(trimmedSource)
        : m_engine->addFromMagnet(trimmedSource);
    if (!addResult)
    {
        LogMsg(tr("Failed to add transfer. Source: \"%1\". Reason: \"%2\"").arg(trimmedSource, addResult.error()), Log::WARNING);
        emit addTransferFailed(trimmedSource, addResult.error());
        return nonstd::make_unexpected(SessionError {SessionErrorKind::Registration, addResult.error()});
    }

    const std::shared_ptr<TransferHandle> handle = addResult.value();
    TransferID id;
    try
    {
        id = handle->id();
    }
    catch (const RuntimeError &err)
    {
        LogMsg(tr("Failed to add transfer. Source: \"%1\". Reason: \"%2\"").arg(trimmedSource, err.message()), Log::WARNING);
        handle->drop();
        emit addTransferFailed(trimmedSource, err.message());
        return nonstd::make_unexpected(SessionError {SessionErrorKind::Registration, err.message()});
    }

    QMutexLocker locker {&m_pendingMutex};
    if (m_pendingTransfers.contains(id) || m_table.contains(id))
    {
        locker.unlock();

        // the engine handed back the handle of the known transfer, it must stay alive
        if (duplicatePolicy() == DuplicateTransferPolicy::Ignore)
        {
            LogMsg(tr("Transfer is already in the session. Ignoring duplicate. Source: \"%1\"").arg(trimmedSource));
            return id;
        }

        const QString message = tr("Transfer is already in the session. ID: \"%1\"").arg(id);
        LogMsg(tr("Failed to add transfer. Source: \"%1\". Reason: \"%2\"").arg(trimmedSource, message), Log::WARNING);
        emit addTransferFailed(trimmedSource, message);
        return nonstd::make_unexpected(SessionError {SessionErrorKind::Registration, message});
    }

    m_pendingTransfers.insert(id, {handle, trimmedSource, QDateTime::currentDateTimeUtc()});
    locker.unlock();

    LogMsg(tr("Added transfer, waiting for metadata. Source: \"%1\"").arg(trimmedSource));
    return id;
}

QList<Session::AddResult> Session::addTransfers(const QStringList &sources)
{
    QList<AddResult> results;
    results.reserve(sources.size());
    for (const QString &source : sources)
    {
        if (source.trimmed().isEmpty())
            continue;

        results.append(addTransfer(source));
    }
    return results;
}

QList<Session::AddResult> Session::addTransfers(const QString &sourcesText)
{
    return addTransfers(splitSources(sourcesText));
}

QStringList Session::splitSources(const QString &sourcesText)
{
    QStringList sources;
    for (const QString &line : asConst(sourcesText.split(u'\n', Qt::SkipEmptyParts)))
    {
        const QString source = line.trimmed();
        if (!source.isEmpty())
            sources.append(source);
    }
    return sources;
}

Session::MutationResult Session::removeTransfer(const TransferID &id, const TransferRemoveOption option)
{
    {
        QMutexLocker locker {&m_pendingMutex};
        if (const auto iter = m_pendingTransfers.find(id); iter != m_pendingTransfers.end())
        {
            const QString source = iter.value().source;
            iter.value().handle->drop();
            m_pendingTransfers.erase(iter);
            locker.unlock();

            LogMsg(tr("Cancelled transfer that was waiting for metadata. Source: \"%1\"").arg(source));
            emit transferRemoved(id);
            return {};
        }
    }

    RemovingTransferData removingData;
    bool engineKnowsTransfer = false;
    const bool found = m_table.modify(id, [&removingData, &engineKnowsTransfer](const SessionRecord &record)
    {
        removingData = {record.entry.name, record.entry.contentPath};
        engineKnowsTransfer = record.handle && record.handle->isValid();
    });
    if (!found)
        return nonstd::make_unexpected(SessionError {SessionErrorKind::NotFound, tr("Transfer not found. ID: \"%1\"").arg(id)});

    const bool removeContentRequested = (option == TransferRemoveOption::RemoveContent);
    const bool waitForEngine = removeContentRequested && engineKnowsTransfer && !removingData.contentPath.isEmpty();
    if (waitForEngine)
    {
        // the engine may still have the files open until it reports the transfer dropped
        const QMutexLocker locker {&m_removingMutex};
        m_removingTransfers.insert(id, removingData);
    }

    const nonstd::expected<SessionEntry, SessionError> removed = m_table.remove(id);
    if (!removed)
    {
        // purged by a refresh cycle in between, the engine won't report it
        const QMutexLocker locker {&m_removingMutex};
        m_removingTransfers.remove(id);
        return nonstd::make_unexpected(removed.error());
    }

    LogMsg(tr("Transfer removed. Transfer: \"%1\"").arg(removed->name));
    emit transferRemoved(id);

    if (removeContentRequested)
    {
        if (removingData.contentPath.isEmpty())
            LogMsg(tr("Transfer has no content on disk to remove. Transfer: \"%1\"").arg(removed->name), Log::WARNING);
        else if (!waitForEngine)
            removeContent(id, removingData);
    }

    return {};
}

void Session::removeContent(const TransferID &id, const RemovingTransferData &data)
{
    QMetaObject::invokeMethod(m_contentRemover, [remover = m_contentRemover, id, data]
    {
        remover->performJob(id, data.name, data.contentPath);
    });
}

Session::MutationResult Session::setPaused(const TransferID &id, const bool paused)
{
    std::optional<SessionError> controlError;
    bool changed = false;
    QString transferName;

    const bool found = m_table.modify(id, [this, paused, &controlError, &changed, &transferName](SessionRecord &record)
    {
        SessionEntry &entry = record.entry;
        transferName = entry.name;
        if (entry.isPaused == paused)
            return;

        try
        {
            if (paused)
                record.handle->cancelAllPieces();
            else
                record.handle->downloadAll();
        }
        catch (const RuntimeError &err)
        {
            controlError = SessionError {SessionErrorKind::InvalidHandle, err.message()};
            return;
        }

        // no rate may span the paused interval
        record.rateEstimator.reset();
        entry.isPaused = paused;
        entry.downloadRate = 0;
        entry.uploadRate = 0;

        StatusInput input;
        input.hasMetadata = (entry.state != TransferState::Discovering);
        input.isPaused = paused;
        input.isSeeding = record.engineSeeding;
        input.totalSize = entry.totalSize;
        input.previousBytes = entry.downloadedBytes;
        input.currentBytes = entry.downloadedBytes;
        input.previousState = entry.state;

        const StatusResult result = StatusClassifier(m_minimumETARate).classify(input);
        entry.state = result.state;
        entry.statusText = result.statusText;
        entry.eta = result.eta;
        changed = true;
    });

    if (!found)
        return nonstd::make_unexpected(SessionError {SessionErrorKind::NotFound, tr("Transfer not found. ID: \"%1\"").arg(id)});

    if (controlError)
    {
        LogMsg(tr("Failed to change transfer state. Transfer: \"%1\". Reason: \"%2\"").arg(transferName, controlError->message), Log::WARNING);
        return nonstd::make_unexpected(*controlError);
    }

    if (changed)
    {
        LogMsg((paused ? tr("Transfer paused. Transfer: \"%1\"") : tr("Transfer resumed. Transfer: \"%1\""))
            .arg(transferName));
    }

    return {};
}

QList<SessionEntry> Session::entries() const
{
    return m_table.snapshot();
}

std::optional<SessionEntry> Session::entry(const TransferID &id) const
{
    return m_table.entry(id);
}

SessionStatus Session::status() const
{
    const QReadLocker locker {&m_statusLock};
    return m_status;
}

int Session::pendingCount() const
{
    const QMutexLocker locker {&m_pendingMutex};
    return static_cast<int>(m_pendingTransfers.size());
}

bool Session::isPending(const TransferID &id) const
{
    const QMutexLocker locker {&m_pendingMutex};
    return m_pendingTransfers.contains(id);
}

void Session::refresh(const QDateTime &now)
{
    const QMutexLocker refreshLocker {&m_refreshMutex};

    const QList<SessionEntry> promotedEntries = promotePendingTransfers(now);

    const QList<TransferID> purgedIDs = m_table.purgeInvalid();
    for (const TransferID &id : purgedIDs)
        LogMsg(tr("Dropped transfer whose handle became invalid. ID: \"%1\"").arg(id), Log::WARNING);

    const StatusClassifier classifier {m_minimumETARate};
    QList<TransferCompletion> completions;
    m_table.forEach([this, &classifier, &now, &completions](SessionRecord &record)
    {
        updateRecord(record, classifier, now, completions);
    });

    const QList<SessionEntry> snapshot = m_table.snapshot();

    for (const SessionEntry &entry : promotedEntries)
        emit transferAdded(entry);

    for (const TransferID &id : purgedIDs)
        emit transferRemoved(id);

    for (const TransferCompletion &completion : asConst(completions))
    {
        LogMsg(tr("Transfer finished. Transfer: \"%1\"").arg(completion.name), Log::INFO);
        emit transferFinished(completion);
    }

    publish(snapshot);
}

void Session::updateRecord(SessionRecord &record, const StatusClassifier &classifier, const QDateTime &now
    , QList<TransferCompletion> &completions) const
{
    SessionEntry &entry = record.entry;

    HandleSample sample;
    try
    {
        sample = sampleHandle(*record.handle);
    }
    catch (const RuntimeError &err)
    {
        // keep the last known state, next cycle retries
        LogMsg(tr("Failed to sample transfer. Transfer: \"%1\". Reason: \"%2\"").arg(entry.name, err.message()), Log::WARNING);
        return;
    }

    const qint64 previousBytes = entry.downloadedBytes;
    const TransferState previousState = entry.state;

    entry.peers = sample.peers;
    entry.seeds = sample.seeds;
    record.engineSeeding = sample.isSeeding;

    if (sample.hasMetadata && !entry.isPaused)
    {
        const SpeedSample rate = record.rateEstimator.addSample({sample.completedSize, sample.totalUpload}, now);
        entry.downloadRate = rate.download;
        entry.uploadRate = rate.upload;
        entry.downloadedBytes = sample.completedSize;
        entry.uploadedBytes = sample.totalUpload;
        entry.progress = computeProgress(entry.downloadedBytes, entry.totalSize);
        updateFilesProgress(entry.files, sample.filesCompletedSize, entry.progress);
    }
    else
    {
        entry.downloadRate = 0;
        entry.uploadRate = 0;
    }

    StatusInput input;
    input.hasMetadata = sample.hasMetadata;
    input.isPaused = entry.isPaused;
    input.isSeeding = sample.isSeeding;
    input.totalSize = entry.totalSize;
    input.previousBytes = previousBytes;
    input.currentBytes = entry.downloadedBytes;
    input.downloadRate = entry.downloadRate;
    input.previousState = previousState;

    const StatusResult result = classifier.classify(input);
    entry.state = result.state;
    entry.statusText = result.statusText;
    entry.eta = result.eta;
    entry.lastSampledAt = now;

    if (result.newlyCompleted)
        completions.append({entry.id, entry.name});
}

void Session::publish(const QList<SessionEntry> &snapshot)
{
    const SessionStatus newStatus = computeSessionStatus(snapshot, pendingCount());
    {
        const QWriteLocker locker {&m_statusLock};
        m_status = newStatus;
    }

    emit transfersUpdated(snapshot);
    emit statsUpdated(newStatus);
}

QList<SessionEntry> Session::promotePendingTransfers(const QDateTime &now)
{
    QList<SessionEntry> promotedEntries;

    const QMutexLocker locker {&m_pendingMutex};
    for (auto iter = m_pendingTransfers.begin(); iter != m_pendingTransfers.end();)
    {
        SessionEntry entry;
        switch (promotePendingTransfer(iter.value(), now, entry))
        {
        case PromotionResult::Waiting:
            ++iter;
            break;
        case PromotionResult::Promoted:
            promotedEntries.append(entry);
            iter = m_pendingTransfers.erase(iter);
            break;
        case PromotionResult::Discarded:
            iter = m_pendingTransfers.erase(iter);
            break;
        }
    }

    return promotedEntries;
}

// Must be called with m_pendingMutex held
Session::PromotionResult Session::promotePendingTransfer(const PendingTransfer &pending, const QDateTime &now, SessionEntry &promotedEntry)
{
    const std::shared_ptr<TransferHandle> &handle = pending.handle;
    if (!handle->isValid())
    {
        LogMsg(tr("Transfer was dropped by the engine before its metadata arrived. Source: \"%1\"").arg(pending.source), Log::WARNING);
        return PromotionResult::Discarded;
    }

    SessionRecord record;
    SessionEntry &entry = record.entry;
    HandleSample sample;
    try
    {
        if (!handle->hasMetadata())
            return PromotionResult::Waiting;

        entry.id = handle->id();
        entry.name = handle->name();
        entry.totalSize = handle->totalSize();
        entry.contentPath = handle->contentPath();

        const QList<TransferFile> files = handle->files();
        entry.files.reserve(std::max<qsizetype>(files.size(), 1));
        for (const TransferFile &file : files)
            entry.files.append({file.path, file.size, 0});
        // single-file transfers may come without a file list
        if (entry.files.isEmpty())
            entry.files.append({entry.name, entry.totalSize, 0});

        handle->downloadAll();
        sample = sampleHandle(*handle);
    }
    catch (const RuntimeError &err)
    {
        LogMsg(tr("Failed to read transfer metadata, will retry. Source: \"%1\". Reason: \"%2\"")
            .arg(pending.source, err.message()), Log::WARNING);
        return PromotionResult::Waiting;
    }

    entry.addedAt = pending.addedAt;
    entry.downloadedBytes = sample.completedSize;
    entry.uploadedBytes = sample.totalUpload;
    entry.peers = sample.peers;
    entry.seeds = sample.seeds;
    entry.progress = computeProgress(entry.downloadedBytes, entry.totalSize);
    updateFilesProgress(entry.files, sample.filesCompletedSize, entry.progress);

    // first sample is only a baseline, it can't report a completion
    record.rateEstimator.addSample({sample.completedSize, sample.totalUpload}, now);

    StatusInput input;
    input.hasMetadata = true;
    input.isSeeding = sample.isSeeding;
    input.totalSize = entry.totalSize;
    input.previousBytes = entry.downloadedBytes;
    input.currentBytes = entry.downloadedBytes;
    input.previousState = TransferState::Discovering;

    const StatusResult result = StatusClassifier(m_minimumETARate).classify(input);
    entry.state = result.state;
    entry.statusText = result.statusText;
    entry.eta = result.eta;
    entry.lastSampledAt = now;

    record.handle = handle;
    record.engineSeeding = sample.isSeeding;
    promotedEntry = entry;

    const nonstd::expected<void, SessionError> addResult = m_table.add(std::move(record));
    if (!addResult)
    {
        LogMsg(addResult.error().message, Log::WARNING);
        return PromotionResult::Discarded;
    }

    LogMsg(tr("Transfer metadata received. Transfer: \"%1\". Size: %2")
        .arg(promotedEntry.name, Utils::Misc::friendlyUnit(promotedEntry.totalSize)));
    return PromotionResult::Promoted;
}

void Session::handleMetadataReceived(const TransferID &id)
{
    SessionEntry entry;
    PromotionResult result = PromotionResult::Waiting;
    {
        const QMutexLocker locker {&m_pendingMutex};
        const auto iter = m_pendingTransfers.find(id);
        if (iter == m_pendingTransfers.end())
            return;

        result = promotePendingTransfer(iter.value(), QDateTime::currentDateTimeUtc(), entry);
        if (result != PromotionResult::Waiting)
            m_pendingTransfers.erase(iter);
    }

    if (result == PromotionResult::Promoted)
        emit transferAdded(entry);
}

void Session::handleTransferDropped(const TransferID &id, const QString &errorMessage)
{
    RemovingTransferData removingData;
    {
        const QMutexLocker locker {&m_removingMutex};
        const auto iter = m_removingTransfers.find(id);
        if (iter == m_removingTransfers.end())
            return;

        removingData = iter.value();
        m_removingTransfers.erase(iter);
    }

    if (!errorMessage.isEmpty())
    {
        LogMsg(tr("Failed to remove partfile. Transfer: \"%1\". Reason: \"%2\"")
            .arg(removingData.name, errorMessage), Log::WARNING);
    }

    removeContent(id, removingData);
}

void Session::handleContentRemovingFinished(const TransferID &id, const QString &transferName, const QString &errorMessage)
{
    if (errorMessage.isEmpty())
    {
        LogMsg(tr("Transfer content removed. Transfer: \"%1\"").arg(transferName));
    }
    else
    {
        LogMsg(tr("Failed to remove transfer content. Transfer: \"%1\". Error: \"%2\"")
            .arg(transferName, errorMessage), Log::WARNING);
    }

    emit contentRemoved(id, errorMessage);
}

void Session::startRefreshing()
{
    if (m_refreshThread)
        return;

    m_refreshThread.reset(new QThread);
    m_refreshThread->setObjectName("Session m_refreshThread");

    m_refreshTimer = new QTimer;
    m_refreshTimer->setInterval(refreshInterval());
    m_refreshTimer->moveToThread(m_refreshThread.get());
    connect(m_refreshThread.get(), &QThread::started, m_refreshTimer, qOverload<>(&QTimer::start));
    connect(m_refreshThread.get(), &QThread::finished, m_refreshTimer, &QObject::deleteLater);
    connect(m_refreshTimer, &QTimer::timeout, m_refreshTimer, [this]
    {
        refresh(QDateTime::currentDateTimeUtc());
    });

    m_refreshThread->start();
    LogMsg(tr("Refreshing transfers every %1 ms").arg(refreshInterval()), Log::INFO);
}

void Session::stopRefreshing()
{
    if (!m_refreshThread)
        return;

    // joins the thread, the timer is deleted once its event loop is gone
    m_refreshThread.reset();
    m_refreshTimer = nullptr;
}

bool Session::isRefreshing() const
{
    return static_cast<bool>(m_refreshThread);
}
