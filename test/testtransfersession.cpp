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

#include <memory>

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QLocale>
#include <QMutex>
#include <QMutexLocker>
#include <QObject>
#include <QSet>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QTest>

#include "base/global.h"
#include "base/logger.h"
#include "base/settingsstorage.h"
#include "base/transfer/session.h"
#include "faketransferengine.h"

using Transfer::DuplicateTransferPolicy;
using Transfer::Session;
using Transfer::SessionEntry;
using Transfer::SessionErrorKind;
using Transfer::SessionStatus;
using Transfer::TransferCompletion;
using Transfer::TransferID;
using Transfer::TransferRemoveOption;
using Transfer::TransferState;

namespace
{
    const QDateTime T0 = QDateTime::fromSecsSinceEpoch(1'700'000'000);

    const QString MAGNET_A = u"magnet:?xt=urn:btih:0123456789abcdef0123456789abcdef01234567"_s;
    const QString MAGNET_B = u"magnet:?xt=urn:btih:89abcdef0123456789abcdef0123456789abcdef"_s;

    QDateTime tick(const int seconds)
    {
        return T0.addSecs(seconds);
    }
}

class TestTransferSession final : public QObject
{
    Q_OBJECT
    Q_DISABLE_COPY_MOVE(TestTransferSession)

public:
    TestTransferSession() = default;

private:
    // Registers `source` and lets the next refresh cycle pick up its metadata
    std::shared_ptr<FakeTransferHandle> addResolved(Session &session, FakeTransferEngine &engine, const QString &source
        , const QString &name, const qint64 size)
    {
        const Session::AddResult id = session.addTransfer(source);
        if (!id)
            return nullptr;

        const std::shared_ptr<FakeTransferHandle> handle = engine.handle(*id);
        handle->resolveMetadata(name, size);
        return handle;
    }

private slots:
    void initTestCase() const
    {
        Logger::initInstance();
    }

    void cleanupTestCase() const
    {
        Logger::freeInstance();
    }

    void init() const
    {
        SettingsStorage::initInstance();
    }

    void cleanup() const
    {
        SettingsStorage::freeInstance();
    }

    void testDefaults() const
    {
        FakeTransferEngine engine;
        const Session session {&engine};

        QCOMPARE(session.refreshInterval(), 1000);
        QCOMPARE(session.minimumETARate(), 1024);
        QCOMPARE(session.duplicatePolicy(), DuplicateTransferPolicy::Reject);
        QVERIFY(session.entries().isEmpty());
        QCOMPARE(session.status().transfersCount, 0);
        QVERIFY(!session.isRefreshing());
    }

    void testSettingsArePersisted() const
    {
        FakeTransferEngine engine;
        {
            Session session {&engine};
            session.setRefreshInterval(10);
            QCOMPARE(session.refreshInterval(), 100);
            session.setRefreshInterval(250);
            session.setMinimumETARate(0);
            session.setDuplicatePolicy(DuplicateTransferPolicy::Ignore);
        }

        QCOMPARE(SettingsStorage::instance()->loadValue<QString>(u"TransferSession/DuplicatePolicy"_s), u"Ignore"_s);

        const Session session {&engine};
        QCOMPARE(session.refreshInterval(), 250);
        QCOMPARE(session.minimumETARate(), 0);
        QCOMPARE(session.duplicatePolicy(), DuplicateTransferPolicy::Ignore);
    }

    void testEntryAppearsAfterMetadata()
    {
        FakeTransferEngine engine;
        Session session {&engine};
        QSignalSpy addedSpy {&session, &Session::transferAdded};

        const Session::AddResult id = session.addTransfer(MAGNET_A);
        QVERIFY(id);
        QCOMPARE(engine.magnetSources, QStringList {MAGNET_A});
        QVERIFY(session.isPending(*id));
        QCOMPARE(session.pendingCount(), 1);

        session.refresh(tick(0));
        QVERIFY(session.entries().isEmpty());
        QCOMPARE(session.status().pendingCount, 1);
        QCOMPARE(Transfer::activitySummary(session.status()), u"Downloading"_s);
        QCOMPARE(addedSpy.count(), 0);

        const std::shared_ptr<FakeTransferHandle> handle = engine.handle(*id);
        handle->resolveMetadata(u"ubuntu.iso"_s, 1'000'000);
        handle->peers = 12;
        handle->seeds = 3;
        session.refresh(tick(1));

        QVERIFY(!session.isPending(*id));
        QCOMPARE(addedSpy.count(), 1);
        const auto added = addedSpy.at(0).at(0).value<SessionEntry>();
        QCOMPARE(added.id, *id);

        const std::optional<SessionEntry> entry = session.entry(*id);
        QVERIFY(entry);
        QCOMPARE(entry->name, u"ubuntu.iso"_s);
        QCOMPARE(entry->totalSize, 1'000'000);
        QCOMPARE(entry->state, TransferState::Downloading);
        QCOMPARE(entry->downloadRate, 0);
        QCOMPARE(entry->eta, u"unknown"_s);
        QCOMPARE(entry->peers, 12);
        QCOMPARE(entry->seeds, 3);
        QCOMPARE(entry->lastSampledAt, tick(1));
        QCOMPARE(handle->downloadAllCalls, 1);

        // no file list: the transfer itself is the only file
        QCOMPARE(entry->fileCount(), 1);
        QCOMPARE(entry->files.first().path, u"ubuntu.iso"_s);
        QCOMPARE(entry->files.first().size, 1'000'000);
    }

    void testMetadataNotification()
    {
        FakeTransferEngine engine;
        Session session {&engine};
        QSignalSpy addedSpy {&session, &Session::transferAdded};

        const std::shared_ptr<FakeTransferHandle> handle = addResolved(session, engine, MAGNET_A, u"a"_s, 100);
        QVERIFY(handle);

        engine.notifyMetadataReceived(FakeTransferEngine::contentID(MAGNET_A));
        QCOMPARE(addedSpy.count(), 1);
        QCOMPARE(session.pendingCount(), 0);
        QCOMPARE(session.entries().size(), 1);

        // unknown ids are ignored
        engine.notifyMetadataReceived(u"unknown"_s);
        QCOMPARE(addedSpy.count(), 1);
    }

    void testRateProgressAndETA()
    {
        FakeTransferEngine engine;
        Session session {&engine};

        const std::shared_ptr<FakeTransferHandle> handle = addResolved(session, engine, MAGNET_A, u"ubuntu.iso"_s, 1'000'000);
        QVERIFY(handle);
        session.refresh(tick(0));

        handle->completed = 100'000;
        handle->uploaded = 2048;
        session.refresh(tick(1));

        const SessionEntry entry = session.entries().first();
        QCOMPARE(entry.downloadRate, 100'000);
        QCOMPARE(entry.uploadRate, 2048);
        QCOMPARE(entry.downloadedBytes, 100'000);
        QCOMPARE(entry.remainingBytes(), 900'000);
        QCOMPARE(entry.progress, 0.1);
        QCOMPARE(entry.state, TransferState::Downloading);
        QCOMPARE(entry.statusText, u"Downloading (%1%)"_s.arg(QLocale::system().toString(10.0, 'f', 1)));
        QCOMPARE(entry.eta, u"9 sec"_s);
        QCOMPARE(entry.files.first().progress, 0.1);

        const SessionStatus status = session.status();
        QCOMPARE(status.transfersCount, 1);
        QCOMPARE(status.activeCount, 1);
        QCOMPARE(status.downloadRate, 100'000);
        QCOMPARE(status.uploadRate, 2048);
    }

    void testRatesAndProgressAcrossCycles()
    {
        FakeTransferEngine engine;
        Session session {&engine};

        const std::shared_ptr<FakeTransferHandle> handle = addResolved(session, engine, MAGNET_A, u"a"_s, 1'000'000);
        QVERIFY(handle);

        const QList<qint64> samples {0, 50'000, 40'000, 40'000, 300'000, 300'000, 999'000};
        qreal lastProgress = 0;
        for (int i = 0; i < samples.size(); ++i)
        {
            handle->completed = std::max(handle->completed, samples[i]);
            handle->uploaded = (i % 2) ? 0 : (i * 1000);
            session.refresh(tick(i));

            const SessionEntry entry = session.entries().first();
            QVERIFY(entry.downloadRate >= 0);
            QVERIFY(entry.uploadRate >= 0);
            QVERIFY(entry.progress >= lastProgress);
            lastProgress = entry.progress;
        }
    }

    void testCompletionFiresOnce()
    {
        FakeTransferEngine engine;
        Session session {&engine};
        QSignalSpy finishedSpy {&session, &Session::transferFinished};

        const std::shared_ptr<FakeTransferHandle> handle = addResolved(session, engine, MAGNET_A, u"ubuntu.iso"_s, 1'000'000);
        QVERIFY(handle);
        handle->completed = 900'000;
        session.refresh(tick(0));
        QCOMPARE(finishedSpy.count(), 0);

        handle->completed = 1'000'000;
        session.refresh(tick(1));

        QCOMPARE(finishedSpy.count(), 1);
        const auto completion = finishedSpy.at(0).at(0).value<TransferCompletion>();
        QCOMPARE(completion.id, FakeTransferEngine::contentID(MAGNET_A));
        QCOMPARE(completion.name, u"ubuntu.iso"_s);

        const SessionEntry entry = session.entries().first();
        QCOMPARE(entry.state, TransferState::Completed);
        QCOMPARE(entry.statusText, u"Completed"_s);
        QVERIFY(entry.eta.isEmpty());
        QCOMPARE(entry.progress, 1.0);

        handle->seeding = true;
        handle->uploaded = 10'000;
        for (int i = 2; i < 10; ++i)
            session.refresh(tick(i));
        QCOMPARE(finishedSpy.count(), 1);

        const SessionStatus status = session.status();
        QCOMPARE(status.completedCount, 1);
        QCOMPARE(status.activeCount, 0);
        QCOMPARE(Transfer::activitySummary(status), u"Idle"_s);
    }

    void testCompleteWhenFirstSeen()
    {
        FakeTransferEngine engine;
        Session session {&engine};
        QSignalSpy finishedSpy {&session, &Session::transferFinished};

        const std::shared_ptr<FakeTransferHandle> handle = addResolved(session, engine, MAGNET_A, u"a"_s, 1000);
        QVERIFY(handle);
        handle->completed = 1000;

        session.refresh(tick(0));
        session.refresh(tick(1));
        QCOMPARE(session.entries().first().state, TransferState::Completed);
        QCOMPARE(finishedSpy.count(), 0);
    }

    void testPauseResume()
    {
        FakeTransferEngine engine;
        Session session {&engine};

        const std::shared_ptr<FakeTransferHandle> handle = addResolved(session, engine, MAGNET_A, u"a"_s, 10'000'000);
        QVERIFY(handle);
        session.refresh(tick(0));
        handle->completed = 100'000;
        session.refresh(tick(1));
        QCOMPARE(session.entries().first().downloadRate, 100'000);

        QVERIFY(session.setPaused(FakeTransferEngine::contentID(MAGNET_A), true));
        QCOMPARE(handle->cancelAllPiecesCalls, 1);
        SessionEntry entry = session.entries().first();
        QVERIFY(entry.isPaused);
        QCOMPARE(entry.state, TransferState::Paused);
        QCOMPARE(entry.downloadRate, 0);
        QVERIFY(entry.eta.isEmpty());

        // pausing twice is a no-op
        QVERIFY(session.setPaused(FakeTransferEngine::contentID(MAGNET_A), true));
        QCOMPARE(handle->cancelAllPiecesCalls, 1);

        // bytes still trickling in while paused are not sampled
        handle->completed = 150'000;
        session.refresh(tick(2));
        entry = session.entries().first();
        QCOMPARE(entry.state, TransferState::Paused);
        QCOMPARE(entry.downloadRate, 0);
        QCOMPARE(entry.downloadedBytes, 100'000);
        QCOMPARE(session.status().pausedCount, 1);

        QVERIFY(session.setPaused(FakeTransferEngine::contentID(MAGNET_A), false));
        QCOMPARE(handle->downloadAllCalls, 2);
        QCOMPARE(session.entries().first().state, TransferState::Downloading);

        // the first cycle after a long pause only sets the baseline
        handle->completed = 5'000'000;
        session.refresh(tick(1000));
        QCOMPARE(session.entries().first().downloadRate, 0);
        QCOMPARE(session.entries().first().downloadedBytes, 5'000'000);

        handle->completed = 5'200'000;
        session.refresh(tick(1001));
        QCOMPARE(session.entries().first().downloadRate, 200'000);
    }

    void testCompletionWhilePaused()
    {
        FakeTransferEngine engine;
        Session session {&engine};
        QSignalSpy finishedSpy {&session, &Session::transferFinished};

        const std::shared_ptr<FakeTransferHandle> handle = addResolved(session, engine, MAGNET_A, u"a"_s, 1000);
        QVERIFY(handle);
        session.refresh(tick(0));

        const TransferID id = FakeTransferEngine::contentID(MAGNET_A);
        QVERIFY(session.setPaused(id, true));
        handle->completed = 1000;
        session.refresh(tick(1));
        QCOMPARE(finishedSpy.count(), 0);

        QVERIFY(session.setPaused(id, false));
        session.refresh(tick(2));
        QCOMPARE(finishedSpy.count(), 1);
        QCOMPARE(session.entries().first().state, TransferState::Completed);
    }

    void testSetPausedErrors()
    {
        FakeTransferEngine engine;
        Session session {&engine};

        const Session::MutationResult notFound = session.setPaused(u"missing"_s, true);
        QVERIFY(!notFound);
        QCOMPARE(notFound.error().kind, SessionErrorKind::NotFound);

        const std::shared_ptr<FakeTransferHandle> handle = addResolved(session, engine, MAGNET_A, u"a"_s, 1000);
        QVERIFY(handle);
        session.refresh(tick(0));

        handle->failControl = true;
        const Session::MutationResult refused = session.setPaused(FakeTransferEngine::contentID(MAGNET_A), true);
        QVERIFY(!refused);
        QCOMPARE(refused.error().kind, SessionErrorKind::InvalidHandle);
        QVERIFY(!session.entries().first().isPaused);
    }

    void testInvalidReference()
    {
        FakeTransferEngine engine;
        Session session {&engine};
        QSignalSpy failedSpy {&session, &Session::addTransferFailed};

        const Session::AddResult result = session.addTransfer(u"invalid-reference"_s);
        QVERIFY(!result);
        QCOMPARE(result.error().kind, SessionErrorKind::Registration);
        QCOMPARE(result.error().message, u"Invalid transfer reference"_s);
        QCOMPARE(failedSpy.count(), 1);
        QCOMPARE(session.pendingCount(), 0);
        QVERIFY(session.entries().isEmpty());

        const Session::AddResult empty = session.addTransfer(u"   "_s);
        QVERIFY(!empty);
        QCOMPARE(empty.error().kind, SessionErrorKind::Registration);

        session.refresh(tick(0));
        QVERIFY(session.entries().isEmpty());
    }

    void testHandleWithoutID()
    {
        FakeTransferEngine engine;
        Session session {&engine};

        const auto handle = std::make_shared<FakeTransferHandle>(u"broken"_s);
        handle->failID = true;
        engine.nextHandle = handle;

        const Session::AddResult result = session.addTransfer(MAGNET_A);
        QVERIFY(!result);
        QCOMPARE(result.error().kind, SessionErrorKind::Registration);
        QVERIFY(handle->dropped);
        QCOMPARE(session.pendingCount(), 0);
    }

    void testFileSource()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString torrentPath = dir.filePath(u"content.torrent"_s);

        FakeTransferEngine engine;
        Session session {&engine};

        QVERIFY(session.addTransfer(torrentPath));
        QCOMPARE(engine.fileSources, QStringList {torrentPath});
        QVERIFY(engine.magnetSources.isEmpty());

        // bare info hashes are magnet references
        const QString hash = u"0123456789abcdef0123456789abcdef01234567"_s;
        QVERIFY(session.addTransfer(hash));
        QCOMPARE(engine.magnetSources, QStringList {hash});
    }

    void testDuplicateRejected()
    {
        FakeTransferEngine engine;
        Session session {&engine};
        QCOMPARE(session.duplicatePolicy(), DuplicateTransferPolicy::Reject);

        const std::shared_ptr<FakeTransferHandle> handle = addResolved(session, engine, MAGNET_A, u"a"_s, 1000);
        QVERIFY(handle);

        // still pending
        const Session::AddResult pendingDuplicate = session.addTransfer(MAGNET_A + u"&dn=other"_s);
        QVERIFY(!pendingDuplicate);
        QCOMPARE(pendingDuplicate.error().kind, SessionErrorKind::Registration);

        session.refresh(tick(0));
        const Session::AddResult duplicate = session.addTransfer(MAGNET_A + u"&tr=http://tracker"_s);
        QVERIFY(!duplicate);
        QCOMPARE(duplicate.error().kind, SessionErrorKind::Registration);

        QVERIFY(!handle->dropped);
        QCOMPARE(session.entries().size(), 1);
        session.refresh(tick(1));
        QCOMPARE(session.entries().size(), 1);
    }

    void testDuplicateIgnored()
    {
        FakeTransferEngine engine;
        Session session {&engine};
        session.setDuplicatePolicy(DuplicateTransferPolicy::Ignore);

        const Session::AddResult first = session.addTransfer(MAGNET_A);
        QVERIFY(first);
        const Session::AddResult second = session.addTransfer(MAGNET_A + u"&dn=other"_s);
        QVERIFY(second);
        QCOMPARE(*second, *first);
        QCOMPARE(session.pendingCount(), 1);

        engine.handle(*first)->resolveMetadata(u"a"_s, 1000);
        session.refresh(tick(0));
        QCOMPARE(*session.addTransfer(MAGNET_A), *first);
        QCOMPARE(session.entries().size(), 1);
        QVERIFY(!engine.handle(*first)->dropped);
    }

    void testBatchAdd()
    {
        FakeTransferEngine engine;
        Session session {&engine};

        const QString batch = MAGNET_A + u"\n\n   \ninvalid-one\r\n  " + MAGNET_B + u"  \n";
        QCOMPARE(Session::splitSources(batch), QStringList({MAGNET_A, u"invalid-one"_s, MAGNET_B}));

        const QList<Session::AddResult> results = session.addTransfers(batch);
        QCOMPARE(results.size(), 3);
        QVERIFY(results[0]);
        QVERIFY(!results[1]);
        QCOMPARE(results[1].error().kind, SessionErrorKind::Registration);
        QVERIFY(results[2]);
        QCOMPARE(session.pendingCount(), 2);

        engine.handle(*results[0])->resolveMetadata(u"a"_s, 1000);
        engine.handle(*results[2])->resolveMetadata(u"b"_s, 2000);
        session.refresh(tick(0));

        const QList<SessionEntry> entries = session.entries();
        QCOMPARE(entries.size(), 2);
        QCOMPARE(session.status().activeCount, 2);
    }

    void testRemoveUnknown()
    {
        FakeTransferEngine engine;
        Session session {&engine};
        QVERIFY(addResolved(session, engine, MAGNET_A, u"a"_s, 1000));
        session.refresh(tick(0));

        const Session::MutationResult result = session.removeTransfer(u"unknown"_s);
        QVERIFY(!result);
        QCOMPARE(result.error().kind, SessionErrorKind::NotFound);
        QCOMPARE(session.entries().size(), 1);
    }

    void testRemove()
    {
        FakeTransferEngine engine;
        Session session {&engine};
        QSignalSpy removedSpy {&session, &Session::transferRemoved};
        QSignalSpy contentSpy {&session, &Session::contentRemoved};

        const std::shared_ptr<FakeTransferHandle> handle = addResolved(session, engine, MAGNET_A, u"a"_s, 1000);
        QVERIFY(handle);
        session.refresh(tick(0));

        const TransferID id = FakeTransferEngine::contentID(MAGNET_A);
        QVERIFY(session.removeTransfer(id));
        QVERIFY(handle->dropped);
        QVERIFY(session.entries().isEmpty());
        QVERIFY(!session.entry(id));
        QCOMPARE(removedSpy.count(), 1);

        session.refresh(tick(1));
        QCOMPARE(session.status().transfersCount, 0);
        QCOMPARE(Transfer::activitySummary(session.status()), u"Ready"_s);
        QTest::qWait(50);
        QCOMPARE(contentSpy.count(), 0);
    }

    void testRemovePending()
    {
        FakeTransferEngine engine;
        Session session {&engine};
        QSignalSpy removedSpy {&session, &Session::transferRemoved};

        const Session::AddResult id = session.addTransfer(MAGNET_A);
        QVERIFY(id);
        QVERIFY(session.removeTransfer(*id));
        QVERIFY(engine.handle(*id)->dropped);
        QCOMPARE(session.pendingCount(), 0);
        QCOMPARE(removedSpy.count(), 1);

        engine.handle(*id)->resolveMetadata(u"a"_s, 1000);
        session.refresh(tick(0));
        QVERIFY(session.entries().isEmpty());
    }

    void testRemoveWithContent()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString contentDir = dir.filePath(u"album"_s);
        QVERIFY(QDir().mkpath(contentDir + u"/cd1"));
        QFile file {contentDir + u"/cd1/track.flac"};
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("data");
        file.close();

        FakeTransferEngine engine;
        Session session {&engine};
        QSignalSpy contentSpy {&session, &Session::contentRemoved};

        const std::shared_ptr<FakeTransferHandle> handle = addResolved(session, engine, MAGNET_A, u"album"_s, 4);
        QVERIFY(handle);
        handle->path = contentDir;
        session.refresh(tick(0));

        const TransferID id = FakeTransferEngine::contentID(MAGNET_A);
        QVERIFY(session.removeTransfer(id, TransferRemoveOption::RemoveContent));
        QVERIFY(handle->dropped);
        QVERIFY(session.entries().isEmpty());

        // files stay until the engine has let go of them
        QTest::qWait(100);
        QCOMPARE(contentSpy.count(), 0);
        QVERIFY(QFile::exists(contentDir));

        engine.notifyTransferDropped(FakeTransferEngine::contentID(MAGNET_B));
        QTest::qWait(100);
        QCOMPARE(contentSpy.count(), 0);

        engine.notifyTransferDropped(id);
        QTRY_COMPARE(contentSpy.count(), 1);
        QCOMPARE(contentSpy.at(0).at(0).toString(), id);
        QVERIFY(contentSpy.at(0).at(1).toString().isEmpty());
        QVERIFY(!QFile::exists(contentDir));

        // a second notification has nothing left to remove
        engine.notifyTransferDropped(id);
        QTest::qWait(100);
        QCOMPARE(contentSpy.count(), 1);
    }

    void testRemoveContentOfTransferUnknownToEngine()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString contentFile = dir.filePath(u"movie.mkv"_s);
        QFile file {contentFile};
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("data");
        file.close();

        FakeTransferEngine engine;
        Session session {&engine};
        QSignalSpy removedSpy {&session, &Session::transferRemoved};
        QSignalSpy contentSpy {&session, &Session::contentRemoved};

        const std::shared_ptr<FakeTransferHandle> handle = addResolved(session, engine, MAGNET_A, u"movie.mkv"_s, 4);
        QVERIFY(handle);
        handle->path = contentFile;
        session.refresh(tick(0));

        // the engine already forgot the transfer, nothing holds the file any more
        handle->valid = false;
        QVERIFY(session.removeTransfer(FakeTransferEngine::contentID(MAGNET_A), TransferRemoveOption::RemoveContent));
        QCOMPARE(removedSpy.count(), 1);

        QTRY_COMPARE(contentSpy.count(), 1);
        QVERIFY(contentSpy.at(0).at(1).toString().isEmpty());
        QVERIFY(!QFile::exists(contentFile));
    }

    void testPurgeInvalidHandles()
    {
        FakeTransferEngine engine;
        Session session {&engine};
        QSignalSpy removedSpy {&session, &Session::transferRemoved};

        const std::shared_ptr<FakeTransferHandle> handleA = addResolved(session, engine, MAGNET_A, u"a"_s, 1000);
        const std::shared_ptr<FakeTransferHandle> handleB = addResolved(session, engine, MAGNET_B, u"b"_s, 1000);
        QVERIFY(handleA && handleB);
        session.refresh(tick(0));
        QCOMPARE(session.entries().size(), 2);

        handleA->valid = false;
        session.refresh(tick(1));

        const QList<SessionEntry> entries = session.entries();
        QCOMPARE(entries.size(), 1);
        QCOMPARE(entries.first().name, u"b"_s);
        QCOMPARE(removedSpy.count(), 1);
        QCOMPARE(removedSpy.at(0).at(0).toString(), FakeTransferEngine::contentID(MAGNET_A));
        QCOMPARE(session.status().transfersCount, 1);
    }

    void testInvalidHandleIsHiddenBeforePurge()
    {
        FakeTransferEngine engine;
        Session session {&engine};

        const std::shared_ptr<FakeTransferHandle> handleA = addResolved(session, engine, MAGNET_A, u"a"_s, 1000);
        const std::shared_ptr<FakeTransferHandle> handleB = addResolved(session, engine, MAGNET_B, u"b"_s, 1000);
        QVERIFY(handleA && handleB);
        session.refresh(tick(0));
        QCOMPARE(session.entries().size(), 2);

        // no refresh cycle in between
        handleA->valid = false;
        const QList<SessionEntry> entries = session.entries();
        QCOMPARE(entries.size(), 1);
        QCOMPARE(entries.first().name, u"b"_s);
        QVERIFY(!session.entry(FakeTransferEngine::contentID(MAGNET_A)));
        QVERIFY(session.entry(FakeTransferEngine::contentID(MAGNET_B)));
    }

    void testPendingDroppedByEngine()
    {
        FakeTransferEngine engine;
        Session session {&engine};

        const Session::AddResult id = session.addTransfer(MAGNET_A);
        QVERIFY(id);
        engine.handle(*id)->valid = false;

        session.refresh(tick(0));
        QCOMPARE(session.pendingCount(), 0);
        QVERIFY(session.entries().isEmpty());
    }

    void testSampleFailureIsIsolated()
    {
        FakeTransferEngine engine;
        Session session {&engine};

        const std::shared_ptr<FakeTransferHandle> handleA = addResolved(session, engine, MAGNET_A, u"a"_s, 1'000'000);
        const std::shared_ptr<FakeTransferHandle> handleB = addResolved(session, engine, MAGNET_B, u"b"_s, 1'000'000);
        QVERIFY(handleA && handleB);
        session.refresh(tick(0));

        handleA->completed = 100'000;
        handleB->completed = 100'000;
        session.refresh(tick(1));

        handleA->failSampling = true;
        handleA->completed = 300'000;
        handleB->completed = 300'000;
        session.refresh(tick(2));

        SessionEntry entryA = *session.entry(FakeTransferEngine::contentID(MAGNET_A));
        const SessionEntry entryB = *session.entry(FakeTransferEngine::contentID(MAGNET_B));
        QCOMPARE(entryA.downloadedBytes, 100'000);
        QCOMPARE(entryA.downloadRate, 100'000);
        QCOMPARE(entryA.lastSampledAt, tick(1));
        QCOMPARE(entryB.downloadedBytes, 300'000);
        QCOMPARE(entryB.downloadRate, 200'000);

        handleA->failSampling = false;
        session.refresh(tick(3));
        entryA = *session.entry(FakeTransferEngine::contentID(MAGNET_A));
        QCOMPARE(entryA.downloadedBytes, 300'000);
        QCOMPARE(entryA.downloadRate, 100'000);
    }

    void testPerFileProgress()
    {
        FakeTransferEngine engine;
        Session session {&engine};

        const Session::AddResult id = session.addTransfer(MAGNET_A);
        QVERIFY(id);
        const std::shared_ptr<FakeTransferHandle> handle = engine.handle(*id);
        handle->resolveMetadata(u"album"_s, 3000, {{u"album/a.flac"_s, 1000}, {u"album/b.flac"_s, 2000}, {u"album/empty.txt"_s, 0}});
        handle->completed = 1500;
        handle->filesCompleted = {1000, 500, 0};
        session.refresh(tick(0));

        SessionEntry entry = *session.entry(*id);
        QCOMPARE(entry.fileCount(), 3);
        QCOMPARE(entry.files[0].progress, 1.0);
        QCOMPARE(entry.files[1].progress, 0.25);
        QCOMPARE(entry.files[2].progress, 1.0);

        // without per-file counters every file shows the overall progress
        handle->filesCompleted.clear();
        handle->completed = 2400;
        session.refresh(tick(1));
        entry = *session.entry(*id);
        QCOMPARE(entry.files[0].progress, 0.8);
        QCOMPARE(entry.files[1].progress, 0.8);
    }

    void testSeedingPartialDownload()
    {
        FakeTransferEngine engine;
        Session session {&engine};

        const std::shared_ptr<FakeTransferHandle> handle = addResolved(session, engine, MAGNET_A, u"a"_s, 1000);
        QVERIFY(handle);
        handle->completed = 400;
        handle->seeding = true;
        session.refresh(tick(0));

        QCOMPARE(session.entries().first().state, TransferState::Seeding);
        QCOMPARE(session.status().seedingCount, 1);
        QCOMPARE(session.status().activeCount, 0);
    }

    void testResumeKeepsSeedingState()
    {
        FakeTransferEngine engine;
        Session session {&engine};

        const std::shared_ptr<FakeTransferHandle> handle = addResolved(session, engine, MAGNET_A, u"a"_s, 1000);
        QVERIFY(handle);
        handle->completed = 400;
        handle->seeding = true;
        session.refresh(tick(0));
        QCOMPARE(session.entries().first().state, TransferState::Seeding);

        const TransferID id = FakeTransferEngine::contentID(MAGNET_A);
        QVERIFY(session.setPaused(id, true));
        QCOMPARE(session.entries().first().state, TransferState::Paused);

        QVERIFY(session.setPaused(id, false));
        QCOMPARE(session.entries().first().state, TransferState::Seeding);
    }

    void testUpdatesArePublished()
    {
        FakeTransferEngine engine;
        Session session {&engine};
        QSignalSpy entriesSpy {&session, &Session::transfersUpdated};
        QSignalSpy statsSpy {&session, &Session::statsUpdated};

        QVERIFY(addResolved(session, engine, MAGNET_A, u"a"_s, 1000));
        session.refresh(tick(0));
        session.refresh(tick(1));

        QCOMPARE(entriesSpy.count(), 2);
        QCOMPARE(statsSpy.count(), 2);
        QCOMPARE(entriesSpy.last().at(0).value<QList<SessionEntry>>().size(), 1);
        QCOMPARE(statsSpy.last().at(0).value<SessionStatus>().transfersCount, 1);
    }

    void testRefreshThread()
    {
        FakeTransferEngine engine;
        Session session {&engine};
        session.setRefreshInterval(100);

        // cycles run on the refresh thread, count them on this one
        int cycles = 0;
        connect(&session, &Session::statsUpdated, this, [&cycles] { ++cycles; });

        session.startRefreshing();
        QVERIFY(session.isRefreshing());
        session.startRefreshing();

        QTRY_VERIFY(cycles >= 2);

        session.stopRefreshing();
        QVERIFY(!session.isRefreshing());

        QCoreApplication::processEvents();
        const int count = cycles;
        QTest::qWait(300);
        QCOMPARE(cycles, count);
    }

    void testMutationsDuringRefresh()
    {
        FakeTransferEngine engine;
        Session session {&engine};
        session.setRefreshInterval(100);

        // checked on the refresh thread, as each snapshot gets published
        QMutex checkMutex;
        QSet<TransferID> removedIDs;
        QSet<TransferID> goneIDs;
        int snapshots = 0;
        int badEntries = 0;
        connect(&session, &Session::transfersUpdated, this
            , [&checkMutex, &removedIDs, &goneIDs, &snapshots, &badEntries](const QList<SessionEntry> &entries)
        {
            const QMutexLocker locker {&checkMutex};
            ++snapshots;

            QSet<TransferID> ids;
            for (const SessionEntry &entry : entries)
            {
                ids.insert(entry.id);
                if ((entry.downloadRate < 0) || (entry.uploadRate < 0)
                        || (entry.downloadedBytes > entry.totalSize)
                        || (entry.progress < 0) || (entry.progress > 1)
                        || goneIDs.contains(entry.id))
                {
                    ++badEntries;
                }
            }

            for (const TransferID &id : asConst(removedIDs))
            {
                if (!ids.contains(id))
                    goneIDs.insert(id);
            }
        }, Qt::DirectConnection);

        session.startRefreshing();

        QList<std::shared_ptr<FakeTransferHandle>> removedHandles;
        for (int i = 0; i < 40; ++i)
        {
            const QString source = u"magnet:?xt=urn:btih:%1"_s.arg(i, 40, 10, u'0');
            const auto newHandle = std::make_shared<FakeTransferHandle>(FakeTransferEngine::contentID(source));
            newHandle->resolveMetadata(u"transfer %1"_s.arg(i), 10'000'000);
            newHandle->bytesPerSample = 50'000;
            engine.nextHandle = newHandle;
            QVERIFY(session.addTransfer(source));

            QTest::qWait(20);

            const QList<SessionEntry> entries = session.entries();
            if (entries.isEmpty())
                continue;

            const SessionEntry target = entries.at(i % entries.size());
            if ((i % 3) == 0)
            {
                QVERIFY(session.removeTransfer(target.id));
                QVERIFY(!session.entry(target.id));
                removedHandles.append(engine.handle(target.id));

                const QMutexLocker locker {&checkMutex};
                removedIDs.insert(target.id);
            }
            else
            {
                QVERIFY(session.setPaused(target.id, !target.isPaused));
            }
        }

        const auto publishedSnapshots = [&checkMutex, &snapshots]
        {
            const QMutexLocker locker {&checkMutex};
            return snapshots;
        };
        const int publishedBeforeWait = publishedSnapshots();
        QTRY_VERIFY(publishedSnapshots() >= (publishedBeforeWait + 2));
        session.stopRefreshing();

        QVERIFY(!removedHandles.isEmpty());
        for (const std::shared_ptr<FakeTransferHandle> &handle : asConst(removedHandles))
        {
            QVERIFY(handle->dropped);
            QCOMPARE(handle->samplesAfterDrop.load(), 0);
        }

        const QMutexLocker locker {&checkMutex};
        QCOMPARE(badEntries, 0);
        for (const TransferID &id : asConst(removedIDs))
            QVERIFY(goneIDs.contains(id));
    }
};

QTEST_GUILESS_MAIN(TestTransferSession)
#include "testtransfersession.moc"
