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

#include <QDir>
#include <QFile>
#include <QObject>
#include <QTemporaryDir>
#include <QTest>

#include "base/global.h"
#include "app/cmdoptions.h"

namespace
{
    QTrCommandLineParameters parse(const QStringList &args)
    {
        return parseCommandLine(QStringList {u"qtransfer"_s} + args);
    }

    bool rejects(const QStringList &args)
    {
        try
        {
            parse(args);
        }
        catch (const CommandLineParameterError &)
        {
            return true;
        }
        return false;
    }
}

class TestCmdOptions final : public QObject
{
    Q_OBJECT
    Q_DISABLE_COPY_MOVE(TestCmdOptions)

public:
    TestCmdOptions() = default;

private slots:
    void testDefaults() const
    {
        const QTrCommandLineParameters params = parse({});
        QVERIFY(!params.showHelp);
        QVERIFY(!params.showVersion);
        QVERIFY(!params.exitWhenDone);
        QCOMPARE(params.refreshInterval, -1);
        QVERIFY(params.profileDir.isEmpty());
        QVERIFY(params.savePath.isEmpty());
        QVERIFY(params.batchFile.isEmpty());
        QVERIFY(params.transferSources.isEmpty());
        QVERIFY(params.unknownParameter.isEmpty());
    }

    void testFlags() const
    {
        QVERIFY(parse({u"-h"_s}).showHelp);
        QVERIFY(parse({u"--help"_s}).showHelp);
        QVERIFY(parse({u"-v"_s}).showVersion);
        QVERIFY(parse({u"--version"_s}).showVersion);
        QVERIFY(parse({u"--exit-when-done"_s}).exitWhenDone);
    }

    void testValues() const
    {
        const QTrCommandLineParameters params = parse({u"--refresh-interval=250"_s, u"--save-path=\"/data/downloads\""_s
            , u"--profile=/data/profile"_s, u"--batch-file=links.txt"_s});
        QCOMPARE(params.refreshInterval, 250);
        QCOMPARE(params.savePath, u"/data/downloads"_s);
        QCOMPARE(params.profileDir, u"/data/profile"_s);
        QCOMPARE(params.batchFile, u"links.txt"_s);

        QCOMPARE(parse({u"--save-path=relative"_s}).savePath, QDir::current().absoluteFilePath(u"relative"_s));
    }

    void testInvalidValues() const
    {
        QVERIFY(rejects({u"--refresh-interval=abc"_s}));
        QVERIFY(rejects({u"--refresh-interval=50"_s}));
        QVERIFY(rejects({u"--save-path=a=b"_s}));
        QVERIFY(!rejects({u"--refresh-interval=100"_s}));
    }

    void testUnknownParameter() const
    {
        const QTrCommandLineParameters params = parse({u"--exit-when-done"_s, u"--bogus"_s, u"--help"_s});
        QVERIFY(params.exitWhenDone);
        QCOMPARE(params.unknownParameter, u"--bogus"_s);
        QVERIFY(!params.showHelp);
    }

    void testSources() const
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString torrentPath = dir.filePath(u"content.torrent"_s);
        QFile file {torrentPath};
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.close();

        const QString magnet = u"magnet:?xt=urn:btih:0123456789abcdef0123456789abcdef01234567"_s;
        const QTrCommandLineParameters params = parse({magnet, torrentPath, u"--odd-name.torrent"_s, u"missing.torrent"_s});
        QCOMPARE(params.transferSources, QStringList({magnet, torrentPath, u"--odd-name.torrent"_s, u"missing.torrent"_s}));
    }

    void testEnvironment() const
    {
        qputenv("QTR_EXIT_WHEN_DONE", "TRUE");
        qputenv("QTR_REFRESH_INTERVAL", "300");
        qputenv("QTR_SAVE_PATH", "/env/downloads");

        QTrCommandLineParameters params = parse({});
        QVERIFY(params.exitWhenDone);
        QCOMPARE(params.refreshInterval, 300);
        QCOMPARE(params.savePath, u"/env/downloads"_s);

        // command line wins
        params = parse({u"--refresh-interval=400"_s, u"--save-path=/cli/downloads"_s});
        QCOMPARE(params.refreshInterval, 400);
        QCOMPARE(params.savePath, u"/cli/downloads"_s);

        qunsetenv("QTR_EXIT_WHEN_DONE");
        qunsetenv("QTR_REFRESH_INTERVAL");
        qunsetenv("QTR_SAVE_PATH");
        QVERIFY(!parse({}).exitWhenDone);
    }

    void testUsage() const
    {
        const QString usage = makeUsage(u"qtransfer"_s);
        QVERIFY(usage.contains(u"--batch-file=<file>"_s));
        QVERIFY(usage.contains(u"--refresh-interval=<ms>"_s));
        QVERIFY(usage.contains(u"-h | --help"_s));
        QVERIFY(usage.contains(u"QTR_EXIT_WHEN_DONE=1 qtransfer"_s));
    }
};

QTEST_APPLESS_MAIN(TestCmdOptions)
#include "testcmdoptions.moc"
