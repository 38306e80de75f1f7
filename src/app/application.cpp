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

#include "application.h"

#include <algorithm>
#include <cstdio>

#include <QDir>
#include <QFile>
#include <QStandardPaths>

#include "base/exceptions.h"
#include "base/global.h"
#include "base/logger.h"
#include "base/settingsstorage.h"
#include "base/settingvalue.h"
#include "base/transfer/lttransferengine.h"
#include "base/transfer/session.h"
#include "base/transfer/sessionstatus.h"
#include "base/utils/fs.h"
#include "base/utils/misc.h"
#include "base/version.h"
#include "filelogger.h"

namespace
{
#define SETTINGS_KEY(name) u"Application/" name
#define FILELOGGER_SETTINGS_KEY(name) (SETTINGS_KEY(u"FileLogger/") name)

    const QString CONFIG_FILE_NAME = u"qtransfer.ini"_s;
    const QString LOG_FOLDER = u"logs"_s;

    const int MIN_FILELOG_SIZE = 1024; // 1KiB
    const int MAX_FILELOG_SIZE = 1000 * 1024 * 1024; // 1000MiB
    const int DEFAULT_FILELOG_SIZE = 65 * 1024; // 65KiB
}

Application::Application(int &argc, char **argv)
    : QCoreApplication(argc, argv)
    , m_commandLineArgs(parseCommandLine(Application::arguments()))
{
    qRegisterMetaType<Log::Msg>("Log::Msg");

    setApplicationName(u"qTransfer"_s);
    setApplicationVersion(QStringLiteral(QTR_VERSION));

    Logger::initInstance();

    m_profilePath = m_commandLineArgs.profileDir.isEmpty()
        ? QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation)
        : m_commandLineArgs.profileDir;
    if (!Utils::Fs::mkpath(m_profilePath))
        throw RuntimeError(u"Could not create profile folder: %1"_s.arg(m_profilePath)); // Not translatable. Translation isn't configured yet.

    SettingsStorage::initInstance(QDir(m_profilePath).filePath(CONFIG_FILE_NAME));

    connect(this, &QCoreApplication::aboutToQuit, this, &Application::cleanup);

    LogMsg(tr("qTransfer %1 started. Process ID: %2", "qTransfer v1.0.0 started")
        .arg(QStringLiteral(QTR_VERSION), QString::number(QCoreApplication::applicationPid())));
    LogMsg(tr("Using config directory: %1").arg(m_profilePath));

    if (isFileLoggerEnabled())
        m_fileLogger = new FileLogger(fileLoggerPath(), isFileLoggerBackup(), fileLoggerMaxSize());
}

Application::~Application()
{
    // we still need to call cleanup()
    // in case the App failed to start
    cleanup();
}

const QTrCommandLineParameters &Application::commandLineArgs() const
{
    return m_commandLineArgs;
}

QString Application::profilePath() const
{
    return m_profilePath;
}

bool Application::isFileLoggerEnabled() const
{
    return SettingValue<bool>(FILELOGGER_SETTINGS_KEY(u"Enabled"_s)).get(true);
}

QString Application::fileLoggerPath() const
{
    return SettingValue<QString>(FILELOGGER_SETTINGS_KEY(u"Path"_s)).get(QDir(m_profilePath).filePath(LOG_FOLDER));
}

bool Application::isFileLoggerBackup() const
{
    return SettingValue<bool>(FILELOGGER_SETTINGS_KEY(u"Backup"_s)).get(true);
}

int Application::fileLoggerMaxSize() const
{
    const int val = SettingValue<int>(FILELOGGER_SETTINGS_KEY(u"MaxSizeBytes"_s)).get(DEFAULT_FILELOG_SIZE);
    return std::clamp(val, MIN_FILELOG_SIZE, MAX_FILELOG_SIZE);
}

QString Application::downloadPath() const
{
    if (!m_commandLineArgs.savePath.isEmpty())
        return m_commandLineArgs.savePath;

    const QString defaultPath = QDir(Utils::Fs::homePath()).filePath(u"Downloads/qTransfer"_s);
    return Utils::Fs::toAbsolutePath(SettingValue<QString>(u"TransferSession/DownloadPath"_s).get(defaultPath));
}

int Application::exec()
{
    m_engine = new Transfer::LTTransferEngine(downloadPath(), this);
    m_session = new Transfer::Session(m_engine, this);

    // it will be -1 when user did not set any value
    if (m_commandLineArgs.refreshInterval > 0)
        m_session->setRefreshInterval(m_commandLineArgs.refreshInterval);

    connect(m_session, &Transfer::Session::transferFinished, this, &Application::transferFinished);
    connect(m_session, &Transfer::Session::statsUpdated, this, &Application::statsUpdated);
    connect(m_session, &Transfer::Session::addTransferFailed, this, &Application::addTransferFailed);

    addSources();

    m_session->startRefreshing();

    return QCoreApplication::exec();
}

void Application::addSources()
{
    QStringList sources = m_commandLineArgs.transferSources;
    if (!m_commandLineArgs.batchFile.isEmpty())
        sources += readBatchFile(m_commandLineArgs.batchFile);

    // failures are reported through addTransferFailed()
    const QList<Transfer::Session::AddResult> results = m_session->addTransfers(sources);
    const auto addedCount = std::count_if(results.cbegin(), results.cend()
        , [](const Transfer::Session::AddResult &result) { return result.has_value(); });
    LogMsg(tr("Added %1 of %2 transfer(s) from the command line").arg(QString::number(addedCount), QString::number(results.size())));
}

QStringList Application::readBatchFile(const QString &path) const
{
    QFile file {path};
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text))
    {
        LogMsg(tr("Could not read batch file \"%1\". Reason: %2").arg(path, file.errorString()), Log::WARNING);
        return {};
    }

    return Transfer::Session::splitSources(QString::fromUtf8(file.readAll()));
}

void Application::transferFinished(const Transfer::TransferCompletion &completion)
{
    printf("%s\n", qUtf8Printable(tr("Download Complete: %1").arg(completion.name)));
}

void Application::statsUpdated(const Transfer::SessionStatus &status)
{
    //: e.g. Downloading | 2 Active, 1 Complete | DL: 1.5 MiB/s UL: 20.0 KiB/s
    const QString line = tr("%1 | %2 Active, %3 Complete | DL: %4 UL: %5")
        .arg(Transfer::activitySummary(status)
            , QString::number(status.activeCount)
            , QString::number(status.completedCount)
            , Utils::Misc::friendlyUnit(status.downloadRate, true)
            , Utils::Misc::friendlyUnit(status.uploadRate, true));
    printf("%s\n", qUtf8Printable(line));

    if (m_commandLineArgs.exitWhenDone && (status.pendingCount == 0)
        && (status.completedCount == status.transfersCount))
    {
        LogMsg(tr("All transfers have completed. Exiting."));
        QCoreApplication::exit();
    }
}

void Application::addTransferFailed(const QString &source, const QString &reason)
{
    fprintf(stderr, "%s\n", qUtf8Printable(tr("Could not add \"%1\": %2").arg(source, reason)));
}

void Application::cleanup()
{
    // cleanup() can be called multiple times during shutdown. We only need it once.
    if (m_isCleanupRun)
        return;
    m_isCleanupRun = true;

    if (m_session)
    {
        m_session->stopRefreshing();
        delete m_session;
        m_session = nullptr;
    }

    delete m_engine;
    m_engine = nullptr;

    SettingsStorage::freeInstance();

    LogMsg(tr("qTransfer is shut down."));

    Logger::freeInstance();

    delete m_fileLogger;
    m_fileLogger = nullptr;
}
