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

#include <QCoreApplication>
#include <QString>

#include "cmdoptions.h"

class FileLogger;

namespace Transfer
{
    class LTTransferEngine;
    class Session;
    struct SessionStatus;
    struct TransferCompletion;
}

class Application final : public QCoreApplication
{
    Q_OBJECT
    Q_DISABLE_COPY_MOVE(Application)

public:
    Application(int &argc, char **argv);
    ~Application() override;

    int exec();

    const QTrCommandLineParameters &commandLineArgs() const;
    QString profilePath() const;

    // FileLogger properties
    bool isFileLoggerEnabled() const;
    QString fileLoggerPath() const;
    bool isFileLoggerBackup() const;
    int fileLoggerMaxSize() const;

    QString downloadPath() const;

private slots:
    void transferFinished(const Transfer::TransferCompletion &completion);
    void statsUpdated(const Transfer::SessionStatus &status);
    void addTransferFailed(const QString &source, const QString &reason);
    void cleanup();

private:
    void addSources();
    QStringList readBatchFile(const QString &path) const;

    bool m_isCleanupRun = false;
    QTrCommandLineParameters m_commandLineArgs;
    QString m_profilePath;

    FileLogger *m_fileLogger = nullptr;
    Transfer::LTTransferEngine *m_engine = nullptr;
    Transfer::Session *m_session = nullptr;
};
