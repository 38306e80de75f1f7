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

#ifndef Q_MOC_RUN
#include <boost/circular_buffer.hpp>
#endif

#include <QDateTime>
#include <QObject>
#include <QReadWriteLock>
#include <QString>
#include <QtContainerFwd>

// older messages are dropped once the history is full
inline const int LOG_HISTORY_SIZE = 20000;

namespace Log
{
    enum MsgType
    {
        NORMAL,
        INFO,
        WARNING,
        CRITICAL // ERROR is defined by libtorrent and results in compiler error
    };

    struct Msg
    {
        int id = -1;
        MsgType type = NORMAL;
        QDateTime timestamp;
        QString message;
    };
}

class Logger final : public QObject
{
    Q_OBJECT
    Q_DISABLE_COPY_MOVE(Logger)

public:
    static void initInstance();
    static void freeInstance();
    static Logger *instance();

    void addMessage(const QString &message, Log::MsgType type = Log::NORMAL);
    // Messages with an id greater than `lastKnownId`, oldest first
    QList<Log::Msg> getMessages(int lastKnownId = -1) const;

signals:
    void newLogMessage(const Log::Msg &message);

private:
    Logger();
    ~Logger() = default;

    static Logger *m_instance;
    boost::circular_buffer_space_optimized<Log::Msg> m_messages;
    mutable QReadWriteLock m_lock;
    int m_msgCounter = 0;
};

void LogMsg(const QString &message, Log::MsgType type = Log::NORMAL);
