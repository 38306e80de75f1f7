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

#include "fs.h"

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>

bool Utils::Fs::isRegularFile(const QString &path)
{
    return QFileInfo(path).isFile();
}

bool Utils::Fs::isDir(const QString &path)
{
    return QFileInfo(path).isDir();
}

QString Utils::Fs::toAbsolutePath(const QString &path)
{
    if (path.isEmpty())
        return path;

    return QFileInfo(path).absoluteFilePath();
}

nonstd::expected<void, QString> Utils::Fs::removeFile(const QString &path)
{
    QFile file {path};
    if (file.remove())
        return {};

    if (!file.exists())
        return {};

    // Make sure we have read/write permissions
    file.setPermissions(file.permissions() | QFile::ReadOwner | QFile::WriteOwner | QFile::ReadUser | QFile::WriteUser);
    if (file.remove())
        return {};

    return nonstd::make_unexpected(file.errorString());
}

/**
 * Removes directory and its content recursively.
 */
nonstd::expected<void, QString> Utils::Fs::removeDirRecursively(const QString &path)
{
    if (path.isEmpty())
        return {};

    QDir dir {path};
    if (!dir.exists() || dir.removeRecursively())
        return {};

    return nonstd::make_unexpected(QCoreApplication::translate("fs", "Could not remove every entry of the folder"));
}

bool Utils::Fs::mkpath(const QString &dirPath)
{
    return QDir().mkpath(dirPath);
}

QString Utils::Fs::homePath()
{
    return QDir::homePath();
}
