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

#include "settingsstorage.h"

#include <chrono>

#include <QSettings>

#include "global.h"
#include "logger.h"

using namespace std::chrono_literals;

SettingsStorage *SettingsStorage::m_instance = nullptr;

SettingsStorage::SettingsStorage(const QString &filePath)
    : m_filePath {filePath}
{
    readNativeSettings();

    m_timer.setSingleShot(true);
    m_timer.setInterval(5s);
    connect(&m_timer, &QTimer::timeout, this, &SettingsStorage::save);
}

SettingsStorage::~SettingsStorage()
{
    save();
}

void SettingsStorage::initInstance(const QString &filePath)
{
    if (!m_instance)
        m_instance = new SettingsStorage(filePath);
}

void SettingsStorage::freeInstance()
{
    delete m_instance;
    m_instance = nullptr;
}

SettingsStorage *SettingsStorage::instance()
{
    return m_instance;
}

QString SettingsStorage::filePath() const
{
    return m_filePath;
}

bool SettingsStorage::save()
{
    // return `true` only when settings is different AND is saved successfully

    const QWriteLocker locker(&m_lock);  // guard for `m_dirty` too
    if (!m_dirty || m_filePath.isEmpty())
        return false;

    if (!writeNativeSettings())
    {
        m_timer.start();
        return false;
    }

    m_dirty = false;
    return true;
}

QVariant SettingsStorage::loadValueImpl(const QString &key, const QVariant &defaultValue) const
{
    const QReadLocker locker(&m_lock);
    return m_data.value(key, defaultValue);
}

void SettingsStorage::storeValueImpl(const QString &key, const QVariant &value)
{
    const QWriteLocker locker(&m_lock);
    QVariant &currentValue = m_data[key];
    if (currentValue != value)
    {
        m_dirty = true;
        currentValue = value;
        if (!m_filePath.isEmpty())
            m_timer.start();
    }
}

void SettingsStorage::readNativeSettings()
{
    if (m_filePath.isEmpty())
        return;

    const QSettings nativeSettings {m_filePath, QSettings::IniFormat};
    // Copy everything into memory, including keys this program does not know about,
    // so they survive the next save.
    for (const QString &key : asConst(nativeSettings.allKeys()))
    {
        const QVariant value = nativeSettings.value(key);
        if (value.isValid())
            m_data[key] = value;
    }
}

bool SettingsStorage::writeNativeSettings() const
{
    QSettings nativeSettings {m_filePath, QSettings::IniFormat};
    nativeSettings.clear();
    for (auto i = m_data.cbegin(); i != m_data.cend(); ++i)
        nativeSettings.setValue(i.key(), i.value());

    nativeSettings.sync(); // Important to get error status
    switch (nativeSettings.status())
    {
    case QSettings::NoError:
        return true;
    case QSettings::AccessError:
        LogMsg(tr("An access error occurred while trying to write the configuration file. File: \"%1\"").arg(m_filePath), Log::CRITICAL);
        break;
    case QSettings::FormatError:
        LogMsg(tr("A format error occurred while trying to write the configuration file. File: \"%1\"").arg(m_filePath), Log::CRITICAL);
        break;
    default:
        LogMsg(tr("An unknown error occurred while trying to write the configuration file. File: \"%1\"").arg(m_filePath), Log::CRITICAL);
        break;
    }
    return false;
}

void SettingsStorage::removeValue(const QString &key)
{
    const QWriteLocker locker(&m_lock);
    if (m_data.remove(key))
    {
        m_dirty = true;
        if (!m_filePath.isEmpty())
            m_timer.start();
    }
}

bool SettingsStorage::hasKey(const QString &key) const
{
    const QReadLocker locker {&m_lock};
    return m_data.contains(key);
}

bool SettingsStorage::isEmpty() const
{
    const QReadLocker locker {&m_lock};
    return m_data.isEmpty();
}
