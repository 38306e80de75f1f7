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

#include <functional>
#include <utility>

#include <QString>

#include "settingsstorage.h"

// Typed access to one key of `SettingsStorage`. Every read goes to the storage,
// prefer `CachedSettingValue` for values read on each refresh.
template <typename T>
class SettingValue
{
public:
    explicit SettingValue(const QString &keyName)
        : m_keyName {keyName}
    {
        Q_ASSERT(SettingsStorage::instance());
    }

    QString keyName() const
    {
        return m_keyName;
    }

    T get(const T &defaultValue = {}) const
    {
        return SettingsStorage::instance()->loadValue(m_keyName, defaultValue);
    }

    void set(const T &value)
    {
        SettingsStorage::instance()->storeValue(m_keyName, value);
    }

    SettingValue<T> &operator=(const T &value)
    {
        set(value);
        return *this;
    }

private:
    const QString m_keyName;
};

// Keeps the value in memory and writes changes through to the storage.
// `normalizer` (clamping, for instance) applies to loaded and assigned values alike.
template <typename T>
class CachedSettingValue
{
public:
    using Normalizer = std::function<T (const T &)>;

    explicit CachedSettingValue(const QString &keyName, const T &defaultValue = {}, Normalizer normalizer = {})
        : m_settingValue {keyName}
        , m_normalizer {std::move(normalizer)}
        , m_cache {normalized(m_settingValue.get(defaultValue))}
    {
    }

    T get() const
    {
        return m_cache;
    }

    operator T() const
    {
        return get();
    }

    CachedSettingValue<T> &operator=(const T &value)
    {
        const T newValue = normalized(value);
        if (m_cache == newValue)
            return *this;

        m_settingValue = newValue;
        m_cache = newValue;
        return *this;
    }

private:
    T normalized(const T &value) const
    {
        return m_normalizer ? m_normalizer(value) : value;
    }

    SettingValue<T> m_settingValue;
    Normalizer m_normalizer;
    T m_cache;
};
