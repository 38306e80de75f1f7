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

#include <memory>

#include <nonstd/expected.hpp>

#include <QObject>
#include <QString>

#include "transferhandle.h"

namespace Transfer
{
    // Registers transfers with the underlying P2P engine.
    // Registering content that is already known returns the existing handle.
    class TransferEngine : public QObject
    {
        Q_OBJECT
        Q_DISABLE_COPY_MOVE(TransferEngine)

    public:
        using AddResult = nonstd::expected<std::shared_ptr<TransferHandle>, QString>;

        virtual AddResult addFromMagnet(const QString &reference) = 0;
        virtual AddResult addFromFile(const QString &path) = 0;

    signals:
        void metadataReceived(const TransferID &id);
        // The engine has released the files of a dropped transfer.
        // `errorMessage` is set when it failed to clean up after it.
        void transferDropped(const TransferID &id, const QString &errorMessage);

    protected:
        using QObject::QObject;
    };
}
