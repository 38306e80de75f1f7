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

#include <cstdio>
#include <cstdlib>
#include <memory>
#include <optional>

#include <sys/resource.h>

#include <QCoreApplication>
#include <QString>

#include "base/global.h"
#include "base/version.h"
#include "application.h"
#include "cmdoptions.h"
#include "signalhandler.h"

namespace
{
    void printError(const QString &title, const QString &details)
    {
        fprintf(stderr, "%s\n%s\n", qUtf8Printable(title), qUtf8Printable(details));
    }

    // many transfers keep many files open at once
    void raiseFileDescriptorLimit()
    {
        rlimit limit {};
        if (getrlimit(RLIMIT_NOFILE, &limit) != 0)
            return;

        limit.rlim_cur = limit.rlim_max;
        setrlimit(RLIMIT_NOFILE, &limit);
    }

    void ensureLocale()
    {
        // `C.UTF-8` is the only locale present on every system
        if (qEnvironmentVariableIsEmpty("LANG"))
            qputenv("LANG", "C.UTF-8");
    }

    QString soleParameterError(const QString &option)
    {
        return QCoreApplication::translate("Main", "%1 can't be combined with other parameters.").arg(option);
    }

    // Handles -h and -v. Returns the exit code when nothing else is left to do.
    std::optional<int> runInformationalOption(const QTrCommandLineParameters &params, const bool isSoleArgument, const char *programPath)
    {
        if (!params.unknownParameter.isEmpty())
        {
            throw CommandLineParameterError(QCoreApplication::translate("Main", "Unknown parameter: %1")
                .arg(params.unknownParameter));
        }

        if (params.showVersion)
        {
            if (!isSoleArgument)
                throw CommandLineParameterError(soleParameterError(u"-v (--version)"_s));

            printf("%s %s\n", qUtf8Printable(QCoreApplication::applicationName()), QTR_VERSION);
            return EXIT_SUCCESS;
        }

        if (params.showHelp)
        {
            if (!isSoleArgument)
                throw CommandLineParameterError(soleParameterError(u"-h (--help)"_s));

            displayUsage(QString::fromLocal8Bit(programPath));
            return EXIT_SUCCESS;
        }

        return std::nullopt;
    }
}

int main(int argc, char *argv[])
{
    setvbuf(stdout, nullptr, _IONBF, 0);

    ensureLocale();
    raiseFileDescriptorLimit();

    // QCoreApplication may strip arguments it recognizes
    const bool isSoleArgument = (argc == 2);

    std::unique_ptr<Application> app;
    try
    {
        app = std::make_unique<Application>(argc, argv);

        if (const std::optional<int> exitCode = runInformationalOption(app->commandLineArgs(), isSoleArgument, argv[0]))
            return *exitCode;

        registerSignalHandlers();
        return app->exec();
    }
    catch (const CommandLineParameterError &er)
    {
        printError(QCoreApplication::translate("Main", "Invalid command line. Run with -h to list the parameters."), er.message());
        return EXIT_FAILURE;
    }
    catch (const RuntimeError &er)
    {
        printError(QCoreApplication::translate("Main", "qTransfer stopped because of an unrecoverable error."), er.message());
        return EXIT_FAILURE;
    }
}
