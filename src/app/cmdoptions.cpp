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

#include "cmdoptions.h"

#include <cstdio>

#include <QCoreApplication>
#include <QDebug>
#include <QFileInfo>
#include <QProcessEnvironment>
#include <QStringView>

#include "base/global.h"
#include "base/utils/fs.h"
#include "base/utils/misc.h"
#include "base/utils/string.h"

namespace
{
    const int USAGE_INDENTATION = 4;
    const int USAGE_TEXT_COLUMN = 31;
    const int WRAP_AT_COLUMN = 80;
    const int MIN_REFRESH_INTERVAL = 100;

    // Base option class. Encapsulates name operations.
    class Option
    {
    protected:
        explicit constexpr Option(const QStringView name, const QChar shortcut = QChar::Null)
            : m_name {name}
            , m_shortcut {shortcut}
        {
        }

        QString fullParameter() const
        {
            return u"--" + m_name.toString();
        }

        QString shortcutParameter() const
        {
            return u"-" + m_shortcut;
        }

        bool hasShortcut() const
        {
            return !m_shortcut.isNull();
        }

        QString envVarName() const
        {
            return u"QTR_"
                   + m_name.toString().toUpper().replace(u'-', u'_');
        }

    public:
        static QString padUsageText(const QString &usage)
        {
            QString res = QString(USAGE_INDENTATION, u' ') + usage;

            if ((USAGE_TEXT_COLUMN - usage.length() - 4) > 0)
                return res + QString((USAGE_TEXT_COLUMN - usage.length() - 4), u' ');

            return res;
        }

    private:
        const QStringView m_name;
        const QChar m_shortcut;
    };

    class BoolOption : protected Option
    {
    public:
        explicit constexpr BoolOption(const QStringView name, const QChar shortcut = QChar::Null)
            : Option {name, shortcut}
        {
        }

        bool value(const QProcessEnvironment &env) const
        {
            return Utils::String::parseBool(env.value(envVarName())).value_or(false);
        }

        QString usage() const
        {
            QString res;
            if (hasShortcut())
                res += shortcutParameter() + u" | ";
            res += fullParameter();
            return padUsageText(res);
        }

        friend bool operator==(const BoolOption &option, const QString &arg)
        {
            return (option.hasShortcut() && ((arg.size() == 2) && (option.shortcutParameter() == arg)))
                   || (option.fullParameter() == arg);
        }
    };

    // Option with string value. May not have a shortcut
    class StringOption : protected Option
    {
    public:
        explicit constexpr StringOption(const QStringView name)
            : Option {name, QChar::Null}
        {
        }

        QString value(const QString &arg) const
        {
            const QStringList parts = arg.split(u'=');
            if (parts.size() == 2)
                return Utils::String::unquote(parts[1], u"'\""_s);
            throw CommandLineParameterError(QCoreApplication::translate("CMD Options", "Parameter '%1' must follow syntax '%1=%2'",
                                                        "e.g. Parameter '--save-path' must follow syntax '--save-path=value'")
                                            .arg(fullParameter(), u"<value>"_s));
        }

        QString value(const QProcessEnvironment &env, const QString &defaultValue = {}) const
        {
            const QString val = env.value(envVarName());
            return val.isEmpty() ? defaultValue : Utils::String::unquote(val, u"'\""_s);
        }

        QString usage(const QString &valueName) const
        {
            return padUsageText(parameterAssignment() + u'<' + valueName + u'>');
        }

        friend bool operator==(const StringOption &option, const QString &arg)
        {
            return arg.startsWith(option.parameterAssignment());
        }

    protected:
        using Option::fullParameter;
        using Option::envVarName;

    private:
        QString parameterAssignment() const
        {
            return fullParameter() + u'=';
        }
    };

    // Option with integer value. May not have a shortcut
    class IntOption : protected StringOption
    {
    public:
        explicit constexpr IntOption(const QStringView name)
            : StringOption {name}
        {
        }

        using StringOption::usage;

        int value(const QString &arg) const
        {
            const std::optional<int> res = Utils::String::parseInt(StringOption::value(arg));
            if (!res)
            {
                throw CommandLineParameterError(QCoreApplication::translate("CMD Options", "Parameter '%1' must follow syntax '%1=%2'",
                                                            "e.g. Parameter '--refresh-interval' must follow syntax '--refresh-interval=<value>'")
                                                .arg(fullParameter(), u"<integer value>"_s));
            }
            return *res;
        }

        int value(const QProcessEnvironment &env, const int defaultValue) const
        {
            const QString val = env.value(envVarName());
            if (val.isEmpty())
                return defaultValue;

            const std::optional<int> res = Utils::String::parseInt(val);
            if (!res)
            {
                qDebug() << QCoreApplication::translate("CMD Options", "Expected integer number in environment variable '%1', but got '%2'")
                    .arg(envVarName(), val);
                return defaultValue;
            }
            return *res;
        }

        friend bool operator==(const IntOption &option, const QString &arg)
        {
            return (static_cast<const StringOption &>(option) == arg);
        }
    };

    constexpr const BoolOption SHOW_HELP_OPTION {u"help", u'h'};
    constexpr const BoolOption SHOW_VERSION_OPTION {u"version", u'v'};
    constexpr const BoolOption EXIT_WHEN_DONE_OPTION {u"exit-when-done"};
    constexpr const IntOption REFRESH_INTERVAL_OPTION {u"refresh-interval"};
    constexpr const StringOption PROFILE_OPTION {u"profile"};
    constexpr const StringOption SAVE_PATH_OPTION {u"save-path"};
    constexpr const StringOption BATCH_FILE_OPTION {u"batch-file"};

    int checkedRefreshInterval(const int value)
    {
        if (value < MIN_REFRESH_INTERVAL)
        {
            throw CommandLineParameterError(QCoreApplication::translate("CMD Options", "%1 must be at least %2 milliseconds.")
                                            .arg(u"--refresh-interval"_s, QString::number(MIN_REFRESH_INTERVAL)));
        }
        return value;
    }
}

QTrCommandLineParameters::QTrCommandLineParameters(const QProcessEnvironment &env)
    : exitWhenDone(EXIT_WHEN_DONE_OPTION.value(env))
    , refreshInterval(REFRESH_INTERVAL_OPTION.value(env, -1))
    , profileDir(Utils::Fs::toAbsolutePath(PROFILE_OPTION.value(env)))
    , savePath(Utils::Fs::toAbsolutePath(SAVE_PATH_OPTION.value(env)))
    , batchFile(BATCH_FILE_OPTION.value(env))
{
}

QTrCommandLineParameters parseCommandLine(const QStringList &args)
{
    QTrCommandLineParameters result {QProcessEnvironment::systemEnvironment()};

    for (int i = 1; i < args.count(); ++i)
    {
        const QString &arg = args[i];

        if ((arg.startsWith(u"--") && !arg.endsWith(TORRENT_FILE_EXTENSION))
            || (arg.startsWith(u'-') && (arg.size() == 2)))
        {
            // Parse known parameters
            if (arg == SHOW_HELP_OPTION)
            {
                result.showHelp = true;
            }
            else if (arg == SHOW_VERSION_OPTION)
            {
                result.showVersion = true;
            }
            else if (arg == EXIT_WHEN_DONE_OPTION)
            {
                result.exitWhenDone = true;
            }
            else if (arg == REFRESH_INTERVAL_OPTION)
            {
                result.refreshInterval = checkedRefreshInterval(REFRESH_INTERVAL_OPTION.value(arg));
            }
            else if (arg == PROFILE_OPTION)
            {
                result.profileDir = Utils::Fs::toAbsolutePath(PROFILE_OPTION.value(arg));
            }
            else if (arg == SAVE_PATH_OPTION)
            {
                result.savePath = Utils::Fs::toAbsolutePath(SAVE_PATH_OPTION.value(arg));
            }
            else if (arg == BATCH_FILE_OPTION)
            {
                result.batchFile = BATCH_FILE_OPTION.value(arg);
            }
            else
            {
                // Unknown argument
                result.unknownParameter = arg;
                break;
            }
        }
        else
        {
            const QFileInfo sourceFile {arg};
            if (!Utils::Misc::isMagnetLink(arg) && sourceFile.exists())
                result.transferSources += sourceFile.absoluteFilePath();
            else
                result.transferSources += arg;
        }
    }

    return result;
}

QString wrapText(const QString &text, int initialIndentation = USAGE_TEXT_COLUMN, int wrapAtColumn = WRAP_AT_COLUMN)
{
    QStringList words = text.split(u' ');
    QStringList lines = {words.first()};
    int currentLineMaxLength = wrapAtColumn - initialIndentation;

    for (const QString &word : asConst(words.mid(1)))
    {
        if (lines.last().length() + word.length() + 1 < currentLineMaxLength)
        {
            lines.last().append(u' ' + word);
        }
        else
        {
            lines.append(QString(initialIndentation, u' ') + word);
            currentLineMaxLength = wrapAtColumn;
        }
    }

    return lines.join(u'\n');
}

QString makeUsage(const QString &prgName)
{
    const QString indentation {USAGE_INDENTATION, u' '};

    const QString text = QCoreApplication::translate("CMD Options", "Usage:") + u'\n'
        + indentation + prgName + u' ' + QCoreApplication::translate("CMD Options", "[options] [(<filename> | <magnet link> | <info hash>)...]") + u'\n'

        + QCoreApplication::translate("CMD Options", "Options:") + u'\n'
        + SHOW_HELP_OPTION.usage() + wrapText(QCoreApplication::translate("CMD Options", "Display this help message and exit")) + u'\n'
        + SHOW_VERSION_OPTION.usage() + wrapText(QCoreApplication::translate("CMD Options", "Display program version and exit")) + u'\n'
    //: Use appropriate short form or abbreviation of "directory"
        + PROFILE_OPTION.usage(QCoreApplication::translate("CMD Options", "dir"))
        + wrapText(QCoreApplication::translate("CMD Options", "Store configuration and log files in <dir>")) + u'\n'
        + SAVE_PATH_OPTION.usage(QCoreApplication::translate("CMD Options", "path"))
        + wrapText(QCoreApplication::translate("CMD Options", "Download folder, overrides the stored setting")) + u'\n'
        + REFRESH_INTERVAL_OPTION.usage(QCoreApplication::translate("CMD Options", "ms"))
        + wrapText(QCoreApplication::translate("CMD Options", "Time between two status refreshes, in milliseconds")) + u'\n'
        + BATCH_FILE_OPTION.usage(QCoreApplication::translate("CMD Options", "file"))
        + wrapText(QCoreApplication::translate("CMD Options", "Add every magnet link or file path listed in <file>, one per line")) + u'\n'
        + EXIT_WHEN_DONE_OPTION.usage()
        + wrapText(QCoreApplication::translate("CMD Options", "Exit once every transfer has completed")) + u'\n'
        + Option::padUsageText(QCoreApplication::translate("CMD Options", "files or links"))
        + wrapText(QCoreApplication::translate("CMD Options", "Download the transfers passed by the user")) + u'\n'
        + u'\n'

        + wrapText(QCoreApplication::translate("CMD Options", "Option values may be supplied via environment variables. For option named "
                                "'parameter-name', environment variable name is 'QTR_PARAMETER_NAME' (in upper "
                                "case, '-' replaced with '_'). To pass flag values, set the variable to '1' or "
                                "'TRUE'. For example, to exit once everything is downloaded: "), 0) + u'\n'
        + u"QTR_EXIT_WHEN_DONE=1 " + prgName + u'\n'
        + wrapText(QCoreApplication::translate("CMD Options", "Command line parameters take precedence over environment variables"), 0) + u'\n';

    return text;
}

void displayUsage(const QString &prgName)
{
    printf("%s\n", qUtf8Printable(makeUsage(prgName)));
}
