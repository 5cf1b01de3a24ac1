/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef LOGHANDLER_H
#define LOGHANDLER_H

#include "autoresume_export.h"

#include <QDateTime>
#include <QString>
#include <QtGlobal>

namespace AutoResume
{

/**
 * Routes Qt logging of the daemon into daemon.log.
 *
 * Each line is "<ISO timestamp> [<level>] <message>". The file is rotated
 * to daemon.log.1 once it reaches the size limit. Messages are echoed to
 * stderr unless echo is disabled.
 */
namespace LogHandler
{

/**
 * Install the handler. Returns false if the log file cannot be opened; Qt's
 * default handler stays in place then.
 */
AUTORESUME_EXPORT bool install(const QString &logFilePath, qint64 maxSizeBytes, bool echoToStderr = true);

/**
 * Restore the handler that was active before install()
 */
AUTORESUME_EXPORT void uninstall();

AUTORESUME_EXPORT QString defaultLogFilePath();

AUTORESUME_EXPORT QString levelName(QtMsgType type);

AUTORESUME_EXPORT QString formatLine(QtMsgType type, const QString &message, const QDateTime &when);

/**
 * Move path to path.1 when it has reached maxSizeBytes. Returns true if it
 * rotated.
 */
AUTORESUME_EXPORT bool rotateIfNeeded(const QString &path, qint64 maxSizeBytes);

} // namespace LogHandler

} // namespace AutoResume

#endif // LOGHANDLER_H
