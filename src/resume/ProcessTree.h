/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef PROCESSTREE_H
#define PROCESSTREE_H

#include "autoresume_export.h"

#include <QList>
#include <QString>

namespace AutoResume
{

/**
 * Read-only helpers over /proc.
 *
 * Everything here returns an empty or zero value when /proc is missing
 * (non-Linux) or the process has gone away.
 */
namespace ProcessTree
{

/**
 * Check that a process exists
 */
AUTORESUME_EXPORT bool isRunning(qint64 pid);

/**
 * Parent PID from /proc/{pid}/stat, 0 if unknown
 */
AUTORESUME_EXPORT qint64 parentPid(qint64 pid);

/**
 * pid itself followed by its parents up to init
 */
AUTORESUME_EXPORT QList<qint64> ancestry(qint64 pid);

/**
 * Direct children, from /proc/{pid}/task/{pid}/children or a ppid scan
 */
AUTORESUME_EXPORT QList<qint64> children(qint64 pid);

/**
 * Command line with NUL separators turned into spaces
 */
AUTORESUME_EXPORT QString commandLine(qint64 pid);

/**
 * pid, or a descendant at most maxDepth levels down, whose command line
 * mentions claude. 0 if none.
 */
AUTORESUME_EXPORT qint64 findClaudePid(qint64 pid, int maxDepth = 2);

/**
 * Terminal device behind the process's stdin (/dev/pts/N or /dev/ttyN),
 * empty if stdin is not a terminal
 */
AUTORESUME_EXPORT QString terminalDevice(qint64 pid);

/**
 * Parse the ppid field out of a /proc/{pid}/stat line
 */
AUTORESUME_EXPORT qint64 parseStatParentPid(const QString &statLine);

} // namespace ProcessTree

} // namespace AutoResume

#endif // PROCESSTREE_H
