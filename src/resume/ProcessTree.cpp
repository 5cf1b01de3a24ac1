/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "ProcessTree.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>

namespace AutoResume
{

namespace ProcessTree
{

namespace
{
QByteArray readProcFile(qint64 pid, const QString &name)
{
    // /proc pseudo-files report size 0, so read until EOF
    QFile file(QStringLiteral("/proc/%1/%2").arg(pid).arg(name));
    if (!file.open(QIODevice::ReadOnly)) {
        return QByteArray();
    }
    return file.readAll();
}
}

bool isRunning(qint64 pid)
{
    if (pid <= 0) {
        return false;
    }
    // QDir, not QFile: /proc/{pid} is a directory
    return QDir(QStringLiteral("/proc/%1").arg(pid)).exists();
}

qint64 parseStatParentPid(const QString &statLine)
{
    // comm "(name)" may contain spaces and parens; ppid follows the last ')'
    const int closeParenIdx = statLine.lastIndexOf(QLatin1Char(')'));
    if (closeParenIdx < 0) {
        return 0;
    }
    const QStringList fields = statLine.mid(closeParenIdx + 2).split(QLatin1Char(' '), Qt::SkipEmptyParts);
    // fields[0]=state, fields[1]=ppid
    if (fields.size() < 2) {
        return 0;
    }
    bool ok = false;
    const qint64 ppid = fields[1].toLongLong(&ok);
    return ok ? ppid : 0;
}

qint64 parentPid(qint64 pid)
{
    if (pid <= 0) {
        return 0;
    }
    return parseStatParentPid(QString::fromUtf8(readProcFile(pid, QStringLiteral("stat"))).trimmed());
}

QList<qint64> ancestry(qint64 pid)
{
    QList<qint64> chain;
    qint64 current = pid;
    while (current > 0 && !chain.contains(current)) {
        chain.append(current);
        if (current == 1) {
            break;
        }
        current = parentPid(current);
    }
    return chain;
}

QList<qint64> children(qint64 pid)
{
    QList<qint64> result;
    if (pid <= 0) {
        return result;
    }

    const QString childrenStr = QString::fromUtf8(readProcFile(pid, QStringLiteral("task/%1/children").arg(pid))).trimmed();
    if (!childrenStr.isEmpty()) {
        const QStringList parts = childrenStr.split(QLatin1Char(' '), Qt::SkipEmptyParts);
        for (const QString &part : parts) {
            const qint64 child = part.toLongLong();
            if (child > 0) {
                result.append(child);
            }
        }
        return result;
    }

    // Kernels without CONFIG_PROC_CHILDREN: scan for a matching ppid
    const QStringList entries = QDir(QStringLiteral("/proc")).entryList(QDir::Dirs | QDir::NoDotAndDotDot);
    for (const QString &entry : entries) {
        bool isNum = false;
        const qint64 candidate = entry.toLongLong(&isNum);
        if (!isNum || candidate <= 0) {
            continue;
        }
        if (parentPid(candidate) == pid) {
            result.append(candidate);
        }
    }
    return result;
}

QString commandLine(qint64 pid)
{
    if (pid <= 0) {
        return QString();
    }
    QByteArray raw = readProcFile(pid, QStringLiteral("cmdline"));
    raw.replace('\0', ' ');
    return QString::fromUtf8(raw).trimmed();
}

qint64 findClaudePid(qint64 pid, int maxDepth)
{
    if (pid <= 0) {
        return 0;
    }

    // The pane process is often claude itself rather than a wrapper shell
    if (commandLine(pid).contains(QStringLiteral("claude"), Qt::CaseInsensitive)) {
        return pid;
    }
    if (maxDepth <= 0) {
        return 0;
    }

    const QList<qint64> childPids = children(pid);
    for (qint64 child : childPids) {
        const qint64 found = findClaudePid(child, maxDepth - 1);
        if (found > 0) {
            return found;
        }
    }
    return 0;
}

QString terminalDevice(qint64 pid)
{
    if (pid <= 0) {
        return QString();
    }
    const QString target = QFileInfo(QStringLiteral("/proc/%1/fd/0").arg(pid)).symLinkTarget();
    if (target.startsWith(QLatin1String("/dev/pts/")) || target.startsWith(QLatin1String("/dev/tty"))) {
        return target;
    }
    return QString();
}

} // namespace ProcessTree

} // namespace AutoResume
