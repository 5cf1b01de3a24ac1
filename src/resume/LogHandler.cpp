/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "LogHandler.h"
#include "AutoResumeSettings.h"

#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QMutexLocker>

#include <cstdio>
#include <cstdlib>

namespace AutoResume
{
namespace LogHandler
{

namespace
{
// Qt may log from any thread
QMutex s_mutex;
QString s_path;
qint64 s_maxSize = 0;
bool s_echo = true;
bool s_installed = false;
QtMessageHandler s_previous = nullptr;

void messageHandler(QtMsgType type, const QMessageLogContext &context, const QString &message)
{
    Q_UNUSED(context)

    const QByteArray line = formatLine(type, message, QDateTime::currentDateTimeUtc()).toUtf8() + '\n';

    QMutexLocker locker(&s_mutex);

    if (s_echo) {
        fputs(line.constData(), stderr);
        fflush(stderr);
    }

    rotateIfNeeded(s_path, s_maxSize);

    QFile file(s_path);
    if (file.open(QIODevice::WriteOnly | QIODevice::Append)) {
        file.write(line);
    }

    if (type == QtFatalMsg) {
        abort();
    }
}
} // namespace

QString defaultLogFilePath()
{
    return AutoResumeSettings::dataDirectory() + QStringLiteral("/daemon.log");
}

QString levelName(QtMsgType type)
{
    switch (type) {
    case QtDebugMsg:
        return QStringLiteral("debug");
    case QtInfoMsg:
        return QStringLiteral("info");
    case QtWarningMsg:
        return QStringLiteral("warning");
    case QtCriticalMsg:
        return QStringLiteral("error");
    case QtFatalMsg:
        return QStringLiteral("fatal");
    }
    return QStringLiteral("info");
}

QString formatLine(QtMsgType type, const QString &message, const QDateTime &when)
{
    return QStringLiteral("%1 [%2] %3").arg(when.toUTC().toString(Qt::ISODateWithMs), levelName(type).toUpper(), message);
}

bool rotateIfNeeded(const QString &path, qint64 maxSizeBytes)
{
    if (maxSizeBytes <= 0) {
        return false;
    }

    const QFileInfo info(path);
    if (!info.exists() || info.size() < maxSizeBytes) {
        return false;
    }

    const QString rotated = path + QStringLiteral(".1");
    QFile::remove(rotated);
    return QFile::rename(path, rotated);
}

bool install(const QString &logFilePath, qint64 maxSizeBytes, bool echoToStderr)
{
    QDir().mkpath(QFileInfo(logFilePath).absolutePath());

    QFile logFile(logFilePath);
    if (!logFile.open(QIODevice::WriteOnly | QIODevice::Append)) {
        qWarning() << "LogHandler::install() - Cannot open log file" << logFilePath << logFile.errorString();
        return false;
    }
    logFile.close();

    {
        QMutexLocker locker(&s_mutex);
        s_path = logFilePath;
        s_maxSize = maxSizeBytes;
        s_echo = echoToStderr;
    }

    if (!s_installed) {
        s_previous = qInstallMessageHandler(messageHandler);
        s_installed = true;
    }
    return true;
}

void uninstall()
{
    if (!s_installed) {
        return;
    }
    qInstallMessageHandler(s_previous);
    s_previous = nullptr;
    s_installed = false;
}

} // namespace LogHandler
} // namespace AutoResume
