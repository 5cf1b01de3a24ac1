/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "CommandRunner.h"

#include <QDebug>
#include <QPointer>
#include <QProcess>
#include <QStandardPaths>
#include <QTimer>

#include <memory>

namespace AutoResume
{

CommandRunner::CommandRunner(QObject *parent)
    : QObject(parent)
{
}

CommandRunner::~CommandRunner() = default;

void CommandRunner::setTimeout(int timeoutMs)
{
    m_timeoutMs = qMax(1, timeoutMs);
}

int CommandRunner::timeout() const
{
    return m_timeoutMs;
}

int CommandRunner::runningCount() const
{
    return m_running;
}

void CommandRunner::cancelAll()
{
    const QList<QProcess *> processes = findChildren<QProcess *>(QString(), Qt::FindDirectChildrenOnly);
    for (QProcess *process : processes) {
        if (process->state() == QProcess::NotRunning) {
            continue;
        }
        qDebug() << "CommandRunner::cancelAll() - Killing" << process->program();
        process->setProperty("cancelled", true);
        process->kill();
    }
}

bool CommandRunner::isAvailable(const QString &program)
{
    return !QStandardPaths::findExecutable(program).isEmpty();
}

void CommandRunner::run(const QString &program, const QStringList &args, Callback callback, const QByteArray &stdinData)
{
    auto *process = new QProcess(this);
    auto reported = std::make_shared<bool>(false);
    auto timedOut = std::make_shared<bool>(false);
    ++m_running;

    auto report = [this, process, callback, reported](const CommandResult &result) {
        if (*reported) {
            return;
        }
        *reported = true;
        --m_running;
        if (!result.ok()) {
            const QString message = result.errorOutput.isEmpty() ? QStringLiteral("%1 failed").arg(process->program()) : result.errorOutput;
            Q_EMIT errorOccurred(message.trimmed());
        }
        process->deleteLater();
        if (callback) {
            callback(result);
        }
    };

    connect(process, QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished), this, [process, report, timedOut](int exitCode, QProcess::ExitStatus status) {
        CommandResult result;
        result.started = true;
        result.timedOut = *timedOut;
        result.exitCode = (status == QProcess::NormalExit) ? exitCode : -1;
        result.output = QString::fromUtf8(process->readAllStandardOutput());
        result.errorOutput = QString::fromUtf8(process->readAllStandardError());
        if (result.timedOut && result.errorOutput.isEmpty()) {
            result.errorOutput = QStringLiteral("%1 timed out").arg(process->program());
        } else if (process->property("cancelled").toBool() && result.errorOutput.isEmpty()) {
            result.errorOutput = QStringLiteral("%1 cancelled").arg(process->program());
        }
        report(result);
    });

    connect(process, &QProcess::errorOccurred, this, [process, report](QProcess::ProcessError error) {
        // Everything else is followed by finished()
        if (error != QProcess::FailedToStart) {
            return;
        }
        CommandResult result;
        result.errorOutput = process->errorString();
        report(result);
    });

    QTimer::singleShot(m_timeoutMs, process, [process, timedOut]() {
        if (process->state() != QProcess::NotRunning) {
            qWarning() << "CommandRunner::run() - Killing" << process->program() << "after timeout";
            *timedOut = true;
            process->kill();
        }
    });

    process->start(program, args);
    if (!stdinData.isEmpty()) {
        process->write(stdinData);
    }
    process->closeWriteChannel();
}

} // namespace AutoResume

#include "moc_CommandRunner.cpp"
