/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef COMMANDRUNNER_H
#define COMMANDRUNNER_H

#include "autoresume_export.h"

#include <QByteArray>
#include <QObject>
#include <QString>
#include <QStringList>

#include <functional>

namespace AutoResume
{

/**
 * Outcome of one external command
 */
struct AUTORESUME_EXPORT CommandResult {
    bool started = false;
    bool timedOut = false;
    int exitCode = -1;
    QString output;
    QString errorOutput;

    bool ok() const
    {
        return started && !timedOut && exitCode == 0;
    }
};

/**
 * CommandRunner runs external programs asynchronously with a hard timeout.
 *
 * The callback is invoked exactly once per run(): on exit, on failure to
 * start, or after the process was killed for exceeding the timeout.
 */
class AUTORESUME_EXPORT CommandRunner : public QObject
{
    Q_OBJECT

public:
    using Callback = std::function<void(const CommandResult &)>;

    explicit CommandRunner(QObject *parent = nullptr);
    ~CommandRunner() override;

    void setTimeout(int timeoutMs);
    int timeout() const;

    /**
     * Start program with args; stdinData, if any, is written then stdin closed
     */
    void run(const QString &program, const QStringList &args, Callback callback, const QByteArray &stdinData = QByteArray());

    /**
     * Kill every running command. Each one still reports, as failed.
     */
    void cancelAll();

    /**
     * Number of commands started and not yet reported
     */
    int runningCount() const;

    /**
     * Check if a program is on PATH
     */
    static bool isAvailable(const QString &program);

Q_SIGNALS:
    /**
     * Emitted with stderr of a failed command, or a description of the failure
     */
    void errorOccurred(const QString &message);

private:
    int m_timeoutMs = 10000;
    int m_running = 0;
};

} // namespace AutoResume

#endif // COMMANDRUNNER_H
