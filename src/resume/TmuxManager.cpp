/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later

    Based on Bobcat's SessionManager by İsmail Yılmaz
*/

#include "TmuxManager.h"
#include "CommandRunner.h"
#include "ProcessTree.h"

#include <QDebug>
#include <QPointer>
#include <QRegularExpression>
#include <QTimer>

namespace AutoResume
{

TmuxManager::TmuxManager(QObject *parent)
    : QObject(parent)
    , m_runner(new CommandRunner(this))
{
    connect(m_runner, &CommandRunner::errorOccurred, this, &TmuxManager::errorOccurred);
}

TmuxManager::~TmuxManager() = default;

bool TmuxManager::isAvailable()
{
    return CommandRunner::isAvailable(QStringLiteral("tmux"));
}

void TmuxManager::setCommandTimeout(int timeoutMs)
{
    m_runner->setTimeout(timeoutMs);
}

QString TmuxManager::paneListFormat()
{
    return QStringLiteral("#{pane_pid} #{session_name}:#{window_index}.#{pane_index} #{pane_current_command}");
}

QList<TmuxManager::PaneInfo> TmuxManager::parsePaneList(const QString &output)
{
    QList<PaneInfo> panes;

    const QStringList lines = output.split(QLatin1Char('\n'), Qt::SkipEmptyParts);
    for (const QString &line : lines) {
        const QString trimmed = line.trimmed();
        const int firstSpace = trimmed.indexOf(QLatin1Char(' '));
        // Session names may contain spaces; the command never does
        const int lastSpace = trimmed.lastIndexOf(QLatin1Char(' '));
        if (firstSpace <= 0 || lastSpace <= firstSpace) {
            continue;
        }

        bool ok = false;
        PaneInfo info;
        info.pid = trimmed.left(firstSpace).toLongLong(&ok);
        if (!ok || info.pid <= 0) {
            continue;
        }
        info.target = trimmed.mid(firstSpace + 1, lastSpace - firstSpace - 1);
        info.command = trimmed.mid(lastSpace + 1);
        panes.append(info);
    }

    return panes;
}

bool TmuxManager::isClaudeCommand(const QString &command)
{
    return command.contains(QStringLiteral("claude"), Qt::CaseInsensitive);
}

bool TmuxManager::isPossibleClaudeHost(const QString &command)
{
    static const QRegularExpression pattern(QStringLiteral("^(claude|node|\\d+\\.\\d+\\.\\d+)$"));
    return pattern.match(command).hasMatch();
}

QList<DeliveryTarget> TmuxManager::filterClaudePanes(const QList<PaneInfo> &panes, qint64 sourcePid, const std::function<bool(qint64)> &claudeCheck)
{
    const auto hostsClaude = [&claudeCheck](qint64 pid) {
        if (claudeCheck) {
            return claudeCheck(pid);
        }
        return ProcessTree::findClaudePid(pid) > 0;
    };

    QList<DeliveryTarget> targets;
    for (const PaneInfo &pane : panes) {
        const bool match = isClaudeCommand(pane.command) || (isPossibleClaudeHost(pane.command) && hostsClaude(pane.pid));
        if (match) {
            targets.append({pane.target, pane.pid, pane.command});
        }
    }

    if (sourcePid <= 0 || targets.size() <= 1) {
        return targets;
    }

    // Narrow to the pane the detection came from, if it is among them
    const QList<qint64> chain = ProcessTree::ancestry(sourcePid);
    for (const DeliveryTarget &target : std::as_const(targets)) {
        if (chain.contains(target.pid)) {
            return {target};
        }
    }
    return targets;
}

void TmuxManager::listPanesAsync(std::function<void(bool, const QList<PaneInfo> &)> callback)
{
    m_runner->run(QStringLiteral("tmux"),
                  {QStringLiteral("list-panes"), QStringLiteral("-a"), QStringLiteral("-F"), paneListFormat()},
                  [callback](const CommandResult &result) {
                      if (!callback) {
                          return;
                      }
                      // No server running is an empty list, not an error worth a retry
                      callback(result.ok(), result.ok() ? parsePaneList(result.output) : QList<PaneInfo>());
                  });
}

void TmuxManager::findClaudePanesAsync(qint64 sourcePid, std::function<void(bool, const QList<DeliveryTarget> &)> callback)
{
    listPanesAsync([sourcePid, callback](bool ok, const QList<PaneInfo> &panes) {
        const QList<DeliveryTarget> targets = ok ? filterClaudePanes(panes, sourcePid) : QList<DeliveryTarget>();
        qDebug() << "TmuxManager::findClaudePanesAsync() -" << panes.size() << "panes," << targets.size() << "running Claude";
        if (callback) {
            callback(ok, targets);
        }
    });
}

void TmuxManager::sendKeysAsync(const QString &target, const KeyStep &step, std::function<void(bool, const QString &)> callback)
{
    QStringList args = {QStringLiteral("send-keys"), QStringLiteral("-t"), target};
    if (step.literal) {
        args << QStringLiteral("-l");
    }
    args << step.keys;

    m_runner->run(QStringLiteral("tmux"), args, [callback](const CommandResult &result) {
        if (callback) {
            callback(result.ok(), result.ok() ? QString() : result.errorOutput.trimmed());
        }
    });
}

void TmuxManager::sendSequenceAsync(const QString &target, const QList<KeyStep> &steps, std::function<void(bool, const QString &)> callback)
{
    sendStep(target, steps, 0, m_generation, std::move(callback));
}

void TmuxManager::cancelAll()
{
    ++m_generation;
    m_runner->cancelAll();
}

void TmuxManager::sendStep(const QString &target,
                           const QList<KeyStep> &steps,
                           int index,
                           quint64 generation,
                           std::function<void(bool, const QString &)> callback)
{
    if (generation != m_generation) {
        qDebug() << "TmuxManager::sendSequenceAsync() - Sequence for" << target << "cancelled at step" << index;
        if (callback) {
            callback(false, QStringLiteral("cancelled"));
        }
        return;
    }
    if (index >= steps.size()) {
        if (callback) {
            callback(true, QString());
        }
        return;
    }

    QPointer<TmuxManager> guard(this);
    sendKeysAsync(target, steps.at(index), [this, guard, target, steps, index, generation, callback](bool ok, const QString &error) {
        if (!guard) {
            return;
        }
        if (!ok) {
            qWarning() << "TmuxManager::sendSequenceAsync() - Step" << index << "failed for" << target << ":" << error;
            if (callback) {
                callback(false, error);
            }
            return;
        }
        const int delay = steps.at(index).delayMs;
        if (delay <= 0) {
            sendStep(target, steps, index + 1, generation, callback);
            return;
        }
        QTimer::singleShot(delay, this, [this, target, steps, index, generation, callback]() {
            sendStep(target, steps, index + 1, generation, callback);
        });
    });
}

} // namespace AutoResume

#include "moc_TmuxManager.cpp"
