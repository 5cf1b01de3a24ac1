/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later

    Based on Bobcat's SessionManager by İsmail Yılmaz
*/

#ifndef TMUXMANAGER_H
#define TMUXMANAGER_H

#include "autoresume_export.h"

#include "DeliveryTypes.h"

#include <QObject>
#include <QString>
#include <QStringList>

#include <functional>

namespace AutoResume
{

class CommandRunner;

/**
 * TmuxManager finds the tmux panes running Claude and types into them.
 *
 * All tmux invocations go through a CommandRunner, so each one is
 * asynchronous and bounded by the runner's timeout.
 */
class AUTORESUME_EXPORT TmuxManager : public QObject
{
    Q_OBJECT

public:
    /**
     * One line of list-panes output
     */
    struct PaneInfo {
        qint64 pid = 0; // #{pane_pid}
        QString target; // session:window.pane
        QString command; // #{pane_current_command}
    };

    explicit TmuxManager(QObject *parent = nullptr);
    ~TmuxManager() override;

    /**
     * Check if tmux is available on the system
     */
    static bool isAvailable();

    void setCommandTimeout(int timeoutMs);

    /**
     * Format passed to list-panes -F; parsePaneList() reads it back
     */
    static QString paneListFormat();

    static QList<PaneInfo> parsePaneList(const QString &output);

    /**
     * Command names that are Claude itself
     */
    static bool isClaudeCommand(const QString &command);

    /**
     * Command names that may be Claude under another name (node, or the
     * versioned binary like "2.1.3") and need a process tree check
     */
    static bool isPossibleClaudeHost(const QString &command);

    /**
     * Reduce a pane list to the panes running Claude.
     *
     * When sourcePid is known and lies inside one of the matching panes,
     * only that pane is returned. claudeCheck decides for host commands;
     * the default walks /proc.
     */
    static QList<DeliveryTarget> filterClaudePanes(const QList<PaneInfo> &panes,
                                                   qint64 sourcePid,
                                                   const std::function<bool(qint64)> &claudeCheck = std::function<bool(qint64)>());

    /**
     * List every pane on the default server
     */
    void listPanesAsync(std::function<void(bool ok, const QList<PaneInfo> &)> callback);

    /**
     * listPanesAsync() followed by filterClaudePanes()
     */
    void findClaudePanesAsync(qint64 sourcePid, std::function<void(bool ok, const QList<DeliveryTarget> &)> callback);

    /**
     * Send one step: key names, or literal text with send-keys -l
     */
    void sendKeysAsync(const QString &target, const KeyStep &step, std::function<void(bool ok, const QString &error)> callback);

    /**
     * Send steps in order, honouring each step's delay. Stops at the first
     * failing step.
     */
    void sendSequenceAsync(const QString &target, const QList<KeyStep> &steps, std::function<void(bool ok, const QString &error)> callback);

    /**
     * Kill running tmux commands and stop every key sequence in flight.
     * Stopped sequences report failure.
     */
    void cancelAll();

Q_SIGNALS:
    /**
     * Emitted when an error occurs during tmux operations
     */
    void errorOccurred(const QString &message);

private:
    void sendStep(const QString &target, const QList<KeyStep> &steps, int index, quint64 generation, std::function<void(bool, const QString &)> callback);

    CommandRunner *m_runner = nullptr;
    // Bumped by cancelAll(); sequences started under an older value stop
    quint64 m_generation = 0;
};

} // namespace AutoResume

#endif // TMUXMANAGER_H
