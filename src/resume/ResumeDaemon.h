/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef RESUMEDAEMON_H
#define RESUMEDAEMON_H

#include "autoresume_export.h"
#include "DetectionEvent.h"
#include "ResumeCoordinator.h"
#include "ResumeError.h"

#include <QDateTime>
#include <QJsonObject>
#include <QObject>
#include <QSet>
#include <QString>
#include <QTimer>

class QSocketNotifier;

namespace AutoResume
{

class AnalyticsCollector;
class AutoResumeSettings;
class ControlServer;
class HookRegistry;
class NotificationManager;
class RateLimitQueue;
class ResumeScheduler;
class StatusBridge;
class TieredDelivery;
class TranscriptVerifier;

/**
 * ResumeDaemon wires the resume core to its collaborators and runs it.
 *
 * Responsibilities:
 * - Single instance through daemon.pid
 * - Startup recovery (interrupted attempts go back to pending)
 * - Polling status.json for detections written by autoresume-hook
 * - Fanning core signals out to notifications, analytics, hooks and the
 *   status bridge
 * - Serving the control socket
 * - Clean shutdown on SIGINT/SIGTERM or the "stop" command
 */
class AUTORESUME_EXPORT ResumeDaemon : public QObject
{
    Q_OBJECT

public:
    /**
     * @param settings Configuration source, not owned
     * @param dataDirectory Where status.json and friends live; empty uses
     *        AutoResumeSettings::dataDirectory()
     * @param delivery Delivery chain to use; nullptr builds the default
     *        tmux/pty/xdotool chain. Ownership is taken.
     */
    explicit ResumeDaemon(AutoResumeSettings *settings,
                          const QString &dataDirectory = QString(),
                          TieredDelivery *delivery = nullptr,
                          QObject *parent = nullptr);
    ~ResumeDaemon() override;

    QString dataDirectory() const
    {
        return m_dataDirectory;
    }
    QString pidFilePath() const;
    QString socketPath() const;

    /**
     * PID recorded in pidFile if that process is still alive, else 0
     */
    static qint64 runningDaemonPid(const QString &pidFile);

    /**
     * Start serving. Fails if another daemon owns the PID file or the
     * control socket cannot be opened.
     */
    bool start(QString *error = nullptr);

    bool isRunning() const
    {
        return m_running;
    }

    /**
     * Route SIGINT and SIGTERM into stop(). Call once, from main().
     */
    bool watchUnixSignals();

    RateLimitQueue *queue() const
    {
        return m_queue;
    }
    ResumeScheduler *scheduler() const
    {
        return m_scheduler;
    }
    ResumeCoordinator *coordinator() const
    {
        return m_coordinator;
    }
    TieredDelivery *delivery() const
    {
        return m_delivery;
    }
    TranscriptVerifier *verifier() const
    {
        return m_verifier;
    }
    StatusBridge *statusBridge() const
    {
        return m_status;
    }
    ControlServer *controlServer() const
    {
        return m_control;
    }
    HookRegistry *hooks() const
    {
        return m_hooks;
    }
    AnalyticsCollector *analytics() const
    {
        return m_analytics;
    }
    NotificationManager *notifications() const
    {
        return m_notifications;
    }

public Q_SLOTS:
    /**
     * Re-read the queue file. New live entries are announced; the scheduler
     * is re-evaluated either way.
     */
    void checkQueue();

    /**
     * Resume now instead of waiting for the countdown. Uses the entry with
     * eventId, or the next pending one. Returns false if nothing can be
     * resumed or an attempt is already running.
     */
    bool resumeNow(const QString &eventId = QString(), QString *error = nullptr);

    void applySettings();

    /**
     * Stop serving; stopped() follows once onDaemonStop hooks are done
     */
    void stop();

Q_SIGNALS:
    void started();
    void stopped();

private Q_SLOTS:
    void onDetection(const AutoResume::DetectionEvent &event);
    void onStateChanged(AutoResume::ResumeCoordinator::State state, const QString &eventId);
    void onResumeDelivered(const AutoResume::DetectionEvent &event, const QString &tier, int attempt);
    void onResumeFailed(const AutoResume::DetectionEvent &event, AutoResume::ResumeError error, const QString &reason);
    void onUnixSignal();

private:
    void wireCore();
    void wireCollaborators();
    void registerCommands();
    bool acquirePidFile(QString *error);
    void releasePidFile();
    void updateQueueCounts();
    void finishStop();
    QJsonObject daemonInfo() const;

    AutoResumeSettings *m_settings = nullptr;
    QString m_dataDirectory;

    RateLimitQueue *m_queue = nullptr;
    ResumeScheduler *m_scheduler = nullptr;
    TieredDelivery *m_delivery = nullptr;
    TranscriptVerifier *m_verifier = nullptr;
    ResumeCoordinator *m_coordinator = nullptr;

    NotificationManager *m_notifications = nullptr;
    AnalyticsCollector *m_analytics = nullptr;
    HookRegistry *m_hooks = nullptr;
    StatusBridge *m_status = nullptr;
    ControlServer *m_control = nullptr;

    QTimer *m_checkTimer = nullptr;
    QDateTime m_queueModified;
    // Entries already announced, so polling reports each detection once
    QSet<QString> m_seen;
    // Events whose resume outcome went to analytics
    QSet<QString> m_recorded;

    bool m_running = false;
    bool m_stopping = false;
    int m_pendingStopHooks = 0;

    QSocketNotifier *m_signalNotifier = nullptr;
};

} // namespace AutoResume

#endif // RESUMEDAEMON_H
