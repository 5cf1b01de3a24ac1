/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "ResumeDaemon.h"
#include "AnalyticsCollector.h"
#include "AutoResumeSettings.h"
#include "ControlServer.h"
#include "HookRegistry.h"
#include "NotificationManager.h"
#include "ProcessTree.h"
#include "RateLimitQueue.h"
#include "ResumeScheduler.h"
#include "StalenessGuard.h"
#include "StatusBridge.h"
#include "TieredDelivery.h"
#include "TranscriptVerifier.h"

#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QPointer>
#include <QSocketNotifier>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <sys/socket.h>
#include <unistd.h>

namespace AutoResume
{

namespace
{
// Write end of the signal socketpair; the handler may only do async-signal-safe work
int s_signalFds[2] = {-1, -1};

void unixSignalHandler(int)
{
    const char byte = 1;
    const ssize_t written = ::write(s_signalFds[0], &byte, sizeof(byte));
    Q_UNUSED(written)
}
} // namespace

ResumeDaemon::ResumeDaemon(AutoResumeSettings *settings, const QString &dataDirectory, TieredDelivery *delivery, QObject *parent)
    : QObject(parent)
    , m_settings(settings)
    , m_dataDirectory(dataDirectory.isEmpty() ? AutoResumeSettings::dataDirectory() : dataDirectory)
    , m_checkTimer(new QTimer(this))
{
    QDir().mkpath(m_dataDirectory);

    const ResumeConfig config = m_settings->resumeConfig();

    m_queue = new RateLimitQueue(m_dataDirectory + QStringLiteral("/status.json"), this);
    m_scheduler = new ResumeScheduler(m_queue, this);

    if (delivery) {
        delivery->setParent(this);
        m_delivery = delivery;
    } else {
        m_delivery = TieredDelivery::createDefault(config, this);
    }

    m_verifier = new TranscriptVerifier(this);
    m_coordinator = new ResumeCoordinator(m_queue, m_delivery, m_verifier, this);

    m_notifications = new NotificationManager(this);
    m_analytics = new AnalyticsCollector(m_dataDirectory + QStringLiteral("/analytics.json"), this);
    m_hooks = new HookRegistry(this);
    m_status = new StatusBridge(this);
    m_control = new ControlServer(socketPath(), this);

    applySettings();
    wireCore();
    wireCollaborators();
    registerCommands();

    connect(m_checkTimer, &QTimer::timeout, this, &ResumeDaemon::checkQueue);
    connect(m_settings, &AutoResumeSettings::settingsChanged, this, &ResumeDaemon::applySettings);
}

ResumeDaemon::~ResumeDaemon()
{
    if (m_running) {
        m_scheduler->cancel();
        m_control->stop();
        releasePidFile();
    }

    if (m_signalNotifier) {
        ::close(s_signalFds[0]);
        ::close(s_signalFds[1]);
        s_signalFds[0] = s_signalFds[1] = -1;
    }
}

QString ResumeDaemon::pidFilePath() const
{
    return m_dataDirectory + QStringLiteral("/daemon.pid");
}

QString ResumeDaemon::socketPath() const
{
    return m_dataDirectory + QStringLiteral("/daemon.sock");
}

qint64 ResumeDaemon::runningDaemonPid(const QString &pidFile)
{
    QFile file(pidFile);
    if (!file.open(QIODevice::ReadOnly)) {
        return 0;
    }

    bool ok = false;
    const qint64 pid = QString::fromUtf8(file.readAll()).trimmed().toLongLong(&ok);
    if (!ok || pid <= 0) {
        return 0;
    }
    return ProcessTree::isRunning(pid) ? pid : 0;
}

void ResumeDaemon::applySettings()
{
    const ResumeConfig config = m_settings->resumeConfig();
    m_scheduler->setConfig(config);
    m_coordinator->setConfig(config);

    m_notifications->enableChannel(NotificationManager::Channel::Desktop, m_settings->notificationsEnabled());
    m_analytics->setRetentionDays(m_settings->analyticsRetentionDays());

    m_hooks->setEnabled(m_settings->hooksEnabled());
    m_hooks->setTimeout(m_settings->hookTimeoutMs());

    m_checkTimer->setInterval(m_settings->checkIntervalMs());
}

void ResumeDaemon::wireCore()
{
    QPointer<ResumeCoordinator> coordinator(m_coordinator);
    m_scheduler->setBusyCheck([coordinator]() {
        return coordinator && coordinator->isResumeInProgress();
    });
    m_scheduler->setSettledCheck([coordinator](const QString &eventId) {
        return coordinator && coordinator->isSettled(eventId);
    });

    connect(m_scheduler, &ResumeScheduler::fired, this, [this](const DetectionEvent &event) {
        if (!m_coordinator->attemptResume(event)) {
            qDebug() << "ResumeDaemon - Countdown for" << event.id << "fired while busy, deferred";
        }
    });

    // Deferred so the coordinator has fully unwound before the next attempt
    connect(m_coordinator, &ResumeCoordinator::attemptFinished, this, [this]() {
        QTimer::singleShot(0, m_scheduler, &ResumeScheduler::reevaluate);
    });

    connect(m_queue, &RateLimitQueue::detectionAdded, this, &ResumeDaemon::onDetection);
    connect(m_queue, &RateLimitQueue::queueChanged, this, &ResumeDaemon::updateQueueCounts);
}

void ResumeDaemon::wireCollaborators()
{
    connect(m_scheduler, &ResumeScheduler::armed, m_status, &StatusBridge::setArmed);
    connect(m_scheduler, &ResumeScheduler::cancelled, m_status, &StatusBridge::clearArmed);
    connect(m_scheduler, &ResumeScheduler::fired, m_status, &StatusBridge::clearArmed);
    connect(m_scheduler, &ResumeScheduler::staleDropped, this, [this](const DetectionEvent &event) {
        qInfo() << "ResumeDaemon - Dropped stale detection" << event.id << "reset_time:" << event.resetTime;
        m_seen.insert(event.id);
    });

    connect(m_coordinator, &ResumeCoordinator::stateChanged, this, &ResumeDaemon::onStateChanged);
    connect(m_coordinator, &ResumeCoordinator::rateLimitCleared, m_status, &StatusBridge::clearRateLimit);
    connect(m_coordinator, &ResumeCoordinator::resumeDelivered, this, &ResumeDaemon::onResumeDelivered);
    connect(m_coordinator, &ResumeCoordinator::resumeFailed, this, &ResumeDaemon::onResumeFailed);
    connect(m_coordinator, &ResumeCoordinator::resumeVerified, this, [](const DetectionEvent &event, const VerificationResult &result) {
        qInfo() << "ResumeDaemon - Resume of" << event.id << "verified by" << result.method << "after" << result.elapsedMs << "ms";
    });

    connect(m_status, &StatusBridge::statusBroadcast, this, [this](const QJsonObject &status) {
        QJsonObject message;
        message[QStringLiteral("type")] = QStringLiteral("status");
        message[QStringLiteral("timestamp")] = isoTimestamp();
        message[QStringLiteral("data")] = status;
        m_control->publish(message);
    });
    connect(m_status, &StatusBridge::eventBroadcast, m_control, &ControlServer::publish);

    // HookRegistry reports every invocation, timeouts included
    connect(m_hooks, &HookRegistry::hookFinished, this, [this](const QString &, const QString &point) {
        if (!m_stopping || m_pendingStopHooks <= 0 || point != hookPointName(HookPoint::DaemonStop)) {
            return;
        }
        if (--m_pendingStopHooks == 0) {
            finishStop();
        }
    });
}

void ResumeDaemon::registerCommands()
{
    // Nudge from autoresume-hook, optionally carrying the detection itself
    m_control->setHandler(QStringLiteral("detection"), [this](const QJsonObject &data, QJsonObject *result, QString *error) {
        if (data.contains(QStringLiteral("reset_time"))) {
            const Detection detection = Detection::fromJson(data);
            if (detection.resetTime.isEmpty()) {
                *error = QStringLiteral("reset_time is empty");
                return false;
            }
            DetectionEvent added;
            (*result)[QStringLiteral("added")] = m_queue->addDetection(detection, &added);
            if (added.isValid()) {
                (*result)[QStringLiteral("event_id")] = added.id;
            }
        }
        checkQueue();
        return true;
    });

    m_control->setHandler(QStringLiteral("resume"), [this](const QJsonObject &data, QJsonObject *result, QString *error) {
        const QString eventId = data.value(QStringLiteral("event_id")).toString();
        if (!resumeNow(eventId, error)) {
            return false;
        }
        (*result)[QStringLiteral("event_id")] = m_coordinator->currentEvent().id;
        return true;
    });

    m_control->setHandler(QStringLiteral("status"), [this](const QJsonObject &, QJsonObject *result, QString *) {
        *result = m_status->statusSnapshot();
        return true;
    });

    m_control->setHandler(QStringLiteral("stop"), [this](const QJsonObject &, QJsonObject *result, QString *) {
        (*result)[QStringLiteral("pid")] = static_cast<double>(QCoreApplication::applicationPid());
        // Reply goes out before the socket closes
        QTimer::singleShot(0, this, &ResumeDaemon::stop);
        return true;
    });
}

bool ResumeDaemon::acquirePidFile(QString *error)
{
    const QString path = pidFilePath();
    const qint64 own = QCoreApplication::applicationPid();
    const qint64 other = runningDaemonPid(path);

    if (other > 0 && other != own) {
        if (error) {
            *error = QStringLiteral("Daemon already running (PID %1)").arg(other);
        }
        return false;
    }

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        if (error) {
            *error = QStringLiteral("Cannot write PID file %1: %2").arg(path, file.errorString());
        }
        return false;
    }
    if (file.write(QByteArray::number(own)) < 0) {
        if (error) {
            *error = QStringLiteral("Cannot write PID file %1: %2").arg(path, file.errorString());
        }
        return false;
    }
    qDebug() << "ResumeDaemon::acquirePidFile() - PID file written:" << path << "PID:" << own;
    return true;
}

void ResumeDaemon::releasePidFile()
{
    const QString path = pidFilePath();
    if (runningDaemonPid(path) == QCoreApplication::applicationPid()) {
        QFile::remove(path);
    }
}

bool ResumeDaemon::start(QString *error)
{
    if (m_running) {
        return true;
    }

    if (!acquirePidFile(error)) {
        return false;
    }

    if (!m_control->start()) {
        if (error) {
            *error = QStringLiteral("Cannot listen on %1").arg(socketPath());
        }
        releasePidFile();
        return false;
    }

    const int requeued = m_queue->requeueInterrupted();
    if (requeued > 0) {
        qInfo() << "ResumeDaemon::start() - Re-queued" << requeued << "interrupted attempt(s)";
    }

    // Detections from before this start were announced by the previous run
    const QList<DetectionEvent> entries = m_queue->entries();
    for (const DetectionEvent &entry : entries) {
        m_seen.insert(entry.id);
    }
    const DetectionEvent pending = m_queue->nextPending();
    if (pending.isValid()) {
        m_status->setRateLimitActive(pending);
    }

    if (m_settings->hooksEnabled()) {
        const int found = m_hooks->discover(m_settings->hooksDirectory());
        qInfo() << "ResumeDaemon::start() - Loaded" << found << "hook(s) from" << m_settings->hooksDirectory();
    }

    if (m_settings->analyticsEnabled()) {
        m_analytics->cleanup();
    }

    m_queueModified = QFileInfo(m_queue->filePath()).lastModified();
    m_running = true;
    m_checkTimer->start();

    updateQueueCounts();
    m_status->setDaemonState(QStringLiteral("running"));
    m_hooks->dispatch(HookPoint::DaemonStart, daemonInfo());

    qInfo() << "ResumeDaemon::start() - Daemon started, PID" << QCoreApplication::applicationPid() << "data" << m_dataDirectory;
    Q_EMIT started();

    m_scheduler->reevaluate();
    return true;
}

void ResumeDaemon::stop()
{
    if (!m_running || m_stopping) {
        return;
    }
    m_stopping = true;

    qInfo() << "ResumeDaemon::stop() - Stopping daemon";

    m_checkTimer->stop();
    m_scheduler->cancel();
    m_status->setDaemonState(QStringLiteral("stopping"));

    m_pendingStopHooks = m_hooks->dispatch(HookPoint::DaemonStop, daemonInfo());
    if (m_pendingStopHooks == 0) {
        finishStop();
    }
}

void ResumeDaemon::finishStop()
{
    m_control->stop();
    releasePidFile();
    m_running = false;
    m_stopping = false;

    qInfo() << "ResumeDaemon::stop() - Daemon stopped";
    Q_EMIT stopped();
}

bool ResumeDaemon::watchUnixSignals()
{
    if (m_signalNotifier) {
        return true;
    }

    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, s_signalFds) != 0) {
        qWarning() << "ResumeDaemon::watchUnixSignals() - socketpair failed:" << strerror(errno);
        return false;
    }

    m_signalNotifier = new QSocketNotifier(s_signalFds[1], QSocketNotifier::Read, this);
    connect(m_signalNotifier, &QSocketNotifier::activated, this, &ResumeDaemon::onUnixSignal);

    struct sigaction action = {};
    action.sa_handler = unixSignalHandler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;

    if (sigaction(SIGINT, &action, nullptr) != 0 || sigaction(SIGTERM, &action, nullptr) != 0) {
        qWarning() << "ResumeDaemon::watchUnixSignals() - sigaction failed:" << strerror(errno);
        return false;
    }
    return true;
}

void ResumeDaemon::onUnixSignal()
{
    m_signalNotifier->setEnabled(false);
    char byte;
    const ssize_t got = ::read(s_signalFds[1], &byte, sizeof(byte));
    Q_UNUSED(got)

    qInfo() << "ResumeDaemon - Received shutdown signal";
    stop();

    m_signalNotifier->setEnabled(true);
}

void ResumeDaemon::checkQueue()
{
    const QFileInfo info(m_queue->filePath());
    const QDateTime modified = info.exists() ? info.lastModified() : QDateTime();

    if (modified != m_queueModified) {
        m_queueModified = modified;

        const QList<DetectionEvent> pending = m_queue->pendingEntries();
        for (const DetectionEvent &entry : pending) {
            if (!m_seen.contains(entry.id)) {
                onDetection(entry);
            }
        }
        updateQueueCounts();
    }

    m_scheduler->reevaluate();
}

void ResumeDaemon::onDetection(const DetectionEvent &event)
{
    if (m_seen.contains(event.id)) {
        return;
    }
    m_seen.insert(event.id);

    if (isResetTimeStale(event.resetTime, m_settings->resumeConfig().staleThresholdMs)) {
        qDebug() << "ResumeDaemon::onDetection() - Not announcing stale detection" << event.id;
        return;
    }

    qInfo() << "ResumeDaemon::onDetection() - Rate limit detected, reset at" << event.resetTime << "(" << event.timezone << ")";

    m_notifications->notifyRateLimit(event.resetTime);
    if (m_settings->analyticsEnabled()) {
        m_analytics->recordRateLimit(event);
    }
    m_hooks->dispatch(HookPoint::RateLimitDetected, event.toJson());
    m_status->setRateLimitActive(event);
}

bool ResumeDaemon::resumeNow(const QString &eventId, QString *error)
{
    if (m_coordinator->isResumeInProgress()) {
        if (error) {
            *error = QStringLiteral("A resume attempt is already in progress");
        }
        return false;
    }

    DetectionEvent event;
    if (eventId.isEmpty()) {
        event = m_queue->nextPending();
    } else {
        event = m_queue->entry(eventId);
        if (event.isValid() && !event.isLive()) {
            if (error) {
                *error = QStringLiteral("Event %1 is %2").arg(eventId, eventStatusToString(event.status));
            }
            return false;
        }
    }

    if (!event.isValid()) {
        if (error) {
            *error = eventId.isEmpty() ? QStringLiteral("No pending rate limit") : QStringLiteral("Unknown event %1").arg(eventId);
        }
        return false;
    }

    if (m_scheduler->isArmed() && m_scheduler->armedEvent().id == event.id) {
        m_scheduler->cancel();
    }

    qInfo() << "ResumeDaemon::resumeNow() - Manual resume of" << event.id;
    return m_coordinator->attemptResume(event);
}

void ResumeDaemon::onStateChanged(ResumeCoordinator::State state, const QString &eventId)
{
    const QString name = ResumeCoordinator::stateToString(state);
    m_status->setCoordinatorState(name, eventId);

    QJsonObject data;
    data[QStringLiteral("state")] = name;
    data[QStringLiteral("event_id")] = eventId;
    m_hooks->dispatch(HookPoint::StatusChange, data);
}

void ResumeDaemon::onResumeDelivered(const DetectionEvent &event, const QString &tier, int attempt)
{
    qInfo() << "ResumeDaemon - Resume sent for" << event.id << "via" << tier << "attempt" << attempt;

    if (!m_recorded.contains(event.id)) {
        m_recorded.insert(event.id);
        m_notifications->notifyResume(event.claudePid > 0 ? QString::number(event.claudePid) : QString());
        if (m_settings->analyticsEnabled()) {
            m_analytics->recordResume(event, true, tier);
        }
    }

    QJsonObject data = event.toJson();
    data[QStringLiteral("tier")] = tier;
    data[QStringLiteral("attempt")] = attempt;
    m_hooks->dispatch(HookPoint::ResumeSent, data);
}

void ResumeDaemon::onResumeFailed(const DetectionEvent &event, ResumeError error, const QString &reason)
{
    qWarning() << "ResumeDaemon - Resume failed for" << event.id << resumeErrorToString(error) << reason;

    m_notifications->notifyResumeFailed(reason);

    if (!m_recorded.contains(event.id)) {
        m_recorded.insert(event.id);
        if (m_settings->analyticsEnabled()) {
            m_analytics->recordResume(event, false);
        }
    }

    QJsonObject data;
    data[QStringLiteral("event_id")] = event.id;
    data[QStringLiteral("error")] = resumeErrorToString(error);
    data[QStringLiteral("reason")] = reason;
    m_status->broadcastEvent(QStringLiteral("resume_failed"), data);
}

void ResumeDaemon::updateQueueCounts()
{
    const QList<DetectionEvent> entries = m_queue->entries();
    int pending = 0;
    for (const DetectionEvent &entry : entries) {
        if (entry.isLive()) {
            ++pending;
        }
    }
    m_status->setQueueCounts(pending, entries.size());
}

QJsonObject ResumeDaemon::daemonInfo() const
{
    QJsonObject info;
    info[QStringLiteral("pid")] = static_cast<double>(QCoreApplication::applicationPid());
    info[QStringLiteral("data_directory")] = m_dataDirectory;
    info[QStringLiteral("timestamp")] = isoTimestamp();
    return info;
}

} // namespace AutoResume

#include "moc_ResumeDaemon.cpp"
