/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "ResumeScheduler.h"
#include "RateLimitQueue.h"
#include "StalenessGuard.h"

#include <QDebug>

namespace AutoResume
{

ResumeScheduler::ResumeScheduler(RateLimitQueue *queue, QObject *parent)
    : QObject(parent)
    , m_queue(queue)
    , m_timer(new QTimer(this))
{
    m_timer->setSingleShot(true);
    // Coarse timers may fire up to 5% early, which is minutes on a long wait
    m_timer->setTimerType(Qt::PreciseTimer);
    connect(m_timer, &QTimer::timeout, this, &ResumeScheduler::onTimeout);
}

ResumeScheduler::~ResumeScheduler()
{
    m_timer->stop();
}

void ResumeScheduler::setConfig(const ResumeConfig &config)
{
    m_config = config;
}

const ResumeConfig &ResumeScheduler::config() const
{
    return m_config;
}

void ResumeScheduler::setBusyCheck(std::function<bool()> busyCheck)
{
    m_busyCheck = std::move(busyCheck);
}

void ResumeScheduler::setSettledCheck(std::function<bool(const QString &)> settledCheck)
{
    m_settledCheck = std::move(settledCheck);
}

bool ResumeScheduler::isArmed() const
{
    return m_armedEvent.isValid();
}

DetectionEvent ResumeScheduler::armedEvent() const
{
    return m_armedEvent;
}

QDateTime ResumeScheduler::fireAt() const
{
    return m_fireAt;
}

qint64 ResumeScheduler::remainingMs() const
{
    if (!isArmed()) {
        return 0;
    }
    return qMax<qint64>(0, QDateTime::currentDateTimeUtc().msecsTo(m_fireAt));
}

QDateTime ResumeScheduler::computeFireAt(const DetectionEvent &event, qint64 postResetDelayMs)
{
    const QDateTime reset = event.resetDateTime();
    if (!reset.isValid()) {
        return QDateTime();
    }
    return reset.addMSecs(postResetDelayMs);
}

bool ResumeScheduler::isBusy() const
{
    return m_busyCheck && m_busyCheck();
}

bool ResumeScheduler::isSettled(const QString &eventId) const
{
    return m_unwritableStale.contains(eventId) || (m_settledCheck && m_settledCheck(eventId));
}

void ResumeScheduler::startTimer(qint64 delayMs)
{
    m_timer->start(static_cast<int>(qMin(delayMs, kMaxTimerIntervalMs)));
}

void ResumeScheduler::reevaluate()
{
    if (!m_queue) {
        return;
    }

    if (isBusy()) {
        qDebug() << "ResumeScheduler::reevaluate() - Resume in progress, re-check deferred";
        return;
    }

    const QDateTime now = QDateTime::currentDateTimeUtc();

    DetectionEvent candidate;
    const QList<DetectionEvent> pending = m_queue->pendingEntries();
    for (const DetectionEvent &entry : pending) {
        if (isSettled(entry.id)) {
            continue;
        }
        if (isResetTimeStale(entry.resetTime, m_config.staleThresholdMs, now)) {
            qDebug() << "ResumeScheduler::reevaluate() - Dropping stale detection" << entry.id << "reset_time:" << entry.resetTime;
            if (!m_queue->markFailed(entry.id, QStringLiteral("stale"))) {
                qWarning() << "ResumeScheduler::reevaluate() - Could not mark" << entry.id << "stale in the queue file";
                m_unwritableStale.insert(entry.id);
            }
            if (m_armedEvent.id == entry.id) {
                cancel();
            }
            Q_EMIT staleDropped(entry);
            continue;
        }
        candidate = entry;
        break;
    }

    if (!candidate.isValid()) {
        if (isArmed()) {
            qDebug() << "ResumeScheduler::reevaluate() - Armed event no longer pending, disarming";
            cancel();
        }
        return;
    }

    if (isArmed()) {
        if (m_armedEvent.id == candidate.id) {
            return;
        }
        qDebug() << "ResumeScheduler::reevaluate() - Earlier detection" << candidate.id << "replaces armed" << m_armedEvent.id;
        cancel();
    }

    const QDateTime fireAt = computeFireAt(candidate, m_config.postResetDelayMs);
    const qint64 delayMs = now.msecsTo(fireAt);

    if (delayMs <= 0) {
        qDebug() << "ResumeScheduler::reevaluate() - Reset already passed, firing" << candidate.id;
        Q_EMIT fired(candidate);
        return;
    }

    if (candidate.status == EventStatus::Pending) {
        if (m_queue->updateEntryStatus(candidate.id, EventStatus::Waiting)) {
            candidate.status = EventStatus::Waiting;
        } else {
            qWarning() << "ResumeScheduler::reevaluate() - Could not mark" << candidate.id << "waiting, arming anyway";
        }
    }

    m_armedEvent = candidate;
    m_fireAt = fireAt;
    startTimer(delayMs);

    qDebug() << "ResumeScheduler::reevaluate() - Armed" << candidate.id << "fires in" << delayMs << "ms at" << fireAt.toString(Qt::ISODate);
    Q_EMIT armed(candidate, fireAt);
}

void ResumeScheduler::cancel()
{
    if (!isArmed()) {
        return;
    }

    const QString id = m_armedEvent.id;
    m_timer->stop();
    m_armedEvent = DetectionEvent();
    m_fireAt = QDateTime();
    Q_EMIT cancelled(id);
}

void ResumeScheduler::onTimeout()
{
    if (!isArmed()) {
        return;
    }

    const qint64 remaining = QDateTime::currentDateTimeUtc().msecsTo(m_fireAt);
    if (remaining > 0) {
        // Woken early (long wait split up, or the clock moved)
        startTimer(remaining);
        return;
    }

    const DetectionEvent event = m_armedEvent;
    m_armedEvent = DetectionEvent();
    m_fireAt = QDateTime();

    if (isBusy()) {
        qDebug() << "ResumeScheduler::onTimeout() - Resume in progress, deferring" << event.id;
        return;
    }

    // The CLI may have reset the entry while we were waiting
    const DetectionEvent current = m_queue ? m_queue->entry(event.id) : DetectionEvent();
    if (!current.isValid() || !current.isLive() || isSettled(current.id)) {
        reevaluate();
        return;
    }

    Q_EMIT fired(current);
}

} // namespace AutoResume

#include "moc_ResumeScheduler.cpp"
