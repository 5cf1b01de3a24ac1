/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "StatusBridge.h"
#include "DetectionEvent.h"

#include <QCoreApplication>

namespace AutoResume
{

StatusBridge::StatusBridge(QObject *parent)
    : QObject(parent)
    , m_startedAt(QDateTime::currentDateTimeUtc())
{
}

StatusBridge::~StatusBridge() = default;

QJsonObject StatusBridge::statusSnapshot(const QDateTime &now) const
{
    QJsonObject status;
    status[QStringLiteral("daemon")] = m_daemonState;
    status[QStringLiteral("pid")] = static_cast<double>(QCoreApplication::applicationPid());
    status[QStringLiteral("started_at")] = isoTimestamp(m_startedAt);
    status[QStringLiteral("uptime_sec")] = static_cast<double>(m_startedAt.secsTo(now));
    status[QStringLiteral("state")] = m_coordinatorState;
    status[QStringLiteral("event_id")] = m_currentEventId.isEmpty() ? QJsonValue() : QJsonValue(m_currentEventId);

    status[QStringLiteral("rate_limit_active")] = m_rateLimitActive;
    status[QStringLiteral("reset_time")] = m_rateLimitActive ? QJsonValue(m_resetTime) : QJsonValue();
    status[QStringLiteral("message")] = m_rateLimitActive ? QJsonValue(m_message) : QJsonValue();

    if (m_fireAt.isValid()) {
        QJsonObject armed;
        armed[QStringLiteral("event_id")] = m_armedEventId;
        armed[QStringLiteral("fire_at")] = isoTimestamp(m_fireAt);
        armed[QStringLiteral("countdown_sec")] = static_cast<double>(qMax<qint64>(0, now.secsTo(m_fireAt)));
        status[QStringLiteral("armed")] = armed;
    } else {
        status[QStringLiteral("armed")] = QJsonValue();
    }

    QJsonObject queue;
    queue[QStringLiteral("pending")] = m_pending;
    queue[QStringLiteral("total")] = m_total;
    status[QStringLiteral("queue")] = queue;
    return status;
}

bool StatusBridge::isRateLimitActive() const
{
    return m_rateLimitActive;
}

QString StatusBridge::coordinatorState() const
{
    return m_coordinatorState;
}

void StatusBridge::setDaemonState(const QString &state)
{
    if (m_daemonState == state) {
        return;
    }
    m_daemonState = state;
    broadcastStatus();
}

void StatusBridge::setCoordinatorState(const QString &state, const QString &eventId)
{
    m_coordinatorState = state;
    m_currentEventId = eventId;

    QJsonObject data;
    data[QStringLiteral("state")] = state;
    data[QStringLiteral("event_id")] = eventId.isEmpty() ? QJsonValue() : QJsonValue(eventId);
    broadcastEvent(QStringLiteral("state_changed"), data);
    broadcastStatus();
}

void StatusBridge::setRateLimitActive(const DetectionEvent &event)
{
    m_rateLimitActive = true;
    m_resetTime = event.resetTime;
    m_message = event.message;
    broadcastEvent(QStringLiteral("rate_limit_detected"), event.toJson());
    broadcastStatus();
}

void StatusBridge::clearRateLimit()
{
    if (!m_rateLimitActive) {
        return;
    }
    m_rateLimitActive = false;
    m_resetTime.clear();
    m_message.clear();
    broadcastEvent(QStringLiteral("rate_limit_cleared"));
    broadcastStatus();
}

void StatusBridge::setArmed(const DetectionEvent &event, const QDateTime &fireAt)
{
    m_armedEventId = event.id;
    m_fireAt = fireAt;

    QJsonObject data;
    data[QStringLiteral("event_id")] = event.id;
    data[QStringLiteral("fire_at")] = isoTimestamp(fireAt);
    broadcastEvent(QStringLiteral("countdown_armed"), data);
    broadcastStatus();
}

void StatusBridge::clearArmed()
{
    if (!m_fireAt.isValid()) {
        return;
    }
    m_armedEventId.clear();
    m_fireAt = QDateTime();
    broadcastStatus();
}

void StatusBridge::setQueueCounts(int pending, int total)
{
    if (m_pending == pending && m_total == total) {
        return;
    }
    m_pending = pending;
    m_total = total;
    broadcastStatus();
}

void StatusBridge::broadcastStatus()
{
    Q_EMIT statusBroadcast(statusSnapshot());
}

void StatusBridge::broadcastEvent(const QString &type, const QJsonObject &data)
{
    QJsonObject event;
    event[QStringLiteral("type")] = type;
    event[QStringLiteral("timestamp")] = isoTimestamp();
    event[QStringLiteral("data")] = data;
    Q_EMIT eventBroadcast(event);
}

} // namespace AutoResume

#include "moc_StatusBridge.cpp"
