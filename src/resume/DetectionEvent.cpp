/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "DetectionEvent.h"

#include <QJsonValue>
#include <QUuid>

namespace AutoResume
{

QString eventStatusToString(EventStatus status)
{
    switch (status) {
    case EventStatus::Pending:
        return QStringLiteral("pending");
    case EventStatus::Waiting:
        return QStringLiteral("waiting");
    case EventStatus::Active:
        return QStringLiteral("active");
    case EventStatus::Completed:
        return QStringLiteral("completed");
    case EventStatus::Failed:
        return QStringLiteral("failed");
    }
    return QStringLiteral("pending");
}

EventStatus eventStatusFromString(const QString &status, bool *ok)
{
    if (ok) {
        *ok = true;
    }
    if (status == QLatin1String("pending")) {
        return EventStatus::Pending;
    }
    if (status == QLatin1String("waiting")) {
        return EventStatus::Waiting;
    }
    if (status == QLatin1String("active")) {
        return EventStatus::Active;
    }
    if (status == QLatin1String("completed")) {
        return EventStatus::Completed;
    }
    if (status == QLatin1String("failed")) {
        return EventStatus::Failed;
    }
    if (ok) {
        *ok = false;
    }
    return EventStatus::Pending;
}

QString isoTimestamp(const QDateTime &dateTime)
{
    return dateTime.toUTC().toString(Qt::ISODateWithMs);
}

QDateTime parseTimestamp(const QString &value)
{
    const QString trimmed = value.trimmed();
    if (trimmed.isEmpty()) {
        return QDateTime();
    }

    QDateTime parsed = QDateTime::fromString(trimmed, Qt::ISODateWithMs);
    if (!parsed.isValid()) {
        parsed = QDateTime::fromString(trimmed, Qt::ISODate);
    }
    if (!parsed.isValid()) {
        return QDateTime();
    }
    return parsed.toUTC();
}

// pid fields may arrive as numbers or numeric strings from older hooks
static qint64 readPid(const QJsonValue &value)
{
    if (value.isDouble()) {
        return static_cast<qint64>(value.toDouble());
    }
    if (value.isString()) {
        bool ok = false;
        const qint64 pid = value.toString().toLongLong(&ok);
        return ok ? pid : 0;
    }
    return 0;
}

Detection Detection::fromJson(const QJsonObject &obj)
{
    Detection detection;
    detection.resetTime = obj.value(QStringLiteral("reset_time")).toString();
    detection.timezone = obj.value(QStringLiteral("timezone")).toString();
    detection.message = obj.value(QStringLiteral("message")).toString();
    detection.claudePid = readPid(obj.value(QStringLiteral("claude_pid")));
    detection.transcriptPath = obj.value(QStringLiteral("transcript_path")).toString();
    return detection;
}

QDateTime DetectionEvent::resetDateTime() const
{
    return parseTimestamp(resetTime);
}

QJsonObject DetectionEvent::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("id")] = id;
    obj[QStringLiteral("reset_time")] = resetTime;
    obj[QStringLiteral("timezone")] = timezone.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(timezone);
    obj[QStringLiteral("message")] = message;
    obj[QStringLiteral("detected_at")] = detectedAt;
    obj[QStringLiteral("claude_pid")] = claudePid > 0 ? QJsonValue(static_cast<double>(claudePid)) : QJsonValue(QJsonValue::Null);
    if (!transcriptPath.isEmpty()) {
        obj[QStringLiteral("transcript_path")] = transcriptPath;
    }
    obj[QStringLiteral("status")] = eventStatusToString(status);
    if (!completedAt.isEmpty()) {
        obj[QStringLiteral("completed_at")] = completedAt;
    }
    if (!failureReason.isEmpty()) {
        obj[QStringLiteral("failure_reason")] = failureReason;
    }
    return obj;
}

DetectionEvent DetectionEvent::fromJson(const QJsonObject &obj)
{
    DetectionEvent event;
    event.id = obj.value(QStringLiteral("id")).toString();
    event.resetTime = obj.value(QStringLiteral("reset_time")).toString();
    event.timezone = obj.value(QStringLiteral("timezone")).toString();
    event.message = obj.value(QStringLiteral("message")).toString();
    event.detectedAt = obj.value(QStringLiteral("detected_at")).toString();
    event.claudePid = readPid(obj.value(QStringLiteral("claude_pid")));
    event.transcriptPath = obj.value(QStringLiteral("transcript_path")).toString();
    event.status = eventStatusFromString(obj.value(QStringLiteral("status")).toString());
    event.completedAt = obj.value(QStringLiteral("completed_at")).toString();
    event.failureReason = obj.value(QStringLiteral("failure_reason")).toString();
    return event;
}

DetectionEvent DetectionEvent::create(const Detection &detection)
{
    DetectionEvent event;
    event.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    event.resetTime = detection.resetTime;
    event.timezone = detection.timezone;
    event.message = detection.message;
    event.detectedAt = isoTimestamp();
    event.claudePid = detection.claudePid;
    event.transcriptPath = detection.transcriptPath;
    event.status = EventStatus::Pending;
    return event;
}

} // namespace AutoResume
