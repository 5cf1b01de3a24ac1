/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef DETECTIONEVENT_H
#define DETECTIONEVENT_H

#include "autoresume_export.h"

#include <QDateTime>
#include <QJsonObject>
#include <QMetaType>
#include <QString>

namespace AutoResume
{

/**
 * Lifecycle status of a queued detection.
 */
enum class EventStatus {
    Pending, // Recorded, no countdown armed yet
    Waiting, // Countdown armed by the scheduler
    Active, // A resume attempt is running
    Completed, // Keystrokes delivered
    Failed, // Dropped or retries exhausted
};

AUTORESUME_EXPORT QString eventStatusToString(EventStatus status);
AUTORESUME_EXPORT EventStatus eventStatusFromString(const QString &status, bool *ok = nullptr);

/**
 * What the external detector hands over when it sees a rate limit message.
 */
struct AUTORESUME_EXPORT Detection {
    QString resetTime; // ISO-8601, authoritative
    QString timezone;
    QString message;
    qint64 claudePid = 0;
    QString transcriptPath;

    static Detection fromJson(const QJsonObject &obj);
};

/**
 * DetectionEvent is one persisted entry of the rate limit queue.
 *
 * Timestamps are kept as the ISO strings written to disk so that a
 * round-trip through status.json never alters the dedup key.
 */
class AUTORESUME_EXPORT DetectionEvent
{
public:
    QString id; // UUID
    QString resetTime; // ISO-8601, dedup key
    QString timezone; // display only
    QString message; // raw detected text
    QString detectedAt;
    qint64 claudePid = 0; // 0 = unknown
    QString transcriptPath;
    EventStatus status = EventStatus::Pending;
    QString completedAt;
    QString failureReason;

    bool isValid() const
    {
        return !id.isEmpty() && !resetTime.isEmpty();
    }

    /**
     * Pending or waiting: still eligible for scheduling.
     */
    bool isLive() const
    {
        return status == EventStatus::Pending || status == EventStatus::Waiting;
    }

    bool isTerminal() const
    {
        return status == EventStatus::Completed || status == EventStatus::Failed;
    }

    /**
     * Parsed reset time (UTC), invalid if the stored string does not parse.
     */
    QDateTime resetDateTime() const;

    QJsonObject toJson() const;
    static DetectionEvent fromJson(const QJsonObject &obj);

    /**
     * Build a fresh pending entry for a detection, stamped now.
     */
    static DetectionEvent create(const Detection &detection);

    bool operator==(const DetectionEvent &other) const
    {
        return id == other.id;
    }
};

/**
 * ISO-8601 UTC string with milliseconds, the format used throughout status.json.
 */
AUTORESUME_EXPORT QString isoTimestamp(const QDateTime &dateTime = QDateTime::currentDateTimeUtc());

/**
 * Parse an ISO-8601 timestamp; returns an invalid QDateTime on failure.
 */
AUTORESUME_EXPORT QDateTime parseTimestamp(const QString &value);

} // namespace AutoResume

Q_DECLARE_METATYPE(AutoResume::DetectionEvent)

#endif // DETECTIONEVENT_H
