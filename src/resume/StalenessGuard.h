/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef STALENESSGUARD_H
#define STALENESSGUARD_H

#include "autoresume_export.h"

#include <QDateTime>
#include <QString>

namespace AutoResume
{

/**
 * Default age after which a past reset time is no longer acted upon.
 */
constexpr qint64 DefaultStaleThresholdMs = 2 * 60 * 60 * 1000;

/**
 * Classify a detected reset time.
 *
 * Transcripts are re-scanned after the fact, so the detector can report a
 * rate limit that already lifted hours ago. A reset time is stale when it
 * does not parse, or when it lies at least thresholdMs in the past.
 * Future reset times and ones less than thresholdMs old are actionable.
 *
 * @param resetTime ISO-8601 timestamp as stored in the queue
 * @param thresholdMs Allowed age of a past reset time
 * @param now Reference time (defaults to the current time)
 */
AUTORESUME_EXPORT bool isResetTimeStale(const QString &resetTime,
                                        qint64 thresholdMs = DefaultStaleThresholdMs,
                                        const QDateTime &now = QDateTime::currentDateTimeUtc());

} // namespace AutoResume

#endif // STALENESSGUARD_H
