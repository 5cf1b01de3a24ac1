/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "StalenessGuard.h"

#include "DetectionEvent.h"

namespace AutoResume
{

bool isResetTimeStale(const QString &resetTime, qint64 thresholdMs, const QDateTime &now)
{
    const QDateTime reset = parseTimestamp(resetTime);
    if (!reset.isValid()) {
        return true;
    }

    const qint64 ageMs = reset.msecsTo(now);
    return ageMs >= thresholdMs;
}

} // namespace AutoResume
