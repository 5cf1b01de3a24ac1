/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef RESUMECONFIG_H
#define RESUMECONFIG_H

#include "autoresume_export.h"

#include "StalenessGuard.h"

#include <QString>

namespace AutoResume
{

/**
 * Runtime parameters of the resume core.
 *
 * AutoResumeSettings fills this from autoresumerc; tests build it directly
 * with short intervals.
 */
struct AUTORESUME_EXPORT ResumeConfig {
    // Text typed into the session after the menu selection
    QString resumePrompt = QStringLiteral("continue");
    // Key pressed when the rate limit dialog offers options
    QString menuSelection = QStringLiteral("1");

    // Wait after the advertised reset before sending
    qint64 postResetDelayMs = 10 * 1000;
    qint64 staleThresholdMs = DefaultStaleThresholdMs;

    int maxRetries = 4;
    qint64 retryBaseDelayMs = 5 * 1000;
    qint64 retryMaxDelayMs = 5 * 60 * 1000;

    qint64 verificationWindowMs = 90 * 1000;
    int verificationPollMs = 1000;
    // Empty = ~/.claude/projects
    QString transcriptRoot;

    // Bound for every external command a delivery tier runs
    int commandTimeoutMs = 10 * 1000;
    // Upper bound on one delivery pass across all tiers
    int deliveryWatchdogMs = 2 * 60 * 1000;
};

} // namespace AutoResume

#endif // RESUMECONFIG_H
