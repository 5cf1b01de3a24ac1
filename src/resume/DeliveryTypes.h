/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef DELIVERYTYPES_H
#define DELIVERYTYPES_H

#include "autoresume_export.h"

#include <QByteArray>
#include <QList>
#include <QString>
#include <QStringList>

namespace AutoResume
{

/**
 * Tier names, in fallback order
 */
namespace Tier
{
inline const QString Tmux = QStringLiteral("tmux");
inline const QString Pty = QStringLiteral("pty");
inline const QString Xdotool = QStringLiteral("xdotool");
}

/**
 * One addressable endpoint for keystroke injection
 */
struct AUTORESUME_EXPORT DeliveryTarget {
    QString target; // tmux pane "session:window.pane", pty path or X window id
    qint64 pid = 0; // owning process, 0 if unknown
    QString command; // program running there, used for filtering
};

/**
 * Result of sending to a single target
 */
struct AUTORESUME_EXPORT TargetOutcome {
    QString tier;
    QString target;
    bool success = false;
    QString error;
};

/**
 * What one tier reports back to TieredDelivery
 */
struct AUTORESUME_EXPORT TierOutcome {
    QString tier;
    QList<DeliveryTarget> discovered;
    QList<TargetOutcome> results;
    bool success = false; // at least one target received the text
    QString error;

    int sentCount() const;
    int failedCount() const;
};

/**
 * Aggregate of one deliverResume() call across tiers
 */
struct AUTORESUME_EXPORT DeliveryAttempt {
    QStringList tiersAttempted;
    QList<TargetOutcome> targets;
    bool success = false;
    QString tier; // tier that succeeded, empty on failure
    QString error;

    /**
     * Every tier ran and none found anything to send to
     */
    bool noTargets() const;

    /**
     * Succeeded, but some target along the way failed
     */
    bool partialFailure() const;
};

/**
 * Parameters for a delivery pass
 */
struct AUTORESUME_EXPORT DeliveryRequest {
    QString resumeText = QStringLiteral("continue");
    QString menuSelection = QStringLiteral("1");
    qint64 sourcePid = 0; // advisory, narrows discovery when known
};

/**
 * One step of a tmux keystroke sequence
 */
struct AUTORESUME_EXPORT KeyStep {
    QStringList keys; // tmux key names, or literal text when literal is set
    bool literal = false;
    int delayMs = 0; // pause after the step
};

/**
 * Keystrokes that resume a rate limited Claude session.
 *
 * First dismiss whatever is open and pick the menu option the rate limit
 * dialog offers; then dismiss again, clear the input line and type the
 * prompt, for when no dialog was showing.
 */
AUTORESUME_EXPORT QList<KeyStep> buildResumeSequence(const QString &resumePrompt, const QString &menuSelection = QStringLiteral("1"));

/**
 * Same sequence as raw terminal input bytes (no delays, CR terminated)
 */
AUTORESUME_EXPORT QByteArray buildResumeBytes(const QString &resumePrompt, const QString &menuSelection = QStringLiteral("1"));

} // namespace AutoResume

#endif // DELIVERYTYPES_H
