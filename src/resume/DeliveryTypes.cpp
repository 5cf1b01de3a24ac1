/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "DeliveryTypes.h"

#include <algorithm>

namespace AutoResume
{

int TierOutcome::sentCount() const
{
    return static_cast<int>(std::count_if(results.cbegin(), results.cend(), [](const TargetOutcome &o) {
        return o.success;
    }));
}

int TierOutcome::failedCount() const
{
    return results.size() - sentCount();
}

bool DeliveryAttempt::noTargets() const
{
    return !success && targets.isEmpty();
}

bool DeliveryAttempt::partialFailure() const
{
    if (!success) {
        return false;
    }
    return std::any_of(targets.cbegin(), targets.cend(), [](const TargetOutcome &o) {
        return !o.success;
    });
}

QList<KeyStep> buildResumeSequence(const QString &resumePrompt, const QString &menuSelection)
{
    const QString menu = menuSelection.isEmpty() ? QStringLiteral("1") : menuSelection;
    const QString prompt = resumePrompt.isEmpty() ? QStringLiteral("continue") : resumePrompt;

    const QString escape = QStringLiteral("Escape");
    return {
        {{escape}, false, 500},
        {{escape}, false, 300},
        {{menu}, true, 1000},
        {{escape}, false, 500},
        {{escape}, false, 300},
        {{QStringLiteral("C-u")}, false, 200},
        {{prompt}, true, 200},
        {{QStringLiteral("Enter")}, false, 0},
    };
}

QByteArray buildResumeBytes(const QString &resumePrompt, const QString &menuSelection)
{
    const QString menu = menuSelection.isEmpty() ? QStringLiteral("1") : menuSelection;
    const QString prompt = resumePrompt.isEmpty() ? QStringLiteral("continue") : resumePrompt;

    const char esc = 0x1B;
    const char ctrlU = 0x15;

    QByteArray bytes;
    bytes.append(esc).append(esc);
    bytes.append(menu.toUtf8());
    bytes.append(esc).append(esc);
    bytes.append(ctrlU);
    // CR, not LF: the TUI reads raw input
    bytes.append(prompt.toUtf8()).append('\r');
    return bytes;
}

} // namespace AutoResume
