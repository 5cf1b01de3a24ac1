/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "ResumeError.h"

namespace AutoResume
{

QString resumeErrorToString(ResumeError error)
{
    switch (error) {
    case ResumeError::None:
        return QStringLiteral("none");
    case ResumeError::DetectionStale:
        return QStringLiteral("detection_stale");
    case ResumeError::DeliveryNoTargets:
        return QStringLiteral("delivery_no_targets");
    case ResumeError::DeliveryPartialFailure:
        return QStringLiteral("delivery_partial_failure");
    case ResumeError::VerificationTimeout:
        return QStringLiteral("verification_timeout");
    case ResumeError::RetryExhausted:
        return QStringLiteral("retry_exhausted");
    case ResumeError::AttemptAborted:
        return QStringLiteral("attempt_aborted");
    }
    return QStringLiteral("unknown");
}

} // namespace AutoResume
