/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef RESUMEERROR_H
#define RESUMEERROR_H

#include "autoresume_export.h"

#include <QMetaType>
#include <QString>

namespace AutoResume
{

/**
 * Failure kinds recovered inside the resume core
 */
enum class ResumeError {
    None,
    DetectionStale, // reset_time too far in the past, dropped
    DeliveryNoTargets, // every tier ran and found nothing
    DeliveryPartialFailure, // some targets failed, at least one got it
    VerificationTimeout, // delivered, no transcript activity in the window
    RetryExhausted, // gave up after maxRetries
    AttemptAborted, // exception or watchdog inside an attempt
};

AUTORESUME_EXPORT QString resumeErrorToString(ResumeError error);

} // namespace AutoResume

Q_DECLARE_METATYPE(AutoResume::ResumeError)

#endif // RESUMEERROR_H
