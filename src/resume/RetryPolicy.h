/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef RETRYPOLICY_H
#define RETRYPOLICY_H

#include "autoresume_export.h"

#include <QHash>
#include <QString>

namespace AutoResume
{

/**
 * Bounded exponential backoff, counted per event id.
 *
 * Attempt n (0-based) waits base * 2^n, capped at maxDelay. Retrying
 * stops once maxRetries retries have been made.
 */
class AUTORESUME_EXPORT RetryPolicy
{
public:
    RetryPolicy(int maxRetries = 4, qint64 baseDelayMs = 5000, qint64 maxDelayMs = 300000);

    int maxRetries() const;
    qint64 baseDelayMs() const;
    qint64 maxDelayMs() const;

    qint64 nextDelayMs(int retry) const;
    bool shouldRetry(int retriesSoFar) const;

    /**
     * Count a retry for id and return the delay to wait before it, or -1
     * once the budget is spent
     */
    qint64 recordRetry(const QString &id);

    int retries(const QString &id) const;
    void reset(const QString &id);
    void clear();

private:
    int m_maxRetries;
    qint64 m_baseDelayMs;
    qint64 m_maxDelayMs;
    QHash<QString, int> m_retries;
};

} // namespace AutoResume

#endif // RETRYPOLICY_H
