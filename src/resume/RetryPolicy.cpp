/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "RetryPolicy.h"

namespace AutoResume
{

RetryPolicy::RetryPolicy(int maxRetries, qint64 baseDelayMs, qint64 maxDelayMs)
    : m_maxRetries(qMax(0, maxRetries))
    , m_baseDelayMs(qMax<qint64>(0, baseDelayMs))
    , m_maxDelayMs(qMax<qint64>(0, maxDelayMs))
{
}

int RetryPolicy::maxRetries() const
{
    return m_maxRetries;
}

qint64 RetryPolicy::baseDelayMs() const
{
    return m_baseDelayMs;
}

qint64 RetryPolicy::maxDelayMs() const
{
    return m_maxDelayMs;
}

qint64 RetryPolicy::nextDelayMs(int retry) const
{
    qint64 delay = m_baseDelayMs;
    for (int i = 0; i < retry && delay < m_maxDelayMs; ++i) {
        delay *= 2;
    }
    return qMin(delay, m_maxDelayMs);
}

bool RetryPolicy::shouldRetry(int retriesSoFar) const
{
    return retriesSoFar < m_maxRetries;
}

qint64 RetryPolicy::recordRetry(const QString &id)
{
    const int soFar = m_retries.value(id, 0);
    if (!shouldRetry(soFar)) {
        return -1;
    }
    m_retries.insert(id, soFar + 1);
    return nextDelayMs(soFar);
}

int RetryPolicy::retries(const QString &id) const
{
    return m_retries.value(id, 0);
}

void RetryPolicy::reset(const QString &id)
{
    m_retries.remove(id);
}

void RetryPolicy::clear()
{
    m_retries.clear();
}

} // namespace AutoResume
