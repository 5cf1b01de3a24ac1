/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef RESUMESCHEDULER_H
#define RESUMESCHEDULER_H

#include "autoresume_export.h"

#include "DetectionEvent.h"
#include "ResumeConfig.h"

#include <QDateTime>
#include <QObject>
#include <QSet>
#include <QTimer>

#include <functional>

namespace AutoResume
{

class RateLimitQueue;

/**
 * ResumeScheduler arms one countdown for the earliest actionable detection.
 *
 * reevaluate() is the single entry point: it is called whenever the queue
 * may have changed and whenever an in-flight resume finishes. It drops
 * stale entries, and arms (or immediately fires) the earliest remaining
 * one. An armed countdown is replaced when an earlier detection shows up;
 * nothing is armed while the coordinator reports itself busy.
 */
class AUTORESUME_EXPORT ResumeScheduler : public QObject
{
    Q_OBJECT

public:
    explicit ResumeScheduler(RateLimitQueue *queue, QObject *parent = nullptr);
    ~ResumeScheduler() override;

    void setConfig(const ResumeConfig &config);
    const ResumeConfig &config() const;

    /**
     * Predicate consulted before arming and before firing.
     */
    void setBusyCheck(std::function<bool()> busyCheck);

    /**
     * Predicate naming events whose outcome is already decided although
     * the queue may still list them live. Such events are never armed.
     */
    void setSettledCheck(std::function<bool(const QString &)> settledCheck);

    bool isArmed() const;
    DetectionEvent armedEvent() const;
    QDateTime fireAt() const;
    qint64 remainingMs() const;

    /**
     * reset_time + post-reset delay; invalid if reset_time does not parse
     */
    static QDateTime computeFireAt(const DetectionEvent &event, qint64 postResetDelayMs);

public Q_SLOTS:
    /**
     * Pick the next pending event and arm or fire for it.
     */
    void reevaluate();

    /**
     * Disarm without firing. Queue state is left as is.
     */
    void cancel();

Q_SIGNALS:
    void armed(const AutoResume::DetectionEvent &event, const QDateTime &fireAt);
    void cancelled(const QString &eventId);
    void staleDropped(const AutoResume::DetectionEvent &event);
    void fired(const AutoResume::DetectionEvent &event);

private:
    void onTimeout();
    bool isBusy() const;
    bool isSettled(const QString &eventId) const;
    void startTimer(qint64 delayMs);

    // QTimer intervals are int; longer waits re-arm on wake-up
    static constexpr qint64 kMaxTimerIntervalMs = 24LL * 60 * 60 * 1000;

    RateLimitQueue *m_queue = nullptr;
    ResumeConfig m_config;
    std::function<bool()> m_busyCheck;
    std::function<bool(const QString &)> m_settledCheck;
    // Stale entries the queue refused to mark failed
    QSet<QString> m_unwritableStale;

    QTimer *m_timer = nullptr;
    DetectionEvent m_armedEvent;
    QDateTime m_fireAt;
};

} // namespace AutoResume

#endif // RESUMESCHEDULER_H
