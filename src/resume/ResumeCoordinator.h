/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef RESUMECOORDINATOR_H
#define RESUMECOORDINATOR_H

#include "autoresume_export.h"

#include "DeliveryTypes.h"
#include "DetectionEvent.h"
#include "ResumeConfig.h"
#include "ResumeError.h"
#include "RetryPolicy.h"
#include "TranscriptVerifier.h"

#include <QObject>
#include <QSet>
#include <QTimer>

#include <functional>
#include <optional>

namespace AutoResume
{

class RateLimitQueue;
class TieredDelivery;

/**
 * ResumeCoordinator runs one resume attempt at a time.
 *
 * An attempt marks the queue entry active, delivers through
 * TieredDelivery, commits the entry as completed as soon as delivery
 * succeeds, then watches the transcript. Failed deliveries and
 * unverified resumes are retried with backoff until the retry budget is
 * spent.
 *
 * The in-progress flag is held for the whole attempt, backoff waits
 * included, and released on every exit path. A second attemptResume()
 * while it is held returns false and does nothing.
 */
class AUTORESUME_EXPORT ResumeCoordinator : public QObject
{
    Q_OBJECT

public:
    enum class State {
        Idle,
        Attempting,
        Delivered,
        Verifying,
        Verified,
        Unverified,
        Failed,
    };
    Q_ENUM(State)

    ResumeCoordinator(RateLimitQueue *queue, TieredDelivery *delivery, TranscriptVerifier *verifier, QObject *parent = nullptr);
    ~ResumeCoordinator() override;

    /**
     * Takes effect at once when idle. During an attempt the new values
     * are held until the attempt finishes, so its retry budget and
     * verification window stay as they started.
     */
    void setConfig(const ResumeConfig &config);
    const ResumeConfig &config() const;

    State state() const;
    static QString stateToString(State state);

    bool isResumeInProgress() const;
    void setResumeInProgress(bool inProgress);

    /**
     * Event of the running attempt, invalid when idle
     */
    DetectionEvent currentEvent() const;

    DeliveryAttempt lastDelivery() const;
    VerificationResult lastVerification() const;

    const RetryPolicy &retryPolicy() const;

    /**
     * True for events this coordinator finished with although writing the
     * outcome to the queue failed. The queue file still lists them live;
     * automatic scheduling must leave them alone until the daemon restarts.
     */
    bool isSettled(const QString &eventId) const;

public Q_SLOTS:
    /**
     * Start an attempt for event. Returns false if one is already running
     * or event is not valid.
     */
    bool attemptResume(const AutoResume::DetectionEvent &event);

Q_SIGNALS:
    void stateChanged(AutoResume::ResumeCoordinator::State state, const QString &eventId);

    /**
     * Delivery succeeded and the queue entry is completed; the rate limit
     * is over as far as anyone watching is concerned
     */
    void rateLimitCleared(const AutoResume::DetectionEvent &event);

    void resumeDelivered(const AutoResume::DetectionEvent &event, const QString &tier, int attempt);
    void resumeVerified(const AutoResume::DetectionEvent &event, const AutoResume::VerificationResult &result);

    /**
     * Terminal failure of an attempt: RetryExhausted when the retry budget
     * ran out (delivery or verification), AttemptAborted on an exception
     * or the watchdog
     */
    void resumeFailed(const AutoResume::DetectionEvent &event, AutoResume::ResumeError error, const QString &reason);

    /**
     * Always emitted last, once the flag is released
     */
    void attemptFinished(const QString &eventId);

private:
    void runDelivery();
    void onDeliveryFinished(quint64 pass, const DeliveryAttempt &attempt);
    void onVerificationFinished(const VerificationResult &result);
    bool scheduleRetry(const QString &why);
    void giveUp(const QString &reason);
    void abort(const QString &reason);
    void finish();
    void setState(State state);
    void applyConfig(const ResumeConfig &config);
    void recordOutcome(bool written, const char *outcome);

    /**
     * Run step, turning any escaping exception into abort()
     */
    void guarded(const char *where, const std::function<void()> &step);

    RateLimitQueue *m_queue = nullptr;
    TieredDelivery *m_delivery = nullptr;
    TranscriptVerifier *m_verifier = nullptr;

    ResumeConfig m_config;
    RetryPolicy m_retryPolicy;
    std::optional<ResumeConfig> m_deferredConfig;

    bool m_inProgress = false;
    State m_state = State::Idle;
    DetectionEvent m_event;
    // Entry was marked completed; later failures no longer touch the queue
    bool m_committed = false;
    int m_deliveries = 0;
    // Bumped per delivery pass so late callbacks from an aborted pass are ignored
    quint64 m_pass = 0;

    QSet<QString> m_settled;

    DeliveryAttempt m_lastDelivery;
    VerificationResult m_lastVerification;
    QDateTime m_deliveredAt;

    QTimer *m_retryTimer = nullptr;
    QTimer *m_watchdog = nullptr;
};

} // namespace AutoResume

#endif // RESUMECOORDINATOR_H
