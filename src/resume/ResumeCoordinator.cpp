/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "ResumeCoordinator.h"
#include "RateLimitQueue.h"
#include "TieredDelivery.h"

#include <QDebug>
#include <QPointer>

#include <exception>

namespace AutoResume
{

ResumeCoordinator::ResumeCoordinator(RateLimitQueue *queue, TieredDelivery *delivery, TranscriptVerifier *verifier, QObject *parent)
    : QObject(parent)
    , m_queue(queue)
    , m_delivery(delivery)
    , m_verifier(verifier)
    , m_retryTimer(new QTimer(this))
    , m_watchdog(new QTimer(this))
{
    m_retryTimer->setSingleShot(true);
    connect(m_retryTimer, &QTimer::timeout, this, [this]() {
        guarded("retry", [this]() {
            runDelivery();
        });
    });

    m_watchdog->setSingleShot(true);
    connect(m_watchdog, &QTimer::timeout, this, [this]() {
        qWarning() << "ResumeCoordinator - Delivery did not finish within" << m_config.deliveryWatchdogMs << "ms";
        abort(QStringLiteral("delivery watchdog expired"));
    });

    connect(m_verifier, &TranscriptVerifier::finished, this, [this](const VerificationResult &result) {
        guarded("verification", [this, &result]() {
            onVerificationFinished(result);
        });
    });

    setConfig(ResumeConfig());
}

ResumeCoordinator::~ResumeCoordinator() = default;

void ResumeCoordinator::setConfig(const ResumeConfig &config)
{
    if (m_inProgress) {
        qDebug() << "ResumeCoordinator::setConfig() - Attempt for" << m_event.id << "running, new settings apply afterwards";
        m_deferredConfig = config;
        return;
    }
    applyConfig(config);
}

void ResumeCoordinator::applyConfig(const ResumeConfig &config)
{
    m_deferredConfig.reset();
    m_config = config;
    m_retryPolicy = RetryPolicy(config.maxRetries, config.retryBaseDelayMs, config.retryMaxDelayMs);
    m_verifier->setWindow(config.verificationWindowMs);
    m_verifier->setPollInterval(config.verificationPollMs);
    m_verifier->setTranscriptRoot(config.transcriptRoot);
}

const ResumeConfig &ResumeCoordinator::config() const
{
    return m_config;
}

ResumeCoordinator::State ResumeCoordinator::state() const
{
    return m_state;
}

QString ResumeCoordinator::stateToString(State state)
{
    switch (state) {
    case State::Idle:
        return QStringLiteral("idle");
    case State::Attempting:
        return QStringLiteral("attempting");
    case State::Delivered:
        return QStringLiteral("delivered");
    case State::Verifying:
        return QStringLiteral("verifying");
    case State::Verified:
        return QStringLiteral("verified");
    case State::Unverified:
        return QStringLiteral("unverified");
    case State::Failed:
        return QStringLiteral("failed");
    }
    return QStringLiteral("unknown");
}

bool ResumeCoordinator::isResumeInProgress() const
{
    return m_inProgress;
}

void ResumeCoordinator::setResumeInProgress(bool inProgress)
{
    m_inProgress = inProgress;
}

DetectionEvent ResumeCoordinator::currentEvent() const
{
    return m_event;
}

DeliveryAttempt ResumeCoordinator::lastDelivery() const
{
    return m_lastDelivery;
}

VerificationResult ResumeCoordinator::lastVerification() const
{
    return m_lastVerification;
}

const RetryPolicy &ResumeCoordinator::retryPolicy() const
{
    return m_retryPolicy;
}

bool ResumeCoordinator::isSettled(const QString &eventId) const
{
    return m_settled.contains(eventId);
}

bool ResumeCoordinator::attemptResume(const DetectionEvent &event)
{
    if (m_inProgress) {
        qDebug() << "ResumeCoordinator::attemptResume() - Attempt for" << m_event.id << "in progress, dropping trigger for" << event.id;
        return false;
    }
    if (!event.isValid()) {
        return false;
    }

    m_inProgress = true;
    m_event = event;
    m_committed = false;
    m_deliveries = 0;
    m_lastDelivery = DeliveryAttempt();
    m_lastVerification = VerificationResult();
    m_retryPolicy.reset(event.id);

    qInfo() << "ResumeCoordinator::attemptResume() - Resuming" << event.id << "reset_time:" << event.resetTime;

    guarded("attemptResume", [this]() {
        setState(State::Attempting);
        if (!m_queue->updateEntryStatus(m_event.id, EventStatus::Active)) {
            qWarning() << "ResumeCoordinator::attemptResume() - Could not mark" << m_event.id << "active in the queue file";
        }
        runDelivery();
    });
    return true;
}

void ResumeCoordinator::runDelivery()
{
    if (!m_inProgress) {
        return;
    }

    ++m_deliveries;
    const quint64 pass = ++m_pass;
    setState(State::Attempting);

    // Baseline before sending, so output produced during delivery counts
    m_verifier->prepare(m_event.transcriptPath);
    m_watchdog->start(m_config.deliveryWatchdogMs);

    DeliveryRequest request;
    request.resumeText = m_config.resumePrompt;
    request.menuSelection = m_config.menuSelection;
    request.sourcePid = m_event.claudePid;

    qDebug() << "ResumeCoordinator::runDelivery() - Delivery" << m_deliveries << "for" << m_event.id;

    QPointer<ResumeCoordinator> guard(this);
    m_delivery->deliverResume(request, [this, guard, pass](const DeliveryAttempt &attempt) {
        if (!guard) {
            return;
        }
        guarded("delivery", [this, pass, &attempt]() {
            onDeliveryFinished(pass, attempt);
        });
    });
}

void ResumeCoordinator::onDeliveryFinished(quint64 pass, const DeliveryAttempt &attempt)
{
    if (pass != m_pass || !m_inProgress) {
        qDebug() << "ResumeCoordinator::onDeliveryFinished() - Ignoring result of abandoned delivery pass" << pass;
        return;
    }
    m_watchdog->stop();
    m_lastDelivery = attempt;

    if (!attempt.success) {
        const QString reason = attempt.error.isEmpty() ? QStringLiteral("delivery failed") : attempt.error;
        if (attempt.noTargets()) {
            qWarning() << "ResumeCoordinator::onDeliveryFinished() -" << resumeErrorToString(ResumeError::DeliveryNoTargets) << reason;
        } else {
            qWarning() << "ResumeCoordinator::onDeliveryFinished() - Delivery failed:" << reason;
        }
        if (!scheduleRetry(reason)) {
            giveUp(reason);
        }
        return;
    }

    if (attempt.partialFailure()) {
        qWarning() << "ResumeCoordinator::onDeliveryFinished() -" << resumeErrorToString(ResumeError::DeliveryPartialFailure) << "via" << attempt.tier;
    }

    m_deliveredAt = QDateTime::currentDateTimeUtc();
    setState(State::Delivered);

    // Commit before verifying: a detection arriving during the window must
    // not find this entry still live and start a second attempt
    if (!m_committed) {
        const bool written = m_queue->updateEntryStatus(m_event.id, EventStatus::Completed);
        recordOutcome(written, "completed");
        m_committed = true;
        const DetectionEvent stored = written ? m_queue->entry(m_event.id) : DetectionEvent();
        if (stored.isValid()) {
            m_event = stored;
        } else {
            m_event.status = EventStatus::Completed;
            m_event.completedAt = isoTimestamp(m_deliveredAt);
        }
        Q_EMIT rateLimitCleared(m_event);
    }

    qInfo() << "ResumeCoordinator::onDeliveryFinished() - Delivered" << m_event.id << "via" << attempt.tier << "(delivery" << m_deliveries << ")";
    Q_EMIT resumeDelivered(m_event, attempt.tier, m_deliveries);

    setState(State::Verifying);
    m_verifier->start(m_deliveredAt);
}

void ResumeCoordinator::onVerificationFinished(const VerificationResult &result)
{
    if (!m_inProgress || m_state != State::Verifying) {
        return;
    }
    m_lastVerification = result;

    if (result.verified) {
        qInfo() << "ResumeCoordinator::onVerificationFinished() - Verified" << m_event.id << "after" << result.elapsedMs << "ms";
        setState(State::Verified);
        Q_EMIT resumeVerified(m_event, result);
        finish();
        return;
    }

    setState(State::Unverified);

    if (result.method == QLatin1String("none")) {
        // Nothing to watch; sending again would not make it verifiable
        qWarning() << "ResumeCoordinator::onVerificationFinished() - No transcript to verify" << m_event.id << "against";
        finish();
        return;
    }

    const QString reason = QStringLiteral("no transcript activity within %1 s").arg(m_config.verificationWindowMs / 1000);
    qWarning() << "ResumeCoordinator::onVerificationFinished() -" << resumeErrorToString(ResumeError::VerificationTimeout) << m_event.id << reason;
    if (!scheduleRetry(reason)) {
        giveUp(reason);
    }
}

bool ResumeCoordinator::scheduleRetry(const QString &why)
{
    const qint64 delay = m_retryPolicy.recordRetry(m_event.id);
    if (delay < 0) {
        return false;
    }
    qInfo() << "ResumeCoordinator::scheduleRetry() - Retry" << m_retryPolicy.retries(m_event.id) << "of" << m_retryPolicy.maxRetries() << "for"
            << m_event.id << "in" << delay << "ms:" << why;
    m_retryTimer->start(static_cast<int>(delay));
    return true;
}

void ResumeCoordinator::giveUp(const QString &reason)
{
    qWarning() << "ResumeCoordinator::giveUp() -" << m_event.id << "after" << m_deliveries << "deliveries:" << reason;
    setState(State::Failed);
    if (!m_committed) {
        recordOutcome(m_queue->markFailed(m_event.id, QStringLiteral("delivery")), "failed");
    }
    Q_EMIT resumeFailed(m_event, ResumeError::RetryExhausted, reason);
    finish();
}

void ResumeCoordinator::abort(const QString &reason)
{
    ++m_pass;
    m_watchdog->stop();
    m_retryTimer->stop();
    m_verifier->cancel();

    if (!m_inProgress) {
        return;
    }

    qWarning() << "ResumeCoordinator::abort() -" << m_event.id << reason;
    setState(State::Failed);
    if (!m_committed) {
        recordOutcome(m_queue->markFailed(m_event.id, QStringLiteral("aborted")), "failed");
    }
    Q_EMIT resumeFailed(m_event, ResumeError::AttemptAborted, reason);
    finish();
}

void ResumeCoordinator::finish()
{
    m_watchdog->stop();
    m_retryTimer->stop();

    const QString id = m_event.id;
    m_retryPolicy.reset(id);
    m_inProgress = false;
    m_committed = false;
    m_event = DetectionEvent();
    if (m_deferredConfig) {
        const ResumeConfig deferred = *m_deferredConfig;
        applyConfig(deferred);
    }
    setState(State::Idle);

    Q_EMIT attemptFinished(id);
}

void ResumeCoordinator::recordOutcome(bool written, const char *outcome)
{
    if (written) {
        m_settled.remove(m_event.id);
        return;
    }
    qWarning() << "ResumeCoordinator - Could not mark" << m_event.id << outcome << "in the queue file, holding it back from scheduling";
    m_settled.insert(m_event.id);
}

void ResumeCoordinator::setState(State state)
{
    if (m_state == state) {
        return;
    }
    m_state = state;
    qDebug() << "ResumeCoordinator - State" << stateToString(state) << m_event.id;
    Q_EMIT stateChanged(state, m_event.id);
}

void ResumeCoordinator::guarded(const char *where, const std::function<void()> &step)
{
    try {
        step();
    } catch (const std::exception &e) {
        qWarning() << "ResumeCoordinator - Exception in" << where << ":" << e.what();
        abort(QStringLiteral("%1: %2").arg(QLatin1String(where), QString::fromUtf8(e.what())));
    } catch (...) {
        qWarning() << "ResumeCoordinator - Unknown exception in" << where;
        abort(QStringLiteral("%1: unknown exception").arg(QLatin1String(where)));
    }
}

} // namespace AutoResume

#include "moc_ResumeCoordinator.cpp"
