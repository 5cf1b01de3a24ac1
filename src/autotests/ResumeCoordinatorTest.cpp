/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "ResumeCoordinatorTest.h"

// Qt
#include <QFile>
#include <QSignalSpy>
#include <QStandardPaths>
#include <QTemporaryDir>
#include <QTest>

// AutoResume
#include "../resume/DeliveryTier.h"
#include "../resume/RateLimitQueue.h"
#include "../resume/ResumeCoordinator.h"
#include "../resume/ResumeScheduler.h"
#include "../resume/TieredDelivery.h"
#include "../resume/TranscriptVerifier.h"

#include <stdexcept>

using namespace AutoResume;

namespace
{

// Plays back one scripted behavior per delivery; the last one repeats
class ScriptedTier : public DeliveryTier
{
public:
    enum Step {
        Send, // succeeds and Claude answers in the transcript
        SendQuietly, // succeeds, transcript stays untouched
        Miss, // no targets
        Hang, // never reports
        SendThenThrow, // reports success, then throws
        SendThenThrowUnknown, // reports success, then throws a non-standard value
    };

    explicit ScriptedTier(const QList<Step> &script)
        : m_script(script)
    {
    }

    QString name() const override
    {
        return Tier::Tmux;
    }

    void deliver(const DeliveryRequest &request, Done done) override
    {
        lastRequest = request;
        const Step step = m_script.at(qMin(calls, m_script.size() - 1));
        ++calls;

        if (step == Hang) {
            return;
        }

        TierOutcome outcome = makeOutcome();
        if (step == Miss) {
            outcome.error = QStringLiteral("no Claude panes");
            done(outcome);
            return;
        }

        if (step == Send && !transcript.isEmpty()) {
            QFile file(transcript);
            if (file.open(QIODevice::WriteOnly | QIODevice::Append)) {
                file.write("{\"type\":\"assistant\"}\n");
            }
        }

        TargetOutcome result;
        result.tier = name();
        result.target = QStringLiteral("main:0.0");
        result.success = true;
        outcome.results.append(result);
        outcome.success = true;
        done(outcome);

        if (step == SendThenThrow) {
            throw std::runtime_error("tier crashed after sending");
        }
        if (step == SendThenThrowUnknown) {
            throw 42;
        }
    }

    int calls = 0;
    QString transcript;
    DeliveryRequest lastRequest;

private:
    QList<Step> m_script;
};

// Queue, delivery chain and verifier around one coordinator
struct Harness {
    explicit Harness(const QList<ScriptedTier::Step> &script)
        : queue(dir.filePath(QStringLiteral("status.json")))
        , coordinator(&queue, &delivery, &verifier)
    {
        tier = new ScriptedTier(script);
        tier->transcript = dir.filePath(QStringLiteral("session.jsonl"));
        delivery.addTier(tier);
        delivery.setTierTimeout(10000);

        QFile file(tier->transcript);
        if (file.open(QIODevice::WriteOnly)) {
            file.write("{\"type\":\"user\"}\n");
        }

        ResumeConfig config;
        config.maxRetries = 2;
        config.retryBaseDelayMs = 10;
        config.retryMaxDelayMs = 40;
        config.verificationWindowMs = 150;
        config.verificationPollMs = 10;
        config.transcriptRoot = dir.path();
        config.deliveryWatchdogMs = 5000;
        coordinator.setConfig(config);
    }

    DetectionEvent queueEvent(bool withTranscript = true, int secondsAgo = 5)
    {
        Detection detection;
        detection.resetTime = isoTimestamp(QDateTime::currentDateTimeUtc().addSecs(-secondsAgo));
        detection.claudePid = 1234;
        if (withTranscript) {
            detection.transcriptPath = tier->transcript;
        }
        DetectionEvent added;
        queue.addDetection(detection, &added);
        return added;
    }

    QTemporaryDir dir;
    RateLimitQueue queue;
    TieredDelivery delivery;
    TranscriptVerifier verifier;
    ResumeCoordinator coordinator;
    ScriptedTier *tier = nullptr;
};

}

void ResumeCoordinatorTest::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
    qRegisterMetaType<DetectionEvent>();
    qRegisterMetaType<ResumeError>();
    qRegisterMetaType<VerificationResult>();
    qRegisterMetaType<ResumeCoordinator::State>();
}

void ResumeCoordinatorTest::testFlagRejectsSecondAttempt()
{
    Harness h({ScriptedTier::Hang});
    QVERIFY(h.dir.isValid());
    const DetectionEvent first = h.queueEvent();

    QVERIFY(!h.coordinator.isResumeInProgress());
    QVERIFY(h.coordinator.attemptResume(first));
    QVERIFY(h.coordinator.isResumeInProgress());
    QCOMPARE(h.coordinator.currentEvent().id, first.id);
    QCOMPARE(h.queue.entry(first.id).status, EventStatus::Active);

    // A second trigger while the first hangs is a no-op
    QVERIFY(!h.coordinator.attemptResume(first));
    QCOMPARE(h.tier->calls, 1);
    QCOMPARE(h.coordinator.currentEvent().id, first.id);
}

void ResumeCoordinatorTest::testInvalidEventRejected()
{
    Harness h({ScriptedTier::Send});
    QVERIFY(!h.coordinator.attemptResume(DetectionEvent()));
    QVERIFY(!h.coordinator.isResumeInProgress());
    QCOMPARE(h.tier->calls, 0);
}

void ResumeCoordinatorTest::testFlagMockable()
{
    Harness h({ScriptedTier::Send});
    const DetectionEvent event = h.queueEvent();

    h.coordinator.setResumeInProgress(true);
    QVERIFY(!h.coordinator.attemptResume(event));
    QCOMPARE(h.tier->calls, 0);

    h.coordinator.setResumeInProgress(false);
    QVERIFY(h.coordinator.attemptResume(event));
}

void ResumeCoordinatorTest::testDeliveredAndVerified()
{
    Harness h({ScriptedTier::Send});
    const DetectionEvent event = h.queueEvent();

    QSignalSpy deliveredSpy(&h.coordinator, &ResumeCoordinator::resumeDelivered);
    QSignalSpy verifiedSpy(&h.coordinator, &ResumeCoordinator::resumeVerified);
    QSignalSpy failedSpy(&h.coordinator, &ResumeCoordinator::resumeFailed);
    QSignalSpy finishedSpy(&h.coordinator, &ResumeCoordinator::attemptFinished);

    QVERIFY(h.coordinator.attemptResume(event));
    QCOMPARE(h.tier->lastRequest.sourcePid, qint64(1234));
    QCOMPARE(h.tier->lastRequest.resumeText, QStringLiteral("continue"));

    QTRY_COMPARE_WITH_TIMEOUT(finishedSpy.count(), 1, 3000);
    QCOMPARE(deliveredSpy.count(), 1);
    QCOMPARE(deliveredSpy.at(0).at(1).toString(), Tier::Tmux);
    QCOMPARE(deliveredSpy.at(0).at(2).toInt(), 1);
    QCOMPARE(verifiedSpy.count(), 1);
    QCOMPARE(failedSpy.count(), 0);

    QVERIFY(!h.coordinator.isResumeInProgress());
    QCOMPARE(h.coordinator.state(), ResumeCoordinator::State::Idle);
    QVERIFY(h.coordinator.lastVerification().verified);
    QCOMPARE(h.queue.entry(event.id).status, EventStatus::Completed);
    QVERIFY(!h.queue.entry(event.id).completedAt.isEmpty());
    QVERIFY(!h.coordinator.isSettled(event.id));
}

void ResumeCoordinatorTest::testCompletedBeforeVerification()
{
    Harness h({ScriptedTier::SendQuietly});
    const DetectionEvent event = h.queueEvent();

    EventStatus statusAtDelivery = EventStatus::Pending;
    connect(&h.coordinator, &ResumeCoordinator::resumeDelivered, this, [&h, &statusAtDelivery](const DetectionEvent &delivered) {
        statusAtDelivery = h.queue.entry(delivered.id).status;
    });
    QSignalSpy clearedSpy(&h.coordinator, &ResumeCoordinator::rateLimitCleared);

    QVERIFY(h.coordinator.attemptResume(event));

    // Delivery reported synchronously; verification still running
    QCOMPARE(h.coordinator.state(), ResumeCoordinator::State::Verifying);
    QCOMPARE(statusAtDelivery, EventStatus::Completed);
    QCOMPARE(clearedSpy.count(), 1);
    QVERIFY(h.queue.nextPending().id.isEmpty());
}

void ResumeCoordinatorTest::testDuplicateAfterCompletionIgnored()
{
    Harness h({ScriptedTier::Send});
    const DetectionEvent event = h.queueEvent();
    QSignalSpy finishedSpy(&h.coordinator, &ResumeCoordinator::attemptFinished);

    QVERIFY(h.coordinator.attemptResume(event));
    QTRY_COMPARE_WITH_TIMEOUT(finishedSpy.count(), 1, 3000);

    const QList<DetectionEvent> before = h.queue.entries();

    Detection duplicate;
    duplicate.resetTime = event.resetTime;
    QVERIFY(!h.queue.addDetection(duplicate));

    const QList<DetectionEvent> after = h.queue.entries();
    QCOMPARE(after.size(), before.size());
    QCOMPARE(after.first().status, EventStatus::Completed);
}

void ResumeCoordinatorTest::testCommitOfMissingEntryHeldBack()
{
    Harness h({ScriptedTier::Send});

    // Never written to the queue, so every status write fails
    Detection detection;
    detection.resetTime = isoTimestamp(QDateTime::currentDateTimeUtc().addSecs(-5));
    detection.transcriptPath = h.tier->transcript;
    const DetectionEvent event = DetectionEvent::create(detection);

    QSignalSpy clearedSpy(&h.coordinator, &ResumeCoordinator::rateLimitCleared);
    QSignalSpy failedSpy(&h.coordinator, &ResumeCoordinator::resumeFailed);
    QSignalSpy finishedSpy(&h.coordinator, &ResumeCoordinator::attemptFinished);

    QVERIFY(!h.coordinator.isSettled(event.id));
    QVERIFY(h.coordinator.attemptResume(event));
    QTRY_COMPARE_WITH_TIMEOUT(finishedSpy.count(), 1, 3000);

    QCOMPARE(h.tier->calls, 1);
    QCOMPARE(clearedSpy.count(), 1);
    QCOMPARE(failedSpy.count(), 0);
    QVERIFY(h.coordinator.isSettled(event.id));
    QVERIFY(!h.queue.entry(event.id).isValid());
}

void ResumeCoordinatorTest::testUnwritableQueueHeldBack()
{
    Harness h({ScriptedTier::Send});
    const DetectionEvent event = h.queueEvent();

    const QFile::Permissions permissions = QFile::permissions(h.dir.path());
    QVERIFY(QFile::setPermissions(h.dir.path(), QFile::ReadOwner | QFile::ExeOwner));
    QFile check(h.dir.filePath(QStringLiteral("write-check")));
    if (check.open(QIODevice::WriteOnly)) {
        check.close();
        QVERIFY(check.remove());
        QVERIFY(QFile::setPermissions(h.dir.path(), permissions));
        QSKIP("directory permissions are not enforced for this user");
    }

    ResumeScheduler scheduler(&h.queue);
    scheduler.setConfig(h.coordinator.config());
    scheduler.setSettledCheck([&h](const QString &eventId) {
        return h.coordinator.isSettled(eventId);
    });
    QSignalSpy firedSpy(&scheduler, &ResumeScheduler::fired);
    QSignalSpy finishedSpy(&h.coordinator, &ResumeCoordinator::attemptFinished);

    QVERIFY(h.coordinator.attemptResume(event));
    QTRY_COMPARE_WITH_TIMEOUT(finishedSpy.count(), 1, 3000);

    // Still live on disk, but not picked up again
    const bool live = h.queue.entry(event.id).isLive();
    scheduler.reevaluate();
    QVERIFY(QFile::setPermissions(h.dir.path(), permissions));

    QVERIFY(live);
    QVERIFY(h.coordinator.isSettled(event.id));
    QCOMPARE(firedSpy.count(), 0);
    QVERIFY(!scheduler.isArmed());
    QCOMPARE(h.tier->calls, 1);
}

void ResumeCoordinatorTest::testDeliveryFailureRetried()
{
    Harness h({ScriptedTier::Miss, ScriptedTier::Send});
    const DetectionEvent event = h.queueEvent();

    QSignalSpy deliveredSpy(&h.coordinator, &ResumeCoordinator::resumeDelivered);
    QSignalSpy failedSpy(&h.coordinator, &ResumeCoordinator::resumeFailed);
    QSignalSpy finishedSpy(&h.coordinator, &ResumeCoordinator::attemptFinished);

    QVERIFY(h.coordinator.attemptResume(event));

    // Waiting out the backoff still holds the flag
    QVERIFY(h.coordinator.isResumeInProgress());
    QCOMPARE(h.queue.entry(event.id).status, EventStatus::Active);

    QTRY_COMPARE_WITH_TIMEOUT(finishedSpy.count(), 1, 3000);
    QCOMPARE(h.tier->calls, 2);
    QCOMPARE(deliveredSpy.count(), 1);
    QCOMPARE(deliveredSpy.at(0).at(2).toInt(), 2);
    QCOMPARE(failedSpy.count(), 0);
    QCOMPARE(h.queue.entry(event.id).status, EventStatus::Completed);
}

void ResumeCoordinatorTest::testDeliveryRetriesExhausted()
{
    Harness h({ScriptedTier::Miss});
    const DetectionEvent event = h.queueEvent();

    QSignalSpy failedSpy(&h.coordinator, &ResumeCoordinator::resumeFailed);
    QSignalSpy finishedSpy(&h.coordinator, &ResumeCoordinator::attemptFinished);

    QVERIFY(h.coordinator.attemptResume(event));
    QTRY_COMPARE_WITH_TIMEOUT(finishedSpy.count(), 1, 3000);

    // One delivery plus maxRetries retries
    QCOMPARE(h.tier->calls, 3);
    QCOMPARE(failedSpy.count(), 1);
    QCOMPARE(failedSpy.at(0).at(1).value<ResumeError>(), ResumeError::RetryExhausted);
    QVERIFY(h.coordinator.lastDelivery().noTargets());

    const DetectionEvent stored = h.queue.entry(event.id);
    QCOMPARE(stored.status, EventStatus::Failed);
    QCOMPARE(stored.failureReason, QStringLiteral("delivery"));
    QVERIFY(!h.coordinator.isResumeInProgress());
}

void ResumeCoordinatorTest::testUnverifiedResumeRetried()
{
    Harness h({ScriptedTier::SendQuietly});
    const DetectionEvent event = h.queueEvent();

    QSignalSpy deliveredSpy(&h.coordinator, &ResumeCoordinator::resumeDelivered);
    QSignalSpy clearedSpy(&h.coordinator, &ResumeCoordinator::rateLimitCleared);
    QSignalSpy failedSpy(&h.coordinator, &ResumeCoordinator::resumeFailed);
    QSignalSpy finishedSpy(&h.coordinator, &ResumeCoordinator::attemptFinished);

    QVERIFY(h.coordinator.attemptResume(event));
    QTRY_COMPARE_WITH_TIMEOUT(finishedSpy.count(), 1, 5000);

    // Sent again after each silent window, without anyone asking
    QCOMPARE(h.tier->calls, 3);
    QCOMPARE(deliveredSpy.count(), 3);
    QCOMPARE(clearedSpy.count(), 1);

    QCOMPARE(failedSpy.count(), 1);
    QCOMPARE(failedSpy.at(0).at(1).value<ResumeError>(), ResumeError::RetryExhausted);
    QVERIFY(failedSpy.at(0).at(2).toString().contains(QStringLiteral("no transcript activity")));

    // Delivery already committed the entry
    QCOMPARE(h.queue.entry(event.id).status, EventStatus::Completed);
}

void ResumeCoordinatorTest::testNoTranscriptSkipsRetry()
{
    Harness h({ScriptedTier::SendQuietly});
    ResumeConfig config = h.coordinator.config();
    config.transcriptRoot = h.dir.filePath(QStringLiteral("no-such-dir"));
    h.coordinator.setConfig(config);

    const DetectionEvent event = h.queueEvent(false);
    QSignalSpy failedSpy(&h.coordinator, &ResumeCoordinator::resumeFailed);
    QSignalSpy finishedSpy(&h.coordinator, &ResumeCoordinator::attemptFinished);

    QVERIFY(h.coordinator.attemptResume(event));
    QCOMPARE(finishedSpy.count(), 1);
    QCOMPARE(h.tier->calls, 1);
    QCOMPARE(failedSpy.count(), 0);
    QCOMPARE(h.coordinator.lastVerification().method, QStringLiteral("none"));
    QCOMPARE(h.queue.entry(event.id).status, EventStatus::Completed);
}

void ResumeCoordinatorTest::testSettingsChangeDuringAttemptDeferred()
{
    Harness h({ScriptedTier::SendQuietly});
    const DetectionEvent event = h.queueEvent();
    QSignalSpy finishedSpy(&h.coordinator, &ResumeCoordinator::attemptFinished);

    QVERIFY(h.coordinator.attemptResume(event));
    QCOMPARE(h.coordinator.state(), ResumeCoordinator::State::Verifying);

    ResumeConfig changed = h.coordinator.config();
    changed.maxRetries = 0;
    changed.verificationWindowMs = 60000;
    h.coordinator.setConfig(changed);

    // The running attempt keeps its retry budget and window
    QCOMPARE(h.coordinator.config().maxRetries, 2);
    QCOMPARE(h.coordinator.retryPolicy().maxRetries(), 2);
    QTRY_COMPARE_WITH_TIMEOUT(finishedSpy.count(), 1, 5000);
    QCOMPARE(h.tier->calls, 3);

    // Applied once idle
    QCOMPARE(h.coordinator.config().maxRetries, 0);
    QCOMPARE(h.coordinator.config().verificationWindowMs, qint64(60000));
    QCOMPARE(h.coordinator.retryPolicy().maxRetries(), 0);
}

void ResumeCoordinatorTest::testExceptionReleasesFlag()
{
    Harness h({ScriptedTier::SendThenThrow});
    const DetectionEvent event = h.queueEvent();

    QSignalSpy failedSpy(&h.coordinator, &ResumeCoordinator::resumeFailed);
    QSignalSpy finishedSpy(&h.coordinator, &ResumeCoordinator::attemptFinished);

    QVERIFY(h.coordinator.attemptResume(event));

    QCOMPARE(finishedSpy.count(), 1);
    QCOMPARE(failedSpy.count(), 1);
    QCOMPARE(failedSpy.at(0).at(1).value<ResumeError>(), ResumeError::AttemptAborted);
    QVERIFY(!h.coordinator.isResumeInProgress());
    QVERIFY(!h.verifier.isRunning());

    // The keystrokes went out before the crash
    QCOMPARE(h.queue.entry(event.id).status, EventStatus::Completed);

    // Ready for the next one
    const DetectionEvent next = h.queueEvent(true, 30);
    QVERIFY(next.isValid());
    QVERIFY(h.coordinator.attemptResume(next));
}

void ResumeCoordinatorTest::testUnknownExceptionReleasesFlag()
{
    Harness h({ScriptedTier::SendThenThrowUnknown});
    const DetectionEvent event = h.queueEvent();

    QSignalSpy failedSpy(&h.coordinator, &ResumeCoordinator::resumeFailed);
    QSignalSpy finishedSpy(&h.coordinator, &ResumeCoordinator::attemptFinished);

    QVERIFY(h.coordinator.attemptResume(event));

    QCOMPARE(finishedSpy.count(), 1);
    QCOMPARE(failedSpy.count(), 1);
    QCOMPARE(failedSpy.at(0).at(1).value<ResumeError>(), ResumeError::AttemptAborted);
    QVERIFY(failedSpy.at(0).at(2).toString().contains(QStringLiteral("unknown exception")));
    QVERIFY(!h.coordinator.isResumeInProgress());
    QVERIFY(!h.verifier.isRunning());
    QCOMPARE(h.queue.entry(event.id).status, EventStatus::Completed);

    const DetectionEvent next = h.queueEvent(true, 30);
    QVERIFY(h.coordinator.attemptResume(next));
}

void ResumeCoordinatorTest::testWatchdogAbortsHungDelivery()
{
    Harness h({ScriptedTier::Hang});
    ResumeConfig config = h.coordinator.config();
    config.deliveryWatchdogMs = 100;
    h.coordinator.setConfig(config);

    const DetectionEvent event = h.queueEvent();
    QSignalSpy failedSpy(&h.coordinator, &ResumeCoordinator::resumeFailed);
    QSignalSpy finishedSpy(&h.coordinator, &ResumeCoordinator::attemptFinished);

    QVERIFY(h.coordinator.attemptResume(event));
    QTRY_COMPARE_WITH_TIMEOUT(finishedSpy.count(), 1, 3000);

    QCOMPARE(failedSpy.count(), 1);
    QCOMPARE(failedSpy.at(0).at(1).value<ResumeError>(), ResumeError::AttemptAborted);
    QVERIFY(!h.coordinator.isResumeInProgress());

    const DetectionEvent stored = h.queue.entry(event.id);
    QCOMPARE(stored.status, EventStatus::Failed);
    QCOMPARE(stored.failureReason, QStringLiteral("aborted"));
}

void ResumeCoordinatorTest::testStateNames()
{
    QCOMPARE(ResumeCoordinator::stateToString(ResumeCoordinator::State::Idle), QStringLiteral("idle"));
    QCOMPARE(ResumeCoordinator::stateToString(ResumeCoordinator::State::Verifying), QStringLiteral("verifying"));
    QCOMPARE(ResumeCoordinator::stateToString(ResumeCoordinator::State::Unverified), QStringLiteral("unverified"));
    QCOMPARE(ResumeCoordinator::stateToString(ResumeCoordinator::State::Failed), QStringLiteral("failed"));
}

QTEST_GUILESS_MAIN(ResumeCoordinatorTest)

#include "moc_ResumeCoordinatorTest.cpp"
