/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "ResumeSchedulerTest.h"

// Qt
#include <QSignalSpy>
#include <QStandardPaths>
#include <QTest>

// AutoResume
#include "../resume/RateLimitQueue.h"
#include "../resume/ResumeScheduler.h"

using namespace AutoResume;

static DetectionEvent addAt(RateLimitQueue &queue, const QDateTime &reset)
{
    Detection detection;
    detection.resetTime = isoTimestamp(reset);
    DetectionEvent added;
    queue.addDetection(detection, &added);
    return added;
}

static ResumeConfig quickConfig()
{
    ResumeConfig config;
    config.postResetDelayMs = 0;
    return config;
}

void ResumeSchedulerTest::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
    qRegisterMetaType<DetectionEvent>();
    QVERIFY(m_tempDir.isValid());
}

void ResumeSchedulerTest::init()
{
    ++m_counter;
}

QString ResumeSchedulerTest::queueFile() const
{
    return m_tempDir.path() + QStringLiteral("/status-%1.json").arg(m_counter);
}

void ResumeSchedulerTest::testComputeFireAt()
{
    DetectionEvent event;
    event.resetTime = QStringLiteral("2026-03-01T10:00:00.000Z");

    const QDateTime fireAt = ResumeScheduler::computeFireAt(event, 10 * 1000);
    QCOMPARE(fireAt, parseTimestamp(event.resetTime).addSecs(10));

    event.resetTime = QStringLiteral("soon");
    QVERIFY(!ResumeScheduler::computeFireAt(event, 0).isValid());
}

void ResumeSchedulerTest::testFiresImmediatelyWhenResetPassed()
{
    RateLimitQueue queue(queueFile());
    const DetectionEvent event = addAt(queue, QDateTime::currentDateTimeUtc().addSecs(-30));

    ResumeScheduler scheduler(&queue);
    scheduler.setConfig(quickConfig());
    QSignalSpy firedSpy(&scheduler, &ResumeScheduler::fired);

    scheduler.reevaluate();

    QCOMPARE(firedSpy.count(), 1);
    QCOMPARE(firedSpy.first().first().value<DetectionEvent>().id, event.id);
    QVERIFY(!scheduler.isArmed());
}

void ResumeSchedulerTest::testArmsForFutureReset()
{
    RateLimitQueue queue(queueFile());
    const DetectionEvent event = addAt(queue, QDateTime::currentDateTimeUtc().addSecs(3600));

    ResumeScheduler scheduler(&queue);
    ResumeConfig config = quickConfig();
    config.postResetDelayMs = 10 * 1000;
    scheduler.setConfig(config);
    QSignalSpy armedSpy(&scheduler, &ResumeScheduler::armed);
    QSignalSpy firedSpy(&scheduler, &ResumeScheduler::fired);

    scheduler.reevaluate();

    QCOMPARE(armedSpy.count(), 1);
    QCOMPARE(firedSpy.count(), 0);
    QVERIFY(scheduler.isArmed());
    QCOMPARE(scheduler.armedEvent().id, event.id);
    QCOMPARE(scheduler.fireAt(), event.resetDateTime().addSecs(10));
    QVERIFY(scheduler.remainingMs() > 3600 * 1000 - 5000);
    QCOMPARE(queue.entry(event.id).status, EventStatus::Waiting);

    // Re-evaluating with nothing new keeps the same countdown
    scheduler.reevaluate();
    QCOMPARE(armedSpy.count(), 1);
}

void ResumeSchedulerTest::testFiresWhenTimerElapses()
{
    RateLimitQueue queue(queueFile());
    const DetectionEvent event = addAt(queue, QDateTime::currentDateTimeUtc().addMSecs(200));

    ResumeScheduler scheduler(&queue);
    ResumeConfig config = quickConfig();
    config.postResetDelayMs = 100;
    scheduler.setConfig(config);
    QSignalSpy firedSpy(&scheduler, &ResumeScheduler::fired);

    scheduler.reevaluate();
    QVERIFY(scheduler.isArmed());

    QTRY_COMPARE_WITH_TIMEOUT(firedSpy.count(), 1, 5000);
    const DetectionEvent fired = firedSpy.first().first().value<DetectionEvent>();
    QCOMPARE(fired.id, event.id);
    QCOMPARE(fired.status, EventStatus::Waiting);
    QVERIFY(!scheduler.isArmed());
}

void ResumeSchedulerTest::testStaleEntryDropped()
{
    RateLimitQueue queue(queueFile());
    const DetectionEvent stale = addAt(queue, QDateTime::currentDateTimeUtc().addSecs(-3 * 3600));

    ResumeScheduler scheduler(&queue);
    scheduler.setConfig(quickConfig());
    QSignalSpy staleSpy(&scheduler, &ResumeScheduler::staleDropped);
    QSignalSpy firedSpy(&scheduler, &ResumeScheduler::fired);

    scheduler.reevaluate();

    QCOMPARE(staleSpy.count(), 1);
    QCOMPARE(firedSpy.count(), 0);
    QVERIFY(!scheduler.isArmed());

    const DetectionEvent entry = queue.entry(stale.id);
    QCOMPARE(entry.status, EventStatus::Failed);
    QCOMPARE(entry.failureReason, QStringLiteral("stale"));
}

void ResumeSchedulerTest::testBusyDoesNotArm()
{
    RateLimitQueue queue(queueFile());
    addAt(queue, QDateTime::currentDateTimeUtc().addSecs(-10));

    bool busy = true;
    ResumeScheduler scheduler(&queue);
    scheduler.setConfig(quickConfig());
    scheduler.setBusyCheck([&busy]() {
        return busy;
    });
    QSignalSpy firedSpy(&scheduler, &ResumeScheduler::fired);
    QSignalSpy armedSpy(&scheduler, &ResumeScheduler::armed);

    scheduler.reevaluate();
    QCOMPARE(firedSpy.count(), 0);
    QCOMPARE(armedSpy.count(), 0);

    // Re-check after the in-flight attempt is done
    busy = false;
    scheduler.reevaluate();
    QCOMPARE(firedSpy.count(), 1);
}

void ResumeSchedulerTest::testEarlierDetectionReplacesArmed()
{
    RateLimitQueue queue(queueFile());
    const QDateTime now = QDateTime::currentDateTimeUtc();
    const DetectionEvent later = addAt(queue, now.addSecs(2 * 3600));

    ResumeScheduler scheduler(&queue);
    scheduler.setConfig(quickConfig());
    QSignalSpy cancelledSpy(&scheduler, &ResumeScheduler::cancelled);
    QSignalSpy armedSpy(&scheduler, &ResumeScheduler::armed);

    scheduler.reevaluate();
    QCOMPARE(scheduler.armedEvent().id, later.id);

    const DetectionEvent earlier = addAt(queue, now.addSecs(3600));
    scheduler.reevaluate();

    QCOMPARE(cancelledSpy.count(), 1);
    QCOMPARE(cancelledSpy.first().first().toString(), later.id);
    QCOMPARE(armedSpy.count(), 2);
    QCOMPARE(scheduler.armedEvent().id, earlier.id);
}

void ResumeSchedulerTest::testBusyAtFireTimeDefers()
{
    RateLimitQueue queue(queueFile());
    addAt(queue, QDateTime::currentDateTimeUtc().addMSecs(150));

    bool busy = false;
    ResumeScheduler scheduler(&queue);
    scheduler.setConfig(quickConfig());
    scheduler.setBusyCheck([&busy]() {
        return busy;
    });
    QSignalSpy firedSpy(&scheduler, &ResumeScheduler::fired);

    scheduler.reevaluate();
    QVERIFY(scheduler.isArmed());

    busy = true;
    QTRY_VERIFY_WITH_TIMEOUT(!scheduler.isArmed(), 5000);
    QCOMPARE(firedSpy.count(), 0);

    busy = false;
    scheduler.reevaluate();
    QCOMPARE(firedSpy.count(), 1);
}

void ResumeSchedulerTest::testEntryResetWhileArmedDoesNotFire()
{
    RateLimitQueue queue(queueFile());
    const DetectionEvent event = addAt(queue, QDateTime::currentDateTimeUtc().addMSecs(150));

    ResumeScheduler scheduler(&queue);
    scheduler.setConfig(quickConfig());
    QSignalSpy firedSpy(&scheduler, &ResumeScheduler::fired);

    scheduler.reevaluate();
    QVERIFY(scheduler.isArmed());

    QVERIFY(queue.markFailed(event.id, QStringLiteral("stale")));

    QTRY_VERIFY_WITH_TIMEOUT(!scheduler.isArmed(), 5000);
    QTest::qWait(100);
    QCOMPARE(firedSpy.count(), 0);
}

void ResumeSchedulerTest::testCancel()
{
    RateLimitQueue queue(queueFile());
    addAt(queue, QDateTime::currentDateTimeUtc().addSecs(3600));

    ResumeScheduler scheduler(&queue);
    scheduler.setConfig(quickConfig());
    QSignalSpy cancelledSpy(&scheduler, &ResumeScheduler::cancelled);

    scheduler.cancel();
    QCOMPARE(cancelledSpy.count(), 0);

    scheduler.reevaluate();
    scheduler.cancel();
    QCOMPARE(cancelledSpy.count(), 1);
    QVERIFY(!scheduler.isArmed());
    QCOMPARE(scheduler.remainingMs(), qint64(0));
}

void ResumeSchedulerTest::testSettledEventSkipped()
{
    RateLimitQueue queue(queueFile());
    const DetectionEvent settled = addAt(queue, QDateTime::currentDateTimeUtc().addSecs(-60));
    const DetectionEvent later = addAt(queue, QDateTime::currentDateTimeUtc().addSecs(-30));

    ResumeScheduler scheduler(&queue);
    scheduler.setConfig(quickConfig());
    scheduler.setSettledCheck([&settled](const QString &eventId) {
        return eventId == settled.id;
    });
    QSignalSpy firedSpy(&scheduler, &ResumeScheduler::fired);

    // The queue still lists it live, but it is never fired again
    scheduler.reevaluate();
    QCOMPARE(firedSpy.count(), 1);
    QCOMPARE(firedSpy.first().first().value<DetectionEvent>().id, later.id);
    QVERIFY(queue.entry(settled.id).isLive());

    QVERIFY(queue.updateEntryStatus(later.id, EventStatus::Completed));
    scheduler.reevaluate();
    QCOMPARE(firedSpy.count(), 1);
    QVERIFY(!scheduler.isArmed());
}

QTEST_GUILESS_MAIN(ResumeSchedulerTest)

#include "moc_ResumeSchedulerTest.cpp"
