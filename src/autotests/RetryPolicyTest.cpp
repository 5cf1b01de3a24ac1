/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "RetryPolicyTest.h"

// Qt
#include <QTest>

// AutoResume
#include "../resume/RetryPolicy.h"

using namespace AutoResume;

void RetryPolicyTest::testDefaults()
{
    RetryPolicy policy;
    QCOMPARE(policy.maxRetries(), 4);
    QCOMPARE(policy.baseDelayMs(), qint64(5000));
    QCOMPARE(policy.maxDelayMs(), qint64(300000));
}

void RetryPolicyTest::testBackoffDoubles_data()
{
    QTest::addColumn<int>("retry");
    QTest::addColumn<qint64>("expected");

    QTest::newRow("first") << 0 << qint64(1000);
    QTest::newRow("second") << 1 << qint64(2000);
    QTest::newRow("third") << 2 << qint64(4000);
    QTest::newRow("fourth") << 3 << qint64(8000);
    QTest::newRow("capped") << 4 << qint64(10000);
    QTest::newRow("far past cap") << 40 << qint64(10000);
}

void RetryPolicyTest::testBackoffDoubles()
{
    QFETCH(int, retry);
    QFETCH(qint64, expected);

    RetryPolicy policy(10, 1000, 10000);
    QCOMPARE(policy.nextDelayMs(retry), expected);
}

void RetryPolicyTest::testBudgetExhausted()
{
    RetryPolicy policy(3, 100, 1000);
    const QString id = QStringLiteral("evt-1");

    QCOMPARE(policy.recordRetry(id), qint64(100));
    QCOMPARE(policy.recordRetry(id), qint64(200));
    QCOMPARE(policy.recordRetry(id), qint64(400));
    QCOMPARE(policy.retries(id), 3);

    QCOMPARE(policy.recordRetry(id), qint64(-1));
    QCOMPARE(policy.retries(id), 3);
    QVERIFY(!policy.shouldRetry(policy.retries(id)));
}

void RetryPolicyTest::testCountsArePerEvent()
{
    RetryPolicy policy(2, 100, 1000);

    QCOMPARE(policy.recordRetry(QStringLiteral("a")), qint64(100));
    QCOMPARE(policy.recordRetry(QStringLiteral("a")), qint64(200));
    QCOMPARE(policy.recordRetry(QStringLiteral("b")), qint64(100));

    QCOMPARE(policy.retries(QStringLiteral("a")), 2);
    QCOMPARE(policy.retries(QStringLiteral("b")), 1);
    QCOMPARE(policy.retries(QStringLiteral("unknown")), 0);
}

void RetryPolicyTest::testReset()
{
    RetryPolicy policy(1, 100, 1000);

    QCOMPARE(policy.recordRetry(QStringLiteral("a")), qint64(100));
    QCOMPARE(policy.recordRetry(QStringLiteral("a")), qint64(-1));

    policy.reset(QStringLiteral("a"));
    QCOMPARE(policy.retries(QStringLiteral("a")), 0);
    QCOMPARE(policy.recordRetry(QStringLiteral("a")), qint64(100));

    QCOMPARE(policy.recordRetry(QStringLiteral("b")), qint64(100));
    policy.clear();
    QCOMPARE(policy.retries(QStringLiteral("a")), 0);
    QCOMPARE(policy.retries(QStringLiteral("b")), 0);
}

void RetryPolicyTest::testZeroRetries()
{
    RetryPolicy policy(0, 100, 1000);
    QVERIFY(!policy.shouldRetry(0));
    QCOMPARE(policy.recordRetry(QStringLiteral("a")), qint64(-1));
}

void RetryPolicyTest::testNegativeArgumentsClamped()
{
    RetryPolicy policy(-3, -100, -1);
    QCOMPARE(policy.maxRetries(), 0);
    QCOMPARE(policy.baseDelayMs(), qint64(0));
    QCOMPARE(policy.maxDelayMs(), qint64(0));
    QCOMPARE(policy.nextDelayMs(5), qint64(0));
}

QTEST_GUILESS_MAIN(RetryPolicyTest)

#include "moc_RetryPolicyTest.cpp"
