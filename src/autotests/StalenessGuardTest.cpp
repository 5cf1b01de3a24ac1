/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "StalenessGuardTest.h"

// Qt
#include <QTest>
#include <QTimeZone>

// AutoResume
#include "../resume/DetectionEvent.h"
#include "../resume/StalenessGuard.h"

using namespace AutoResume;

static const qint64 Hour = 60 * 60 * 1000;

static QDateTime fixedNow()
{
    return QDateTime(QDate(2026, 3, 1), QTime(12, 0), QTimeZone::UTC);
}

void StalenessGuardTest::testIsStale_data()
{
    QTest::addColumn<QString>("resetTime");
    QTest::addColumn<bool>("stale");

    const QDateTime now = fixedNow();
    QTest::newRow("future") << isoTimestamp(now.addSecs(3600)) << false;
    QTest::newRow("now") << isoTimestamp(now) << false;
    QTest::newRow("one hour ago") << isoTimestamp(now.addSecs(-3600)) << false;
    QTest::newRow("three hours ago") << isoTimestamp(now.addSecs(-3 * 3600)) << true;
    QTest::newRow("last week") << isoTimestamp(now.addDays(-7)) << true;
    QTest::newRow("empty") << QString() << true;
    QTest::newRow("garbage") << QStringLiteral("7pm Europe/Berlin") << true;
}

void StalenessGuardTest::testIsStale()
{
    QFETCH(QString, resetTime);
    QFETCH(bool, stale);

    QCOMPARE(isResetTimeStale(resetTime, 2 * Hour, fixedNow()), stale);
}

void StalenessGuardTest::testExactThresholdIsStale()
{
    const QDateTime now = fixedNow();
    QVERIFY(isResetTimeStale(isoTimestamp(now.addMSecs(-2 * Hour)), 2 * Hour, now));
}

void StalenessGuardTest::testJustInsideThreshold()
{
    const QDateTime now = fixedNow();
    QVERIFY(!isResetTimeStale(isoTimestamp(now.addMSecs(-2 * Hour + 1)), 2 * Hour, now));
}

void StalenessGuardTest::testDefaultThreshold()
{
    QCOMPARE(DefaultStaleThresholdMs, 2 * Hour);

    const QDateTime now = QDateTime::currentDateTimeUtc();
    QVERIFY(!isResetTimeStale(isoTimestamp(now.addSecs(-60))));
    QVERIFY(isResetTimeStale(isoTimestamp(now.addSecs(-3 * 3600))));
}

QTEST_GUILESS_MAIN(StalenessGuardTest)

#include "moc_StalenessGuardTest.cpp"
