/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef ANALYTICSCOLLECTORTEST_H
#define ANALYTICSCOLLECTORTEST_H

#include <QObject>

namespace AutoResume
{

class AnalyticsCollectorTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();

    // Recording
    void testRecordRateLimit();
    void testRecordResume();
    void testPersistsAcrossInstances();
    void testCorruptFileIgnored();

    // Statistics
    void testStatisticsPeriods();
    void testSuccessRateRounding();
    void testEmptyStatistics();

    // Prediction
    void testPredictionNoData();
    void testPredictionSingleEvent();
    void testPredictionRegularIntervals();
    void testPredictionIrregularIntervals();

    // Retention
    void testCleanup();
    void testRetentionClamped();
};

}

#endif // ANALYTICSCOLLECTORTEST_H
