/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef STATUSBRIDGETEST_H
#define STATUSBRIDGETEST_H

#include <QObject>

namespace AutoResume
{

class StatusBridgeTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();

    void testInitialSnapshot();
    void testRateLimitActiveAndCleared();
    void testClearWhenInactiveIsQuiet();
    void testArmedCountdown();
    void testCountdownNeverNegative();
    void testCoordinatorState();
    void testQueueCountsDeduplicated();
    void testEventEnvelope();
};

}

#endif // STATUSBRIDGETEST_H
