/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "NotificationManagerTest.h"

// Qt
#include <QDateTime>
#include <QSignalSpy>
#include <QStandardPaths>
#include <QTest>

// AutoResume
#include "../resume/DetectionEvent.h"
#include "../resume/NotificationManager.h"

using namespace AutoResume;

void NotificationManagerTest::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);

    // The singleton requires an explicit construction before instance() works.
    m_manager = new NotificationManager(this);
}

void NotificationManagerTest::cleanupTestCase()
{
    delete m_manager;
    m_manager = nullptr;
}

void NotificationManagerTest::init()
{
    // Keep popups out of the test session
    m_manager->setEnabledChannels(NotificationManager::Channel::Log);
}

void NotificationManagerTest::testInstance()
{
    QVERIFY(NotificationManager::instance() != nullptr);
    QCOMPARE(NotificationManager::instance(), m_manager);
}

void NotificationManagerTest::testInstanceConsistency()
{
    NotificationManager second;
    QCOMPARE(NotificationManager::instance(), m_manager);
}

void NotificationManagerTest::testDefaultChannels()
{
    NotificationManager manager;
    const NotificationManager::Channels channels = manager.enabledChannels();
    QVERIFY(channels.testFlag(NotificationManager::Channel::Desktop));
    QVERIFY(channels.testFlag(NotificationManager::Channel::Log));
}

void NotificationManagerTest::testEnableChannel()
{
    m_manager->setEnabledChannels(NotificationManager::Channel::None);
    m_manager->enableChannel(NotificationManager::Channel::Log, true);

    QVERIFY(m_manager->isChannelEnabled(NotificationManager::Channel::Log));
    QVERIFY(!m_manager->isChannelEnabled(NotificationManager::Channel::Desktop));
}

void NotificationManagerTest::testDisableChannel()
{
    m_manager->setEnabledChannels(NotificationManager::Channel::All);
    m_manager->enableChannel(NotificationManager::Channel::Desktop, false);

    QVERIFY(!m_manager->isChannelEnabled(NotificationManager::Channel::Desktop));
    QVERIFY(m_manager->isChannelEnabled(NotificationManager::Channel::Log));
}

void NotificationManagerTest::testDisabledChannelsSuppress()
{
    QSignalSpy spy(m_manager, &NotificationManager::notified);

    m_manager->setEnabledChannels(NotificationManager::Channel::None);
    m_manager->notify(NotificationManager::NotificationType::Info, QStringLiteral("Title"), QStringLiteral("Body"));
    QCOMPARE(spy.count(), 0);

    // Requesting only a disabled channel sends nothing either
    m_manager->setEnabledChannels(NotificationManager::Channel::Log);
    m_manager->notify(NotificationManager::NotificationType::Info,
                      QStringLiteral("Title"),
                      QStringLiteral("Body"),
                      NotificationManager::Channel::Desktop);
    QCOMPARE(spy.count(), 0);

    m_manager->notify(NotificationManager::NotificationType::Info, QStringLiteral("Title"), QStringLiteral("Body"));
    QCOMPARE(spy.count(), 1);
}

void NotificationManagerTest::testRateLimitMessage()
{
    QSignalSpy spy(m_manager, &NotificationManager::notified);

    const QDateTime reset = QDateTime::currentDateTimeUtc().addSecs(3600);
    m_manager->notifyRateLimit(isoTimestamp(reset));

    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(0).value<NotificationManager::NotificationType>(), NotificationManager::NotificationType::RateLimit);
    const QString message = spy.at(0).at(2).toString();
    QVERIFY(message.contains(reset.toLocalTime().toString(QStringLiteral("HH:mm"))));
}

void NotificationManagerTest::testRateLimitUnparsableTime()
{
    QSignalSpy spy(m_manager, &NotificationManager::notified);

    m_manager->notifyRateLimit(QStringLiteral("soon"));

    QCOMPARE(spy.count(), 1);
    QVERIFY(spy.at(0).at(2).toString().contains(QStringLiteral("soon")));
}

void NotificationManagerTest::testResumeMessage()
{
    QSignalSpy spy(m_manager, &NotificationManager::notified);

    m_manager->notifyResume(QStringLiteral("main:0.0"));
    m_manager->notifyResume();

    QCOMPARE(spy.count(), 2);
    QCOMPARE(spy.at(0).at(0).value<NotificationManager::NotificationType>(), NotificationManager::NotificationType::Resumed);
    QVERIFY(spy.at(0).at(2).toString().contains(QStringLiteral("main:0.0")));
    QVERIFY(!spy.at(1).at(2).toString().isEmpty());
}

void NotificationManagerTest::testResumeFailedMessage()
{
    QSignalSpy spy(m_manager, &NotificationManager::notified);

    m_manager->notifyResumeFailed(QStringLiteral("no transcript activity"));

    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(0).value<NotificationManager::NotificationType>(), NotificationManager::NotificationType::ResumeFailed);
    QVERIFY(spy.at(0).at(2).toString().contains(QStringLiteral("no transcript activity")));
}

void NotificationManagerTest::testEventNames()
{
    // Must match the [Event/...] groups of autoresume.notifyrc
    QCOMPARE(NotificationManager::eventName(NotificationManager::NotificationType::RateLimit), QStringLiteral("rateLimit"));
    QCOMPARE(NotificationManager::eventName(NotificationManager::NotificationType::Resumed), QStringLiteral("resumed"));
    QCOMPARE(NotificationManager::eventName(NotificationManager::NotificationType::ResumeFailed), QStringLiteral("resumeFailed"));
    QCOMPARE(NotificationManager::eventName(NotificationManager::NotificationType::Info), QStringLiteral("info"));
}

void NotificationManagerTest::testIconNames()
{
    QVERIFY(!NotificationManager::iconName(NotificationManager::NotificationType::Info).isEmpty());
    QCOMPARE(NotificationManager::iconName(NotificationManager::NotificationType::ResumeFailed), QStringLiteral("dialog-error"));
}

QTEST_GUILESS_MAIN(NotificationManagerTest)

#include "moc_NotificationManagerTest.cpp"
