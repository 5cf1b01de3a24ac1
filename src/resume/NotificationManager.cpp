/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "NotificationManager.h"
#include "DetectionEvent.h"

#include <KLocalizedString>
#include <KNotification>

#include <QDebug>

namespace AutoResume
{

static NotificationManager *s_notificationManagerInstance = nullptr;

NotificationManager::NotificationManager(QObject *parent)
    : QObject(parent)
{
    if (!s_notificationManagerInstance) {
        s_notificationManagerInstance = this;
    }
}

NotificationManager::~NotificationManager()
{
    if (s_notificationManagerInstance == this) {
        s_notificationManagerInstance = nullptr;
    }
}

NotificationManager *NotificationManager::instance()
{
    return s_notificationManagerInstance;
}

void NotificationManager::notify(NotificationType type, const QString &title, const QString &message, Channels channels)
{
    // Apply enabled channel filter
    channels &= m_enabledChannels;
    if (channels == Channel::None) {
        return;
    }

    if (channels.testFlag(Channel::Log)) {
        qInfo().noquote() << "NotificationManager -" << eventName(type) << title << "-" << message;
    }

    if (channels.testFlag(Channel::Desktop)) {
        showDesktopNotification(type, title, message);
    }

    Q_EMIT notified(type, title, message);
}

void NotificationManager::notifyRateLimit(const QString &resetTime)
{
    const QDateTime reset = parseTimestamp(resetTime);
    const QString when = reset.isValid() ? reset.toLocalTime().toString(QStringLiteral("HH:mm")) : resetTime;
    notify(NotificationType::RateLimit, i18n("Claude rate limited"), i18n("Resuming automatically at %1", when));
}

void NotificationManager::notifyResume(const QString &sessionId)
{
    const QString message = sessionId.isEmpty() ? i18n("The session was resumed.") : i18n("Session %1 was resumed.", sessionId);
    notify(NotificationType::Resumed, i18n("Claude resumed"), message);
}

void NotificationManager::notifyResumeFailed(const QString &reason)
{
    notify(NotificationType::ResumeFailed, i18n("Automatic resume failed"), i18n("Could not resume the session: %1", reason));
}

void NotificationManager::showDesktopNotification(NotificationType type, const QString &title, const QString &message)
{
    KNotification *notification = new KNotification(eventName(type), KNotification::CloseOnTimeout);
    notification->setTitle(title);
    notification->setText(message);
    notification->setIconName(iconName(type));
    notification->setComponentName(QStringLiteral("autoresume"));
    if (type == NotificationType::ResumeFailed) {
        notification->setUrgency(KNotification::HighUrgency);
    }

    notification->sendEvent();
}

void NotificationManager::enableChannel(Channel channel, bool enable)
{
    if (enable) {
        m_enabledChannels |= channel;
    } else {
        m_enabledChannels &= ~Channels(channel);
    }
}

bool NotificationManager::isChannelEnabled(Channel channel) const
{
    return m_enabledChannels.testFlag(channel);
}

QString NotificationManager::eventName(NotificationType type)
{
    switch (type) {
    case NotificationType::RateLimit:
        return QStringLiteral("rateLimit");
    case NotificationType::Resumed:
        return QStringLiteral("resumed");
    case NotificationType::ResumeFailed:
        return QStringLiteral("resumeFailed");
    case NotificationType::Info:
    default:
        return QStringLiteral("info");
    }
}

QString NotificationManager::iconName(NotificationType type)
{
    switch (type) {
    case NotificationType::RateLimit:
        return QStringLiteral("chronometer");
    case NotificationType::Resumed:
        return QStringLiteral("dialog-ok");
    case NotificationType::ResumeFailed:
        return QStringLiteral("dialog-error");
    case NotificationType::Info:
    default:
        return QStringLiteral("dialog-information");
    }
}

} // namespace AutoResume

#include "moc_NotificationManager.cpp"
