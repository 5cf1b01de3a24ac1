/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef NOTIFICATIONMANAGER_H
#define NOTIFICATIONMANAGER_H

#include "autoresume_export.h"
#include <QObject>
#include <QString>

namespace AutoResume
{

/**
 * NotificationManager tells the user what the daemon is doing.
 *
 * Two channels:
 * 1. Desktop Popup - KNotification framework (autoresume.notifyrc)
 * 2. Log - a line in the daemon log
 *
 * Notification types:
 * - Rate limit detected, with the reset time
 * - Session resumed
 * - Resume failed after all retries
 * - Info
 *
 * Sending is fire-and-forget; nothing here reports failure back.
 */
class AUTORESUME_EXPORT NotificationManager : public QObject
{
    Q_OBJECT

public:
    /**
     * Notification type/priority
     */
    enum class NotificationType {
        Info,
        RateLimit,
        Resumed,
        ResumeFailed
    };
    Q_ENUM(NotificationType)

    /**
     * Notification channel flags
     */
    enum class Channel {
        None = 0,
        Desktop = 1 << 0,
        Log = 1 << 1,
        All = Desktop | Log
    };
    Q_DECLARE_FLAGS(Channels, Channel)
    Q_FLAG(Channels)

    explicit NotificationManager(QObject *parent = nullptr);
    ~NotificationManager() override;

    /**
     * Get the singleton instance
     */
    static NotificationManager *instance();

    void notify(NotificationType type, const QString &title, const QString &message, Channels channels = Channel::All);

    /**
     * "Rate limit detected, resuming at HH:mm"
     */
    void notifyRateLimit(const QString &resetTime);

    /**
     * sessionId is whatever identifies the resumed session to the user
     * (tmux pane, event id); may be empty
     */
    void notifyResume(const QString &sessionId = QString());

    void notifyResumeFailed(const QString &reason);

    void showDesktopNotification(NotificationType type, const QString &title, const QString &message);

    /**
     * Get/set enabled channels
     */
    Channels enabledChannels() const { return m_enabledChannels; }
    void setEnabledChannels(Channels channels) { m_enabledChannels = channels; }

    /**
     * Enable/disable specific channel
     */
    void enableChannel(Channel channel, bool enable = true);
    bool isChannelEnabled(Channel channel) const;

    /**
     * Event id in autoresume.notifyrc
     */
    static QString eventName(NotificationType type);

    /**
     * Get icon name for notification type
     */
    static QString iconName(NotificationType type);

Q_SIGNALS:
    /**
     * Emitted for every notification that passed the channel filter
     */
    void notified(AutoResume::NotificationManager::NotificationType type, const QString &title, const QString &message);

private:
    Channels m_enabledChannels = Channel::All;
};

Q_DECLARE_OPERATORS_FOR_FLAGS(NotificationManager::Channels)

} // namespace AutoResume

#endif // NOTIFICATIONMANAGER_H
