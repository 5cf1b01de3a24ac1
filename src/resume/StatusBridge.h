/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef STATUSBRIDGE_H
#define STATUSBRIDGE_H

#include "autoresume_export.h"

#include <QDateTime>
#include <QJsonObject>
#include <QObject>
#include <QString>

namespace AutoResume
{

class DetectionEvent;

/**
 * StatusBridge keeps the externally visible picture of the daemon and
 * broadcasts it to observers (control socket subscribers).
 *
 * It is display only: nothing flows from here back into the resume core.
 */
class AUTORESUME_EXPORT StatusBridge : public QObject
{
    Q_OBJECT

public:
    explicit StatusBridge(QObject *parent = nullptr);
    ~StatusBridge() override;

    /**
     * Current status as sent to clients; countdown is computed against now
     */
    QJsonObject statusSnapshot(const QDateTime &now = QDateTime::currentDateTimeUtc()) const;

    bool isRateLimitActive() const;
    QString coordinatorState() const;

public Q_SLOTS:
    void setDaemonState(const QString &state);
    void setCoordinatorState(const QString &state, const QString &eventId);
    void setRateLimitActive(const AutoResume::DetectionEvent &event);
    void clearRateLimit();
    void setArmed(const AutoResume::DetectionEvent &event, const QDateTime &fireAt);
    void clearArmed();
    void setQueueCounts(int pending, int total);

    void broadcastStatus();
    void broadcastEvent(const QString &type, const QJsonObject &data = QJsonObject());

Q_SIGNALS:
    void statusBroadcast(const QJsonObject &status);
    void eventBroadcast(const QJsonObject &event);

private:
    QString m_daemonState = QStringLiteral("starting");
    QString m_coordinatorState = QStringLiteral("idle");
    QString m_currentEventId;
    bool m_rateLimitActive = false;
    QString m_resetTime;
    QString m_message;
    QString m_armedEventId;
    QDateTime m_fireAt;
    int m_pending = 0;
    int m_total = 0;
    QDateTime m_startedAt;
};

} // namespace AutoResume

#endif // STATUSBRIDGE_H
