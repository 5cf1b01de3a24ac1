/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef ANALYTICSCOLLECTOR_H
#define ANALYTICSCOLLECTOR_H

#include "autoresume_export.h"

#include <QDateTime>
#include <QJsonArray>
#include <QJsonObject>
#include <QObject>
#include <QString>

namespace AutoResume
{

class DetectionEvent;

/**
 * AnalyticsCollector keeps a history of rate limits and resumes in
 * analytics.json and derives statistics from it.
 *
 * Recording never fails from the caller's point of view: a write error is
 * logged and the record stays in memory until the next successful save.
 */
class AUTORESUME_EXPORT AnalyticsCollector : public QObject
{
    Q_OBJECT

public:
    explicit AnalyticsCollector(const QString &filePath = QString(), QObject *parent = nullptr);
    ~AnalyticsCollector() override;

    static QString defaultFilePath();
    QString filePath() const
    {
        return m_filePath;
    }

    int retentionDays() const;
    void setRetentionDays(int days);

    void recordRateLimit(const DetectionEvent &event, const QDateTime &when = QDateTime::currentDateTimeUtc());
    void recordResume(const DetectionEvent &event, bool success, const QString &tier = QString(), const QDateTime &when = QDateTime::currentDateTimeUtc());

    int rateLimitCount() const;
    int resumeCount() const;
    int successfulResumeCount() const;

    /**
     * { last7Days, last30Days, allTime } with counts and success rate
     */
    QJsonObject statistics(const QDateTime &now = QDateTime::currentDateTimeUtc()) const;

    /**
     * Guess at the next rate limit from the average interval between the
     * last week's rate limits. confidence is none/low/medium/high.
     */
    QJsonObject prediction(const QDateTime &now = QDateTime::currentDateTimeUtc()) const;

    /**
     * Drop records older than the retention period; returns how many
     */
    int cleanup(const QDateTime &now = QDateTime::currentDateTimeUtc());

    void load();
    bool save();

Q_SIGNALS:
    void recorded();

private:
    QJsonObject periodStats(qint64 sinceMs) const;

    QString m_filePath;
    int m_retentionDays = 30;
    QJsonArray m_rateLimits;
    QJsonArray m_resumes;
};

} // namespace AutoResume

#endif // ANALYTICSCOLLECTOR_H
