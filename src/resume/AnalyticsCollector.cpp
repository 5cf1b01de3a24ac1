/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "AnalyticsCollector.h"
#include "AutoResumeSettings.h"
#include "DetectionEvent.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QSaveFile>

#include <algorithm>
#include <cmath>

namespace AutoResume
{

namespace
{
constexpr qint64 DayMs = 24LL * 60 * 60 * 1000;

qint64 timestampOf(const QJsonValue &record)
{
    return static_cast<qint64>(record.toObject().value(QStringLiteral("timestamp")).toDouble());
}
}

AnalyticsCollector::AnalyticsCollector(const QString &filePath, QObject *parent)
    : QObject(parent)
    , m_filePath(filePath.isEmpty() ? defaultFilePath() : filePath)
{
    load();
}

AnalyticsCollector::~AnalyticsCollector() = default;

QString AnalyticsCollector::defaultFilePath()
{
    return AutoResumeSettings::dataDirectory() + QStringLiteral("/analytics.json");
}

int AnalyticsCollector::retentionDays() const
{
    return m_retentionDays;
}

void AnalyticsCollector::setRetentionDays(int days)
{
    m_retentionDays = qBound(1, days, 365);
}

void AnalyticsCollector::recordRateLimit(const DetectionEvent &event, const QDateTime &when)
{
    QJsonObject record;
    const qint64 timestamp = when.toMSecsSinceEpoch();
    record[QStringLiteral("timestamp")] = static_cast<double>(timestamp);
    record[QStringLiteral("session")] = event.id.isEmpty() ? QStringLiteral("default") : event.id;

    const QDateTime reset = event.resetDateTime();
    if (reset.isValid()) {
        record[QStringLiteral("resetTime")] = static_cast<double>(reset.toMSecsSinceEpoch());
        record[QStringLiteral("duration")] = static_cast<double>(reset.toMSecsSinceEpoch() - timestamp);
    } else {
        record[QStringLiteral("resetTime")] = QJsonValue::Null;
        record[QStringLiteral("duration")] = QJsonValue::Null;
    }

    m_rateLimits.append(record);
    save();
    Q_EMIT recorded();
}

void AnalyticsCollector::recordResume(const DetectionEvent &event, bool success, const QString &tier, const QDateTime &when)
{
    QJsonObject record;
    record[QStringLiteral("timestamp")] = static_cast<double>(when.toMSecsSinceEpoch());
    record[QStringLiteral("session")] = event.id.isEmpty() ? QStringLiteral("default") : event.id;
    record[QStringLiteral("success")] = success;
    if (!tier.isEmpty()) {
        record[QStringLiteral("tier")] = tier;
    }

    m_resumes.append(record);
    save();
    Q_EMIT recorded();
}

int AnalyticsCollector::rateLimitCount() const
{
    return m_rateLimits.size();
}

int AnalyticsCollector::resumeCount() const
{
    return m_resumes.size();
}

int AnalyticsCollector::successfulResumeCount() const
{
    int count = 0;
    for (const QJsonValue &value : m_resumes) {
        if (value.toObject().value(QStringLiteral("success")).toBool()) {
            ++count;
        }
    }
    return count;
}

QJsonObject AnalyticsCollector::periodStats(qint64 sinceMs) const
{
    int rateLimits = 0;
    for (const QJsonValue &value : m_rateLimits) {
        if (timestampOf(value) >= sinceMs) {
            ++rateLimits;
        }
    }

    int resumes = 0;
    int successful = 0;
    for (const QJsonValue &value : m_resumes) {
        if (timestampOf(value) < sinceMs) {
            continue;
        }
        ++resumes;
        if (value.toObject().value(QStringLiteral("success")).toBool()) {
            ++successful;
        }
    }

    QJsonObject stats;
    stats[QStringLiteral("rateLimitCount")] = rateLimits;
    stats[QStringLiteral("resumeCount")] = resumes;
    stats[QStringLiteral("successfulResumes")] = successful;
    stats[QStringLiteral("successRate")] = resumes > 0 ? std::round(1000.0 * successful / resumes) / 10.0 : 0.0;
    return stats;
}

QJsonObject AnalyticsCollector::statistics(const QDateTime &now) const
{
    const qint64 nowMs = now.toMSecsSinceEpoch();

    QJsonObject allTime = periodStats(0);
    qint64 oldest = 0;
    for (const QJsonValue &value : m_rateLimits) {
        const qint64 ts = timestampOf(value);
        if (oldest == 0 || ts < oldest) {
            oldest = ts;
        }
    }
    allTime[QStringLiteral("oldestRecord")] = oldest > 0 ? QJsonValue(isoTimestamp(QDateTime::fromMSecsSinceEpoch(oldest).toUTC())) : QJsonValue();

    QJsonObject stats;
    stats[QStringLiteral("last7Days")] = periodStats(nowMs - 7 * DayMs);
    stats[QStringLiteral("last30Days")] = periodStats(nowMs - 30 * DayMs);
    stats[QStringLiteral("allTime")] = allTime;
    return stats;
}

QJsonObject AnalyticsCollector::prediction(const QDateTime &now) const
{
    const qint64 nowMs = now.toMSecsSinceEpoch();

    QList<qint64> recent;
    for (const QJsonValue &value : m_rateLimits) {
        const qint64 ts = timestampOf(value);
        if (ts >= nowMs - 7 * DayMs) {
            recent.append(ts);
        }
    }
    std::sort(recent.begin(), recent.end());

    QJsonObject result;
    result[QStringLiteral("nextPredictedTime")] = QJsonValue::Null;

    if (recent.isEmpty()) {
        result[QStringLiteral("confidence")] = QStringLiteral("none");
        result[QStringLiteral("message")] = QStringLiteral("Insufficient data for prediction");
        return result;
    }
    if (recent.size() == 1) {
        result[QStringLiteral("confidence")] = QStringLiteral("low");
        result[QStringLiteral("message")] = QStringLiteral("Only one rate limit event recorded");
        return result;
    }

    double sum = 0;
    QList<double> intervals;
    for (int i = 1; i < recent.size(); ++i) {
        intervals.append(static_cast<double>(recent[i] - recent[i - 1]));
        sum += intervals.last();
    }
    const double average = sum / intervals.size();

    double variance = 0;
    for (double interval : std::as_const(intervals)) {
        variance += (interval - average) * (interval - average);
    }
    variance /= intervals.size();
    // Identical timestamps give a zero average; treat as no pattern
    const double variation = average > 0 ? std::sqrt(variance) / average : 1.0;

    QString confidence;
    if (variation < 0.2) {
        confidence = QStringLiteral("high");
    } else if (variation < 0.5) {
        confidence = QStringLiteral("medium");
    } else {
        confidence = QStringLiteral("low");
    }

    const qint64 predicted = recent.last() + static_cast<qint64>(average);
    const QDateTime predictedAt = QDateTime::fromMSecsSinceEpoch(predicted).toUTC();

    result[QStringLiteral("confidence")] = confidence;
    result[QStringLiteral("nextPredictedTime")] = isoTimestamp(predictedAt);
    result[QStringLiteral("avgIntervalMs")] = static_cast<double>(std::llround(average));
    result[QStringLiteral("avgIntervalHours")] = std::round(average / (60.0 * 60 * 1000) * 10) / 10;
    result[QStringLiteral("sampleSize")] = intervals.size();
    result[QStringLiteral("message")] = predicted > nowMs
        ? QStringLiteral("Next rate limit predicted around %1").arg(predictedAt.toLocalTime().toString(Qt::ISODate))
        : QStringLiteral("Pattern suggests rate limit may occur soon");
    return result;
}

int AnalyticsCollector::cleanup(const QDateTime &now)
{
    const qint64 cutoff = now.toMSecsSinceEpoch() - m_retentionDays * DayMs;

    const auto prune = [cutoff](QJsonArray &records) {
        int removed = 0;
        for (int i = records.size() - 1; i >= 0; --i) {
            if (timestampOf(records.at(i)) < cutoff) {
                records.removeAt(i);
                ++removed;
            }
        }
        return removed;
    };

    const int removed = prune(m_rateLimits) + prune(m_resumes);
    if (removed > 0) {
        qDebug() << "AnalyticsCollector::cleanup() - Removed" << removed << "records older than" << m_retentionDays << "days";
        save();
    }
    return removed;
}

void AnalyticsCollector::load()
{
    m_rateLimits = QJsonArray();
    m_resumes = QJsonArray();

    QFile file(m_filePath);
    if (!file.exists()) {
        return;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "AnalyticsCollector::load() - Cannot read" << m_filePath << file.errorString();
        return;
    }

    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "AnalyticsCollector::load() - Ignoring unparsable" << m_filePath << error.errorString();
        return;
    }

    const QJsonObject root = doc.object();
    m_rateLimits = root.value(QStringLiteral("rateLimits")).toArray();
    m_resumes = root.value(QStringLiteral("resumes")).toArray();
}

bool AnalyticsCollector::save()
{
    QDir().mkpath(QFileInfo(m_filePath).absolutePath());

    QJsonObject root;
    root[QStringLiteral("version")] = QStringLiteral("1.0.0");
    root[QStringLiteral("rateLimits")] = m_rateLimits;
    root[QStringLiteral("resumes")] = m_resumes;

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "AnalyticsCollector::save() - Cannot write" << m_filePath << file.errorString();
        return false;
    }
    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        qWarning() << "AnalyticsCollector::save() - Commit failed for" << m_filePath << file.errorString();
        return false;
    }
    return true;
}

} // namespace AutoResume

#include "moc_AnalyticsCollector.cpp"
