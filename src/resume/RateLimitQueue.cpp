/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "RateLimitQueue.h"
#include "StalenessGuard.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QSaveFile>
#include <QStandardPaths>

#include <algorithm>

namespace AutoResume
{

static bool earlierReset(const DetectionEvent &a, const DetectionEvent &b)
{
    const QDateTime ta = a.resetDateTime();
    const QDateTime tb = b.resetDateTime();
    // Unparsable reset times sort last
    if (!ta.isValid()) {
        return false;
    }
    if (!tb.isValid()) {
        return true;
    }
    return ta < tb;
}

RateLimitQueue::RateLimitQueue(const QString &filePath, QObject *parent)
    : QObject(parent)
    , m_filePath(filePath.isEmpty() ? statusFilePath() : filePath)
{
}

RateLimitQueue::~RateLimitQueue() = default;

QString RateLimitQueue::statusFilePath()
{
    QString dataDir = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return dataDir + QStringLiteral("/autoresume/status.json");
}

QueueState RateLimitQueue::load() const
{
    QFile file(m_filePath);
    if (!file.exists() || !file.open(QIODevice::ReadOnly)) {
        return QueueState();
    }

    const QByteArray data = file.readAll();
    file.close();

    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "RateLimitQueue::load() - Unreadable queue file, treating as empty:" << m_filePath << error.errorString();
        return QueueState();
    }

    bool migrated = false;
    QueueState state = QueueState::fromJson(doc.object(), &migrated);
    if (migrated) {
        qDebug() << "RateLimitQueue::load() - Migrated legacy status document," << state.queue.size() << "entry(ies)";
        if (!writeDocument(state)) {
            qWarning() << "RateLimitQueue::load() - Could not persist migrated document, entry ids will not be stable";
        }
    }
    return state;
}

bool RateLimitQueue::save(const QueueState &state)
{
    if (!writeDocument(state)) {
        return false;
    }

    Q_EMIT queueChanged();
    return true;
}

bool RateLimitQueue::writeDocument(const QueueState &state) const
{
    QFileInfo fileInfo(m_filePath);
    QDir().mkpath(fileInfo.absolutePath());

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "RateLimitQueue::save() - Cannot open" << m_filePath << file.errorString();
        return false;
    }

    if (file.write(QJsonDocument(state.toJson()).toJson(QJsonDocument::Indented)) < 0) {
        qWarning() << "RateLimitQueue::save() - Write failed for" << m_filePath << file.errorString();
        file.cancelWriting();
        return false;
    }
    if (!file.commit()) {
        qWarning() << "RateLimitQueue::save() - Commit failed for" << m_filePath << file.errorString();
        return false;
    }
    return true;
}

bool RateLimitQueue::addDetection(const Detection &detection, DetectionEvent *added)
{
    if (detection.resetTime.isEmpty()) {
        qWarning() << "RateLimitQueue::addDetection() - Ignoring detection without reset_time";
        return false;
    }

    QueueState state = load();

    const bool exists = std::any_of(state.queue.cbegin(), state.queue.cend(), [&detection](const DetectionEvent &entry) {
        return entry.resetTime == detection.resetTime;
    });
    if (exists) {
        return false;
    }

    const DetectionEvent event = DetectionEvent::create(detection);
    state.queue.append(event);
    state.lastHookRun = isoTimestamp();

    if (!save(state)) {
        return false;
    }

    qDebug() << "RateLimitQueue::addDetection() - Queued" << event.id << "reset_time:" << event.resetTime;
    if (added) {
        *added = event;
    }
    Q_EMIT detectionAdded(event);
    return true;
}

QList<DetectionEvent> RateLimitQueue::pendingEntries() const
{
    const QueueState state = load();

    QList<DetectionEvent> pending;
    for (const DetectionEvent &entry : state.queue) {
        if (entry.isLive()) {
            pending.append(entry);
        }
    }
    std::stable_sort(pending.begin(), pending.end(), earlierReset);
    return pending;
}

DetectionEvent RateLimitQueue::nextPending() const
{
    const QList<DetectionEvent> pending = pendingEntries();
    return pending.isEmpty() ? DetectionEvent() : pending.first();
}

bool RateLimitQueue::updateEntryStatus(const QString &id, EventStatus status)
{
    QueueState state = load();

    for (DetectionEvent &entry : state.queue) {
        if (entry.id != id) {
            continue;
        }
        entry.status = status;
        if (status == EventStatus::Completed) {
            entry.completedAt = isoTimestamp();
        }
        return save(state);
    }
    return false;
}

bool RateLimitQueue::markFailed(const QString &id, const QString &reason)
{
    QueueState state = load();

    for (DetectionEvent &entry : state.queue) {
        if (entry.id != id) {
            continue;
        }
        entry.status = EventStatus::Failed;
        entry.failureReason = reason;
        return save(state);
    }
    return false;
}

DetectionEvent RateLimitQueue::entry(const QString &id) const
{
    const QueueState state = load();
    for (const DetectionEvent &entry : state.queue) {
        if (entry.id == id) {
            return entry;
        }
    }
    return DetectionEvent();
}

QList<DetectionEvent> RateLimitQueue::entries() const
{
    return load().queue;
}

QString RateLimitQueue::lastHookRun() const
{
    return load().lastHookRun;
}

int RateLimitQueue::requeueInterrupted()
{
    QueueState state = load();

    int count = 0;
    for (DetectionEvent &entry : state.queue) {
        if (entry.status == EventStatus::Active) {
            entry.status = EventStatus::Pending;
            ++count;
        }
    }

    if (count > 0 && !save(state)) {
        return 0;
    }
    return count;
}

int RateLimitQueue::resetStaleEntries(qint64 thresholdMs)
{
    QueueState state = load();
    const QDateTime now = QDateTime::currentDateTimeUtc();

    int count = 0;
    for (DetectionEvent &entry : state.queue) {
        if (entry.isLive() && isResetTimeStale(entry.resetTime, thresholdMs, now)) {
            entry.status = EventStatus::Failed;
            entry.failureReason = QStringLiteral("stale");
            ++count;
        }
    }

    if (count > 0 && !save(state)) {
        return 0;
    }
    return count;
}

int RateLimitQueue::pruneTerminal(int olderThanDays)
{
    QueueState state = load();
    const QDateTime cutoff = QDateTime::currentDateTimeUtc().addDays(-olderThanDays);

    const int before = state.queue.size();
    state.queue.erase(std::remove_if(state.queue.begin(),
                                     state.queue.end(),
                                     [&cutoff](const DetectionEvent &entry) {
                                         if (!entry.isTerminal()) {
                                             return false;
                                         }
                                         const QDateTime detected = parseTimestamp(entry.detectedAt);
                                         return detected.isValid() && detected < cutoff;
                                     }),
                      state.queue.end());

    const int removed = before - state.queue.size();
    if (removed > 0 && !save(state)) {
        return 0;
    }
    return removed;
}

} // namespace AutoResume

#include "moc_RateLimitQueue.cpp"
