/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef RATELIMITQUEUE_H
#define RATELIMITQUEUE_H

#include "autoresume_export.h"

#include "DetectionEvent.h"
#include "QueueState.h"

#include <QList>
#include <QObject>
#include <QString>

namespace AutoResume
{

/**
 * RateLimitQueue is the durable store of rate limit detections.
 *
 * The backing file (status.json) is shared with the detector hook, which
 * runs as a separate short-lived process. Every operation therefore does
 * a full read-modify-write against the file instead of caching, and every
 * write is an atomic replace (QSaveFile) so a concurrent reader never sees
 * a truncated document.
 *
 * A missing or unparsable file reads as an empty queue. The detector
 * re-reports live rate limits, so losing a corrupt document is recoverable.
 */
class AUTORESUME_EXPORT RateLimitQueue : public QObject
{
    Q_OBJECT

public:
    explicit RateLimitQueue(const QString &filePath = QString(), QObject *parent = nullptr);
    ~RateLimitQueue() override;

    /**
     * Default location: ~/.local/share/autoresume/status.json
     */
    static QString statusFilePath();

    QString filePath() const
    {
        return m_filePath;
    }

    /**
     * Insert a detection unless an entry with the same reset_time exists.
     *
     * @param detection Detector payload; an empty reset_time is rejected
     * @param added Receives the stored entry when one was inserted
     * @return true if a new entry was written
     */
    bool addDetection(const Detection &detection, DetectionEvent *added = nullptr);

    /**
     * Pending or waiting entry with the earliest reset time. Returns an
     * invalid event when nothing is eligible.
     */
    DetectionEvent nextPending() const;

    /**
     * Pending and waiting entries, earliest reset time first.
     */
    QList<DetectionEvent> pendingEntries() const;

    /**
     * Transition an entry. Completing stamps completed_at.
     *
     * @return false if the id is unknown or the write failed
     */
    bool updateEntryStatus(const QString &id, EventStatus status);

    /**
     * Mark an entry failed and record why.
     */
    bool markFailed(const QString &id, const QString &reason);

    DetectionEvent entry(const QString &id) const;
    QList<DetectionEvent> entries() const;
    QString lastHookRun() const;

    /**
     * Return entries left active by a previous daemon run to pending.
     *
     * @return number of entries re-queued
     */
    int requeueInterrupted();

    /**
     * Fail every pending/waiting entry whose reset time is stale.
     *
     * @return number of entries reset
     */
    int resetStaleEntries(qint64 thresholdMs);

    /**
     * Drop completed/failed entries detected more than the given number of
     * days ago.
     */
    int pruneTerminal(int olderThanDays);

    /**
     * Read the document, migrating legacy shapes. Never fails. A migrated
     * document is written back at once so that generated ids stay stable
     * across reads.
     */
    QueueState load() const;

    /**
     * Atomically replace the document.
     */
    bool save(const QueueState &state);

Q_SIGNALS:
    /**
     * Emitted after any successful write
     */
    void queueChanged();

    /**
     * Emitted when addDetection stored a new entry
     */
    void detectionAdded(const AutoResume::DetectionEvent &event);

private:
    bool writeDocument(const QueueState &state) const;

    QString m_filePath;
};

} // namespace AutoResume

#endif // RATELIMITQUEUE_H
