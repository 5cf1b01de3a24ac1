/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef QUEUESTATE_H
#define QUEUESTATE_H

#include "autoresume_export.h"

#include "DetectionEvent.h"

#include <QJsonObject>
#include <QList>
#include <QString>

namespace AutoResume
{

/**
 * QueueState is the in-memory form of status.json.
 *
 * Schema versions:
 *   1 - legacy single slot: { detected, reset_time, timezone, message,
 *       last_detected, claude_pid }
 *   2 - queue: { version, queue: [DetectionEvent...], last_hook_run }
 *
 * Documents written by older hooks carry a queue array but no version
 * field; they are read as version 2.
 */
struct AUTORESUME_EXPORT QueueState {
    static constexpr int CurrentVersion = 2;

    QList<DetectionEvent> queue;
    QString lastHookRun; // empty = never

    QJsonObject toJson() const;

    /**
     * Load any supported document shape, migrating it to the current
     * schema. Sets *migrated when the input was not already current,
     * including when entry ids had to be generated.
     */
    static QueueState fromJson(const QJsonObject &root, bool *migrated = nullptr);

    /**
     * Convert a legacy single-slot document. A document without an active
     * detection yields an empty queue.
     */
    static QueueState migrateLegacy(const QJsonObject &legacy);

    /**
     * Detect the schema version of a raw document.
     */
    static int documentVersion(const QJsonObject &root);
};

} // namespace AutoResume

#endif // QUEUESTATE_H
