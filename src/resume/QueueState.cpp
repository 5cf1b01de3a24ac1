/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "QueueState.h"

#include <QJsonArray>
#include <QUuid>

namespace AutoResume
{

QJsonObject QueueState::toJson() const
{
    QJsonArray entries;
    for (const DetectionEvent &event : queue) {
        entries.append(event.toJson());
    }

    QJsonObject root;
    root[QStringLiteral("version")] = CurrentVersion;
    root[QStringLiteral("queue")] = entries;
    root[QStringLiteral("last_hook_run")] = lastHookRun.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(lastHookRun);
    return root;
}

int QueueState::documentVersion(const QJsonObject &root)
{
    if (root.value(QStringLiteral("queue")).isArray()) {
        return CurrentVersion;
    }
    return 1;
}

QueueState QueueState::fromJson(const QJsonObject &root, bool *migrated)
{
    const int version = documentVersion(root);
    if (migrated) {
        *migrated = (version != CurrentVersion || !root.contains(QStringLiteral("version")));
    }

    if (version == 1) {
        return migrateLegacy(root);
    }

    QueueState state;
    state.lastHookRun = root.value(QStringLiteral("last_hook_run")).toString();

    const QJsonArray entries = root.value(QStringLiteral("queue")).toArray();
    for (const QJsonValue &value : entries) {
        if (!value.isObject()) {
            continue;
        }
        DetectionEvent event = DetectionEvent::fromJson(value.toObject());
        if (event.resetTime.isEmpty()) {
            continue;
        }
        // Entries written by hand or by an older hook may lack an id
        if (event.id.isEmpty()) {
            event.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
            if (migrated) {
                *migrated = true;
            }
        }
        state.queue.append(event);
    }
    return state;
}

QueueState QueueState::migrateLegacy(const QJsonObject &legacy)
{
    QueueState state;
    state.lastHookRun = legacy.value(QStringLiteral("last_hook_run")).toString();

    const bool detected = legacy.value(QStringLiteral("detected")).toBool();
    const QString resetTime = legacy.value(QStringLiteral("reset_time")).toString();
    if (!detected || resetTime.isEmpty()) {
        return state;
    }

    Detection detection;
    detection.resetTime = resetTime;
    detection.timezone = legacy.value(QStringLiteral("timezone")).toString();
    detection.message = legacy.value(QStringLiteral("message")).toString();
    detection.claudePid = Detection::fromJson(legacy).claudePid;

    DetectionEvent event = DetectionEvent::create(detection);
    const QString lastDetected = legacy.value(QStringLiteral("last_detected")).toString();
    if (!lastDetected.isEmpty()) {
        event.detectedAt = lastDetected;
    }
    state.queue.append(event);
    return state;
}

} // namespace AutoResume
