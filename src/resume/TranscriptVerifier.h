/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TRANSCRIPTVERIFIER_H
#define TRANSCRIPTVERIFIER_H

#include "autoresume_export.h"

#include <QDateTime>
#include <QHash>
#include <QObject>
#include <QString>
#include <QTimer>

namespace AutoResume
{

/**
 * Outcome of watching for session activity after a delivery
 */
struct AUTORESUME_EXPORT VerificationResult {
    bool verified = false;
    // "transcript" (known file), "transcript-scan" (any session file) or "none"
    QString method;
    QString transcriptPath; // file that grew, if any
    qint64 newBytes = 0;
    qint64 elapsedMs = 0;
    QDateTime checkedAt;
};

/**
 * TranscriptVerifier decides whether Claude actually resumed.
 *
 * Claude appends to its JSONL transcript whenever the conversation moves
 * on. prepare() records the size of the watched files before delivery;
 * start() then polls until one of them grows, or a new one appears, or
 * the window runs out.
 */
class AUTORESUME_EXPORT TranscriptVerifier : public QObject
{
    Q_OBJECT

public:
    explicit TranscriptVerifier(QObject *parent = nullptr);
    ~TranscriptVerifier() override;

    /**
     * ~/.claude/projects
     */
    static QString defaultTranscriptRoot();

    void setWindow(qint64 windowMs);
    qint64 window() const;

    void setPollInterval(int intervalMs);

    /**
     * Directory scanned when no transcript path is known. Empty = default.
     */
    void setTranscriptRoot(const QString &root);
    QString transcriptRoot() const;

    /**
     * Record the baseline. An empty transcriptPath means scan the root.
     */
    void prepare(const QString &transcriptPath);

    /**
     * Begin polling. Calls prepare() first if it was not called.
     */
    void start(const QDateTime &deliveredAt = QDateTime::currentDateTimeUtc());

    /**
     * Stop without emitting finished()
     */
    void cancel();

    bool isRunning() const;

    /**
     * Method prepare() settled on
     */
    QString method() const;

    /**
     * One poll against the baseline; verified is false when nothing moved
     */
    VerificationResult check() const;

Q_SIGNALS:
    void finished(const AutoResume::VerificationResult &result);

private:
    void poll();
    void finish(const VerificationResult &result);
    QHash<QString, qint64> snapshot() const;

    qint64 m_windowMs = 90 * 1000;
    QString m_transcriptRoot;
    QString m_transcriptPath;
    QString m_method;
    bool m_prepared = false;

    QHash<QString, qint64> m_baseline;
    QDateTime m_deliveredAt;
    QDateTime m_startedAt;
    QTimer *m_pollTimer = nullptr;
};

} // namespace AutoResume

Q_DECLARE_METATYPE(AutoResume::VerificationResult)

#endif // TRANSCRIPTVERIFIER_H
