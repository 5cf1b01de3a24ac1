/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef AUTORESUME_SETTINGS_H
#define AUTORESUME_SETTINGS_H

#include "autoresume_export.h"

#include "ResumeConfig.h"

#include <QObject>
#include <QString>

#include <KSharedConfig>

namespace AutoResume
{

/**
 * AutoResumeSettings reads and writes autoresumerc.
 *
 * Every numeric value is clamped to its allowed range on read, so a hand
 * edited config file can never push the daemon outside sane bounds.
 * resumeConfig() hands the resume core a plain value.
 */
class AUTORESUME_EXPORT AutoResumeSettings : public QObject
{
    Q_OBJECT

public:
    static AutoResumeSettings *instance();

    explicit AutoResumeSettings(const QString &configName = QStringLiteral("autoresumerc"), QObject *parent = nullptr);
    ~AutoResumeSettings() override;

    /**
     * GenericDataLocation/autoresume, where the queue, analytics, pid
     * file, log and socket live
     */
    static QString dataDirectory();

    // ========== Resume ==========

    /**
     * Text typed into the session to continue
     */
    QString resumePrompt() const;
    void setResumePrompt(const QString &prompt);

    /**
     * Key chosen in the rate limit dialog
     */
    QString menuSelection() const;
    void setMenuSelection(const QString &selection);

    /**
     * Seconds to wait after the reset time (1-300)
     */
    int postResetDelaySec() const;
    void setPostResetDelaySec(int seconds);

    /**
     * Retries after the first delivery (0-10)
     */
    int maxRetries() const;
    void setMaxRetries(int retries);

    /**
     * How long to watch the transcript after delivery (10-600)
     */
    int verificationWindowSec() const;
    void setVerificationWindowSec(int seconds);

    int verificationPollMs() const;
    void setVerificationPollMs(int ms);

    /**
     * Age past which a reset time is ignored (1-10080)
     */
    int staleThresholdMinutes() const;
    void setStaleThresholdMinutes(int minutes);

    int retryBaseDelayMs() const;
    void setRetryBaseDelayMs(int ms);
    int retryMaxDelayMs() const;
    void setRetryMaxDelayMs(int ms);

    /**
     * Bound for each tmux/xdotool invocation (1000-60000)
     */
    int commandTimeoutMs() const;
    void setCommandTimeoutMs(int ms);

    // ========== Daemon ==========

    /**
     * Queue file polling interval (1000-60000)
     */
    int checkIntervalMs() const;
    void setCheckIntervalMs(int ms);

    /**
     * Directory holding Claude's JSONL transcripts
     */
    QString transcriptRoot() const;
    void setTranscriptRoot(const QString &path);

    /**
     * daemon.log is rotated past this size (1-100)
     */
    int maxLogSizeMB() const;
    void setMaxLogSizeMB(int megabytes);

    // ========== Notifications / Analytics / Hooks ==========

    bool notificationsEnabled() const;
    void setNotificationsEnabled(bool enabled);

    bool analyticsEnabled() const;
    void setAnalyticsEnabled(bool enabled);

    /**
     * Days of analytics kept (1-365)
     */
    int analyticsRetentionDays() const;
    void setAnalyticsRetentionDays(int days);

    bool hooksEnabled() const;
    void setHooksEnabled(bool enabled);

    QString hooksDirectory() const;
    void setHooksDirectory(const QString &path);

    int hookTimeoutMs() const;
    void setHookTimeoutMs(int ms);

    /**
     * Snapshot of everything the resume core consumes
     */
    ResumeConfig resumeConfig() const;

    /**
     * Save settings to disk
     */
    void save();

Q_SIGNALS:
    void settingsChanged();

private:
    KSharedConfig::Ptr m_config;

    static AutoResumeSettings *s_instance;
};

} // namespace AutoResume

#endif // AUTORESUME_SETTINGS_H
