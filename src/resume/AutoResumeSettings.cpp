/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "AutoResumeSettings.h"
#include "TranscriptVerifier.h"

#include <KConfigGroup>
#include <QDebug>
#include <QDir>
#include <QStandardPaths>

namespace AutoResume
{

namespace
{
const QString ResumeGroup = QStringLiteral("Resume");
const QString DaemonGroup = QStringLiteral("Daemon");
const QString NotificationsGroup = QStringLiteral("Notifications");
const QString AnalyticsGroup = QStringLiteral("Analytics");
const QString HooksGroup = QStringLiteral("Hooks");
}

AutoResumeSettings *AutoResumeSettings::s_instance = nullptr;

AutoResumeSettings *AutoResumeSettings::instance()
{
    return s_instance;
}

AutoResumeSettings::AutoResumeSettings(const QString &configName, QObject *parent)
    : QObject(parent)
{
    if (!s_instance) {
        s_instance = this;
    }

    // Load config from ~/.config/autoresumerc
    m_config = KSharedConfig::openConfig(configName);
}

AutoResumeSettings::~AutoResumeSettings()
{
    save();
    if (s_instance == this) {
        s_instance = nullptr;
    }
}

QString AutoResumeSettings::dataDirectory()
{
    return QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation) + QStringLiteral("/autoresume");
}

QString AutoResumeSettings::resumePrompt() const
{
    KConfigGroup group(m_config, ResumeGroup);
    const QString prompt = group.readEntry("Prompt", QStringLiteral("continue"));
    return prompt.trimmed().isEmpty() ? QStringLiteral("continue") : prompt;
}

void AutoResumeSettings::setResumePrompt(const QString &prompt)
{
    KConfigGroup group(m_config, ResumeGroup);
    group.writeEntry("Prompt", prompt);
    Q_EMIT settingsChanged();
}

QString AutoResumeSettings::menuSelection() const
{
    KConfigGroup group(m_config, ResumeGroup);
    const QString selection = group.readEntry("MenuSelection", QStringLiteral("1"));
    return selection.trimmed().isEmpty() ? QStringLiteral("1") : selection.trimmed();
}

void AutoResumeSettings::setMenuSelection(const QString &selection)
{
    KConfigGroup group(m_config, ResumeGroup);
    group.writeEntry("MenuSelection", selection);
    Q_EMIT settingsChanged();
}

int AutoResumeSettings::postResetDelaySec() const
{
    KConfigGroup group(m_config, ResumeGroup);
    return qBound(1, group.readEntry("PostResetDelaySec", 10), 300);
}

void AutoResumeSettings::setPostResetDelaySec(int seconds)
{
    KConfigGroup group(m_config, ResumeGroup);
    group.writeEntry("PostResetDelaySec", qBound(1, seconds, 300));
    Q_EMIT settingsChanged();
}

int AutoResumeSettings::maxRetries() const
{
    KConfigGroup group(m_config, ResumeGroup);
    return qBound(0, group.readEntry("MaxRetries", 4), 10);
}

void AutoResumeSettings::setMaxRetries(int retries)
{
    KConfigGroup group(m_config, ResumeGroup);
    group.writeEntry("MaxRetries", qBound(0, retries, 10));
    Q_EMIT settingsChanged();
}

int AutoResumeSettings::verificationWindowSec() const
{
    KConfigGroup group(m_config, ResumeGroup);
    return qBound(10, group.readEntry("VerificationWindowSec", 90), 600);
}

void AutoResumeSettings::setVerificationWindowSec(int seconds)
{
    KConfigGroup group(m_config, ResumeGroup);
    group.writeEntry("VerificationWindowSec", qBound(10, seconds, 600));
    Q_EMIT settingsChanged();
}

int AutoResumeSettings::verificationPollMs() const
{
    KConfigGroup group(m_config, ResumeGroup);
    return qBound(100, group.readEntry("VerificationPollMs", 1000), 10000);
}

void AutoResumeSettings::setVerificationPollMs(int ms)
{
    KConfigGroup group(m_config, ResumeGroup);
    group.writeEntry("VerificationPollMs", qBound(100, ms, 10000));
    Q_EMIT settingsChanged();
}

int AutoResumeSettings::staleThresholdMinutes() const
{
    KConfigGroup group(m_config, ResumeGroup);
    return qBound(1, group.readEntry("StaleThresholdMinutes", 120), 10080);
}

void AutoResumeSettings::setStaleThresholdMinutes(int minutes)
{
    KConfigGroup group(m_config, ResumeGroup);
    group.writeEntry("StaleThresholdMinutes", qBound(1, minutes, 10080));
    Q_EMIT settingsChanged();
}

int AutoResumeSettings::retryBaseDelayMs() const
{
    KConfigGroup group(m_config, ResumeGroup);
    return qBound(100, group.readEntry("RetryBaseDelayMs", 5000), 600000);
}

void AutoResumeSettings::setRetryBaseDelayMs(int ms)
{
    KConfigGroup group(m_config, ResumeGroup);
    group.writeEntry("RetryBaseDelayMs", ms);
    Q_EMIT settingsChanged();
}

int AutoResumeSettings::retryMaxDelayMs() const
{
    KConfigGroup group(m_config, ResumeGroup);
    // Never below the base delay
    return qBound(retryBaseDelayMs(), group.readEntry("RetryMaxDelayMs", 300000), 3600000);
}

void AutoResumeSettings::setRetryMaxDelayMs(int ms)
{
    KConfigGroup group(m_config, ResumeGroup);
    group.writeEntry("RetryMaxDelayMs", ms);
    Q_EMIT settingsChanged();
}

int AutoResumeSettings::commandTimeoutMs() const
{
    KConfigGroup group(m_config, ResumeGroup);
    return qBound(1000, group.readEntry("CommandTimeoutMs", 10000), 60000);
}

void AutoResumeSettings::setCommandTimeoutMs(int ms)
{
    KConfigGroup group(m_config, ResumeGroup);
    group.writeEntry("CommandTimeoutMs", qBound(1000, ms, 60000));
    Q_EMIT settingsChanged();
}

int AutoResumeSettings::checkIntervalMs() const
{
    KConfigGroup group(m_config, DaemonGroup);
    return qBound(1000, group.readEntry("CheckIntervalMs", 5000), 60000);
}

void AutoResumeSettings::setCheckIntervalMs(int ms)
{
    KConfigGroup group(m_config, DaemonGroup);
    group.writeEntry("CheckIntervalMs", qBound(1000, ms, 60000));
    Q_EMIT settingsChanged();
}

QString AutoResumeSettings::transcriptRoot() const
{
    KConfigGroup group(m_config, DaemonGroup);
    QString root = group.readEntry("TranscriptRoot", TranscriptVerifier::defaultTranscriptRoot());
    if (root.startsWith(QLatin1String("~/"))) {
        root = QDir::homePath() + root.mid(1);
    }
    return root;
}

void AutoResumeSettings::setTranscriptRoot(const QString &path)
{
    KConfigGroup group(m_config, DaemonGroup);
    group.writeEntry("TranscriptRoot", path);
    Q_EMIT settingsChanged();
}

int AutoResumeSettings::maxLogSizeMB() const
{
    KConfigGroup group(m_config, DaemonGroup);
    return qBound(1, group.readEntry("MaxLogSizeMB", 1), 100);
}

void AutoResumeSettings::setMaxLogSizeMB(int megabytes)
{
    KConfigGroup group(m_config, DaemonGroup);
    group.writeEntry("MaxLogSizeMB", qBound(1, megabytes, 100));
    Q_EMIT settingsChanged();
}

bool AutoResumeSettings::notificationsEnabled() const
{
    KConfigGroup group(m_config, NotificationsGroup);
    return group.readEntry("Enabled", true);
}

void AutoResumeSettings::setNotificationsEnabled(bool enabled)
{
    KConfigGroup group(m_config, NotificationsGroup);
    group.writeEntry("Enabled", enabled);
    Q_EMIT settingsChanged();
}

bool AutoResumeSettings::analyticsEnabled() const
{
    KConfigGroup group(m_config, AnalyticsGroup);
    return group.readEntry("Enabled", true);
}

void AutoResumeSettings::setAnalyticsEnabled(bool enabled)
{
    KConfigGroup group(m_config, AnalyticsGroup);
    group.writeEntry("Enabled", enabled);
    Q_EMIT settingsChanged();
}

int AutoResumeSettings::analyticsRetentionDays() const
{
    KConfigGroup group(m_config, AnalyticsGroup);
    return qBound(1, group.readEntry("RetentionDays", 30), 365);
}

void AutoResumeSettings::setAnalyticsRetentionDays(int days)
{
    KConfigGroup group(m_config, AnalyticsGroup);
    group.writeEntry("RetentionDays", qBound(1, days, 365));
    Q_EMIT settingsChanged();
}

bool AutoResumeSettings::hooksEnabled() const
{
    KConfigGroup group(m_config, HooksGroup);
    return group.readEntry("Enabled", false);
}

void AutoResumeSettings::setHooksEnabled(bool enabled)
{
    KConfigGroup group(m_config, HooksGroup);
    group.writeEntry("Enabled", enabled);
    Q_EMIT settingsChanged();
}

QString AutoResumeSettings::hooksDirectory() const
{
    KConfigGroup group(m_config, HooksGroup);
    return group.readEntry("Directory", dataDirectory() + QStringLiteral("/hooks"));
}

void AutoResumeSettings::setHooksDirectory(const QString &path)
{
    KConfigGroup group(m_config, HooksGroup);
    group.writeEntry("Directory", path);
    Q_EMIT settingsChanged();
}

int AutoResumeSettings::hookTimeoutMs() const
{
    KConfigGroup group(m_config, HooksGroup);
    return qBound(1000, group.readEntry("TimeoutMs", 30000), 300000);
}

void AutoResumeSettings::setHookTimeoutMs(int ms)
{
    KConfigGroup group(m_config, HooksGroup);
    group.writeEntry("TimeoutMs", qBound(1000, ms, 300000));
    Q_EMIT settingsChanged();
}

ResumeConfig AutoResumeSettings::resumeConfig() const
{
    ResumeConfig config;
    config.resumePrompt = resumePrompt();
    config.menuSelection = menuSelection();
    config.postResetDelayMs = postResetDelaySec() * 1000LL;
    config.staleThresholdMs = staleThresholdMinutes() * 60LL * 1000;
    config.maxRetries = maxRetries();
    config.retryBaseDelayMs = retryBaseDelayMs();
    config.retryMaxDelayMs = retryMaxDelayMs();
    config.verificationWindowMs = verificationWindowSec() * 1000LL;
    config.verificationPollMs = verificationPollMs();
    config.transcriptRoot = transcriptRoot();
    config.commandTimeoutMs = commandTimeoutMs();
    return config;
}

void AutoResumeSettings::save()
{
    if (!m_config->sync()) {
        qWarning() << "AutoResumeSettings::save() - Failed to write" << m_config->name();
    }
}

} // namespace AutoResume

#include "moc_AutoResumeSettings.cpp"
