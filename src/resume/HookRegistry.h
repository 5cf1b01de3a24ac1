/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef HOOKREGISTRY_H
#define HOOKREGISTRY_H

#include "autoresume_export.h"

#include <QJsonObject>
#include <QList>
#include <QObject>
#include <QSet>
#include <QString>
#include <QStringList>

#include <functional>

namespace AutoResume
{

class CommandRunner;

/**
 * Points in the daemon's life where hooks run
 */
enum class HookPoint {
    RateLimitDetected,
    ResumeSent,
    StatusChange,
    DaemonStart,
    DaemonStop,
};

inline size_t qHash(HookPoint point, size_t seed = 0) noexcept
{
    return ::qHash(static_cast<int>(point), seed);
}

/**
 * "onRateLimitDetected", "onResumeSent", ...
 */
AUTORESUME_EXPORT QString hookPointName(HookPoint point);
AUTORESUME_EXPORT HookPoint hookPointFromName(const QString &name, bool *ok = nullptr);
AUTORESUME_EXPORT QList<HookPoint> allHookPoints();

/**
 * A user extension reacting to daemon events.
 *
 * invoke() must call done exactly once; HookRegistry bounds how long it
 * waits and ignores a late or repeated call.
 */
class AUTORESUME_EXPORT ResumeHook : public QObject
{
    Q_OBJECT

public:
    using Done = std::function<void(bool ok, const QString &error)>;

    explicit ResumeHook(QObject *parent = nullptr);
    ~ResumeHook() override;

    virtual QString name() const = 0;
    virtual QSet<HookPoint> hookPoints() const = 0;
    virtual void invoke(HookPoint point, const QJsonObject &event, Done done) = 0;
};

/**
 * Hook backed by an executable described by a plugin.json manifest:
 *
 *   { "name": "slack", "version": "1.0.0", "description": "...",
 *     "hooks": ["onResumeSent"], "exec": "notify.sh" }
 *
 * The executable is run as `exec <hookName>` with the event JSON on stdin.
 */
class AUTORESUME_EXPORT ExecutableHook : public ResumeHook
{
    Q_OBJECT

public:
    /**
     * Parse the manifest in directory. Returns nullptr and fills error if
     * it is missing or invalid.
     */
    static ExecutableHook *fromDirectory(const QString &directory, QString *error, QObject *parent = nullptr);

    QString name() const override;
    QSet<HookPoint> hookPoints() const override;
    void invoke(HookPoint point, const QJsonObject &event, Done done) override;

    QString version() const;
    QString description() const;
    QString executable() const;

    void setTimeout(int timeoutMs);

private:
    explicit ExecutableHook(QObject *parent = nullptr);

    QString m_name;
    QString m_version;
    QString m_description;
    QString m_executable;
    QSet<HookPoint> m_points;
    CommandRunner *m_runner = nullptr;
};

/**
 * HookRegistry holds the hooks and fans daemon events out to them.
 *
 * Each invocation is bounded by the hook timeout. A hook that fails,
 * throws or times out is logged and does not affect the others.
 */
class AUTORESUME_EXPORT HookRegistry : public QObject
{
    Q_OBJECT

public:
    explicit HookRegistry(QObject *parent = nullptr);
    ~HookRegistry() override;

    void setEnabled(bool enabled);
    bool isEnabled() const;

    void setTimeout(int timeoutMs);
    int timeout() const;

    /**
     * Takes ownership. A hook with a name already registered is rejected.
     */
    bool registerHook(ResumeHook *hook);
    bool unregisterHook(const QString &name);
    QList<ResumeHook *> hooks() const;
    QStringList hookNames() const;

    /**
     * Register an ExecutableHook for every subdirectory of directory that
     * has a valid plugin.json. Returns how many were added.
     */
    int discover(const QString &directory);

    /**
     * Run every hook registered for point. Returns how many were started.
     */
    int dispatch(HookPoint point, const QJsonObject &event);

Q_SIGNALS:
    void hookFinished(const QString &hookName, const QString &hookPoint, bool ok, const QString &error);

private:
    bool m_enabled = true;
    int m_timeoutMs = 30 * 1000;
    QList<ResumeHook *> m_hooks;
};

} // namespace AutoResume

#endif // HOOKREGISTRY_H
