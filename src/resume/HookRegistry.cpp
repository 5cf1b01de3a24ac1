/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "HookRegistry.h"
#include "CommandRunner.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QPointer>
#include <QTimer>

#include <exception>
#include <memory>

namespace AutoResume
{

QString hookPointName(HookPoint point)
{
    switch (point) {
    case HookPoint::RateLimitDetected:
        return QStringLiteral("onRateLimitDetected");
    case HookPoint::ResumeSent:
        return QStringLiteral("onResumeSent");
    case HookPoint::StatusChange:
        return QStringLiteral("onStatusChange");
    case HookPoint::DaemonStart:
        return QStringLiteral("onDaemonStart");
    case HookPoint::DaemonStop:
        return QStringLiteral("onDaemonStop");
    }
    return QString();
}

QList<HookPoint> allHookPoints()
{
    return {HookPoint::RateLimitDetected, HookPoint::ResumeSent, HookPoint::StatusChange, HookPoint::DaemonStart, HookPoint::DaemonStop};
}

HookPoint hookPointFromName(const QString &name, bool *ok)
{
    const QList<HookPoint> points = allHookPoints();
    for (HookPoint point : points) {
        if (hookPointName(point) == name) {
            if (ok) {
                *ok = true;
            }
            return point;
        }
    }
    if (ok) {
        *ok = false;
    }
    return HookPoint::StatusChange;
}

ResumeHook::ResumeHook(QObject *parent)
    : QObject(parent)
{
}

ResumeHook::~ResumeHook() = default;

// ========== ExecutableHook ==========

ExecutableHook::ExecutableHook(QObject *parent)
    : ResumeHook(parent)
    , m_runner(new CommandRunner(this))
{
}

ExecutableHook *ExecutableHook::fromDirectory(const QString &directory, QString *error, QObject *parent)
{
    const auto fail = [error](const QString &message) -> ExecutableHook * {
        if (error) {
            *error = message;
        }
        return nullptr;
    };

    QFile file(QDir(directory).filePath(QStringLiteral("plugin.json")));
    if (!file.open(QIODevice::ReadOnly)) {
        return fail(QStringLiteral("no plugin.json"));
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        return fail(QStringLiteral("invalid plugin.json: %1").arg(parseError.errorString()));
    }
    const QJsonObject manifest = doc.object();

    const QString name = manifest.value(QStringLiteral("name")).toString();
    const QString version = manifest.value(QStringLiteral("version")).toString();
    if (name.isEmpty() || version.isEmpty()) {
        return fail(QStringLiteral("plugin.json needs name and version"));
    }

    QSet<HookPoint> points;
    const QJsonArray hooks = manifest.value(QStringLiteral("hooks")).toArray();
    for (const QJsonValue &value : hooks) {
        bool ok = false;
        const HookPoint point = hookPointFromName(value.toString(), &ok);
        if (!ok) {
            return fail(QStringLiteral("unknown hook %1").arg(value.toString()));
        }
        points.insert(point);
    }

    const QString exec = manifest.value(QStringLiteral("exec")).toString();
    const QFileInfo execInfo(QDir(directory).filePath(exec));
    if (exec.isEmpty() || !execInfo.isFile() || !execInfo.isExecutable()) {
        return fail(QStringLiteral("exec %1 is not an executable file").arg(exec));
    }

    auto *hook = new ExecutableHook(parent);
    hook->m_name = name;
    hook->m_version = version;
    hook->m_description = manifest.value(QStringLiteral("description")).toString();
    hook->m_executable = execInfo.absoluteFilePath();
    hook->m_points = points;
    return hook;
}

QString ExecutableHook::name() const
{
    return m_name;
}

QSet<HookPoint> ExecutableHook::hookPoints() const
{
    return m_points;
}

QString ExecutableHook::version() const
{
    return m_version;
}

QString ExecutableHook::description() const
{
    return m_description;
}

QString ExecutableHook::executable() const
{
    return m_executable;
}

void ExecutableHook::setTimeout(int timeoutMs)
{
    m_runner->setTimeout(timeoutMs);
}

void ExecutableHook::invoke(HookPoint point, const QJsonObject &event, Done done)
{
    const QByteArray payload = QJsonDocument(event).toJson(QJsonDocument::Compact);
    m_runner->run(
        m_executable,
        {hookPointName(point)},
        [done](const CommandResult &result) {
            if (result.ok()) {
                done(true, QString());
            } else if (result.timedOut) {
                done(false, QStringLiteral("timed out"));
            } else {
                done(false, result.errorOutput.trimmed().isEmpty() ? QStringLiteral("exit code %1").arg(result.exitCode) : result.errorOutput.trimmed());
            }
        },
        payload);
}

// ========== HookRegistry ==========

HookRegistry::HookRegistry(QObject *parent)
    : QObject(parent)
{
}

HookRegistry::~HookRegistry() = default;

void HookRegistry::setEnabled(bool enabled)
{
    m_enabled = enabled;
}

bool HookRegistry::isEnabled() const
{
    return m_enabled;
}

void HookRegistry::setTimeout(int timeoutMs)
{
    m_timeoutMs = qMax(1, timeoutMs);
    for (ResumeHook *hook : std::as_const(m_hooks)) {
        if (auto *exec = qobject_cast<ExecutableHook *>(hook)) {
            exec->setTimeout(m_timeoutMs);
        }
    }
}

int HookRegistry::timeout() const
{
    return m_timeoutMs;
}

bool HookRegistry::registerHook(ResumeHook *hook)
{
    if (!hook) {
        return false;
    }
    if (hookNames().contains(hook->name())) {
        qWarning() << "HookRegistry::registerHook() - Hook" << hook->name() << "already registered";
        return false;
    }

    hook->setParent(this);
    if (auto *exec = qobject_cast<ExecutableHook *>(hook)) {
        exec->setTimeout(m_timeoutMs);
    }
    m_hooks.append(hook);
    qDebug() << "HookRegistry::registerHook() - Registered" << hook->name();
    return true;
}

bool HookRegistry::unregisterHook(const QString &name)
{
    for (int i = 0; i < m_hooks.size(); ++i) {
        if (m_hooks.at(i)->name() == name) {
            m_hooks.takeAt(i)->deleteLater();
            return true;
        }
    }
    return false;
}

QList<ResumeHook *> HookRegistry::hooks() const
{
    return m_hooks;
}

QStringList HookRegistry::hookNames() const
{
    QStringList names;
    for (const ResumeHook *hook : m_hooks) {
        names.append(hook->name());
    }
    return names;
}

int HookRegistry::discover(const QString &directory)
{
    const QDir dir(directory);
    if (!dir.exists()) {
        qDebug() << "HookRegistry::discover() - No hooks directory" << directory;
        return 0;
    }

    int added = 0;
    const QStringList entries = dir.entryList(QDir::Dirs | QDir::NoDotAndDotDot, QDir::Name);
    for (const QString &entry : entries) {
        QString error;
        ExecutableHook *hook = ExecutableHook::fromDirectory(dir.filePath(entry), &error);
        if (!hook) {
            qWarning() << "HookRegistry::discover() - Skipping" << entry << ":" << error;
            continue;
        }
        if (registerHook(hook)) {
            ++added;
        } else {
            delete hook;
        }
    }
    return added;
}

int HookRegistry::dispatch(HookPoint point, const QJsonObject &event)
{
    if (!m_enabled) {
        return 0;
    }

    const QString pointName = hookPointName(point);
    QJsonObject payload = event;
    payload[QStringLiteral("hook")] = pointName;

    int started = 0;
    const QList<ResumeHook *> hooks = m_hooks;
    for (ResumeHook *hook : hooks) {
        if (!hook->hookPoints().contains(point)) {
            continue;
        }
        ++started;

        const QString hookName = hook->name();
        auto reported = std::make_shared<bool>(false);
        QPointer<HookRegistry> guard(this);
        auto report = [this, guard, reported, hookName, pointName](bool ok, const QString &error) {
            if (*reported || !guard) {
                return;
            }
            *reported = true;
            if (!ok) {
                qWarning() << "HookRegistry::dispatch() - Hook" << hookName << pointName << "failed:" << error;
            }
            Q_EMIT hookFinished(hookName, pointName, ok, error);
        };

        QTimer::singleShot(m_timeoutMs, this, [report]() {
            report(false, QStringLiteral("timed out"));
        });

        try {
            hook->invoke(point, payload, report);
        } catch (const std::exception &e) {
            report(false, QString::fromUtf8(e.what()));
        } catch (...) {
            report(false, QStringLiteral("unknown exception"));
        }
    }
    return started;
}

} // namespace AutoResume

#include "moc_HookRegistry.cpp"
