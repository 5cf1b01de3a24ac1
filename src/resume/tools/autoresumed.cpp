/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later

    autoresumed - rate limit auto-resume daemon and its control CLI

    Usage:
        autoresumed daemon                 Run the daemon in the foreground
        autoresumed status                 Show daemon and rate limit status
        autoresumed queue                  List queued detections
        autoresumed reset-stale            Fail pending detections that went stale
        autoresumed resume [--event <id>]  Resume now instead of waiting
        autoresumed stop                   Stop a running daemon
        autoresumed watch                  Stream status updates
        autoresumed stats                  Show resume statistics
        autoresumed prune [--days <n>]     Drop old finished detections
*/

#include "AnalyticsCollector.h"
#include "AutoResumeSettings.h"
#include "ControlServer.h"
#include "DetectionEvent.h"
#include "LogHandler.h"
#include "ProcessTree.h"
#include "RateLimitQueue.h"
#include "ResumeDaemon.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTextStream>
#include <QThread>

#include <csignal>

using namespace AutoResume;

namespace
{

struct Context {
    QString dataDir;
    bool json = false;
    int timeoutMs = 3000;

    QString socketPath() const
    {
        return dataDir + QStringLiteral("/daemon.sock");
    }
    QString statusFile() const
    {
        return dataDir + QStringLiteral("/status.json");
    }
    QString pidFile() const
    {
        return dataDir + QStringLiteral("/daemon.pid");
    }
};

QTextStream &out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream &err()
{
    static QTextStream stream(stderr);
    return stream;
}

void printJson(const QJsonObject &obj)
{
    out() << QJsonDocument(obj).toJson(QJsonDocument::Indented);
    out().flush();
}

QString formatCountdown(qint64 seconds)
{
    const qint64 h = seconds / 3600;
    const qint64 m = (seconds % 3600) / 60;
    const qint64 s = seconds % 60;
    return QStringLiteral("%1:%2:%3").arg(h, 2, 10, QLatin1Char('0')).arg(m, 2, 10, QLatin1Char('0')).arg(s, 2, 10, QLatin1Char('0'));
}

QString localTime(const QString &iso)
{
    const QDateTime dt = parseTimestamp(iso);
    return dt.isValid() ? dt.toLocalTime().toString(QStringLiteral("yyyy-MM-dd HH:mm:ss")) : iso;
}

// Best effort; the daemon also polls status.json
void nudgeDaemon(const Context &ctx)
{
    ControlClient client;
    QJsonObject response;
    if (!client.request(ctx.socketPath(), QStringLiteral("detection"), QJsonObject(), &response, ctx.timeoutMs)) {
        qDebug() << "autoresumed - Daemon not reachable, it will pick the change up on its next poll";
    }
}

int runDaemon(QCoreApplication &app, const Context &ctx)
{
    AutoResumeSettings settings;

    LogHandler::install(ctx.dataDir + QStringLiteral("/daemon.log"), static_cast<qint64>(settings.maxLogSizeMB()) * 1024 * 1024);

    ResumeDaemon daemon(&settings, ctx.dataDir);
    daemon.watchUnixSignals();
    QObject::connect(&daemon, &ResumeDaemon::stopped, &app, &QCoreApplication::quit);

    QString error;
    if (!daemon.start(&error)) {
        err() << "Error: " << error << "\n";
        return 1;
    }

    const int rc = app.exec();
    LogHandler::uninstall();
    return rc;
}

int showStatus(const Context &ctx)
{
    ControlClient client;
    QJsonObject response;
    if (!client.request(ctx.socketPath(), QStringLiteral("status"), QJsonObject(), &response, ctx.timeoutMs)) {
        RateLimitQueue queue(ctx.statusFile());
        const DetectionEvent next = queue.nextPending();
        const qint64 pid = ResumeDaemon::runningDaemonPid(ctx.pidFile());

        if (ctx.json) {
            QJsonObject status;
            status[QStringLiteral("daemon")] = pid > 0 ? QStringLiteral("unresponsive") : QStringLiteral("stopped");
            status[QStringLiteral("next_pending")] = next.isValid() ? QJsonValue(next.toJson()) : QJsonValue();
            printJson(status);
        } else if (pid > 0) {
            out() << "Daemon process " << pid << " exists but does not answer on " << ctx.socketPath() << "\n";
        } else {
            out() << "Daemon is not running\n";
            if (next.isValid()) {
                out() << "Pending rate limit, reset at " << localTime(next.resetTime) << "\n";
            }
        }
        return 1;
    }

    const QJsonObject status = response.value(QStringLiteral("data")).toObject();
    if (ctx.json) {
        printJson(status);
        return 0;
    }

    out() << "Daemon:      " << status.value(QStringLiteral("daemon")).toString() << " (PID " << status.value(QStringLiteral("pid")).toInteger()
          << ", up " << formatCountdown(status.value(QStringLiteral("uptime_sec")).toInteger()) << ")\n";
    out() << "State:       " << status.value(QStringLiteral("state")).toString();
    if (!status.value(QStringLiteral("event_id")).toString().isEmpty()) {
        out() << " [" << status.value(QStringLiteral("event_id")).toString() << "]";
    }
    out() << "\n";

    if (status.value(QStringLiteral("rate_limit_active")).toBool()) {
        out() << "Rate limit:  active, resets at " << localTime(status.value(QStringLiteral("reset_time")).toString()) << "\n";
    } else {
        out() << "Rate limit:  none\n";
    }

    const QJsonObject armed = status.value(QStringLiteral("armed")).toObject();
    if (!armed.isEmpty()) {
        out() << "Countdown:   " << formatCountdown(armed.value(QStringLiteral("countdown_sec")).toInteger()) << " until resume at "
              << localTime(armed.value(QStringLiteral("fire_at")).toString()) << "\n";
    }

    const QJsonObject queue = status.value(QStringLiteral("queue")).toObject();
    out() << "Queue:       " << queue.value(QStringLiteral("pending")).toInt() << " pending, " << queue.value(QStringLiteral("total")).toInt() << " total\n";
    return 0;
}

int listQueue(const Context &ctx)
{
    RateLimitQueue queue(ctx.statusFile());
    const QList<DetectionEvent> entries = queue.entries();

    if (ctx.json) {
        QJsonArray array;
        for (const DetectionEvent &entry : entries) {
            array.append(entry.toJson());
        }
        QJsonObject root;
        root[QStringLiteral("queue")] = array;
        root[QStringLiteral("last_hook_run")] = queue.lastHookRun();
        printJson(root);
        return 0;
    }

    if (entries.isEmpty()) {
        out() << "Queue is empty\n";
        return 0;
    }

    for (const DetectionEvent &entry : entries) {
        out() << entry.id << "  " << eventStatusToString(entry.status).leftJustified(9) << "  reset " << localTime(entry.resetTime);
        if (!entry.failureReason.isEmpty()) {
            out() << "  (" << entry.failureReason << ")";
        }
        if (!entry.completedAt.isEmpty()) {
            out() << "  completed " << localTime(entry.completedAt);
        }
        out() << "\n";
    }
    return 0;
}

int resetStale(const Context &ctx, int thresholdMinutes)
{
    RateLimitQueue queue(ctx.statusFile());
    const qint64 thresholdMs = thresholdMinutes > 0 ? static_cast<qint64>(thresholdMinutes) * 60 * 1000 : AutoResumeSettings().resumeConfig().staleThresholdMs;

    const int reset = queue.resetStaleEntries(thresholdMs);
    out() << "Reset " << reset << " stale detection(s)\n";
    if (reset > 0) {
        nudgeDaemon(ctx);
    }
    return 0;
}

int resumeNow(const Context &ctx, const QString &eventId)
{
    QJsonObject data;
    if (!eventId.isEmpty()) {
        data[QStringLiteral("event_id")] = eventId;
    }

    ControlClient client;
    QJsonObject response;
    if (!client.request(ctx.socketPath(), QStringLiteral("resume"), data, &response, ctx.timeoutMs)) {
        err() << "Error: daemon is not running\n";
        return 1;
    }
    if (!response.value(QStringLiteral("ok")).toBool()) {
        err() << "Error: " << response.value(QStringLiteral("error")).toString() << "\n";
        return 1;
    }
    out() << "Resume started for " << response.value(QStringLiteral("data")).toObject().value(QStringLiteral("event_id")).toString() << "\n";
    return 0;
}

int stopDaemon(const Context &ctx)
{
    const qint64 pid = ResumeDaemon::runningDaemonPid(ctx.pidFile());

    ControlClient client;
    QJsonObject response;
    const bool asked = client.request(ctx.socketPath(), QStringLiteral("stop"), QJsonObject(), &response, ctx.timeoutMs);

    if (pid <= 0) {
        out() << (asked ? "Daemon stopping\n" : "Daemon is not running\n");
        return 0;
    }

    if (!asked) {
        ::kill(static_cast<pid_t>(pid), SIGTERM);
    }

    for (int i = 0; i < 50; ++i) {
        if (!ProcessTree::isRunning(pid)) {
            out() << "Daemon stopped\n";
            return 0;
        }
        QThread::msleep(200);
    }

    err() << "Daemon did not stop gracefully, sending SIGKILL\n";
    if (::kill(static_cast<pid_t>(pid), SIGKILL) != 0) {
        err() << "Error: failed to kill " << pid << "\n";
        return 1;
    }
    QFile::remove(ctx.pidFile());
    return 0;
}

int watch(QCoreApplication &app, const Context &ctx)
{
    ControlClient client;
    QObject::connect(&client, &ControlClient::messageReceived, [&ctx](const QJsonObject &message) {
        if (ctx.json) {
            out() << QJsonDocument(message).toJson(QJsonDocument::Compact) << "\n";
        } else if (message.value(QStringLiteral("type")).toString() == QLatin1String("status")) {
            const QJsonObject status = message.value(QStringLiteral("data")).toObject();
            const QJsonObject armed = status.value(QStringLiteral("armed")).toObject();
            out() << localTime(message.value(QStringLiteral("timestamp")).toString()) << "  " << status.value(QStringLiteral("state")).toString();
            if (!armed.isEmpty()) {
                out() << "  countdown " << formatCountdown(armed.value(QStringLiteral("countdown_sec")).toInteger());
            }
            out() << "\n";
        } else if (message.contains(QStringLiteral("type"))) {
            out() << localTime(message.value(QStringLiteral("timestamp")).toString()) << "  " << message.value(QStringLiteral("type")).toString() << " "
                  << QJsonDocument(message.value(QStringLiteral("data")).toObject()).toJson(QJsonDocument::Compact) << "\n";
        }
        out().flush();
    });
    QObject::connect(&client, &ControlClient::disconnected, &app, &QCoreApplication::quit);

    if (!client.subscribe(ctx.socketPath(), ctx.timeoutMs)) {
        err() << "Error: daemon is not running\n";
        return 1;
    }
    return app.exec();
}

int showStats(const Context &ctx)
{
    AnalyticsCollector analytics(ctx.dataDir + QStringLiteral("/analytics.json"));
    const QJsonObject stats = analytics.statistics();
    const QJsonObject prediction = analytics.prediction();

    if (ctx.json) {
        QJsonObject root;
        root[QStringLiteral("statistics")] = stats;
        root[QStringLiteral("prediction")] = prediction;
        printJson(root);
        return 0;
    }

    const auto printPeriod = [&stats](const QString &key, const QString &label) {
        const QJsonObject period = stats.value(key).toObject();
        out() << label << period.value(QStringLiteral("rateLimitCount")).toInt() << " rate limits, " << period.value(QStringLiteral("resumeCount")).toInt() << " resumes, "
              << period.value(QStringLiteral("successRate")).toDouble() << "% successful\n";
    };
    printPeriod(QStringLiteral("last7Days"), QStringLiteral("Last 7 days:   "));
    printPeriod(QStringLiteral("last30Days"), QStringLiteral("Last 30 days:  "));
    printPeriod(QStringLiteral("allTime"), QStringLiteral("All time:      "));

    out() << prediction.value(QStringLiteral("message")).toString() << " (confidence: " << prediction.value(QStringLiteral("confidence")).toString() << ")\n";
    return 0;
}

int prune(const Context &ctx, int days)
{
    RateLimitQueue queue(ctx.statusFile());
    const int removed = queue.pruneTerminal(days);

    AnalyticsCollector analytics(ctx.dataDir + QStringLiteral("/analytics.json"));
    analytics.setRetentionDays(days);
    const int dropped = analytics.cleanup();

    out() << "Removed " << removed << " finished detection(s) and " << dropped << " analytics record(s) older than " << days << " day(s)\n";
    return 0;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("autoresumed"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Automatically resume Claude sessions after a rate limit resets"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("command"), QStringLiteral("daemon, status, queue, reset-stale, resume, stop, watch, stats or prune"));

    QCommandLineOption dataDirOption(QStringList() << QStringLiteral("d") << QStringLiteral("data-dir"),
                                     QStringLiteral("Directory holding status.json, daemon.sock and daemon.pid"),
                                     QStringLiteral("path"));
    parser.addOption(dataDirOption);

    QCommandLineOption jsonOption(QStringList() << QStringLiteral("j") << QStringLiteral("json"), QStringLiteral("Print machine readable JSON"));
    parser.addOption(jsonOption);

    QCommandLineOption eventOption(QStringList() << QStringLiteral("e") << QStringLiteral("event"), QStringLiteral("Event to resume (resume)"), QStringLiteral("id"));
    parser.addOption(eventOption);

    QCommandLineOption daysOption(QStringLiteral("days"), QStringLiteral("Retention in days (prune, default: 30)"), QStringLiteral("n"), QStringLiteral("30"));
    parser.addOption(daysOption);

    QCommandLineOption thresholdOption(QStringLiteral("threshold-minutes"),
                                       QStringLiteral("Staleness threshold (reset-stale, default: configured)"),
                                       QStringLiteral("minutes"));
    parser.addOption(thresholdOption);

    QCommandLineOption timeoutOption(QStringList() << QStringLiteral("t") << QStringLiteral("timeout"),
                                     QStringLiteral("Control socket timeout in milliseconds (default: 3000)"),
                                     QStringLiteral("ms"),
                                     QStringLiteral("3000"));
    parser.addOption(timeoutOption);

    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(1);
    }

    Context ctx;
    ctx.dataDir = parser.isSet(dataDirOption) ? QDir(parser.value(dataDirOption)).absolutePath() : AutoResumeSettings::dataDirectory();
    ctx.json = parser.isSet(jsonOption);
    ctx.timeoutMs = parser.value(timeoutOption).toInt();
    QDir().mkpath(ctx.dataDir);

    const QString command = args.first();
    if (command == QLatin1String("daemon")) {
        return runDaemon(app, ctx);
    } else if (command == QLatin1String("status")) {
        return showStatus(ctx);
    } else if (command == QLatin1String("queue")) {
        return listQueue(ctx);
    } else if (command == QLatin1String("reset-stale")) {
        return resetStale(ctx, parser.value(thresholdOption).toInt());
    } else if (command == QLatin1String("resume")) {
        return resumeNow(ctx, parser.value(eventOption));
    } else if (command == QLatin1String("stop")) {
        return stopDaemon(ctx);
    } else if (command == QLatin1String("watch")) {
        return watch(app, ctx);
    } else if (command == QLatin1String("stats")) {
        return showStats(ctx);
    } else if (command == QLatin1String("prune")) {
        return prune(ctx, qMax(1, parser.value(daysOption).toInt()));
    }

    err() << "Error: unknown command '" << command << "'\n";
    return 1;
}
