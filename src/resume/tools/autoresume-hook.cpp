/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later

    autoresume-hook - hand a rate limit detection to the auto-resume daemon

    Called by the detector when it sees a rate limit message. The detection
    is appended to status.json and the daemon, if running, is nudged over its
    control socket. Calling it again for the same reset time is harmless.

    Usage:
        autoresume-hook < detection.json
        autoresume-hook --reset-time <iso> [--timezone <tz>] [--message <text>]
                        [--pid <claude pid>] [--transcript <path>]

    The stdin document uses the keys reset_time, timezone, message,
    claude_pid and transcript_path. Options override stdin values.
*/

#include "AutoResumeSettings.h"
#include "ControlServer.h"
#include "DetectionEvent.h"
#include "ProcessTree.h"
#include "RateLimitQueue.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTextStream>

#include <unistd.h>

using namespace AutoResume;

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("autoresume-hook"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Queue a rate limit detection for the auto-resume daemon"));
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption resetOption(QStringList() << QStringLiteral("r") << QStringLiteral("reset-time"),
                                   QStringLiteral("ISO-8601 time the rate limit resets"),
                                   QStringLiteral("time"));
    parser.addOption(resetOption);

    QCommandLineOption timezoneOption(QStringLiteral("timezone"), QStringLiteral("Timezone named in the message"), QStringLiteral("tz"));
    parser.addOption(timezoneOption);

    QCommandLineOption messageOption(QStringList() << QStringLiteral("m") << QStringLiteral("message"),
                                     QStringLiteral("Detected rate limit text"),
                                     QStringLiteral("text"));
    parser.addOption(messageOption);

    QCommandLineOption pidOption(QStringList() << QStringLiteral("p") << QStringLiteral("pid"), QStringLiteral("PID of the Claude process"), QStringLiteral("pid"));
    parser.addOption(pidOption);

    QCommandLineOption transcriptOption(QStringLiteral("transcript"), QStringLiteral("Transcript file of the session"), QStringLiteral("path"));
    parser.addOption(transcriptOption);

    QCommandLineOption dataDirOption(QStringList() << QStringLiteral("d") << QStringLiteral("data-dir"),
                                     QStringLiteral("Directory holding status.json and daemon.sock"),
                                     QStringLiteral("path"));
    parser.addOption(dataDirOption);

    QCommandLineOption timeoutOption(QStringList() << QStringLiteral("t") << QStringLiteral("timeout"),
                                     QStringLiteral("Connection timeout in milliseconds (default: 2000)"),
                                     QStringLiteral("ms"),
                                     QStringLiteral("2000"));
    parser.addOption(timeoutOption);

    parser.process(app);

    QTextStream err(stderr);

    // Read detection from stdin when it is not a terminal
    QJsonObject input;
    if (!isatty(STDIN_FILENO)) {
        QFile stdinFile;
        if (stdinFile.open(stdin, QIODevice::ReadOnly)) {
            const QByteArray stdinData = stdinFile.readAll();
            stdinFile.close();

            if (!stdinData.trimmed().isEmpty()) {
                QJsonParseError error;
                const QJsonDocument doc = QJsonDocument::fromJson(stdinData, &error);
                if (error.error != QJsonParseError::NoError || !doc.isObject()) {
                    err << "Error: stdin is not a JSON object: " << error.errorString() << "\n";
                    return 1;
                }
                input = doc.object();
            }
        }
    }

    Detection detection = Detection::fromJson(input);
    if (parser.isSet(resetOption)) {
        detection.resetTime = parser.value(resetOption);
    }
    if (parser.isSet(timezoneOption)) {
        detection.timezone = parser.value(timezoneOption);
    }
    if (parser.isSet(messageOption)) {
        detection.message = parser.value(messageOption);
    }
    if (parser.isSet(pidOption)) {
        detection.claudePid = parser.value(pidOption).toLongLong();
    }
    if (parser.isSet(transcriptOption)) {
        detection.transcriptPath = parser.value(transcriptOption);
    }

    if (detection.resetTime.isEmpty()) {
        err << "Error: no reset time given (reset_time on stdin or --reset-time)\n";
        return 1;
    }
    if (!parseTimestamp(detection.resetTime).isValid()) {
        err << "Error: reset time '" << detection.resetTime << "' is not an ISO-8601 timestamp\n";
        return 1;
    }

    // The detector usually runs as a child of the Claude process
    if (detection.claudePid <= 0) {
        detection.claudePid = ProcessTree::findClaudePid(getppid());
    }

    const QString dataDir = parser.isSet(dataDirOption) ? QDir(parser.value(dataDirOption)).absolutePath() : AutoResumeSettings::dataDirectory();
    QDir().mkpath(dataDir);

    RateLimitQueue queue(dataDir + QStringLiteral("/status.json"));
    DetectionEvent added;
    if (queue.addDetection(detection, &added)) {
        QTextStream out(stdout);
        out << added.id << "\n";
    }

    // No daemon running; it picks the entry up at start
    const QString socketPath = dataDir + QStringLiteral("/daemon.sock");
    if (!QFileInfo::exists(socketPath)) {
        return 0;
    }

    ControlClient client;
    QJsonObject response;
    if (!client.request(socketPath, QStringLiteral("detection"), QJsonObject(), &response, parser.value(timeoutOption).toInt())) {
        // Stale socket; the entry is already on disk
        return 0;
    }
    if (!response.value(QStringLiteral("ok")).toBool()) {
        err << "Warning: daemon rejected nudge: " << response.value(QStringLiteral("error")).toString() << "\n";
    }
    return 0;
}
