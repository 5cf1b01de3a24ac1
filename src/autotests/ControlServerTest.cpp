/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "ControlServerTest.h"

// Qt
#include <QFile>
#include <QJsonDocument>
#include <QLocalSocket>
#include <QSignalSpy>
#include <QStandardPaths>
#include <QTemporaryDir>
#include <QTest>
#include <QThread>

// AutoResume
#include "../resume/ControlServer.h"

#include <memory>

using namespace AutoResume;

static void addEchoHandler(ControlServer &server)
{
    server.setHandler(QStringLiteral("echo"), [](const QJsonObject &data, QJsonObject *result, QString *) {
        *result = data;
        return true;
    });
}

static QByteArray requestLine(const QString &command, const QJsonObject &data = QJsonObject())
{
    QJsonObject request;
    request[QStringLiteral("command")] = command;
    request[QStringLiteral("data")] = data;
    return QJsonDocument(request).toJson(QJsonDocument::Compact);
}

void ControlServerTest::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
}

void ControlServerTest::testHandleKnownCommand()
{
    ControlServer server(QStringLiteral("/nonexistent/daemon.sock"));
    addEchoHandler(server);

    QJsonObject data;
    data[QStringLiteral("event_id")] = QStringLiteral("evt-1");
    const QJsonObject response = server.handleRequest(requestLine(QStringLiteral("echo"), data));

    QVERIFY(response.value(QStringLiteral("ok")).toBool());
    QCOMPARE(response.value(QStringLiteral("command")).toString(), QStringLiteral("echo"));
    QCOMPARE(response.value(QStringLiteral("data")).toObject(), data);
    QVERIFY(!response.contains(QStringLiteral("error")));
}

void ControlServerTest::testHandleFailingCommand()
{
    ControlServer server(QStringLiteral("/nonexistent/daemon.sock"));
    server.setHandler(QStringLiteral("resume"), [](const QJsonObject &, QJsonObject *, QString *error) {
        *error = QStringLiteral("A resume attempt is already running");
        return false;
    });
    server.setHandler(QStringLiteral("quiet"), [](const QJsonObject &, QJsonObject *, QString *) {
        return false;
    });

    QJsonObject response = server.handleRequest(requestLine(QStringLiteral("resume")));
    QVERIFY(!response.value(QStringLiteral("ok")).toBool());
    QCOMPARE(response.value(QStringLiteral("error")).toString(), QStringLiteral("A resume attempt is already running"));

    response = server.handleRequest(requestLine(QStringLiteral("quiet")));
    QCOMPARE(response.value(QStringLiteral("error")).toString(), QStringLiteral("quiet failed"));
}

void ControlServerTest::testHandleUnknownCommand()
{
    ControlServer server(QStringLiteral("/nonexistent/daemon.sock"));
    const QJsonObject response = server.handleRequest(requestLine(QStringLiteral("explode")));

    QVERIFY(!response.value(QStringLiteral("ok")).toBool());
    QCOMPARE(response.value(QStringLiteral("error")).toString(), QStringLiteral("Unknown command: explode"));
}

void ControlServerTest::testHandleMalformedRequest()
{
    ControlServer server(QStringLiteral("/nonexistent/daemon.sock"));
    QSignalSpy errorSpy(&server, &ControlServer::errorOccurred);

    QJsonObject response = server.handleRequest("{ not json");
    QVERIFY(!response.value(QStringLiteral("ok")).toBool());
    QVERIFY(response.value(QStringLiteral("error")).toString().startsWith(QStringLiteral("Failed to parse request")));
    QCOMPARE(errorSpy.count(), 1);

    response = server.handleRequest("[1, 2]");
    QVERIFY(!response.value(QStringLiteral("ok")).toBool());
}

void ControlServerTest::testCommandsList()
{
    ControlServer server(QStringLiteral("/nonexistent/daemon.sock"));
    addEchoHandler(server);
    server.setHandler(QStringLiteral("status"), [](const QJsonObject &, QJsonObject *, QString *) {
        return true;
    });

    QCOMPARE(server.commands(), (QStringList{QStringLiteral("echo"), QStringLiteral("status"), QStringLiteral("subscribe")}));
}

void ControlServerTest::testStartStop()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("run/daemon.sock"));

    ControlServer server(path);
    QVERIFY(!server.isRunning());
    QVERIFY(server.start());
    QVERIFY(server.isRunning());
    QVERIFY(QFile::exists(path));

    // Second start is a no-op
    QVERIFY(server.start());

    server.stop();
    QVERIFY(!server.isRunning());
    QVERIFY(!QFile::exists(path));
}

void ControlServerTest::testStartReplacesStaleSocket()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("daemon.sock"));

    QFile stale(path);
    QVERIFY(stale.open(QIODevice::WriteOnly));
    stale.close();

    ControlServer server(path);
    QVERIFY(server.start());
    QVERIFY(ControlClient::isDaemonReachable(path));
}

void ControlServerTest::testRequestOverSocket()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    ControlServer server(dir.filePath(QStringLiteral("daemon.sock")));
    addEchoHandler(server);
    QVERIFY(server.start());

    QLocalSocket socket;
    socket.connectToServer(server.socketPath());
    QTRY_COMPARE(socket.state(), QLocalSocket::ConnectedState);

    QJsonObject data;
    data[QStringLiteral("n")] = 1;
    socket.write(requestLine(QStringLiteral("echo"), data) + '\n' + requestLine(QStringLiteral("nope")) + '\n');

    QByteArray lines;
    QTRY_VERIFY_WITH_TIMEOUT((lines += socket.readAll()).count('\n') >= 2, 3000);

    const QList<QByteArray> replies = lines.trimmed().split('\n');
    QCOMPARE(replies.size(), 2);
    const QJsonObject first = QJsonDocument::fromJson(replies.at(0)).object();
    QVERIFY(first.value(QStringLiteral("ok")).toBool());
    QCOMPARE(first.value(QStringLiteral("data")).toObject(), data);
    const QJsonObject second = QJsonDocument::fromJson(replies.at(1)).object();
    QVERIFY(!second.value(QStringLiteral("ok")).toBool());
}

void ControlServerTest::testBlockingClientRequest()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    ControlServer server(dir.filePath(QStringLiteral("daemon.sock")));
    addEchoHandler(server);
    QVERIFY(server.start());

    // The client blocks, so it needs its own thread while this one serves
    bool ok = false;
    QJsonObject response;
    const QString path = server.socketPath();
    std::unique_ptr<QThread> thread(QThread::create([&ok, &response, path]() {
        ControlClient client;
        QJsonObject data;
        data[QStringLiteral("greeting")] = QStringLiteral("hello");
        ok = client.request(path, QStringLiteral("echo"), data, &response, 3000);
    }));
    thread->start();

    QTRY_VERIFY_WITH_TIMEOUT(thread->isFinished(), 5000);
    QVERIFY(ok);
    QVERIFY(response.value(QStringLiteral("ok")).toBool());
    QCOMPARE(response.value(QStringLiteral("data")).toObject().value(QStringLiteral("greeting")).toString(), QStringLiteral("hello"));
}

void ControlServerTest::testSubscribeReceivesPublished()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    ControlServer server(dir.filePath(QStringLiteral("daemon.sock")));
    QVERIFY(server.start());

    ControlClient client;
    QSignalSpy messageSpy(&client, &ControlClient::messageReceived);
    QVERIFY(client.subscribe(server.socketPath()));

    // Acknowledgement of the subscribe request
    QTRY_COMPARE_WITH_TIMEOUT(messageSpy.count(), 1, 3000);
    QCOMPARE(messageSpy.at(0).at(0).toJsonObject().value(QStringLiteral("command")).toString(), QStringLiteral("subscribe"));
    QCOMPARE(server.subscriberCount(), 1);

    QJsonObject status;
    status[QStringLiteral("type")] = QStringLiteral("status");
    server.publish(status);

    QTRY_COMPARE_WITH_TIMEOUT(messageSpy.count(), 2, 3000);
    QCOMPARE(messageSpy.at(1).at(0).toJsonObject().value(QStringLiteral("type")).toString(), QStringLiteral("status"));
}

void ControlServerTest::testSubscriberDropsOnDisconnect()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    ControlServer server(dir.filePath(QStringLiteral("daemon.sock")));
    QVERIFY(server.start());

    {
        ControlClient client;
        QVERIFY(client.subscribe(server.socketPath()));
        QTRY_COMPARE_WITH_TIMEOUT(server.subscriberCount(), 1, 3000);
    }

    QTRY_COMPARE_WITH_TIMEOUT(server.subscriberCount(), 0, 3000);

    // Publishing to nobody is harmless
    server.publish(QJsonObject());
}

void ControlServerTest::testUnreachableDaemon()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("daemon.sock"));

    QVERIFY(!ControlClient::isDaemonReachable(path, 200));

    ControlClient client;
    QJsonObject response;
    response[QStringLiteral("untouched")] = true;
    QVERIFY(!client.request(path, QStringLiteral("status"), QJsonObject(), &response, 200));
    QVERIFY(response.value(QStringLiteral("untouched")).toBool());
}

QTEST_GUILESS_MAIN(ControlServerTest)

#include "moc_ControlServerTest.cpp"
