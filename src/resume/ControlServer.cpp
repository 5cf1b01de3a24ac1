/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "ControlServer.h"
#include "AutoResumeSettings.h"

#include <QDebug>
#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>

namespace AutoResume
{

ControlServer::ControlServer(const QString &socketPath, QObject *parent)
    : QObject(parent)
    , m_socketPath(socketPath.isEmpty() ? defaultSocketPath() : socketPath)
{
}

ControlServer::~ControlServer()
{
    stop();
}

QString ControlServer::defaultSocketPath()
{
    return AutoResumeSettings::dataDirectory() + QStringLiteral("/daemon.sock");
}

bool ControlServer::start()
{
    if (m_server && m_server->isListening()) {
        return true;
    }

    QDir().mkpath(QFileInfo(m_socketPath).absolutePath());

    // Left behind by a daemon that did not shut down cleanly
    if (QFile::exists(m_socketPath)) {
        QLocalServer::removeServer(m_socketPath);
    }

    m_server = new QLocalServer(this);
    m_server->setSocketOptions(QLocalServer::UserAccessOption);

    connect(m_server, &QLocalServer::newConnection, this, &ControlServer::onNewConnection);

    if (!m_server->listen(m_socketPath)) {
        qWarning() << "ControlServer::start() - Failed to listen on" << m_socketPath << m_server->errorString();
        Q_EMIT errorOccurred(QStringLiteral("Failed to start control server: ") + m_server->errorString());
        delete m_server;
        m_server = nullptr;
        return false;
    }

    qDebug() << "ControlServer::start() - Listening on" << m_socketPath;
    return true;
}

void ControlServer::stop()
{
    if (m_server) {
        m_server->close();
        delete m_server;
        m_server = nullptr;
    }

    for (QLocalSocket *client : std::as_const(m_clients)) {
        client->disconnect(this);
        client->disconnectFromServer();
        client->deleteLater();
    }
    m_clients.clear();
    m_subscribers.clear();

    if (QFile::exists(m_socketPath)) {
        QFile::remove(m_socketPath);
    }
}

bool ControlServer::isRunning() const
{
    return m_server && m_server->isListening();
}

void ControlServer::setHandler(const QString &command, Handler handler)
{
    m_handlers.insert(command, std::move(handler));
}

QStringList ControlServer::commands() const
{
    QStringList names = m_handlers.keys();
    names.append(QStringLiteral("subscribe"));
    names.sort();
    return names;
}

int ControlServer::subscriberCount() const
{
    return m_subscribers.size();
}

QByteArray ControlServer::encode(const QJsonObject &message)
{
    return QJsonDocument(message).toJson(QJsonDocument::Compact) + '\n';
}

void ControlServer::publish(const QJsonObject &message)
{
    if (m_subscribers.isEmpty()) {
        return;
    }
    const QByteArray data = encode(message);
    for (QLocalSocket *client : std::as_const(m_subscribers)) {
        client->write(data);
    }
}

void ControlServer::onNewConnection()
{
    while (m_server->hasPendingConnections()) {
        QLocalSocket *client = m_server->nextPendingConnection();
        if (!client) {
            continue;
        }
        m_clients.insert(client);
        connect(client, &QLocalSocket::readyRead, this, &ControlServer::onClientReadyRead);
        connect(client, &QLocalSocket::disconnected, this, &ControlServer::onClientDisconnected);
    }
}

void ControlServer::onClientReadyRead()
{
    QLocalSocket *client = qobject_cast<QLocalSocket *>(sender());
    if (!client) {
        return;
    }

    while (client->canReadLine()) {
        const QByteArray line = client->readLine().trimmed();
        if (line.isEmpty()) {
            continue;
        }
        client->write(encode(handleRequest(line, client)));
    }
}

void ControlServer::onClientDisconnected()
{
    QLocalSocket *client = qobject_cast<QLocalSocket *>(sender());
    if (client) {
        m_clients.remove(client);
        m_subscribers.remove(client);
        client->deleteLater();
    }
}

QJsonObject ControlServer::handleRequest(const QByteArray &line, QLocalSocket *client)
{
    QJsonObject response;
    response[QStringLiteral("ok")] = false;

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(line, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        response[QStringLiteral("error")] = QStringLiteral("Failed to parse request: ") + parseError.errorString();
        Q_EMIT errorOccurred(response[QStringLiteral("error")].toString());
        return response;
    }

    const QJsonObject request = doc.object();
    const QString command = request.value(QStringLiteral("command")).toString();
    response[QStringLiteral("command")] = command;

    if (command == QLatin1String("subscribe")) {
        if (client) {
            m_subscribers.insert(client);
        }
        response[QStringLiteral("ok")] = true;
        return response;
    }

    const auto handler = m_handlers.constFind(command);
    if (handler == m_handlers.cend()) {
        response[QStringLiteral("error")] = QStringLiteral("Unknown command: %1").arg(command);
        return response;
    }

    QJsonObject result;
    QString error;
    const bool ok = handler.value()(request.value(QStringLiteral("data")).toObject(), &result, &error);
    response[QStringLiteral("ok")] = ok;
    if (ok) {
        response[QStringLiteral("data")] = result;
    } else {
        response[QStringLiteral("error")] = error.isEmpty() ? QStringLiteral("%1 failed").arg(command) : error;
    }
    return response;
}

// ============================================================================
// ControlClient
// ============================================================================

ControlClient::ControlClient(QObject *parent)
    : QObject(parent)
    , m_socket(new QLocalSocket(this))
{
    connect(m_socket, &QLocalSocket::disconnected, this, &ControlClient::disconnected);
}

ControlClient::~ControlClient() = default;

bool ControlClient::request(const QString &socketPath, const QString &command, const QJsonObject &data, QJsonObject *response, int timeoutMs)
{
    QElapsedTimer timer;
    timer.start();

    m_socket->connectToServer(socketPath);
    if (!m_socket->waitForConnected(timeoutMs)) {
        return false;
    }

    QJsonObject msg;
    msg[QStringLiteral("command")] = command;
    msg[QStringLiteral("data")] = data;
    m_socket->write(QJsonDocument(msg).toJson(QJsonDocument::Compact) + '\n');
    if (!m_socket->waitForBytesWritten(timeoutMs)) {
        m_socket->disconnectFromServer();
        return false;
    }

    while (!m_socket->canReadLine()) {
        const qint64 remaining = timeoutMs - timer.elapsed();
        if (remaining <= 0 || !m_socket->waitForReadyRead(static_cast<int>(remaining))) {
            m_socket->disconnectFromServer();
            return false;
        }
    }

    const QJsonDocument doc = QJsonDocument::fromJson(m_socket->readLine());
    m_socket->disconnectFromServer();
    if (!doc.isObject()) {
        return false;
    }
    if (response) {
        *response = doc.object();
    }
    return true;
}

bool ControlClient::subscribe(const QString &socketPath, int timeoutMs)
{
    m_socket->connectToServer(socketPath);
    if (!m_socket->waitForConnected(timeoutMs)) {
        return false;
    }

    connect(m_socket, &QLocalSocket::readyRead, this, [this]() {
        while (m_socket->canReadLine()) {
            const QJsonDocument doc = QJsonDocument::fromJson(m_socket->readLine());
            if (doc.isObject()) {
                Q_EMIT messageReceived(doc.object());
            }
        }
    });

    QJsonObject msg;
    msg[QStringLiteral("command")] = QStringLiteral("subscribe");
    m_socket->write(QJsonDocument(msg).toJson(QJsonDocument::Compact) + '\n');
    return m_socket->waitForBytesWritten(timeoutMs);
}

bool ControlClient::isDaemonReachable(const QString &socketPath, int timeoutMs)
{
    QLocalSocket socket;
    socket.connectToServer(socketPath);
    const bool reachable = socket.waitForConnected(timeoutMs);
    socket.disconnectFromServer();
    return reachable;
}

} // namespace AutoResume

#include "moc_ControlServer.cpp"
