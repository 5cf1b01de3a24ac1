/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef CONTROLSERVER_H
#define CONTROLSERVER_H

#include "autoresume_export.h"

#include <QHash>
#include <QJsonObject>
#include <QLocalServer>
#include <QLocalSocket>
#include <QObject>
#include <QSet>
#include <QString>

#include <functional>

namespace AutoResume
{

/**
 * ControlServer is the daemon's local command socket.
 *
 * Listens with QLocalServer at <data>/daemon.sock. Clients send one JSON
 * object per line:
 *
 *   {"command": "status", "data": {...}}
 *
 * and get one line back: {"ok": true, "command": ..., "data": {...}} or
 * {"ok": false, "command": ..., "error": "..."}.
 *
 * A client that sends "subscribe" stays connected and receives every
 * message passed to publish().
 */
class AUTORESUME_EXPORT ControlServer : public QObject
{
    Q_OBJECT

public:
    /**
     * Returns false and sets error to fail the command
     */
    using Handler = std::function<bool(const QJsonObject &data, QJsonObject *result, QString *error)>;

    explicit ControlServer(const QString &socketPath = QString(), QObject *parent = nullptr);
    ~ControlServer() override;

    static QString defaultSocketPath();

    QString socketPath() const
    {
        return m_socketPath;
    }

    /**
     * Start the server
     *
     * @return true if started successfully
     */
    bool start();

    /**
     * Stop the server and drop all clients
     */
    void stop();

    bool isRunning() const;

    void setHandler(const QString &command, Handler handler);
    QStringList commands() const;

    int subscriberCount() const;

    /**
     * Send message to every subscriber
     */
    void publish(const QJsonObject &message);

    /**
     * Parse one request line and produce the response for it
     */
    QJsonObject handleRequest(const QByteArray &line, QLocalSocket *client = nullptr);

Q_SIGNALS:
    void errorOccurred(const QString &message);

private Q_SLOTS:
    void onNewConnection();
    void onClientReadyRead();
    void onClientDisconnected();

private:
    static QByteArray encode(const QJsonObject &message);

    QString m_socketPath;
    QLocalServer *m_server = nullptr;
    QSet<QLocalSocket *> m_clients;
    QSet<QLocalSocket *> m_subscribers;
    QHash<QString, Handler> m_handlers;
};

/**
 * ControlClient talks to a running daemon.
 *
 * request() blocks for at most the given timeout, which suits the CLI and
 * the detector hook; subscribe() is asynchronous and reports through
 * messageReceived().
 */
class AUTORESUME_EXPORT ControlClient : public QObject
{
    Q_OBJECT

public:
    explicit ControlClient(QObject *parent = nullptr);
    ~ControlClient() override;

    /**
     * Send command and wait for the reply line. Returns false if the
     * daemon is unreachable or does not answer in time; response is then
     * untouched.
     */
    bool request(const QString &socketPath, const QString &command, const QJsonObject &data, QJsonObject *response, int timeoutMs = 3000);

    /**
     * Connect, subscribe and keep listening
     */
    bool subscribe(const QString &socketPath, int timeoutMs = 3000);

    /**
     * Check whether a daemon is listening at socketPath
     */
    static bool isDaemonReachable(const QString &socketPath, int timeoutMs = 500);

Q_SIGNALS:
    void messageReceived(const QJsonObject &message);
    void disconnected();

private:
    QLocalSocket *m_socket = nullptr;
};

} // namespace AutoResume

#endif // CONTROLSERVER_H
