#ifndef CONNECTIONMANAGER_H
#define CONNECTIONMANAGER_H

#include <QObject>
#include <QWebSocket>
#include <QJsonValue>
#include <QPointer>
#include <QTimer>
#include <memory>
#include "messagecorrelator.h"

class TabBridgeLogger;

// Owner of the one current extension socket. Every tool call goes through
// call(); setConnection() is the only place the socket changes.
class ConnectionManager : public QObject
{
    Q_OBJECT

public:
    using ResponseCallback = MessageCorrelator::ResponseCallback;

    ConnectionManager(TabBridgeLogger& logger, int defaultTimeoutMs = MessageCorrelator::DEFAULT_TIMEOUT_MS,
                      int pingIntervalMs = 30000, QObject* parent = nullptr);
    ~ConnectionManager();

    bool hasConnection() const;

    // The callback runs exactly once, possibly before call() returns when the
    // call cannot be sent. Concurrent calls settle in whatever order the
    // extension answers them.
    void call(const QString& type, const QJsonValue& payload, ResponseCallback callback);
    void call(const QString& type, const QJsonValue& payload, int timeoutMs, ResponseCallback callback);

    // Install a freshly accepted socket. Any previous socket has its pending
    // calls failed and is closed before the new one becomes current.
    void setConnection(QWebSocket* socket);

    // Drop the current socket, failing its pending calls
    void closeConnection();

    int pendingCount() const;
    int defaultTimeoutMs() const { return m_defaultTimeoutMs; }
    QString peerDescription() const;

    static const char* notConnectedMessage();

    // Error text the extension answers with when no tab is attached to it
    static constexpr const char* EXTENSION_NO_TAB_ERROR = "No tab is connected";

signals:
    void connected();
    void connectionLost();

private slots:
    void onSocketDisconnected();
    void onPingTimeout();

private:
    void releaseCurrent(const QString& reason);

    TabBridgeLogger& m_logger;
    QPointer<QWebSocket> m_socket;
    std::unique_ptr<MessageCorrelator> m_correlator;
    QTimer* m_pingTimer;
    int m_defaultTimeoutMs;
};

#endif // CONNECTIONMANAGER_H
