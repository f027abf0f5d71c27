#ifndef SOCKETLISTENER_H
#define SOCKETLISTENER_H

#include <QObject>
#include <QWebSocketServer>
#include "common.h"

class ConnectionManager;
class TabBridgeLogger;

// Accepts browser extension WebSocket connections on the well-known port
// and hands each one straight to the ConnectionManager.
class SocketListener : public QObject
{
    Q_OBJECT

public:
    SocketListener(quint16 port, const TabBridgeCommon::PortEvictionOptions& eviction,
                   ConnectionManager& connections, TabBridgeLogger& logger, QObject* parent = nullptr);
    ~SocketListener();

    // Throws PortConflictError if the port cannot be claimed
    void listen();
    void close();

    bool isListening() const;
    quint16 port() const;

signals:
    void serverError(const QString& message);

private slots:
    void onNewConnection();
    void onAcceptError(QAbstractSocket::SocketError error);

private:
    quint16 m_port;
    TabBridgeCommon::PortEvictionOptions m_eviction;
    ConnectionManager& m_connections;
    TabBridgeLogger& m_logger;
    QWebSocketServer* m_server;
};

#endif // SOCKETLISTENER_H
