#include "socketlistener.h"
#include "connectionmanager.h"
#include "tabbridgelogger.h"
#include "bridge_errors.h"

SocketListener::SocketListener(quint16 port, const TabBridgeCommon::PortEvictionOptions& eviction,
                               ConnectionManager& connections, TabBridgeLogger& logger, QObject* parent)
    : QObject(parent)
    , m_port(port)
    , m_eviction(eviction)
    , m_connections(connections)
    , m_logger(logger)
    , m_server(new QWebSocketServer(QStringLiteral("tabbridge"), QWebSocketServer::NonSecureMode, this))
{
    connect(m_server, &QWebSocketServer::newConnection, this, &SocketListener::onNewConnection);
    connect(m_server, &QWebSocketServer::acceptError, this, &SocketListener::onAcceptError);
    connect(m_server, &QWebSocketServer::serverError, this, [this](QWebSocketProtocol::CloseCode closeCode) {
        QString message = QString("WebSocket server error %1: %2")
            .arg(static_cast<int>(closeCode))
            .arg(m_server->errorString());
        m_logger.error(message);
        emit serverError(message);
    });
}

SocketListener::~SocketListener()
{
    close();
}

void SocketListener::listen()
{
    if (m_server->isListening()) {
        return;
    }

    TabBridgeCommon::ensurePortFree(m_port, m_eviction, m_logger);

    if (!m_server->listen(QHostAddress::LocalHost, m_port)) {
        QString message = QString("Failed to listen on WebSocket port %1: %2")
            .arg(m_port)
            .arg(m_server->errorString());
        if (m_port != 0 && !TabBridgeCommon::isPortAvailable(m_port)) {
            throw TabBridgeCommon::PortConflictError(message);
        }
        throw TabBridgeCommon::TransportError(message);
    }

    m_logger.info(QString("WebSocket server listening on ws://localhost:%1").arg(port()));
}

void SocketListener::close()
{
    if (m_server->isListening()) {
        m_server->close();
        m_logger.debug(QString("WebSocket server on port %1 closed").arg(m_port));
    }
}

bool SocketListener::isListening() const
{
    return m_server->isListening();
}

quint16 SocketListener::port() const
{
    return m_server->isListening() ? m_server->serverPort() : m_port;
}

void SocketListener::onNewConnection()
{
    // Assignment happens right here, with no event loop turn in between,
    // so two racing connections cannot both end up current
    while (m_server->hasPendingConnections()) {
        QWebSocket* socket = m_server->nextPendingConnection();
        if (socket) {
            m_connections.setConnection(socket);
        }
    }
}

void SocketListener::onAcceptError(QAbstractSocket::SocketError error)
{
    QString message = QString("WebSocket accept error %1: %2").arg(static_cast<int>(error)).arg(m_server->errorString());
    m_logger.warning(message);
    emit serverError(message);
}
