#include "connectionmanager.h"
#include "common.h"
#include "tabbridgelogger.h"

using TabBridgeCommon::CallError;
using TabBridgeCommon::ErrorKind;

ConnectionManager::ConnectionManager(TabBridgeLogger& logger, int defaultTimeoutMs, int pingIntervalMs, QObject* parent)
    : QObject(parent)
    , m_logger(logger)
    , m_pingTimer(new QTimer(this))
    , m_defaultTimeoutMs(defaultTimeoutMs)
{
    m_pingTimer->setInterval(pingIntervalMs);
    connect(m_pingTimer, &QTimer::timeout, this, &ConnectionManager::onPingTimeout);
}

ConnectionManager::~ConnectionManager()
{
    releaseCurrent("Bridge shutting down");
}

const char* ConnectionManager::notConnectedMessage()
{
    return "No tab is connected. Open the browser extension and click Connect on the tab you want to automate.";
}

bool ConnectionManager::hasConnection() const
{
    return m_socket && m_correlator && m_socket->state() == QAbstractSocket::ConnectedState;
}

int ConnectionManager::pendingCount() const
{
    return m_correlator ? m_correlator->pendingCount() : 0;
}

QString ConnectionManager::peerDescription() const
{
    if (!m_socket) {
        return QString();
    }
    return QString("%1:%2").arg(m_socket->peerAddress().toString()).arg(m_socket->peerPort());
}

void ConnectionManager::call(const QString& type, const QJsonValue& payload, ResponseCallback callback)
{
    call(type, payload, m_defaultTimeoutMs, std::move(callback));
}

void ConnectionManager::call(const QString& type, const QJsonValue& payload, int timeoutMs, ResponseCallback callback)
{
    if (TabBridgeCommon::isTerminationRequested()) {
        callback(QJsonValue(), CallError::make(ErrorKind::Transport, "Bridge is shutting down"));
        return;
    }

    if (!hasConnection()) {
        callback(QJsonValue(), CallError::make(ErrorKind::NotConnected, notConnectedMessage()));
        return;
    }

    // A connected extension with no attached tab is the same condition as no
    // extension at all for the caller
    auto translated = [callback = std::move(callback)](const QJsonValue& result, const CallError& error) {
        if (error.kind == ErrorKind::Remote && error.message == QLatin1String(EXTENSION_NO_TAB_ERROR)) {
            callback(QJsonValue(), CallError::make(ErrorKind::NotConnected, notConnectedMessage()));
            return;
        }
        callback(result, error);
    };

    m_correlator->call(type, payload, timeoutMs > 0 ? timeoutMs : m_defaultTimeoutMs, std::move(translated));
}

void ConnectionManager::setConnection(QWebSocket* socket)
{
    if (!socket) {
        return;
    }

    if (m_socket || m_correlator) {
        m_logger.info("New extension connection replaces the current one");
        releaseCurrent("Connection replaced by a new extension connection");
    }

    m_socket = socket;
    m_correlator = std::make_unique<MessageCorrelator>(socket, m_logger);
    connect(socket, &QWebSocket::disconnected, this, &ConnectionManager::onSocketDisconnected);
    m_pingTimer->start();

    m_logger.info(QString("Browser extension connected from %1").arg(peerDescription()));
    emit connected();
}

void ConnectionManager::closeConnection()
{
    if (m_socket || m_correlator) {
        releaseCurrent("Connection closed");
        emit connectionLost();
    }
}

void ConnectionManager::releaseCurrent(const QString& reason)
{
    m_pingTimer->stop();

    // Pending calls fail before the socket goes away, so no caller is left
    // waiting on a handle that can never answer
    if (m_correlator) {
        m_correlator->detach();
        m_correlator->failAll(CallError::make(ErrorKind::Transport, reason));
        m_correlator.reset();
    }

    if (m_socket) {
        QWebSocket* old = m_socket;
        m_socket = nullptr;
        disconnect(old, nullptr, this, nullptr);
        // close() on a dead socket only reports through error signals, which
        // are no longer connected
        old->close(QWebSocketProtocol::CloseCodeGoingAway, reason);
        old->deleteLater();
    }
}

void ConnectionManager::onSocketDisconnected()
{
    QWebSocket* socket = qobject_cast<QWebSocket*>(sender());
    if (socket != m_socket) {
        return;
    }

    m_logger.warning(QString("Browser extension disconnected (%1)").arg(socket->closeReason()));
    releaseCurrent("WebSocket connection closed");
    emit connectionLost();
}

void ConnectionManager::onPingTimeout()
{
    if (hasConnection()) {
        m_socket->ping();
    }
}
