#ifndef FRONTDOOR_H
#define FRONTDOOR_H

#include <QObject>
#include <QTcpServer>
#include <QHttpServer>
#include <QHttpServerRequest>
#include <QHttpServerResponder>
#include <QHttpServerResponse>
#include <QJsonObject>
#include <QDateTime>
#include <functional>
#include "common.h"

class ToolCallBridge;
class ConnectionManager;
class TabBridgeLogger;

// Localhost HTTP entry point shared by every bridge process on the machine:
// GET /health, GET /tools and POST /tool. Tool calls answer as they finish,
// so a slow tool never holds up another client's request.
class FrontDoorServer : public QObject
{
    Q_OBJECT

public:
    using InfoProvider = std::function<QJsonObject()>;

    FrontDoorServer(quint16 port, const TabBridgeCommon::PortEvictionOptions& eviction,
                    ToolCallBridge& bridge, ConnectionManager& connections,
                    TabBridgeLogger& logger, QObject* parent = nullptr);
    ~FrontDoorServer();

    // Throws PortConflictError if the port cannot be claimed
    void listen();
    void close();

    bool isListening() const;
    quint16 port() const;

    void setSocketPort(quint16 port) { m_socketPort = port; }
    void setResourceCount(int count) { m_resourceCount = count; }
    void setLifecycleInfoProvider(InfoProvider provider) { m_lifecycleInfo = std::move(provider); }

    static constexpr qint64 MAX_BODY_BYTES = 10 * 1024 * 1024;

signals:
    void serverError(const QString& message);

private:
    void registerRoutes();
    void handleToolInvoke(const QHttpServerRequest& request, QHttpServerResponder& responder);
    void handleUnmatched(const QHttpServerRequest& request, QHttpServerResponder& responder);

    QJsonObject healthBody() const;
    static QJsonObject badRequest(const QString& message);
    static void addCorsHeaders(QHttpServerResponse& response);
    static void sendJson(QHttpServerResponder& responder, QHttpServerResponder::StatusCode status,
                         const QJsonObject& body);
    static QString methodName(QHttpServerRequest::Method method);

    quint16 m_port;
    quint16 m_socketPort;
    int m_resourceCount;
    TabBridgeCommon::PortEvictionOptions m_eviction;
    ToolCallBridge& m_bridge;
    ConnectionManager& m_connections;
    TabBridgeLogger& m_logger;
    QHttpServer* m_http;        // Null while closed
    QTcpServer* m_tcpServer;    // Owned by m_http
    QDateTime m_startedAt;
    InfoProvider m_lifecycleInfo;
};

#endif // FRONTDOOR_H
