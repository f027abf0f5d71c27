#include "frontdoor.h"
#include "toolregistry.h"
#include "connectionmanager.h"
#include "tabbridgelogger.h"
#include "bridge_errors.h"
#include <QHttpHeaders>
#include <QJsonDocument>
#include <QJsonArray>
#include <QPointer>
#include <memory>

using StatusCode = QHttpServerResponder::StatusCode;

FrontDoorServer::FrontDoorServer(quint16 port, const TabBridgeCommon::PortEvictionOptions& eviction,
                                 ToolCallBridge& bridge, ConnectionManager& connections,
                                 TabBridgeLogger& logger, QObject* parent)
    : QObject(parent)
    , m_port(port)
    , m_socketPort(0)
    , m_resourceCount(0)
    , m_eviction(eviction)
    , m_bridge(bridge)
    , m_connections(connections)
    , m_logger(logger)
    , m_http(nullptr)
    , m_tcpServer(nullptr)
    , m_startedAt(QDateTime::currentDateTimeUtc())
{
}

FrontDoorServer::~FrontDoorServer()
{
    close();
}

void FrontDoorServer::listen()
{
    if (isListening()) {
        return;
    }

    TabBridgeCommon::ensurePortFree(m_port, m_eviction, m_logger);

    auto* http = new QHttpServer(this);
    auto* tcp = new QTcpServer(http);

    if (!tcp->listen(QHostAddress::LocalHost, m_port)) {
        QString message = QString("Failed to listen on HTTP port %1: %2").arg(m_port).arg(tcp->errorString());
        const bool inUse = tcp->serverError() == QAbstractSocket::AddressInUseError;
        delete http;
        if (inUse) {
            throw TabBridgeCommon::PortConflictError(message);
        }
        throw TabBridgeCommon::TransportError(message);
    }

    m_http = http;
    registerRoutes();

    if (!m_http->bind(tcp)) {
        delete m_http;
        m_http = nullptr;
        throw TabBridgeCommon::TransportError(QString("Failed to start HTTP server on port %1").arg(m_port));
    }
    m_tcpServer = tcp;

    connect(tcp, &QTcpServer::acceptError, this, [this, tcp](QAbstractSocket::SocketError) {
        QString message = QString("HTTP accept error: %1").arg(tcp->errorString());
        m_logger.warning(message);
        emit serverError(message);
    });

    m_startedAt = QDateTime::currentDateTimeUtc();
    m_logger.info(QString("HTTP front door listening on http://localhost:%1").arg(port()));
}

void FrontDoorServer::close()
{
    if (!m_http) {
        return;
    }

    if (m_tcpServer) {
        m_tcpServer->close();
    }

    // close() can run from inside one of the server's own signals
    m_http->deleteLater();
    m_http = nullptr;
    m_tcpServer = nullptr;
}

bool FrontDoorServer::isListening() const
{
    return m_tcpServer && m_tcpServer->isListening();
}

quint16 FrontDoorServer::port() const
{
    return isListening() ? m_tcpServer->serverPort() : m_port;
}

void FrontDoorServer::registerRoutes()
{
    m_http->route("/health", QHttpServerRequest::Method::Get, [this]() {
        return QHttpServerResponse(healthBody(), StatusCode::Ok);
    });

    m_http->route("/tools", QHttpServerRequest::Method::Get, [this]() {
        return QHttpServerResponse(QJsonObject{
            {"success", true},
            {"tools", m_bridge.listTools().value("tools")}
        }, StatusCode::Ok);
    });

    m_http->route("/tool", QHttpServerRequest::Method::Post,
                  [this](const QHttpServerRequest& request, QHttpServerResponder& responder) {
        handleToolInvoke(request, responder);
    });

    m_http->setMissingHandler(this, [this](const QHttpServerRequest& request, QHttpServerResponder& responder) {
        handleUnmatched(request, responder);
    });

    // Routes that return a response get CORS here; deferred ones add it in sendJson()
    m_http->addAfterRequestHandler(this, [](const QHttpServerRequest&, QHttpServerResponse& response) {
        addCorsHeaders(response);
    });
}

void FrontDoorServer::handleUnmatched(const QHttpServerRequest& request, QHttpServerResponder& responder)
{
    const QString method = methodName(request.method());
    const QString path = request.url().path();
    m_logger.debug(QString("HTTP %1 %2").arg(method, path));

    if (request.method() == QHttpServerRequest::Method::Options) {
        QHttpServerResponse response(StatusCode::Ok);
        addCorsHeaders(response);
        responder.sendResponse(response);
        return;
    }

    sendJson(responder, StatusCode::NotFound, QJsonObject{
        {"success", false},
        {"error", "Not Found"},
        {"message", QString("Endpoint %1 %2 not found").arg(method, path)},
        {"availableEndpoints", QJsonArray{"GET /health", "GET /tools", "POST /tool"}}
    });
}

QJsonObject FrontDoorServer::badRequest(const QString& message)
{
    return QJsonObject{
        {"success", false},
        {"error", "Bad Request"},
        {"message", message},
        {"expectedFormat", QJsonObject{
            {"name", "string (required)"},
            {"arguments", "object (optional)"}
        }}
    };
}

void FrontDoorServer::handleToolInvoke(const QHttpServerRequest& request, QHttpServerResponder& responder)
{
    if (request.body().size() > MAX_BODY_BYTES) {
        sendJson(responder, StatusCode::PayloadTooLarge, QJsonObject{
            {"success", false},
            {"error", "Payload Too Large"},
            {"message", QString("Request body exceeds %1 bytes").arg(MAX_BODY_BYTES)}
        });
        return;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(request.body(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        sendJson(responder, StatusCode::BadRequest, badRequest("Request body must be a JSON object"));
        return;
    }

    const QJsonObject body = doc.object();
    if (!body.value("name").isString() || body.value("name").toString().isEmpty()) {
        sendJson(responder, StatusCode::BadRequest, badRequest("Tool name is required and must be a string"));
        return;
    }
    if (body.contains("arguments") && !body.value("arguments").isObject()) {
        sendJson(responder, StatusCode::BadRequest, badRequest("Tool arguments must be an object"));
        return;
    }

    const QString name = body.value("name").toString();
    const QJsonObject arguments = body.value("arguments").toObject();
    m_logger.debug(QString("HTTP POST /tool %1").arg(name));

    // The responder outlives this handler; the server may be closed before
    // the tool finishes
    auto pending = std::make_shared<QHttpServerResponder>(std::move(responder));
    QPointer<QHttpServer> server(m_http);
    TabBridgeLogger* logger = &m_logger;

    m_bridge.execute(name, arguments, [pending, server, logger, name](const ToolCallResult& outcome) {
        if (!server) {
            logger->debug(QString("Front door closed before %1 finished").arg(name));
            return;
        }

        if (TabBridgeCommon::isTransportKind(outcome.failure)) {
            sendJson(*pending, StatusCode::InternalServerError, QJsonObject{
                {"success", false},
                {"error", "Bridge Unavailable"},
                {"message", outcome.errorMessage},
                {"tool", name}
            });
            return;
        }

        sendJson(*pending, StatusCode::Ok, QJsonObject{
            {"success", true},
            {"tool", name},
            {"result", outcome.result}
        });
    });
}

QJsonObject FrontDoorServer::healthBody() const
{
    QJsonObject body{
        {"status", "healthy"},
        {"timestamp", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs)},
        {"uptimeSeconds", m_startedAt.secsTo(QDateTime::currentDateTimeUtc())},
        {"version", TabBridgeCommon::Config::APP_VERSION},
        {"ports", QJsonObject{
            {"http", port()},
            {"socket", m_socketPort}
        }},
        {"tools", m_bridge.table().size()},
        {"resources", m_resourceCount},
        {"extensionConnected", m_connections.hasConnection()}
    };

    if (m_lifecycleInfo) {
        body["lifecycle"] = m_lifecycleInfo();
    }
    return body;
}

void FrontDoorServer::addCorsHeaders(QHttpServerResponse& response)
{
    QHttpHeaders headers = response.headers();
    headers.replaceOrAppend("Access-Control-Allow-Origin", "*");
    headers.replaceOrAppend("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    headers.replaceOrAppend("Access-Control-Allow-Headers", "Content-Type");
    response.setHeaders(std::move(headers));
}

void FrontDoorServer::sendJson(QHttpServerResponder& responder, StatusCode status, const QJsonObject& body)
{
    QHttpServerResponse response(body, status);
    addCorsHeaders(response);
    responder.sendResponse(response);
}

QString FrontDoorServer::methodName(QHttpServerRequest::Method method)
{
    switch (method) {
        case QHttpServerRequest::Method::Get: return "GET";
        case QHttpServerRequest::Method::Put: return "PUT";
        case QHttpServerRequest::Method::Delete: return "DELETE";
        case QHttpServerRequest::Method::Post: return "POST";
        case QHttpServerRequest::Method::Head: return "HEAD";
        case QHttpServerRequest::Method::Options: return "OPTIONS";
        case QHttpServerRequest::Method::Patch: return "PATCH";
        case QHttpServerRequest::Method::Connect: return "CONNECT";
        case QHttpServerRequest::Method::Trace: return "TRACE";
        default: return "UNKNOWN";
    }
}
