#include "frontdoorclient.h"
#include "toolregistry.h"
#include "tabbridgelogger.h"
#include "common.h"
#include <QNetworkRequest>
#include <QJsonDocument>

using namespace TabBridgeCommon;

FrontDoorClient::FrontDoorClient(quint16 httpPort, int timeoutMs, TabBridgeLogger& logger, QObject* parent)
    : QObject(parent)
    , m_baseUrl(QString("http://localhost:%1").arg(httpPort))
    , m_timeoutMs(timeoutMs)
    , m_logger(logger)
    , m_networkManager(new QNetworkAccessManager(this))
{
}

FrontDoorClient::~FrontDoorClient()
{
    const QSet<QNetworkReply*> replies = m_inFlight;
    m_inFlight.clear();
    for (QNetworkReply* reply : replies) {
        reply->disconnect(this);
        reply->abort();
        reply->deleteLater();
    }
}

void FrontDoorClient::invoke(const QString& toolName, const QJsonObject& arguments, ResponseCallback callback)
{
    QNetworkRequest request(toolUrl());
    request.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");
    request.setRawHeader("User-Agent", QByteArray("tabbridge-forwarder/") + Config::APP_VERSION);
    request.setTransferTimeout(m_timeoutMs);

    QJsonObject body{
        {"name", toolName},
        {"arguments", arguments}
    };

    QNetworkReply* reply = m_networkManager->post(request, QJsonDocument(body).toJson(QJsonDocument::Compact));
    m_inFlight.insert(reply);

    connect(reply, &QNetworkReply::finished, this, [this, reply, toolName, callback]() {
        handleReply(reply, toolName, callback);
    });
}

void FrontDoorClient::handleReply(QNetworkReply* reply, const QString& toolName, ResponseCallback callback)
{
    reply->deleteLater();
    if (!m_inFlight.remove(reply)) {
        return;
    }

    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    const QByteArray data = reply->readAll();

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    const QJsonObject response = doc.object();

    // A 500 still carries a JSON body worth reporting
    if (status == 0 && reply->error() != QNetworkReply::NoError) {
        ErrorKind kind = reply->error() == QNetworkReply::OperationCanceledError
                       ? ErrorKind::Timeout : ErrorKind::Transport;
        callback({}, CallError::make(kind, reply->errorString()));
        return;
    }

    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        callback({}, CallError::make(ErrorKind::Transport,
                                     QString("Invalid response from bridge (HTTP %1)").arg(status)));
        return;
    }

    if (status != 200 || !response.value("success").toBool()) {
        QString message = response.value("message").toString();
        if (message.isEmpty()) {
            message = response.value("error").toString(QString("HTTP %1").arg(status));
        }
        m_logger.debug(QString("Front door rejected %1: %2").arg(toolName, message));
        callback({}, CallError::make(status >= 500 ? ErrorKind::Transport : ErrorKind::InvalidRequest, message));
        return;
    }

    callback(response.value("result").toObject(), CallError::none());
}

void FrontDoorClient::relay(const QString& toolName, const QJsonObject& arguments, RelayCallback callback)
{
    TabBridgeLogger* logger = &m_logger;
    invoke(toolName, arguments, [logger, toolName, callback](const QJsonObject& response, const CallError& error) {
        if (error.isError()) {
            logger->warning(QString("Forwarding %1 failed: %2").arg(toolName, error.message));
            callback(ToolCallBridge::errorResult(QString(PROXY_ERROR_PREFIX) + error.message));
            return;
        }
        callback(response);
    });
}
