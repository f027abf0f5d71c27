#include "messagecorrelator.h"
#include "tabbridgelogger.h"
#include <QJsonDocument>
#include <QJsonArray>
#include <QUuid>

using TabBridgeCommon::CallError;
using TabBridgeCommon::ErrorKind;

MessageCorrelator::MessageCorrelator(QWebSocket* socket, TabBridgeLogger& logger, QObject* parent)
    : QObject(parent)
    , m_socket(socket)
    , m_logger(logger)
{
    if (m_socket) {
        connect(m_socket, &QWebSocket::textMessageReceived, this, &MessageCorrelator::onTextMessageReceived);
        connect(m_socket, &QWebSocket::disconnected, this, &MessageCorrelator::onDisconnected);
#if QT_VERSION >= QT_VERSION_CHECK(6, 5, 0)
        connect(m_socket, &QWebSocket::errorOccurred, this, &MessageCorrelator::onSocketError);
#else
        connect(m_socket, QOverload<QAbstractSocket::SocketError>::of(&QWebSocket::error),
                this, &MessageCorrelator::onSocketError);
#endif
    }
}

MessageCorrelator::~MessageCorrelator()
{
    detach();
    failAll(CallError::make(ErrorKind::Transport, "WebSocket connection closed"));
}

void MessageCorrelator::detach()
{
    if (m_socket) {
        disconnect(m_socket, nullptr, this, nullptr);
    }
}

QString MessageCorrelator::nextCorrelationId() const
{
    QString id;
    do {
        id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    } while (m_pending.contains(id));
    return id;
}

void MessageCorrelator::call(const QString& type, const QJsonValue& payload, int timeoutMs, ResponseCallback callback)
{
    if (!m_socket || m_socket->state() != QAbstractSocket::ConnectedState) {
        callback(QJsonValue(), CallError::make(ErrorKind::Transport, "WebSocket is not open"));
        return;
    }

    const QString id = nextCorrelationId();

    PendingRequest request;
    request.type = type;
    request.createdAt = QDateTime::currentDateTimeUtc();
    request.callback = std::move(callback);
    request.timer = new QTimer(this);
    request.timer->setSingleShot(true);
    connect(request.timer, &QTimer::timeout, this, [this, id, timeoutMs]() {
        m_logger.warning(QString("Call %1 timed out after %2ms").arg(id).arg(timeoutMs));
        settle(id, QJsonValue(), CallError::make(ErrorKind::Timeout,
            QString("WebSocket response timeout after %1ms").arg(timeoutMs)));
    });

    m_pending.insert(id, request);
    request.timer->start(timeoutMs);

    QJsonObject envelope{
        {"id", id},
        {"type", type},
        {"payload", payload}
    };

    m_logger.debug(QString("-> %1 (%2)").arg(type, id));
    m_socket->sendTextMessage(QString::fromUtf8(QJsonDocument(envelope).toJson(QJsonDocument::Compact)));
}

bool MessageCorrelator::settle(const QString& id, const QJsonValue& result, const CallError& error)
{
    auto it = m_pending.find(id);
    if (it == m_pending.end()) {
        return false;
    }

    // Take the record before invoking the callback, which may re-enter call()
    PendingRequest request = it.value();
    m_pending.erase(it);

    if (request.timer) {
        request.timer->stop();
        request.timer->deleteLater();
    }

    request.callback(result, error);
    return true;
}

void MessageCorrelator::failAll(const CallError& error)
{
    const QStringList ids = m_pending.keys();
    for (const QString& id : ids) {
        settle(id, QJsonValue(), error);
    }
}

void MessageCorrelator::onTextMessageReceived(const QString& message)
{
    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(message.toUtf8(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        m_logger.debug(QString("Ignoring non-JSON extension message: %1").arg(parseError.errorString()));
        return;
    }

    QJsonObject envelope = doc.object();
    if (envelope.value("type").toString() != RESPONSE_TYPE) {
        return;
    }

    QJsonObject payload = envelope.value("payload").toObject();
    const QString requestId = payload.value("requestId").toString();

    bool matched;
    if (payload.contains("error") && !payload.value("error").isNull()) {
        matched = settle(requestId, QJsonValue(),
                         CallError::make(ErrorKind::Remote, errorText(payload.value("error"))));
    } else {
        matched = settle(requestId, payload.value("result"), CallError::none());
    }

    if (!matched) {
        m_logger.debug(QString("Discarding response for unknown or expired request %1").arg(requestId));
    }
}

QString MessageCorrelator::errorText(const QJsonValue& error)
{
    if (error.isString()) {
        return error.toString();
    }
    if (error.isObject()) {
        return QString::fromUtf8(QJsonDocument(error.toObject()).toJson(QJsonDocument::Compact));
    }
    if (error.isArray()) {
        return QString::fromUtf8(QJsonDocument(error.toArray()).toJson(QJsonDocument::Compact));
    }
    return error.toVariant().toString();
}

void MessageCorrelator::onDisconnected()
{
    if (!m_pending.isEmpty()) {
        m_logger.warning(QString("WebSocket closed with %1 call(s) outstanding").arg(m_pending.size()));
    }
    failAll(CallError::make(ErrorKind::Transport, "WebSocket connection closed"));
}

void MessageCorrelator::onSocketError(QAbstractSocket::SocketError error)
{
    Q_UNUSED(error)
    QString detail = m_socket ? m_socket->errorString() : QString();
    m_logger.warning(QString("WebSocket error occurred: %1").arg(detail));
    failAll(CallError::make(ErrorKind::Transport, QString("WebSocket error occurred: %1").arg(detail)));
}
