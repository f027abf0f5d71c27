#ifndef MESSAGECORRELATOR_H
#define MESSAGECORRELATOR_H

#include <QObject>
#include <QWebSocket>
#include <QJsonObject>
#include <QJsonValue>
#include <QHash>
#include <QDateTime>
#include <QPointer>
#include <QTimer>
#include <functional>
#include "bridge_errors.h"

class TabBridgeLogger;

// Request/response matching over one extension socket. Each call is sent as
// {id, type, payload}; the extension answers with a "messageResponse"
// envelope whose payload carries the same id as requestId.
class MessageCorrelator : public QObject
{
    Q_OBJECT

public:
    using ResponseCallback = std::function<void(const QJsonValue& result, const TabBridgeCommon::CallError& error)>;

    MessageCorrelator(QWebSocket* socket, TabBridgeLogger& logger, QObject* parent = nullptr);
    ~MessageCorrelator();

    // The callback runs exactly once: on the matching response, on timeout,
    // or when the socket closes or errors. A socket that is not open fails
    // the call before anything is written.
    void call(const QString& type, const QJsonValue& payload, int timeoutMs, ResponseCallback callback);

    // Fail every outstanding call with the given error, leaving nothing pending
    void failAll(const TabBridgeCommon::CallError& error);

    // Stop listening to the socket. Outstanding calls are left untouched.
    void detach();

    int pendingCount() const { return m_pending.size(); }
    QWebSocket* socket() const { return m_socket; }

    // Text of a response's error field, whatever JSON type the extension sent
    static QString errorText(const QJsonValue& error);

    static constexpr int DEFAULT_TIMEOUT_MS = 30000;
    static constexpr const char* RESPONSE_TYPE = "messageResponse";

private slots:
    void onTextMessageReceived(const QString& message);
    void onDisconnected();
    void onSocketError(QAbstractSocket::SocketError error);

private:
    struct PendingRequest {
        QString type;
        QDateTime createdAt;
        ResponseCallback callback;
        QTimer* timer = nullptr;
    };

    QString nextCorrelationId() const;
    bool settle(const QString& id, const QJsonValue& result, const TabBridgeCommon::CallError& error);

    QPointer<QWebSocket> m_socket;
    TabBridgeLogger& m_logger;
    QHash<QString, PendingRequest> m_pending;
};

#endif // MESSAGECORRELATOR_H
