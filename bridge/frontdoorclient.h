#ifndef FRONTDOORCLIENT_H
#define FRONTDOORCLIENT_H

#include <QObject>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QJsonObject>
#include <QUrl>
#include <QSet>
#include <functional>
#include "bridge_errors.h"

class TabBridgeLogger;

// Used by a forwarder process: relays tool calls to the active bridge's
// HTTP front door instead of talking to the extension itself.
class FrontDoorClient : public QObject
{
    Q_OBJECT

public:
    using ResponseCallback = std::function<void(const QJsonObject& result, const TabBridgeCommon::CallError& error)>;

    FrontDoorClient(quint16 httpPort, int timeoutMs, TabBridgeLogger& logger, QObject* parent = nullptr);
    ~FrontDoorClient();

    void invoke(const QString& toolName, const QJsonObject& arguments, ResponseCallback callback);

    using RelayCallback = std::function<void(const QJsonObject& result)>;

    // Like invoke(), but relay failures come back as an isError tool result
    void relay(const QString& toolName, const QJsonObject& arguments, RelayCallback callback);

    QUrl toolUrl() const { return m_baseUrl.resolved(QUrl("/tool")); }
    int timeoutMs() const { return m_timeoutMs; }

    static constexpr const char* PROXY_ERROR_PREFIX = "Proxy communication error: ";

private:
    void handleReply(QNetworkReply* reply, const QString& toolName, ResponseCallback callback);

    QUrl m_baseUrl;
    int m_timeoutMs;
    TabBridgeLogger& m_logger;
    QNetworkAccessManager* m_networkManager;
    QSet<QNetworkReply*> m_inFlight;
};

#endif // FRONTDOORCLIENT_H
