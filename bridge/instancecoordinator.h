#ifndef INSTANCECOORDINATOR_H
#define INSTANCECOORDINATOR_H

#include <QObject>
#include <QNetworkAccessManager>
#include <functional>

class TabBridgeLogger;

struct InstanceDescriptor {
    bool exists = false;
    bool healthy = false;
    bool httpBound = false;
    bool socketBound = false;
    quint16 httpPort = 0;
    quint16 socketPort = 0;
};

// Decides at startup whether another bridge already owns the ports
class InstanceCoordinator : public QObject
{
    Q_OBJECT

public:
    using DetectCallback = std::function<void(const InstanceDescriptor& descriptor)>;

    InstanceCoordinator(quint16 httpPort, quint16 socketPort, TabBridgeLogger& logger, QObject* parent = nullptr);

    void setPortCheckTimeoutMs(int ms) { m_portCheckTimeoutMs = ms; }
    void setHealthTimeoutMs(int ms) { m_healthTimeoutMs = ms; }

    void detect(DetectCallback callback);
    InstanceDescriptor detectSync();

    // Polls /health until it answers or timeoutMs elapses
    bool waitForHealthy(int timeoutMs = 10000, int intervalMs = 500);

    static constexpr int DEFAULT_PORT_CHECK_TIMEOUT_MS = 1000;
    static constexpr int DEFAULT_HEALTH_TIMEOUT_MS = 2000;

private:
    void checkPortBound(quint16 port, std::function<void(bool bound)> done);
    void checkHealth(std::function<void(bool healthy)> done);

    quint16 m_httpPort;
    quint16 m_socketPort;
    int m_portCheckTimeoutMs;
    int m_healthTimeoutMs;
    TabBridgeLogger& m_logger;
    QNetworkAccessManager* m_networkManager;
};

#endif // INSTANCECOORDINATOR_H
