#include "instancecoordinator.h"
#include "tabbridgelogger.h"
#include <QTcpSocket>
#include <QTimer>
#include <QNetworkRequest>
#include <QNetworkReply>
#include <QEventLoop>
#include <QElapsedTimer>
#include <QPointer>
#include <QUrl>
#include <memory>

InstanceCoordinator::InstanceCoordinator(quint16 httpPort, quint16 socketPort, TabBridgeLogger& logger, QObject* parent)
    : QObject(parent)
    , m_httpPort(httpPort)
    , m_socketPort(socketPort)
    , m_portCheckTimeoutMs(DEFAULT_PORT_CHECK_TIMEOUT_MS)
    , m_healthTimeoutMs(DEFAULT_HEALTH_TIMEOUT_MS)
    , m_logger(logger)
    , m_networkManager(new QNetworkAccessManager(this))
{
}

void InstanceCoordinator::checkPortBound(quint16 port, std::function<void(bool bound)> done)
{
    auto* socket = new QTcpSocket(this);
    auto* timer = new QTimer(socket);
    timer->setSingleShot(true);

    auto settled = std::make_shared<bool>(false);
    auto finish = [socket, settled, done](bool bound) {
        if (*settled) {
            return;
        }
        *settled = true;
        socket->abort();
        socket->deleteLater();
        done(bound);
    };

    connect(socket, &QTcpSocket::connected, this, [finish]() { finish(true); });
    connect(socket, &QTcpSocket::errorOccurred, this, [finish](QAbstractSocket::SocketError) { finish(false); });
    connect(timer, &QTimer::timeout, this, [finish]() { finish(false); });

    timer->start(m_portCheckTimeoutMs);
    socket->connectToHost(QHostAddress::LocalHost, port);
}

void InstanceCoordinator::checkHealth(std::function<void(bool healthy)> done)
{
    QNetworkRequest request(QUrl(QString("http://localhost:%1/health").arg(m_httpPort)));
    request.setTransferTimeout(m_healthTimeoutMs);

    QNetworkReply* reply = m_networkManager->get(request);
    connect(reply, &QNetworkReply::finished, this, [reply, done]() {
        reply->deleteLater();
        const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        // Any HTTP answer below 500 means a live bridge is serving
        done(status > 0 && status < 500);
    });
}

void InstanceCoordinator::detect(DetectCallback callback)
{
    struct DetectionState {
        InstanceDescriptor descriptor;
        int remaining = 2;
    };
    auto state = std::make_shared<DetectionState>();
    state->descriptor.httpPort = m_httpPort;
    state->descriptor.socketPort = m_socketPort;

    QPointer<InstanceCoordinator> self(this);
    auto checksDone = [self, state, callback]() {
        if (--state->remaining > 0 || !self) {
            return;
        }

        InstanceDescriptor& d = state->descriptor;
        d.exists = d.httpBound || d.socketBound;
        if (!d.httpBound) {
            self->m_logger.info("No existing bridge detected");
            callback(d);
            return;
        }

        self->checkHealth([self, state, callback](bool healthy) {
            state->descriptor.healthy = healthy;
            if (self) {
                self->m_logger.info(QString("Existing bridge detected on port %1 (%2)")
                                    .arg(state->descriptor.httpPort)
                                    .arg(healthy ? "healthy" : "unhealthy"));
            }
            callback(state->descriptor);
        });
    };

    checkPortBound(m_httpPort, [state, checksDone](bool bound) {
        state->descriptor.httpBound = bound;
        checksDone();
    });
    checkPortBound(m_socketPort, [state, checksDone](bool bound) {
        state->descriptor.socketBound = bound;
        checksDone();
    });
}

InstanceDescriptor InstanceCoordinator::detectSync()
{
    QEventLoop loop;
    bool done = false;
    InstanceDescriptor result;

    detect([&](const InstanceDescriptor& descriptor) {
        result = descriptor;
        done = true;
        loop.quit();
    });

    if (!done) {
        loop.exec();
    }
    return result;
}

bool InstanceCoordinator::waitForHealthy(int timeoutMs, int intervalMs)
{
    QElapsedTimer elapsed;
    elapsed.start();

    while (elapsed.elapsed() < timeoutMs) {
        QEventLoop loop;
        bool healthy = false;
        checkHealth([&](bool ok) {
            healthy = ok;
            loop.quit();
        });
        loop.exec();

        if (healthy) {
            return true;
        }

        QEventLoop pause;
        QTimer::singleShot(intervalMs, &pause, &QEventLoop::quit);
        pause.exec();
    }

    m_logger.warning(QString("Bridge on port %1 did not become healthy within %2ms").arg(m_httpPort).arg(timeoutMs));
    return false;
}
