#include "bridgeapplication.h"
#include "browsertools.h"
#include "connectionmanager.h"
#include "socketlistener.h"
#include "frontdoor.h"
#include "frontdoorclient.h"
#include "mcpserver_stdio.h"
#include "tabbridgelogger.h"
#include "common.h"
#include <QCoreApplication>
#include <QJsonDocument>

using namespace TabBridgeCommon;

BridgeApplication::BridgeApplication(const TabBridgeCLI::BridgeConfig& config, TabBridgeLogger& logger, QObject* parent)
    : QObject(parent)
    , m_config(config)
    , m_logger(logger)
    , m_tools(BrowserTools::buildToolTable())
    , m_connections(std::make_unique<ConnectionManager>(logger, config.callTimeoutMs, config.pingIntervalMs))
    , m_bridge(std::make_unique<ToolCallBridge>(m_tools, *m_connections, logger))
    , m_mcp(new MCPServerStdio(logger, this))
    , m_coordinator(new InstanceCoordinator(config.httpPort, config.socketPort, logger, this))
    , m_listener(nullptr)
    , m_frontDoor(nullptr)
    , m_forwarder(nullptr)
    , m_lifecycle(nullptr)
    , m_role(Role::ActiveBridge)
    , m_started(false)
    , m_announced(false)
{
    m_coordinator->setPortCheckTimeoutMs(config.portCheckTimeoutMs);
    m_coordinator->setHealthTimeoutMs(config.healthTimeoutMs);

    m_mcp->setServerInfo(Config::SERVER_NAME, Config::APP_VERSION);
    m_mcp->setCapabilities(QJsonObject{
        {"tools", QJsonObject{}},
        {"resources", QJsonObject{}}
    });
    m_mcp->setTools(m_tools.describe());
    m_mcp->registerResource({
        "tabbridge://status",
        "Bridge status",
        "Role, ports and lifecycle state of this bridge process",
        "application/json",
        [this]() {
            QJsonObject status{
                {"role", getRoleString(m_role)},
                {"httpPort", httpPort()},
                {"socketPort", socketPort()},
                {"extensionConnected", m_connections->hasConnection()},
                {"lifecycle", m_lifecycle ? m_lifecycle->stateInfo() : QJsonObject()}
            };
            return QJsonObject{
                {"mimeType", "application/json"},
                {"text", QString::fromUtf8(QJsonDocument(status).toJson(QJsonDocument::Compact))}
            };
        }
    });

    connect(m_mcp, &MCPServerStdio::stdinClosed, this, [this]() {
        m_logger.info("stdin closed, shutting down");
        requestTermination();
        requestShutdown("stdin closed");
    });

    connect(m_connections.get(), &ConnectionManager::connected, this, [this]() {
        m_logger.info(QString("Extension connected from %1").arg(m_connections->peerDescription()));
    });
    connect(m_connections.get(), &ConnectionManager::connectionLost, this, [this]() {
        m_logger.info("Extension disconnected, waiting for it to reconnect");
    });
}

BridgeApplication::~BridgeApplication()
{
    m_mcp->stop();

    // Accepted sockets belong to the listener, so release them before it goes
    m_connections->closeConnection();
    delete m_lifecycle;
    delete m_frontDoor;
    delete m_listener;
}

quint16 BridgeApplication::httpPort() const
{
    return m_frontDoor ? m_frontDoor->port() : m_config.httpPort;
}

quint16 BridgeApplication::socketPort() const
{
    return m_listener ? m_listener->port() : m_config.socketPort;
}

ServerInfo BridgeApplication::serverInfo() const
{
    ServerInfo info;
    info.role = m_role;
    info.httpPort = httpPort();
    info.socketPort = socketPort();
    info.toolCount = m_tools.size();
    info.pid = QCoreApplication::applicationPid();
    info.logPath = m_logger.currentSessionPath();
    return info;
}

LifecycleStateMachine::Config BridgeApplication::lifecycleConfig() const
{
    LifecycleStateMachine::Config config;
    config.maxRetries = m_config.maxRetries;
    config.retryDelayMs = m_config.retryDelayMs;
    config.maxStateHistory = m_config.maxStateHistory;
    config.connectedCheckIntervalMs = m_config.connectedCheckIntervalMs;
    config.shutdownTimeoutMs = m_config.shutdownTimeoutMs;
    return config;
}

PortEvictionOptions BridgeApplication::evictionOptions() const
{
    PortEvictionOptions options;
    options.graceMs = m_config.evictionGraceMs;
    options.waitAttempts = m_config.portWaitAttempts;
    options.waitIntervalMs = m_config.portWaitIntervalMs;
    return options;
}

void BridgeApplication::start()
{
    if (m_started) {
        return;
    }
    m_started = true;

    m_logger.info(QString("Checking for a running bridge on ports %1/%2")
                  .arg(m_config.httpPort).arg(m_config.socketPort));
    m_coordinator->detect([this](const InstanceDescriptor& descriptor) { onDetected(descriptor); });
}

void BridgeApplication::onDetected(const InstanceDescriptor& descriptor)
{
    if (!m_pendingShutdown.isEmpty()) {
        m_logger.info(QString("Shutdown requested before startup finished: %1").arg(m_pendingShutdown));
        emit finished(0);
        return;
    }

    if (descriptor.exists && descriptor.healthy) {
        startForwarder();
    } else {
        if (descriptor.exists) {
            m_logger.warning("Found an unresponsive bridge holding the ports, taking over");
        }
        startActive();
    }
}

void BridgeApplication::requestShutdown(const QString& reason)
{
    if (m_lifecycle) {
        m_lifecycle->requestShutdown(reason);
        return;
    }

    if (!m_started) {
        emit finished(0);
        return;
    }

    // Detection is still running; onDetected() finishes up
    m_pendingShutdown = reason;
}

void BridgeApplication::startLifecycle(const LifecycleStateMachine::Actions& actions)
{
    m_lifecycle = new LifecycleStateMachine(lifecycleConfig(), actions, m_logger, this);

    connect(m_lifecycle, &LifecycleStateMachine::stateChanged, this,
            [this](LifecycleStateMachine::State, LifecycleStateMachine::State to) {
        if (to == LifecycleStateMachine::State::Connected && !m_announced) {
            m_announced = true;
            emit ready(serverInfo());
        }
    });
    connect(m_lifecycle, &LifecycleStateMachine::finished, this, &BridgeApplication::finished);

    m_lifecycle->start();
}

void BridgeApplication::startActive()
{
    m_role = Role::ActiveBridge;
    m_logger.info("Starting as the active bridge");

    m_mcp->setToolCallHandler([this](const QString& name, const QJsonObject& arguments,
                                     MCPServerStdio::ToolResultCallback respond) {
        m_bridge->execute(name, arguments, [respond](const ToolCallResult& outcome) {
            respond(outcome.result);
        });
    });

    LifecycleStateMachine::Actions actions;
    actions.createServer = [this]() { createServers(); };
    actions.connectTransport = [this]() { m_mcp->start(); };
    actions.cleanup = [this](LifecycleStateMachine::CleanupDone done) {
        m_connections->closeConnection();
        closeServers();
        if (m_lifecycle->isShuttingDown()) {
            m_mcp->stop();
        }
        done(QString());
    };

    startLifecycle(actions);
}

void BridgeApplication::startForwarder()
{
    m_role = Role::Forwarder;
    m_logger.info(QString("Healthy bridge found on port %1, forwarding tool calls to it").arg(m_config.httpPort));

    // Leave headroom over the active bridge's own call timeout
    m_forwarder = new FrontDoorClient(m_config.httpPort, m_config.callTimeoutMs + 5000, m_logger, this);

    m_mcp->setToolCallHandler([this](const QString& name, const QJsonObject& arguments,
                                     MCPServerStdio::ToolResultCallback respond) {
        m_forwarder->relay(name, arguments, respond);
    });

    LifecycleStateMachine::Actions actions;
    actions.createServer = []() {};
    actions.connectTransport = [this]() { m_mcp->start(); };
    actions.cleanup = [this](LifecycleStateMachine::CleanupDone done) {
        if (m_lifecycle->isShuttingDown()) {
            m_mcp->stop();
        }
        done(QString());
    };

    startLifecycle(actions);
}

void BridgeApplication::createServers()
{
    if (!m_listener) {
        m_listener = new SocketListener(m_config.socketPort, evictionOptions(), *m_connections, m_logger, this);
        connect(m_listener, &SocketListener::serverError, this, [this](const QString& message) {
            if (m_lifecycle) {
                m_lifecycle->reportError("socket listener", message);
            }
        });
    }

    if (!m_frontDoor) {
        m_frontDoor = new FrontDoorServer(m_config.httpPort, evictionOptions(), *m_bridge, *m_connections, m_logger, this);
        m_frontDoor->setResourceCount(m_mcp->resourceCount());
        m_frontDoor->setLifecycleInfoProvider([this]() {
            return m_lifecycle ? m_lifecycle->stateInfo() : QJsonObject();
        });
        connect(m_frontDoor, &FrontDoorServer::serverError, this, [this](const QString& message) {
            if (m_lifecycle) {
                m_lifecycle->reportError("front door", message);
            }
        });
    }

    m_listener->listen();
    m_frontDoor->setSocketPort(m_listener->port());
    m_frontDoor->listen();
}

void BridgeApplication::closeServers()
{
    if (m_frontDoor) {
        m_frontDoor->close();
    }
    if (m_listener) {
        m_listener->close();
    }
}
