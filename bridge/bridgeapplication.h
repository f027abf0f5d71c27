#ifndef BRIDGEAPPLICATION_H
#define BRIDGEAPPLICATION_H

#include <QObject>
#include <memory>
#include "cli_args.h"
#include "server_info.h"
#include "toolregistry.h"
#include "instancecoordinator.h"
#include "lifecycle.h"

class TabBridgeLogger;
class ConnectionManager;
class SocketListener;
class FrontDoorServer;
class FrontDoorClient;
class MCPServerStdio;

// Top-level wiring of one tabbridge process. start() decides between the
// active bridge role (owns both ports and the extension socket) and the
// forwarder role (relays to a healthy bridge already running), then drives
// the chosen stack through a LifecycleStateMachine.
class BridgeApplication : public QObject
{
    Q_OBJECT

public:
    using Role = TabBridgeCommon::ServerInfo::Role;

    BridgeApplication(const TabBridgeCLI::BridgeConfig& config, TabBridgeLogger& logger, QObject* parent = nullptr);
    ~BridgeApplication();

    void start();
    void requestShutdown(const QString& reason);

    bool roleDecided() const { return m_lifecycle != nullptr; }
    Role role() const { return m_role; }

    // Null until the role has been decided
    LifecycleStateMachine* lifecycle() const { return m_lifecycle; }

    ConnectionManager& connections() { return *m_connections; }
    ToolCallBridge& toolBridge() { return *m_bridge; }
    MCPServerStdio& mcpServer() { return *m_mcp; }
    const ToolTable& tools() const { return m_tools; }

    // Bound ports once listening, configured ports otherwise
    quint16 httpPort() const;
    quint16 socketPort() const;

    TabBridgeCommon::ServerInfo serverInfo() const;

signals:
    void ready(const TabBridgeCommon::ServerInfo& info);
    void finished(int exitCode);

private:
    void onDetected(const InstanceDescriptor& descriptor);
    void startActive();
    void startForwarder();
    void startLifecycle(const LifecycleStateMachine::Actions& actions);

    void createServers();
    void closeServers();

    LifecycleStateMachine::Config lifecycleConfig() const;
    TabBridgeCommon::PortEvictionOptions evictionOptions() const;

    TabBridgeCLI::BridgeConfig m_config;
    TabBridgeLogger& m_logger;

    ToolTable m_tools;
    std::unique_ptr<ConnectionManager> m_connections;
    std::unique_ptr<ToolCallBridge> m_bridge;

    MCPServerStdio* m_mcp;
    InstanceCoordinator* m_coordinator;
    SocketListener* m_listener;
    FrontDoorServer* m_frontDoor;
    FrontDoorClient* m_forwarder;
    LifecycleStateMachine* m_lifecycle;

    Role m_role;
    bool m_started;
    bool m_announced;
    QString m_pendingShutdown;
};

#endif // BRIDGEAPPLICATION_H
