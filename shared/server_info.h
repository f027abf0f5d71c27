#ifndef SERVER_INFO_H
#define SERVER_INFO_H

#include <QString>
#include <QtGlobal>

namespace TabBridgeCommon {

/**
 * Runtime state shown in the startup banner
 */
struct ServerInfo {
    enum class Role {
        ActiveBridge,     // Owns the ports and the extension socket
        Forwarder         // Relays tool calls to another running bridge
    };

    Role role = Role::ActiveBridge;
    quint16 httpPort = 0;
    quint16 socketPort = 0;
    int toolCount = 0;
    qint64 pid = 0;
    QString logPath;
};

/**
 * Generate the startup banner as a formatted string
 * @param info Runtime state
 * @return Formatted string ready to be written to stderr in one call
 */
QString generateServerInfoString(const ServerInfo& info);

QString getRoleString(ServerInfo::Role role);

} // namespace TabBridgeCommon

#endif // SERVER_INFO_H
