#include "server_info.h"
#include "common.h"
#include <QTextStream>

namespace TabBridgeCommon {

QString getRoleString(ServerInfo::Role role) {
    return role == ServerInfo::Role::ActiveBridge ? "active bridge" : "forwarder";
}

QString generateServerInfoString(const ServerInfo& info) {
    QString result;
    QTextStream stream(&result);

    stream << "\n";
    stream << "========================================================\n";
    stream << Config::SERVER_NAME << " bridge " << Config::APP_VERSION << " Started\n";
    stream << "--------------------------------------------------------\n";
    stream << "  Role:      " << getRoleString(info.role) << "\n";

    if (info.role == ServerInfo::Role::ActiveBridge) {
        stream << "  HTTP:      http://localhost:" << info.httpPort << "/health\n";
        stream << "  Extension: ws://localhost:" << info.socketPort << "\n";
    } else {
        stream << "  Upstream:  http://localhost:" << info.httpPort << "/tool\n";
    }

    stream << "  Tools:     " << info.toolCount << "\n";
    stream << "  PID:       " << info.pid << "\n";

    if (!info.logPath.isEmpty()) {
        stream << "  Logs:      " << info.logPath << "\n";
    }

    stream << "========================================================\n";
    return result;
}

} // namespace TabBridgeCommon
