#include "cli_help.h"
#include "common.h"
#include <sstream>

namespace TabBridgeCLI {

std::string generateHelpText(const char* programName) {
    std::ostringstream help;

    help << "Usage: " << programName << " [options]\n"
         << "\n"
         << "Bridges an MCP client on stdio to a browser extension over a local\n"
         << "WebSocket. If another bridge is already running and healthy, tool calls\n"
         << "are forwarded to it over HTTP instead.\n"
         << "\n"
         << "Port Configuration:\n"
         << "  --http-port <port>       Front door HTTP port (default: "
         << TabBridgeCommon::Config::DEFAULT_HTTP_PORT << ")\n"
         << "  --socket-port <port>     Extension WebSocket port (default: "
         << TabBridgeCommon::Config::DEFAULT_SOCKET_PORT << ")\n"
         << "\n"
         << "Calls:\n"
         << "  --call-timeout <ms>      Timeout for each extension call (default: 30000)\n"
         << "\n"
         << "Logging:\n"
         << "  --log-dir <path>         Base directory for session logs\n"
         << "  --debug                  Log debug messages\n"
         << "  --no-color               Disable coloured console output\n"
         << "\n"
         << "Other:\n"
         << "  --help, -h               Show this help message\n"
         << "  --version, -v            Show version information\n"
         << "\n"
         << "Environment:\n"
         << "  TABBRIDGE_HTTP_PORT, TABBRIDGE_SOCKET_PORT, TABBRIDGE_CALL_TIMEOUT_MS,\n"
         << "  TABBRIDGE_LOG_DIR, TABBRIDGE_DEBUG (command-line flags take precedence)\n"
         << "\n"
         << "Configure in an MCP client with:\n"
         << "  \"mcpServers\": {\n"
         << "    \"browser\": { \"command\": \"path/to/" << programName << "\" }\n"
         << "  }\n";

    return help.str();
}

std::string generateVersionString() {
    std::ostringstream version;
    version << TabBridgeCommon::Config::APP_NAME << " version " << TabBridgeCommon::Config::APP_VERSION;
    return version.str();
}

} // namespace TabBridgeCLI
