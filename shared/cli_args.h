#ifndef TABBRIDGE_CLI_ARGS_H
#define TABBRIDGE_CLI_ARGS_H

#include <cstring>
#include <string>
#include <cstdlib>
#include <functional>
#include <QtCore/QtGlobal>
#include "common.h"

namespace TabBridgeCLI {

// Every tunable of the bridge. Defaults match the browser extension's
// expectations, so a bare `tabbridge` needs no arguments.
struct BridgeConfig {
    // Ports
    quint16 httpPort = TabBridgeCommon::Config::DEFAULT_HTTP_PORT;     // Front door
    quint16 socketPort = TabBridgeCommon::Config::DEFAULT_SOCKET_PORT; // Extension WebSocket

    // Calls to the extension
    int callTimeoutMs = 30000;
    int pingIntervalMs = 30000;

    // Lifecycle
    int maxRetries = 3;
    int retryDelayMs = 5000;
    int maxStateHistory = 100;
    int connectedCheckIntervalMs = 5000;
    int shutdownTimeoutMs = 15000;

    // Instance detection
    int healthTimeoutMs = 2000;
    int portCheckTimeoutMs = 1000;

    // Port eviction
    int evictionGraceMs = 1000;
    int portWaitAttempts = 50;
    int portWaitIntervalMs = 100;

    // Logging
    bool debug = false;
    bool noColor = false;
    std::string logDir;            // Empty = platform default

    // Other
    bool showHelp = false;
    bool showVersion = false;

    // Error handling
    bool hasError = false;
    std::string errorMessage;
};

// Helper function to parse port argument
// Returns true if there was an error, false if successful
inline bool parsePort(const char* nextArg, int& i, quint16& portValue, BridgeConfig& config, const char* argName) {
    if (nextArg != nullptr) {
        char* endPtr;
        long port = std::strtol(nextArg, &endPtr, 10);
        if (*endPtr != '\0' || endPtr == nextArg) {
            config.hasError = true;
            config.errorMessage = std::string(argName) + " must be a valid number";
            return true;
        }
        if (port < 1 || port > 65535) {
            config.hasError = true;
            config.errorMessage = std::string(argName) + " must be between 1 and 65535";
            return true;
        }
        portValue = static_cast<quint16>(port);
        i++; // Consume next arg
    } else {
        config.hasError = true;
        config.errorMessage = std::string(argName) + " requires a port number";
        return true;
    }
    return false;
}

// Helper to parse a positive millisecond duration
inline bool parseDuration(const char* nextArg, int& i, int& value, BridgeConfig& config, const char* argName) {
    if (nextArg == nullptr) {
        config.hasError = true;
        config.errorMessage = std::string(argName) + " requires a duration in milliseconds";
        return true;
    }
    char* endPtr;
    long ms = std::strtol(nextArg, &endPtr, 10);
    if (*endPtr != '\0' || endPtr == nextArg || ms <= 0 || ms > 3600000) {
        config.hasError = true;
        config.errorMessage = std::string(argName) + " must be between 1 and 3600000";
        return true;
    }
    value = static_cast<int>(ms);
    i++;
    return false;
}

// Parse one command-line argument
// Returns true if the argument was recognized (whether successful or not)
// Check config.hasError to see if there was an error processing the argument
inline bool parseBridgeArg(const char* arg, const char* nextArg, int& i, BridgeConfig& config) {
    if (std::strcmp(arg, "--http-port") == 0) {
        parsePort(nextArg, i, config.httpPort, config, "--http-port");
        return true;
    } else if (std::strcmp(arg, "--socket-port") == 0) {
        parsePort(nextArg, i, config.socketPort, config, "--socket-port");
        return true;
    } else if (std::strcmp(arg, "--call-timeout") == 0) {
        parseDuration(nextArg, i, config.callTimeoutMs, config, "--call-timeout");
        return true;
    } else if (std::strcmp(arg, "--log-dir") == 0) {
        if (nextArg != nullptr) {
            config.logDir = nextArg;
            i++;
        } else {
            config.hasError = true;
            config.errorMessage = "--log-dir requires a directory path";
        }
        return true;
    } else if (std::strcmp(arg, "--debug") == 0) {
        config.debug = true;
        return true;
    } else if (std::strcmp(arg, "--no-color") == 0) {
        config.noColor = true;
        return true;
    } else if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
        config.showHelp = true;
        return true;
    } else if (std::strcmp(arg, "--version") == 0 || std::strcmp(arg, "-v") == 0) {
        config.showVersion = true;
        return true;
    }
    return false;
}

inline const char* systemGetEnv(const char* name) {
    return std::getenv(name);
}

// Apply TABBRIDGE_* environment overrides. Command-line flags are parsed
// afterwards and win. The lookup is injectable for tests.
inline void applyEnvironmentVariables(BridgeConfig& config,
                                      const std::function<const char*(const char*)>& getEnv = systemGetEnv) {
    int unused = 0;
    if (const char* value = getEnv("TABBRIDGE_HTTP_PORT")) {
        parsePort(value, unused, config.httpPort, config, "TABBRIDGE_HTTP_PORT");
    }
    if (const char* value = getEnv("TABBRIDGE_SOCKET_PORT")) {
        parsePort(value, unused, config.socketPort, config, "TABBRIDGE_SOCKET_PORT");
    }
    if (const char* value = getEnv("TABBRIDGE_CALL_TIMEOUT_MS")) {
        parseDuration(value, unused, config.callTimeoutMs, config, "TABBRIDGE_CALL_TIMEOUT_MS");
    }
    if (const char* value = getEnv("TABBRIDGE_LOG_DIR")) {
        config.logDir = value;
    }
    if (const char* value = getEnv("TABBRIDGE_DEBUG")) {
        config.debug = (std::strcmp(value, "1") == 0 || std::strcmp(value, "true") == 0);
    }
}

// Full parse: environment first, then argv
inline BridgeConfig parseCommandLine(int argc, char* argv[],
                                     const std::function<const char*(const char*)>& getEnv = systemGetEnv) {
    BridgeConfig config;
    applyEnvironmentVariables(config, getEnv);

    for (int i = 1; i < argc && !config.hasError; ++i) {
        const char* nextArg = (i + 1 < argc) ? argv[i + 1] : nullptr;
        if (!parseBridgeArg(argv[i], nextArg, i, config)) {
            config.hasError = true;
            config.errorMessage = std::string("Unknown option: ") + argv[i];
        }
    }

    if (!config.hasError && config.httpPort == config.socketPort) {
        config.hasError = true;
        config.errorMessage = "--http-port and --socket-port must differ";
    }

    return config;
}

} // namespace TabBridgeCLI

#endif // TABBRIDGE_CLI_ARGS_H
