#ifndef COMMON_H
#define COMMON_H

#include <QString>
#include <QList>
#include <QCoreApplication>
#include <QTcpServer>
#include <functional>
#include "error_codes.h"

class TabBridgeLogger;

namespace TabBridgeCommon {

    namespace Config {
        constexpr const char* APP_NAME = "tabbridge";
        constexpr const char* SERVER_NAME = "Browser MCP";

        #ifdef TABBRIDGE_VERSION
            constexpr const char* APP_VERSION = TABBRIDGE_VERSION;
        #else
            constexpr const char* APP_VERSION = "0.0.0";
        #endif

        constexpr quint16 DEFAULT_HTTP_PORT = 9008;
        constexpr quint16 DEFAULT_SOCKET_PORT = 9009;
    }

    // Setup console signal handling for graceful shutdown
    void setupSignalHandlers();

    // Route received signals to the callback on the Qt event loop
    // (must be called after QCoreApplication creation)
    void setupSignalNotifier(std::function<void(int signal)> onSignal);

    // Check if a termination signal has been received
    bool isTerminationRequested();

    // Set the shared termination flag without a signal (stdin close, tests)
    void requestTermination();
    void resetTerminationRequest();

    void cleanupSignalHandlers();

    // True if a listen() on the loopback address would succeed
    bool isPortAvailable(quint16 port);

    // PIDs listening on a TCP port, excluding this process. Processes that
    // are merely connected to the port are not included.
    QList<qint64> findPortOwners(quint16 port);

    // Best-effort: terminate every holder of the port, then force-kill
    // survivors after the grace period. Never targets this process.
    // Returns the number of processes signalled.
    int evictPortHolders(quint16 port, int graceMs, TabBridgeLogger& logger);

    // Poll until the port can be bound. Returns false if it stays busy.
    bool waitForPortRelease(quint16 port, int attempts, int intervalMs);

    struct PortEvictionOptions {
        bool enabled = true;
        int graceMs = 1000;
        int waitAttempts = 50;
        int waitIntervalMs = 100;
    };

    // Make the port bindable, evicting stale holders if allowed.
    // Throws PortConflictError if it is still busy afterwards.
    void ensurePortFree(quint16 port, const PortEvictionOptions& options, TabBridgeLogger& logger);
}

#endif // COMMON_H
