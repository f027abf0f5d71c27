#include <QCoreApplication>
#include <QDir>
#include <iostream>
#include "bridgeapplication.h"
#include "tabbridgelogger.h"
#include "qt_message_handler.h"
#include "cli_args.h"
#include "cli_help.h"
#include "common.h"
#include "error_codes.h"
#include "server_info.h"

#ifdef Q_OS_WIN
#include <windows.h>
#include <io.h>
#include <fcntl.h>
#endif

using namespace TabBridgeCommon;

int main(int argc, char *argv[]) {
#ifdef Q_OS_WIN
    SetConsoleOutputCP(CP_UTF8);
    SetConsoleCP(CP_UTF8);

    // stdout carries JSON-RPC, so no newline translation
    _setmode(_fileno(stdout), _O_BINARY);
    _setmode(_fileno(stdin), _O_BINARY);
#endif

    TabBridgeCLI::BridgeConfig config = TabBridgeCLI::parseCommandLine(argc, argv);

    if (config.hasError) {
        std::cerr << "Error: " << config.errorMessage << "\n";
        std::cerr << TabBridgeCLI::generateHelpText(argv[0]);
        return static_cast<int>(ExitCode::INVALID_ARGUMENTS);
    }
    if (config.showHelp) {
        // Help goes to stderr as well: stdout belongs to the MCP client
        std::cerr << TabBridgeCLI::generateHelpText(argv[0]);
        return 0;
    }
    if (config.showVersion) {
        std::cerr << TabBridgeCLI::generateVersionString() << "\n";
        return 0;
    }

    setupSignalHandlers();

    QCoreApplication app(argc, argv);
    app.setApplicationName(Config::APP_NAME);
    app.setApplicationVersion(Config::APP_VERSION);
    app.setOrganizationName("TabBridge");

    TabBridgeLoggerConfig logConfig = TabBridgeLoggerConfig::defaults();
    if (!config.logDir.empty()) {
        logConfig.baseLogDir = QString::fromStdString(config.logDir);
        if (!QDir().mkpath(logConfig.baseLogDir)) {
            exitWithError(ExitCode::LOG_DIR_CREATE_FAILED, logConfig.baseLogDir);
        }
    }
    logConfig.consoleColors = !config.noColor;
    logConfig.minLevel = config.debug ? LogLevel::Debug : LogLevel::Info;

    TabBridgeLogger logger(logConfig);
    installQtMessageHandler(&logger);

    BridgeApplication bridge(config, logger);

    setupSignalNotifier([&bridge, &logger](int signal) {
        logger.info(QString("Received signal %1").arg(signal));
        bridge.requestShutdown(QString("signal %1").arg(signal));
    });

    QObject::connect(&bridge, &BridgeApplication::ready, &app, [](const ServerInfo& info) {
        std::cerr << generateServerInfoString(info).toStdString() << std::flush;
    });

    QObject::connect(&bridge, &BridgeApplication::finished, &app, [&app, &bridge, &logger](int exitCode) {
        if (exitCode == 0) {
            app.exit(0);
            return;
        }

        ExitCode code = ExitCode::SHUTDOWN_FAILED;
        if (bridge.lifecycle() && bridge.lifecycle()->state() == LifecycleStateMachine::State::Failed) {
            code = ExitCode::LIFECYCLE_FAILED;
        }
        std::cerr << "Error: " << exitCodeToString(code) << "\n";
        std::cerr << "Full logs available at: " << logger.currentSessionPath().toStdString() << "\n";
        app.exit(static_cast<int>(code));
    });

    logger.info(QString("%1 %2 starting (pid %3)")
                .arg(Config::APP_NAME)
                .arg(Config::APP_VERSION)
                .arg(QCoreApplication::applicationPid()));

    bridge.start();

    int result = app.exec();

    logger.info(QString("Exiting with code %1").arg(result));
    logger.flush();
    uninstallQtMessageHandler();
    cleanupSignalHandlers();
    return result;
}
