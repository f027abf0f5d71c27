#include "test_harness.h"
#include <QCoreApplication>
#include <QTcpServer>
#include <QTcpSocket>
#include <QTextStream>
#include <QList>

TabBridgeLogger& testReportLogger()
{
    static TabBridgeLogger logger([]() {
        TabBridgeLoggerConfig config = TabBridgeLoggerConfig::capturing();
        config.consoleEnabled = true;
        config.minLevel = LogLevel::Info;
        return config;
    }());
    return logger;
}

// Listens on the given port (0 picks one), prints the bound port and keeps
// every accepted connection open until killed
static int holdPort(QCoreApplication& app, quint16 port)
{
    QTcpServer server;
    if (!server.listen(QHostAddress::LocalHost, port)) {
        return 2;
    }

    QList<QTcpSocket*> accepted;
    QObject::connect(&server, &QTcpServer::newConnection, [&server, &accepted]() {
        while (server.hasPendingConnections()) {
            accepted.append(server.nextPendingConnection());
        }
    });

    QTextStream(stdout) << server.serverPort() << Qt::endl;
    return app.exec();
}

// Connects to the given port, prints "connected" and stays alive even after
// the other end goes away
static int connectToPort(QCoreApplication& app, quint16 port)
{
    QTcpSocket socket;
    QObject::connect(&socket, &QTcpSocket::connected, []() {
        QTextStream(stdout) << "connected" << Qt::endl;
    });
    socket.connectToHost(QHostAddress::LocalHost, port);
    return app.exec();
}

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);

    const QStringList arguments = app.arguments();
    if (arguments.size() == 3 && arguments.at(1) == HOLD_PORT_SWITCH) {
        return holdPort(app, static_cast<quint16>(arguments.at(2).toUInt()));
    }
    if (arguments.size() == 3 && arguments.at(1) == CONNECT_PORT_SWITCH) {
        return connectToPort(app, static_cast<quint16>(arguments.at(2).toUInt()));
    }

    using Suite = int (*)(int&, int&);
    const Suite suites[] = {
        runCliArgumentTests,
        runCorrelatorTests,
        runConnectionManagerTests,
        runLifecycleTests,
        runToolBridgeTests,
        runFrontDoorTests,
        runInstanceCoordinatorTests,
        runMcpStdioTests,
        runPortEvictionTests
    };

    int totalTests = 0;
    int passedTests = 0;
    int failedTests = 0;

    for (Suite suite : suites) {
        int total = 0;
        int passed = 0;
        failedTests += suite(total, passed);
        totalTests += total;
        passedTests += passed;
    }

    testReportLogger().info("\n===============================================");
    if (failedTests > 0) {
        testReportLogger().error(QString("%1 of %2 tests failed").arg(failedTests).arg(totalTests));
        testReportLogger().info("===============================================");
        return 1;
    }

    testReportLogger().info(QString("All %1 tests passed").arg(passedTests));
    testReportLogger().info("===============================================");
    return 0;
}
