#include "test_harness.h"
#include "test_support.h"
#include "common.h"
#include "bridge_errors.h"
#include <QCoreApplication>
#include <QProcess>
#include <QStandardPaths>
#include <QTcpServer>

using namespace TabBridgeCommon;

static QList<TestResult> testResults;

namespace {

// This test binary re-run in one of its helper roles
class HelperProcess
{
public:
    ~HelperProcess() { stop(); }

    bool start(const char* role, quint16 port)
    {
        m_process.start(QCoreApplication::applicationFilePath(), {role, QString::number(port)});
        return m_process.waitForStarted(5000);
    }

    QString readLine(int timeoutMs = 5000)
    {
        waitUntil([this]() {
            return m_process.canReadLine() || m_process.state() == QProcess::NotRunning;
        }, timeoutMs);
        return QString::fromUtf8(m_process.readLine()).trimmed();
    }

    bool waitForExit(int timeoutMs)
    {
        return waitUntil([this]() { return m_process.state() == QProcess::NotRunning; }, timeoutMs);
    }

    void stop()
    {
        if (m_process.state() != QProcess::NotRunning) {
            m_process.kill();
            m_process.waitForFinished(3000);
        }
    }

    bool isRunning() const { return m_process.state() == QProcess::Running; }
    qint64 pid() const { return m_process.processId(); }

private:
    QProcess m_process;
};

bool ownerLookupAvailable()
{
#ifdef Q_OS_WIN
    return !QStandardPaths::findExecutable("netstat").isEmpty();
#else
    return !QStandardPaths::findExecutable("lsof").isEmpty();
#endif
}

} // namespace

bool testOnlyTheListenerIsEvicted(TestContext& ctx)
{
    if (!ownerLookupAvailable()) {
        testReportLogger().info("    port owner lookup tool not installed, skipping");
        return ctx.passed;
    }

    TabBridgeLogger logger(TabBridgeLoggerConfig::capturing());

    HelperProcess holder;
    TEST_REQUIRE(ctx, holder.start(HOLD_PORT_SWITCH, 0), "port holder should start");
    const quint16 port = static_cast<quint16>(holder.readLine().toUInt());
    TEST_REQUIRE(ctx, port != 0, "port holder reports the port it listens on");

    HelperProcess client;
    TEST_REQUIRE(ctx, client.start(CONNECT_PORT_SWITCH, port), "client should start");
    TEST_REQUIRE(ctx, client.readLine() == "connected", "client connects to the held port");

    const QList<qint64> owners = findPortOwners(port);
    TEST_ASSERT(ctx, owners == QList<qint64>{holder.pid()}, "only the listening process owns the port");
    TEST_ASSERT(ctx, !owners.contains(client.pid()), "a connected client is not an owner");

    PortEvictionOptions options;
    options.graceMs = 300;
    options.waitAttempts = 50;
    options.waitIntervalMs = 100;

    QString failure;
    try {
        ensurePortFree(port, options, logger);
    } catch (const PortConflictError& e) {
        failure = e.message();
    }

    TEST_ASSERT(ctx, failure.isEmpty(), QString("port should be freed: %1").arg(failure));
    TEST_ASSERT(ctx, holder.waitForExit(5000), "the listening process is terminated");
    TEST_ASSERT(ctx, client.isRunning(), "the connected client survives the eviction");
    TEST_ASSERT(ctx, isPortAvailable(port), "the port can be bound again");
    return ctx.passed;
}

bool testOwnListenerIsNeverEvicted(TestContext& ctx)
{
    TabBridgeLogger logger(TabBridgeLoggerConfig::capturing());

    QTcpServer own;
    TEST_REQUIRE(ctx, own.listen(QHostAddress::LocalHost, 0), "should bind a random port");
    const quint16 port = own.serverPort();

    TEST_ASSERT(ctx, !findPortOwners(port).contains(QCoreApplication::applicationPid()),
                "this process is never listed as an owner");

    PortEvictionOptions options;
    options.graceMs = 50;
    options.waitAttempts = 3;
    options.waitIntervalMs = 20;

    QString failure;
    try {
        ensurePortFree(port, options, logger);
    } catch (const PortConflictError& e) {
        failure = e.message();
    }

    TEST_ASSERT(ctx, failure == QString("Port %1 is still in use after 60ms").arg(port),
                QString("busy port reports the wait it gave up after, got: %1").arg(failure));
    TEST_ASSERT(ctx, own.isListening(), "this process keeps its listener");
    return ctx.passed;
}

bool testDisabledEvictionRefusesBusyPort(TestContext& ctx)
{
    TabBridgeLogger logger(TabBridgeLoggerConfig::capturing());

    QTcpServer own;
    TEST_REQUIRE(ctx, own.listen(QHostAddress::LocalHost, 0), "should bind a random port");
    const quint16 port = own.serverPort();

    PortEvictionOptions options;
    options.enabled = false;

    QString failure;
    try {
        ensurePortFree(port, options, logger);
    } catch (const PortConflictError& e) {
        failure = e.message();
    }
    TEST_ASSERT(ctx, failure == QString("Port %1 is already in use").arg(port), "busy port is refused outright");

    own.close();
    bool threw = false;
    try {
        ensurePortFree(port, options, logger);
    } catch (const PortConflictError&) {
        threw = true;
    }
    TEST_ASSERT(ctx, !threw, "a free port passes without eviction");
    return ctx.passed;
}

int runPortEvictionTests(int& totalTests, int& passedTests)
{
    testReportLogger().info("\nPort eviction");

    RUN_TEST(testOnlyTheListenerIsEvicted);
    RUN_TEST(testOwnListenerIsNeverEvicted);
    RUN_TEST(testDisabledEvictionRefusesBusyPort);

    return summarizeResults("Port eviction", testResults, totalTests, passedTests);
}
