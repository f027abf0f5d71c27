#include "test_harness.h"
#include "cli_args.h"
#include "cli_help.h"
#include "server_info.h"
#include <map>
#include <string>
#include <vector>

using namespace TabBridgeCLI;

static QList<TestResult> testResults;

// Test helper to simulate command line arguments
struct ArgSimulator {
    std::vector<char*> args;
    std::vector<std::string> storage;
    bool finalized = false;

    void add(const char* arg) {
        storage.push_back(arg);
        finalized = false;
    }

    void finalize() {
        args.clear();
        for (auto& str : storage) {
            args.push_back(const_cast<char*>(str.c_str()));
        }
        args.push_back(nullptr); // Real argv is null-terminated
        finalized = true;
    }

    int argc() {
        if (!finalized) finalize();
        return static_cast<int>(args.size()) - 1;
    }

    char** argv() {
        if (!finalized) finalize();
        return args.data();
    }
};

// Environment lookup backed by a map, so tests never touch the real environment
struct FakeEnvironment {
    std::map<std::string, std::string> values;

    std::function<const char*(const char*)> lookup() {
        return [this](const char* name) -> const char* {
            auto it = values.find(name);
            return it == values.end() ? nullptr : it->second.c_str();
        };
    }
};

static BridgeConfig parse(ArgSimulator& sim, FakeEnvironment& env)
{
    return parseCommandLine(sim.argc(), sim.argv(), env.lookup());
}

bool testDefaults(TestContext& ctx) {
    ArgSimulator sim;
    sim.add("tabbridge");
    FakeEnvironment env;

    BridgeConfig config = parse(sim, env);
    TEST_ASSERT(ctx, !config.hasError, "No error expected");
    TEST_ASSERT(ctx, config.httpPort == 9008, "HTTP port defaults to 9008");
    TEST_ASSERT(ctx, config.socketPort == 9009, "Socket port defaults to 9009");
    TEST_ASSERT(ctx, config.callTimeoutMs == 30000, "Call timeout defaults to 30000ms");
    TEST_ASSERT(ctx, config.maxRetries == 3, "Three retries by default");
    TEST_ASSERT(ctx, config.retryDelayMs == 5000, "Retry delay defaults to 5000ms");
    TEST_ASSERT(ctx, config.shutdownTimeoutMs == 15000, "Shutdown cap defaults to 15000ms");
    TEST_ASSERT(ctx, config.maxStateHistory == 100, "History keeps 100 entries");
    TEST_ASSERT(ctx, !config.debug, "Debug off by default");
    TEST_ASSERT(ctx, config.logDir.empty(), "Platform log dir by default");
    return ctx.passed;
}

bool testHelpAndVersionFlags(TestContext& ctx) {
    FakeEnvironment env;

    ArgSimulator help;
    help.add("tabbridge");
    help.add("-h");
    TEST_ASSERT(ctx, parse(help, env).showHelp, "-h should set showHelp");

    ArgSimulator version;
    version.add("tabbridge");
    version.add("--version");
    TEST_ASSERT(ctx, parse(version, env).showVersion, "--version should set showVersion");

    const std::string helpText = generateHelpText("tabbridge");
    TEST_ASSERT(ctx, helpText.find("--http-port") != std::string::npos, "help documents --http-port");
    TEST_ASSERT(ctx, helpText.find("--socket-port") != std::string::npos, "help documents --socket-port");
    TEST_ASSERT(ctx, generateVersionString().rfind("tabbridge version ", 0) == 0, "version string prefix");
    return ctx.passed;
}

bool testPortArguments(TestContext& ctx) {
    ArgSimulator sim;
    sim.add("tabbridge");
    sim.add("--http-port");
    sim.add("19008");
    sim.add("--socket-port");
    sim.add("19009");
    FakeEnvironment env;

    BridgeConfig config = parse(sim, env);
    TEST_ASSERT(ctx, !config.hasError, "No error expected");
    TEST_ASSERT(ctx, config.httpPort == 19008, "HTTP port parsed");
    TEST_ASSERT(ctx, config.socketPort == 19009, "Socket port parsed");
    return ctx.passed;
}

bool testInvalidPorts(TestContext& ctx) {
    FakeEnvironment env;
    const std::vector<std::string> bad{"0", "65536", "-1", "abc", "80x"};

    for (const std::string& value : bad) {
        ArgSimulator sim;
        sim.add("tabbridge");
        sim.add("--http-port");
        sim.add(value.c_str());
        BridgeConfig config = parse(sim, env);
        TEST_ASSERT(ctx, config.hasError, QString("'%1' should be rejected").arg(QString::fromStdString(value)));
    }

    ArgSimulator missing;
    missing.add("tabbridge");
    missing.add("--socket-port");
    BridgeConfig config = parse(missing, env);
    TEST_ASSERT(ctx, config.hasError, "Missing port value should be an error");
    TEST_ASSERT(ctx, config.errorMessage == "--socket-port requires a port number", "Error message names the flag");
    return ctx.passed;
}

bool testSamePortsRejected(TestContext& ctx) {
    ArgSimulator sim;
    sim.add("tabbridge");
    sim.add("--http-port");
    sim.add("9100");
    sim.add("--socket-port");
    sim.add("9100");
    FakeEnvironment env;

    BridgeConfig config = parse(sim, env);
    TEST_ASSERT(ctx, config.hasError, "Identical ports should be an error");
    TEST_ASSERT(ctx, config.errorMessage == "--http-port and --socket-port must differ", "Error message explains why");
    return ctx.passed;
}

bool testUnknownFlag(TestContext& ctx) {
    ArgSimulator sim;
    sim.add("tabbridge");
    sim.add("--teleport");
    FakeEnvironment env;

    BridgeConfig config = parse(sim, env);
    TEST_ASSERT(ctx, config.hasError, "Unknown flag should be an error");
    TEST_ASSERT(ctx, config.errorMessage == "Unknown option: --teleport", "Error message names the flag");
    return ctx.passed;
}

bool testCallTimeoutArgument(TestContext& ctx) {
    FakeEnvironment env;

    ArgSimulator sim;
    sim.add("tabbridge");
    sim.add("--call-timeout");
    sim.add("1500");
    TEST_ASSERT(ctx, parse(sim, env).callTimeoutMs == 1500, "Call timeout parsed");

    ArgSimulator zero;
    zero.add("tabbridge");
    zero.add("--call-timeout");
    zero.add("0");
    TEST_ASSERT(ctx, parse(zero, env).hasError, "Zero timeout rejected");
    return ctx.passed;
}

bool testEnvironmentVariables(TestContext& ctx) {
    ArgSimulator sim;
    sim.add("tabbridge");
    FakeEnvironment env;
    env.values["TABBRIDGE_HTTP_PORT"] = "18008";
    env.values["TABBRIDGE_SOCKET_PORT"] = "18009";
    env.values["TABBRIDGE_CALL_TIMEOUT_MS"] = "2500";
    env.values["TABBRIDGE_LOG_DIR"] = "/tmp/tabbridge-logs";
    env.values["TABBRIDGE_DEBUG"] = "1";

    BridgeConfig config = parse(sim, env);
    TEST_ASSERT(ctx, !config.hasError, "No error expected");
    TEST_ASSERT(ctx, config.httpPort == 18008, "HTTP port from environment");
    TEST_ASSERT(ctx, config.socketPort == 18009, "Socket port from environment");
    TEST_ASSERT(ctx, config.callTimeoutMs == 2500, "Timeout from environment");
    TEST_ASSERT(ctx, config.logDir == "/tmp/tabbridge-logs", "Log dir from environment");
    TEST_ASSERT(ctx, config.debug, "Debug from environment");
    return ctx.passed;
}

bool testFlagsOverrideEnvironment(TestContext& ctx) {
    ArgSimulator sim;
    sim.add("tabbridge");
    sim.add("--http-port");
    sim.add("28008");
    FakeEnvironment env;
    env.values["TABBRIDGE_HTTP_PORT"] = "18008";

    BridgeConfig config = parse(sim, env);
    TEST_ASSERT(ctx, config.httpPort == 28008, "Command line wins over environment");
    return ctx.passed;
}

bool testInvalidEnvironmentValue(TestContext& ctx) {
    ArgSimulator sim;
    sim.add("tabbridge");
    FakeEnvironment env;
    env.values["TABBRIDGE_SOCKET_PORT"] = "not-a-port";

    BridgeConfig config = parse(sim, env);
    TEST_ASSERT(ctx, config.hasError, "Bad environment value is an error");
    TEST_ASSERT(ctx, config.errorMessage.find("TABBRIDGE_SOCKET_PORT") != std::string::npos, "Error names the variable");
    return ctx.passed;
}

bool testServerInfoBanner(TestContext& ctx) {
    TabBridgeCommon::ServerInfo info;
    info.role = TabBridgeCommon::ServerInfo::Role::ActiveBridge;
    info.httpPort = 9008;
    info.socketPort = 9009;
    info.toolCount = 13;
    info.pid = 4242;

    const QString banner = TabBridgeCommon::generateServerInfoString(info);
    TEST_ASSERT(ctx, banner.contains("http://localhost:9008/health"), "banner shows the health URL");
    TEST_ASSERT(ctx, banner.contains("ws://localhost:9009"), "banner shows the extension URL");
    TEST_ASSERT(ctx, banner.contains("active bridge"), "banner shows the role");

    info.role = TabBridgeCommon::ServerInfo::Role::Forwarder;
    const QString forwarder = TabBridgeCommon::generateServerInfoString(info);
    TEST_ASSERT(ctx, forwarder.contains("forwarder"), "forwarder role is named");
    TEST_ASSERT(ctx, !forwarder.contains("ws://"), "forwarder does not own the socket port");
    return ctx.passed;
}

int runCliArgumentTests(int& totalTests, int& passedTests)
{
    testReportLogger().info("\nCommand line and configuration");

    RUN_TEST(testDefaults);
    RUN_TEST(testHelpAndVersionFlags);
    RUN_TEST(testPortArguments);
    RUN_TEST(testInvalidPorts);
    RUN_TEST(testSamePortsRejected);
    RUN_TEST(testUnknownFlag);
    RUN_TEST(testCallTimeoutArgument);
    RUN_TEST(testEnvironmentVariables);
    RUN_TEST(testFlagsOverrideEnvironment);
    RUN_TEST(testInvalidEnvironmentValue);
    RUN_TEST(testServerInfoBanner);

    return summarizeResults("CLI", testResults, totalTests, passedTests);
}
