#ifndef TABBRIDGE_TEST_HARNESS_H
#define TABBRIDGE_TEST_HARNESS_H

#include <QString>
#include <QStringList>
#include <QList>
#include "tabbridgelogger.h"

// Test context for collecting multiple failures
struct TestContext {
    bool passed = true;
    QStringList failures;

    void fail(const QString& message) {
        passed = false;
        failures.append(message);
    }
};

// Test result tracking
struct TestResult {
    QString testName;
    bool passed;
    QString message;
};

// Logger the runner reports through; set up by test_main.cpp
TabBridgeLogger& testReportLogger();

// Helper macro for tests - collects failures but continues testing
#define TEST_ASSERT(ctx, condition, message) \
    if (!(condition)) { \
        (ctx).fail(QString("Assertion failed: %1").arg(message)); \
    }

// Macro for tests that should stop on first failure
#define TEST_REQUIRE(ctx, condition, message) \
    if (!(condition)) { \
        (ctx).fail(QString("Required condition failed: %1").arg(message)); \
        return (ctx).passed; \
    }

#define RUN_TEST(testFunc) \
    { \
        QString testName = #testFunc; \
        TestContext ctx; \
        testFunc(ctx); \
        QString message = ctx.passed ? "Passed" : ctx.failures.join("; "); \
        testResults.append({testName, ctx.passed, message}); \
        if (ctx.passed) { \
            testReportLogger().info(QString("  ✓ %1").arg(testName)); \
        } else { \
            testReportLogger().error(QString("  ✗ %1: %2").arg(testName).arg(message)); \
        } \
    }

// Tally a suite's results. Returns the number of failures.
inline int summarizeResults(const QString& suiteName, const QList<TestResult>& results,
                            int& totalTests, int& passedTests)
{
    int passed = 0;
    int failed = 0;

    for (const auto& result : results) {
        if (result.passed) {
            passed++;
        } else {
            failed++;
        }
    }

    totalTests = passed + failed;
    passedTests = passed;
    testReportLogger().info(QString("%1 Tests: %2 passed, %3 failed")
        .arg(suiteName)
        .arg(passed)
        .arg(failed));

    return failed;
}

// Suites
int runCliArgumentTests(int& totalTests, int& passedTests);
int runCorrelatorTests(int& totalTests, int& passedTests);
int runConnectionManagerTests(int& totalTests, int& passedTests);
int runLifecycleTests(int& totalTests, int& passedTests);
int runToolBridgeTests(int& totalTests, int& passedTests);
int runFrontDoorTests(int& totalTests, int& passedTests);
int runInstanceCoordinatorTests(int& totalTests, int& passedTests);
int runMcpStdioTests(int& totalTests, int& passedTests);
int runPortEvictionTests(int& totalTests, int& passedTests);

// Command-line switches that turn the test binary into a helper process
// for the port eviction tests
constexpr const char* HOLD_PORT_SWITCH = "--hold-port";
constexpr const char* CONNECT_PORT_SWITCH = "--connect-port";

#endif // TABBRIDGE_TEST_HARNESS_H
