#include "test_harness.h"
#include "test_support.h"
#include "messagecorrelator.h"
#include "bridge_errors.h"
#include <QJsonArray>
#include <QJsonDocument>
#include <memory>

using namespace TabBridgeCommon;

static QList<TestResult> testResults;

namespace {

struct Outcome {
    bool settled = false;
    int calls = 0;
    QJsonValue result;
    CallError error;
};

MessageCorrelator::ResponseCallback capture(std::shared_ptr<Outcome> outcome)
{
    return [outcome](const QJsonValue& result, const CallError& error) {
        outcome->settled = true;
        outcome->calls++;
        outcome->result = result;
        outcome->error = error;
    };
}

} // namespace

bool testResolvesMatchingResponse(TestContext& ctx)
{
    TabBridgeLogger logger(TabBridgeLoggerConfig::capturing());
    LoopbackSocketPair pair;
    TEST_REQUIRE(ctx, pair.open(), "loopback pair should connect");

    pair.extension().onRequest("getTitle", [](const QJsonValue&) { return QJsonValue("Hello"); });

    MessageCorrelator correlator(pair.serverSide(), logger);
    auto outcome = std::make_shared<Outcome>();
    correlator.call("getTitle", QJsonValue(), 5000, capture(outcome));

    TEST_ASSERT(ctx, correlator.pendingCount() == 1, "call should be pending until answered");
    TEST_REQUIRE(ctx, waitUntil([&]() { return outcome->settled; }), "call should settle");
    TEST_ASSERT(ctx, !outcome->error.isError(), "no error expected");
    TEST_ASSERT(ctx, outcome->result.toString() == "Hello", "result should be the extension's value");
    TEST_ASSERT(ctx, correlator.pendingCount() == 0, "nothing should be left pending");

    const QJsonObject sent = pair.extension().received().value(0);
    TEST_ASSERT(ctx, sent.value("type").toString() == "getTitle", "envelope carries the type");
    TEST_ASSERT(ctx, !sent.value("id").toString().isEmpty(), "envelope carries a correlation id");
    TEST_ASSERT(ctx, sent.contains("payload"), "envelope carries a payload");
    return ctx.passed;
}

bool testRemoteErrorRejects(TestContext& ctx)
{
    TabBridgeLogger logger(TabBridgeLoggerConfig::capturing());
    LoopbackSocketPair pair;
    TEST_REQUIRE(ctx, pair.open(), "loopback pair should connect");

    pair.extension().failRequest("browser_click", "Element not found");

    MessageCorrelator correlator(pair.serverSide(), logger);
    auto outcome = std::make_shared<Outcome>();
    correlator.call("browser_click", QJsonObject{{"ref", "s1e1"}}, 5000, capture(outcome));

    TEST_REQUIRE(ctx, waitUntil([&]() { return outcome->settled; }), "call should settle");
    TEST_ASSERT(ctx, outcome->error.kind == ErrorKind::Remote, "extension error should be a RemoteError");
    TEST_ASSERT(ctx, outcome->error.message == "Element not found", "error text is passed through");
    return ctx.passed;
}

bool testStructuredRemoteErrorsKeepTheirText(TestContext& ctx)
{
    TabBridgeLogger logger(TabBridgeLoggerConfig::capturing());
    LoopbackSocketPair pair;
    TEST_REQUIRE(ctx, pair.open(), "loopback pair should connect");
    pair.extension().ignoreRequest("browser_click");

    MessageCorrelator correlator(pair.serverSide(), logger);
    auto listError = std::make_shared<Outcome>();
    auto numberError = std::make_shared<Outcome>();
    correlator.call("browser_click", QJsonValue(), 5000, capture(listError));
    correlator.call("browser_click", QJsonValue(), 5000, capture(numberError));
    TEST_REQUIRE(ctx, waitUntil([&]() { return pair.extension().received().size() == 2; }), "both requests sent");

    auto sendError = [&pair](int index, const QJsonValue& error) {
        const QString id = pair.extension().received().at(index).value("id").toString();
        QJsonObject envelope{
            {"type", "messageResponse"},
            {"payload", QJsonObject{{"requestId", id}, {"error", error}}}
        };
        pair.extension().sendRaw(QString::fromUtf8(QJsonDocument(envelope).toJson(QJsonDocument::Compact)));
    };
    sendError(0, QJsonArray{"stale ref", "s1e9"});
    sendError(1, 404);

    TEST_REQUIRE(ctx, waitUntil([&]() { return listError->settled && numberError->settled; }), "both calls settle");
    TEST_ASSERT(ctx, listError->error.kind == ErrorKind::Remote, "array error is a RemoteError");
    TEST_ASSERT(ctx, listError->error.message == "[\"stale ref\",\"s1e9\"]", "array error keeps its elements");
    TEST_ASSERT(ctx, numberError->error.message == "404", "numeric error keeps its value");
    TEST_ASSERT(ctx, MessageCorrelator::errorText(QJsonObject{{"code", 7}}) == "{\"code\":7}", "object error is serialised");
    TEST_ASSERT(ctx, MessageCorrelator::errorText(true) == "true", "boolean error is spelled out");
    return ctx.passed;
}

bool testTimeoutRemovesEntryOnce(TestContext& ctx)
{
    TabBridgeLogger logger(TabBridgeLoggerConfig::capturing());
    LoopbackSocketPair pair;
    TEST_REQUIRE(ctx, pair.open(), "loopback pair should connect");

    pair.extension().ignoreRequest("browser_wait");

    MessageCorrelator correlator(pair.serverSide(), logger);
    auto outcome = std::make_shared<Outcome>();
    correlator.call("browser_wait", QJsonObject{{"time", 5}}, 200, capture(outcome));

    TEST_REQUIRE(ctx, waitUntil([&]() { return outcome->settled; }, 3000), "call should time out");
    TEST_ASSERT(ctx, outcome->error.kind == ErrorKind::Timeout, "expected TimeoutError");
    TEST_ASSERT(ctx, outcome->error.message == "WebSocket response timeout after 200ms", "timeout message names the duration");
    TEST_ASSERT(ctx, correlator.pendingCount() == 0, "timed out entry should be removed");

    // A late answer for the same id is dropped without touching the callback again
    const QString id = pair.extension().received().value(0).value("id").toString();
    pair.extension().respond(id, QJsonValue("too late"));
    waitMs(100);
    TEST_ASSERT(ctx, outcome->calls == 1, "callback should run exactly once");
    TEST_ASSERT(ctx, outcome->error.kind == ErrorKind::Timeout, "late response must not overwrite the timeout");
    return ctx.passed;
}

bool testSocketNotOpenFailsWithoutWriting(TestContext& ctx)
{
    TabBridgeLogger logger(TabBridgeLoggerConfig::capturing());
    QWebSocket unopened;

    MessageCorrelator correlator(&unopened, logger);
    auto outcome = std::make_shared<Outcome>();
    correlator.call("getUrl", QJsonValue(), 1000, capture(outcome));

    TEST_ASSERT(ctx, outcome->settled, "call should fail synchronously");
    TEST_ASSERT(ctx, outcome->error.kind == ErrorKind::Transport, "expected TransportError");
    TEST_ASSERT(ctx, outcome->error.message == "WebSocket is not open", "message should say the socket is not open");
    TEST_ASSERT(ctx, correlator.pendingCount() == 0, "nothing should be registered");
    return ctx.passed;
}

bool testCloseFailsOutstandingCalls(TestContext& ctx)
{
    TabBridgeLogger logger(TabBridgeLoggerConfig::capturing());
    LoopbackSocketPair pair;
    TEST_REQUIRE(ctx, pair.open(), "loopback pair should connect");

    pair.extension().ignoreRequest("browser_snapshot");

    MessageCorrelator correlator(pair.serverSide(), logger);
    auto first = std::make_shared<Outcome>();
    auto second = std::make_shared<Outcome>();
    correlator.call("browser_snapshot", QJsonObject(), 10000, capture(first));
    correlator.call("browser_snapshot", QJsonObject(), 10000, capture(second));

    TEST_REQUIRE(ctx, waitUntil([&]() { return pair.extension().received().size() == 2; }),
                 "both requests should reach the extension");
    pair.extension().close();

    TEST_REQUIRE(ctx, waitUntil([&]() { return first->settled && second->settled; }),
                 "close should settle every pending call");
    TEST_ASSERT(ctx, first->error.kind == ErrorKind::Transport, "first call fails as TransportError");
    TEST_ASSERT(ctx, second->error.kind == ErrorKind::Transport, "second call fails as TransportError");
    TEST_ASSERT(ctx, first->error.message == "WebSocket connection closed", "close message");
    TEST_ASSERT(ctx, correlator.pendingCount() == 0, "nothing should be left pending");
    return ctx.passed;
}

bool testNoCrossResolution(TestContext& ctx)
{
    TabBridgeLogger logger(TabBridgeLoggerConfig::capturing());
    LoopbackSocketPair pair;
    TEST_REQUIRE(ctx, pair.open(), "loopback pair should connect");

    // Hold every request, then answer them in reverse order
    pair.extension().ignoreRequest("echo");

    MessageCorrelator correlator(pair.serverSide(), logger);
    QList<std::shared_ptr<Outcome>> outcomes;
    for (int i = 0; i < 5; ++i) {
        auto outcome = std::make_shared<Outcome>();
        outcomes.append(outcome);
        correlator.call("echo", QJsonObject{{"n", i}}, 5000, capture(outcome));
    }

    TEST_REQUIRE(ctx, waitUntil([&]() { return pair.extension().received().size() == 5; }),
                 "all requests should arrive");

    const QList<QJsonObject> requests = pair.extension().received();
    for (int i = requests.size() - 1; i >= 0; --i) {
        const QJsonObject request = requests.at(i);
        pair.extension().respond(request.value("id").toString(),
                                 request.value("payload").toObject().value("n"));
    }

    TEST_REQUIRE(ctx, waitUntil([&]() {
        for (const auto& outcome : outcomes) {
            if (!outcome->settled) return false;
        }
        return true;
    }), "every call should settle");

    for (int i = 0; i < outcomes.size(); ++i) {
        TEST_ASSERT(ctx, outcomes.at(i)->result.toInt() == i,
                    QString("call %1 should receive its own answer").arg(i));
        TEST_ASSERT(ctx, outcomes.at(i)->calls == 1, QString("call %1 settles once").arg(i));
    }

    QStringList ids;
    for (const QJsonObject& request : requests) {
        ids.append(request.value("id").toString());
    }
    ids.removeDuplicates();
    TEST_ASSERT(ctx, ids.size() == 5, "correlation ids must be unique while pending");
    return ctx.passed;
}

bool testIgnoresUnrelatedMessages(TestContext& ctx)
{
    TabBridgeLogger logger(TabBridgeLoggerConfig::capturing());
    LoopbackSocketPair pair;
    TEST_REQUIRE(ctx, pair.open(), "loopback pair should connect");

    pair.extension().ignoreRequest("getUrl");

    MessageCorrelator correlator(pair.serverSide(), logger);
    auto outcome = std::make_shared<Outcome>();
    correlator.call("getUrl", QJsonValue(), 5000, capture(outcome));
    TEST_REQUIRE(ctx, waitUntil([&]() { return pair.extension().received().size() == 1; }), "request should arrive");

    pair.extension().sendRaw("not json at all");
    pair.extension().sendRaw("{\"type\":\"tabActivated\",\"payload\":{}}");
    pair.extension().respond("unknown-id", QJsonValue("stray"));
    waitMs(100);

    TEST_ASSERT(ctx, !outcome->settled, "unrelated traffic must not settle the call");
    TEST_ASSERT(ctx, correlator.pendingCount() == 1, "call is still pending");

    pair.extension().respond(pair.extension().received().value(0).value("id").toString(), QJsonValue("https://a.test/"));
    TEST_REQUIRE(ctx, waitUntil([&]() { return outcome->settled; }), "matching response settles");
    TEST_ASSERT(ctx, outcome->result.toString() == "https://a.test/", "matching result delivered");
    return ctx.passed;
}

int runCorrelatorTests(int& totalTests, int& passedTests)
{
    testReportLogger().info("\nMessage correlator");

    RUN_TEST(testResolvesMatchingResponse);
    RUN_TEST(testRemoteErrorRejects);
    RUN_TEST(testStructuredRemoteErrorsKeepTheirText);
    RUN_TEST(testTimeoutRemovesEntryOnce);
    RUN_TEST(testSocketNotOpenFailsWithoutWriting);
    RUN_TEST(testCloseFailsOutstandingCalls);
    RUN_TEST(testNoCrossResolution);
    RUN_TEST(testIgnoresUnrelatedMessages);

    return summarizeResults("Correlator", testResults, totalTests, passedTests);
}
