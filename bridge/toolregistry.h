#ifndef TOOLREGISTRY_H
#define TOOLREGISTRY_H

#include <QString>
#include <QStringList>
#include <QJsonObject>
#include <QJsonArray>
#include <QList>
#include <QHash>
#include <functional>
#include "bridge_errors.h"

class ConnectionManager;
class TabBridgeLogger;

// Called exactly once per tool run, with either a result or an error
using ToolCompletion = std::function<void(const QJsonObject& result, const TabBridgeCommon::CallError& error)>;

// A handler validates its arguments up front (throwing HandlerError on bad
// input), starts its extension calls and returns. The run finishes when
// done is called.
using ToolHandler = std::function<void(ConnectionManager& connections, const QJsonObject& args, ToolCompletion done)>;

struct ToolDefinition {
    QString name;
    QString description;
    QJsonObject inputSchema;
    ToolHandler handler;
};

// Immutable name -> tool table, built once at startup
class ToolTable
{
public:
    ToolTable() = default;
    // The first registration of a name wins
    explicit ToolTable(const QList<ToolDefinition>& tools);

    const ToolDefinition* find(const QString& name) const;
    bool contains(const QString& name) const { return m_index.contains(name); }
    QStringList names() const;
    QJsonArray describe() const;
    int size() const { return m_tools.size(); }

private:
    QList<ToolDefinition> m_tools;
    QHash<QString, int> m_index;
};

namespace ToolAliases {
    constexpr const char* TOOL_PREFIX = "browser_";

    // Alternative spellings a registered name answers to
    QStringList aliasesFor(const QString& registeredName);

    // Exact registration first, then aliases. Empty if nothing matches.
    QString resolve(const ToolTable& table, const QString& requested);
}

struct ToolCallResult {
    QJsonObject result;
    QString resolvedName;
    TabBridgeCommon::ErrorKind failure = TabBridgeCommon::ErrorKind::None;
    QString errorMessage;

    bool isError() const { return failure != TabBridgeCommon::ErrorKind::None; }
};

// Runs tools against the ConnectionManager. Never throws: every failure
// comes back as a structured result with isError set. Runs overlap freely
// and each reports through its own callback when it finishes.
class ToolCallBridge
{
public:
    static constexpr const char* LIST_TOOLS_META_NAME = "__list_tools__";

    using ResultCallback = std::function<void(const ToolCallResult& outcome)>;

    ToolCallBridge(const ToolTable& table, ConnectionManager& connections, TabBridgeLogger& logger);

    // The callback runs once. Unknown names and the meta-name are answered
    // before execute() returns.
    void execute(const QString& name, const QJsonObject& args, ResultCallback callback);

    QJsonObject listTools() const;

    const ToolTable& table() const { return m_table; }

    static QJsonObject errorResult(const QString& text);

private:
    static void logCall(TabBridgeLogger& logger, const QString& requested, const QString& resolved,
                        qint64 durationMs, const ToolCallResult& outcome);

    const ToolTable& m_table;
    ConnectionManager& m_connections;
    TabBridgeLogger& m_logger;
};

#endif // TOOLREGISTRY_H
