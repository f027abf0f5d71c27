#include "toolregistry.h"
#include "connectionmanager.h"
#include "tabbridgelogger.h"
#include <QElapsedTimer>
#include <memory>

using TabBridgeCommon::CallError;
using TabBridgeCommon::ErrorKind;

ToolTable::ToolTable(const QList<ToolDefinition>& tools)
{
    for (const ToolDefinition& tool : tools) {
        if (m_index.contains(tool.name)) {
            continue;
        }
        m_index.insert(tool.name, m_tools.size());
        m_tools.append(tool);
    }
}

const ToolDefinition* ToolTable::find(const QString& name) const
{
    auto it = m_index.constFind(name);
    if (it == m_index.constEnd()) {
        return nullptr;
    }
    return &m_tools.at(it.value());
}

QStringList ToolTable::names() const
{
    QStringList result;
    for (const ToolDefinition& tool : m_tools) {
        result.append(tool.name);
    }
    return result;
}

QJsonArray ToolTable::describe() const
{
    QJsonArray tools;
    for (const ToolDefinition& tool : m_tools) {
        tools.append(QJsonObject{
            {"name", tool.name},
            {"description", tool.description},
            {"inputSchema", tool.inputSchema}
        });
    }
    return tools;
}

namespace ToolAliases {

QStringList aliasesFor(const QString& registeredName)
{
    const QString prefix = QString::fromLatin1(TOOL_PREFIX);
    if (!registeredName.startsWith(prefix) || registeredName.size() == prefix.size()) {
        return {};
    }

    const QString base = registeredName.mid(prefix.size());
    return {
        base,
        prefix + registeredName,                  // browser_browser_<base>
        QStringLiteral("mcp_") + registeredName   // mcp_browser_<base>
    };
}

QString resolve(const ToolTable& table, const QString& requested)
{
    if (table.contains(requested)) {
        return requested;
    }

    for (const QString& name : table.names()) {
        if (aliasesFor(name).contains(requested)) {
            return name;
        }
    }
    return QString();
}

} // namespace ToolAliases

ToolCallBridge::ToolCallBridge(const ToolTable& table, ConnectionManager& connections, TabBridgeLogger& logger)
    : m_table(table)
    , m_connections(connections)
    , m_logger(logger)
{
}

QJsonObject ToolCallBridge::errorResult(const QString& text)
{
    return QJsonObject{
        {"content", QJsonArray{QJsonObject{{"type", "text"}, {"text", text}}}},
        {"isError", true}
    };
}

QJsonObject ToolCallBridge::listTools() const
{
    return QJsonObject{{"tools", m_table.describe()}};
}

void ToolCallBridge::execute(const QString& name, const QJsonObject& args, ResultCallback callback)
{
    if (name == LIST_TOOLS_META_NAME) {
        ToolCallResult outcome;
        outcome.resolvedName = name;
        outcome.result = listTools();
        callback(outcome);
        return;
    }

    const QString resolved = ToolAliases::resolve(m_table, name);
    if (resolved.isEmpty()) {
        ToolCallResult outcome;
        outcome.failure = ErrorKind::ToolNotFound;
        outcome.errorMessage = QString("Tool \"%1\" not found. Available tools: %2")
            .arg(name, m_table.names().join(", "));
        outcome.result = errorResult(outcome.errorMessage);
        m_logger.warning(outcome.errorMessage);
        callback(outcome);
        return;
    }

    const ToolDefinition* tool = m_table.find(resolved);

    auto timer = std::make_shared<QElapsedTimer>();
    timer->start();
    auto settled = std::make_shared<bool>(false);
    TabBridgeLogger* logger = &m_logger;

    ToolCompletion done = [logger, name, resolved, timer, settled, callback](const QJsonObject& result,
                                                                          const CallError& error) {
        if (*settled) {
            logger->warning(QString("Tool %1 reported completion more than once").arg(resolved));
            return;
        }
        *settled = true;

        ToolCallResult outcome;
        outcome.resolvedName = resolved;
        if (error.isError()) {
            outcome.failure = error.kind;
            outcome.errorMessage = error.message;
            outcome.result = errorResult(error.message);
        } else {
            outcome.result = result;
        }

        logCall(*logger, name, resolved, timer->elapsed(), outcome);
        callback(outcome);
    };

    try {
        tool->handler(m_connections, args, done);
    } catch (const TabBridgeCommon::BridgeError& e) {
        done(QJsonObject(), CallError::make(e.kind(), e.message()));
    } catch (const std::exception& e) {
        done(QJsonObject(), CallError::make(ErrorKind::Handler, QString::fromUtf8(e.what())));
    }
}

void ToolCallBridge::logCall(TabBridgeLogger& logger, const QString& requested, const QString& resolved,
                             qint64 durationMs, const ToolCallResult& outcome)
{
    QJsonObject metadata{
        {"tool", resolved},
        {"durationMs", durationMs},
        {"status", outcome.isError() ? "error" : "success"}
    };
    if (requested != resolved) {
        metadata["requestedAs"] = requested;
    }
    if (outcome.isError()) {
        metadata["errorKind"] = TabBridgeCommon::errorKindToString(outcome.failure);
        metadata["error"] = outcome.errorMessage;
    }

    logger.log(outcome.isError() ? LogLevel::Warning : LogLevel::Info, "tools",
                 QString("Tool %1 %2 in %3ms")
                     .arg(resolved)
                     .arg(outcome.isError() ? "failed" : "completed")
                     .arg(durationMs),
                 metadata);
}
