#include "mcpserver_stdio.h"
#include "tabbridgelogger.h"
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonArray>
#include <cstdio>
#include <memory>
#ifdef Q_OS_WIN
#include <windows.h>
#include <io.h>
#include <fcntl.h>
#else
#include <unistd.h>
#include <errno.h>
#include <cstring>
#endif

MCPServerStdio::MCPServerStdio(TabBridgeLogger& logger, QObject* parent)
    : QObject(parent)
    , m_logger(logger)
    , m_stdinNotifier(nullptr)
    , m_stdinPollTimer(nullptr)
    , m_serverName("Browser MCP")
    , m_serverVersion("1.0.0")
    , m_initialized(false)
    , m_running(false)
    , m_stdinClosed(false)
{
    m_capabilities = QJsonObject{
        {"tools", QJsonObject{}},
        {"resources", QJsonObject{}}
    };

#ifdef Q_OS_WIN
    _setmode(_fileno(stdin), _O_BINARY);
    _setmode(_fileno(stdout), _O_BINARY);
#endif

    if (!m_stdout.open(stdout, QIODevice::WriteOnly | QIODevice::Unbuffered)) {
        m_logger.error(QString("Failed to open stdout: %1").arg(m_stdout.errorString()));
    }
}

MCPServerStdio::~MCPServerStdio()
{
    stop();
}

void MCPServerStdio::start()
{
    if (m_running) {
        return;
    }

    m_running = true;

    // An output device means a test is driving us through processLine()
    if (m_output) {
        return;
    }

#ifdef Q_OS_WIN
    m_stdinPollTimer = new QTimer(this);
    connect(m_stdinPollTimer, &QTimer::timeout, this, &MCPServerStdio::handleStdinReady);
    m_stdinPollTimer->start(50);
#else
    m_stdinNotifier = new QSocketNotifier(STDIN_FILENO, QSocketNotifier::Read, this);
    connect(m_stdinNotifier, &QSocketNotifier::activated, this, &MCPServerStdio::handleStdinReady);
#endif

    m_logger.debug("MCP stdio server started");
}

void MCPServerStdio::stop()
{
    if (!m_running) {
        return;
    }
    m_running = false;

    if (m_stdinNotifier) {
        m_stdinNotifier->setEnabled(false);
        m_stdinNotifier->deleteLater();
        m_stdinNotifier = nullptr;
    }
    if (m_stdinPollTimer) {
        m_stdinPollTimer->stop();
        m_stdinPollTimer->deleteLater();
        m_stdinPollTimer = nullptr;
    }

    m_logger.debug("MCP stdio server stopped");
}

void MCPServerStdio::setTools(const QJsonArray& tools)
{
    m_tools = tools;
}

void MCPServerStdio::setToolCallHandler(ToolCallHandler handler)
{
    m_toolCallHandler = std::move(handler);
}

void MCPServerStdio::registerResource(const ResourceDefinition& resource)
{
    m_resources[resource.uri] = resource;
}

void MCPServerStdio::setServerInfo(const QString& name, const QString& version)
{
    m_serverName = name;
    m_serverVersion = version;
}

void MCPServerStdio::setCapabilities(const QJsonObject& capabilities)
{
    m_capabilities = capabilities;
}

void MCPServerStdio::setOutputDevice(QIODevice* device)
{
    m_output = device;
}

void MCPServerStdio::signalStdinClosed()
{
    if (m_stdinClosed) {
        return;
    }
    m_stdinClosed = true;
    if (m_stdinNotifier) {
        m_stdinNotifier->setEnabled(false);
    }
    if (m_stdinPollTimer) {
        m_stdinPollTimer->stop();
    }
    m_logger.info("stdin closed by the MCP client");
    emit stdinClosed();
}

void MCPServerStdio::handleStdinReady()
{
    if (!m_running || m_stdinClosed) {
        return;
    }

    char chunk[4096];

#ifdef Q_OS_WIN
    HANDLE hStdin = GetStdHandle(STD_INPUT_HANDLE);
    if (hStdin == INVALID_HANDLE_VALUE) {
        signalStdinClosed();
        return;
    }

    DWORD available = 0;
    if (!PeekNamedPipe(hStdin, NULL, 0, NULL, &available, NULL)) {
        DWORD error = GetLastError();
        if (error == ERROR_BROKEN_PIPE || error == ERROR_PIPE_NOT_CONNECTED) {
            signalStdinClosed();
        }
        return;
    }
    if (available == 0) {
        return;
    }

    DWORD bytesRead = 0;
    DWORD toRead = qMin<DWORD>(available, sizeof(chunk));
    if (!ReadFile(hStdin, chunk, toRead, &bytesRead, NULL) || bytesRead == 0) {
        signalStdinClosed();
        return;
    }
    m_inputBuffer.append(chunk, static_cast<int>(bytesRead));
#else
    ssize_t bytesRead = ::read(STDIN_FILENO, chunk, sizeof(chunk));
    if (bytesRead == 0) {
        signalStdinClosed();
        return;
    }
    if (bytesRead < 0) {
        if (errno == EAGAIN || errno == EINTR) {
            return;
        }
        m_logger.error(QString("Failed to read stdin: %1").arg(strerror(errno)));
        signalStdinClosed();
        return;
    }
    m_inputBuffer.append(chunk, static_cast<int>(bytesRead));
#endif

    // Take every complete line out of the buffer before handling any of them
    QList<QByteArray> lines;
    int newline;
    while ((newline = m_inputBuffer.indexOf('\n')) >= 0) {
        lines.append(m_inputBuffer.left(newline));
        m_inputBuffer.remove(0, newline + 1);
    }

    if (m_inputBuffer.size() > MAX_MESSAGE_BYTES) {
        m_inputBuffer.clear();
        sendError(QJsonValue::Null, -32700, "Message too large");
    }

    for (const QByteArray& line : lines) {
        processLine(line);
    }
}

void MCPServerStdio::processLine(const QByteArray& line)
{
    const QByteArray trimmed = line.trimmed();
    if (trimmed.isEmpty()) {
        return;
    }

    QJsonParseError error;
    QJsonDocument doc = QJsonDocument::fromJson(trimmed, &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        m_logger.warning(QString("JSON parse error at offset %1: %2").arg(error.offset).arg(error.errorString()));
        sendError(QJsonValue::Null, -32700, "Parse error");
        return;
    }

    processJsonRpcRequest(doc.object());
}

void MCPServerStdio::processJsonRpcRequest(const QJsonObject& request)
{
    if (request.value("jsonrpc").toString() != JSONRPC_VERSION || !request.contains("method")) {
        sendError(request.value("id"), -32600, "Invalid Request");
        return;
    }

    const QString method = request["method"].toString();
    const QJsonObject params = request.value("params").toObject();
    const QJsonValue id = request.value("id");
    const bool isNotification = !request.contains("id");

    m_logger.debug(QString("MCP <- %1").arg(method));

    try {
        QJsonObject result;

        if (method == "initialize") {
            result = handleInitialize(params);
            m_initialized = true;
        } else if (method == "ping") {
            result = QJsonObject{};
        } else if (method == "tools/list") {
            result = handleListTools(params);
        } else if (method == "tools/call") {
            if (!params.value("name").isString()) {
                sendError(id, -32602, "Invalid params: tool name is required");
                return;
            }
            handleCallTool(id, isNotification, params);
            return;
        } else if (method == "resources/list") {
            result = handleListResources(params);
        } else if (method == "resources/read") {
            result = handleReadResource(params);
        } else if (method.startsWith("notifications/")) {
            return;
        } else {
            sendError(id, -32601, "Method not found");
            return;
        }

        if (!isNotification) {
            sendResponse(id, result);
        }
    } catch (const std::exception& e) {
        m_logger.error(QString("Internal error handling %1: %2").arg(method, e.what()));
        sendError(id, -32603, QString("Internal error: %1").arg(e.what()));
    }
}

QJsonObject MCPServerStdio::handleInitialize(const QJsonObject& params)
{
    const QString clientName = params.value("clientInfo").toObject().value("name").toString();
    if (!clientName.isEmpty()) {
        m_logger.info(QString("MCP client connected: %1").arg(clientName));
    }

    return QJsonObject{
        {"protocolVersion", MCP_VERSION},
        {"capabilities", m_capabilities},
        {"serverInfo", QJsonObject{
            {"name", m_serverName},
            {"version", m_serverVersion}
        }}
    };
}

QJsonObject MCPServerStdio::handleListTools(const QJsonObject& params)
{
    Q_UNUSED(params);
    return QJsonObject{{"tools", m_tools}};
}

void MCPServerStdio::handleCallTool(const QJsonValue& id, bool isNotification, const QJsonObject& params)
{
    const QString toolName = params["name"].toString();
    const QJsonObject arguments = params.value("arguments").toObject();

    QPointer<MCPServerStdio> self(this);
    auto replied = std::make_shared<bool>(false);
    ToolResultCallback respond = [self, id, isNotification, replied](const QJsonObject& result) {
        if (!self || *replied) {
            return;
        }
        *replied = true;
        if (!isNotification) {
            self->sendResponse(id, result);
        }
    };

    if (!m_toolCallHandler) {
        respond(QJsonObject{
            {"content", QJsonArray{QJsonObject{{"type", "text"}, {"text", QString("Tool \"%1\" not found").arg(toolName)}}}},
            {"isError", true}
        });
        return;
    }

    // Tool failures are results, not protocol errors, so the agent can read them
    try {
        m_toolCallHandler(toolName, arguments, respond);
    } catch (const std::exception& e) {
        respond(QJsonObject{
            {"content", QJsonArray{QJsonObject{
                {"type", "text"},
                {"text", QString("Error executing tool: %1").arg(e.what())}
            }}},
            {"isError", true}
        });
    }
}

QJsonObject MCPServerStdio::handleListResources(const QJsonObject& params)
{
    Q_UNUSED(params);

    QJsonArray resources;
    for (const auto& resource : m_resources) {
        resources.append(QJsonObject{
            {"uri", resource.uri},
            {"name", resource.name},
            {"description", resource.description},
            {"mimeType", resource.mimeType}
        });
    }
    return QJsonObject{{"resources", resources}};
}

QJsonObject MCPServerStdio::handleReadResource(const QJsonObject& params)
{
    const QString uri = params.value("uri").toString();
    auto it = m_resources.constFind(uri);
    if (it == m_resources.constEnd() || !it->reader) {
        return QJsonObject{{"contents", QJsonArray{}}};
    }

    QJsonObject content = it->reader();
    if (!content.contains("uri")) {
        content["uri"] = uri;
    }
    return QJsonObject{{"contents", QJsonArray{content}}};
}

void MCPServerStdio::sendResponse(const QJsonValue& id, const QJsonObject& result)
{
    writeMessage(QJsonObject{
        {"jsonrpc", JSONRPC_VERSION},
        {"id", id},
        {"result", result}
    });
}

void MCPServerStdio::sendError(const QJsonValue& id, int code, const QString& message)
{
    writeMessage(QJsonObject{
        {"jsonrpc", JSONRPC_VERSION},
        {"id", id},
        {"error", QJsonObject{
            {"code", code},
            {"message", message}
        }}
    });
}

void MCPServerStdio::writeMessage(const QJsonObject& message)
{
    QByteArray data = QJsonDocument(message).toJson(QJsonDocument::Compact);
    data.append('\n');

    QIODevice* device = m_output ? m_output.data() : static_cast<QIODevice*>(&m_stdout);
    if (device->write(data) != data.size()) {
        m_logger.warning(QString("Short write to MCP client: %1").arg(device->errorString()));
    }
    if (!m_output) {
        std::fflush(stdout);
    }
}
