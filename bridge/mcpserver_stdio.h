#ifndef MCPSERVER_STDIO_H
#define MCPSERVER_STDIO_H

#include <QObject>
#include <QJsonObject>
#include <QJsonDocument>
#include <QJsonArray>
#include <QMap>
#include <QFile>
#include <QPointer>
#include <QIODevice>
#include <QSocketNotifier>
#include <QTimer>
#include <functional>

class TabBridgeLogger;

// MCP (JSON-RPC 2.0, newline delimited) on stdin/stdout
class MCPServerStdio : public QObject
{
    Q_OBJECT

public:
    // Delivers a tools/call result. Calls after the first are ignored.
    using ToolResultCallback = std::function<void(const QJsonObject& result)>;
    // Starts a tool run and returns; the run answers through respond, in any
    // order relative to other requests
    using ToolCallHandler = std::function<void(const QString& name, const QJsonObject& arguments,
                                               ToolResultCallback respond)>;

    struct ResourceDefinition {
        QString uri;
        QString name;
        QString description;
        QString mimeType;
        std::function<QJsonObject()> reader;   // Returns one "contents" entry
    };

    explicit MCPServerStdio(TabBridgeLogger& logger, QObject* parent = nullptr);
    ~MCPServerStdio();

    void start();
    void stop();
    bool isRunning() const { return m_running; }

    void setTools(const QJsonArray& tools);
    void setToolCallHandler(ToolCallHandler handler);
    void registerResource(const ResourceDefinition& resource);

    void setServerInfo(const QString& name, const QString& version);
    void setCapabilities(const QJsonObject& capabilities);

    // Replaces stdout, used by tests
    void setOutputDevice(QIODevice* device);

    // Handle one line of input as a JSON-RPC message
    void processLine(const QByteArray& line);

    int resourceCount() const { return m_resources.size(); }

signals:
    void stdinClosed();

private slots:
    void handleStdinReady();

private:
    void processJsonRpcRequest(const QJsonObject& request);

    QJsonObject handleInitialize(const QJsonObject& params);
    QJsonObject handleListTools(const QJsonObject& params);
    void handleCallTool(const QJsonValue& id, bool isNotification, const QJsonObject& params);
    QJsonObject handleListResources(const QJsonObject& params);
    QJsonObject handleReadResource(const QJsonObject& params);

    void sendResponse(const QJsonValue& id, const QJsonObject& result);
    void sendError(const QJsonValue& id, int code, const QString& message);
    void writeMessage(const QJsonObject& message);
    void signalStdinClosed();

    TabBridgeLogger& m_logger;
    QFile m_stdout;
    QPointer<QIODevice> m_output;
    QByteArray m_inputBuffer;
    QSocketNotifier* m_stdinNotifier;
    QTimer* m_stdinPollTimer;

    QString m_serverName;
    QString m_serverVersion;
    QJsonObject m_capabilities;

    QJsonArray m_tools;
    ToolCallHandler m_toolCallHandler;
    QMap<QString, ResourceDefinition> m_resources;

    bool m_initialized;
    bool m_running;
    bool m_stdinClosed;

    static constexpr const char* JSONRPC_VERSION = "2.0";
    static constexpr const char* MCP_VERSION = "2024-11-05";
    static constexpr int MAX_MESSAGE_BYTES = 16 * 1024 * 1024;
};

#endif // MCPSERVER_STDIO_H
