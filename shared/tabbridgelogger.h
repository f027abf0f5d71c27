#ifndef TABBRIDGELOGGER_H
#define TABBRIDGELOGGER_H

#include <QObject>
#include <QString>
#include <QJsonObject>
#include <QVector>
#include <QMutex>
#include <QFile>
#include <QTextStream>
#include <memory>
#include <unordered_map>

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3,
    Critical = 4
};

struct TabBridgeLoggerConfig {
    QString appName = "tabbridge";
    QString baseLogDir;                 // Default: ~/.local/share/TabBridge/logs
    int maxSessions = 5;                // Keep last 5 session folders

    struct LogFile {
        QString name;                   // e.g. "bridge.log", "tools.log"
        QString category;               // Category that maps to this file
        bool jsonFormat = false;        // Plain text or JSONL
    };
    QVector<LogFile> logFiles;

    bool fileLoggingEnabled = true;
    bool consoleEnabled = true;         // Always stderr, stdout carries MCP traffic
    bool consoleColors = true;
    bool emitQtSignals = false;         // Lets tests capture log output
    LogLevel minLevel = LogLevel::Info;

    // Defaults used by the tabbridge binary
    static TabBridgeLoggerConfig defaults();
    // No files, no console, signals only
    static TabBridgeLoggerConfig capturing();
};

class TabBridgeLogger : public QObject {
    Q_OBJECT

public:
    explicit TabBridgeLogger(const TabBridgeLoggerConfig& config, QObject* parent = nullptr);
    ~TabBridgeLogger();

    void log(LogLevel level, const QString& category, const QString& message);
    void log(LogLevel level, const QString& category, const QString& message,
             const QJsonObject& metadata);

    // Convenience methods that use the default category (first configured file)
    void debug(const QString& message);
    void info(const QString& message);
    void warning(const QString& message);
    void error(const QString& message);
    void critical(const QString& message);

    QString currentSessionPath() const { return m_sessionPath; }

    void flush();

    static QString levelToString(LogLevel level);
    static QString getBaseLogDir();

signals:
    void logMessage(LogLevel level, const QString& category,
                    const QString& message, const QJsonObject& metadata);

private:
    QString createSessionFolder();
    void cleanupOldSessions();
    void openLogFiles();
    void closeLogFiles();
    void writeToFile(const QString& category, LogLevel level,
                     const QString& message, const QJsonObject& metadata);
    void writeToConsole(LogLevel level, const QString& category, const QString& message);
    QString levelToColorCode(LogLevel level) const;

    TabBridgeLoggerConfig m_config;
    QString m_sessionPath;
    QString m_defaultCategory;
    mutable QMutex m_mutex;

    struct FileInfo {
        std::unique_ptr<QFile> file;
        std::unique_ptr<QTextStream> stream;
        bool jsonFormat;
    };
    std::unordered_map<QString, FileInfo> m_files;
};

#endif // TABBRIDGELOGGER_H
