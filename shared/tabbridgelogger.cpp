#include "tabbridgelogger.h"
#include <QDateTime>
#include <QDir>
#include <QStandardPaths>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTextStream>
#include <QDebug>
#include <QCoreApplication>

TabBridgeLoggerConfig TabBridgeLoggerConfig::defaults()
{
    TabBridgeLoggerConfig config;
    config.appName = "tabbridge";
    config.baseLogDir = TabBridgeLogger::getBaseLogDir();
    config.logFiles = {
        {"bridge.log", "bridge", false},
        {"tools.log", "tools", true},
        {"lifecycle.log", "lifecycle", true}
    };
    return config;
}

TabBridgeLoggerConfig TabBridgeLoggerConfig::capturing()
{
    TabBridgeLoggerConfig config;
    config.appName = "tabbridge-test";
    config.logFiles = {{"bridge.log", "bridge", false}};
    config.fileLoggingEnabled = false;
    config.consoleEnabled = false;
    config.emitQtSignals = true;
    config.minLevel = LogLevel::Debug;
    return config;
}

TabBridgeLogger::TabBridgeLogger(const TabBridgeLoggerConfig& config, QObject* parent)
    : QObject(parent)
    , m_config(config)
{
    if (!m_config.logFiles.isEmpty()) {
        m_defaultCategory = m_config.logFiles.first().category;
    } else {
        m_defaultCategory = "default";
    }

    if (m_config.fileLoggingEnabled) {
        if (m_config.baseLogDir.isEmpty()) {
            m_config.baseLogDir = getBaseLogDir();
        }
        m_sessionPath = createSessionFolder();
        openLogFiles();
        log(LogLevel::Debug, m_defaultCategory,
            QString("Logger initialized for '%1' in session: %2")
            .arg(m_config.appName)
            .arg(m_sessionPath));
    }
}

TabBridgeLogger::~TabBridgeLogger()
{
    flush();
    closeLogFiles();
}

QString TabBridgeLogger::getBaseLogDir()
{
    QString dataPath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return QDir(QDir(dataPath).absoluteFilePath("TabBridge")).absoluteFilePath("logs");
}

QString TabBridgeLogger::createSessionFolder()
{
    QString appDir = QString("%1/%2").arg(m_config.baseLogDir).arg(m_config.appName);
    QDir dir(appDir);

    QString timestamp = QDateTime::currentDateTime().toString("yyyy-MM-dd_HHmmss");
    QString sessionName = QString("%1_p%2").arg(timestamp).arg(QCoreApplication::applicationPid());
    QString sessionPath = dir.absoluteFilePath(sessionName);

    if (!dir.mkpath(sessionName)) {
        qCritical() << "Failed to create session directory:" << sessionPath;
    }

    cleanupOldSessions();

    return sessionPath;
}

void TabBridgeLogger::cleanupOldSessions()
{
    QString appDir = QString("%1/%2").arg(m_config.baseLogDir).arg(m_config.appName);
    QDir dir(appDir);

    QStringList sessions = dir.entryList(QDir::Dirs | QDir::NoDotAndDotDot, QDir::Name);

    while (sessions.size() > m_config.maxSessions) {
        QString oldestSession = sessions.takeFirst();
        QDir oldDir(dir.absoluteFilePath(oldestSession));
        if (!oldDir.removeRecursively()) {
            writeToConsole(LogLevel::Warning, m_defaultCategory,
                           QString("Failed to remove old session: %1").arg(oldestSession));
        }
    }
}

void TabBridgeLogger::openLogFiles()
{
    for (const auto& logFile : m_config.logFiles) {
        QString filePath = QDir(m_sessionPath).absoluteFilePath(logFile.name);

        auto file = std::make_unique<QFile>(filePath);
        if (!file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            qCritical() << "Failed to open log file:" << filePath << file->errorString();
            continue;
        }

        FileInfo info;
        info.stream = std::make_unique<QTextStream>(file.get());
        info.file = std::move(file);
        info.jsonFormat = logFile.jsonFormat;

        m_files[logFile.category] = std::move(info);
    }
}

void TabBridgeLogger::closeLogFiles()
{
    QMutexLocker locker(&m_mutex);

    for (auto& [category, info] : m_files) {
        if (info.stream) {
            info.stream->flush();
        }
        if (info.file) {
            info.file->close();
        }
    }
    m_files.clear();
}

void TabBridgeLogger::log(LogLevel level, const QString& category, const QString& message)
{
    log(level, category, message, QJsonObject());
}

void TabBridgeLogger::log(LogLevel level, const QString& category, const QString& message,
                          const QJsonObject& metadata)
{
    {
        QMutexLocker locker(&m_mutex);

        if (level < m_config.minLevel) {
            return;
        }

        if (m_config.consoleEnabled) {
            writeToConsole(level, category, message);
        }

        writeToFile(category, level, message, metadata);
    }

    // Emitted outside the lock so a connected slot may log again
    if (m_config.emitQtSignals) {
        emit logMessage(level, category, message, metadata);
    }
}

void TabBridgeLogger::writeToFile(const QString& category, LogLevel level,
                                  const QString& message, const QJsonObject& metadata)
{
    auto it = m_files.find(category);
    if (it == m_files.end()) {
        it = m_files.find(m_defaultCategory);
        if (it == m_files.end()) {
            return;
        }
    }

    auto& info = it->second;
    if (!info.stream) {
        return;
    }

    QString timestamp = QDateTime::currentDateTime().toString("yyyy-MM-dd HH:mm:ss.zzz");

    if (info.jsonFormat) {
        QJsonObject entry;
        entry["timestamp"] = timestamp;
        entry["level"] = levelToString(level);
        entry["category"] = category;
        entry["message"] = message;

        for (auto meta = metadata.begin(); meta != metadata.end(); ++meta) {
            entry[meta.key()] = meta.value();
        }

        *info.stream << QJsonDocument(entry).toJson(QJsonDocument::Compact) << Qt::endl;
    } else {
        *info.stream << timestamp << " [" << levelToString(level) << "] ";

        if (category != m_defaultCategory) {
            *info.stream << "[" << category << "] ";
        }

        *info.stream << message;
        if (!metadata.isEmpty()) {
            *info.stream << " " << QJsonDocument(metadata).toJson(QJsonDocument::Compact);
        }
        *info.stream << Qt::endl;
    }

    if (level >= LogLevel::Warning) {
        info.stream->flush();
    }
}

void TabBridgeLogger::writeToConsole(LogLevel level, const QString& category, const QString& message)
{
    QString timestamp = QDateTime::currentDateTime().toString("HH:mm:ss.zzz");

    QTextStream out(stderr);

    if (m_config.consoleColors) {
        out << levelToColorCode(level);
    }

    out << timestamp << " [" << levelToString(level) << "] ";
    if (category != m_defaultCategory) {
        out << "[" << category << "] ";
    }
    out << message;

    if (m_config.consoleColors) {
        out << "\033[0m";
    }
    out << Qt::endl;
}

QString TabBridgeLogger::levelToString(LogLevel level)
{
    switch (level) {
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARN";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        default:                 return "UNKNOWN";
    }
}

QString TabBridgeLogger::levelToColorCode(LogLevel level) const
{
    switch (level) {
        case LogLevel::Debug:    return "\033[36m";  // Cyan
        case LogLevel::Info:     return "\033[32m";  // Green
        case LogLevel::Warning:  return "\033[33m";  // Yellow
        case LogLevel::Error:    return "\033[31m";  // Red
        case LogLevel::Critical: return "\033[35m";  // Magenta
        default:                 return "\033[0m";
    }
}

void TabBridgeLogger::flush()
{
    QMutexLocker locker(&m_mutex);

    for (auto& [category, info] : m_files) {
        if (info.stream) {
            info.stream->flush();
        }
    }
}

void TabBridgeLogger::debug(const QString& message)
{
    log(LogLevel::Debug, m_defaultCategory, message);
}

void TabBridgeLogger::info(const QString& message)
{
    log(LogLevel::Info, m_defaultCategory, message);
}

void TabBridgeLogger::warning(const QString& message)
{
    log(LogLevel::Warning, m_defaultCategory, message);
}

void TabBridgeLogger::error(const QString& message)
{
    log(LogLevel::Error, m_defaultCategory, message);
}

void TabBridgeLogger::critical(const QString& message)
{
    log(LogLevel::Critical, m_defaultCategory, message);
}
