#include "lifecycle.h"
#include "common.h"
#include "tabbridgelogger.h"
#include <QJsonArray>
#include <memory>

static const char* LOG_CATEGORY = "lifecycle";

LifecycleStateMachine::LifecycleStateMachine(const Config& config, const Actions& actions,
                                             TabBridgeLogger& logger, QObject* parent)
    : QObject(parent)
    , m_config(config)
    , m_actions(actions)
    , m_logger(logger)
    , m_state(State::Initializing)
    , m_retryCount(0)
    , m_shuttingDown(false)
    , m_connectRetriesExhausted(false)
    , m_finished(false)
    , m_stepTimer(new QTimer(this))
    , m_connectedCheckTimer(new QTimer(this))
{
    m_stepTimer->setSingleShot(true);
    connect(m_stepTimer, &QTimer::timeout, this, &LifecycleStateMachine::step);

    m_connectedCheckTimer->setInterval(m_config.connectedCheckIntervalMs);
    connect(m_connectedCheckTimer, &QTimer::timeout, this, &LifecycleStateMachine::checkConnectedState);
}

LifecycleStateMachine::~LifecycleStateMachine()
{
    m_stepTimer->stop();
    m_connectedCheckTimer->stop();
}

QString LifecycleStateMachine::stateName(State state)
{
    switch (state) {
        case State::Initializing: return "INITIALIZING";
        case State::CreatingServer: return "CREATING_SERVER";
        case State::RetryingServerCreation: return "RETRYING_SERVER_CREATION";
        case State::Connecting: return "CONNECTING";
        case State::RetryingConnection: return "RETRYING_CONNECTION";
        case State::Connected: return "CONNECTED";
        case State::Reconnecting: return "RECONNECTING";
        case State::Restarting: return "RESTARTING";
        case State::ShuttingDown: return "SHUTTING_DOWN";
        case State::Shutdown: return "SHUTDOWN";
        case State::Failed: return "FAILED";
        default: return "UNKNOWN";
    }
}

bool LifecycleStateMachine::isValidTransition(State from, State to)
{
    if (from == State::Shutdown || from == State::Failed) {
        return false;
    }
    if (to == State::ShuttingDown) {
        return from != State::ShuttingDown;
    }

    switch (from) {
        case State::Initializing:
            return to == State::CreatingServer;
        case State::CreatingServer:
            return to == State::Connecting || to == State::RetryingServerCreation || to == State::Failed;
        case State::RetryingServerCreation:
            return to == State::CreatingServer;
        case State::Connecting:
            return to == State::Connected || to == State::RetryingConnection || to == State::Failed;
        case State::RetryingConnection:
            return to == State::Connecting || to == State::Restarting;
        case State::Connected:
            return to == State::Reconnecting;
        case State::Reconnecting:
        case State::Restarting:
            return to == State::CreatingServer;
        case State::ShuttingDown:
            return to == State::Shutdown;
        default:
            return false;
    }
}

bool LifecycleStateMachine::isTerminal() const
{
    return m_state == State::Shutdown || m_state == State::Failed;
}

void LifecycleStateMachine::start()
{
    if (m_state != State::Initializing) {
        m_logger.warning(QString("Lifecycle already started (state %1)").arg(stateName(m_state)));
        return;
    }

    transition(State::CreatingServer);
    scheduleStep(0);
}

void LifecycleStateMachine::scheduleStep(int delayMs)
{
    if (m_finished) {
        return;
    }
    m_stepTimer->start(delayMs);
}

void LifecycleStateMachine::transition(State next, const QJsonObject& context)
{
    const State previous = m_state;

    if (!isValidTransition(previous, next)) {
        m_logger.log(LogLevel::Warning, LOG_CATEGORY,
            QString("Unexpected state transition %1 -> %2").arg(stateName(previous), stateName(next)));
    }

    m_state = next;

    Transition entry{previous, next, QDateTime::currentDateTimeUtc(), context, m_retryCount};
    m_history.append(entry);
    while (m_history.size() > m_config.maxStateHistory) {
        m_history.removeFirst();
    }

    QJsonObject metadata = context;
    metadata["from"] = stateName(previous);
    metadata["to"] = stateName(next);
    metadata["retryCount"] = m_retryCount;
    m_logger.log(LogLevel::Info, LOG_CATEGORY,
        QString("State transition: %1 -> %2").arg(stateName(previous), stateName(next)), metadata);

    emit stateChanged(previous, next);
}

void LifecycleStateMachine::step()
{
    if (m_shuttingDown || isTerminal()) {
        return;
    }

    switch (m_state) {
        case State::CreatingServer:
            try {
                m_actions.createServer();
            } catch (const std::exception& e) {
                handleCreateFailure(QString::fromUtf8(e.what()));
                return;
            }
            transition(State::Connecting);
            scheduleStep(0);
            break;

        case State::RetryingServerCreation:
            transition(State::CreatingServer, QJsonObject{{"attempt", m_retryCount + 1}});
            scheduleStep(0);
            break;

        case State::Connecting:
            try {
                m_actions.connectTransport();
            } catch (const std::exception& e) {
                handleConnectFailure(QString::fromUtf8(e.what()));
                return;
            }
            m_retryCount = 0;
            transition(State::Connected);
            m_connectedCheckTimer->start();
            break;

        case State::RetryingConnection:
            if (m_connectRetriesExhausted) {
                m_connectRetriesExhausted = false;
                transition(State::Restarting, QJsonObject{{"reason", "connection retries exhausted"}});
                scheduleStep(0);
            } else {
                transition(State::Connecting, QJsonObject{{"attempt", m_retryCount + 1}});
                scheduleStep(0);
            }
            break;

        case State::Reconnecting:
            rebuild("reconnect");
            break;

        case State::Restarting:
            rebuild("restart");
            break;

        default:
            break;
    }
}

void LifecycleStateMachine::handleCreateFailure(const QString& message)
{
    m_logger.log(LogLevel::Error, LOG_CATEGORY, QString("Server creation failed: %1").arg(message),
        QJsonObject{{"error", message}, {"retryCount", m_retryCount}});

    if (m_retryCount < m_config.maxRetries) {
        m_retryCount++;
        transition(State::RetryingServerCreation, QJsonObject{
            {"error", message},
            {"retryDelayMs", m_config.retryDelayMs}
        });
        scheduleStep(m_config.retryDelayMs);
    } else {
        transition(State::Failed, QJsonObject{{"error", message}, {"reason", "server creation retries exhausted"}});
        enterFailed(message);
    }
}

void LifecycleStateMachine::handleConnectFailure(const QString& message)
{
    m_logger.log(LogLevel::Error, LOG_CATEGORY, QString("Transport connection failed: %1").arg(message),
        QJsonObject{{"error", message}, {"retryCount", m_retryCount}});

    // The server itself is fine, so exhausted retries rebuild rather than fail
    if (m_retryCount < m_config.maxRetries) {
        m_retryCount++;
        m_connectRetriesExhausted = false;
        transition(State::RetryingConnection, QJsonObject{
            {"error", message},
            {"retryDelayMs", m_config.retryDelayMs}
        });
        scheduleStep(m_config.retryDelayMs);
    } else {
        m_connectRetriesExhausted = true;
        transition(State::RetryingConnection, QJsonObject{{"error", message}, {"exhausted", true}});
        scheduleStep(0);
    }
}

void LifecycleStateMachine::rebuild(const QString& reason)
{
    runCleanup(reason, [this, reason](const QString& error) {
        if (m_shuttingDown || isTerminal()) {
            return;
        }
        if (!error.isEmpty()) {
            m_logger.log(LogLevel::Warning, LOG_CATEGORY,
                QString("Cleanup before %1 reported: %2").arg(reason, error));
        }
        m_retryCount = 0;
        transition(State::CreatingServer, QJsonObject{{"reason", reason}});
        scheduleStep(0);
    });
}

void LifecycleStateMachine::reportError(const QString& operation, const QString& message)
{
    if (m_shuttingDown || isTerminal()) {
        m_logger.debug(QString("Ignoring %1 error during shutdown: %2").arg(operation, message));
        return;
    }

    if (m_state != State::Connected) {
        m_logger.log(LogLevel::Warning, LOG_CATEGORY,
            QString("%1 error in state %2: %3").arg(operation, stateName(m_state), message));
        return;
    }

    m_connectedCheckTimer->stop();
    // A fresh problem starts counting retries from zero
    m_retryCount = 0;
    transition(State::Reconnecting, QJsonObject{{"operation", operation}, {"error", message}});
    scheduleStep(0);
}

void LifecycleStateMachine::requestShutdown(const QString& reason)
{
    if (isTerminal()) {
        return;
    }
    if (m_shuttingDown) {
        m_logger.debug(QString("Shutdown already in progress, ignoring: %1").arg(reason));
        return;
    }

    m_shuttingDown = true;
    m_stepTimer->stop();
    m_connectedCheckTimer->stop();

    transition(State::ShuttingDown, QJsonObject{{"reason", reason}});

    runCleanup("shutdown", [this](const QString& error) {
        if (error.isEmpty()) {
            transition(State::Shutdown);
            finish(0);
        } else {
            m_logger.error(QString("Shutdown cleanup failed: %1").arg(error));
            transition(State::Shutdown, QJsonObject{{"error", error}});
            finish(1);
        }
    });
}

void LifecycleStateMachine::runCleanup(const QString& reason, std::function<void(const QString& error)> then)
{
    auto settled = std::make_shared<bool>(false);
    auto complete = [settled, then](const QString& error) {
        if (*settled) {
            return;
        }
        *settled = true;
        then(error);
    };

    const int capMs = m_config.shutdownTimeoutMs;
    QTimer::singleShot(capMs, this, [this, settled, complete, reason, capMs]() {
        if (*settled) {
            return;
        }
        m_logger.log(LogLevel::Error, LOG_CATEGORY,
            QString("Cleanup for %1 did not finish within %2ms, forcing").arg(reason).arg(capMs));
        complete(QString("Cleanup timed out after %1ms").arg(capMs));
    });

    if (!m_actions.cleanup) {
        complete(QString());
        return;
    }

    try {
        m_actions.cleanup(complete);
    } catch (const std::exception& e) {
        complete(QString::fromUtf8(e.what()));
    }
}

void LifecycleStateMachine::enterFailed(const QString& message)
{
    m_stepTimer->stop();
    m_connectedCheckTimer->stop();

    runCleanup("failure", [this, message](const QString& error) {
        if (!error.isEmpty()) {
            m_logger.warning(QString("Best-effort cleanup after failure reported: %1").arg(error));
        }

        QString logPath = m_logger.currentSessionPath();
        m_logger.critical(QString("Bridge failed after %1 retries: %2").arg(m_config.maxRetries).arg(message));
        if (!logPath.isEmpty()) {
            m_logger.critical(QString("Full logs available at: %1").arg(logPath));
        }
        finish(1);
    });
}

void LifecycleStateMachine::finish(int exitCode)
{
    if (m_finished) {
        return;
    }
    m_finished = true;
    m_stepTimer->stop();
    m_connectedCheckTimer->stop();
    m_logger.flush();
    emit finished(exitCode);
}

void LifecycleStateMachine::checkConnectedState()
{
    if (m_state != State::Connected) {
        m_connectedCheckTimer->stop();
        return;
    }

    if (TabBridgeCommon::isTerminationRequested()) {
        requestShutdown("termination requested");
    }
}

QJsonObject LifecycleStateMachine::stateInfo() const
{
    QJsonArray recent;
    const int first = qMax(0, static_cast<int>(m_history.size()) - 10);
    for (int i = first; i < m_history.size(); ++i) {
        const Transition& entry = m_history.at(i);
        recent.append(QJsonObject{
            {"from", stateName(entry.from)},
            {"to", stateName(entry.to)},
            {"timestamp", entry.timestamp.toString(Qt::ISODateWithMs)},
            {"retryCount", entry.retryCount},
            {"context", entry.context}
        });
    }

    return QJsonObject{
        {"state", stateName(m_state)},
        {"retryCount", m_retryCount},
        {"maxRetries", m_config.maxRetries},
        {"isShuttingDown", m_shuttingDown},
        {"recentTransitions", recent}
    };
}
