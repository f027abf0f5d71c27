#ifndef LIFECYCLE_H
#define LIFECYCLE_H

#include <QObject>
#include <QString>
#include <QJsonObject>
#include <QDateTime>
#include <QList>
#include <QTimer>
#include <functional>

class TabBridgeLogger;

// Drives the bridge from startup to exit through an explicit state graph,
// with bounded retries, reconnect on error and signal-driven shutdown.
class LifecycleStateMachine : public QObject
{
    Q_OBJECT

public:
    enum class State {
        Initializing,
        CreatingServer,
        RetryingServerCreation,
        Connecting,
        RetryingConnection,
        Connected,
        Reconnecting,
        Restarting,
        ShuttingDown,
        Shutdown,
        Failed
    };
    Q_ENUM(State)

    struct Config {
        int maxRetries = 3;
        int retryDelayMs = 5000;
        int maxStateHistory = 100;
        int connectedCheckIntervalMs = 5000;
        int shutdownTimeoutMs = 15000;
    };

    // Cleanup reports completion through this; an empty string means success
    using CleanupDone = std::function<void(const QString& error)>;

    // createServer and connectTransport signal failure by throwing
    struct Actions {
        std::function<void()> createServer;
        std::function<void()> connectTransport;
        std::function<void(CleanupDone done)> cleanup;
    };

    struct Transition {
        State from;
        State to;
        QDateTime timestamp;
        QJsonObject context;
        int retryCount;
    };

    LifecycleStateMachine(const Config& config, const Actions& actions,
                          TabBridgeLogger& logger, QObject* parent = nullptr);
    ~LifecycleStateMachine();

    void start();

    // Report an error from a running component. Only acted on while CONNECTED.
    void reportError(const QString& operation, const QString& message);

    // Enter SHUTTING_DOWN from any non-terminal state
    void requestShutdown(const QString& reason);

    State state() const { return m_state; }
    int retryCount() const { return m_retryCount; }
    bool isShuttingDown() const { return m_shuttingDown; }
    bool isTerminal() const;
    const QList<Transition>& history() const { return m_history; }
    const Config& config() const { return m_config; }

    QJsonObject stateInfo() const;

    static QString stateName(State state);
    static bool isValidTransition(State from, State to);

signals:
    void stateChanged(LifecycleStateMachine::State from, LifecycleStateMachine::State to);
    void finished(int exitCode);

private slots:
    void step();
    void checkConnectedState();

private:
    void scheduleStep(int delayMs = 0);
    void transition(State next, const QJsonObject& context = QJsonObject());
    void handleCreateFailure(const QString& message);
    void handleConnectFailure(const QString& message);
    void runCleanup(const QString& reason, std::function<void(const QString& error)> then);
    void rebuild(const QString& reason);
    void enterFailed(const QString& message);
    void finish(int exitCode);

    Config m_config;
    Actions m_actions;
    TabBridgeLogger& m_logger;

    State m_state;
    int m_retryCount;
    bool m_shuttingDown;
    bool m_connectRetriesExhausted;
    bool m_finished;
    QList<Transition> m_history;

    QTimer* m_stepTimer;
    QTimer* m_connectedCheckTimer;
};

#endif // LIFECYCLE_H
