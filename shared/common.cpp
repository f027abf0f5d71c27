#include "common.h"
#include "tabbridgelogger.h"
#include "bridge_errors.h"
#include <QTcpServer>
#include <QProcess>
#include <QThread>
#include <QMetaObject>
#include <QSocketNotifier>
#include <QCoreApplication>
#include <QRegularExpression>
#include <iostream>
#include <csignal>
#ifndef Q_OS_WIN
#include <unistd.h>
#include <errno.h>
#include <fcntl.h>
#include <cstring>
#include <sys/types.h>
#endif

#ifdef Q_OS_WIN
#include <windows.h>
#endif

namespace TabBridgeCommon {

static volatile std::sig_atomic_t g_signalReceived = 0;
static std::function<void(int)> g_signalCallback;

#ifndef Q_OS_WIN
static int signalPipeFd[2] = {-1, -1};
static QSocketNotifier* signalNotifier = nullptr;

static void signalHandler(int signal) {
    g_signalReceived = signal;
    char a = 1;
    if (signalPipeFd[1] != -1) {
        ssize_t result = ::write(signalPipeFd[1], &a, sizeof(a));
        (void)result;
    }
}
#else
static BOOL WINAPI consoleCtrlHandler(DWORD dwCtrlType) {
    switch (dwCtrlType) {
        case CTRL_C_EVENT:
        case CTRL_BREAK_EVENT:
        case CTRL_CLOSE_EVENT:
        case CTRL_LOGOFF_EVENT:
        case CTRL_SHUTDOWN_EVENT:
            g_signalReceived = SIGINT;
            if (qApp) {
                QMetaObject::invokeMethod(qApp, []() {
                    if (g_signalCallback) {
                        g_signalCallback(SIGINT);
                    }
                }, Qt::QueuedConnection);
            }
            return TRUE;
    }
    return FALSE;
}

static void signalHandler(int signal) {
    g_signalReceived = signal;
}
#endif

void setupSignalHandlers() {
#ifndef Q_OS_WIN
    if (::pipe(signalPipeFd) == -1) {
        std::cerr << "Failed to create signal pipe: " << strerror(errno) << std::endl;
        return;
    }

    auto set_nb_cloexec = [](int fd) {
        int flags = ::fcntl(fd, F_GETFL);
        if (flags != -1) {
            ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
        }
        int fdflags = ::fcntl(fd, F_GETFD);
        if (fdflags != -1) {
            ::fcntl(fd, F_SETFD, fdflags | FD_CLOEXEC);
        }
    };

    set_nb_cloexec(signalPipeFd[0]);
    set_nb_cloexec(signalPipeFd[1]);

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGHUP, signalHandler);
    // A vanished front-door client must not kill the bridge
    std::signal(SIGPIPE, SIG_IGN);
#else
    SetConsoleCtrlHandler(consoleCtrlHandler, TRUE);
    std::signal(SIGTERM, signalHandler);
#endif
}

void setupSignalNotifier(std::function<void(int signal)> onSignal) {
    g_signalCallback = std::move(onSignal);

#ifdef Q_OS_WIN
    // Console events are queued onto qApp by consoleCtrlHandler. One that
    // arrived before the callback existed is delivered now.
    if (qApp && g_signalReceived != 0) {
        QMetaObject::invokeMethod(qApp, []() {
            if (g_signalCallback) {
                g_signalCallback(static_cast<int>(g_signalReceived));
            }
        }, Qt::QueuedConnection);
    }
#else
    if (!qApp) {
        std::cerr << "setupSignalNotifier called before QCoreApplication creation!" << std::endl;
        return;
    }

    if (signalPipeFd[0] == -1) {
        std::cerr << "setupSignalNotifier called before setupSignalHandlers!" << std::endl;
        return;
    }

    signalNotifier = new QSocketNotifier(signalPipeFd[0], QSocketNotifier::Read, qApp);
    QObject::connect(signalNotifier, &QSocketNotifier::activated, []() {
        char tmp;
        while (::read(signalPipeFd[0], &tmp, sizeof(tmp)) > 0) {}

        if (g_signalReceived != 0 && g_signalCallback) {
            g_signalCallback(static_cast<int>(g_signalReceived));
        }
    });
#endif
}

bool isTerminationRequested() {
    return g_signalReceived != 0;
}

void requestTermination() {
    if (g_signalReceived == 0) {
        g_signalReceived = SIGTERM;
    }
}

void resetTerminationRequest() {
    g_signalReceived = 0;
}

void cleanupSignalHandlers() {
    g_signalCallback = nullptr;
#ifndef Q_OS_WIN
    if (signalNotifier) {
        delete signalNotifier;
        signalNotifier = nullptr;
    }

    if (signalPipeFd[0] != -1) {
        ::close(signalPipeFd[0]);
        signalPipeFd[0] = -1;
    }

    if (signalPipeFd[1] != -1) {
        ::close(signalPipeFd[1]);
        signalPipeFd[1] = -1;
    }
#endif
}

bool isPortAvailable(quint16 port) {
    QTcpServer testServer;
    bool available = testServer.listen(QHostAddress::LocalHost, port);
    testServer.close();
    return available;
}

QList<qint64> findPortOwners(quint16 port) {
    QList<qint64> pids;
    const qint64 ownPid = QCoreApplication::applicationPid();

#ifdef Q_OS_WIN
    QProcess netstat;
    netstat.start("netstat", {"-ano", "-p", "TCP"});
    if (!netstat.waitForFinished(3000)) {
        netstat.kill();
        return pids;
    }

    const QString output = QString::fromLocal8Bit(netstat.readAllStandardOutput());
    const QRegularExpression row(QString(R"(^\s*TCP\s+\S+:%1\s+\S+\s+LISTENING\s+(\d+))").arg(port),
                                 QRegularExpression::MultilineOption);
    auto it = row.globalMatch(output);
    while (it.hasNext()) {
        qint64 pid = it.next().captured(1).toLongLong();
        if (pid > 0 && pid != ownPid && !pids.contains(pid)) {
            pids.append(pid);
        }
    }
#else
    // Only the listening socket's owner. Clients connected to the port,
    // such as the browser holding the extension socket, must survive.
    QProcess lsof;
    lsof.start("lsof", {"-t", "-n", "-P", QString("-iTCP:%1").arg(port), "-sTCP:LISTEN"});
    if (!lsof.waitForFinished(3000)) {
        lsof.kill();
        return pids;
    }

    // lsof exits with 1 when nothing holds the port
    const QString output = QString::fromLocal8Bit(lsof.readAllStandardOutput());
    for (const QString& line : output.split('\n', Qt::SkipEmptyParts)) {
        bool ok = false;
        qint64 pid = line.trimmed().toLongLong(&ok);
        if (ok && pid > 0 && pid != ownPid && !pids.contains(pid)) {
            pids.append(pid);
        }
    }
#endif

    return pids;
}

static void signalProcess(qint64 pid, bool force) {
#ifdef Q_OS_WIN
    QStringList args;
    if (force) {
        args << "/F";
    }
    args << "/PID" << QString::number(pid);
    QProcess::execute("taskkill", args);
#else
    QProcess::execute("kill", {force ? "-KILL" : "-TERM", QString::number(pid)});
#endif
}

int evictPortHolders(quint16 port, int graceMs, TabBridgeLogger& logger) {
    QList<qint64> owners = findPortOwners(port);
    if (owners.isEmpty()) {
        return 0;
    }

    for (qint64 pid : owners) {
        logger.info(QString("Port %1 is held by PID %2, sending termination request").arg(port).arg(pid));
        signalProcess(pid, false);
    }

    QThread::msleep(static_cast<unsigned long>(graceMs));

    const QList<qint64> survivors = findPortOwners(port);
    for (qint64 pid : survivors) {
        logger.warning(QString("PID %1 still holds port %2, force killing").arg(pid).arg(port));
        signalProcess(pid, true);
    }

    return owners.size();
}

bool waitForPortRelease(quint16 port, int attempts, int intervalMs) {
    for (int i = 0; i < attempts; ++i) {
        if (isPortAvailable(port)) {
            return true;
        }
        QThread::msleep(static_cast<unsigned long>(intervalMs));
    }
    return isPortAvailable(port);
}

void ensurePortFree(quint16 port, const PortEvictionOptions& options, TabBridgeLogger& logger) {
    if (port == 0 || isPortAvailable(port)) {
        return;
    }

    if (!options.enabled) {
        throw PortConflictError(QString("Port %1 is already in use").arg(port));
    }

    int evicted = evictPortHolders(port, options.graceMs, logger);
    logger.debug(QString("Signalled %1 process(es) holding port %2").arg(evicted).arg(port));

    if (!waitForPortRelease(port, options.waitAttempts, options.waitIntervalMs)) {
        throw PortConflictError(QString("Port %1 is still in use after %2ms")
            .arg(port)
            .arg(options.waitAttempts * options.waitIntervalMs));
    }
}

} // namespace TabBridgeCommon
