#include "qt_message_handler.h"
#include "tabbridgelogger.h"
#include <QString>

namespace TabBridgeCommon {

static QtMessageHandler originalMessageHandler = nullptr;
static TabBridgeLogger* routedLogger = nullptr;

static void unifiedMessageHandler(QtMsgType type, const QMessageLogContext &context, const QString &msg)
{
    if (!routedLogger) {
        if (originalMessageHandler) {
            originalMessageHandler(type, context, msg);
        }
        return;
    }

    switch (type) {
    case QtDebugMsg:
        routedLogger->debug(QString("[Qt] %1").arg(msg));
        break;
    case QtInfoMsg:
        routedLogger->info(QString("[Qt] %1").arg(msg));
        break;
    case QtWarningMsg:
        routedLogger->warning(QString("[Qt] %1").arg(msg));
        break;
    case QtCriticalMsg:
    case QtFatalMsg:
        routedLogger->error(QString("[Qt] %1").arg(msg));
        break;
    }
}

void installQtMessageHandler(TabBridgeLogger* logger)
{
    routedLogger = logger;
    QtMessageHandler previous = qInstallMessageHandler(unifiedMessageHandler);
    if (previous != unifiedMessageHandler) {
        originalMessageHandler = previous;
    }
}

void uninstallQtMessageHandler()
{
    qInstallMessageHandler(originalMessageHandler);
    originalMessageHandler = nullptr;
    routedLogger = nullptr;
}

} // namespace TabBridgeCommon
