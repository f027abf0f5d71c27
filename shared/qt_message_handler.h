#ifndef QT_MESSAGE_HANDLER_H
#define QT_MESSAGE_HANDLER_H

#include <QtGlobal>

class TabBridgeLogger;

namespace TabBridgeCommon {
    /**
     * Route qDebug/qInfo/qWarning/qCritical output through the given logger
     * with a [Qt] prefix. Nothing from Qt reaches stdout, which carries MCP.
     * The logger must outlive the handler; call uninstallQtMessageHandler()
     * before destroying it.
     */
    void installQtMessageHandler(TabBridgeLogger* logger);
    void uninstallQtMessageHandler();
}

#endif // QT_MESSAGE_HANDLER_H
