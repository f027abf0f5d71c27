#ifndef BROWSERTOOLS_H
#define BROWSERTOOLS_H

#include <QList>
#include <QJsonObject>
#include "toolregistry.h"

class ConnectionManager;

namespace BrowserTools {

    // The complete set of tools the bridge exposes
    enum class ToolKind {
        Navigate,
        GoBack,
        GoForward,
        Snapshot,
        Click,
        Hover,
        Drag,
        Type,
        SelectOption,
        PressKey,
        Wait,
        GetConsoleLogs,
        Screenshot
    };

    QList<ToolKind> allToolKinds();

    ToolDefinition makeTool(ToolKind kind);

    // Table of every ToolKind, in declaration order
    ToolTable buildToolTable();

    // URL, title and accessibility tree of the current tab as one text item,
    // handed to done once the three extension calls have answered
    void captureAriaSnapshot(ConnectionManager& connections, ToolCompletion done, const QString& status = QString());
}

#endif // BROWSERTOOLS_H
