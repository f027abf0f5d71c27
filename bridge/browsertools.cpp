#include "browsertools.h"
#include "connectionmanager.h"
#include "bridge_errors.h"
#include <QJsonArray>
#include <QJsonDocument>
#include <functional>

namespace BrowserTools {

namespace {

QJsonObject stringProperty(const QString& description)
{
    return QJsonObject{{"type", "string"}, {"description", description}};
}

QJsonObject objectSchema(const QJsonObject& properties = QJsonObject(), const QStringList& required = QStringList())
{
    QJsonObject schema{
        {"type", "object"},
        {"properties", properties},
        {"additionalProperties", false}
    };
    if (!required.isEmpty()) {
        schema["required"] = QJsonArray::fromStringList(required);
    }
    return schema;
}

QJsonObject elementProperties()
{
    return QJsonObject{
        {"element", stringProperty("Human-readable element description used to obtain permission to interact with the element")},
        {"ref", stringProperty("Exact target element reference from the page snapshot")}
    };
}

QString requireString(const QJsonObject& args, const QString& key)
{
    QJsonValue value = args.value(key);
    if (!value.isString()) {
        throw TabBridgeCommon::HandlerError(QString("Invalid arguments: '%1' must be a string").arg(key));
    }
    return value.toString();
}

double requireNumber(const QJsonObject& args, const QString& key)
{
    QJsonValue value = args.value(key);
    if (!value.isDouble()) {
        throw TabBridgeCommon::HandlerError(QString("Invalid arguments: '%1' must be a number").arg(key));
    }
    return value.toDouble();
}

bool requireBool(const QJsonObject& args, const QString& key)
{
    QJsonValue value = args.value(key);
    if (!value.isBool()) {
        throw TabBridgeCommon::HandlerError(QString("Invalid arguments: '%1' must be a boolean").arg(key));
    }
    return value.toBool();
}

QJsonArray requireStringArray(const QJsonObject& args, const QString& key)
{
    QJsonValue value = args.value(key);
    if (!value.isArray()) {
        throw TabBridgeCommon::HandlerError(QString("Invalid arguments: '%1' must be an array of strings").arg(key));
    }
    const QJsonArray array = value.toArray();
    for (const QJsonValue& item : array) {
        if (!item.isString()) {
            throw TabBridgeCommon::HandlerError(QString("Invalid arguments: '%1' must be an array of strings").arg(key));
        }
    }
    return array;
}

QString valueToText(const QJsonValue& value)
{
    if (value.isString()) {
        return value.toString();
    }
    if (value.isObject()) {
        return QString::fromUtf8(QJsonDocument(value.toObject()).toJson(QJsonDocument::Compact));
    }
    if (value.isArray()) {
        return QString::fromUtf8(QJsonDocument(value.toArray()).toJson(QJsonDocument::Compact));
    }
    if (value.isDouble()) {
        return QString::number(value.toDouble());
    }
    if (value.isBool()) {
        return value.toBool() ? "true" : "false";
    }
    return QString();
}

QJsonObject textResult(const QString& text)
{
    return QJsonObject{
        {"content", QJsonArray{QJsonObject{{"type", "text"}, {"text", text}}}}
    };
}

using TabBridgeCommon::CallError;
using ValueStep = std::function<void(const QJsonValue& value)>;

// One extension call. A failure finishes the tool run; a success continues
// with next.
void callThen(ConnectionManager& connections, const QString& type, const QJsonValue& payload,
              const ToolCompletion& done, ValueStep next)
{
    connections.call(type, payload, [done, next](const QJsonValue& value, const CallError& error) {
        if (error.isError()) {
            done(QJsonObject(), error);
            return;
        }
        next(value);
    });
}

void finish(const ToolCompletion& done, const QJsonObject& result)
{
    done(result, CallError::none());
}

// Action line followed by a fresh snapshot of the page
void actionWithSnapshot(ConnectionManager& connections, const QString& actionText, const ToolCompletion& done)
{
    captureAriaSnapshot(connections, [done, actionText](const QJsonObject& snapshot, const CallError& error) {
        if (error.isError()) {
            done(QJsonObject(), error);
            return;
        }
        QJsonArray content{QJsonObject{{"type", "text"}, {"text", actionText}}};
        for (const QJsonValue& item : snapshot.value("content").toArray()) {
            content.append(item);
        }
        finish(done, QJsonObject{{"content", content}});
    });
}

// Runs an action then reports it together with a fresh snapshot
void actThenSnapshot(ConnectionManager& connections, const QString& type, const QJsonObject& payload,
                     const QString& actionText, const ToolCompletion& done)
{
    ConnectionManager* manager = &connections;
    callThen(connections, type, payload, done, [manager, actionText, done](const QJsonValue&) {
        actionWithSnapshot(*manager, actionText, done);
    });
}

// Runs a page-changing call then answers with the new page's snapshot
void navigateThenSnapshot(ConnectionManager& connections, const QString& type, const QJsonObject& payload,
                          const ToolCompletion& done)
{
    ConnectionManager* manager = &connections;
    callThen(connections, type, payload, done, [manager, done](const QJsonValue&) {
        captureAriaSnapshot(*manager, done);
    });
}

QJsonObject elementPayload(const QJsonObject& args)
{
    return QJsonObject{
        {"element", requireString(args, "element")},
        {"ref", requireString(args, "ref")}
    };
}

} // namespace

QList<ToolKind> allToolKinds()
{
    return {
        ToolKind::Navigate,
        ToolKind::GoBack,
        ToolKind::GoForward,
        ToolKind::Snapshot,
        ToolKind::Click,
        ToolKind::Hover,
        ToolKind::Drag,
        ToolKind::Type,
        ToolKind::SelectOption,
        ToolKind::PressKey,
        ToolKind::Wait,
        ToolKind::GetConsoleLogs,
        ToolKind::Screenshot
    };
}

void captureAriaSnapshot(ConnectionManager& connections, ToolCompletion done, const QString& status)
{
    ConnectionManager* manager = &connections;
    callThen(connections, "getUrl", QJsonValue(), done, [manager, done, status](const QJsonValue& url) {
        callThen(*manager, "getTitle", QJsonValue(), done, [manager, done, status, url](const QJsonValue& title) {
            callThen(*manager, "browser_snapshot", QJsonObject(), done,
                     [done, status, url, title](const QJsonValue& snapshot) {
                QString text;
                if (!status.isEmpty()) {
                    text += status + "\n";
                }
                text += QString("\n- Page URL: %1\n- Page Title: %2\n- Page Snapshot\n```yaml\n%3\n```\n")
                    .arg(valueToText(url), valueToText(title), valueToText(snapshot));
                finish(done, textResult(text));
            });
        });
    });
}

ToolDefinition makeTool(ToolKind kind)
{
    switch (kind) {
        case ToolKind::Navigate:
            return {
                "browser_navigate",
                "Navigate to a URL",
                objectSchema(QJsonObject{{"url", stringProperty("The URL to navigate to")}}, {"url"}),
                [](ConnectionManager& connections, const QJsonObject& args, ToolCompletion done) {
                    const QString url = requireString(args, "url");
                    navigateThenSnapshot(connections, "browser_navigate", QJsonObject{{"url", url}}, done);
                }
            };

        case ToolKind::GoBack:
            return {
                "browser_go_back",
                "Go back to the previous page",
                objectSchema(),
                [](ConnectionManager& connections, const QJsonObject&, ToolCompletion done) {
                    navigateThenSnapshot(connections, "browser_go_back", QJsonObject(), done);
                }
            };

        case ToolKind::GoForward:
            return {
                "browser_go_forward",
                "Go forward to the next page",
                objectSchema(),
                [](ConnectionManager& connections, const QJsonObject&, ToolCompletion done) {
                    navigateThenSnapshot(connections, "browser_go_forward", QJsonObject(), done);
                }
            };

        case ToolKind::Snapshot:
            return {
                "browser_snapshot",
                "Capture accessibility snapshot of the current page. Use this for getting references to elements to interact with.",
                objectSchema(),
                [](ConnectionManager& connections, const QJsonObject&, ToolCompletion done) {
                    captureAriaSnapshot(connections, done);
                }
            };

        case ToolKind::Click:
            return {
                "browser_click",
                "Perform click on a web page",
                objectSchema(elementProperties(), {"element", "ref"}),
                [](ConnectionManager& connections, const QJsonObject& args, ToolCompletion done) {
                    QJsonObject payload = elementPayload(args);
                    actThenSnapshot(connections, "browser_click", payload,
                                    QString("Clicked \"%1\"").arg(payload["element"].toString()), done);
                }
            };

        case ToolKind::Hover:
            return {
                "browser_hover",
                "Hover over element on page",
                objectSchema(elementProperties(), {"element", "ref"}),
                [](ConnectionManager& connections, const QJsonObject& args, ToolCompletion done) {
                    QJsonObject payload = elementPayload(args);
                    actThenSnapshot(connections, "browser_hover", payload,
                                    QString("Hovered over \"%1\"").arg(payload["element"].toString()), done);
                }
            };

        case ToolKind::Drag:
            return {
                "browser_drag",
                "Perform drag and drop between two elements",
                objectSchema(QJsonObject{
                    {"startElement", stringProperty("Human-readable source element description used to obtain the permission to interact with the element")},
                    {"startRef", stringProperty("Exact source element reference from the page snapshot")},
                    {"endElement", stringProperty("Human-readable target element description used to obtain the permission to interact with the element")},
                    {"endRef", stringProperty("Exact target element reference from the page snapshot")}
                }, {"startElement", "startRef", "endElement", "endRef"}),
                [](ConnectionManager& connections, const QJsonObject& args, ToolCompletion done) {
                    QJsonObject payload{
                        {"startElement", requireString(args, "startElement")},
                        {"startRef", requireString(args, "startRef")},
                        {"endElement", requireString(args, "endElement")},
                        {"endRef", requireString(args, "endRef")}
                    };
                    actThenSnapshot(connections, "browser_drag", payload, QString("Dragged \"%1\" to \"%2\"")
                        .arg(payload["startElement"].toString(), payload["endElement"].toString()), done);
                }
            };

        case ToolKind::Type: {
            QJsonObject properties = elementProperties();
            properties["text"] = stringProperty("Text to type into the element");
            properties["submit"] = QJsonObject{
                {"type", "boolean"},
                {"description", "Whether to submit entered text (press Enter after)"}
            };
            return {
                "browser_type",
                "Type text into editable element",
                objectSchema(properties, {"element", "ref", "text", "submit"}),
                [](ConnectionManager& connections, const QJsonObject& args, ToolCompletion done) {
                    QJsonObject payload = elementPayload(args);
                    payload["text"] = requireString(args, "text");
                    payload["submit"] = requireBool(args, "submit");
                    actThenSnapshot(connections, "browser_type", payload, QString("Typed \"%1\" into \"%2\"")
                        .arg(payload["text"].toString(), payload["element"].toString()), done);
                }
            };
        }

        case ToolKind::SelectOption: {
            QJsonObject properties = elementProperties();
            properties["values"] = QJsonObject{
                {"type", "array"},
                {"items", QJsonObject{{"type", "string"}}},
                {"description", "Array of values to select in the dropdown. This can be a single value or multiple values."}
            };
            return {
                "browser_select_option",
                "Select an option in a dropdown",
                objectSchema(properties, {"element", "ref", "values"}),
                [](ConnectionManager& connections, const QJsonObject& args, ToolCompletion done) {
                    QJsonObject payload = elementPayload(args);
                    payload["values"] = requireStringArray(args, "values");
                    actThenSnapshot(connections, "browser_select_option", payload,
                                    QString("Selected option in \"%1\"").arg(payload["element"].toString()), done);
                }
            };
        }

        case ToolKind::PressKey:
            return {
                "browser_press_key",
                "Press a key on the keyboard",
                objectSchema(QJsonObject{
                    {"key", stringProperty("Name of the key to press or a character to generate, such as `ArrowLeft` or `a`")}
                }, {"key"}),
                [](ConnectionManager& connections, const QJsonObject& args, ToolCompletion done) {
                    const QString key = requireString(args, "key");
                    callThen(connections, "browser_press_key", QJsonObject{{"key", key}}, done, [done, key](const QJsonValue&) {
                        finish(done, textResult(QString("Pressed key %1").arg(key)));
                    });
                }
            };

        case ToolKind::Wait:
            return {
                "browser_wait",
                "Wait for a specified time in seconds",
                objectSchema(QJsonObject{
                    {"time", QJsonObject{{"type", "number"}, {"description", "The time to wait in seconds"}}}
                }, {"time"}),
                [](ConnectionManager& connections, const QJsonObject& args, ToolCompletion done) {
                    const double time = requireNumber(args, "time");
                    callThen(connections, "browser_wait", QJsonObject{{"time", time}}, done, [done, time](const QJsonValue&) {
                        finish(done, textResult(QString("Waited for %1 seconds").arg(QString::number(time))));
                    });
                }
            };

        case ToolKind::GetConsoleLogs:
            return {
                "browser_get_console_logs",
                "Get the console logs from the browser",
                objectSchema(),
                [](ConnectionManager& connections, const QJsonObject&, ToolCompletion done) {
                    callThen(connections, "browser_get_console_logs", QJsonObject(), done, [done](const QJsonValue& logs) {
                        QStringList lines;
                        for (const QJsonValue& entry : logs.toArray()) {
                            lines.append(entry.isObject()
                                ? QString::fromUtf8(QJsonDocument(entry.toObject()).toJson(QJsonDocument::Compact))
                                : valueToText(entry));
                        }
                        finish(done, textResult(lines.join("\n")));
                    });
                }
            };

        case ToolKind::Screenshot:
            return {
                "browser_screenshot",
                "Take a screenshot of the current page",
                objectSchema(),
                [](ConnectionManager& connections, const QJsonObject&, ToolCompletion done) {
                    callThen(connections, "browser_screenshot", QJsonObject(), done, [done](const QJsonValue& data) {
                        finish(done, QJsonObject{
                            {"content", QJsonArray{QJsonObject{
                                {"type", "image"},
                                {"data", data.toString()},
                                {"mimeType", "image/png"}
                            }}}
                        });
                    });
                }
            };
    }

    throw std::invalid_argument("Unknown tool kind");
}

ToolTable buildToolTable()
{
    QList<ToolDefinition> tools;
    for (ToolKind kind : allToolKinds()) {
        tools.append(makeTool(kind));
    }
    return ToolTable(tools);
}

} // namespace BrowserTools
