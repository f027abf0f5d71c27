#ifndef BRIDGE_ERRORS_H
#define BRIDGE_ERRORS_H

#include <QString>
#include <stdexcept>

namespace TabBridgeCommon {

    enum class ErrorKind {
        None,
        NotConnected,
        Timeout,
        Transport,
        Remote,
        ToolNotFound,
        Handler,
        PortConflict,
        InvalidRequest
    };

    inline const char* errorKindToString(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::None: return "None";
            case ErrorKind::NotConnected: return "NotConnectedError";
            case ErrorKind::Timeout: return "TimeoutError";
            case ErrorKind::Transport: return "TransportError";
            case ErrorKind::Remote: return "RemoteError";
            case ErrorKind::ToolNotFound: return "ToolNotFound";
            case ErrorKind::Handler: return "HandlerError";
            case ErrorKind::PortConflict: return "PortConflictError";
            case ErrorKind::InvalidRequest: return "InvalidRequestError";
            default: return "UnknownError";
        }
    }

    // Failures that mean the extension could not be reached at all,
    // as opposed to a tool that ran and reported an error
    inline bool isTransportKind(ErrorKind kind) {
        return kind == ErrorKind::NotConnected
            || kind == ErrorKind::Timeout
            || kind == ErrorKind::Transport;
    }

    // Error value carried through asynchronous callbacks
    struct CallError {
        ErrorKind kind = ErrorKind::None;
        QString message;

        bool isError() const { return kind != ErrorKind::None; }

        static CallError none() { return CallError(); }
        static CallError make(ErrorKind kind, const QString& message) {
            CallError error;
            error.kind = kind;
            error.message = message;
            return error;
        }
    };

    class BridgeError : public std::runtime_error {
    public:
        BridgeError(ErrorKind kind, const QString& message)
            : std::runtime_error(message.toStdString()), m_kind(kind), m_message(message) {}

        ErrorKind kind() const { return m_kind; }
        QString message() const { return m_message; }
        CallError toCallError() const { return CallError::make(m_kind, m_message); }

    private:
        ErrorKind m_kind;
        QString m_message;
    };

    class NotConnectedError : public BridgeError {
    public:
        explicit NotConnectedError(const QString& message) : BridgeError(ErrorKind::NotConnected, message) {}
    };

    class TimeoutError : public BridgeError {
    public:
        explicit TimeoutError(const QString& message) : BridgeError(ErrorKind::Timeout, message) {}
    };

    class TransportError : public BridgeError {
    public:
        explicit TransportError(const QString& message) : BridgeError(ErrorKind::Transport, message) {}
    };

    class RemoteError : public BridgeError {
    public:
        explicit RemoteError(const QString& message) : BridgeError(ErrorKind::Remote, message) {}
    };

    class ToolNotFound : public BridgeError {
    public:
        explicit ToolNotFound(const QString& message) : BridgeError(ErrorKind::ToolNotFound, message) {}
    };

    class HandlerError : public BridgeError {
    public:
        explicit HandlerError(const QString& message) : BridgeError(ErrorKind::Handler, message) {}
    };

    class PortConflictError : public BridgeError {
    public:
        explicit PortConflictError(const QString& message) : BridgeError(ErrorKind::PortConflict, message) {}
    };

    class InvalidRequestError : public BridgeError {
    public:
        explicit InvalidRequestError(const QString& message) : BridgeError(ErrorKind::InvalidRequest, message) {}
    };

    // Rethrow an asynchronous failure as its matching exception type
    [[noreturn]] inline void throwCallError(const CallError& error) {
        switch (error.kind) {
            case ErrorKind::NotConnected: throw NotConnectedError(error.message);
            case ErrorKind::Timeout: throw TimeoutError(error.message);
            case ErrorKind::Transport: throw TransportError(error.message);
            case ErrorKind::Remote: throw RemoteError(error.message);
            case ErrorKind::ToolNotFound: throw ToolNotFound(error.message);
            case ErrorKind::PortConflict: throw PortConflictError(error.message);
            case ErrorKind::InvalidRequest: throw InvalidRequestError(error.message);
            default: throw HandlerError(error.message);
        }
    }
}

#endif // BRIDGE_ERRORS_H
