#pragma once

#include <QString>
#include <QMetaType>
#include <stdexcept>
#include <string>

namespace herald {

enum class ErrorKind {
    None,
    Validation,
    CapacityExceeded,
    Platform,
    Persistence,
    Timeout,
    PermissionDenied,
    CircuitOpen,
    QueueFull,
    Cancelled
};

inline const char* errorKindName(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::None: return "None";
    case ErrorKind::Validation: return "Validation";
    case ErrorKind::CapacityExceeded: return "CapacityExceeded";
    case ErrorKind::Platform: return "Platform";
    case ErrorKind::Persistence: return "Persistence";
    case ErrorKind::Timeout: return "Timeout";
    case ErrorKind::PermissionDenied: return "PermissionDenied";
    case ErrorKind::CircuitOpen: return "CircuitOpen";
    case ErrorKind::QueueFull: return "QueueFull";
    case ErrorKind::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

/// Failure record carried by Error events and platform results.
struct NotificationError {
    ErrorKind kind = ErrorKind::None;
    QString operation;
    QString message;

    bool isError() const { return kind != ErrorKind::None; }

    QString toString() const
    {
        return QStringLiteral("%1 in %2: %3")
            .arg(QString::fromLatin1(errorKindName(kind)), operation, message);
    }
};

/// Base for the failures thrown out of the async wrappers.
class AsyncError : public std::runtime_error {
public:
    AsyncError(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class TimeoutError : public AsyncError {
public:
    explicit TimeoutError(const std::string& what)
        : AsyncError(ErrorKind::Timeout, what) {}
};

class QueueFullError : public AsyncError {
public:
    explicit QueueFullError(const std::string& what)
        : AsyncError(ErrorKind::QueueFull, what) {}
};

class OperationCancelledError : public AsyncError {
public:
    explicit OperationCancelledError(const std::string& what)
        : AsyncError(ErrorKind::Cancelled, what) {}
};

} // namespace herald

Q_DECLARE_METATYPE(herald::NotificationError)
