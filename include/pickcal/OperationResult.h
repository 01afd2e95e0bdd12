#pragma once

#include <QString>

namespace pickcal {

enum class ErrorCode {
    None,
    InvalidSource,
    NoSignal,
    GridMismatch,
    TargetMismatch,
    InvalidLocation,
    InvalidRequest,
    Busy,
    SessionClosed,
    DetectionFailure,
    ActuatorFault,
    DeviceFault,
    ConfigError,
    IoError
};

QString errorCodeName(ErrorCode code);

// Faults that a later attempt on the same calibration cell may clear.
bool isRetryable(ErrorCode code);

struct OperationResult {
    bool success {false};
    ErrorCode error {ErrorCode::None};
    QString message;

    static OperationResult ok(const QString &message = QString());
    static OperationResult failure(ErrorCode error, const QString &message);
};

inline OperationResult OperationResult::ok(const QString &message)
{
    OperationResult result;
    result.success = true;
    result.message = message;
    return result;
}

inline OperationResult OperationResult::failure(ErrorCode error, const QString &message)
{
    OperationResult result;
    result.success = false;
    result.error = error;
    result.message = message;
    return result;
}

} // namespace pickcal
