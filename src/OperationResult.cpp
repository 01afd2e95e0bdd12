#include "pickcal/OperationResult.h"

namespace pickcal {

QString errorCodeName(ErrorCode code)
{
    switch (code) {
    case ErrorCode::None:
        return QStringLiteral("None");
    case ErrorCode::InvalidSource:
        return QStringLiteral("InvalidSource");
    case ErrorCode::NoSignal:
        return QStringLiteral("NoSignal");
    case ErrorCode::GridMismatch:
        return QStringLiteral("GridMismatch");
    case ErrorCode::TargetMismatch:
        return QStringLiteral("TargetMismatch");
    case ErrorCode::InvalidLocation:
        return QStringLiteral("InvalidLocation");
    case ErrorCode::InvalidRequest:
        return QStringLiteral("InvalidRequest");
    case ErrorCode::Busy:
        return QStringLiteral("Busy");
    case ErrorCode::SessionClosed:
        return QStringLiteral("SessionClosed");
    case ErrorCode::DetectionFailure:
        return QStringLiteral("DetectionFailure");
    case ErrorCode::ActuatorFault:
        return QStringLiteral("ActuatorFault");
    case ErrorCode::DeviceFault:
        return QStringLiteral("DeviceFault");
    case ErrorCode::ConfigError:
        return QStringLiteral("ConfigError");
    case ErrorCode::IoError:
        return QStringLiteral("IoError");
    }
    return QStringLiteral("Unknown");
}

bool isRetryable(ErrorCode code)
{
    switch (code) {
    case ErrorCode::NoSignal:
    case ErrorCode::Busy:
    case ErrorCode::DetectionFailure:
    case ErrorCode::ActuatorFault:
    case ErrorCode::DeviceFault:
        return true;
    default:
        return false;
    }
}

} // namespace pickcal
