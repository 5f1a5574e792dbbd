#pragma once

#include <QString>

namespace vanta {

// Error codes carried in {"type":"error"} envelopes. The numeric values are
// stable on the wire; the string form goes into "codeString".
enum class IpcErrorCode : int {
    InvalidParams      = 1,
    Timeout            = 2,
    NotFound           = 4,
    InternalError      = 6,
    Unsupported        = 7,
    ScriptFailed       = 10,
};

inline QString ipcErrorCodeToString(IpcErrorCode code)
{
    switch (code) {
    case IpcErrorCode::InvalidParams:      return QStringLiteral("INVALID_PARAMS");
    case IpcErrorCode::Timeout:            return QStringLiteral("TIMEOUT");
    case IpcErrorCode::NotFound:           return QStringLiteral("NOT_FOUND");
    case IpcErrorCode::InternalError:      return QStringLiteral("INTERNAL_ERROR");
    case IpcErrorCode::Unsupported:        return QStringLiteral("UNSUPPORTED");
    case IpcErrorCode::ScriptFailed:       return QStringLiteral("SCRIPT_FAILED");
    }
    return QStringLiteral("UNKNOWN");
}

} // namespace vanta
