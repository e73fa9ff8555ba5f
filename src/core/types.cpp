#include "types.hpp"

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:               return "None";
        case ErrorKind::KeyLoad:            return "KeyLoad";
        case ErrorKind::KeyParse:           return "KeyParse";
        case ErrorKind::DialExhausted:      return "DialExhausted";
        case ErrorKind::Handshake:          return "Handshake";
        case ErrorKind::SessionCreation:    return "SessionCreation";
        case ErrorKind::Execution:          return "Execution";
        case ErrorKind::Cancelled:          return "Cancelled";
        case ErrorKind::DeadlineExceeded:   return "DeadlineExceeded";
        case ErrorKind::ToolLookup:         return "ToolLookup";
        case ErrorKind::PermissionChange:   return "PermissionChange";
        case ErrorKind::Transfer:           return "Transfer";
        case ErrorKind::NotConnected:       return "NotConnected";
        case ErrorKind::ReconnectExhausted: return "ReconnectExhausted";
    }
    return "Unknown";
}

std::string SSHResult::describe() const {
    if (success()) return "ok";
    return std::string(error_kind_name(kind)) + ": " + error;
}
