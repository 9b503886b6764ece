#include "prosftp/SftpTypes.hpp"

namespace prosftp {

const char *errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:
        return "None";
    case ErrorKind::AuthError:
        return "AuthError";
    case ErrorKind::NetworkError:
        return "NetworkError";
    case ErrorKind::UntrustedHost:
        return "UntrustedHost";
    case ErrorKind::NotConnected:
        return "NotConnected";
    case ErrorKind::RemoteIOError:
        return "RemoteIOError";
    case ErrorKind::LocalIOError:
        return "LocalIOError";
    case ErrorKind::RemoteCommandError:
        return "RemoteCommandError";
    case ErrorKind::Cancelled:
        return "Cancelled";
    case ErrorKind::Busy:
        return "Busy";
    }
    return "Unknown";
}

std::string SftpError::describe() const {
    if (empty()) return {};
    if (message.empty()) return errorKindName(kind);
    return std::string(errorKindName(kind)) + ": " + message;
}

} // namespace prosftp
