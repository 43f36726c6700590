#include "keyboard_transport/transport_error.hpp"

namespace kb::transport {

const char* errorKindName(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::Io:
        return "io";
    case ErrorKind::Framing:
        return "framing";
    case ErrorKind::ProtocolMismatch:
        return "protocol mismatch";
    case ErrorKind::Timeout:
        return "timeout";
    case ErrorKind::DeviceNotFound:
        return "device not found";
    case ErrorKind::Unimplemented:
        return "unimplemented";
    }
    return "unknown";
}

TransportError::TransportError(ErrorKind kind, const std::string& message)
    : std::runtime_error(std::string(errorKindName(kind)) + ": " + message),
      kind_(kind) {}

}  // namespace kb::transport
