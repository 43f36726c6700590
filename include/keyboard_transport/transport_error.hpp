#pragma once

#include <stdexcept>
#include <string>

namespace kb::transport {

enum class ErrorKind {
    Io,
    Framing,
    ProtocolMismatch,
    Timeout,
    DeviceNotFound,
    Unimplemented,
};

[[nodiscard]] const char* errorKindName(ErrorKind kind) noexcept;

// Every failure that crosses the transport API. Io and Timeout are worth
// retrying later; DeviceNotFound and Unimplemented will fail the same way again.
class TransportError : public std::runtime_error {
public:
    TransportError(ErrorKind kind, const std::string& message);

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
    [[nodiscard]] bool isTransient() const noexcept {
        return kind_ == ErrorKind::Io || kind_ == ErrorKind::Timeout;
    }

private:
    ErrorKind kind_;
};

class FramingError : public TransportError {
public:
    explicit FramingError(const std::string& message)
        : TransportError(ErrorKind::Framing, message) {}
};

}  // namespace kb::transport
