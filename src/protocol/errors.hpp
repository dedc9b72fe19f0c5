#ifndef WB_PROTOCOL_ERRORS_HPP
#define WB_PROTOCOL_ERRORS_HPP

#include <kj/exception.h>

#include <cstdint>
#include <string>

namespace protocol {

// -----------------------------------------------------------------------------
// ErrorCode - Faults a bridge request can end with
// -----------------------------------------------------------------------------
enum class ErrorCode : uint8_t {
    Timeout          = 1,  // Deadline elapsed with no response
    UnknownMethod    = 2,  // Host has no handler
    NoWallet         = 3,  // No wallet configured
    UserRejected     = 4,  // Confirmation declined
    NetworkError     = 5,  // Downstream RPC failure
    MalformedMessage = 6,  // Dropped at the boundary, never surfaced
    InvalidParams    = 7   // Handler input missing or of the wrong type
};

const char* error_code_name(ErrorCode code);

// Message used on the wire when a handler has nothing more specific to say.
std::string default_message(ErrorCode code);

// Asynchronous faults travel as kj::Exception. The description is exactly
// the message, so it can be copied into an Err outcome unchanged.
kj::Exception make_error(ErrorCode code, const std::string& message);
kj::Exception make_error(ErrorCode code);

// An Err outcome received from the other side of the bridge.
kj::Exception remote_error(const std::string& message);

std::string error_message(const kj::Exception& exception);

} // namespace protocol

#endif // WB_PROTOCOL_ERRORS_HPP
