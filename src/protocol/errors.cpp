#include "errors.hpp"

#include <kj/string.h>

namespace protocol {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Timeout:          return "Timeout";
        case ErrorCode::UnknownMethod:    return "UnknownMethod";
        case ErrorCode::NoWallet:         return "NoWallet";
        case ErrorCode::UserRejected:     return "UserRejected";
        case ErrorCode::NetworkError:     return "NetworkError";
        case ErrorCode::MalformedMessage: return "MalformedMessage";
        case ErrorCode::InvalidParams:    return "InvalidParams";
    }
    return "Unknown";
}

std::string default_message(ErrorCode code) {
    switch (code) {
        case ErrorCode::Timeout:          return "Request timeout";
        case ErrorCode::UnknownMethod:    return "Unknown request type";
        case ErrorCode::NoWallet:         return "No wallet found";
        case ErrorCode::UserRejected:     return "User rejected the request";
        case ErrorCode::NetworkError:     return "Network error";
        case ErrorCode::MalformedMessage: return "Malformed message";
        case ErrorCode::InvalidParams:    return "Invalid parameters";
    }
    return "Unknown error";
}

kj::Exception make_error(ErrorCode code, const std::string& message) {
    // Timeouts map to OVERLOADED like kj's own timer exceptions.
    auto type = code == ErrorCode::Timeout ? kj::Exception::Type::OVERLOADED
                                           : kj::Exception::Type::FAILED;
    return kj::Exception(type, __FILE__, __LINE__, kj::heapString(message.data(), message.size()));
}

kj::Exception make_error(ErrorCode code) {
    return make_error(code, default_message(code));
}

kj::Exception remote_error(const std::string& message) {
    return kj::Exception(kj::Exception::Type::FAILED, __FILE__, __LINE__,
                         kj::heapString(message.data(), message.size()));
}

std::string error_message(const kj::Exception& exception) {
    auto description = exception.getDescription();
    return std::string(description.begin(), description.size());
}

} // namespace protocol
