#ifndef WB_PROTOCOL_ENVELOPE_HPP
#define WB_PROTOCOL_ENVELOPE_HPP

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace protocol {

using Json = nlohmann::json;

// Wire tags carried in the "tag" field of every envelope
constexpr const char* kOutboundTag = "provider-request";
constexpr const char* kInboundTag  = "provider-response";

// Capability methods understood by the privileged host
constexpr const char* kGetWalletAddress = "GET_WALLET_ADDRESS";
constexpr const char* kSignTransaction  = "SIGN_TRANSACTION";
constexpr const char* kGetBalance       = "GET_BALANCE";

// -----------------------------------------------------------------------------
// Outcome - Ok(value) | Err(message)
// -----------------------------------------------------------------------------
struct Outcome {
    bool        ok = true;
    Json        value;
    std::string error;

    static Outcome success(Json value);
    static Outcome failure(std::string message);

    // Host responses signal failure with an {error: <string>} object.
    static Outcome from_host_response(const Json& response);

    // Wire form: the value itself, or {error: message}
    Json to_json() const;
};

// -----------------------------------------------------------------------------
// OutboundRequest - page -> relay
// -----------------------------------------------------------------------------
struct OutboundRequest {
    uint64_t    id = 0;
    std::string method;
    Json        params = Json::array();

    Json to_json() const;

    // Returns nullopt for anything that is not a well-formed outbound envelope.
    static std::optional<OutboundRequest> parse(const Json& data);
};

// -----------------------------------------------------------------------------
// InboundResponse - relay -> page
// -----------------------------------------------------------------------------
struct InboundResponse {
    uint64_t id = 0;
    Outcome  outcome;

    Json to_json() const;
    static std::optional<InboundResponse> parse(const Json& data);
};

// -----------------------------------------------------------------------------
// ForwardedCall - relay -> privileged host
// -----------------------------------------------------------------------------
struct ForwardedCall {
    std::string type;  // Capability method name
    uint64_t    id = 0;
    Json        params = Json::array();
    Json        fields = Json::object();  // Method-specific fields (legacy callers)

    Json to_json() const;

    static ForwardedCall from_request(const OutboundRequest& request);

    // Requires a string "type"; id and params are optional. Any other
    // members are kept in `fields`.
    static std::optional<ForwardedCall> parse(const Json& data);

    // params[index] when present, else the named method-specific field,
    // else null.
    Json argument(std::size_t index, const char* field) const;
};

// -----------------------------------------------------------------------------
// Envelope - tagged variant of the two channel directions
// -----------------------------------------------------------------------------
using Envelope = std::variant<OutboundRequest, InboundResponse>;

std::optional<Envelope> parse_envelope(const Json& data);

} // namespace protocol

#endif // WB_PROTOCOL_ENVELOPE_HPP
