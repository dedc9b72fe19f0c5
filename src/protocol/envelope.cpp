#include "envelope.hpp"

namespace protocol {

namespace {

bool has_tag(const Json& data, const char* tag) {
    if (!data.is_object()) return false;
    auto it = data.find("tag");
    return it != data.end() && it->is_string() && it->get<std::string>() == tag;
}

std::optional<uint64_t> read_id(const Json& data) {
    auto it = data.find("id");
    if (it == data.end()) return std::nullopt;
    if (it->is_number_unsigned()) return it->get<uint64_t>();
    if (it->is_number_integer()) {
        auto v = it->get<int64_t>();
        if (v < 0) return std::nullopt;
        return static_cast<uint64_t>(v);
    }
    return std::nullopt;
}

} // namespace

// -----------------------------------------------------------------------------
// Outcome
// -----------------------------------------------------------------------------

Outcome Outcome::success(Json value) {
    Outcome out;
    out.ok = true;
    out.value = std::move(value);
    return out;
}

Outcome Outcome::failure(std::string message) {
    Outcome out;
    out.ok = false;
    out.error = std::move(message);
    return out;
}

Outcome Outcome::from_host_response(const Json& response) {
    if (response.is_object()) {
        auto it = response.find("error");
        if (it != response.end() && it->is_string()) {
            return failure(it->get<std::string>());
        }
    }
    return success(response);
}

Json Outcome::to_json() const {
    if (ok) return value;
    return Json{{"error", error}};
}

// -----------------------------------------------------------------------------
// OutboundRequest
// -----------------------------------------------------------------------------

Json OutboundRequest::to_json() const {
    return Json{
        {"tag", kOutboundTag},
        {"id", id},
        {"method", method},
        {"params", params.is_array() ? params : Json::array()}
    };
}

std::optional<OutboundRequest> OutboundRequest::parse(const Json& data) {
    if (!has_tag(data, kOutboundTag)) return std::nullopt;

    auto id = read_id(data);
    if (!id) return std::nullopt;

    auto method = data.find("method");
    if (method == data.end() || !method->is_string() || method->get<std::string>().empty()) {
        return std::nullopt;
    }

    OutboundRequest req;
    req.id = *id;
    req.method = method->get<std::string>();

    auto params = data.find("params");
    if (params != data.end() && !params->is_null()) {
        if (!params->is_array()) return std::nullopt;
        req.params = *params;
    }
    return req;
}

// -----------------------------------------------------------------------------
// InboundResponse
// -----------------------------------------------------------------------------

Json InboundResponse::to_json() const {
    return Json{
        {"tag", kInboundTag},
        {"id", id},
        {"result", outcome.to_json()}
    };
}

std::optional<InboundResponse> InboundResponse::parse(const Json& data) {
    if (!has_tag(data, kInboundTag)) return std::nullopt;

    auto id = read_id(data);
    if (!id) return std::nullopt;

    auto result = data.find("result");
    if (result == data.end()) return std::nullopt;

    InboundResponse resp;
    resp.id = *id;
    resp.outcome = Outcome::from_host_response(*result);
    return resp;
}

// -----------------------------------------------------------------------------
// ForwardedCall
// -----------------------------------------------------------------------------

Json ForwardedCall::to_json() const {
    Json out = fields.is_object() ? fields : Json::object();
    out["type"] = type;
    out["id"] = id;
    out["params"] = params.is_array() ? params : Json::array();
    return out;
}

ForwardedCall ForwardedCall::from_request(const OutboundRequest& request) {
    ForwardedCall call;
    call.type = request.method;
    call.id = request.id;
    call.params = request.params;
    return call;
}

std::optional<ForwardedCall> ForwardedCall::parse(const Json& data) {
    if (!data.is_object()) return std::nullopt;

    auto type = data.find("type");
    if (type == data.end() || !type->is_string()) return std::nullopt;

    ForwardedCall call;
    call.type = type->get<std::string>();
    call.id = read_id(data).value_or(0);

    auto params = data.find("params");
    if (params != data.end() && params->is_array()) {
        call.params = *params;
    }

    for (auto it = data.begin(); it != data.end(); ++it) {
        if (it.key() == "type" || it.key() == "id" || it.key() == "params") continue;
        call.fields[it.key()] = it.value();
    }
    return call;
}

Json ForwardedCall::argument(std::size_t index, const char* field) const {
    if (params.is_array() && index < params.size() && !params[index].is_null()) {
        return params[index];
    }
    if (field != nullptr && fields.is_object()) {
        auto it = fields.find(field);
        if (it != fields.end()) return *it;
    }
    return nullptr;
}

// -----------------------------------------------------------------------------
// Envelope
// -----------------------------------------------------------------------------

std::optional<Envelope> parse_envelope(const Json& data) {
    if (auto out = OutboundRequest::parse(data)) return Envelope{std::move(*out)};
    if (auto in = InboundResponse::parse(data)) return Envelope{std::move(*in)};
    return std::nullopt;
}

} // namespace protocol
