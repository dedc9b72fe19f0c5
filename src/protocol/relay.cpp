#include "relay.hpp"
#include "errors.hpp"
#include <kj/debug.h>

#include <utility>

namespace protocol {

Relay::Relay(MessageChannel& channel, HostPort& host)
    : channel_(channel)
    , host_(host)
    , tasks_(*this)
{
    subscription_ = channel_.subscribe([this](const ChannelMessage& message) {
        on_message(message);
    });
}

Relay::~Relay() noexcept(false) {
    channel_.unsubscribe(subscription_);
}

void Relay::on_message(const ChannelMessage& message) {
    auto envelope = parse_envelope(message.data);
    if (!envelope) return;

    const auto* request = std::get_if<OutboundRequest>(&*envelope);
    if (request == nullptr) return;

    // Only accept requests posted by this window itself.
    if (message.source != channel_.context_id()) {
        ++rejected_;
        KJ_LOG(WARNING, "relay ignoring request from foreign source", request->id,
               message.source, message.origin.c_str());
        return;
    }

    uint64_t id = request->id;
    Json call = ForwardedCall::from_request(*request).to_json();
    ++forwarded_;
    KJ_LOG(INFO, "relay forwarding", id, request->method.c_str());

    tasks_.add(kj::evalNow([this, call = std::move(call)]() mutable {
        return host_.send_message(std::move(call));
    }).then(
        [this, id](Json response) {
            respond(id, Outcome::from_host_response(response));
        },
        [this, id](kj::Exception&& exception) {
            respond(id, Outcome::failure(error_message(exception)));
        }));
}

void Relay::respond(uint64_t id, const Outcome& outcome) {
    InboundResponse response;
    response.id = id;
    response.outcome = outcome;
    channel_.post(response.to_json());
}

void Relay::taskFailed(kj::Exception&& exception) {
    KJ_LOG(ERROR, "relay forwarding task failed", exception);
}

} // namespace protocol
