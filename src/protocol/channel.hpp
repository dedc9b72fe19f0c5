#ifndef WB_PROTOCOL_CHANNEL_HPP
#define WB_PROTOCOL_CHANNEL_HPP

#include "envelope.hpp"

#include <kj/async.h>

#include <cstdint>
#include <functional>
#include <map>
#include <string>

namespace protocol {

// -----------------------------------------------------------------------------
// ChannelMessage - One posted message plus its apparent sender
// -----------------------------------------------------------------------------
struct ChannelMessage {
    uint64_t    source = 0;  // Context id of the poster
    std::string origin;      // Origin string claimed by the poster
    Json        data;
};

// -----------------------------------------------------------------------------
// MessageChannel - Shared page-wide bus (postMessage analogue)
//
// Every listener sees every message, including traffic from unrelated
// senders. Delivery happens on a later event loop turn, in posting order.
// -----------------------------------------------------------------------------
class MessageChannel : private kj::TaskSet::ErrorHandler {
public:
    using Listener = std::function<void(const ChannelMessage&)>;

    explicit MessageChannel(std::string origin = "page://localhost");
    ~MessageChannel() noexcept(false);

    MessageChannel(const MessageChannel&) = delete;
    MessageChannel& operator=(const MessageChannel&) = delete;

    // Identity of the window this channel belongs to
    uint64_t context_id() const { return context_id_; }
    const std::string& origin() const { return origin_; }

    // Post as this window
    void post(Json data);

    // Post as some other context (foreign frame, other script)
    void post_from(uint64_t source, std::string origin, Json data);

    uint64_t subscribe(Listener listener);
    void unsubscribe(uint64_t subscription);

    std::size_t listener_count() const { return listeners_.size(); }
    uint64_t posted_count() const { return posted_; }

    // Allocate a fresh context id, distinct from every channel's own.
    static uint64_t allocate_context_id();

private:
    void deliver(const ChannelMessage& message);
    void taskFailed(kj::Exception&& exception) override;

    uint64_t context_id_;
    std::string origin_;
    uint64_t next_subscription_ = 1;
    uint64_t posted_ = 0;
    std::map<uint64_t, Listener> listeners_;
    kj::TaskSet tasks_;
};

} // namespace protocol

#endif // WB_PROTOCOL_CHANNEL_HPP
