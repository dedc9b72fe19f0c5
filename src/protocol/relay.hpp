#ifndef WB_PROTOCOL_RELAY_HPP
#define WB_PROTOCOL_RELAY_HPP

#include "channel.hpp"
#include "envelope.hpp"

#include <kj/async.h>

#include <cstdint>

namespace protocol {

// -----------------------------------------------------------------------------
// HostPort - The privileged host's own messaging primitive
//
// send_message() completes exactly once with the host's response object.
// -----------------------------------------------------------------------------
class HostPort {
public:
    virtual ~HostPort() = default;
    virtual kj::Promise<Json> send_message(Json message) = 0;
};

// -----------------------------------------------------------------------------
// Relay - Trust boundary between the page channel and the host
//
// Forwards outbound envelopes posted by this window to the host and posts
// exactly one inbound envelope per forwarded call. Keeps no per-call state
// beyond the completion closure.
// -----------------------------------------------------------------------------
class Relay : private kj::TaskSet::ErrorHandler {
public:
    Relay(MessageChannel& channel, HostPort& host);
    ~Relay() noexcept(false);

    Relay(const Relay&) = delete;
    Relay& operator=(const Relay&) = delete;

    uint64_t forwarded_count() const { return forwarded_; }
    uint64_t rejected_count() const { return rejected_; }

private:
    void on_message(const ChannelMessage& message);
    void respond(uint64_t id, const Outcome& outcome);
    void taskFailed(kj::Exception&& exception) override;

    MessageChannel& channel_;
    HostPort&       host_;
    uint64_t        subscription_ = 0;

    // Diagnostic tallies; forwarding never reads them
    uint64_t forwarded_ = 0;
    uint64_t rejected_  = 0;

    kj::TaskSet tasks_;
};

} // namespace protocol

#endif // WB_PROTOCOL_RELAY_HPP
