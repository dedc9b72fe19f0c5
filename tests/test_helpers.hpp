#ifndef WB_TEST_HELPERS_HPP
#define WB_TEST_HELPERS_HPP

#include "config.hpp"
#include "helpers.hpp"
#include "crypto/keystore.hpp"
#include "protocol/channel.hpp"
#include "protocol/client_proxy.hpp"
#include "protocol/confirmation.hpp"
#include "protocol/envelope.hpp"
#include "protocol/errors.hpp"
#include "protocol/host.hpp"
#include "protocol/relay.hpp"
#include "protocol/rpc_client.hpp"

#include <kj/async.h>
#include <kj/exception.h>
#include <kj/timer.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace test_helpers {

using protocol::Json;

// -----------------------------------------------------------------------------
// Event loop with a manual clock
// -----------------------------------------------------------------------------

struct LoopFixture {
    kj::EventLoop loop;
    kj::WaitScope ws;
    kj::TimerImpl timer;

    LoopFixture() : ws(loop), timer(kj::origin<kj::TimePoint>()) {}

    // Run everything that is ready
    void pump() { ws.poll(); }

    // Move the clock forward, then run what became ready
    void advance(kj::Duration delay) {
        timer.advanceTo(timer.now() + delay);
        ws.poll();
    }
};

// -----------------------------------------------------------------------------
// LogCapture - Collects KJ_LOG output while in scope
//
// Must live on the stack, like every kj::ExceptionCallback.
// -----------------------------------------------------------------------------

class LogCapture : public kj::ExceptionCallback {
public:
    struct Entry {
        kj::LogSeverity severity;
        std::string text;
    };

    void logMessage(kj::LogSeverity severity, const char*, int, int,
                    kj::String&& text) override {
        entries.push_back(Entry{severity, std::string(text.cStr())});
    }

    std::size_t count(const std::string& fragment) const {
        std::size_t n = 0;
        for (const auto& e : entries) {
            if (e.text.find(fragment) != std::string::npos) ++n;
        }
        return n;
    }

    std::vector<Entry> entries;
};

// -----------------------------------------------------------------------------
// Observed - Records how a promise settled
//
// Must be destroyed before the fixture that owns the event loop.
// -----------------------------------------------------------------------------

template <typename T>
class Observed {
public:
    explicit Observed(kj::Promise<T> promise)
        : state_(std::make_shared<State>())
        , promise_(promise.then(
              [state = state_](T value) {
                  ++state->settle_count;
                  state->ok = true;
                  state->value = kj::mv(value);
              },
              [state = state_](kj::Exception&& e) {
                  ++state->settle_count;
                  state->ok = false;
                  state->error = protocol::error_message(e);
              }).eagerlyEvaluate(nullptr)) {}

    bool settled() const { return state_->settle_count > 0; }
    int settle_count() const { return state_->settle_count; }
    bool ok() const { return settled() && state_->ok; }
    bool rejected() const { return settled() && !state_->ok; }
    const T& value() const { return state_->value; }
    const std::string& error() const { return state_->error; }

private:
    struct State {
        int         settle_count = 0;
        bool        ok = false;
        T           value{};
        std::string error;
    };

    std::shared_ptr<State> state_;
    kj::Promise<void> promise_;
};

template <typename T>
std::unique_ptr<Observed<T>> observe(kj::Promise<T> promise) {
    return std::make_unique<Observed<T>>(kj::mv(promise));
}

// -----------------------------------------------------------------------------
// Recorder - Captures every envelope posted on a channel
// -----------------------------------------------------------------------------

class Recorder {
public:
    explicit Recorder(protocol::MessageChannel& channel) : channel_(channel) {
        subscription_ = channel_.subscribe([this](const protocol::ChannelMessage& m) {
            messages.push_back(m);
        });
    }
    ~Recorder() { channel_.unsubscribe(subscription_); }

    std::vector<protocol::OutboundRequest> requests() const {
        std::vector<protocol::OutboundRequest> out;
        for (const auto& m : messages) {
            if (auto r = protocol::OutboundRequest::parse(m.data)) out.push_back(*r);
        }
        return out;
    }

    std::vector<protocol::InboundResponse> responses() const {
        std::vector<protocol::InboundResponse> out;
        for (const auto& m : messages) {
            if (auto r = protocol::InboundResponse::parse(m.data)) out.push_back(*r);
        }
        return out;
    }

    std::vector<protocol::ChannelMessage> messages;

private:
    protocol::MessageChannel& channel_;
    uint64_t subscription_ = 0;
};

// -----------------------------------------------------------------------------
// ScriptedHost - HostPort answered by the test, in any order
// -----------------------------------------------------------------------------

class ScriptedHost : public protocol::HostPort {
public:
    struct Call {
        Json message;
        kj::Own<kj::PromiseFulfiller<Json>> fulfiller;
    };

    kj::Promise<Json> send_message(Json message) override {
        if (fail_synchronously) {
            return protocol::remote_error("host port closed");
        }
        auto paf = kj::newPromiseAndFulfiller<Json>();
        calls.push_back(Call{std::move(message), kj::mv(paf.fulfiller)});
        return kj::mv(paf.promise);
    }

    void answer(std::size_t index, Json response) {
        calls.at(index).fulfiller->fulfill(std::move(response));
    }

    void fail(std::size_t index, const std::string& message) {
        calls.at(index).fulfiller->reject(protocol::remote_error(message));
    }

    bool fail_synchronously = false;
    std::vector<Call> calls;
};

// -----------------------------------------------------------------------------
// Page side only: channel + proxy, responses posted by the test
// -----------------------------------------------------------------------------

struct PageFixture : LoopFixture {
    protocol::MessageChannel channel;
    Recorder recorder;
    std::unique_ptr<protocol::ClientProxy> proxy;

    explicit PageFixture(const wb::BridgeConfig& config = wb::BridgeConfig())
        : recorder(channel)
        , proxy(std::make_unique<protocol::ClientProxy>(channel, timer, config)) {}

    ~PageFixture() { proxy.reset(); }

    // Post an inbound envelope as this window
    void respond(uint64_t id, Json result) {
        channel.post(Json{{"tag", protocol::kInboundTag}, {"id", id}, {"result", std::move(result)}});
    }
};

// -----------------------------------------------------------------------------
// Page + relay, host answered by the test
// -----------------------------------------------------------------------------

struct RelayFixture : LoopFixture {
    protocol::MessageChannel channel;
    Recorder recorder;
    ScriptedHost host;
    protocol::Relay relay;
    protocol::ClientProxy proxy;

    explicit RelayFixture(const wb::BridgeConfig& config = wb::BridgeConfig())
        : recorder(channel)
        , relay(channel, host)
        , proxy(channel, timer, config) {}
};

// -----------------------------------------------------------------------------
// Full bridge: page, relay and a real privileged host
// -----------------------------------------------------------------------------

struct BridgeFixture : LoopFixture {
    wb::BridgeConfig config;
    protocol::MessageChannel channel;
    crypto::LocalKeyStore key_store;
    protocol::MockRpcClient rpc;
    protocol::QueuedConfirmation confirmation;
    protocol::PrivilegedHost host;
    protocol::Relay relay;
    protocol::ClientProxy proxy;

    explicit BridgeFixture(const wb::BridgeConfig& cfg = wb::BridgeConfig())
        : config(cfg)
        , rpc(cfg.rpc_url)
        , host(key_store, rpc, confirmation, timer, config)
        , relay(channel, host)
        , proxy(channel, timer, config) {}
};

// Host side only, driven through send_message()
struct HostFixture : LoopFixture {
    wb::BridgeConfig config;
    crypto::LocalKeyStore key_store;
    protocol::MockRpcClient rpc;
    protocol::QueuedConfirmation confirmation;
    protocol::PrivilegedHost host;

    explicit HostFixture(const wb::BridgeConfig& cfg = wb::BridgeConfig())
        : config(cfg)
        , host(key_store, rpc, confirmation, timer, config) {}

    kj::Promise<Json> call(const std::string& type, uint64_t id, Json params = Json::array()) {
        return host.send_message(Json{{"type", type}, {"id", id}, {"params", std::move(params)}});
    }
};

inline Json sample_transaction() {
    return Json{{"to", "0x00000000000000000000000000000000000000aa"},
                {"amount", "1000"},
                {"purpose", "coffee"}};
}

} // namespace test_helpers

#endif // WB_TEST_HELPERS_HPP
