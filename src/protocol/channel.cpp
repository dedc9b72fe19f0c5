#include "channel.hpp"
#include "errors.hpp"
#include <kj/debug.h>

#include <atomic>
#include <exception>
#include <vector>

namespace protocol {

uint64_t MessageChannel::allocate_context_id() {
    static std::atomic<uint64_t> next{1};
    return next.fetch_add(1, std::memory_order_relaxed);
}

MessageChannel::MessageChannel(std::string origin)
    : context_id_(allocate_context_id())
    , origin_(std::move(origin))
    , tasks_(*this)
{
}

MessageChannel::~MessageChannel() noexcept(false) {}

void MessageChannel::post(Json data) {
    post_from(context_id_, origin_, std::move(data));
}

void MessageChannel::post_from(uint64_t source, std::string origin, Json data) {
    ChannelMessage message;
    message.source = source;
    message.origin = std::move(origin);
    message.data = std::move(data);
    ++posted_;

    tasks_.add(kj::evalLater([this, message = std::move(message)]() {
        deliver(message);
    }));
}

uint64_t MessageChannel::subscribe(Listener listener) {
    uint64_t id = next_subscription_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

void MessageChannel::unsubscribe(uint64_t subscription) {
    listeners_.erase(subscription);
}

void MessageChannel::deliver(const ChannelMessage& message) {
    // Listeners may subscribe or unsubscribe while we iterate.
    std::vector<uint64_t> ids;
    ids.reserve(listeners_.size());
    for (const auto& entry : listeners_) ids.push_back(entry.first);

    for (uint64_t id : ids) {
        auto it = listeners_.find(id);
        if (it == listeners_.end()) continue;
        Listener listener = it->second;
        try {
            listener(message);
        } catch (const std::exception& e) {
            KJ_LOG(WARNING, "channel listener threw", id, e.what());
        }
    }
}

void MessageChannel::taskFailed(kj::Exception&& exception) {
    KJ_LOG(ERROR, "channel delivery failed", exception);
}

} // namespace protocol
