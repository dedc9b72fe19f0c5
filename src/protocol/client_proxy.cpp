#include "client_proxy.hpp"
#include "errors.hpp"
#include <kj/debug.h>

#include <exception>
#include <utility>

namespace protocol {

ClientProxy::ClientProxy(MessageChannel& channel, kj::Timer& timer, const wb::BridgeConfig& config)
    : channel_(channel)
    , timer_(timer)
    , timeout_(static_cast<int64_t>(config.request_timeout_ms) * kj::MILLISECONDS)
    , chain_id_(config.chain_id)
    , network_version_(config.network_version)
    , tasks_(*this)
{
    subscription_ = channel_.subscribe([this](const ChannelMessage& message) {
        on_message(message);
    });
}

ClientProxy::~ClientProxy() noexcept(false) {
    channel_.unsubscribe(subscription_);
    std::size_t dropped = table_.reject_all(remote_error("Client proxy destroyed"));
    if (dropped > 0) {
        KJ_LOG(INFO, "client proxy rejected pending requests on shutdown", dropped);
    }
}

// -----------------------------------------------------------------------------
// Correlation
// -----------------------------------------------------------------------------

kj::Promise<Json> ClientProxy::request(const std::string& method, Json params) {
    uint64_t id = ++next_id_;
    auto paf = kj::newPromiseAndFulfiller<Json>();

    PendingEntry entry;
    entry.id = id;
    entry.created_at = timer_.now();
    entry.fulfiller = kj::mv(paf.fulfiller);
    entry.deadline = kj::heap<kj::Canceler>();

    auto deadline = entry.deadline->wrap(timer_.afterDelay(timeout_));
    table_.register_entry(std::move(entry));

    tasks_.add(kj::mv(deadline).then(
        [this, id]() {
            if (table_.reject(id, make_error(ErrorCode::Timeout))) {
                KJ_LOG(INFO, "request timed out", id);
            }
        },
        [](kj::Exception&&) {
            // Cancelled: the response arrived first.
        }));

    OutboundRequest out;
    out.id = id;
    out.method = method;
    out.params = params.is_array() ? std::move(params) : Json::array();

    KJ_LOG(INFO, "posting request", id, method.c_str());
    channel_.post(out.to_json());

    return kj::mv(paf.promise);
}

void ClientProxy::on_message(const ChannelMessage& message) {
    // Responses are only trusted when the relay in this window posted them.
    if (message.source != channel_.context_id()) return;

    auto envelope = parse_envelope(message.data);
    if (!envelope) return;

    const auto* response = std::get_if<InboundResponse>(&*envelope);
    if (response == nullptr) return;

    bool settled = response->outcome.ok
        ? table_.resolve(response->id, response->outcome.value)
        : table_.reject(response->id, remote_error(response->outcome.error));

    if (!settled) {
        KJ_LOG(INFO, "discarding response for unknown id", response->id);
    }
}

// -----------------------------------------------------------------------------
// Capability wrappers
// -----------------------------------------------------------------------------

kj::Promise<std::vector<std::string>> ClientProxy::enable() {
    return request(kGetWalletAddress).then([this](Json result) -> std::vector<std::string> {
        auto it = result.find("address");
        if (it == result.end() || !it->is_string()) {
            kj::throwFatalException(remote_error("Response did not contain an address"));
        }
        std::string address = it->get<std::string>();

        bool first_connect = !connected_;
        bool changed = !selected_address_ || *selected_address_ != address;
        selected_address_ = address;
        connected_ = true;

        if (first_connect) emit("connect", Json{{"chainId", chain_id_}});
        if (changed) emit("accountsChanged", Json::array({address}));

        return {address};
    });
}

kj::Promise<std::vector<std::string>> ClientProxy::get_accounts() {
    if (selected_address_) {
        return std::vector<std::string>{*selected_address_};
    }
    return enable();
}

kj::Promise<Json> ClientProxy::get_balance(std::optional<std::string> address) {
    Json params = Json::array();
    if (address) {
        params.push_back(*address);
    } else if (selected_address_) {
        params.push_back(*selected_address_);
    } else {
        params.push_back(nullptr);
    }
    return request(kGetBalance, std::move(params));
}

kj::Promise<Json> ClientProxy::send_transaction(Json tx) {
    Json params = Json::array();
    params.push_back(std::move(tx));
    return request(kSignTransaction, std::move(params));
}

kj::Promise<std::string> ClientProxy::get_chain_id() {
    return std::string(chain_id_);
}

kj::Promise<std::string> ClientProxy::get_network_version() {
    return std::string(network_version_);
}

// -----------------------------------------------------------------------------
// Events
// -----------------------------------------------------------------------------

uint64_t ClientProxy::on(const std::string& event, EventListener listener) {
    uint64_t id = next_listener_++;
    listeners_[event].emplace(id, std::move(listener));
    return id;
}

bool ClientProxy::remove_listener(const std::string& event, uint64_t listener_id) {
    auto it = listeners_.find(event);
    if (it == listeners_.end()) return false;
    bool removed = it->second.erase(listener_id) > 0;
    if (it->second.empty()) listeners_.erase(it);
    return removed;
}

std::size_t ClientProxy::listener_count(const std::string& event) const {
    auto it = listeners_.find(event);
    return it == listeners_.end() ? 0 : it->second.size();
}

void ClientProxy::emit(const std::string& event, const Json& payload) {
    auto it = listeners_.find(event);
    if (it == listeners_.end()) return;

    // Copy so listeners may add or remove subscriptions.
    auto subscribers = it->second;
    for (auto& entry : subscribers) {
        try {
            entry.second(payload);
        } catch (const std::exception& e) {
            KJ_LOG(WARNING, "event listener threw", event.c_str(), e.what());
        }
    }
}

void ClientProxy::taskFailed(kj::Exception&& exception) {
    KJ_LOG(ERROR, "deadline task failed", exception);
}

} // namespace protocol
