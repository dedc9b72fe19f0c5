#ifndef WB_PROTOCOL_CLIENT_PROXY_HPP
#define WB_PROTOCOL_CLIENT_PROXY_HPP

#include "channel.hpp"
#include "correlation.hpp"
#include "envelope.hpp"
#include "../config.hpp"

#include <kj/async.h>
#include <kj/timer.h>

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace protocol {

/**
 * ClientProxy - Capability API for the untrusted page context
 *
 * Every call becomes an outbound envelope on the shared channel and a
 * pending entry in the correlation table. The entry is settled by the
 * first of: a matching inbound envelope, or its deadline.
 *
 * The proxy must outlive the promises it hands out.
 */
class ClientProxy : private kj::TaskSet::ErrorHandler {
public:
    using EventListener = std::function<void(const Json&)>;

    ClientProxy(MessageChannel& channel, kj::Timer& timer,
                const wb::BridgeConfig& config = wb::BridgeConfig());
    ~ClientProxy() noexcept(false);

    ClientProxy(const ClientProxy&) = delete;
    ClientProxy& operator=(const ClientProxy&) = delete;

    // Resolves with the host's response object, rejects with its error
    // message or with "Request timeout".
    kj::Promise<Json> request(const std::string& method, Json params = Json::array());

    // Capability wrappers
    kj::Promise<std::vector<std::string>> enable();
    kj::Promise<std::vector<std::string>> get_accounts();
    kj::Promise<Json> get_balance(std::optional<std::string> address = std::nullopt);
    kj::Promise<Json> send_transaction(Json tx);
    kj::Promise<std::string> get_chain_id();
    kj::Promise<std::string> get_network_version();

    // Events: "connect" (first successful enable) and "accountsChanged"
    // (cached address changed). Returns a listener id for removal.
    uint64_t on(const std::string& event, EventListener listener);
    bool remove_listener(const std::string& event, uint64_t listener_id);
    std::size_t listener_count(const std::string& event) const;

    std::size_t pending_count() const { return table_.size(); }
    bool is_pending(uint64_t id) const { return table_.contains(id); }
    bool is_connected() const { return connected_; }
    const std::optional<std::string>& selected_address() const { return selected_address_; }
    uint64_t last_issued_id() const { return next_id_; }

private:
    void on_message(const ChannelMessage& message);
    void emit(const std::string& event, const Json& payload);
    void taskFailed(kj::Exception&& exception) override;

    MessageChannel& channel_;
    kj::Timer&      timer_;
    kj::Duration    timeout_;
    std::string     chain_id_;
    std::string     network_version_;

    uint64_t         next_id_ = 0;
    CorrelationTable table_;
    uint64_t         subscription_ = 0;

    bool                       connected_ = false;
    std::optional<std::string> selected_address_;

    uint64_t next_listener_ = 1;
    std::map<std::string, std::map<uint64_t, EventListener>> listeners_;

    kj::TaskSet tasks_;
};

} // namespace protocol

#endif // WB_PROTOCOL_CLIENT_PROXY_HPP
