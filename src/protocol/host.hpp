#ifndef WB_PROTOCOL_HOST_HPP
#define WB_PROTOCOL_HOST_HPP

#include "confirmation.hpp"
#include "envelope.hpp"
#include "relay.hpp"
#include "rpc_client.hpp"
#include "transaction.hpp"
#include "../config.hpp"
#include "../crypto/keystore.hpp"

#include <kj/async.h>
#include <kj/timer.h>

#include <cstdint>
#include <functional>
#include <map>
#include <set>
#include <string>

namespace protocol {

/**
 * PrivilegedHost - Owns the wallet capabilities
 *
 * Dispatches forwarded calls by their "type" and answers every one of them
 * exactly once. Faults never reject towards the relay; they become an
 * {error: message} response instead.
 *
 * The host must outlive every promise returned by send_message().
 */
class PrivilegedHost : public HostPort {
public:
    using Handler = std::function<kj::Promise<Json>(const ForwardedCall&)>;

    PrivilegedHost(crypto::WalletKeyStore& key_store,
                   RpcClient& rpc,
                   ConfirmationSurface& confirmation,
                   kj::Timer& timer,
                   const wb::BridgeConfig& config = wb::BridgeConfig());

    PrivilegedHost(const PrivilegedHost&) = delete;
    PrivilegedHost& operator=(const PrivilegedHost&) = delete;

    kj::Promise<Json> send_message(Json message) override;

    // Adds or replaces the handler for `method`.
    void register_handler(const std::string& method, Handler handler);
    bool has_handler(const std::string& method) const;

    // Signing requests still waiting on the user
    bool awaiting_confirmation(uint64_t correlation_id) const;
    std::size_t awaiting_confirmation_count() const { return awaiting_.size(); }

private:
    kj::Promise<Json> dispatch(const ForwardedCall& call);
    kj::Promise<Json> invoke(const Handler& handler, const ForwardedCall& call);

    // Built-in capabilities
    kj::Promise<Json> get_wallet_address(const ForwardedCall& call);
    kj::Promise<Json> sign_transaction(const ForwardedCall& call);
    kj::Promise<Json> get_balance(const ForwardedCall& call);

    kj::Promise<bool> await_approval(uint64_t correlation_id, const Json& transaction);
    Json sign(const UnsignedTransaction& tx, const crypto::WalletRecord& wallet) const;
    void finish_confirmation(uint64_t correlation_id);

    crypto::WalletKeyStore& key_store_;
    RpcClient&              rpc_;
    ConfirmationSurface&    confirmation_;
    kj::Timer&              timer_;
    kj::Duration            confirmation_timeout_;  // Capped at the request timeout
    bool                    broadcast_signed_;

    std::map<std::string, Handler> handlers_;

    // Correlation ids are only unique per page.
    std::multiset<uint64_t> awaiting_;
};

} // namespace protocol

#endif // WB_PROTOCOL_HOST_HPP
