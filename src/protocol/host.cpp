#include "host.hpp"
#include "errors.hpp"
#include "../helpers.hpp"
#include <kj/common.h>
#include <kj/debug.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <utility>

namespace protocol {

static constexpr uint32_t kNonceRange = 1000000;

static uint64_t now_seconds() {
    auto now = std::chrono::system_clock::now();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count());
}

static Json error_response(const std::string& message) {
    return Json{{"error", message}};
}

PrivilegedHost::PrivilegedHost(crypto::WalletKeyStore& key_store,
                               RpcClient& rpc,
                               ConfirmationSurface& confirmation,
                               kj::Timer& timer,
                               const wb::BridgeConfig& config)
    : key_store_(key_store)
    , rpc_(rpc)
    , confirmation_(confirmation)
    , timer_(timer)
    , confirmation_timeout_(static_cast<int64_t>(
          std::min(config.confirmation_timeout_ms, config.request_timeout_ms)) * kj::MILLISECONDS)
    , broadcast_signed_(config.broadcast_signed)
{
    register_handler(kGetWalletAddress, [this](const ForwardedCall& call) {
        return get_wallet_address(call);
    });
    register_handler(kSignTransaction, [this](const ForwardedCall& call) {
        return sign_transaction(call);
    });
    register_handler(kGetBalance, [this](const ForwardedCall& call) {
        return get_balance(call);
    });
}

void PrivilegedHost::register_handler(const std::string& method, Handler handler) {
    handlers_[method] = std::move(handler);
}

bool PrivilegedHost::has_handler(const std::string& method) const {
    return handlers_.count(method) > 0;
}

bool PrivilegedHost::awaiting_confirmation(uint64_t correlation_id) const {
    return awaiting_.count(correlation_id) > 0;
}

// -----------------------------------------------------------------------------
// Dispatch
// -----------------------------------------------------------------------------

kj::Promise<Json> PrivilegedHost::send_message(Json message) {
    auto call = ForwardedCall::parse(message);
    if (!call) {
        KJ_LOG(INFO, "host message without a type");
        return error_response(default_message(ErrorCode::UnknownMethod));
    }
    return dispatch(*call);
}

kj::Promise<Json> PrivilegedHost::dispatch(const ForwardedCall& call) {
    auto it = handlers_.find(call.type);
    if (it == handlers_.end()) {
        KJ_LOG(INFO, "host received unknown request type", call.type.c_str());
        return error_response(default_message(ErrorCode::UnknownMethod));
    }

    KJ_LOG(INFO, "host handling request", call.type.c_str(), call.id);

    std::string type = call.type;
    return invoke(it->second, call).catch_([type](kj::Exception&& exception) -> Json {
        std::string message = error_message(exception);
        KJ_LOG(INFO, "host request failed", type.c_str(), message.c_str());
        return error_response(message);
    });
}

kj::Promise<Json> PrivilegedHost::invoke(const Handler& handler, const ForwardedCall& call) {
    // kj::Exception first: kj's thrown exceptions also derive from std::exception.
    try {
        return handler(call);
    } catch (const kj::Exception& exception) {
        return kj::Exception(exception);
    } catch (const std::exception& exception) {
        return remote_error(exception.what());
    }
}

// -----------------------------------------------------------------------------
// GET_WALLET_ADDRESS
// -----------------------------------------------------------------------------

kj::Promise<Json> PrivilegedHost::get_wallet_address(const ForwardedCall&) {
    auto wallet = key_store_.load_wallet();
    if (!wallet) {
        return make_error(ErrorCode::NoWallet);
    }
    return Json{{"address", wallet->address}};
}

// -----------------------------------------------------------------------------
// SIGN_TRANSACTION
// -----------------------------------------------------------------------------

kj::Promise<Json> PrivilegedHost::sign_transaction(const ForwardedCall& call) {
    auto wallet = key_store_.load_wallet();

    UnsignedTransaction tx;
    try {
        tx = UnsignedTransaction::from_request(call.argument(0, "data"),
                                               wallet ? wallet->address : std::string());
    } catch (const TransactionError& e) {
        return make_error(ErrorCode::InvalidParams, e.what());
    }

    if (!wallet) {
        return make_error(ErrorCode::NoWallet);
    }

    tx.timestamp = now_seconds();
    tx.nonce = wb::utils::random_uniform(kNonceRange);

    return await_approval(call.id, tx.to_json()).then(
        [this, tx = std::move(tx), wallet = std::move(*wallet)](bool approved) -> kj::Promise<Json> {
            if (!approved) {
                return make_error(ErrorCode::UserRejected);
            }

            Json signed_tx = sign(tx, wallet);
            if (!broadcast_signed_) {
                return signed_tx;
            }
            return rpc_.send_transaction(signed_tx).then(
                [signed_tx](std::string hash) mutable -> Json {
                    signed_tx["hash"] = hash;
                    return signed_tx;
                });
        });
}

kj::Promise<bool> PrivilegedHost::await_approval(uint64_t correlation_id, const Json& transaction) {
    auto decision = confirmation_.request_approval(correlation_id, transaction);
    awaiting_.insert(correlation_id);

    auto expiry = timer_.afterDelay(confirmation_timeout_).then([]() -> kj::Promise<bool> {
        return make_error(ErrorCode::Timeout, "Confirmation timed out");
    });

    return decision.exclusiveJoin(kj::mv(expiry))
        .attach(kj::defer([this, correlation_id]() {
            finish_confirmation(correlation_id);
        }));
}

void PrivilegedHost::finish_confirmation(uint64_t correlation_id) {
    auto it = awaiting_.find(correlation_id);
    if (it != awaiting_.end()) {
        awaiting_.erase(it);
    }
}

Json PrivilegedHost::sign(const UnsignedTransaction& tx, const crypto::WalletRecord& wallet) const {
    wb::Bytes signature;
    try {
        signature = key_store_.sign(tx.digest(), wallet);
    } catch (const crypto::KeyStoreError& e) {
        kj::throwFatalException(remote_error(e.what()));
    }
    KJ_LOG(INFO, "signed transaction", tx.to.c_str());
    return make_signed_transaction(tx, signature, wallet.public_key_hex());
}

// -----------------------------------------------------------------------------
// GET_BALANCE
// -----------------------------------------------------------------------------

kj::Promise<Json> PrivilegedHost::get_balance(const ForwardedCall& call) {
    Json address = call.argument(0, "address");
    if (!address.is_string() || address.get<std::string>().empty()) {
        return make_error(ErrorCode::InvalidParams, "Missing address");
    }

    return rpc_.get_balance(address.get<std::string>()).then([](std::string balance) -> Json {
        return Json{{"balance", balance}};
    });
}

} // namespace protocol
