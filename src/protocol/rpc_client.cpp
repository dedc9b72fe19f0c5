#include "rpc_client.hpp"
#include "errors.hpp"
#include "../helpers.hpp"
#include <kj/debug.h>

#include <utility>

namespace protocol {

MockRpcClient::MockRpcClient(std::string url) : url_(std::move(url)) {}

kj::Promise<std::string> MockRpcClient::get_balance(const std::string& address) {
    ++calls_;
    if (failure_) {
        return make_error(ErrorCode::NetworkError, *failure_);
    }
    KJ_LOG(INFO, "rpc balance query", url_.c_str(), address.c_str());
    return std::string(balance_);
}

kj::Promise<std::string> MockRpcClient::send_transaction(const Json& signed_tx) {
    ++calls_;
    if (failure_) {
        return make_error(ErrorCode::NetworkError, *failure_);
    }
    last_submitted_ = signed_tx;
    std::string hash = "0x" + wb::utils::bytes_to_hex(wb::utils::random_bytes(32));
    KJ_LOG(INFO, "rpc submitted transaction", url_.c_str(), hash.c_str());
    return hash;
}

} // namespace protocol
