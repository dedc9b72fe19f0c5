#ifndef WB_PROTOCOL_RPC_CLIENT_HPP
#define WB_PROTOCOL_RPC_CLIENT_HPP

#include "envelope.hpp"

#include <kj/async.h>

#include <cstdint>
#include <optional>
#include <string>

namespace protocol {

// -----------------------------------------------------------------------------
// RpcClient - Chain node access used by the privileged host
//
// Failures reject with a NetworkError whose description is the message
// to report.
// -----------------------------------------------------------------------------
class RpcClient {
public:
    virtual ~RpcClient() = default;

    virtual kj::Promise<std::string> get_balance(const std::string& address) = 0;

    // Returns the transaction hash.
    virtual kj::Promise<std::string> send_transaction(const Json& signed_tx) = 0;
};

// -----------------------------------------------------------------------------
// MockRpcClient - Development data, no network
// -----------------------------------------------------------------------------
class MockRpcClient : public RpcClient {
public:
    explicit MockRpcClient(std::string url = "http://localhost:8545");

    kj::Promise<std::string> get_balance(const std::string& address) override;
    kj::Promise<std::string> send_transaction(const Json& signed_tx) override;

    void set_balance(std::string balance) { balance_ = std::move(balance); }

    // Every call rejects with `message` until cleared with nullopt.
    void set_failure(std::optional<std::string> message) { failure_ = std::move(message); }

    const std::string& url() const { return url_; }
    uint64_t call_count() const { return calls_; }
    const std::optional<Json>& last_submitted() const { return last_submitted_; }

private:
    std::string url_;
    std::string balance_ = "1000000000000000000000";
    std::optional<std::string> failure_;
    std::optional<Json> last_submitted_;
    uint64_t calls_ = 0;
};

} // namespace protocol

#endif // WB_PROTOCOL_RPC_CLIENT_HPP
