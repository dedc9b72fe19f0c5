#include "transaction.hpp"

#include <algorithm>
#include <cctype>

namespace protocol {

using namespace wb::utils;

static const char* kSigningDomain = "walletbridge/tx/v1";

Json UnsignedTransaction::to_json() const {
    return Json{
        {"from", from},
        {"to", to},
        {"amount", amount},
        {"purpose", purpose},
        {"timestamp", timestamp},
        {"nonce", nonce}
    };
}

Bytes UnsignedTransaction::serialize_for_signing() const {
    Bytes out;
    append_lp(out, std::string(kSigningDomain));
    append_lp(out, from);
    append_lp(out, to);
    append_lp(out, amount);
    append_lp(out, purpose);
    append_u64_be(out, timestamp);
    append_u64_be(out, nonce);
    return out;
}

Bytes UnsignedTransaction::digest() const {
    return hash_all({serialize_for_signing()});
}

// Hex addresses compare case-insensitively.
static bool same_address(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

static std::string amount_string(const Json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number_unsigned()) {
        return std::to_string(value.get<uint64_t>());
    }
    if (value.is_number_integer()) {
        if (value.get<int64_t>() < 0) throw TransactionError("Amount must not be negative");
        return std::to_string(value.get<int64_t>());
    }
    if (value.is_number_float()) {
        if (value.get<double>() < 0) throw TransactionError("Amount must not be negative");
        return value.dump();
    }
    throw TransactionError("Amount must be a string or a number");
}

UnsignedTransaction UnsignedTransaction::from_request(const Json& request,
                                                      const std::string& wallet_address) {
    if (!request.is_object()) {
        throw TransactionError("Transaction must be an object");
    }

    UnsignedTransaction tx;

    auto to = request.find("to");
    if (to == request.end() || !to->is_string() || to->get<std::string>().empty()) {
        throw TransactionError("Missing recipient");
    }
    tx.to = to->get<std::string>();

    auto amount = request.find("amount");
    if (amount == request.end() || amount->is_null()) {
        throw TransactionError("Missing amount");
    }
    tx.amount = amount_string(*amount);
    if (tx.amount.empty()) {
        throw TransactionError("Missing amount");
    }

    auto from = request.find("from");
    if (from != request.end() && !from->is_null()) {
        if (!from->is_string()) {
            throw TransactionError("Sender must be a string");
        }
        const std::string claimed = from->get<std::string>();
        if (!claimed.empty() && !same_address(claimed, wallet_address)) {
            throw TransactionError("Sender does not match the wallet address");
        }
    }
    tx.from = wallet_address;

    auto purpose = request.find("purpose");
    if (purpose != request.end() && purpose->is_string()) {
        tx.purpose = purpose->get<std::string>();
    }

    return tx;
}

Json make_signed_transaction(const UnsignedTransaction& tx,
                             const Bytes& signature,
                             const std::string& public_key_hex) {
    Json out = tx.to_json();
    out["signature"] = bytes_to_hex(signature);
    out["publicKey"] = public_key_hex;
    return out;
}

} // namespace protocol
