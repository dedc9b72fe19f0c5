#ifndef WB_PROTOCOL_TRANSACTION_HPP
#define WB_PROTOCOL_TRANSACTION_HPP

#include "envelope.hpp"
#include "../helpers.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>

namespace protocol {

using Bytes = wb::Bytes;

class TransactionError : public std::runtime_error {
public:
    explicit TransactionError(const std::string& msg) : std::runtime_error(msg) {}
};

// -----------------------------------------------------------------------------
// UnsignedTransaction - What the user approves and the wallet signs
// -----------------------------------------------------------------------------
struct UnsignedTransaction {
    std::string from;
    std::string to;
    std::string amount;    // Decimal string, kept verbatim
    std::string purpose;
    uint64_t    timestamp = 0;  // Unix seconds
    uint64_t    nonce = 0;

    Json to_json() const;

    // Length-prefixed canonical encoding of every field
    Bytes serialize_for_signing() const;

    // SHA-256 of serialize_for_signing()
    Bytes digest() const;

    /**
     * Build from a page-supplied request object {from?, to, amount, purpose?}.
     * `from` is always the signing wallet's address; a page-supplied
     * `from` naming any other address is refused. Amount may be a string
     * or a number. Throws TransactionError on a missing, mistyped or
     * mismatched field. Timestamp and nonce are left for the caller to fill.
     */
    static UnsignedTransaction from_request(const Json& request, const std::string& wallet_address);
};

// Unsigned fields plus "signature" and "publicKey" (both hex)
Json make_signed_transaction(const UnsignedTransaction& tx,
                             const Bytes& signature,
                             const std::string& public_key_hex);

} // namespace protocol

#endif // WB_PROTOCOL_TRANSACTION_HPP
