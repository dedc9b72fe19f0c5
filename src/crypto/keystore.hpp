#ifndef WB_CRYPTO_KEYSTORE_HPP
#define WB_CRYPTO_KEYSTORE_HPP

#include "../helpers.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

namespace crypto {

using Bytes = wb::Bytes;

// -----------------------------------------------------------------------------
// Error types
// -----------------------------------------------------------------------------
class KeyStoreError : public std::runtime_error {
public:
    explicit KeyStoreError(const std::string& msg) : std::runtime_error(msg) {}
};

// -----------------------------------------------------------------------------
// WalletRecord - Stored wallet material
// -----------------------------------------------------------------------------
struct WalletRecord {
    std::string address;      // 0x + first 40 hex chars of SHA-256(public_key)
    Bytes       public_key;
    Bytes       private_key;
    uint64_t    created_at = 0;  // Unix milliseconds

    std::string public_key_hex() const;
};

// -----------------------------------------------------------------------------
// WalletKeyStore - Capability contract consumed by the privileged host
// -----------------------------------------------------------------------------
class WalletKeyStore {
public:
    virtual ~WalletKeyStore() = default;

    virtual bool has_wallet() const = 0;

    // nullopt means no wallet is configured.
    virtual std::optional<WalletRecord> load_wallet() const = 0;

    // Opaque signature over `digest`. Throws KeyStoreError if the wallet's
    // material is unusable.
    virtual Bytes sign(const Bytes& digest, const WalletRecord& wallet) const = 0;
};

// -----------------------------------------------------------------------------
// LocalKeyStore - In-memory Ed25519 key store (libsodium)
// -----------------------------------------------------------------------------
class LocalKeyStore : public WalletKeyStore {
public:
    LocalKeyStore();

    bool has_wallet() const override;
    std::optional<WalletRecord> load_wallet() const override;
    Bytes sign(const Bytes& digest, const WalletRecord& wallet) const override;

    /**
     * Generate a fresh Ed25519 key pair and store it, replacing any
     * existing wallet.
     */
    WalletRecord create_wallet();

    /**
     * Import a hex private key: a 32-byte seed or a 64-byte libsodium
     * secret key. An optional 0x prefix is accepted.
     */
    WalletRecord import_private_key(const std::string& private_key_hex);

    void clear();

    static bool verify(const Bytes& digest, const Bytes& signature, const Bytes& public_key);
    static std::string address_from_public_key(const Bytes& public_key);

private:
    WalletRecord store(Bytes public_key, Bytes private_key);

    mutable std::mutex mu_;
    std::optional<WalletRecord> wallet_;
};

} // namespace crypto

#endif // WB_CRYPTO_KEYSTORE_HPP
