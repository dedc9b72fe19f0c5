#include "keystore.hpp"
#include <kj/debug.h>

#include <sodium.h>
#include <chrono>

namespace crypto {

using wb::utils::bytes_to_hex;
using wb::utils::hex_to_bytes;
using wb::utils::hash_all;

static uint64_t now_millis() {
    auto now = std::chrono::system_clock::now();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count());
}

std::string WalletRecord::public_key_hex() const {
    return bytes_to_hex(public_key);
}

// -----------------------------------------------------------------------------
// LocalKeyStore implementation
// -----------------------------------------------------------------------------

LocalKeyStore::LocalKeyStore() {
    wb::utils::ensure_sodium();
}

bool LocalKeyStore::has_wallet() const {
    std::lock_guard<std::mutex> lock(mu_);
    return wallet_.has_value();
}

std::optional<WalletRecord> LocalKeyStore::load_wallet() const {
    std::lock_guard<std::mutex> lock(mu_);
    return wallet_;
}

Bytes LocalKeyStore::sign(const Bytes& digest, const WalletRecord& wallet) const {
    if (wallet.private_key.size() != crypto_sign_SECRETKEYBYTES) {
        throw KeyStoreError("Wallet private key has the wrong length");
    }

    Bytes signature(crypto_sign_BYTES);
    unsigned long long sig_len = 0;
    if (crypto_sign_detached(signature.data(), &sig_len,
                             digest.data(), digest.size(),
                             wallet.private_key.data()) != 0) {
        throw KeyStoreError("Signing failed");
    }
    signature.resize(static_cast<std::size_t>(sig_len));
    return signature;
}

WalletRecord LocalKeyStore::create_wallet() {
    Bytes pk(crypto_sign_PUBLICKEYBYTES);
    Bytes sk(crypto_sign_SECRETKEYBYTES);
    crypto_sign_keypair(pk.data(), sk.data());
    return store(std::move(pk), std::move(sk));
}

WalletRecord LocalKeyStore::import_private_key(const std::string& private_key_hex) {
    Bytes raw;
    try {
        raw = hex_to_bytes(private_key_hex);
    } catch (const std::invalid_argument& e) {
        throw KeyStoreError(std::string("Invalid private key: ") + e.what());
    }

    Bytes pk(crypto_sign_PUBLICKEYBYTES);
    Bytes sk(crypto_sign_SECRETKEYBYTES);

    if (raw.size() == crypto_sign_SEEDBYTES) {
        crypto_sign_seed_keypair(pk.data(), sk.data(), raw.data());
    } else if (raw.size() == crypto_sign_SECRETKEYBYTES) {
        sk = raw;
        crypto_sign_ed25519_sk_to_pk(pk.data(), sk.data());
    } else {
        sodium_memzero(raw.data(), raw.size());
        throw KeyStoreError("Private key must be 32 or 64 bytes");
    }

    sodium_memzero(raw.data(), raw.size());
    return store(std::move(pk), std::move(sk));
}

void LocalKeyStore::clear() {
    std::lock_guard<std::mutex> lock(mu_);
    if (wallet_) {
        sodium_memzero(wallet_->private_key.data(), wallet_->private_key.size());
    }
    wallet_.reset();
}

WalletRecord LocalKeyStore::store(Bytes public_key, Bytes private_key) {
    WalletRecord record;
    record.address = address_from_public_key(public_key);
    record.public_key = std::move(public_key);
    record.private_key = std::move(private_key);
    record.created_at = now_millis();

    std::lock_guard<std::mutex> lock(mu_);
    wallet_ = record;
    KJ_LOG(INFO, "stored wallet", record.address.c_str());
    return record;
}

bool LocalKeyStore::verify(const Bytes& digest, const Bytes& signature, const Bytes& public_key) {
    if (signature.size() != crypto_sign_BYTES) return false;
    if (public_key.size() != crypto_sign_PUBLICKEYBYTES) return false;
    return crypto_sign_verify_detached(signature.data(),
                                       digest.data(), digest.size(),
                                       public_key.data()) == 0;
}

std::string LocalKeyStore::address_from_public_key(const Bytes& public_key) {
    std::string hex = bytes_to_hex(hash_all({public_key}));
    return "0x" + hex.substr(0, 40);
}

} // namespace crypto
