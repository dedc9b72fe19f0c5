#include <catch2/catch_test_macros.hpp>
#include "crypto/keystore.hpp"
#include "helpers.hpp"

#include <regex>
#include <string>

using crypto::KeyStoreError;
using crypto::LocalKeyStore;
using wb::Bytes;
using namespace wb::utils;

static const std::string kSeedHex =
    "0x9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60";

TEST_CASE("LocalKeyStore wallets", "[crypto][keystore]") {
    LocalKeyStore store;

    SECTION("starts without a wallet") {
        REQUIRE_FALSE(store.has_wallet());
        REQUIRE_FALSE(store.load_wallet().has_value());
    }

    SECTION("create_wallet stores an Ed25519 key pair") {
        auto record = store.create_wallet();
        REQUIRE(store.has_wallet());
        REQUIRE(record.public_key.size() == 32);
        REQUIRE(record.private_key.size() == 64);
        REQUIRE(record.created_at > 0);

        std::regex address_pattern("0x[0-9a-f]{40}");
        REQUIRE(std::regex_match(record.address, address_pattern));
        REQUIRE(record.address == LocalKeyStore::address_from_public_key(record.public_key));
        REQUIRE(store.load_wallet()->address == record.address);
    }

    SECTION("the address is the first 40 hex chars of SHA-256(public key)") {
        auto record = store.create_wallet();
        std::string digest = bytes_to_hex(hash_all({record.public_key}));
        REQUIRE(record.address == "0x" + digest.substr(0, 40));
    }

    SECTION("importing a seed is deterministic") {
        auto a = store.import_private_key(kSeedHex);
        auto b = store.import_private_key(kSeedHex.substr(2));
        REQUIRE(a.address == b.address);
        // RFC 8032 test vector 1
        REQUIRE(a.public_key_hex() ==
                "d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a");
    }

    SECTION("a 64-byte secret key imports to the same wallet as its seed") {
        auto from_seed = store.import_private_key(kSeedHex);
        auto from_full = store.import_private_key(bytes_to_hex(from_seed.private_key));
        REQUIRE(from_full.public_key == from_seed.public_key);
        REQUIRE(from_full.address == from_seed.address);
    }

    SECTION("bad private keys throw KeyStoreError") {
        REQUIRE_THROWS_AS(store.import_private_key("not hex"), KeyStoreError);
        REQUIRE_THROWS_AS(store.import_private_key("abcd"), KeyStoreError);
        REQUIRE_FALSE(store.has_wallet());
    }

    SECTION("clear forgets the wallet") {
        store.create_wallet();
        store.clear();
        REQUIRE_FALSE(store.has_wallet());
    }
}

TEST_CASE("LocalKeyStore signing", "[crypto][keystore]") {
    LocalKeyStore store;
    auto wallet = store.create_wallet();
    Bytes digest = hash_all({to_bytes("transfer 1000")});

    SECTION("signatures verify against the wallet's public key") {
        Bytes sig = store.sign(digest, wallet);
        REQUIRE(sig.size() == 64);
        REQUIRE(LocalKeyStore::verify(digest, sig, wallet.public_key));
    }

    SECTION("a different digest or key does not verify") {
        Bytes sig = store.sign(digest, wallet);
        Bytes other = hash_all({to_bytes("transfer 1001")});
        REQUIRE_FALSE(LocalKeyStore::verify(other, sig, wallet.public_key));

        LocalKeyStore second;
        auto stranger = second.create_wallet();
        REQUIRE_FALSE(LocalKeyStore::verify(digest, sig, stranger.public_key));
        REQUIRE_FALSE(LocalKeyStore::verify(digest, Bytes(10, 0), wallet.public_key));
    }

    SECTION("unusable key material throws") {
        auto broken = wallet;
        broken.private_key.resize(10);
        REQUIRE_THROWS_AS(store.sign(digest, broken), KeyStoreError);
    }
}
