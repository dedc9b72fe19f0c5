#include "helpers.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <sodium.h>

namespace wb {
namespace utils {

std::string bytes_to_hex(const Bytes& bytes) {
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (const auto& byte : bytes) ss << std::setw(2) << static_cast<int>(byte);
    return ss.str();
}

static int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

Bytes hex_to_bytes(const std::string& hex) {
    std::size_t start = 0;
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) start = 2;
    if ((hex.length() - start) % 2 != 0) throw std::invalid_argument("Hex string length must be even.");

    Bytes bytes;
    bytes.reserve((hex.length() - start) / 2);
    for (std::size_t i = start; i < hex.length(); i += 2) {
        int hi = hex_digit(hex[i]);
        int lo = hex_digit(hex[i + 1]);
        if (hi < 0 || lo < 0) throw std::invalid_argument("Invalid hex character.");
        bytes.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return bytes;
}

Bytes to_bytes(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

void append_u32_be(Bytes& out, uint32_t v) {
    out.push_back(uint8_t((v >> 24) & 0xFF));
    out.push_back(uint8_t((v >> 16) & 0xFF));
    out.push_back(uint8_t((v >>  8) & 0xFF));
    out.push_back(uint8_t((v >>  0) & 0xFF));
}

void append_u64_be(Bytes& out, uint64_t v) {
    append_u32_be(out, static_cast<uint32_t>(v >> 32));
    append_u32_be(out, static_cast<uint32_t>(v & 0xFFFFFFFFu));
}

void append_lp(Bytes& out, const Bytes& b) {
    append_u32_be(out, static_cast<uint32_t>(b.size()));
    out.insert(out.end(), b.begin(), b.end());
}

void append_lp(Bytes& out, const std::string& s) {
    append_u32_be(out, static_cast<uint32_t>(s.size()));
    out.insert(out.end(), s.begin(), s.end());
}

Bytes hash_all(std::initializer_list<Bytes> inputs) {
    crypto_hash_sha256_state state;
    crypto_hash_sha256_init(&state);

    for (const auto& input : inputs) {
        crypto_hash_sha256_update(&state, input.data(), input.size());
    }

    Bytes result(crypto_hash_sha256_BYTES);
    crypto_hash_sha256_final(&state, result.data());
    return result;
}

void ensure_sodium() {
    static const int rc = sodium_init();
    if (rc < 0) throw std::runtime_error("Failed to initialize libsodium");
}

Bytes random_bytes(std::size_t len) {
    ensure_sodium();
    Bytes out(len);
    randombytes_buf(out.data(), out.size());
    return out;
}

uint32_t random_uniform(uint32_t upper_bound) {
    ensure_sodium();
    return randombytes_uniform(upper_bound);
}

} // namespace utils
} // namespace wb
