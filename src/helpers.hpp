#ifndef WB_HELPERS_HPP
#define WB_HELPERS_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <initializer_list>
#include <vector>

namespace wb {

using Bytes = std::vector<uint8_t>;

namespace utils {

    // Hex helpers (hex_to_bytes accepts an optional 0x prefix)
    std::string bytes_to_hex(const Bytes& bytes);
    Bytes hex_to_bytes(const std::string& hex);

    // Generic serialization primitives
    Bytes to_bytes(const std::string& s);

    void append_u32_be(Bytes& out, uint32_t v);
    void append_u64_be(Bytes& out, uint64_t v);

    void append_lp(Bytes& out, const Bytes& b);
    void append_lp(Bytes& out, const std::string& s);

    // Hash utilities (SHA-256)
    Bytes hash_all(std::initializer_list<Bytes> inputs);

    // Initialise libsodium once; throws std::runtime_error on failure.
    void ensure_sodium();

    // Random helpers (libsodium)
    Bytes random_bytes(std::size_t len);
    uint32_t random_uniform(uint32_t upper_bound);

} // namespace utils
} // namespace wb

#endif // WB_HELPERS_HPP
