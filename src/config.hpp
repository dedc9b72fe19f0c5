#ifndef WB_CONFIG_HPP
#define WB_CONFIG_HPP

#include <kj/exception.h>

#include <cstdint>
#include <stdexcept>
#include <string>

namespace wb {

// -----------------------------------------------------------------------------
// Error types
// -----------------------------------------------------------------------------
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

// -----------------------------------------------------------------------------
// BridgeConfig - Settings shared by the proxy, relay and host
// -----------------------------------------------------------------------------
struct BridgeConfig {
    // Values reported by getChainId() / getNetworkVersion()
    std::string chain_id        = "0x1d69";
    std::string network_version = "7529";

    // Page-side deadline for every request
    uint64_t request_timeout_ms = 30000;

    // Host-side limit on waiting for the user's decision when signing.
    // Never longer than request_timeout_ms, so nothing is signed after the
    // page has given up.
    uint64_t confirmation_timeout_ms = 25000;

    // Submit signed transactions through the RPC client
    bool broadcast_signed = false;

    std::string rpc_url = "http://localhost:8545";

    // Minimum severity passed through KJ_LOG
    kj::LogSeverity log_level = kj::LogSeverity::WARNING;

    // Install log_level as the process-wide KJ_LOG threshold
    void apply_log_level() const;

    // Serialize to environment variable format (KEY=value lines)
    std::string to_env_string() const;

    // Deserialize from environment variable format. Unknown keys are
    // ignored; malformed values and a confirmation timeout longer than
    // the request timeout throw ConfigError.
    static BridgeConfig from_env_string(const std::string& env_content);
};

// "info", "warning" (or "warn"), "error" or "fatal", case-insensitive.
// "debug" is accepted as the most verbose level, INFO.
kj::LogSeverity parse_log_level(const std::string& name);
const char* log_level_name(kj::LogSeverity level);

} // namespace wb

#endif // WB_CONFIG_HPP
