#include "config.hpp"

#include <kj/debug.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <sstream>

namespace wb {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

uint64_t parse_u64(const std::string& key, const std::string& value) {
    if (value.empty() || value[0] == '-') {
        throw ConfigError(key + ": expected a non-negative integer");
    }
    errno = 0;
    char* end = nullptr;
    unsigned long long v = std::strtoull(value.c_str(), &end, 10);
    if (errno != 0 || end == value.c_str() || *end != '\0') {
        throw ConfigError(key + ": expected a non-negative integer, got '" + value + "'");
    }
    return static_cast<uint64_t>(v);
}

bool parse_bool(const std::string& key, const std::string& value) {
    if (value == "1" || value == "true" || value == "yes") return true;
    if (value == "0" || value == "false" || value == "no") return false;
    throw ConfigError(key + ": expected a boolean, got '" + value + "'");
}

} // namespace

kj::LogSeverity parse_log_level(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug" || lower == "info") return kj::LogSeverity::INFO;
    if (lower == "warn" || lower == "warning") return kj::LogSeverity::WARNING;
    if (lower == "error") return kj::LogSeverity::ERROR;
    if (lower == "fatal") return kj::LogSeverity::FATAL;
    throw ConfigError("Unknown log level: " + name);
}

const char* log_level_name(kj::LogSeverity level) {
    switch (level) {
        case kj::LogSeverity::INFO:    return "info";
        case kj::LogSeverity::WARNING: return "warning";
        case kj::LogSeverity::ERROR:   return "error";
        case kj::LogSeverity::FATAL:   return "fatal";
        case kj::LogSeverity::DBG:     return "debug";
    }
    return "warning";
}

void BridgeConfig::apply_log_level() const {
    kj::_::Debug::setLogLevel(log_level);
}

std::string BridgeConfig::to_env_string() const {
    std::ostringstream oss;
    oss << "WB_CHAIN_ID=" << chain_id << "\n"
        << "WB_NETWORK_VERSION=" << network_version << "\n"
        << "WB_REQUEST_TIMEOUT_MS=" << request_timeout_ms << "\n"
        << "WB_CONFIRMATION_TIMEOUT_MS=" << confirmation_timeout_ms << "\n"
        << "WB_BROADCAST_SIGNED=" << (broadcast_signed ? "1" : "0") << "\n"
        << "WB_RPC_URL=" << rpc_url << "\n"
        << "WB_LOG_LEVEL=" << log_level_name(log_level) << "\n";
    return oss.str();
}

BridgeConfig BridgeConfig::from_env_string(const std::string& env_content) {
    BridgeConfig cfg;
    std::istringstream in(env_content);
    std::string line;
    std::size_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw ConfigError("line " + std::to_string(line_no) + ": expected KEY=value");
        }
        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));

        if (key == "WB_CHAIN_ID") {
            cfg.chain_id = value;
        } else if (key == "WB_NETWORK_VERSION") {
            cfg.network_version = value;
        } else if (key == "WB_REQUEST_TIMEOUT_MS") {
            cfg.request_timeout_ms = parse_u64(key, value);
        } else if (key == "WB_CONFIRMATION_TIMEOUT_MS") {
            cfg.confirmation_timeout_ms = parse_u64(key, value);
        } else if (key == "WB_BROADCAST_SIGNED") {
            cfg.broadcast_signed = parse_bool(key, value);
        } else if (key == "WB_RPC_URL") {
            cfg.rpc_url = value;
        } else if (key == "WB_LOG_LEVEL") {
            cfg.log_level = parse_log_level(value);
        }
    }

    if (cfg.request_timeout_ms == 0) {
        throw ConfigError("WB_REQUEST_TIMEOUT_MS must be greater than zero");
    }
    if (cfg.confirmation_timeout_ms > cfg.request_timeout_ms) {
        throw ConfigError("WB_CONFIRMATION_TIMEOUT_MS must not exceed WB_REQUEST_TIMEOUT_MS");
    }
    return cfg;
}

} // namespace wb
