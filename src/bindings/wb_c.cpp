#include "wb/wb_c.h"
#include "../config.hpp"
#include "../helpers.hpp"
#include "../crypto/keystore.hpp"
#include "../protocol/channel.hpp"
#include "../protocol/client_proxy.hpp"
#include "../protocol/confirmation.hpp"
#include "../protocol/errors.hpp"
#include "../protocol/host.hpp"
#include "../protocol/relay.hpp"
#include "../protocol/rpc_client.hpp"

#include <kj/async.h>
#include <kj/debug.h>
#include <kj/timer.h>

#include <cstring>
#include <map>
#include <new>
#include <stdexcept>
#include <string>

using namespace protocol;

/*==============================================================================
 * Internal wrapper struct for the opaque handle
 *============================================================================*/

struct wb_bridge_t : private kj::TaskSet::ErrorHandler {
    struct Settled {
        bool        ok = false;
        std::string payload;  // Result JSON or error message
    };

    explicit wb_bridge_t(const wb::BridgeConfig& cfg)
        : config(cfg)
        , wait_scope(loop)
        , timer(kj::origin<kj::TimePoint>())
        , rpc(cfg.rpc_url)
        , host(key_store, rpc, confirmation, timer, cfg)
        , relay(channel, host)
        , proxy(channel, timer, cfg)
        , tasks(*this) {}

    void track(uint64_t ticket, kj::Promise<Json> promise) {
        tasks.add(promise.then(
            [this, ticket](Json value) {
                results[ticket] = Settled{true, value.dump()};
            },
            [this, ticket](kj::Exception&& exception) {
                results[ticket] = Settled{false, error_message(exception)};
            }));
    }

    void taskFailed(kj::Exception&& exception) override {
        KJ_LOG(ERROR, "bridge task failed", exception);
    }

    // Declaration order is teardown order in reverse: everything holding
    // promises goes before the timer and the loop.
    wb::BridgeConfig           config;
    kj::EventLoop              loop;
    kj::WaitScope              wait_scope;
    kj::TimerImpl              timer;
    MessageChannel             channel;
    crypto::LocalKeyStore      key_store;
    MockRpcClient              rpc;
    QueuedConfirmation         confirmation;
    PrivilegedHost             host;
    Relay                      relay;
    ClientProxy                proxy;
    std::map<uint64_t, Settled> results;
    kj::TaskSet                tasks;
};

/*==============================================================================
 * Helper functions
 *============================================================================*/

static char* copy_to_c_string(const std::string& str) {
    char* result = new char[str.size() + 1];
    std::memcpy(result, str.c_str(), str.size() + 1);
    return result;
}

template <typename Body>
static int guarded(const char* what, Body&& body) {
    try {
        return body();
    } catch (const wb::ConfigError& e) {
        KJ_LOG(WARNING, "C API call failed", what, e.what());
        return WB_ERR_PARSE;
    } catch (const nlohmann::json::exception& e) {
        KJ_LOG(WARNING, "C API call failed", what, e.what());
        return WB_ERR_PARSE;
    } catch (const crypto::KeyStoreError& e) {
        KJ_LOG(WARNING, "C API call failed", what, e.what());
        return WB_ERR_KEYSTORE;
    } catch (const std::bad_alloc&) {
        return WB_ERR;
    } catch (const kj::Exception& e) {
        KJ_LOG(ERROR, "C API call failed", what, e);
        return WB_ERR;
    } catch (const std::exception& e) {
        KJ_LOG(ERROR, "C API call failed", what, e.what());
        return WB_ERR;
    }
}

/*==============================================================================
 * Init / Utilities
 *============================================================================*/

int wb_init(void) {
    return guarded("wb_init", []() {
        wb::utils::ensure_sodium();
        return WB_OK;
    });
}

void wb_free_string(char* str) {
    delete[] str;
}

/*==============================================================================
 * Bridge lifecycle
 *============================================================================*/

int wb_bridge_new(const char* env_config, wb_bridge_t** out) {
    if (!out) return WB_ERR_INVALID_ARG;
    return guarded("wb_bridge_new", [&]() {
        wb::BridgeConfig config = env_config ? wb::BridgeConfig::from_env_string(env_config)
                                             : wb::BridgeConfig();
        config.apply_log_level();
        *out = new wb_bridge_t(config);
        return WB_OK;
    });
}

void wb_bridge_free(wb_bridge_t* bridge) {
    delete bridge;
}

/*==============================================================================
 * Wallet
 *============================================================================*/

int wb_bridge_create_wallet(wb_bridge_t* bridge, char** address_out) {
    if (!bridge || !address_out) return WB_ERR_INVALID_ARG;
    return guarded("wb_bridge_create_wallet", [&]() {
        auto record = bridge->key_store.create_wallet();
        *address_out = copy_to_c_string(record.address);
        return WB_OK;
    });
}

int wb_bridge_import_wallet(wb_bridge_t* bridge, const char* private_key_hex,
                            char** address_out) {
    if (!bridge || !private_key_hex || !address_out) return WB_ERR_INVALID_ARG;
    return guarded("wb_bridge_import_wallet", [&]() {
        auto record = bridge->key_store.import_private_key(private_key_hex);
        *address_out = copy_to_c_string(record.address);
        return WB_OK;
    });
}

/*==============================================================================
 * Requests
 *============================================================================*/

int wb_bridge_request(wb_bridge_t* bridge, const char* method,
                      const char* params_json, uint64_t* ticket_out) {
    if (!bridge || !method || !ticket_out) return WB_ERR_INVALID_ARG;
    return guarded("wb_bridge_request", [&]() {
        Json params = params_json ? Json::parse(params_json) : Json::array();
        if (!params.is_array()) return WB_ERR_INVALID_ARG;

        auto promise = bridge->proxy.request(method, std::move(params));
        uint64_t ticket = bridge->proxy.last_issued_id();
        bridge->track(ticket, kj::mv(promise));
        *ticket_out = ticket;
        return WB_OK;
    });
}

int wb_bridge_poll(wb_bridge_t* bridge) {
    if (!bridge) return WB_ERR_INVALID_ARG;
    return guarded("wb_bridge_poll", [&]() {
        bridge->wait_scope.poll();
        return WB_OK;
    });
}

int wb_bridge_advance(wb_bridge_t* bridge, uint64_t ms) {
    if (!bridge) return WB_ERR_INVALID_ARG;
    return guarded("wb_bridge_advance", [&]() {
        bridge->timer.advanceTo(bridge->timer.now() + static_cast<int64_t>(ms) * kj::MILLISECONDS);
        bridge->wait_scope.poll();
        return WB_OK;
    });
}

int wb_bridge_take_result(wb_bridge_t* bridge, uint64_t ticket, char** json_out) {
    if (!bridge || !json_out) return WB_ERR_INVALID_ARG;
    return guarded("wb_bridge_take_result", [&]() {
        auto it = bridge->results.find(ticket);
        if (it == bridge->results.end()) {
            bool issued = ticket > 0 && ticket <= bridge->proxy.last_issued_id();
            return issued && bridge->proxy.is_pending(ticket) ? WB_PENDING : WB_ERR_NOT_FOUND;
        }

        bool ok = it->second.ok;
        *json_out = copy_to_c_string(it->second.payload);
        bridge->results.erase(it);
        return ok ? WB_OK : WB_ERR_REJECTED;
    });
}

size_t wb_bridge_pending_count(const wb_bridge_t* bridge) {
    return bridge ? bridge->proxy.pending_count() : 0;
}

/*==============================================================================
 * Confirmation
 *============================================================================*/

int wb_bridge_pending_confirmations(wb_bridge_t* bridge, char** json_out) {
    if (!bridge || !json_out) return WB_ERR_INVALID_ARG;
    return guarded("wb_bridge_pending_confirmations", [&]() {
        Json list = Json::array();
        for (uint64_t id : bridge->confirmation.pending_ids()) {
            auto tx = bridge->confirmation.transaction(id);
            list.push_back(Json{{"id", id}, {"transaction", tx ? *tx : Json()}});
        }
        *json_out = copy_to_c_string(list.dump());
        return WB_OK;
    });
}

int wb_bridge_confirm(wb_bridge_t* bridge, uint64_t correlation_id, int approve) {
    if (!bridge) return WB_ERR_INVALID_ARG;
    return guarded("wb_bridge_confirm", [&]() {
        bool decided = approve ? bridge->confirmation.approve(correlation_id)
                               : bridge->confirmation.reject(correlation_id);
        return decided ? WB_OK : WB_ERR_NOT_FOUND;
    });
}
