#ifndef WB_C_H
#define WB_C_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/*==============================================================================
 * Status codes
 *============================================================================*/
#define WB_OK                 0
#define WB_PENDING            1
#define WB_ERR               -1
#define WB_ERR_INVALID_ARG   -2
#define WB_ERR_PARSE         -3
#define WB_ERR_REJECTED      -4
#define WB_ERR_NOT_FOUND     -5
#define WB_ERR_KEYSTORE      -6

/*==============================================================================
 * Opaque handles
 *============================================================================*/

/**
 * An in-process bridge: event loop, manual clock, page channel, relay,
 * privileged host (in-memory key store, mock RPC client, queued
 * confirmations) and the page client proxy.
 */
typedef struct wb_bridge_t wb_bridge_t;

/*==============================================================================
 * Init / Utilities
 *============================================================================*/

/** Initialize the library. Call once at process start. */
int wb_init(void);

/** Free a heap-allocated string returned by wb_* functions. */
void wb_free_string(char* str);

/*==============================================================================
 * Bridge lifecycle
 *============================================================================*/

/**
 * Create a bridge from environment variable format (KEY=value lines).
 * env_config may be NULL for defaults.
 */
int wb_bridge_new(const char* env_config, wb_bridge_t** out);

/** Destroy a bridge. Outstanding requests are dropped. */
void wb_bridge_free(wb_bridge_t* bridge);

/*==============================================================================
 * Wallet
 *============================================================================*/

/** Generate a wallet. Writes its address to *address_out. */
int wb_bridge_create_wallet(wb_bridge_t* bridge, char** address_out);

/** Import a hex private key (32-byte seed or 64-byte secret key). */
int wb_bridge_import_wallet(wb_bridge_t* bridge, const char* private_key_hex,
                            char** address_out);

/*==============================================================================
 * Requests
 *============================================================================*/

/**
 * Issue a request from the page side. params_json is a JSON array, or
 * NULL for none. The returned ticket is the request's correlation id.
 */
int wb_bridge_request(wb_bridge_t* bridge, const char* method,
                      const char* params_json, uint64_t* ticket_out);

/** Run every event that is ready without advancing the clock. */
int wb_bridge_poll(wb_bridge_t* bridge);

/** Advance the bridge clock by `ms` and run what became ready. */
int wb_bridge_advance(wb_bridge_t* bridge, uint64_t ms);

/**
 * Take a settled result.
 * WB_OK:           *json_out holds the result JSON.
 * WB_ERR_REJECTED: *json_out holds the error message.
 * WB_PENDING:      not settled yet, *json_out untouched.
 * WB_ERR_NOT_FOUND: unknown or already taken ticket.
 */
int wb_bridge_take_result(wb_bridge_t* bridge, uint64_t ticket, char** json_out);

/** Requests still waiting on the page side. */
size_t wb_bridge_pending_count(const wb_bridge_t* bridge);

/*==============================================================================
 * Confirmation
 *============================================================================*/

/**
 * JSON array of {"id": <correlation id>, "transaction": {...}} for every
 * signing request awaiting a decision.
 */
int wb_bridge_pending_confirmations(wb_bridge_t* bridge, char** json_out);

/** Approve (approve != 0) or reject a signing request. */
int wb_bridge_confirm(wb_bridge_t* bridge, uint64_t correlation_id, int approve);

#ifdef __cplusplus
}
#endif

#endif // WB_C_H
