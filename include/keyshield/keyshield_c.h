#ifndef KEYSHIELD_C_H
#define KEYSHIELD_C_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/*==============================================================================
 * Status codes
 *============================================================================*/
#define KEYSHIELD_OK                0
#define KEYSHIELD_ERR              -1
#define KEYSHIELD_ERR_INVALID_ARG  -2
#define KEYSHIELD_ERR_VERIFY_FAIL  -3
#define KEYSHIELD_ERR_PARSE        -4
#define KEYSHIELD_ERR_CHAIN        -5

#define KEYSHIELD_ACCOUNT_SIZE     32

/*==============================================================================
 * Opaque handles
 *============================================================================*/
typedef struct keyshield_maintenance_t keyshield_maintenance_t;

/*==============================================================================
 * Chain oracle callbacks
 *
 * Every callback returns KEYSHIELD_OK on success. Any other value is treated
 * as an infrastructure failure (unreachable node, timeout) and surfaces as
 * KEYSHIELD_ERR_CHAIN. Callbacks must bound their own running time.
 *============================================================================*/
typedef struct keyshield_chain_callbacks_t {
    void* ctx;

    /** Current finalized block height. */
    int (*current_block)(void* ctx, uint32_t* out_block);

    /** On-chain record of an asset. *found = 0 when the asset does not exist. */
    int (*nft_record)(void* ctx, uint32_t nft_id, int* found,
                      unsigned char owner[KEYSHIELD_ACCOUNT_SIZE],
                      int* is_secret, int* is_capsule);

    /** Current delegatee. *found = 0 when none. */
    int (*delegatee_of)(void* ctx, uint32_t nft_id, int* found,
                        unsigned char account[KEYSHIELD_ACCOUNT_SIZE]);

    /** Current rent-contract rentee. *found = 0 when none. */
    int (*rentee_of)(void* ctx, uint32_t nft_id, int* found,
                     unsigned char account[KEYSHIELD_ACCOUNT_SIZE]);
} keyshield_chain_callbacks_t;

/*==============================================================================
 * Init / Utilities
 *============================================================================*/

/** Initialize the library. Call once at process start. */
void keyshield_init(void);

/** Free a heap-allocated string returned by keyshield_* functions. */
void keyshield_free_string(char* str);

/**
 * Verify an sr25519 signature ("0x"-prefixed hex) over msg by an SS58 account.
 * Returns KEYSHIELD_OK if valid, KEYSHIELD_ERR_VERIFY_FAIL if not,
 * KEYSHIELD_ERR_PARSE for a malformed signature or account.
 */
int keyshield_sr25519_verify(const char* signature_hex,
                             const unsigned char* msg, size_t msg_len,
                             const char* ss58_account);

/*==============================================================================
 * Key-share requests
 *
 * nft_type is "secret-nft" or "capsule".
 * On KEYSHIELD_OK, *out_json holds the validated payload.
 * On KEYSHIELD_ERR_VERIFY_FAIL, KEYSHIELD_ERR_PARSE or KEYSHIELD_ERR_CHAIN,
 * *out_json holds the status report {status, nft_id, enclave_id, description}.
 * Free *out_json with keyshield_free_string.
 *============================================================================*/

/** Validated payload: {"nft_id", "keyshare", "block_number", "block_validation"} */
int keyshield_verify_store_request(const char* packet_json,
                                   const char* nft_type,
                                   const char* enclave_id,
                                   const keyshield_chain_callbacks_t* chain,
                                   char** out_json);

/** Validated payload: {"nft_id", "block_number", "block_validation"} */
int keyshield_verify_retrieve_request(const char* packet_json,
                                      const char* nft_type,
                                      const char* enclave_id,
                                      const keyshield_chain_callbacks_t* chain,
                                      char** out_json);

/*==============================================================================
 * Admin requests
 *============================================================================*/

int keyshield_maintenance_create(keyshield_maintenance_t** out);

/** Current maintenance message, empty when idle. */
int keyshield_maintenance_message(const keyshield_maintenance_t* m, char** out);

void keyshield_maintenance_destroy(keyshield_maintenance_t* m);

/**
 * Verify a bulk admin request. config_env uses the KEY=value admin config format.
 * On KEYSHIELD_OK, *out_json is {"admin", "nft_ids", "auth_token"}.
 * On KEYSHIELD_ERR_VERIFY_FAIL, *out_json is {"error": reason}.
 * KEYSHIELD_ERR_PARSE is returned for unparsable packet JSON or config.
 */
int keyshield_verify_admin_request(const char* packet_json,
                                   const char* config_env,
                                   const keyshield_chain_callbacks_t* chain,
                                   keyshield_maintenance_t* maintenance,
                                   char** out_json);

#ifdef __cplusplus
}
#endif

#endif /* KEYSHIELD_C_H */
