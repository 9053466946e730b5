#ifndef GRPSIG_C_H
#define GRPSIG_C_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/*==============================================================================
 * Status codes
 *============================================================================*/
#define GRPSIG_OK                0
#define GRPSIG_ERR              -1
#define GRPSIG_ERR_INVALID_ARG  -2
#define GRPSIG_ERR_VERIFY_FAIL  -3
#define GRPSIG_ERR_ALLOC        -4
#define GRPSIG_ERR_PARSE        -5
#define GRPSIG_ERR_PROTOCOL     -6
#define GRPSIG_ERR_NOT_FOUND    -7
#define GRPSIG_ERR_UNSUPPORTED  -8
#define GRPSIG_ERR_MISSING_KEY  -9

/*==============================================================================
 * Key kinds (grpsig_export_key)
 *============================================================================*/
#define GRPSIG_KEY_GROUP       0
#define GRPSIG_KEY_MANAGER     1
#define GRPSIG_KEY_REVMANAGER  2
#define GRPSIG_KEY_MEMBER      3

/*==============================================================================
 * Opaque handles
 *============================================================================*/
typedef struct grpsig_scheme_t grpsig_scheme_t;

/*==============================================================================
 * Init / Utilities
 *============================================================================*/

/** Initialize the library. Call once at process start. */
int grpsig_init(void);

/** Free a heap-allocated string returned by grpsig_* functions. */
void grpsig_free_string(char* str);

/** Free a heap-allocated byte buffer returned by grpsig_* functions. */
void grpsig_free_bytes(unsigned char* buf);

/** Set the level of every logger: "trace", "debug", "info", "warn", "error", "off". */
int grpsig_set_log_level(const char* level);

/*==============================================================================
 * Scheme lifecycle
 *============================================================================*/

/** Create a scheme instance by name ("cpy06") with in-memory GML and CRL. */
int grpsig_scheme_create(const char* name, grpsig_scheme_t** out);

void grpsig_scheme_destroy(grpsig_scheme_t* scheme);

/** Generate fresh group, manager and revocation manager keys. */
int grpsig_setup(grpsig_scheme_t* scheme);

/** Export a key held by this instance as an envelope string. */
int grpsig_export_key(const grpsig_scheme_t* scheme, int kind, char** out);

/** Import a key envelope ("<scheme>:<kind>:<base64>"). */
int grpsig_import_key(grpsig_scheme_t* scheme, const char* envelope);

/** Apply a KEY=value configuration (see grpsig::Config). */
int grpsig_apply_config(grpsig_scheme_t* scheme, const char* env_content);

/*==============================================================================
 * Join
 *============================================================================*/

/**
 * Manager side. Pass msg = NULL to open a new join; otherwise pass the
 * member's message. The next message is written to *out.
 */
int grpsig_join_mgr(grpsig_scheme_t* scheme,
                    const unsigned char* msg, size_t msg_len,
                    unsigned char** out, size_t* out_len);

/**
 * Member side. Either *out receives the next message for the manager, or the
 * join is complete and *member_key receives the member key envelope (the other
 * output is set to NULL).
 */
int grpsig_join_mem(grpsig_scheme_t* scheme,
                    const unsigned char* msg, size_t msg_len,
                    unsigned char** out, size_t* out_len,
                    char** member_key);

/** Drop the pending join session that `msg` (any join message) belongs to. */
int grpsig_join_abort(grpsig_scheme_t* scheme, const unsigned char* msg, size_t msg_len);

/*==============================================================================
 * Sign / Verify
 *============================================================================*/

/** Sign with `member_key`, or with the imported member key if it is NULL. */
int grpsig_sign(grpsig_scheme_t* scheme,
                const unsigned char* msg, size_t msg_len,
                const char* member_key,
                char** out_signature);

/** *out_valid is 1 for a valid signature, 0 otherwise. */
int grpsig_verify(grpsig_scheme_t* scheme,
                  const unsigned char* msg, size_t msg_len,
                  const char* signature,
                  int* out_valid);

/*==============================================================================
 * Open / Reveal / Trace
 *============================================================================*/

/** Group Manager's opening partial. */
int grpsig_open_gm(grpsig_scheme_t* scheme, const char* signature, char** out_partial);

/** Revocation Manager's opening partial; requires the GM partial. */
int grpsig_open_rm(grpsig_scheme_t* scheme, const char* signature,
                   const char* gm_partial, char** out_partial);

/** Combine both partials; *out_member_id receives the GML id. */
int grpsig_open_combine(grpsig_scheme_t* scheme, const char* signature,
                        const char* gm_partial, const char* rm_partial,
                        char** out_member_id);

int grpsig_reveal(grpsig_scheme_t* scheme, const char* member_id);

/** *out_revoked is 1 if the signer is on the CRL. */
int grpsig_trace(grpsig_scheme_t* scheme, const char* signature, int* out_revoked);

/*==============================================================================
 * Claim
 *============================================================================*/

int grpsig_claim(grpsig_scheme_t* scheme, const char* signature,
                 const char* member_key, char** out_proof);

int grpsig_claim_verify(grpsig_scheme_t* scheme, const char* signature,
                        const char* proof, int* out_valid);

#ifdef __cplusplus
}
#endif

#endif /* GRPSIG_C_H */
