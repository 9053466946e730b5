#include "grpsig/grpsig_c.h"
#include "../groupsig/scheme.hpp"
#include "../crypto/ecgroup.hpp"
#include "../config.hpp"
#include "../logging.hpp"

#include <sodium.h>

#include <cstring>
#include <memory>
#include <new>
#include <optional>
#include <string>

using ecgroup::Bytes;
using grpsig::ErrorCode;
using grpsig::ObjectKind;

/*==============================================================================
 * Internal wrapper structs for opaque handles
 *============================================================================*/

struct grpsig_scheme_t {
    std::unique_ptr<grpsig::Scheme> scheme;
};

/*==============================================================================
 * Helper functions
 *============================================================================*/

static char* copy_to_c_string(const std::string& str) {
    char* result = new char[str.size() + 1];
    std::memcpy(result, str.c_str(), str.size() + 1);
    return result;
}

static void copy_to_c_bytes(const Bytes& vec, unsigned char** out, size_t* out_len) {
    *out_len = vec.size();
    if (vec.empty()) {
        *out = nullptr;
        return;
    }
    *out = new unsigned char[*out_len];
    std::memcpy(*out, vec.data(), *out_len);
}

static Bytes to_bytes(const unsigned char* buf, size_t len) {
    if (!buf) return Bytes();
    return Bytes(buf, buf + len);
}

static int status_to_rc(const grpsig::Status& st) {
    switch (st.code()) {
        case ErrorCode::Ok:           return GRPSIG_OK;
        case ErrorCode::Protocol:     return GRPSIG_ERR_PROTOCOL;
        case ErrorCode::Verification: return GRPSIG_ERR_VERIFY_FAIL;
        case ErrorCode::NotFound:     return GRPSIG_ERR_NOT_FOUND;
        case ErrorCode::Unsupported:  return GRPSIG_ERR_UNSUPPORTED;
        case ErrorCode::MissingKey:   return GRPSIG_ERR_MISSING_KEY;
    }
    return GRPSIG_ERR;
}

static grpsig::logging::Logger& logger() {
    static grpsig::logging::Logger l = grpsig::logging::get_logger("grpsig.c");
    return l;
}

// Runs `fn` and maps exceptions to status codes.
template <typename Fn>
static int guarded(const char* op, Fn&& fn) {
    try {
        return fn();
    } catch (const ecgroup::DecodeError& e) {
        LOG_DEBUG(logger(), op << ": " << e.what());
        return GRPSIG_ERR_PARSE;
    } catch (const grpsig::ConfigError& e) {
        LOG_DEBUG(logger(), op << ": " << e.what());
        return GRPSIG_ERR_PARSE;
    } catch (const std::invalid_argument& e) {
        LOG_DEBUG(logger(), op << ": " << e.what());
        return GRPSIG_ERR_INVALID_ARG;
    } catch (const std::bad_alloc&) {
        return GRPSIG_ERR_ALLOC;
    } catch (const std::exception& e) {
        LOG_ERROR(logger(), op << ": " << e.what());
        return GRPSIG_ERR;
    }
}

template <typename T>
static int emit_string(const grpsig::Outcome<T>& result, char** out) {
    if (!result.ok()) return status_to_rc(result.status());
    *out = copy_to_c_string(result.value());
    return GRPSIG_OK;
}

/*==============================================================================
 * Init / Utilities
 *============================================================================*/

int grpsig_init(void) {
    if (sodium_init() < 0) return GRPSIG_ERR;
    return guarded("grpsig_init", [] {
        ecgroup::init_pairing();
        return GRPSIG_OK;
    });
}

void grpsig_free_string(char* str) {
    delete[] str;
}

void grpsig_free_bytes(unsigned char* buf) {
    delete[] buf;
}

int grpsig_set_log_level(const char* level) {
    if (!level) return GRPSIG_ERR_INVALID_ARG;
    return guarded("grpsig_set_log_level", [&] {
        grpsig::logging::set_log_level(level);
        return GRPSIG_OK;
    });
}

/*==============================================================================
 * Scheme lifecycle
 *============================================================================*/

int grpsig_scheme_create(const char* name, grpsig_scheme_t** out) {
    if (!name || !out) return GRPSIG_ERR_INVALID_ARG;
    return guarded("grpsig_scheme_create", [&] {
        auto handle = std::make_unique<grpsig_scheme_t>();
        handle->scheme = grpsig::make_scheme(grpsig::scheme_from_name(name));
        *out = handle.release();
        return GRPSIG_OK;
    });
}

void grpsig_scheme_destroy(grpsig_scheme_t* scheme) {
    delete scheme;
}

int grpsig_setup(grpsig_scheme_t* scheme) {
    if (!scheme) return GRPSIG_ERR_INVALID_ARG;
    return guarded("grpsig_setup", [&] {
        scheme->scheme->setup();
        return GRPSIG_OK;
    });
}

int grpsig_export_key(const grpsig_scheme_t* scheme, int kind, char** out) {
    if (!scheme || !out) return GRPSIG_ERR_INVALID_ARG;
    if (kind < GRPSIG_KEY_GROUP || kind > GRPSIG_KEY_MEMBER) return GRPSIG_ERR_INVALID_ARG;
    return guarded("grpsig_export_key", [&] {
        return emit_string(scheme->scheme->export_key(static_cast<ObjectKind>(kind)), out);
    });
}

int grpsig_import_key(grpsig_scheme_t* scheme, const char* envelope) {
    if (!scheme || !envelope) return GRPSIG_ERR_INVALID_ARG;
    return guarded("grpsig_import_key", [&] {
        scheme->scheme->import_key(envelope);
        return GRPSIG_OK;
    });
}

int grpsig_apply_config(grpsig_scheme_t* scheme, const char* env_content) {
    if (!scheme || !env_content) return GRPSIG_ERR_INVALID_ARG;
    return guarded("grpsig_apply_config", [&] {
        grpsig::Config::from_env_string(env_content).apply(*scheme->scheme);
        return GRPSIG_OK;
    });
}

/*==============================================================================
 * Join
 *============================================================================*/

int grpsig_join_mgr(grpsig_scheme_t* scheme,
                    const unsigned char* msg, size_t msg_len,
                    unsigned char** out, size_t* out_len) {
    if (!scheme || !out || !out_len) return GRPSIG_ERR_INVALID_ARG;
    return guarded("grpsig_join_mgr", [&] {
        std::optional<grpsig::JoinMessage> in;
        if (msg) in = grpsig::JoinMessage::from_bytes(to_bytes(msg, msg_len));

        auto result = scheme->scheme->join_mgr(in);
        if (!result.ok()) return status_to_rc(result.status());
        copy_to_c_bytes(result.value().to_bytes(), out, out_len);
        return GRPSIG_OK;
    });
}

int grpsig_join_mem(grpsig_scheme_t* scheme,
                    const unsigned char* msg, size_t msg_len,
                    unsigned char** out, size_t* out_len,
                    char** member_key) {
    if (!scheme || !msg || !out || !out_len || !member_key) return GRPSIG_ERR_INVALID_ARG;
    return guarded("grpsig_join_mem", [&] {
        auto in = grpsig::JoinMessage::from_bytes(to_bytes(msg, msg_len));
        auto result = scheme->scheme->join_mem(in);
        if (!result.ok()) return status_to_rc(result.status());

        const grpsig::JoinReply& reply = result.value();
        *out = nullptr;
        *out_len = 0;
        *member_key = nullptr;
        if (reply.next) copy_to_c_bytes(reply.next->to_bytes(), out, out_len);
        if (reply.done()) *member_key = copy_to_c_string(reply.member_key);
        return GRPSIG_OK;
    });
}

int grpsig_join_abort(grpsig_scheme_t* scheme, const unsigned char* msg, size_t msg_len) {
    if (!scheme || !msg) return GRPSIG_ERR_INVALID_ARG;
    return guarded("grpsig_join_abort", [&] {
        auto in = grpsig::JoinMessage::from_bytes(to_bytes(msg, msg_len));
        return status_to_rc(scheme->scheme->join_abort(in));
    });
}

/*==============================================================================
 * Sign / Verify
 *============================================================================*/

int grpsig_sign(grpsig_scheme_t* scheme,
                const unsigned char* msg, size_t msg_len,
                const char* member_key,
                char** out_signature) {
    if (!scheme || (!msg && msg_len > 0) || !out_signature) return GRPSIG_ERR_INVALID_ARG;
    return guarded("grpsig_sign", [&] {
        Bytes m = to_bytes(msg, msg_len);
        if (member_key) return emit_string(scheme->scheme->sign(m, member_key), out_signature);
        return emit_string(scheme->scheme->sign(m), out_signature);
    });
}

int grpsig_verify(grpsig_scheme_t* scheme,
                  const unsigned char* msg, size_t msg_len,
                  const char* signature,
                  int* out_valid) {
    if (!scheme || (!msg && msg_len > 0) || !signature || !out_valid) return GRPSIG_ERR_INVALID_ARG;
    return guarded("grpsig_verify", [&] {
        *out_valid = scheme->scheme->verify(to_bytes(msg, msg_len), signature) ? 1 : 0;
        return GRPSIG_OK;
    });
}

/*==============================================================================
 * Open / Reveal / Trace
 *============================================================================*/

int grpsig_open_gm(grpsig_scheme_t* scheme, const char* signature, char** out_partial) {
    if (!scheme || !signature || !out_partial) return GRPSIG_ERR_INVALID_ARG;
    return guarded("grpsig_open_gm", [&] {
        return emit_string(scheme->scheme->open(signature), out_partial);
    });
}

int grpsig_open_rm(grpsig_scheme_t* scheme, const char* signature,
                   const char* gm_partial, char** out_partial) {
    if (!scheme || !signature || !gm_partial || !out_partial) return GRPSIG_ERR_INVALID_ARG;
    return guarded("grpsig_open_rm", [&] {
        return emit_string(scheme->scheme->open(signature, gm_partial), out_partial);
    });
}

int grpsig_open_combine(grpsig_scheme_t* scheme, const char* signature,
                        const char* gm_partial, const char* rm_partial,
                        char** out_member_id) {
    if (!scheme || !signature || !gm_partial || !rm_partial || !out_member_id) {
        return GRPSIG_ERR_INVALID_ARG;
    }
    return guarded("grpsig_open_combine", [&] {
        return emit_string(scheme->scheme->open(signature, gm_partial, rm_partial), out_member_id);
    });
}

int grpsig_reveal(grpsig_scheme_t* scheme, const char* member_id) {
    if (!scheme || !member_id) return GRPSIG_ERR_INVALID_ARG;
    return guarded("grpsig_reveal", [&] {
        return status_to_rc(scheme->scheme->reveal(member_id));
    });
}

int grpsig_trace(grpsig_scheme_t* scheme, const char* signature, int* out_revoked) {
    if (!scheme || !signature || !out_revoked) return GRPSIG_ERR_INVALID_ARG;
    return guarded("grpsig_trace", [&] {
        auto result = scheme->scheme->trace(signature);
        if (!result.ok()) return status_to_rc(result.status());
        *out_revoked = result.value() ? 1 : 0;
        return GRPSIG_OK;
    });
}

/*==============================================================================
 * Claim
 *============================================================================*/

int grpsig_claim(grpsig_scheme_t* scheme, const char* signature,
                 const char* member_key, char** out_proof) {
    if (!scheme || !signature || !member_key || !out_proof) return GRPSIG_ERR_INVALID_ARG;
    return guarded("grpsig_claim", [&] {
        return emit_string(scheme->scheme->claim(signature, member_key), out_proof);
    });
}

int grpsig_claim_verify(grpsig_scheme_t* scheme, const char* signature,
                        const char* proof, int* out_valid) {
    if (!scheme || !signature || !proof || !out_valid) return GRPSIG_ERR_INVALID_ARG;
    return guarded("grpsig_claim_verify", [&] {
        auto result = scheme->scheme->claim_verify(signature, proof);
        if (!result.ok()) return status_to_rc(result.status());
        *out_valid = result.value() ? 1 : 0;
        return GRPSIG_OK;
    });
}
