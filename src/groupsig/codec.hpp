#ifndef GRPSIG_CODEC_HPP
#define GRPSIG_CODEC_HPP

#include "../crypto/ecgroup.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace grpsig {

using ecgroup::Bytes;

// -----------------------------------------------------------------------------
// ObjectKind - what an envelope carries
// -----------------------------------------------------------------------------
enum class ObjectKind : uint8_t {
    Group                    = 0,
    Manager                  = 1,
    RevocationManager        = 2,
    Member                   = 3,
    Signature                = 4,
    GroupManagerPartial      = 5,
    RevocationManagerPartial = 6,
    Proof                    = 7
};

// "group", "manager", "revmanager", "member", "signature", "gmpartial",
// "rmpartial", "proof"
const char* to_string(ObjectKind kind);

// Throws ecgroup::DecodeError on an unknown name.
ObjectKind kind_from_string(const std::string& name);

// -----------------------------------------------------------------------------
// Envelope - textual transport form "<scheme>:<kind>:<base64>"
// -----------------------------------------------------------------------------
struct Envelope {
    std::string scheme;
    ObjectKind  kind = ObjectKind::Group;
    Bytes       payload;

    std::string encode() const;

    // Splits and base64-decodes. Throws ecgroup::DecodeError on a malformed
    // envelope; does not check the scheme.
    static Envelope parse(const std::string& text);
};

std::string encode_envelope(const std::string& scheme, ObjectKind kind, const Bytes& payload);

// Parses `text` and checks both labels. Throws ecgroup::DecodeError on a
// scheme or kind mismatch.
Bytes decode_envelope(const std::string& text, const std::string& scheme, ObjectKind kind);

// Throws ecgroup::DecodeError unless b.size() == expected.
void require_size(const Bytes& b, std::size_t expected, const char* what);

} // namespace grpsig

#endif // GRPSIG_CODEC_HPP
