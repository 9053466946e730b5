#ifndef GRPSIG_SCHEME_HPP
#define GRPSIG_SCHEME_HPP

#include "codec.hpp"
#include "registry.hpp"
#include "status.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace grpsig {

// -----------------------------------------------------------------------------
// Scheme identifiers
// -----------------------------------------------------------------------------
enum class SchemeId : uint8_t {
    Cpy06 = 0
};

const char* scheme_name(SchemeId id);

// Throws std::invalid_argument for an unknown scheme.
SchemeId scheme_from_name(const std::string& name);

// Optional capability bits
namespace capability {
constexpr uint32_t Open          = 1u << 0;
constexpr uint32_t Reveal        = 1u << 1;
constexpr uint32_t Trace         = 1u << 2;
constexpr uint32_t Link          = 1u << 3;
constexpr uint32_t Blind         = 1u << 4;
constexpr uint32_t Claim         = 1u << 5;
constexpr uint32_t ProveEquality = 1u << 6;
constexpr uint32_t Convert       = 1u << 7;
constexpr uint32_t Unblind       = 1u << 8;
} // namespace capability

// -----------------------------------------------------------------------------
// Join transport
// -----------------------------------------------------------------------------
struct JoinMessage {
    uint32_t phase = 0;
    Bytes    payload;

    Bytes to_bytes() const;
    static JoinMessage from_bytes(const Bytes& data);
};

struct JoinReply {
    std::optional<JoinMessage> next;        // message for the manager, if any
    std::string                member_key;  // envelope, set once the join completes

    bool done() const { return !member_key.empty(); }
};

// GML and CRL backing stores. Null members are replaced by MemoryStores.
struct Stores {
    std::shared_ptr<KeyValueStore> gml;
    std::shared_ptr<KeyValueStore> crl;
};

// -----------------------------------------------------------------------------
// Scheme - lifecycle shared by every group-signature scheme. Keys, signatures
// and partials cross this interface as "<scheme>:<kind>:<base64>" envelopes.
// Malformed envelopes throw ecgroup::DecodeError.
// -----------------------------------------------------------------------------
class Scheme {
public:
    // Initializes the pairing backend if no one has yet.
    explicit Scheme(Stores stores);
    virtual ~Scheme() = default;

    Scheme(const Scheme&) = delete;
    Scheme& operator=(const Scheme&) = delete;

    virtual SchemeId id() const = 0;
    std::string name() const { return scheme_name(id()); }

    virtual uint32_t capabilities() const = 0;
    bool supports(uint32_t cap) const { return (capabilities() & cap) == cap; }

    // Keys
    virtual void setup() = 0;
    virtual Outcome<std::string> export_key(ObjectKind kind) const = 0;
    virtual void import_key(const std::string& envelope) = 0;
    virtual bool has_key(ObjectKind kind) const = 0;

    // Join: 0 if the manager sends the first message, 1 if the member does.
    virtual uint32_t join_start() const = 0;
    // Phase number of the last message of the join.
    virtual uint32_t join_seq() const = 0;

    virtual Outcome<JoinMessage> join_mgr(const std::optional<JoinMessage>& msg) = 0;
    virtual Outcome<JoinReply>   join_mem(const JoinMessage& msg) = 0;

    // Drops the pending join session `msg` belongs to, on either side.
    // NotFound if no session is pending.
    virtual Status join_abort(const JoinMessage& msg) = 0;

    // Signing with an explicit member key envelope, or with the imported one.
    virtual Outcome<std::string> sign(const Bytes& msg, const std::string& member_key) = 0;
    Outcome<std::string> sign(const Bytes& msg);

    virtual bool verify(const Bytes& msg, const std::string& signature) = 0;

    // Optional capabilities; the defaults answer ErrorCode::Unsupported.

    // Group Manager partial
    virtual Outcome<std::string> open(const std::string& signature);
    // Revocation Manager partial
    virtual Outcome<std::string> open(const std::string& signature, const std::string& gm_partial);
    // Member id from both partials
    virtual Outcome<std::string> open(const std::string& signature, const std::string& gm_partial,
                                      const std::string& rm_partial);

    virtual Status        reveal(const std::string& member_id);
    virtual Outcome<bool> trace(const std::string& signature);

    virtual Outcome<std::string> claim(const std::string& signature, const std::string& member_key);
    virtual Outcome<bool>        claim_verify(const std::string& signature, const std::string& proof);

    virtual Outcome<std::string> prove_equality(const std::vector<std::string>& signatures,
                                                const std::string& member_key);
    virtual Outcome<bool>        prove_equality_verify(const std::vector<std::string>& signatures,
                                                       const std::string& proof);

    Registry&       gml()       { return gml_; }
    const Registry& gml() const { return gml_; }
    Registry&       crl()       { return crl_; }
    const Registry& crl() const { return crl_; }

protected:
    Status unsupported(const char* op) const;

private:
    Registry gml_;
    Registry crl_;
};

std::unique_ptr<Scheme> make_scheme(SchemeId id, Stores stores = Stores{});

} // namespace grpsig

#endif // GRPSIG_SCHEME_HPP
