#ifndef GRPSIG_CPY06_HPP
#define GRPSIG_CPY06_HPP

#include "../crypto/ecgroup.hpp"
#include "registry.hpp"
#include "status.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace cpy06 {

using ecgroup::Bytes;
using ecgroup::Scalar;
using ecgroup::G1Point;
using ecgroup::G2Point;
using ecgroup::PairingResult;

// Scheme label used in envelopes.
constexpr const char* SCHEME_NAME = "cpy06";

// -----------------------------------------------------------------------------
// Keys
// -----------------------------------------------------------------------------

/** Public group key with the pairings every signer and verifier reuses. */
struct GroupKey {
    G1Point Q;
    G2Point R;   // gamma·g2
    G2Point W;
    G1Point X;   // Z·(xi1 + xi1_rev)^-1
    G1Point Y;   // Z·(xi2 + xi2_rev)^-1
    G1Point Z;

    PairingResult e1;  // e(g1, W)
    PairingResult e2;  // e(Z, g2)
    PairingResult e3;  // e(Z, R)
    PairingResult e4;  // e(g1, g2)
    PairingResult e5;  // e(Q, g2)

    static constexpr std::size_t SERIALIZED_SIZE =
        4 * ecgroup::G1_SERIALIZED_SIZE + 2 * ecgroup::G2_SERIALIZED_SIZE +
        5 * ecgroup::GT_SERIALIZED_SIZE;

    Bytes to_bytes() const;
    static GroupKey from_bytes(const Bytes& b);
};

/** Group Manager's trapdoor shares and issuing secret. */
struct ManagerKey {
    Scalar xi1;
    Scalar xi2;
    Scalar gamma;

    static constexpr std::size_t SERIALIZED_SIZE = 3 * ecgroup::FR_SERIALIZED_SIZE;

    Bytes to_bytes() const;
    static ManagerKey from_bytes(const Bytes& b);
};

/** Revocation Manager's complementary trapdoor shares. */
struct RevocationManagerKey {
    Scalar xi1;
    Scalar xi2;

    static constexpr std::size_t SERIALIZED_SIZE = 2 * ecgroup::FR_SERIALIZED_SIZE;

    Bytes to_bytes() const;
    static RevocationManagerKey from_bytes(const Bytes& b);
};

/** Member credential: A·(gamma + t) = x·g1 + Q. */
struct MemberKey {
    Scalar  x;
    Scalar  t;
    G1Point A;

    static constexpr std::size_t SERIALIZED_SIZE =
        2 * ecgroup::FR_SERIALIZED_SIZE + ecgroup::G1_SERIALIZED_SIZE;

    Bytes to_bytes() const;
    static MemberKey from_bytes(const Bytes& b);
};

// -----------------------------------------------------------------------------
// Signature
// -----------------------------------------------------------------------------
struct Signature {
    G1Point       T1;
    G1Point       T2;
    G1Point       T3;
    G2Point       T4;
    PairingResult T5;
    Scalar        c;
    Scalar        sr1;
    Scalar        sr2;
    Scalar        sd1;
    Scalar        sd2;
    Scalar        sx;
    Scalar        st;

    static constexpr std::size_t SERIALIZED_SIZE =
        3 * ecgroup::G1_SERIALIZED_SIZE + ecgroup::G2_SERIALIZED_SIZE +
        ecgroup::GT_SERIALIZED_SIZE + 7 * ecgroup::FR_SERIALIZED_SIZE;

    Bytes to_bytes() const;
    static Signature from_bytes(const Bytes& b);
};

// -----------------------------------------------------------------------------
// Opening partials
// -----------------------------------------------------------------------------
struct GroupManagerPartial {
    Scalar xi1;
    Scalar xi2;

    static constexpr std::size_t SERIALIZED_SIZE = 2 * ecgroup::FR_SERIALIZED_SIZE;

    Bytes to_bytes() const;
    static GroupManagerPartial from_bytes(const Bytes& b);
};

struct RevocationManagerPartial {
    Scalar xi1;
    Scalar xi2;

    static constexpr std::size_t SERIALIZED_SIZE = 2 * ecgroup::FR_SERIALIZED_SIZE;

    Bytes to_bytes() const;
    static RevocationManagerPartial from_bytes(const Bytes& b);
};

/** Proof that a set of signatures share the signer secret x. */
struct EqualityProof {
    Scalar c;
    Scalar s;

    static constexpr std::size_t SERIALIZED_SIZE = 2 * ecgroup::FR_SERIALIZED_SIZE;

    Bytes to_bytes() const;
    static EqualityProof from_bytes(const Bytes& b);
};

// -----------------------------------------------------------------------------
// Operations
// -----------------------------------------------------------------------------

struct SetupResult {
    GroupKey             grpkey;
    ManagerKey           mgrkey;
    RevocationManagerKey revkey;
};

SetupResult setup();

Signature sign(const GroupKey& grpkey, const MemberKey& memkey, const Bytes& msg);

bool verify(const GroupKey& grpkey, const Signature& sig, const Bytes& msg);

// GML/CRL key of a member: hex(SHA-256(A || pi)).
std::string member_id(const G1Point& A, const G1Point& pi);

// Group Manager's opening share.
GroupManagerPartial open_group_manager(const ManagerKey& mgrkey, const Signature& sig);

// Revocation Manager's opening share. Requires the Group Manager's partial to
// exist; the shares are independent so it is not consumed.
RevocationManagerPartial open_revocation_manager(const RevocationManagerKey& revkey,
                                                 const Signature& sig,
                                                 const GroupManagerPartial& gm);

// A = T3 - ((xi1 + xi1_rev)·T1 + (xi2 + xi2_rev)·T2)
G1Point recover_discriminator(const Signature& sig,
                              const GroupManagerPartial& gm,
                              const RevocationManagerPartial& rm);

// Combines both partials and looks the discriminator up in the GML.
// NotFound if no member matches.
grpsig::Outcome<std::string> open_combine(const Signature& sig,
                                          const GroupManagerPartial& gm,
                                          const RevocationManagerPartial& rm,
                                          const grpsig::Registry& gml);

// Copies the GML entry of `id` into the CRL. NotFound for unknown ids.
grpsig::Status reveal(const std::string& id, const grpsig::Registry& gml, grpsig::Registry& crl);

// True iff some CRL entry satisfies e(pi, T4) == T5.
bool trace(const Signature& sig, const grpsig::Registry& crl);

// Proves every signature in `sigs` was produced with memkey.x. An empty list
// is a protocol error.
grpsig::Outcome<EqualityProof> prove_equality(const MemberKey& memkey,
                                              const std::vector<Signature>& sigs);
bool prove_equality_verify(const std::vector<Signature>& sigs, const EqualityProof& proof);

grpsig::Outcome<EqualityProof> claim(const MemberKey& memkey, const Signature& sig);
bool claim_verify(const Signature& sig, const EqualityProof& proof);

} // namespace cpy06

#endif // GRPSIG_CPY06_HPP
