#include "cpy06.hpp"
#include "codec.hpp"
#include "../helpers.hpp"
#include "../logging.hpp"

namespace cpy06 {

using namespace grpsig::utils;
using grpsig::ErrorCode;
using grpsig::Outcome;
using grpsig::Registry;
using grpsig::RegistryEntry;
using grpsig::Status;
using grpsig::require_size;
using ecgroup::FR_SERIALIZED_SIZE;
using ecgroup::G1_SERIALIZED_SIZE;
using ecgroup::G2_SERIALIZED_SIZE;
using ecgroup::GT_SERIALIZED_SIZE;

namespace {

grpsig::logging::Logger& logger() {
    static grpsig::logging::Logger l = grpsig::logging::get_logger("grpsig.cpy06");
    return l;
}

Scalar read_fr(const Bytes& b, std::size_t& off) {
    return Scalar::from_bytes(read_raw(b, off, FR_SERIALIZED_SIZE));
}
G1Point read_g1(const Bytes& b, std::size_t& off) {
    return G1Point::from_bytes(read_raw(b, off, G1_SERIALIZED_SIZE));
}
G2Point read_g2(const Bytes& b, std::size_t& off) {
    return G2Point::from_bytes(read_raw(b, off, G2_SERIALIZED_SIZE));
}
PairingResult read_gt(const Bytes& b, std::size_t& off) {
    return PairingResult::from_bytes(read_raw(b, off, GT_SERIALIZED_SIZE));
}

Scalar random_nonzero() {
    Scalar s = Scalar::get_random();
    while (s.is_zero()) s = Scalar::get_random();
    return s;
}

// Shares of a pair of scalars
Bytes scalar_pair_bytes(const Scalar& a, const Scalar& b) {
    Bytes out;
    append_raw(out, a.to_bytes());
    append_raw(out, b.to_bytes());
    return out;
}

/* c = H(tag || msg || T1..T5 || B1..B6) */
Scalar sign_challenge(const Bytes& msg,
                      const Signature& sig,
                      const G1Point& B1, const G1Point& B2,
                      const G1Point& B3, const G1Point& B4,
                      const PairingResult& B5, const PairingResult& B6) {
    Bytes buf;
    append_lp(buf, to_bytes("CPY06:SIGN:v1"));
    append_lp(buf, msg);
    append_lp(buf, sig.T1.to_bytes());
    append_lp(buf, sig.T2.to_bytes());
    append_lp(buf, sig.T3.to_bytes());
    append_lp(buf, sig.T4.to_bytes());
    append_lp(buf, sig.T5.to_bytes());
    append_lp(buf, B1.to_bytes());
    append_lp(buf, B2.to_bytes());
    append_lp(buf, B3.to_bytes());
    append_lp(buf, B4.to_bytes());
    append_lp(buf, B5.to_bytes());
    append_lp(buf, B6.to_bytes());
    return Scalar::hash_to_scalar(buf);
}

} // namespace

// -----------------------------------------------------------------------------
// Serialization
// -----------------------------------------------------------------------------

Bytes GroupKey::to_bytes() const {
    Bytes out;
    out.reserve(SERIALIZED_SIZE);
    append_raw(out, Q.to_bytes());
    append_raw(out, R.to_bytes());
    append_raw(out, W.to_bytes());
    append_raw(out, X.to_bytes());
    append_raw(out, Y.to_bytes());
    append_raw(out, Z.to_bytes());
    append_raw(out, e1.to_bytes());
    append_raw(out, e2.to_bytes());
    append_raw(out, e3.to_bytes());
    append_raw(out, e4.to_bytes());
    append_raw(out, e5.to_bytes());
    return out;
}

GroupKey GroupKey::from_bytes(const Bytes& b) {
    require_size(b, SERIALIZED_SIZE, "cpy06::GroupKey");
    GroupKey k;
    std::size_t off = 0;
    k.Q  = read_g1(b, off);
    k.R  = read_g2(b, off);
    k.W  = read_g2(b, off);
    k.X  = read_g1(b, off);
    k.Y  = read_g1(b, off);
    k.Z  = read_g1(b, off);
    k.e1 = read_gt(b, off);
    k.e2 = read_gt(b, off);
    k.e3 = read_gt(b, off);
    k.e4 = read_gt(b, off);
    k.e5 = read_gt(b, off);
    return k;
}

Bytes ManagerKey::to_bytes() const {
    Bytes out;
    append_raw(out, xi1.to_bytes());
    append_raw(out, xi2.to_bytes());
    append_raw(out, gamma.to_bytes());
    return out;
}

ManagerKey ManagerKey::from_bytes(const Bytes& b) {
    require_size(b, SERIALIZED_SIZE, "cpy06::ManagerKey");
    ManagerKey k;
    std::size_t off = 0;
    k.xi1   = read_fr(b, off);
    k.xi2   = read_fr(b, off);
    k.gamma = read_fr(b, off);
    return k;
}

Bytes RevocationManagerKey::to_bytes() const {
    return scalar_pair_bytes(xi1, xi2);
}

RevocationManagerKey RevocationManagerKey::from_bytes(const Bytes& b) {
    require_size(b, SERIALIZED_SIZE, "cpy06::RevocationManagerKey");
    RevocationManagerKey k;
    std::size_t off = 0;
    k.xi1 = read_fr(b, off);
    k.xi2 = read_fr(b, off);
    return k;
}

Bytes MemberKey::to_bytes() const {
    Bytes out;
    append_raw(out, x.to_bytes());
    append_raw(out, t.to_bytes());
    append_raw(out, A.to_bytes());
    return out;
}

MemberKey MemberKey::from_bytes(const Bytes& b) {
    require_size(b, SERIALIZED_SIZE, "cpy06::MemberKey");
    MemberKey k;
    std::size_t off = 0;
    k.x = read_fr(b, off);
    k.t = read_fr(b, off);
    k.A = read_g1(b, off);
    return k;
}

Bytes Signature::to_bytes() const {
    Bytes out;
    out.reserve(SERIALIZED_SIZE);
    append_raw(out, T1.to_bytes());
    append_raw(out, T2.to_bytes());
    append_raw(out, T3.to_bytes());
    append_raw(out, T4.to_bytes());
    append_raw(out, T5.to_bytes());
    append_raw(out, c.to_bytes());
    append_raw(out, sr1.to_bytes());
    append_raw(out, sr2.to_bytes());
    append_raw(out, sd1.to_bytes());
    append_raw(out, sd2.to_bytes());
    append_raw(out, sx.to_bytes());
    append_raw(out, st.to_bytes());
    return out;
}

Signature Signature::from_bytes(const Bytes& b) {
    require_size(b, SERIALIZED_SIZE, "cpy06::Signature");
    Signature sig;
    std::size_t off = 0;
    sig.T1  = read_g1(b, off);
    sig.T2  = read_g1(b, off);
    sig.T3  = read_g1(b, off);
    sig.T4  = read_g2(b, off);
    sig.T5  = read_gt(b, off);
    sig.c   = read_fr(b, off);
    sig.sr1 = read_fr(b, off);
    sig.sr2 = read_fr(b, off);
    sig.sd1 = read_fr(b, off);
    sig.sd2 = read_fr(b, off);
    sig.sx  = read_fr(b, off);
    sig.st  = read_fr(b, off);
    return sig;
}

Bytes GroupManagerPartial::to_bytes() const {
    return scalar_pair_bytes(xi1, xi2);
}

GroupManagerPartial GroupManagerPartial::from_bytes(const Bytes& b) {
    require_size(b, SERIALIZED_SIZE, "cpy06::GroupManagerPartial");
    GroupManagerPartial p;
    std::size_t off = 0;
    p.xi1 = read_fr(b, off);
    p.xi2 = read_fr(b, off);
    return p;
}

Bytes RevocationManagerPartial::to_bytes() const {
    return scalar_pair_bytes(xi1, xi2);
}

RevocationManagerPartial RevocationManagerPartial::from_bytes(const Bytes& b) {
    require_size(b, SERIALIZED_SIZE, "cpy06::RevocationManagerPartial");
    RevocationManagerPartial p;
    std::size_t off = 0;
    p.xi1 = read_fr(b, off);
    p.xi2 = read_fr(b, off);
    return p;
}

Bytes EqualityProof::to_bytes() const {
    return scalar_pair_bytes(c, s);
}

EqualityProof EqualityProof::from_bytes(const Bytes& b) {
    require_size(b, SERIALIZED_SIZE, "cpy06::EqualityProof");
    EqualityProof p;
    std::size_t off = 0;
    p.c = read_fr(b, off);
    p.s = read_fr(b, off);
    return p;
}

// -----------------------------------------------------------------------------
// Setup
// -----------------------------------------------------------------------------

SetupResult setup() {
    const G1Point g1 = G1Point::get_generator();
    const G2Point g2 = G2Point::get_generator();

    SetupResult out;
    GroupKey& grp = out.grpkey;
    ManagerKey& mgr = out.mgrkey;
    RevocationManagerKey& rev = out.revkey;

    grp.Z = G1Point::get_random();
    while (grp.Z.is_zero()) grp.Z = G1Point::get_random();
    grp.Q = G1Point::get_random();
    grp.W = G2Point::get_random();
    while (grp.W.is_zero()) grp.W = G2Point::get_random();

    mgr.xi1   = Scalar::get_random();
    mgr.xi2   = Scalar::get_random();
    mgr.gamma = random_nonzero();

    // The full trapdoors xi1 + xi1_rev and xi2 + xi2_rev must be invertible.
    do { rev.xi1 = Scalar::get_random(); } while ((mgr.xi1 + rev.xi1).is_zero());
    do { rev.xi2 = Scalar::get_random(); } while ((mgr.xi2 + rev.xi2).is_zero());

    grp.X = grp.Z * (mgr.xi1 + rev.xi1).inverse();
    grp.Y = grp.Z * (mgr.xi2 + rev.xi2).inverse();
    grp.R = g2 * mgr.gamma;

    grp.e1 = ecgroup::pairing(g1, grp.W);
    grp.e2 = ecgroup::pairing(grp.Z, g2);
    grp.e3 = ecgroup::pairing(grp.Z, grp.R);
    grp.e4 = ecgroup::pairing(g1, g2);
    grp.e5 = ecgroup::pairing(grp.Q, g2);

    LOG_DEBUG(logger(), "setup complete");
    return out;
}

// -----------------------------------------------------------------------------
// Sign / Verify
// -----------------------------------------------------------------------------

Signature sign(const GroupKey& grpkey, const MemberKey& memkey, const Bytes& msg) {
    const G1Point g1 = G1Point::get_generator();
    const G2Point g2 = G2Point::get_generator();

    Scalar r1 = Scalar::get_random();
    Scalar r2 = Scalar::get_random();
    Scalar r3 = Scalar::get_random();
    Scalar d1 = memkey.t * r1;
    Scalar d2 = memkey.t * r2;

    Signature sig;
    sig.T1 = grpkey.X * r1;
    sig.T2 = grpkey.Y * r2;
    sig.T3 = memkey.A + grpkey.Z * (r1 + r2);
    sig.T4 = grpkey.W * r3;
    sig.T5 = grpkey.e1.pow(r3 * memkey.x);

    Scalar br1 = Scalar::get_random();
    Scalar br2 = Scalar::get_random();
    Scalar bd1 = Scalar::get_random();
    Scalar bd2 = Scalar::get_random();
    Scalar bt  = Scalar::get_random();
    Scalar bx  = Scalar::get_random();

    G1Point B1 = grpkey.X * br1;
    G1Point B2 = grpkey.Y * br2;
    G1Point B3 = sig.T1 * bt - grpkey.X * bd1;
    G1Point B4 = sig.T2 * bt - grpkey.Y * bd2;
    PairingResult B5 = ecgroup::pairing(g1, sig.T4).pow(bx);

    // B6 = e(T3,g2)^bt · e(Z,g2)^(-bd1-bd2) · e(Z,R)^(-br1-br2) · e(g1,g2)^(-bx)
    PairingResult B6 = PairingResult::pow_prod(
        {ecgroup::pairing(sig.T3, g2), grpkey.e2, grpkey.e3, grpkey.e4},
        {bt, -(bd1 + bd2), -(br1 + br2), -bx});

    sig.c = sign_challenge(msg, sig, B1, B2, B3, B4, B5, B6);

    // s = b + c·w
    sig.sr1 = br1 + sig.c * r1;
    sig.sr2 = br2 + sig.c * r2;
    sig.sd1 = bd1 + sig.c * d1;
    sig.sd2 = bd2 + sig.c * d2;
    sig.sx  = bx  + sig.c * memkey.x;
    sig.st  = bt  + sig.c * memkey.t;
    return sig;
}

bool verify(const GroupKey& grpkey, const Signature& sig, const Bytes& msg) {
    const G1Point g1 = G1Point::get_generator();
    const G2Point g2 = G2Point::get_generator();

    G1Point B1 = grpkey.X * sig.sr1 - sig.T1 * sig.c;
    G1Point B2 = grpkey.Y * sig.sr2 - sig.T2 * sig.c;
    G1Point B3 = sig.T1 * sig.st - grpkey.X * sig.sd1;
    G1Point B4 = sig.T2 * sig.st - grpkey.Y * sig.sd2;

    // B5 = e(g1,T4)^sx / T5^c
    PairingResult B5 = ecgroup::pairing(g1, sig.T4).pow(sig.sx) / sig.T5.pow(sig.c);

    // B6 = e(T3,g2)^st · e(Z,g2)^(-sd1-sd2) · e(Z,R)^(-sr1-sr2) · e(g1,g2)^(-sx)
    //      · (e(T3,R) / e(Q,g2))^c
    PairingResult B6 = PairingResult::pow_prod(
        {ecgroup::pairing(sig.T3, g2), grpkey.e2, grpkey.e3, grpkey.e4,
         ecgroup::pairing(sig.T3, grpkey.R) / grpkey.e5},
        {sig.st, -(sig.sd1 + sig.sd2), -(sig.sr1 + sig.sr2), -sig.sx, sig.c});

    if (sign_challenge(msg, sig, B1, B2, B3, B4, B5, B6) != sig.c) {
        LOG_DEBUG(logger(), "verify: challenge mismatch");
        return false;
    }
    return true;
}

// -----------------------------------------------------------------------------
// Open / Reveal / Trace
// -----------------------------------------------------------------------------

std::string member_id(const G1Point& A, const G1Point& pi) {
    RegistryEntry e;
    e.A  = A;
    e.pi = pi;
    return e.id();
}

GroupManagerPartial open_group_manager(const ManagerKey& mgrkey, const Signature& sig) {
    (void)sig;
    GroupManagerPartial p;
    p.xi1 = mgrkey.xi1;
    p.xi2 = mgrkey.xi2;
    return p;
}

RevocationManagerPartial open_revocation_manager(const RevocationManagerKey& revkey,
                                                 const Signature& sig,
                                                 const GroupManagerPartial& gm) {
    (void)sig;
    (void)gm;
    RevocationManagerPartial p;
    p.xi1 = revkey.xi1;
    p.xi2 = revkey.xi2;
    return p;
}

G1Point recover_discriminator(const Signature& sig,
                              const GroupManagerPartial& gm,
                              const RevocationManagerPartial& rm) {
    G1Point mask = G1Point::mul_sum({sig.T1, sig.T2}, {gm.xi1 + rm.xi1, gm.xi2 + rm.xi2});
    return sig.T3 - mask;
}

Outcome<std::string> open_combine(const Signature& sig,
                                  const GroupManagerPartial& gm,
                                  const RevocationManagerPartial& rm,
                                  const Registry& gml) {
    G1Point A = recover_discriminator(sig, gm, rm);

    std::string found;
    gml.for_each([&](const std::string& id, const RegistryEntry& e) {
        if (e.A == A) {
            found = id;
            return false;
        }
        return true;
    });

    if (found.empty()) {
        LOG_WARN(logger(), "open: no GML entry matches the signature");
        return Outcome<std::string>::Error(ErrorCode::NotFound, "no member matches the signature");
    }
    LOG_INFO(logger(), "open: signature attributed to " << found);
    return found;
}

Status reveal(const std::string& id, const Registry& gml, Registry& crl) {
    auto entry = gml.find(id);
    if (!entry) {
        return Status::Error(ErrorCode::NotFound, "unknown member id: " + id);
    }
    crl.add(*entry);
    LOG_INFO(logger(), "reveal: member " << id << " added to CRL");
    return Status::Ok();
}

bool trace(const Signature& sig, const Registry& crl) {
    bool revoked = false;
    crl.for_each([&](const std::string& id, const RegistryEntry& e) {
        if (ecgroup::pairing(e.pi, sig.T4) == sig.T5) {
            LOG_DEBUG(logger(), "trace: signature matches revoked member " << id);
            revoked = true;
            return false;
        }
        return true;
    });
    return revoked;
}

// -----------------------------------------------------------------------------
// Claim / Prove-equality
// -----------------------------------------------------------------------------

namespace {

// Appends e^k || e || T5 for one signature, where e = e(g1, T4).
void append_equality_term(Bytes& buf, const PairingResult& ek,
                          const PairingResult& e, const PairingResult& T5) {
    append_lp(buf, ek.to_bytes());
    append_lp(buf, e.to_bytes());
    append_lp(buf, T5.to_bytes());
}

} // namespace

Outcome<EqualityProof> prove_equality(const MemberKey& memkey, const std::vector<Signature>& sigs) {
    if (sigs.empty()) {
        return Outcome<EqualityProof>::Error(ErrorCode::Protocol, "prove_equality: no signatures");
    }
    const G1Point g1 = G1Point::get_generator();

    Scalar r = Scalar::get_random();
    Bytes buf;
    append_lp(buf, to_bytes("CPY06:EQ:v1"));
    append_u32_be(buf, static_cast<uint32_t>(sigs.size()));
    for (const auto& sig : sigs) {
        PairingResult e = ecgroup::pairing(g1, sig.T4);
        append_equality_term(buf, e.pow(r), e, sig.T5);
    }

    EqualityProof proof;
    proof.c = Scalar::hash_to_scalar(buf);
    proof.s = r + proof.c * memkey.x;
    return proof;
}

bool prove_equality_verify(const std::vector<Signature>& sigs, const EqualityProof& proof) {
    if (sigs.empty()) return false;
    const G1Point g1 = G1Point::get_generator();

    Bytes buf;
    append_lp(buf, to_bytes("CPY06:EQ:v1"));
    append_u32_be(buf, static_cast<uint32_t>(sigs.size()));
    for (const auto& sig : sigs) {
        PairingResult e = ecgroup::pairing(g1, sig.T4);
        // e^r = e^s / T5^c
        append_equality_term(buf, e.pow(proof.s) / sig.T5.pow(proof.c), e, sig.T5);
    }

    if (Scalar::hash_to_scalar(buf) != proof.c) {
        LOG_DEBUG(logger(), "prove_equality_verify: challenge mismatch");
        return false;
    }
    return true;
}

Outcome<EqualityProof> claim(const MemberKey& memkey, const Signature& sig) {
    return prove_equality(memkey, {sig});
}

bool claim_verify(const Signature& sig, const EqualityProof& proof) {
    return prove_equality_verify({sig}, proof);
}

} // namespace cpy06
