#include "spk.hpp"
#include "../helpers.hpp"

#include <algorithm>
#include <stdexcept>

namespace spk {

using ecgroup::FR_SERIALIZED_SIZE;
using ecgroup::DecodeError;
using namespace grpsig::utils;   // append_lp, append_u32_be, to_bytes

/* ============================== Statement =============================== */

std::size_t RepStatement::witness_count() const {
    std::size_t n = 0;
    for (const auto& rel : relations) {
        for (const auto& t : rel.terms) n = std::max(n, t.witness + 1);
    }
    return n;
}

bool RepStatement::well_formed() const {
    if (relations.size() != y.size() || y.empty()) return false;
    for (const auto& rel : relations) {
        if (rel.terms.empty()) return false;
        for (const auto& t : rel.terms) {
            if (t.base >= g.size()) return false;
        }
    }
    return true;
}

/* Fiat–Shamir challenge over a length-prefixed transcript:
 * tag || msg || y[] || g[] || relation structure || comm[]
 */
static Scalar rep_challenge(const RepStatement& stmt,
                            const std::vector<G1Point>& comm,
                            const Bytes& msg) {
    Bytes buf;
    append_lp(buf, to_bytes("SPK:REP:v1"));
    append_lp(buf, msg);

    append_u32_be(buf, static_cast<uint32_t>(stmt.y.size()));
    for (const auto& y : stmt.y) append_lp(buf, y.to_bytes());

    append_u32_be(buf, static_cast<uint32_t>(stmt.g.size()));
    for (const auto& g : stmt.g) append_lp(buf, g.to_bytes());

    // Grouping structure: which (witness, base) terms feed which relation
    append_u32_be(buf, static_cast<uint32_t>(stmt.relations.size()));
    for (const auto& rel : stmt.relations) {
        append_u32_be(buf, static_cast<uint32_t>(rel.terms.size()));
        for (const auto& t : rel.terms) {
            append_u32_be(buf, static_cast<uint32_t>(t.witness));
            append_u32_be(buf, static_cast<uint32_t>(t.base));
        }
    }

    for (const auto& c : comm) append_lp(buf, c.to_bytes());

    return Scalar::hash_to_scalar(buf);
}

/* =========================== Representation ============================ */

RepProof rep_prove(const RepStatement& stmt,
                   const std::vector<Scalar>& w,
                   const Bytes& msg) {
    if (!stmt.well_formed()) {
        throw std::invalid_argument("spk::rep_prove: malformed statement");
    }
    if (w.size() != stmt.witness_count()) {
        throw std::invalid_argument("spk::rep_prove: witness count mismatch");
    }

    std::vector<Scalar> r(w.size());
    for (auto& ri : r) ri = Scalar::get_random();

    // Comm_j = Σ r[witness]·g[base]
    std::vector<G1Point> comm;
    comm.reserve(stmt.relations.size());
    for (const auto& rel : stmt.relations) {
        G1Point acc;
        for (const auto& t : rel.terms) {
            acc = acc.add(G1Point::mul(stmt.g[t.base], r[t.witness]));
        }
        comm.push_back(acc);
    }

    RepProof proof;
    proof.c = rep_challenge(stmt, comm, msg);
    proof.s.reserve(w.size());
    for (std::size_t i = 0; i < w.size(); ++i) {
        proof.s.push_back(r[i] - (proof.c * w[i]));
    }
    return proof;
}

bool rep_verify(const RepStatement& stmt,
                const RepProof& proof,
                const Bytes& msg) {
    if (!stmt.well_formed()) return false;
    if (proof.s.size() != stmt.witness_count()) return false;

    // Comm'_j = c·y_j + Σ s[witness]·g[base]
    std::vector<G1Point> comm;
    comm.reserve(stmt.relations.size());
    for (std::size_t j = 0; j < stmt.relations.size(); ++j) {
        G1Point acc = G1Point::mul(stmt.y[j], proof.c);
        for (const auto& t : stmt.relations[j].terms) {
            acc = acc.add(G1Point::mul(stmt.g[t.base], proof.s[t.witness]));
        }
        comm.push_back(acc);
    }

    return rep_challenge(stmt, comm, msg) == proof.c;
}

Bytes RepProof::to_bytes() const {
    Bytes out;
    append_raw(out, c.to_bytes());
    append_u32_be(out, static_cast<uint32_t>(s.size()));
    for (const auto& si : s) append_raw(out, si.to_bytes());
    return out;
}

RepProof RepProof::from_bytes(const Bytes& in) {
    std::size_t off = 0;
    RepProof p;
    p.c = Scalar::from_bytes(read_raw(in, off, FR_SERIALIZED_SIZE));
    uint32_t n = read_u32_be(in, off);
    if (static_cast<std::size_t>(n) * FR_SERIALIZED_SIZE != in.size() - off) {
        throw DecodeError("RepProof::from_bytes: bad response count");
    }
    p.s.reserve(n);
    for (uint32_t i = 0; i < n; ++i) {
        p.s.push_back(Scalar::from_bytes(read_raw(in, off, FR_SERIALIZED_SIZE)));
    }
    return p;
}

/* ============================== Dlog (G1) =============================== */

static Scalar dlog_challenge(const G1Point& G, const G1Point& g,
                             const G1Point& t, const Bytes& msg) {
    Bytes buf;
    append_lp(buf, to_bytes("SPK:DLOG:G1:v1"));
    append_lp(buf, msg);
    append_lp(buf, G.to_bytes());
    append_lp(buf, g.to_bytes());
    append_lp(buf, t.to_bytes());
    return Scalar::hash_to_scalar(buf);
}

DlogProof dlog_g1_prove(const G1Point& G, const G1Point& g, const Scalar& x, const Bytes& msg) {
    Scalar r = Scalar::get_random();
    G1Point t = G1Point::mul(g, r);

    DlogProof proof;
    proof.c = dlog_challenge(G, g, t, msg);
    // s = r - c*x
    proof.s = r - (proof.c * x);
    return proof;
}

bool dlog_g1_verify(const G1Point& G, const G1Point& g, const DlogProof& proof, const Bytes& msg) {
    // t = s*g + c*G
    G1Point t = G1Point::mul(g, proof.s).add(G1Point::mul(G, proof.c));
    return dlog_challenge(G, g, t, msg) == proof.c;
}

/* ====================== Pairing homomorphism (G2) ======================= */

static Scalar pairing_hom_challenge(const G1Point& g, const PairingResult& G,
                                    const PairingResult& R, const Bytes& msg) {
    Bytes buf;
    append_lp(buf, to_bytes("SPK:PHOM:G2:v1"));
    append_lp(buf, msg);
    append_lp(buf, g.to_bytes());
    append_lp(buf, G.to_bytes());
    append_lp(buf, R.to_bytes());
    return Scalar::hash_to_scalar(buf);
}

PairingHomProof pairing_hom_g2_prove(const G1Point& g, const PairingResult& G,
                                     const G2Point& xx, const Bytes& msg) {
    // Mask rr ∈ G2, R = e(g, rr)
    G2Point rr = G2Point::get_random();
    PairingResult R = ecgroup::pairing(g, rr);

    PairingHomProof proof;
    proof.c = pairing_hom_challenge(g, G, R, msg);
    // s = rr + c*xx
    proof.s = rr.add(G2Point::mul(xx, proof.c));
    return proof;
}

bool pairing_hom_g2_verify(const G1Point& g, const PairingResult& G,
                           const PairingHomProof& proof, const Bytes& msg) {
    // R = e(g, s) / G^c
    PairingResult R = ecgroup::pairing(g, proof.s) / G.pow(proof.c);
    return pairing_hom_challenge(g, G, R, msg) == proof.c;
}

} // namespace spk
