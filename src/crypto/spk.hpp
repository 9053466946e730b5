#ifndef GRPSIG_SPK_HPP
#define GRPSIG_SPK_HPP

#include "ecgroup.hpp"
#include <cstddef>
#include <vector>

namespace spk {

using ecgroup::Bytes;
using ecgroup::Scalar;
using ecgroup::G1Point;
using ecgroup::G2Point;
using ecgroup::PairingResult;

/*========================  Representation proofs  ========================*/

/** One addend w_witness · g_base of a relation. */
struct Term {
    std::size_t witness;
    std::size_t base;
};

/** y_j = Σ terms. */
struct Relation {
    std::vector<Term> terms;
};

/**
 * Public statement for a proof of knowledge of a linear representation:
 * for every j, y[j] = Σ_{t ∈ relations[j].terms} w[t.witness] · g[t.base].
 * The number of witnesses is implied by the largest witness index.
 */
struct RepStatement {
    std::vector<G1Point>  y;
    std::vector<G1Point>  g;
    std::vector<Relation> relations;

    /// Number of witnesses referenced by the relations.
    std::size_t witness_count() const;

    /// Structural check: one relation per y, every index in range.
    bool well_formed() const;
};

/** Fiat–Shamir proof (c, s[]) with s_i = r_i − c·w_i. */
struct RepProof {
    Scalar              c;
    std::vector<Scalar> s;

    Bytes to_bytes() const;
    static RepProof from_bytes(const Bytes& in);
};

/**
 * Prove knowledge of `w` for `stmt`, binding `msg` into the challenge.
 * Throws std::invalid_argument if the statement is malformed or the number
 * of witnesses does not match.
 */
RepProof rep_prove(const RepStatement& stmt,
                   const std::vector<Scalar>& w,
                   const Bytes& msg);

/** Verify a representation proof. Malformed input yields false. */
bool rep_verify(const RepStatement& stmt,
                const RepProof& proof,
                const Bytes& msg);

/*========================  Discrete log in G1  ========================*/

struct DlogProof {
    Scalar c;
    Scalar s;
};

/** Prove knowledge of x with G = x·g. */
DlogProof dlog_g1_prove(const G1Point& G, const G1Point& g, const Scalar& x, const Bytes& msg);
bool      dlog_g1_verify(const G1Point& G, const G1Point& g, const DlogProof& proof, const Bytes& msg);

/*========================  Pairing homomorphism (G2 witness)  ========================*/

struct PairingHomProof {
    Scalar  c;
    G2Point s;
};

/** Prove knowledge of xx ∈ G2 with G = e(g, xx). */
PairingHomProof pairing_hom_g2_prove(const G1Point& g, const PairingResult& G,
                                     const G2Point& xx, const Bytes& msg);
bool            pairing_hom_g2_verify(const G1Point& g, const PairingResult& G,
                                      const PairingHomProof& proof, const Bytes& msg);

} // namespace spk

#endif // GRPSIG_SPK_HPP
