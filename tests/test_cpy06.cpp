#include <catch2/catch_test_macros.hpp>

#include "groupsig/cpy06.hpp"
#include "test_helpers.hpp"

#include <string>
#include <vector>

using namespace test_helpers;

// Decodes a byte-flipped signature; a decode failure counts as rejection.
static bool tampered_accepted(const cpy06::GroupKey& grpkey, Bytes raw, std::size_t pos,
                              const Bytes& message) {
    raw[pos] ^= 0x01;
    try {
        return cpy06::verify(grpkey, cpy06::Signature::from_bytes(raw), message);
    } catch (const ecgroup::DecodeError&) {
        return false;
    }
}

TEST_CASE("CPY06 setup", "[cpy06]") {
    TestGroup group = create_group();
    const auto& k = group.keys;

    const ecgroup::G1Point g1 = ecgroup::G1Point::get_generator();
    const ecgroup::G2Point g2 = ecgroup::G2Point::get_generator();

    REQUIRE_FALSE(k.grpkey.Z.is_zero());
    REQUIRE_FALSE(k.grpkey.W.is_zero());
    REQUIRE(k.grpkey.R == g2 * k.mgrkey.gamma);

    // X·(xi1 + xi1_rev) = Z and Y·(xi2 + xi2_rev) = Z
    REQUIRE(k.grpkey.X * (k.mgrkey.xi1 + k.revkey.xi1) == k.grpkey.Z);
    REQUIRE(k.grpkey.Y * (k.mgrkey.xi2 + k.revkey.xi2) == k.grpkey.Z);

    REQUIRE(k.grpkey.e1 == ecgroup::pairing(g1, k.grpkey.W));
    REQUIRE(k.grpkey.e2 == ecgroup::pairing(k.grpkey.Z, g2));
    REQUIRE(k.grpkey.e3 == ecgroup::pairing(k.grpkey.Z, k.grpkey.R));
    REQUIRE(k.grpkey.e4 == ecgroup::pairing(g1, g2));
    REQUIRE(k.grpkey.e5 == ecgroup::pairing(k.grpkey.Q, g2));
}

TEST_CASE("CPY06 sign and verify", "[cpy06]") {
    TestGroup group = create_group();
    TestMember alice = group.join();
    TestMember bob = group.join();
    const auto& grpkey = group.keys.grpkey;

    SECTION("Completeness for every member and message") {
        for (const auto* m : {&alice, &bob}) {
            for (const std::string text : {"", "hello", "record-42"}) {
                cpy06::Signature sig = cpy06::sign(grpkey, m->key, msg(text));
                REQUIRE(cpy06::verify(grpkey, sig, msg(text)));
            }
        }
    }

    SECTION("Signatures are unlinkable byte-wise") {
        cpy06::Signature s1 = cpy06::sign(grpkey, alice.key, msg("m"));
        cpy06::Signature s2 = cpy06::sign(grpkey, alice.key, msg("m"));
        REQUIRE(s1.to_bytes() != s2.to_bytes());
    }

    SECTION("Wrong message or wrong group is rejected") {
        cpy06::Signature sig = cpy06::sign(grpkey, alice.key, msg("hello"));
        REQUIRE_FALSE(cpy06::verify(grpkey, sig, msg("hellp")));

        TestGroup other = create_group();
        REQUIRE_FALSE(cpy06::verify(other.keys.grpkey, sig, msg("hello")));
    }

    SECTION("A credential not issued by the manager does not verify") {
        cpy06::MemberKey forged = alice.key;
        forged.t = forged.t + ecgroup::Scalar::from_int(1);
        cpy06::Signature sig = cpy06::sign(grpkey, forged, msg("hello"));
        REQUIRE_FALSE(cpy06::verify(grpkey, sig, msg("hello")));
    }

    SECTION("Flipping any byte of the signature is detected") {
        Bytes message = msg("integrity");
        Bytes raw = cpy06::sign(grpkey, alice.key, message).to_bytes();
        REQUIRE(raw.size() == cpy06::Signature::SERIALIZED_SIZE);

        // One byte inside each field: T1, T2, T3, T4, T5, c and the six responses
        const std::size_t G1 = ecgroup::G1_SERIALIZED_SIZE;
        const std::size_t G2 = ecgroup::G2_SERIALIZED_SIZE;
        const std::size_t GT = ecgroup::GT_SERIALIZED_SIZE;
        const std::size_t FR = ecgroup::FR_SERIALIZED_SIZE;
        std::vector<std::size_t> positions = {
            5, G1 + 5, 2 * G1 + 5, 3 * G1 + 7, 3 * G1 + G2 + 11,
        };
        std::size_t scalars = 3 * G1 + G2 + GT;
        for (std::size_t i = 0; i < 7; ++i) positions.push_back(scalars + i * FR + 3);

        for (std::size_t pos : positions) {
            CAPTURE(pos);
            REQUIRE_FALSE(tampered_accepted(grpkey, raw, pos, message));
        }
    }

    SECTION("Serialization") {
        cpy06::Signature sig = cpy06::sign(grpkey, bob.key, msg("hello"));
        cpy06::Signature dec = cpy06::Signature::from_bytes(sig.to_bytes());
        REQUIRE(dec.to_bytes() == sig.to_bytes());
        REQUIRE(cpy06::verify(grpkey, dec, msg("hello")));

        Bytes longer = sig.to_bytes();
        longer.push_back(0);
        REQUIRE_THROWS_AS(cpy06::Signature::from_bytes(longer), ecgroup::DecodeError);
    }
}

TEST_CASE("CPY06 key layouts", "[cpy06]") {
    TestGroup group = create_group();
    TestMember m = group.join();

    REQUIRE(cpy06::GroupKey::SERIALIZED_SIZE == 3264);
    REQUIRE(cpy06::Signature::SERIALIZED_SIZE == 1040);

    Bytes gk = group.keys.grpkey.to_bytes();
    REQUIRE(gk.size() == cpy06::GroupKey::SERIALIZED_SIZE);
    REQUIRE(cpy06::GroupKey::from_bytes(gk).to_bytes() == gk);

    Bytes mk = group.keys.mgrkey.to_bytes();
    REQUIRE(mk.size() == cpy06::ManagerKey::SERIALIZED_SIZE);
    REQUIRE(cpy06::ManagerKey::from_bytes(mk).to_bytes() == mk);

    Bytes rk = group.keys.revkey.to_bytes();
    REQUIRE(rk.size() == cpy06::RevocationManagerKey::SERIALIZED_SIZE);
    REQUIRE(cpy06::RevocationManagerKey::from_bytes(rk).to_bytes() == rk);

    Bytes memk = m.key.to_bytes();
    REQUIRE(memk.size() == cpy06::MemberKey::SERIALIZED_SIZE);
    REQUIRE(cpy06::MemberKey::from_bytes(memk).to_bytes() == memk);

    REQUIRE_THROWS_AS(cpy06::ManagerKey::from_bytes(rk), ecgroup::DecodeError);
    REQUIRE_THROWS_AS(cpy06::MemberKey::from_bytes(Bytes()), ecgroup::DecodeError);
}

TEST_CASE("CPY06 split-trust opening", "[cpy06]") {
    TestGroup group = create_group();
    TestMember alice = group.join();
    TestMember bob = group.join();
    const auto& keys = group.keys;

    cpy06::Signature sig = cpy06::sign(keys.grpkey, bob.key, msg("who signed this?"));

    auto gm = cpy06::open_group_manager(keys.mgrkey, sig);
    auto rm = cpy06::open_revocation_manager(keys.revkey, sig, gm);

    SECTION("Both partials recover the signer") {
        REQUIRE(cpy06::recover_discriminator(sig, gm, rm) == bob.key.A);
        auto id = cpy06::open_combine(sig, gm, rm, group.gml);
        REQUIRE(id.ok());
        REQUIRE(id.value() == bob.id);
        REQUIRE(id.value() != alice.id);
    }

    SECTION("One manager's shares alone do not open") {
        // Substitute the missing share with zero
        cpy06::RevocationManagerPartial no_rm;
        REQUIRE_FALSE(cpy06::recover_discriminator(sig, gm, no_rm) == bob.key.A);
        auto gm_only = cpy06::open_combine(sig, gm, no_rm, group.gml);
        REQUIRE_FALSE(gm_only.ok());
        REQUIRE(gm_only.code() == grpsig::ErrorCode::NotFound);

        cpy06::GroupManagerPartial no_gm;
        auto rm_only = cpy06::open_combine(sig, no_gm, rm, group.gml);
        REQUIRE(rm_only.code() == grpsig::ErrorCode::NotFound);
    }

    SECTION("Unknown signer is NotFound") {
        grpsig::Registry empty(std::make_shared<grpsig::MemoryStore>());
        auto id = cpy06::open_combine(sig, gm, rm, empty);
        REQUIRE(id.code() == grpsig::ErrorCode::NotFound);
    }

    SECTION("member_id matches the GML entry") {
        auto entry = group.gml.find(bob.id);
        REQUIRE(entry.has_value());
        REQUIRE(cpy06::member_id(entry->A, entry->pi) == bob.id);
        REQUIRE(entry->pi == ecgroup::G1Point::get_generator() * bob.key.x);
    }
}

TEST_CASE("CPY06 revocation", "[cpy06]") {
    TestGroup group = create_group();
    TestMember alice = group.join();
    TestMember bob = group.join();
    const auto& grpkey = group.keys.grpkey;

    cpy06::Signature a_sig = cpy06::sign(grpkey, alice.key, msg("a"));
    cpy06::Signature b_sig = cpy06::sign(grpkey, bob.key, msg("b"));

    REQUIRE_FALSE(cpy06::trace(a_sig, group.crl));
    REQUIRE_FALSE(cpy06::trace(b_sig, group.crl));

    REQUIRE(cpy06::reveal(alice.id, group.gml, group.crl).ok());
    REQUIRE(cpy06::reveal(alice.id, group.gml, group.crl).ok());
    REQUIRE(group.crl.size() == 1);

    REQUIRE(cpy06::trace(a_sig, group.crl));
    REQUIRE(cpy06::trace(cpy06::sign(grpkey, alice.key, msg("later")), group.crl));
    REQUIRE_FALSE(cpy06::trace(b_sig, group.crl));

    auto unknown = cpy06::reveal(std::string(64, '0'), group.gml, group.crl);
    REQUIRE(unknown.code() == grpsig::ErrorCode::NotFound);
}

TEST_CASE("CPY06 claim and prove-equality", "[cpy06]") {
    TestGroup group = create_group();
    TestMember alice = group.join();
    TestMember bob = group.join();
    const auto& grpkey = group.keys.grpkey;

    cpy06::Signature a1 = cpy06::sign(grpkey, alice.key, msg("one"));
    cpy06::Signature a2 = cpy06::sign(grpkey, alice.key, msg("two"));
    cpy06::Signature b1 = cpy06::sign(grpkey, bob.key, msg("three"));

    SECTION("Claim") {
        auto proof = cpy06::claim(alice.key, a1);
        REQUIRE(proof.ok());
        REQUIRE(cpy06::claim_verify(a1, proof.value()));
        REQUIRE_FALSE(cpy06::claim_verify(b1, proof.value()));

        auto wrong = cpy06::claim(bob.key, a1);
        REQUIRE_FALSE(cpy06::claim_verify(a1, wrong.value()));

        auto dec = cpy06::EqualityProof::from_bytes(proof.value().to_bytes());
        REQUIRE(cpy06::claim_verify(a1, dec));
    }

    SECTION("Same signer set verifies, mixed set does not") {
        auto same = cpy06::prove_equality(alice.key, {a1, a2});
        REQUIRE(same.ok());
        REQUIRE(cpy06::prove_equality_verify({a1, a2}, same.value()));

        auto mixed = cpy06::prove_equality(alice.key, {a1, b1});
        REQUIRE(mixed.ok());
        REQUIRE_FALSE(cpy06::prove_equality_verify({a1, b1}, mixed.value()));

        REQUIRE_FALSE(cpy06::prove_equality_verify({a1}, same.value()));
    }

    SECTION("Empty signature list") {
        auto none = cpy06::prove_equality(alice.key, {});
        REQUIRE(none.code() == grpsig::ErrorCode::Protocol);
        REQUIRE_FALSE(cpy06::prove_equality_verify({}, cpy06::EqualityProof()));
    }
}

TEST_CASE("CPY06 end-to-end attribution of a record", "[cpy06][e2e]") {
    TestGroup group = create_group();
    group.join();
    TestMember doctor = group.join();
    group.join();

    cpy06::Signature sig = cpy06::sign(group.keys.grpkey, doctor.key, msg("record-42"));
    REQUIRE(cpy06::verify(group.keys.grpkey, sig, msg("record-42")));

    auto gm = cpy06::open_group_manager(group.keys.mgrkey, sig);
    auto rm = cpy06::open_revocation_manager(group.keys.revkey, sig, gm);
    auto who = cpy06::open_combine(sig, gm, rm, group.gml);

    REQUIRE(who.ok());
    REQUIRE(who.value() == doctor.id);
}
