#include <catch2/catch_test_macros.hpp>

#include "crypto/ecgroup.hpp"

#include <vector>

TEST_CASE("Elliptic Curve Group Operations", "[ecgroup]") {
    ecgroup::init_pairing();

    SECTION("Scalar operations") {
        ecgroup::Scalar s1 = ecgroup::Scalar::get_random();
        ecgroup::Scalar s2 = ecgroup::Scalar::get_random();

        REQUIRE(s1 == s1);
        REQUIRE_FALSE(s1 == s2);

        // s == (s^-1)^-1 and s·s^-1 == 1
        REQUIRE(s1 == s1.inverse().inverse());
        REQUIRE(s1 * s1.inverse() == ecgroup::Scalar::from_int(1));

        REQUIRE((s1 + s1.negate()).is_zero());
        REQUIRE(s1 - s2 == s1 + (-s2));
        REQUIRE(ecgroup::Scalar::from_int(2) + ecgroup::Scalar::from_int(3) ==
                ecgroup::Scalar::from_int(5));

        ecgroup::Scalar h1 = ecgroup::Scalar::hash_to_scalar("test message");
        ecgroup::Scalar h2 = ecgroup::Scalar::hash_to_scalar("test message");
        ecgroup::Scalar h3 = ecgroup::Scalar::hash_to_scalar("another message");
        REQUIRE(h1 == h2);
        REQUIRE_FALSE(h1 == h3);
    }

    SECTION("G1Point operations") {
        ecgroup::G1Point p1 = ecgroup::G1Point::hash_and_map_to("hello world");
        ecgroup::G1Point p2 = ecgroup::G1Point::hash_and_map_to("another message");
        REQUIRE(p1 == ecgroup::G1Point::hash_and_map_to("hello world"));
        REQUIRE_FALSE(p1 == p2);

        REQUIRE((p1 + p2) - p2 == p1);
        REQUIRE((p1 + p1.negate()).is_zero());

        ecgroup::Scalar a = ecgroup::Scalar::get_random();
        ecgroup::Scalar b = ecgroup::Scalar::get_random();
        REQUIRE(p1 * (a + b) == p1 * a + p1 * b);
        REQUIRE(ecgroup::G1Point::mul_sum({p1, p2}, {a, b}) == p1 * a + p2 * b);

        ecgroup::G1Point identity;
        REQUIRE(identity.is_zero());
        REQUIRE_FALSE(ecgroup::G1Point::get_random() == identity);
    }

    SECTION("G2Point operations") {
        ecgroup::G2Point g = ecgroup::G2Point::get_generator();
        REQUIRE(g == ecgroup::G2Point::get_generator());

        ecgroup::Scalar s1 = ecgroup::Scalar::get_random();
        ecgroup::Scalar s2 = ecgroup::Scalar::get_random();
        REQUIRE_FALSE(g * s1 == g * s2);
        REQUIRE(g * s1 + g * s2 == g * (s1 + s2));

        ecgroup::G2Point identity;
        REQUIRE(identity.is_zero());
        REQUIRE_FALSE(ecgroup::G2Point::get_random() == identity);
    }

    SECTION("Pairing properties") {
        ecgroup::Scalar s = ecgroup::Scalar::get_random();
        ecgroup::G1Point p = ecgroup::G1Point::hash_and_map_to("test point");
        ecgroup::G2Point q = ecgroup::G2Point::get_generator();

        // e(s·P, Q) == e(P, s·Q) == e(P, Q)^s
        ecgroup::PairingResult e1 = ecgroup::pairing(p * s, q);
        ecgroup::PairingResult e2 = ecgroup::pairing(p, q * s);
        REQUIRE(e1 == e2);
        REQUIRE(e1 == ecgroup::pairing(p, q).pow(s));
        REQUIRE_FALSE(e1 == ecgroup::pairing(p, q));
    }

    SECTION("GT arithmetic") {
        ecgroup::PairingResult e = ecgroup::pairing(ecgroup::G1Point::get_generator(),
                                                    ecgroup::G2Point::get_generator());
        ecgroup::Scalar a = ecgroup::Scalar::get_random();
        ecgroup::Scalar b = ecgroup::Scalar::get_random();

        REQUIRE_FALSE(e.is_one());
        REQUIRE((e / e).is_one());
        REQUIRE((e * e.inverse()).is_one());
        REQUIRE(e.pow(a) * e.pow(b) == e.pow(a + b));
        REQUIRE(e.pow(a) / e.pow(b) == e.pow(a - b));
        REQUIRE(ecgroup::PairingResult::pow_prod({e, e}, {a, b}) == e.pow(a + b));
        REQUIRE(ecgroup::PairingResult().is_one());
    }

    SECTION("Serialization") {
        ecgroup::Scalar s1 = ecgroup::Scalar::get_random();
        REQUIRE(s1 == ecgroup::Scalar::from_string(s1.to_string()));
        REQUIRE(s1.to_bytes().size() == ecgroup::FR_SERIALIZED_SIZE);
        REQUIRE(s1 == ecgroup::Scalar::from_bytes(s1.to_bytes()));

        ecgroup::G1Point p1 = ecgroup::G1Point::get_random();
        REQUIRE(p1 == ecgroup::G1Point::from_string(p1.to_string()));
        REQUIRE(p1.to_bytes().size() == ecgroup::G1_SERIALIZED_SIZE);
        REQUIRE(p1 == ecgroup::G1Point::from_bytes(p1.to_bytes()));

        ecgroup::G2Point p2 = ecgroup::G2Point::get_random();
        REQUIRE(p2 == ecgroup::G2Point::from_string(p2.to_string()));
        REQUIRE(p2.to_bytes().size() == ecgroup::G2_SERIALIZED_SIZE);
        REQUIRE(p2 == ecgroup::G2Point::from_bytes(p2.to_bytes()));

        ecgroup::PairingResult e = ecgroup::pairing(p1, p2);
        REQUIRE(e.to_bytes().size() == ecgroup::GT_SERIALIZED_SIZE);
        REQUIRE(e == ecgroup::PairingResult::from_bytes(e.to_bytes()));
    }

    SECTION("Malformed input is rejected") {
        ecgroup::Bytes short_scalar(ecgroup::FR_SERIALIZED_SIZE - 1, 0x01);
        REQUIRE_THROWS_AS(ecgroup::Scalar::from_bytes(short_scalar), ecgroup::DecodeError);

        // All-ones exceeds the group order
        ecgroup::Bytes big_scalar(ecgroup::FR_SERIALIZED_SIZE, 0xFF);
        REQUIRE_THROWS_AS(ecgroup::Scalar::from_bytes(big_scalar), ecgroup::DecodeError);

        ecgroup::Bytes p1 = ecgroup::G1Point::get_random().to_bytes();
        p1.push_back(0x00);
        REQUIRE_THROWS_AS(ecgroup::G1Point::from_bytes(p1), ecgroup::DecodeError);

        ecgroup::Bytes junk_g2(ecgroup::G2_SERIALIZED_SIZE, 0xFF);
        REQUIRE_THROWS_AS(ecgroup::G2Point::from_bytes(junk_g2), ecgroup::DecodeError);

        REQUIRE_THROWS_AS(ecgroup::Scalar::from_string("not hex"), ecgroup::DecodeError);

        // Canonical Fp12 encodings that are not in GT
        ecgroup::Bytes zero_gt(ecgroup::GT_SERIALIZED_SIZE, 0x00);
        REQUIRE_THROWS_AS(ecgroup::PairingResult::from_bytes(zero_gt), ecgroup::DecodeError);

        mcl::bn::Fp12 two;
        two.clear();
        two.a.a.a = 2;
        ecgroup::Bytes two_gt(ecgroup::GT_SERIALIZED_SIZE);
        REQUIRE(two.serialize(two_gt.data(), two_gt.size()) == two_gt.size());
        REQUIRE_THROWS_AS(ecgroup::PairingResult::from_bytes(two_gt), ecgroup::DecodeError);

        // The identity and real pairing values still decode
        ecgroup::PairingResult e = ecgroup::pairing(ecgroup::G1Point::get_random(),
                                                    ecgroup::G2Point::get_random());
        REQUIRE(ecgroup::PairingResult::from_bytes(e.to_bytes()) == e);
        ecgroup::PairingResult one = e.pow(ecgroup::Scalar::from_int(0));
        REQUIRE(ecgroup::PairingResult::from_bytes(one.to_bytes()).is_one());
    }
}
