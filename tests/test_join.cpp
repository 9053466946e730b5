#include <catch2/catch_test_macros.hpp>

#include "groupsig/cpy06_join.hpp"
#include "test_helpers.hpp"

using namespace test_helpers;
using cpy06::ManagerJoinSession;
using cpy06::ManagerJoinState;
using cpy06::MemberJoinSession;
using cpy06::MemberJoinState;
using grpsig::ErrorCode;

TEST_CASE("CPY06 join state machines", "[join]") {
    TestGroup group = create_group();
    const auto& keys = group.keys;

    ManagerJoinSession mgr(keys.grpkey, keys.mgrkey, group.gml);
    MemberJoinSession mem(keys.grpkey);
    REQUIRE(mgr.state() == ManagerJoinState::Init);
    REQUIRE(mem.state() == MemberJoinState::AwaitingChallenge);

    SECTION("Honest run issues a valid credential") {
        auto challenge = mgr.start();
        REQUIRE(challenge.ok());
        REQUIRE(challenge.value().session.size() == cpy06::SESSION_ID_SIZE);
        REQUIRE(mgr.state() == ManagerJoinState::AwaitingCommitment);

        auto commitment = mem.respond(challenge.value());
        REQUIRE(commitment.ok());
        REQUIRE(mem.state() == MemberJoinState::AwaitingCredential);

        auto credential = mgr.issue(commitment.value());
        REQUIRE(credential.ok());
        REQUIRE(mgr.state() == ManagerJoinState::Issued);
        REQUIRE(group.gml.contains(mgr.member_id()));

        auto key = mem.finish(credential.value());
        REQUIRE(key.ok());
        REQUIRE(mem.state() == MemberJoinState::Complete);

        // A·(gamma + t) = x·g1 + Q
        const auto& k = key.value();
        REQUIRE(k.A * (keys.mgrkey.gamma + k.t) ==
                ecgroup::G1Point::get_generator() * k.x + keys.grpkey.Q);
        REQUIRE(cpy06::member_id(k.A, ecgroup::G1Point::get_generator() * k.x) == mgr.member_id());
    }

    SECTION("Out-of-order calls are protocol errors") {
        auto early = mem.finish(cpy06::JoinCredential());
        REQUIRE(early.code() == ErrorCode::Protocol);

        auto no_start = mgr.issue(cpy06::JoinCommitment());
        REQUIRE(no_start.code() == ErrorCode::Protocol);

        auto challenge = mgr.start();
        REQUIRE(mgr.start().code() == ErrorCode::Protocol);

        auto commitment = mem.respond(challenge.value());
        REQUIRE(mem.respond(challenge.value()).code() == ErrorCode::Protocol);

        REQUIRE(mgr.issue(commitment.value()).ok());
        // Replaying the commitment to a finished session
        REQUIRE(mgr.issue(commitment.value()).code() == ErrorCode::Protocol);
        REQUIRE(group.gml.size() == 1);
    }

    SECTION("Commitment for another session is a protocol error") {
        auto challenge = mgr.start();
        auto commitment = mem.respond(challenge.value());

        cpy06::JoinCommitment other = commitment.value();
        other.session[0] ^= 0xFF;
        REQUIRE(mgr.issue(other).code() == ErrorCode::Protocol);
        REQUIRE(mgr.state() == ManagerJoinState::AwaitingCommitment);
        REQUIRE(mgr.issue(commitment.value()).ok());
    }

    SECTION("A commitment proven for different u, v fails") {
        auto challenge = mgr.start();

        cpy06::JoinChallenge altered = challenge.value();
        altered.v = altered.v + ecgroup::Scalar::from_int(1);
        auto commitment = mem.respond(altered);
        REQUIRE(commitment.ok());

        auto credential = mgr.issue(commitment.value());
        REQUIRE(credential.code() == ErrorCode::Verification);
        REQUIRE(mgr.state() == ManagerJoinState::Failed);
        REQUIRE(group.gml.size() == 0);
    }

    SECTION("A tampered pi fails the proof") {
        auto challenge = mgr.start();
        auto commitment = mem.respond(challenge.value());

        cpy06::JoinCommitment bad = commitment.value();
        bad.pi = bad.pi + ecgroup::G1Point::get_generator();
        REQUIRE(mgr.issue(bad).code() == ErrorCode::Verification);
    }

    SECTION("A malformed credential is rejected by the member") {
        auto challenge = mgr.start();
        auto commitment = mem.respond(challenge.value());
        auto credential = mgr.issue(commitment.value());

        cpy06::JoinCredential bad = credential.value();
        bad.t = bad.t + ecgroup::Scalar::from_int(1);
        auto key = mem.finish(bad);
        REQUIRE(key.code() == ErrorCode::Verification);
        REQUIRE(mem.state() == MemberJoinState::Failed);
    }
}

TEST_CASE("CPY06 join messages on the wire", "[join]") {
    TestGroup group = create_group();
    ManagerJoinSession mgr(group.keys.grpkey, group.keys.mgrkey, group.gml);
    MemberJoinSession mem(group.keys.grpkey);

    auto challenge = mgr.start();
    auto challenge_rt = cpy06::JoinChallenge::from_bytes(challenge.value().to_bytes());
    REQUIRE(challenge_rt.session == challenge.value().session);
    REQUIRE(challenge_rt.u == challenge.value().u);

    auto commitment = mem.respond(challenge_rt);
    auto commitment_rt = cpy06::JoinCommitment::from_bytes(commitment.value().to_bytes());
    REQUIRE(commitment_rt.pi == commitment.value().pi);

    auto credential = mgr.issue(commitment_rt);
    REQUIRE(credential.ok());
    auto credential_rt = cpy06::JoinCredential::from_bytes(credential.value().to_bytes());
    REQUIRE(mem.finish(credential_rt).ok());

    Bytes trailing = credential.value().to_bytes();
    trailing.push_back(0);
    REQUIRE_THROWS_AS(cpy06::JoinCredential::from_bytes(trailing), ecgroup::DecodeError);

    REQUIRE_THROWS_AS(cpy06::JoinChallenge::from_bytes(Bytes(10, 0)), ecgroup::DecodeError);
}
