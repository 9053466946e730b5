#ifndef GRPSIG_CPY06_JOIN_HPP
#define GRPSIG_CPY06_JOIN_HPP

#include "cpy06.hpp"
#include "registry.hpp"
#include "status.hpp"
#include "../crypto/spk.hpp"

#include <cstdint>
#include <string>

namespace cpy06 {

constexpr std::size_t SESSION_ID_SIZE = 16;

// -----------------------------------------------------------------------------
// Join messages, one per protocol step
// -----------------------------------------------------------------------------

// Manager -> member
struct JoinChallenge {
    Bytes  session;
    Scalar u;
    Scalar v;

    Bytes to_bytes() const;
    static JoinChallenge from_bytes(const Bytes& data);
};

// Member -> manager
struct JoinCommitment {
    Bytes         session;
    G1Point       I;      // y·g1 + r·Q
    G1Point       pi;     // x·g1
    spk::RepProof proof;

    Bytes to_bytes() const;
    static JoinCommitment from_bytes(const Bytes& data);
};

// Manager -> member
struct JoinCredential {
    Bytes   session;
    Scalar  t;
    G1Point A;

    Bytes to_bytes() const;
    static JoinCredential from_bytes(const Bytes& data);
};

// Statement proven in JoinCommitment: pi = x·g1 and pi = v·g1 + u·I + rr·Q,
// witnesses (x, v, u, rr).
spk::RepStatement join_statement(const GroupKey& grpkey, const G1Point& I, const G1Point& pi);

// pi || session || u || v
Bytes join_binding(const G1Point& pi, const Bytes& session, const Scalar& u, const Scalar& v);

// -----------------------------------------------------------------------------
// ManagerJoinSession
// -----------------------------------------------------------------------------
enum class ManagerJoinState : uint8_t {
    Init,
    AwaitingCommitment,
    Issued,
    Failed
};

const char* to_string(ManagerJoinState state);

class ManagerJoinSession {
public:
    ManagerJoinSession(GroupKey grpkey, ManagerKey mgrkey, grpsig::Registry gml);

    // Init -> AwaitingCommitment
    grpsig::Outcome<JoinChallenge> start();

    // AwaitingCommitment -> Issued | Failed. A session mismatch is a
    // protocol error and leaves the state unchanged.
    grpsig::Outcome<JoinCredential> issue(const JoinCommitment& msg);

    ManagerJoinState state() const { return state_; }
    const Bytes& session() const { return session_; }

    // GML id of the issued member; empty before Issued.
    const std::string& member_id() const { return member_id_; }

private:
    GroupKey         grpkey_;
    ManagerKey       mgrkey_;
    grpsig::Registry gml_;

    ManagerJoinState state_ = ManagerJoinState::Init;
    Bytes            session_;
    Scalar           u_;
    Scalar           v_;
    std::string      member_id_;
};

// -----------------------------------------------------------------------------
// MemberJoinSession
// -----------------------------------------------------------------------------
enum class MemberJoinState : uint8_t {
    AwaitingChallenge,
    AwaitingCredential,
    Complete,
    Failed
};

const char* to_string(MemberJoinState state);

class MemberJoinSession {
public:
    explicit MemberJoinSession(GroupKey grpkey);

    // AwaitingChallenge -> AwaitingCredential
    grpsig::Outcome<JoinCommitment> respond(const JoinChallenge& msg);

    // AwaitingCredential -> Complete | Failed
    grpsig::Outcome<MemberKey> finish(const JoinCredential& msg);

    MemberJoinState state() const { return state_; }
    const Bytes& session() const { return session_; }

private:
    GroupKey        grpkey_;
    MemberJoinState state_ = MemberJoinState::AwaitingChallenge;
    Bytes           session_;
    Scalar          x_;
    G1Point         pi_;
};

} // namespace cpy06

#endif // GRPSIG_CPY06_JOIN_HPP
