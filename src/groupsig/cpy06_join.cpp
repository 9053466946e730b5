#include "cpy06_join.hpp"
#include "codec.hpp"
#include "../helpers.hpp"
#include "../logging.hpp"

#include <utility>

namespace cpy06 {

using namespace grpsig::utils;
using grpsig::ErrorCode;
using grpsig::Outcome;
using grpsig::RegistryEntry;
using ecgroup::DecodeError;
using ecgroup::FR_SERIALIZED_SIZE;
using ecgroup::G1_SERIALIZED_SIZE;

namespace {

grpsig::logging::Logger& logger() {
    static grpsig::logging::Logger l = grpsig::logging::get_logger("grpsig.cpy06.join");
    return l;
}

Bytes read_session(const Bytes& data, std::size_t& off) {
    Bytes s = read_lp(data, off);
    if (s.size() != SESSION_ID_SIZE) throw DecodeError("join: bad session id length");
    return s;
}

void require_consumed(const Bytes& data, std::size_t off, const char* what) {
    if (off != data.size()) throw DecodeError(std::string(what) + ": trailing bytes");
}

} // namespace

// -----------------------------------------------------------------------------
// Messages
// -----------------------------------------------------------------------------

Bytes JoinChallenge::to_bytes() const {
    Bytes out;
    append_lp(out, session);
    append_raw(out, u.to_bytes());
    append_raw(out, v.to_bytes());
    return out;
}

JoinChallenge JoinChallenge::from_bytes(const Bytes& data) {
    JoinChallenge m;
    std::size_t off = 0;
    m.session = read_session(data, off);
    m.u = Scalar::from_bytes(read_raw(data, off, FR_SERIALIZED_SIZE));
    m.v = Scalar::from_bytes(read_raw(data, off, FR_SERIALIZED_SIZE));
    require_consumed(data, off, "JoinChallenge");
    return m;
}

Bytes JoinCommitment::to_bytes() const {
    Bytes out;
    append_lp(out, session);
    append_raw(out, I.to_bytes());
    append_raw(out, pi.to_bytes());
    append_lp(out, proof.to_bytes());
    return out;
}

JoinCommitment JoinCommitment::from_bytes(const Bytes& data) {
    JoinCommitment m;
    std::size_t off = 0;
    m.session = read_session(data, off);
    m.I  = G1Point::from_bytes(read_raw(data, off, G1_SERIALIZED_SIZE));
    m.pi = G1Point::from_bytes(read_raw(data, off, G1_SERIALIZED_SIZE));
    m.proof = spk::RepProof::from_bytes(read_lp(data, off));
    require_consumed(data, off, "JoinCommitment");
    return m;
}

Bytes JoinCredential::to_bytes() const {
    Bytes out;
    append_lp(out, session);
    append_raw(out, t.to_bytes());
    append_raw(out, A.to_bytes());
    return out;
}

JoinCredential JoinCredential::from_bytes(const Bytes& data) {
    JoinCredential m;
    std::size_t off = 0;
    m.session = read_session(data, off);
    m.t = Scalar::from_bytes(read_raw(data, off, FR_SERIALIZED_SIZE));
    m.A = G1Point::from_bytes(read_raw(data, off, G1_SERIALIZED_SIZE));
    require_consumed(data, off, "JoinCredential");
    return m;
}

spk::RepStatement join_statement(const GroupKey& grpkey, const G1Point& I, const G1Point& pi) {
    spk::RepStatement stmt;
    stmt.y = {pi, pi};
    stmt.g = {G1Point::get_generator(), I, grpkey.Q};
    // pi = x·g1
    spk::Relation knows_x;
    knows_x.terms.push_back(spk::Term{0, 0});
    // pi = v·g1 + u·I + rr·Q
    spk::Relation opens_commitment;
    opens_commitment.terms.push_back(spk::Term{1, 0});
    opens_commitment.terms.push_back(spk::Term{2, 1});
    opens_commitment.terms.push_back(spk::Term{3, 2});

    stmt.relations.push_back(knows_x);
    stmt.relations.push_back(opens_commitment);
    return stmt;
}

Bytes join_binding(const G1Point& pi, const Bytes& session, const Scalar& u, const Scalar& v) {
    Bytes out;
    append_lp(out, pi.to_bytes());
    append_lp(out, session);
    append_lp(out, u.to_bytes());
    append_lp(out, v.to_bytes());
    return out;
}

// -----------------------------------------------------------------------------
// Manager side
// -----------------------------------------------------------------------------

const char* to_string(ManagerJoinState state) {
    switch (state) {
        case ManagerJoinState::Init:               return "Init";
        case ManagerJoinState::AwaitingCommitment: return "AwaitingCommitment";
        case ManagerJoinState::Issued:             return "Issued";
        case ManagerJoinState::Failed:             return "Failed";
    }
    return "Unknown";
}

ManagerJoinSession::ManagerJoinSession(GroupKey grpkey, ManagerKey mgrkey, grpsig::Registry gml)
    : grpkey_(std::move(grpkey)), mgrkey_(std::move(mgrkey)), gml_(std::move(gml)) {}

Outcome<JoinChallenge> ManagerJoinSession::start() {
    if (state_ != ManagerJoinState::Init) {
        return Outcome<JoinChallenge>::Error(
            ErrorCode::Protocol, std::string("start called in state ") + to_string(state_));
    }

    session_ = random_bytes(SESSION_ID_SIZE);
    u_ = Scalar::get_random();
    v_ = Scalar::get_random();
    state_ = ManagerJoinState::AwaitingCommitment;

    LOG_DEBUG(logger(), "join " << bytes_to_hex(session_) << ": challenge sent");

    JoinChallenge msg;
    msg.session = session_;
    msg.u = u_;
    msg.v = v_;
    return msg;
}

Outcome<JoinCredential> ManagerJoinSession::issue(const JoinCommitment& msg) {
    if (state_ != ManagerJoinState::AwaitingCommitment) {
        return Outcome<JoinCredential>::Error(
            ErrorCode::Protocol, std::string("issue called in state ") + to_string(state_));
    }
    if (msg.session != session_) {
        LOG_WARN(logger(), "join " << bytes_to_hex(session_) << ": commitment for foreign session "
                                   << bytes_to_hex(msg.session));
        return Outcome<JoinCredential>::Error(ErrorCode::Protocol, "session id mismatch");
    }

    spk::RepStatement stmt = join_statement(grpkey_, msg.I, msg.pi);
    if (!spk::rep_verify(stmt, msg.proof, join_binding(msg.pi, session_, u_, v_))) {
        state_ = ManagerJoinState::Failed;
        LOG_ERROR(logger(), "join " << bytes_to_hex(session_) << ": commitment proof rejected");
        return Outcome<JoinCredential>::Error(ErrorCode::Verification, "invalid join proof");
    }

    // A = (pi + Q)·(gamma + t)^-1
    Scalar t = Scalar::get_random();
    while ((mgrkey_.gamma + t).is_zero()) t = Scalar::get_random();

    RegistryEntry entry;
    entry.A  = (msg.pi + grpkey_.Q) * (mgrkey_.gamma + t).inverse();
    entry.pi = msg.pi;
    member_id_ = gml_.add(entry);
    state_ = ManagerJoinState::Issued;

    LOG_INFO(logger(), "join " << bytes_to_hex(session_) << ": issued member " << member_id_);

    JoinCredential out;
    out.session = session_;
    out.t = t;
    out.A = entry.A;
    return out;
}

// -----------------------------------------------------------------------------
// Member side
// -----------------------------------------------------------------------------

const char* to_string(MemberJoinState state) {
    switch (state) {
        case MemberJoinState::AwaitingChallenge:  return "AwaitingChallenge";
        case MemberJoinState::AwaitingCredential: return "AwaitingCredential";
        case MemberJoinState::Complete:           return "Complete";
        case MemberJoinState::Failed:             return "Failed";
    }
    return "Unknown";
}

MemberJoinSession::MemberJoinSession(GroupKey grpkey) : grpkey_(std::move(grpkey)) {}

Outcome<JoinCommitment> MemberJoinSession::respond(const JoinChallenge& msg) {
    if (state_ != MemberJoinState::AwaitingChallenge) {
        return Outcome<JoinCommitment>::Error(
            ErrorCode::Protocol, std::string("respond called in state ") + to_string(state_));
    }

    const G1Point g1 = G1Point::get_generator();
    Scalar y = Scalar::get_random();
    Scalar r = Scalar::get_random();

    // I = y·g1 + r·Q, x = u·y + v, rr = -u·r
    G1Point I = G1Point::mul_sum({g1, grpkey_.Q}, {y, r});
    x_  = msg.u * y + msg.v;
    pi_ = g1 * x_;
    Scalar rr = -(msg.u * r);

    JoinCommitment out;
    out.session = msg.session;
    out.I  = I;
    out.pi = pi_;
    out.proof = spk::rep_prove(join_statement(grpkey_, I, pi_),
                               {x_, msg.v, msg.u, rr},
                               join_binding(pi_, msg.session, msg.u, msg.v));

    session_ = msg.session;
    state_ = MemberJoinState::AwaitingCredential;
    return out;
}

Outcome<MemberKey> MemberJoinSession::finish(const JoinCredential& msg) {
    if (state_ != MemberJoinState::AwaitingCredential) {
        return Outcome<MemberKey>::Error(
            ErrorCode::Protocol, std::string("finish called in state ") + to_string(state_));
    }
    if (msg.session != session_) {
        return Outcome<MemberKey>::Error(ErrorCode::Protocol, "session id mismatch");
    }

    const G1Point g1 = G1Point::get_generator();
    const G2Point g2 = G2Point::get_generator();

    // e(A, t·g2 + R) == e(x·g1 + Q, g2)
    PairingResult lhs = ecgroup::pairing(msg.A, g2 * msg.t + grpkey_.R);
    PairingResult rhs = ecgroup::pairing(pi_ + grpkey_.Q, g2);
    if (lhs != rhs) {
        state_ = MemberJoinState::Failed;
        LOG_ERROR(logger(), "join " << bytes_to_hex(session_) << ": credential check failed");
        return Outcome<MemberKey>::Error(ErrorCode::Verification, "credential does not verify");
    }

    MemberKey key;
    key.x = x_;
    key.t = msg.t;
    key.A = msg.A;
    state_ = MemberJoinState::Complete;
    LOG_DEBUG(logger(), "join " << bytes_to_hex(session_) << ": member key complete");
    return key;
}

} // namespace cpy06
