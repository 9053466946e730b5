#include "cpy06_scheme.hpp"
#include "../helpers.hpp"
#include "../logging.hpp"

#include <utility>

namespace cpy06 {

using grpsig::ErrorCode;
using grpsig::JoinMessage;
using grpsig::JoinReply;
using grpsig::ObjectKind;
using grpsig::Outcome;
using grpsig::Status;
using grpsig::decode_envelope;
using grpsig::encode_envelope;
using grpsig::utils::bytes_to_hex;

namespace {

grpsig::logging::Logger& logger() {
    static grpsig::logging::Logger l = grpsig::logging::get_logger("grpsig.cpy06.scheme");
    return l;
}

template <typename T>
std::string envelope_of(ObjectKind kind, const T& obj) {
    return encode_envelope(SCHEME_NAME, kind, obj.to_bytes());
}

template <typename T>
T object_of(ObjectKind kind, const std::string& envelope) {
    return T::from_bytes(decode_envelope(envelope, SCHEME_NAME, kind));
}

Status missing(const char* what) {
    return Status::Error(ErrorCode::MissingKey, std::string("cpy06: no ") + what + " loaded");
}

} // namespace

Cpy06Scheme::Cpy06Scheme(grpsig::Stores stores) : grpsig::Scheme(std::move(stores)) {}

uint32_t Cpy06Scheme::capabilities() const {
    namespace cap = grpsig::capability;
    return cap::Open | cap::Reveal | cap::Trace | cap::Claim | cap::ProveEquality;
}

// -----------------------------------------------------------------------------
// Keys
// -----------------------------------------------------------------------------

void Cpy06Scheme::setup() {
    SetupResult keys = cpy06::setup();
    std::lock_guard<std::mutex> lock(keys_mu_);
    grpkey_ = std::move(keys.grpkey);
    mgrkey_ = std::move(keys.mgrkey);
    revkey_ = std::move(keys.revkey);
    LOG_INFO(logger(), "new group created");
}

Outcome<std::string> Cpy06Scheme::export_key(ObjectKind kind) const {
    std::lock_guard<std::mutex> lock(keys_mu_);
    switch (kind) {
        case ObjectKind::Group:
            if (grpkey_) return envelope_of(kind, *grpkey_);
            return missing("group key");
        case ObjectKind::Manager:
            if (mgrkey_) return envelope_of(kind, *mgrkey_);
            return missing("manager key");
        case ObjectKind::RevocationManager:
            if (revkey_) return envelope_of(kind, *revkey_);
            return missing("revocation manager key");
        case ObjectKind::Member:
            if (memkey_) return envelope_of(kind, *memkey_);
            return missing("member key");
        default:
            break;
    }
    return Outcome<std::string>::Error(ErrorCode::Protocol,
                                       std::string("not a key kind: ") + grpsig::to_string(kind));
}

void Cpy06Scheme::import_key(const std::string& envelope) {
    grpsig::Envelope env = grpsig::Envelope::parse(envelope);
    if (env.scheme != SCHEME_NAME) {
        throw ecgroup::DecodeError("cpy06: envelope belongs to scheme " + env.scheme);
    }

    switch (env.kind) {
        case ObjectKind::Group: {
            GroupKey k = GroupKey::from_bytes(env.payload);
            std::lock_guard<std::mutex> lock(keys_mu_);
            grpkey_ = std::move(k);
            break;
        }
        case ObjectKind::Manager: {
            ManagerKey k = ManagerKey::from_bytes(env.payload);
            std::lock_guard<std::mutex> lock(keys_mu_);
            mgrkey_ = std::move(k);
            break;
        }
        case ObjectKind::RevocationManager: {
            RevocationManagerKey k = RevocationManagerKey::from_bytes(env.payload);
            std::lock_guard<std::mutex> lock(keys_mu_);
            revkey_ = std::move(k);
            break;
        }
        case ObjectKind::Member: {
            MemberKey k = MemberKey::from_bytes(env.payload);
            std::lock_guard<std::mutex> lock(keys_mu_);
            memkey_ = std::move(k);
            break;
        }
        default:
            throw ecgroup::DecodeError(std::string("cpy06: cannot import a ") +
                                       grpsig::to_string(env.kind));
    }
    LOG_DEBUG(logger(), "imported " << grpsig::to_string(env.kind) << " key");
}

bool Cpy06Scheme::has_key(ObjectKind kind) const {
    std::lock_guard<std::mutex> lock(keys_mu_);
    switch (kind) {
        case ObjectKind::Group:             return grpkey_.has_value();
        case ObjectKind::Manager:           return mgrkey_.has_value();
        case ObjectKind::RevocationManager: return revkey_.has_value();
        case ObjectKind::Member:            return memkey_.has_value();
        default:                            return false;
    }
}

std::optional<GroupKey> Cpy06Scheme::group_key() const {
    std::lock_guard<std::mutex> lock(keys_mu_);
    return grpkey_;
}

std::optional<ManagerKey> Cpy06Scheme::manager_key() const {
    std::lock_guard<std::mutex> lock(keys_mu_);
    return mgrkey_;
}

std::optional<RevocationManagerKey> Cpy06Scheme::revocation_key() const {
    std::lock_guard<std::mutex> lock(keys_mu_);
    return revkey_;
}

Signature Cpy06Scheme::decode_signature(const std::string& envelope) const {
    return object_of<Signature>(ObjectKind::Signature, envelope);
}

// -----------------------------------------------------------------------------
// Join
// -----------------------------------------------------------------------------

Outcome<JoinMessage> Cpy06Scheme::join_mgr(const std::optional<JoinMessage>& msg) {
    auto grpkey = group_key();
    auto mgrkey = manager_key();
    if (!grpkey) return missing("group key");
    if (!mgrkey) return missing("manager key");

    if (!msg) {
        auto session = std::make_unique<ManagerJoinSession>(*grpkey, *mgrkey, gml());
        Outcome<JoinChallenge> challenge = session->start();
        if (!challenge.ok()) return challenge.status();

        std::string sid = bytes_to_hex(session->session());
        {
            std::lock_guard<std::mutex> lock(join_mu_);
            mgr_sessions_.emplace(sid, std::move(session));
        }

        JoinMessage out;
        out.phase   = PHASE_CHALLENGE;
        out.payload = challenge.value().to_bytes();
        return out;
    }

    if (msg->phase != PHASE_COMMITMENT) {
        return Outcome<JoinMessage>::Error(
            ErrorCode::Protocol, "join_mgr: unexpected phase " + std::to_string(msg->phase));
    }

    JoinCommitment commitment = JoinCommitment::from_bytes(msg->payload);
    std::string sid = bytes_to_hex(commitment.session);

    // A session is used once: take it out before issuing.
    std::unique_ptr<ManagerJoinSession> session;
    {
        std::lock_guard<std::mutex> lock(join_mu_);
        auto it = mgr_sessions_.find(sid);
        if (it != mgr_sessions_.end()) {
            session = std::move(it->second);
            mgr_sessions_.erase(it);
        }
    }
    if (!session) {
        LOG_WARN(logger(), "join_mgr: no pending session " << sid);
        return Outcome<JoinMessage>::Error(ErrorCode::Protocol, "unknown or finished join session");
    }

    Outcome<JoinCredential> credential = session->issue(commitment);
    if (!credential.ok()) return credential.status();

    JoinMessage out;
    out.phase   = PHASE_CREDENTIAL;
    out.payload = credential.value().to_bytes();
    return out;
}

Outcome<JoinReply> Cpy06Scheme::join_mem(const JoinMessage& msg) {
    auto grpkey = group_key();
    if (!grpkey) return missing("group key");

    if (msg.phase == PHASE_CHALLENGE) {
        JoinChallenge challenge = JoinChallenge::from_bytes(msg.payload);
        auto session = std::make_unique<MemberJoinSession>(*grpkey);
        Outcome<JoinCommitment> commitment = session->respond(challenge);
        if (!commitment.ok()) return commitment.status();

        {
            std::lock_guard<std::mutex> lock(join_mu_);
            mem_sessions_[bytes_to_hex(challenge.session)] = std::move(session);
        }

        JoinMessage next;
        next.phase   = PHASE_COMMITMENT;
        next.payload = commitment.value().to_bytes();
        JoinReply reply;
        reply.next = std::move(next);
        return reply;
    }

    if (msg.phase != PHASE_CREDENTIAL) {
        return Outcome<JoinReply>::Error(
            ErrorCode::Protocol, "join_mem: unexpected phase " + std::to_string(msg.phase));
    }

    JoinCredential credential = JoinCredential::from_bytes(msg.payload);
    std::string sid = bytes_to_hex(credential.session);

    std::unique_ptr<MemberJoinSession> session;
    {
        std::lock_guard<std::mutex> lock(join_mu_);
        auto it = mem_sessions_.find(sid);
        if (it != mem_sessions_.end()) {
            session = std::move(it->second);
            mem_sessions_.erase(it);
        }
    }
    if (!session) {
        return Outcome<JoinReply>::Error(ErrorCode::Protocol, "unknown or finished join session");
    }

    Outcome<MemberKey> key = session->finish(credential);
    if (!key.ok()) return key.status();

    {
        std::lock_guard<std::mutex> lock(keys_mu_);
        memkey_ = key.value();
    }

    JoinReply reply;
    reply.member_key = envelope_of(ObjectKind::Member, key.value());
    return reply;
}

grpsig::Status Cpy06Scheme::join_abort(const JoinMessage& msg) {
    Bytes session;
    switch (msg.phase) {
        case PHASE_CHALLENGE:  session = JoinChallenge::from_bytes(msg.payload).session; break;
        case PHASE_COMMITMENT: session = JoinCommitment::from_bytes(msg.payload).session; break;
        case PHASE_CREDENTIAL: session = JoinCredential::from_bytes(msg.payload).session; break;
        default:
            return Status::Error(ErrorCode::Protocol,
                                 "join_abort: unexpected phase " + std::to_string(msg.phase));
    }

    std::string sid = bytes_to_hex(session);
    std::size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(join_mu_);
        dropped += mgr_sessions_.erase(sid);
        dropped += mem_sessions_.erase(sid);
    }
    if (dropped == 0) {
        return Status::Error(ErrorCode::NotFound, "no pending join session " + sid);
    }
    LOG_DEBUG(logger(), "join session " << sid << " aborted");
    return Status::Ok();
}

std::size_t Cpy06Scheme::pending_manager_joins() const {
    std::lock_guard<std::mutex> lock(join_mu_);
    return mgr_sessions_.size();
}

std::size_t Cpy06Scheme::pending_member_joins() const {
    std::lock_guard<std::mutex> lock(join_mu_);
    return mem_sessions_.size();
}

// -----------------------------------------------------------------------------
// Sign / Verify
// -----------------------------------------------------------------------------

Outcome<std::string> Cpy06Scheme::sign(const Bytes& msg, const std::string& member_key) {
    auto grpkey = group_key();
    if (!grpkey) return missing("group key");

    MemberKey memkey = object_of<MemberKey>(ObjectKind::Member, member_key);
    return envelope_of(ObjectKind::Signature, cpy06::sign(*grpkey, memkey, msg));
}

bool Cpy06Scheme::verify(const Bytes& msg, const std::string& signature) {
    auto grpkey = group_key();
    if (!grpkey) {
        LOG_ERROR(logger(), "verify: no group key loaded");
        return false;
    }
    return cpy06::verify(*grpkey, decode_signature(signature), msg);
}

// -----------------------------------------------------------------------------
// Open / Reveal / Trace
// -----------------------------------------------------------------------------

Outcome<std::string> Cpy06Scheme::open(const std::string& signature) {
    auto mgrkey = manager_key();
    if (!mgrkey) return missing("manager key");

    Signature sig = decode_signature(signature);
    return envelope_of(ObjectKind::GroupManagerPartial, open_group_manager(*mgrkey, sig));
}

Outcome<std::string> Cpy06Scheme::open(const std::string& signature, const std::string& gm_partial) {
    auto revkey = revocation_key();
    if (!revkey) return missing("revocation manager key");

    Signature sig = decode_signature(signature);
    auto gm = object_of<GroupManagerPartial>(ObjectKind::GroupManagerPartial, gm_partial);
    return envelope_of(ObjectKind::RevocationManagerPartial,
                       open_revocation_manager(*revkey, sig, gm));
}

Outcome<std::string> Cpy06Scheme::open(const std::string& signature, const std::string& gm_partial,
                                       const std::string& rm_partial) {
    Signature sig = decode_signature(signature);
    auto gm = object_of<GroupManagerPartial>(ObjectKind::GroupManagerPartial, gm_partial);
    auto rm = object_of<RevocationManagerPartial>(ObjectKind::RevocationManagerPartial, rm_partial);
    return open_combine(sig, gm, rm, gml());
}

Status Cpy06Scheme::reveal(const std::string& member_id) {
    return cpy06::reveal(member_id, gml(), crl());
}

Outcome<bool> Cpy06Scheme::trace(const std::string& signature) {
    return cpy06::trace(decode_signature(signature), crl());
}

// -----------------------------------------------------------------------------
// Claim / Prove-equality
// -----------------------------------------------------------------------------

Outcome<std::string> Cpy06Scheme::claim(const std::string& signature, const std::string& member_key) {
    Signature sig = decode_signature(signature);
    MemberKey memkey = object_of<MemberKey>(ObjectKind::Member, member_key);

    Outcome<EqualityProof> proof = cpy06::claim(memkey, sig);
    if (!proof.ok()) return proof.status();
    return envelope_of(ObjectKind::Proof, proof.value());
}

Outcome<bool> Cpy06Scheme::claim_verify(const std::string& signature, const std::string& proof) {
    Signature sig = decode_signature(signature);
    auto p = object_of<EqualityProof>(ObjectKind::Proof, proof);
    return cpy06::claim_verify(sig, p);
}

Outcome<std::string> Cpy06Scheme::prove_equality(const std::vector<std::string>& signatures,
                                                 const std::string& member_key) {
    std::vector<Signature> sigs;
    sigs.reserve(signatures.size());
    for (const auto& s : signatures) sigs.push_back(decode_signature(s));
    MemberKey memkey = object_of<MemberKey>(ObjectKind::Member, member_key);

    Outcome<EqualityProof> proof = cpy06::prove_equality(memkey, sigs);
    if (!proof.ok()) return proof.status();
    return envelope_of(ObjectKind::Proof, proof.value());
}

Outcome<bool> Cpy06Scheme::prove_equality_verify(const std::vector<std::string>& signatures,
                                                 const std::string& proof) {
    if (signatures.empty()) {
        return Outcome<bool>::Error(ErrorCode::Protocol, "prove_equality_verify: no signatures");
    }
    std::vector<Signature> sigs;
    sigs.reserve(signatures.size());
    for (const auto& s : signatures) sigs.push_back(decode_signature(s));
    auto p = object_of<EqualityProof>(ObjectKind::Proof, proof);
    return cpy06::prove_equality_verify(sigs, p);
}

} // namespace cpy06
