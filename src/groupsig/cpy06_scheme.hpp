#ifndef GRPSIG_CPY06_SCHEME_HPP
#define GRPSIG_CPY06_SCHEME_HPP

#include "scheme.hpp"
#include "cpy06.hpp"
#include "cpy06_join.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cpy06 {

// Join phases on the wire
constexpr uint32_t PHASE_CHALLENGE  = 0;  // manager -> member
constexpr uint32_t PHASE_COMMITMENT = 1;  // member -> manager
constexpr uint32_t PHASE_CREDENTIAL = 2;  // manager -> member
constexpr uint32_t PHASE_COMPLETE   = 3;  // member stores its key

// -----------------------------------------------------------------------------
// Cpy06Scheme - CPY06 behind the generic Scheme interface. Holds whichever
// keys the local party owns and the join sessions in flight.
// -----------------------------------------------------------------------------
class Cpy06Scheme : public grpsig::Scheme {
public:
    explicit Cpy06Scheme(grpsig::Stores stores);

    grpsig::SchemeId id() const override { return grpsig::SchemeId::Cpy06; }
    uint32_t capabilities() const override;

    void setup() override;
    grpsig::Outcome<std::string> export_key(grpsig::ObjectKind kind) const override;
    void import_key(const std::string& envelope) override;
    bool has_key(grpsig::ObjectKind kind) const override;

    uint32_t join_start() const override { return PHASE_CHALLENGE; }
    uint32_t join_seq() const override { return PHASE_COMPLETE; }

    grpsig::Outcome<grpsig::JoinMessage> join_mgr(const std::optional<grpsig::JoinMessage>& msg) override;
    grpsig::Outcome<grpsig::JoinReply>   join_mem(const grpsig::JoinMessage& msg) override;
    grpsig::Status                       join_abort(const grpsig::JoinMessage& msg) override;

    using grpsig::Scheme::sign;
    grpsig::Outcome<std::string> sign(const Bytes& msg, const std::string& member_key) override;
    bool verify(const Bytes& msg, const std::string& signature) override;

    grpsig::Outcome<std::string> open(const std::string& signature) override;
    grpsig::Outcome<std::string> open(const std::string& signature,
                                      const std::string& gm_partial) override;
    grpsig::Outcome<std::string> open(const std::string& signature,
                                      const std::string& gm_partial,
                                      const std::string& rm_partial) override;

    grpsig::Status        reveal(const std::string& member_id) override;
    grpsig::Outcome<bool> trace(const std::string& signature) override;

    grpsig::Outcome<std::string> claim(const std::string& signature,
                                       const std::string& member_key) override;
    grpsig::Outcome<bool>        claim_verify(const std::string& signature,
                                              const std::string& proof) override;

    grpsig::Outcome<std::string> prove_equality(const std::vector<std::string>& signatures,
                                                const std::string& member_key) override;
    grpsig::Outcome<bool>        prove_equality_verify(const std::vector<std::string>& signatures,
                                                       const std::string& proof) override;

    // Number of join sessions awaiting their next message, per role.
    std::size_t pending_manager_joins() const;
    std::size_t pending_member_joins() const;

private:
    std::optional<GroupKey>             group_key() const;
    std::optional<ManagerKey>           manager_key() const;
    std::optional<RevocationManagerKey> revocation_key() const;

    Signature decode_signature(const std::string& envelope) const;

    mutable std::mutex                  keys_mu_;
    std::optional<GroupKey>             grpkey_;
    std::optional<ManagerKey>           mgrkey_;
    std::optional<RevocationManagerKey> revkey_;
    std::optional<MemberKey>            memkey_;

    mutable std::mutex                                         join_mu_;
    std::map<std::string, std::unique_ptr<ManagerJoinSession>> mgr_sessions_;
    std::map<std::string, std::unique_ptr<MemberJoinSession>>  mem_sessions_;
};

} // namespace cpy06

#endif // GRPSIG_CPY06_SCHEME_HPP
