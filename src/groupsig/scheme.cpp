#include "scheme.hpp"
#include "cpy06_scheme.hpp"
#include "../helpers.hpp"

#include <stdexcept>
#include <utility>

namespace grpsig {

using namespace grpsig::utils;

const char* scheme_name(SchemeId id) {
    switch (id) {
        case SchemeId::Cpy06: return cpy06::SCHEME_NAME;
    }
    return "unknown";
}

SchemeId scheme_from_name(const std::string& name) {
    if (name == cpy06::SCHEME_NAME) return SchemeId::Cpy06;
    throw std::invalid_argument("unknown group signature scheme: " + name);
}

Bytes JoinMessage::to_bytes() const {
    Bytes out;
    append_u32_be(out, phase);
    append_lp(out, payload);
    return out;
}

JoinMessage JoinMessage::from_bytes(const Bytes& data) {
    JoinMessage m;
    std::size_t off = 0;
    m.phase   = read_u32_be(data, off);
    m.payload = read_lp(data, off);
    if (off != data.size()) throw ecgroup::DecodeError("JoinMessage: trailing bytes");
    return m;
}

namespace {

std::shared_ptr<KeyValueStore> or_memory(std::shared_ptr<KeyValueStore> store) {
    if (store) return store;
    return std::make_shared<MemoryStore>();
}

} // namespace

Scheme::Scheme(Stores stores)
    : gml_(or_memory(std::move(stores.gml))), crl_(or_memory(std::move(stores.crl))) {
    ecgroup::init_pairing();
}

Outcome<std::string> Scheme::sign(const Bytes& msg) {
    Outcome<std::string> key = export_key(ObjectKind::Member);
    if (!key.ok()) return key.status();
    return sign(msg, key.value());
}

Status Scheme::unsupported(const char* op) const {
    return Status::Error(ErrorCode::Unsupported, name() + " does not support " + op);
}

Outcome<std::string> Scheme::open(const std::string&) {
    return unsupported("open");
}

Outcome<std::string> Scheme::open(const std::string&, const std::string&) {
    return unsupported("open");
}

Outcome<std::string> Scheme::open(const std::string&, const std::string&, const std::string&) {
    return unsupported("open");
}

Status Scheme::reveal(const std::string&) {
    return unsupported("reveal");
}

Outcome<bool> Scheme::trace(const std::string&) {
    return unsupported("trace");
}

Outcome<std::string> Scheme::claim(const std::string&, const std::string&) {
    return unsupported("claim");
}

Outcome<bool> Scheme::claim_verify(const std::string&, const std::string&) {
    return unsupported("claim_verify");
}

Outcome<std::string> Scheme::prove_equality(const std::vector<std::string>&, const std::string&) {
    return unsupported("prove_equality");
}

Outcome<bool> Scheme::prove_equality_verify(const std::vector<std::string>&, const std::string&) {
    return unsupported("prove_equality_verify");
}

std::unique_ptr<Scheme> make_scheme(SchemeId id, Stores stores) {
    switch (id) {
        case SchemeId::Cpy06: return std::make_unique<cpy06::Cpy06Scheme>(std::move(stores));
    }
    throw std::invalid_argument("make_scheme: unknown scheme id");
}

} // namespace grpsig
