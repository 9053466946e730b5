#include "codec.hpp"
#include "../helpers.hpp"

#include <utility>

namespace grpsig {

using ecgroup::DecodeError;

const char* to_string(ObjectKind kind) {
    switch (kind) {
        case ObjectKind::Group:                    return "group";
        case ObjectKind::Manager:                  return "manager";
        case ObjectKind::RevocationManager:        return "revmanager";
        case ObjectKind::Member:                   return "member";
        case ObjectKind::Signature:                return "signature";
        case ObjectKind::GroupManagerPartial:      return "gmpartial";
        case ObjectKind::RevocationManagerPartial: return "rmpartial";
        case ObjectKind::Proof:                    return "proof";
    }
    return "unknown";
}

ObjectKind kind_from_string(const std::string& name) {
    static const ObjectKind all[] = {
        ObjectKind::Group, ObjectKind::Manager, ObjectKind::RevocationManager,
        ObjectKind::Member, ObjectKind::Signature, ObjectKind::GroupManagerPartial,
        ObjectKind::RevocationManagerPartial, ObjectKind::Proof
    };
    for (ObjectKind k : all) {
        if (name == to_string(k)) return k;
    }
    throw DecodeError("unknown object kind: " + name);
}

std::string Envelope::encode() const {
    return scheme + ":" + to_string(kind) + ":" + utils::to_base64(payload);
}

Envelope Envelope::parse(const std::string& text) {
    auto first = text.find(':');
    if (first == std::string::npos || first == 0) {
        throw DecodeError("envelope: missing scheme label");
    }
    auto second = text.find(':', first + 1);
    if (second == std::string::npos) {
        throw DecodeError("envelope: missing kind label");
    }

    Envelope env;
    env.scheme  = text.substr(0, first);
    env.kind    = kind_from_string(text.substr(first + 1, second - first - 1));
    env.payload = utils::from_base64(text.substr(second + 1));
    return env;
}

std::string encode_envelope(const std::string& scheme, ObjectKind kind, const Bytes& payload) {
    Envelope env;
    env.scheme  = scheme;
    env.kind    = kind;
    env.payload = payload;
    return env.encode();
}

Bytes decode_envelope(const std::string& text, const std::string& scheme, ObjectKind kind) {
    Envelope env = Envelope::parse(text);
    if (env.scheme != scheme) {
        throw DecodeError("envelope: expected scheme " + scheme + ", got " + env.scheme);
    }
    if (env.kind != kind) {
        throw DecodeError(std::string("envelope: expected ") + to_string(kind) +
                          ", got " + to_string(env.kind));
    }
    return std::move(env.payload);
}

void require_size(const Bytes& b, std::size_t expected, const char* what) {
    if (b.size() != expected) {
        throw DecodeError(std::string(what) + ": expected " + std::to_string(expected) +
                          " bytes, got " + std::to_string(b.size()));
    }
}

} // namespace grpsig
