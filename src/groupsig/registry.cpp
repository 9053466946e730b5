#include "registry.hpp"
#include "codec.hpp"
#include "../helpers.hpp"

#include <stdexcept>
#include <utility>
#include <vector>

namespace grpsig {

using namespace grpsig::utils;
using ecgroup::DecodeError;
using ecgroup::G1_SERIALIZED_SIZE;

// -----------------------------------------------------------------------------
// MemoryStore
// -----------------------------------------------------------------------------

std::optional<Bytes> MemoryStore::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

bool MemoryStore::put_if_absent(const std::string& key, const Bytes& value) {
    std::lock_guard<std::mutex> lock(mu_);
    return entries_.emplace(key, value).second;
}

void MemoryStore::for_each(const std::function<bool(const std::string&, const Bytes&)>& fn) const {
    std::vector<std::pair<std::string, Bytes>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mu_);
        snapshot.assign(entries_.begin(), entries_.end());
    }
    for (const auto& kv : snapshot) {
        if (!fn(kv.first, kv.second)) break;
    }
}

std::size_t MemoryStore::size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return entries_.size();
}

// -----------------------------------------------------------------------------
// RegistryEntry
// -----------------------------------------------------------------------------

std::string RegistryEntry::id() const {
    return bytes_to_hex(hash_all({A.to_bytes(), pi.to_bytes()}));
}

Bytes RegistryEntry::to_bytes() const {
    Bytes out;
    append_raw(out, A.to_bytes());
    append_raw(out, pi.to_bytes());
    return out;
}

RegistryEntry RegistryEntry::from_bytes(const Bytes& b) {
    require_size(b, 2 * G1_SERIALIZED_SIZE, "RegistryEntry");
    std::size_t off = 0;
    RegistryEntry e;
    e.A  = G1Point::from_bytes(read_raw(b, off, G1_SERIALIZED_SIZE));
    e.pi = G1Point::from_bytes(read_raw(b, off, G1_SERIALIZED_SIZE));
    return e;
}

// -----------------------------------------------------------------------------
// Registry
// -----------------------------------------------------------------------------

Registry::Registry(std::shared_ptr<KeyValueStore> store) : store_(std::move(store)) {
    if (!store_) throw std::invalid_argument("Registry: null store");
}

std::string Registry::add(const RegistryEntry& entry) {
    std::string id = entry.id();
    store_->put_if_absent(id, entry.to_bytes());
    return id;
}

std::optional<RegistryEntry> Registry::find(const std::string& id) const {
    auto raw = store_->get(id);
    if (!raw) return std::nullopt;
    return RegistryEntry::from_bytes(*raw);
}

bool Registry::contains(const std::string& id) const {
    return store_->get(id).has_value();
}

void Registry::for_each(const std::function<bool(const std::string&, const RegistryEntry&)>& fn) const {
    store_->for_each([&fn](const std::string& id, const Bytes& raw) {
        return fn(id, RegistryEntry::from_bytes(raw));
    });
}

std::size_t Registry::size() const {
    return store_->size();
}

Bytes Registry::export_bytes() const {
    std::vector<std::pair<std::string, Bytes>> entries;
    store_->for_each([&entries](const std::string& id, const Bytes& raw) {
        entries.emplace_back(id, raw);
        return true;
    });

    Bytes out;
    append_u32_be(out, static_cast<uint32_t>(entries.size()));
    for (const auto& kv : entries) {
        append_lp(out, utils::to_bytes(kv.first));
        append_lp(out, kv.second);
    }
    return out;
}

std::size_t Registry::import_bytes(const Bytes& snapshot) {
    std::size_t off = 0;
    uint32_t count = read_u32_be(snapshot, off);

    // Smallest possible record: LP(64-char id) then LP(A || pi)
    const std::size_t min_record = 4 + 64 + 4 + RegistryEntry::SERIALIZED_SIZE;
    if (count > (snapshot.size() - off) / min_record) {
        throw DecodeError("Registry::import_bytes: count exceeds snapshot size");
    }

    // Decode everything before touching the store.
    std::vector<RegistryEntry> entries;
    entries.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        std::string id = read_string(snapshot, off);
        RegistryEntry e = RegistryEntry::from_bytes(read_lp(snapshot, off));
        if (e.id() != id) {
            throw DecodeError("Registry::import_bytes: id does not match entry " + id);
        }
        entries.push_back(e);
    }
    if (off != snapshot.size()) {
        throw DecodeError("Registry::import_bytes: trailing bytes");
    }

    std::size_t added = 0;
    for (const auto& e : entries) {
        if (store_->put_if_absent(e.id(), e.to_bytes())) ++added;
    }
    return added;
}

} // namespace grpsig
