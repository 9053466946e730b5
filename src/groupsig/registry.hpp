#ifndef GRPSIG_REGISTRY_HPP
#define GRPSIG_REGISTRY_HPP

#include "../crypto/ecgroup.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace grpsig {

using ecgroup::Bytes;
using ecgroup::G1Point;

// -----------------------------------------------------------------------------
// KeyValueStore - backing storage for the GML and CRL
// -----------------------------------------------------------------------------
class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    virtual std::optional<Bytes> get(const std::string& key) const = 0;

    // Atomically stores `value` unless `key` is present. Returns true if stored.
    virtual bool put_if_absent(const std::string& key, const Bytes& value) = 0;

    // Visits entries in key order until `fn` returns false.
    virtual void for_each(const std::function<bool(const std::string&, const Bytes&)>& fn) const = 0;

    virtual std::size_t size() const = 0;
};

// In-process store. Every operation takes the mutex; for_each iterates a
// snapshot so the visitor may call back into the store.
class MemoryStore : public KeyValueStore {
public:
    std::optional<Bytes> get(const std::string& key) const override;
    bool put_if_absent(const std::string& key, const Bytes& value) override;
    void for_each(const std::function<bool(const std::string&, const Bytes&)>& fn) const override;
    std::size_t size() const override;

private:
    mutable std::mutex           mu_;
    std::map<std::string, Bytes> entries_;
};

// -----------------------------------------------------------------------------
// RegistryEntry - (A, pi) pair recorded for a member at join time
// -----------------------------------------------------------------------------
struct RegistryEntry {
    static constexpr std::size_t SERIALIZED_SIZE = 2 * ecgroup::G1_SERIALIZED_SIZE;

    G1Point A;   // opening trapdoor
    G1Point pi;  // tracing trapdoor, x·g1

    // hex(SHA-256(A || pi))
    std::string id() const;

    Bytes to_bytes() const;
    static RegistryEntry from_bytes(const Bytes& b);
};

// -----------------------------------------------------------------------------
// Registry - append-only map member_id -> RegistryEntry over a KeyValueStore
// -----------------------------------------------------------------------------
class Registry {
public:
    explicit Registry(std::shared_ptr<KeyValueStore> store);

    // Records the entry under its id and returns the id. Re-adding the same
    // entry is a no-op.
    std::string add(const RegistryEntry& entry);

    std::optional<RegistryEntry> find(const std::string& id) const;
    bool contains(const std::string& id) const;

    // Visits entries until `fn` returns false.
    void for_each(const std::function<bool(const std::string&, const RegistryEntry&)>& fn) const;

    std::size_t size() const;

    // Snapshot: u32 count, then LP(id) || LP(entry) per entry.
    Bytes export_bytes() const;

    // Merges a snapshot and returns the number of new entries. Throws
    // ecgroup::DecodeError if the snapshot is malformed or an id does not
    // match its entry.
    std::size_t import_bytes(const Bytes& snapshot);

private:
    std::shared_ptr<KeyValueStore> store_;
};

} // namespace grpsig

#endif // GRPSIG_REGISTRY_HPP
