#pragma once

#include <initializer_list>
#include <memory>
#include <optional>
#include <vector>
#include "collection.hpp"
#include "persistent_hash_map.hpp"
#include "seq.hpp"

namespace pcoll {

/**
 * PersistentArrayMap - Small map optimization for ≤8 entries
 *
 * Uses a simple vector of key-value pairs with linear scan, kept in
 * insertion order. For small maps this beats the trie on cache locality
 * and avoids hashing altogether.
 *
 * Performance characteristics:
 * - Get: O(n) where n ≤ 8 (very fast in practice)
 * - Assoc: O(n) copy + insert
 * - Dissoc: O(n) copy + remove
 *
 * The typed assoc() refuses to grow past ARRAY_MAP_THRESHOLD; the
 * protocol-level associate()/conjoin() promote to a PersistentHashMap
 * instead, so generic code never sees the limit.
 */
class PersistentArrayMap : public Collection,
                           public Associative,
                           public Dissociable {
private:
    std::shared_ptr<const std::vector<MapEntry>> entries_;

    // Helper: find index of key (linear scan)
    int findIndex(const Value& key) const;

public:
    // Constructors
    PersistentArrayMap();
    explicit PersistentArrayMap(std::shared_ptr<const std::vector<MapEntry>> entries);

    // Core operations (functional style)
    PersistentArrayMap assoc(const Value& key, const Value& val) const;   // throws past the threshold
    PersistentArrayMap dissoc(const Value& key) const;
    Value get(const Value& key, const Value& default_val = Value()) const;
    std::optional<MapEntry> find(const Value& key) const;
    bool contains(const Value& key) const;

    // Size
    size_t size() const { return entries_->size(); }
    bool isFull() const { return entries_->size() >= ARRAY_MAP_THRESHOLD; }

    // Same entries as a hash map
    PersistentHashMap toHashMap() const;

    // Access to entries, insertion order
    const std::vector<MapEntry>& getEntries() const { return *entries_; }

    // Equality
    bool operator==(const PersistentArrayMap& other) const;
    bool operator!=(const PersistentArrayMap& other) const { return !(*this == other); }

    // Factory methods; more than ARRAY_MAP_THRESHOLD distinct keys throws
    static PersistentArrayMap of(std::initializer_list<MapEntry> entries);

    // Collection protocol
    ValueType type() const override { return ValueType::ARRAY_MAP; }
    const char* typeName() const override { return "PersistentArrayMap"; }
    Category category() const override { return Category::MAP; }
    size_t count() const override { return entries_->size(); }
    Value conjoin(const Value& x) const override;
    Value emptyValue() const override { return Value::wrap(PersistentArrayMap()); }
    SeqPtr seq() const override;

    // Lookup / Associative / Dissociable
    Value lookup(const Value& key, const Value& notFound) const override { return get(key, notFound); }
    std::optional<MapEntry> findEntry(const Value& key) const override { return find(key); }
    bool containsKey(const Value& key) const override { return contains(key); }
    Value associate(const Value& key, const Value& val) const override;   // promotes when full
    Value dissociate(const Value& key) const override { return Value::wrap(dissoc(key)); }

    const Lookup* asLookup() const override { return this; }
    const Associative* asAssociative() const override { return this; }
    const Dissociable* asDissociable() const override { return this; }
};

// Entries of an array map, boxed as [k v] vectors
class ArrayMapSeq : public ASeq {
public:
    ArrayMapSeq(std::shared_ptr<const std::vector<MapEntry>> entries, size_t index)
        : entries_(std::move(entries)), index_(index) {}

    Value first() const override { return (*entries_)[index_].toValue(); }
    SeqPtr next() const override;
    size_t count() const override { return entries_->size() - index_; }

    const char* typeName() const override { return "ArrayMapSeq"; }

private:
    std::shared_ptr<const std::vector<MapEntry>> entries_;
    size_t index_;
};

}  // namespace pcoll
