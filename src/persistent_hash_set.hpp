#pragma once

#include <initializer_list>
#include <optional>
#include <vector>
#include "collection.hpp"
#include "persistent_hash_map.hpp"

namespace pcoll {

/**
 * PersistentHashSet - Immutable set implementation
 *
 * A persistent (immutable) hash set implemented as a wrapper around
 * PersistentHashMap, where keys are set elements mapped to themselves.
 *
 * Inherits all performance characteristics from PersistentHashMap:
 * - O(log32 n) operations (conj, disj, contains)
 * - Structural sharing for memory efficiency
 * - Copy-on-write semantics
 *
 * Supports standard set operations:
 * - union, intersection, difference, symmetric difference
 * - subset / superset / disjoint predicates
 */
class PersistentHashSet : public Collection,
                          public Lookup,
                          public SetLike {
private:
    PersistentHashMap map_;  // Keys are set elements, each mapped to itself

public:
    // Constructors
    PersistentHashSet() = default;
    explicit PersistentHashSet(PersistentHashMap map) : map_(std::move(map)) {}

    // Core operations (functional style)
    PersistentHashSet conj(const Value& elem) const;  // Add element
    PersistentHashSet disj(const Value& elem) const;  // Remove element
    bool contains(const Value& elem) const { return map_.contains(elem); }

    // Set operations
    PersistentHashSet unionWith(const PersistentHashSet& other) const;
    PersistentHashSet intersection(const PersistentHashSet& other) const;
    PersistentHashSet difference(const PersistentHashSet& other) const;
    PersistentHashSet symmetricDifference(const PersistentHashSet& other) const;

    // Set predicates
    bool isSubset(const PersistentHashSet& other) const;
    bool isSuperset(const PersistentHashSet& other) const;
    bool isDisjoint(const PersistentHashSet& other) const;

    // Size
    size_t size() const { return map_.size(); }

    // Equality
    bool operator==(const PersistentHashSet& other) const;
    bool operator!=(const PersistentHashSet& other) const { return !(*this == other); }

    // Factory methods
    static PersistentHashSet of(std::initializer_list<Value> elems);
    static PersistentHashSet fromValues(const std::vector<Value>& elems);
    static PersistentHashSet fromSeq(SeqPtr seq);

    // Access to underlying map (for implementation)
    const PersistentHashMap& getMap() const { return map_; }

    // Collection protocol
    ValueType type() const override { return ValueType::HASH_SET; }
    const char* typeName() const override { return "PersistentHashSet"; }
    Category category() const override { return Category::SET; }
    size_t count() const override { return map_.size(); }
    Value conjoin(const Value& x) const override { return Value::wrap(conj(x)); }
    Value emptyValue() const override { return Value::wrap(PersistentHashSet()); }
    SeqPtr seq() const override { return map_.keys(); }

    // Lookup: get on a set yields the stored element
    Value lookup(const Value& key, const Value& notFound) const override { return map_.get(key, notFound); }
    std::optional<MapEntry> findEntry(const Value& key) const override { return map_.find(key); }
    bool containsKey(const Value& key) const override { return map_.contains(key); }

    // SetLike
    Value disjoin(const Value& x) const override { return Value::wrap(disj(x)); }
    bool containsElement(const Value& x) const override { return contains(x); }

    const Lookup* asLookup() const override { return this; }
    const SetLike* asSetLike() const override { return this; }
};

}  // namespace pcoll
