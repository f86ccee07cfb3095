#pragma once

#include <initializer_list>
#include <optional>
#include <vector>
#include "collection.hpp"
#include "persistent_tree_map.hpp"

namespace pcoll {

/**
 * PersistentTreeSet - Immutable sorted set
 *
 * Wraps a PersistentTreeMap whose keys are the elements (each mapped to
 * itself), so ordering, range views and balance all come from the map.
 */
class PersistentTreeSet : public Collection,
                          public Lookup,
                          public SetLike,
                          public Sorted,
                          public Reversible {
private:
    PersistentTreeMap map_;

public:
    PersistentTreeSet() = default;
    explicit PersistentTreeSet(ComparatorPtr cmp) : map_(std::move(cmp)) {}
    explicit PersistentTreeSet(PersistentTreeMap map) : map_(std::move(map)) {}

    // Core operations (functional style)
    PersistentTreeSet conj(const Value& elem) const;
    PersistentTreeSet disj(const Value& elem) const;
    bool contains(const Value& elem) const { return map_.contains(elem); }

    // Smallest / largest element; IllegalStateError when empty
    Value first() const { return map_.first().key; }
    Value last() const { return map_.last().key; }

    // Elements within bounds, ascending / descending
    SeqPtr subseq(const std::optional<Bound>& lower, const std::optional<Bound>& upper) const {
        return map_.keyRange(lower, upper, true);
    }
    SeqPtr rsubseq(const std::optional<Bound>& lower, const std::optional<Bound>& upper) const {
        return map_.keyRange(lower, upper, false);
    }

    // Set operations against any set; results keep this set's comparator
    PersistentTreeSet unionWith(const Collection& other) const;
    PersistentTreeSet intersection(const Collection& other) const;
    PersistentTreeSet difference(const Collection& other) const;
    bool isSubset(const Collection& other) const;
    bool isSuperset(const Collection& other) const;

    size_t size() const { return map_.size(); }
    size_t height() const { return map_.height(); }
    bool verifyInvariants() const { return map_.verifyInvariants(); }
    const PersistentTreeMap& getMap() const { return map_; }

    bool operator==(const PersistentTreeSet& other) const;
    bool operator!=(const PersistentTreeSet& other) const { return !(*this == other); }

    // Factory methods
    static PersistentTreeSet of(std::initializer_list<Value> elems,
                                ComparatorPtr cmp = defaultComparator());
    static PersistentTreeSet fromValues(const std::vector<Value>& elems,
                                        ComparatorPtr cmp = defaultComparator());

    // Collection protocol
    ValueType type() const override { return ValueType::SORTED_SET; }
    const char* typeName() const override { return "PersistentTreeSet"; }
    Category category() const override { return Category::SET; }
    size_t count() const override { return map_.size(); }
    Value conjoin(const Value& x) const override { return Value::wrap(conj(x)); }
    Value emptyValue() const override { return Value::wrap(PersistentTreeSet(map_.comparator())); }
    SeqPtr seq() const override { return map_.keys(); }

    // Lookup: get on a set yields the stored element
    Value lookup(const Value& key, const Value& notFound) const override { return map_.get(key, notFound); }
    std::optional<MapEntry> findEntry(const Value& key) const override { return map_.find(key); }
    bool containsKey(const Value& key) const override { return map_.contains(key); }

    // SetLike
    Value disjoin(const Value& x) const override { return Value::wrap(disj(x)); }
    bool containsElement(const Value& x) const override { return contains(x); }

    // Sorted / Reversible
    SeqPtr rangeView(const std::optional<Bound>& lower, const std::optional<Bound>& upper,
                     bool ascending) const override {
        return map_.keyRange(lower, upper, ascending);
    }
    const ComparatorPtr& comparator() const override { return map_.comparator(); }
    SeqPtr reverseSeq() const override { return map_.keyRange(std::nullopt, std::nullopt, false); }

    const Lookup* asLookup() const override { return this; }
    const SetLike* asSetLike() const override { return this; }
    const Sorted* asSorted() const override { return this; }
    const Reversible* asReversible() const override { return this; }
};

}  // namespace pcoll
