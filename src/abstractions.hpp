#pragma once

#include <cstdint>
#include <optional>
#include <vector>
#include "collection.hpp"
#include "seq.hpp"

namespace pcoll {

/**
 * Abstraction dispatcher - the capability protocol over any Value
 *
 * Generic code calls these instead of branching on concrete types. Each
 * operation resolves to the capability interface the value's variant
 * implements; a value without it raises CapabilityError (never a
 * best-effort emulation). nil behaves as an empty collection, and
 * strings are sequences of characters indexed by position.
 *
 * count() is O(1) for every collection variant and O(n) on a lazy or
 * generic sequence, which it walks to the end.
 */

enum class Capability {
    SEQABLE,
    LOOKUP,
    ASSOCIATIVE,
    DISSOCIABLE,
    INDEXED,
    STACK,
    SET,
    SORTED,
    REVERSIBLE
};

bool supports(const Value& v, Capability capability);

// Collection
Value conj(const Value& coll, const Value& x);               // nil conj gives a list
Value conj(const Value& coll, const std::vector<Value>& xs);
size_t count(const Value& coll);
bool isEmpty(const Value& coll);
Value empty(const Value& coll);                              // same kind, no elements; nil for non-collections
Value into(const Value& to, const Value& from);

// Sequence view
SeqPtr seq(const Value& coll);                               // nullptr when empty
Value first(const Value& coll);                              // nil when empty
SeqPtr rest(const Value& coll);                              // never nullptr
SeqPtr next(const Value& coll);                              // nullptr when nothing follows

// Lookup / Associative
Value get(const Value& coll, const Value& key, const Value& notFound = Value());
std::optional<MapEntry> find(const Value& coll, const Value& key);
bool contains(const Value& coll, const Value& key);
Value assoc(const Value& coll, const Value& key, const Value& val);
Value dissoc(const Value& coll, const Value& key);
Value getIn(const Value& coll, const std::vector<Value>& path, const Value& notFound = Value());

// Indexed
Value nth(const Value& coll, int64_t idx);                   // IndexError out of bounds
Value nth(const Value& coll, int64_t idx, const Value& notFound);

// Stack
Value peek(const Value& coll);
Value pop(const Value& coll);

// Set
Value disj(const Value& coll, const Value& x);

// Sorted / Reversible
SeqPtr subseq(const Value& coll, const std::optional<Bound>& lower, const std::optional<Bound>& upper);
SeqPtr rsubseq(const Value& coll, const std::optional<Bound>& lower, const std::optional<Bound>& upper);
SeqPtr rseq(const Value& coll);

}  // namespace pcoll
