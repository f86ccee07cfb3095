#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "value.hpp"

namespace pcoll {

// Key/value pair returned by find-entry; boxes as a 2-element vector
struct MapEntry {
    Value key;
    Value value;

    MapEntry(const Value& k, const Value& v) : key(k), value(v) {}

    Value toValue() const;
};

// A boxed [k v] vector as an entry; TypeError for anything else
MapEntry entryFromValue(const Value& pair);

// What conjoin on a map adds: one [k v] vector, or every entry of another map
std::vector<MapEntry> entriesForConjoin(const Value& x);

using Comparator = std::function<int(const Value&, const Value&)>;
using ComparatorPtr = std::shared_ptr<const Comparator>;

// Comparator wrapping pcoll::compare
ComparatorPtr defaultComparator();

// Comparator from a strict "less than" predicate (e.g. descending order via >)
ComparatorPtr comparatorFromPredicate(std::function<bool(const Value&, const Value&)> less);

// Inclusive or exclusive endpoint of a sorted range
struct Bound {
    Value key;
    bool inclusive = true;

    Bound(const Value& k, bool incl = true) : key(k), inclusive(incl) {}
};

class Lookup;
class Associative;
class Dissociable;
class Indexed;
class Stack;
class SetLike;
class Sorted;
class Reversible;

/**
 * Collection - Protocol every concrete collection variant implements
 *
 * The optional capabilities (Lookup, Associative, Indexed, ...) are flat
 * interfaces. A variant advertises the ones it implements through the
 * as*() queries; a null result means "not supported" and callers report a
 * CapabilityError instead of emulating the operation.
 */
class Collection : public std::enable_shared_from_this<Collection> {
public:
    enum class Category { SEQUENTIAL, MAP, SET };

    virtual ~Collection() = default;

    virtual ValueType type() const = 0;
    virtual const char* typeName() const = 0;
    virtual Category category() const = 0;

    // O(1) for every variant except sequences, which walk (see ASeq::count)
    virtual size_t count() const = 0;
    virtual bool isEmpty() const { return count() == 0; }

    // Add at the natural insertion point of the variant
    virtual Value conjoin(const Value& x) const = 0;

    // Empty collection of the same variant (sorted variants keep their comparator)
    virtual Value emptyValue() const = 0;

    // Sequence view; nullptr when empty
    virtual SeqPtr seq() const = 0;

    virtual bool equals(const Collection& other) const;
    virtual size_t hash() const;
    virtual std::string toString() const;

    virtual const Lookup* asLookup() const { return nullptr; }
    virtual const Associative* asAssociative() const { return nullptr; }
    virtual const Dissociable* asDissociable() const { return nullptr; }
    virtual const Indexed* asIndexed() const { return nullptr; }
    virtual const Stack* asStack() const { return nullptr; }
    virtual const SetLike* asSetLike() const { return nullptr; }
    virtual const Sorted* asSorted() const { return nullptr; }
    virtual const Reversible* asReversible() const { return nullptr; }
};

// get / find / contains?
class Lookup {
public:
    virtual ~Lookup() = default;
    virtual Value lookup(const Value& key, const Value& notFound) const = 0;
    virtual std::optional<MapEntry> findEntry(const Value& key) const = 0;
    virtual bool containsKey(const Value& key) const = 0;
};

// assoc
class Associative : public Lookup {
public:
    virtual Value associate(const Value& key, const Value& val) const = 0;
};

// dissoc
class Dissociable {
public:
    virtual ~Dissociable() = default;
    virtual Value dissociate(const Value& key) const = 0;
};

// nth: fails with IndexError out of bounds, unlike lookup
class Indexed {
public:
    virtual ~Indexed() = default;
    virtual Value nth(size_t idx) const = 0;
    virtual Value nth(size_t idx, const Value& notFound) const = 0;
};

// peek / pop at the end where conjoin is efficient
class Stack {
public:
    virtual ~Stack() = default;
    virtual Value stackPeek() const = 0;
    virtual Value stackPop() const = 0;
};

// disj / contains?
class SetLike {
public:
    virtual ~SetLike() = default;
    virtual Value disjoin(const Value& x) const = 0;
    virtual bool containsElement(const Value& x) const = 0;
};

// Ordered range views without re-sorting
class Sorted {
public:
    virtual ~Sorted() = default;
    virtual SeqPtr rangeView(const std::optional<Bound>& lower,
                             const std::optional<Bound>& upper,
                             bool ascending) const = 0;
    virtual const ComparatorPtr& comparator() const = 0;
};

// rseq
class Reversible {
public:
    virtual ~Reversible() = default;
    virtual SeqPtr reverseSeq() const = 0;
};

}  // namespace pcoll
