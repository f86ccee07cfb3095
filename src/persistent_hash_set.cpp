#include "persistent_hash_set.hpp"

namespace pcoll {

// Core operations
PersistentHashSet PersistentHashSet::conj(const Value& elem) const {
    if (map_.contains(elem)) {
        return *this;
    }
    return PersistentHashSet(map_.assoc(elem, elem));
}

PersistentHashSet PersistentHashSet::disj(const Value& elem) const {
    // Remove element by dissociating the key
    return PersistentHashSet(map_.dissoc(elem));
}

// Set operations
PersistentHashSet PersistentHashSet::unionWith(const PersistentHashSet& other) const {
    // Fold the smaller set into the larger one
    const PersistentHashSet& smaller = (size() <= other.size()) ? *this : other;
    const PersistentHashSet& larger = (size() <= other.size()) ? other : *this;

    PersistentHashSet result = larger;
    for (SeqPtr s = smaller.seq(); s; s = s->next()) {
        result = result.conj(s->first());
    }
    return result;
}

PersistentHashSet PersistentHashSet::intersection(const PersistentHashSet& other) const {
    // Iterate smaller set, check containment in larger
    const PersistentHashSet& smaller = (size() <= other.size()) ? *this : other;
    const PersistentHashSet& larger = (size() <= other.size()) ? other : *this;

    PersistentHashSet result;
    for (SeqPtr s = smaller.seq(); s; s = s->next()) {
        if (larger.contains(s->first())) {
            result = result.conj(s->first());
        }
    }
    return result;
}

PersistentHashSet PersistentHashSet::difference(const PersistentHashSet& other) const {
    // Start with this set, remove all elements in other
    PersistentHashSet result = *this;
    for (SeqPtr s = other.seq(); s; s = s->next()) {
        result = result.disj(s->first());
    }
    return result;
}

PersistentHashSet PersistentHashSet::symmetricDifference(const PersistentHashSet& other) const {
    // (A - B) ∪ (B - A)
    return difference(other).unionWith(other.difference(*this));
}

// Set predicates
bool PersistentHashSet::isSubset(const PersistentHashSet& other) const {
    // All elements of this must be in other
    if (size() > other.size()) return false;

    for (SeqPtr s = seq(); s; s = s->next()) {
        if (!other.contains(s->first())) {
            return false;
        }
    }
    return true;
}

bool PersistentHashSet::isSuperset(const PersistentHashSet& other) const {
    // Other must be subset of this
    return other.isSubset(*this);
}

bool PersistentHashSet::isDisjoint(const PersistentHashSet& other) const {
    // No elements in common
    const PersistentHashSet& smaller = (size() <= other.size()) ? *this : other;
    const PersistentHashSet& larger = (size() <= other.size()) ? other : *this;

    for (SeqPtr s = smaller.seq(); s; s = s->next()) {
        if (larger.contains(s->first())) {
            return false;
        }
    }
    return true;
}

// Equality
bool PersistentHashSet::operator==(const PersistentHashSet& other) const {
    // Fast path: same object
    if (this == &other) return true;

    // Different sizes
    if (size() != other.size()) return false;
    return isSubset(other);
}

// Factory methods
PersistentHashSet PersistentHashSet::of(std::initializer_list<Value> elems) {
    PersistentHashSet result;
    for (const Value& elem : elems) {
        result = result.conj(elem);
    }
    return result;
}

PersistentHashSet PersistentHashSet::fromValues(const std::vector<Value>& elems) {
    PersistentHashSet result;
    for (const Value& elem : elems) {
        result = result.conj(elem);
    }
    return result;
}

PersistentHashSet PersistentHashSet::fromSeq(SeqPtr seq) {
    PersistentHashSet result;
    for (SeqPtr s = seq ? seq->seq() : nullptr; s; s = s->next()) {
        result = result.conj(s->first());
    }
    return result;
}

}  // namespace pcoll
