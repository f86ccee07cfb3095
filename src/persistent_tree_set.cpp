#include "persistent_tree_set.hpp"
#include "errors.hpp"

namespace pcoll {

namespace {

const SetLike& requireSet(const Collection& coll, const char* operation) {
    const SetLike* set = coll.asSetLike();
    if (!set) {
        throw CapabilityError(operation, coll.typeName());
    }
    return *set;
}

}  // namespace

PersistentTreeSet PersistentTreeSet::conj(const Value& elem) const {
    if (map_.contains(elem)) {
        return *this;
    }
    return PersistentTreeSet(map_.assoc(elem, elem));
}

PersistentTreeSet PersistentTreeSet::disj(const Value& elem) const {
    return PersistentTreeSet(map_.dissoc(elem));
}

// Set operations

PersistentTreeSet PersistentTreeSet::unionWith(const Collection& other) const {
    requireSet(other, "union");
    PersistentTreeSet result = *this;
    for (SeqPtr s = other.seq(); s; s = s->next()) {
        result = result.conj(s->first());
    }
    return result;
}

PersistentTreeSet PersistentTreeSet::intersection(const Collection& other) const {
    const SetLike& set = requireSet(other, "intersection");
    PersistentTreeSet result(map_.comparator());
    for (SeqPtr s = seq(); s; s = s->next()) {
        if (set.containsElement(s->first())) {
            result = result.conj(s->first());
        }
    }
    return result;
}

PersistentTreeSet PersistentTreeSet::difference(const Collection& other) const {
    requireSet(other, "difference");
    PersistentTreeSet result = *this;
    for (SeqPtr s = other.seq(); s; s = s->next()) {
        result = result.disj(s->first());
    }
    return result;
}

bool PersistentTreeSet::isSubset(const Collection& other) const {
    const SetLike& set = requireSet(other, "subset?");
    if (size() > other.count()) return false;

    for (SeqPtr s = seq(); s; s = s->next()) {
        if (!set.containsElement(s->first())) {
            return false;
        }
    }
    return true;
}

bool PersistentTreeSet::isSuperset(const Collection& other) const {
    requireSet(other, "superset?");
    for (SeqPtr s = other.seq(); s; s = s->next()) {
        if (!contains(s->first())) {
            return false;
        }
    }
    return true;
}

bool PersistentTreeSet::operator==(const PersistentTreeSet& other) const {
    if (this == &other) return true;
    if (size() != other.size()) return false;
    return isSubset(other);
}

// Factory methods

PersistentTreeSet PersistentTreeSet::of(std::initializer_list<Value> elems, ComparatorPtr cmp) {
    PersistentTreeSet result(std::move(cmp));
    for (const Value& elem : elems) {
        result = result.conj(elem);
    }
    return result;
}

PersistentTreeSet PersistentTreeSet::fromValues(const std::vector<Value>& elems, ComparatorPtr cmp) {
    PersistentTreeSet result(std::move(cmp));
    for (const Value& elem : elems) {
        result = result.conj(elem);
    }
    return result;
}

}  // namespace pcoll
