#include "abstractions.hpp"
#include "errors.hpp"
#include "persistent_array_map.hpp"
#include "persistent_list.hpp"

namespace pcoll {

namespace {

const Collection* collectionOf(const Value& v) {
    return v.isCollection() ? v.asCollection().get() : nullptr;
}

// Code points of a string
size_t stringLength(const std::string& text) {
    size_t n = 0;
    for (size_t pos = 0; pos < text.size(); ++n) {
        decodeUtf8(text, pos);
    }
    return n;
}

// Character at a code point index, nullopt past the end
std::optional<Value> stringCharAt(const std::string& text, int64_t idx) {
    if (idx < 0) return std::nullopt;
    size_t pos = 0;
    for (int64_t i = 0; pos < text.size(); ++i) {
        char32_t c = decodeUtf8(text, pos);
        if (i == idx) return Value::character(c);
    }
    return std::nullopt;
}

[[noreturn]] void unsupported(const char* operation, const Value& v) {
    throw CapabilityError(operation, v.typeName());
}

// Value stored under key; nullopt when absent (nil-valued entries are present)
std::optional<Value> lookupPresent(const Value& coll, const Value& key, const char* operation) {
    if (coll.isNil()) {
        return std::nullopt;
    }
    if (coll.isString()) {
        if (!key.isInteger()) return std::nullopt;
        return stringCharAt(coll.asString(), key.asInteger());
    }
    const Collection* c = collectionOf(coll);
    const Lookup* lookup = c ? c->asLookup() : nullptr;
    if (!lookup) {
        unsupported(operation, coll);
    }
    std::optional<MapEntry> entry = lookup->findEntry(key);
    if (!entry) return std::nullopt;
    return entry->value;
}

}  // namespace

bool supports(const Value& v, Capability capability) {
    const Collection* c = collectionOf(v);
    switch (capability) {
        case Capability::SEQABLE: return v.isNil() || v.isString() || c != nullptr;
        case Capability::LOOKUP: return v.isString() || (c && c->asLookup());
        case Capability::ASSOCIATIVE: return c && c->asAssociative();
        case Capability::DISSOCIABLE: return c && c->asDissociable();
        case Capability::INDEXED: return v.isString() || (c && c->asIndexed());
        case Capability::STACK: return c && c->asStack();
        case Capability::SET: return c && c->asSetLike();
        case Capability::SORTED: return c && c->asSorted();
        case Capability::REVERSIBLE: return c && c->asReversible();
    }
    return false;
}

//=============================================================================
// Collection
//=============================================================================

Value conj(const Value& coll, const Value& x) {
    if (coll.isNil()) {
        return Value::wrap(PersistentList().conj(x));
    }
    const Collection* c = collectionOf(coll);
    if (!c) {
        unsupported("conj", coll);
    }
    return c->conjoin(x);
}

Value conj(const Value& coll, const std::vector<Value>& xs) {
    Value result = coll;
    for (const Value& x : xs) {
        result = conj(result, x);
    }
    return result;
}

size_t count(const Value& coll) {
    if (coll.isNil()) return 0;
    if (coll.isString()) return stringLength(coll.asString());
    const Collection* c = collectionOf(coll);
    if (!c) {
        unsupported("count", coll);
    }
    return c->count();
}

bool isEmpty(const Value& coll) {
    if (coll.isNil()) return true;
    if (coll.isString()) return coll.asString().empty();
    const Collection* c = collectionOf(coll);
    if (!c) {
        unsupported("empty?", coll);
    }
    return c->isEmpty();
}

Value empty(const Value& coll) {
    const Collection* c = collectionOf(coll);
    return c ? c->emptyValue() : Value();
}

Value into(const Value& to, const Value& from) {
    Value result = to;
    for (SeqPtr s = seq(from); s; s = s->next()) {
        result = conj(result, s->first());
    }
    return result;
}

//=============================================================================
// Sequence view
//=============================================================================

SeqPtr seq(const Value& coll) {
    if (coll.isNil()) return nullptr;
    if (coll.isString()) return StringSeq::create(coll);
    const Collection* c = collectionOf(coll);
    if (!c) {
        unsupported("seq", coll);
    }
    return c->seq();
}

Value first(const Value& coll) {
    SeqPtr s = seq(coll);
    return s ? s->first() : Value();
}

SeqPtr rest(const Value& coll) {
    SeqPtr s = seq(coll);
    return s ? s->more() : emptySeq();
}

SeqPtr next(const Value& coll) {
    SeqPtr s = seq(coll);
    return s ? s->next() : nullptr;
}

//=============================================================================
// Lookup / Associative
//=============================================================================

Value get(const Value& coll, const Value& key, const Value& notFound) {
    std::optional<Value> found = lookupPresent(coll, key, "get");
    return found ? *found : notFound;
}

std::optional<MapEntry> find(const Value& coll, const Value& key) {
    std::optional<Value> found = lookupPresent(coll, key, "find");
    if (!found) return std::nullopt;
    return MapEntry(key, *found);
}

bool contains(const Value& coll, const Value& key) {
    if (coll.isNil()) return false;
    if (coll.isString()) {
        return key.isInteger() && key.asInteger() >= 0 &&
               static_cast<size_t>(key.asInteger()) < stringLength(coll.asString());
    }
    const Collection* c = collectionOf(coll);
    const Lookup* lookup = c ? c->asLookup() : nullptr;
    if (!lookup) {
        unsupported("contains?", coll);
    }
    return lookup->containsKey(key);
}

Value assoc(const Value& coll, const Value& key, const Value& val) {
    if (coll.isNil()) {
        return Value::wrap(PersistentArrayMap().assoc(key, val));
    }
    const Collection* c = collectionOf(coll);
    const Associative* associative = c ? c->asAssociative() : nullptr;
    if (!associative) {
        unsupported("assoc", coll);
    }
    return associative->associate(key, val);
}

Value dissoc(const Value& coll, const Value& key) {
    if (coll.isNil()) return coll;
    const Collection* c = collectionOf(coll);
    const Dissociable* dissociable = c ? c->asDissociable() : nullptr;
    if (!dissociable) {
        unsupported("dissoc", coll);
    }
    return dissociable->dissociate(key);
}

Value getIn(const Value& coll, const std::vector<Value>& path, const Value& notFound) {
    Value current = coll;
    for (const Value& key : path) {
        std::optional<Value> found = lookupPresent(current, key, "get-in");
        if (!found) return notFound;
        current = *found;
    }
    return current;
}

//=============================================================================
// Indexed
//=============================================================================

Value nth(const Value& coll, int64_t idx) {
    if (coll.isNil()) return Value();
    if (coll.isString()) {
        std::optional<Value> c = stringCharAt(coll.asString(), idx);
        if (!c) throw IndexError(idx, stringLength(coll.asString()));
        return *c;
    }
    const Collection* c = collectionOf(coll);
    const Indexed* indexed = c ? c->asIndexed() : nullptr;
    if (!indexed) {
        unsupported("nth", coll);
    }
    if (idx < 0) {
        throw IndexError(idx, c->count());
    }
    return indexed->nth(static_cast<size_t>(idx));
}

Value nth(const Value& coll, int64_t idx, const Value& notFound) {
    if (coll.isNil()) return notFound;
    if (coll.isString()) {
        std::optional<Value> c = stringCharAt(coll.asString(), idx);
        return c ? *c : notFound;
    }
    const Collection* c = collectionOf(coll);
    const Indexed* indexed = c ? c->asIndexed() : nullptr;
    if (!indexed) {
        unsupported("nth", coll);
    }
    if (idx < 0) return notFound;
    return indexed->nth(static_cast<size_t>(idx), notFound);
}

//=============================================================================
// Stack
//=============================================================================

Value peek(const Value& coll) {
    if (coll.isNil()) return coll;
    const Collection* c = collectionOf(coll);
    const Stack* stack = c ? c->asStack() : nullptr;
    if (!stack) {
        unsupported("peek", coll);
    }
    return stack->stackPeek();
}

Value pop(const Value& coll) {
    if (coll.isNil()) return coll;
    const Collection* c = collectionOf(coll);
    const Stack* stack = c ? c->asStack() : nullptr;
    if (!stack) {
        unsupported("pop", coll);
    }
    return stack->stackPop();
}

//=============================================================================
// Set
//=============================================================================

Value disj(const Value& coll, const Value& x) {
    if (coll.isNil()) return coll;
    const Collection* c = collectionOf(coll);
    const SetLike* set = c ? c->asSetLike() : nullptr;
    if (!set) {
        unsupported("disj", coll);
    }
    return set->disjoin(x);
}

//=============================================================================
// Sorted / Reversible
//=============================================================================

SeqPtr subseq(const Value& coll, const std::optional<Bound>& lower, const std::optional<Bound>& upper) {
    const Collection* c = collectionOf(coll);
    const Sorted* sorted = c ? c->asSorted() : nullptr;
    if (!sorted) {
        unsupported("subseq", coll);
    }
    return sorted->rangeView(lower, upper, true);
}

SeqPtr rsubseq(const Value& coll, const std::optional<Bound>& lower, const std::optional<Bound>& upper) {
    const Collection* c = collectionOf(coll);
    const Sorted* sorted = c ? c->asSorted() : nullptr;
    if (!sorted) {
        unsupported("rsubseq", coll);
    }
    return sorted->rangeView(lower, upper, false);
}

SeqPtr rseq(const Value& coll) {
    const Collection* c = collectionOf(coll);
    const Reversible* reversible = c ? c->asReversible() : nullptr;
    if (!reversible) {
        unsupported("rseq", coll);
    }
    return reversible->reverseSeq();
}

}  // namespace pcoll
