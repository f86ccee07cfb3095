#include "collection.hpp"
#include "errors.hpp"
#include "persistent_vector.hpp"
#include "seq.hpp"
#include <sstream>

namespace pcoll {

Value MapEntry::toValue() const {
    return Value::wrap(PersistentVector::of({key, value}));
}

MapEntry entryFromValue(const Value& pair) {
    const PersistentVector* vec = pair.as<PersistentVector>();
    if (!vec || vec->size() != 2) {
        throw TypeError("Map entry must be a [key value] vector, got " + pair.toString());
    }
    return MapEntry(vec->nth(0), vec->nth(1));
}

std::vector<MapEntry> entriesForConjoin(const Value& x) {
    if (x.isCollection() && x.asCollection()->category() == Collection::Category::MAP) {
        std::vector<MapEntry> entries;
        for (SeqPtr s = x.asCollection()->seq(); s; s = s->next()) {
            entries.push_back(entryFromValue(s->first()));
        }
        return entries;
    }
    return {entryFromValue(x)};
}

ComparatorPtr defaultComparator() {
    static const ComparatorPtr cmp = std::make_shared<const Comparator>(&compare);
    return cmp;
}

ComparatorPtr comparatorFromPredicate(std::function<bool(const Value&, const Value&)> less) {
    return std::make_shared<const Comparator>(
        [less = std::move(less)](const Value& a, const Value& b) {
            if (less(a, b)) return -1;
            if (less(b, a)) return 1;
            return 0;
        });
}

//=============================================================================
// Structural equality, by category
//=============================================================================

namespace {

bool sequentialEquals(const Collection& a, const Collection& b) {
    SeqPtr sa = a.seq();
    SeqPtr sb = b.seq();
    while (sa && sb) {
        if (sa->first() != sb->first()) return false;
        sa = sa->next();
        sb = sb->next();
    }
    return !sa && !sb;
}

bool mapEquals(const Collection& a, const Collection& b) {
    if (a.count() != b.count()) return false;
    const Lookup* other = b.asLookup();
    for (SeqPtr s = a.seq(); s; s = s->next()) {
        MapEntry entry = entryFromValue(s->first());
        std::optional<MapEntry> found = other->findEntry(entry.key);
        if (!found || found->value != entry.value) return false;
    }
    return true;
}

bool setEquals(const Collection& a, const Collection& b) {
    if (a.count() != b.count()) return false;
    const SetLike* other = b.asSetLike();
    for (SeqPtr s = a.seq(); s; s = s->next()) {
        if (!other->containsElement(s->first())) return false;
    }
    return true;
}

}  // namespace

bool Collection::equals(const Collection& other) const {
    if (this == &other) return true;
    if (category() != other.category()) return false;

    switch (category()) {
        case Category::SEQUENTIAL: return sequentialEquals(*this, other);
        case Category::MAP: return mapEquals(*this, other);
        case Category::SET: return setEquals(*this, other);
    }
    return false;
}

size_t Collection::hash() const {
    switch (category()) {
        case Category::SEQUENTIAL: {
            // Ordered: 31 * h + x, as for lists
            size_t h = 1;
            for (SeqPtr s = seq(); s; s = s->next()) {
                h = 31 * h + s->first().hash();
            }
            return h;
        }
        case Category::MAP: {
            // Unordered: independent of iteration order
            size_t h = 0;
            for (SeqPtr s = seq(); s; s = s->next()) {
                MapEntry entry = entryFromValue(s->first());
                h += entry.key.hash() ^ entry.value.hash();
            }
            return hashCombine(0x4d4150, h);
        }
        case Category::SET: {
            size_t h = 0;
            for (SeqPtr s = seq(); s; s = s->next()) {
                h += s->first().hash();
            }
            return hashCombine(0x534554, h);
        }
    }
    return 0;
}

std::string Collection::toString() const {
    std::ostringstream oss;
    const char* open = "(";
    const char* close = ")";
    if (type() == ValueType::VECTOR) {
        open = "[";
        close = "]";
    } else if (category() == Category::MAP) {
        open = "{";
        close = "}";
    } else if (category() == Category::SET) {
        open = "#{";
        close = "}";
    }

    oss << open;
    size_t i = 0;
    for (SeqPtr s = seq(); s; s = s->next(), ++i) {
        if (i > 0) oss << (category() == Category::MAP ? ", " : " ");

        // Limit output for large (or infinite) collections
        if (i >= 32) {
            oss << "...";
            break;
        }

        if (category() == Category::MAP) {
            MapEntry entry = entryFromValue(s->first());
            oss << entry.key.toString() << " " << entry.value.toString();
        } else {
            oss << s->first().toString();
        }
    }
    oss << close;
    return oss.str();
}

}  // namespace pcoll
