#include "persistent_array_map.hpp"
#include "debug_log.hpp"
#include "errors.hpp"

namespace pcoll {

// Constructors
PersistentArrayMap::PersistentArrayMap()
    : entries_(std::make_shared<const std::vector<MapEntry>>()) {}

PersistentArrayMap::PersistentArrayMap(std::shared_ptr<const std::vector<MapEntry>> entries)
    : entries_(std::move(entries)) {}

// Helper: find index of key (linear scan)
int PersistentArrayMap::findIndex(const Value& key) const {
    for (size_t i = 0; i < entries_->size(); ++i) {
        if ((*entries_)[i].key == key) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

// Core operations
PersistentArrayMap PersistentArrayMap::assoc(const Value& key, const Value& val) const {
    int idx = findIndex(key);

    if (idx >= 0) {
        // Key exists - check if value is the same
        if ((*entries_)[idx].value.identical(val)) {
            return *this;  // No change needed
        }

        // Copy-on-write: copy vector, update one entry
        auto newEntries = std::make_shared<std::vector<MapEntry>>(*entries_);
        (*newEntries)[idx].value = val;
        return PersistentArrayMap(std::move(newEntries));
    }

    // Key doesn't exist
    if (isFull()) {
        throw IllegalStateError("PersistentArrayMap max size exceeded (" +
                                std::to_string(ARRAY_MAP_THRESHOLD) +
                                " entries). Use associate() or a PersistentHashMap for larger maps.");
    }

    // Copy vector and append
    auto newEntries = std::make_shared<std::vector<MapEntry>>(*entries_);
    newEntries->emplace_back(key, val);
    return PersistentArrayMap(std::move(newEntries));
}

PersistentArrayMap PersistentArrayMap::dissoc(const Value& key) const {
    int idx = findIndex(key);
    if (idx < 0) return *this;  // Key not found, no change

    // Copy vector without the entry at idx
    auto newEntries = std::make_shared<std::vector<MapEntry>>();
    newEntries->reserve(entries_->size() - 1);

    for (size_t i = 0; i < entries_->size(); ++i) {
        if (i != static_cast<size_t>(idx)) {
            newEntries->push_back((*entries_)[i]);
        }
    }

    return PersistentArrayMap(std::move(newEntries));
}

Value PersistentArrayMap::get(const Value& key, const Value& default_val) const {
    int idx = findIndex(key);
    if (idx >= 0) {
        return (*entries_)[idx].value;
    }
    return default_val;
}

std::optional<MapEntry> PersistentArrayMap::find(const Value& key) const {
    int idx = findIndex(key);
    if (idx < 0) {
        return std::nullopt;
    }
    return (*entries_)[idx];
}

bool PersistentArrayMap::contains(const Value& key) const {
    return findIndex(key) >= 0;
}

PersistentHashMap PersistentArrayMap::toHashMap() const {
    return PersistentHashMap::fromEntries(*entries_);
}

// Protocol operations: promotion instead of the size error

Value PersistentArrayMap::associate(const Value& key, const Value& val) const {
    if (isFull() && !contains(key)) {
        PCOLL_DEBUG("PersistentArrayMap", "promoting to PersistentHashMap at " << size() << " entries");
        return Value::wrap(toHashMap().assoc(key, val));
    }
    return Value::wrap(assoc(key, val));
}

Value PersistentArrayMap::conjoin(const Value& x) const {
    Value result = Value::wrap(*this);
    for (const MapEntry& entry : entriesForConjoin(x)) {
        result = result.asCollection()->asAssociative()->associate(entry.key, entry.value);
    }
    return result;
}

// Iteration

SeqPtr PersistentArrayMap::seq() const {
    if (entries_->empty()) return nullptr;
    return std::make_shared<const ArrayMapSeq>(entries_, 0);
}

SeqPtr ArrayMapSeq::next() const {
    if (index_ + 1 >= entries_->size()) return nullptr;
    return std::make_shared<const ArrayMapSeq>(entries_, index_ + 1);
}

// Equality
bool PersistentArrayMap::operator==(const PersistentArrayMap& other) const {
    if (entries_ == other.entries_) return true;
    if (size() != other.size()) return false;

    // Order-independent comparison
    for (const MapEntry& entry : *entries_) {
        int idx = other.findIndex(entry.key);
        if (idx < 0 || (*other.entries_)[idx].value != entry.value) {
            return false;
        }
    }
    return true;
}

// Factory methods
PersistentArrayMap PersistentArrayMap::of(std::initializer_list<MapEntry> entries) {
    PersistentArrayMap result;
    for (const MapEntry& entry : entries) {
        result = result.assoc(entry.key, entry.value);
    }
    return result;
}

}  // namespace pcoll
