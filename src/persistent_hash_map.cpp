#include "persistent_hash_map.hpp"
#include "debug_log.hpp"
#include "errors.hpp"

namespace pcoll {

uint32_t hashKey(const Value& key) {
    uint64_t h = static_cast<uint64_t>(key.hash());
    return static_cast<uint32_t>(h ^ (h >> 32));
}

//=============================================================================
// BitmapNode Implementation
//=============================================================================

const MapEntry* BitmapNode::find(uint32_t shift, uint32_t hash, const Value& key) const {
    uint32_t bit_pos = 1u << ((hash >> shift) & MASK);

    // Check if this slot is occupied
    if ((bitmap_ & bit_pos) == 0) {
        return nullptr;
    }

    // Calculate array index
    uint32_t idx = popcount(bitmap_ & (bit_pos - 1));

    const Slot& elem = array_[idx];
    if (const EntryPtr* entry = std::get_if<EntryPtr>(&elem)) {
        return (*entry)->key == key ? entry->get() : nullptr;
    }
    return std::get<Ptr>(elem)->find(shift + BITS, hash, key);
}

HashNode::Ptr BitmapNode::assoc(uint32_t shift, uint32_t hash,
                                const Value& key, const Value& val, bool& addedLeaf) const {
    uint32_t bit_pos = 1u << ((hash >> shift) & MASK);
    uint32_t idx = popcount(bitmap_ & (bit_pos - 1));

    if ((bitmap_ & bit_pos) == 0) {
        // Slot is empty, insert new entry
        std::vector<Slot> newArray;
        newArray.reserve(array_.size() + 1);
        newArray.insert(newArray.end(), array_.begin(), array_.begin() + idx);
        newArray.push_back(std::make_shared<const MapEntry>(key, val));
        newArray.insert(newArray.end(), array_.begin() + idx, array_.end());

        addedLeaf = true;
        return makeNode<BitmapNode>(bitmap_ | bit_pos, std::move(newArray));
    }

    const Slot& elem = array_[idx];

    if (const EntryPtr* entry = std::get_if<EntryPtr>(&elem)) {
        if ((*entry)->key == key) {
            // Same key, update value
            if ((*entry)->value.identical(val)) {
                return Ptr(this);
            }

            // Copy-on-write: copying the slots only bumps reference counts
            std::vector<Slot> newArray = array_;
            newArray[idx] = std::make_shared<const MapEntry>((*entry)->key, val);
            return makeNode<BitmapNode>(bitmap_, std::move(newArray));
        }

        // Different key, same slot - push both down into a sub-node
        std::vector<Slot> newArray = array_;
        newArray[idx] = createNode(shift + BITS, *entry, hash, std::make_shared<const MapEntry>(key, val));
        addedLeaf = true;
        return makeNode<BitmapNode>(bitmap_, std::move(newArray));
    }

    // It's a child node, recurse
    const Ptr& child = std::get<Ptr>(elem);
    Ptr newChild = child->assoc(shift + BITS, hash, key, val, addedLeaf);
    if (newChild == child) {
        return Ptr(this);
    }

    std::vector<Slot> newArray = array_;
    newArray[idx] = std::move(newChild);
    return makeNode<BitmapNode>(bitmap_, std::move(newArray));
}

HashNode::Ptr BitmapNode::without(uint32_t shift, uint32_t hash, const Value& key) const {
    uint32_t bit_pos = 1u << ((hash >> shift) & MASK);

    if ((bitmap_ & bit_pos) == 0) {
        // Key not in this node
        return Ptr(this);
    }

    uint32_t idx = popcount(bitmap_ & (bit_pos - 1));
    const Slot& elem = array_[idx];

    Ptr newChild;
    if (const EntryPtr* entry = std::get_if<EntryPtr>(&elem)) {
        if ((*entry)->key != key) {
            return Ptr(this);
        }
    } else {
        const Ptr& child = std::get<Ptr>(elem);
        newChild = child->without(shift + BITS, hash, key);
        if (newChild == child) {
            return Ptr(this);
        }
    }

    if (newChild) {
        // Child shrank but is not empty
        std::vector<Slot> newArray = array_;
        newArray[idx] = std::move(newChild);
        return makeNode<BitmapNode>(bitmap_, std::move(newArray));
    }

    // Entry (or emptied child) goes away
    if (array_.size() == 1) {
        return Ptr();
    }
    std::vector<Slot> newArray;
    newArray.reserve(array_.size() - 1);
    newArray.insert(newArray.end(), array_.begin(), array_.begin() + idx);
    newArray.insert(newArray.end(), array_.begin() + idx + 1, array_.end());
    return makeNode<BitmapNode>(bitmap_ & ~bit_pos, std::move(newArray));
}

const MapEntry* BitmapNode::entryAt(size_t idx) const {
    const EntryPtr* entry = std::get_if<EntryPtr>(&array_.at(idx));
    return entry ? entry->get() : nullptr;
}

const HashNode* BitmapNode::childAt(size_t idx) const {
    const Ptr* child = std::get_if<Ptr>(&array_.at(idx));
    return child ? child->get() : nullptr;
}

HashNode::Ptr BitmapNode::createNode(uint32_t shift, EntryPtr entry1, uint32_t hash2, EntryPtr entry2) {
    uint32_t hash1 = hashKey(entry1->key);

    if (hash1 == hash2) {
        // Full 32-bit collision, no level can tell the keys apart
        PCOLL_DEBUG("PersistentHashMap", "collision node for hash " << hash1 << " at shift " << shift);
        return makeNode<CollisionNode>(hash1, std::vector<EntryPtr>{std::move(entry1), std::move(entry2)});
    }

    uint32_t idx1 = (hash1 >> shift) & MASK;
    uint32_t idx2 = (hash2 >> shift) & MASK;

    if (idx1 == idx2) {
        // Same index at this level, recurse deeper
        Ptr child = createNode(shift + BITS, std::move(entry1), hash2, std::move(entry2));
        return makeNode<BitmapNode>(1u << idx1, std::vector<Slot>{std::move(child)});
    }

    // Different indices, create node with both entries
    uint32_t bitmap = (1u << idx1) | (1u << idx2);
    std::vector<Slot> array;
    if (idx1 < idx2) {
        array.push_back(std::move(entry1));
        array.push_back(std::move(entry2));
    } else {
        array.push_back(std::move(entry2));
        array.push_back(std::move(entry1));
    }
    return makeNode<BitmapNode>(bitmap, std::move(array));
}

//=============================================================================
// CollisionNode Implementation
//=============================================================================

int CollisionNode::findIndex(const Value& key) const {
    for (size_t i = 0; i < entries_.size(); ++i) {
        if (entries_[i]->key == key) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

const MapEntry* CollisionNode::find(uint32_t, uint32_t, const Value& key) const {
    int idx = findIndex(key);
    return idx >= 0 ? entries_[idx].get() : nullptr;
}

HashNode::Ptr CollisionNode::assoc(uint32_t shift, uint32_t hash,
                                   const Value& key, const Value& val, bool& addedLeaf) const {
    if (hash != hash_) {
        // Hashes diverge below this level: nest this node in a bitmap node and retry there
        Ptr parent = makeNode<BitmapNode>(1u << ((hash_ >> shift) & MASK),
                                          std::vector<BitmapNode::Slot>{Ptr(this)});
        return parent->assoc(shift, hash, key, val, addedLeaf);
    }

    int idx = findIndex(key);
    if (idx >= 0) {
        if (entries_[idx]->value.identical(val)) {
            return Ptr(this);
        }
        std::vector<EntryPtr> newEntries = entries_;
        newEntries[idx] = std::make_shared<const MapEntry>(entries_[idx]->key, val);
        return makeNode<CollisionNode>(hash_, std::move(newEntries));
    }

    // Key not found, append
    std::vector<EntryPtr> newEntries = entries_;
    newEntries.push_back(std::make_shared<const MapEntry>(key, val));
    addedLeaf = true;
    return makeNode<CollisionNode>(hash_, std::move(newEntries));
}

HashNode::Ptr CollisionNode::without(uint32_t, uint32_t, const Value& key) const {
    int idx = findIndex(key);
    if (idx < 0) {
        return Ptr(this);
    }
    if (entries_.size() == 1) {
        return Ptr();
    }

    std::vector<EntryPtr> newEntries;
    newEntries.reserve(entries_.size() - 1);
    for (size_t i = 0; i < entries_.size(); ++i) {
        if (i != static_cast<size_t>(idx)) {
            newEntries.push_back(entries_[i]);
        }
    }
    return makeNode<CollisionNode>(hash_, std::move(newEntries));
}

//=============================================================================
// HashNodeSeq Implementation - O(depth) memory traversal
//=============================================================================

bool HashNodeSeq::settle(std::vector<Frame>& stack) {
    while (!stack.empty()) {
        const Frame top = stack.back();

        if (top.index >= top.node->slotCount()) {
            // Exhausted this node, resume the parent after it
            stack.pop_back();
            if (!stack.empty()) {
                ++stack.back().index;
            }
            continue;
        }

        if (top.node->entryAt(top.index)) {
            return true;
        }
        stack.push_back({top.node->childAt(top.index), 0});
    }
    return false;
}

SeqPtr HashNodeSeq::create(HashNode::Ptr root, size_t count, Mode mode) {
    if (!root || count == 0) {
        return nullptr;
    }
    std::vector<Frame> stack{{root.get(), 0}};
    if (!settle(stack)) {
        return nullptr;
    }
    return std::make_shared<const HashNodeSeq>(std::move(root), std::move(stack), count, mode);
}

Value HashNodeSeq::first() const {
    const Frame& top = stack_.back();
    const MapEntry* entry = top.node->entryAt(top.index);
    switch (mode_) {
        case Mode::KEYS: return entry->key;
        case Mode::VALUES: return entry->value;
        case Mode::ENTRIES: break;
    }
    return entry->toValue();
}

SeqPtr HashNodeSeq::next() const {
    std::vector<Frame> stack = stack_;
    ++stack.back().index;
    if (!settle(stack)) {
        return nullptr;
    }
    return std::make_shared<const HashNodeSeq>(root_, std::move(stack), remaining_ - 1, mode_);
}

//=============================================================================
// PersistentHashMap Implementation
//=============================================================================

PersistentHashMap PersistentHashMap::assoc(const Value& key, const Value& val) const {
    uint32_t hash = hashKey(key);

    if (!root_) {
        // Empty map, create first node
        std::vector<BitmapNode::Slot> array{std::make_shared<const MapEntry>(key, val)};
        return PersistentHashMap(makeNode<BitmapNode>(1u << (hash & MASK), std::move(array)), 1);
    }

    bool addedLeaf = false;
    HashNode::Ptr newRoot = root_->assoc(0, hash, key, val, addedLeaf);
    if (newRoot == root_) {
        // No change
        return *this;
    }
    return PersistentHashMap(std::move(newRoot), addedLeaf ? count_ + 1 : count_);
}

PersistentHashMap PersistentHashMap::dissoc(const Value& key) const {
    if (!root_) {
        return *this;
    }

    uint32_t hash = hashKey(key);
    if (!root_->find(0, hash, key)) {
        // Key not found
        return *this;
    }
    return PersistentHashMap(root_->without(0, hash, key), count_ - 1);
}

Value PersistentHashMap::get(const Value& key, const Value& default_val) const {
    if (!root_) {
        return default_val;
    }
    const MapEntry* entry = root_->find(0, hashKey(key), key);
    return entry ? entry->value : default_val;
}

std::optional<MapEntry> PersistentHashMap::find(const Value& key) const {
    if (!root_) {
        return std::nullopt;
    }
    const MapEntry* entry = root_->find(0, hashKey(key), key);
    if (!entry) {
        return std::nullopt;
    }
    return *entry;
}

bool PersistentHashMap::contains(const Value& key) const {
    return root_ && root_->find(0, hashKey(key), key) != nullptr;
}

PersistentHashMap PersistentHashMap::merge(const Collection& other) const {
    if (other.category() != Category::MAP) {
        throw TypeError(std::string("merge() requires a map, got ") + other.typeName());
    }
    PersistentHashMap result = *this;
    for (SeqPtr s = other.seq(); s; s = s->next()) {
        MapEntry entry = entryFromValue(s->first());
        result = result.assoc(entry.key, entry.value);
    }
    return result;
}

Value PersistentHashMap::conjoin(const Value& x) const {
    PersistentHashMap result = *this;
    for (const MapEntry& entry : entriesForConjoin(x)) {
        result = result.assoc(entry.key, entry.value);
    }
    return Value::wrap(std::move(result));
}

SeqPtr PersistentHashMap::seq() const {
    return HashNodeSeq::create(root_, count_, HashNodeSeq::Mode::ENTRIES);
}

SeqPtr PersistentHashMap::keys() const {
    return HashNodeSeq::create(root_, count_, HashNodeSeq::Mode::KEYS);
}

SeqPtr PersistentHashMap::vals() const {
    return HashNodeSeq::create(root_, count_, HashNodeSeq::Mode::VALUES);
}

bool PersistentHashMap::operator==(const PersistentHashMap& other) const {
    if (count_ != other.count_) {
        return false;
    }
    if (root_ == other.root_) {
        return true;
    }
    return equals(other);
}

PersistentHashMap PersistentHashMap::of(std::initializer_list<MapEntry> entries) {
    PersistentHashMap result;
    for (const MapEntry& entry : entries) {
        result = result.assoc(entry.key, entry.value);
    }
    return result;
}

PersistentHashMap PersistentHashMap::fromEntries(const std::vector<MapEntry>& entries) {
    PersistentHashMap result;
    for (const MapEntry& entry : entries) {
        result = result.assoc(entry.key, entry.value);
    }
    return result;
}

}  // namespace pcoll
