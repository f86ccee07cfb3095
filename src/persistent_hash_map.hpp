#pragma once

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <variant>
#include <vector>
#include "collection.hpp"
#include "seq.hpp"
#include "trie_node.hpp"

namespace pcoll {

// Hash folded to the 32 bits the trie consumes, 5 per level
uint32_t hashKey(const Value& key);

/**
 * HashNode - Abstract HAMT node
 *
 * All operations are pure: assoc/without return this node (same pointer)
 * when nothing changed, a new node otherwise, and never touch the
 * original. without() returns nullptr when the node becomes empty.
 */
class HashNode : public RefCounted {
public:
    using Ptr = NodePtr<HashNode>;

    virtual const MapEntry* find(uint32_t shift, uint32_t hash, const Value& key) const = 0;

    virtual Ptr assoc(uint32_t shift, uint32_t hash,
                      const Value& key, const Value& val, bool& addedLeaf) const = 0;

    virtual Ptr without(uint32_t shift, uint32_t hash, const Value& key) const = 0;

    // Slot access for traversal: a slot holds either an entry or a child
    virtual size_t slotCount() const = 0;
    virtual const MapEntry* entryAt(size_t idx) const = 0;    // nullptr for a child slot
    virtual const HashNode* childAt(size_t idx) const = 0;    // nullptr for an entry slot
};

using EntryPtr = std::shared_ptr<const MapEntry>;

// BitmapNode: Main HAMT node using bitmap indexing
class BitmapNode : public HashNode {
public:
    using Slot = std::variant<EntryPtr, HashNode::Ptr>;

    BitmapNode(uint32_t bitmap, std::vector<Slot> array)
        : bitmap_(bitmap), array_(std::move(array)) {}

    const MapEntry* find(uint32_t shift, uint32_t hash, const Value& key) const override;
    Ptr assoc(uint32_t shift, uint32_t hash,
              const Value& key, const Value& val, bool& addedLeaf) const override;
    Ptr without(uint32_t shift, uint32_t hash, const Value& key) const override;

    size_t slotCount() const override { return array_.size(); }
    const MapEntry* entryAt(size_t idx) const override;
    const HashNode* childAt(size_t idx) const override;

    uint32_t getBitmap() const { return bitmap_; }
    const std::vector<Slot>& getArray() const { return array_; }

    // Node holding two entries whose keys differ; nests until their hash bits diverge
    static Ptr createNode(uint32_t shift, EntryPtr entry1, uint32_t hash2, EntryPtr entry2);

private:
    uint32_t bitmap_;
    std::vector<Slot> array_;   // popcount(bitmap_) slots, in bit order
};

// CollisionNode: Handles hash collisions when multiple keys have the same hash
class CollisionNode : public HashNode {
public:
    CollisionNode(uint32_t hash, std::vector<EntryPtr> entries)
        : hash_(hash), entries_(std::move(entries)) {}

    const MapEntry* find(uint32_t shift, uint32_t hash, const Value& key) const override;
    Ptr assoc(uint32_t shift, uint32_t hash,
              const Value& key, const Value& val, bool& addedLeaf) const override;
    Ptr without(uint32_t shift, uint32_t hash, const Value& key) const override;

    size_t slotCount() const override { return entries_.size(); }
    const MapEntry* entryAt(size_t idx) const override { return entries_.at(idx).get(); }
    const HashNode* childAt(size_t) const override { return nullptr; }

    uint32_t getHash() const { return hash_; }

private:
    int findIndex(const Value& key) const;

    uint32_t hash_;
    std::vector<EntryPtr> entries_;
};

/**
 * HashNodeSeq - Depth-first sequence over the entries of a HAMT
 *
 * Keeps a stack of (node, slot) frames, O(depth) per step; the root
 * reference keeps the whole trie alive for as long as the sequence is.
 */
class HashNodeSeq : public ASeq {
public:
    enum class Mode { ENTRIES, KEYS, VALUES };

    struct Frame {
        const HashNode* node;
        size_t index;
    };

    // nullptr for an empty trie
    static SeqPtr create(HashNode::Ptr root, size_t count, Mode mode);

    HashNodeSeq(HashNode::Ptr root, std::vector<Frame> stack, size_t remaining, Mode mode)
        : root_(std::move(root)), stack_(std::move(stack)), remaining_(remaining), mode_(mode) {}

    Value first() const override;
    SeqPtr next() const override;
    size_t count() const override { return remaining_; }

    const char* typeName() const override { return "HashNodeSeq"; }

private:
    // Moves the top frame onto the next entry slot; false when exhausted
    static bool settle(std::vector<Frame>& stack);

    HashNode::Ptr root_;
    std::vector<Frame> stack_;
    size_t remaining_;
    Mode mode_;
};

/**
 * PersistentHashMap - Hash array mapped trie
 *
 * Key features:
 * - O(log₃₂ n) lookup, assoc and dissoc (effectively O(1))
 * - Structural sharing: assoc copies only the nodes on the path to the key
 * - Keys compared by structural equality (Value::operator==)
 * - nil is a legitimate key and value; find() distinguishes absence
 *
 * Iteration order depends on key hashes only and carries no meaning.
 */
class PersistentHashMap : public Collection,
                          public Associative,
                          public Dissociable {
private:
    HashNode::Ptr root_;    // nullptr when empty
    size_t count_;

public:
    PersistentHashMap() : root_(nullptr), count_(0) {}
    PersistentHashMap(HashNode::Ptr root, size_t count) : root_(std::move(root)), count_(count) {}

    // Core operations (functional style)
    PersistentHashMap assoc(const Value& key, const Value& val) const;
    PersistentHashMap dissoc(const Value& key) const;
    Value get(const Value& key, const Value& default_val = Value()) const;
    std::optional<MapEntry> find(const Value& key) const;
    bool contains(const Value& key) const;

    // Right-hand entries win
    PersistentHashMap merge(const Collection& other) const;

    size_t size() const { return count_; }
    const HashNode::Ptr& root() const { return root_; }

    // Sequence views
    SeqPtr keys() const;
    SeqPtr vals() const;

    bool operator==(const PersistentHashMap& other) const;
    bool operator!=(const PersistentHashMap& other) const { return !(*this == other); }

    // Factory methods
    static PersistentHashMap of(std::initializer_list<MapEntry> entries);
    static PersistentHashMap fromEntries(const std::vector<MapEntry>& entries);

    // Collection protocol
    ValueType type() const override { return ValueType::HASH_MAP; }
    const char* typeName() const override { return "PersistentHashMap"; }
    Category category() const override { return Category::MAP; }
    size_t count() const override { return count_; }
    Value conjoin(const Value& x) const override;
    Value emptyValue() const override { return Value::wrap(PersistentHashMap()); }
    SeqPtr seq() const override;

    // Lookup / Associative / Dissociable
    Value lookup(const Value& key, const Value& notFound) const override { return get(key, notFound); }
    std::optional<MapEntry> findEntry(const Value& key) const override { return find(key); }
    bool containsKey(const Value& key) const override { return contains(key); }
    Value associate(const Value& key, const Value& val) const override { return Value::wrap(assoc(key, val)); }
    Value dissociate(const Value& key) const override { return Value::wrap(dissoc(key)); }

    const Lookup* asLookup() const override { return this; }
    const Associative* asAssociative() const override { return this; }
    const Dissociable* asDissociable() const override { return this; }
};

}  // namespace pcoll
