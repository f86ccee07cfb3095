#ifndef PCOLL_PERSISTENT_TREE_MAP_HPP
#define PCOLL_PERSISTENT_TREE_MAP_HPP

#include <initializer_list>
#include <optional>
#include <vector>
#include "collection.hpp"
#include "seq.hpp"
#include "trie_node.hpp"

namespace pcoll {

// Color for red-black tree nodes
enum class Color { RED, BLACK };

// TreeNode - Immutable red-black tree node with intrusive reference counting
class TreeNode : public RefCounted {
public:
    using Ptr = NodePtr<TreeNode>;

    const Value key;
    const Value value;
    const Color color;
    const Ptr left;
    const Ptr right;

    TreeNode(const Value& k, const Value& v, Color c, Ptr l, Ptr r)
        : key(k), value(v), color(c), left(std::move(l)), right(std::move(r)) {}

    // Helper methods
    bool isRed() const { return color == Color::RED; }
    bool isBlack() const { return color == Color::BLACK; }
};

/**
 * TreeSeq - Ordered walk over a (sub)tree, ascending or descending
 *
 * The stack holds the path of nodes still to visit; the top is the current
 * node. An optional stop bound ends the walk at the far end of a range.
 */
class TreeSeq : public ASeq {
public:
    enum class Mode { ENTRIES, KEYS, VALUES };

    struct Range {
        std::optional<Bound> lower;
        std::optional<Bound> upper;
    };

    static constexpr size_t NO_COUNT = static_cast<size_t>(-1);

    // nullptr when no node of the tree falls inside the range
    static SeqPtr create(TreeNode::Ptr root, ComparatorPtr cmp, const Range& range,
                         bool ascending, Mode mode, size_t knownCount = NO_COUNT);

    TreeSeq(TreeNode::Ptr root, ComparatorPtr cmp, std::vector<const TreeNode*> stack,
            std::optional<Bound> stop, bool ascending, Mode mode, size_t knownCount)
        : root_(std::move(root)), cmp_(std::move(cmp)), stack_(std::move(stack)),
          stop_(std::move(stop)), ascending_(ascending), mode_(mode), knownCount_(knownCount) {}

    Value first() const override;
    SeqPtr next() const override;
    size_t count() const override;

    const char* typeName() const override { return "TreeSeq"; }

private:
    // Push node and its spine toward the walk's start
    void pushSpine(std::vector<const TreeNode*>& stack, const TreeNode* node) const;
    bool pastStop(const TreeNode* node) const;

    TreeNode::Ptr root_;
    ComparatorPtr cmp_;
    std::vector<const TreeNode*> stack_;
    std::optional<Bound> stop_;
    bool ascending_;
    Mode mode_;
    size_t knownCount_;
};

/**
 * PersistentTreeMap - Immutable sorted map using a left-leaning red-black tree
 *
 * - O(log n) get, assoc, dissoc; height stays within 2 log₂(n + 1)
 * - Path copying: an update allocates new nodes only along the search path
 *   (plus the nodes a rotation touches); everything else is shared
 * - Ordered by the comparator given at construction (default: pcoll::compare)
 * - subseq / rsubseq walk a key range lazily without re-sorting
 *
 * A comparator that is not a strict total order yields an undefined (but
 * still balanced and crash-free) ordering.
 */
class PersistentTreeMap : public Collection,
                          public Associative,
                          public Dissociable,
                          public Sorted,
                          public Reversible {
public:
    // Constructors
    PersistentTreeMap();
    explicit PersistentTreeMap(ComparatorPtr cmp);
    PersistentTreeMap(ComparatorPtr cmp, TreeNode::Ptr root, size_t count);

    // Core operations (functional API)
    PersistentTreeMap assoc(const Value& key, const Value& val) const;
    PersistentTreeMap dissoc(const Value& key) const;
    Value get(const Value& key, const Value& default_val = Value()) const;
    std::optional<MapEntry> find(const Value& key) const;
    bool contains(const Value& key) const;

    // Ordered operations; IllegalStateError on an empty map
    MapEntry first() const;   // smallest key
    MapEntry last() const;    // largest key

    // Entries within bounds, ascending / descending
    SeqPtr subseq(const std::optional<Bound>& lower, const std::optional<Bound>& upper) const;
    SeqPtr rsubseq(const std::optional<Bound>& lower, const std::optional<Bound>& upper) const;

    SeqPtr keys() const;
    SeqPtr vals() const;

    // Size and structure
    size_t size() const { return count_; }
    size_t height() const;
    const TreeNode::Ptr& root() const { return root_; }

    // Red-black and ordering invariants hold (no red right links, no two
    // reds in a row, equal black height, keys strictly increasing)
    bool verifyInvariants() const;

    // Equality
    bool operator==(const PersistentTreeMap& other) const;
    bool operator!=(const PersistentTreeMap& other) const { return !(*this == other); }

    // Factory methods
    static PersistentTreeMap of(std::initializer_list<MapEntry> entries,
                                ComparatorPtr cmp = defaultComparator());
    static PersistentTreeMap fromEntries(const std::vector<MapEntry>& entries,
                                         ComparatorPtr cmp = defaultComparator());

    // Collection protocol
    ValueType type() const override { return ValueType::SORTED_MAP; }
    const char* typeName() const override { return "PersistentTreeMap"; }
    Category category() const override { return Category::MAP; }
    size_t count() const override { return count_; }
    Value conjoin(const Value& x) const override;
    Value emptyValue() const override { return Value::wrap(PersistentTreeMap(cmp_)); }
    SeqPtr seq() const override;

    // Lookup / Associative / Dissociable
    Value lookup(const Value& key, const Value& notFound) const override { return get(key, notFound); }
    std::optional<MapEntry> findEntry(const Value& key) const override { return find(key); }
    bool containsKey(const Value& key) const override { return contains(key); }
    Value associate(const Value& key, const Value& val) const override { return Value::wrap(assoc(key, val)); }
    Value dissociate(const Value& key) const override { return Value::wrap(dissoc(key)); }

    // Sorted / Reversible
    SeqPtr rangeView(const std::optional<Bound>& lower, const std::optional<Bound>& upper,
                     bool ascending) const override;
    const ComparatorPtr& comparator() const override { return cmp_; }
    SeqPtr reverseSeq() const override;

    const Lookup* asLookup() const override { return this; }
    const Associative* asAssociative() const override { return this; }
    const Dissociable* asDissociable() const override { return this; }
    const Sorted* asSorted() const override { return this; }
    const Reversible* asReversible() const override { return this; }

    // Range walk producing keys only (sorted set views)
    SeqPtr keyRange(const std::optional<Bound>& lower, const std::optional<Bound>& upper,
                    bool ascending) const;

private:
    ComparatorPtr cmp_;
    TreeNode::Ptr root_;
    size_t count_;

    int compareKeys(const Value& k1, const Value& k2) const { return (*cmp_)(k1, k2); }

    // Helper methods for tree operations
    TreeNode::Ptr insert(const TreeNode::Ptr& node, const Value& key, const Value& val, bool& inserted) const;
    TreeNode::Ptr remove(TreeNode::Ptr node, const Value& key, bool& removed) const;
    const TreeNode* findNode(const Value& key) const;
};

}  // namespace pcoll

#endif // PCOLL_PERSISTENT_TREE_MAP_HPP
