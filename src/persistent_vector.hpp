#pragma once

#include <initializer_list>
#include <memory>
#include <string>
#include <vector>
#include "collection.hpp"
#include "seq.hpp"
#include "trie_node.hpp"

namespace pcoll {

/**
 * PersistentVector - Indexed sequence with O(log₃₂ n) access
 *
 * Implements a persistent (immutable) vector using a 32-way tree structure
 * with tail optimization.
 *
 * Key features:
 * - O(log₃₂ n) random access and update (effectively O(1) for practical sizes)
 * - O(1) amortized append (tail optimization)
 * - Structural sharing via copy-on-write
 * - Intrusive reference counting for nodes
 *
 * Tree structure:
 * - Each node has up to 32 children (5 bits per level)
 * - Last 1-32 elements stored in separate tail for fast append
 * - Path copying for updates (only O(log n) nodes copied)
 */
class PersistentVector : public Collection,
                         public Associative,
                         public Indexed,
                         public Stack,
                         public Reversible {
private:
    VectorNode::Ptr root_;                                      // Tree root (never null)
    std::shared_ptr<const std::vector<Value>> tail_;            // Last 0-32 elements
    size_t count_;                                              // Total elements
    uint32_t shift_;                                            // Tree depth (5 * levels)

    // Helper: the leaf array (or tail) holding index idx
    const std::vector<Value>& arrayFor(size_t idx) const;

    // Helper: update element in tree, returning new tree
    VectorNode::Ptr assocInTree(const VectorNode::Ptr& node, uint32_t level, size_t idx, const Value& val) const;

    // Helper: push tail to tree when it's full
    VectorNode::Ptr pushTail(const VectorNode::Ptr& parent, uint32_t level, VectorNode::Ptr tailNode) const;

    // Helper: remove the rightmost leaf, nullptr when the subtree becomes empty
    VectorNode::Ptr popTail(const VectorNode::Ptr& node, uint32_t level) const;

    // Helper: create new path for expanding tree
    static VectorNode::Ptr newPath(uint32_t level, VectorNode::Ptr node);

    // Helper: calculate tail offset (index where tail starts)
    size_t tailOffset() const {
        if (count_ < NODE_SIZE) return 0;
        return ((count_ - 1) >> BITS) << BITS;
    }

public:
    // Constructors
    PersistentVector();
    PersistentVector(VectorNode::Ptr root, std::shared_ptr<const std::vector<Value>> tail,
                     size_t count, uint32_t shift);

    PersistentVector(const PersistentVector& other) = default;
    PersistentVector(PersistentVector&& other) noexcept = default;
    PersistentVector& operator=(const PersistentVector& other) = default;
    PersistentVector& operator=(PersistentVector&& other) noexcept = default;

    // Core operations (functional style)
    PersistentVector conj(const Value& val) const;                      // Append
    PersistentVector assoc(size_t idx, const Value& val) const;         // Update at index (idx == size appends)
    PersistentVector pop() const;                                       // Remove last
    Value peek() const;                                                 // Last element, nil when empty
    Value get(size_t idx, const Value& default_val) const;              // Get with default

    // Size
    size_t size() const { return count_; }

    // Structure (exposed for sharing checks)
    const VectorNode::Ptr& root() const { return root_; }
    const std::shared_ptr<const std::vector<Value>>& tail() const { return tail_; }
    uint32_t shift() const { return shift_; }

    // Materialize
    std::vector<Value> toStdVector() const;

    // Slicing [start, stop)
    PersistentVector slice(size_t start, size_t stop) const;

    // Equality
    bool operator==(const PersistentVector& other) const;
    bool operator!=(const PersistentVector& other) const { return !(*this == other); }

    // Factory methods
    static PersistentVector of(std::initializer_list<Value> values);
    static PersistentVector fromValues(const std::vector<Value>& values);
    static PersistentVector fromSeq(SeqPtr seq);

    // Collection protocol
    ValueType type() const override { return ValueType::VECTOR; }
    const char* typeName() const override { return "PersistentVector"; }
    Category category() const override { return Category::SEQUENTIAL; }
    size_t count() const override { return count_; }
    Value conjoin(const Value& x) const override { return Value::wrap(conj(x)); }
    Value emptyValue() const override { return Value::wrap(PersistentVector()); }
    SeqPtr seq() const override;

    // Lookup / Associative: integer keys are indices
    Value lookup(const Value& key, const Value& notFound) const override;
    std::optional<MapEntry> findEntry(const Value& key) const override;
    bool containsKey(const Value& key) const override;
    Value associate(const Value& key, const Value& val) const override;

    // Indexed
    Value nth(size_t idx) const override;
    Value nth(size_t idx, const Value& notFound) const override;

    // Stack: the end where conj is efficient
    Value stackPeek() const override { return peek(); }
    Value stackPop() const override { return Value::wrap(pop()); }

    // Reversible
    SeqPtr reverseSeq() const override;

    const Lookup* asLookup() const override { return this; }
    const Associative* asAssociative() const override { return this; }
    const Indexed* asIndexed() const override { return this; }
    const Stack* asStack() const override { return this; }
    const Reversible* asReversible() const override { return this; }
};

/**
 * VectorSeq - Sequence view over a vector, ascending or descending
 */
class VectorSeq : public ASeq {
private:
    PersistentVector vec_;
    size_t index_;      // current position
    bool reversed_;

public:
    VectorSeq(PersistentVector vec, size_t index, bool reversed)
        : vec_(std::move(vec)), index_(index), reversed_(reversed) {}

    Value first() const override { return vec_.nth(index_); }
    SeqPtr next() const override;
    size_t count() const override { return reversed_ ? index_ + 1 : vec_.size() - index_; }

    const char* typeName() const override { return "VectorSeq"; }
};

}  // namespace pcoll
