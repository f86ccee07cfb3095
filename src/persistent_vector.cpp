#include "persistent_vector.hpp"
#include "debug_log.hpp"
#include "errors.hpp"

namespace pcoll {

namespace {

// Integer key as an index, or -1 for anything else
int64_t indexKey(const Value& key) {
    return key.isInteger() ? key.asInteger() : -1;
}

}  // namespace

// PersistentVector implementation

PersistentVector::PersistentVector()
    : root_(VectorNode::emptyInner())
    , tail_(std::make_shared<const std::vector<Value>>())
    , count_(0)
    , shift_(BITS) {}

PersistentVector::PersistentVector(VectorNode::Ptr root,
                                   std::shared_ptr<const std::vector<Value>> tail,
                                   size_t count, uint32_t shift)
    : root_(std::move(root)), tail_(std::move(tail)), count_(count), shift_(shift) {}

// Core operations

PersistentVector PersistentVector::conj(const Value& val) const {
    // Fast path: append to tail if there's room
    if (tail_->size() < NODE_SIZE) {
        auto newTail = std::make_shared<std::vector<Value>>(*tail_);
        newTail->push_back(val);
        return PersistentVector(root_, std::move(newTail), count_ + 1, shift_);
    }

    // Tail is full, need to push it to tree
    VectorNode::Ptr tailNode = VectorNode::newLeaf(*tail_);
    auto newTail = std::make_shared<const std::vector<Value>>(1, val);

    // Check if we need to expand the tree height
    if ((count_ >> BITS) > (size_t(1) << shift_)) {
        // Tree is full at current height, need to add a level
        PCOLL_DEBUG("PersistentVector", "growing tree to shift " << (shift_ + BITS) << " at count " << count_);
        VectorNode::Ptr newRoot = VectorNode::newInner({root_, newPath(shift_, std::move(tailNode))});
        return PersistentVector(std::move(newRoot), std::move(newTail), count_ + 1, shift_ + BITS);
    }

    // Push tail into existing tree
    PCOLL_TRACE("PersistentVector", "flushing tail at count " << count_);
    VectorNode::Ptr newRoot = pushTail(root_, shift_, std::move(tailNode));
    return PersistentVector(std::move(newRoot), std::move(newTail), count_ + 1, shift_);
}

VectorNode::Ptr PersistentVector::pushTail(const VectorNode::Ptr& parent, uint32_t level,
                                           VectorNode::Ptr tailNode) const {
    size_t subidx = ((count_ - 1) >> level) & MASK;

    VectorNode::Ptr nodeToInsert;
    if (level == BITS) {
        // Parent of leaves: the tail becomes the new leaf
        nodeToInsert = std::move(tailNode);
    } else if (subidx < parent->size()) {
        // Recurse into existing child
        nodeToInsert = pushTail(parent->childAt(subidx), level - BITS, std::move(tailNode));
    } else {
        // Creating new path
        nodeToInsert = newPath(level - BITS, std::move(tailNode));
    }

    return parent->withChildAt(subidx, std::move(nodeToInsert));
}

VectorNode::Ptr PersistentVector::newPath(uint32_t level, VectorNode::Ptr node) {
    if (level == 0) {
        return node;
    }
    return VectorNode::newInner({newPath(level - BITS, std::move(node))});
}

const std::vector<Value>& PersistentVector::arrayFor(size_t idx) const {
    // Check if in tail
    if (idx >= tailOffset()) {
        return *tail_;
    }

    // Descend through internal nodes until we reach a leaf
    const VectorNode* node = root_.get();
    for (uint32_t level = shift_; level > 0; level -= BITS) {
        node = node->childAt((idx >> level) & MASK).get();
    }
    return node->values();
}

Value PersistentVector::nth(size_t idx) const {
    if (idx >= count_) {
        throw IndexError(idx, count_);
    }
    return arrayFor(idx)[idx & MASK];
}

Value PersistentVector::nth(size_t idx, const Value& notFound) const {
    if (idx >= count_) {
        return notFound;
    }
    return arrayFor(idx)[idx & MASK];
}

Value PersistentVector::get(size_t idx, const Value& default_val) const {
    return nth(idx, default_val);
}

PersistentVector PersistentVector::assoc(size_t idx, const Value& val) const {
    if (idx == count_) {
        return conj(val);
    }
    if (idx > count_) {
        throw IndexError(idx, count_);
    }

    // Check if in tail
    if (idx >= tailOffset()) {
        size_t tailIdx = idx - tailOffset();
        if ((*tail_)[tailIdx].identical(val)) {
            return *this;  // No change
        }

        auto newTail = std::make_shared<std::vector<Value>>(*tail_);
        (*newTail)[tailIdx] = val;
        return PersistentVector(root_, std::move(newTail), count_, shift_);
    }

    // In tree - path copying
    VectorNode::Ptr newRoot = assocInTree(root_, shift_, idx, val);
    return PersistentVector(std::move(newRoot), tail_, count_, shift_);
}

VectorNode::Ptr PersistentVector::assocInTree(const VectorNode::Ptr& node, uint32_t level,
                                              size_t idx, const Value& val) const {
    if (level == 0) {
        // Leaf level - node contains values
        return node->withValueAt(idx & MASK, val);
    }

    // Internal node - only the child on the path is replaced
    size_t subidx = (idx >> level) & MASK;
    VectorNode::Ptr newChild = assocInTree(node->childAt(subidx), level - BITS, idx, val);
    return node->withChildAt(subidx, std::move(newChild));
}

PersistentVector PersistentVector::pop() const {
    if (count_ == 0) {
        throw IllegalStateError("Can't pop empty vector");
    }

    if (count_ == 1) {
        return PersistentVector();
    }

    // If tail has more than one element, just remove the last
    if (count_ - tailOffset() > 1) {
        auto newTail = std::make_shared<const std::vector<Value>>(tail_->begin(), tail_->end() - 1);
        return PersistentVector(root_, std::move(newTail), count_ - 1, shift_);
    }

    // Tail becomes empty: the rightmost leaf moves back into the tail
    auto newTail = std::make_shared<const std::vector<Value>>(arrayFor(count_ - 2));
    VectorNode::Ptr newRoot = popTail(root_, shift_);
    uint32_t newShift = shift_;

    if (!newRoot) {
        newRoot = VectorNode::emptyInner();
    }
    if (shift_ > BITS && newRoot->size() == 1) {
        // Root has a single child, drop a level
        PCOLL_DEBUG("PersistentVector", "shrinking tree to shift " << (shift_ - BITS));
        VectorNode::Ptr onlyChild = newRoot->childAt(0);
        newRoot = std::move(onlyChild);
        newShift -= BITS;
    }

    return PersistentVector(std::move(newRoot), std::move(newTail), count_ - 1, newShift);
}

VectorNode::Ptr PersistentVector::popTail(const VectorNode::Ptr& node, uint32_t level) const {
    size_t subidx = ((count_ - 2) >> level) & MASK;

    if (level > BITS) {
        VectorNode::Ptr newChild = popTail(node->childAt(subidx), level - BITS);
        if (!newChild && subidx == 0) {
            return nullptr;
        }
        if (!newChild) {
            return node->truncated(subidx);
        }
        return node->withChildAt(subidx, std::move(newChild));
    }

    if (subidx == 0) {
        return nullptr;
    }
    return node->truncated(subidx);
}

Value PersistentVector::peek() const {
    if (count_ == 0) {
        return Value();
    }
    return nth(count_ - 1);
}

// Iteration and conversion

SeqPtr PersistentVector::seq() const {
    if (count_ == 0) return nullptr;
    return std::make_shared<const VectorSeq>(*this, 0, false);
}

SeqPtr PersistentVector::reverseSeq() const {
    if (count_ == 0) return nullptr;
    return std::make_shared<const VectorSeq>(*this, count_ - 1, true);
}

SeqPtr VectorSeq::next() const {
    if (reversed_) {
        if (index_ == 0) return nullptr;
        return std::make_shared<const VectorSeq>(vec_, index_ - 1, true);
    }
    if (index_ + 1 >= vec_.size()) return nullptr;
    return std::make_shared<const VectorSeq>(vec_, index_ + 1, false);
}

std::vector<Value> PersistentVector::toStdVector() const {
    std::vector<Value> result;
    result.reserve(count_);
    for (size_t i = 0; i < count_; i += NODE_SIZE) {
        const std::vector<Value>& leaf = arrayFor(i);
        result.insert(result.end(), leaf.begin(), leaf.end());
    }
    return result;
}

// Slicing

PersistentVector PersistentVector::slice(size_t start, size_t stop) const {
    // Clamp to valid range
    if (stop > count_) stop = count_;
    if (start >= stop) return PersistentVector();

    // Build new vector from slice
    PersistentVector result;
    for (size_t i = start; i < stop; ++i) {
        result = result.conj(nth(i));
    }
    return result;
}

// Lookup / Associative

Value PersistentVector::lookup(const Value& key, const Value& notFound) const {
    int64_t idx = indexKey(key);
    if (idx < 0) return notFound;
    return nth(static_cast<size_t>(idx), notFound);
}

std::optional<MapEntry> PersistentVector::findEntry(const Value& key) const {
    int64_t idx = indexKey(key);
    if (idx < 0 || static_cast<size_t>(idx) >= count_) return std::nullopt;
    return MapEntry(key, nth(static_cast<size_t>(idx)));
}

bool PersistentVector::containsKey(const Value& key) const {
    int64_t idx = indexKey(key);
    return idx >= 0 && static_cast<size_t>(idx) < count_;
}

Value PersistentVector::associate(const Value& key, const Value& val) const {
    if (!key.isInteger()) {
        throw TypeError("Vector key must be an integer, got " + key.typeName());
    }
    int64_t idx = key.asInteger();
    if (idx < 0) {
        throw IndexError(idx, count_);
    }
    return Value::wrap(assoc(static_cast<size_t>(idx), val));
}

// Equality

bool PersistentVector::operator==(const PersistentVector& other) const {
    if (this == &other) return true;
    if (count_ != other.count_) return false;
    if (root_ == other.root_ && tail_ == other.tail_) return true;

    for (size_t i = 0; i < count_; ++i) {
        if (nth(i) != other.nth(i)) return false;
    }
    return true;
}

// Factory methods

PersistentVector PersistentVector::of(std::initializer_list<Value> values) {
    PersistentVector result;
    for (const Value& v : values) {
        result = result.conj(v);
    }
    return result;
}

PersistentVector PersistentVector::fromValues(const std::vector<Value>& values) {
    PersistentVector result;
    for (const Value& v : values) {
        result = result.conj(v);
    }
    return result;
}

PersistentVector PersistentVector::fromSeq(SeqPtr seq) {
    PersistentVector result;
    for (SeqPtr s = seq ? seq->seq() : nullptr; s; s = s->next()) {
        result = result.conj(s->first());
    }
    return result;
}

}  // namespace pcoll
