#include "trie_node.hpp"
#include <algorithm>
#include <stdexcept>

namespace pcoll {

VectorNode::Ptr VectorNode::newLeaf(std::vector<Value> values) {
    if (values.size() > NODE_SIZE) {
        throw std::length_error("Vector leaf holds at most 32 values");
    }
    return Ptr(new VectorNode(true, std::move(values), {}));
}

VectorNode::Ptr VectorNode::newInner(std::vector<Ptr> children) {
    if (children.size() > NODE_SIZE) {
        throw std::length_error("Vector node holds at most 32 children");
    }
    return Ptr(new VectorNode(false, {}, std::move(children)));
}

const VectorNode::Ptr& VectorNode::emptyInner() {
    static const Ptr empty = newInner({});
    return empty;
}

VectorNode::Ptr VectorNode::withChildAt(size_t idx, Ptr child) const {
    if (leaf_ || idx > children_.size()) {
        throw std::out_of_range("withChildAt: slot out of range");
    }

    // Copy-on-write: copying the child handles shares every other subtree
    std::vector<Ptr> array = children_;
    if (idx == array.size()) {
        array.push_back(std::move(child));
    } else {
        array[idx] = std::move(child);
    }
    return newInner(std::move(array));
}

VectorNode::Ptr VectorNode::withValueAt(size_t idx, const Value& val) const {
    if (!leaf_ || idx > values_.size()) {
        throw std::out_of_range("withValueAt: slot out of range");
    }

    std::vector<Value> array = values_;
    if (idx == array.size()) {
        array.push_back(val);
    } else {
        array[idx] = val;
    }
    return newLeaf(std::move(array));
}

VectorNode::Ptr VectorNode::truncated(size_t n) const {
    if (leaf_) {
        return newLeaf(std::vector<Value>(values_.begin(), values_.begin() + std::min(n, values_.size())));
    }
    return newInner(std::vector<Ptr>(children_.begin(), children_.begin() + std::min(n, children_.size())));
}

}  // namespace pcoll
