#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>
#include "config.hpp"
#include "value.hpp"

namespace pcoll {

// Utility functions for popcount (bit counting)
#if defined(__GNUC__) || defined(__clang__)
    inline uint32_t popcount(uint32_t x) {
        return __builtin_popcount(x);  // Compiler intrinsic
    }
#else
    // Fallback implementation
    inline uint32_t popcount(uint32_t x) {
        x = x - ((x >> 1) & 0x55555555);
        x = (x & 0x33333333) + ((x >> 2) & 0x33333333);
        return (((x + (x >> 4)) & 0x0F0F0F0F) * 0x01010101) >> 24;
    }
#endif

/**
 * RefCounted - Intrusive reference count for immutable tree nodes
 *
 * A node may be shared by any number of collection versions; it is freed
 * when the last NodePtr referring to it goes away.
 */
class RefCounted {
protected:
    mutable std::atomic<uint32_t> refcount_;

public:
    RefCounted() : refcount_(0) {}
    virtual ~RefCounted() = default;

    // No copy/move (managed by refcounting)
    RefCounted(const RefCounted&) = delete;
    RefCounted& operator=(const RefCounted&) = delete;

    void addRef() const {
        refcount_.fetch_add(1, std::memory_order_relaxed);
    }

    void release() const {
        if (refcount_.fetch_sub(1, std::memory_order_release) == 1) {
            std::atomic_thread_fence(std::memory_order_acquire);
            delete this;
        }
    }

    uint32_t getRefCount() const {
        return refcount_.load(std::memory_order_relaxed);
    }
};

/**
 * NodePtr - Owning handle to a RefCounted node
 *
 * Holds one reference for as long as it lives; copies share the node.
 */
template <typename T>
class NodePtr {
private:
    const T* node_;

public:
    NodePtr() : node_(nullptr) {}
    NodePtr(std::nullptr_t) : node_(nullptr) {}

    // Adopts a freshly allocated node (refcount 0) or shares an existing one
    explicit NodePtr(const T* node) : node_(node) {
        if (node_) node_->addRef();
    }

    NodePtr(const NodePtr& other) : node_(other.node_) {
        if (node_) node_->addRef();
    }

    NodePtr(NodePtr&& other) noexcept : node_(other.node_) {
        other.node_ = nullptr;
    }

    template <typename U>
    NodePtr(const NodePtr<U>& other) : node_(other.get()) {
        if (node_) node_->addRef();
    }

    ~NodePtr() {
        if (node_) node_->release();
    }

    // other may be owned by the node being released
    NodePtr& operator=(const NodePtr& other) {
        NodePtr tmp(other);
        std::swap(node_, tmp.node_);
        return *this;
    }

    NodePtr& operator=(NodePtr&& other) noexcept {
        NodePtr tmp(std::move(other));
        std::swap(node_, tmp.node_);
        return *this;
    }

    const T* get() const { return node_; }
    const T* operator->() const { return node_; }
    const T& operator*() const { return *node_; }
    explicit operator bool() const { return node_ != nullptr; }

    bool operator==(const NodePtr& other) const { return node_ == other.node_; }
    bool operator!=(const NodePtr& other) const { return node_ != other.node_; }
};

template <typename T, typename... Args>
NodePtr<T> makeNode(Args&&... args) {
    return NodePtr<T>(new T(std::forward<Args>(args)...));
}

/**
 * VectorNode - 32-way trie node for PersistentVector
 *
 * Either a leaf (up to 32 values) or an inner node (up to 32 children).
 * Nodes are immutable once built: every "edit" returns a new node that
 * shares all untouched children with the original.
 */
class VectorNode : public RefCounted {
public:
    using Ptr = NodePtr<VectorNode>;

    static Ptr newLeaf(std::vector<Value> values);
    static Ptr newInner(std::vector<Ptr> children);
    static const Ptr& emptyInner();

    bool isLeaf() const { return leaf_; }
    size_t size() const { return leaf_ ? values_.size() : children_.size(); }

    // Out-of-range index is a programming error (std::out_of_range)
    const Ptr& childAt(size_t idx) const { return children_.at(idx); }
    const Value& valueAt(size_t idx) const { return values_.at(idx); }
    const std::vector<Value>& values() const { return values_; }

    // Copy with slot idx replaced; idx == size() appends
    Ptr withChildAt(size_t idx, Ptr child) const;
    Ptr withValueAt(size_t idx, const Value& val) const;

    // Copy keeping only the first n slots
    Ptr truncated(size_t n) const;

private:
    VectorNode(bool leaf, std::vector<Value> values, std::vector<Ptr> children)
        : leaf_(leaf), values_(std::move(values)), children_(std::move(children)) {}

    bool leaf_;
    std::vector<Value> values_;
    std::vector<Ptr> children_;
};

}  // namespace pcoll
