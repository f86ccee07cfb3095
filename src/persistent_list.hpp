#pragma once

#include <initializer_list>
#include <memory>
#include <vector>
#include "collection.hpp"
#include "seq.hpp"

namespace pcoll {

// Immutable cons cell of a PersistentList; knows the length behind it
class ListCell : public ASeq {
public:
    ListCell(const Value& first, std::shared_ptr<const ListCell> rest)
        : first_(first), rest_(std::move(rest)), count_(rest_ ? rest_->count_ + 1 : 1) {}
    ~ListCell() override { dropChain(std::move(rest_)); }

    Value first() const override { return first_; }
    SeqPtr next() const override { return rest_; }
    size_t count() const override { return count_; }

    const std::shared_ptr<const ListCell>& rest() const { return rest_; }

    const char* typeName() const override { return "ListCell"; }

protected:
    SeqPtr releaseTail() const override { return std::move(rest_); }

private:
    Value first_;
    mutable std::shared_ptr<const ListCell> rest_;   // mutable for teardown only
    size_t count_;
};

/**
 * PersistentList - Singly linked immutable list
 *
 * - O(1) conj / peek / pop, all at the head
 * - O(1) count (each cell caches the length behind it)
 * - O(n) nth
 * - A list built by conj onto another shares every cell of the original
 */
class PersistentList : public Collection,
                       public Indexed,
                       public Stack {
private:
    std::shared_ptr<const ListCell> head_;   // nullptr when empty

public:
    PersistentList() = default;
    explicit PersistentList(std::shared_ptr<const ListCell> head) : head_(std::move(head)) {}

    // Core operations (functional style)
    PersistentList conj(const Value& val) const;    // Prepend
    Value peek() const;                             // Head, nil when empty
    PersistentList pop() const;                     // IllegalStateError when empty

    size_t size() const { return head_ ? head_->count() : 0; }
    const std::shared_ptr<const ListCell>& head() const { return head_; }

    bool operator==(const PersistentList& other) const;
    bool operator!=(const PersistentList& other) const { return !(*this == other); }

    // Factory methods; elements keep the given order
    static PersistentList of(std::initializer_list<Value> values);
    static PersistentList fromValues(const std::vector<Value>& values);

    // Collection protocol
    ValueType type() const override { return ValueType::LIST; }
    const char* typeName() const override { return "PersistentList"; }
    Category category() const override { return Category::SEQUENTIAL; }
    size_t count() const override { return size(); }
    Value conjoin(const Value& x) const override { return Value::wrap(conj(x)); }
    Value emptyValue() const override { return Value::wrap(PersistentList()); }
    SeqPtr seq() const override { return head_; }

    // Indexed: linear walk
    Value nth(size_t idx) const override;
    Value nth(size_t idx, const Value& notFound) const override;

    // Stack: the head
    Value stackPeek() const override { return peek(); }
    Value stackPop() const override { return Value::wrap(pop()); }

    const Indexed* asIndexed() const override { return this; }
    const Stack* asStack() const override { return this; }
};

}  // namespace pcoll
