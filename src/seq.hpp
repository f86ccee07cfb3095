#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "collection.hpp"

namespace pcoll {

/**
 * ASeq - Base of every sequence view
 *
 *   first()  head element (nil when empty)
 *   next()   tail, or nullptr when there is no further element; may force
 *            one element of the tail to find out
 *   more()   tail without forcing its head; never nullptr (empty list
 *            instead) - what rest() returns
 *
 * count() walks the sequence: O(n), and never terminates on an infinite
 * sequence unless Config::countLimit is set. Sequences must be created
 * through std::make_shared (seq() returns the object itself).
 */
class ASeq : public Collection, public Indexed {
public:
    virtual Value first() const = 0;
    virtual SeqPtr next() const = 0;
    virtual SeqPtr more() const;

    ValueType type() const override { return ValueType::SEQ; }
    Category category() const override { return Category::SEQUENTIAL; }

    // Costly: linear walk
    size_t count() const override;
    bool isEmpty() const override { return seq() == nullptr; }

    // Prepends
    Value conjoin(const Value& x) const override;
    Value emptyValue() const override;
    SeqPtr seq() const override { return self(); }

    // Linear walk
    Value nth(size_t idx) const override;
    Value nth(size_t idx, const Value& notFound) const override;

    const Indexed* asIndexed() const override { return this; }

protected:
    SeqPtr self() const;

    // Gives up the tail this cell owns; called only on a dying cell
    virtual SeqPtr releaseTail() const { return nullptr; }

    // Frees a chain one cell at a time while this caller is its only owner,
    // so destroying a long realized sequence does not recurse per element
    static void dropChain(SeqPtr chain);
};

// () - the empty sequence rest() returns at the end
class EmptyList : public ASeq {
public:
    static SeqPtr instance();

    Value first() const override { return Value(); }
    SeqPtr next() const override { return nullptr; }
    SeqPtr more() const override { return self(); }
    SeqPtr seq() const override { return nullptr; }
    size_t count() const override { return 0; }
    bool isEmpty() const override { return true; }

    ValueType type() const override { return ValueType::LIST; }
    const char* typeName() const override { return "EmptyList"; }
};

inline SeqPtr emptySeq() { return EmptyList::instance(); }

// Cons cell: a head in front of any sequence (more may be nullptr)
class Cons : public ASeq {
public:
    Cons(const Value& first, SeqPtr more) : first_(first), more_(std::move(more)) {}
    ~Cons() override { dropChain(std::move(more_)); }

    Value first() const override { return first_; }
    SeqPtr next() const override;
    SeqPtr more() const override;

    const char* typeName() const override { return "Cons"; }

protected:
    SeqPtr releaseTail() const override { return std::move(more_); }

private:
    Value first_;
    mutable SeqPtr more_;   // mutable for teardown only
};

/**
 * LazySeq - Deferred, memoized sequence cell
 *
 * State machine: Unrealized(producer) -> Realized(seq). The producer runs
 * at most once, the first time anything needs the contents; concurrent
 * callers block on this cell's own mutex and then all observe the cached
 * result. A producer that throws leaves the cell unrealized, so the next
 * caller runs it again. Once realized the cell drops the producer.
 */
class LazySeq : public ASeq {
public:
    using Producer = std::function<SeqPtr()>;

    explicit LazySeq(Producer producer) : producer_(std::move(producer)) {}
    ~LazySeq() override { dropChain(std::move(seq_)); }

    Value first() const override;
    SeqPtr next() const override;
    SeqPtr more() const override;
    SeqPtr seq() const override { return realize(); }

    bool isRealized() const { return realized_.load(std::memory_order_acquire); }

    const char* typeName() const override { return "LazySeq"; }

protected:
    SeqPtr releaseTail() const override { return std::move(seq_); }

private:
    SeqPtr realize() const;

    mutable std::mutex mutex_;
    mutable Producer producer_;
    mutable SeqPtr seq_;
    mutable std::atomic<bool> realized_{false};
};

// Sequence over a shared, immutable array of values
class ArraySeq : public ASeq {
public:
    // nullptr when index is past the end
    static SeqPtr create(std::shared_ptr<const std::vector<Value>> items, size_t index = 0);

    ArraySeq(std::shared_ptr<const std::vector<Value>> items, size_t index)
        : items_(std::move(items)), index_(index) {}

    Value first() const override { return (*items_)[index_]; }
    SeqPtr next() const override { return create(items_, index_ + 1); }
    size_t count() const override { return items_->size() - index_; }

    const char* typeName() const override { return "ArraySeq"; }

private:
    std::shared_ptr<const std::vector<Value>> items_;
    size_t index_;
};

// Characters of a string, decoded from UTF-8
class StringSeq : public ASeq {
public:
    // nullptr for an empty string or an offset at the end
    static SeqPtr create(const Value& str, size_t offset = 0);

    StringSeq(const Value& str, size_t offset) : str_(str), offset_(offset) {}

    Value first() const override;
    SeqPtr next() const override;

    const char* typeName() const override { return "StringSeq"; }

private:
    Value str_;
    size_t offset_;
};

// Factory helpers
SeqPtr lazySeq(LazySeq::Producer producer);
SeqPtr cons(const Value& x, SeqPtr more);
SeqPtr seqOf(std::vector<Value> items);

// Copies the elements of a (finite) sequence
std::vector<Value> toVector(SeqPtr seq);

}  // namespace pcoll
