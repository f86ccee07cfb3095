#include "seq.hpp"
#include "config.hpp"
#include "debug_log.hpp"
#include "errors.hpp"

namespace pcoll {

//=============================================================================
// ASeq
//=============================================================================

SeqPtr ASeq::self() const {
    return std::static_pointer_cast<const ASeq>(shared_from_this());
}

void ASeq::dropChain(SeqPtr chain) {
    while (chain && chain.use_count() == 1) {
        SeqPtr tail = chain->releaseTail();
        // Frees the cell; its own tail is already detached
        chain = std::move(tail);
    }
}

SeqPtr ASeq::more() const {
    SeqPtr n = next();
    return n ? n : emptySeq();
}

size_t ASeq::count() const {
    const size_t limit = Config::activeCountLimit();
    size_t n = 0;
    for (SeqPtr s = seq(); s; s = s->next()) {
        if (limit != 0 && n >= limit) {
            throw IllegalStateError("count() exceeded the configured limit of " +
                                    std::to_string(limit) + " elements");
        }
        ++n;
    }
    return n;
}

Value ASeq::conjoin(const Value& x) const {
    return Value(CollectionPtr(std::make_shared<const Cons>(x, self())));
}

Value ASeq::emptyValue() const {
    return Value(CollectionPtr(emptySeq()));
}

Value ASeq::nth(size_t idx) const {
    size_t i = 0;
    for (SeqPtr s = seq(); s; s = s->next(), ++i) {
        if (i == idx) return s->first();
    }
    throw IndexError(idx, i);
}

Value ASeq::nth(size_t idx, const Value& notFound) const {
    size_t i = 0;
    for (SeqPtr s = seq(); s; s = s->next(), ++i) {
        if (i == idx) return s->first();
    }
    return notFound;
}

//=============================================================================
// EmptyList
//=============================================================================

SeqPtr EmptyList::instance() {
    static const SeqPtr empty = std::make_shared<const EmptyList>();
    return empty;
}

//=============================================================================
// Cons
//=============================================================================

SeqPtr Cons::next() const {
    return more_ ? more_->seq() : nullptr;
}

SeqPtr Cons::more() const {
    return more_ ? more_ : emptySeq();
}

//=============================================================================
// LazySeq
//=============================================================================

SeqPtr LazySeq::realize() const {
    // Fast path: no locking once realized
    if (realized_.load(std::memory_order_acquire)) {
        return seq_;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!realized_.load(std::memory_order_relaxed)) {
        // If the producer throws, the cell stays unrealized
        SeqPtr produced = producer_();
        // Unwrap nested lazy cells so seq_ is either nullptr or non-empty
        seq_ = produced ? produced->seq() : nullptr;
        producer_ = nullptr;
        realized_.store(true, std::memory_order_release);
        PCOLL_TRACE("LazySeq", "realized " << this << (seq_ ? "" : " (terminal)"));
    }
    return seq_;
}

Value LazySeq::first() const {
    SeqPtr s = realize();
    return s ? s->first() : Value();
}

SeqPtr LazySeq::next() const {
    SeqPtr s = realize();
    return s ? s->next() : nullptr;
}

SeqPtr LazySeq::more() const {
    SeqPtr s = realize();
    return s ? s->more() : emptySeq();
}

//=============================================================================
// ArraySeq / StringSeq
//=============================================================================

SeqPtr ArraySeq::create(std::shared_ptr<const std::vector<Value>> items, size_t index) {
    if (!items || index >= items->size()) return nullptr;
    return std::make_shared<const ArraySeq>(std::move(items), index);
}

SeqPtr StringSeq::create(const Value& str, size_t offset) {
    if (offset >= str.asString().size()) return nullptr;
    return std::make_shared<const StringSeq>(str, offset);
}

Value StringSeq::first() const {
    size_t pos = offset_;
    return Value::character(decodeUtf8(str_.asString(), pos));
}

SeqPtr StringSeq::next() const {
    size_t pos = offset_;
    decodeUtf8(str_.asString(), pos);
    return create(str_, pos);
}

//=============================================================================
// Helpers
//=============================================================================

SeqPtr lazySeq(LazySeq::Producer producer) {
    return std::make_shared<const LazySeq>(std::move(producer));
}

SeqPtr cons(const Value& x, SeqPtr more) {
    return std::make_shared<const Cons>(x, std::move(more));
}

SeqPtr seqOf(std::vector<Value> items) {
    return ArraySeq::create(std::make_shared<const std::vector<Value>>(std::move(items)));
}

std::vector<Value> toVector(SeqPtr seq) {
    std::vector<Value> result;
    for (SeqPtr s = seq ? seq->seq() : nullptr; s; s = s->next()) {
        result.push_back(s->first());
    }
    return result;
}

}  // namespace pcoll
