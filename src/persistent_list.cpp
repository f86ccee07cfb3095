#include "persistent_list.hpp"
#include "errors.hpp"

namespace pcoll {

PersistentList PersistentList::conj(const Value& val) const {
    return PersistentList(std::make_shared<const ListCell>(val, head_));
}

Value PersistentList::peek() const {
    return head_ ? head_->first() : Value();
}

PersistentList PersistentList::pop() const {
    if (!head_) {
        throw IllegalStateError("Can't pop empty list");
    }
    return PersistentList(head_->rest());
}

Value PersistentList::nth(size_t idx) const {
    if (idx >= size()) {
        throw IndexError(idx, size());
    }
    return head_->nth(idx);
}

Value PersistentList::nth(size_t idx, const Value& notFound) const {
    if (idx >= size()) {
        return notFound;
    }
    return head_->nth(idx);
}

bool PersistentList::operator==(const PersistentList& other) const {
    if (head_ == other.head_) return true;
    if (size() != other.size()) return false;
    return equals(other);
}

PersistentList PersistentList::of(std::initializer_list<Value> values) {
    return fromValues(std::vector<Value>(values));
}

PersistentList PersistentList::fromValues(const std::vector<Value>& values) {
    // Build from the back so the first value ends up at the head
    std::shared_ptr<const ListCell> head;
    for (auto it = values.rbegin(); it != values.rend(); ++it) {
        head = std::make_shared<const ListCell>(*it, std::move(head));
    }
    return PersistentList(std::move(head));
}

}  // namespace pcoll
