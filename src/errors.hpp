#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace pcoll {

// nth / update / index outside [0, count)
class IndexError : public std::out_of_range {
public:
    IndexError(int64_t index, size_t count)
        : std::out_of_range("Index " + std::to_string(index) + " out of range for count " +
                            std::to_string(count)),
          index_(index), count_(count) {}

    int64_t index() const { return index_; }
    size_t count() const { return count_; }

private:
    int64_t index_;
    size_t count_;
};

// An operation applied to a value whose type does not implement it
class CapabilityError : public std::logic_error {
public:
    CapabilityError(const std::string& operation, const std::string& typeName)
        : std::logic_error(operation + " not supported on " + typeName),
          operation_(operation), typeName_(typeName) {}

    const std::string& operation() const { return operation_; }
    const std::string& typeName() const { return typeName_; }

private:
    std::string operation_;
    std::string typeName_;
};

// Two values the default comparator has no order for
class ComparatorError : public std::runtime_error {
public:
    explicit ComparatorError(const std::string& what) : std::runtime_error(what) {}
};

// Malformed binding pattern
class PatternError : public std::invalid_argument {
public:
    explicit PatternError(const std::string& what) : std::invalid_argument(what) {}
};

// Value of the wrong kind for an accessor or argument
class TypeError : public std::invalid_argument {
public:
    explicit TypeError(const std::string& what) : std::invalid_argument(what) {}
};

// Operation impossible in the collection's current state (pop of an empty stack, ...)
class IllegalStateError : public std::runtime_error {
public:
    explicit IllegalStateError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace pcoll
