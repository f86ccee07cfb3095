#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <variant>

namespace pcoll {

class Collection;
class ASeq;

using CollectionPtr = std::shared_ptr<const Collection>;
using SeqPtr = std::shared_ptr<const ASeq>;

enum class ValueType {
    NIL,
    BOOLEAN,
    INTEGER,
    FLOAT,
    CHAR,
    STRING,
    KEYWORD,
    SYMBOL,
    LIST,
    VECTOR,
    ARRAY_MAP,
    HASH_MAP,
    HASH_SET,
    SORTED_MAP,
    SORTED_SET,
    SEQ
};

/**
 * Value - Immutable dynamically typed value stored in every collection
 *
 * Scalars are held inline; text shares one immutable buffer between
 * copies; collections are held through a shared pointer to the
 * (immutable) collection object, so copying a Value never copies
 * collection contents.
 *
 * Equality and hashing are structural: two vectors with equal elements
 * are equal and hash alike, whatever path built them.
 */
class Value {
public:
    // nil
    Value() : data_(std::monostate{}) {}

    explicit Value(bool b) : data_(b) {}
    explicit Value(int i) : data_(static_cast<int64_t>(i)) {}
    explicit Value(long i) : data_(static_cast<int64_t>(i)) {}
    explicit Value(long long i) : data_(static_cast<int64_t>(i)) {}
    explicit Value(unsigned long i) : data_(static_cast<int64_t>(i)) {}
    explicit Value(unsigned long long i) : data_(static_cast<int64_t>(i)) {}
    explicit Value(double d) : data_(d) {}
    explicit Value(const char* s) : data_(StringText{std::make_shared<const std::string>(s)}) {}
    explicit Value(std::string s) : data_(StringText{std::make_shared<const std::string>(std::move(s))}) {}
    explicit Value(CollectionPtr coll);

    static Value nil() { return Value(); }
    static Value character(char32_t c);
    static Value keyword(std::string_view name);
    static Value symbol(std::string_view name);

    // Box a concrete collection value
    template <typename C>
    static Value wrap(C coll) {
        return Value(CollectionPtr(std::make_shared<const C>(std::move(coll))));
    }

    // nil for an exhausted (null) sequence
    static Value fromSeq(const SeqPtr& seq);

    ValueType type() const;
    std::string typeName() const;

    bool isNil() const { return std::holds_alternative<std::monostate>(data_); }
    bool isBoolean() const { return std::holds_alternative<bool>(data_); }
    bool isInteger() const { return std::holds_alternative<int64_t>(data_); }
    bool isFloat() const { return std::holds_alternative<double>(data_); }
    bool isNumber() const { return isInteger() || isFloat(); }
    bool isChar() const { return std::holds_alternative<char32_t>(data_); }
    bool isString() const { return std::holds_alternative<StringText>(data_); }
    bool isKeyword() const { return std::holds_alternative<KeywordText>(data_); }
    bool isSymbol() const { return std::holds_alternative<SymbolText>(data_); }
    bool isCollection() const { return std::holds_alternative<CollectionPtr>(data_); }

    // Only nil and false are falsy
    bool truthy() const;

    // Typed accessors; TypeError on a kind mismatch
    bool asBool() const;
    int64_t asInteger() const;
    double asFloat() const;      // integers widen
    char32_t asChar() const;
    const std::string& asString() const;
    const std::string& name() const;  // keyword or symbol name
    const CollectionPtr& asCollection() const;

    // Concrete collection of type T, or nullptr
    template <typename T>
    const T* as() const {
        if (!isCollection()) return nullptr;
        return dynamic_cast<const T*>(std::get<CollectionPtr>(data_).get());
    }

    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

    // Same representation object (same collection instance, same text buffer)
    bool identical(const Value& other) const;

    size_t hash() const;

    // Readable form for logs and error messages
    std::string toString() const;

private:
    struct StringText { std::shared_ptr<const std::string> text; };
    struct KeywordText { std::shared_ptr<const std::string> text; };
    struct SymbolText { std::shared_ptr<const std::string> text; };

    std::variant<std::monostate, bool, int64_t, double, char32_t,
                 StringText, KeywordText, SymbolText, CollectionPtr> data_;
};

/**
 * Default comparator - generic three-way total order
 *
 * nil sorts before everything; integers and floats compare numerically;
 * booleans false < true; chars, strings, keywords and symbols compare by
 * their text; vectors compare by length first, then element-wise.
 * Values of unrelated kinds, and collections without a natural order,
 * raise ComparatorError.
 */
int compare(const Value& a, const Value& b);

// Structural hash helpers shared by the collection categories
size_t hashCombine(size_t seed, size_t h);

struct ValueHash {
    size_t operator()(const Value& v) const { return v.hash(); }
};

// Append the UTF-8 encoding of a code point
void appendUtf8(std::string& out, char32_t c);

// Decode the code point starting at byte offset pos; advances pos
char32_t decodeUtf8(const std::string& text, size_t& pos);

}  // namespace pcoll
