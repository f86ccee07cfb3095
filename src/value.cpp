#include "value.hpp"
#include "collection.hpp"
#include "errors.hpp"
#include "seq.hpp"
#include <cmath>
#include <functional>
#include <sstream>

namespace pcoll {

Value::Value(CollectionPtr coll) : data_(std::monostate{}) {
    if (coll) data_ = std::move(coll);
}

Value Value::character(char32_t c) {
    Value v;
    v.data_ = c;
    return v;
}

Value Value::keyword(std::string_view name) {
    Value v;
    v.data_ = KeywordText{std::make_shared<const std::string>(name)};
    return v;
}

Value Value::symbol(std::string_view name) {
    Value v;
    v.data_ = SymbolText{std::make_shared<const std::string>(name)};
    return v;
}

Value Value::fromSeq(const SeqPtr& seq) {
    if (!seq) return Value();
    return Value(CollectionPtr(seq));
}

ValueType Value::type() const {
    switch (data_.index()) {
        case 0: return ValueType::NIL;
        case 1: return ValueType::BOOLEAN;
        case 2: return ValueType::INTEGER;
        case 3: return ValueType::FLOAT;
        case 4: return ValueType::CHAR;
        case 5: return ValueType::STRING;
        case 6: return ValueType::KEYWORD;
        case 7: return ValueType::SYMBOL;
        default: return std::get<CollectionPtr>(data_)->type();
    }
}

std::string Value::typeName() const {
    switch (data_.index()) {
        case 0: return "nil";
        case 1: return "boolean";
        case 2: return "integer";
        case 3: return "float";
        case 4: return "char";
        case 5: return "string";
        case 6: return "keyword";
        case 7: return "symbol";
        default: return std::get<CollectionPtr>(data_)->typeName();
    }
}

bool Value::truthy() const {
    if (isNil()) return false;
    if (const bool* b = std::get_if<bool>(&data_)) return *b;
    return true;
}

bool Value::asBool() const {
    if (const bool* b = std::get_if<bool>(&data_)) return *b;
    throw TypeError("Expected boolean, got " + typeName());
}

int64_t Value::asInteger() const {
    if (const int64_t* i = std::get_if<int64_t>(&data_)) return *i;
    throw TypeError("Expected integer, got " + typeName());
}

double Value::asFloat() const {
    if (const double* d = std::get_if<double>(&data_)) return *d;
    if (const int64_t* i = std::get_if<int64_t>(&data_)) return static_cast<double>(*i);
    throw TypeError("Expected number, got " + typeName());
}

char32_t Value::asChar() const {
    if (const char32_t* c = std::get_if<char32_t>(&data_)) return *c;
    throw TypeError("Expected char, got " + typeName());
}

const std::string& Value::asString() const {
    if (const StringText* s = std::get_if<StringText>(&data_)) return *s->text;
    throw TypeError("Expected string, got " + typeName());
}

const std::string& Value::name() const {
    if (const KeywordText* k = std::get_if<KeywordText>(&data_)) return *k->text;
    if (const SymbolText* s = std::get_if<SymbolText>(&data_)) return *s->text;
    throw TypeError("Expected keyword or symbol, got " + typeName());
}

const CollectionPtr& Value::asCollection() const {
    if (const CollectionPtr* c = std::get_if<CollectionPtr>(&data_)) return *c;
    throw TypeError("Expected collection, got " + typeName());
}

bool Value::operator==(const Value& other) const {
    if (data_.index() != other.data_.index()) return false;

    switch (data_.index()) {
        case 0: return true;
        case 1: return std::get<bool>(data_) == std::get<bool>(other.data_);
        case 2: return std::get<int64_t>(data_) == std::get<int64_t>(other.data_);
        case 3: return std::get<double>(data_) == std::get<double>(other.data_);
        case 4: return std::get<char32_t>(data_) == std::get<char32_t>(other.data_);
        case 5: return *std::get<StringText>(data_).text == *std::get<StringText>(other.data_).text;
        case 6: return *std::get<KeywordText>(data_).text == *std::get<KeywordText>(other.data_).text;
        case 7: return *std::get<SymbolText>(data_).text == *std::get<SymbolText>(other.data_).text;
        default: {
            const CollectionPtr& a = std::get<CollectionPtr>(data_);
            const CollectionPtr& b = std::get<CollectionPtr>(other.data_);
            if (a == b) return true;
            return a->equals(*b);
        }
    }
}

bool Value::identical(const Value& other) const {
    if (data_.index() != other.data_.index()) return false;
    switch (data_.index()) {
        case 5: return std::get<StringText>(data_).text == std::get<StringText>(other.data_).text;
        case 6: return std::get<KeywordText>(data_).text == std::get<KeywordText>(other.data_).text;
        case 7: return std::get<SymbolText>(data_).text == std::get<SymbolText>(other.data_).text;
        case 8: return std::get<CollectionPtr>(data_) == std::get<CollectionPtr>(other.data_);
        default: return *this == other;
    }
}

size_t hashCombine(size_t seed, size_t h) {
    return seed ^ (h + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

size_t Value::hash() const {
    switch (data_.index()) {
        case 0: return 0;
        case 1: return std::get<bool>(data_) ? 1231 : 1237;
        case 2: return std::hash<int64_t>()(std::get<int64_t>(data_));
        case 3: return hashCombine(3, std::hash<double>()(std::get<double>(data_)));
        case 4: return hashCombine(4, std::hash<uint32_t>()(static_cast<uint32_t>(std::get<char32_t>(data_))));
        case 5: return std::hash<std::string>()(*std::get<StringText>(data_).text);
        case 6: return hashCombine(6, std::hash<std::string>()(*std::get<KeywordText>(data_).text));
        case 7: return hashCombine(7, std::hash<std::string>()(*std::get<SymbolText>(data_).text));
        default: return std::get<CollectionPtr>(data_)->hash();
    }
}

std::string Value::toString() const {
    switch (data_.index()) {
        case 0: return "nil";
        case 1: return std::get<bool>(data_) ? "true" : "false";
        case 2: return std::to_string(std::get<int64_t>(data_));
        case 3: {
            std::ostringstream oss;
            oss << std::get<double>(data_);
            return oss.str();
        }
        case 4: {
            std::string out = "\\";
            appendUtf8(out, std::get<char32_t>(data_));
            return out;
        }
        case 5: return "\"" + *std::get<StringText>(data_).text + "\"";
        case 6: return ":" + *std::get<KeywordText>(data_).text;
        case 7: return *std::get<SymbolText>(data_).text;
        default: return std::get<CollectionPtr>(data_)->toString();
    }
}

//=============================================================================
// Default comparator
//=============================================================================

namespace {

template <typename T>
int threeWay(const T& a, const T& b) {
    if (a < b) return -1;
    if (b < a) return 1;
    return 0;
}

int compareNumbers(const Value& a, const Value& b) {
    if (a.isInteger() && b.isInteger()) {
        return threeWay(a.asInteger(), b.asInteger());
    }
    double x = a.asFloat();
    double y = b.asFloat();
    if (std::isnan(x) || std::isnan(y)) {
        throw ComparatorError("NaN has no order");
    }
    return threeWay(x, y);
}

int compareVectors(const Collection& a, const Collection& b) {
    size_t na = a.count();
    size_t nb = b.count();
    if (na != nb) return na < nb ? -1 : 1;

    const Indexed* ia = a.asIndexed();
    const Indexed* ib = b.asIndexed();
    for (size_t i = 0; i < na; ++i) {
        int c = compare(ia->nth(i), ib->nth(i));
        if (c != 0) return c;
    }
    return 0;
}

[[noreturn]] void incomparable(const Value& a, const Value& b) {
    throw ComparatorError("Cannot compare " + a.typeName() + " with " + b.typeName());
}

}  // namespace

int compare(const Value& a, const Value& b) {
    if (a.isNil()) return b.isNil() ? 0 : -1;
    if (b.isNil()) return 1;

    if (a.isNumber() && b.isNumber()) return compareNumbers(a, b);

    ValueType ta = a.type();
    if (ta != b.type()) incomparable(a, b);

    switch (ta) {
        case ValueType::BOOLEAN: return threeWay(a.asBool(), b.asBool());
        case ValueType::CHAR: return threeWay(a.asChar(), b.asChar());
        case ValueType::STRING: return threeWay(a.asString(), b.asString());
        case ValueType::KEYWORD:
        case ValueType::SYMBOL: return threeWay(a.name(), b.name());
        case ValueType::VECTOR: return compareVectors(*a.asCollection(), *b.asCollection());
        default: incomparable(a, b);
    }
}

//=============================================================================
// UTF-8
//=============================================================================

void appendUtf8(std::string& out, char32_t c) {
    if (c < 0x80) {
        out.push_back(static_cast<char>(c));
    } else if (c < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (c >> 6)));
        out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    } else if (c < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (c >> 12)));
        out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (c >> 18)));
        out.push_back(static_cast<char>(0x80 | ((c >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    }
}

char32_t decodeUtf8(const std::string& text, size_t& pos) {
    auto byte = [&](size_t i) { return static_cast<unsigned char>(text[i]); };

    unsigned char lead = byte(pos);
    size_t length = 1;
    char32_t c = lead;
    if (lead >= 0xF0) {
        length = 4;
        c = lead & 0x07;
    } else if (lead >= 0xE0) {
        length = 3;
        c = lead & 0x0F;
    } else if (lead >= 0xC0) {
        length = 2;
        c = lead & 0x1F;
    }

    // Truncated sequence: hand back the lead byte on its own
    if (pos + length > text.size()) {
        ++pos;
        return lead;
    }

    for (size_t i = 1; i < length; ++i) {
        c = (c << 6) | (byte(pos + i) & 0x3F);
    }
    pos += length;
    return c;
}

}  // namespace pcoll
