#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "value.hpp"

namespace pcoll {

struct Pattern;
using PatternPtr = std::shared_ptr<const Pattern>;

// One explicit (target, selector) pair of a key pattern
struct KeyEntry {
    PatternPtr target;
    Value selector;
};

/**
 * Pattern - Binding pattern tree
 *
 *   NAME      binds the value; "_" extracts but records nothing
 *   SEQUENCE  [p0 p1 ... & rest :as whole]
 *   KEYS      {p0 sel0 ... :keys [a b] :strs [..] :syms [..] :or {a dflt} :as whole}
 *
 * Defaults are keyed by binding name and apply to NAME targets and
 * shorthand names of the same key pattern. They are used when the key is
 * absent, not when it maps to a falsy value.
 */
struct Pattern {
    enum class Kind { NAME, SEQUENCE, KEYS };

    Kind kind = Kind::NAME;
    std::string name;                                     // NAME
    std::vector<PatternPtr> items;                        // SEQUENCE
    PatternPtr rest;                                      // SEQUENCE, optional
    std::vector<KeyEntry> entries;                        // KEYS
    std::vector<std::string> keys;                        // KEYS, keyword selectors
    std::vector<std::string> strs;                        // KEYS, string selectors
    std::vector<std::string> syms;                        // KEYS, symbol selectors
    std::vector<std::pair<std::string, Value>> defaults;  // KEYS
    std::string as;                                       // SEQUENCE / KEYS, "" = none

    static PatternPtr bindName(std::string name);
    static PatternPtr discard();
    static PatternPtr sequence(std::vector<PatternPtr> items, PatternPtr rest = nullptr,
                               std::string as = std::string());

    // Parses the data form of a pattern:
    //   symbol                       NAME
    //   [a [b c] & r :as all]        SEQUENCE
    //   {a :k, :keys [x] :or {x 1}}  KEYS
    // PatternError on anything malformed.
    static PatternPtr fromForm(const Value& form);
};

// Ordered visible bindings produced by bind()
class Bindings {
public:
    void add(const std::string& name, const Value& value) { entries_.emplace_back(name, value); }

    size_t size() const { return entries_.size(); }
    bool contains(const std::string& name) const;

    // std::out_of_range when the pattern binds no such name
    const Value& at(const std::string& name) const;

    const std::vector<std::pair<std::string, Value>>& entries() const { return entries_; }
    std::vector<std::pair<std::string, Value>>::const_iterator begin() const { return entries_.begin(); }
    std::vector<std::pair<std::string, Value>>::const_iterator end() const { return entries_.end(); }

private:
    std::vector<std::pair<std::string, Value>> entries_;
};

/**
 * BindingPlan - Flat extraction program compiled from a Pattern
 *
 * Slot 0 holds the source; each step reads one slot and writes a fresh
 * one, so every extraction depends only on the source and never on names
 * bound before it. BIND steps publish a slot under a name, in pattern
 * order.
 */
struct PlanStep {
    enum class Op {
        BIND,       // name <- slots[src]
        SEQ_VIEW,   // sequence view of slots[src], nil when empty
        FIRST,      // first of a sequence view
        NEXT,       // next of a sequence view, nil when exhausted
        MAP_VIEW,   // slots[src] as a lookup source; sequences are poured into a map
        LOOKUP      // slots[src][key], or fallback / nil when absent
    };

    Op op;
    size_t src = 0;
    size_t dst = 0;
    std::string name;
    Value key;
    std::optional<Value> fallback;
};

struct BindingPlan {
    std::vector<PlanStep> steps;
    size_t slotCount = 1;
    std::vector<std::string> names;    // bound names in order

    std::string describe() const;
};

BindingPlan compilePattern(const Pattern& pattern);

// Runs a compiled plan against a source value
Bindings bind(const BindingPlan& plan, const Value& source);

// compilePattern + bind
Bindings destructure(const Pattern& pattern, const Value& source);

}  // namespace pcoll
