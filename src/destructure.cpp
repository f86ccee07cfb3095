#include "destructure.hpp"
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>
#include "abstractions.hpp"
#include "debug_log.hpp"
#include "errors.hpp"
#include "persistent_array_map.hpp"
#include "persistent_vector.hpp"

namespace pcoll {

//=============================================================================
// Pattern construction
//=============================================================================

PatternPtr Pattern::bindName(std::string name) {
    auto p = std::make_shared<Pattern>();
    p->kind = Kind::NAME;
    p->name = std::move(name);
    return p;
}

PatternPtr Pattern::discard() {
    return bindName("_");
}

PatternPtr Pattern::sequence(std::vector<PatternPtr> items, PatternPtr rest, std::string as) {
    auto p = std::make_shared<Pattern>();
    p->kind = Kind::SEQUENCE;
    p->items = std::move(items);
    p->rest = std::move(rest);
    p->as = std::move(as);
    return p;
}

namespace {

bool isKeyword(const Value& v, const char* name) {
    return v.isKeyword() && v.name() == name;
}

bool isMapForm(const Value& v) {
    return v.isCollection() && v.asCollection()->category() == Collection::Category::MAP;
}

std::vector<std::string> parseNameList(const Value& form, const char* option) {
    const PersistentVector* vec = form.as<PersistentVector>();
    if (!vec) {
        throw PatternError(std::string(":") + option + " expects a vector of names, got " + form.toString());
    }
    std::vector<std::string> names;
    for (size_t i = 0; i < vec->size(); ++i) {
        Value v = vec->nth(i);
        if (!v.isSymbol() && !v.isKeyword()) {
            throw PatternError(std::string(":") + option + " entries must be symbols, got " + v.toString());
        }
        names.push_back(v.name());
    }
    return names;
}

PatternPtr parseSequenceForm(const PersistentVector& vec) {
    auto p = std::make_shared<Pattern>();
    p->kind = Pattern::Kind::SEQUENCE;

    const size_t n = vec.size();
    for (size_t i = 0; i < n; ++i) {
        Value el = vec.nth(i);
        if (el.isSymbol() && el.name() == "&") {
            if (p->rest) {
                throw PatternError("Only one & allowed in a sequence pattern");
            }
            if (i + 1 >= n || isKeyword(vec.nth(i + 1), "as")) {
                throw PatternError("& must be followed by a binding form");
            }
            p->rest = Pattern::fromForm(vec.nth(++i));
        } else if (isKeyword(el, "as")) {
            if (i + 1 >= n || !vec.nth(i + 1).isSymbol()) {
                throw PatternError(":as must be followed by a symbol");
            }
            if (i + 2 != n) {
                throw PatternError(":as must be the last element of a sequence pattern");
            }
            p->as = vec.nth(++i).name();
        } else {
            if (p->rest) {
                throw PatternError("Unexpected binding form after the rest binding: " + el.toString());
            }
            p->items.push_back(Pattern::fromForm(el));
        }
    }
    return p;
}

PatternPtr parseKeyForm(const Value& form) {
    auto p = std::make_shared<Pattern>();
    p->kind = Pattern::Kind::KEYS;

    for (SeqPtr s = seq(form); s; s = s->next()) {
        MapEntry entry = entryFromValue(s->first());
        if (!entry.key.isKeyword()) {
            p->entries.push_back(KeyEntry{Pattern::fromForm(entry.key), entry.value});
            continue;
        }

        const std::string& option = entry.key.name();
        if (option == "keys") {
            p->keys = parseNameList(entry.value, "keys");
        } else if (option == "strs") {
            p->strs = parseNameList(entry.value, "strs");
        } else if (option == "syms") {
            p->syms = parseNameList(entry.value, "syms");
        } else if (option == "or") {
            if (!isMapForm(entry.value)) {
                throw PatternError(":or expects a map of defaults, got " + entry.value.toString());
            }
            for (SeqPtr d = seq(entry.value); d; d = d->next()) {
                MapEntry dflt = entryFromValue(d->first());
                if (!dflt.key.isSymbol()) {
                    throw PatternError(":or keys must be symbols, got " + dflt.key.toString());
                }
                p->defaults.emplace_back(dflt.key.name(), dflt.value);
            }
        } else if (option == "as") {
            if (!entry.value.isSymbol()) {
                throw PatternError(":as must be followed by a symbol");
            }
            p->as = entry.value.name();
        } else {
            throw PatternError("Unsupported key-pattern option :" + option);
        }
    }
    return p;
}

}  // namespace

PatternPtr Pattern::fromForm(const Value& form) {
    if (form.isSymbol()) {
        return bindName(form.name());
    }
    if (const PersistentVector* vec = form.as<PersistentVector>()) {
        return parseSequenceForm(*vec);
    }
    if (isMapForm(form)) {
        return parseKeyForm(form);
    }
    throw PatternError("Unsupported binding form: " + form.toString());
}

//=============================================================================
// Bindings
//=============================================================================

bool Bindings::contains(const std::string& name) const {
    for (const auto& entry : entries_) {
        if (entry.first == name) return true;
    }
    return false;
}

const Value& Bindings::at(const std::string& name) const {
    for (const auto& entry : entries_) {
        if (entry.first == name) return entry.second;
    }
    throw std::out_of_range("No binding named " + name);
}

//=============================================================================
// Compilation
//=============================================================================

std::string BindingPlan::describe() const {
    std::ostringstream out;
    out << steps.size() << " steps, " << slotCount << " slots, binds [";
    for (size_t i = 0; i < names.size(); ++i) {
        out << (i ? " " : "") << names[i];
    }
    out << "]";
    return out.str();
}

namespace {

// Local name of a possibly qualified shorthand name (ns/x binds x)
std::string localName(const std::string& name) {
    size_t slash = name.rfind('/');
    if (slash == std::string::npos || slash + 1 == name.size()) return name;
    return name.substr(slash + 1);
}

class PlanBuilder {
public:
    BindingPlan build(const Pattern& pattern) {
        compile(pattern, 0);
        return std::move(plan_);
    }

private:
    size_t newSlot() { return plan_.slotCount++; }

    size_t emit(PlanStep::Op op, size_t src, const Value& key = Value(),
                std::optional<Value> fallback = std::nullopt) {
        PlanStep step;
        step.op = op;
        step.src = src;
        step.dst = newSlot();
        step.key = key;
        step.fallback = std::move(fallback);
        plan_.steps.push_back(std::move(step));
        return plan_.steps.back().dst;
    }

    void bindSlot(const std::string& name, size_t slot) {
        if (name.empty() || name == "&") {
            throw PatternError("Invalid binding name '" + name + "'");
        }
        if (name == "_") {
            return;
        }
        if (!seen_.insert(name).second) {
            throw PatternError("Duplicate binding name: " + name);
        }
        PlanStep step;
        step.op = PlanStep::Op::BIND;
        step.src = slot;
        step.name = name;
        plan_.steps.push_back(std::move(step));
        plan_.names.push_back(name);
    }

    void compile(const Pattern& p, size_t src) {
        switch (p.kind) {
            case Pattern::Kind::NAME:
                bindSlot(p.name, src);
                break;
            case Pattern::Kind::SEQUENCE:
                compileSequence(p, src);
                break;
            case Pattern::Kind::KEYS:
                compileKeys(p, src);
                break;
        }
    }

    static const Pattern& require(const PatternPtr& p) {
        if (!p) {
            throw PatternError("Missing sub-pattern");
        }
        return *p;
    }

    void compileSequence(const Pattern& p, size_t src) {
        if (!p.as.empty()) {
            bindSlot(p.as, src);
        }
        size_t view = emit(PlanStep::Op::SEQ_VIEW, src);
        for (size_t i = 0; i < p.items.size(); ++i) {
            const Pattern& item = require(p.items[i]);
            compile(item, emit(PlanStep::Op::FIRST, view));
            if (i + 1 < p.items.size() || p.rest) {
                view = emit(PlanStep::Op::NEXT, view);
            }
        }
        if (p.rest) {
            compile(*p.rest, view);
        }
    }

    void compileKeys(const Pattern& p, size_t src) {
        if (!p.as.empty()) {
            bindSlot(p.as, src);
        }

        std::unordered_map<std::string, Value> defaults;
        for (const auto& d : p.defaults) {
            defaults.insert_or_assign(d.first, d.second);
        }
        std::unordered_set<std::string> usedDefaults;
        auto fallbackFor = [&](const std::string& name) -> std::optional<Value> {
            auto it = defaults.find(name);
            if (it == defaults.end()) return std::nullopt;
            usedDefaults.insert(name);
            return it->second;
        };

        size_t source = emit(PlanStep::Op::MAP_VIEW, src);

        for (const KeyEntry& entry : p.entries) {
            const Pattern& target = require(entry.target);
            std::optional<Value> fallback;
            if (target.kind == Pattern::Kind::NAME) {
                fallback = fallbackFor(target.name);
            }
            compile(target, emit(PlanStep::Op::LOOKUP, source, entry.selector, fallback));
        }

        auto shorthand = [&](const std::vector<std::string>& names, Value (*selector)(const std::string&)) {
            for (const std::string& name : names) {
                std::string local = localName(name);
                size_t slot = emit(PlanStep::Op::LOOKUP, source, selector(name), fallbackFor(local));
                bindSlot(local, slot);
            }
        };
        shorthand(p.keys, [](const std::string& n) { return Value::keyword(n); });
        shorthand(p.strs, [](const std::string& n) { return Value(n); });
        shorthand(p.syms, [](const std::string& n) { return Value::symbol(n); });

        for (const auto& d : defaults) {
            if (!usedDefaults.count(d.first)) {
                throw PatternError("Default given for unbound name: " + d.first);
            }
        }
    }

    BindingPlan plan_;
    std::unordered_set<std::string> seen_;
};

// Key-pattern source: lookups as-is, sequences poured into a map
Value lookupSource(const Value& v) {
    if (v.isNil() || v.isString()) {
        return v;
    }
    if (!v.isCollection()) {
        throw CapabilityError("destructure keys", v.typeName());
    }
    const Collection& coll = *v.asCollection();
    if (coll.asLookup()) {
        return v;
    }
    if (coll.category() != Collection::Category::SEQUENTIAL) {
        throw CapabilityError("destructure keys", v.typeName());
    }

    Value map = Value::wrap(PersistentArrayMap());
    for (SeqPtr s = coll.seq(); s;) {
        Value key = s->first();
        s = s->next();
        if (!s) {
            throw TypeError("No value supplied for key: " + key.toString());
        }
        map = assoc(map, key, s->first());
        s = s->next();
    }
    return map;
}

}  // namespace

BindingPlan compilePattern(const Pattern& pattern) {
    BindingPlan plan = PlanBuilder().build(pattern);
    PCOLL_DEBUG("Destructure", "compiled plan: " << plan.describe());
    return plan;
}

//=============================================================================
// Execution
//=============================================================================

Bindings bind(const BindingPlan& plan, const Value& source) {
    std::vector<Value> slots(plan.slotCount);
    slots[0] = source;

    Bindings bindings;
    for (const PlanStep& step : plan.steps) {
        const Value& in = slots[step.src];
        switch (step.op) {
            case PlanStep::Op::BIND:
                bindings.add(step.name, in);
                break;
            case PlanStep::Op::SEQ_VIEW:
                slots[step.dst] = Value::fromSeq(seq(in));
                break;
            case PlanStep::Op::FIRST:
                slots[step.dst] = first(in);
                break;
            case PlanStep::Op::NEXT:
                slots[step.dst] = Value::fromSeq(next(in));
                break;
            case PlanStep::Op::MAP_VIEW:
                slots[step.dst] = lookupSource(in);
                break;
            case PlanStep::Op::LOOKUP: {
                std::optional<MapEntry> found = find(in, step.key);
                slots[step.dst] = found ? found->value : step.fallback.value_or(Value());
                break;
            }
        }
    }
    return bindings;
}

Bindings destructure(const Pattern& pattern, const Value& source) {
    return bind(compilePattern(pattern), source);
}

}  // namespace pcoll
