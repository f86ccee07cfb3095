#include "seq_library.hpp"
#include "abstractions.hpp"

namespace pcoll {
namespace seqs {

namespace {

SeqPtr realized(const SeqPtr& s) {
    return s ? s->seq() : nullptr;
}

SeqPtr rangeFrom(int64_t i, int64_t end, int64_t step) {
    return lazySeq([i, end, step]() -> SeqPtr {
        bool done = step > 0 ? i >= end : step < 0 ? i <= end : i == end;
        if (done) return nullptr;
        return cons(Value(i), rangeFrom(i + step, end, step));
    });
}

SeqPtr mapIndexedFrom(Fn2 f, SeqPtr coll, int64_t index) {
    return lazySeq([f, coll, index]() -> SeqPtr {
        SeqPtr s = realized(coll);
        if (!s) return nullptr;
        return cons(f(Value(index), s->first()), mapIndexedFrom(f, s->more(), index + 1));
    });
}

}  // namespace

//=============================================================================
// Generators
//=============================================================================

SeqPtr range() {
    return iterate([](const Value& x) { return Value(x.asInteger() + 1); }, Value(0));
}

SeqPtr range(int64_t end) {
    return rangeFrom(0, end, 1);
}

SeqPtr range(int64_t start, int64_t end, int64_t step) {
    return rangeFrom(start, end, step);
}

SeqPtr iterate(Fn f, const Value& x) {
    // f(x) runs only when the tail is demanded
    return cons(x, lazySeq([f, x]() { return iterate(f, f(x)); }));
}

SeqPtr repeat(const Value& x) {
    return lazySeq([x]() { return cons(x, repeat(x)); });
}

SeqPtr repeat(int64_t n, const Value& x) {
    return take(n, repeat(x));
}

SeqPtr repeatedly(Supplier f) {
    return lazySeq([f]() { return cons(f(), repeatedly(f)); });
}

SeqPtr repeatedly(int64_t n, Supplier f) {
    return take(n, repeatedly(std::move(f)));
}

//=============================================================================
// Construction
//=============================================================================

SeqPtr listStar(const std::vector<Value>& items, SeqPtr tail) {
    SeqPtr result = std::move(tail);
    for (auto it = items.rbegin(); it != items.rend(); ++it) {
        result = cons(*it, std::move(result));
    }
    return result ? result : emptySeq();
}

SeqPtr concat(SeqPtr a, SeqPtr b) {
    return lazySeq([a, b]() -> SeqPtr {
        SeqPtr s = realized(a);
        if (s) {
            return cons(s->first(), concat(s->more(), b));
        }
        return b;
    });
}

SeqPtr concat(const std::vector<SeqPtr>& parts) {
    SeqPtr result;
    for (auto it = parts.rbegin(); it != parts.rend(); ++it) {
        result = concat(*it, result);
    }
    return result ? result : lazySeq([]() -> SeqPtr { return nullptr; });
}

//=============================================================================
// Transformations
//=============================================================================

SeqPtr map(Fn f, SeqPtr coll) {
    return lazySeq([f, coll]() -> SeqPtr {
        SeqPtr s = realized(coll);
        if (!s) return nullptr;
        return cons(f(s->first()), map(f, s->more()));
    });
}

SeqPtr map(Fn2 f, SeqPtr a, SeqPtr b) {
    return lazySeq([f, a, b]() -> SeqPtr {
        SeqPtr sa = realized(a);
        SeqPtr sb = realized(b);
        if (!sa || !sb) return nullptr;
        return cons(f(sa->first(), sb->first()), map(f, sa->more(), sb->more()));
    });
}

SeqPtr mapIndexed(Fn2 f, SeqPtr coll) {
    return mapIndexedFrom(std::move(f), std::move(coll), 0);
}

SeqPtr filter(Pred pred, SeqPtr coll) {
    return lazySeq([pred, coll]() -> SeqPtr {
        // Skip rejected elements iteratively
        for (SeqPtr s = realized(coll); s; s = s->next()) {
            Value x = s->first();
            if (pred(x)) {
                return cons(x, filter(pred, s->more()));
            }
        }
        return nullptr;
    });
}

SeqPtr remove(Pred pred, SeqPtr coll) {
    return filter([pred](const Value& x) { return !pred(x); }, std::move(coll));
}

SeqPtr take(int64_t n, SeqPtr coll) {
    return lazySeq([n, coll]() -> SeqPtr {
        if (n <= 0) return nullptr;
        SeqPtr s = realized(coll);
        if (!s) return nullptr;
        return cons(s->first(), take(n - 1, s->more()));
    });
}

SeqPtr takeWhile(Pred pred, SeqPtr coll) {
    return lazySeq([pred, coll]() -> SeqPtr {
        SeqPtr s = realized(coll);
        if (!s || !pred(s->first())) return nullptr;
        return cons(s->first(), takeWhile(pred, s->more()));
    });
}

SeqPtr drop(int64_t n, SeqPtr coll) {
    return lazySeq([n, coll]() -> SeqPtr {
        SeqPtr s = realized(coll);
        for (int64_t i = 0; s && i < n; ++i) {
            s = s->next();
        }
        return s;
    });
}

SeqPtr dropWhile(Pred pred, SeqPtr coll) {
    return lazySeq([pred, coll]() -> SeqPtr {
        SeqPtr s = realized(coll);
        while (s && pred(s->first())) {
            s = s->next();
        }
        return s;
    });
}

SeqPtr mapcat(Fn f, SeqPtr coll) {
    return lazySeq([f, coll]() -> SeqPtr {
        // Empty results are skipped here rather than through nested cells
        for (SeqPtr s = realized(coll); s; s = s->next()) {
            SeqPtr inner = pcoll::seq(f(s->first()));
            if (inner) {
                return concat(inner, mapcat(f, s->more()));
            }
        }
        return nullptr;
    });
}

SeqPtr interleave(SeqPtr a, SeqPtr b) {
    return lazySeq([a, b]() -> SeqPtr {
        SeqPtr sa = realized(a);
        SeqPtr sb = realized(b);
        if (!sa || !sb) return nullptr;
        return cons(sa->first(), cons(sb->first(), interleave(sa->more(), sb->more())));
    });
}

//=============================================================================
// Eager consumers
//=============================================================================

Value reduce(Fn2 f, const Value& init, SeqPtr coll) {
    Value acc = init;
    for (SeqPtr s = realized(coll); s; s = s->next()) {
        acc = f(acc, s->first());
    }
    return acc;
}

Value reduce(Fn2 f, SeqPtr coll) {
    SeqPtr s = realized(coll);
    if (!s) return Value();
    return reduce(std::move(f), s->first(), s->more());
}

Value into(const Value& to, SeqPtr coll) {
    Value result = to;
    for (SeqPtr s = realized(coll); s; s = s->next()) {
        result = pcoll::conj(result, s->first());
    }
    return result;
}

Value some(Fn f, SeqPtr coll) {
    for (SeqPtr s = realized(coll); s; s = s->next()) {
        Value r = f(s->first());
        if (r.truthy()) return r;
    }
    return Value();
}

bool every(Pred pred, SeqPtr coll) {
    for (SeqPtr s = realized(coll); s; s = s->next()) {
        if (!pred(s->first())) return false;
    }
    return true;
}

SeqPtr doall(SeqPtr coll) {
    dorun(coll);
    return coll;
}

void dorun(SeqPtr coll) {
    for (SeqPtr s = realized(coll); s; s = s->next()) {
    }
}

PersistentVector toVector(SeqPtr coll) {
    return PersistentVector::fromSeq(realized(coll));
}

//=============================================================================
// Comprehension
//=============================================================================

namespace {

struct Comprehension {
    std::vector<Generator> generators;
    std::function<Value(const Env&)> body;
};

using ComprehensionPtr = std::shared_ptr<const Comprehension>;

SeqPtr emitLevel(const ComprehensionPtr& plan, size_t level, const Env& env, SeqPtr items) {
    return lazySeq([plan, level, env, items]() -> SeqPtr {
        const Generator& gen = plan->generators[level];
        const bool innermost = level + 1 == plan->generators.size();

        for (SeqPtr s = realized(items); s; s = s->next()) {
            Env bound = env;
            bound.push_back(s->first());
            for (const auto& let : gen.lets) {
                bound.push_back(let(bound));
            }
            if (gen.whileCond && !gen.whileCond(bound)) {
                return nullptr;
            }
            if (gen.when && !gen.when(bound)) {
                continue;
            }

            SeqPtr following = emitLevel(plan, level, env, s->more());
            if (innermost) {
                return cons(plan->body(bound), following);
            }

            const Generator& inner = plan->generators[level + 1];
            SeqPtr nested = realized(emitLevel(plan, level + 1, bound, inner.source(bound)));
            if (nested) {
                return concat(nested, following);
            }
        }
        return nullptr;
    });
}

}  // namespace

SeqPtr comprehend(std::vector<Generator> generators, std::function<Value(const Env&)> body) {
    if (generators.empty()) {
        return lazySeq([]() -> SeqPtr { return nullptr; });
    }
    auto plan = std::make_shared<const Comprehension>(Comprehension{std::move(generators), std::move(body)});
    return emitLevel(plan, 0, Env{}, plan->generators[0].source(Env{}));
}

}  // namespace seqs
}  // namespace pcoll
