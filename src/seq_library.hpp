#pragma once

#include <cstdint>
#include <functional>
#include <vector>
#include "persistent_vector.hpp"
#include "seq.hpp"

namespace pcoll {
namespace seqs {

/**
 * Sequence library - lazy transformations over ASeq
 *
 * Every input may be nullptr (empty) or an unrealized LazySeq; nothing is
 * forced until the result is walked. Results are LazySeq cells (never
 * nullptr), so test emptiness through seq(). Functions that produce
 * elements compute each one only when the cell holding it is realized:
 * taking the first n elements of an infinite source never evaluates the
 * element at n.
 */

using Fn = std::function<Value(const Value&)>;
using Fn2 = std::function<Value(const Value&, const Value&)>;
using Pred = std::function<bool(const Value&)>;
using Supplier = std::function<Value()>;

// Generators
SeqPtr range();                                              // 0, 1, 2, ... unbounded
SeqPtr range(int64_t end);
SeqPtr range(int64_t start, int64_t end, int64_t step = 1);  // step 0 repeats start
SeqPtr iterate(Fn f, const Value& x);                        // x, f(x), f(f(x)), ...
SeqPtr repeat(const Value& x);
SeqPtr repeat(int64_t n, const Value& x);
SeqPtr repeatedly(Supplier f);
SeqPtr repeatedly(int64_t n, Supplier f);

// Construction
SeqPtr listStar(const std::vector<Value>& items, SeqPtr tail);
SeqPtr concat(SeqPtr a, SeqPtr b);
SeqPtr concat(const std::vector<SeqPtr>& parts);

// Transformations
SeqPtr map(Fn f, SeqPtr coll);
SeqPtr map(Fn2 f, SeqPtr a, SeqPtr b);                       // stops at the shorter input
SeqPtr mapIndexed(Fn2 f, SeqPtr coll);                       // f(index, x)
SeqPtr filter(Pred pred, SeqPtr coll);
SeqPtr remove(Pred pred, SeqPtr coll);
SeqPtr take(int64_t n, SeqPtr coll);
SeqPtr takeWhile(Pred pred, SeqPtr coll);
SeqPtr drop(int64_t n, SeqPtr coll);
SeqPtr dropWhile(Pred pred, SeqPtr coll);
SeqPtr mapcat(Fn f, SeqPtr coll);                            // f returns any seqable value
SeqPtr interleave(SeqPtr a, SeqPtr b);

// Eager consumers
Value reduce(Fn2 f, const Value& init, SeqPtr coll);
Value reduce(Fn2 f, SeqPtr coll);                            // first element seeds; nil when empty
Value into(const Value& to, SeqPtr coll);
Value some(Fn f, SeqPtr coll);                               // first truthy f(x), else nil
bool every(Pred pred, SeqPtr coll);
SeqPtr doall(SeqPtr coll);                                   // realizes every cell, returns coll
void dorun(SeqPtr coll);
PersistentVector toVector(SeqPtr coll);

/**
 * Sequence comprehension (list comprehension over nested generators)
 *
 * Env holds the values bound so far, in binding order: each generator's
 * current element followed by the values of its let clauses. For every
 * element of a generator the lets run first, then whileCond (false ends
 * that generator at this nesting level), then when (false skips the
 * element). Inner generators see the env of the outer ones, and body
 * sees the full env.
 */
using Env = std::vector<Value>;

struct Generator {
    std::function<SeqPtr(const Env&)> source;
    std::vector<std::function<Value(const Env&)>> lets;
    std::function<bool(const Env&)> when;        // optional
    std::function<bool(const Env&)> whileCond;   // optional
};

SeqPtr comprehend(std::vector<Generator> generators, std::function<Value(const Env&)> body);

}  // namespace seqs
}  // namespace pcoll
