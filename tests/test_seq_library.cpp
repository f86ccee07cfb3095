#include <gtest/gtest.h>
#include "abstractions.hpp"
#include "persistent_list.hpp"
#include "seq_library.hpp"
#include "test_helpers.hpp"

using namespace pcoll;
using namespace pcoll::test_util;

namespace {

bool isEven(const Value& x) {
    return x.asInteger() % 2 == 0;
}

Value plus(const Value& a, const Value& b) {
    return Value(a.asInteger() + b.asInteger());
}

Value times10(const Value& x) {
    return Value(x.asInteger() * 10);
}

}  // namespace

TEST(SeqLibraryTest, Ranges) {
    EXPECT_EQ(ints(seqs::range(5)), (std::vector<int64_t>{0, 1, 2, 3, 4}));
    EXPECT_EQ(ints(seqs::range(2, 11, 3)), (std::vector<int64_t>{2, 5, 8}));
    EXPECT_EQ(ints(seqs::range(10, 0, -3)), (std::vector<int64_t>{10, 7, 4, 1}));
    EXPECT_EQ(seqs::range(0)->seq(), nullptr);
    EXPECT_EQ(seqs::range(5, 5, 0)->seq(), nullptr);
    EXPECT_EQ(ints(seqs::take(3, seqs::range(2, 9, 0))), (std::vector<int64_t>{2, 2, 2}));
    EXPECT_EQ(ints(seqs::take(4, seqs::range())), (std::vector<int64_t>{0, 1, 2, 3}));
}

TEST(SeqLibraryTest, LargeRealizedPipelinesAreReleased) {
    {
        PersistentVector v = seqs::toVector(seqs::take(200000, seqs::range()));
        ASSERT_EQ(v.size(), 200000u);
        EXPECT_EQ(v.nth(199999), Value(199999));
    }
    SeqPtr evens = seqs::doall(seqs::filter([](const Value& x) { return x.asInteger() % 2 == 0; },
                                            seqs::range(400000)));
    EXPECT_EQ(evens->nth(199999), Value(399998));
    evens.reset();
    EXPECT_FALSE(evens);
}

TEST(SeqLibraryTest, IterateAppliesFunctionOnlyWhenTailIsDemanded) {
    int calls = 0;
    SeqPtr powers = seqs::iterate([&calls](const Value& x) {
        ++calls;
        return Value(x.asInteger() * 2);
    }, I(1));
    EXPECT_EQ(powers->first(), I(1));
    EXPECT_EQ(calls, 0);
    EXPECT_EQ(ints(seqs::take(5, powers)), (std::vector<int64_t>{1, 2, 4, 8, 16}));
    EXPECT_EQ(calls, 4);
}

TEST(SeqLibraryTest, RepeatAndRepeatedly) {
    EXPECT_EQ(ints(seqs::repeat(3, I(7))), (std::vector<int64_t>{7, 7, 7}));
    EXPECT_EQ(seqs::repeat(0, I(7))->seq(), nullptr);
    EXPECT_EQ(ints(seqs::take(2, seqs::repeat(I(1)))), (std::vector<int64_t>{1, 1}));

    int next = 0;
    SeqPtr counter = seqs::repeatedly(3, [&next]() { return Value(next++); });
    EXPECT_EQ(next, 0);
    EXPECT_EQ(ints(counter), (std::vector<int64_t>{0, 1, 2}));
    EXPECT_EQ(ints(counter), (std::vector<int64_t>{0, 1, 2}));
    EXPECT_EQ(next, 3);
}

TEST(SeqLibraryTest, ListStarAndConcat) {
    EXPECT_EQ(ints(seqs::listStar({I(1), I(2)}, seqOf({I(3)}))), (std::vector<int64_t>{1, 2, 3}));
    EXPECT_EQ(seqs::listStar({}, nullptr), emptySeq());

    EXPECT_EQ(ints(seqs::concat(seqOf({I(1)}), seqOf({I(2), I(3)}))), (std::vector<int64_t>{1, 2, 3}));
    EXPECT_EQ(ints(seqs::concat({seqOf({I(1)}), nullptr, seqs::range(2, 4)})), (std::vector<int64_t>{1, 2, 3}));
    EXPECT_EQ(seqs::concat(std::vector<SeqPtr>{})->seq(), nullptr);
    EXPECT_EQ(ints(seqs::take(3, seqs::concat(seqOf({I(9)}), seqs::range()))), (std::vector<int64_t>{9, 0, 1}));
}

TEST(SeqLibraryTest, MapIsLazy) {
    int calls = 0;
    SeqPtr mapped = seqs::map([&calls](const Value& x) {
        ++calls;
        return times10(x);
    }, seqs::range());
    EXPECT_EQ(calls, 0);

    // Taking five never evaluates the sixth element
    EXPECT_EQ(ints(seqs::take(5, mapped)), (std::vector<int64_t>{0, 10, 20, 30, 40}));
    EXPECT_EQ(calls, 5);

    // Realized cells are cached
    EXPECT_EQ(mapped->nth(2), I(20));
    EXPECT_EQ(calls, 5);
}

TEST(SeqLibraryTest, MapOverTwoSequencesStopsAtShorter) {
    EXPECT_EQ(ints(seqs::map(plus, seqs::range(), seqOf({I(10), I(20)}))), (std::vector<int64_t>{10, 21}));
    EXPECT_EQ(seqs::map(plus, nullptr, seqs::range())->seq(), nullptr);
}

TEST(SeqLibraryTest, MapIndexedPassesPositions) {
    SeqPtr s = seqs::mapIndexed([](const Value& i, const Value& x) {
        return Value(i.asInteger() * 100 + x.asInteger());
    }, seqOf({I(5), I(6), I(7)}));
    EXPECT_EQ(ints(s), (std::vector<int64_t>{5, 106, 207}));
}

TEST(SeqLibraryTest, FilterAndRemove) {
    EXPECT_EQ(ints(seqs::take(3, seqs::filter(isEven, seqs::range()))), (std::vector<int64_t>{0, 2, 4}));
    EXPECT_EQ(ints(seqs::remove(isEven, seqs::range(6))), (std::vector<int64_t>{1, 3, 5}));
    EXPECT_EQ(seqs::filter(isEven, seqOf({I(1), I(3)}))->seq(), nullptr);

    // A long run of rejected elements does not nest realization
    SeqPtr sparse = seqs::filter([](const Value& x) { return x.asInteger() % 1000 == 999; },
                                 seqs::range(3000));
    EXPECT_EQ(ints(sparse), (std::vector<int64_t>{999, 1999, 2999}));
}

TEST(SeqLibraryTest, TakeDropAndWhileVariants) {
    EXPECT_EQ(ints(seqs::take(10, seqs::range(3))), (std::vector<int64_t>{0, 1, 2}));
    EXPECT_EQ(seqs::take(0, seqs::range())->seq(), nullptr);
    EXPECT_EQ(seqs::take(-1, seqs::range())->seq(), nullptr);
    EXPECT_EQ(ints(seqs::drop(2, seqs::range(5))), (std::vector<int64_t>{2, 3, 4}));
    EXPECT_EQ(seqs::drop(9, seqs::range(5))->seq(), nullptr);
    EXPECT_EQ(ints(seqs::drop(-2, seqs::range(2))), (std::vector<int64_t>{0, 1}));

    auto below3 = [](const Value& x) { return x.asInteger() < 3; };
    EXPECT_EQ(ints(seqs::takeWhile(below3, seqs::range())), (std::vector<int64_t>{0, 1, 2}));
    EXPECT_EQ(ints(seqs::take(2, seqs::dropWhile(below3, seqs::range()))), (std::vector<int64_t>{3, 4}));
}

TEST(SeqLibraryTest, MapcatFlattensSeqableResults) {
    SeqPtr doubled = seqs::mapcat([](const Value& x) { return vec({x, x}); }, seqs::range(3));
    EXPECT_EQ(ints(doubled), (std::vector<int64_t>{0, 0, 1, 1, 2, 2}));

    // Empty and nil results contribute nothing
    SeqPtr evensOnly = seqs::mapcat([](const Value& x) {
        return isEven(x) ? vec({x}) : (x.asInteger() == 3 ? Value() : vec({}));
    }, seqs::range(6));
    EXPECT_EQ(ints(evensOnly), (std::vector<int64_t>{0, 2, 4}));

    SeqPtr chars = seqs::mapcat([](const Value& x) { return x; }, seqOf({S("ab"), S("c")}));
    EXPECT_EQ(chars->count(), 3u);
    EXPECT_EQ(chars->nth(2), Value::character(U'c'));
}

TEST(SeqLibraryTest, InterleaveAlternates) {
    SeqPtr s = seqs::interleave(seqs::range(), seqOf({S("a"), S("b")}));
    std::vector<Value> items = toVector(s);
    ASSERT_EQ(items.size(), 4u);
    EXPECT_EQ(items[0], I(0));
    EXPECT_EQ(items[1], S("a"));
    EXPECT_EQ(items[2], I(1));
    EXPECT_EQ(items[3], S("b"));
}

TEST(SeqLibraryTest, EagerConsumers) {
    EXPECT_EQ(seqs::reduce(plus, I(100), seqs::range(5)), I(110));
    EXPECT_EQ(seqs::reduce(plus, seqs::range(5)), I(10));
    EXPECT_EQ(seqs::reduce(plus, seqOf({I(4)})), I(4));
    EXPECT_TRUE(seqs::reduce(plus, nullptr).isNil());

    EXPECT_EQ(seqs::into(vec({}), seqs::range(3)), vec({I(0), I(1), I(2)}));
    EXPECT_EQ(seqs::into(Value::wrap(PersistentList()), seqs::range(3)),
              Value::wrap(PersistentList::of({I(2), I(1), I(0)})));

    EXPECT_EQ(seqs::some([](const Value& x) { return x.asInteger() > 2 ? times10(x) : Value(false); },
                         seqs::range()),
              I(30));
    EXPECT_TRUE(seqs::some([](const Value&) { return Value(); }, seqs::range(4)).isNil());
    EXPECT_TRUE(seqs::every(isEven, seqOf({I(2), I(4)})));
    EXPECT_FALSE(seqs::every(isEven, seqs::range()));
    EXPECT_TRUE(seqs::every(isEven, nullptr));

    PersistentVector v = seqs::toVector(seqs::range(40));
    EXPECT_EQ(v.size(), 40u);
    EXPECT_EQ(v.nth(39), I(39));
}

TEST(SeqLibraryTest, DoallRealizesEveryElement) {
    int calls = 0;
    SeqPtr s = seqs::map([&calls](const Value& x) {
        ++calls;
        return x;
    }, seqs::range(4));
    EXPECT_EQ(calls, 0);
    EXPECT_EQ(seqs::doall(s), s);
    EXPECT_EQ(calls, 4);
    seqs::dorun(s);
    EXPECT_EQ(calls, 4);
}

TEST(SeqLibraryTest, ComprehensionWithLetWhenAndWhile) {
    // for x in range(5), let y = x * 10, when x odd,
    //   for z in range(x), while z < 2: [x y z]
    seqs::Generator outer;
    outer.source = [](const seqs::Env&) { return seqs::range(5); };
    outer.lets.push_back([](const seqs::Env& env) { return times10(env[0]); });
    outer.when = [](const seqs::Env& env) { return !isEven(env[0]); };

    seqs::Generator inner;
    inner.source = [](const seqs::Env& env) { return seqs::range(env[0].asInteger()); };
    inner.whileCond = [](const seqs::Env& env) { return env[2].asInteger() < 2; };

    SeqPtr result = seqs::comprehend({outer, inner}, [](const seqs::Env& env) {
        return vec({env[0], env[1], env[2]});
    });
    std::vector<Value> items = toVector(result);
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0], vec({I(1), I(10), I(0)}));
    EXPECT_EQ(items[1], vec({I(3), I(30), I(0)}));
    EXPECT_EQ(items[2], vec({I(3), I(30), I(1)}));
}

TEST(SeqLibraryTest, ComprehensionOverInfiniteGeneratorIsLazy) {
    int bodyCalls = 0;
    seqs::Generator outer;
    outer.source = [](const seqs::Env&) { return seqs::range(); };
    seqs::Generator inner;
    inner.source = [](const seqs::Env&) { return seqs::range(2); };

    SeqPtr pairs = seqs::comprehend({outer, inner}, [&bodyCalls](const seqs::Env& env) {
        ++bodyCalls;
        return Value(env[0].asInteger() * 10 + env[1].asInteger());
    });
    EXPECT_EQ(ints(seqs::take(5, pairs)), (std::vector<int64_t>{0, 1, 10, 11, 20}));
    EXPECT_EQ(bodyCalls, 5);
}

TEST(SeqLibraryTest, ComprehensionWhileEndsInfiniteGenerator) {
    seqs::Generator gen;
    gen.source = [](const seqs::Env&) { return seqs::range(); };
    gen.whileCond = [](const seqs::Env& env) { return env[0].asInteger() < 3; };

    SeqPtr s = seqs::comprehend({gen}, [](const seqs::Env& env) { return env[0]; });
    EXPECT_EQ(ints(s), (std::vector<int64_t>{0, 1, 2}));
    EXPECT_EQ(seqs::comprehend({}, [](const seqs::Env&) { return Value(); })->seq(), nullptr);
}
