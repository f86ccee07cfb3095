#include <gtest/gtest.h>
#include "abstractions.hpp"
#include "errors.hpp"
#include "persistent_array_map.hpp"
#include "persistent_hash_map.hpp"
#include "persistent_hash_set.hpp"
#include "persistent_list.hpp"
#include "persistent_tree_map.hpp"
#include "persistent_tree_set.hpp"
#include "test_helpers.hpp"

using namespace pcoll;
using namespace pcoll::test_util;

namespace {

Value hashMap(std::initializer_list<MapEntry> entries) {
    return Value::wrap(PersistentHashMap::of(entries));
}

Value sortedMap(std::initializer_list<MapEntry> entries) {
    return Value::wrap(PersistentTreeMap::of(entries));
}

Value list(std::initializer_list<Value> items) {
    return Value::wrap(PersistentList::of(items));
}

}  // namespace

TEST(AbstractionsTest, SupportsReflectsCapabilities) {
    Value v = vec({I(1)});
    Value m = hashMap({{K("a"), I(1)}});
    Value s = Value::wrap(PersistentHashSet::of({I(1)}));
    Value sorted = Value::wrap(PersistentTreeSet::of({I(1)}));

    EXPECT_TRUE(supports(v, Capability::INDEXED));
    EXPECT_TRUE(supports(v, Capability::REVERSIBLE));
    EXPECT_FALSE(supports(v, Capability::DISSOCIABLE));
    EXPECT_TRUE(supports(m, Capability::DISSOCIABLE));
    EXPECT_FALSE(supports(m, Capability::INDEXED));
    EXPECT_FALSE(supports(m, Capability::SORTED));
    EXPECT_TRUE(supports(s, Capability::SET));
    EXPECT_TRUE(supports(sorted, Capability::SORTED));
    EXPECT_TRUE(supports(Value("abc"), Capability::INDEXED));
    EXPECT_TRUE(supports(Value(), Capability::SEQABLE));
    EXPECT_FALSE(supports(I(5), Capability::SEQABLE));
}

TEST(AbstractionsTest, ConjAddsWhereEachCollectionPrefers) {
    EXPECT_EQ(conj(vec({I(1)}), I(2)), vec({I(1), I(2)}));
    EXPECT_EQ(first(conj(list({I(1)}), I(2))), I(2));
    EXPECT_EQ(count(conj(Value::wrap(PersistentHashSet::of({I(1)})), I(1))), 1u);
    EXPECT_EQ(get(conj(hashMap({}), vec({K("k"), I(9)})), K("k")), I(9));

    // nil conj builds a list
    Value fromNil = conj(Value(), I(1));
    EXPECT_EQ(fromNil.type(), ValueType::LIST);
    EXPECT_EQ(conj(Value(), {I(1), I(2)}), list({I(2), I(1)}));

    EXPECT_THROW(conj(I(1), I(2)), CapabilityError);
}

TEST(AbstractionsTest, CountAndEmptiness) {
    EXPECT_EQ(count(Value()), 0u);
    EXPECT_EQ(count(vec({I(1), I(2)})), 2u);
    EXPECT_EQ(count(Value("h\xC3\xA9llo")), 5u);
    EXPECT_EQ(count(Value::fromSeq(seqOf({I(1), I(2), I(3)}))), 3u);
    EXPECT_THROW(count(K("k")), CapabilityError);

    EXPECT_TRUE(isEmpty(Value()));
    EXPECT_TRUE(isEmpty(Value("")));
    EXPECT_TRUE(isEmpty(hashMap({})));
    EXPECT_FALSE(isEmpty(vec({I(1)})));
}

TEST(AbstractionsTest, EmptyKeepsTheCollectionKind) {
    Value m = empty(sortedMap({{I(1), I(1)}}));
    EXPECT_EQ(m.type(), ValueType::SORTED_MAP);
    EXPECT_EQ(count(m), 0u);
    EXPECT_EQ(empty(vec({I(1)})).type(), ValueType::VECTOR);
    EXPECT_TRUE(empty(I(3)).isNil());
}

TEST(AbstractionsTest, IntoPoursAnySequence) {
    Value v = into(vec({}), list({I(1), I(2)}));
    EXPECT_EQ(v, vec({I(1), I(2)}));

    Value m = into(hashMap({}), vec({vec({K("a"), I(1)}), vec({K("b"), I(2)})}));
    EXPECT_EQ(get(m, K("b")), I(2));

    Value chars = into(vec({}), Value("ab"));
    EXPECT_EQ(nth(chars, 1), Value::character(U'b'));
    EXPECT_EQ(into(vec({I(1)}), Value()), vec({I(1)}));
}

TEST(AbstractionsTest, SequenceViews) {
    EXPECT_EQ(seq(Value()), nullptr);
    EXPECT_EQ(seq(vec({})), nullptr);
    EXPECT_EQ(seq(Value("")), nullptr);
    EXPECT_EQ(first(Value()), Value());
    EXPECT_EQ(first(Value("xy")), Value::character(U'x'));
    EXPECT_EQ(first(vec({I(4), I(5)})), I(4));

    SeqPtr r = rest(vec({I(1)}));
    ASSERT_NE(r, nullptr);
    EXPECT_EQ(r->seq(), nullptr);
    EXPECT_NE(rest(Value()), nullptr);
    EXPECT_EQ(next(vec({I(1)})), nullptr);
    EXPECT_EQ(ints(next(vec({I(1), I(2), I(3)}))), (std::vector<int64_t>{2, 3}));

    EXPECT_THROW(seq(I(3)), CapabilityError);
}

TEST(AbstractionsTest, GetDistinguishesAbsentFromNil) {
    Value m = hashMap({{K("present"), Value()}});
    EXPECT_EQ(get(m, K("present"), S("dflt")), Value());
    EXPECT_EQ(get(m, K("absent"), S("dflt")), S("dflt"));
    EXPECT_TRUE(contains(m, K("present")));
    EXPECT_FALSE(contains(m, K("absent")));
    ASSERT_TRUE(find(m, K("present")).has_value());
    EXPECT_FALSE(find(m, K("absent")).has_value());

    // Vectors and strings look up by index
    EXPECT_EQ(get(vec({S("a"), S("b")}), I(1)), S("b"));
    EXPECT_EQ(get(vec({S("a")}), I(5), S("none")), S("none"));
    EXPECT_EQ(get(Value("abc"), I(2)), Value::character(U'c'));
    EXPECT_TRUE(contains(Value("abc"), I(0)));
    EXPECT_FALSE(contains(Value("abc"), I(3)));

    // Sets look up their elements
    Value s = Value::wrap(PersistentHashSet::of({K("x")}));
    EXPECT_EQ(get(s, K("x")), K("x"));
    EXPECT_TRUE(contains(s, K("x")));

    EXPECT_EQ(get(Value(), K("a"), S("dflt")), S("dflt"));
    EXPECT_FALSE(contains(Value(), K("a")));
}

TEST(AbstractionsTest, LookupOnUnsupportedTypesRaises) {
    EXPECT_THROW(get(list({I(1)}), I(0)), CapabilityError);
    EXPECT_THROW(get(I(5), I(0)), CapabilityError);
    EXPECT_THROW(contains(list({I(1)}), I(0)), CapabilityError);

    try {
        get(I(5), I(0));
        FAIL() << "expected CapabilityError";
    } catch (const CapabilityError& e) {
        EXPECT_EQ(e.operation(), "get");
        EXPECT_EQ(e.typeName(), "integer");
    }
}

TEST(AbstractionsTest, AssocAndDissoc) {
    Value m = assoc(Value(), K("a"), I(1));
    EXPECT_EQ(m.type(), ValueType::ARRAY_MAP);
    EXPECT_EQ(get(m, K("a")), I(1));

    EXPECT_EQ(assoc(vec({I(1), I(2)}), I(0), S("x")), vec({S("x"), I(2)}));
    EXPECT_EQ(assoc(vec({I(1)}), I(1), I(2)), vec({I(1), I(2)}));
    EXPECT_THROW(assoc(vec({I(1)}), I(5), I(2)), IndexError);
    EXPECT_THROW(assoc(list({I(1)}), I(0), I(2)), CapabilityError);

    EXPECT_FALSE(contains(dissoc(m, K("a")), K("a")));
    EXPECT_TRUE(dissoc(Value(), K("a")).isNil());
    EXPECT_THROW(dissoc(vec({I(1)}), I(0)), CapabilityError);
}

TEST(AbstractionsTest, ArrayMapPromotesThroughAssoc) {
    Value m;
    for (int i = 0; i < 20; ++i) {
        m = assoc(m, Value(i), Value(i));
    }
    EXPECT_EQ(m.type(), ValueType::HASH_MAP);
    EXPECT_EQ(count(m), 20u);
    EXPECT_EQ(get(m, Value(13)), Value(13));
}

TEST(AbstractionsTest, GetInFollowsPaths) {
    Value inner = hashMap({{K("c"), Value()}, {K("d"), vec({I(10), I(20)})}});
    Value outer = hashMap({{K("b"), inner}});

    EXPECT_EQ(getIn(outer, {K("b"), K("d"), I(1)}), I(20));
    EXPECT_EQ(getIn(outer, {K("b"), K("c")}, S("dflt")), Value());
    EXPECT_EQ(getIn(outer, {K("b"), K("zz")}, S("dflt")), S("dflt"));
    EXPECT_EQ(getIn(outer, {K("zz"), K("c")}, S("dflt")), S("dflt"));
    EXPECT_EQ(getIn(outer, {}), outer);
    EXPECT_THROW(getIn(outer, {K("b"), K("d"), I(0), K("x")}), CapabilityError);
}

TEST(AbstractionsTest, NthAcrossIndexedTypes) {
    EXPECT_EQ(nth(vec({I(1), I(2)}), 1), I(2));
    EXPECT_EQ(nth(list({I(1), I(2)}), 0), I(1));
    EXPECT_EQ(nth(Value::fromSeq(seqOf({I(7), I(8)})), 1), I(8));
    EXPECT_EQ(nth(Value("h\xC3\xA9"), 1), Value::character(U'é'));
    EXPECT_TRUE(nth(Value(), 3).isNil());

    EXPECT_THROW(nth(vec({I(1)}), 1), IndexError);
    EXPECT_THROW(nth(vec({I(1)}), -1), IndexError);
    EXPECT_THROW(nth(Value("ab"), 2), IndexError);
    EXPECT_EQ(nth(vec({I(1)}), 4, S("none")), S("none"));
    EXPECT_EQ(nth(vec({I(1)}), -1, S("none")), S("none"));
    EXPECT_EQ(nth(Value("ab"), 9, S("none")), S("none"));

    EXPECT_THROW(nth(hashMap({{I(0), I(1)}}), 0), CapabilityError);
    EXPECT_THROW(nth(Value::wrap(PersistentHashSet::of({I(0)})), 0), CapabilityError);
}

TEST(AbstractionsTest, NegativeNthReportsTheSignedIndex) {
    try {
        nth(vec({I(1), I(2)}), -3);
        FAIL() << "expected IndexError";
    } catch (const IndexError& e) {
        EXPECT_EQ(e.index(), -3);
        EXPECT_EQ(e.count(), 2u);
        EXPECT_EQ(std::string(e.what()), "Index -3 out of range for count 2");
    }
    try {
        nth(Value("ab"), -1);
        FAIL() << "expected IndexError";
    } catch (const IndexError& e) {
        EXPECT_EQ(e.index(), -1);
    }
}

TEST(AbstractionsTest, StackOperations) {
    EXPECT_EQ(peek(vec({I(1), I(2)})), I(2));
    EXPECT_EQ(pop(vec({I(1), I(2)})), vec({I(1)}));
    EXPECT_EQ(peek(list({I(1), I(2)})), I(1));
    EXPECT_EQ(pop(list({I(1), I(2)})), list({I(2)}));
    EXPECT_TRUE(peek(Value()).isNil());
    EXPECT_TRUE(pop(Value()).isNil());
    EXPECT_THROW(pop(vec({})), IllegalStateError);
    EXPECT_THROW(peek(hashMap({})), CapabilityError);
}

TEST(AbstractionsTest, DisjOnSets) {
    Value s = Value::wrap(PersistentHashSet::of({I(1), I(2)}));
    EXPECT_EQ(count(disj(s, I(1))), 1u);
    EXPECT_EQ(disj(s, I(9)), s);
    Value sorted = Value::wrap(PersistentTreeSet::of({I(1), I(2)}));
    EXPECT_EQ(ints(seq(disj(sorted, I(2)))), (std::vector<int64_t>{1}));
    EXPECT_THROW(disj(vec({I(1)}), I(1)), CapabilityError);
}

TEST(AbstractionsTest, SortedRangesAndReverse) {
    Value sorted = Value::wrap(PersistentTreeSet::of({I(1), I(2), I(3), I(4)}));
    EXPECT_EQ(ints(subseq(sorted, Bound(I(2)), std::nullopt)), (std::vector<int64_t>{2, 3, 4}));
    EXPECT_EQ(ints(rsubseq(sorted, std::nullopt, Bound(I(3), false))), (std::vector<int64_t>{2, 1}));
    EXPECT_EQ(ints(rseq(sorted)), (std::vector<int64_t>{4, 3, 2, 1}));
    EXPECT_EQ(ints(rseq(vec({I(1), I(2)}))), (std::vector<int64_t>{2, 1}));

    Value m = sortedMap({{I(1), S("a")}, {I(2), S("b")}});
    SeqPtr entries = subseq(m, Bound(I(2)), std::nullopt);
    ASSERT_NE(entries, nullptr);
    EXPECT_EQ(entries->first(), vec({I(2), S("b")}));

    EXPECT_THROW(subseq(hashMap({}), Bound(I(1)), std::nullopt), CapabilityError);
    EXPECT_THROW(rsubseq(vec({I(1)}), std::nullopt, std::nullopt), CapabilityError);
    EXPECT_THROW(rseq(hashMap({{I(1), I(1)}})), CapabilityError);
    EXPECT_THROW(rseq(list({I(1)})), CapabilityError);
}
