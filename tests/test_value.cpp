#include <gtest/gtest.h>
#include <cmath>
#include <unordered_set>
#include "errors.hpp"
#include "persistent_hash_map.hpp"
#include "persistent_hash_set.hpp"
#include "persistent_list.hpp"
#include "persistent_vector.hpp"
#include "test_helpers.hpp"

using namespace pcoll;
using namespace pcoll::test_util;

TEST(ValueTest, NilIsDefault) {
    Value v;
    EXPECT_TRUE(v.isNil());
    EXPECT_EQ(v.type(), ValueType::NIL);
    EXPECT_EQ(v.typeName(), "nil");
    EXPECT_EQ(v, Value::nil());
}

TEST(ValueTest, OnlyNilAndFalseAreFalsy) {
    EXPECT_FALSE(Value().truthy());
    EXPECT_FALSE(Value(false).truthy());
    EXPECT_TRUE(Value(true).truthy());
    EXPECT_TRUE(Value(0).truthy());
    EXPECT_TRUE(Value("").truthy());
}

TEST(ValueTest, TypedAccessorsRejectOtherKinds) {
    EXPECT_EQ(I(7).asInteger(), 7);
    EXPECT_DOUBLE_EQ(I(7).asFloat(), 7.0);
    EXPECT_EQ(S("abc").asString(), "abc");
    EXPECT_EQ(K("name").name(), "name");

    EXPECT_THROW(S("abc").asInteger(), TypeError);
    EXPECT_THROW(I(1).asString(), TypeError);
    EXPECT_THROW(Value().asCollection(), TypeError);
    EXPECT_THROW(I(1).name(), TypeError);
}

TEST(ValueTest, KeywordsSymbolsAndStringsAreDistinct) {
    EXPECT_NE(K("a"), Sym("a"));
    EXPECT_NE(K("a"), S("a"));
    EXPECT_EQ(K("a"), K("a"));
    EXPECT_EQ(K("a").toString(), ":a");
    EXPECT_EQ(Sym("a").toString(), "a");
    EXPECT_EQ(S("a").toString(), "\"a\"");
}

TEST(ValueTest, IntegersAndFloatsAreNotEqual) {
    EXPECT_NE(I(1), Value(1.0));
    EXPECT_EQ(compare(I(1), Value(1.0)), 0);
}

TEST(ValueTest, CharactersRoundTripThroughUtf8) {
    Value c = Value::character(U'é');
    EXPECT_TRUE(c.isChar());
    EXPECT_EQ(c.asChar(), U'é');

    std::string text;
    appendUtf8(text, U'é');
    appendUtf8(text, U'\U0001F600');
    size_t pos = 0;
    EXPECT_EQ(decodeUtf8(text, pos), U'é');
    EXPECT_EQ(decodeUtf8(text, pos), U'\U0001F600');
    EXPECT_EQ(pos, text.size());
}

TEST(ValueTest, CollectionsCompareStructurally) {
    Value a = vec({I(1), I(2), I(3)});
    Value b = Value::wrap(PersistentVector().conj(I(1)).conj(I(2)).conj(I(3)));
    EXPECT_FALSE(a.identical(b));
    EXPECT_EQ(a, b);
    EXPECT_EQ(a.hash(), b.hash());

    // Sequential collections are equal across kinds
    Value list = Value::wrap(PersistentList::of({I(1), I(2), I(3)}));
    EXPECT_EQ(a, list);
    EXPECT_EQ(a.hash(), list.hash());

    EXPECT_NE(a, vec({I(1), I(2)}));
    EXPECT_NE(a, Value::wrap(PersistentHashSet::of({I(1), I(2), I(3)})));
}

TEST(ValueTest, MapHashIgnoresInsertionOrder) {
    Value m1 = Value::wrap(PersistentHashMap().assoc(K("a"), I(1)).assoc(K("b"), I(2)));
    Value m2 = Value::wrap(PersistentHashMap().assoc(K("b"), I(2)).assoc(K("a"), I(1)));
    EXPECT_EQ(m1, m2);
    EXPECT_EQ(m1.hash(), m2.hash());
}

TEST(ValueTest, CollectionsWorkAsHashKeys) {
    std::unordered_set<Value, ValueHash> seen;
    seen.insert(vec({I(1), I(2)}));
    seen.insert(vec({I(1), I(2)}));
    seen.insert(vec({I(2), I(1)}));
    EXPECT_EQ(seen.size(), 2u);
}

TEST(ValueTest, AsReturnsConcreteCollection) {
    Value v = vec({I(1)});
    ASSERT_NE(v.as<PersistentVector>(), nullptr);
    EXPECT_EQ(v.as<PersistentHashMap>(), nullptr);
    EXPECT_EQ(I(1).as<PersistentVector>(), nullptr);
}

TEST(ValueTest, ToStringRendersCollections) {
    EXPECT_EQ(vec({I(1), S("x"), Value()}).toString(), "[1 \"x\" nil]");
    EXPECT_EQ(Value::wrap(PersistentList::of({I(1), I(2)})).toString(), "(1 2)");
    EXPECT_EQ(Value::wrap(PersistentHashMap().assoc(K("a"), I(1))).toString(), "{:a 1}");
}

TEST(DefaultComparatorTest, OrdersWithinKinds) {
    EXPECT_LT(compare(Value(), I(0)), 0);
    EXPECT_GT(compare(I(0), Value()), 0);
    EXPECT_LT(compare(I(1), Value(1.5)), 0);
    EXPECT_LT(compare(Value(false), Value(true)), 0);
    EXPECT_LT(compare(S("apple"), S("banana")), 0);
    EXPECT_LT(compare(K("a"), K("b")), 0);
    EXPECT_EQ(compare(S("same"), S("same")), 0);
}

TEST(DefaultComparatorTest, VectorsCompareByLengthThenElements) {
    EXPECT_LT(compare(vec({I(9)}), vec({I(1), I(1)})), 0);
    EXPECT_LT(compare(vec({I(1), I(2)}), vec({I(1), I(3)})), 0);
    EXPECT_EQ(compare(vec({I(1), I(2)}), vec({I(1), I(2)})), 0);
}

TEST(DefaultComparatorTest, UnrelatedKindsRaise) {
    EXPECT_THROW(compare(I(1), S("1")), ComparatorError);
    EXPECT_THROW(compare(K("a"), Sym("a")), ComparatorError);
    EXPECT_THROW(compare(Value(std::nan("")), I(1)), ComparatorError);

    Value map = Value::wrap(PersistentHashMap().assoc(I(1), I(1)));
    EXPECT_THROW(compare(map, map), ComparatorError);
}
