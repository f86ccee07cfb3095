#include <gtest/gtest.h>
#include "destructure.hpp"
#include "errors.hpp"
#include "persistent_array_map.hpp"
#include "persistent_hash_map.hpp"
#include "persistent_list.hpp"
#include "seq_library.hpp"
#include "test_helpers.hpp"

using namespace pcoll;
using namespace pcoll::test_util;

namespace {

Value amap(std::initializer_list<MapEntry> entries) {
    return Value::wrap(PersistentArrayMap::of(entries));
}

Bindings run(const Value& form, const Value& source) {
    return destructure(*Pattern::fromForm(form), source);
}

}  // namespace

TEST(DestructureTest, NestedSequencePatternWithRest) {
    // [a _ [_ b] & rest]
    Value form = vec({Sym("a"), Sym("_"), vec({Sym("_"), Sym("b")}), Sym("&"), Sym("rest")});
    Value source = vec({I(10), I(20), vec({I(1), I(2), I(3)}), I(30), I(40)});

    Bindings b = run(form, source);
    ASSERT_EQ(b.size(), 3u);
    EXPECT_EQ(b.at("a"), I(10));
    EXPECT_EQ(b.at("b"), I(2));
    EXPECT_EQ(b.at("rest"), vec({I(30), I(40)}));
    EXPECT_FALSE(b.contains("_"));

    // Names come out in pattern order
    EXPECT_EQ(b.entries()[0].first, "a");
    EXPECT_EQ(b.entries()[1].first, "b");
    EXPECT_EQ(b.entries()[2].first, "rest");
}

TEST(DestructureTest, ShortSourcesBindNil) {
    Bindings b = run(vec({Sym("a"), Sym("b"), Sym("&"), Sym("r")}), vec({I(1)}));
    EXPECT_EQ(b.at("a"), I(1));
    EXPECT_TRUE(b.at("b").isNil());
    EXPECT_TRUE(b.at("r").isNil());

    Bindings fromNil = run(vec({Sym("a"), vec({Sym("b")})}), Value());
    EXPECT_TRUE(fromNil.at("a").isNil());
    EXPECT_TRUE(fromNil.at("b").isNil());
}

TEST(DestructureTest, AsBindsTheWholeSource) {
    Value source = vec({I(1), I(2)});
    Bindings b = run(vec({Sym("x"), K("as"), Sym("all")}), source);
    EXPECT_TRUE(b.at("all").identical(source));
    EXPECT_EQ(b.at("x"), I(1));
    EXPECT_EQ(b.entries()[0].first, "all");
}

TEST(DestructureTest, SequencePatternsAcceptAnySeqable) {
    Value pattern = vec({Sym("a"), Sym("b")});

    Bindings fromList = run(pattern, Value::wrap(PersistentList::of({I(5), I(6)})));
    EXPECT_EQ(fromList.at("b"), I(6));

    Bindings fromString = run(pattern, Value("xy"));
    EXPECT_EQ(fromString.at("a"), Value::character(U'x'));

    // Only as much of an infinite sequence as the pattern needs is realized
    Bindings fromInfinite = run(vec({Sym("a"), Sym("b"), Sym("&"), Sym("more")}),
                                Value::fromSeq(seqs::range()));
    EXPECT_EQ(fromInfinite.at("b"), I(1));
    EXPECT_EQ(fromInfinite.at("more").asCollection()->seq()->first(), I(2));
}

TEST(DestructureTest, NonSeqableSourceRaises) {
    EXPECT_THROW(run(vec({Sym("a")}), I(5)), CapabilityError);
    EXPECT_THROW(run(amap({{K("keys"), vec({Sym("a")})}}), I(5)), CapabilityError);
    EXPECT_THROW(run(amap({{K("keys"), vec({Sym("a")})}}), K("kw")), CapabilityError);
}

TEST(DestructureTest, KeyPatternShorthands) {
    Value form = amap({{K("keys"), vec({Sym("a"), Sym("b")})},
                       {K("strs"), vec({Sym("c")})},
                       {K("syms"), vec({Sym("d")})},
                       {K("as"), Sym("m")}});
    Value source = Value::wrap(PersistentHashMap::of({{K("a"), I(1)}, {S("c"), I(3)}, {Sym("d"), I(4)}}));

    Bindings b = run(form, source);
    EXPECT_EQ(b.at("a"), I(1));
    EXPECT_TRUE(b.at("b").isNil());
    EXPECT_EQ(b.at("c"), I(3));
    EXPECT_EQ(b.at("d"), I(4));
    EXPECT_EQ(b.at("m"), source);
}

TEST(DestructureTest, QualifiedShorthandBindsLocalName) {
    Value form = amap({{K("keys"), vec({Sym("user/id")})}});
    Bindings b = run(form, amap({{K("user/id"), I(7)}}));
    EXPECT_EQ(b.at("id"), I(7));
    EXPECT_FALSE(b.contains("user/id"));
}

TEST(DestructureTest, ExplicitEntriesTakeNestedPatterns) {
    // {[x y] :point, label "name"}
    Value form = amap({{vec({Sym("x"), Sym("y")}), K("point")}, {Sym("label"), S("name")}});
    Value source = amap({{K("point"), vec({I(3), I(4)})}, {S("name"), S("origin")}});

    Bindings b = run(form, source);
    EXPECT_EQ(b.at("x"), I(3));
    EXPECT_EQ(b.at("y"), I(4));
    EXPECT_EQ(b.at("label"), S("origin"));

    // Vectors are looked up by index
    Bindings byIndex = run(amap({{Sym("second"), I(1)}}), vec({S("a"), S("b")}));
    EXPECT_EQ(byIndex.at("second"), S("b"));
}

TEST(DestructureTest, DefaultsApplyOnlyToAbsentKeys) {
    // {k :missing, :or {k "d"}}
    Value form = amap({{Sym("k"), K("missing")}, {K("or"), amap({{Sym("k"), S("d")}})}});

    EXPECT_EQ(run(form, amap({{K("present"), I(5)}})).at("k"), S("d"));
    EXPECT_EQ(run(form, amap({})).at("k"), S("d"));
    EXPECT_EQ(run(form, amap({{K("missing"), Value(false)}})).at("k"), Value(false));
    EXPECT_TRUE(run(form, amap({{K("missing"), Value()}})).at("k").isNil());
    EXPECT_EQ(run(form, Value()).at("k"), S("d"));

    Value shorthand = amap({{K("keys"), vec({Sym("a")})}, {K("or"), amap({{Sym("a"), I(5)}})}});
    EXPECT_EQ(run(shorthand, amap({})).at("a"), I(5));
    EXPECT_EQ(run(shorthand, amap({{K("a"), I(1)}})).at("a"), I(1));
}

TEST(DestructureTest, RestAsKeyPatternReadsKeywordArguments) {
    // [a & {:keys [b c] :or {c 9}}]
    Value options = amap({{K("keys"), vec({Sym("b"), Sym("c")})}, {K("or"), amap({{Sym("c"), I(9)}})}});
    Value form = vec({Sym("a"), Sym("&"), options});

    Bindings b = run(form, vec({I(1), K("b"), I(2)}));
    EXPECT_EQ(b.at("a"), I(1));
    EXPECT_EQ(b.at("b"), I(2));
    EXPECT_EQ(b.at("c"), I(9));

    Bindings none = run(form, vec({I(1)}));
    EXPECT_TRUE(none.at("b").isNil());
    EXPECT_EQ(none.at("c"), I(9));

    EXPECT_THROW(run(form, vec({I(1), K("b")})), TypeError);
}

TEST(DestructureTest, PlansAreReusable) {
    BindingPlan plan = compilePattern(*Pattern::fromForm(vec({Sym("head"), Sym("&"), Sym("tail")})));
    EXPECT_EQ(plan.names, (std::vector<std::string>{"head", "tail"}));
    EXPECT_NE(plan.describe().find("binds [head tail]"), std::string::npos);

    EXPECT_EQ(bind(plan, vec({I(1), I(2)})).at("head"), I(1));
    EXPECT_EQ(bind(plan, vec({I(8)})).at("head"), I(8));
    EXPECT_TRUE(bind(plan, vec({I(8)})).at("tail").isNil());
}

TEST(DestructureTest, ProgrammaticPatterns) {
    PatternPtr p = Pattern::sequence({Pattern::bindName("x"), Pattern::discard(), Pattern::bindName("z")});
    Bindings b = destructure(*p, vec({I(1), I(2), I(3)}));
    EXPECT_EQ(b.size(), 2u);
    EXPECT_EQ(b.at("z"), I(3));
    EXPECT_THROW(b.at("y"), std::out_of_range);

    int visited = 0;
    for (const auto& entry : b) {
        EXPECT_FALSE(entry.second.isNil());
        ++visited;
    }
    EXPECT_EQ(visited, 2);
}

TEST(DestructureTest, CompileRejectsBadBindings) {
    EXPECT_THROW(run(vec({Sym("a"), Sym("a")}), Value()), PatternError);
    EXPECT_THROW(run(vec({Sym("a"), K("as"), Sym("a")}), Value()), PatternError);
    EXPECT_THROW(run(amap({{K("keys"), vec({Sym("a")})}, {K("or"), amap({{Sym("b"), I(1)}})}}), Value()),
                 PatternError);
    EXPECT_THROW(compilePattern(*Pattern::sequence({Pattern::bindName("a"), nullptr})), PatternError);
    EXPECT_THROW(compilePattern(*Pattern::bindName("")), PatternError);

    // Repeated discards are fine
    EXPECT_EQ(run(vec({Sym("_"), Sym("_")}), vec({I(1), I(2)})).size(), 0u);
}

TEST(DestructureTest, FromFormRejectsMalformedSequencePatterns) {
    EXPECT_THROW(Pattern::fromForm(vec({Sym("a"), Sym("&"), Sym("b"), Sym("&"), Sym("c")})), PatternError);
    EXPECT_THROW(Pattern::fromForm(vec({Sym("a"), Sym("&")})), PatternError);
    EXPECT_THROW(Pattern::fromForm(vec({Sym("&"), K("as"), Sym("x")})), PatternError);
    EXPECT_THROW(Pattern::fromForm(vec({Sym("a"), K("as")})), PatternError);
    EXPECT_THROW(Pattern::fromForm(vec({Sym("a"), K("as"), S("x")})), PatternError);
    EXPECT_THROW(Pattern::fromForm(vec({Sym("a"), K("as"), Sym("x"), Sym("b")})), PatternError);
    EXPECT_THROW(Pattern::fromForm(vec({Sym("a"), Sym("&"), Sym("r"), Sym("b")})), PatternError);

    // Rest and :as together are fine
    PatternPtr ok = Pattern::fromForm(vec({Sym("a"), Sym("&"), Sym("r"), K("as"), Sym("all")}));
    EXPECT_EQ(ok->as, "all");
    ASSERT_NE(ok->rest, nullptr);
    EXPECT_EQ(ok->rest->name, "r");
}

TEST(DestructureTest, FromFormRejectsMalformedKeyPatterns) {
    EXPECT_THROW(Pattern::fromForm(amap({{K("keys"), Sym("a")}})), PatternError);
    EXPECT_THROW(Pattern::fromForm(amap({{K("keys"), vec({S("a")})}})), PatternError);
    EXPECT_THROW(Pattern::fromForm(amap({{K("or"), vec({I(1)})}})), PatternError);
    EXPECT_THROW(Pattern::fromForm(amap({{K("or"), amap({{K("a"), I(1)}})}})), PatternError);
    EXPECT_THROW(Pattern::fromForm(amap({{K("as"), S("m")}})), PatternError);
    EXPECT_THROW(Pattern::fromForm(amap({{K("bogus"), I(1)}})), PatternError);

    EXPECT_THROW(Pattern::fromForm(I(3)), PatternError);
    EXPECT_THROW(Pattern::fromForm(K("a")), PatternError);
    EXPECT_THROW(Pattern::fromForm(Value()), PatternError);

    // Keywords are accepted as shorthand names
    PatternPtr p = Pattern::fromForm(amap({{K("keys"), vec({K("a")})}}));
    EXPECT_EQ(p->keys, (std::vector<std::string>{"a"}));
}
