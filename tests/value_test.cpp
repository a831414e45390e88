#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include "rson/rson.hpp"
#include "rson/encoder.hpp"
#include "rson/parser.hpp"

using namespace rson;

TEST(ValueFactories, RejectInvalidInput){
    EXPECT_THROW(n_f64(std::nan("")), std::invalid_argument);
    EXPECT_THROW(n_f64(std::numeric_limits<double>::infinity()), std::invalid_argument);
    EXPECT_THROW(n_str("bad \xFF"), std::invalid_argument);
    EXPECT_THROW(node_seq(std::vector<node_ptr>{node_ptr{}}), std::invalid_argument);
    EXPECT_THROW(node_map(std::vector<std::pair<node_ptr, node_ptr>>{{n_str("k"), node_ptr{}}}), std::invalid_argument);
    EXPECT_THROW(node_tagged("null", node_seq({})), std::invalid_argument);
    EXPECT_THROW(node_tagged("1x", node_seq({})), std::invalid_argument);
    EXPECT_THROW(node_tagged("A", n_i64(1)), std::invalid_argument);
    EXPECT_NO_THROW(node_tagged("A_1", node_map({})));
}

TEST(ValueFactories, BuiltTreesRoundTrip){
    auto v = node_struct("Scene", {
        kvp(n_str("name"), n_str("demo")),
        kvp(n_str("origin"), node_tuple("Point", { n_i64(-3), n_f64(0.25) })),
        kvp(n_i64(7), node_seq({ n_bool(false), n_null(), n_f64(-0.0), n_f64(3.0) })),
        kvp(n_str("true"), n_str("quoted key")),
    });
    auto back = parse(encode(v));
    EXPECT_TRUE(equal(v, back));
    EXPECT_EQ(encode(back), encode(v));
}

TEST(ValueEquality, StructuralAndOrdered){
    EXPECT_TRUE(equal(parse("1"), parse("+1")));
    EXPECT_TRUE(equal(parse("1"), n_i64(1)));
    EXPECT_TRUE(equal(parse("0.5"), n_f64(0.5)));
    EXPECT_FALSE(equal(parse("[1, 2]"), parse("[2, 1]")));
    EXPECT_FALSE(equal(parse("{a: 1, b: 2}"), parse("{b: 2, a: 1}")));
    EXPECT_FALSE(equal(parse("\"a\""), parse("A()")));
    EXPECT_FALSE(equal(parse("A(1)"), parse("B(1)")));
    EXPECT_FALSE(equal(parse("A(1)"), parse("A{x: 1}")));
    EXPECT_TRUE(equal(parse("foo"), parse("\"foo\"")));
    // offsets never take part
    EXPECT_TRUE(equal(parse("[1]"), parse("  [ 1 ]")));
}

TEST(ValueEquality, CommentsOnlyWhenAsked){
    lex_options keep; keep.preserve_comments = true;
    auto a = parse("// note\n[1]", keep);
    auto b = parse("[1]", keep);
    EXPECT_TRUE(equal(a, b));
    EXPECT_FALSE(equal(a, b, false));
    EXPECT_TRUE(equal(a, parse("// note\n[1]", keep), false));
}

TEST(ValueIdentifiers, Classification){
    EXPECT_TRUE(is_identifier("_x9"));
    EXPECT_FALSE(is_identifier("9x"));
    EXPECT_FALSE(is_identifier(""));
    EXPECT_FALSE(is_identifier("a-b"));
    EXPECT_TRUE(is_keyword("null"));
    EXPECT_FALSE(is_keyword("Null"));
}
