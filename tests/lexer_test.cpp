#include <cassert>
#include <iostream>
#include <string>
#include "rson/lexer.hpp"

using namespace rson;

template<typename F>
static void expect_lex_error(F f, lex_error_kind kind, size_t offset){
    try { f(); }
    catch (const lex_error& e) {
        if(e.kind != kind || e.offset() != offset){
            std::cerr << "lex error mismatch: got " << e.kind_name() << " at " << e.offset() << " (" << e.what() << ")\n";
            assert(false);
        }
        return;
    }
    std::cerr << "expected lex error " << error_kind_name(kind) << "\n";
    assert(false);
}

static void test_punctuation_and_words(){
    auto t = tokenize("{[( )]}:, true false null foo_1");
    token_kind want[] = {
        token_kind::left_brace, token_kind::left_bracket, token_kind::left_paren,
        token_kind::right_paren, token_kind::right_bracket, token_kind::right_brace,
        token_kind::colon, token_kind::comma,
        token_kind::kw_true, token_kind::kw_false, token_kind::kw_null,
        token_kind::identifier, token_kind::end };
    assert(t.size() == sizeof(want) / sizeof(want[0]));
    for(size_t i = 0; i < t.size(); ++i) assert(t[i].kind == want[i]);
    assert(t[11].text == "foo_1" && t[11].offset == 26 && t[11].length == 5);
    assert(t[12].offset == 31);
}

static void test_numbers(){
    auto t = tokenize("0 -12 +3 1.25 6.02e23 1E-3");
    assert(t.size() == 7);
    assert(t[0].text == "0");
    assert(t[1].text == "-12" && t[1].offset == 2);
    assert(t[2].text == "+3");
    assert(t[3].text == "1.25");
    assert(t[4].text == "6.02e23");
    assert(t[5].text == "1E-3");
    expect_lex_error([]{ tokenize("1e999"); }, lex_error_kind::invalid_number, 0);
    // magnitudes below the smallest subnormal must not collapse to zero
    expect_lex_error([]{ tokenize("1e-400"); }, lex_error_kind::invalid_number, 0);
    expect_lex_error([]{ tokenize("[-1e-400]"); }, lex_error_kind::invalid_number, 1);
    assert(tokenize("1e-320")[0].text == "1e-320");
    assert(tokenize("0e-400")[0].kind == token_kind::number);
    expect_lex_error([]{ tokenize("[-]"); }, lex_error_kind::unexpected_byte, 1);
}

static void test_strings(){
    auto t = tokenize("\"a\\\"b\\\\c\\n\\t\\/\"");
    assert(t[0].kind == token_kind::string);
    assert(t[0].text == "a\"b\\c\n\t/");
    assert(t[0].length == 15);
    assert(tokenize("\"\\u00e9\"")[0].text == "\xC3\xA9");
    assert(tokenize("\"\\uD83D\\uDE00\"")[0].text == "\xF0\x9F\x98\x80");
    assert(tokenize("\"caf\xC3\xA9\"")[0].text == "caf\xC3\xA9");

    expect_lex_error([]{ tokenize("[1, 2, 3, \"abc"); }, lex_error_kind::unterminated_string, 10);
    expect_lex_error([]{ tokenize("\"ab\\q\""); }, lex_error_kind::invalid_escape, 3);
    expect_lex_error([]{ tokenize("\"\\u12\""); }, lex_error_kind::invalid_escape, 1);
    expect_lex_error([]{ tokenize("\"\\uDC00\""); }, lex_error_kind::invalid_escape, 1);
    expect_lex_error([]{ tokenize("\"\\uD800x\""); }, lex_error_kind::invalid_escape, 1);
    expect_lex_error([]{ tokenize("\"a\xff\""); }, lex_error_kind::unexpected_byte, 2);
}

static void test_comments(){
    auto t = tokenize("// hi\n1 /* x */ 2");
    assert(t.size() == 3);
    assert(t[0].kind == token_kind::number && t[0].offset == 6);
    assert(t[1].kind == token_kind::number && t[1].offset == 16);

    lex_options keep; keep.preserve_comments = true;
    auto c = tokenize("// hi\n1 /* x */ 2", keep);
    assert(c.size() == 5);
    assert(c[0].kind == token_kind::comment && c[0].text == "// hi" && c[0].offset == 0 && c[0].length == 5);
    assert(c[2].kind == token_kind::comment && c[2].text == "/* x */" && c[2].offset == 8 && c[2].length == 7);

    expect_lex_error([]{ tokenize("1 /* x"); }, lex_error_kind::unterminated_comment, 2);
    expect_lex_error([]{ tokenize("1 / 2"); }, lex_error_kind::unexpected_byte, 2);
}

static void test_end_is_sticky(){
    lexer lx("  7  ");
    token a = lx.next();
    assert(a.kind == token_kind::number && a.offset == 2);
    assert(!lx.done());
    assert(lx.next().kind == token_kind::end);
    assert(lx.done());
    token again = lx.next();
    assert(again.kind == token_kind::end && again.offset == 5);
    expect_lex_error([]{ tokenize("[1] @"); }, lex_error_kind::unexpected_byte, 4);
}

void run_lexer_tests(){
    std::cout << "[lexer] tokens, literals, comments...\n";
    test_punctuation_and_words();
    test_numbers();
    test_strings();
    test_comments();
    test_end_is_sticky();
}
