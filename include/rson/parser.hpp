// Recursive-descent parser: token stream -> value tree
#pragma once
#include "rson/rson.hpp"
#include "rson/lexer.hpp"
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace rson {

struct document {
    node_ptr root;
    // Comments after the root value (only with preserve_comments).
    std::vector<std::string> trailing_comments;
};

// One-shot parser over a single input. Throws lex_error or parse_error on the
// first problem; there is no recovery.
//
// An identifier immediately followed by '(' '[' or '{' (whitespace and comments
// may sit in between) starts a tagged variant; any other identifier is a bare
// string. Mapping keys may be any value. Nesting depth is not limited.
class parser {
public:
    explicit parser(std::string_view src, lex_options opts = {}) : lex_(src, opts) {}

    document parse_document();

private:
    struct lookahead {
        token tok;
        std::vector<std::string> comments; // comment tokens seen before tok
        bool loaded = false;
    };

    lexer lex_;
    lookahead cur_;
    lookahead next_;

    lookahead pull();
    const token& peek();
    void advance();

    node_ptr parse_value();
    std::shared_ptr<node> parse_sequence(token_kind close);
    std::shared_ptr<node> parse_mapping();
    [[noreturn]] void fail_expected(const std::string& what);
};

node_ptr parse(std::string_view src, lex_options opts = {});
document parse_document(std::string_view src, lex_options opts = {});

} // namespace rson
