// Lexer: raw text -> lazy token stream
#pragma once
#include "rson/token.hpp"
#include "rson/errors.hpp"
#include <string_view>
#include <vector>

namespace rson {

struct lex_options {
    // Yield comment tokens instead of skipping them.
    bool preserve_comments = false;
};

// Scans left to right with maximal munch. Each next() produces exactly one
// token; once the end token has been returned every further call returns it
// again. Not restartable. Errors are thrown as lex_error.
class lexer {
public:
    explicit lexer(std::string_view src, lex_options opts = {}) : src_(src), opts_(opts) {}

    token next();
    bool done() const { return done_; }

private:
    std::string_view src_;
    lex_options opts_;
    size_t pos_ = 0;
    bool done_ = false;

    token make(token_kind k, size_t start, size_t len, std::string text = {}) const;
    token lex_string();
    token lex_number();
    token lex_word();
    // false when the slash at pos_ does not start a comment
    bool lex_comment(token& out);
    void skip_blanks();
};

// Eager helper: every token up to and including the end token.
std::vector<token> tokenize(std::string_view src, lex_options opts = {});

} // namespace rson
