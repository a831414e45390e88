// Token kinds and spans produced by the lexer
#pragma once
#include <string>
#include <cstddef>

namespace rson {

enum class token_kind {
    left_brace, right_brace,     // {}
    left_bracket, right_bracket, // []
    left_paren, right_paren,     // ()
    colon, comma,
    identifier,
    string,
    number,
    kw_true, kw_false, kw_null,
    comment,
    end
};

struct token {
    token_kind kind = token_kind::end;
    size_t offset = 0; // first byte
    size_t length = 0; // bytes covered in the source
    // identifier / number / comment: the source lexeme; string: decoded text.
    std::string text;
};

const char* token_kind_name(token_kind k);

inline bool is_open_delimiter(token_kind k){
    return k == token_kind::left_paren || k == token_kind::left_bracket || k == token_kind::left_brace;
}
inline bool is_keyword(token_kind k){
    return k == token_kind::kw_true || k == token_kind::kw_false || k == token_kind::kw_null;
}

} // namespace rson
