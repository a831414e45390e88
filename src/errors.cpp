#include "rson/errors.hpp"

namespace rson {

const char* error_kind_name(lex_error_kind k){
    switch(k){
        case lex_error_kind::unterminated_string: return "unterminated_string";
        case lex_error_kind::unterminated_comment: return "unterminated_comment";
        case lex_error_kind::unexpected_byte: return "unexpected_byte";
        case lex_error_kind::invalid_escape: return "invalid_escape";
        case lex_error_kind::invalid_number: return "invalid_number";
    }
    return "unknown";
}

const char* error_kind_name(parse_error_kind k){
    switch(k){
        case parse_error_kind::unexpected_token: return "unexpected_token";
        case parse_error_kind::unexpected_end: return "unexpected_end";
        case parse_error_kind::malformed_tag: return "malformed_tag";
        case parse_error_kind::trailing_input: return "trailing_input";
    }
    return "unknown";
}

const char* error_kind_name(bridge_error_kind k){
    switch(k){
        case bridge_error_kind::invalid_utf8: return "invalid_utf8";
        case bridge_error_kind::out_of_memory: return "out_of_memory";
        case bridge_error_kind::input_too_large: return "input_too_large";
        case bridge_error_kind::unknown_buffer: return "unknown_buffer";
    }
    return "unknown";
}

const char* category_name(error_category c){
    return c == error_category::lex ? "lex" : "parse";
}

} // namespace rson
