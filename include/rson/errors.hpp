// Error taxonomy: lexer and parser exceptions, bridge status codes
#pragma once
#include <stdexcept>
#include <string>
#include <cstddef>

namespace rson {

enum class error_category { lex, parse };

enum class lex_error_kind {
    unterminated_string,  // no closing quote before end of input
    unterminated_comment, // /* without */
    unexpected_byte,      // byte that cannot start or continue a token
    invalid_escape,       // unknown \x escape or lone surrogate
    invalid_number        // literal out of double range
};

enum class parse_error_kind {
    unexpected_token,
    unexpected_end,
    malformed_tag, // keyword used as a tagged-variant name
    trailing_input
};

// Status codes returned across the C boundary. Negative values only.
enum class bridge_error_kind : int {
    invalid_utf8 = -1,
    out_of_memory = -2,
    input_too_large = -3,
    unknown_buffer = -4
};

const char* error_kind_name(lex_error_kind k);
const char* error_kind_name(parse_error_kind k);
const char* error_kind_name(bridge_error_kind k);
const char* category_name(error_category c);

// Base for everything the lexer and parser throw. offset() is a byte offset into
// the original input.
struct syntax_error : std::runtime_error {
    syntax_error(const std::string& msg, size_t offset) : std::runtime_error(msg), offset_(offset) {}
    size_t offset() const noexcept { return offset_; }
    virtual error_category category() const noexcept = 0;
    virtual const char* kind_name() const noexcept = 0;
private:
    size_t offset_;
};

struct lex_error : syntax_error {
    lex_error(lex_error_kind k, size_t offset, const std::string& msg) : syntax_error(msg, offset), kind(k) {}
    error_category category() const noexcept override { return error_category::lex; }
    const char* kind_name() const noexcept override { return error_kind_name(kind); }
    lex_error_kind kind;
};

struct parse_error : syntax_error {
    parse_error(parse_error_kind k, size_t offset, const std::string& msg) : syntax_error(msg, offset), kind(k) {}
    error_category category() const noexcept override { return error_category::parse; }
    const char* kind_name() const noexcept override { return error_kind_name(kind); }
    parse_error_kind kind;
};

} // namespace rson
