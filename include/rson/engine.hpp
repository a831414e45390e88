// Engine facade: lex -> parse -> encode behind a single call
#pragma once
#include "rson/config.hpp"
#include "rson/errors.hpp"
#include <string>
#include <string_view>
#include <variant>

namespace rson {

struct engine_error {
    error_category category = error_category::parse;
    std::variant<lex_error_kind, parse_error_kind> kind;
    size_t offset = 0; // byte offset into the input
    std::string message;
};

struct run_result {
    bool success{false};
    std::string output; // reformatted text; empty on failure
    engine_error error; // meaningful only when !success
};

// Pure function of (input, opts). Lexer and parser failures come back in the
// result and never escape; std::bad_alloc does.
run_result run(std::string_view input, const options& opts = {});

const char* kind_name(const engine_error& e);
// "<category> error at byte <offset>: <message>"
std::string describe(const engine_error& e);

} // namespace rson
