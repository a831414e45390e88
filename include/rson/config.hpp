#pragma once
#include "rson/lexer.hpp"
#include "rson/encoder.hpp"
#include <cstddef>

namespace rson {

constexpr const char* version_string = "rson 0.1.0";

enum class error_format { text, json };

// Everything a call depends on besides its input text.
struct options {
    lex_options lex;
    encode_options encode;
    size_t max_input_bytes = 0; // bridge size guard, 0 = unlimited
    error_format errors = error_format::text; // how the bridge renders failures
    bool debug = false; // [rson][...] traces on stderr
};

// Reads RSON_* process env vars and constructs options (see README for
// semantics). Malformed values keep the defaults.
options detect_options();

// True when the variable is set to 1/t/T/y/Y.
bool env_flag_enabled(const char* name);

} // namespace rson
