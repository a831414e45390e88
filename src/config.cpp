#include "rson/config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace rson {

bool env_flag_enabled(const char* name){
    const char* v = std::getenv(name);
    return v && (v[0] == '1' || v[0] == 't' || v[0] == 'T' || v[0] == 'y' || v[0] == 'Y');
}

// Parses a non-negative decimal; false on anything else.
static bool parse_count(const char* v, unsigned long long& out){
    if(!v || !*v) return false;
    char* end = nullptr;
    if(*v == '-') return false;
    unsigned long long x = std::strtoull(v, &end, 10);
    if(!end || *end != '\0') return false;
    out = x;
    return true;
}

options detect_options(){
    options o{};
    auto get = [](const char* k)->const char*{ const char* v = std::getenv(k); return (v && *v) ? v : nullptr; };

    o.debug = env_flag_enabled("RSON_DEBUG");

    // Layout
    unsigned long long n = 0;
    if (const char* v = get("RSON_INDENT")) {
        if (parse_count(v, n) && n <= 16) o.encode.indent_width = static_cast<int>(n);
        else if (o.debug) std::fprintf(stderr, "[rson][config] ignoring RSON_INDENT=%s\n", v);
    }
    if (const char* v = get("RSON_INLINE_THRESHOLD")) {
        if (parse_count(v, n)) o.encode.inline_threshold = static_cast<size_t>(n);
        else if (o.debug) std::fprintf(stderr, "[rson][config] ignoring RSON_INLINE_THRESHOLD=%s\n", v);
    }
    if (const char* v = get("RSON_BARE_KEYS")) o.encode.bare_keys = !(std::string(v) == "0");

    // Comments
    o.lex.preserve_comments = env_flag_enabled("RSON_PRESERVE_COMMENTS");

    // Bridge
    if (const char* v = get("RSON_MAX_INPUT")) {
        if (parse_count(v, n)) o.max_input_bytes = static_cast<size_t>(n);
        else if (o.debug) std::fprintf(stderr, "[rson][config] ignoring RSON_MAX_INPUT=%s\n", v);
    }
    if (const char* v = get("RSON_ERROR_FORMAT")) {
        std::string f = v;
        std::transform(f.begin(), f.end(), f.begin(), [](unsigned char c){ return (char)std::tolower(c); });
        if (f == "json") o.errors = error_format::json;
    }

    if (o.debug)
        std::fprintf(stderr, "[rson][config] indent=%d inline_threshold=%zu bare_keys=%d comments=%d max_input=%zu errors=%s\n",
                     o.encode.indent_width, o.encode.inline_threshold, o.encode.bare_keys ? 1 : 0,
                     o.lex.preserve_comments ? 1 : 0, o.max_input_bytes,
                     o.errors == error_format::json ? "json" : "text");
    return o;
}

} // namespace rson
