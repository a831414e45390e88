// Encoder: value tree -> canonical text
#pragma once
#include "rson/rson.hpp"
#include <cstddef>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

namespace rson {

struct encode_options {
    int indent_width = 4;
    // Collections with more elements than this are laid out one element per line.
    size_t inline_threshold = 6;
    // Render identifier-like string keys of mappings without quotes.
    bool bare_keys = true;
};

// Deterministic and total: identical trees give byte-identical text.
std::string encode(const node& n, const encode_options& opts = {});
inline std::string encode(const node_ptr& n, const encode_options& opts = {}) { return encode(*n, opts); }

// Root value followed by the comments that came after it in the source.
std::string encode_document(const node_ptr& root, const std::vector<std::string>& trailing_comments,
                            const encode_options& opts = {});

// Shortest digits that read back as the same double. Fixed notation for
// decimal exponents in [-5, 17), with ".0" when there is no fraction;
// scientific ("1.5e+20") outside that range.
std::string format_double(double v);
std::string format_number(const number& n);
// Double-quoted, canonically escaped.
std::string quote_string(std::string_view s);

inline std::string to_string(const node_ptr& p){
    encode_options o;
    o.inline_threshold = std::numeric_limits<size_t>::max();
    return encode(*p, o);
}
inline std::string to_pretty_string(const node_ptr& p, int indentWidth = 4){
    encode_options o;
    o.indent_width = indentWidth;
    return encode(*p, o);
}

} // namespace rson
