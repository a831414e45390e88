// UTF-8 helpers shared by the lexer (escape decoding) and the bridge (boundary validation)
#pragma once
#include <string>
#include <string_view>
#include <cstddef>

namespace rson::utf8 {

constexpr size_t npos = static_cast<size_t>(-1);

// Length of the well-formed sequence starting at s[i] (1..4), or 0 if the bytes
// there are not valid UTF-8 (overlong forms, surrogates and code points above
// U+10FFFF are rejected).
size_t sequence_length(std::string_view s, size_t i);

// Offset of the first byte that does not start a valid sequence, npos when s is valid.
size_t find_invalid(std::string_view s);

inline bool valid(std::string_view s){ return find_invalid(s) == npos; }

// Append the UTF-8 encoding of a Unicode scalar value.
void append(std::string& out, char32_t cp);

} // namespace rson::utf8
