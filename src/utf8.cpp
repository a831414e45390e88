#include "rson/utf8.hpp"

namespace rson::utf8 {

static bool is_cont(unsigned char c){ return (c & 0xC0) == 0x80; }

size_t sequence_length(std::string_view s, size_t i){
    if(i >= s.size()) return 0;
    auto at = [&](size_t k)->unsigned char{ return static_cast<unsigned char>(s[k]); };
    unsigned char c = at(i);
    if(c < 0x80) return 1;
    size_t need = 0; unsigned char lo = 0x80, hi = 0xBF;
    if(c >= 0xC2 && c <= 0xDF) need = 1;
    else if(c == 0xE0){ need = 2; lo = 0xA0; }
    else if(c == 0xED){ need = 2; hi = 0x9F; } // no UTF-16 surrogates
    else if(c >= 0xE1 && c <= 0xEF) need = 2;
    else if(c == 0xF0){ need = 3; lo = 0x90; }
    else if(c >= 0xF1 && c <= 0xF3) need = 3;
    else if(c == 0xF4){ need = 3; hi = 0x8F; }
    else return 0;
    if(i + need >= s.size()) return 0; // truncated
    unsigned char c1 = at(i + 1);
    if(c1 < lo || c1 > hi) return 0;
    for(size_t k = 2; k <= need; ++k) if(!is_cont(at(i + k))) return 0;
    return need + 1;
}

size_t find_invalid(std::string_view s){
    size_t i = 0;
    while(i < s.size()){
        size_t n = sequence_length(s, i);
        if(n == 0) return i;
        i += n;
    }
    return npos;
}

void append(std::string& out, char32_t cp){
    if(cp < 0x80){ out += static_cast<char>(cp); }
    else if(cp < 0x800){
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if(cp < 0x10000){
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

} // namespace rson::utf8
