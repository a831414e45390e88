#include "rson/lexer.hpp"
#include "grammar.hpp"
#include "rson/utf8.hpp"
#include <tao/pegtl.hpp>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <string>

namespace rson {

namespace {

// Length of the longest match of Rule at src[at], 0 on no match.
template<typename Rule>
size_t match_at(std::string_view src, size_t at){
    tao::pegtl::memory_input<> in(src.data() + at, src.size() - at, "rson");
    if(!tao::pegtl::parse< Rule >(in)) return 0;
    return static_cast<size_t>(in.current() - (src.data() + at));
}

int hex_value(char c){
    if(c >= '0' && c <= '9') return c - '0';
    if(c >= 'a' && c <= 'f') return c - 'a' + 10;
    if(c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Reads XXXX after "\u" at src[at]; -1 when fewer than four hex digits follow.
long read_hex4(std::string_view src, size_t at){
    if(at + 4 > src.size()) return -1;
    long v = 0;
    for(size_t k = 0; k < 4; ++k){
        int h = hex_value(src[at + k]);
        if(h < 0) return -1;
        v = v * 16 + h;
    }
    return v;
}

std::string quote_byte(unsigned char c){
    static const char* hex = "0123456789ABCDEF";
    if(c >= 0x20 && c < 0x7F) return std::string("'") + static_cast<char>(c) + "'";
    std::string s = "0x";
    s += hex[c >> 4];
    s += hex[c & 0xF];
    return s;
}

} // namespace

const char* token_kind_name(token_kind k){
    switch(k){
        case token_kind::left_brace: return "'{'";
        case token_kind::right_brace: return "'}'";
        case token_kind::left_bracket: return "'['";
        case token_kind::right_bracket: return "']'";
        case token_kind::left_paren: return "'('";
        case token_kind::right_paren: return "')'";
        case token_kind::colon: return "':'";
        case token_kind::comma: return "','";
        case token_kind::identifier: return "identifier";
        case token_kind::string: return "string";
        case token_kind::number: return "number";
        case token_kind::kw_true: return "'true'";
        case token_kind::kw_false: return "'false'";
        case token_kind::kw_null: return "'null'";
        case token_kind::comment: return "comment";
        case token_kind::end: return "end of input";
    }
    return "token";
}

token lexer::make(token_kind k, size_t start, size_t len, std::string text) const {
    token t;
    t.kind = k;
    t.offset = start;
    t.length = len;
    t.text = std::move(text);
    return t;
}

void lexer::skip_blanks(){
    pos_ += match_at< grammar::blanks >(src_, pos_);
}

token lexer::next(){
    for(;;){
        if(done_) return make(token_kind::end, src_.size(), 0);
        skip_blanks();
        if(pos_ >= src_.size()){
            done_ = true;
            return make(token_kind::end, src_.size(), 0);
        }
        const size_t start = pos_;
        const char c = src_[pos_];
        switch(c){
            case '{': ++pos_; return make(token_kind::left_brace, start, 1);
            case '}': ++pos_; return make(token_kind::right_brace, start, 1);
            case '[': ++pos_; return make(token_kind::left_bracket, start, 1);
            case ']': ++pos_; return make(token_kind::right_bracket, start, 1);
            case '(': ++pos_; return make(token_kind::left_paren, start, 1);
            case ')': ++pos_; return make(token_kind::right_paren, start, 1);
            case ':': ++pos_; return make(token_kind::colon, start, 1);
            case ',': ++pos_; return make(token_kind::comma, start, 1);
            case '"': return lex_string();
            case '/': {
                token t;
                if(!lex_comment(t))
                    throw lex_error(lex_error_kind::unexpected_byte, start, "unexpected character '/'");
                if(opts_.preserve_comments) return t;
                continue; // skipped
            }
            default:
                break;
        }
        if((c >= '0' && c <= '9') || c == '+' || c == '-') return lex_number();
        if(match_at< grammar::word >(src_, pos_) > 0) return lex_word();
        throw lex_error(lex_error_kind::unexpected_byte, start,
                        "unexpected character " + quote_byte(static_cast<unsigned char>(c)));
    }
}

bool lexer::lex_comment(token& out){
    const size_t start = pos_;
    if(size_t n = match_at< grammar::comment_line >(src_, pos_)){
        pos_ += n;
        out = make(token_kind::comment, start, n, std::string(src_.substr(start, n)));
        return true;
    }
    if(size_t n = match_at< grammar::block_comment >(src_, pos_)){
        pos_ += n;
        out = make(token_kind::comment, start, n, std::string(src_.substr(start, n)));
        return true;
    }
    if(pos_ + 1 < src_.size() && src_[pos_ + 1] == '*')
        throw lex_error(lex_error_kind::unterminated_comment, start, "unterminated block comment");
    return false;
}

token lexer::lex_number(){
    const size_t start = pos_;
    const size_t n = match_at< grammar::number >(src_, pos_);
    if(n == 0){
        // a lone sign
        throw lex_error(lex_error_kind::unexpected_byte, start,
                        "unexpected character " + quote_byte(static_cast<unsigned char>(src_[start])));
    }
    pos_ += n;
    std::string lexeme(src_.substr(start, n));
    errno = 0;
    double v = std::strtod(lexeme.c_str(), nullptr);
    if(errno == ERANGE && std::isinf(v))
        throw lex_error(lex_error_kind::invalid_number, start, "number literal out of range: " + lexeme);
    // underflow to zero from a nonzero mantissa
    if(errno == ERANGE && v == 0.0 && lexeme.find_first_of("123456789") < lexeme.find_first_of("eE"))
        throw lex_error(lex_error_kind::invalid_number, start, "number literal too small: " + lexeme);
    return make(token_kind::number, start, n, std::move(lexeme));
}

token lexer::lex_word(){
    const size_t start = pos_;
    const size_t n = match_at< grammar::word >(src_, pos_);
    pos_ += n;
    std::string w(src_.substr(start, n));
    if(w == "true") return make(token_kind::kw_true, start, n, std::move(w));
    if(w == "false") return make(token_kind::kw_false, start, n, std::move(w));
    if(w == "null") return make(token_kind::kw_null, start, n, std::move(w));
    return make(token_kind::identifier, start, n, std::move(w));
}

token lexer::lex_string(){
    const size_t start = pos_;
    size_t i = pos_ + 1; // past the opening quote
    std::string out;
    while(i < src_.size()){
        const char c = src_[i];
        if(c == '"'){
            pos_ = i + 1;
            return make(token_kind::string, start, pos_ - start, std::move(out));
        }
        if(c == '\\'){
            if(i + 1 >= src_.size()) break; // unterminated
            const size_t esc = i;
            const char e = src_[i + 1];
            i += 2;
            switch(e){
                case 'n': out += '\n'; break;
                case 't': out += '\t'; break;
                case 'r': out += '\r'; break;
                case 'b': out += '\b'; break;
                case 'f': out += '\f'; break;
                case '0': out += '\0'; break;
                case '/': out += '/'; break;
                case '\\': out += '\\'; break;
                case '"': out += '"'; break;
                case 'u': {
                    long cp = read_hex4(src_, i);
                    if(cp < 0) throw lex_error(lex_error_kind::invalid_escape, esc, "\\u requires four hex digits");
                    i += 4;
                    if(cp >= 0xDC00 && cp <= 0xDFFF)
                        throw lex_error(lex_error_kind::invalid_escape, esc, "unpaired low surrogate in \\u escape");
                    if(cp >= 0xD800 && cp <= 0xDBFF){
                        long lo = (i + 1 < src_.size() && src_[i] == '\\' && src_[i + 1] == 'u') ? read_hex4(src_, i + 2) : -1;
                        if(lo < 0xDC00 || lo > 0xDFFF)
                            throw lex_error(lex_error_kind::invalid_escape, esc, "unpaired high surrogate in \\u escape");
                        i += 6;
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                    }
                    utf8::append(out, static_cast<char32_t>(cp));
                    break;
                }
                default:
                    throw lex_error(lex_error_kind::invalid_escape, esc,
                                    std::string("invalid escape sequence '\\") + e + "'");
            }
            continue;
        }
        size_t n = utf8::sequence_length(src_, i);
        if(n == 0)
            throw lex_error(lex_error_kind::unexpected_byte, i,
                            "invalid UTF-8 byte " + quote_byte(static_cast<unsigned char>(c)) + " in string");
        out.append(src_.data() + i, n);
        i += n;
    }
    throw lex_error(lex_error_kind::unterminated_string, start, "unterminated string literal");
}

std::vector<token> tokenize(std::string_view src, lex_options opts){
    lexer lx(src, opts);
    std::vector<token> out;
    for(;;){
        out.push_back(lx.next());
        if(out.back().kind == token_kind::end) break;
    }
    return out;
}

} // namespace rson
