#include "rson/parser.hpp"
#include <charconv>
#include <cstdlib>
#include <memory>

namespace rson {

namespace {

number decode_number(const std::string& lexeme){
    number n;
    n.lexeme = lexeme;
    n.value = std::strtod(lexeme.c_str(), nullptr); // range already checked by the lexer
    if(lexeme.find_first_of(".eE") != std::string::npos) return n;
    const char* b = lexeme.data();
    const char* e = b + lexeme.size();
    if(*b == '+') ++b;
    int64_t v = 0;
    auto res = std::from_chars(b, e, v);
    // -0 keeps its sign through the double form
    if(res.ec == std::errc() && res.ptr == e && !(v == 0 && lexeme[0] == '-')){
        n.integral = true;
        n.integer = v;
    }
    return n;
}

std::shared_ptr<node> fresh(node_data d, size_t offset){
    auto n = std::make_shared<node>();
    n->data = std::move(d);
    n->offset = static_cast<long>(offset);
    return n;
}

const char* closing_name(token_kind close){
    switch(close){
        case token_kind::right_bracket: return "']'";
        case token_kind::right_paren: return "')'";
        default: return "'}'";
    }
}

} // namespace

parser::lookahead parser::pull(){
    lookahead la;
    for(;;){
        token t = lex_.next();
        if(t.kind == token_kind::comment){
            la.comments.push_back(std::move(t.text));
            continue;
        }
        la.tok = std::move(t);
        la.loaded = true;
        return la;
    }
}

const token& parser::peek(){
    if(!next_.loaded) next_ = pull();
    return next_.tok;
}

// Comments still attached to the consumed token move on to the next one.
void parser::advance(){
    std::vector<std::string> carry = std::move(cur_.comments);
    if(next_.loaded){
        cur_ = std::move(next_);
        next_ = lookahead{};
    } else {
        cur_ = pull();
    }
    if(!carry.empty()){
        carry.insert(carry.end(), cur_.comments.begin(), cur_.comments.end());
        cur_.comments = std::move(carry);
    }
}

void parser::fail_expected(const std::string& what){
    const token& t = cur_.tok;
    if(t.kind == token_kind::end)
        throw parse_error(parse_error_kind::unexpected_end, t.offset,
                          "unexpected end of input, expected " + what);
    throw parse_error(parse_error_kind::unexpected_token, t.offset,
                      std::string("unexpected ") + token_kind_name(t.kind) + ", expected " + what);
}

document parser::parse_document(){
    cur_ = pull();
    document doc;
    doc.root = parse_value();
    if(cur_.tok.kind != token_kind::end)
        throw parse_error(parse_error_kind::trailing_input, cur_.tok.offset,
                          std::string("unexpected ") + token_kind_name(cur_.tok.kind) + " after the value");
    doc.trailing_comments = std::move(cur_.comments);
    return doc;
}

node_ptr parser::parse_value(){
    std::vector<std::string> leading = std::move(cur_.comments);
    cur_.comments.clear();
    const token& t = cur_.tok;
    const size_t start = t.offset;
    std::shared_ptr<node> out;

    switch(t.kind){
        case token_kind::kw_null:
        case token_kind::kw_true:
        case token_kind::kw_false:
            if(is_open_delimiter(peek().kind))
                throw parse_error(parse_error_kind::malformed_tag, start,
                                  "'" + t.text + "' is a keyword and cannot name a tagged variant");
            if(t.kind == token_kind::kw_null) out = fresh(std::monostate{}, start);
            else out = fresh(t.kind == token_kind::kw_true, start);
            advance();
            break;
        case token_kind::number:
            out = fresh(decode_number(t.text), start);
            advance();
            break;
        case token_kind::string:
            out = fresh(t.text, start);
            advance();
            break;
        case token_kind::identifier:
            if(is_open_delimiter(peek().kind)){
                std::string name = t.text;
                advance(); // onto the delimiter
                node_ptr body = cur_.tok.kind == token_kind::left_brace ? parse_mapping()
                              : parse_sequence(cur_.tok.kind == token_kind::left_paren ? token_kind::right_paren : token_kind::right_bracket);
                out = fresh(tagged{std::move(name), std::move(body)}, start);
            } else {
                out = fresh(t.text, start); // bare identifier reads as a string
                advance();
            }
            break;
        case token_kind::left_bracket:
            out = parse_sequence(token_kind::right_bracket);
            break;
        case token_kind::left_paren:
            out = parse_sequence(token_kind::right_paren);
            break;
        case token_kind::left_brace:
            out = parse_mapping();
            break;
        default:
            fail_expected("a value");
    }
    out->comments = std::move(leading);
    return out;
}

std::shared_ptr<node> parser::parse_sequence(token_kind close){
    const size_t start = cur_.tok.offset;
    advance(); // past the opening delimiter
    sequence seq;
    while(cur_.tok.kind != close){
        seq.elems.push_back(parse_value());
        if(cur_.tok.kind == token_kind::comma){ advance(); continue; }
        if(cur_.tok.kind != close) fail_expected(std::string("',' or ") + closing_name(close));
    }
    auto out = fresh(std::move(seq), start);
    out->trailing_comments = std::move(cur_.comments);
    cur_.comments.clear();
    advance(); // past the closing delimiter
    return out;
}

std::shared_ptr<node> parser::parse_mapping(){
    const size_t start = cur_.tok.offset;
    advance(); // past '{'
    mapping map;
    while(cur_.tok.kind != token_kind::right_brace){
        node_ptr key = parse_value();
        if(cur_.tok.kind != token_kind::colon) fail_expected("':'");
        advance();
        node_ptr value = parse_value();
        map.entries.emplace_back(std::move(key), std::move(value));
        if(cur_.tok.kind == token_kind::comma){ advance(); continue; }
        if(cur_.tok.kind != token_kind::right_brace) fail_expected(std::string("',' or ") + closing_name(token_kind::right_brace));
    }
    auto out = fresh(std::move(map), start);
    out->trailing_comments = std::move(cur_.comments);
    cur_.comments.clear();
    advance(); // past '}'
    return out;
}

node_ptr parse(std::string_view src, lex_options opts){
    return parser(src, opts).parse_document().root;
}

document parse_document(std::string_view src, lex_options opts){
    return parser(src, opts).parse_document();
}

} // namespace rson
