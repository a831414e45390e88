// Validating factories for value nodes.
#include "rson/rson.hpp"
#include "rson/encoder.hpp"
#include "rson/utf8.hpp"
#include <cmath>

namespace rson {

bool is_identifier(std::string_view s){
    if(s.empty()) return false;
    auto first = [](char c){ return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_'; };
    if(!first(s[0])) return false;
    for(char c : s.substr(1)){
        if(!first(c) && !(c >= '0' && c <= '9')) return false;
    }
    return true;
}

bool is_keyword(std::string_view s){ return s == "true" || s == "false" || s == "null"; }

node_ptr n_f64(double v){
    if(!std::isfinite(v)) throw std::invalid_argument("n_f64: number must be finite");
    number n;
    n.value = v;
    n.lexeme = format_double(v);
    return detail::make_node(std::move(n));
}

node_ptr n_i64(int64_t v){
    number n;
    n.value = static_cast<double>(v);
    n.integral = true;
    n.integer = v;
    n.lexeme = std::to_string(v);
    return detail::make_node(std::move(n));
}

node_ptr n_str(std::string s){
    if(!utf8::valid(s)) throw std::invalid_argument("n_str: string is not valid UTF-8");
    return detail::make_node(std::move(s));
}

node_ptr node_seq(std::vector<node_ptr> elems){
    for(auto& e : elems)
        if(!e) throw std::invalid_argument("node_seq: null element");
    return detail::make_node(sequence{std::move(elems)});
}

node_ptr node_map(std::vector<std::pair<node_ptr, node_ptr>> entries){
    for(auto& kv : entries)
        if(!kv.first || !kv.second) throw std::invalid_argument("node_map: null key or value");
    return detail::make_node(mapping{std::move(entries)});
}

node_ptr node_tagged(std::string name, node_ptr body){
    if(!is_identifier(name) || is_keyword(name))
        throw std::invalid_argument("node_tagged: '" + name + "' is not a valid tag identifier");
    if(!body || !(is_sequence(*body) || is_mapping(*body)))
        throw std::invalid_argument("node_tagged: body must be a sequence or a mapping");
    return detail::make_node(tagged{std::move(name), std::move(body)});
}

} // namespace rson
