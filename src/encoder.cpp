// encoder.cpp - canonical and pretty rendering of value trees
#include "rson/encoder.hpp"
#include <charconv>
#include <cstdlib>
#include <cstdio>

namespace rson {

// Shortest round-trip digits, spelled out in fixed notation while the decimal
// exponent is in [-5, 17) and in scientific notation otherwise.
std::string format_double(double v){
    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), v, std::chars_format::scientific);
    std::string sci(buf, res.ptr); // [-]d[.ddd]e[+-]XX
    const size_t e = sci.find('e');
    const int exp = std::atoi(sci.c_str() + e + 1);
    if(exp < -5 || exp >= 17) return sci;

    const bool neg = sci[0] == '-';
    std::string digits;
    for(size_t i = neg ? 1 : 0; i < e; ++i)
        if(sci[i] != '.') digits += sci[i];
    std::string out = neg ? "-" : "";
    if(exp < 0) return out + "0." + std::string(static_cast<size_t>(-exp - 1), '0') + digits;
    const size_t int_len = static_cast<size_t>(exp) + 1;
    if(digits.size() <= int_len) return out + digits + std::string(int_len - digits.size(), '0') + ".0";
    return out + digits.substr(0, int_len) + "." + digits.substr(int_len);
}

std::string format_number(const number& n){
    if(n.integral) return std::to_string(n.integer);
    return format_double(n.value);
}

std::string quote_string(std::string_view s){
    std::string out;
    out.reserve(s.size() + 2);
    out += '"';
    for(char c : s){
        switch(c){
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default: {
                unsigned char u = static_cast<unsigned char>(c);
                if(u < 0x20 || u == 0x7F){
                    char buf[7];
                    std::snprintf(buf, sizeof(buf), "\\u%04X", static_cast<unsigned>(u));
                    out += buf;
                } else {
                    out += c; // UTF-8 passes through
                }
                break;
            }
        }
    }
    out += '"';
    return out;
}

namespace {

struct writer {
    const encode_options& o;

    std::string pad(int spaces) const { return std::string(static_cast<size_t>(spaces < 0 ? 0 : spaces), ' '); }

    bool bare_key(const node& k) const {
        if(!o.bare_keys) return false;
        const std::string* s = as_string(k);
        return s && is_identifier(*s) && !is_keyword(*s);
    }

    // Comments printed on the lines before an element.
    static void leading_of(const node& n, std::vector<std::string>& out){
        out.insert(out.end(), n.comments.begin(), n.comments.end());
        if(const tagged* t = as_tagged(n)) if(t->body) out.insert(out.end(), t->body->comments.begin(), t->body->comments.end());
    }

    struct item {
        std::vector<std::string> comments;
        std::string text;
    };

    std::string render(const node& n, int indent) const {
        struct V {
            const writer& w; const node& self; int indent;
            std::string operator()(std::monostate) const { return "null"; }
            std::string operator()(bool b) const { return b ? "true" : "false"; }
            std::string operator()(const number& x) const { return format_number(x); }
            std::string operator()(const std::string& s) const { return quote_string(s); }
            std::string operator()(const sequence& s) const { return w.render_sequence(s, self, '[', ']', indent); }
            std::string operator()(const mapping& m) const { return w.render_mapping(m, self, indent); }
            std::string operator()(const tagged& t) const {
                if(!t.body) return t.name + "()";
                if(const sequence* s = as_sequence(*t.body)) return t.name + w.render_sequence(*s, *t.body, '(', ')', indent);
                if(const mapping* m = as_mapping(*t.body)) return t.name + w.render_mapping(*m, *t.body, indent);
                // not constructible through the factories; still render something re-parseable
                return t.name + "(" + w.render(*t.body, indent) + ")";
            }
        };
        return std::visit(V{*this, n, indent}, n.data);
    }

    std::string render_sequence(const sequence& s, const node& self, char open, char close, int indent) const {
        std::vector<item> items;
        items.reserve(s.elems.size());
        for(auto& e : s.elems){
            item it;
            leading_of(*e, it.comments);
            it.text = render(*e, indent + o.indent_width);
            items.push_back(std::move(it));
        }
        return layout(items, self.trailing_comments, open, close, indent);
    }

    std::string render_mapping(const mapping& m, const node& self, int indent) const {
        std::vector<item> items;
        items.reserve(m.entries.size());
        for(auto& kv : m.entries){
            item it;
            leading_of(*kv.first, it.comments);
            leading_of(*kv.second, it.comments);
            int inner = indent + o.indent_width;
            it.text = (bare_key(*kv.first) ? std::get<std::string>(kv.first->data) : render(*kv.first, inner))
                    + ": " + render(*kv.second, inner);
            items.push_back(std::move(it));
        }
        return layout(items, self.trailing_comments, '{', '}', indent);
    }

    std::string layout(const std::vector<item>& items, const std::vector<std::string>& trailing,
                       char open, char close, int indent) const {
        if(items.empty() && trailing.empty()) return std::string{open, close};
        bool multi = items.size() > o.inline_threshold || !trailing.empty();
        for(auto& it : items){
            if(multi) break;
            if(!it.comments.empty() || it.text.find('\n') != std::string::npos) multi = true;
        }
        std::string out(1, open);
        if(!multi){
            for(size_t i = 0; i < items.size(); ++i){
                if(i) out += ", ";
                out += items[i].text;
            }
            out += close;
            return out;
        }
        const std::string inner = pad(indent + o.indent_width);
        out += '\n';
        for(size_t i = 0; i < items.size(); ++i){
            for(auto& c : items[i].comments) out += inner + c + '\n';
            out += inner + items[i].text;
            if(i + 1 < items.size()) out += ',';
            out += '\n';
        }
        for(auto& c : trailing) out += inner + c + '\n';
        out += pad(indent);
        out += close;
        return out;
    }
};

} // namespace

std::string encode(const node& n, const encode_options& opts){
    writer w{opts};
    std::vector<std::string> leading;
    writer::leading_of(n, leading);
    std::string out;
    for(auto& c : leading) out += c + '\n';
    out += w.render(n, 0);
    return out;
}

std::string encode_document(const node_ptr& root, const std::vector<std::string>& trailing_comments,
                            const encode_options& opts){
    std::string out = encode(*root, opts);
    for(auto& c : trailing_comments) out += '\n' + c;
    return out;
}

} // namespace rson
