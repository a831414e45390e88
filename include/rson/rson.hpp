// Immutable node-based value tree with source offsets and optional comments
#pragma once
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <memory>
#include <stdexcept>
#include <cstdint>
#include <utility>
#include <initializer_list>

namespace rson
{

    struct node; // forward declaration

    using node_ptr = std::shared_ptr<const node>;

    // Exact source lexeme plus the decoded forms. `integral` is set when the lexeme
    // is an integer literal that fits in int64_t; `integer` is then exact.
    struct number
    {
        std::string lexeme;
        double value = 0.0;
        bool integral = false;
        int64_t integer = 0;
    };
    struct sequence
    {
        std::vector<node_ptr> elems;
    };
    struct mapping
    {
        std::vector<std::pair<node_ptr, node_ptr>> entries;
    };
    // Body is a sequence (tuple style) or a mapping (struct style).
    struct tagged
    {
        std::string name;
        node_ptr body;
    };

    using node_data = std::variant<std::monostate, bool, number, std::string, sequence, mapping, tagged>;

    struct node
    {
        node_data data;
        long offset = -1; // byte offset of the first token, -1 when built in code
        std::vector<std::string> comments;          // leading comments, verbatim
        std::vector<std::string> trailing_comments; // before the closing delimiter
    };

    // Structural deep equality. Offsets are never compared; comments only when
    // ignore_comments is false. Numbers compare by decoded value.
    bool equal(const node_ptr &a, const node_ptr &b, bool ignore_comments = true);

    // [A-Za-z_][A-Za-z0-9_]*
    bool is_identifier(std::string_view s);
    // true / false / null
    bool is_keyword(std::string_view s);

    inline bool is_null(const node &n) { return std::holds_alternative<std::monostate>(n.data); }
    inline bool is_bool(const node &n) { return std::holds_alternative<bool>(n.data); }
    inline bool is_number(const node &n) { return std::holds_alternative<number>(n.data); }
    inline bool is_string(const node &n) { return std::holds_alternative<std::string>(n.data); }
    inline bool is_sequence(const node &n) { return std::holds_alternative<sequence>(n.data); }
    inline bool is_mapping(const node &n) { return std::holds_alternative<mapping>(n.data); }
    inline bool is_tagged(const node &n) { return std::holds_alternative<tagged>(n.data); }

    inline const number *as_number(const node &n) { return is_number(n) ? &std::get<number>(n.data) : nullptr; }
    inline const std::string *as_string(const node &n) { return is_string(n) ? &std::get<std::string>(n.data) : nullptr; }
    inline const sequence *as_sequence(const node &n) { return is_sequence(n) ? &std::get<sequence>(n.data) : nullptr; }
    inline const mapping *as_mapping(const node &n) { return is_mapping(n) ? &std::get<mapping>(n.data) : nullptr; }
    inline const tagged *as_tagged(const node &n) { return is_tagged(n) ? &std::get<tagged>(n.data) : nullptr; }

    namespace detail
    {
        inline node_ptr make_node(node_data d, long offset = -1)
        {
            auto n = std::make_shared<node>();
            n->data = std::move(d);
            n->offset = offset;
            return n;
        }
    }

    // ------ Factory helpers ------
    // Each one validates its input so that every tree built in code is encodable
    // and parses back to itself.

    inline node_ptr n_null() { return detail::make_node(std::monostate{}); }
    inline node_ptr n_bool(bool b) { return detail::make_node(b); }
    node_ptr n_f64(double v);
    node_ptr n_i64(int64_t v);
    node_ptr n_str(std::string s);
    node_ptr node_seq(std::vector<node_ptr> elems);
    node_ptr node_map(std::vector<std::pair<node_ptr, node_ptr>> entries);
    node_ptr node_tagged(std::string name, node_ptr body);

    inline node_ptr node_seq(std::initializer_list<node_ptr> xs) { return node_seq(std::vector<node_ptr>(xs.begin(), xs.end())); }
    inline node_ptr node_map(std::initializer_list<std::pair<node_ptr, node_ptr>> xs)
    {
        return node_map(std::vector<std::pair<node_ptr, node_ptr>>(xs.begin(), xs.end()));
    }
    inline node_ptr node_tuple(std::string name, std::initializer_list<node_ptr> xs) { return node_tagged(std::move(name), node_seq(xs)); }
    inline node_ptr node_struct(std::string name, std::initializer_list<std::pair<node_ptr, node_ptr>> xs) { return node_tagged(std::move(name), node_map(xs)); }

    inline std::pair<node_ptr, node_ptr> kvp(node_ptr k, node_ptr v) { return {std::move(k), std::move(v)}; }

} // namespace rson
