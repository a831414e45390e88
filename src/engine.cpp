#include "rson/engine.hpp"
#include "rson/parser.hpp"
#include "rson/encoder.hpp"
#include <cstdio>

namespace rson {

run_result run(std::string_view input, const options& opts){
    run_result r;
    try {
        document doc = parser(input, opts.lex).parse_document();
        r.output = encode_document(doc.root, doc.trailing_comments, opts.encode);
        r.success = true;
        if(opts.debug) std::fprintf(stderr, "[rson][engine] ok in=%zu out=%zu\n", input.size(), r.output.size());
    } catch (const lex_error& e) {
        r.error.category = e.category();
        r.error.kind = e.kind;
        r.error.offset = e.offset();
        r.error.message = e.what();
    } catch (const parse_error& e) {
        r.error.category = e.category();
        r.error.kind = e.kind;
        r.error.offset = e.offset();
        r.error.message = e.what();
    }
    if(!r.success && opts.debug)
        std::fprintf(stderr, "[rson][engine] %s error kind=%s offset=%zu: %s\n", category_name(r.error.category),
                     kind_name(r.error), r.error.offset, r.error.message.c_str());
    return r;
}

const char* kind_name(const engine_error& e){
    return std::visit([](auto k){ return error_kind_name(k); }, e.kind);
}

std::string describe(const engine_error& e){
    return std::string(category_name(e.category)) + " error at byte " + std::to_string(e.offset) + ": " + e.message;
}

} // namespace rson
