// Builds a document in code, encodes it, and checks it parses back unchanged.
#include <iostream>
#include <string>
#include "rson/rson.hpp"
#include "rson/encoder.hpp"
#include "rson/parser.hpp"

using namespace rson;

int main(){
    auto scene = node_struct("Scene", {
        kvp(n_str("name"), n_str("demo \"one\"")),
        kvp(n_str("origin"), node_tuple("Point", { n_i64(0), n_f64(1.5) })),
        kvp(n_str("tags"), node_seq({ n_str("a"), n_str("b"), n_null() })),
        kvp(n_i64(7), n_bool(true)), // keys need not be strings
    });

    std::string text = to_pretty_string(scene);
    std::cout << text << "\n";

    try {
        auto back = parse(text);
        if(!equal(scene, back)){
            std::cerr << "round trip changed the tree\n";
            return 1;
        }
    } catch (const syntax_error& e) {
        std::cerr << "reparse failed at byte " << e.offset() << ": " << e.what() << "\n";
        return 2;
    }
    std::cout << "tagged example OK\n";
    return 0;
}
