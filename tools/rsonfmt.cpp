#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include "rson/engine.hpp"
#include "rson/diagnostics_json.hpp"

using namespace rson;

static bool read_all(std::istream& is, std::string& out){ std::stringstream ss; ss<<is.rdbuf(); out = ss.str(); return !is.bad(); }

int main(int argc, char** argv){
    if(argc>2){ std::cerr << "usage: rsonfmt [file|-]\n"; return 1; }
    std::string file = argc>1 ? argv[1] : "-";
    std::string src;
    if(file == "-"){
        if(!read_all(std::cin, src)){ std::cerr << "failed to read stdin\n"; return 1; }
        file = "<stdin>";
    } else {
        std::ifstream ifs(file, std::ios::binary);
        if(!ifs){ std::cerr << "failed to open " << file << "\n"; return 1; }
        if(!read_all(ifs, src)){ std::cerr << "failed to read " << file << "\n"; return 1; }
    }
    options opts = detect_options();
    run_result r = run(src, opts);
    if(!r.success){
        if(!maybe_print_json(r))
            std::cerr << file << ":" << r.error.offset << ": " << category_name(r.error.category)
                      << " error: " << r.error.message << "\n";
        return 2;
    }
    std::cout << r.output << "\n";
    return 0;
}
