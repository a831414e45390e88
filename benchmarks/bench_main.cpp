#include "rson/engine.hpp"
#include "rson/bridge.hpp"
#include <chrono>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

using Clock = std::chrono::steady_clock;

struct RunResult { double ms_run; size_t out_bytes; bool ok; };

static RunResult bench_case(const char* name, const std::string &doc, int reps){
    rson::options opts;
    size_t out = 0;
    auto t0 = Clock::now();
    for(int i=0;i<reps;++i){
        auto r = rson::run(doc, opts);
        if(!r.success){
            std::cerr << "[bench] case '" << name << "' failed: " << rson::describe(r.error) << "\n";
            return {0.0, 0, false};
        }
        out = r.output.size();
    }
    auto t1 = Clock::now();
    return { std::chrono::duration<double, std::milli>(t1 - t0).count() / reps, out, true };
}

// Same document through the allocate/write/run/read protocol.
static RunResult bench_bridge(const std::string &doc, int reps){
    rson::bridge::context ctx;
    size_t out = 0;
    auto t0 = Clock::now();
    for(int i=0;i<reps;++i){
        uint8_t* p = ctx.guest_alloc(doc.size());
        if(!p){ std::cerr << "[bench] bridge alloc failed\n"; return {0.0, 0, false}; }
        std::memcpy(p, doc.data(), doc.size());
        if(ctx.run(p, doc.size()) != rson::bridge::status_ok){ std::cerr << "[bench] bridge run failed: " << ctx.result() << "\n"; return {0.0, 0, false}; }
        std::string copy(ctx.result());
        out = copy.size();
    }
    auto t1 = Clock::now();
    return { std::chrono::duration<double, std::milli>(t1 - t0).count() / reps, out, true };
}

static std::string wide_sequence(int n){
    std::string s = "[";
    for(int i=0;i<n;++i){ if(i) s += ", "; s += std::to_string(i) + "." + std::to_string(i % 7); }
    return s + "]";
}

static std::string nested_structs(int depth){
    std::string s;
    for(int i=0;i<depth;++i) s += "Node{ id: " + std::to_string(i) + ", name: \"n" + std::to_string(i) + "\", child: ";
    s += "null";
    for(int i=0;i<depth;++i) s += " }";
    return s;
}

static std::string many_keys(int n){
    std::string s = "{";
    for(int i=0;i<n;++i){ if(i) s += ",\n"; s += "  key" + std::to_string(i) + ": Point(" + std::to_string(i) + ", -" + std::to_string(i) + ")"; }
    return s + "\n}";
}

int main(){
    struct Case { const char* name; std::string doc; int reps; };
    std::vector<Case> cases;
    cases.push_back({"wide_sequence", wide_sequence(20000), 20});
    cases.push_back({"nested_structs", nested_structs(500), 50});
    cases.push_back({"many_keys", many_keys(5000), 20});

    std::cout << "name,ms_run,out_bytes\n";
    for(const auto &c : cases){
        auto r = bench_case(c.name, c.doc, c.reps);
        if(!r.ok) return 1;
        std::cout << c.name << "," << r.ms_run << "," << r.out_bytes << "\n";
    }
    auto b = bench_bridge(cases[2].doc, 20);
    if(!b.ok) return 1;
    std::cout << "bridge_many_keys," << b.ms_run << "," << b.out_bytes << "\n";
    return 0;
}
