#include "rson/diagnostics_json.hpp"
#include "rson/config.hpp"
#include "rson/encoder.hpp"
#include <sstream>
#include <cstdlib>
#include <cstdio>

namespace rson {

// The encoder's canonical string form is also a valid JSON string.
std::string json_escape(const std::string& s){ return quote_string(s); }

static std::string failure_json(const char* category, const char* kind, size_t offset, const std::string& message){
    std::ostringstream os;
    os<<"{\"success\":false"
      <<",\"category\":"<<json_escape(category)
      <<",\"kind\":"<<json_escape(kind)
      <<",\"offset\":"<<offset
      <<",\"message\":"<<json_escape(message)
      <<"}";
    return os.str();
}

std::string result_to_json(const run_result& r){
    if(r.success){
        std::ostringstream os;
        os<<"{\"success\":true,\"output\":"<<json_escape(r.output)<<"}";
        return os.str();
    }
    return failure_json(category_name(r.error.category), kind_name(r.error), r.error.offset, r.error.message);
}

std::string bridge_error_to_json(bridge_error_kind k, size_t offset, const std::string& message){
    return failure_json("bridge", error_kind_name(k), offset, message);
}

bool maybe_print_json(const run_result& r){
    if(!env_flag_enabled("RSON_DIAG_JSON")) return false;
    auto js=result_to_json(r);
    std::fprintf(stderr, "%s\n", js.c_str());
    return true;
}

} // namespace rson
