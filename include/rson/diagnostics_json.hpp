// diagnostics_json.hpp - JSON serialization for engine and bridge results
#pragma once
#include "rson/engine.hpp"
#include "rson/errors.hpp"
#include <string>

namespace rson {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// {"success":true,"output":"..."} or
// {"success":false,"category":"lex","kind":"...","offset":N,"message":"..."}
std::string result_to_json(const run_result& r);

// Same shape as a failed result_to_json with category "bridge".
std::string bridge_error_to_json(bridge_error_kind k, size_t offset, const std::string& message);

// If RSON_DIAG_JSON=1 in the environment, print the result JSON to stderr.
// Returns true when something was printed.
bool maybe_print_json(const run_result& r);

} // namespace rson
