// C ABI exported to the host. Under Emscripten the functions are kept alive for
// the JS side (cwrap/ccall); natively they are plain extern "C" symbols.
#include "rson/bridge.hpp"

#if defined(__EMSCRIPTEN__)
#include <emscripten.h>
#define RSON_EXPORT EMSCRIPTEN_KEEPALIVE
#else
#define RSON_EXPORT
#endif

namespace {

// The module instance: lives from first use until process exit.
rson::bridge::context& module_instance(){
    static rson::bridge::context ctx(rson::detect_options());
    return ctx;
}

} // namespace

extern "C" {

RSON_EXPORT uint8_t* rson_guest_alloc(uint32_t len){ return module_instance().guest_alloc(len); }

// Unknown pointers are ignored, like free(NULL).
RSON_EXPORT void rson_guest_free(uint8_t* ptr){ (void)module_instance().guest_free(ptr); }

RSON_EXPORT int32_t rson_run(const uint8_t* ptr, uint32_t len){ return module_instance().run(ptr, len); }

RSON_EXPORT const uint8_t* rson_result_ptr(void){ return module_instance().result_ptr(); }

RSON_EXPORT uint32_t rson_result_len(void){ return static_cast<uint32_t>(module_instance().result_len()); }

RSON_EXPORT const char* rson_version(void){ return rson::version_string; }

} // extern "C"
