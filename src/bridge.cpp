#include "rson/bridge.hpp"
#include "rson/diagnostics_json.hpp"
#include "rson/engine.hpp"
#include "rson/utf8.hpp"
#include <cstdio>
#include <new>

namespace rson::bridge {

uint8_t* context::guest_alloc(size_t len){
    try {
        buffer b;
        b.data = std::make_unique<uint8_t[]>(len ? len : 1); // distinct pointer even for len 0
        b.size = len;
        uint8_t* p = b.data.get();
        buffers_.emplace(p, std::move(b));
        if(opts_.debug) std::fprintf(stderr, "[rson][bridge] alloc len=%zu ptr=%p live=%zu\n", len, (void*)p, buffers_.size());
        return p;
    } catch (const std::bad_alloc&) {
        if(opts_.debug) std::fprintf(stderr, "[rson][bridge] alloc len=%zu failed: out of memory\n", len);
        return nullptr;
    }
}

bool context::guest_free(const uint8_t* ptr){
    auto it = buffers_.find(ptr);
    if(it == buffers_.end()){
        if(opts_.debug) std::fprintf(stderr, "[rson][bridge] free of unknown ptr=%p ignored\n", (const void*)ptr);
        return false;
    }
    buffers_.erase(it);
    return true;
}

size_t context::bytes_in_use() const {
    size_t n = result_.size();
    for(auto& kv : buffers_) n += kv.second.size;
    return n;
}

void context::set_result(std::string_view text){
    result_.assign(text.begin(), text.end());
}

int32_t context::fail(bridge_error_kind k, size_t offset, const std::string& message){
    if(opts_.debug) std::fprintf(stderr, "[rson][bridge] %s at byte %zu: %s\n", error_kind_name(k), offset, message.c_str());
    if(opts_.errors == error_format::json) set_result(bridge_error_to_json(k, offset, message));
    else set_result("bridge error at byte " + std::to_string(offset) + ": " + message);
    return static_cast<int32_t>(k);
}

int32_t context::run(const uint8_t* ptr, size_t len){
    try {
        auto it = buffers_.find(ptr);
        if(it == buffers_.end())
            return fail(bridge_error_kind::unknown_buffer, 0, "pointer was not returned by guest_alloc");
        if(len > it->second.size)
            return fail(bridge_error_kind::unknown_buffer, 0,
                        "length " + std::to_string(len) + " exceeds buffer size " + std::to_string(it->second.size));

        // Implicit guest_free: the input is released when `input` goes out of scope.
        buffer input = std::move(it->second);
        buffers_.erase(it);
        std::string_view text(reinterpret_cast<const char*>(input.data.get()), len);

        if(opts_.max_input_bytes && len > opts_.max_input_bytes)
            return fail(bridge_error_kind::input_too_large, opts_.max_input_bytes,
                        "input of " + std::to_string(len) + " bytes exceeds the limit of " + std::to_string(opts_.max_input_bytes));
        if(size_t bad = utf8::find_invalid(text); bad != utf8::npos)
            return fail(bridge_error_kind::invalid_utf8, bad, "input is not valid UTF-8");

        run_result r = rson::run(text, opts_);
        if(r.success){
            set_result(r.output);
            return status_ok;
        }
        if(opts_.errors == error_format::json) set_result(result_to_json(r));
        else set_result(describe(r.error));
        return status_syntax_error;
    } catch (const std::bad_alloc&) {
        // Nothing partial is left behind; the context stays usable.
        std::vector<uint8_t>().swap(result_);
        if(opts_.debug) std::fprintf(stderr, "[rson][bridge] run len=%zu failed: out of memory\n", len);
        return static_cast<int32_t>(bridge_error_kind::out_of_memory);
    }
}

} // namespace rson::bridge
