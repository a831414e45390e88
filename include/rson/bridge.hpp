// Foreign memory bridge: moves text across a module boundary by ownership handoff.
//
// Protocol (host side):
//   1. p = guest_alloc(len)          module allocates and owns the buffer
//   2. write len UTF-8 bytes at p
//   3. status = run(p, len)          module consumes and frees the buffer
//   4. copy result_len() bytes from result_ptr()
//   5. only then issue the next call; the result buffer is reused or moved by it
// Buffers allocated in step 1 but never passed to run are released with guest_free.
// A context is neither reentrant nor thread-safe.
#pragma once
#include "rson/config.hpp"
#include "rson/errors.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace rson::bridge {

// run() status codes; negative values are bridge_error_kind.
constexpr int32_t status_ok = 0;
constexpr int32_t status_syntax_error = 1;

// One module instance's memory: live input buffers plus the current result.
class context {
public:
    explicit context(options opts = {}) : opts_(std::move(opts)) {}
    context(const context&) = delete;
    context& operator=(const context&) = delete;

    // nullptr when the allocation fails; the context is unchanged then.
    uint8_t* guest_alloc(size_t len);
    // Releases a buffer from guest_alloc. False if ptr is not a live buffer.
    bool guest_free(const uint8_t* ptr);

    // Consumes the buffer at ptr (it is released whatever the outcome, unless
    // the pointer/length pair is rejected as unknown_buffer) and replaces the
    // result. Returns status_ok, status_syntax_error or a bridge_error_kind value.
    int32_t run(const uint8_t* ptr, size_t len);

    const uint8_t* result_ptr() const { return result_.empty() ? nullptr : result_.data(); }
    size_t result_len() const { return result_.size(); }
    std::string_view result() const { return {reinterpret_cast<const char*>(result_.data()), result_.size()}; }

    size_t live_buffers() const { return buffers_.size(); }
    size_t bytes_in_use() const;
    const options& opts() const { return opts_; }

private:
    struct buffer {
        std::unique_ptr<uint8_t[]> data;
        size_t size = 0;
    };

    options opts_;
    std::unordered_map<const uint8_t*, buffer> buffers_;
    std::vector<uint8_t> result_;

    void set_result(std::string_view text);
    int32_t fail(bridge_error_kind k, size_t offset, const std::string& message);
};

} // namespace rson::bridge

// C ABI over the process-wide module instance (created on first use with
// detect_options()). These are what a WebAssembly host imports.
extern "C" {
uint8_t* rson_guest_alloc(uint32_t len);
void rson_guest_free(uint8_t* ptr);
int32_t rson_run(const uint8_t* ptr, uint32_t len);
const uint8_t* rson_result_ptr(void);
uint32_t rson_result_len(void);
const char* rson_version(void);
}
