#include <cassert>
#include <iostream>
#include "rson/config.hpp"
#include "test_env.hpp"

using namespace rson;

static void test_defaults(){
    scoped_env a("RSON_INDENT", "");
    scoped_env b("RSON_INLINE_THRESHOLD", "");
    scoped_env c("RSON_BARE_KEYS", "");
    scoped_env d("RSON_PRESERVE_COMMENTS", "");
    scoped_env e("RSON_MAX_INPUT", "");
    scoped_env f("RSON_ERROR_FORMAT", "");
    auto o = detect_options();
    assert(o.encode.indent_width == 4);
    assert(o.encode.inline_threshold == 6);
    assert(o.encode.bare_keys);
    assert(!o.lex.preserve_comments);
    assert(o.max_input_bytes == 0);
    assert(o.errors == error_format::text);
}

static void test_overrides(){
    scoped_env a("RSON_INDENT", "2");
    scoped_env b("RSON_INLINE_THRESHOLD", "0");
    scoped_env c("RSON_BARE_KEYS", "0");
    scoped_env d("RSON_PRESERVE_COMMENTS", "yes");
    scoped_env e("RSON_MAX_INPUT", "1024");
    scoped_env f("RSON_ERROR_FORMAT", "JSON");
    auto o = detect_options();
    assert(o.encode.indent_width == 2);
    assert(o.encode.inline_threshold == 0);
    assert(!o.encode.bare_keys);
    assert(o.lex.preserve_comments);
    assert(o.max_input_bytes == 1024);
    assert(o.errors == error_format::json);
}

static void test_malformed_values_keep_defaults(){
    {
        scoped_env a("RSON_INDENT", "99");
        scoped_env b("RSON_MAX_INPUT", "-5");
        scoped_env c("RSON_INLINE_THRESHOLD", "3x");
        auto o = detect_options();
        assert(o.encode.indent_width == 4);
        assert(o.max_input_bytes == 0);
        assert(o.encode.inline_threshold == 6);
    }
    scoped_env a("RSON_INDENT", "abc");
    assert(detect_options().encode.indent_width == 4);
}

static void test_env_flag(){
    {
        scoped_env a("RSON_TEST_FLAG", "1");
        assert(env_flag_enabled("RSON_TEST_FLAG"));
    }
    {
        scoped_env a("RSON_TEST_FLAG", "True");
        assert(env_flag_enabled("RSON_TEST_FLAG"));
    }
    {
        scoped_env a("RSON_TEST_FLAG", "0");
        assert(!env_flag_enabled("RSON_TEST_FLAG"));
    }
    scoped_env a("RSON_TEST_FLAG", "");
    assert(!env_flag_enabled("RSON_TEST_FLAG"));
}

void run_config_tests(){
    std::cout << "[config] RSON_* environment...\n";
    test_defaults();
    test_overrides();
    test_malformed_values_keep_defaults();
    test_env_flag();
}
