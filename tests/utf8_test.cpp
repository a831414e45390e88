#include <cassert>
#include <iostream>
#include <string>
#include "rson/utf8.hpp"

using namespace rson;

static void test_valid_inputs(){
    assert(utf8::valid(""));
    assert(utf8::valid("plain ascii"));
    assert(utf8::valid("caf\xC3\xA9"));             // U+00E9
    assert(utf8::valid("\xE2\x82\xAC"));            // U+20AC
    assert(utf8::valid("\xF0\x9F\x98\x80"));        // U+1F600
    assert(utf8::valid("\xF4\x8F\xBF\xBF"));        // U+10FFFF
    assert(utf8::sequence_length("\xF0\x9F\x98\x80", 0) == 4);
}

static void test_invalid_inputs(){
    assert(utf8::find_invalid("ab\xFF") == 2);
    assert(utf8::find_invalid("\xC0\xAF") == 0);     // overlong '/'
    assert(utf8::find_invalid("\xE0\x80\xAF") == 0); // overlong
    assert(utf8::find_invalid("\xED\xA0\x80") == 0); // surrogate D800
    assert(utf8::find_invalid("\xF4\x90\x80\x80") == 0); // above U+10FFFF
    assert(utf8::find_invalid("x\xE2\x82") == 1);    // truncated at end
    assert(utf8::find_invalid("\x80") == 0);         // lone continuation
}

static void test_append(){
    std::string s;
    utf8::append(s, U'A');
    utf8::append(s, 0xE9);
    utf8::append(s, 0x20AC);
    utf8::append(s, 0x1F600);
    assert(s == "A\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80");
    assert(utf8::valid(s));
}

void run_utf8_tests(){
    std::cout << "[utf8] validation and encoding...\n";
    test_valid_inputs();
    test_invalid_inputs();
    test_append();
}
