#include <iostream>
#include <exception>
#include "test_env.hpp"
// Assert-style suites run first; GoogleTest suites compiled into the same binary
// are dispatched afterwards (we link GTest::gtest, not gtest_main).
#include <gtest/gtest.h>

void run_utf8_tests();
void run_lexer_tests();
void run_parser_tests();
void run_config_tests();
void run_diagnostics_json_tests();

int main(int argc, char** argv){
    try{
        run_utf8_tests();
        run_lexer_tests();
        run_parser_tests();
        run_config_tests();
        run_diagnostics_json_tests();
    }catch(const std::exception& e){ std::cerr << "[rson] exception: " << e.what() << "\n"; return 1; }
    std::cout << "[rson] assert suites passed" << std::endl;

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
