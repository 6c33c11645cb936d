#include <iostream>
#include <exception>
#include "test_env.hpp"
// Links GTest::gtest (not gtest_main); the manual harness runs first, then any TEST cases in this binary.
#include <gtest/gtest.h>

void run_type_tests();
void run_ownership_tests();
void run_type_checker_tests();
void run_diagnostics_tests();
void run_env_tests();

int main(int argc, char** argv){
    try{
        run_type_tests();
        run_ownership_tests();
        run_type_checker_tests();
        run_diagnostics_tests();
        run_env_tests();
    }catch(const std::exception& e){ std::cerr << "[core] exception: " << e.what() << "\n"; return 1; }
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
