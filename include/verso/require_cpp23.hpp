#pragma once

/**
 * @file require_cpp23.hpp
 * @brief C++23 feature-test checks for verso
 *
 * Include early in a translation unit (main.cpp does) to get a clear error
 * when the toolchain is insufficient.
 *
 * Required compiler versions:
 *   - GCC 14.0+
 *   - Clang 19.0+
 */

#include <expected>
#include <version>

#if !defined(__cplusplus) || __cplusplus < 202'302L
    #error "verso requires C++23 or later (__cplusplus >= 202302L)."
#endif

// std::println for console output
#if !defined(__cpp_lib_print) || __cpp_lib_print < 202'207L
    #error "verso requires std::print/std::println (__cpp_lib_print >= 202207L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// std::expected carries every Result
#if !defined(__cpp_lib_expected) || __cpp_lib_expected < 202'202L
    #error "verso requires std::expected (__cpp_lib_expected >= 202202L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// std::format with chrono support formats CommitDate
#if !defined(__cpp_lib_format) || __cpp_lib_format < 202'110L
    #error "verso requires std::format (__cpp_lib_format >= 202110L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

#if !defined(__cpp_lib_ranges) || __cpp_lib_ranges < 202'110L
    #error "verso requires std::ranges (__cpp_lib_ranges >= 202110L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

#define VERSO_CPP23_FEATURES_VERIFIED 1
