#pragma once

/**
 * @file require_cpp23.hpp
 * @brief C++23 feature-test macros for OpenTreasury
 *
 * Verifies at compile time that the standard library provides the C++23
 * features OpenTreasury relies on. Included first by the CLI entry point.
 *
 * Required compiler versions:
 *   - GCC 14.0+
 *   - Clang 19.0+
 */

#include <expected>
#include <version>

// =============================================================================
// C++23 Language Standard Check
// =============================================================================

#if !defined(__cplusplus) || __cplusplus < 202'302L
    #error "OpenTreasury requires C++23 or later (__cplusplus >= 202302L)."
#endif

// =============================================================================
// std::print / std::println (__cpp_lib_print)
// =============================================================================
// Required for: CLI output
// Minimum value: 202207L

#if !defined(__cpp_lib_print) || __cpp_lib_print < 202'207L
    #error "OpenTreasury requires std::print/std::println (__cpp_lib_print >= 202207L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// =============================================================================
// std::expected (__cpp_lib_expected)
// =============================================================================
// Required for: Result / VoidResult
// Minimum value: 202202L

#if !defined(__cpp_lib_expected) || __cpp_lib_expected < 202'202L
    #error "OpenTreasury requires std::expected (__cpp_lib_expected >= 202202L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// =============================================================================
// std::format (__cpp_lib_format)
// =============================================================================
// Required for: String formatting (used extensively with std::print)
// Minimum value: 202110L

#if !defined(__cpp_lib_format) || __cpp_lib_format < 202'110L
    #error "OpenTreasury requires std::format (__cpp_lib_format >= 202110L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// =============================================================================
// std::ranges (__cpp_lib_ranges)
// =============================================================================
// Required for: std::ranges::sort / find_if over entries and instructions
// Minimum value: 202110L

#if !defined(__cpp_lib_ranges) || __cpp_lib_ranges < 202'110L
    #error "OpenTreasury requires std::ranges (__cpp_lib_ranges >= 202110L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

#define OPENTREASURY_CPP23_FEATURES_VERIFIED 1
