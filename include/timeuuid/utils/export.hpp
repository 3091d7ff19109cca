/**
 * @file export.hpp
 * @brief Symbol visibility macros for the timeuuid_utils shared library.
 *
 * @copyright Copyright (c) 2024 timeuuid Contributors
 * @license MIT License
 */

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #if defined(TIMEUUID_UTILS_BUILD)
        #define TIMEUUID_UTILS_API __declspec(dllexport)
    #else
        #define TIMEUUID_UTILS_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(TIMEUUID_UTILS_BUILD)
        #define TIMEUUID_UTILS_API __attribute__((visibility("default")))
    #else
        #define TIMEUUID_UTILS_API
    #endif
#else
    #define TIMEUUID_UTILS_API
#endif
