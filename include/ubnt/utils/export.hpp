/**
 * @file export.hpp
 * @brief Symbol visibility macros for ubnt_utils shared library.
 *
 * @copyright Copyright (c) 2024 UBNT Discovery Contributors
 * @license MIT License
 */

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #if defined(UBNT_UTILS_BUILD)
        #define UBNT_UTILS_API __declspec(dllexport)
    #else
        #define UBNT_UTILS_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(UBNT_UTILS_BUILD)
        #define UBNT_UTILS_API __attribute__((visibility("default")))
    #else
        #define UBNT_UTILS_API
    #endif
#else
    #define UBNT_UTILS_API
#endif
