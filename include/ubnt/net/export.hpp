/**
 * @file export.hpp
 * @brief Symbol visibility macros for ubnt_net shared library.
 *
 * @copyright Copyright (c) 2024 UBNT Discovery Contributors
 * @license MIT License
 */

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #if defined(UBNT_NET_BUILD)
        #define UBNT_NET_API __declspec(dllexport)
    #else
        #define UBNT_NET_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(UBNT_NET_BUILD)
        #define UBNT_NET_API __attribute__((visibility("default")))
    #else
        #define UBNT_NET_API
    #endif
#else
    #define UBNT_NET_API
#endif
