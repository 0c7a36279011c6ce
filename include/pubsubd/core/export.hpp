/**
 * @file export.hpp
 * @brief Symbol visibility macros for the pubsubd_core library.
 *
 * This header provides the PUBSUBD_CORE_API macro for cross-platform
 * shared library symbol export/import.
 *
 * @copyright Copyright (c) 2024 PubSubD Contributors
 * @license MIT License
 */

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #if defined(PUBSUBD_CORE_BUILD)
        #define PUBSUBD_CORE_API __declspec(dllexport)
    #else
        #define PUBSUBD_CORE_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(PUBSUBD_CORE_BUILD)
        #define PUBSUBD_CORE_API __attribute__((visibility("default")))
    #else
        #define PUBSUBD_CORE_API
    #endif
#else
    #define PUBSUBD_CORE_API
#endif
