/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#pragma once

// Note: these constants are treated as tri-state variables, so they can be 0, 1, or undefined.

// Windows
#if defined(WIN32) || defined(_WIN32) || defined(__WIN32__) || defined(__NT__)
    #define FRAC_WINDOWS 1
#else
    #define FRAC_WINDOWS 0
#endif

// Apple
#if defined(__APPLE__)
    #define FRAC_APPLE 1
    #define FRAC_POSIX 1  // POSIX-certified.
    #include <TargetConditionals.h>
    #if TARGET_OS_MAC && !TARGET_OS_IPHONE
        #define FRAC_MACOS 1
    #else
        #define FRAC_MACOS 0
    #endif
#else
    #define FRAC_APPLE 0
    #define FRAC_MACOS 0
#endif

// Linux
#if defined(__linux__)
    #define FRAC_LINUX 1
    #define FRAC_POSIX 1  // Most distributions are mostly POSIX compliant.
#else
    #define FRAC_LINUX 0
#endif

// Posix
#ifndef FRAC_POSIX
    #if defined(_POSIX_VERSION)
        #define FRAC_POSIX 1
    #else
        #define FRAC_POSIX 0
    #endif
#endif

// Name of the enclosing function, used for exceptions and log messages.
#ifndef FRAC_FUNCTION
    #if defined(_MSC_VER)
        #define FRAC_FUNCTION __FUNCSIG__
    #else
        #define FRAC_FUNCTION __PRETTY_FUNCTION__
    #endif
#endif

#if FRAC_WINDOWS
    #ifndef NOMINMAX
        #error "Please define NOMINMAX as compile constant in your build system."
    #endif
#endif
