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

#include <cstdlib>
#include <iostream>

#include "exception.hpp"
#include "log.hpp"

/**
 * When FRAC_LOG_ON_ASSERT is defined as true (1), a log message will be emitted when an assertion is hit. Default is
 * on.
 */
#ifndef FRAC_LOG_ON_ASSERT
    #define FRAC_LOG_ON_ASSERT 1  // Enabled by default
#endif

/**
 * When FRAC_THROW_EXCEPTION_ON_ASSERT is defined as true (1), an exception will be thrown when an assertion is hit.
 * Default is off.
 */
#ifndef FRAC_THROW_EXCEPTION_ON_ASSERT
    #define FRAC_THROW_EXCEPTION_ON_ASSERT 0
#endif

/**
 * When FRAC_ABORT_ON_ASSERT is defined as true (1), program execution will abort when an assertion is hit. Default is
 * off.
 */
#ifndef FRAC_ABORT_ON_ASSERT
    #define FRAC_ABORT_ON_ASSERT 0
#endif

/**
 * Logs a message if FRAC_LOG_ON_ASSERT is set to true.
 * @param msg The message to log.
 */
#define FRAC_LOG_IF_ENABLED(msg) \
    if (FRAC_LOG_ON_ASSERT) {    \
        FRAC_CRITICAL(msg);      \
    }

/**
 * Throws an exception if FRAC_THROW_EXCEPTION_ON_ASSERT is set to true.
 * @param msg The message of the exception.
 */
#define FRAC_THROW_EXCEPTION_IF_ENABLED(msg) \
    if (FRAC_THROW_EXCEPTION_ON_ASSERT) {    \
        FRAC_THROW_EXCEPTION(msg);           \
    }

/**
 * Aborts program execution if FRAC_ABORT_ON_ASSERT is set to true.
 * @param msg The message to write to stderr before aborting.
 */
#define FRAC_ABORT_IF_ENABLED(msg)                                 \
    if (FRAC_ABORT_ON_ASSERT) {                                    \
        std::cerr << "Abort on assertion: " << (msg) << std::endl; \
        std::abort();                                              \
    }

/**
 * Assert condition to be true, otherwise:
 *  - Logs if enabled
 *  - Throws if enabled
 *  - Aborts if enabled
 * @param condition The condition to test.
 * @param message The message for logging, throwing and/or aborting.
 */
#define FRAC_ASSERT(condition, message)                                    \
    do {                                                                   \
        if (!(condition)) {                                                \
            FRAC_LOG_IF_ENABLED("Assertion failure: " message)             \
            FRAC_THROW_EXCEPTION_IF_ENABLED("Assertion failure: " message) \
            FRAC_ABORT_IF_ENABLED(message)                                 \
        }                                                                  \
    } while (false)

/**
 * Assert condition to be true, otherwise:
 *  - Logs if enabled
 *  - Throws if enabled
 *  - Aborts if enabled
 *  - Returns given `return_value` if `condition` is false
 * @param condition The condition to test.
 * @param message The message for logging, throwing and/or aborting.
 * @param return_value The value to return.
 */
#define FRAC_ASSERT_RETURN_WITH(condition, message, return_value)          \
    do {                                                                   \
        if (!(condition)) {                                                \
            FRAC_LOG_IF_ENABLED("Assertion failure: " message)             \
            FRAC_THROW_EXCEPTION_IF_ENABLED("Assertion failure: " message) \
            FRAC_ABORT_IF_ENABLED(message)                                 \
            return return_value;                                           \
        }                                                                  \
    } while (false)

/**
 * Asserts with false, entering the FRAC_ASSERT procedure as a quick way to assert that a branch is invalid.
 * @param message The message to log, throw, abort with.
 */
#define FRAC_ASSERT_FALSE(message) FRAC_ASSERT(false, message)
