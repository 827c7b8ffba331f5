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

#include "platform.hpp"
#include "env.hpp"
#include "string.hpp"

#include <atomic>
#include <cstdio>

#ifndef FRAC_ENABLE_SPDLOG
    #define FRAC_ENABLE_SPDLOG 0
#endif

#if FRAC_ENABLE_SPDLOG

    #define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE

    #if FRAC_MACOS
        #define SPDLOG_FUNCTION __PRETTY_FUNCTION__
    #endif

    #include <spdlog/spdlog.h>

    #ifndef FRAC_TRACE
        #define FRAC_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
    #endif

    #ifndef FRAC_DEBUG
        #define FRAC_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
    #endif

    #ifndef FRAC_CRITICAL
        #define FRAC_CRITICAL(...) SPDLOG_CRITICAL(__VA_ARGS__)
    #endif

    #ifndef FRAC_ERROR
        #define FRAC_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)
    #endif

    #ifndef FRAC_WARNING
        #define FRAC_WARNING(...) SPDLOG_WARN(__VA_ARGS__)
    #endif

    #ifndef FRAC_INFO
        #define FRAC_INFO(...) SPDLOG_INFO(__VA_ARGS__)
    #endif

#else

    #include <fmt/format.h>

namespace frac {

enum class LogLevel { off, critical, error, warning, info, debug, trace };

inline std::atomic<LogLevel> log_level {LogLevel::info};

}  // namespace frac

    #define FRAC_LOG_WITH_LEVEL(level, prefix, ...)                                    \
        do {                                                                           \
            if (frac::log_level.load() >= (level)) {                                   \
                fmt::print(stdout, "[" prefix "] {}\n", fmt::format(__VA_ARGS__));     \
            }                                                                          \
        } while (false)

    #ifndef FRAC_TRACE
        #define FRAC_TRACE(...) FRAC_LOG_WITH_LEVEL(frac::LogLevel::trace, "T", __VA_ARGS__)
    #endif

    #ifndef FRAC_DEBUG
        #define FRAC_DEBUG(...) FRAC_LOG_WITH_LEVEL(frac::LogLevel::debug, "D", __VA_ARGS__)
    #endif

    #ifndef FRAC_CRITICAL
        #define FRAC_CRITICAL(...) FRAC_LOG_WITH_LEVEL(frac::LogLevel::critical, "C", __VA_ARGS__)
    #endif

    #ifndef FRAC_ERROR
        #define FRAC_ERROR(...) FRAC_LOG_WITH_LEVEL(frac::LogLevel::error, "E", __VA_ARGS__)
    #endif

    #ifndef FRAC_WARNING
        #define FRAC_WARNING(...) FRAC_LOG_WITH_LEVEL(frac::LogLevel::warning, "W", __VA_ARGS__)
    #endif

    #ifndef FRAC_INFO
        #define FRAC_INFO(...) FRAC_LOG_WITH_LEVEL(frac::LogLevel::info, "I", __VA_ARGS__)
    #endif

#endif

namespace frac {

/**
 * Sets the log level for the application based on the given string.
 * The following are valid values:
 *  - TRACE
 *  - DEBUG
 *  - INFO (default)
 *  - WARN
 *  - ERROR
 *  - CRITICAL
 *  - OFF
 * @param level The log level as string, case-insensitive.
 */
inline void set_log_level(const char* level) {
#if FRAC_ENABLE_SPDLOG
    if (string_compare_case_insensitive(level, "TRACE")) {
        spdlog::set_level(spdlog::level::trace);
    } else if (string_compare_case_insensitive(level, "DEBUG")) {
        spdlog::set_level(spdlog::level::debug);
    } else if (string_compare_case_insensitive(level, "INFO")) {
        spdlog::set_level(spdlog::level::info);
    } else if (string_compare_case_insensitive(level, "WARN")) {
        spdlog::set_level(spdlog::level::warn);
    } else if (string_compare_case_insensitive(level, "ERROR")) {
        spdlog::set_level(spdlog::level::err);
    } else if (string_compare_case_insensitive(level, "CRITICAL")) {
        spdlog::set_level(spdlog::level::critical);
    } else if (string_compare_case_insensitive(level, "OFF")) {
        spdlog::set_level(spdlog::level::off);
    } else {
        spdlog::set_level(spdlog::level::info);
        SPDLOG_WARN("Invalid log level: {}. Setting log level to info.", level);
    }
#else
    if (string_compare_case_insensitive(level, "TRACE")) {
        log_level = LogLevel::trace;
    } else if (string_compare_case_insensitive(level, "DEBUG")) {
        log_level = LogLevel::debug;
    } else if (string_compare_case_insensitive(level, "INFO")) {
        log_level = LogLevel::info;
    } else if (string_compare_case_insensitive(level, "WARN")) {
        log_level = LogLevel::warning;
    } else if (string_compare_case_insensitive(level, "ERROR")) {
        log_level = LogLevel::error;
    } else if (string_compare_case_insensitive(level, "CRITICAL")) {
        log_level = LogLevel::critical;
    } else if (string_compare_case_insensitive(level, "OFF")) {
        log_level = LogLevel::off;
    } else {
        fmt::print("Invalid log level: {}. Setting log level to info.\n", level);
        log_level = LogLevel::info;
    }
#endif
}

/**
 * Tries to find given environment variable and set the log level accordingly. See set_log_level() for the valid
 * values. If the variable is not set, or holds an invalid value, the log level will be set to INFO.
 * @param env_var The environment variable to read the log level from.
 */
inline void set_log_level_from_env(const char* env_var = "FRAC_LOG_LEVEL") {
    if (const auto env_value = get_env(env_var)) {
        set_log_level(env_value->c_str());
    } else {
        set_log_level("INFO");
    }
}

}  // namespace frac
