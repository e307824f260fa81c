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

#include "exception.hpp"
#include "string.hpp"

#include <array>
#include <atomic>
#include <cstdlib>
#include <optional>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#ifndef KL_ENABLE_SPDLOG
    #define KL_ENABLE_SPDLOG 0
#endif

#if KL_ENABLE_SPDLOG
    #define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
    #include <spdlog/spdlog.h>
#endif

namespace kl {

enum class LogLevel { off, critical, error, warning, info, debug, trace };

#if !KL_ENABLE_SPDLOG
/// The level of the fallback logger, used when spdlog is not enabled.
inline std::atomic<LogLevel> g_log_level {LogLevel::info};
#endif

/**
 * Parses the name of a log level. Valid names are TRACE, DEBUG, INFO, WARN (or WARNING), ERROR, CRITICAL and OFF,
 * compared case-insensitively.
 * @param name The name to parse.
 * @return The level, or an empty optional if the name is not valid.
 */
inline std::optional<LogLevel> parse_log_level(const std::string_view name) {
    constexpr std::array<std::pair<std::string_view, LogLevel>, 8> k_levels {{
        {"TRACE", LogLevel::trace},
        {"DEBUG", LogLevel::debug},
        {"INFO", LogLevel::info},
        {"WARN", LogLevel::warning},
        {"WARNING", LogLevel::warning},
        {"ERROR", LogLevel::error},
        {"CRITICAL", LogLevel::critical},
        {"OFF", LogLevel::off},
    }};

    for (const auto& [level_name, level] : k_levels) {
        if (string_compare_case_insensitive(name, level_name)) {
            return level;
        }
    }
    return std::nullopt;
}

/**
 * Sets the level below which log messages are discarded.
 * @param level The new level.
 */
inline void set_log_level(const LogLevel level) {
#if KL_ENABLE_SPDLOG
    switch (level) {
        case LogLevel::off:
            spdlog::set_level(spdlog::level::off);
            break;
        case LogLevel::critical:
            spdlog::set_level(spdlog::level::critical);
            break;
        case LogLevel::error:
            spdlog::set_level(spdlog::level::err);
            break;
        case LogLevel::warning:
            spdlog::set_level(spdlog::level::warn);
            break;
        case LogLevel::info:
            spdlog::set_level(spdlog::level::info);
            break;
        case LogLevel::debug:
            spdlog::set_level(spdlog::level::debug);
            break;
        case LogLevel::trace:
            spdlog::set_level(spdlog::level::trace);
            break;
    }
#else
    g_log_level = level;
#endif
}

/**
 * Sets the log level from its name. See parse_log_level for the valid names. An invalid name sets the level to INFO.
 * @param name The name of the level.
 */
inline void set_log_level(const std::string_view name) {
    const auto level = parse_log_level(name);
    if (!level) {
        fmt::println(stderr, "Invalid log level: {}. Setting log level to info.", name);
    }
    set_log_level(level.value_or(LogLevel::info));
}

/**
 * Sets the log level from an environment variable, or to INFO when the variable is not set.
 * @param env_var The name of the environment variable.
 */
inline void set_log_level_from_env(const char* env_var = "KL_LOG_LEVEL") {
    const auto* value = std::getenv(env_var);
    set_log_level(value != nullptr ? std::string_view(value) : std::string_view("INFO"));
}

}  // namespace kl

#if KL_ENABLE_SPDLOG

    #define KL_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
    #define KL_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
    #define KL_INFO(...) SPDLOG_INFO(__VA_ARGS__)
    #define KL_WARNING(...) SPDLOG_WARN(__VA_ARGS__)
    #define KL_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)
    #define KL_CRITICAL(...) SPDLOG_CRITICAL(__VA_ARGS__)

#else

    // Messages go to stderr so they don't mix with the output of command line tools.
    #define KL_LOG_AT(level, tag, ...)                         \
        do {                                                   \
            if (kl::g_log_level.load() >= kl::LogLevel::level) { \
                fmt::println(stderr, "[" tag "] " __VA_ARGS__); \
            }                                                  \
        } while (false)

    #define KL_TRACE(...) KL_LOG_AT(trace, "T", __VA_ARGS__)
    #define KL_DEBUG(...) KL_LOG_AT(debug, "D", __VA_ARGS__)
    #define KL_INFO(...) KL_LOG_AT(info, "I", __VA_ARGS__)
    #define KL_WARNING(...) KL_LOG_AT(warning, "W", __VA_ARGS__)
    #define KL_ERROR(...) KL_LOG_AT(error, "E", __VA_ARGS__)
    #define KL_CRITICAL(...) KL_LOG_AT(critical, "C", __VA_ARGS__)

#endif

/**
 * Catch clauses for the outermost frame of a worker thread. Exceptions reaching this point are logged as critical.
 */
#define KL_CATCH_LOG_UNCAUGHT_EXCEPTIONS                             \
    catch (const kl::Exception& e) {                                 \
        KL_CRITICAL("Uncaught kl::Exception: {}", e.to_string());    \
    }                                                                \
    catch (const std::exception& e) {                                \
        KL_CRITICAL("Uncaught std::exception: {}", e.what());        \
    }
