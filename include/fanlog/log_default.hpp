/**
 * @file log_default.hpp
 * @brief Process-wide default logger and free functions logging through it
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * The first logger built by logger::create() becomes the default. Before that
 * a fallback logger writes every level to stderr, each line prefixed with a
 * warning that logging happened before initialization.
 */
#pragma once

#include <memory>
#include <mutex>
#include <source_location>
#include <string_view>
#include <utility>

#include "logger.hpp"

namespace fanlog
{

inline constexpr std::string_view fallback_banner = "ERROR: Logging before fanlog init.\n";
inline constexpr int fallback_flags = flag_date | flag_microseconds | flag_short_file;

namespace detail
{

struct default_logger_slot
{
    std::shared_ptr<logger> instance;
    bool installed = false; ///< set once a real logger took the slot
};

inline default_logger_slot &default_slot()
{
    static default_logger_slot slot;
    return slot;
}

inline std::shared_ptr<logger> make_fallback_logger()
{
    level_writers writers;
    writers.fill(stderr_writer());

    level_prefixes prefixes;
    for (size_t i = 0; i < LOG_LEVEL_COUNT; ++i) { prefixes[i] = fmt::format("{}{}", fallback_banner, log_level_tags[i]); }

    logger_options options;
    options.flags    = fallback_flags;
    options.prefixes = std::move(prefixes);
    return std::make_shared<logger>("fallback", std::move(writers), std::vector<std::shared_ptr<log_writer>>{}, std::move(options));
}

/**
 * @brief Install @p candidate unless a real logger is already the default
 */
inline void offer_default_logger(std::shared_ptr<logger> candidate)
{
    std::shared_ptr<logger> previous;
    {
        std::lock_guard<std::mutex> lock(log_mutex());
        auto &slot = default_slot();
        if (slot.installed) return;

        previous       = std::exchange(slot.instance, std::move(candidate));
        slot.installed = true;
    }
    // previous is released here, outside the lock its destructor takes
}

} // namespace detail

/**
 * @brief Current default logger, creating the fallback on first use
 */
inline std::shared_ptr<logger> default_logger()
{
    {
        std::lock_guard<std::mutex> lock(detail::log_mutex());
        if (auto instance = detail::default_slot().instance) return instance;
    }

    auto fallback = detail::make_fallback_logger();

    std::lock_guard<std::mutex> lock(detail::log_mutex());
    auto &slot = detail::default_slot();
    if (!slot.instance) slot.instance = fallback;
    return slot.instance;
}

/**
 * @brief Replace the default logger unconditionally
 */
inline void install_default_logger(std::shared_ptr<logger> instance)
{
    std::shared_ptr<logger> previous;
    {
        std::lock_guard<std::mutex> lock(detail::log_mutex());
        auto &slot     = detail::default_slot();
        previous       = std::exchange(slot.instance, std::move(instance));
        slot.installed = slot.instance != nullptr;
    }
}

/**
 * @brief Forget the default logger so the next created logger takes its place
 */
inline void reset_default_logger() { install_default_logger(nullptr); }

inline void debug(std::string_view msg, std::source_location loc = std::source_location::current())
{
    default_logger()->debug(msg, loc);
}

inline void info(std::string_view msg, std::source_location loc = std::source_location::current())
{
    default_logger()->info(msg, loc);
}

inline void warning(std::string_view msg, std::source_location loc = std::source_location::current())
{
    default_logger()->warning(msg, loc);
}

inline void error(std::string_view msg, std::source_location loc = std::source_location::current())
{
    default_logger()->error(msg, loc);
}

inline void panic(std::string_view msg, std::source_location loc = std::source_location::current())
{
    default_logger()->panic(msg, loc);
}

inline void fatal(std::string_view msg, std::source_location loc = std::source_location::current())
{
    default_logger()->fatal(msg, loc);
}

template <typename... Args> void debugf(located_format_string<Args...> format, Args &&...args)
{
    default_logger()->debugf<Args...>(std::move(format), std::forward<Args>(args)...);
}

template <typename... Args> void infof(located_format_string<Args...> format, Args &&...args)
{
    default_logger()->infof<Args...>(std::move(format), std::forward<Args>(args)...);
}

template <typename... Args> void warningf(located_format_string<Args...> format, Args &&...args)
{
    default_logger()->warningf<Args...>(std::move(format), std::forward<Args>(args)...);
}

template <typename... Args> void errorf(located_format_string<Args...> format, Args &&...args)
{
    default_logger()->errorf<Args...>(std::move(format), std::forward<Args>(args)...);
}

template <typename... Args> void panicf(located_format_string<Args...> format, Args &&...args)
{
    default_logger()->panicf<Args...>(std::move(format), std::forward<Args>(args)...);
}

template <typename... Args> void fatalf(located_format_string<Args...> format, Args &&...args)
{
    default_logger()->fatalf<Args...>(std::move(format), std::forward<Args>(args)...);
}

inline void log(log_level level, std::string_view msg, std::source_location loc = std::source_location::current())
{
    default_logger()->log(level, msg, loc);
}

inline void set_level(log_level level) { default_logger()->set_level(level); }
inline void set_level_mask(level_mask mask) { default_logger()->set_level_mask(mask); }
inline log_level level() { return default_logger()->level(); }
inline void set_flags(int flags) { default_logger()->set_flags(flags); }
inline int flags() { return default_logger()->flags(); }

inline logger &with(const log_fields &fields) { return default_logger()->with(fields); }
inline void with_context(const log_fields &fields) { default_logger()->with_context(fields); }
inline void clear_context() { default_logger()->clear_context(); }

inline void close() { default_logger()->close(); }
inline logger_state state() { return default_logger()->state(); }

} // namespace fanlog
