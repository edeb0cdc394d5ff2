/**
 * @file log_types.hpp
 * @brief Core type definitions and constants for the logging system
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cstdint>
#include <cstddef>
#include <cctype>
#include <array>
#include <string>
#include <string_view>
#include <algorithm>
#include <source_location>
#include <type_traits>

#include "fmt_config.hpp" // IWYU pragma: keep

namespace fanlog
{

/**
 * @brief Concept for types that can be logged
 * @tparam T The type to check
 */
template <typename T>
concept Loggable = fmt::is_formattable<std::remove_cvref_t<T>>::value;

/**
 * @brief Enumeration of available log levels, most severe first
 *
 * A lower numeric value is a more severe level. A gate configured with a
 * threshold lets through every level whose value is <= the threshold.
 */
enum class log_level : int8_t
{
    off     = -1, ///< Gate setting only: nothing is emitted
    fatal   = 0,  ///< Written, then the process terminates
    panic   = 1,  ///< Written, then the panic hook fires
    error   = 2,  ///< Error messages
    warning = 3,  ///< Warning messages
    info    = 4,  ///< General information
    debug   = 5,  ///< Debugging information
};

inline constexpr size_t LOG_LEVEL_COUNT = 6;

inline constexpr log_level level_default = log_level::info;

/**
 * @brief Array index for a real (non-off) level
 */
constexpr size_t level_index(log_level level) noexcept { return static_cast<size_t>(level); }

// Output flags. These decorate the line header written by each channel and
// tell the JSON formatter which header fields to compute.
inline constexpr int flag_date         = 1 << 0; ///< the date in the local time zone: 2009/01/23
inline constexpr int flag_time         = 1 << 1; ///< the time in the local time zone: 01:23:23
inline constexpr int flag_microseconds = 1 << 2; ///< microsecond resolution: 01:23:23.123123, assumes flag_time
inline constexpr int flag_long_file    = 1 << 3; ///< full file name and line number: /a/b/c/d.cpp:23
inline constexpr int flag_short_file   = 1 << 4; ///< final file name element and line number: d.cpp:23
inline constexpr int flag_utc          = 1 << 5; ///< with date or time, use UTC rather than local time
inline constexpr int flag_msg_prefix   = 1 << 6; ///< move the prefix from the start of the line to before the message
inline constexpr int flag_std          = flag_date | flag_time;
inline constexpr int flag_disable      = 0;

// Level tags, indexed by level_index(). Colon aligned to a constant width.
inline constexpr std::array<std::string_view, LOG_LEVEL_COUNT> log_level_tags = {
    "FATAL: ",
    "PANIC: ",
    "ERROR: ",
    "WARN : ",
    "INFO : ",
    "DEBUG: ",
};

// Level names used in structured output
inline constexpr std::array<std::string_view, LOG_LEVEL_COUNT> log_level_names = {
    "fatal",
    "panic",
    "error",
    "warning",
    "info",
    "debug",
};

inline constexpr std::array<std::string_view, LOG_LEVEL_COUNT> log_level_colors = {
    "\033[1;31m", // fatal
    "\033[35m",   // panic
    "\033[31m",   // error
    "\033[33m",   // warning
    "\033[36m",   // info
    "\033[37m",   // debug
};

inline constexpr std::string_view log_color_reset = "\033[0m";

/**
 * @brief Per-level line prefixes, indexed by level_index()
 */
using level_prefixes = std::array<std::string, LOG_LEVEL_COUNT>;

inline level_prefixes default_level_prefixes()
{
    level_prefixes prefixes;
    for (size_t i = 0; i < LOG_LEVEL_COUNT; ++i) { prefixes[i] = std::string(log_level_tags[i]); }
    return prefixes;
}

/**
 * @brief Convert string to log_level
 * @param str Level name (case insensitive)
 * @param fallback Value returned for unrecognized names
 * @return Corresponding log_level, or @p fallback if invalid
 *
 * Recognized values: "fatal", "panic", "error", "warn", "warning", "info", "debug", "off", "none"
 */
inline log_level log_level_from_string(std::string_view str, log_level fallback = log_level::off)
{
    std::string lower(str);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return static_cast<char>(::tolower(c)); });

    if (lower == "fatal") return log_level::fatal;
    if (lower == "panic") return log_level::panic;
    if (lower == "error") return log_level::error;
    if (lower == "warn" || lower == "warning") return log_level::warning;
    if (lower == "info") return log_level::info;
    if (lower == "debug") return log_level::debug;
    if (lower == "off" || lower == "none" || lower == "nolog") return log_level::off;

    return fallback;
}

/**
 * @brief Convert log_level to string
 * @param level The log level
 * @return String representation of the level
 */
inline const char *string_from_log_level(log_level level)
{
    switch (level)
    {
    case log_level::fatal: return "fatal";
    case log_level::panic: return "panic";
    case log_level::error: return "error";
    case log_level::warning: return "warning";
    case log_level::info: return "info";
    case log_level::debug: return "debug";
    case log_level::off: return "off";
    default: return "unknown";
    }
}

/**
 * @brief Source location of the application call that produced a line
 */
struct call_site
{
    std::string_view file;
    uint32_t line = 0;

    static call_site from(const std::source_location &loc) noexcept
    {
        return call_site{loc.file_name() ? std::string_view(loc.file_name()) : std::string_view(), loc.line()};
    }

    /**
     * @brief File name with the "???" placeholder when the location is unknown
     */
    std::string_view file_or_placeholder() const noexcept { return file.empty() ? std::string_view("???") : file; }

    uint32_t line_or_zero() const noexcept { return file.empty() ? 0 : line; }
};

/**
 * @brief fmt format string that also records where it was written
 *
 * Lets the printf-like logger methods keep a variadic argument list and
 * still capture the caller's location.
 */
template <typename... Args> struct basic_located_format
{
    fmt::format_string<Args...> format;
    std::source_location location;

    template <typename S>
        requires std::is_convertible_v<const S &, std::string_view>
    consteval basic_located_format(const S &str, std::source_location loc = std::source_location::current())
    : format(str), location(loc)
    {
    }
};

template <typename... Args> using located_format_string = basic_located_format<std::type_identity_t<Args>...>;

} // namespace fanlog
