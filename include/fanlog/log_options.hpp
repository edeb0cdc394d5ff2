/**
 * @file log_options.hpp
 * @brief Logger configuration and its textual form
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "log_types.hpp"
#include "log_gate.hpp"
#include "log_formatters.hpp"
#include "log_syslog.hpp"

namespace fanlog
{

/**
 * @brief Everything a logger is constructed with besides its destinations
 *
 * An empty on_fatal terminates the process with std::exit(). An empty
 * on_panic throws panic_error. A set mask selects the bitmask gate instead of
 * the level threshold. Prefixes replace the default level tags unless the
 * formatter supplies its own. An empty system_log_opener uses
 * open_system_log().
 */
struct logger_options
{
    log_formatter formatter = plain_formatter{};
    log_level level         = level_default;
    std::optional<level_mask> mask;
    int flags = flag_std;
    std::optional<level_prefixes> prefixes;
    std::function<void(int)> on_fatal;
    std::function<void(std::string_view)> on_panic;
    std::function<system_log_writers(const std::string &)> system_log_opener;
};

/**
 * @brief Parse output flags from "date|time|microseconds|shortfile|utc" style text
 * @param str Flag names separated by '|'
 * @param out Receives the flags on success
 * @return false if any name is not a flag
 *
 * Recognized names: date, time, microseconds (micro), longfile, shortfile,
 * utc, msgprefix, std, disable (none).
 */
inline bool output_flags_from_string(std::string_view str, int &out)
{
    int flags = flag_disable;
    while (!str.empty())
    {
        auto sep  = str.find_first_of("|+");
        auto name = std::string(str.substr(0, sep));
        str       = sep == std::string_view::npos ? std::string_view() : str.substr(sep + 1);

        name.erase(std::remove_if(name.begin(), name.end(), ::isspace), name.end());
        std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return static_cast<char>(::tolower(c)); });
        if (name.empty()) continue;

        if (name == "date") flags |= flag_date;
        else if (name == "time") flags |= flag_time;
        else if (name == "microseconds" || name == "micro") flags |= flag_microseconds;
        else if (name == "longfile") flags |= flag_long_file;
        else if (name == "shortfile") flags |= flag_short_file;
        else if (name == "utc") flags |= flag_utc;
        else if (name == "msgprefix") flags |= flag_msg_prefix;
        else if (name == "std") flags |= flag_std;
        else if (name == "disable" || name == "none") flags |= flag_disable;
        else return false;
    }
    out = flags;
    return true;
}

/**
 * @brief Apply a configuration string to @p options
 * @param options Options to update
 * @param config Configuration string
 * @return true if the whole string was valid, false otherwise
 *
 * Format: "key=value,key=value". A part without '=' is taken as a level.
 * Keys:
 * - "level=debug" - threshold gate
 * - "mask=error|fatal" - bitmask gate
 * - "flags=std|shortfile" - output flags
 * - "format=plain", "format=json", "format=json-pretty", "format=color"
 *
 * Nothing is applied when any part is invalid.
 */
inline bool configure_from_string(logger_options &options, const char *config)
{
    if (!config) return false;

    std::string config_str(config);
    if (config_str.empty()) return false;

    // Remove whitespace
    config_str.erase(std::remove_if(config_str.begin(), config_str.end(), ::isspace), config_str.end());
    std::transform(config_str.begin(), config_str.end(), config_str.begin(),
                   [](unsigned char c) { return static_cast<char>(::tolower(c)); });

    logger_options result = options;

    // Split by comma
    size_t pos = 0;
    while (pos < config_str.length())
    {
        size_t comma_pos = config_str.find(',', pos);
        if (comma_pos == std::string::npos) comma_pos = config_str.length();

        std::string part = config_str.substr(pos, comma_pos - pos);
        pos              = comma_pos + 1;

        if (part.empty()) continue;

        size_t eq_pos   = part.find('=');
        std::string key = eq_pos == std::string::npos ? std::string("level") : part.substr(0, eq_pos);
        std::string value = eq_pos == std::string::npos ? part : part.substr(eq_pos + 1);

        if (key.empty() || value.empty()) return false;

        if (key == "level")
        {
            log_level level = log_level_from_string(value, log_level::off);
            if (level == log_level::off && value != "off" && value != "none" && value != "nolog")
            {
                return false; // Invalid level
            }
            result.level = level;
            result.mask.reset();
        }
        else if (key == "mask")
        {
            level_mask mask;
            if (!level_mask_from_string(value, mask)) return false;
            result.mask = mask;
        }
        else if (key == "flags")
        {
            int flags;
            if (!output_flags_from_string(value, flags)) return false;
            result.flags = flags;
        }
        else if (key == "format")
        {
            if (value == "plain" || value == "std") result.formatter = plain_formatter{};
            else if (value == "json") result.formatter = json_formatter{};
            else if (value == "json-pretty") result.formatter = json_formatter{.pretty_print = true};
            else if (value == "color") result.formatter = color_formatter{};
            else return false;
        }
        else { return false; }
    }

    options = std::move(result);
    return true;
}

/**
 * @brief Apply the configuration string stored in environment variable @p name
 * @return false if the variable is unset or its value is invalid
 */
inline bool configure_from_env(logger_options &options, const char *name = "FANLOG_CONFIG")
{
    return configure_from_string(options, std::getenv(name));
}

} // namespace fanlog
