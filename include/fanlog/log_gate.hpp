/**
 * @file log_gate.hpp
 * @brief Severity gate deciding which levels are emitted
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cstdint>
#include <string_view>

#include "log_types.hpp"

namespace fanlog
{

/**
 * @brief Bitmask with one bit per level
 */
using level_mask = uint8_t;

constexpr level_mask level_bit(log_level level) noexcept
{
    return level == log_level::off ? level_mask{0} : static_cast<level_mask>(1u << level_index(level));
}

inline constexpr level_mask level_mask_none = 0;
inline constexpr level_mask level_mask_default = level_bit(log_level::fatal) | level_bit(log_level::panic) |
                                                 level_bit(log_level::error) | level_bit(log_level::warning) |
                                                 level_bit(log_level::info);
inline constexpr level_mask level_mask_all = level_mask_default | level_bit(log_level::debug);

/**
 * @brief Threshold rule: enabled when the threshold is at least as verbose as the level
 */
constexpr bool level_enabled(log_level threshold, log_level level) noexcept
{
    return level != log_level::off && threshold >= level;
}

/**
 * @brief Mask rule: enabled when the level's bit is set
 */
constexpr bool level_enabled(level_mask mask, log_level level) noexcept { return (mask & level_bit(level)) != 0; }

/**
 * @brief Parse a level mask from "error|fatal|panic" style text
 * @param str Level names separated by '|' or ','; "all" and "none" are accepted
 * @param out Receives the mask on success
 * @return false if any name is not a level
 */
inline bool level_mask_from_string(std::string_view str, level_mask &out)
{
    level_mask mask = level_mask_none;
    while (!str.empty())
    {
        auto sep = str.find_first_of("|,");
        auto name = str.substr(0, sep);
        str = sep == std::string_view::npos ? std::string_view() : str.substr(sep + 1);

        while (!name.empty() && name.front() == ' ') name.remove_prefix(1);
        while (!name.empty() && name.back() == ' ') name.remove_suffix(1);
        if (name.empty()) continue;

        if (name == "all")
        {
            mask |= level_mask_all;
            continue;
        }
        if (name == "none") continue;

        auto level = log_level_from_string(name, log_level::off);
        if (level == log_level::off) return false;
        mask |= level_bit(level);
    }
    out = mask;
    return true;
}

/**
 * @brief Severity gate with a threshold mode and a bitmask mode
 *
 * Threshold mode is the default. Calling set_mask() switches to mask mode,
 * set_threshold() switches back.
 */
class severity_gate
{
  public:
    constexpr severity_gate() noexcept = default;
    constexpr explicit severity_gate(log_level threshold) noexcept : threshold_(threshold) {}
    constexpr explicit severity_gate(level_mask mask) noexcept : mask_(mask), uses_mask_(true) {}

    constexpr void set_threshold(log_level threshold) noexcept
    {
        threshold_ = threshold;
        uses_mask_ = false;
    }

    constexpr void set_mask(level_mask mask) noexcept
    {
        mask_ = mask;
        uses_mask_ = true;
    }

    constexpr log_level threshold() const noexcept { return threshold_; }
    constexpr level_mask mask() const noexcept { return mask_; }
    constexpr bool uses_mask() const noexcept { return uses_mask_; }

    constexpr bool enabled(log_level level) const noexcept
    {
        return uses_mask_ ? level_enabled(mask_, level) : level_enabled(threshold_, level);
    }

  private:
    log_level threshold_ = level_default;
    level_mask mask_ = level_mask_default;
    bool uses_mask_ = false;
};

} // namespace fanlog
