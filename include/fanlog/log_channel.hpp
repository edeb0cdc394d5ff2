/**
 * @file log_channel.hpp
 * @brief Per-level output channel rendering the classic log line header
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cerrno>
#include <chrono>
#include <ctime>
#include <iterator>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

#include "log_types.hpp"
#include "log_writers.hpp"

namespace fanlog
{

namespace detail
{

/**
 * @brief Lock serializing every channel write and logger state change in the process
 */
inline std::mutex &log_mutex()
{
    static std::mutex mutex;
    return mutex;
}

inline std::tm broken_down_time(std::chrono::system_clock::time_point tp, bool utc)
{
    std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#ifdef _WIN32
    if (utc) gmtime_s(&tm, &seconds);
    else localtime_s(&tm, &seconds);
#else
    if (utc) gmtime_r(&seconds, &tm);
    else localtime_r(&seconds, &tm);
#endif
    return tm;
}

/**
 * @brief Append the date and time parts selected by @p flags
 *
 * Each part is followed by a single space: "2009/01/23 01:23:23.123123 ".
 */
inline void append_time(std::string &out, int flags, std::chrono::system_clock::time_point tp)
{
    if ((flags & (flag_date | flag_time | flag_microseconds)) == 0) return;

    auto tm = broken_down_time(tp, (flags & flag_utc) != 0);
    if (flags & flag_date) { fmt::format_to(std::back_inserter(out), "{:04}/{:02}/{:02} ", tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday); }
    if (flags & (flag_time | flag_microseconds))
    {
        fmt::format_to(std::back_inserter(out), "{:02}:{:02}:{:02}", tm.tm_hour, tm.tm_min, tm.tm_sec);
        if (flags & flag_microseconds)
        {
            auto since_epoch = tp.time_since_epoch();
            auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
                              since_epoch - std::chrono::duration_cast<std::chrono::seconds>(since_epoch))
                              .count();
            if (micros < 0) micros += 1000000;
            fmt::format_to(std::back_inserter(out), ".{:06}", micros);
        }
        out.push_back(' ');
    }
}

/**
 * @brief File reference "path:line" selected by @p flags, basename only with flag_short_file
 */
inline std::string file_reference(int flags, const call_site &site)
{
    std::string_view file = site.file_or_placeholder();
    if (flags & flag_short_file)
    {
        auto slash = file.find_last_of("/\\");
        if (slash != std::string_view::npos && slash > 0) file.remove_prefix(slash + 1);
    }
    return fmt::format("{}:{}", file, site.line_or_zero());
}

} // namespace detail

/**
 * @brief Destination, prefix and header flags for one level
 *
 * Line layout: prefix, date, time, "file:line: ", text. With flag_msg_prefix
 * the prefix moves right in front of the text. A newline is appended unless
 * the text already ends with one.
 */
class log_channel
{
  public:
    log_channel() = default;

    log_channel(std::shared_ptr<log_writer> writer, std::string prefix, int flags)
    : writer_(std::move(writer)), prefix_(std::move(prefix)), flags_(flags)
    {
    }

    std::string format_line(std::chrono::system_clock::time_point now, const call_site &site, std::string_view text) const
    {
        std::string line;
        line.reserve(prefix_.size() + text.size() + 48);

        if ((flags_ & flag_msg_prefix) == 0) line.append(prefix_);
        detail::append_time(line, flags_, now);
        if (flags_ & (flag_short_file | flag_long_file))
        {
            line.append(detail::file_reference(flags_, site));
            line.append(": ");
        }
        if (flags_ & flag_msg_prefix) line.append(prefix_);

        line.append(text);
        if (text.empty() || text.back() != '\n') line.push_back('\n');
        return line;
    }

    /**
     * @brief Render the line and write it under the process-wide log lock
     * @return Result of the writer, -1 on failure
     */
    ssize_t output(const call_site &site, std::string_view text) const
    {
        auto now = std::chrono::system_clock::now();
        std::lock_guard<std::mutex> lock(detail::log_mutex());
        if (!writer_)
        {
            errno = EBADF;
            return -1;
        }
        auto line = format_line(now, site, text);
        return writer_->write(line.data(), line.size());
    }

    void set_flags(int flags) noexcept { flags_ = flags; }
    int flags() const noexcept { return flags_; }

    void set_prefix(std::string prefix) { prefix_ = std::move(prefix); }
    const std::string &prefix() const noexcept { return prefix_; }

    const std::shared_ptr<log_writer> &writer() const noexcept { return writer_; }

  private:
    std::shared_ptr<log_writer> writer_;
    std::string prefix_;
    int flags_ = flag_std;
};

} // namespace fanlog
