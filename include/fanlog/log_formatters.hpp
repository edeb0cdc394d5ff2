/**
 * @file log_formatters.hpp
 * @brief Log message formatting implementations
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <chrono>
#include <concepts>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <tao/json/events/to_stream.hpp>
#include <tao/json/events/to_pretty_stream.hpp>

#include "log_types.hpp"
#include "log_fields.hpp"
#include "log_channel.hpp"

namespace fanlog
{

/**
 * @brief Requirements for a formatter usable by the logger
 *
 * output() turns one call into the text handed to the level channel.
 * override_flags() and override_prefixes() let a formatter take over the
 * channel header, for output formats that carry time and level themselves.
 */
template <typename T>
concept LogFormatter = requires(const T &f, int flags, log_level level, const log_fields &fields, std::string_view msg,
                                const call_site &site) {
    { f.output(flags, level, fields, msg, site) } -> std::convertible_to<std::string>;
    { f.override_flags() } -> std::convertible_to<std::optional<int>>;
    { f.override_prefixes() } -> std::convertible_to<std::optional<level_prefixes>>;
};

/**
 * @brief Plain text: sorted "key=value " fields followed by the message
 */
class plain_formatter
{
  public:
    std::string
    output(int /*flags*/, log_level /*level*/, const log_fields &fields, std::string_view msg, const call_site & /*site*/) const
    {
        if (fields.empty()) return std::string(msg);

        auto out = render_fields(fields);
        out.push_back(' ');
        out.append(msg);
        return out;
    }

    std::optional<int> override_flags() const { return std::nullopt; }
    std::optional<level_prefixes> override_prefixes() const { return std::nullopt; }
};

/**
 * @brief Plain text with ANSI colored level tags
 */
class color_formatter
{
  public:
    std::string output(int flags, log_level level, const log_fields &fields, std::string_view msg, const call_site &site) const
    {
        return plain_.output(flags, level, fields, msg, site);
    }

    std::optional<int> override_flags() const { return std::nullopt; }

    std::optional<level_prefixes> override_prefixes() const
    {
        level_prefixes prefixes;
        for (size_t i = 0; i < LOG_LEVEL_COUNT; ++i)
        {
            prefixes[i] = fmt::format("{}{}{}", log_level_colors[i], log_level_tags[i], log_color_reset);
        }
        return prefixes;
    }

  private:
    plain_formatter plain_;
};

/**
 * @brief JSON formatter using taocpp/json library
 *
 * Produces one object per line. "time", "level" and "msg" come first, then
 * the caller's fields and "file". Time and file are computed from the logger
 * flags; the channel header is switched off so they are not repeated.
 *
 * Usage:
 * @code
 * json_formatter formatter;
 * formatter.pretty_print = true;  // Enable pretty printing
 * @endcode
 */
class json_formatter
{
  public:
    bool pretty_print = false;

    /**
     * @brief Template method that produces JSON events for one line
     *
     * Follows taocpp/json's producer pattern so it can drive any consumer.
     * Caller fields named like a header field are replaced by the header value.
     */
    template <typename Consumer>
    void produce_log_json(Consumer &c,
                          int flags,
                          log_level level,
                          const log_fields &fields,
                          std::string_view msg,
                          const call_site &site,
                          std::chrono::system_clock::time_point now) const
    {
        bool has_time = (flags & (flag_date | flag_time | flag_microseconds)) != 0;
        bool has_file = (flags & (flag_short_file | flag_long_file)) != 0;

        c.begin_object();

        if (has_time)
        {
            std::string time;
            detail::append_time(time, flags, now);
            while (!time.empty() && time.back() == ' ') time.pop_back();
            c.key("time");
            c.string(time);
            c.member();
        }
        else if (auto it = fields.find("time"); it != fields.end())
        {
            c.key("time");
            it->second.to_json(c);
            c.member();
        }

        c.key("level");
        c.string(level == log_level::off ? std::string_view("off") : log_level_names[level_index(level)]);
        c.member();

        c.key("msg");
        c.string(msg);
        c.member();

        if (has_file)
        {
            c.key("file");
            c.string(detail::file_reference(flags, site));
            c.member();
        }

        for (const auto &[key, value] : fields)
        {
            if (key == "time" || key == "level" || key == "msg") continue;
            if (has_file && key == "file") continue;

            c.key(key);
            value.to_json(c);
            c.member();
        }

        c.end_object();
    }

    std::string output(int flags, log_level level, const log_fields &fields, std::string_view msg, const call_site &site) const
    {
        auto now = std::chrono::system_clock::now();
        std::ostringstream stream;

        if (pretty_print)
        {
            // Pretty print with 2-space indent
            tao::json::events::to_pretty_stream consumer(stream, 2);
            produce_log_json(consumer, flags, level, fields, msg, site, now);
        }
        else
        {
            tao::json::events::to_stream consumer(stream);
            produce_log_json(consumer, flags, level, fields, msg, site, now);
        }

        return stream.str();
    }

    std::optional<int> override_flags() const { return flag_disable; }
    std::optional<level_prefixes> override_prefixes() const { return level_prefixes{}; }
};

/**
 * @brief Abstract interface for formatter operations behind log_formatter
 */
struct formatter_concept
{
    virtual ~formatter_concept() = default;

    virtual std::string
    output(int flags, log_level level, const log_fields &fields, std::string_view msg, const call_site &site) const = 0;
    virtual std::optional<int> override_flags() const                  = 0;
    virtual std::optional<level_prefixes> override_prefixes() const    = 0;
    virtual std::unique_ptr<formatter_concept> clone() const           = 0;
};

template <LogFormatter Formatter> struct formatter_model final : formatter_concept
{
    Formatter formatter_;

    explicit formatter_model(Formatter f) : formatter_(std::move(f)) {}

    std::string
    output(int flags, log_level level, const log_fields &fields, std::string_view msg, const call_site &site) const override
    {
        return formatter_.output(flags, level, fields, msg, site);
    }

    std::optional<int> override_flags() const override { return formatter_.override_flags(); }
    std::optional<level_prefixes> override_prefixes() const override { return formatter_.override_prefixes(); }

    std::unique_ptr<formatter_concept> clone() const override { return std::make_unique<formatter_model>(formatter_); }
};

/**
 * @brief Value type holding any LogFormatter
 */
class log_formatter
{
  public:
    log_formatter() : impl_(std::make_unique<formatter_model<plain_formatter>>(plain_formatter{})) {}

    template <LogFormatter Formatter>
        requires(!std::is_same_v<std::decay_t<Formatter>, log_formatter>)
    log_formatter(Formatter formatter)
    : impl_(std::make_unique<formatter_model<Formatter>>(std::move(formatter)))
    {
    }

    log_formatter(const log_formatter &other) : impl_(other.get().clone()) {}
    log_formatter(log_formatter &&) noexcept = default;

    log_formatter &operator=(const log_formatter &other)
    {
        if (this != &other) impl_ = other.get().clone();
        return *this;
    }
    log_formatter &operator=(log_formatter &&) noexcept = default;

    std::string output(int flags, log_level level, const log_fields &fields, std::string_view msg, const call_site &site) const
    {
        return get().output(flags, level, fields, msg, site);
    }

    std::optional<int> override_flags() const { return get().override_flags(); }
    std::optional<level_prefixes> override_prefixes() const { return get().override_prefixes(); }

  private:
    // A moved-from formatter renders plain text
    const formatter_concept &get() const noexcept
    {
        static const formatter_model<plain_formatter> plain{plain_formatter{}};
        return impl_ ? *impl_ : plain;
    }

    std::unique_ptr<formatter_concept> impl_;
};

} // namespace fanlog
