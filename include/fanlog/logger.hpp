/**
 * @file logger.hpp
 * @brief Leveled logger fanning each line out to its destinations
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * A logger owns one channel per level. Each channel writes to the explicit
 * writer given at construction (a file, a memory buffer), the system log
 * when requested, and stdout (debug, info, warning) or stderr (error, panic,
 * fatal). Lines are filtered by a severity gate and rendered by a pluggable
 * formatter.
 *
 * @code
 * auto log = fanlog::make_logger(std::make_shared<fanlog::file_writer>("app.log"));
 * log->set_level(fanlog::log_level::debug);
 * log->with({{"user", "bob"}, {"attempt", 3}}).warning("login failed");
 * log->infof("listening on {}:{}", host, port);
 * @endcode
 */
#pragma once

#include <array>
#include <functional>
#include <memory>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "log_types.hpp"
#include "log_gate.hpp"
#include "log_fields.hpp"
#include "log_writers.hpp"
#include "log_syslog.hpp"
#include "log_channel.hpp"
#include "log_formatters.hpp"
#include "log_options.hpp"

namespace fanlog
{

enum class logger_state
{
    uninitialized,
    initialized,
    closed,
};

inline const char *string_from_logger_state(logger_state state)
{
    switch (state)
    {
    case logger_state::uninitialized: return "uninitialized";
    case logger_state::initialized: return "initialized";
    case logger_state::closed: return "closed";
    default: return "unknown";
    }
}

/**
 * @brief Thrown by panic() after the line is written and the logger closed
 */
class panic_error : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Destination of each level, indexed by level_index()
 */
using level_writers = std::array<std::shared_ptr<log_writer>, LOG_LEVEL_COUNT>;

class logger;

namespace detail
{
inline void offer_default_logger(std::shared_ptr<logger> candidate);
} // namespace detail

class logger
{
  public:
    /**
     * @brief Build a logger with the standard fan-out
     * @param name Program name, used as the system log ident
     * @param system_log Also send every line to the system log
     * @param writer Extra destination placed first in every level, may be null
     * @param options Formatter, gate, flags and terminal hooks
     *
     * A system log that cannot be reached does not fail construction; the
     * failure is logged at error level through the new logger instead. The
     * first logger created becomes the process default.
     */
    static std::shared_ptr<logger>
    create(const std::string &name, bool system_log, std::shared_ptr<log_writer> writer, logger_options options = {});

    /**
     * @brief Build a logger over explicit per-level destinations
     * @param closers Destinations released by close(); each must implement log_closer
     */
    logger(std::string name, level_writers writers, std::vector<std::shared_ptr<log_writer>> closers, logger_options options);

    logger(const logger &)            = delete;
    logger &operator=(const logger &) = delete;

    ~logger();

    void debug(std::string_view msg, std::source_location loc = std::source_location::current())
    {
        emit(log_level::debug, msg, call_site::from(loc));
    }

    void info(std::string_view msg, std::source_location loc = std::source_location::current())
    {
        emit(log_level::info, msg, call_site::from(loc));
    }

    void warning(std::string_view msg, std::source_location loc = std::source_location::current())
    {
        emit(log_level::warning, msg, call_site::from(loc));
    }

    void error(std::string_view msg, std::source_location loc = std::source_location::current())
    {
        emit(log_level::error, msg, call_site::from(loc));
    }

    /**
     * @brief Write at panic level, close the logger, then fire the panic hook
     * @throws panic_error with @p msg unless a panic hook was configured
     */
    void panic(std::string_view msg, std::source_location loc = std::source_location::current())
    {
        emit(log_level::panic, msg, call_site::from(loc));
        raise_panic(msg);
    }

    /**
     * @brief Write at fatal level, close the logger, then terminate with status 1
     */
    void fatal(std::string_view msg, std::source_location loc = std::source_location::current())
    {
        emit(log_level::fatal, msg, call_site::from(loc));
        terminate();
    }

    template <typename... Args> void debugf(located_format_string<Args...> format, Args &&...args)
    {
        emit(log_level::debug, fmt::format(format.format, std::forward<Args>(args)...), call_site::from(format.location));
    }

    template <typename... Args> void infof(located_format_string<Args...> format, Args &&...args)
    {
        emit(log_level::info, fmt::format(format.format, std::forward<Args>(args)...), call_site::from(format.location));
    }

    template <typename... Args> void warningf(located_format_string<Args...> format, Args &&...args)
    {
        emit(log_level::warning, fmt::format(format.format, std::forward<Args>(args)...), call_site::from(format.location));
    }

    template <typename... Args> void errorf(located_format_string<Args...> format, Args &&...args)
    {
        emit(log_level::error, fmt::format(format.format, std::forward<Args>(args)...), call_site::from(format.location));
    }

    template <typename... Args> void panicf(located_format_string<Args...> format, Args &&...args)
    {
        auto msg = fmt::format(format.format, std::forward<Args>(args)...);
        emit(log_level::panic, msg, call_site::from(format.location));
        raise_panic(msg);
    }

    template <typename... Args> void fatalf(located_format_string<Args...> format, Args &&...args)
    {
        emit(log_level::fatal, fmt::format(format.format, std::forward<Args>(args)...), call_site::from(format.location));
        terminate();
    }

    /**
     * @brief Write at a level chosen at runtime, with the terminal action of panic and fatal
     */
    void log(log_level level, std::string_view msg, std::source_location loc = std::source_location::current());

    void set_level(log_level level);
    void set_level_mask(level_mask mask);
    log_level level() const;
    severity_gate gate() const;

    void set_flags(int flags);
    int flags() const;

    /**
     * @brief Attach fields to the next line only
     * @return This logger, for chaining
     *
     * The fields are consumed by the next call that reaches the emit path,
     * whether or not the line passes the gate.
     */
    logger &with(const log_fields &fields);

    /**
     * @brief Attach fields to every following line, replacing the previous context
     *
     * Context fields win over one-shot fields with the same key.
     */
    void with_context(const log_fields &fields);
    void clear_context();

    /**
     * @brief Release the writer and system log destinations
     *
     * Does nothing unless the logger is initialized. Close failures are
     * reported on stderr. Lines logged afterwards are dropped.
     */
    void close();

    logger_state state() const;
    const std::string &name() const noexcept { return name_; }

  private:
    void emit(log_level level, std::string_view msg, const call_site &site);
    void terminate();
    void raise_panic(std::string_view msg);

    std::string name_;
    log_formatter formatter_;
    int flags_;
    severity_gate gate_;
    std::function<void(int)> on_fatal_;
    std::function<void(std::string_view)> on_panic_;
    std::array<log_channel, LOG_LEVEL_COUNT> channels_;
    std::vector<std::shared_ptr<log_writer>> closers_;
    log_fields fields_;
    log_fields context_;
    logger_state state_ = logger_state::uninitialized;
};

/// Logger writing to the console only
inline std::shared_ptr<logger> make_std_logger(logger_options options = {})
{
    return logger::create("", false, nullptr, std::move(options));
}

/// Logger writing to the console and the system log under @p name
inline std::shared_ptr<logger> make_syslog_logger(const std::string &name, logger_options options = {})
{
    return logger::create(name, true, nullptr, std::move(options));
}

/// Logger writing to the console and @p writer
inline std::shared_ptr<logger> make_logger(std::shared_ptr<log_writer> writer, logger_options options = {})
{
    return logger::create("", false, std::move(writer), std::move(options));
}

/// Logger rendering JSON objects, to the console and @p writer
inline std::shared_ptr<logger> make_json_logger(std::shared_ptr<log_writer> writer = nullptr, logger_options options = {})
{
    options.formatter = json_formatter{};
    return logger::create("", false, std::move(writer), std::move(options));
}

/// Logger with ANSI colored level tags, to the console and @p writer
inline std::shared_ptr<logger> make_color_logger(std::shared_ptr<log_writer> writer = nullptr, logger_options options = {})
{
    options.formatter = color_formatter{};
    return logger::create("", false, std::move(writer), std::move(options));
}

} // namespace fanlog

#include "logger_impl.hpp" // IWYU pragma: keep
#include "log_default.hpp" // IWYU pragma: keep
