/**
 * @file logger_impl.hpp
 * @brief Implementation of the logger construction, emit path and shutdown
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cstdlib>
#include <exception>
#include <mutex>
#include <system_error>

#include "logger.hpp"

namespace fanlog
{

inline std::shared_ptr<logger>
logger::create(const std::string &name, bool system_log, std::shared_ptr<log_writer> writer, logger_options options)
{
    system_log_writers system;
    std::string system_log_error;
    if (system_log)
    {
        try
        {
            system = options.system_log_opener ? options.system_log_opener(name) : open_system_log(name);
        }
        catch (const std::system_error &e)
        {
            system_log_error = e.what();
        }
    }

    level_writers writers;
    for (size_t i = 0; i < LOG_LEVEL_COUNT; ++i)
    {
        auto level = static_cast<log_level>(i);
        auto fan   = std::make_shared<multi_writer>();

        fan->add(writer);
        fan->add(system.by_level[i]);
        if (level == log_level::debug || level == log_level::info || level == log_level::warning) { fan->add(stdout_writer()); }
        else { fan->add(stderr_writer()); }

        writers[i] = std::move(fan);
    }

    std::vector<std::shared_ptr<log_writer>> closers;
    if (writer && dynamic_cast<log_closer *>(writer.get())) { closers.push_back(writer); }
    for (auto &closer : system.closers()) { closers.push_back(std::move(closer)); }

    auto instance = std::make_shared<logger>(name, std::move(writers), std::move(closers), std::move(options));

    if (!system_log_error.empty()) { instance->error(system_log_error); }

    detail::offer_default_logger(instance);
    return instance;
}

inline logger::logger(std::string name,
                      level_writers writers,
                      std::vector<std::shared_ptr<log_writer>> closers,
                      logger_options options)
: name_(std::move(name)),
  formatter_(std::move(options.formatter)),
  flags_(options.flags),
  on_fatal_(std::move(options.on_fatal)),
  on_panic_(std::move(options.on_panic)),
  closers_(std::move(closers))
{
    if (options.mask) { gate_.set_mask(*options.mask); }
    else { gate_.set_threshold(options.level); }

    auto prefixes = formatter_.override_prefixes();
    if (!prefixes) prefixes = options.prefixes;
    if (!prefixes) prefixes = default_level_prefixes();

    int channel_flags = formatter_.override_flags().value_or(flags_);

    for (size_t i = 0; i < LOG_LEVEL_COUNT; ++i)
    {
        channels_[i] = log_channel(std::move(writers[i]), (*prefixes)[i], channel_flags);
    }

    state_ = logger_state::initialized;
}

inline logger::~logger() { close(); }

inline void logger::emit(log_level level, std::string_view msg, const call_site &site)
{
    log_fields fields;
    severity_gate gate;
    int flags;
    logger_state state;
    {
        std::lock_guard<std::mutex> lock(detail::log_mutex());
        fields = merge_fields(std::exchange(fields_, log_fields{}), context_);
        gate   = gate_;
        flags  = flags_;
        state  = state_;
    }

    if (!gate.enabled(level)) return;

    if (state != logger_state::initialized)
    {
        fmt::print(stderr, "fanlog: {} logger is {}, dropped {} line: {}\n", name_.empty() ? "unnamed" : name_,
                   string_from_logger_state(state), string_from_log_level(level), msg);
        return;
    }

    auto text = formatter_.output(flags, level, fields, msg, site);

    // Destination failures are reported by the fan-out writer
    channels_[level_index(level)].output(site, text);
}

inline void logger::terminate()
{
    close();
    if (on_fatal_)
    {
        on_fatal_(1);
        return;
    }
    std::exit(1);
}

inline void logger::raise_panic(std::string_view msg)
{
    close();
    if (on_panic_)
    {
        on_panic_(msg);
        return;
    }
    throw panic_error(std::string(msg));
}

inline void logger::log(log_level level, std::string_view msg, std::source_location loc)
{
    switch (level)
    {
    case log_level::panic: panic(msg, loc); break;
    case log_level::fatal: fatal(msg, loc); break;
    case log_level::off: break;
    default: emit(level, msg, call_site::from(loc)); break;
    }
}

inline void logger::set_level(log_level level)
{
    std::lock_guard<std::mutex> lock(detail::log_mutex());
    gate_.set_threshold(level);
}

inline void logger::set_level_mask(level_mask mask)
{
    std::lock_guard<std::mutex> lock(detail::log_mutex());
    gate_.set_mask(mask);
}

inline log_level logger::level() const
{
    std::lock_guard<std::mutex> lock(detail::log_mutex());
    return gate_.threshold();
}

inline severity_gate logger::gate() const
{
    std::lock_guard<std::mutex> lock(detail::log_mutex());
    return gate_;
}

inline void logger::set_flags(int flags)
{
    std::lock_guard<std::mutex> lock(detail::log_mutex());
    flags_ = flags;
    if (formatter_.override_flags()) return;

    for (auto &channel : channels_) { channel.set_flags(flags); }
}

inline int logger::flags() const
{
    std::lock_guard<std::mutex> lock(detail::log_mutex());
    return flags_;
}

inline logger &logger::with(const log_fields &fields)
{
    std::lock_guard<std::mutex> lock(detail::log_mutex());
    fields_ = merge_fields(std::move(fields_), fields);
    return *this;
}

inline void logger::with_context(const log_fields &fields)
{
    std::lock_guard<std::mutex> lock(detail::log_mutex());
    context_ = fields;
}

inline void logger::clear_context()
{
    std::lock_guard<std::mutex> lock(detail::log_mutex());
    context_.clear();
}

inline void logger::close()
{
    // Writers are closed under the lock so no channel is writing to them
    std::lock_guard<std::mutex> lock(detail::log_mutex());
    if (state_ != logger_state::initialized) return;
    state_ = logger_state::closed;

    for (const auto &writer : std::exchange(closers_, {}))
    {
        auto *closer = dynamic_cast<log_closer *>(writer.get());
        if (!closer) continue;

        try
        {
            closer->close();
        }
        catch (const std::exception &e)
        {
            fmt::print(stderr, "fanlog: close {} failed: {}\n", writer->describe(), e.what());
        }
    }
}

inline logger_state logger::state() const
{
    std::lock_guard<std::mutex> lock(detail::log_mutex());
    return state_;
}

} // namespace fanlog
