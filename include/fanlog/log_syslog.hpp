/**
 * @file log_syslog.hpp
 * @brief Per-level writers for the platform system log
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * On POSIX systems lines go to syslog(3) with facility LOG_USER. On Windows
 * they go to the Application event log under a source named after the
 * program, registered on first use.
 */
#pragma once

#include <array>
#include <cerrno>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#else
#include <cstring>
#include <sys/socket.h>
#include <sys/un.h>
#include <syslog.h>
#include <unistd.h>
#endif

#include "log_types.hpp"
#include "log_writers.hpp"

namespace fanlog
{

/**
 * @brief One system log writer per level
 *
 * The fatal slot shares the error writer. closers() lists each distinct
 * writer once.
 */
struct system_log_writers
{
    std::array<std::shared_ptr<log_writer>, LOG_LEVEL_COUNT> by_level;

    std::shared_ptr<log_writer> operator[](log_level level) const { return by_level[level_index(level)]; }

    std::vector<std::shared_ptr<log_writer>> closers() const
    {
        std::vector<std::shared_ptr<log_writer>> result;
        for (const auto &writer : by_level)
        {
            if (!writer || !dynamic_cast<log_closer *>(writer.get())) continue;

            bool seen = false;
            for (const auto &existing : result) { seen = seen || existing == writer; }
            if (!seen) result.push_back(writer);
        }
        return result;
    }
};

#ifndef _WIN32

namespace detail
{

/**
 * @brief Process-wide openlog()/closelog() pairing
 *
 * syslog(3) keeps a single ident per process; the connection owns the ident
 * storage and closes the log when the last writer lets go of it.
 */
class syslog_connection
{
  public:
    explicit syslog_connection(std::string ident) : ident_(std::move(ident)) { ::openlog(ident_.c_str(), LOG_PID, LOG_USER); }

    syslog_connection(const syslog_connection &)            = delete;
    syslog_connection &operator=(const syslog_connection &) = delete;

    ~syslog_connection() { ::closelog(); }

    void write(int priority, std::string_view text) const
    {
        ::syslog(LOG_USER | priority, "%.*s", static_cast<int>(text.size()), text.data());
    }

  private:
    std::string ident_;
};

/**
 * @brief Check that a syslog daemon accepts connections on the socket at @p path
 *
 * Tries a datagram socket first, then a stream socket. Anything that is not a
 * listening unix socket (a missing path, a directory, a regular file) fails.
 */
inline bool syslog_socket_reachable(const char *path)
{
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (std::strlen(path) >= sizeof(addr.sun_path)) return false;
    std::strncpy(addr.sun_path, path, sizeof(addr.sun_path) - 1);

    for (int type : {SOCK_DGRAM, SOCK_STREAM})
    {
        int fd = ::socket(AF_UNIX, type, 0);
        if (fd < 0) continue;

        bool connected = ::connect(fd, reinterpret_cast<const sockaddr *>(&addr), sizeof(addr)) == 0;
        ::close(fd);
        if (connected) return true;
    }
    return false;
}

inline bool syslog_reachable()
{
    for (const char *path : {"/dev/log", "/var/run/syslog", "/var/run/log"})
    {
        if (syslog_socket_reachable(path)) return true;
    }
    return false;
}

} // namespace detail

/**
 * @brief Writer sending each line to syslog at a fixed priority
 */
class syslog_writer : public log_writer, public log_closer
{
  public:
    syslog_writer(std::shared_ptr<detail::syslog_connection> connection, int priority, std::string name)
    : connection_(std::move(connection)), priority_(priority), name_(std::move(name))
    {
    }

    ssize_t write(const char *data, size_t len) override
    {
        if (!connection_)
        {
            errno = EBADF;
            return -1;
        }

        std::string_view text(data, len);
        while (!text.empty() && text.back() == '\n') text.remove_suffix(1);
        connection_->write(priority_, text);
        return static_cast<ssize_t>(len);
    }

    std::string describe() const override { return name_; }

    void close() override { connection_.reset(); }

    int priority() const noexcept { return priority_; }

  private:
    std::shared_ptr<detail::syslog_connection> connection_;
    int priority_;
    std::string name_;
};

/**
 * @brief Acquire per-level syslog writers tagged with @p name
 * @throws std::system_error when no syslog socket is reachable
 */
inline system_log_writers open_system_log(const std::string &name)
{
    if (!detail::syslog_reachable())
    {
        throw std::system_error(ECONNREFUSED, std::generic_category(), "Unix syslog delivery error");
    }

    auto connection = std::make_shared<detail::syslog_connection>(name);
    auto make       = [&](int priority, const char *label)
    { return std::make_shared<syslog_writer>(connection, priority, fmt::format("syslog:{}:{}", name, label)); };

    system_log_writers writers;
    writers.by_level[level_index(log_level::debug)]   = make(LOG_DEBUG, "debug");
    writers.by_level[level_index(log_level::info)]    = make(LOG_NOTICE, "notice");
    writers.by_level[level_index(log_level::warning)] = make(LOG_WARNING, "warning");
    writers.by_level[level_index(log_level::error)]   = make(LOG_ERR, "err");
    writers.by_level[level_index(log_level::panic)]   = make(LOG_CRIT, "crit");
    writers.by_level[level_index(log_level::fatal)]   = writers.by_level[level_index(log_level::error)];
    return writers;
}

#else

namespace detail
{

/**
 * @brief Register @p source as an Application event source backed by EventCreate.exe
 *
 * An existing registration and a lack of permission to create one are both
 * accepted so that pre-registered sources work without administrator rights.
 */
inline void install_event_source(const std::string &source)
{
    std::string key_path = "SYSTEM\\CurrentControlSet\\Services\\EventLog\\Application\\" + source;

    HKEY key;
    DWORD disposition = 0;
    LONG rc = ::RegCreateKeyExA(HKEY_LOCAL_MACHINE, key_path.c_str(), 0, nullptr, REG_OPTION_NON_VOLATILE,
                                KEY_SET_VALUE, nullptr, &key, &disposition);
    if (rc == ERROR_ACCESS_DENIED) return;
    if (rc != ERROR_SUCCESS)
    {
        throw std::system_error(static_cast<int>(rc), std::system_category(), "Failed to register event source " + source);
    }
    if (disposition == REG_OPENED_EXISTING_KEY)
    {
        ::RegCloseKey(key);
        return;
    }

    const char message_file[] = "%SystemRoot%\\System32\\EventCreate.exe";
    DWORD types = EVENTLOG_ERROR_TYPE | EVENTLOG_WARNING_TYPE | EVENTLOG_INFORMATION_TYPE;
    DWORD custom = 1;

    rc = ::RegSetValueExA(key, "EventMessageFile", 0, REG_EXPAND_SZ, reinterpret_cast<const BYTE *>(message_file),
                          sizeof(message_file));
    if (rc == ERROR_SUCCESS)
    {
        rc = ::RegSetValueExA(key, "TypesSupported", 0, REG_DWORD, reinterpret_cast<const BYTE *>(&types), sizeof(types));
    }
    if (rc == ERROR_SUCCESS)
    {
        rc = ::RegSetValueExA(key, "CustomSource", 0, REG_DWORD, reinterpret_cast<const BYTE *>(&custom), sizeof(custom));
    }
    ::RegCloseKey(key);

    if (rc != ERROR_SUCCESS && rc != ERROR_ACCESS_DENIED)
    {
        throw std::system_error(static_cast<int>(rc), std::system_category(), "Failed to register event source " + source);
    }
}

} // namespace detail

/**
 * @brief Writer reporting each line to the Application event log
 */
class event_log_writer : public log_writer, public log_closer
{
  public:
    event_log_writer(const std::string &source, log_level level) : source_(source), level_(level)
    {
        detail::install_event_source(source);
        handle_ = ::RegisterEventSourceA(nullptr, source.c_str());
        if (!handle_)
        {
            throw std::system_error(static_cast<int>(::GetLastError()), std::system_category(),
                                    "Failed to open event source " + source);
        }
    }

    event_log_writer(const event_log_writer &)            = delete;
    event_log_writer &operator=(const event_log_writer &) = delete;

    ~event_log_writer() override
    {
        if (handle_) ::DeregisterEventSource(handle_);
    }

    ssize_t write(const char *data, size_t len) override
    {
        if (!handle_)
        {
            errno = EBADF;
            return -1;
        }

        std::string text(data, len);
        const char *strings[] = {text.c_str()};
        if (!::ReportEventA(handle_, event_type(), 0, event_id(), nullptr, 1, 0, strings, nullptr))
        {
            errno = EIO;
            return -1;
        }
        return static_cast<ssize_t>(len);
    }

    std::string describe() const override { return "eventlog:" + source_; }

    void close() override
    {
        if (!handle_) return;

        HANDLE handle = handle_;
        handle_       = nullptr;
        if (!::DeregisterEventSource(handle))
        {
            throw std::system_error(static_cast<int>(::GetLastError()), std::system_category(),
                                    "Failed to close event source " + source_);
        }
    }

  private:
    WORD event_type() const
    {
        switch (level_)
        {
        case log_level::debug:
        case log_level::info: return EVENTLOG_INFORMATION_TYPE;
        case log_level::warning: return EVENTLOG_WARNING_TYPE;
        default: return EVENTLOG_ERROR_TYPE;
        }
    }

    DWORD event_id() const
    {
        switch (level_)
        {
        case log_level::debug:
        case log_level::info: return 1;
        case log_level::warning: return 3;
        default: return 2;
        }
    }

    std::string source_;
    log_level level_;
    HANDLE handle_ = nullptr;
};

inline system_log_writers open_system_log(const std::string &name)
{
    system_log_writers writers;
    for (auto level : {log_level::debug, log_level::info, log_level::warning, log_level::error, log_level::panic})
    {
        writers.by_level[level_index(level)] = std::make_shared<event_log_writer>(name, level);
    }
    writers.by_level[level_index(log_level::fatal)] = writers.by_level[level_index(log_level::error)];
    return writers;
}

#endif

} // namespace fanlog
