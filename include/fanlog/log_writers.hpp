/**
 * @file log_writers.hpp
 * @brief Output destinations for formatted log lines
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#ifdef _WIN32
#include <BaseTsd.h>
#include <io.h>
#include <fcntl.h>
using ssize_t = SSIZE_T;
#ifndef STDOUT_FILENO
#define STDOUT_FILENO 1
#define STDERR_FILENO 2
#endif
#else
#include <unistd.h> // For write() and STDOUT_FILENO
#include <fcntl.h>
#endif

#include "fmt_config.hpp" // IWYU pragma: keep

namespace fanlog
{

/**
 * @brief Destination that accepts formatted bytes
 *
 * write() returns the number of bytes written or -1 with errno set.
 * describe() names the destination in diagnostics.
 */
class log_writer
{
  public:
    virtual ~log_writer() = default;

    virtual ssize_t write(const char *data, size_t len) = 0;
    virtual std::string describe() const = 0;
};

/**
 * @brief Capability of destinations that own a resource
 *
 * close() throws std::system_error when releasing the resource fails.
 */
class log_closer
{
  public:
    virtual ~log_closer() = default;

    virtual void close() = 0;
};

namespace detail
{

inline ssize_t write_fd(int fd, const char *data, size_t len)
{
    if (fd < 0)
    {
        errno = EBADF;
        return -1;
    }

    size_t total_written = 0;
    while (total_written < len)
    {
#ifdef _WIN32
        auto written = ::_write(fd, data + total_written, static_cast<unsigned>(len - total_written));
#else
        ssize_t written = ::write(fd, data + total_written, len - total_written);
#endif
        if (written < 0)
        {
            if (errno == EINTR) { continue; }
            return -1;
        }
        total_written += static_cast<size_t>(written);
    }
    return static_cast<ssize_t>(total_written);
}

inline int close_fd(int fd)
{
#ifdef _WIN32
    return ::_close(fd);
#else
    return ::close(fd);
#endif
}

} // namespace detail

/**
 * @brief Writer for an already open file descriptor
 *
 * The descriptor is closed on destruction only when @p close_fd is set.
 */
class fd_writer : public log_writer
{
  public:
    explicit fd_writer(int fd, bool close_fd = false, std::string name = {})
    : fd_(fd), close_fd_(close_fd), name_(std::move(name))
    {
        if (name_.empty()) { name_ = "fd:" + std::to_string(fd); }
    }

    fd_writer(const fd_writer &)            = delete;
    fd_writer &operator=(const fd_writer &) = delete;

    ~fd_writer() override
    {
        if (close_fd_ && fd_ >= 0)
        {
            detail::close_fd(fd_);
            fd_ = -1;
        }
    }

    ssize_t write(const char *data, size_t len) override { return detail::write_fd(fd_, data, len); }

    std::string describe() const override { return name_; }

    int fd() const noexcept { return fd_; }

  protected:
    int fd_{-1};           ///< File descriptor for logging
    bool close_fd_{false}; ///< Whether to close fd on destruction
    std::string name_;     ///< Name used in diagnostics
};

/**
 * @brief Writer appending to a named file
 */
class file_writer : public fd_writer, public log_closer
{
  public:
    explicit file_writer(const std::string &filename) : fd_writer(-1, true, filename)
    {
#ifdef _WIN32
        fd_ = ::_open(filename.c_str(), _O_WRONLY | _O_CREAT | _O_APPEND | _O_BINARY, 0644);
#else
        fd_ = ::open(filename.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
#endif
        if (fd_ < 0) { throw std::system_error(errno, std::generic_category(), "Failed to open log file: " + filename); }
    }

    void close() override
    {
        if (fd_ < 0) return;

        int fd = fd_;
        fd_    = -1;
        if (detail::close_fd(fd) < 0)
        {
            throw std::system_error(errno, std::generic_category(), "Failed to close log file: " + name_);
        }
    }

    const std::string &filename() const noexcept { return name_; }
};

/**
 * @brief Thread safe in-memory destination
 *
 * Collects everything written to it. Once closed, writes fail with EBADF
 * while the collected text stays readable.
 */
class memory_writer : public log_writer, public log_closer
{
  public:
    explicit memory_writer(std::string name = "memory") : name_(std::move(name)) {}

    ssize_t write(const char *data, size_t len) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_)
        {
            errno = EBADF;
            return -1;
        }
        buffer_.append(data, len);
        return static_cast<ssize_t>(len);
    }

    std::string describe() const override { return name_; }

    void close() override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }

    bool closed() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    std::string str() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return buffer_;
    }

    /**
     * @brief Collected text split at newlines, without the newlines
     */
    std::vector<std::string> lines() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> result;
        size_t start = 0;
        while (start < buffer_.size())
        {
            auto end = buffer_.find('\n', start);
            if (end == std::string::npos) end = buffer_.size();
            result.emplace_back(buffer_, start, end - start);
            start = end + 1;
        }
        return result;
    }

    void clear()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        buffer_.clear();
    }

  private:
    mutable std::mutex mutex_;
    std::string buffer_;
    std::string name_;
    bool closed_ = false;
};

/**
 * @brief Destination that accepts and drops everything
 */
class discard_writer : public log_writer
{
  public:
    ssize_t write(const char *, size_t len) override { return static_cast<ssize_t>(len); }

    std::string describe() const override { return "discard"; }
};

/**
 * @brief Fan-out over an ordered list of destinations
 *
 * Every destination receives the line even when an earlier one fails. A
 * failure is reported on stderr and the combined write returns -1.
 */
class multi_writer : public log_writer
{
  public:
    multi_writer() = default;
    explicit multi_writer(std::vector<std::shared_ptr<log_writer>> writers) : writers_(std::move(writers)) {}

    void add(std::shared_ptr<log_writer> writer)
    {
        if (writer) writers_.push_back(std::move(writer));
    }

    const std::vector<std::shared_ptr<log_writer>> &writers() const noexcept { return writers_; }

    ssize_t write(const char *data, size_t len) override
    {
        bool failed = false;
        for (const auto &writer : writers_)
        {
            if (writer->write(data, len) < 0)
            {
                int err = errno;
                fmt::print(stderr, "fanlog: write to {} failed: {}\n", writer->describe(), std::strerror(err));
                failed = true;
            }
        }
        return failed ? -1 : static_cast<ssize_t>(len);
    }

    std::string describe() const override
    {
        std::string out = "multi(";
        for (size_t i = 0; i < writers_.size(); ++i)
        {
            if (i) out += ", ";
            out += writers_[i]->describe();
        }
        out += ")";
        return out;
    }

  private:
    std::vector<std::shared_ptr<log_writer>> writers_;
};

inline std::shared_ptr<log_writer> stdout_writer()
{
    static auto writer = std::make_shared<fd_writer>(STDOUT_FILENO, false, "stdout");
    return writer;
}

inline std::shared_ptr<log_writer> stderr_writer()
{
    static auto writer = std::make_shared<fd_writer>(STDERR_FILENO, false, "stderr");
    return writer;
}

} // namespace fanlog
