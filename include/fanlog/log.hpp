/**
 * @file log.hpp
 * @brief Leveled, multi-destination synchronous logging
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * This logging system provides:
 * - Six severities, from fatal to debug, with threshold or bitmask filtering
 * - Fan-out of each line to a file or buffer, the system log and the console
 * - Structured key/value fields, per line or attached as context
 * - Plain, JSON and colorized output
 * - A process-wide default logger behind free functions
 *
 * Basic Usage:
 * @code
 * #include <fanlog/log.hpp>
 *
 * auto log = fanlog::make_logger(std::make_shared<fanlog::file_writer>("app.log"));
 * log->info("service started");
 * // Output: INFO : 2024/05/01 12:00:00 service started
 *
 * log->with({{"user", "bob"}, {"retries", 3}}).warning("login failed");
 * // Output: WARN : 2024/05/01 12:00:01 retries=3 user=bob login failed
 *
 * log->errorf("cannot open {}: {}", path, reason);
 *
 * // The first logger created is also the default
 * fanlog::info("through the default logger");
 * @endcode
 *
 * JSON Output:
 * @code
 * auto json = fanlog::make_json_logger();
 * json->set_flags(fanlog::flag_std | fanlog::flag_short_file);
 * json->info("ready");
 * // Output: {"time":"2024/05/01 12:00:00","level":"info","msg":"ready","file":"main.cpp:12"}
 * @endcode
 *
 * Configuration:
 * @code
 * fanlog::logger_options options;
 * fanlog::configure_from_env(options);   // FANLOG_CONFIG="level=debug,format=json"
 * auto log = fanlog::make_std_logger(options);
 * @endcode
 *
 * Thread safety: every logger call may be made from any thread. Writes from
 * all loggers in the process are serialized by a single lock; formatting
 * happens outside it.
 */
#pragma once

#include "log_version.hpp"       // IWYU pragma: export
#include "log_types.hpp"         // IWYU pragma: export
#include "log_gate.hpp"          // IWYU pragma: export
#include "log_fields.hpp"        // IWYU pragma: export
#include "log_writers.hpp"       // IWYU pragma: export
#include "log_syslog.hpp"        // IWYU pragma: export
#include "log_channel.hpp"       // IWYU pragma: export
#include "log_formatters.hpp"    // IWYU pragma: export
#include "log_options.hpp"       // IWYU pragma: export
#include "logger.hpp"            // IWYU pragma: export
