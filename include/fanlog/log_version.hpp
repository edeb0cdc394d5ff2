/**
 * @file log_version.hpp
 * @brief Version information for fanlog logging library
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

namespace fanlog
{

#ifndef FANLOG_VERSION_STRING
    #define FANLOG_VERSION_STRING "dev"
#endif

inline constexpr const char *VERSION = FANLOG_VERSION_STRING;

} // namespace fanlog
