/**
 * @file fmt_config.hpp
 * @brief Configuration for fmt library to be used in header-only mode
 *
 * fanlog is header-only, so fmt is pulled in the same way and no separate
 * fmt compilation is needed by consumers.
 */
#pragma once

// Enable fmt header-only mode
#ifndef FMT_HEADER_ONLY
#define FMT_HEADER_ONLY
#endif

#include <fmt/format.h>
