/**
   Include this file instead of directly including spdlog or fmtlib (fmt)
   headers.

   spdlog may be built against an external fmtlib or use its "bundled" copy.
   This hides the difference.
 */

#ifndef SMOOTHSIZEUTIL_SPDLOG
#define SMOOTHSIZEUTIL_SPDLOG

// Prefer SPDLOG_LOGGER_DEBUG() or SPDLOG_DEBUG() over bare calls to
// log->debug() or spdlog::debug().
//
// Always use SPDLOG_LOGGER_TRACE() or SPDLOG_TRACE() for trace level logs.
//
// The compile time minimum level is set when configuring with
// -DSMOOTHSIZE_SPDLOG_ACTIVE_LEVEL=<level>.

#include <spdlog/spdlog.h>

#if defined(SPDLOG_FMT_EXTERNAL)
#include <fmt/core.h>
#include <fmt/ranges.h>
#else
#include <spdlog/fmt/bundled/core.h>
#include <spdlog/fmt/bundled/ranges.h>
#endif

#endif
