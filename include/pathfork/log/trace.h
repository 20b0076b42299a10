#pragma once

#include <string_view>

/**
 * @file trace.h
 * @brief Opt-in tracing of branch exploration to stderr.
 *
 * Lines are written as `[channel] message`. Tracing is off unless the PATHFORK_TRACE
 * environment variable is set or it has been enabled programmatically.
 */

namespace pathfork::log
{

/** @brief True if trace lines are currently written. */
[[nodiscard]] bool trace_enabled();

/** @brief Force tracing on or off, overriding the environment. */
void set_trace_enabled(bool enabled);

/** @brief Write `[channel] message` to stderr if tracing is enabled. */
void trace(std::string_view channel, std::string_view message);

} // namespace pathfork::log
