#pragma once

#include <pathfork/diag/diagnostic.h>
#include <variant>

/**
 * @file config.h
 * @brief Tunables for branch exploration.
 */

namespace pathfork::config
{

/** @brief Settings consumed by the brancher and its session. */
struct BrancherConfig
{
    /** Per-query budget for feasibility checks, in milliseconds. */
    unsigned check_timeout_ms = 10;
    /** Write branch/join trace lines to stderr. */
    bool trace = false;
};

/** @brief Result of reading the configuration: settings or a diagnostic. */
using ConfigResult = std::variant<BrancherConfig, pathfork::diag::Diagnostic>;

/**
 * @brief Read settings from the environment.
 *
 * PATHFORK_CHECK_TIMEOUT must be a positive integer number of milliseconds.
 * PATHFORK_TRACE enables tracing when present.
 */
[[nodiscard]] ConfigResult config_from_env();

} // namespace pathfork::config
