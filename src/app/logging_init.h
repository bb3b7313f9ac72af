#pragma once
// Copyright (c) 2025-2026 The cbtrace Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Logging system initialization.
//
// Configures the global Logger singleton from AppConfig:
//   - Sets the log level threshold.
//   - Restricts output to the -debug category list.
//   - Opens the optional -logfile in append mode.
// Console (stderr) output stays on; stdout is reserved for reports.
// ---------------------------------------------------------------------------

#ifndef CBT_APP_LOGGING_INIT_H
#define CBT_APP_LOGGING_INIT_H

#include "core/error.h"
#include "core/logging.h"

#include <string>
#include <string_view>

// Forward declaration.
namespace app {
struct AppConfig;
} // namespace app

namespace app {

/// Initialize the logging subsystem from the application configuration.
///
/// @returns STORAGE_WRITE_FAIL if the log file cannot be opened.
[[nodiscard]] core::Result<void> init_logging(const AppConfig& config);

/// Parse a comma-separated list of category names into a bitmask.
///
/// Recognised names (case-insensitive): parse, classify, correlate,
/// report, config, io, all, none. An empty list, or the bare flag value
/// "1", selects all categories.
///
/// @returns CONFIG_INVALID naming the first unknown category.
[[nodiscard]] core::Result<core::LogCategory> parse_log_categories(
    std::string_view category_str);

/// One-line banner logged at startup.
[[nodiscard]] std::string get_startup_banner(const AppConfig& config);

} // namespace app

#endif // CBT_APP_LOGGING_INIT_H
