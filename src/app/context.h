#pragma once
// Copyright (c) 2025-2026 The cbtrace Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// AppConfig -- typed view of the command line and configuration file.
//
// Built from a core::Config; command-line values override file values,
// which override the defaults below.
// ---------------------------------------------------------------------------

#ifndef CBT_APP_CONTEXT_H
#define CBT_APP_CONTEXT_H

#include "core/error.h"
#include "core/logging.h"
#include "relay/pass.h"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace app {

// ---------------------------------------------------------------------------
// Version constants
// ---------------------------------------------------------------------------

inline constexpr int VERSION_MAJOR = 0;
inline constexpr int VERSION_MINOR = 3;
inline constexpr int VERSION_PATCH = 0;
inline constexpr const char* VERSION_SUFFIX = "";

/// Returns the full version string, e.g. "0.3.0".
std::string get_version_string();

/// Returns e.g. "cbtrace v0.3.0".
std::string get_client_name();

// ---------------------------------------------------------------------------
// AppConfig
// ---------------------------------------------------------------------------

enum class Command {
    PARSE,     // write <out>_received.csv and <out>_sent.csv
    STATS,     // print statistics blocks
    SUMMARY,   // print pass counters
    HELP,
    VERSION,
};

[[nodiscard]] std::optional<Command> command_from_string(
    std::string_view name) noexcept;

inline constexpr const char* DEFAULT_OUT_PREFIX = "compactblocksdata";

struct AppConfig {
    Command               command = Command::HELP;
    std::filesystem::path log_path;

    // -- Output --------------------------------------------------------------
    std::string out_prefix = DEFAULT_OUT_PREFIX;

    // -- Time window ---------------------------------------------------------
    std::optional<std::string> from;
    std::optional<std::string> to;

    // -- Logging -------------------------------------------------------------
    core::LogLevel log_level = core::LogLevel::INFO;
    core::LogCategory log_categories = core::LogCategory::ALL;
    std::optional<std::filesystem::path> log_file;

    // -- Derived helpers -----------------------------------------------------

    [[nodiscard]] relay::PassOptions pass_options() const;
    [[nodiscard]] std::filesystem::path received_csv_path() const;
    [[nodiscard]] std::filesystem::path sent_csv_path() const;
};

// ---------------------------------------------------------------------------
// Argument / config file parsing
// ---------------------------------------------------------------------------

/// Parse the command line:  cbtrace [options] <command> <logfile>
///
/// Accepted options (with - or -- prefix):
///   -out=<prefix>      -from=<ts>        -to=<ts>
///   -loglevel=<level>  -debug=<cat,...>  -logfile=<path>
///   -conf=<file>       -help / -h / -?   -version
///
/// @returns CONFIG_INVALID for an unknown command, a missing log path, a
///          bad log level or category, or an inverted time window;
///          STORAGE_NOT_FOUND if -conf names a missing file.
[[nodiscard]] core::Result<AppConfig> parse_args(int argc,
                                                 const char* const argv[]);

/// Print a usage/help message to stdout.
void print_usage();

/// Print version information to stdout.
void print_version();

} // namespace app

#endif // CBT_APP_CONTEXT_H
