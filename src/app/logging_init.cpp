// Copyright (c) 2025-2026 The cbtrace Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "app/logging_init.h"
#include "app/context.h"

#include "core/fs.h"
#include "core/time.h"

#include <cctype>
#include <sstream>

namespace app {

namespace {

/// Trim leading and trailing whitespace.
std::string_view trim_ws(std::string_view sv) {
    while (!sv.empty() &&
           std::isspace(static_cast<unsigned char>(sv.front()))) {
        sv.remove_prefix(1);
    }
    while (!sv.empty() &&
           std::isspace(static_cast<unsigned char>(sv.back()))) {
        sv.remove_suffix(1);
    }
    return sv;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// init_logging
// ---------------------------------------------------------------------------

core::Result<void> init_logging(const AppConfig& config) {
    auto& logger = core::Logger::instance();

    logger.set_level(config.log_level);
    logger.set_categories(config.log_categories);
    logger.set_print_to_console(true);

    if (config.log_file) {
        const auto& path = *config.log_file;
        if (path.has_parent_path() &&
            !core::fs::ensure_directory(path.parent_path())) {
            return core::make_error(
                core::ErrorCode::STORAGE_WRITE_FAIL,
                "cannot create log directory: " +
                path.parent_path().string());
        }
        if (!logger.set_log_file(path)) {
            return core::make_error(core::ErrorCode::STORAGE_WRITE_FAIL,
                                    "cannot open log file: " + path.string());
        }
    }

    LOG_DEBUG(core::LogCategory::CONFIG, get_startup_banner(config));
    return core::make_ok();
}

// ---------------------------------------------------------------------------
// parse_log_categories
// ---------------------------------------------------------------------------

core::Result<core::LogCategory> parse_log_categories(
    std::string_view category_str) {
    category_str = trim_ws(category_str);
    if (category_str.empty() || category_str == "1") {
        return core::LogCategory::ALL;
    }

    core::LogCategory result = core::LogCategory::NONE;

    size_t start = 0;
    while (start <= category_str.size()) {
        size_t comma = category_str.find(',', start);
        if (comma == std::string_view::npos) {
            comma = category_str.size();
        }

        std::string_view token =
            trim_ws(category_str.substr(start, comma - start));
        if (!token.empty()) {
            auto cat = core::log_category_from_string(token);
            if (!cat) {
                return core::make_error(
                    core::ErrorCode::CONFIG_INVALID,
                    "unknown log category: " + std::string{token});
            }
            result = result | *cat;
        }

        start = comma + 1;
    }

    return result;
}

// ---------------------------------------------------------------------------
// get_startup_banner
// ---------------------------------------------------------------------------

std::string get_startup_banner(const AppConfig& config) {
    std::ostringstream ss;
    ss << get_client_name()
       << " started " << core::format_iso8601(core::get_time())
       << ", log level " << core::log_level_string(config.log_level);
    if (config.from || config.to) {
        ss << ", window [" << config.from.value_or("")
           << ", " << config.to.value_or("") << "]";
    }
    return ss.str();
}

} // namespace app
