// Copyright (c) 2025-2026 The cbtrace Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Unit tests for the core module.

#include "test_framework.h"

#include "app/context.h"
#include "app/logging_init.h"
#include "core/config.h"
#include "core/error.h"
#include "core/fs.h"
#include "core/logging.h"
#include "core/time.h"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

namespace {

std::filesystem::path scratch_path(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() / "cbtrace_test_core";
    std::filesystem::create_directories(dir);
    return dir / name;
}

std::string slurp(const std::filesystem::path& p) {
    std::ifstream in(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in),
                       std::istreambuf_iterator<char>());
}

core::Result<int> half(int v) {
    if (v % 2 != 0) {
        return core::make_error(core::ErrorCode::INTERNAL_ERROR, "odd");
    }
    return v / 2;
}

core::Result<int> quarter(int v) {
    CBT_TRY_ASSIGN(h, half(v));
    CBT_TRY_ASSIGN(q, half(h));
    return q;
}

} // anonymous namespace

// ============================================================================
// Error / Result
// ============================================================================

TEST_CASE(ErrorResult, error_creation) {
    core::Error err(core::ErrorCode::PARSE_MALFORMED_LINE, "bad input");
    CHECK_EQ(err.code(), core::ErrorCode::PARSE_MALFORMED_LINE);
    CHECK_EQ(err.message(), "bad input");
    CHECK(!err.is_ok());
    CHECK(static_cast<bool>(err));  // explicit bool: true when not ok
}

TEST_CASE(ErrorResult, error_none_is_ok) {
    core::Error ok_err;
    CHECK(ok_err.is_ok());
    CHECK_EQ(ok_err.code(), core::ErrorCode::NONE);
    CHECK_EQ(ok_err.format(), "no error");
}

TEST_CASE(ErrorResult, format_names_the_code) {
    core::Error err(core::ErrorCode::CORRELATION_PEER_MISMATCH, "peer=2");
    std::string s = err.format();
    CHECK(s.find("CORRELATION_PEER_MISMATCH") != std::string::npos);
    CHECK(s.find("peer=2") != std::string::npos);
}

TEST_CASE(ErrorResult, only_malformed_lines_are_line_local) {
    CHECK(core::is_line_local(core::ErrorCode::PARSE_MALFORMED_LINE));
    CHECK(!core::is_line_local(core::ErrorCode::PARSE_UNKNOWN_ANNOTATION));
    CHECK(!core::is_line_local(core::ErrorCode::PARSE_DUPLICATE_ANNOTATION));
    CHECK(!core::is_line_local(core::ErrorCode::PARSE_MISSING_CATEGORY));
    CHECK(!core::is_line_local(core::ErrorCode::CORRELATION_PEER_MISMATCH));
}

TEST_CASE(ErrorResult, result_value_or) {
    core::Result<int> good = 42;
    core::Result<int> bad = core::Error(core::ErrorCode::INTERNAL_ERROR, "x");
    CHECK_EQ(good.value_or(0), 42);
    CHECK_EQ(bad.value_or(-1), -1);
}

TEST_CASE(ErrorResult, try_assign_propagates) {
    auto ok = quarter(8);
    CHECK_OK(ok);
    CHECK_EQ(ok.value(), 2);

    // 6 -> 3 fails on the second step
    CHECK_ERR_CODE(quarter(6), core::ErrorCode::INTERNAL_ERROR);
}

// ============================================================================
// Logging
// ============================================================================

TEST_CASE(Logging, level_names_roundtrip) {
    CHECK_EQ(core::log_level_string(core::LogLevel::WARN), "WARN");
    CHECK(core::log_level_from_string("Warning") == core::LogLevel::WARN);
    CHECK(core::log_level_from_string("debug") == core::LogLevel::DEBUG);
    CHECK(!core::log_level_from_string("chatty").has_value());
}

TEST_CASE(Logging, category_filter_and_hook) {
    auto& logger = core::Logger::instance();
    auto saved_level = logger.level();
    auto saved_cats  = logger.enabled_categories();

    std::vector<std::string> seen;
    logger.set_hook([&](core::LogLevel, core::LogCategory,
                        std::string_view msg) {
        seen.emplace_back(msg);
    });
    logger.set_print_to_console(false);
    logger.set_level(core::LogLevel::DEBUG);
    logger.set_categories(core::LogCategory::PARSE);

    LOG_DEBUG(core::LogCategory::PARSE, "kept");
    LOG_DEBUG(core::LogCategory::CORRELATE, "filtered");
    LOG_TRACE(core::LogCategory::PARSE, "below level");

    logger.set_hook(nullptr);
    logger.set_print_to_console(true);
    logger.set_level(saved_level);
    logger.set_categories(saved_cats);

    CHECK_EQ(seen.size(), 1u);
    if (!seen.empty()) CHECK_EQ(seen[0], "kept");
}

// ============================================================================
// Config
// ============================================================================

TEST_CASE(Config, parse_args_keys_flags_positionals) {
    const char* argv[] = {"cbtrace", "-out=run1", "--debug=parse",
                          "-debug=io", "-version", "stats", "debug.log"};
    core::Config cfg;
    cfg.parse_args(7, argv);

    CHECK(cfg.get("out") == std::string{"run1"});
    CHECK(cfg.has("version"));
    CHECK_EQ(cfg.get_list("debug").size(), 2u);
    CHECK_EQ(cfg.positionals().size(), 2u);
    CHECK_EQ(cfg.positionals()[0], "stats");
    CHECK_EQ(cfg.positionals()[1], "debug.log");
}

TEST_CASE(Config, lone_dash_is_positional) {
    const char* argv[] = {"cbtrace", "parse", "-"};
    core::Config cfg;
    cfg.parse_args(3, argv);
    CHECK_EQ(cfg.positionals().size(), 2u);
    CHECK_EQ(cfg.positionals()[1], "-");
}

TEST_CASE(Config, command_line_overrides_file) {
    auto path = scratch_path("override.conf");
    {
        std::ofstream out(path);
        out << "# comment\n"
            << "out = from_file\n"
            << "from=2025-01-01T00:00:00Z\n"
            << "\n";
    }

    const char* argv[] = {"cbtrace", "-out=from_cli"};
    core::Config cfg;
    cfg.parse_args(2, argv);
    CHECK_OK(cfg.parse_file(path));

    CHECK(cfg.get("out") == std::string{"from_cli"});
    CHECK(cfg.get("from") == std::string{"2025-01-01T00:00:00Z"});
    CHECK(!cfg.get("missing").has_value());
}

TEST_CASE(Config, missing_file_is_an_error) {
    core::Config cfg;
    CHECK_ERR_CODE(cfg.parse_file(scratch_path("does_not_exist.conf")),
                   core::ErrorCode::STORAGE_NOT_FOUND);
}

TEST_CASE(Config, empty_key_is_invalid) {
    auto path = scratch_path("bad.conf");
    {
        std::ofstream out(path);
        out << "=value\n";
    }
    core::Config cfg;
    CHECK_ERR_CODE(cfg.parse_file(path), core::ErrorCode::CONFIG_INVALID);
}

// ============================================================================
// App command line
// ============================================================================

TEST_CASE(App, command_and_logfile) {
    const char* argv[] = {"cbtrace", "-out=run1", "-from=2025-06-25T20:00:00Z",
                          "parse", "debug.log"};
    auto r = app::parse_args(5, argv);
    CHECK_OK(r);
    if (!r.ok()) return;
    const auto& cfg = r.value();
    CHECK(cfg.command == app::Command::PARSE);
    CHECK(cfg.log_path == std::filesystem::path{"debug.log"});
    CHECK(cfg.received_csv_path() == std::filesystem::path{"run1_received.csv"});
    CHECK(cfg.sent_csv_path() == std::filesystem::path{"run1_sent.csv"});
    CHECK(cfg.pass_options().from == std::string{"2025-06-25T20:00:00Z"});
    CHECK(!cfg.pass_options().to.has_value());
}

TEST_CASE(App, defaults) {
    const char* argv[] = {"cbtrace", "stats", "-"};
    auto r = app::parse_args(3, argv);
    CHECK_OK(r);
    if (!r.ok()) return;
    CHECK(r.value().command == app::Command::STATS);
    CHECK_EQ(r.value().out_prefix, app::DEFAULT_OUT_PREFIX);
    CHECK(r.value().log_level == core::LogLevel::INFO);
    CHECK(r.value().log_categories == core::LogCategory::ALL);
}

TEST_CASE(App, help_and_version_need_nothing_else) {
    const char* help[] = {"cbtrace", "-help"};
    auto h = app::parse_args(2, help);
    CHECK_OK(h);
    if (h.ok()) CHECK(h.value().command == app::Command::HELP);

    const char* version[] = {"cbtrace", "version"};
    auto v = app::parse_args(2, version);
    CHECK_OK(v);
    if (v.ok()) CHECK(v.value().command == app::Command::VERSION);
}

TEST_CASE(App, usage_errors) {
    const char* none[] = {"cbtrace"};
    CHECK_ERR_CODE(app::parse_args(1, none), core::ErrorCode::CONFIG_INVALID);

    const char* unknown[] = {"cbtrace", "frobnicate", "debug.log"};
    CHECK_ERR_CODE(app::parse_args(3, unknown),
                   core::ErrorCode::CONFIG_INVALID);

    const char* no_log[] = {"cbtrace", "summary"};
    CHECK_ERR_CODE(app::parse_args(2, no_log), core::ErrorCode::CONFIG_INVALID);

    const char* extra[] = {"cbtrace", "parse", "a.log", "b.log"};
    CHECK_ERR_CODE(app::parse_args(4, extra), core::ErrorCode::CONFIG_INVALID);

    const char* reversed[] = {"cbtrace", "-from=2025-06-25T21:00:00Z",
                              "-to=2025-06-25T20:00:00Z", "parse", "a.log"};
    CHECK_ERR_CODE(app::parse_args(5, reversed),
                   core::ErrorCode::CONFIG_INVALID);

    const char* level[] = {"cbtrace", "-loglevel=chatty", "parse", "a.log"};
    CHECK_ERR_CODE(app::parse_args(4, level), core::ErrorCode::CONFIG_INVALID);
}

TEST_CASE(App, debug_categories_accumulate) {
    const char* argv[] = {"cbtrace", "-debug=parse,correlate", "-debug=io",
                          "-loglevel=debug", "summary", "a.log"};
    auto r = app::parse_args(6, argv);
    CHECK_OK(r);
    if (!r.ok()) return;
    CHECK(r.value().log_level == core::LogLevel::DEBUG);
    CHECK(r.value().log_categories ==
          (core::LogCategory::PARSE | core::LogCategory::CORRELATE |
           core::LogCategory::IO));

    CHECK(app::parse_log_categories("1").value() == core::LogCategory::ALL);
    CHECK_ERR_CODE(app::parse_log_categories("parse,bogus"),
                   core::ErrorCode::CONFIG_INVALID);
}

TEST_CASE(App, config_file_supplies_options) {
    auto path = scratch_path("app.conf");
    {
        std::ofstream out(path);
        out << "out=from_file\n"
            << "to=2025-06-25T23:00:00Z\n";
    }
    std::string conf = "-conf=" + path.string();
    const char* argv[] = {"cbtrace", conf.c_str(), "-out=cli", "parse",
                          "a.log"};
    auto r = app::parse_args(5, argv);
    CHECK_OK(r);
    if (!r.ok()) return;
    CHECK_EQ(r.value().out_prefix, "cli");
    CHECK(r.value().to == std::string{"2025-06-25T23:00:00Z"});

    const char* missing[] = {"cbtrace", "-conf=/nonexistent/cbtrace.conf",
                             "parse", "a.log"};
    CHECK_ERR_CODE(app::parse_args(4, missing),
                   core::ErrorCode::STORAGE_NOT_FOUND);
}

// ============================================================================
// Time
// ============================================================================

TEST_CASE(Time, parse_node_timestamp_micros) {
    auto t = core::parse_iso8601_micros("2025-06-25T20:15:37.882709Z");
    CHECK(t.has_value());
    if (t) CHECK_EQ(*t, int64_t{1750882537} * 1'000'000 + 882709);
}

TEST_CASE(Time, parse_fraction_widths) {
    auto base = core::parse_iso8601_micros("2025-06-25T20:15:37Z");
    auto ms   = core::parse_iso8601_micros("2025-06-25T20:15:37.5Z");
    auto ns   = core::parse_iso8601_micros("2025-06-25T20:15:37.123456789Z");
    CHECK(base && ms && ns);
    if (base && ms && ns) {
        CHECK_EQ(*ms - *base, 500000);
        CHECK_EQ(*ns - *base, 123456);
    }
}

TEST_CASE(Time, parse_rejects_garbage) {
    CHECK(!core::parse_iso8601_micros("2025-06-25 20:15:37Z").has_value());
    CHECK(!core::parse_iso8601_micros("2025-06-25T20:15:37").has_value());
    CHECK(!core::parse_iso8601_micros("2025-13-25T20:15:37Z").has_value());
    CHECK(!core::parse_iso8601_micros("2025-06-25T20:15:37.Z").has_value());
    CHECK(!core::parse_iso8601_micros("T1").has_value());
}

TEST_CASE(Time, format_epoch) {
    CHECK_EQ(core::format_iso8601(0), "1970-01-01T00:00:00Z");
}

TEST_CASE(Time, window_bounds_are_inclusive_and_optional) {
    std::optional<std::string> from = "2025-06-25T20:00:00Z";
    std::optional<std::string> to   = "2025-06-25T21:00:00Z";
    std::optional<std::string> none;

    CHECK(core::in_time_window("2025-06-25T20:00:00Z", from, to));
    CHECK(core::in_time_window("2025-06-25T20:30:00.000001Z", from, to));
    CHECK(core::in_time_window("2025-06-25T21:00:00Z", from, to));
    CHECK(!core::in_time_window("2025-06-25T19:59:59.999999Z", from, to));
    CHECK(!core::in_time_window("2025-06-25T21:00:00.000001Z", from, to));
    CHECK(core::in_time_window("anything", none, none));
    CHECK(core::in_time_window("2030-01-01T00:00:00Z", from, none));
}

// ============================================================================
// Filesystem
// ============================================================================

TEST_CASE(Fs, write_file_replaces_content) {
    auto path = scratch_path("out/export.csv");
    CHECK_OK(core::fs::write_file(path, "first\n"));
    CHECK_OK(core::fs::write_file(path, "second\n"));
    CHECK(core::fs::file_exists(path));
    CHECK_EQ(slurp(path), "second\n");
    CHECK(core::fs::file_size(path) == uint64_t{7});
}

TEST_CASE(Fs, write_file_into_a_file_fails) {
    auto blocker = scratch_path("blocker");
    CHECK_OK(core::fs::write_file(blocker, "x"));
    CHECK_ERR_CODE(core::fs::write_file(blocker / "child.csv", "y"),
                   core::ErrorCode::STORAGE_WRITE_FAIL);
}
