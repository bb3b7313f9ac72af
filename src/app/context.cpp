// Copyright (c) 2025-2026 The cbtrace Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "app/context.h"
#include "app/logging_init.h"

#include "core/config.h"

#include <iostream>
#include <sstream>
#include <string>
#include <utility>

namespace app {

// ---------------------------------------------------------------------------
// Version helpers
// ---------------------------------------------------------------------------

std::string get_version_string() {
    std::ostringstream ss;
    ss << VERSION_MAJOR << '.' << VERSION_MINOR << '.' << VERSION_PATCH;
    if (VERSION_SUFFIX[0] != '\0') {
        ss << '-' << VERSION_SUFFIX;
    }
    return ss.str();
}

std::string get_client_name() {
    return "cbtrace v" + get_version_string();
}

std::optional<Command> command_from_string(std::string_view name) noexcept {
    if (name == "parse")   return Command::PARSE;
    if (name == "stats")   return Command::STATS;
    if (name == "summary") return Command::SUMMARY;
    if (name == "help")    return Command::HELP;
    if (name == "version") return Command::VERSION;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// AppConfig -- derived helpers
// ---------------------------------------------------------------------------

relay::PassOptions AppConfig::pass_options() const {
    return relay::PassOptions{from, to};
}

std::filesystem::path AppConfig::received_csv_path() const {
    return out_prefix + "_received.csv";
}

std::filesystem::path AppConfig::sent_csv_path() const {
    return out_prefix + "_sent.csv";
}

// ---------------------------------------------------------------------------
// Internal: apply core::Config values
// ---------------------------------------------------------------------------

namespace {

core::Result<void> apply_config(const core::Config& cfg, AppConfig& ac) {
    if (auto v = cfg.get(core::CONF_OUT); v && !v->empty()) {
        ac.out_prefix = *v;
    }
    if (auto v = cfg.get(core::CONF_FROM); v && !v->empty()) ac.from = *v;
    if (auto v = cfg.get(core::CONF_TO); v && !v->empty())   ac.to = *v;

    if (auto v = cfg.get(core::CONF_LOGLEVEL)) {
        auto level = core::log_level_from_string(*v);
        if (!level) {
            return core::make_error(core::ErrorCode::CONFIG_INVALID,
                                    "unknown log level: " + *v);
        }
        ac.log_level = *level;
    }

    // -debug may be repeated and each value may be a comma list.
    auto debug = cfg.get_list(core::CONF_DEBUG);
    if (!debug.empty()) {
        core::LogCategory mask = core::LogCategory::NONE;
        for (const auto& item : debug) {
            CBT_TRY_ASSIGN(cats, parse_log_categories(item));
            mask = mask | cats;
        }
        ac.log_categories = mask;
    }

    if (auto v = cfg.get(core::CONF_LOGFILE); v && !v->empty()) {
        ac.log_file = std::filesystem::path{*v};
    }

    if (ac.from && ac.to && *ac.to < *ac.from) {
        return core::make_error(core::ErrorCode::CONFIG_INVALID,
                                "-to=" + *ac.to + " is before -from=" +
                                *ac.from);
    }
    return core::make_ok();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// parse_args
// ---------------------------------------------------------------------------

core::Result<AppConfig> parse_args(int argc, const char* const argv[]) {
    AppConfig config;

    core::Config raw;
    raw.parse_args(argc, argv);

    // Early-exit flags win over everything else on the line.
    if (raw.has("help") || raw.has("h") || raw.has("?")) {
        config.command = Command::HELP;
        return config;
    }
    if (raw.has("version")) {
        config.command = Command::VERSION;
        return config;
    }

    if (auto cf = raw.get(core::CONF_CONF); cf && !cf->empty()) {
        CBT_TRY_VOID(raw.parse_file(std::filesystem::path{*cf}));
    }
    CBT_TRY_VOID(apply_config(raw, config));

    const auto& pos = raw.positionals();
    if (pos.empty()) {
        return core::make_error(core::ErrorCode::CONFIG_INVALID,
                                "no command given (try -help)");
    }

    auto cmd = command_from_string(pos[0]);
    if (!cmd) {
        return core::make_error(core::ErrorCode::CONFIG_INVALID,
                                "unknown command: " + pos[0]);
    }
    config.command = *cmd;
    if (config.command == Command::HELP ||
        config.command == Command::VERSION) {
        return config;
    }

    if (pos.size() < 2 || pos[1].empty()) {
        return core::make_error(core::ErrorCode::CONFIG_INVALID,
                                pos[0] + ": missing <logfile>");
    }
    if (pos.size() > 2) {
        return core::make_error(core::ErrorCode::CONFIG_INVALID,
                                pos[0] + ": unexpected argument " + pos[2]);
    }
    config.log_path = pos[1];

    return config;
}

// ---------------------------------------------------------------------------
// print_usage
// ---------------------------------------------------------------------------

void print_usage() {
    std::cout
        << get_client_name() << " -- compact block relay log analyzer\n"
        << "\n"
        << "Usage:\n"
        << "  cbtrace [options] <command> <logfile>\n"
        << "\n"
        << "Commands:\n"
        << "  parse <logfile>           Write <out>_received.csv and <out>_sent.csv\n"
        << "  stats <logfile>           Print reconstruction, send and window statistics\n"
        << "  summary <logfile>         Print line and event counters for the pass\n"
        << "\n"
        << "Options:\n"
        << "  -h, -help, -?             Show this help message and exit\n"
        << "  -version                  Show version information and exit\n"
        << "  -conf=<file>              Read options from a key=value file\n"
        << "  -out=<prefix>             Output file prefix (default: "
        << DEFAULT_OUT_PREFIX << ")\n"
        << "\n"
        << "Time window (inclusive, compared as text):\n"
        << "  -from=<timestamp>         Ignore lines logged before this time\n"
        << "  -to=<timestamp>           Ignore lines logged after this time\n"
        << "\n"
        << "Logging:\n"
        << "  -loglevel=<level>         trace, debug, info, warn, error, fatal, off\n"
        << "  -debug=<cat,...>          parse, classify, correlate, report, config, io, all\n"
        << "  -logfile=<file>           Also append log output to this file\n"
        << "\n";
}

// ---------------------------------------------------------------------------
// print_version
// ---------------------------------------------------------------------------

void print_version() {
    std::cout
        << get_client_name() << "\n"
        << "Copyright (c) 2025-2026 The cbtrace Developers\n"
        << "Distributed under the MIT software license.\n"
        << "\n"
        << "Compiler: "
#if defined(__clang__)
        << "Clang " << __clang_major__ << "." << __clang_minor__
#elif defined(_MSC_VER)
        << "MSVC " << _MSC_VER
#elif defined(__GNUC__)
        << "GCC " << __GNUC__ << "." << __GNUC_MINOR__
#else
        << "Unknown"
#endif
        << "\n"
        << "C++ standard: " << __cplusplus << "\n";
}

} // namespace app
