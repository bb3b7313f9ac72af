// Copyright (c) 2025-2026 The cbtrace Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.
//
// cbtrace -- compact block relay log analyzer.

#include "app/context.h"
#include "app/logging_init.h"
#include "logparse/line_source.h"
#include "relay/pass.h"
#include "report/csv.h"
#include "report/rows.h"
#include "report/stats.h"

#include <cstdlib>
#include <iostream>
#include <memory>

namespace {

int fail(const core::Error& err) {
    std::cerr << "Error: " << err.message() << std::endl;
    return EXIT_FAILURE;
}

core::Result<std::unique_ptr<logparse::LineSource>> open_source(
    const std::filesystem::path& path) {
    // "-" reads the log from standard input.
    if (path == "-") {
        return std::unique_ptr<logparse::LineSource>(
            std::make_unique<logparse::StreamLineSource>(std::cin));
    }
    CBT_TRY_ASSIGN(file, logparse::FileLineSource::open(path));
    return std::unique_ptr<logparse::LineSource>(
        std::make_unique<logparse::FileLineSource>(std::move(file)));
}

core::Result<void> write_exports(const app::AppConfig& config,
                                 const relay::CorrelationResult& result) {
    auto received = report::build_received_rows(result);
    auto sent     = report::build_sent_rows(result);
    CBT_TRY_VOID(report::write_received_csv(config.received_csv_path(),
                                            received));
    CBT_TRY_VOID(report::write_sent_csv(config.sent_csv_path(), sent));

    std::cout << "Wrote " << received.size() << " received rows to "
              << config.received_csv_path().string() << "\n"
              << "Wrote " << sent.size() << " sent rows to "
              << config.sent_csv_path().string() << "\n";
    return core::make_ok();
}

void print_stats(const relay::CorrelationResult& result) {
    auto received = report::build_received_rows(result);
    auto sent     = report::build_sent_rows(result);

    report::print_received_stats(std::cout,
                                 report::compute_received_stats(received));
    std::cout << "\n";
    report::print_sent_stats(std::cout, report::compute_sent_stats(sent));
    std::cout << "\n";
    report::print_window_stats(std::cout, report::compute_window_stats(sent));
    std::cout << "\n";
    report::print_already_over_stats(
        std::cout, report::compute_already_over_stats(sent));
}

void print_summary(const relay::PassResult& pass) {
    const auto& c = pass.counters;
    const auto& s = pass.correlation.stats;
    std::cout
        << "Lines\n"
        << "  read:                       " << c.lines_read << "\n"
        << "  blank:                      " << c.blank_lines << "\n"
        << "  malformed:                  " << c.malformed_lines << "\n"
        << "  outside time window:        " << c.filtered_lines << "\n"
        << "  uninteresting:              " << c.uninteresting_lines << "\n"
        << "  events:                     " << c.events << "\n"
        << "\n"
        << "Correlation\n"
        << "  receives:                   " << s.receives << "\n"
        << "  reconstructions:            " << s.reconstructions << "\n"
        << "  orphaned receives:          " << s.orphaned_receives << "\n"
        << "  unexpected reconstructions: " << s.unexpected_reconstructions << "\n"
        << "  sends opened:               " << s.sends_opened << "\n"
        << "  sends completed:            " << s.sends_completed << "\n"
        << "  windows recorded:           " << s.windows_recorded << "\n"
        << "  dropped (unknown block):    " << s.dropped_unknown_block << "\n"
        << "  dropped sends:              " << s.dropped_sends << "\n"
        << "  dropped windows:            " << s.dropped_windows << "\n"
        << "\n"
        << "Records\n"
        << "  blocks received:            "
        << pass.correlation.receive_records.size() << "\n"
        << "  send records:               " << pass.correlation.send_count()
        << "\n";
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    auto parsed = app::parse_args(argc, argv);
    if (!parsed.ok()) {
        int rc = fail(parsed.error());
        std::cerr << "Run 'cbtrace -help' for usage." << std::endl;
        return rc;
    }
    const app::AppConfig& config = parsed.value();

    if (config.command == app::Command::HELP) {
        app::print_usage();
        return EXIT_SUCCESS;
    }
    if (config.command == app::Command::VERSION) {
        app::print_version();
        return EXIT_SUCCESS;
    }

    auto log_init = app::init_logging(config);
    if (!log_init.ok()) return fail(log_init.error());

    auto source = open_source(config.log_path);
    if (!source.ok()) return fail(source.error());

    auto tables     = logparse::MetadataTables::node_defaults();
    auto classifier = relay::Classifier::node_defaults();

    auto pass = relay::run_pass(*source.value(), tables, classifier,
                                config.pass_options());
    if (!pass.ok()) return fail(pass.error());

    switch (config.command) {
        case app::Command::PARSE: {
            auto written = write_exports(config, pass.value().correlation);
            if (!written.ok()) return fail(written.error());
            break;
        }
        case app::Command::STATS:
            print_stats(pass.value().correlation);
            break;
        case app::Command::SUMMARY:
            print_summary(pass.value());
            break;
        case app::Command::HELP:
        case app::Command::VERSION:
            break;
    }

    core::Logger::instance().flush();
    return EXIT_SUCCESS;
}
