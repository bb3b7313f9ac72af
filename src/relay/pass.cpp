// Copyright (c) 2025-2026 The cbtrace Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "relay/pass.h"

#include "core/logging.h"
#include "core/time.h"
#include "logparse/tokenizer.h"

#include <utility>

namespace relay {

namespace {

core::Error at_line(uint64_t line_no, const core::Error& err) {
    return core::make_error(err.code(),
                            "line " + std::to_string(line_no) + ": " +
                            err.message());
}

} // anonymous namespace

core::Result<PassResult> run_pass(logparse::LineSource& source,
                                  const logparse::MetadataTables& tables,
                                  const Classifier& classifier,
                                  const PassOptions& options) {
    PassCounters counters;
    CorrelationEngine engine;

    while (auto raw = source.next_line()) {
        ++counters.lines_read;

        std::string_view line = logparse::trim_line(*raw);
        if (line.empty()) {
            ++counters.blank_lines;
            continue;
        }

        auto tokens = logparse::tokenize_line(line);
        if (!tokens.ok()) {
            if (core::is_line_local(tokens.error().code())) {
                LOG_WARN(core::LogCategory::PARSE,
                         "skipping malformed line " +
                         std::to_string(counters.lines_read) + ": " +
                         std::string{line});
                ++counters.malformed_lines;
                continue;
            }
            return at_line(counters.lines_read, tokens.error());
        }

        if (!core::in_time_window(tokens.value().timestamp,
                                  options.from, options.to)) {
            ++counters.filtered_lines;
            continue;
        }

        auto metadata = logparse::disambiguate(tokens.value(), tables, line);
        if (!metadata.ok()) {
            return at_line(counters.lines_read, metadata.error());
        }

        auto event = classifier.classify(metadata.value(),
                                         tokens.value().body);
        if (!event) {
            ++counters.uninteresting_lines;
            continue;
        }

        LOG_TRACE(core::LogCategory::CLASSIFY,
                  std::string{event_kind_name(event->kind())} + " at " +
                  event->timestamp);
        ++counters.events;

        auto applied = engine.apply(*event);
        if (!applied.ok()) {
            return at_line(counters.lines_read, applied.error());
        }
    }

    // A source that stopped on a read error is not a complete log.
    if (source.error()) {
        return at_line(counters.lines_read + 1, source.error());
    }

    PassResult result;
    result.correlation = std::move(engine).finish();
    result.counters    = counters;

    LOG_INFO(core::LogCategory::CORRELATE,
             "pass done: " + std::to_string(counters.lines_read) +
             " lines, " + std::to_string(counters.events) + " events, " +
             std::to_string(result.correlation.receive_records.size()) +
             " blocks received, " +
             std::to_string(result.correlation.send_count()) + " sends");
    return result;
}

} // namespace relay
