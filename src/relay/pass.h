#pragma once
// Copyright (c) 2025-2026 The cbtrace Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "logparse/line_source.h"
#include "logparse/metadata.h"
#include "relay/classifier.h"
#include "relay/correlation.h"

#include <cstdint>
#include <optional>
#include <string>

namespace relay {

/// Options for a single pass over a log.
struct PassOptions {
    /// Inclusive timestamp bounds, compared lexically. Unset means open.
    std::optional<std::string> from;
    std::optional<std::string> to;
};

/// Line accounting for one pass.
struct PassCounters {
    uint64_t lines_read          = 0;
    uint64_t blank_lines         = 0;
    uint64_t malformed_lines     = 0;
    uint64_t filtered_lines      = 0;   // outside the time window
    uint64_t uninteresting_lines = 0;
    uint64_t events              = 0;

    bool operator==(const PassCounters&) const = default;
};

struct PassResult {
    CorrelationResult correlation;
    PassCounters      counters;
};

/// Drive @p source through tokenizer, disambiguator, classifier and the
/// correlation engine.
///
/// Malformed lines are logged and skipped. Any other parse failure, and a
/// peer mismatch, aborts the pass; the returned error keeps its code and
/// has the 1-based line number prepended to its message.
[[nodiscard]] core::Result<PassResult> run_pass(
    logparse::LineSource& source,
    const logparse::MetadataTables& tables,
    const Classifier& classifier,
    const PassOptions& options = {});

} // namespace relay
