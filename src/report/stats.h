#pragma once
// Copyright (c) 2025-2026 The cbtrace Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Summary statistics over report rows.
//
// Every compute_* function accepts an empty row set and reports zeros.
// Rates are fractions in [0, 1]; the print_* functions render them as
// percentages.
// ---------------------------------------------------------------------------

#include "report/rows.h"

#include <cstdint>
#include <ostream>
#include <vector>

namespace report {

struct ReceivedStats {
    uint64_t total                     = 0;
    uint64_t failed                    = 0;   // tx_missing_count > 0
    double   fail_rate                 = 0.0;
    double   success_rate              = 0.0;
    double   avg_received_size         = 0.0;
    double   avg_bytes_missing         = 0.0;
    double   avg_bytes_missing_failed  = 0.0;
    uint64_t timed                     = 0;   // rows with a reconstruction time
    double   avg_reconstruction_ms     = 0.0;
};

struct SentStats {
    uint64_t total                     = 0;
    uint64_t prefilled                 = 0;   // prefill_size > 0
    double   prefilled_share           = 0.0;
    double   avg_send_size             = 0.0;
    double   avg_send_size_prefilled   = 0.0;
    double   avg_send_size_plain       = 0.0;
    double   avg_available_all         = 0.0;
    double   avg_available_prefilled   = 0.0;
    double   avg_prefill_size          = 0.0;
    uint64_t prefills_fit              = 0;
    double   prefill_fit_rate          = 0.0;
};

struct WindowStats {
    uint64_t count                     = 0;
    double   avg_window                = 0.0;
    double   median_window             = 0.0;
    uint64_t mode_window               = 0;   // smallest value on ties
    uint64_t mode_frequency            = 0;
    double   mode_share                = 0.0;
    double   avg_bytes_used            = 0.0;
    double   avg_bytes_available       = 0.0;
};

/// Sends whose block alone already needs more than one full window.
struct AlreadyOverStats {
    uint64_t total                     = 0;
    uint64_t over                      = 0;   // rtts_without_prefill > 1
    double   over_rate                 = 0.0;
    double   avg_available_over        = 0.0;
    uint64_t over_prefills_fit         = 0;
    double   over_prefill_fit_rate     = 0.0;
};

[[nodiscard]] ReceivedStats compute_received_stats(
    const std::vector<ReceivedRow>& rows);
[[nodiscard]] SentStats compute_sent_stats(const std::vector<SentRow>& rows);
[[nodiscard]] WindowStats compute_window_stats(
    const std::vector<SentRow>& rows);
[[nodiscard]] AlreadyOverStats compute_already_over_stats(
    const std::vector<SentRow>& rows);

void print_received_stats(std::ostream& out, const ReceivedStats& s);
void print_sent_stats(std::ostream& out, const SentStats& s);
void print_window_stats(std::ostream& out, const WindowStats& s);
void print_already_over_stats(std::ostream& out, const AlreadyOverStats& s);

} // namespace report
