#pragma once
// Copyright (c) 2025-2026 The cbtrace Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Report rows -- flat, derived views over a CorrelationResult.
//
// The window columns model how much of the first TCP round trip the
// compact block left unused: a block of received_size bytes fills
// received_size / window full windows and leaves window - (received_size %
// window) bytes of the last one for prefilled transactions.
// ---------------------------------------------------------------------------

#include "relay/correlation.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace report {

struct ReceivedRow {
    std::string                block_hash;
    std::string                time_received;
    std::optional<std::string> time_reconstructed;
    uint64_t                   received_size       = 0;
    uint64_t                   bytes_missing       = 0;
    uint64_t                   tx_missing_count    = 0;
    uint64_t                   prefilled_tx_count  = 0;
    uint64_t                   mempool_tx_count    = 0;
    uint64_t                   extra_pool_tx_count = 0;

    /// time_reconstructed - time_received, if both timestamps parse.
    std::optional<int64_t>     reconstruction_time_us;
};

struct SentRow {
    std::string                block_hash;
    std::optional<std::string> time_sent;
    uint64_t                   peer_id         = 0;
    relay::SendTrigger         trigger         = relay::SendTrigger::ANNOUNCED;
    uint64_t                   tcp_window_size = 0;
    uint64_t                   send_size       = 0;

    // Joined from the block's receive record.
    uint64_t                   received_size          = 0;
    uint64_t                   received_bytes_missing = 0;
    uint64_t                   received_tx_missing    = 0;

    // Derived. The window columns are zero when no window was logged.
    int64_t                    prefill_size           = 0;
    uint64_t                   window_bytes_used      = 0;
    uint64_t                   window_bytes_available = 0;
    uint64_t                   rtts_without_prefill   = 0;
};

/// One row per receive record, ordered by time_received then hash.
[[nodiscard]] std::vector<ReceivedRow> build_received_rows(
    const relay::CorrelationResult& result);

/// One row per send record whose block still has a receive record,
/// ordered by time_sent, hash, then peer. Unsent records sort first.
[[nodiscard]] std::vector<SentRow> build_sent_rows(
    const relay::CorrelationResult& result);

} // namespace report
