// Copyright (c) 2025-2026 The cbtrace Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "report/rows.h"

#include "core/logging.h"
#include "core/time.h"

#include <algorithm>
#include <tuple>
#include <utility>

namespace report {

std::vector<ReceivedRow> build_received_rows(
    const relay::CorrelationResult& result) {
    std::vector<ReceivedRow> rows;
    rows.reserve(result.receive_records.size());

    for (const auto& [hash, rec] : result.receive_records) {
        ReceivedRow row;
        row.block_hash          = hash;
        row.time_received       = rec.time_received;
        row.time_reconstructed  = rec.time_reconstructed;
        row.received_size       = rec.received_size;
        row.bytes_missing       = rec.bytes_missing;
        row.tx_missing_count    = rec.tx_missing_count;
        row.prefilled_tx_count  = rec.prefilled_tx_count;
        row.mempool_tx_count    = rec.mempool_tx_count;
        row.extra_pool_tx_count = rec.extra_pool_tx_count;

        if (rec.time_reconstructed) {
            auto t0 = core::parse_iso8601_micros(rec.time_received);
            auto t1 = core::parse_iso8601_micros(*rec.time_reconstructed);
            if (t0 && t1) row.reconstruction_time_us = *t1 - *t0;
        }
        rows.push_back(std::move(row));
    }

    std::sort(rows.begin(), rows.end(),
              [](const ReceivedRow& a, const ReceivedRow& b) {
                  return std::tie(a.time_received, a.block_hash) <
                         std::tie(b.time_received, b.block_hash);
              });
    return rows;
}

std::vector<SentRow> build_sent_rows(const relay::CorrelationResult& result) {
    std::vector<SentRow> rows;
    rows.reserve(result.send_count());
    size_t skipped = 0;

    for (const auto& [hash, sends] : result.send_records) {
        const relay::BlockReceiveRecord* received = result.find_receive(hash);
        if (!received) {
            skipped += sends.size();
            continue;
        }

        for (const auto& send : sends) {
            SentRow row;
            row.block_hash             = hash;
            row.time_sent              = send.time_sent;
            row.peer_id                = send.peer_id;
            row.trigger                = send.trigger;
            row.tcp_window_size        = send.tcp_window_size;
            row.send_size              = send.send_size;
            row.received_size          = received->received_size;
            row.received_bytes_missing = received->bytes_missing;
            row.received_tx_missing    = received->tx_missing_count;

            row.prefill_size = static_cast<int64_t>(send.send_size) -
                               static_cast<int64_t>(received->received_size);
            if (send.tcp_window_size > 0) {
                row.window_bytes_used =
                    received->received_size % send.tcp_window_size;
                row.window_bytes_available =
                    send.tcp_window_size - row.window_bytes_used;
                row.rtts_without_prefill =
                    received->received_size / send.tcp_window_size;
            }
            rows.push_back(std::move(row));
        }
    }

    if (skipped > 0) {
        LOG_DEBUG(core::LogCategory::REPORT,
                  std::to_string(skipped) +
                  " send records without a receive record left out");
    }

    std::stable_sort(rows.begin(), rows.end(),
                     [](const SentRow& a, const SentRow& b) {
                         return std::tie(a.time_sent, a.block_hash,
                                         a.peer_id) <
                                std::tie(b.time_sent, b.block_hash,
                                         b.peer_id);
                     });
    return rows;
}

} // namespace report
