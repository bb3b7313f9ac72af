#pragma once
// Copyright (c) 2025-2026 The cbtrace Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Correlation engine
// ---------------------------------------------------------------------------
// Folds the classified event stream, in log order, into per-block receive
// records and per-transmission send records. The node logs a compact block
// send as up to three consecutive lines (announce/getdata, send, max-send);
// the engine stitches them together through three pending slots:
//
//   Received ............ opens pending_reconstruction
//   Reconstructed ....... closes pending_reconstruction
//   Announced/Requested . appends a send record, opens pending_send
//   Sent ................ fills it, moves it to pending_window
//   WindowSizeLogged .... fills tcp_window_size, closes pending_window
//
// Pending slots refer to send records by (hash, index) so that growth of
// a send list never invalidates them.
// ---------------------------------------------------------------------------

#include "core/error.h"
#include "relay/events.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace relay {

struct BlockReceiveRecord {
    std::string                time_received;
    std::optional<std::string> time_reconstructed;
    uint64_t received_size       = 0;
    uint64_t bytes_missing       = 0;
    uint64_t tx_missing_count    = 0;
    uint64_t prefilled_tx_count  = 0;
    uint64_t mempool_tx_count    = 0;
    uint64_t extra_pool_tx_count = 0;

    [[nodiscard]] bool is_reconstructed() const noexcept {
        return time_reconstructed.has_value();
    }

    bool operator==(const BlockReceiveRecord&) const = default;
};

/// What caused the node to push the compact block to the peer.
enum class SendTrigger : uint8_t {
    ANNOUNCED = 0,   // high-bandwidth announcement
    REQUESTED = 1,   // getdata from the peer
};

[[nodiscard]] std::string_view send_trigger_name(SendTrigger trigger) noexcept;

struct BlockSendRecord {
    std::string                block_hash;
    uint64_t                   peer_id = 0;
    SendTrigger                trigger = SendTrigger::ANNOUNCED;
    std::optional<std::string> time_sent;
    uint64_t                   send_size       = 0;
    uint64_t                   tcp_window_size = 0;

    bool operator==(const BlockSendRecord&) const = default;
};

using ReceiveRecords = std::unordered_map<std::string, BlockReceiveRecord>;
using SendRecords =
    std::unordered_map<std::string, std::vector<BlockSendRecord>>;

struct CorrelationStats {
    uint64_t events                     = 0;
    uint64_t receives                   = 0;
    uint64_t reconstructions            = 0;
    uint64_t orphaned_receives          = 0;
    uint64_t unexpected_reconstructions = 0;
    uint64_t sends_opened               = 0;
    uint64_t sends_completed            = 0;
    uint64_t windows_recorded           = 0;
    uint64_t dropped_unknown_block      = 0;   // announce/getdata, no receive
    uint64_t dropped_sends              = 0;   // send without announce
    uint64_t dropped_windows            = 0;   // max-send without send

    bool operator==(const CorrelationStats&) const = default;
};

/// Final, immutable output of a pass.
struct CorrelationResult {
    ReceiveRecords   receive_records;
    SendRecords      send_records;
    CorrelationStats stats;

    [[nodiscard]] const BlockReceiveRecord* find_receive(
        const std::string& hash) const;

    /// Send records for @p hash, empty if none.
    [[nodiscard]] const std::vector<BlockSendRecord>& sends_for(
        const std::string& hash) const;

    /// Total number of send records across all hashes.
    [[nodiscard]] size_t send_count() const noexcept;
};

/// Position of a send record inside SendRecords.
struct SendCursor {
    std::string block_hash;
    size_t      index = 0;

    bool operator==(const SendCursor&) const = default;
};

struct CorrelationState {
    ReceiveRecords             receive_records;
    SendRecords                send_records;
    std::optional<std::string> pending_reconstruction;
    std::optional<SendCursor>  pending_send;
    std::optional<SendCursor>  pending_window;
};

class CorrelationEngine {
public:
    /// Apply one event.
    /// @returns CORRELATION_PEER_MISMATCH if a Sent event names a different
    ///          peer than the pending announce/getdata. The engine is left
    ///          without a record for that transmission; callers are
    ///          expected to abandon the pass.
    [[nodiscard]] core::Result<void> apply(const ClassifiedEvent& event);

    /// Discard pending slots and hand out the committed records.
    [[nodiscard]] CorrelationResult finish() &&;

    [[nodiscard]] const CorrelationState& state() const noexcept {
        return state_;
    }
    [[nodiscard]] const CorrelationStats& stats() const noexcept {
        return stats_;
    }

private:
    void on_received(const std::string& ts, const ReceivedEvent& ev);
    void on_reconstructed(const std::string& ts, const ReconstructedEvent& ev);
    void on_send_opened(const std::string& hash, uint64_t peer,
                        SendTrigger trigger);
    core::Result<void> on_sent(const std::string& ts, const SentEvent& ev);
    void on_window(const WindowSizeEvent& ev);

    BlockSendRecord& record_at(const SendCursor& cursor);

    CorrelationState state_;
    CorrelationStats stats_;
};

} // namespace relay
