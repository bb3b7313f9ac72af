// Copyright (c) 2025-2026 The cbtrace Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "relay/correlation.h"

#include "core/logging.h"

#include <cstddef>
#include <utility>

namespace relay {

std::string_view send_trigger_name(SendTrigger trigger) noexcept {
    switch (trigger) {
        case SendTrigger::ANNOUNCED: return "announced";
        case SendTrigger::REQUESTED: return "requested";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// CorrelationResult
// ---------------------------------------------------------------------------

const BlockReceiveRecord* CorrelationResult::find_receive(
    const std::string& hash) const {
    auto it = receive_records.find(hash);
    return it == receive_records.end() ? nullptr : &it->second;
}

const std::vector<BlockSendRecord>& CorrelationResult::sends_for(
    const std::string& hash) const {
    static const std::vector<BlockSendRecord> empty;
    auto it = send_records.find(hash);
    return it == send_records.end() ? empty : it->second;
}

size_t CorrelationResult::send_count() const noexcept {
    size_t n = 0;
    for (const auto& [hash, sends] : send_records) n += sends.size();
    return n;
}

// ---------------------------------------------------------------------------
// CorrelationEngine
// ---------------------------------------------------------------------------

core::Result<void> CorrelationEngine::apply(const ClassifiedEvent& event) {
    ++stats_.events;

    switch (event.kind()) {
        case EventKind::RECEIVED:
            on_received(event.timestamp,
                        std::get<ReceivedEvent>(event.payload));
            break;
        case EventKind::RECONSTRUCTED:
            on_reconstructed(event.timestamp,
                             std::get<ReconstructedEvent>(event.payload));
            break;
        case EventKind::ANNOUNCED: {
            const auto& ev = std::get<AnnouncedEvent>(event.payload);
            on_send_opened(ev.block_hash, ev.peer_id, SendTrigger::ANNOUNCED);
            break;
        }
        case EventKind::REQUESTED: {
            const auto& ev = std::get<RequestedEvent>(event.payload);
            on_send_opened(ev.block_hash, ev.peer_id, SendTrigger::REQUESTED);
            break;
        }
        case EventKind::SENT:
            return on_sent(event.timestamp,
                           std::get<SentEvent>(event.payload));
        case EventKind::WINDOW_SIZE_LOGGED:
            on_window(std::get<WindowSizeEvent>(event.payload));
            break;
    }
    return core::make_ok();
}

CorrelationResult CorrelationEngine::finish() && {
    if (state_.pending_reconstruction || state_.pending_send ||
        state_.pending_window) {
        LOG_DEBUG(core::LogCategory::CORRELATE,
                  "discarding pending state at end of stream");
    }

    CorrelationResult result;
    result.receive_records = std::move(state_.receive_records);
    result.send_records    = std::move(state_.send_records);
    result.stats           = stats_;
    state_ = CorrelationState{};
    return result;
}

BlockSendRecord& CorrelationEngine::record_at(const SendCursor& cursor) {
    return state_.send_records.at(cursor.block_hash).at(cursor.index);
}

// ---------------------------------------------------------------------------
// Transitions
// ---------------------------------------------------------------------------

void CorrelationEngine::on_received(const std::string& ts,
                                    const ReceivedEvent& ev) {
    ++stats_.receives;

    // A block still awaiting reconstruction when another arrives never
    // completed; its receipt is dropped.
    if (state_.pending_reconstruction &&
        *state_.pending_reconstruction != ev.block_hash) {
        LOG_DEBUG(core::LogCategory::CORRELATE,
                  "orphaned receive of " + *state_.pending_reconstruction);
        state_.receive_records.erase(*state_.pending_reconstruction);
        ++stats_.orphaned_receives;
    }

    BlockReceiveRecord rec;
    rec.time_received = ts;
    rec.received_size = ev.cmpctblock_bytes;
    state_.receive_records[ev.block_hash] = std::move(rec);
    state_.pending_reconstruction = ev.block_hash;
}

void CorrelationEngine::on_reconstructed(const std::string& ts,
                                         const ReconstructedEvent& ev) {
    if (state_.pending_reconstruction != ev.block_hash) {
        LOG_WARN(core::LogCategory::CORRELATE,
                 "reconstruction of " + ev.block_hash + " at " + ts +
                 " without a pending receive, skipped");
        ++stats_.unexpected_reconstructions;
        return;
    }

    BlockReceiveRecord& rec = state_.receive_records[ev.block_hash];
    rec.tx_missing_count    = ev.requested_count;
    rec.bytes_missing       = ev.requested_bytes;
    rec.prefilled_tx_count  = ev.prefilled_count;
    rec.mempool_tx_count    = ev.mempool_count;
    rec.extra_pool_tx_count = ev.extra_pool_count;
    rec.time_reconstructed  = ts;

    state_.pending_reconstruction.reset();
    ++stats_.reconstructions;
}

void CorrelationEngine::on_send_opened(const std::string& hash, uint64_t peer,
                                       SendTrigger trigger) {
    if (!state_.receive_records.contains(hash)) {
        LOG_DEBUG(core::LogCategory::CORRELATE,
                  std::string{send_trigger_name(trigger)} + " send of " +
                  hash + " to peer=" + std::to_string(peer) +
                  " for a block never received, dropped");
        ++stats_.dropped_unknown_block;
        return;
    }

    auto& sends = state_.send_records[hash];
    BlockSendRecord rec;
    rec.block_hash = hash;
    rec.peer_id    = peer;
    rec.trigger    = trigger;
    sends.push_back(std::move(rec));

    state_.pending_send = SendCursor{hash, sends.size() - 1};
    ++stats_.sends_opened;
}

core::Result<void> CorrelationEngine::on_sent(const std::string& ts,
                                              const SentEvent& ev) {
    if (!state_.pending_send) {
        LOG_DEBUG(core::LogCategory::CORRELATE,
                  "cmpctblock send to peer=" + std::to_string(ev.peer_id) +
                  " without a pending announce, dropped");
        ++stats_.dropped_sends;
        return core::make_ok();
    }

    SendCursor cursor = std::move(*state_.pending_send);
    state_.pending_send.reset();
    BlockSendRecord& rec = record_at(cursor);

    if (rec.peer_id != ev.peer_id) {
        std::string msg = "cmpctblock for " + cursor.block_hash +
                          " announced to peer=" + std::to_string(rec.peer_id) +
                          " but sent to peer=" + std::to_string(ev.peer_id);

        auto& sends = state_.send_records[cursor.block_hash];
        sends.erase(sends.begin() + static_cast<std::ptrdiff_t>(cursor.index));
        if (state_.pending_window &&
            state_.pending_window->block_hash == cursor.block_hash &&
            state_.pending_window->index > cursor.index) {
            --state_.pending_window->index;
        }
        if (sends.empty()) state_.send_records.erase(cursor.block_hash);

        return core::make_error(core::ErrorCode::CORRELATION_PEER_MISMATCH,
                                std::move(msg));
    }

    rec.send_size = ev.cmpctblock_bytes;
    rec.time_sent = ts;
    state_.pending_window = std::move(cursor);
    ++stats_.sends_completed;
    return core::make_ok();
}

void CorrelationEngine::on_window(const WindowSizeEvent& ev) {
    if (!state_.pending_window) {
        ++stats_.dropped_windows;
        return;
    }

    record_at(*state_.pending_window).tcp_window_size = ev.max_send_bytes;
    state_.pending_window.reset();
    ++stats_.windows_recorded;
}

} // namespace relay
