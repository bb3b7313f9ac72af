#pragma once
// Copyright (c) 2025-2026 The cbtrace Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Compact block relay events
// ---------------------------------------------------------------------------
// One event per interesting log line. The payload is resolved once, at
// classification time, into a fixed-shape struct per kind; downstream code
// never looks fields up by name.
//
//   RECEIVED            "Initialized PartiallyDownloadedBlock for block H
//                        using a cmpctblock of N bytes"
//   RECONSTRUCTED       "Successfully reconstructed block H with ..."
//   ANNOUNCED           "PeerManager::NewPoWValidBlock sending
//                        header-and-ids H to peer=P"
//   REQUESTED           "received getdata for: cmpctblock H peer=P"
//   SENT                "sending cmpctblock (N bytes) peer=P"
//   WINDOW_SIZE_LOGGED  "- Max send per-rtt: N bytes"
// ---------------------------------------------------------------------------

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace relay {

/// Order matches the alternatives of EventPayload.
enum class EventKind : uint8_t {
    RECEIVED           = 0,
    RECONSTRUCTED      = 1,
    ANNOUNCED          = 2,
    REQUESTED          = 3,
    SENT               = 4,
    WINDOW_SIZE_LOGGED = 5,
};

[[nodiscard]] std::string_view event_kind_name(EventKind kind) noexcept;

struct ReceivedEvent {
    std::string block_hash;
    uint64_t    cmpctblock_bytes = 0;

    bool operator==(const ReceivedEvent&) const = default;
};

struct ReconstructedEvent {
    std::string block_hash;
    uint64_t    prefilled_count  = 0;
    uint64_t    mempool_count    = 0;
    uint64_t    extra_pool_count = 0;   // lower bound, "incl at least"
    uint64_t    requested_count  = 0;
    uint64_t    requested_bytes  = 0;

    bool operator==(const ReconstructedEvent&) const = default;
};

struct AnnouncedEvent {
    std::string block_hash;
    uint64_t    peer_id = 0;

    bool operator==(const AnnouncedEvent&) const = default;
};

struct RequestedEvent {
    std::string block_hash;
    uint64_t    peer_id = 0;

    bool operator==(const RequestedEvent&) const = default;
};

struct SentEvent {
    uint64_t cmpctblock_bytes = 0;
    uint64_t peer_id          = 0;

    bool operator==(const SentEvent&) const = default;
};

struct WindowSizeEvent {
    uint64_t max_send_bytes = 0;

    bool operator==(const WindowSizeEvent&) const = default;
};

using EventPayload = std::variant<ReceivedEvent,
                                  ReconstructedEvent,
                                  AnnouncedEvent,
                                  RequestedEvent,
                                  SentEvent,
                                  WindowSizeEvent>;

static_assert(std::variant_size_v<EventPayload> == 6);

struct ClassifiedEvent {
    std::string  timestamp;
    EventPayload payload;

    [[nodiscard]] EventKind kind() const noexcept {
        return static_cast<EventKind>(payload.index());
    }

    bool operator==(const ClassifiedEvent&) const = default;
};

} // namespace relay
