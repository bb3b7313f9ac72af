// Copyright (c) 2025-2026 The cbtrace Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "relay/classifier.h"

#include "core/logging.h"

#include <charconv>
#include <stdexcept>
#include <utility>

namespace relay {

std::string_view event_kind_name(EventKind kind) noexcept {
    switch (kind) {
        case EventKind::RECEIVED:           return "RECEIVED";
        case EventKind::RECONSTRUCTED:      return "RECONSTRUCTED";
        case EventKind::ANNOUNCED:          return "ANNOUNCED";
        case EventKind::REQUESTED:          return "REQUESTED";
        case EventKind::SENT:               return "SENT";
        case EventKind::WINDOW_SIZE_LOGGED: return "WINDOW_SIZE_LOGGED";
    }
    return "UNKNOWN";
}

size_t capture_count(EventKind kind) noexcept {
    switch (kind) {
        case EventKind::RECEIVED:           return 2;
        case EventKind::RECONSTRUCTED:      return 6;
        case EventKind::ANNOUNCED:          return 2;
        case EventKind::REQUESTED:          return 2;
        case EventKind::SENT:               return 2;
        case EventKind::WINDOW_SIZE_LOGGED: return 1;
    }
    return 0;
}

// Repetitions are bounded so the recursive std::regex matcher runs at a
// fixed depth; a longer hash or number leaves the line uninteresting.
std::vector<EventPattern> default_event_patterns() {
    return {
        {EventKind::RECONSTRUCTED, "cmpctblock",
         R"(Successfully reconstructed block ([0-9A-Fa-f]{1,128}) with )"
         R"((\d{1,20}) txn prefilled, (\d{1,20}) txn from mempool )"
         R"(\(incl at least (\d{1,20}) from extra pool\) and )"
         R"((\d{1,20}) txn \((\d{1,20}) bytes\) requested)"},
        {EventKind::RECEIVED, "cmpctblock",
         R"(Initialized PartiallyDownloadedBlock for block )"
         R"(([0-9A-Fa-f]{1,128}) using a cmpctblock of (\d{1,20}) bytes)"},
        {EventKind::SENT, "net",
         R"(sending cmpctblock \((\d{1,20}) bytes\) peer=(\d{1,20}))"},
        {EventKind::ANNOUNCED, "net",
         R"(PeerManager::NewPoWValidBlock sending header-and-ids )"
         R"(([0-9A-Fa-f]{1,128}) to peer=(\d{1,20}))"},
        {EventKind::REQUESTED, "net",
         R"(received getdata for: cmpctblock ([0-9A-Fa-f]{1,128}) )"
         R"(peer=(\d{1,20}))"},
        {EventKind::WINDOW_SIZE_LOGGED, "net",
         R"(\s{0,64}- Max send per-rtt: (\d{1,20}) bytes)"},
    };
}

// ---------------------------------------------------------------------------
// Capture decoding
// ---------------------------------------------------------------------------
namespace {

using SvMatch = std::match_results<std::string_view::const_iterator>;

std::string_view group(const SvMatch& m, size_t i) {
    return std::string_view(m[i].first, m[i].second);
}

/// Decimal capture to uint64. Values that do not fit make the whole line
/// uninteresting rather than producing a wrapped count.
std::optional<uint64_t> number(const SvMatch& m, size_t i) {
    if (!m[i].matched || m[i].length() == 0) return std::nullopt;
    std::string_view sv = group(m, i);
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) return std::nullopt;
    return value;
}

std::optional<EventPayload> decode(EventKind kind, const SvMatch& m) {
    switch (kind) {
        case EventKind::RECEIVED: {
            auto bytes = number(m, 2);
            if (!bytes) return std::nullopt;
            return ReceivedEvent{std::string{group(m, 1)}, *bytes};
        }
        case EventKind::RECONSTRUCTED: {
            ReconstructedEvent ev;
            ev.block_hash = std::string{group(m, 1)};
            auto prefilled = number(m, 2);
            auto mempool   = number(m, 3);
            auto extra     = number(m, 4);
            auto req_count = number(m, 5);
            auto req_bytes = number(m, 6);
            if (!prefilled || !mempool || !extra || !req_count || !req_bytes) {
                return std::nullopt;
            }
            ev.prefilled_count  = *prefilled;
            ev.mempool_count    = *mempool;
            ev.extra_pool_count = *extra;
            ev.requested_count  = *req_count;
            ev.requested_bytes  = *req_bytes;
            return ev;
        }
        case EventKind::ANNOUNCED: {
            auto peer = number(m, 2);
            if (!peer) return std::nullopt;
            return AnnouncedEvent{std::string{group(m, 1)}, *peer};
        }
        case EventKind::REQUESTED: {
            auto peer = number(m, 2);
            if (!peer) return std::nullopt;
            return RequestedEvent{std::string{group(m, 1)}, *peer};
        }
        case EventKind::SENT: {
            auto bytes = number(m, 1);
            auto peer  = number(m, 2);
            if (!bytes || !peer) return std::nullopt;
            return SentEvent{*bytes, *peer};
        }
        case EventKind::WINDOW_SIZE_LOGGED: {
            auto bytes = number(m, 1);
            if (!bytes) return std::nullopt;
            return WindowSizeEvent{*bytes};
        }
    }
    return std::nullopt;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Classifier
// ---------------------------------------------------------------------------

core::Result<Classifier> Classifier::create(std::vector<EventPattern> patterns) {
    Classifier c;
    c.compiled_.reserve(patterns.size());

    for (auto& p : patterns) {
        std::regex re;
        try {
            re.assign(p.pattern, std::regex::ECMAScript | std::regex::optimize);
        } catch (const std::regex_error& e) {
            return core::make_error(
                core::ErrorCode::CONFIG_INVALID,
                "bad " + std::string{event_kind_name(p.kind)} +
                " pattern: " + e.what());
        }

        size_t want = capture_count(p.kind);
        if (re.mark_count() != want) {
            return core::make_error(
                core::ErrorCode::CONFIG_INVALID,
                std::string{event_kind_name(p.kind)} + " pattern declares " +
                std::to_string(re.mark_count()) + " capture groups, expected " +
                std::to_string(want));
        }

        c.buckets_[p.category].push_back(c.compiled_.size());
        c.compiled_.push_back(Compiled{p.kind, std::move(re)});
    }

    LOG_DEBUG(core::LogCategory::CLASSIFY,
              "compiled " + std::to_string(c.compiled_.size()) +
              " event patterns in " + std::to_string(c.buckets_.size()) +
              " categories");
    return c;
}

Classifier Classifier::node_defaults() {
    auto result = create(default_event_patterns());
    if (!result.ok()) {
        // The built-in table is fixed; a failure here is a programming error.
        throw std::logic_error(result.error().format());
    }
    return std::move(result).value();
}

std::optional<EventPayload> Classifier::match(std::string_view category,
                                              std::string_view body) const {
    auto it = buckets_.find(std::string{category});
    if (it == buckets_.end()) return std::nullopt;

    for (size_t idx : it->second) {
        const Compiled& c = compiled_[idx];
        SvMatch m;
        if (!std::regex_search(body.begin(), body.end(), m, c.regex,
                               std::regex_constants::match_continuous)) {
            continue;
        }
        // First matching pattern decides, even if its numbers are unusable.
        return decode(c.kind, m);
    }
    return std::nullopt;
}

std::optional<ClassifiedEvent> Classifier::classify(
    const logparse::Metadata& metadata, std::string_view body) const {
    if (!metadata.category) return std::nullopt;

    auto payload = match(*metadata.category, body);
    if (!payload) return std::nullopt;

    return ClassifiedEvent{metadata.timestamp, std::move(*payload)};
}

} // namespace relay
