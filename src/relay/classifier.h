#pragma once
// Copyright (c) 2025-2026 The cbtrace Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Line classifier
// ---------------------------------------------------------------------------
// Two-level dispatch: the line's log category selects a bucket of
// patterns, then the bucket's patterns are tried in table order against
// the body. The first match wins. A body that matches a pattern of some
// other category is still uninteresting; patterns never cross buckets.
//
// Patterns are anchored at the start of the body (trailing text is
// allowed) and capture their fields positionally, in the order the
// corresponding payload struct declares them.
// ---------------------------------------------------------------------------

#include "core/error.h"
#include "logparse/metadata.h"
#include "relay/events.h"

#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace relay {

/// One row of the pattern table.
struct EventPattern {
    EventKind   kind;
    std::string category;
    std::string pattern;   // ECMAScript regex
};

/// Number of capture groups a pattern for @p kind must declare.
[[nodiscard]] size_t capture_count(EventKind kind) noexcept;

/// The table for the upstream node's compact block logging.
[[nodiscard]] std::vector<EventPattern> default_event_patterns();

class Classifier {
public:
    /// Compile @p patterns.
    /// @returns CONFIG_INVALID if a pattern does not compile or declares
    ///          the wrong number of capture groups for its kind.
    [[nodiscard]] static core::Result<Classifier> create(
        std::vector<EventPattern> patterns);

    /// A classifier over default_event_patterns().
    [[nodiscard]] static Classifier node_defaults();

    /// Classify a body logged under @p category. std::nullopt means
    /// uninteresting. Pure: no state is read or written besides the
    /// immutable table.
    [[nodiscard]] std::optional<EventPayload> match(
        std::string_view category, std::string_view body) const;

    /// Classify a parsed line. Lines without a category are uninteresting.
    [[nodiscard]] std::optional<ClassifiedEvent> classify(
        const logparse::Metadata& metadata, std::string_view body) const;

    [[nodiscard]] size_t size() const noexcept { return compiled_.size(); }

private:
    struct Compiled {
        EventKind  kind;
        std::regex regex;
    };

    Classifier() = default;

    std::vector<Compiled> compiled_;

    /// category -> indices into compiled_, in table order
    std::unordered_map<std::string, std::vector<size_t>> buckets_;
};

} // namespace relay
