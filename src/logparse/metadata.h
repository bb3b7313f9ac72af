#pragma once
// Copyright (c) 2025-2026 The cbtrace Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Metadata disambiguation
// ---------------------------------------------------------------------------
// Assigns each bracketed annotation of a tokenized line to one of the slots
//
//   [thread] [file.cpp:line] [function] [category:level] [wallet]
//
// by shape alone. Resolution runs right to left: the rightmost annotation
// is either a category (with optional ":level") or a wallet name, in which
// case the one before it must be a category. Whatever remains is a thread
// name, a source location or a function name, tried in that order.
//
// The grammar is treated as closed. An annotation of any other shape aborts
// the pass rather than being dropped.
// ---------------------------------------------------------------------------

#include "core/error.h"
#include "logparse/tokenizer.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace logparse {

// ---------------------------------------------------------------------------
// Metadata
// ---------------------------------------------------------------------------
struct Metadata {
    std::string                timestamp;      // unparsed, lexically sortable
    std::optional<std::string> category;
    std::optional<std::string> loglevel;
    std::optional<std::string> thread;
    std::optional<std::string> source_file;
    std::optional<uint32_t>    source_line;
    std::optional<std::string> function;
    std::optional<std::string> wallet_name;

    bool operator==(const Metadata&) const = default;
};

// ---------------------------------------------------------------------------
// MetadataTables -- the vocabulary the disambiguator recognizes
// ---------------------------------------------------------------------------
struct MetadataTables {
    /// Thread names that occur exactly once in a node ("msghand", "net").
    std::unordered_set<std::string> thread_names;

    /// Prefixes of numbered worker threads: "scriptch" matches "scriptch.3".
    std::vector<std::string> numbered_thread_prefixes;

    /// Logging category names ("net", "cmpctblock", ...).
    std::unordered_set<std::string> categories;

    /// The vocabulary of the upstream node's logging subsystem.
    [[nodiscard]] static MetadataTables node_defaults();
};

// ---------------------------------------------------------------------------
// Shape predicates (exposed for unit testing)
// ---------------------------------------------------------------------------

struct CategoryLevel {
    std::string_view                category;
    std::optional<std::string_view> level;
};

/// "<category>" or "<category>:<level>" with level in [A-Za-z0-9_]+.
[[nodiscard]] std::optional<CategoryLevel> match_category(
    std::string_view token, const MetadataTables& tables);

/// A known thread name, or "<prefix>.<digits>" for a numbered worker.
[[nodiscard]] bool is_thread_name(std::string_view token,
                                  const MetadataTables& tables);

struct SourceLocation {
    std::string_view file;
    uint32_t         line = 0;
};

/// "<path>.cpp:<digits>" or "<path>.h:<digits>"; the path has no ':'.
[[nodiscard]] std::optional<SourceLocation> match_source_location(
    std::string_view token);

/// An identifier, or "operator" followed by at least one character.
[[nodiscard]] bool is_function_name(std::string_view token);

// ---------------------------------------------------------------------------
// Disambiguation
// ---------------------------------------------------------------------------

/// Assign the annotations of @p tokens to Metadata slots.
///
/// Errors (all fatal for the pass):
///   PARSE_MISSING_CATEGORY     a wallet name is not preceded by a category
///   PARSE_UNKNOWN_ANNOTATION   an annotation matches no known shape
///   PARSE_DUPLICATE_ANNOTATION two annotations resolve to the same slot
///
/// @param line  The full line, quoted in error messages.
[[nodiscard]] core::Result<Metadata> disambiguate(
    const TokenizedLine& tokens, const MetadataTables& tables,
    std::string_view line);

/// A fully parsed line: metadata plus an owned copy of the body.
struct ParsedLine {
    Metadata    metadata;
    std::string body;
};

/// tokenize_line() followed by disambiguate().
[[nodiscard]] core::Result<ParsedLine> parse_line(
    std::string_view line, const MetadataTables& tables);

/// Re-assemble a line from its parts: "<ts> [a] [b] body". Tokenizing the
/// result yields the same parts again.
[[nodiscard]] std::string render_line(const TokenizedLine& tokens);

} // namespace logparse
