// Copyright (c) 2025-2026 The cbtrace Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "logparse/metadata.h"

#include <charconv>

namespace logparse {

// ---------------------------------------------------------------------------
// MetadataTables::node_defaults
// ---------------------------------------------------------------------------
// Thread names are the ones the node passes to its thread-naming helpers;
// categories follow the node's logging category table.
// ---------------------------------------------------------------------------
MetadataTables MetadataTables::node_defaults() {
    MetadataTables t;
    t.thread_names = {
        "init",          "http",          "shutoff",       "capnp-loop",
        "main",          "qt-clientmodl", "qt-init",       "qt-rpcconsole",
        "qt-walletctrl", "test",          "initload",      "mapport",
        "net",           "dnsseed",       "addcon",        "opencon",
        "msghand",       "i2paccept",     "torcontrol",
    };
    t.numbered_thread_prefixes = {"scriptch", "httpworker"};
    t.categories = {
        "all",         "net",          "tor",        "mempool",
        "http",        "bench",        "zmq",        "walletdb",
        "rpc",         "estimatefee",  "addrman",    "selectcoins",
        "reindex",     "cmpctblock",   "rand",       "prune",
        "proxy",       "mempoolrej",   "libevent",   "coindb",
        "qt",          "leveldb",      "validation", "i2p",
        "ipc",         "lock",         "blockstorage",
        "txreconciliation",            "scan",       "txpackages",
    };
    return t;
}

// ---------------------------------------------------------------------------
// Character classes
// ---------------------------------------------------------------------------
namespace {

bool is_digit(char c) { return c >= '0' && c <= '9'; }

bool is_ident_start(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

bool is_ident_char(char c) { return is_ident_start(c) || is_digit(c); }

bool all_of(std::string_view sv, bool (*pred)(char)) {
    for (char c : sv) {
        if (!pred(c)) return false;
    }
    return true;
}

/// Parse a non-empty run of decimal digits into a uint32.
std::optional<uint32_t> parse_u32(std::string_view sv) {
    if (sv.empty() || !all_of(sv, is_digit)) return std::nullopt;
    uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) return std::nullopt;
    return value;
}

/// Store @p value in @p slot unless the slot is already taken.
template <typename T, typename V>
core::Result<void> assign_once(std::optional<T>& slot, V&& value,
                               std::string_view slot_name,
                               std::string_view token,
                               std::string_view line) {
    if (slot.has_value()) {
        return core::make_error(
            core::ErrorCode::PARSE_DUPLICATE_ANNOTATION,
            "second " + std::string{slot_name} + " annotation [" +
            std::string{token} + "] in line: " + std::string{line});
    }
    slot = T(std::forward<V>(value));
    return core::make_ok();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Shape predicates
// ---------------------------------------------------------------------------

std::optional<CategoryLevel> match_category(std::string_view token,
                                            const MetadataTables& tables) {
    CategoryLevel out;
    auto colon = token.find(':');
    out.category = token.substr(0, colon);
    if (!tables.categories.contains(std::string{out.category})) {
        return std::nullopt;
    }
    if (colon != std::string_view::npos) {
        std::string_view level = token.substr(colon + 1);
        if (level.empty() || !all_of(level, is_ident_char)) {
            return std::nullopt;
        }
        out.level = level;
    }
    return out;
}

bool is_thread_name(std::string_view token, const MetadataTables& tables) {
    if (tables.thread_names.contains(std::string{token})) return true;

    for (const auto& prefix : tables.numbered_thread_prefixes) {
        if (token.size() > prefix.size() + 1 &&
            token.starts_with(prefix) &&
            token[prefix.size()] == '.' &&
            all_of(token.substr(prefix.size() + 1), is_digit)) {
            return true;
        }
    }
    return false;
}

std::optional<SourceLocation> match_source_location(std::string_view token) {
    // The file part may not contain ':', so the first colon is the split.
    auto colon = token.find(':');
    if (colon == std::string_view::npos) return std::nullopt;

    std::string_view file = token.substr(0, colon);
    if (!file.ends_with(".cpp") && !file.ends_with(".h")) return std::nullopt;

    auto line = parse_u32(token.substr(colon + 1));
    if (!line) return std::nullopt;

    return SourceLocation{file, *line};
}

bool is_function_name(std::string_view token) {
    if (token.size() > 8 && token.starts_with("operator")) return true;
    return !token.empty() && is_ident_start(token.front()) &&
           all_of(token, is_ident_char);
}

// ---------------------------------------------------------------------------
// disambiguate
// ---------------------------------------------------------------------------

core::Result<Metadata> disambiguate(const TokenizedLine& tokens,
                                    const MetadataTables& tables,
                                    std::string_view line) {
    Metadata md;
    md.timestamp = std::string{tokens.timestamp};

    // Lines without annotations are common and valid.
    if (tokens.annotations.empty()) return md;

    std::vector<std::string_view> rest = tokens.annotations;

    // Rightmost: category[:level], or a wallet name followed (to its left)
    // by a mandatory category.
    std::string_view right = rest.back();
    rest.pop_back();
    auto cat = match_category(right, tables);
    if (!cat) {
        md.wallet_name = std::string{right};
        if (rest.empty() || !(cat = match_category(rest.back(), tables))) {
            return core::make_error(
                core::ErrorCode::PARSE_MISSING_CATEGORY,
                "no log category before wallet name [" + std::string{right} +
                "] in line: " + std::string{line});
        }
        rest.pop_back();
    }
    md.category = std::string{cat->category};
    if (cat->level) md.loglevel = std::string{*cat->level};

    for (std::string_view token : rest) {
        if (is_thread_name(token, tables)) {
            CBT_TRY_VOID(assign_once(md.thread, token, "thread", token, line));
        } else if (auto loc = match_source_location(token)) {
            CBT_TRY_VOID(assign_once(md.source_file, loc->file,
                                     "source location", token, line));
            md.source_line = loc->line;
        } else if (is_function_name(token)) {
            CBT_TRY_VOID(assign_once(md.function, token, "function",
                                     token, line));
        } else {
            return core::make_error(
                core::ErrorCode::PARSE_UNKNOWN_ANNOTATION,
                "unrecognized annotation [" + std::string{token} +
                "] in line: " + std::string{line});
        }
    }
    return md;
}

// ---------------------------------------------------------------------------
// parse_line / render_line
// ---------------------------------------------------------------------------

core::Result<ParsedLine> parse_line(std::string_view line,
                                    const MetadataTables& tables) {
    CBT_TRY_ASSIGN(tokens, tokenize_line(line));
    CBT_TRY_ASSIGN(metadata, disambiguate(tokens, tables, line));
    return ParsedLine{std::move(metadata), std::string{tokens.body}};
}

std::string render_line(const TokenizedLine& tokens) {
    std::string out{tokens.timestamp};
    for (std::string_view a : tokens.annotations) {
        out += " [";
        out += a;
        out += ']';
    }
    if (!tokens.body.empty()) {
        out += ' ';
        out += tokens.body;
    }
    return out;
}

} // namespace logparse
