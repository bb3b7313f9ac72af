// Copyright (c) 2025-2026 The cbtrace Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "logparse/tokenizer.h"

#include <cctype>
#include <string>

namespace logparse {

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

/// Advance @p pos past any whitespace in @p sv.
void skip_spaces(std::string_view sv, size_t& pos) {
    while (pos < sv.size() && is_space(sv[pos])) ++pos;
}

} // anonymous namespace

std::string_view trim_line(std::string_view line) noexcept {
    while (!line.empty() && is_space(line.front())) line.remove_prefix(1);
    while (!line.empty() && is_space(line.back())) line.remove_suffix(1);
    return line;
}

core::Result<TokenizedLine> tokenize_line(std::string_view line) {
    size_t split = 0;
    while (split < line.size() && !is_space(line[split])) ++split;

    if (split == 0 || split == line.size()) {
        return core::make_error(core::ErrorCode::PARSE_MALFORMED_LINE,
                                "no timestamp separator in line: " +
                                std::string{line});
    }

    TokenizedLine out;
    out.timestamp = line.substr(0, split);

    std::string_view rest = line.substr(split);
    size_t pos = 0;
    skip_spaces(rest, pos);

    // Greedy metadata prefix: "[" one-or-more non-"]" "]", then whitespace.
    while (pos < rest.size() && rest[pos] == '[') {
        size_t close = rest.find(']', pos + 1);
        if (close == std::string_view::npos || close == pos + 1) {
            // Unterminated or empty group: not metadata, body starts here.
            break;
        }
        out.annotations.push_back(rest.substr(pos + 1, close - pos - 1));
        pos = close + 1;
        skip_spaces(rest, pos);
    }

    out.body = rest.substr(pos);
    return out;
}

} // namespace logparse
