#pragma once
// Copyright (c) 2025-2026 The cbtrace Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Line tokenizer for node debug logs
// ---------------------------------------------------------------------------
// A debug log line has the shape
//
//   <timestamp> [<annotation>] [<annotation>] ... <body>
//
//   2025-06-25T20:15:37.882709Z [msghand] [net_processing.cpp:1154]
//       [ProcessMessage] [net:debug] received getdata for: cmpctblock ...
//
// where every annotation is optional and none of them is tagged. The
// tokenizer only separates the pieces; deciding what each annotation means
// is the job of the metadata disambiguator.
//
// The metadata prefix is matched greedily: every leading bracket group is
// taken as an annotation, so a body that itself begins with "[...]" is
// mis-split. The log format offers no way to tell the two apart.
// ---------------------------------------------------------------------------

#include "core/error.h"

#include <string_view>
#include <vector>

namespace logparse {

/// The pieces of one log line. All views point into the caller's line
/// buffer, which must outlive this value.
struct TokenizedLine {
    std::string_view              timestamp;
    std::vector<std::string_view> annotations;  // brackets stripped, in order
    std::string_view              body;
};

/// Strip leading and trailing whitespace (including a trailing '\r').
[[nodiscard]] std::string_view trim_line(std::string_view line) noexcept;

/// Split a trimmed, non-empty line into timestamp, annotations and body.
///
/// @returns PARSE_MALFORMED_LINE when the line has no whitespace that
///          separates a timestamp from the rest.
[[nodiscard]] core::Result<TokenizedLine> tokenize_line(std::string_view line);

} // namespace logparse
