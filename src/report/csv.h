#pragma once
// Copyright (c) 2025-2026 The cbtrace Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "report/rows.h"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace report {

/// Quote @p field for CSV if it contains a comma, quote, CR or LF.
[[nodiscard]] std::string csv_escape(std::string_view field);

/// Render rows as CSV text: one header row, "\r\n" line endings, empty
/// cells for absent values.
[[nodiscard]] std::string render_received_csv(
    const std::vector<ReceivedRow>& rows);
[[nodiscard]] std::string render_sent_csv(const std::vector<SentRow>& rows);

/// Render and write atomically.
/// @returns STORAGE_WRITE_FAIL if the file cannot be written.
[[nodiscard]] core::Result<void> write_received_csv(
    const std::filesystem::path& path, const std::vector<ReceivedRow>& rows);
[[nodiscard]] core::Result<void> write_sent_csv(
    const std::filesystem::path& path, const std::vector<SentRow>& rows);

} // namespace report
