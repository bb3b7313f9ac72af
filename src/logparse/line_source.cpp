// Copyright (c) 2025-2026 The cbtrace Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "logparse/line_source.h"

#include "core/fs.h"
#include "core/logging.h"

#include <string_view>

namespace logparse {

// ---------------------------------------------------------------------------
// LineSource
// ---------------------------------------------------------------------------

std::optional<std::string> LineSource::read_from(std::istream& in,
                                                 std::string_view what) {
    std::string line;
    if (!std::getline(in, line)) {
        // eof alone is a clean end; badbit means the stream itself broke.
        if (in.bad() && error_.is_ok()) {
            error_ = core::Error(core::ErrorCode::STORAGE_READ_FAIL,
                                 "read error on " + std::string{what});
            LOG_ERROR(core::LogCategory::IO, error_.message());
        }
        return std::nullopt;
    }
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return line;
}

// ---------------------------------------------------------------------------
// StreamLineSource
// ---------------------------------------------------------------------------

std::optional<std::string> StreamLineSource::next_line() {
    return read_from(in_, "input stream");
}

// ---------------------------------------------------------------------------
// FileLineSource
// ---------------------------------------------------------------------------

core::Result<FileLineSource> FileLineSource::open(
    const std::filesystem::path& path) {
    if (!core::fs::file_exists(path)) {
        return core::make_error(core::ErrorCode::STORAGE_NOT_FOUND,
                                "log file not found: " + path.string());
    }

    std::ifstream stream(path);
    if (!stream.is_open()) {
        return core::make_error(core::ErrorCode::STORAGE_NOT_FOUND,
                                "cannot open log file: " + path.string());
    }

    auto size = core::fs::file_size(path);
    LOG_INFO(core::LogCategory::IO,
             "reading " + path.string() +
             (size ? " (" + std::to_string(*size) + " bytes)" : ""));

    return FileLineSource(path, std::move(stream));
}

std::optional<std::string> FileLineSource::next_line() {
    return read_from(stream_, path_.string());
}

// ---------------------------------------------------------------------------
// MemoryLineSource
// ---------------------------------------------------------------------------

MemoryLineSource::MemoryLineSource(std::string_view buffer) {
    size_t start = 0;
    while (start < buffer.size()) {
        size_t nl = buffer.find('\n', start);
        if (nl == std::string_view::npos) nl = buffer.size();
        std::string_view line = buffer.substr(start, nl - start);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        lines_.emplace_back(line);
        start = nl + 1;
    }
}

std::optional<std::string> MemoryLineSource::next_line() {
    if (next_ >= lines_.size()) return std::nullopt;
    return std::move(lines_[next_++]);
}

} // namespace logparse
