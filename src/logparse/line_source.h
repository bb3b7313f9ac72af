#pragma once
// Copyright (c) 2025-2026 The cbtrace Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace logparse {

// ---------------------------------------------------------------------------
// LineSource -- pull interface over a sequence of log lines
// ---------------------------------------------------------------------------

/// A forward-only, single-pass sequence of raw lines. Implementations
/// strip the line terminator ("\n" or "\r\n") and nothing else.
class LineSource {
public:
    virtual ~LineSource() = default;

    /// The next line, or std::nullopt once the source is exhausted or a
    /// read failed. Check error() to tell the two apart.
    virtual std::optional<std::string> next_line() = 0;

    /// STORAGE_READ_FAIL once the underlying stream reported a hard read
    /// error; NONE while the source is healthy or cleanly exhausted.
    [[nodiscard]] const core::Error& error() const noexcept { return error_; }

protected:
    /// Read one line from @p in, recording a read failure in error_.
    std::optional<std::string> read_from(std::istream& in,
                                         std::string_view what);

    core::Error error_;
};

// ---------------------------------------------------------------------------
// StreamLineSource -- reads from a caller-owned std::istream (e.g. stdin)
// ---------------------------------------------------------------------------
class StreamLineSource : public LineSource {
public:
    explicit StreamLineSource(std::istream& in) : in_(in) {}

    std::optional<std::string> next_line() override;

private:
    std::istream& in_;
};

// ---------------------------------------------------------------------------
// FileLineSource -- streams a log file from disk
// ---------------------------------------------------------------------------
class FileLineSource : public LineSource {
public:
    /// Open @p path for reading.
    /// @returns STORAGE_NOT_FOUND if the file does not exist or cannot be
    ///          opened.
    [[nodiscard]] static core::Result<FileLineSource> open(
        const std::filesystem::path& path);

    FileLineSource(FileLineSource&&) = default;
    FileLineSource& operator=(FileLineSource&&) = default;

    std::optional<std::string> next_line() override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept {
        return path_;
    }

private:
    FileLineSource(std::filesystem::path path, std::ifstream stream)
        : path_(std::move(path)), stream_(std::move(stream)) {}

    std::filesystem::path path_;
    std::ifstream         stream_;
};

// ---------------------------------------------------------------------------
// MemoryLineSource -- serves lines from memory (tests, fixtures)
// ---------------------------------------------------------------------------
class MemoryLineSource : public LineSource {
public:
    /// Split @p buffer on '\n'. A trailing newline does not produce an
    /// extra empty line.
    explicit MemoryLineSource(std::string_view buffer);

    explicit MemoryLineSource(std::vector<std::string> lines)
        : lines_(std::move(lines)) {}

    std::optional<std::string> next_line() override;

private:
    std::vector<std::string> lines_;
    size_t                   next_ = 0;
};

} // namespace logparse
