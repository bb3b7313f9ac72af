#pragma once

#include "core/error.h"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>

namespace core::fs {

/// Convenience alias so callers don't need to spell out std::filesystem::path.
using path = std::filesystem::path;

/// Creates the directory (and parents) if it does not exist.
/// Returns true on success or if the directory already exists.
bool ensure_directory(const path& dir);

/// Returns true if `p` refers to an existing regular file.
bool file_exists(const path& p);

/// Returns the size of the file in bytes, or std::nullopt on error.
std::optional<uint64_t> file_size(const path& p);

/// Writes `content` to `p` atomically: the bytes go to a sibling temporary
/// file which is then renamed over the target. A reader never observes a
/// half-written export.
[[nodiscard]] core::Result<void> write_file(const path& p,
                                            std::string_view content);

} // namespace core::fs
