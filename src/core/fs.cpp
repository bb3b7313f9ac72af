#include "core/fs.h"

#include <fstream>
#include <random>
#include <string>

namespace core::fs {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

/// Generates a short random suffix for temporary file names.
static std::string random_suffix()
{
    static constexpr char CHARS[] =
        "abcdefghijklmnopqrstuvwxyz0123456789";
    static constexpr int SUFFIX_LEN = 8;

    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<int> dist(
        0, static_cast<int>(sizeof(CHARS) - 2));

    std::string suffix;
    suffix.reserve(SUFFIX_LEN);
    for (int i = 0; i < SUFFIX_LEN; ++i) {
        suffix.push_back(CHARS[dist(rng)]);
    }
    return suffix;
}

/// Returns a temporary path adjacent to `target` (same parent directory).
static path temp_path_for(const path& target)
{
    return target.parent_path() /
           (target.filename().string() + ".tmp." + random_suffix());
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

bool ensure_directory(const path& dir)
{
    std::error_code ec;
    if (std::filesystem::is_directory(dir, ec)) {
        return true;
    }
    return std::filesystem::create_directories(dir, ec) || !ec;
}

bool file_exists(const path& p)
{
    std::error_code ec;
    return std::filesystem::is_regular_file(p, ec);
}

std::optional<uint64_t> file_size(const path& p)
{
    std::error_code ec;
    auto sz = std::filesystem::file_size(p, ec);
    if (ec) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(sz);
}

// ---------------------------------------------------------------------------
// write_file
// ---------------------------------------------------------------------------

core::Result<void> write_file(const path& p, std::string_view content)
{
    if (p.has_parent_path() && !ensure_directory(p.parent_path())) {
        return core::make_error(core::ErrorCode::STORAGE_WRITE_FAIL,
                                "cannot create directory " +
                                p.parent_path().string());
    }

    path tmp = temp_path_for(p);
    std::error_code ec;

    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            return core::make_error(core::ErrorCode::STORAGE_WRITE_FAIL,
                                    "cannot open " + tmp.string());
        }
        ofs.write(content.data(),
                  static_cast<std::streamsize>(content.size()));
        ofs.flush();
        if (!ofs.good()) {
            ofs.close();
            std::filesystem::remove(tmp, ec);
            return core::make_error(core::ErrorCode::STORAGE_WRITE_FAIL,
                                    "short write to " + tmp.string());
        }
    }

    // rename(2) is atomic on the same filesystem and replaces the target.
    std::filesystem::rename(tmp, p, ec);
    if (ec) {
        std::error_code rm_ec;
        std::filesystem::remove(tmp, rm_ec);
        return core::make_error(core::ErrorCode::STORAGE_WRITE_FAIL,
                                "cannot rename " + tmp.string() + " to " +
                                p.string() + ": " + ec.message());
    }
    return core::make_ok();
}

} // namespace core::fs
