// Copyright (c) 2025-2026 The cbtrace Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <sstream>

namespace core {

// ---------------------------------------------------------------------------
// error_code_name: human-readable label for every ErrorCode variant
// ---------------------------------------------------------------------------
std::string_view error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NONE:                       return "NONE";

        // Line parsing
        case ErrorCode::PARSE_ERROR:                return "PARSE_ERROR";
        case ErrorCode::PARSE_MALFORMED_LINE:       return "PARSE_MALFORMED_LINE";
        case ErrorCode::PARSE_UNKNOWN_ANNOTATION:   return "PARSE_UNKNOWN_ANNOTATION";
        case ErrorCode::PARSE_DUPLICATE_ANNOTATION: return "PARSE_DUPLICATE_ANNOTATION";
        case ErrorCode::PARSE_MISSING_CATEGORY:     return "PARSE_MISSING_CATEGORY";

        // Event correlation
        case ErrorCode::CORRELATION_ERROR:          return "CORRELATION_ERROR";
        case ErrorCode::CORRELATION_PEER_MISMATCH:  return "CORRELATION_PEER_MISMATCH";

        // Storage / IO
        case ErrorCode::STORAGE_ERROR:              return "STORAGE_ERROR";
        case ErrorCode::STORAGE_NOT_FOUND:          return "STORAGE_NOT_FOUND";
        case ErrorCode::STORAGE_READ_FAIL:          return "STORAGE_READ_FAIL";
        case ErrorCode::STORAGE_WRITE_FAIL:         return "STORAGE_WRITE_FAIL";

        // Configuration
        case ErrorCode::CONFIG_ERROR:               return "CONFIG_ERROR";
        case ErrorCode::CONFIG_INVALID:             return "CONFIG_INVALID";

        // Internal
        case ErrorCode::INTERNAL_ERROR:             return "INTERNAL_ERROR";
    }

    return "UNKNOWN";
}

// ---------------------------------------------------------------------------
// is_line_local
// ---------------------------------------------------------------------------
bool is_line_local(ErrorCode code) noexcept {
    return code == ErrorCode::PARSE_MALFORMED_LINE;
}

// ---------------------------------------------------------------------------
// Error::format: build a diagnostic string including source location
// ---------------------------------------------------------------------------
std::string Error::format() const {
    if (code_ == ErrorCode::NONE) {
        return "no error";
    }

    std::ostringstream oss;
    oss << error_code_name(code_)
        << '(' << static_cast<uint16_t>(code_) << ')';

    if (!message_.empty()) {
        oss << ": " << message_;
    }

    // Append the origin as basename:line when available.
    std::string_view file = location_.file_name();
    if (!file.empty()) {
        auto slash = file.find_last_of("/\\");
        if (slash != std::string_view::npos) file.remove_prefix(slash + 1);
        oss << " [" << file << ':' << location_.line() << ']';
    }

    return oss.str();
}

} // namespace core
