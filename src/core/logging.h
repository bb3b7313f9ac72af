#pragma once
// Copyright (c) 2025-2026 The cbtrace Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CBT_CORE_LOGGING_H
#define CBT_CORE_LOGGING_H

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace core {

// ---------------------------------------------------------------------------
// LogLevel: severity levels for log messages
// ---------------------------------------------------------------------------
enum class LogLevel : int {
    TRACE   = 0,
    DEBUG   = 1,
    INFO    = 2,
    WARN    = 3,
    ERR     = 4,  // "ERROR" conflicts with Windows <windows.h> macro
    FATAL   = 5,
    OFF     = 6,
};

// ---------------------------------------------------------------------------
// LogCategory: bitmask categories for filtering log output
// ---------------------------------------------------------------------------
enum class LogCategory : uint32_t {
    NONE       = 0,
    PARSE      = 1u << 0,   // tokenizer / metadata disambiguation
    CLASSIFY   = 1u << 1,   // event pattern table
    CORRELATE  = 1u << 2,   // correlation engine
    REPORT     = 1u << 3,   // derived columns, stats, export
    CONFIG     = 1u << 4,
    IO         = 1u << 5,   // line sources, files
    ALL        = 0xFFFFFFFF,
};

inline constexpr LogCategory operator|(LogCategory a, LogCategory b) noexcept {
    return static_cast<LogCategory>(
        static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

inline constexpr LogCategory operator&(LogCategory a, LogCategory b) noexcept {
    return static_cast<LogCategory>(
        static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}

// ---------------------------------------------------------------------------
// Conversion helpers
// ---------------------------------------------------------------------------

/// Returns the short string name for a log level (e.g. "INFO", "WARN").
[[nodiscard]] std::string_view log_level_string(LogLevel level) noexcept;

/// Parses a level name ("debug", "warning", "off", ...), case-insensitive.
[[nodiscard]] std::optional<LogLevel> log_level_from_string(
    std::string_view name) noexcept;

/// Returns the name of the lowest set category bit, "NONE" for zero.
[[nodiscard]] std::string_view log_category_string(
    LogCategory cat) noexcept;

/// Parses a single category name ("parse", "correlate", "all", ...),
/// case-insensitive.
[[nodiscard]] std::optional<LogCategory> log_category_from_string(
    std::string_view name) noexcept;

// ---------------------------------------------------------------------------
// Logger: thread-safe singleton logger
// ---------------------------------------------------------------------------
class Logger {
public:
    /// Observer called for every line that passes the filters, after the
    /// regular sinks. Used by tests to assert on emitted diagnostics.
    using Hook = std::function<void(LogLevel, LogCategory, std::string_view)>;

    static Logger& instance();

    // -- configuration -------------------------------------------------------

    void set_level(LogLevel level);

    /// Replaces the enabled category mask wholesale.
    void set_categories(LogCategory mask);

    [[nodiscard]] LogLevel level() const noexcept;
    [[nodiscard]] LogCategory enabled_categories() const noexcept;

    /// Lockless check: true if a message at this level and category
    /// would reach at least one sink.
    [[nodiscard]] bool will_log(LogLevel level,
                                LogCategory cat) const noexcept;

    void set_print_to_console(bool enable);

    /// Opens @p path in append mode and routes output to it. An empty path
    /// closes the file sink. Returns false if the file cannot be opened.
    bool set_log_file(const std::filesystem::path& path);

    /// Installs (or, with an empty function, removes) the observer hook.
    void set_hook(Hook hook);

    void flush();

    // -- logging entry point ------------------------------------------------

    /// Formats and writes one log line. Callers go through the LOG_*
    /// macros, which perform the will_log() check first.
    void write(LogLevel level, LogCategory cat, std::string_view message);

    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger() = default;
    ~Logger();

    /// "2026-02-03 12:00:00.123"
    static std::string format_timestamp();

    std::atomic<int>      level_{static_cast<int>(LogLevel::INFO)};
    std::atomic<uint32_t> enabled_categories_{
        static_cast<uint32_t>(LogCategory::ALL)};
    std::atomic<bool>     print_to_console_{true};
    std::atomic<bool>     print_to_file_{false};
    std::atomic<bool>     has_hook_{false};

    mutable std::mutex    write_mutex_;
    std::ofstream         file_stream_;
    Hook                  hook_;
};

} // namespace core

// ---------------------------------------------------------------------------
// Convenience macros
// ---------------------------------------------------------------------------
// Each macro performs a lockless will_log() check before building the
// message, so filtered-out statements cost one atomic load.
//
//   LOG_WARN(core::LogCategory::PARSE, "malformed line " + std::to_string(n));
// ---------------------------------------------------------------------------

#define CBT_LOG_AT(lvl, cat, msg)                                         \
    do {                                                                  \
        if (core::Logger::instance().will_log((lvl), (cat))) {            \
            core::Logger::instance().write((lvl), (cat),                  \
                                           std::string(msg));             \
        }                                                                 \
    } while (0)

#define LOG_TRACE(cat, msg) CBT_LOG_AT(core::LogLevel::TRACE, cat, msg)
#define LOG_DEBUG(cat, msg) CBT_LOG_AT(core::LogLevel::DEBUG, cat, msg)
#define LOG_INFO(cat, msg)  CBT_LOG_AT(core::LogLevel::INFO,  cat, msg)
#define LOG_WARN(cat, msg)  CBT_LOG_AT(core::LogLevel::WARN,  cat, msg)
#define LOG_ERROR(cat, msg) CBT_LOG_AT(core::LogLevel::ERR,   cat, msg)
#define LOG_FATAL(cat, msg) CBT_LOG_AT(core::LogLevel::FATAL, cat, msg)

#endif // CBT_CORE_LOGGING_H
