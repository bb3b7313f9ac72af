#pragma once

#include "core/error.h"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace core {

// ---------------------------------------------------------------------------
// Configuration key constants
// ---------------------------------------------------------------------------
inline constexpr const char* CONF_CONF     = "conf";
inline constexpr const char* CONF_OUT      = "out";
inline constexpr const char* CONF_FROM     = "from";
inline constexpr const char* CONF_TO       = "to";
inline constexpr const char* CONF_LOGLEVEL = "loglevel";
inline constexpr const char* CONF_DEBUG    = "debug";
inline constexpr const char* CONF_LOGFILE  = "logfile";

// ---------------------------------------------------------------------------
// Config  --  layered key/value configuration
//
// Priority order: command-line args  >  config file
// Multi-value keys (e.g. -debug=parse -debug=correlate) are accumulated into
// a vector accessible via get_list(). Arguments not starting with '-' are
// kept, in order, as positionals.
// ---------------------------------------------------------------------------
class Config {
public:
    Config() = default;

    // -- source loading -----------------------------------------------------

    /// Parse command-line arguments.
    /// Accepted formats:
    ///   -key=value   --key=value   (key/value pair)
    ///   -key         --key         (boolean flag, value = "1")
    ///   word                       (positional)
    void parse_args(int argc, const char* const argv[]);

    /// Parse an INI-style configuration file.
    /// Format per line:  key=value
    /// Lines starting with '#' and blank lines are ignored.
    [[nodiscard]] core::Result<void> parse_file(
        const std::filesystem::path& path);

    // -- getters -----------------------------------------------------------

    [[nodiscard]] std::optional<std::string> get(std::string_view key) const;

    /// All values for @p key, CLI values first.
    [[nodiscard]] std::vector<std::string> get_list(
        std::string_view key) const;

    [[nodiscard]] bool has(std::string_view key) const;

    /// Positional arguments in command-line order.
    [[nodiscard]] const std::vector<std::string>& positionals() const noexcept {
        return positionals_;
    }

private:
    // CLI values always override file values; lookup checks cli_values_
    // first, then file_values_.
    using ValueMap =
        std::unordered_map<std::string, std::vector<std::string>>;

    ValueMap cli_values_;
    ValueMap file_values_;
    std::vector<std::string> positionals_;

    void insert(ValueMap& target, std::string_view key, std::string value);
    [[nodiscard]] const std::vector<std::string>* lookup(
        std::string_view key) const;
};

} // namespace core
