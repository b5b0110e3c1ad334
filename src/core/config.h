#pragma once
// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

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
// Config  --  key/value configuration with multiple sources
//
// Priority order: command-line args  >  config file / programmatic set()
// Multi-value keys (e.g. -file=a -file=b) are accumulated into a vector
// accessible via get_list().  Arguments that do not start with '-' are
// kept in order as positional arguments.
// ---------------------------------------------------------------------------
class Config {
public:
    Config() = default;

    // -- source loading -----------------------------------------------------

    /// Parse command-line arguments (argv[0] is skipped).
    /// Accepted formats:
    ///   -key=value   --key=value   (key/value pair)
    ///   -key         --key         (boolean flag, value = "1")
    ///   anything-else              (positional argument)
    void parse_args(int argc, const char* const argv[]);

    /// Parse an INI-style configuration file.
    /// Format per line:  key=value
    /// Lines starting with '#' and blank lines are ignored.
    /// Leading/trailing whitespace around key and value is trimmed.
    /// @returns IO_NOT_FOUND if the file cannot be opened, CONFIG_INVALID
    ///          for a line with an empty key.
    [[nodiscard]] Result<void> parse_file(const std::filesystem::path& path);

    // -- setters / getters --------------------------------------------------

    /// Set a key to a single value (replaces any previous values).
    void set(std::string_view key, std::string value);

    /// Return the first value for @p key, or std::nullopt if absent.
    [[nodiscard]] std::optional<std::string> get(std::string_view key) const;

    /// Return the first value for @p key, or @p default_val if absent.
    [[nodiscard]] std::string get_or(std::string_view key,
                                     std::string_view default_val) const;

    /// Return the value for @p key parsed as int64, or @p default_val when
    /// absent or unparsable (the latter is logged).
    [[nodiscard]] int64_t get_int(std::string_view key,
                                  int64_t default_val = 0) const;

    /// Return the value for @p key parsed as bool, or @p default_val.
    /// Truthy: "1", "true", "yes", "on" (case-insensitive).
    [[nodiscard]] bool get_bool(std::string_view key,
                                bool default_val = false) const;

    /// Return all values associated with @p key, CLI values first.
    [[nodiscard]] std::vector<std::string> get_list(
        std::string_view key) const;

    /// Check whether @p key exists in any source.
    [[nodiscard]] bool has(std::string_view key) const;

    /// Positional (non-option) command-line arguments, in order.
    [[nodiscard]] const std::vector<std::string>& positional() const noexcept {
        return positional_;
    }

private:
    // Two separate maps so that CLI args always override file values.
    using ValueMap =
        std::unordered_map<std::string, std::vector<std::string>>;

    ValueMap cli_values_;
    ValueMap file_values_;
    std::vector<std::string> positional_;

    void insert(ValueMap& target, std::string_view key, std::string value);
    [[nodiscard]] const std::vector<std::string>* lookup(
        std::string_view key) const;
};

} // namespace core
