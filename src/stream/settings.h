#pragma once
// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Settings -- typed, validated view of a core::Config for pipeline users.
//
// Recognised keys:
//   errcap=<n>          Error Channel capacity of the first stage (>= 1)
//   pollms=<n>          Error Channel check() poll interval in ms (>= 1)
//   loglevel=<level>    trace, debug, info, warn, error, fatal, off
//   debug=<cat,...>     restrict logging to these categories
//   logfile=<path>      also log to this file
//   printtoconsole=<b>  log to stderr (default 1)
//   conf=<path>         merge this configuration file first
// ---------------------------------------------------------------------------

#ifndef SLUICE_STREAM_SETTINGS_H
#define SLUICE_STREAM_SETTINGS_H

#include "core/config.h"
#include "core/error.h"
#include "core/logging.h"
#include "stream/error_channel.h"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>

namespace stream {

struct Settings {
    size_t                    error_capacity = DEFAULT_ERROR_CAPACITY;
    std::chrono::milliseconds poll_interval  = DEFAULT_POLL_INTERVAL;

    core::LogLevel                       log_level = core::LogLevel::INFO;
    std::optional<core::LogCategory>     log_categories;
    std::optional<std::filesystem::path> log_file;
    bool                                 print_to_console = true;

    /// Build settings from @p config, first merging the file named by the
    /// "conf" key if present.
    /// @returns IO_NOT_FOUND for a missing conf file, CONFIG_INVALID for an
    ///          out-of-range or unparsable value.
    [[nodiscard]] static core::Result<Settings> from_config(
        core::Config& config);
};

/// Apply the logging part of @p settings to the Logger singleton.
void init_logging(const Settings& settings);

} // namespace stream

#endif // SLUICE_STREAM_SETTINGS_H
