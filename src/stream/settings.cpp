// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "stream/settings.h"

#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>

namespace stream {

namespace {

/// Parse @p key as an integer >= 1, falling back to @p default_val when
/// the key is absent.
core::Result<int64_t> parse_positive(const core::Config& config,
                                     std::string_view key,
                                     int64_t default_val) {
    auto raw = config.get(key);
    if (!raw) return default_val;

    int64_t value = 0;
    const std::string& s = *raw;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return core::Error(core::ErrorCode::CONFIG_INVALID,
                           "-" + std::string(key) + ": not an integer: '"
                               + s + "'");
    }
    if (value < 1) {
        return core::Error(core::ErrorCode::CONFIG_INVALID,
                           "-" + std::string(key) + " must be at least 1, got "
                               + s);
    }
    return value;
}

/// Parse a comma-separated category list into one bitmask.
core::Result<core::LogCategory> parse_categories(std::string_view list) {
    core::LogCategory mask = core::LogCategory::NONE;
    while (!list.empty()) {
        auto comma = list.find(',');
        std::string_view name = list.substr(0, comma);
        list = comma == std::string_view::npos ? std::string_view{}
                                               : list.substr(comma + 1);
        if (name.empty()) continue;

        auto cat = core::parse_log_category(name);
        if (!cat) {
            return core::Error(core::ErrorCode::CONFIG_INVALID,
                               "-debug: unknown log category '"
                                   + std::string(name) + "'");
        }
        mask = mask | *cat;
    }
    return mask;
}

} // anonymous namespace

core::Result<Settings> Settings::from_config(core::Config& config) {
    if (auto conf = config.get("conf")) {
        SLUICE_TRY_VOID(config.parse_file(*conf));
    }

    Settings out;

    SLUICE_TRY_ASSIGN(errcap, parse_positive(config, "errcap",
                                             DEFAULT_ERROR_CAPACITY));
    out.error_capacity = static_cast<size_t>(errcap);

    SLUICE_TRY_ASSIGN(pollms, parse_positive(config, "pollms",
                                             DEFAULT_POLL_INTERVAL.count()));
    out.poll_interval = std::chrono::milliseconds(pollms);

    if (auto level = config.get("loglevel")) {
        auto parsed = core::parse_log_level(*level);
        if (!parsed) {
            return core::Error(core::ErrorCode::CONFIG_INVALID,
                               "-loglevel: unknown level '" + *level + "'");
        }
        out.log_level = *parsed;
    }

    if (auto debug = config.get("debug")) {
        SLUICE_TRY_ASSIGN(cats, parse_categories(*debug));
        out.log_categories = cats;
        // -debug without an explicit level means "show debug output".
        if (!config.has("loglevel")) out.log_level = core::LogLevel::DEBUG;
    }

    if (auto file = config.get("logfile"); file && !file->empty()) {
        out.log_file = std::filesystem::path(*file);
    }

    out.print_to_console = config.get_bool("printtoconsole", true);
    return out;
}

void init_logging(const Settings& settings) {
    auto& logger = core::Logger::instance();

    logger.set_level(settings.log_level);
    if (settings.log_categories) {
        logger.set_categories(*settings.log_categories);
    }
    logger.set_print_to_console(settings.print_to_console);

    if (settings.log_file) {
        logger.set_log_file(*settings.log_file);
        logger.set_print_to_file(true);
    }
}

} // namespace stream
