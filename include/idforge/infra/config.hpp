/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file config.hpp
 * @brief Runtime configuration for the IdForge command-line tool.
 *
 * @details
 * Settings are layered: built-in defaults, then an optional JSON file
 * (`--config`), then individual command-line flags. The JSON file uses the
 * same names as the flags with underscores, e.g.:
 *
 * @code
 * { "regions": "data/region_codes.json", "workers": 8, "min_year": 1950,
 *   "max_year": 2010, "allow_future": false, "log_level": "debug" }
 * @endcode
 */

#pragma once

#include "idforge/infra/clock.hpp"
#include "idforge/infra/logger.hpp"

#include <cstddef>
#include <string>

namespace idforge::infra {

/**
 * @struct Config
 * @brief Fully resolved settings for one process run.
 */
struct Config {
    /// @brief Path of the region-code JSON table.
    std::string regions_path = "region_codes.json";

    /// @brief Directory receiving timestamped result files.
    std::string output_dir = ".";

    /// @brief Worker threads per generation request.
    std::size_t workers = 1;

    /// @brief Earliest admissible birth year when the year field has wildcards.
    int min_year = 1900;

    /// @brief Latest admissible birth year; the current year unless overridden.
    int max_year = Clock::current_year();

    /// @brief When false, dates after today are rejected even inside `max_year`.
    bool allow_future = false;

    /// @brief Console threshold.
    LogLevel log_level = LogLevel::INFO;

    /// @brief One-shot pattern; empty means interactive mode.
    std::string pattern;

    /// @brief `--help` was requested.
    bool show_help = false;

    /**
     * @brief Builds the default configuration.
     *
     * `workers` is the hardware concurrency (at least 1); every other field
     * keeps its member default.
     */
    static Config defaults();

    /**
     * @brief Resolves defaults, the optional `--config` file and the flags.
     *
     * @param argc Argument count as received by `main`.
     * @param argv Argument vector as received by `main`.
     * @return Config The validated configuration.
     * @throws std::invalid_argument On unknown flags, missing or malformed values.
     * @throws std::runtime_error If the configuration file cannot be read or parsed.
     */
    static Config from_args(int argc, char* argv[]);

    /**
     * @brief Overlays the keys present in a JSON document onto this config.
     *
     * Unknown keys are logged at WARN and ignored.
     *
     * @throws std::runtime_error If the text is not a JSON object.
     * @throws std::invalid_argument If a known key has the wrong type or value.
     */
    void apply_json(const std::string& json_text);

    /// @brief Reads `path` and forwards its content to `apply_json`.
    void load_file(const std::string& path);

    /**
     * @brief Checks cross-field constraints.
     * @throws std::invalid_argument If the year window is empty or out of range,
     * or the worker count is zero.
     */
    void validate() const;
};

} // namespace idforge::infra
