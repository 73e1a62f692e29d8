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
 * @file logger.hpp
 * @brief Thread-safe diagnostic logging facility for IdForge.
 *
 * @details
 * This header declares the `Logger` class, the single reporting interface used
 * by the generation engine, the region store and the command-line front end.
 * Output is serialized across worker threads so that lines emitted by the
 * dispatcher's jobs never interleave.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <string>

namespace idforge::infra {

/**
 * @enum LogLevel
 * @brief Defines the severity hierarchy for diagnostic messages.
 *
 * Levels are ordered: a message is emitted only when its level is at or above
 * the process-wide threshold configured through `Logger::set_level`.
 */
enum class LogLevel {
    TRACE, ///< Per-job and per-field enumeration details.
    DEBUG, ///< Partitioning decisions, resolved set sizes.
    INFO,  ///< Nominal operational events (table loaded, result counts).
    WARN,  ///< Skipped table entries, suspicious configuration.
    ERROR, ///< Recoverable failures (result file could not be written).
    FATAL  ///< Failures that end the process.
};

/**
 * @class Logger
 * @brief A static utility class providing process-wide logging.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message to the console.
     *
     * The output includes a timestamp, the severity tag, and the payload.
     *
     * **Stream Routing Logic:**
     * - `TRACE`, `DEBUG`, `INFO`: Routed to `std::cout`.
     * - `WARN`, `ERROR`, `FATAL`: Routed to `std::cerr`.
     *
     * Messages below the current threshold are discarded without taking the lock.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * idforge::infra::Logger::log(LogLevel::INFO, "Store: 3208 region codes loaded.");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /**
     * @brief Sets the minimum severity that will be written.
     * @param level The new threshold. Defaults to `INFO` at startup.
     */
    static void set_level(LogLevel level);

    /// @brief Returns the current minimum severity.
    static LogLevel level();

    /**
     * @brief Converts a case-insensitive level name into a `LogLevel`.
     *
     * Accepted names: `trace`, `debug`, `info`, `warn`, `error`, `fatal`.
     *
     * @param name The textual level, typically from configuration.
     * @param out Receives the parsed level on success.
     * @return true If the name was recognised.
     */
    static bool parse_level(const std::string& name, LogLevel& out);

  private:
    /// @brief Serializes access to `std::cout` and `std::cerr`.
    static std::mutex mutex_;

    /// @brief Minimum severity that reaches the console.
    static std::atomic<LogLevel> threshold_;
};

} // namespace idforge::infra
