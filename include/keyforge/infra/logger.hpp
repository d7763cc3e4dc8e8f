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
 * @brief Thread-safe diagnostic logging facility for keyforge.
 *
 * @details
 * Every subsystem reports through the static `Logger`. Output is serialized by a single
 * mutex so lines emitted by concurrent import workers never interleave.
 */

#pragma once

#include <mutex>
#include <string>

namespace keyforge::infra {

/**
 * @enum LogLevel
 * @brief Severity hierarchy for diagnostic messages, lowest first.
 */
enum class LogLevel {
    TRACE, ///< Per-fragment evaluation details.
    DEBUG, ///< Compilation results and configuration dumps.
    INFO,  ///< Nominal operational events.
    WARN,  ///< Skipped documents and other recoverable anomalies.
    ERROR, ///< Failures that abort a unit of work.
    FATAL  ///< Failures that abort the process.
};

/**
 * @class Logger
 * @brief A static utility class providing system-wide logging.
 *
 * Each entry carries a local timestamp, a colour-coded severity tag and the payload.
 * `TRACE`, `DEBUG` and `INFO` go to `std::cout`; `WARN` and above go to `std::cerr`.
 * Messages below the configured threshold (default `INFO`) are discarded.
 */
class Logger {
  public:
    /**
     * @brief Writes a message if `level` passes the current threshold.
     *
     * @code
     * keyforge::infra::Logger::log(LogLevel::WARN, "Keyer: Skipping document #3");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /// Sets the minimum severity that will be written.
    static void set_level(LogLevel level);

    /// Returns the minimum severity that will be written.
    static LogLevel level();

    /// Returns true if a message at `level` would currently be written.
    static bool enabled(LogLevel level);

  private:
    /// Guards the console streams and the threshold.
    static std::mutex mutex_;

    static LogLevel level_;
};

} // namespace keyforge::infra
