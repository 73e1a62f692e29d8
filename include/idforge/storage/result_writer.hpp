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
 * @file result_writer.hpp
 * @brief Persistence of generated numbers to timestamped text files.
 *
 * @details
 * Each request's output goes to `<output_dir>/YYYYMMDD_HHMMSS.txt` (local
 * time), one identity number per line. A second request in the same second
 * gets `YYYYMMDD_HHMMSS_1.txt`, and so on; existing files are never replaced.
 */

#pragma once

#include <ctime>
#include <string>
#include <vector>

namespace idforge::storage {

/**
 * @class ResultWriter
 * @brief Writes result sets below a fixed output directory.
 */
class ResultWriter {
  public:
    /// @param output_dir Target directory; created on first write if missing.
    explicit ResultWriter(std::string output_dir);

    /**
     * @brief Writes `ids` to a file named after the current local time.
     *
     * @return std::string The path written, or an empty string if the
     * directory or the file could not be written (logged at ERROR).
     */
    std::string write(const std::vector<std::string>& ids) const;

    /// @brief Same as `write(ids)` with an explicit timestamp.
    std::string write(const std::vector<std::string>& ids, std::time_t timestamp) const;

    /// @brief `YYYYMMDD_HHMMSS.txt` for `timestamp` in local time.
    static std::string file_name(std::time_t timestamp);

    const std::string& output_dir() const { return output_dir_; }

  private:
    /// @brief `file_name(timestamp)` in the output directory, or the first free `_N` variant.
    std::string available_path(std::time_t timestamp) const;

    std::string output_dir_;
};

} // namespace idforge::storage
