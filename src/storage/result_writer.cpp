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
 * @file result_writer.cpp
 * @brief Timestamped result files.
 *
 * @details
 * Output is first written to a `.tmp` sibling and then renamed into place, so
 * a reader never observes a half-written result file.
 */

#include "idforge/storage/result_writer.hpp"

#include "idforge/infra/logger.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace idforge::storage {

ResultWriter::ResultWriter(std::string output_dir) : output_dir_(std::move(output_dir)) {}

std::string ResultWriter::file_name(std::time_t timestamp)
{
    std::tm local{};
    localtime_r(&timestamp, &local);

    std::ostringstream name;
    name << std::put_time(&local, "%Y%m%d_%H%M%S") << ".txt";
    return name.str();
}

std::string ResultWriter::available_path(std::time_t timestamp) const
{
    const std::string name = file_name(timestamp);
    const fs::path first = fs::path(output_dir_) / name;

    std::error_code ec;
    if (!fs::exists(first, ec)) {
        return first.string();
    }

    // Same-second requests: YYYYMMDD_HHMMSS_1.txt, _2, ...
    const std::string stem = fs::path(name).stem().string();
    for (int n = 1;; ++n) {
        const fs::path candidate = fs::path(output_dir_) / (stem + "_" + std::to_string(n) + ".txt");
        if (!fs::exists(candidate, ec)) {
            infra::Logger::log(infra::LogLevel::WARN, "Store: '" + first.string() +
                                                          "' exists; writing '" +
                                                          candidate.string() + "' instead.");
            return candidate.string();
        }
    }
}

std::string ResultWriter::write(const std::vector<std::string>& ids) const
{
    return write(ids, std::time(nullptr));
}

std::string ResultWriter::write(const std::vector<std::string>& ids, std::time_t timestamp) const
{
    std::error_code ec;
    if (!fs::exists(output_dir_, ec)) {
        fs::create_directories(output_dir_, ec);
        if (ec) {
            infra::Logger::log(infra::LogLevel::ERROR, "Store: Cannot create output directory '" +
                                                           output_dir_ + "': " + ec.message());
            return "";
        }
    }

    const std::string path = available_path(timestamp);
    const std::string temp_path = path + ".tmp";

    std::ofstream file(temp_path, std::ios::trunc);
    if (!file.is_open()) {
        infra::Logger::log(infra::LogLevel::ERROR, "Store: Cannot open '" + temp_path + "'.");
        return "";
    }

    for (const auto& id : ids) {
        file << id << '\n';
    }

    file.flush();
    file.close();

    if (file.fail()) {
        fs::remove(temp_path, ec);
        infra::Logger::log(infra::LogLevel::ERROR, "Store: Write to '" + temp_path + "' failed.");
        return "";
    }

    fs::rename(temp_path, path, ec);
    if (ec) {
        fs::remove(temp_path, ec);
        infra::Logger::log(infra::LogLevel::ERROR, "Store: Cannot move result into '" + path + "'.");
        return "";
    }

    infra::Logger::log(infra::LogLevel::DEBUG,
                       "Store: Wrote " + std::to_string(ids.size()) + " numbers to '" + path + "'.");
    return path;
}

} // namespace idforge::storage
