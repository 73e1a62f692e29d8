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
 * @file region_store.cpp
 * @brief JSON ingestion of the region-code whitelist.
 */

#include "idforge/storage/region_store.hpp"

#include "idforge/core/pattern.hpp"
#include "idforge/infra/logger.hpp"
#include "idforge/infra/string.hpp"

#include <cJSON.h>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace idforge::storage {

core::RegionTable RegionStore::parse(const std::string& json_text)
{
    cJSON* root = cJSON_Parse(json_text.c_str());
    if (!root) {
        throw std::runtime_error("Store: region table is not valid JSON");
    }
    if (!cJSON_IsObject(root)) {
        cJSON_Delete(root);
        throw std::runtime_error("Store: region table root must be a JSON object");
    }

    core::RegionTable table;
    std::size_t skipped = 0;

    const cJSON* entry = nullptr;
    cJSON_ArrayForEach(entry, root)
    {
        const std::string code = entry->string ? entry->string : "";
        if (code.size() != core::kRegionLength || !infra::String::is_digits(code)) {
            infra::Logger::log(infra::LogLevel::WARN,
                               "Store: Skipping malformed region code '" + code + "'");
            ++skipped;
            continue;
        }
        if (!cJSON_IsString(entry) || entry->valuestring == nullptr) {
            infra::Logger::log(infra::LogLevel::WARN,
                               "Store: Skipping region " + code + " without a string name");
            ++skipped;
            continue;
        }
        table[code] = entry->valuestring;
    }

    cJSON_Delete(root);

    infra::Logger::log(infra::LogLevel::DEBUG, "Store: Parsed " + std::to_string(table.size()) +
                                                   " region codes (" + std::to_string(skipped) +
                                                   " skipped).");
    return table;
}

core::RegionTable RegionStore::load(const std::string& path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Store: cannot open region table '" + path + "'");
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    core::RegionTable table = parse(buffer.str());
    infra::Logger::log(infra::LogLevel::INFO, "Store: Loaded " + std::to_string(table.size()) +
                                                  " region codes from '" + path + "'.");
    return table;
}

} // namespace idforge::storage
