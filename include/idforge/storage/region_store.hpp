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
 * @file region_store.hpp
 * @brief Loader for the administrative-division reference table.
 *
 * @details
 * The table is a flat JSON object mapping 6-digit codes to display names:
 *
 * @code
 * { "110000": "北京市", "110101": "北京市东城区", "440106": "广东省广州市天河区" }
 * @endcode
 *
 * It is read once at startup and handed to `core::Generator` by value.
 */

#pragma once

#include "idforge/core/region_filter.hpp"

#include <string>

namespace idforge::storage {

/**
 * @class RegionStore
 * @brief Static helpers turning JSON text or files into a `core::RegionTable`.
 */
class RegionStore {
  public:
    /**
     * @brief Builds a table from JSON text.
     *
     * Entries whose key is not exactly six digits, or whose value is not a
     * string, are skipped with a WARN line.
     *
     * @param json_text The document.
     * @return core::RegionTable The accepted entries.
     * @throws std::runtime_error If the text is not valid JSON or its root is not an object.
     */
    static core::RegionTable parse(const std::string& json_text);

    /**
     * @brief Reads `path` and parses it.
     * @throws std::runtime_error If the file cannot be opened or parsed.
     */
    static core::RegionTable load(const std::string& path);
};

} // namespace idforge::storage
