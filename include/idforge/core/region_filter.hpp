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
 * @file region_filter.hpp
 * @brief Resolution of the region field against the administrative-division whitelist.
 */

#pragma once

#include "idforge/core/pattern.hpp"

#include <map>
#include <string>
#include <vector>

namespace idforge::core {

/**
 * @brief Whitelist of administrative divisions: 6-digit code to display name.
 *
 * Ordered so that resolution output and prefix scans are deterministic.
 */
using RegionTable = std::map<std::string, std::string>;

/// @brief A whitelisted region code together with its display name.
struct Region {
    std::string code;
    std::string name;
};

/**
 * @class RegionFilter
 * @brief Selects the whitelist entries consistent with a pattern's first six positions.
 */
class RegionFilter {
  public:
    /**
     * @brief Resolves the region field.
     *
     * Only codes present in `table` are returned, so a digit-consistent code
     * that is not a real division never reaches the assembler. When the
     * leading positions are fixed, the scan is limited to the table range
     * sharing that prefix.
     *
     * @param pattern The parsed template.
     * @param table The whitelist.
     * @return std::vector<Region> Matches ordered by code; empty if none.
     */
    static std::vector<Region> resolve(const Pattern& pattern, const RegionTable& table);
};

} // namespace idforge::core
