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
 * @file region_filter.cpp
 * @brief Whitelist resolution of the region field.
 */

#include "idforge/core/region_filter.hpp"

namespace idforge::core {

std::vector<Region> RegionFilter::resolve(const Pattern& pattern, const RegionTable& table)
{
    std::vector<Region> regions;
    const std::string_view slice = pattern.region();

    // Fully fixed: a single lookup.
    if (slice.find(kWildcard) == std::string_view::npos) {
        auto it = table.find(std::string(slice));
        if (it != table.end()) {
            regions.push_back({it->first, it->second});
        }
        return regions;
    }

    // Keys sharing the fixed leading digits form one contiguous run of the map.
    const std::string prefix(slice.substr(0, slice.find(kWildcard)));

    for (auto it = table.lower_bound(prefix); it != table.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) {
            break;
        }
        if (matches(slice, it->first)) {
            regions.push_back({it->first, it->second});
        }
    }
    return regions;
}

} // namespace idforge::core
