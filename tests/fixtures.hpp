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
 * @file fixtures.hpp
 * @brief Shared test data: a small region whitelist and fixed date windows.
 */

#pragma once

#include "idforge/core/date_enumerator.hpp"
#include "idforge/core/region_filter.hpp"

namespace idforge::test {

/// @brief Eight real divisions: two in Beijing, four in Guangdong, two in Guangxi.
inline core::RegionTable sample_regions()
{
    return {
        {"110101", "北京市东城区"},
        {"110102", "北京市西城区"},
        {"440103", "广东省广州市荔湾区"},
        {"440104", "广东省广州市越秀区"},
        {"440106", "广东省广州市天河区"},
        {"441900", "广东省东莞市"},
        {"450102", "广西壮族自治区南宁市兴宁区"},
        {"450103", "广西壮族自治区南宁市青秀区"},
    };
}

/// @brief 1900-2020 with no cap on today, so results do not depend on the clock.
inline core::DateBounds fixed_bounds()
{
    return core::DateBounds::open(1900, 2020);
}

} // namespace idforge::test
