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
 * @file clock.hpp
 * @brief Local calendar date queries.
 */

#pragma once

namespace idforge::infra {

/**
 * @class Clock
 * @brief Today's local date, as used for default year windows.
 */
class Clock {
  public:
    /// @brief Current local calendar year, e.g. 2026.
    static int current_year();

    /// @brief Current local date encoded as `YYYYMMDD`.
    static int today();
};

} // namespace idforge::infra
