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
 * @file sequence_enumerator.hpp
 * @brief Expansion of the 3-digit sequence field.
 */

#pragma once

#include "idforge/core/pattern.hpp"

#include <string>
#include <vector>

namespace idforge::core {

/**
 * @class SequenceEnumerator
 * @brief Enumerates `000` to `999` filtered by the fixed digits of positions 15 to 17.
 *
 * There is no whitelist for this field, so the result size is exactly
 * `10^(wildcards in the slice)`.
 */
class SequenceEnumerator {
  public:
    /// @brief Matching sequence codes in ascending order.
    static std::vector<std::string> resolve(const Pattern& pattern);
};

} // namespace idforge::core
