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

#include "idforge/core/sequence_enumerator.hpp"

#include "idforge/infra/string.hpp"

namespace idforge::core {

std::vector<std::string> SequenceEnumerator::resolve(const Pattern& pattern)
{
    const std::vector<int> values = matching_values(pattern.sequence(), 0, 999);

    std::vector<std::string> sequences;
    sequences.reserve(values.size());
    for (int value : values) {
        sequences.push_back(infra::String::zero_pad(value, kSequenceLength));
    }
    return sequences;
}

} // namespace idforge::core
