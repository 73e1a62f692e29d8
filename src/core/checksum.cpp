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
 * @file checksum.cpp
 * @brief Check character computation.
 */

#include "idforge/core/checksum.hpp"

#include "idforge/core/pattern.hpp"

#include <cctype>

namespace idforge::core {

int Checksum::partial_sum(std::string_view digits, std::size_t first_position)
{
    int sum = 0;
    for (std::size_t i = 0; i < digits.size(); ++i) {
        sum += kCheckWeights[first_position + i] * (digits[i] - '0');
    }
    return sum;
}

char Checksum::compute(std::string_view first17)
{
    return from_sum(partial_sum(first17.substr(0, kCheckOffset), 0));
}

bool Checksum::verify(std::string_view id)
{
    if (id.size() != kIdLength) {
        return false;
    }
    for (std::size_t i = 0; i < kCheckOffset; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(id[i]))) {
            return false;
        }
    }
    return compute(id.substr(0, kCheckOffset)) == id[kCheckOffset];
}

} // namespace idforge::core
