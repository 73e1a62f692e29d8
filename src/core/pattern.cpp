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
 * @file pattern.cpp
 * @brief Template parsing and slice matching.
 */

#include "idforge/core/pattern.hpp"

#include "idforge/infra/string.hpp"

#include <algorithm>
#include <cctype>

namespace idforge::core {

Pattern Pattern::parse(const std::string& raw)
{
    if (raw.size() != kIdLength) {
        throw InvalidFormat("expected " + std::to_string(kIdLength) + " characters, got " +
                            std::to_string(raw.size()));
    }

    std::string text = raw;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(text[i]);
        if (std::isdigit(c) || c == kWildcard) {
            continue;
        }
        if (c == 'X' || c == 'x') {
            if (i != kCheckOffset) {
                throw InvalidFormat("'X' is only allowed at position 18, found at position " +
                                    std::to_string(i + 1));
            }
            text[i] = kCheckTen;
            continue;
        }
        throw InvalidFormat("invalid character '" + std::string(1, text[i]) + "' at position " +
                            std::to_string(i + 1));
    }

    return Pattern(std::move(text));
}

std::string_view Pattern::region() const
{
    return std::string_view(text_).substr(kRegionOffset, kRegionLength);
}

std::string_view Pattern::date() const
{
    return std::string_view(text_).substr(kDateOffset, kDateLength);
}

std::string_view Pattern::year() const
{
    return std::string_view(text_).substr(kDateOffset, 4);
}

std::string_view Pattern::month() const
{
    return std::string_view(text_).substr(kDateOffset + 4, 2);
}

std::string_view Pattern::day() const
{
    return std::string_view(text_).substr(kDateOffset + 6, 2);
}

std::string_view Pattern::sequence() const
{
    return std::string_view(text_).substr(kSequenceOffset, kSequenceLength);
}

bool Pattern::accepts_check(char computed) const
{
    return check() == kWildcard || check() == computed;
}

std::size_t Pattern::wildcard_count() const
{
    return static_cast<std::size_t>(std::count(text_.begin(), text_.end(), kWildcard));
}

bool matches(std::string_view slice, std::string_view candidate)
{
    if (slice.size() != candidate.size()) {
        return false;
    }
    for (std::size_t i = 0; i < slice.size(); ++i) {
        if (slice[i] != kWildcard && slice[i] != candidate[i]) {
            return false;
        }
    }
    return true;
}

std::vector<int> matching_values(std::string_view slice, int low, int high)
{
    std::vector<int> values;

    // Bounding interval of the slice: wildcards as all-0 and as all-9.
    int floor = 0;
    int ceiling = 0;
    for (char c : slice) {
        floor = floor * 10 + (c == kWildcard ? 0 : c - '0');
        ceiling = ceiling * 10 + (c == kWildcard ? 9 : c - '0');
    }

    const int start = std::max(low, floor);
    const int end = std::min(high, ceiling);
    for (int value = start; value <= end; ++value) {
        if (matches(slice, infra::String::zero_pad(value, slice.size()))) {
            values.push_back(value);
        }
    }
    return values;
}

} // namespace idforge::core
