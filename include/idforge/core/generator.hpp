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
 * @file generator.hpp
 * @brief Request-level entry point of the generation engine.
 *
 * @details
 * `Generator` ties the pipeline together for one request:
 * 1. **Parse** the raw template (`Pattern::parse`).
 * 2. **Resolve** region, date and sequence sets.
 * 3. **Dispatch** the cross product over the worker pool.
 * 4. **Report** the merged numbers with a sample and its region name.
 *
 * The region table is loaded by the caller and owned here for the lifetime of
 * the generator; it is never modified.
 */

#pragma once

#include "idforge/core/assembler.hpp"
#include "idforge/core/date_enumerator.hpp"
#include "idforge/core/pattern.hpp"
#include "idforge/core/region_filter.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace idforge::core {

/// @brief Tunables for a `Generator`.
struct GeneratorOptions {
    std::size_t workers = 1;

    /// @brief 1900 up to today unless replaced.
    DateBounds bounds;
};

/**
 * @struct GenerationReport
 * @brief What a request hands back to its caller.
 */
struct GenerationReport {
    /// @brief Every accepted number, in merged order.
    std::vector<std::string> ids;

    /// @brief Size of region x date x sequence before check filtering.
    std::uint64_t estimated = 0;

    /// @brief Combinations actually assembled.
    std::uint64_t examined = 0;

    /// @brief First number of `ids`, empty when there is none.
    std::string sample;

    /// @brief Display name of the sample's region code.
    std::string sample_region;

    std::size_t count() const { return ids.size(); }
    bool empty() const { return ids.empty(); }
};

/**
 * @class Generator
 * @brief Expands templates into every structurally valid identity number.
 */
class Generator {
  public:
    /// @brief Display name returned for codes absent from the table.
    static constexpr const char* kUnknownRegion = "Unknown";

    Generator(RegionTable regions, GeneratorOptions options);

    /**
     * @brief Parses `raw` and runs the request.
     *
     * @throws InvalidFormat If `raw` is malformed.
     * @throws GenerationAborted If `cancel` is raised mid-run.
     */
    GenerationReport generate(const std::string& raw,
                              const std::atomic<bool>* cancel = nullptr) const;

    /**
     * @brief Runs the request for an already parsed template.
     *
     * A template whose region or date field admits nothing is not an error:
     * the report is simply empty.
     */
    GenerationReport generate(const Pattern& pattern,
                              const std::atomic<bool>* cancel = nullptr) const;

    /**
     * @brief Size of the search space for `pattern`.
     *
     * Resolves the three fields without assembling anything.
     */
    std::uint64_t estimate_total(const Pattern& pattern) const;

    /// @brief Display name of `code`, or `kUnknownRegion`.
    std::string region_name(const std::string& code) const;

    const RegionTable& regions() const { return regions_; }
    const GeneratorOptions& options() const { return options_; }

  private:
    CandidateAssembler build_assembler(const Pattern& pattern) const;

    RegionTable regions_;
    GeneratorOptions options_;
};

} // namespace idforge::core
