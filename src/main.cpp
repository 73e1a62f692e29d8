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
 * @file main.cpp
 * @brief Application Entry Point.
 *
 * @details
 * This file contains the `main` function which orchestrates the startup sequence:
 * 1. Configuration (defaults, `--config` file, flags).
 * 2. Signal Handling Registration (SIGINT/SIGTERM).
 * 3. Region table load.
 * 4. Either a single `--pattern` request or the interactive prompt loop.
 */

#include "idforge/core/dispatcher.hpp"
#include "idforge/core/generator.hpp"
#include "idforge/infra/config.hpp"
#include "idforge/infra/logger.hpp"
#include "idforge/infra/string.hpp"
#include "idforge/storage/region_store.hpp"
#include "idforge/storage/result_writer.hpp"

#include <atomic>
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

/// @brief Raised by the signal handler; polled by running jobs.
std::atomic<bool> g_cancel{false};

/// @brief True while a request is being generated.
std::atomic<bool> g_busy{false};

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitInvalidPattern = 2;
constexpr int kExitAborted = 3;

/**
 * @brief SIGINT/SIGTERM handler.
 *
 * During generation the signal only cancels the running request. When idle
 * the default disposition is restored and the signal re-raised, ending the
 * process as usual.
 */
void signal_handler(int signum)
{
    if (g_busy.load()) {
        g_cancel.store(true);
        return;
    }
    std::signal(signum, SIG_DFL);
    std::raise(signum);
}

void print_help(const char* binary_name)
{
    std::cout << "Usage: " << binary_name << " [OPTIONS]\n"
              << "Expands an 18-character identity-number template ('-' marks unknown\n"
              << "positions) into every number valid under GB 11643-1999.\n\n"
              << "Options:\n"
              << "  --pattern P       Run once for template P and exit\n"
              << "  --regions PATH    Region-code JSON table (Default: region_codes.json)\n"
              << "  --output DIR      Directory for result files (Default: .)\n"
              << "  --workers N       Worker threads (Default: hardware concurrency)\n"
              << "  --min-year Y      Earliest birth year (Default: 1900)\n"
              << "  --max-year Y      Latest birth year (Default: current year)\n"
              << "  --allow-future    Accept birth dates after today\n"
              << "  --log-level L     trace|debug|info|warn|error|fatal (Default: info)\n"
              << "  --config PATH     JSON file with the settings above\n"
              << "  --help            Show this help message\n";
}

/**
 * @brief Runs one request and prints its outcome.
 * @return int One of the `kExit*` codes.
 */
int run_request(const idforge::core::Generator& generator,
                const idforge::storage::ResultWriter& writer, const std::string& input)
{
    using idforge::infra::Logger;
    using idforge::infra::LogLevel;

    g_cancel.store(false);
    g_busy.store(true);

    idforge::core::GenerationReport report;
    try {
        std::cout << "Generating valid numbers..." << std::endl;
        report = generator.generate(input, &g_cancel);
    } catch (const idforge::core::InvalidFormat& e) {
        g_busy.store(false);
        Logger::log(LogLevel::WARN, "Input: Invalid format: " + std::string(e.what()));
        std::cout << "Invalid input format: " << e.what() << std::endl;
        return kExitInvalidPattern;
    } catch (const idforge::core::GenerationAborted&) {
        g_busy.store(false);
        Logger::log(LogLevel::WARN, "Input: Generation interrupted; partial results discarded.");
        return kExitAborted;
    } catch (...) {
        g_busy.store(false);
        throw;
    }
    g_busy.store(false);

    std::cout << "\nFound " << report.count() << " valid numbers" << std::endl;
    if (report.empty()) {
        return kExitOk;
    }

    const std::string path = writer.write(report.ids);
    if (path.empty()) {
        std::cout << "Results could not be saved (see log)." << std::endl;
    } else {
        std::cout << "Full results saved to: " << path << std::endl;
    }
    std::cout << "Sample number: " << report.sample << std::endl;
    std::cout << "Region: " << report.sample_region << std::endl;
    return kExitOk;
}

} // namespace

int main(int argc, char* argv[])
{
    using idforge::infra::Logger;
    using idforge::infra::LogLevel;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        const idforge::infra::Config config = idforge::infra::Config::from_args(argc, argv);
        if (config.show_help) {
            print_help(argv[0]);
            return kExitOk;
        }
        Logger::set_level(config.log_level);

        Logger::log(LogLevel::DEBUG, "Config: Region table '" + config.regions_path + "', " +
                                         std::to_string(config.workers) + " workers, years " +
                                         std::to_string(config.min_year) + "-" +
                                         std::to_string(config.max_year) + ".");

        idforge::core::GeneratorOptions options;
        options.workers = config.workers;
        options.bounds =
            config.allow_future
                ? idforge::core::DateBounds::open(config.min_year, config.max_year)
                : idforge::core::DateBounds::until_today(config.min_year, config.max_year);

        idforge::core::Generator generator(idforge::storage::RegionStore::load(config.regions_path),
                                           options);
        idforge::storage::ResultWriter writer(config.output_dir);

        if (!config.pattern.empty()) {
            return run_request(generator, writer, idforge::infra::String::trim(config.pattern));
        }

        std::cout << "Region codes come from a fixed administrative-division snapshot; "
                     "some may be outdated."
                  << std::endl;

        std::string line;
        while (true) {
            std::cout << "==========\n"
                      << "Enter the 18-character number to complete, '-' for unknown positions:"
                      << std::endl;
            if (!std::getline(std::cin, line)) {
                break;
            }
            const std::string input = idforge::infra::String::trim(line);
            if (input.empty()) {
                continue;
            }
            run_request(generator, writer, input);
        }

    } catch (const std::exception& e) {
        Logger::log(LogLevel::FATAL, "System: Critical Failure: " + std::string(e.what()));
        return kExitFailure;
    }

    return kExitOk;
}
