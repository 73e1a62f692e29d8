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
 * @file config.cpp
 * @brief Layered configuration: defaults, JSON file, command-line flags.
 */

#include "idforge/infra/config.hpp"

#include <cJSON.h>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace idforge::infra {

namespace {

int parse_int(const std::string& flag, const std::string& value)
{
    std::size_t consumed = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("Config: " + flag + " expects an integer, got '" + value + "'");
    }
    if (consumed != value.size()) {
        throw std::invalid_argument("Config: " + flag + " expects an integer, got '" + value + "'");
    }
    return parsed;
}

std::size_t parse_workers(const std::string& flag, int value)
{
    if (value <= 0) {
        throw std::invalid_argument("Config: " + flag + " must be positive");
    }
    return static_cast<std::size_t>(value);
}

LogLevel parse_log_level(const std::string& flag, const std::string& value)
{
    LogLevel level = LogLevel::INFO;
    if (!Logger::parse_level(value, level)) {
        throw std::invalid_argument("Config: " + flag + " has unknown level '" + value + "'");
    }
    return level;
}

int json_int(const cJSON* item)
{
    if (!cJSON_IsNumber(item) || std::floor(item->valuedouble) != item->valuedouble) {
        throw std::invalid_argument(std::string("Config: key '") + item->string +
                                    "' expects an integer");
    }
    if (item->valuedouble < static_cast<double>(std::numeric_limits<int>::min()) ||
        item->valuedouble > static_cast<double>(std::numeric_limits<int>::max())) {
        throw std::invalid_argument(std::string("Config: key '") + item->string +
                                    "' is out of range");
    }
    return static_cast<int>(item->valuedouble);
}

std::string json_string(const cJSON* item)
{
    if (!cJSON_IsString(item) || item->valuestring == nullptr) {
        throw std::invalid_argument(std::string("Config: key '") + item->string +
                                    "' expects a string");
    }
    return item->valuestring;
}

} // namespace

Config Config::defaults()
{
    Config config;
    unsigned int cores = std::thread::hardware_concurrency();
    config.workers = cores == 0 ? 1 : cores;
    return config;
}

void Config::apply_json(const std::string& json_text)
{
    cJSON* root = cJSON_Parse(json_text.c_str());
    if (!root) {
        throw std::runtime_error("Config: configuration file is not valid JSON");
    }
    if (!cJSON_IsObject(root)) {
        cJSON_Delete(root);
        throw std::runtime_error("Config: configuration root must be a JSON object");
    }

    try {
        const cJSON* item = nullptr;
        cJSON_ArrayForEach(item, root)
        {
            const std::string key = item->string ? item->string : "";
            if (key == "regions") {
                regions_path = json_string(item);
            } else if (key == "output") {
                output_dir = json_string(item);
            } else if (key == "workers") {
                workers = parse_workers("workers", json_int(item));
            } else if (key == "min_year") {
                min_year = json_int(item);
            } else if (key == "max_year") {
                max_year = json_int(item);
            } else if (key == "allow_future") {
                if (!cJSON_IsBool(item)) {
                    throw std::invalid_argument("Config: key 'allow_future' expects a boolean");
                }
                allow_future = cJSON_IsTrue(item);
            } else if (key == "log_level") {
                log_level = parse_log_level("log_level", json_string(item));
            } else {
                Logger::log(LogLevel::WARN, "Config: Ignoring unknown key '" + key + "'");
            }
        }
    } catch (...) {
        cJSON_Delete(root);
        throw;
    }

    cJSON_Delete(root);
}

void Config::load_file(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Config: cannot open configuration file '" + path + "'");
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    apply_json(buffer.str());
    Logger::log(LogLevel::DEBUG, "Config: Loaded settings from '" + path + "'");
}

void Config::validate() const
{
    if (workers == 0) {
        throw std::invalid_argument("Config: workers must be positive");
    }
    if (min_year < 1 || max_year > 9999) {
        throw std::invalid_argument("Config: year bounds must lie within 0001..9999");
    }
    if (min_year > max_year) {
        throw std::invalid_argument("Config: min_year (" + std::to_string(min_year) +
                                    ") exceeds max_year (" + std::to_string(max_year) + ")");
    }
}

Config Config::from_args(int argc, char* argv[])
{
    Config config = defaults();

    // The file layer sits under the flags, so locate it before anything else.
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            if (i + 1 >= argc) {
                throw std::invalid_argument("Config: --config requires a value");
            }
            config.load_file(argv[i + 1]);
        }
    }

    for (int i = 1; i < argc; ++i) {
        const std::string flag = argv[i];

        if (flag == "--help" || flag == "-h") {
            config.show_help = true;
            continue;
        }
        if (flag == "--allow-future") {
            config.allow_future = true;
            continue;
        }

        if (i + 1 >= argc) {
            throw std::invalid_argument("Config: " + flag + " requires a value");
        }
        const std::string value = argv[++i];

        if (flag == "--config") {
            // Already applied.
        } else if (flag == "--regions") {
            config.regions_path = value;
        } else if (flag == "--output") {
            config.output_dir = value;
        } else if (flag == "--workers") {
            config.workers = parse_workers(flag, parse_int(flag, value));
        } else if (flag == "--min-year") {
            config.min_year = parse_int(flag, value);
        } else if (flag == "--max-year") {
            config.max_year = parse_int(flag, value);
        } else if (flag == "--log-level") {
            config.log_level = parse_log_level(flag, value);
        } else if (flag == "--pattern") {
            config.pattern = value;
        } else {
            throw std::invalid_argument("Config: unknown option '" + flag + "'");
        }
    }

    config.validate();
    return config;
}

} // namespace idforge::infra
