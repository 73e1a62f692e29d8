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
 * @file storage_test.cpp
 * @brief Unit tests for the region table loader and the result writer.
 *
 * @details
 * Covers the two filesystem touchpoints of a request:
 * 1. Loading and validating the region whitelist document.
 * 2. Persisting a result list under a timestamped name.
 */

#include "framework.hpp"
#include "idforge/storage/region_store.hpp"
#include "idforge/storage/result_writer.hpp"

#include <ctime>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using idforge::core::RegionTable;
using idforge::storage::RegionStore;
using idforge::storage::ResultWriter;

/**
 * @class StorageTestManager
 * @brief RAII scratch directory for storage tests.
 *
 * @details
 * - **Setup**: Purges the directory before the first test.
 * - **Teardown**: Removes it when the test binary exits.
 */
class StorageTestManager {
  public:
    /// @brief Path to the temporary, volatile test directory.
    const std::string path = "./test_idforge_storage";

    StorageTestManager() { reset(); }

    ~StorageTestManager()
    {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    /**
     * @brief Explicitly resets the workspace to prevent cross-test leakage.
     */
    void reset()
    {
        if (fs::exists(path)) {
            fs::remove_all(path);
        }
    }

    /// @brief Writes `content` to `name` inside the scratch directory and returns its path.
    std::string write_file(const std::string& name, const std::string& content) const
    {
        fs::create_directories(path);
        const std::string file_path = path + "/" + name;
        std::ofstream out(file_path, std::ios::trunc);
        out << content;
        return file_path;
    }
};

// Global instance to handle automated cleanup upon process exit.
static StorageTestManager g_test_manager;

namespace {

std::vector<std::string> read_lines(const std::string& path)
{
    std::vector<std::string> lines;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

} // namespace

void test_region_store_parse()
{
    RegionTable table = RegionStore::parse(
        R"({"110101": "北京市东城区", "440106": "广东省广州市天河区"})");

    ASSERT_EQ(table.size(), static_cast<size_t>(2));
    ASSERT_EQ(table.at("110101"), std::string("北京市东城区"));
    ASSERT_EQ(table.at("440106"), std::string("广东省广州市天河区"));
}

/**
 * @brief Malformed entries are dropped, the rest of the document survives.
 *
 * Rejected: a five-digit key, a key with a letter, a numeric value.
 */
void test_region_store_skips_malformed()
{
    RegionTable table = RegionStore::parse(
        R"({"11010": "short", "11010A": "letter", "110102": 42, "441900": "广东省东莞市"})");

    ASSERT_EQ(table.size(), static_cast<size_t>(1));
    ASSERT_EQ(table.count("441900"), static_cast<size_t>(1));
}

void test_region_store_rejects_invalid()
{
    ASSERT_THROWS(RegionStore::parse("{\"110101\": "), std::runtime_error);
    ASSERT_THROWS(RegionStore::parse("[\"110101\"]"), std::runtime_error);
    ASSERT_THROWS(RegionStore::load(g_test_manager.path + "/missing.json"), std::runtime_error);
}

void test_region_store_load()
{
    g_test_manager.reset();
    const std::string file =
        g_test_manager.write_file("regions.json", R"({"450102": "广西壮族自治区南宁市兴宁区"})");

    RegionTable table = RegionStore::load(file);
    ASSERT_EQ(table.size(), static_cast<size_t>(1));
    ASSERT_EQ(table.at("450102"), std::string("广西壮族自治区南宁市兴宁区"));
}

/**
 * @brief The file name encodes local time as `YYYYMMDD_HHMMSS.txt`.
 */
void test_result_writer_file_name()
{
    std::tm local{};
    local.tm_year = 1998 - 1900;
    local.tm_mon = 6;
    local.tm_mday = 4;
    local.tm_hour = 9;
    local.tm_min = 5;
    local.tm_sec = 7;
    local.tm_isdst = -1;
    const std::time_t stamp = std::mktime(&local);

    ASSERT_EQ(ResultWriter::file_name(stamp), std::string("19980704_090507.txt"));
}

/**
 * @brief Writes one number per line in the given order, creating the
 * directory on demand and leaving no temporary file behind.
 */
void test_result_writer_writes_lines()
{
    g_test_manager.reset();
    const std::string dir = g_test_manager.path + "/nested/out";
    ResultWriter writer(dir);

    const std::vector<std::string> ids = {"110101199001010007", "110101199001010015",
                                          "11010519491231002X"};
    const std::time_t stamp = std::time(nullptr);
    const std::string path = writer.write(ids, stamp);

    ASSERT_FALSE(path.empty());
    ASSERT_TRUE(fs::exists(path));
    ASSERT_FALSE(fs::exists(path + ".tmp"));
    ASSERT_EQ(fs::path(path).filename().string(), ResultWriter::file_name(stamp));
    ASSERT_TRUE(read_lines(path) == ids);
}

/**
 * @brief An unusable output location is reported through an empty path.
 */
void test_result_writer_unwritable()
{
    g_test_manager.reset();
    const std::string blocker = g_test_manager.write_file("blocker", "not a directory");

    ResultWriter writer(blocker + "/out");
    ASSERT_EQ(writer.write({"110101199001010007"}), std::string(""));
}

/**
 * @brief Two writes in the same second keep both files.
 */
void test_result_writer_same_second()
{
    g_test_manager.reset();
    ResultWriter writer(g_test_manager.path);
    const std::time_t stamp = std::time(nullptr);

    const std::vector<std::string> first = {"110101199001010007"};
    const std::vector<std::string> second = {"11010519491231002X"};
    const std::string first_path = writer.write(first, stamp);
    const std::string second_path = writer.write(second, stamp);

    ASSERT_FALSE(first_path.empty());
    ASSERT_FALSE(second_path.empty());
    ASSERT_NE(first_path, second_path);

    const std::string stem = fs::path(ResultWriter::file_name(stamp)).stem().string();
    ASSERT_EQ(fs::path(second_path).filename().string(), stem + "_1.txt");

    ASSERT_TRUE(read_lines(first_path) == first);
    ASSERT_TRUE(read_lines(second_path) == second);
}
