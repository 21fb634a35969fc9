/**
 * @file test_support.hpp
 * @brief Shared helpers for the giantt unit tests.
 */
#pragma once
#include "giantt/model/item.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace giantt_test
{

/**
 * @brief Build a bare item with the given id and title.
 */
inline giantt::Item make_item(const std::string& id, const std::string& title = "")
{
    giantt::Item item;
    item.id = id;
    item.title = title.empty() ? id : title;
    item.duration = giantt::Duration(1, giantt::DurationUnit::Days);
    return item;
}

inline void write_file(const std::filesystem::path& path, const std::string& content)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string read_file(const std::filesystem::path& path)
{
    std::ifstream in(path, std::ios::binary);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

/**
 * @brief Fixture that owns a fresh temporary directory per test.
 */
class TempDirTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        static std::atomic<int> counter{0};
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        m_dir = std::filesystem::temp_directory_path() /
            ("giantt_" + std::string(info->test_suite_name()) + "_" + info->name() + "_" +
                std::to_string(counter++));
        std::filesystem::remove_all(m_dir);
        std::filesystem::create_directories(m_dir);
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(m_dir, ec);
    }

    const std::filesystem::path& dir() const
    {
        return m_dir;
    }

private:
    std::filesystem::path m_dir;
};

} // namespace giantt_test
