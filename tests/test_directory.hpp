#ifndef test_directory_hpp
#define test_directory_hpp

#include <unistd.h> // for getpid

#include <filesystem>
#include <string>

#include <gtest/gtest.h>

/// @brief Gets a temporary directory path unique to the running test.
/// @note The path is made from the test's name and the process ID so
///   tests running at the same time don't share directories.
inline auto test_directory(const std::string& prefix)
    -> std::filesystem::path
{
    const auto info = ::testing::UnitTest::GetInstance()->current_test_info();
    auto name = prefix;
    if (info) {
        name += "-";
        name += info->test_suite_name();
        name += "-";
        name += info->name();
    }
    name += "-" + std::to_string(::getpid());
    return std::filesystem::temp_directory_path() / name;
}

#endif /* test_directory_hpp */
