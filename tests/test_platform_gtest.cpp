// ==============================================================================
// test_platform_gtest.cpp - Тесты платформенного модуля (GoogleTest)
// ==============================================================================
//
// TST-PLATFORM-002..TST-PLATFORM-005
//
// ==============================================================================

#include "terse/platform.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <regex>
#include <string>

namespace terse::platform::test {

class PlatformFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("terse_platform_test_" +
                std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path dir_;
};

// ==============================================================================
// TST-PLATFORM-002: Преобразование путей UTF-8 <-> path
// ==============================================================================

TEST(PlatformTest, PathFromUtf8_BasicPath) {
    // Arrange
    std::string utf8 = "test/path/file.txt";

    // Act
    std::filesystem::path p = path_from_utf8(utf8);

    // Assert
    EXPECT_EQ(p.filename(), "file.txt");
}

TEST(PlatformTest, PathConversion_RoundtripWithCyrillic) {
    // Arrange
    std::string original_utf8 = "путь/к/файлу с пробелом.txt";

    // Act
    std::string roundtrip = path_to_utf8(path_from_utf8(original_utf8));

    // Assert
    EXPECT_EQ(roundtrip, original_utf8);
}

TEST(PlatformTest, PathFromUtf8_EmptyString) {
    EXPECT_TRUE(path_from_utf8("").empty());
    EXPECT_TRUE(path_to_utf8(std::filesystem::path()).empty());
}

// ==============================================================================
// TST-PLATFORM-003: Каталог состояния и окружение
// ==============================================================================

TEST(PlatformTest, StateDir_TerseHomeOverride) {
    const auto previous = get_env("TERSE_HOME");
    ::setenv("TERSE_HOME", "/tmp/terse-state", 1);

    auto dir = state_dir();
    ASSERT_TRUE(dir.has_value());
    EXPECT_EQ(path_to_utf8(*dir), "/tmp/terse-state");

    if (previous) {
        ::setenv("TERSE_HOME", previous->c_str(), 1);
    } else {
        ::unsetenv("TERSE_HOME");
    }
}

TEST(PlatformTest, GetEnv_MissingVariable) {
    EXPECT_FALSE(get_env("TERSE_TEST_SURELY_UNSET_VARIABLE").has_value());
}

// ==============================================================================
// TST-PLATFORM-004: Файлы
// ==============================================================================

TEST(PlatformTest, MakeTempFile_UniqueWithPrefix) {
    std::filesystem::path path1 = make_temp_file("terse_test");
    std::filesystem::path path2 = make_temp_file("terse_test");

    EXPECT_NE(path1, path2);
    EXPECT_TRUE(std::filesystem::exists(path1));
    EXPECT_NE(path1.filename().string().find("terse_test"), std::string::npos);

    std::filesystem::remove(path1);
    std::filesystem::remove(path2);
}

TEST_F(PlatformFileTest, WriteFileAtomic_CreatesParentsAndReplaces) {
    const auto file = dir_ / "a" / "b" / "state.json";
    ASSERT_TRUE(write_file_atomic(file, "first"));
    ASSERT_TRUE(write_file_atomic(file, "second"));

    auto content = read_file(file);
    ASSERT_TRUE(content.has_value());
    EXPECT_EQ(*content, "second");

    // Временные файлы рядом с целевым не остаются
    size_t entries = 0;
    for (const auto& entry : std::filesystem::directory_iterator(file.parent_path())) {
        (void)entry;
        ++entries;
    }
    EXPECT_EQ(entries, 1u);
}

TEST_F(PlatformFileTest, AppendLine_AddsNewline) {
    const auto file = dir_ / "log" / "events.jsonl";
    ASSERT_TRUE(append_line(file, "one"));
    ASSERT_TRUE(append_line(file, "two"));
    EXPECT_EQ(read_file(file).value_or(""), "one\ntwo\n");
}

TEST_F(PlatformFileTest, ReadFile_Missing) {
    EXPECT_FALSE(read_file(dir_ / "missing.txt").has_value());
}

// ==============================================================================
// TST-PLATFORM-005: Время
// ==============================================================================

TEST(PlatformTest, NowRfc3339_Format) {
    const std::regex pattern(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}Z)");
    EXPECT_TRUE(std::regex_match(now_rfc3339(), pattern));
}

TEST(PlatformTest, Clocks_Advance) {
    EXPECT_GT(now_unix(), 1600000000);
    const auto a = monotonic_ms();
    const auto b = monotonic_ms();
    EXPECT_LE(a, b);
}

}  // namespace terse::platform::test
