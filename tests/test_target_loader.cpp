#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "src/io/target_loader.hpp"

class TargetLoaderTest : public ::testing::Test {};

TEST_F(TargetLoaderTest, SkipsBlankLinesAndComments) {
    const auto targets = io::parse_targets(
        "# production sites\n"
        "https://example.com\n"
        "\n"
        "   \n"
        "  https://example.org/status  \n"
        "#https://disabled.example\n"
        "http://plain.example\r\n");

    const std::vector<std::string> expected = {"https://example.com", "https://example.org/status", "http://plain.example"};
    ASSERT_EQ(targets, expected);
}

TEST_F(TargetLoaderTest, KeepsDuplicatesInOrder) {
    const auto targets = io::parse_targets("https://b.test\nhttps://a.test\nhttps://b.test");

    ASSERT_EQ(targets.size(), 3U);
    EXPECT_EQ(targets[0], "https://b.test");
    EXPECT_EQ(targets[1], "https://a.test");
    EXPECT_EQ(targets[2], "https://b.test");
}

TEST_F(TargetLoaderTest, EmptyTextGivesNoTargets) { EXPECT_TRUE(io::parse_targets("").empty()); }

TEST_F(TargetLoaderTest, LoadsFromFile) {
    const auto path = std::filesystem::temp_directory_path() / "uptime_watch_targets_test.txt";
    {
        std::ofstream out(path);
        out << "https://one.test\n# comment\nhttps://two.test\n";
    }

    const auto targets = io::load_targets(path);
    std::filesystem::remove(path);

    ASSERT_EQ(targets.size(), 2U);
    EXPECT_EQ(targets[0], "https://one.test");
    EXPECT_EQ(targets[1], "https://two.test");
}

TEST_F(TargetLoaderTest, MissingFileThrows) { EXPECT_THROW((void)io::load_targets("/nonexistent/website_list.txt"), std::runtime_error); }
