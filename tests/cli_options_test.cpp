#include "gtest/gtest.h"
#include "cli_options.h"
#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace gptcli;

TEST(CliOptionsTest, ParsesAllFlags) {
    auto options = parseCommandLine({"-c", "a.txt", "--context", "b.txt", "-k", "sk", "-m", "gpt-4",
                                     "-ml", "--config", "/tmp/c.json"});

    ASSERT_EQ(options.context_files.size(), 2u);
    EXPECT_EQ(options.context_files[0], "a.txt");
    EXPECT_EQ(options.context_files[1], "b.txt");
    EXPECT_EQ(options.api_key.value_or(""), "sk");
    EXPECT_EQ(options.model.value_or(""), "gpt-4");
    EXPECT_EQ(options.config_path.value_or(""), "/tmp/c.json");
    EXPECT_TRUE(options.multiline);
    EXPECT_FALSE(options.help);
}

TEST(CliOptionsTest, NoArgumentsMeansDefaults) {
    auto options = parseCommandLine({});
    EXPECT_TRUE(options.context_files.empty());
    EXPECT_FALSE(options.api_key.has_value());
    EXPECT_FALSE(options.model.has_value());
    EXPECT_FALSE(options.multiline);
}

TEST(CliOptionsTest, RejectsUnknownFlagAndMissingValue) {
    EXPECT_THROW(parseCommandLine({"--verbose"}), std::invalid_argument);
    EXPECT_THROW(parseCommandLine({"-m"}), std::invalid_argument);
}

TEST(CliOptionsTest, ReadsContextFilesInOrder) {
    auto dir = std::filesystem::temp_directory_path() / "gptcli_context_test";
    std::filesystem::create_directories(dir);
    std::ofstream(dir / "one.txt") << "first";
    std::ofstream(dir / "two.txt") << "second";

    auto blocks = readContextFiles({(dir / "one.txt").string(), (dir / "two.txt").string()});
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[0].content, "first");
    EXPECT_EQ(blocks[1].content, "second");

    EXPECT_THROW(readContextFiles({(dir / "missing.txt").string()}), std::runtime_error);
    std::filesystem::remove_all(dir);
}
