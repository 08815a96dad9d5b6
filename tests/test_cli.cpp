#include <gtest/gtest.h>
#include "../src/cli/cli.hpp"
#include "securand/common.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

using namespace securand;
using namespace securand::cli;

class CliTest : public ::testing::Test {
protected:
    Settings settings;
    std::ostringstream out;
    std::filesystem::path scratch;

    void SetUp() override {
        scratch = std::filesystem::temp_directory_path() /
                  (std::string("securand_cli_") +
                   ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::create_directories(scratch);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(scratch, ec);
    }

    int command(const std::string& name, const std::vector<std::string>& args) {
        return run_command(name, args, settings, out);
    }

    std::string write_config(const std::string& contents) {
        auto path = scratch / "config.json";
        std::ofstream file(path);
        file << contents;
        return path.string();
    }

    std::string output_line() const {
        std::string text = out.str();
        if (!text.empty() && text.back() == '\n') {
            text.pop_back();
        }
        return text;
    }
};

TEST_F(CliTest, RangeInBounds) {
    EXPECT_EQ(command("range", {"1", "6"}), EXIT_OK);
    int64_t value = 0;
    ASSERT_TRUE(parse_int64(output_line(), value));
    EXPECT_GE(value, 1);
    EXPECT_LE(value, 6);
}

TEST_F(CliTest, RangeInvertedIsLibraryError) {
    EXPECT_EQ(command("range", {"5", "1"}), EXIT_LIBRARY_ERROR);
    EXPECT_TRUE(out.str().empty());
}

TEST_F(CliTest, RangeMalformedIsUsageError) {
    EXPECT_EQ(command("range", {"5x", "1"}), EXIT_USAGE);
    EXPECT_EQ(command("range", {"5"}), EXIT_USAGE);
}

TEST_F(CliTest, PickWithoutItemsIsLibraryError) {
    EXPECT_EQ(command("pick", {}), EXIT_LIBRARY_ERROR);
}

TEST_F(CliTest, PickReturnsAnItem) {
    const std::vector<std::string> items = {"red", "green", "blue"};
    EXPECT_EQ(command("pick", items), EXIT_OK);
    EXPECT_NE(std::find(items.begin(), items.end(), output_line()), items.end());
}

TEST_F(CliTest, NegativeStringLengthIsLibraryError) {
    EXPECT_EQ(command("string", {"-1"}), EXIT_LIBRARY_ERROR);
}

TEST_F(CliTest, StringUsesSettingsDefaults) {
    settings.string_length = 12;
    settings.charset = "ab";
    EXPECT_EQ(command("string", {}), EXIT_OK);
    std::string line = output_line();
    EXPECT_EQ(line.size(), 12u);
    EXPECT_EQ(line.find_first_not_of("ab"), std::string::npos);
}

TEST_F(CliTest, StringWithNamedCharset) {
    EXPECT_EQ(command("string", {"--charset", "digits", "20"}), EXIT_OK);
    std::string line = output_line();
    EXPECT_EQ(line.size(), 20u);
    EXPECT_TRUE(std::all_of(line.begin(), line.end(),
                            [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }));
}

TEST_F(CliTest, StringWithUnknownCharsetName) {
    EXPECT_EQ(command("string", {"--charset", "emoji", "4"}), EXIT_USAGE);
}

TEST_F(CliTest, BytesPrintsHex) {
    EXPECT_EQ(command("bytes", {"4"}), EXIT_OK);
    std::string line = output_line();
    EXPECT_EQ(line.size(), 8u);
    EXPECT_EQ(line.find_first_not_of("0123456789abcdef"), std::string::npos);
}

TEST_F(CliTest, BytesRejectsNegativeCount) {
    EXPECT_EQ(command("bytes", {"-4"}), EXIT_USAGE);
}

TEST_F(CliTest, ShufflePrintsPermutation) {
    EXPECT_EQ(command("shuffle", {"c", "a", "b"}), EXIT_OK);
    std::istringstream words(output_line());
    std::vector<std::string> items;
    for (std::string word; words >> word;) {
        items.push_back(word);
    }
    std::sort(items.begin(), items.end());
    EXPECT_EQ(items, (std::vector<std::string>{"a", "b", "c"}));
}

TEST_F(CliTest, UnknownCommandIsUsageError) {
    EXPECT_EQ(command("dice", {}), EXIT_USAGE);
}

TEST_F(CliTest, StrictIntegerParsing) {
    int64_t value = 0;
    EXPECT_TRUE(parse_int64("-9223372036854775808", value));
    EXPECT_EQ(value, std::numeric_limits<int64_t>::min());
    EXPECT_FALSE(parse_int64("9223372036854775808", value));
    EXPECT_FALSE(parse_int64("", value));
    EXPECT_FALSE(parse_int64("12 ", value));
    EXPECT_FALSE(parse_int64("0x10", value));

    size_t size = 0;
    EXPECT_TRUE(parse_size("16", size));
    EXPECT_EQ(size, 16u);
    EXPECT_FALSE(parse_size("-1", size));
}

TEST_F(CliTest, RunWithConfig) {
    auto path = write_config(R"({"log_level": "off", "string_length": 5, "charset": "z"})");
    EXPECT_EQ(run({"--config", path, "string"}, out), EXIT_OK);
    EXPECT_EQ(output_line(), "zzzzz");
}

TEST_F(CliTest, RunWithMissingConfig) {
    EXPECT_EQ(run({"--config", (scratch / "absent.json").string(), "number"}, out), EXIT_USAGE);
}

TEST_F(CliTest, RunWithMalformedConfig) {
    auto path = write_config("{\"log_level\": ");
    EXPECT_EQ(run({"--config", path, "number"}, out), EXIT_USAGE);
}

TEST_F(CliTest, UnopenableLogFileIsReportedNotFatal) {
    // The log file's parent is a regular file, so the rotating sink cannot open it
    auto blocker = scratch / "not_a_directory";
    {
        std::ofstream file(blocker);
        file << "x";
    }
    auto log_file = (blocker / "securand.log").string();
    auto path = write_config(R"({"log_level": "off", "log_to_file": true, "log_file": ")" + log_file + "\"}");

    int status = EXIT_OK;
    EXPECT_NO_THROW(status = run({"--config", path, "number"}, out));
    EXPECT_EQ(status, EXIT_LIBRARY_ERROR);
    EXPECT_TRUE(out.str().empty());
}

TEST_F(CliTest, NoArgumentsIsUsageError) {
    EXPECT_EQ(run({}, out), EXIT_USAGE);
    EXPECT_EQ(run({"--help"}, out), EXIT_OK);
}

TEST(CharsetTest, ByName) {
    EXPECT_STREQ(charset::by_name("digits"), charset::DIGITS);
    EXPECT_STREQ(charset::by_name("hex"), charset::HEX_LOWER);
    EXPECT_STREQ(charset::by_name("lowercase"), charset::LOWERCASE);
    EXPECT_STREQ(charset::by_name("uppercase"), charset::UPPERCASE);
    EXPECT_STREQ(charset::by_name("urlsafe"), charset::URL_SAFE);
    EXPECT_STREQ(charset::by_name("alphanumeric"), constants::DEFAULT_CHARSET);
    EXPECT_TRUE(charset::by_name("emoji") == nullptr);
    EXPECT_EQ(std::string(charset::URL_SAFE).size(), 64u);
}

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
