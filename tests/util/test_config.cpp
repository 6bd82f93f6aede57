// TIERPOOL - Configuration File Parser Tests
// Copyright (c) 2024 TIERPOOL Developers
// MIT License

#include <gtest/gtest.h>

#include "tierpool/util/config.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <unistd.h>

namespace tierpool {
namespace util {
namespace test {

// ============================================================================
// Test Fixtures
// ============================================================================

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.Clear();
    }

    void TearDown() override {
        for (const auto& file : tempFiles_) {
            std::remove(file.c_str());
        }
        tempFiles_.clear();
    }

    std::string CreateTempFile(const std::string& content) {
        char filename[] = "/tmp/tierpool_config_test_XXXXXX";
        int fd = mkstemp(filename);
        if (fd < 0) {
            throw std::runtime_error("Failed to create temp file");
        }
        close(fd);

        std::ofstream file(filename);
        file << content;
        file.close();

        tempFiles_.push_back(filename);
        return filename;
    }

    ConfigManager config_;
    std::vector<std::string> tempFiles_;
};

// ============================================================================
// Parsing
// ============================================================================

TEST_F(ConfigTest, ParseKeyValue) {
    auto result = config_.ParseString("feebps=500\nname = pool one\n");
    ASSERT_TRUE(result.success) << result.ToString();
    EXPECT_EQ(config_.GetString("feebps", ""), "500");
    EXPECT_EQ(config_.GetString("name", ""), "pool one");
    EXPECT_EQ(config_.Size(), 2u);
}

TEST_F(ConfigTest, CommentsAndBlankLines) {
    auto result = config_.ParseString("# comment\n\n; another\nkey=value\n");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 1u);
}

TEST_F(ConfigTest, Sections) {
    auto result = config_.ParseString(
        "level=info\n"
        "[pool]\n"
        "feebps=250\n"
        "[log]\n"
        "level=debug\n");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("level", ""), "info");
    EXPECT_EQ(config_.GetString("level", "", "log"), "debug");
    EXPECT_EQ(config_.GetInt("feebps", 0, "pool"), 250);
    EXPECT_FALSE(config_.HasKey("feebps"));
}

TEST_F(ConfigTest, QuotedValues) {
    auto result = config_.ParseString(
        "a=\"spaced value\"\n"
        "b='single ${HOME}'\n"
        "c=\"tab\\there\"\n");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("a", ""), "spaced value");
    EXPECT_EQ(config_.GetString("c", ""), "tab\there");
}

TEST_F(ConfigTest, EnvironmentExpansion) {
    setenv("TIERPOOL_TEST_VAR", "expanded", 1);
    auto result = config_.ParseString("path=${TIERPOOL_TEST_VAR}/x\nmissing=${TIERPOOL_NOPE}\n");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("path", ""), "expanded/x");
    EXPECT_EQ(config_.GetString("missing", "default"), "");
    unsetenv("TIERPOOL_TEST_VAR");
}

TEST_F(ConfigTest, MissingEqualsIsError) {
    auto result = config_.ParseString("ok=1\nbroken line\n", "test.conf");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorLine, 2);
    EXPECT_EQ(result.errorFile, "test.conf");
    EXPECT_NE(result.ToString().find("test.conf:2:"), std::string::npos);
}

TEST_F(ConfigTest, UnclosedSectionIsError) {
    auto result = config_.ParseString("[pool\nkey=value\n");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorLine, 1);
}

TEST_F(ConfigTest, InvalidKeyIsError) {
    auto result = config_.ParseString("bad key=1\n");
    EXPECT_FALSE(result.success);
}

TEST_F(ConfigTest, ParseFile) {
    std::string path = CreateTempFile("[pool]\noperator=abc\n");
    auto result = config_.ParseFile(path);
    ASSERT_TRUE(result.success) << result.ToString();
    EXPECT_EQ(config_.GetString("operator", "", "pool"), "abc");
}

TEST_F(ConfigTest, ParseMissingFile) {
    auto result = config_.ParseFile("/nonexistent/tierpool.conf");
    EXPECT_FALSE(result.success);
}

// ============================================================================
// Typed Access
// ============================================================================

TEST_F(ConfigTest, IntegerParsing) {
    ASSERT_TRUE(config_.ParseString("a=42\nb=-7\nc=12x\nd=\ne=99999999999999999999\n").success);
    EXPECT_EQ(config_.TryGetInt("a").value_or(0), 42);
    EXPECT_EQ(config_.TryGetInt("b").value_or(0), -7);
    EXPECT_FALSE(config_.TryGetInt("c").has_value());
    EXPECT_FALSE(config_.TryGetInt("d").has_value());
    EXPECT_FALSE(config_.TryGetInt("e").has_value());
    EXPECT_EQ(config_.GetInt("missing", 5), 5);
}

TEST_F(ConfigTest, BooleanParsing) {
    ASSERT_TRUE(config_.ParseString("a=yes\nb=Off\nc=1\nd=maybe\n").success);
    EXPECT_TRUE(config_.GetBool("a", false));
    EXPECT_FALSE(config_.GetBool("b", true));
    EXPECT_TRUE(config_.GetBool("c", false));
    EXPECT_FALSE(config_.TryGetBool("d").has_value());
    EXPECT_TRUE(config_.GetBool("d", true));
}

TEST_F(ConfigTest, SetOverrides) {
    ASSERT_TRUE(config_.ParseString("[pool]\nfeebps=100\n").success);
    config_.Set("feebps", "300", "pool");
    EXPECT_EQ(config_.GetInt("feebps", 0, "pool"), 300);
}

// ============================================================================
// Command Line
// ============================================================================

TEST_F(ConfigTest, CommandLineForms) {
    const char* argv[] = {
        "tierpool-sim", "-conf=pool.conf", "--loglevel", "debug",
        "-pool.feebps=700", "-verbose", "script.txt"
    };
    auto result = config_.ParseCommandLine(7, argv);
    ASSERT_TRUE(result.success) << result.ToString();

    EXPECT_EQ(config_.GetString("conf", ""), "pool.conf");
    EXPECT_EQ(config_.GetString("loglevel", ""), "debug");
    EXPECT_EQ(config_.GetInt("feebps", 0, "pool"), 700);
    EXPECT_TRUE(config_.GetBool("verbose", false));

    ASSERT_EQ(config_.GetPositionalArgs().size(), 1u);
    EXPECT_EQ(config_.GetPositionalArgs()[0], "script.txt");
}

TEST_F(ConfigTest, BareFlagKeepsFollowingPositional) {
    const char* argv[] = {"tierpool-sim", "-log.console", "script.txt"};
    ASSERT_TRUE(config_.ParseCommandLine(3, argv).success);

    EXPECT_TRUE(config_.GetBool("console", false, "log"));
    ASSERT_EQ(config_.GetPositionalArgs().size(), 1u);
    EXPECT_EQ(config_.GetPositionalArgs()[0], "script.txt");
}

TEST_F(ConfigTest, DoubleDashTakesNextValue) {
    const char* argv[] = {"prog", "--log.pool", "debug", "--dry-run"};
    ASSERT_TRUE(config_.ParseCommandLine(4, argv).success);

    EXPECT_EQ(config_.GetString("pool", "", "log"), "debug");
    EXPECT_TRUE(config_.GetBool("dry-run", false));
    EXPECT_TRUE(config_.GetPositionalArgs().empty());
}

TEST_F(ConfigTest, CommandLineOverridesFile) {
    ASSERT_TRUE(config_.ParseString("[pool]\nfeebps=100\n").success);
    const char* argv[] = {"prog", "-pool.feebps=900"};
    ASSERT_TRUE(config_.ParseCommandLine(2, argv).success);
    EXPECT_EQ(config_.GetInt("feebps", 0, "pool"), 900);
}

TEST_F(ConfigTest, ClearRemovesEverything) {
    const char* argv[] = {"prog", "-a=1", "positional"};
    ASSERT_TRUE(config_.ParseCommandLine(3, argv).success);
    config_.Clear();
    EXPECT_EQ(config_.Size(), 0u);
    EXPECT_TRUE(config_.GetPositionalArgs().empty());
}

} // namespace test
} // namespace util
} // namespace tierpool
