// PrivDAO - Configuration Parser Tests
// Copyright (c) 2024 PrivDAO Developers
// MIT License

#include <gtest/gtest.h>
#include "privdao/util/config.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <random>

using namespace privdao;
using namespace privdao::util;

class ConfigManagerTest : public ::testing::Test {
protected:
    ConfigManager config_;
};

// ============================================================================
// File Format
// ============================================================================

TEST_F(ConfigManagerTest, KeyValuesAndComments) {
    auto r = config_.ParseString(
        "# data location\n"
        "datadir=/var/lib/privdao\n"
        "; another comment\n"
        "  debug = yes  \n");
    ASSERT_TRUE(r.success) << r.ToString();
    EXPECT_EQ(config_.GetString("datadir", ""), "/var/lib/privdao");
    EXPECT_TRUE(config_.GetBool("debug", false));
    EXPECT_EQ(config_.Size(), 2u);
}

TEST_F(ConfigManagerTest, Sections) {
    ASSERT_TRUE(config_.ParseString(
        "loglevel=info\n"
        "[engine]\n"
        "reveal_rebate=2000\n"
        "[ logging ]\n"
        "loglevel=debug\n").success);

    EXPECT_EQ(config_.GetUInt("reveal_rebate", 0, "engine"), 2000u);
    EXPECT_FALSE(config_.HasKey("reveal_rebate"));
    EXPECT_EQ(config_.GetString("loglevel", ""), "info");
    EXPECT_EQ(config_.GetString("loglevel", "", "logging"), "debug");
    EXPECT_TRUE(config_.HasKey("engine.reveal_rebate"));
}

TEST_F(ConfigManagerTest, QuotedValues) {
    ASSERT_TRUE(config_.ParseString(
        "name=\"builders guild\"\n"
        "raw='a\\nb'\n"
        "escaped=\"a\\tb\"\n").success);
    EXPECT_EQ(config_.GetString("name", ""), "builders guild");
    EXPECT_EQ(config_.GetString("raw", ""), "a\\nb");
    EXPECT_EQ(config_.GetString("escaped", ""), "a\tb");
}

TEST_F(ConfigManagerTest, LineContinuation) {
    ASSERT_TRUE(config_.ParseString("title=first \\\nsecond\n").success);
    EXPECT_EQ(config_.GetString("title", ""), "first second");
}

TEST_F(ConfigManagerTest, BareKeyIsFlag) {
    ASSERT_TRUE(config_.ParseString("printtoconsole\n").success);
    EXPECT_TRUE(config_.GetBool("printtoconsole", false));
}

TEST_F(ConfigManagerTest, ParseErrorsCarryLine) {
    auto r = config_.ParseString("ok=1\n[broken\n", "test.conf");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.errorLine, 2);
    EXPECT_EQ(r.ToString().rfind("test.conf:2: ", 0), 0u);

    ConfigManager other;
    EXPECT_FALSE(other.ParseString("bad key=1\n").success);
}

TEST_F(ConfigManagerTest, EnvironmentExpansion) {
    setenv("PRIVDAO_TEST_DIR", "/tmp/dao", 1);
    ASSERT_TRUE(config_.ParseString("datadir=${PRIVDAO_TEST_DIR}/db\n").success);
    EXPECT_EQ(config_.GetString("datadir", ""), "/tmp/dao/db");
    EXPECT_EQ(ConfigManager::ExpandEnvVars("${PRIVDAO_UNSET_VARIABLE_X}x"), "x");
    unsetenv("PRIVDAO_TEST_DIR");
}

TEST_F(ConfigManagerTest, TildeExpansion) {
    setenv("HOME", "/home/member", 1);
    EXPECT_EQ(ConfigManager::ExpandTilde("~/keys"), "/home/member/keys");
    EXPECT_EQ(ConfigManager::ExpandTilde("~other/keys"), "~other/keys");
    EXPECT_EQ(ConfigManager::ExpandTilde("/abs"), "/abs");
    EXPECT_EQ(ConfigManager::GetDefaultDataDir(), "/home/member/.privdao");

    config_.Set("datadir", "~/data");
    EXPECT_EQ(config_.GetPath("datadir"), "/home/member/data");
}

TEST_F(ConfigManagerTest, ParseFile) {
    std::random_device rd;
    auto path = std::filesystem::temp_directory_path() /
                ("privdao_conf_" + std::to_string(rd()) + ".conf");
    {
        std::ofstream out(path);
        out << "[engine]\nproposal_deposit=5\n";
    }
    auto r = config_.ParseFile(path.string());
    std::filesystem::remove(path);
    ASSERT_TRUE(r.success) << r.ToString();
    EXPECT_EQ(config_.GetUInt("proposal_deposit", 0, "engine"), 5u);

    EXPECT_FALSE(config_.ParseFile(path.string()).success);
}

// ============================================================================
// Typed Accessors
// ============================================================================

TEST_F(ConfigManagerTest, IntegerParsing) {
    config_.Set("neg", "-7");
    config_.Set("big", "18446744073709551615");
    config_.Set("junk", "12abc");

    EXPECT_EQ(config_.GetInt("neg", 0), -7);
    EXPECT_FALSE(config_.TryGetUInt("neg").has_value());
    EXPECT_EQ(config_.GetUInt("big", 0), 18446744073709551615ULL);
    EXPECT_FALSE(config_.TryGetInt("junk").has_value());
    EXPECT_FALSE(config_.TryGetUInt("junk").has_value());
    EXPECT_EQ(config_.GetInt("missing", 42), 42);
}

TEST_F(ConfigManagerTest, BooleanSpellings) {
    for (const char* t : {"true", "YES", "on", "1"}) {
        config_.Set("flag", t);
        EXPECT_EQ(config_.TryGetBool("flag"), std::optional<bool>(true)) << t;
    }
    for (const char* f : {"false", "No", "off", "0"}) {
        config_.Set("flag", f);
        EXPECT_EQ(config_.TryGetBool("flag"), std::optional<bool>(false)) << f;
    }
    config_.Set("flag", "maybe");
    EXPECT_FALSE(config_.TryGetBool("flag").has_value());
}

TEST_F(ConfigManagerTest, DefaultsNeverOverride) {
    config_.Set("loglevel", "warn");
    config_.SetDefault("loglevel", "info");
    config_.SetDefault("datadir", "/default");
    EXPECT_EQ(config_.GetString("loglevel", ""), "warn");
    EXPECT_EQ(config_.GetString("datadir", ""), "/default");

    config_.Clear();
    EXPECT_EQ(config_.Size(), 0u);
}

// ============================================================================
// Command Line
// ============================================================================

TEST_F(ConfigManagerTest, CommandLineOptionsAndPositionals) {
    const char* argv[] = {"privdao-cli", "--datadir=/tmp/x", "-debug", "-noprinttoconsole",
                          "commit-vote", "--engine.reveal_rebate=0", "abcd"};
    std::vector<std::string> positional;
    auto r = config_.ParseCommandLine(7, argv, positional);
    ASSERT_TRUE(r.success) << r.ToString();

    EXPECT_EQ(config_.GetString("datadir", ""), "/tmp/x");
    EXPECT_TRUE(config_.GetBool("debug", false));
    EXPECT_FALSE(config_.GetBool("printtoconsole", true));
    EXPECT_EQ(config_.GetUInt("reveal_rebate", 99, "engine"), 0u);
    EXPECT_EQ(positional, (std::vector<std::string>{"commit-vote", "abcd"}));
}

TEST_F(ConfigManagerTest, CommandLineOverridesFile) {
    ASSERT_TRUE(config_.ParseString("now=100\n").success);
    const char* argv[] = {"privdao-cli", "-now=250"};
    std::vector<std::string> positional;
    ASSERT_TRUE(config_.ParseCommandLine(2, argv, positional).success);
    EXPECT_EQ(config_.GetInt("now", 0), 250);
}

TEST_F(ConfigManagerTest, CommandLineInvalidOption) {
    const char* argv[] = {"privdao-cli", "--bad key=1"};
    std::vector<std::string> positional;
    EXPECT_FALSE(config_.ParseCommandLine(2, argv, positional).success);
}
