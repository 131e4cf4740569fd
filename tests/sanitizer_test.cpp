#include "sanitizer.hpp"
#include "test_helpers.hpp"
#include <csignal>
#include <format>
#include <sys/resource.h>
#include <gtest/gtest.h>

namespace fs = std::filesystem;
using namespace testing_support;

class SanitizerTest : public ::testing::Test {
protected:
    TempDir dir;
    SanitizationRules rules = SanitizationRules::defaults();
    fs::path input = dir / "backup_20240101_120000.sql";
    fs::path output = dir / "backup_20240101_120000.sql.sanitized";
};

TEST_F(SanitizerTest, DropsMatchingLinesAndKeepsTheRestInOrder) {
    writeFile(input,
              "SET statement_timeout = 0;\n"
              "SET transaction_timeout = 0;\n"
              "\\restrict abc123\n"
              "CREATE TABLE notes (id integer);\n"
              "  SET idle_in_transaction_session_timeout = 0;\n"
              "INSERT INTO notes VALUES (1);\n"
              "\\unrestrict abc123\n");

    auto stats = sanitizeDump(input, output, rules);
    ASSERT_TRUE(stats.has_value()) << stats.error().message;
    EXPECT_EQ(stats->linesTotal, 7u);
    EXPECT_EQ(stats->linesFiltered, 4u);
    EXPECT_EQ(readFile(output),
              "SET statement_timeout = 0;\n"
              "CREATE TABLE notes (id integer);\n"
              "INSERT INTO notes VALUES (1);\n");
}

TEST_F(SanitizerTest, LeavesTheInputUntouched) {
    const std::string original = "SET transaction_timeout = 0;\nSELECT 1;\n";
    writeFile(input, original);

    ASSERT_TRUE(sanitizeDump(input, output, rules).has_value());
    EXPECT_EQ(readFile(input), original);
}

TEST_F(SanitizerTest, PassesBinaryBytesThroughUnchanged) {
    std::string binaryLine("COPY blobs FROM stdin;\n", 23);
    std::string payload;
    payload.push_back('\xff');
    payload.push_back('\xfe');
    payload.push_back('\x00');
    payload.push_back('\x80');
    payload.push_back('\xc3');
    payload.push_back('\x28');
    payload += "\tend\r\n";
    writeFile(input, binaryLine + payload + "\\restrict x\n" + "\\.\n");

    auto stats = sanitizeDump(input, output, rules);
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->linesTotal, 4u);
    EXPECT_EQ(stats->linesFiltered, 1u);
    EXPECT_EQ(readFile(output), binaryLine + payload + "\\.\n");
}

TEST_F(SanitizerTest, PreservesMissingFinalNewline) {
    writeFile(input, "SELECT 1;\nSELECT 2;");

    auto stats = sanitizeDump(input, output, rules);
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->linesTotal, 2u);
    EXPECT_EQ(readFile(output), "SELECT 1;\nSELECT 2;");
}

TEST_F(SanitizerTest, EmptyInputProducesEmptyOutput) {
    writeFile(input, "");

    auto stats = sanitizeDump(input, output, rules);
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->linesTotal, 0u);
    EXPECT_EQ(stats->linesFiltered, 0u);
    EXPECT_TRUE(fs::exists(output));
    EXPECT_EQ(fs::file_size(output), 0u);
}

TEST_F(SanitizerTest, MissingInputIsAnIOFailureWithoutOutput) {
    auto stats = sanitizeDump(dir / "absent.sql", output, rules);
    ASSERT_FALSE(stats.has_value());
    EXPECT_EQ(stats.error().kind, BackupErrorKind::SanitizeIOFailure);
    EXPECT_FALSE(fs::exists(output));
}

TEST_F(SanitizerTest, UnwritableOutputIsAnIOFailure) {
    writeFile(input, "SELECT 1;\n");

    auto stats = sanitizeDump(input, dir / "missing_dir" / "out.sql.sanitized", rules);
    ASSERT_FALSE(stats.has_value());
    EXPECT_EQ(stats.error().kind, BackupErrorKind::SanitizeIOFailure);
}

TEST_F(SanitizerTest, WriteFailurePartwayRemovesPartialOutput) {
    std::string dump;
    for (int row = 0; dump.size() < 5 * 1024 * 1024; ++row) {
        dump += std::format("INSERT INTO notes VALUES ({}, 'row {} of a large table');\n", row, row);
    }
    writeFile(input, dump);

    // Cap file growth at 64 KiB so the sanitized copy fails after its first buffers reach disk.
    rlimit previousLimit{};
    ASSERT_EQ(::getrlimit(RLIMIT_FSIZE, &previousLimit), 0);
    auto previousHandler = std::signal(SIGXFSZ, SIG_IGN);
    rlimit capped = previousLimit;
    capped.rlim_cur = 64 * 1024;
    ASSERT_EQ(::setrlimit(RLIMIT_FSIZE, &capped), 0);

    auto stats = sanitizeDump(input, output, rules);

    ::setrlimit(RLIMIT_FSIZE, &previousLimit);
    std::signal(SIGXFSZ, previousHandler);

    ASSERT_FALSE(stats.has_value());
    EXPECT_EQ(stats.error().kind, BackupErrorKind::SanitizeIOFailure);
    EXPECT_FALSE(fs::exists(output));
    EXPECT_TRUE(fs::exists(input));
}

TEST(SanitizationRuleTest, MatchesOnlyLeadingPrefixAfterWhitespace) {
    SanitizationRules rules = SanitizationRules::defaults();
    EXPECT_TRUE(matchesSanitizationRule("\t SET transaction_timeout = 0;\r", rules));
    EXPECT_TRUE(matchesSanitizationRule("\\unrestrict", rules));
    EXPECT_FALSE(matchesSanitizationRule("-- SET transaction_timeout = 0;", rules));
    EXPECT_FALSE(matchesSanitizationRule("SET statement_timeout = 0;", rules));
    EXPECT_FALSE(matchesSanitizationRule("", rules));
}

TEST(SanitizationRuleTest, CustomRulesReplaceDefaults) {
    SanitizationRules rules;
    rules.versionSpecific = {"SET default_table_access_method"};
    EXPECT_TRUE(matchesSanitizationRule("SET default_table_access_method = heap;", rules));
    EXPECT_FALSE(matchesSanitizationRule("\\restrict abc", rules));
}
