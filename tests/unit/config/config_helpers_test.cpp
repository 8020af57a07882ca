#include "test_helpers.h"
#include <pdfledger/config/config_helpers.h>

#include <cstdlib>

using namespace pdfledger;
using namespace pdfledger::config;
using namespace pdfledger::test;

class ConfigHelpersTest : public PdfLedgerTest {
protected:
    void SetUp() override {
        PdfLedgerTest::SetUp();
        ::unsetenv("PDFLEDGER_CONFIG");
    }

    void TearDown() override {
        ::unsetenv("PDFLEDGER_CONFIG");
        PdfLedgerTest::TearDown();
    }
};

TEST_F(ConfigHelpersTest, ReadsSectionAndDottedKeys) {
    auto path = writeFile("pdfledger.toml", R"(# comment line
[scan]
poll_seconds = 7   # seconds
jobs = "3"

guard.stale_seconds = 60

[tools]
mutool = '/opt/mupdf/bin/mutool'
)");

    EXPECT_EQ(parse_config_value(path, "scan", "poll_seconds"), "7");
    EXPECT_EQ(parse_config_value(path, "scan", "jobs"), "3");
    EXPECT_EQ(parse_config_value(path, "guard", "stale_seconds"), "60");
    EXPECT_EQ(parse_config_value(path, "tools", "mutool"), "/opt/mupdf/bin/mutool");
}

TEST_F(ConfigHelpersTest, MissingKeyOrFileIsEmpty) {
    auto path = writeFile("pdfledger.toml", "[scan]\njobs = 2\n");
    EXPECT_EQ(parse_config_value(path, "scan", "poll_seconds"), "");
    EXPECT_EQ(parse_config_value(path, "tools", "jobs"), "");
    EXPECT_EQ(parse_config_value(testDir / "absent.toml", "scan", "jobs"), "");
}

TEST_F(ConfigHelpersTest, ParsesListForms) {
    EXPECT_EQ(parse_list(".pdf,.PDF"), (std::vector<std::string>{".pdf", ".PDF"}));
    EXPECT_EQ(parse_list(R"([".pdf", ".ai"])"), (std::vector<std::string>{".pdf", ".ai"}));
    EXPECT_TRUE(parse_list("[]").empty());
}

TEST_F(ConfigHelpersTest, TrimAndUnquote) {
    EXPECT_EQ(trimmed("  x y \t"), "x y");
    EXPECT_EQ(unquote(" \"quoted\" "), "quoted");
    EXPECT_EQ(unquote("'single'"), "single");
    EXPECT_EQ(unquote("bare"), "bare");
}

TEST_F(ConfigHelpersTest, ConfigPathResolutionOrder) {
    EXPECT_TRUE(get_config_path(testDir).empty());

    auto local = writeFile("pdfledger.toml", "");
    EXPECT_EQ(get_config_path(testDir), local);

    auto fromEnv = writeFile("env.toml", "");
    ::setenv("PDFLEDGER_CONFIG", fromEnv.c_str(), 1);
    EXPECT_EQ(get_config_path(testDir), fromEnv);

    auto explicitPath = testDir / "explicit.toml";
    EXPECT_EQ(get_config_path(testDir, explicitPath.string()), explicitPath);
}
