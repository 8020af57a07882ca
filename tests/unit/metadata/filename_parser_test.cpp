#include <gtest/gtest.h>
#include <pdfledger/metadata/filename_parser.h>

using namespace pdfledger::metadata;

namespace {

FilingAttributes attrs(std::string c, std::string t, std::string d) {
    return FilingAttributes{std::move(c), std::move(t), std::move(d)};
}

} // namespace

TEST(FilenameParserTest, TrailingFieldsBeyondThreeAreIgnored) {
    EXPECT_EQ(parseFilingName("MCRO_2024-001_Order_2024-05-01_x.pdf"),
              attrs("2024-001", "Order", "2024-05-01"));
}

TEST(FilenameParserTest, ExtensionStrippedFromFinalField) {
    EXPECT_EQ(parseFilingName("MCRO_2024-001_Order_2024-05-01.pdf"),
              attrs("2024-001", "Order", "2024-05-01"));
    EXPECT_EQ(parseFilingName("MCRO_27-CR-23-1234_Motion.pdf"),
              attrs("27-CR-23-1234", "Motion", ""));
}

TEST(FilenameParserTest, ExtensionMatchIsCaseInsensitive) {
    EXPECT_EQ(parseFilingName("MCRO_2024-001.PDF"), attrs("2024-001", "", ""));
}

TEST(FilenameParserTest, ExtensionOnlyStrippedFromLastFieldOfName) {
    // ".pdf" inside an earlier field is part of the value
    EXPECT_EQ(parseFilingName("MCRO_a.pdf_b_c_d.pdf"), attrs("a.pdf", "b", "c"));
}

TEST(FilenameParserTest, NoPrefixYieldsBlanks) {
    EXPECT_EQ(parseFilingName("random.pdf"), attrs("", "", ""));
    EXPECT_EQ(parseFilingName("mcro_2024-001_Order.pdf"), attrs("", "", ""));
    EXPECT_EQ(parseFilingName(""), attrs("", "", ""));
}

TEST(FilenameParserTest, EmptyFieldsArePreserved) {
    EXPECT_EQ(parseFilingName("MCRO__Order_.pdf"), attrs("", "Order", ""));
    EXPECT_EQ(parseFilingName("MCRO_"), attrs("", "", ""));
}

TEST(FilenameParserTest, ConfiguredExtensions) {
    EXPECT_EQ(parseFilingName("MCRO_1_Brief.ai", {".pdf", ".ai"}), attrs("1", "Brief", ""));
}
