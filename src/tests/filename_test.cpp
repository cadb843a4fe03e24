#include <gtest/gtest.h>
#include <chrono>
#include <regex>
#include "utils/filename.hpp"
#include "utils/format.hpp"

using xfer::utils::sanitize_filename;

TEST(FilenameTest, KeepsSafeNames) {
  EXPECT_EQ(sanitize_filename("a.txt"), "a.txt");
  EXPECT_EQ(sanitize_filename("report-2024_v2.tar.gz"), "report-2024_v2.tar.gz");
}

TEST(FilenameTest, KeepsOnlyLastPathComponent) {
  EXPECT_EQ(sanitize_filename("../../etc/passwd"), "passwd");
  EXPECT_EQ(sanitize_filename("/abs/path/file.bin"), "file.bin");
  EXPECT_EQ(sanitize_filename("C:\\Users\\me\\doc.pdf"), "doc.pdf");
}

TEST(FilenameTest, ReplacesWhitespaceRuns) {
  EXPECT_EQ(sanitize_filename("my  holiday\tphoto.jpg"), "my_holiday_photo.jpg");
  EXPECT_EQ(sanitize_filename("  padded.txt  "), "padded.txt");
}

TEST(FilenameTest, DropsUnsafeCharacters) {
  EXPECT_EQ(sanitize_filename("na\x01me\x7f.txt"), "name.txt");
  EXPECT_EQ(sanitize_filename("we?ird*<name>.txt"), "weirdname.txt");
  EXPECT_EQ(sanitize_filename("\xe2\x82\xac" "100.txt"), "100.txt");
}

TEST(FilenameTest, FoldsAccentedLettersToAscii) {
  EXPECT_EQ(sanitize_filename("caf\xc3\xa9.txt"), "cafe.txt");
  EXPECT_EQ(sanitize_filename("r\xc3\xa9sum\xc3\xa9.pdf"), "resume.pdf");
  EXPECT_EQ(sanitize_filename("\xc3\x91" "and\xc3\xba \xc3\x9c" "ber.png"), "Nandu_Uber.png");
  EXPECT_EQ(sanitize_filename("gar\xc3\xa7on\xc2\xa0no\xc3\xabl.doc"), "garcon_noel.doc");
  // Letters without a decomposition are still dropped
  EXPECT_EQ(sanitize_filename("stra\xc3\x9f" "e.txt"), "strae.txt");
  EXPECT_EQ(sanitize_filename("\xc3\x86\xc3\x98"), "");
}

TEST(FilenameTest, StripsLeadingAndTrailingDotsAndUnderscores) {
  EXPECT_EQ(sanitize_filename(".hidden"), "hidden");
  EXPECT_EQ(sanitize_filename("__init__"), "init");
  EXPECT_EQ(sanitize_filename("trailing."), "trailing");
}

TEST(FilenameTest, CanSanitizeToNothing) {
  EXPECT_EQ(sanitize_filename(""), "");
  EXPECT_EQ(sanitize_filename(".."), "");
  EXPECT_EQ(sanitize_filename("dir/"), "");
  EXPECT_EQ(sanitize_filename("***"), "");
}

TEST(FormatTest, KilobytesWithOneDecimal) {
  EXPECT_EQ(xfer::utils::format_kb(0), "0.0 KB");
  EXPECT_EQ(xfer::utils::format_kb(1024), "1.0 KB");
  EXPECT_EQ(xfer::utils::format_kb(1536), "1.5 KB");
}

TEST(FormatTest, TimestampLayout) {
  auto text = xfer::utils::format_timestamp(std::chrono::system_clock::now());
  EXPECT_TRUE(std::regex_match(text, std::regex("^\\d{4}-\\d{2}-\\d{2} \\d{2}:\\d{2}:\\d{2}$"))) << text;
}
