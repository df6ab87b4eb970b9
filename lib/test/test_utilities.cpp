#include "Utilities.h"
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

namespace quub {
namespace utl {

TEST(Sha256Test, EmptyStringProducesKnownHash) {
  EXPECT_EQ(sha256(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(Sha256Test, HelloWorldProducesKnownHash) {
  EXPECT_EQ(sha256("hello world"),
            "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9");
}

TEST(Sha256Test, DifferentInputsProduceDifferentHashes) {
  EXPECT_NE(sha256("test1"), sha256("test2"));
}

TEST(Sha256Test, OutputIsHexadecimal64Characters) {
  std::string hash = sha256("test");
  EXPECT_EQ(hash.size(), 64u);
  for (char c : hash) {
    EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'));
  }
}

TEST(HexEncodeTest, EncodesBytesLowercase) {
  EXPECT_EQ(hexEncode(""), "");
  EXPECT_EQ(hexEncode(std::string("\x00\x0f\xab\xff", 4)), "000fabff");
}

TEST(CurrentTimeTest, IsAfterKnownDate) {
  double now = getCurrentTime();
  EXPECT_GT(now, 1700000000.0);
  EXPECT_LE(now, getCurrentTime());
}

class FileUtilTest : public ::testing::Test {
protected:
  void SetUp() override {
    testDir_ = std::filesystem::temp_directory_path() / "quub_utilities_test";
    std::filesystem::remove_all(testDir_);
    std::filesystem::create_directories(testDir_);
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(testDir_, ec);
  }

  std::filesystem::path testDir_;
};

TEST_F(FileUtilTest, LoadJsonFileParsesContent) {
  auto path = testDir_ / "config.json";
  std::ofstream(path) << R"({"difficulty": 3, "logLevel": "debug"})";

  auto result = loadJsonFile(path.string());
  ASSERT_TRUE(result.isOk()) << result.error().message;
  EXPECT_EQ((*result)["difficulty"], 3);
  EXPECT_EQ((*result)["logLevel"], "debug");
}

TEST_F(FileUtilTest, LoadJsonFileReportsMissingFile) {
  auto result = loadJsonFile((testDir_ / "missing.json").string());
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, E_FILE_NOT_FOUND);
}

TEST_F(FileUtilTest, LoadJsonFileReportsParseError) {
  auto path = testDir_ / "broken.json";
  std::ofstream(path) << "{not json";

  auto result = loadJsonFile(path.string());
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, E_JSON_PARSE);
}

TEST_F(FileUtilTest, WriteToNewFileCreatesParents) {
  auto path = testDir_ / "nested" / "out.json";
  auto result = writeToNewFile(path.string(), "{}");
  ASSERT_TRUE(result.isOk()) << result.error().message;

  std::ifstream file(path);
  std::string content((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());
  EXPECT_EQ(content, "{}");
}

TEST_F(FileUtilTest, WriteToNewFileRefusesExistingFile) {
  auto path = testDir_ / "existing.txt";
  std::ofstream(path) << "old";

  auto result = writeToNewFile(path.string(), "new");
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, E_FILE_EXISTS);
}

} // namespace utl
} // namespace quub
