#include "../Demo.h"
#include "../../lib/Utilities.h"
#include <gtest/gtest.h>

#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

using namespace quub;

class DemoTest : public ::testing::Test {
protected:
  void SetUp() override {
    config_.difficulty = 1;
    testDir_ = std::filesystem::temp_directory_path() / "quub_demo_test";
    std::filesystem::remove_all(testDir_);
  }

  void TearDown() override {
    auto rootLogger = logging::getRootLogger();
    rootLogger->clearHandlers();
    rootLogger->addHandler(std::make_shared<logging::ConsoleHandler>());
    rootLogger->setLevel(logging::Level::DEBUG);

    std::error_code ec;
    std::filesystem::remove_all(testDir_, ec);
  }

  Config config_;
  std::filesystem::path testDir_;
};

TEST_F(DemoTest, JsonModeKeepsStdoutParseable) {
  config_.logLevel = logging::Level::DEBUG;
  Demo demo(config_);
  demo.configureLogging(true);

  std::ostringstream captured;
  std::streambuf *original = std::cout.rdbuf(captured.rdbuf());
  int exitCode = demo.run(std::cout, true, "");
  std::cout.rdbuf(original);

  EXPECT_EQ(exitCode, 0);
  ASSERT_TRUE(nlohmann::json::accept(captured.str())) << captured.str();
  nlohmann::json document = nlohmann::json::parse(captured.str());
  EXPECT_EQ(document["chain_length"], 3);
  EXPECT_EQ(document["difficulty"], 1);
  EXPECT_EQ(document["chain"][2]["data"][0]["from"], "Charlie");
}

TEST_F(DemoTest, ListingReportsValidChain) {
  Demo demo(config_);
  std::ostringstream out;
  EXPECT_EQ(demo.run(out, false, ""), 0);

  std::string listing = out.str();
  EXPECT_NE(listing.find("Genesis block hash: 0"), std::string::npos);
  EXPECT_NE(listing.find("Chain valid: true"), std::string::npos);
  EXPECT_NE(listing.find("Chain length: 3"), std::string::npos);
  EXPECT_NE(listing.find("Block 2:"), std::string::npos);
}

TEST_F(DemoTest, WritesChainToNewFileOnce) {
  auto path = (testDir_ / "chain.json").string();
  Demo demo(config_);
  std::ostringstream out;
  ASSERT_EQ(demo.run(out, true, path), 0);

  auto written = utl::loadJsonFile(path);
  ASSERT_TRUE(written.isOk()) << written.error().message;
  EXPECT_EQ((*written)["chain_length"], 3);

  std::ostringstream again;
  EXPECT_EQ(demo.run(again, true, path), 1);
}

TEST_F(DemoTest, EmptyBatchFails) {
  config_.batches = {Config::Batch{}};
  Demo demo(config_);
  std::ostringstream out;
  EXPECT_EQ(demo.run(out, false, ""), 1);
}
