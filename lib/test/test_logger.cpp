#include "Logger.h"
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace {

// Records what reaches it so propagation can be observed
class CaptureHandler : public quub::logging::Handler {
public:
  void emit(quub::logging::Level level, const std::string & /*loggerName*/,
            const std::string &message) override {
    if (level < level_) {
      return;
    }
    messages.push_back(message);
  }

  std::vector<std::string> messages;
};

bool endsWith(const std::string &str, const std::string &suffix) {
  return str.size() >= suffix.size() &&
         str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

TEST(LoggerTest, RootLoggerWorks) {
  auto rootLogger = quub::logging::getRootLogger();
  EXPECT_EQ(rootLogger->getName(), "");
  EXPECT_GE(rootLogger->getHandlerCount(), 1u);
  EXPECT_NO_THROW({
    rootLogger->debug << "Debug message";
    rootLogger->info << "Info message";
    rootLogger->warning << "Warning message";
    rootLogger->error << "Error message";
    rootLogger->critical << "Critical message";
  });
}

TEST(LoggerTest, SameNameReturnsSameLogger) {
  auto first = quub::logging::getLogger("myapp");
  auto second = quub::logging::getLogger(".myapp");
  EXPECT_EQ(first, second);
  EXPECT_EQ(first->getName(), "myapp");
}

TEST(LoggerTest, HierarchyLinksToAncestors) {
  auto service = quub::logging::getLogger("moduleA.service1");
  auto moduleA = quub::logging::getLogger("moduleA");
  auto root = quub::logging::getRootLogger();

  EXPECT_EQ(service->getParent(), moduleA);
  EXPECT_EQ(moduleA->getParent(), root);
  EXPECT_EQ(root->getParent(), nullptr);
}

TEST(LoggerTest, MessagesPropagateToParents) {
  auto parent = quub::logging::getLogger("propagate");
  auto child = quub::logging::getLogger("propagate.child");
  auto parentCapture = std::make_shared<CaptureHandler>();
  auto childCapture = std::make_shared<CaptureHandler>();
  parent->addHandler(parentCapture);
  child->addHandler(childCapture);

  child->info << "value=" << 42;

  ASSERT_EQ(childCapture->messages.size(), 1u);
  ASSERT_EQ(parentCapture->messages.size(), 1u);
  EXPECT_TRUE(endsWith(childCapture->messages[0], "[INFO] [propagate.child] value=42"));
  EXPECT_EQ(parentCapture->messages[0], childCapture->messages[0]);

  child->setPropagate(false);
  child->info << "local only";
  EXPECT_EQ(childCapture->messages.size(), 2u);
  EXPECT_EQ(parentCapture->messages.size(), 1u);
}

TEST(LoggerTest, LoggingLevelFiltersMessages) {
  auto logger = quub::logging::getLogger("level_test");
  auto capture = std::make_shared<CaptureHandler>();
  logger->addHandler(capture);
  logger->setLevel(quub::logging::Level::WARNING);
  EXPECT_EQ(logger->getLevel(), quub::logging::Level::WARNING);

  logger->debug << "Debug message";
  logger->info << "Info message";
  logger->warning << "Warning message";
  logger->error << "Error message";

  ASSERT_EQ(capture->messages.size(), 2u);
  EXPECT_TRUE(endsWith(capture->messages[0], "Warning message"));
  EXPECT_TRUE(endsWith(capture->messages[1], "Error message"));
}

TEST(LoggerTest, HandlerLevelFiltersMessages) {
  auto logger = quub::logging::getLogger("handler_level_test");
  auto capture = std::make_shared<CaptureHandler>();
  capture->setLevel(quub::logging::Level::ERROR);
  logger->addHandler(capture);

  logger->warning << "dropped";
  logger->error << "kept";

  ASSERT_EQ(capture->messages.size(), 1u);
  EXPECT_TRUE(endsWith(capture->messages[0], "kept"));
}

TEST(LoggerTest, FileHandlerWritesLines) {
  auto path = std::filesystem::temp_directory_path() / "quub_logger_test.log";
  std::filesystem::remove(path);

  auto logger = quub::logging::getLogger("file_test");
  logger->setPropagate(false);
  logger->addFileHandler(path.string(), quub::logging::Level::INFO);
  logger->debug << "not written";
  logger->info << "written";
  logger->clearHandlers();

  std::ifstream file(path);
  std::string line;
  std::vector<std::string> lines;
  while (std::getline(file, line)) {
    lines.push_back(line);
  }
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_TRUE(endsWith(lines[0], "[INFO] [file_test] written"));
  std::filesystem::remove(path);
}

TEST(LoggerTest, ConsoleHandlerWritesToGivenStream) {
  std::ostringstream out;
  auto logger = quub::logging::getLogger("console_stream_test");
  logger->setPropagate(false);
  logger->addHandler(std::make_shared<quub::logging::ConsoleHandler>(out));

  logger->warning << "to the stream";

  EXPECT_TRUE(endsWith(out.str(), "[WARNING] [console_stream_test] to the stream\n"));
  logger->clearHandlers();
}

TEST(LoggerTest, FileHandlerRejectsBadPath) {
  EXPECT_THROW(quub::logging::FileHandler("/nonexistent-dir/sub/test.log"),
               std::runtime_error);
}

TEST(LoggerTest, ParseLevel) {
  quub::logging::Level level = quub::logging::Level::DEBUG;
  EXPECT_TRUE(quub::logging::parseLevel("WARNING", level));
  EXPECT_EQ(level, quub::logging::Level::WARNING);
  EXPECT_TRUE(quub::logging::parseLevel("critical", level));
  EXPECT_EQ(level, quub::logging::Level::CRITICAL);
  EXPECT_FALSE(quub::logging::parseLevel("verbose", level));
  EXPECT_EQ(level, quub::logging::Level::CRITICAL);
  EXPECT_EQ(quub::logging::levelToString(quub::logging::Level::ERROR), "ERROR");
}
