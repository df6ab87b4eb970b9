#include "Demo.h"
#include "../ledger/Chain.h"
#include "../lib/Utilities.h"

#include <iomanip>
#include <iostream>
#include <memory>
#include <utility>

namespace quub {

namespace {

void printBlock(std::ostream &out, const Block &block) {
  out << "\nBlock " << block.getIndex() << ":\n";
  out << "  Timestamp:     " << std::fixed << std::setprecision(6)
      << block.getTimestamp() << "\n";
  out << "  Data:          "
      << nlohmann::json(block.getData()).dump(-1, ' ', false,
                                               nlohmann::json::error_handler_t::replace)
      << "\n";
  out << "  Hash:          " << block.getHash() << "\n";
  out << "  Previous Hash: " << block.getPreviousHash() << "\n";
  out << "  Nonce:         " << block.getNonce() << "\n";
}

} // namespace

Demo::Demo(Config config) : Module("quub"), config_(std::move(config)) {}

void Demo::configureLogging(bool jsonOutput) const {
  auto rootLogger = logging::getRootLogger();
  rootLogger->setLevel(config_.logLevel);
  if (jsonOutput) {
    rootLogger->clearHandlers();
    rootLogger->addHandler(std::make_shared<logging::ConsoleHandler>(std::cerr));
  }
  if (!config_.logFile.empty()) {
    rootLogger->addFileHandler(config_.logFile, logging::Level::DEBUG);
  }
}

int Demo::run(std::ostream &out, bool jsonOutput, const std::string &outputPath) {
  log().info << "Creating chain with difficulty " << config_.difficulty;
  Chain chain(config_.difficulty);
  if (!jsonOutput) {
    out << "Genesis block hash: " << chain.getLatestBlock().getHash() << "\n";
  }

  for (const auto &batch : config_.batches) {
    for (const auto &record : batch) {
      chain.addPending(record);
    }
    auto result = chain.minePending();
    if (!result) {
      std::cerr << "Error: Failed to mine block: " << result.error().message << "\n";
      return 1;
    }
    if (!jsonOutput) {
      out << "Block " << result->getIndex() << " mined: " << result->getHash() << "\n";
    }
  }

  bool valid = chain.isValid();

  std::string document = chain.toJson().dump(2, ' ', false,
                                             nlohmann::json::error_handler_t::replace);
  if (jsonOutput) {
    out << document << "\n";
  } else {
    out << "\nChain valid: " << (valid ? "true" : "false") << "\n";
    out << "Chain length: " << chain.getSize() << "\n";
    for (const auto &block : chain.getBlocks()) {
      printBlock(out, block);
    }
  }

  if (!outputPath.empty()) {
    auto result = utl::writeToNewFile(outputPath, document);
    if (!result) {
      std::cerr << "Error: Failed to write " << outputPath << ": "
                << result.error().message << "\n";
      return 1;
    }
    log().info << "Chain written to " << outputPath;
  }

  return valid ? 0 : 1;
}

} // namespace quub
