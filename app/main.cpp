#include "Config.h"
#include "Demo.h"

#include <CLI/CLI.hpp>

#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>

int main(int argc, char *argv[]) {
  CLI::App app{"quub - Proof-of-work chain demo"};

  int64_t difficulty = -1;
  app.add_option("-d,--difficulty", difficulty, "Leading zero hex digits required in block hashes")
      ->check(CLI::Range(static_cast<int64_t>(0),
                         static_cast<int64_t>(quub::Config::MAX_DIFFICULTY)));

  std::string configPath;
  app.add_option("-c,--config", configPath, "JSON configuration file")
      ->check(CLI::ExistingFile);

  std::string outputPath;
  app.add_option("-o,--output", outputPath, "Write the chain as JSON to a new file");

  bool printJson = false;
  app.add_flag("--json", printJson, "Print the chain as JSON");

  bool debug = false;
  app.add_flag("--debug", debug, "Enable debug logging");

  CLI11_PARSE(app, argc, argv);

  quub::Config config;
  if (!configPath.empty()) {
    auto result = config.loadFile(configPath);
    if (!result) {
      std::cerr << "Error: Failed to load config " << configPath << ": "
                << result.error().message << "\n";
      return 1;
    }
  }
  if (difficulty >= 0) {
    config.difficulty = static_cast<uint32_t>(difficulty);
  }
  if (debug) {
    config.logLevel = quub::logging::Level::DEBUG;
  }

  quub::Demo demo(config);
  try {
    demo.configureLogging(printJson);
  } catch (const std::runtime_error &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  return demo.run(std::cout, printJson, outputPath);
}
