#pragma once

#include "Config.h"
#include "../lib/Module.h"

#include <ostream>
#include <string>

namespace quub {

/**
 * Runs the quub demo: mines each configured batch into a block, validates
 * the chain and prints it either as a listing or as the chain's JSON form.
 */
class Demo : public Module {
public:
  explicit Demo(Config config);
  ~Demo() override = default;

  /**
   * Apply the configured level and log file to the root logger.
   * In JSON mode console logging moves to std::cerr so stdout carries only
   * the chain document.
   * @throws std::runtime_error if the log file cannot be opened
   */
  void configureLogging(bool jsonOutput) const;

  /**
   * @param out Destination for the listing or the JSON document
   * @param outputPath When not empty, the chain JSON is also written there;
   * the file must not exist yet
   * @return 0 when the chain validates, 1 on any error or an invalid chain
   */
  int run(std::ostream &out, bool jsonOutput, const std::string &outputPath);

  const Config &getConfig() const { return config_; }

private:
  Config config_;
};

} // namespace quub
