#pragma once

#include "Logger.h"
#include <memory>
#include <string>

namespace quub {

/**
 * Base class for components that log under their own name.
 */
class Module {
public:
  /**
   * Constructor
   * @param name Hierarchical name for the module's logger (e.g. "chain" or
   * "app.chain")
   */
  explicit Module(const std::string &name);

  virtual ~Module() = default;

  Module(const Module &) = delete;
  Module &operator=(const Module &) = delete;

  /**
   * Get the logger for this module.
   * @return Reference to the registry-owned logger
   */
  logging::Logger &log() const;

  const std::string &getLoggerName() const;

private:
  std::shared_ptr<logging::Logger> spLogger_;
};

} // namespace quub
