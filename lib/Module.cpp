#include "Module.h"

namespace quub {

Module::Module(const std::string &name) : spLogger_(logging::getLogger(name)) {}

logging::Logger &Module::log() const { return *spLogger_; }

const std::string &Module::getLoggerName() const { return spLogger_->getName(); }

} // namespace quub
