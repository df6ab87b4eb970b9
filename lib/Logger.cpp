#include "Logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <unordered_map>

namespace quub {
namespace logging {

namespace {

std::string trimLeadingDot(const std::string &name) {
  if (!name.empty() && name[0] == '.') {
    return name.substr(1);
  }
  return name;
}

std::mutex &getRegistryMutex() {
  static std::mutex mutex;
  return mutex;
}

std::unordered_map<std::string, std::shared_ptr<Logger>> &getRegistry() {
  static std::unordered_map<std::string, std::shared_ptr<Logger>> registry;
  return registry;
}

std::string getCurrentTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;

  std::tm local{};
  localtime_r(&time, &local);

  std::stringstream ss;
  ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
  ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
  return ss.str();
}

// Caller holds the registry mutex
std::shared_ptr<Logger> getOrCreateLocked(const std::string &name) {
  auto &registry = getRegistry();
  auto it = registry.find(name);
  if (it != registry.end()) {
    return it->second;
  }

  auto spLogger = std::make_shared<Logger>(name);
  registry[name] = spLogger;

  if (name.empty()) {
    spLogger->addHandler(std::make_shared<ConsoleHandler>());
  }
  return spLogger;
}

} // namespace

std::string levelToString(Level level) {
  switch (level) {
  case Level::DEBUG:
    return "DEBUG";
  case Level::INFO:
    return "INFO";
  case Level::WARNING:
    return "WARNING";
  case Level::ERROR:
    return "ERROR";
  case Level::CRITICAL:
    return "CRITICAL";
  default:
    return "UNKNOWN";
  }
}

bool parseLevel(const std::string &name, Level &level) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "debug") {
    level = Level::DEBUG;
  } else if (lower == "info") {
    level = Level::INFO;
  } else if (lower == "warning" || lower == "warn") {
    level = Level::WARNING;
  } else if (lower == "error") {
    level = Level::ERROR;
  } else if (lower == "critical") {
    level = Level::CRITICAL;
  } else {
    return false;
  }
  return true;
}

// ConsoleHandler
void ConsoleHandler::emit(Level level, const std::string & /*loggerName*/,
                          const std::string &message) {
  if (level < level_) {
    return;
  }
  out_ << message << std::endl;
}

// FileHandler
FileHandler::FileHandler(const std::string &filename) : filename_(filename) {
  file_.open(filename_, std::ios::app);
  if (!file_.is_open()) {
    throw std::runtime_error("Failed to open log file: " + filename_);
  }
}

FileHandler::~FileHandler() {
  if (file_.is_open()) {
    file_.close();
  }
}

void FileHandler::emit(Level level, const std::string & /*loggerName*/,
                       const std::string &message) {
  if (level < level_) {
    return;
  }
  if (file_.is_open()) {
    file_ << message << std::endl;
    file_.flush();
  }
}

// LogProxy
LogProxy::LogProxy(Logger *logger, Level level)
    : logger_(logger), level_(level) {}

// LogStream
LogStream::LogStream(Logger *logger, Level level)
    : logger_(logger), level_(level), moved_(false) {}

LogStream::~LogStream() {
  if (!moved_ && logger_) {
    logger_->log(level_, stream_.str());
  }
}

LogStream::LogStream(LogStream &&other) noexcept
    : logger_(other.logger_), level_(other.level_),
      stream_(std::move(other.stream_)), moved_(false) {
  other.moved_ = true;
}

LogStream &LogStream::operator=(LogStream &&other) noexcept {
  if (this != &other) {
    logger_ = other.logger_;
    level_ = other.level_;
    stream_ = std::move(other.stream_);
    moved_ = false;
    other.moved_ = true;
  }
  return *this;
}

// Logger
Logger::Logger(const std::string &name)
    : debug(this, Level::DEBUG), info(this, Level::INFO),
      warning(this, Level::WARNING), error(this, Level::ERROR),
      critical(this, Level::CRITICAL), name_(name) {}

void Logger::setLevel(Level level) {
  std::lock_guard<std::mutex> lock(mutex_);
  level_ = level;
}

Level Logger::getLevel() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return level_;
}

void Logger::addHandler(std::shared_ptr<Handler> spHandler) {
  std::lock_guard<std::mutex> lock(mutex_);
  spHandlers_.push_back(spHandler);
}

void Logger::addFileHandler(const std::string &filename, Level level) {
  auto spHandler = std::make_shared<FileHandler>(filename);
  spHandler->setLevel(level);
  addHandler(spHandler);
}

void Logger::clearHandlers() {
  std::lock_guard<std::mutex> lock(mutex_);
  spHandlers_.clear();
}

size_t Logger::getHandlerCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return spHandlers_.size();
}

void Logger::setPropagate(bool propagate) {
  std::lock_guard<std::mutex> lock(mutex_);
  propagate_ = propagate;
}

bool Logger::getPropagate() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return propagate_;
}

void Logger::log(Level level, const std::string &message) {
  if (level < getLevel()) {
    return;
  }

  std::string formatted = formatMessage(level, message);
  emitToHandlers(level, formatted);

  if (!getPropagate()) {
    return;
  }
  for (auto spAncestor = getParent(); spAncestor;
       spAncestor = spAncestor->getParent()) {
    if (level >= spAncestor->getLevel()) {
      spAncestor->emitToHandlers(level, formatted);
    }
    if (!spAncestor->getPropagate()) {
      break;
    }
  }
}

void Logger::emitToHandlers(Level level, const std::string &formatted) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &spHandler : spHandlers_) {
    spHandler->emit(level, name_, formatted);
  }
}

std::string Logger::formatMessage(Level level,
                                  const std::string &message) const {
  std::stringstream ss;
  ss << "[" << getCurrentTimestamp() << "] ";
  ss << "[" << levelToString(level) << "] ";
  if (!name_.empty()) {
    ss << "[" << name_ << "] ";
  }
  ss << message;
  return ss.str();
}

// Global logger management

std::shared_ptr<Logger> getLogger(const std::string &name) {
  std::string trimmed = trimLeadingDot(name);
  std::lock_guard<std::mutex> lock(getRegistryMutex());

  auto spLogger = getOrCreateLocked(trimmed);
  if (trimmed.empty() || spLogger->getParent()) {
    return spLogger;
  }

  // Link newly created loggers to their ancestors, creating them as needed
  auto spChild = spLogger;
  std::string childName = trimmed;
  while (!childName.empty()) {
    auto lastDot = childName.rfind('.');
    std::string parentName =
        lastDot == std::string::npos ? "" : childName.substr(0, lastDot);
    auto spParent = getOrCreateLocked(parentName);
    spChild->setParent(spParent);
    if (parentName.empty() || spParent->getParent()) {
      break;
    }
    spChild = spParent;
    childName = parentName;
  }
  return spLogger;
}

std::shared_ptr<Logger> getRootLogger() { return getLogger(""); }

} // namespace logging
} // namespace quub
