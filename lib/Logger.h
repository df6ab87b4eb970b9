#ifndef QUUB_CHAIN_LOGGER_H
#define QUUB_CHAIN_LOGGER_H

#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace quub {
namespace logging {

enum class Level { DEBUG = 0, INFO = 1, WARNING = 2, ERROR = 3, CRITICAL = 4 };

std::string levelToString(Level level);

/**
 * Parse a level name (case-insensitive: debug, info, warning, error, critical)
 * @param name Level name
 * @param level Output parameter for the parsed level
 * @return true if the name is known
 */
bool parseLevel(const std::string &name, Level &level);

class Handler {
public:
  virtual ~Handler() = default;
  virtual void emit(Level level, const std::string &loggerName,
                    const std::string &message) = 0;

  void setLevel(Level level) { level_ = level; }
  Level getLevel() const { return level_; }

protected:
  Level level_ = Level::DEBUG;
};

// Writes to std::cout unless given another stream
class ConsoleHandler : public Handler {
public:
  explicit ConsoleHandler(std::ostream &out = std::cout) : out_(out) {}

  void emit(Level level, const std::string &loggerName,
            const std::string &message) override;

private:
  std::ostream &out_;
};

class FileHandler : public Handler {
public:
  explicit FileHandler(const std::string &filename);
  ~FileHandler() override;
  void emit(Level level, const std::string &loggerName,
            const std::string &message) override;

private:
  std::ofstream file_;
  std::string filename_;
};

class Logger;
class LogStream;

class LogProxy {
public:
  LogProxy(Logger *logger, Level level);

  template <typename T> LogStream operator<<(const T &value);

private:
  Logger *logger_;
  Level level_;
};

// Collects one message and hands it to the logger on destruction
class LogStream {
public:
  LogStream(Logger *logger, Level level);
  ~LogStream();

  LogStream(const LogStream &) = delete;
  LogStream &operator=(const LogStream &) = delete;

  LogStream(LogStream &&other) noexcept;
  LogStream &operator=(LogStream &&other) noexcept;

  template <typename T> LogStream &operator<<(const T &value) {
    stream_ << value;
    return *this;
  }

private:
  Logger *logger_;
  Level level_;
  std::ostringstream stream_;
  bool moved_;
};

/**
 * Named logger in a dot-separated hierarchy ("chain" is a child of root,
 * "chain.seal" a child of "chain").
 *
 * Messages at or above the logger's level are formatted once, emitted to the
 * logger's own handlers and then, if propagation is enabled, to every
 * ancestor's handlers. Only the root logger owns a console handler by
 * default.
 *
 * Loggers are owned by the global registry and handed out as shared_ptr;
 * they cannot be copied because the level proxies point back at them.
 */
class Logger {
public:
  explicit Logger(const std::string &name);
  ~Logger() = default;

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  LogProxy debug;
  LogProxy info;
  LogProxy warning;
  LogProxy error;
  LogProxy critical;

  void setLevel(Level level);
  Level getLevel() const;

  void addHandler(std::shared_ptr<Handler> spHandler);
  void addFileHandler(const std::string &filename, Level level = Level::DEBUG);
  void clearHandlers();
  size_t getHandlerCount() const;

  void setPropagate(bool propagate);
  bool getPropagate() const;

  // Full dot-separated name; empty for the root logger
  const std::string &getName() const { return name_; }

  std::shared_ptr<Logger> getParent() const { return wpParent_.lock(); }

  void log(Level level, const std::string &message);

private:
  friend std::shared_ptr<Logger> getLogger(const std::string &name);

  void setParent(std::weak_ptr<Logger> parent) { wpParent_ = parent; }
  void emitToHandlers(Level level, const std::string &formatted);
  std::string formatMessage(Level level, const std::string &message) const;

  std::string name_;
  std::weak_ptr<Logger> wpParent_;
  Level level_{ Level::DEBUG };
  bool propagate_{ true };
  std::vector<std::shared_ptr<Handler>> spHandlers_;
  mutable std::mutex mutex_;
};

template <typename T> LogStream LogProxy::operator<<(const T &value) {
  LogStream stream(logger_, level_);
  stream << value;
  return stream;
}

/**
 * Get (or create) the logger with the given dot-separated name.
 * Missing ancestors are created on the way up to the root.
 */
std::shared_ptr<Logger> getLogger(const std::string &name);
std::shared_ptr<Logger> getRootLogger();

} // namespace logging
} // namespace quub

#endif // QUUB_CHAIN_LOGGER_H
