#ifndef DIRECT_TPU_LOGGER_H
#define DIRECT_TPU_LOGGER_H

#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace dt {
namespace logging {

enum class Level { DEBUG = 0, INFO = 1, WARNING = 2, ERROR = 3 };

std::string levelToString(Level level);
/** Parse "debug", "info", "warning" or "error" (case-insensitive) */
std::optional<Level> levelFromString(const std::string &name);

/**
 * Output for formatted log lines. Lines below the handler's own level are
 * dropped before write() is called.
 */
class Handler {
public:
  virtual ~Handler() = default;

  void emit(Level level, const std::string &line) {
    if (level >= level_) {
      write(line);
    }
  }

  void setLevel(Level level) { level_ = level; }

protected:
  virtual void write(const std::string &line) = 0;

private:
  Level level_ = Level::DEBUG;
};

class ConsoleHandler : public Handler {
protected:
  void write(const std::string &line) override;
};

class FileHandler : public Handler {
public:
  /** Appends to filename; throws std::runtime_error when it cannot be opened */
  explicit FileHandler(const std::string &filename);

protected:
  void write(const std::string &line) override;

private:
  std::mutex mutex_;
  std::ofstream file_;
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

// Collects one message and hands it to the logger when destroyed
class LogStream {
public:
  LogStream(Logger *logger, Level level);
  ~LogStream();

  LogStream(const LogStream &) = delete;
  LogStream &operator=(const LogStream &) = delete;
  LogStream(LogStream &&other) noexcept;

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

// Tree node shared by every Logger handle with the same dotted name
class LoggerNode {
public:
  LoggerNode(const std::string &fullName, std::shared_ptr<LoggerNode> spParent);

  void setLevel(Level level);
  /** Own level if set, otherwise the nearest ancestor's; root defaults to INFO */
  Level getEffectiveLevel() const;

  void addHandler(std::shared_ptr<Handler> spHandler);

  const std::string &getFullName() const { return fullName_; }

  void log(Level level, const std::string &message);

private:
  // Hands the line to this node's handlers, then to every ancestor's
  void dispatch(Level level, const std::string &line);

  std::string fullName_;
  std::shared_ptr<LoggerNode> spParent_;
  std::optional<Level> level_;
  std::vector<std::shared_ptr<Handler>> spHandlers_;
  mutable std::mutex mutex_;
};

// Lightweight handle; copies share the same node
class Logger {
public:
  explicit Logger(std::shared_ptr<LoggerNode> spNode);
  Logger(const Logger &other);
  Logger &operator=(const Logger &other);

  LogProxy debug;
  LogProxy info;
  LogProxy warning;
  LogProxy error;

  void setLevel(Level level) { spNode_->setLevel(level); }
  bool isEnabledFor(Level level) const {
    return level >= spNode_->getEffectiveLevel();
  }

  void addHandler(std::shared_ptr<Handler> spHandler) {
    spNode_->addHandler(std::move(spHandler));
  }
  void addFileHandler(const std::string &filename, Level level = Level::DEBUG);

  const std::string &getFullName() const { return spNode_->getFullName(); }

private:
  friend class LogStream;

  std::shared_ptr<LoggerNode> spNode_;
};

template <typename T> LogStream LogProxy::operator<<(const T &value) {
  LogStream stream(logger_, level_);
  stream << value;
  return stream;
}

/**
 * Get (or create) a logger by dotted name, e.g. "tracker.leader_tracker".
 * Intermediate loggers are created on demand and become parents.
 */
Logger getLogger(const std::string &name);
Logger getRootLogger();

} // namespace logging
} // namespace dt

#endif // DIRECT_TPU_LOGGER_H
