#include "Logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <unordered_map>

namespace dt {
namespace logging {

namespace {

std::mutex &getRegistryMutex() {
  static std::mutex mutex;
  return mutex;
}

std::unordered_map<std::string, std::shared_ptr<LoggerNode>> &getRegistry() {
  static std::unordered_map<std::string, std::shared_ptr<LoggerNode>> registry;
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
std::shared_ptr<LoggerNode> getOrCreateNode(const std::string &fullName) {
  auto &registry = getRegistry();
  auto it = registry.find(fullName);
  if (it != registry.end()) {
    return it->second;
  }

  std::shared_ptr<LoggerNode> spParent;
  if (!fullName.empty()) {
    auto lastDot = fullName.rfind('.');
    spParent = getOrCreateNode(lastDot == std::string::npos ? ""
                                                            : fullName.substr(0, lastDot));
  }

  auto spNode = std::make_shared<LoggerNode>(fullName, spParent);
  if (fullName.empty()) {
    spNode->setLevel(Level::INFO);
    spNode->addHandler(std::make_shared<ConsoleHandler>());
  }
  registry[fullName] = spNode;
  return spNode;
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
  }
  return "UNKNOWN";
}

std::optional<Level> levelFromString(const std::string &name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "debug") return Level::DEBUG;
  if (lower == "info") return Level::INFO;
  if (lower == "warning" || lower == "warn") return Level::WARNING;
  if (lower == "error") return Level::ERROR;
  return std::nullopt;
}

void ConsoleHandler::write(const std::string &line) {
  // stdout is reserved for the final outcome line
  std::clog << line << std::endl;
}

FileHandler::FileHandler(const std::string &filename) {
  file_.open(filename, std::ios::app);
  if (!file_.is_open()) {
    throw std::runtime_error("Failed to open log file: " + filename);
  }
}

void FileHandler::write(const std::string &line) {
  std::lock_guard<std::mutex> lock(mutex_);
  file_ << line << std::endl;
}

LogProxy::LogProxy(Logger *logger, Level level)
    : logger_(logger), level_(level) {}

LogStream::LogStream(Logger *logger, Level level)
    : logger_(logger), level_(level), moved_(false) {}

LogStream::~LogStream() {
  if (!moved_ && logger_) {
    logger_->spNode_->log(level_, stream_.str());
  }
}

LogStream::LogStream(LogStream &&other) noexcept
    : logger_(other.logger_), level_(other.level_),
      stream_(std::move(other.stream_)), moved_(false) {
  other.moved_ = true;
}

LoggerNode::LoggerNode(const std::string &fullName,
                       std::shared_ptr<LoggerNode> spParent)
    : fullName_(fullName), spParent_(std::move(spParent)) {}

void LoggerNode::setLevel(Level level) {
  std::lock_guard<std::mutex> lock(mutex_);
  level_ = level;
}

Level LoggerNode::getEffectiveLevel() const {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level_) {
      return *level_;
    }
  }
  return spParent_ ? spParent_->getEffectiveLevel() : Level::INFO;
}

void LoggerNode::addHandler(std::shared_ptr<Handler> spHandler) {
  std::lock_guard<std::mutex> lock(mutex_);
  spHandlers_.push_back(std::move(spHandler));
}

void LoggerNode::log(Level level, const std::string &message) {
  if (level < getEffectiveLevel()) {
    return;
  }

  std::stringstream ss;
  ss << "[" << getCurrentTimestamp() << "] [" << levelToString(level) << "] ";
  if (!fullName_.empty()) {
    ss << "[" << fullName_ << "] ";
  }
  ss << message;

  dispatch(level, ss.str());
}

void LoggerNode::dispatch(Level level, const std::string &line) {
  std::vector<std::shared_ptr<Handler>> handlers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers = spHandlers_;
  }
  for (auto &spHandler : handlers) {
    spHandler->emit(level, line);
  }
  if (spParent_) {
    spParent_->dispatch(level, line);
  }
}

Logger::Logger(std::shared_ptr<LoggerNode> spNode)
    : debug(this, Level::DEBUG), info(this, Level::INFO),
      warning(this, Level::WARNING), error(this, Level::ERROR),
      spNode_(std::move(spNode)) {
  if (!spNode_) {
    throw std::invalid_argument("Logger requires a node");
  }
}

Logger::Logger(const Logger &other) : Logger(other.spNode_) {}

Logger &Logger::operator=(const Logger &other) {
  // Proxies keep pointing at this handle, only the node changes
  spNode_ = other.spNode_;
  return *this;
}

void Logger::addFileHandler(const std::string &filename, Level level) {
  auto spHandler = std::make_shared<FileHandler>(filename);
  spHandler->setLevel(level);
  spNode_->addHandler(spHandler);
}

Logger getLogger(const std::string &name) {
  std::string fullName = !name.empty() && name[0] == '.' ? name.substr(1) : name;
  std::lock_guard<std::mutex> lock(getRegistryMutex());
  return Logger(getOrCreateNode(fullName));
}

Logger getRootLogger() { return getLogger(""); }

} // namespace logging
} // namespace dt
