#include "Service.h"

namespace dt {

Service::Service(const std::string &name) : Module(name) {}

Service::~Service() {
  // Derived parts are already destroyed here; only join the thread
  if (!isStopSet_) {
    isStopSet_ = true;
    waitCv_.notify_all();
  }
  if (thread_.joinable()) {
    thread_.join();
  }
}

Service::Roe<void> Service::start() {
  if (!isStopSet_) {
    return Error(-1, "Service is already running");
  }

  isStopSet_ = false;
  thread_ = std::thread(&Service::runLoop, this);

  log().info << "Service started";
  return {};
}

void Service::stop() {
  if (isStopSet_ && !thread_.joinable()) {
    log().debug << "Service is not running";
    return;
  }

  log().info << "Stopping service";

  {
    std::lock_guard<std::mutex> lock(waitMutex_);
    isStopSet_ = true;
  }
  waitCv_.notify_all();

  if (thread_.joinable()) {
    thread_.join();
  }

  log().info << "Service stopped";
}

bool Service::waitFor(std::chrono::milliseconds duration) {
  std::unique_lock<std::mutex> lock(waitMutex_);
  waitCv_.wait_for(lock, duration, [this] { return isStopSet_.load(); });
  return !isStopSet_;
}

} // namespace dt
