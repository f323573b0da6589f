#pragma once

#include "Module.h"
#include "ResultOrError.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace dt {

/**
 * Service - Base class for components that run in a dedicated thread.
 *
 * Provides thread lifecycle management with start/stop functionality.
 * Derived classes implement the runLoop() method which executes in the service
 * thread.
 */
class Service : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  explicit Service(const std::string &name);

  /**
   * Stops the service if running
   */
  ~Service() override;

  Service(const Service &) = delete;
  Service &operator=(const Service &) = delete;

  bool isStopSet() const { return isStopSet_; }

  Roe<void> start();
  void stop();

protected:
  /**
   * Main service loop - implement in derived classes.
   * Should check !isStopSet() periodically to allow graceful shutdown.
   */
  virtual void runLoop() = 0;

  /**
   * Sleep for the given duration unless stop() is called first.
   * @return false if the service was asked to stop
   */
  bool waitFor(std::chrono::milliseconds duration);

private:
  std::atomic<bool> isStopSet_{ true };
  std::mutex waitMutex_;
  std::condition_variable waitCv_;
  std::thread thread_;
};

} // namespace dt
