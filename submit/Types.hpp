#pragma once

#include <chrono>
#include <functional>
#include <thread>

namespace dt {
namespace submit {

// Every pause of the submission flow goes through a Sleeper
using Sleeper = std::function<void(std::chrono::milliseconds)>;

inline Sleeper threadSleeper() {
  return [](std::chrono::milliseconds duration) { std::this_thread::sleep_for(duration); };
}

} // namespace submit
} // namespace dt
