#pragma once

#include "Logger.h"
#include <string>

namespace dt {

/**
 * Base class for components that need logging functionality.
 * Each module owns a logger named after its place in the component tree.
 */
class Module {
public:
  /**
   * Constructor
   * @param name Hierarchical name for the module's logger (e.g.,
   * "tracker.leader_tracker")
   */
  explicit Module(const std::string &name);

  virtual ~Module() = default;

  Module(const Module &) = delete;
  Module &operator=(const Module &) = delete;

  /**
   * Get the logger instance for this module.
   * @return Reference to the logger instance
   */
  logging::Logger &log() const;

private:
  mutable logging::Logger logger_;
};

} // namespace dt
