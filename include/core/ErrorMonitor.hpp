#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Single reporting point for the daemon's fatal conditions.
 *
 *  © 2025 HyprDock - MIT-licensed.
 */

#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace hyprdock::core {

  /**
 * @class ErrorMonitor
 * @brief Spawn, socket and decoding faults are all fatal; the component that
 *        hits one reports it here, then throws.
 *
 * * `main` registers the escalation that writes the Fatal log line.
 * * The same message is escalated at most once, because `main` reports the
 *   exception that ends the process again after the component already did.
 */
  class ErrorMonitor {
  public:
    ErrorMonitor() = default;
    virtual ~ErrorMonitor() = default;

    /// Register a lambda that escalates a fatal fault (main logs it at Fatal).
    void registerEscalation(std::function<void(const std::string&)> cb);

    /// Called by subsystems on fault; will forward to the escalation callback.
    virtual void notifyFailure(const std::string& message);

    /// Number of distinct failures seen so far.
    std::size_t failureCount() const;

  private:
    void forwardIfNew(const std::string& message);

    std::function<void(const std::string&)> escalation_{};
    std::vector<std::string> seen_; ///< de-dupe list
    mutable std::mutex mtx_;
  };

} // namespace hyprdock::core
