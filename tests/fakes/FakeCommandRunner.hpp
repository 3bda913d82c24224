#pragma once
/** @file  FakeCommandRunner.hpp
 *  @brief CommandRunner that records invocations instead of spawning.
 *
 *  © 2025 HyprDock - MIT-licensed.
 */

#include <algorithm>
#include <string>
#include <vector>

#include "io/CommandRunner.hpp"
#include "protocols/CommandLine.hpp"

namespace hyprdock {
  namespace test {

    /**
 * @class FakeCommandRunner
 * @brief Scripted monitor listings, ordered call log.
 *
 *  * `listings` are returned by successive `runCapture()` calls; the last one repeats.
 *  * `calls` holds every fire-and-forget command in order. Tests may append
 *    markers (e.g. "sleep:1000") to interleave other side effects.
 */
    class FakeCommandRunner : public io::CommandRunner {
    public:
      std::vector<std::string> listings{ "" };
      std::vector<std::string> calls;
      std::vector<std::string> captures;

      void run(const std::string& commandLine) override {
        if (protocols::CommandLine{ commandLine }.empty())
          return;
        calls.push_back(commandLine);
      }

      std::string runCapture(const std::string& commandLine) override {
        if (protocols::CommandLine{ commandLine }.empty())
          return {};
        captures.push_back(commandLine);
        const std::size_t i = std::min(next_capture_++, listings.size() - 1);
        return listings[i];
      }

      void setListing(const std::string& listing) {
        listings = { listing };
        next_capture_ = 0;
      }

      std::size_t count(const std::string& command) const {
        return static_cast<std::size_t>(std::count(calls.begin(), calls.end(), command));
      }

    private:
      std::size_t next_capture_{ 0 };
    };

  } // namespace test
} // namespace hyprdock
