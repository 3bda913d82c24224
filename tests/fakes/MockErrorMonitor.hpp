#pragma once
/** @file  MockErrorMonitor.hpp
 *  @brief gmock ErrorMonitor for asserting escalations.
 *
 *  © 2025 HyprDock - MIT-licensed.
 */

#include <string>

#include <gmock/gmock.h>

#include "core/ErrorMonitor.hpp"

namespace hyprdock {
  namespace test {

    class MockErrorMonitor : public core::ErrorMonitor {
    public:
      MOCK_METHOD(void, notifyFailure, (const std::string&), (override));
    };

  } // namespace test
} // namespace hyprdock
