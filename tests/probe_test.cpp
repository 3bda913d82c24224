#include "core/ErrorMonitor.hpp"
#include "core/MonitorProbe.hpp"

#include "FakeCommandRunner.hpp"
#include "MockErrorMonitor.hpp"
#include "TestConfig.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>

namespace hyprdock::test {

  using core::MonitorProbe;

  class MonitorProbeTest : public ::testing::Test {
  protected:
    core::MonitorConfig config = testConfig();
    FakeCommandRunner runner;
    std::shared_ptr<testing::NiceMock<MockErrorMonitor>> errorMonitor =
        std::make_shared<testing::NiceMock<MockErrorMonitor>>();
    MonitorProbe probe{ config, runner, errorMonitor };
  };

  TEST_F(MonitorProbeTest, hasExternalMonitor_TracksSecondIdMarker) {
    runner.setListing(kDocked);
    EXPECT_TRUE(probe.hasExternalMonitor());

    runner.setListing(kLaptopOnly);
    EXPECT_FALSE(probe.hasExternalMonitor());

    runner.setListing("ID 1");
    EXPECT_TRUE(probe.hasExternalMonitor());

    runner.setListing("id 1 / ID1 / ID  1");
    EXPECT_FALSE(probe.hasExternalMonitor());
  }

  TEST_F(MonitorProbeTest, isInternalActive_TracksMonitorNameSubstring) {
    runner.setListing(kLaptopOnly);
    EXPECT_TRUE(probe.isInternalActive());

    runner.setListing(kExternalOnly);
    EXPECT_FALSE(probe.isInternalActive());

    runner.setListing("");
    EXPECT_FALSE(probe.isInternalActive());
  }

  TEST_F(MonitorProbeTest, isInternalActive_PrefixOfAnotherConnectorStillMatches) {
    runner.setListing("Monitor eDP-10 (ID 0):\n");
    EXPECT_TRUE(probe.isInternalActive());
  }

  TEST_F(MonitorProbeTest, everyQueryRunsTheListingCommand) {
    runner.setListing(kDocked);

    probe.isInternalActive();
    probe.hasExternalMonitor();
    probe.isInternalActive();

    EXPECT_EQ(runner.captures,
              std::vector<std::string>({ "list-monitors", "list-monitors", "list-monitors" }));
  }

  TEST_F(MonitorProbeTest, invalidUtf8Listing_IsReportedAndThrows) {
    runner.setListing(std::string("Monitor \xff\xfe (ID 1)"));
    EXPECT_CALL(*errorMonitor, notifyFailure(testing::HasSubstr("not valid UTF-8"))).Times(1);

    EXPECT_THROW(probe.hasExternalMonitor(), std::runtime_error);
  }

} // namespace hyprdock::test
