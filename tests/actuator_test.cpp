#include "core/DisplayActuator.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/MonitorProbe.hpp"

#include "FakeCommandRunner.hpp"
#include "TestConfig.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace hyprdock::test {

  using core::DisplayActuator;
  using core::Logger;
  using core::LogLevel;
  using ::testing::ElementsAre;
  using ::testing::IsEmpty;

  class DisplayActuatorTest : public ::testing::Test {
  protected:
    core::MonitorConfig config = testConfig();
    FakeCommandRunner runner;
    Logger log{ LogLevel::Fatal, false };
    core::MonitorProbe probe{ config, runner, std::make_shared<core::ErrorMonitor>() };
    DisplayActuator actuator{ config, runner, probe, log };
  };

  TEST_F(DisplayActuatorTest, enableInternalOnly_AlreadyActive_SkipsRestarts) {
    runner.setListing(kDocked);

    actuator.enableInternalOnly();
    actuator.enableInternalOnly();

    EXPECT_THAT(runner.calls,
                ElementsAre("internal on", "external off", "internal on", "external off"));
  }

  TEST_F(DisplayActuatorTest, enableInternalOnly_PanelOff_RestartsBarAndWallpaper) {
    runner.setListing(kExternalOnly);

    actuator.enableInternalOnly();

    EXPECT_THAT(runner.calls,
                ElementsAre("internal on", "external off", "bar close", "bar open", "wallpaper"));
  }

  TEST_F(DisplayActuatorTest, enableExternalOnly_NoExternal_IsNoOp) {
    runner.setListing(kLaptopOnly);

    actuator.enableExternalOnly();

    EXPECT_THAT(runner.calls, IsEmpty());
  }

  TEST_F(DisplayActuatorTest, enableExternalOnly_PanelOn_SwitchesAndRestarts) {
    runner.setListing(kDocked);

    actuator.enableExternalOnly();

    EXPECT_THAT(runner.calls,
                ElementsAre("internal off", "external on", "bar close", "bar open", "wallpaper"));
  }

  TEST_F(DisplayActuatorTest, enableExternalOnly_PanelAlreadyOff_SwitchesWithoutRestart) {
    runner.setListing(kDockedPanelOff);

    actuator.enableExternalOnly();

    EXPECT_THAT(runner.calls, ElementsAre("internal off", "external on"));
  }

  TEST_F(DisplayActuatorTest, extend_PanelOn_OnlyIssuesExtend) {
    runner.setListing(kDocked);

    actuator.extend();

    EXPECT_THAT(runner.calls, ElementsAre("layout extend"));
  }

  TEST_F(DisplayActuatorTest, mirror_PanelOn_OnlyIssuesMirror) {
    runner.setListing(kDocked);

    actuator.mirror();

    EXPECT_THAT(runner.calls, ElementsAre("layout mirror"));
  }

  TEST_F(DisplayActuatorTest, mirror_PanelOff_RestartsInternalFirst) {
    runner.setListing(kDockedPanelOff);

    actuator.mirror();

    EXPECT_THAT(runner.calls, ElementsAre("internal on", "wallpaper", "bar close", "bar open",
                                          "bar reload", "layout mirror"));
  }

  TEST_F(DisplayActuatorTest, restartBar_ClosesBeforeOpening) {
    actuator.restartBar();

    EXPECT_THAT(runner.calls, ElementsAre("bar close", "bar open"));
    EXPECT_THAT(runner.captures, IsEmpty());
  }

  TEST_F(DisplayActuatorTest, lockAndSuspend_LocksThenSuspends) {
    actuator.lockAndSuspend();

    EXPECT_THAT(runner.calls, ElementsAre("lock", "power suspend"));
  }

  TEST_F(DisplayActuatorTest, unprobedHelpers_NeverQueryTheListing) {
    actuator.restartWallpaper();
    actuator.fixBar();
    actuator.stopMedia();
    actuator.switchToInternal();
    actuator.switchToExternal();
    actuator.applyExtend();
    actuator.applyMirror();

    EXPECT_THAT(runner.captures, IsEmpty());
    EXPECT_THAT(runner.calls, ElementsAre("wallpaper", "bar reload", "media pause", "internal on",
                                          "external off", "internal off", "external on",
                                          "layout extend", "layout mirror"));
  }

} // namespace hyprdock::test
