#include "core/ActionRegistry.hpp"
#include "core/CliOptions.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>

using namespace hyprdock::core;

TEST(error_monitor, escalates_each_unique_failure_once) {
  ErrorMonitor monitor;
  std::vector<std::string> escalated;
  monitor.registerEscalation([&](const std::string& m) { escalated.push_back(m); });

  monitor.notifyFailure("spawn failed");
  monitor.notifyFailure("spawn failed");
  monitor.notifyFailure("socket closed");

  EXPECT_EQ(escalated, std::vector<std::string>({ "spawn failed", "socket closed" }));
  EXPECT_EQ(monitor.failureCount(), 2u);
}

TEST(error_monitor, records_failures_without_escalation_callback) {
  ErrorMonitor monitor;
  monitor.notifyFailure("early fault");
  EXPECT_EQ(monitor.failureCount(), 1u);
}

TEST(action_registry, invokes_by_any_registered_name) {
  ActionRegistry registry;
  int calls = 0;
  ASSERT_TRUE(registry.registerAction({ "--extend", "-eo" }, "Extends monitors", [&] { ++calls; }));

  registry.invoke("--extend");
  registry.invoke("-eo");

  EXPECT_EQ(calls, 2);
  EXPECT_TRUE(registry.contains("-eo"));
  EXPECT_FALSE(registry.contains("--mirror"));
}

TEST(action_registry, rejects_duplicate_names) {
  ActionRegistry registry;
  ASSERT_TRUE(registry.registerAction({ "--internal", "-i" }, "", [] {}));
  EXPECT_FALSE(registry.registerAction({ "--interactive", "-i" }, "", [] {}));
  EXPECT_FALSE(registry.contains("--interactive"));
}

TEST(action_registry, unknown_action_throws) {
  ActionRegistry registry;
  EXPECT_THROW(registry.invoke("--bogus"), std::out_of_range);
}

TEST(action_registry, help_lists_flags_in_registration_order) {
  ActionRegistry registry;
  registry.registerAction({ "--internal", "-i" }, "Internal only", [] {});
  registry.registerAction({ "--server", "-s" }, "Daemon mode", [] {});

  const std::string help = registry.helpText();
  auto first = help.find("--internal/-i");
  auto second = help.find("--server/-s");
  ASSERT_NE(first, std::string::npos);
  ASSERT_NE(second, std::string::npos);
  EXPECT_LT(first, second);
  EXPECT_NE(help.find("Daemon mode"), std::string::npos);
}

TEST(logger, format_has_level_component_and_message) {
  const std::string line = Logger::format({ LogLevel::Warning, "DockDaemon", "socket closed" });
  EXPECT_NE(line.find(",WARNING,DockDaemon,socket closed"), std::string::npos);
}

TEST(logger, drops_events_below_threshold_and_writes_file) {
  char path[] = "/tmp/hyprdock_logXXXXXX";
  int fd = mkstemp(path);
  ASSERT_GE(fd, 0);
  close(fd);

  {
    Logger log(LogLevel::Info, false);
    ASSERT_TRUE(log.openFile(path));
    log.debug("ProcessRunner", "spawn: hidden");
    log.info("DockingController", "lid closed");
    log.flush();
  }

  std::ifstream in(path);
  std::stringstream contents;
  contents << in.rdbuf();
  EXPECT_EQ(contents.str().find("hidden"), std::string::npos);
  EXPECT_NE(contents.str().find(",INFO,DockingController,lid closed\n"), std::string::npos);
  std::remove(path);
}

TEST(cli_options, bare_invocation_does_not_need_config) {
  const CliOptions opts = CliOptions::parse({});
  EXPECT_FALSE(opts.needsConfig());
  EXPECT_FALSE(opts.configPath.has_value());
}

TEST(cli_options, global_options_alone_do_not_need_config) {
  const CliOptions opts = CliOptions::parse({ "--verbose", "-c", "/tmp/broken.json" });
  EXPECT_FALSE(opts.needsConfig());
  EXPECT_TRUE(opts.verbose);
  EXPECT_EQ(opts.configPath.value_or(""), "/tmp/broken.json");
}

TEST(cli_options, actions_keep_their_order) {
  const CliOptions opts =
      CliOptions::parse({ "-i", "--config", "/tmp/hyprdock.json", "--extend", "-v" });
  EXPECT_TRUE(opts.needsConfig());
  EXPECT_EQ(opts.actions, std::vector<std::string>({ "-i", "--extend", "-v" }));
  EXPECT_EQ(opts.configPath.value_or(""), "/tmp/hyprdock.json");
}

TEST(cli_options, config_without_path_is_rejected) {
  EXPECT_THROW(CliOptions::parse({ "--server", "--config" }), std::invalid_argument);
}
