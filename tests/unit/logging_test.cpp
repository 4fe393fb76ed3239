#include "internal/observability/logging.hpp"

#include <cassert>
#include <cstdlib>
#include <iostream>

#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace {

ledger::runtime::config::RuntimeConfig ConfigWithLevel(const char* level) {
  ledger::runtime::config::RuntimeConfig config;
  config.mutable_logging()->set_level(level);
  return config;
}

void TestInitializeInstallsStderrLogger() {
  unsetenv("LEDGER_LOG_LEVEL");
  ledger::observability::InitializeLogging(ConfigWithLevel("debug"));

  auto logger = spdlog::default_logger();
  assert(logger->name() == "file-ledger");
  assert(logger->level() == spdlog::level::debug);
  assert(spdlog::get("file-ledger") == logger);

  LEDGER_LOG_DEBUG("logging test", {ledger::observability::StringField("lfn", "/store/a.root"),
                                    ledger::observability::IntField("sites", 2)});
}

void TestReinitializeReusesLogger() {
  unsetenv("LEDGER_LOG_LEVEL");
  ledger::observability::InitializeLogging(ConfigWithLevel("debug"));
  auto first = spdlog::default_logger();

  ledger::observability::InitializeLogging(ConfigWithLevel("error"));
  assert(spdlog::default_logger() == first);
  assert(first->level() == spdlog::level::err);
}

void TestEnvironmentOverridesConfig() {
  setenv("LEDGER_LOG_LEVEL", "warn", 1);
  ledger::observability::InitializeLogging(ConfigWithLevel("debug"));
  assert(spdlog::default_logger()->level() == spdlog::level::warn);
  unsetenv("LEDGER_LOG_LEVEL");
}

void TestDefaultLevelIsInfo() {
  unsetenv("LEDGER_LOG_LEVEL");
  ledger::observability::InitializeLogging(ledger::runtime::config::RuntimeConfig{});
  assert(spdlog::default_logger()->level() == spdlog::level::info);
}

} // namespace

int main() {
  TestInitializeInstallsStderrLogger();
  TestReinitializeReusesLogger();
  TestEnvironmentOverridesConfig();
  TestDefaultLevelIsInfo();

  std::cout << "ledger_unit_logging: pass\n";
  return 0;
}
