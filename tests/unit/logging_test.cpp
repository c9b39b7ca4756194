#include "internal/observability/logging.hpp"

#include <spdlog/spdlog.h>

#include <cassert>
#include <iostream>
#include <string>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace {

using namespace tierbridge::observability;

void TestBytesFieldStaysExactBelowOneKiB() {
  auto field = BytesField("bytes", 1023);
  assert(field.key == "bytes");
  assert(field.value == "1023");
}

void TestBytesFieldAddsHumanSize() {
  assert(BytesField("bytes", 1024).value == "1024 (1.0KiB)");
  assert(BytesField("bytes", 5ull * 1024 * 1024 * 1024).value == "5368709120 (5.0GiB)");
  assert(BytesField("bytes", 1536ull * 1024).value == "1572864 (1.5MiB)");
}

void TestErrorFieldCarriesMessage() {
  tierbridge::util::PermissionDenied error("write access denied");
  auto                               field = ErrorField(error);
  assert(field.key == "error");
  assert(field.value == "write access denied");
}

void TestEnabledFollowsConfiguredLevel() {
  tierbridge::runtime::config::RuntimeConfig config;
  config.mutable_logging()->set_level("warn");
  InitializeLogging(config);
  assert(!Enabled(spdlog::level::debug));
  assert(!Enabled(spdlog::level::info));
  assert(Enabled(spdlog::level::warn));
  assert(Enabled(spdlog::level::err));
  TIERBRIDGE_LOG_WARN("logging test line", {StringField("path", "/a b/c"), BytesField("bytes", 2048)});
}

} // namespace

int main() {
  TestBytesFieldStaysExactBelowOneKiB();
  TestBytesFieldAddsHumanSize();
  TestErrorFieldCarriesMessage();
  TestEnabledFollowsConfiguredLevel();
  std::cout << "tierbridge_unit_logging: pass" << std::endl;
  return 0;
}
