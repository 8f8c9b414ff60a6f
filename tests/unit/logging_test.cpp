#include "internal/observability/logging.hpp"

#include <cassert>
#include <cstdlib>
#include <iostream>
#include <string>

#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace {

using chronicle::observability::BoolField;
using chronicle::observability::FormatFields;
using chronicle::observability::IntField;
using chronicle::observability::ParseLogLevel;
using chronicle::observability::StringField;
using chronicle::observability::UintField;

void TestParseLogLevel() {
  assert(ParseLogLevel("debug") == spdlog::level::debug);
  assert(ParseLogLevel("info") == spdlog::level::info);
  assert(ParseLogLevel("warning") == spdlog::level::warn);
  assert(ParseLogLevel("error") == spdlog::level::err);
  assert(ParseLogLevel("off") == spdlog::level::off);
  assert(!ParseLogLevel("loud").has_value());
  assert(!ParseLogLevel("").has_value());
}

void TestFieldsAreKeyValuePairs() {
  assert(FormatFields({}).empty());
  assert(FormatFields({StringField("stream_id", "acc-1"), UintField("version", 3), IntField("delta", -5), BoolField("closed", false)}) ==
         "stream_id=acc-1 version=3 delta=-5 closed=false");
}

void TestValuesWithSeparatorsAreQuoted() {
  assert(FormatFields({StringField("owner", "Alice Johnson")}) == "owner=\"Alice Johnson\"");
  assert(FormatFields({StringField("filter", "a=b")}) == "filter=\"a=b\"");
  assert(FormatFields({StringField("msg", "say \"hi\"")}) == "msg=\"say \\\"hi\\\"\"");
  assert(FormatFields({StringField("empty", "")}) == "empty=\"\"");
}

void TestLoggingLifecycle() {
  chronicle::runtime::config::RuntimeConfig config;
  config.mutable_logging()->set_level("loud");

  // an unknown level falls back to info instead of silencing output
  chronicle::observability::InitializeLogging(config);
  assert(spdlog::get("chronicle") != nullptr);
  assert(spdlog::get("chronicle")->level() == spdlog::level::info);

  config.mutable_logging()->set_level("error");
  chronicle::observability::InitializeLogging(config);
  assert(spdlog::get("chronicle")->level() == spdlog::level::err);

  CHRONICLE_LOG_INFO("suppressed", {StringField("k", "v")});
  CHRONICLE_LOG_ERROR("logging test line", {UintField("n", 1)});

  chronicle::observability::ShutdownLogging();
}

} // namespace

int main() {
  ::unsetenv("CHRONICLE_LOG_LEVEL");

  TestParseLogLevel();
  TestFieldsAreKeyValuePairs();
  TestValuesWithSeparatorsAreQuoted();
  TestLoggingLifecycle();

  std::cout << "chronicle_unit_logging: pass\n";
  return 0;
}
