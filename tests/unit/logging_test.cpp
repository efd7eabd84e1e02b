#include <cassert>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include <spdlog/logger.h>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include "internal/observability/logging.hpp"

namespace {

using pulse::observability::IntField;
using pulse::observability::LogScope;
using pulse::observability::StringField;

// Routes the default logger into `out`, one bare message per line.
std::shared_ptr<spdlog::logger> CaptureInto(std::ostringstream& out) {
  auto sink   = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
  auto logger = std::make_shared<spdlog::logger>("capture", sink);
  logger->set_pattern("%v");
  logger->set_level(spdlog::level::trace);
  spdlog::set_default_logger(logger);
  return logger;
}

std::string TakeLine(std::ostringstream& out) {
  auto line = out.str();
  out.str("");
  while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
    line.pop_back();
  }
  return line;
}

void TestFieldsFollowTheMessage() {
  std::ostringstream out;
  auto               logger = CaptureInto(out);

  PULSE_LOG_INFO("plain");
  assert(TakeLine(out) == "plain");

  PULSE_LOG_INFO("with fields", {StringField("node_id", "swap-1"), IntField("count", 3)});
  assert(TakeLine(out) == "with fields node_id=swap-1 count=3");

  PULSE_LOG_INFO("flags", {pulse::observability::BoolField("wal_mode", true), pulse::observability::BoolField("cached", false)});
  assert(TakeLine(out) == "flags wal_mode=true cached=false");
}

void TestScopedFieldsAreAppended() {
  std::ostringstream out;
  auto               logger = CaptureInto(out);

  {
    LogScope run({StringField("automation_id", "a-1"), StringField("execution_id", "e-1")});
    PULSE_LOG_WARN("node failed", {StringField("node_id", "wait-2")});
    assert(TakeLine(out) == "node failed node_id=wait-2 automation_id=a-1 execution_id=e-1");

    PULSE_LOG_INFO("bare");
    assert(TakeLine(out) == "bare automation_id=a-1 execution_id=e-1");
  }

  PULSE_LOG_INFO("after");
  assert(TakeLine(out) == "after");
  assert(pulse::observability::ScopedFields().empty());
}

void TestExplicitFieldShadowsScopedOne() {
  std::ostringstream out;
  auto               logger = CaptureInto(out);

  LogScope run({StringField("automation_id", "a-1")});
  PULSE_LOG_INFO("override", {StringField("automation_id", "a-2")});
  assert(TakeLine(out) == "override automation_id=a-2");
}

void TestNestedScopesPopInOrder() {
  std::ostringstream out;
  auto               logger = CaptureInto(out);

  LogScope outer({StringField("automation_id", "a-1")});
  {
    LogScope inner({IntField("run_sequence", 4)});
    assert(pulse::observability::ScopedFields().size() == 2);
    PULSE_LOG_DEBUG("inner");
    assert(TakeLine(out) == "inner automation_id=a-1 run_sequence=4");
  }
  assert(pulse::observability::ScopedFields().size() == 1);
  PULSE_LOG_DEBUG("outer");
  assert(TakeLine(out) == "outer automation_id=a-1");
}

void TestParseLevelIsStrict() {
  using pulse::observability::ParseLevel;
  assert(ParseLevel("trace") == spdlog::level::trace);
  assert(ParseLevel("warn") == spdlog::level::warn);
  assert(ParseLevel("error") == spdlog::level::err);
  assert(ParseLevel("off") == spdlog::level::off);

  assert(!ParseLevel(""));
  assert(!ParseLevel("WARN"));
  assert(!ParseLevel("warning"));
  assert(!ParseLevel("err"));
}

} // namespace

int main() {
  TestFieldsFollowTheMessage();
  TestScopedFieldsAreAppended();
  TestExplicitFieldShadowsScopedOne();
  TestNestedScopesPopInOrder();
  TestParseLevelIsStrict();

  spdlog::drop_all();
  std::cout << "pulse_automation_unit_logging: pass\n";
  return 0;
}
