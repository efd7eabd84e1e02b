#include <gmpxx.h>

#include <cassert>
#include <iostream>
#include <string>

#include "internal/execution/execution_context.hpp"
#include "internal/graph/graph_ops.hpp"
#include "internal/util/errors.hpp"

namespace {

using pulse::execution::ExecutionContext;
using pulse::execution::ParseUnits;
using pulse::model::PreviousOutputAmount;
using pulse::model::StaticAmount;
using pulse::serialization::ChainObject;
using pulse::serialization::ChainValue;

template <typename Ex, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Ex&) {
    return true;
  }
  return false;
}

ExecutionContext NewContext() {
  return ExecutionContext("automation-1", {"exec-1", 1});
}

void TestParseUnits() {
  assert(*ParseUnits("1.5") == mpz_class("1500000000000000000"));
  assert(*ParseUnits("0") == 0);
  assert(*ParseUnits(".25", 2) == 25);
  assert(*ParseUnits("7.", 2) == 700);
  assert(*ParseUnits("12", 6) == 12000000);

  assert(!ParseUnits(""));
  assert(!ParseUnits("."));
  assert(!ParseUnits("-1"));
  assert(!ParseUnits("1e18"));
  assert(!ParseUnits("0.001", 2));
}

void TestStaticAmounts() {
  const auto context = NewContext();
  assert(context.ResolveAmount(StaticAmount{"2"}) == mpz_class("2000000000000000000"));
  assert(context.ResolveAmount(StaticAmount{""}) == 0);
  assert(Throws<pulse::util::InvalidArgument>([&] { context.ResolveAmount(StaticAmount{"lots"}); }));
}

void TestPreviousOutputNeedsAnEarlierNode() {
  const auto context = NewContext();
  assert(!context.previous_node_id().has_value());
  assert(Throws<pulse::util::InvalidState>([&] { context.ResolveAmount(PreviousOutputAmount{"amountOut", 50.0}); }));
}

void TestPreviousOutputTakesPercentageOfField() {
  auto       context = NewContext();
  const auto swap    = pulse::graph::MakeNode("swap-1", pulse::model::SwapParams{}, {});

  context.Record(swap, ChainValue::Object(ChainObject{{"amountOut", ChainValue::BigInt("1000000000000000000000")},
                                                      {"count", ChainValue::Number(10)},
                                                      {"text", ChainValue::String("abc")}}));
  assert(*context.previous_node_id() == "swap-1");
  assert(*context.previous_node_kind() == pulse::model::NodeKind::kSwap);
  assert(context.OutputOf("swap-1") != nullptr);
  assert(context.OutputOf("other") == nullptr);

  assert(context.ResolveAmount(PreviousOutputAmount{"amountOut", 100.0}) == mpz_class("1000000000000000000000"));
  assert(context.ResolveAmount(PreviousOutputAmount{"amountOut", 50.0}) == mpz_class("500000000000000000000"));
  assert(context.ResolveAmount(PreviousOutputAmount{"count", 25.0}) == 2);

  // 33.333% floors to 33.33%
  assert(context.ResolveAmount(PreviousOutputAmount{"amountOut", 33.333}) == mpz_class("333300000000000000000"));

  assert(Throws<pulse::util::InvalidArgument>([&] { context.ResolveAmount(PreviousOutputAmount{"missing", 50.0}); }));
  assert(Throws<pulse::util::InvalidArgument>([&] { context.ResolveAmount(PreviousOutputAmount{"text", 50.0}); }));
  assert(Throws<pulse::util::InvalidArgument>([&] { context.ResolveAmount(PreviousOutputAmount{"amountOut", 0.0}); }));
}

void TestMissingFieldMessageNamesTheField() {
  auto context = NewContext();
  context.Record(pulse::graph::MakeNode("wait-1", pulse::model::WaitParams{.seconds = 1}, {}), ChainValue::Null());

  try {
    context.ResolveAmount(PreviousOutputAmount{"balance", 10.0});
    assert(false && "expected a missing field error");
  } catch (const pulse::util::InvalidArgument& e) {
    assert(std::string(e.what()) == "Previous node output does not have field: balance");
  }
}

void TestLatestRecordWins() {
  auto       context = NewContext();
  const auto a       = pulse::graph::MakeNode("a", pulse::model::WaitParams{.seconds = 1}, {});
  const auto b       = pulse::graph::MakeNode("b", pulse::model::WaitParams{.seconds = 1}, {});

  context.Record(a, ChainValue::Object(ChainObject{{"value", ChainValue::Number(100)}}));
  context.Record(b, ChainValue::Object(ChainObject{{"value", ChainValue::Number(8)}}));

  assert(*context.previous_node_id() == "b");
  assert(context.ResolveAmount(PreviousOutputAmount{"value", 50.0}) == 4);
  assert(context.OutputOf("a") != nullptr);
}

} // namespace

int main() {
  TestParseUnits();
  TestStaticAmounts();
  TestPreviousOutputNeedsAnEarlierNode();
  TestPreviousOutputTakesPercentageOfField();
  TestMissingFieldMessageNamesTheField();
  TestLatestRecordWins();

  std::cout << "pulse_automation_unit_execution_context: pass\n";
  return 0;
}
