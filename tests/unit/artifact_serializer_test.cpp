#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <variant>

#include <google/protobuf/util/message_differencer.h>

#include "internal/serialization/artifact_serializer.hpp"
#include "internal/serialization/chain_value.hpp"

namespace {

using google::protobuf::Value;
using google::protobuf::util::MessageDifferencer;
using pulse::serialization::ChainList;
using pulse::serialization::ChainObject;
using pulse::serialization::ChainValue;
using pulse::serialization::FromArtifact;
using pulse::serialization::IsUnserializable;
using pulse::serialization::Serialize;

const Value& Field(const Value& object, const std::string& key) {
  return object.struct_value().fields().at(key);
}

bool IsNull(const Value& value) {
  return value.kind_case() == Value::kNullValue;
}

void AssertStable(const ChainValue& input) {
  const auto once  = Serialize(input);
  const auto twice = Serialize(FromArtifact(once));
  assert(MessageDifferencer::Equals(once, twice));
}

ChainValue SampleReceipt() {
  pulse::serialization::TransactionReceipt receipt;
  receipt.hash                = "0xabc";
  receipt.block_number        = mpz_class("19000000");
  receipt.from                = "0xfrom";
  receipt.status              = 1;
  receipt.gas_used            = mpz_class("21000");
  receipt.effective_gas_price = mpz_class("123456789012345678901234567890");
  receipt.provider            = pulse::serialization::OpaqueHandle{"json-rpc provider"};
  receipt.logs.push_back(ChainValue::Object(ChainObject{{"topic", ChainValue::String("0x01")}}));
  return receipt.ToChainValue();
}

void TestUndefinedAndNullBecomeNull() {
  assert(IsNull(Serialize(ChainValue::Undefined())));
  assert(IsNull(Serialize(ChainValue::Null())));
  assert(IsNull(Serialize(ChainValue{})));
}

void TestReceiptProjectsFixedKeys() {
  const auto out = Serialize(SampleReceipt());

  assert(out.kind_case() == Value::kStructValue);
  assert(out.struct_value().fields_size() == 10);
  for (const char* key : pulse::serialization::kReceiptFields) {
    assert(out.struct_value().fields().count(key) == 1);
  }

  assert(Field(out, "hash").string_value() == "0xabc");
  assert(Field(out, "blockNumber").string_value() == "19000000");
  assert(Field(out, "gasUsed").string_value() == "21000");
  assert(Field(out, "effectiveGasPrice").string_value() == "123456789012345678901234567890");
  assert(Field(out, "status").number_value() == 1.0);
  assert(Field(out, "from").string_value() == "0xfrom");
  assert(IsNull(Field(out, "blockHash")));
  assert(IsNull(Field(out, "to")));
  assert(IsNull(Field(out, "gasPrice")));
  assert(IsNull(Field(out, "transactionIndex")));

  // provider and logs never reach the artifact
  assert(out.struct_value().fields().count("provider") == 0);
  assert(out.struct_value().fields().count("logs") == 0);
}

void TestReceiptDetectionIsStructural() {
  const auto minimal = ChainValue::Object(ChainObject{{"hash", ChainValue::String("0x1")}, {"blockNumber", ChainValue::Number(42)}});
  const auto out     = Serialize(minimal);
  assert(out.struct_value().fields_size() == 10);
  assert(Field(out, "blockNumber").string_value() == "42");

  assert(std::holds_alternative<pulse::serialization::ReceiptShape>(pulse::serialization::Classify(minimal)));

  const auto no_block = ChainValue::Object(ChainObject{{"hash", ChainValue::String("0x1")}, {"blockNumber", ChainValue::Undefined()}});
  assert(std::holds_alternative<pulse::serialization::GenericShape>(pulse::serialization::Classify(no_block)));
  const auto generic = Serialize(no_block);
  assert(generic.struct_value().fields_size() == 2);
  assert(IsNull(Field(generic, "blockNumber")));

  const auto numeric_hash = ChainValue::Object(ChainObject{{"hash", ChainValue::Number(1)}, {"blockNumber", ChainValue::Number(1)}});
  assert(std::holds_alternative<pulse::serialization::GenericShape>(pulse::serialization::Classify(numeric_hash)));
}

void TestPendingTransactionStillProjects() {
  // not yet mined: blockNumber is null and the provider is still attached
  const auto pending = ChainValue::Object(ChainObject{{"hash", ChainValue::String("0xabc")},
                                                      {"blockNumber", ChainValue::Null()},
                                                      {"provider", ChainValue::Opaque("json-rpc provider")}});
  assert(std::holds_alternative<pulse::serialization::ReceiptShape>(pulse::serialization::Classify(pending)));

  const auto out = Serialize(pending);
  assert(!IsUnserializable(out));
  assert(out.struct_value().fields_size() == 10);
  assert(Field(out, "hash").string_value() == "0xabc");
  assert(IsNull(Field(out, "blockNumber")));
  assert(out.struct_value().fields().count("provider") == 0);
}

void TestBigIntegersKeepEveryDigit() {
  const std::string big = "123456789012345678901234567890";

  ChainObject inner{{"amount", ChainValue::BigInt(big)}, {"missing", ChainValue::Undefined()}};
  ChainList   list{ChainValue::Object(std::move(inner)), ChainValue::BigInt("-7")};
  const auto  value = ChainValue::Object(ChainObject{{"items", ChainValue::List(std::move(list))}});

  const auto  out   = Serialize(value);
  const auto& items = Field(out, "items").list_value();
  assert(items.values_size() == 2);
  assert(Field(items.values(0), "amount").string_value() == big);
  assert(IsNull(Field(items.values(0), "missing")));
  assert(items.values(1).string_value() == "-7");
}

void TestNonFiniteNumbersBecomeNull() {
  assert(IsNull(Serialize(ChainValue::Number(std::numeric_limits<double>::quiet_NaN()))));
  assert(IsNull(Serialize(ChainValue::Number(std::numeric_limits<double>::infinity()))));
  assert(Serialize(ChainValue::Number(2.5)).number_value() == 2.5);
}

void TestCyclesYieldSentinel() {
  auto object       = std::make_shared<ChainObject>();
  (*object)["name"] = ChainValue::String("loop");
  (*object)["self"] = ChainValue::Object(object);
  const auto out    = Serialize(ChainValue::Object(object));
  assert(IsUnserializable(out));
  assert(out.struct_value().fields_size() == 1);

  auto list = std::make_shared<ChainList>();
  list->push_back(ChainValue::List(list));
  assert(IsUnserializable(Serialize(ChainValue::List(list))));

  // break the cycles so the shared_ptrs can be released
  object->clear();
  list->clear();
}

void TestSharedButAcyclicValuesSerialize() {
  auto       shared = std::make_shared<ChainObject>(ChainObject{{"v", ChainValue::Number(1)}});
  const auto value  = ChainValue::List(ChainList{ChainValue::Object(shared), ChainValue::Object(shared)});
  const auto out    = Serialize(value);
  assert(!IsUnserializable(out));
  assert(out.list_value().values_size() == 2);
}

void TestOpaqueOutsideReceiptYieldsSentinel() {
  const auto value = ChainValue::Object(ChainObject{{"signer", ChainValue::Opaque("wallet")}});
  assert(IsUnserializable(Serialize(value)));
}

void TestExcessiveNestingYieldsSentinel() {
  ChainValue value = ChainValue::Number(1);
  for (std::size_t i = 0; i < pulse::serialization::kMaxNestingDepth + 8; ++i) {
    value = ChainValue::List(ChainList{value});
  }
  assert(IsUnserializable(Serialize(value)));
}

ChainValue NestedObjects(std::size_t levels) {
  ChainValue value = ChainValue::String("leaf");
  for (std::size_t i = 0; i < levels; ++i) {
    value = ChainValue::Object(ChainObject{{"inner", value}});
  }
  return value;
}

void TestDeepestAcceptedValueStillEncodes() {
  const auto deepest = Serialize(NestedObjects(pulse::serialization::kMaxNestingDepth));
  assert(!IsUnserializable(deepest));

  const auto json = pulse::serialization::ToJson(deepest);
  assert(MessageDifferencer::Equals(pulse::serialization::ArtifactFromJson(json), deepest));

  Value decoded;
  assert(decoded.ParseFromString(deepest.SerializeAsString()));
  assert(MessageDifferencer::Equals(decoded, deepest));

  assert(IsUnserializable(Serialize(NestedObjects(pulse::serialization::kMaxNestingDepth + 1))));
}

void TestSerializeIsIdempotent() {
  AssertStable(SampleReceipt());
  AssertStable(ChainValue::Object(ChainObject{{"hash", ChainValue::String("0x1")}, {"blockNumber", ChainValue::Null()}}));
  AssertStable(NestedObjects(pulse::serialization::kMaxNestingDepth));
  AssertStable(ChainValue::List(ChainList{ChainValue::BigInt("99999999999999999999"), ChainValue::Undefined(), ChainValue::Boolean(true)}));
  AssertStable(ChainValue::String("plain"));
  AssertStable(ChainValue::Undefined());

  auto object       = std::make_shared<ChainObject>();
  (*object)["self"] = ChainValue::Object(object);
  AssertStable(ChainValue::Object(object));
  object->clear();
}

void TestJsonRoundTripOfArtifact() {
  const auto artifact = Serialize(SampleReceipt());
  const auto json     = pulse::serialization::ToJson(artifact);
  assert(json.find("\"blockNumber\":\"19000000\"") != std::string::npos);
  assert(MessageDifferencer::Equals(pulse::serialization::ArtifactFromJson(json), artifact));

  bool threw = false;
  try {
    pulse::serialization::ArtifactFromJson("{not json");
  } catch (const std::exception&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestUndefinedAndNullBecomeNull();
  TestReceiptProjectsFixedKeys();
  TestReceiptDetectionIsStructural();
  TestPendingTransactionStillProjects();
  TestBigIntegersKeepEveryDigit();
  TestNonFiniteNumbersBecomeNull();
  TestCyclesYieldSentinel();
  TestSharedButAcyclicValuesSerialize();
  TestOpaqueOutsideReceiptYieldsSentinel();
  TestExcessiveNestingYieldsSentinel();
  TestDeepestAcceptedValueStillEncodes();
  TestSerializeIsIdempotent();
  TestJsonRoundTripOfArtifact();

  std::cout << "pulse_automation_unit_artifact_serializer: pass\n";
  return 0;
}
