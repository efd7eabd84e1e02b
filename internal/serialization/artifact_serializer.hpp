#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstddef>
#include <string>
#include <variant>

#include "internal/serialization/chain_value.hpp"

namespace pulse::serialization {

// google.protobuf.Value spends up to three message levels per nesting level
// (Value, Struct, map entry) and protobuf stops parsing at 100. Deeper
// values would be accepted here and then fail to encode or decode.
inline constexpr std::size_t kMaxNestingDepth = 30;

// Fields a receipt projects to, in output order.
inline constexpr const char* kReceiptFields[] = {"hash",   "blockHash", "blockNumber", "transactionIndex", "from",
                                                 "to",     "status",    "gasUsed",     "gasPrice",         "effectiveGasPrice"};

struct ReceiptShape {
  const ChainObject* fields;
};

struct GenericShape {};

using ValueShape = std::variant<ReceiptShape, GenericShape>;

// An object with a string "hash" and a present, non-undefined "blockNumber"
// is a receipt. A null blockNumber is a pending transaction and still
// projects (blockNumber: null).
ValueShape Classify(const ChainValue& value);

/*
  Converts a chain value into a JSON-safe artifact.

  Total and deterministic: big integers become decimal strings, undefined
  and non-finite numbers become null, receipts project to a fixed summary,
  and anything that cannot be represented (cycles, live handles, nesting
  beyond kMaxNestingDepth) yields {"unserializable": true}. Never throws.
*/
google::protobuf::Value Serialize(const ChainValue& value) noexcept;

google::protobuf::Value UnserializableSentinel();
bool                    IsUnserializable(const google::protobuf::Value& artifact);

// Lifts an artifact back into a chain value. Serialize(FromArtifact(a)) == a
// for every a produced by Serialize.
ChainValue FromArtifact(const google::protobuf::Value& artifact);

std::string             ToJson(const google::protobuf::Value& artifact);
google::protobuf::Value ArtifactFromJson(const std::string& json);

} // namespace pulse::serialization
