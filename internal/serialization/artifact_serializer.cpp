#include "internal/serialization/artifact_serializer.hpp"

#include <google/protobuf/util/json_util.h>

#include <charconv>
#include <cmath>
#include <stdexcept>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/overloaded.hpp"

namespace pulse::serialization {

using google::protobuf::Value;
using util::Overloaded;

namespace {

class Unserializable : public std::runtime_error {
 public:
  explicit Unserializable(const std::string& msg) : std::runtime_error(msg) {
  }
};

Value NullValue() {
  Value out;
  out.set_null_value(google::protobuf::NULL_VALUE);
  return out;
}

Value StringValue(std::string s) {
  Value out;
  out.set_string_value(std::move(s));
  return out;
}

// Integral values print without a fraction, like a JS number's toString().
std::string FormatNumber(double value) {
  char buffer[64];
  auto result = std::abs(value) < 1e21 && std::trunc(value) == value
                    ? std::to_chars(buffer, buffer + sizeof(buffer), value, std::chars_format::fixed, 0)
                    : std::to_chars(buffer, buffer + sizeof(buffer), value);
  return std::string(buffer, result.ptr);
}

// ---------------------------------------------------------------------
// Receipt projection
// ---------------------------------------------------------------------

bool IsNumericField(std::string_view key) {
  return key == "blockNumber" || key == "gasUsed" || key == "gasPrice" || key == "effectiveGasPrice";
}

Value ProjectScalar(const ChainValue* field, bool numeric) {
  if (field == nullptr) {
    return NullValue();
  }
  return std::visit(Overloaded{
                        [&](bool b) {
                          if (numeric) {
                            return StringValue(b ? "true" : "false");
                          }
                          Value out;
                          out.set_bool_value(b);
                          return out;
                        },
                        [&](double d) {
                          if (!std::isfinite(d)) {
                            return NullValue();
                          }
                          if (numeric) {
                            return StringValue(FormatNumber(d));
                          }
                          Value out;
                          out.set_number_value(d);
                          return out;
                        },
                        [](const std::string& s) { return StringValue(s); },
                        [](const mpz_class& n) { return StringValue(n.get_str(10)); },
                        [](const auto&) { return NullValue(); },
                    },
                    field->storage());
}

Value ProjectReceipt(const ChainObject& fields) {
  Value out;
  auto* projected = out.mutable_struct_value()->mutable_fields();
  for (const char* key : kReceiptFields) {
    auto it = fields.find(key);
    (*projected)[key] = ProjectScalar(it == fields.end() ? nullptr : &it->second, IsNumericField(key));
  }
  return out;
}

// ---------------------------------------------------------------------
// Generic walk
// ---------------------------------------------------------------------

class Walker {
 public:
  Value Walk(const ChainValue& value, std::size_t depth) {
    if (depth > kMaxNestingDepth) {
      throw Unserializable("nesting deeper than " + std::to_string(kMaxNestingDepth));
    }
    return std::visit(Overloaded{
                          [](const UndefinedValue&) { return NullValue(); },
                          [](std::nullptr_t) { return NullValue(); },
                          [](bool b) {
                            Value out;
                            out.set_bool_value(b);
                            return out;
                          },
                          [](double d) {
                            if (!std::isfinite(d)) {
                              return NullValue();
                            }
                            Value out;
                            out.set_number_value(d);
                            return out;
                          },
                          [](const std::string& s) { return StringValue(s); },
                          [](const mpz_class& n) { return StringValue(n.get_str(10)); },
                          [&](const std::shared_ptr<ChainList>& list) {
                            if (!list) {
                              return NullValue();
                            }
                            Enter(list.get());
                            Value out;
                            auto* values = out.mutable_list_value();
                            for (const auto& item : *list) {
                              *values->add_values() = Walk(item, depth + 1);
                            }
                            Leave();
                            return out;
                          },
                          [&](const std::shared_ptr<ChainObject>& object) {
                            if (!object) {
                              return NullValue();
                            }
                            Enter(object.get());
                            Value out;
                            auto* fields = out.mutable_struct_value()->mutable_fields();
                            for (const auto& [key, item] : *object) {
                              (*fields)[key] = Walk(item, depth + 1);
                            }
                            Leave();
                            return out;
                          },
                          [](const OpaqueHandle& handle) -> Value { throw Unserializable("opaque handle: " + handle.description); },
                      },
                      value.storage());
  }

 private:
  // Containers on the current path; a container reached twice on one path is a cycle.
  void Enter(const void* container) {
    for (const void* ancestor : path_) {
      if (ancestor == container) {
        throw Unserializable("cycle detected");
      }
    }
    path_.push_back(container);
  }

  void Leave() {
    path_.pop_back();
  }

  std::vector<const void*> path_;
};

} // namespace

ValueShape Classify(const ChainValue& value) {
  const auto* object = std::get_if<std::shared_ptr<ChainObject>>(&value.storage());
  if (object == nullptr || !*object) {
    return GenericShape{};
  }

  const auto* hash         = value.Find("hash");
  const auto* block_number = value.Find("blockNumber");
  if (hash != nullptr && hash->IsString() && block_number != nullptr && !block_number->IsUndefined()) {
    return ReceiptShape{object->get()};
  }
  return GenericShape{};
}

Value Serialize(const ChainValue& value) noexcept {
  try {
    return std::visit(Overloaded{
                          [](const ReceiptShape& receipt) { return ProjectReceipt(*receipt.fields); },
                          [&](const GenericShape&) { return Walker{}.Walk(value, 0); },
                      },
                      Classify(value));
  } catch (const std::exception& e) {
    PULSE_LOG_WARN("Value replaced with unserializable marker", {observability::StringField("reason", e.what())});
    return UnserializableSentinel();
  }
}

Value UnserializableSentinel() {
  Value out;
  (*out.mutable_struct_value()->mutable_fields())["unserializable"].set_bool_value(true);
  return out;
}

bool IsUnserializable(const Value& artifact) {
  if (artifact.kind_case() != Value::kStructValue) {
    return false;
  }
  const auto& fields = artifact.struct_value().fields();
  if (fields.size() != 1) {
    return false;
  }
  auto it = fields.find("unserializable");
  return it != fields.end() && it->second.kind_case() == Value::kBoolValue && it->second.bool_value();
}

ChainValue FromArtifact(const Value& artifact) {
  switch (artifact.kind_case()) {
    case Value::kNullValue:
    case Value::KIND_NOT_SET:
      return ChainValue::Null();
    case Value::kBoolValue:
      return ChainValue::Boolean(artifact.bool_value());
    case Value::kNumberValue:
      return ChainValue::Number(artifact.number_value());
    case Value::kStringValue:
      return ChainValue::String(artifact.string_value());
    case Value::kListValue: {
      ChainList items;
      items.reserve(artifact.list_value().values_size());
      for (const auto& item : artifact.list_value().values()) {
        items.push_back(FromArtifact(item));
      }
      return ChainValue::List(std::move(items));
    }
    case Value::kStructValue: {
      ChainObject fields;
      for (const auto& [key, item] : artifact.struct_value().fields()) {
        fields.emplace(key, FromArtifact(item));
      }
      return ChainValue::Object(std::move(fields));
    }
  }
  return ChainValue::Null();
}

std::string ToJson(const Value& artifact) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(artifact, &json);
  if (!status.ok()) {
    throw std::runtime_error("failed to encode artifact: " + std::string(status.message()));
  }
  return json;
}

Value ArtifactFromJson(const std::string& json) {
  Value artifact;
  auto  status = google::protobuf::util::JsonStringToMessage(json, &artifact);
  if (!status.ok()) {
    throw util::InvalidArgument("failed to decode artifact: " + std::string(status.message()));
  }
  return artifact;
}

} // namespace pulse::serialization
