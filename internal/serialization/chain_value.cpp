#include "internal/serialization/chain_value.hpp"

#include "internal/util/errors.hpp"

namespace pulse::serialization {

ChainValue ChainValue::Undefined() {
  return ChainValue(Storage{std::in_place_type<UndefinedValue>});
}

ChainValue ChainValue::Null() {
  return ChainValue(Storage{std::in_place_type<std::nullptr_t>, nullptr});
}

ChainValue ChainValue::Boolean(bool value) {
  return ChainValue(Storage{std::in_place_type<bool>, value});
}

ChainValue ChainValue::Number(double value) {
  return ChainValue(Storage{std::in_place_type<double>, value});
}

ChainValue ChainValue::String(std::string value) {
  return ChainValue(Storage{std::move(value)});
}

ChainValue ChainValue::BigInt(mpz_class value) {
  return ChainValue(Storage{std::in_place_type<mpz_class>, std::move(value)});
}

ChainValue ChainValue::BigInt(const std::string& decimal) {
  mpz_class value;
  if (decimal.empty() || value.set_str(decimal, 10) != 0) {
    throw util::InvalidArgument("not a decimal integer: '" + decimal + "'");
  }
  return BigInt(std::move(value));
}

ChainValue ChainValue::List(ChainList items) {
  return List(std::make_shared<ChainList>(std::move(items)));
}

ChainValue ChainValue::List(std::shared_ptr<ChainList> items) {
  return ChainValue(Storage{std::move(items)});
}

ChainValue ChainValue::Object(ChainObject fields) {
  return Object(std::make_shared<ChainObject>(std::move(fields)));
}

ChainValue ChainValue::Object(std::shared_ptr<ChainObject> fields) {
  return ChainValue(Storage{std::move(fields)});
}

ChainValue ChainValue::Opaque(std::string description) {
  return ChainValue(Storage{OpaqueHandle{std::move(description)}});
}

const ChainValue* ChainValue::Find(const std::string& key) const {
  const auto* object = std::get_if<std::shared_ptr<ChainObject>>(&storage_);
  if (object == nullptr || !*object) {
    return nullptr;
  }
  auto it = (*object)->find(key);
  return it == (*object)->end() ? nullptr : &it->second;
}

ChainValue TransactionReceipt::ToChainValue() const {
  auto optional_string = [](const std::optional<std::string>& v) { return v ? ChainValue::String(*v) : ChainValue::Null(); };
  auto optional_bigint = [](const std::optional<mpz_class>& v) { return v ? ChainValue::BigInt(*v) : ChainValue::Null(); };

  ChainObject fields;
  fields["hash"]              = ChainValue::String(hash);
  fields["blockHash"]         = optional_string(block_hash);
  fields["blockNumber"]       = ChainValue::BigInt(block_number);
  fields["transactionIndex"]  = transaction_index ? ChainValue::Number(static_cast<double>(*transaction_index)) : ChainValue::Null();
  fields["from"]              = optional_string(from);
  fields["to"]                = optional_string(to);
  fields["status"]            = status ? ChainValue::Number(*status) : ChainValue::Null();
  fields["gasUsed"]           = optional_bigint(gas_used);
  fields["gasPrice"]          = optional_bigint(gas_price);
  fields["effectiveGasPrice"] = optional_bigint(effective_gas_price);
  fields["logs"]              = ChainValue::List(logs);
  if (provider) {
    fields["provider"] = ChainValue::Opaque(provider->description);
  }
  return ChainValue::Object(std::move(fields));
}

} // namespace pulse::serialization
