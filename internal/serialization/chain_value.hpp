#pragma once

#include <gmpxx.h>

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace pulse::serialization {

class ChainValue;

using ChainList   = std::vector<ChainValue>;
using ChainObject = std::map<std::string, ChainValue>;

// Absent value, distinct from null.
struct UndefinedValue {
  bool operator==(const UndefinedValue&) const = default;
};

// Live object that has no data representation (provider, signer, socket).
struct OpaqueHandle {
  std::string description;
};

/*
  ChainValue

  A value returned by a chain executor: the dynamic shapes a provider hands
  back (numbers, arbitrary-precision integers, nested records, receipts
  carrying live handles). Containers are shared, so a value graph may
  contain cycles; the serializer detects them.
*/
class ChainValue {
 public:
  using Storage = std::variant<UndefinedValue, std::nullptr_t, bool, double, std::string, mpz_class, std::shared_ptr<ChainList>,
                               std::shared_ptr<ChainObject>, OpaqueHandle>;

  ChainValue() = default;

  static ChainValue Undefined();
  static ChainValue Null();
  static ChainValue Boolean(bool value);
  static ChainValue Number(double value);
  static ChainValue String(std::string value);
  static ChainValue BigInt(mpz_class value);
  static ChainValue BigInt(const std::string& decimal);
  static ChainValue List(ChainList items);
  static ChainValue List(std::shared_ptr<ChainList> items);
  static ChainValue Object(ChainObject fields);
  static ChainValue Object(std::shared_ptr<ChainObject> fields);
  static ChainValue Opaque(std::string description);

  const Storage& storage() const {
    return storage_;
  }

  bool IsUndefined() const {
    return std::holds_alternative<UndefinedValue>(storage_);
  }
  bool IsNull() const {
    return std::holds_alternative<std::nullptr_t>(storage_);
  }
  bool IsString() const {
    return std::holds_alternative<std::string>(storage_);
  }
  bool IsObject() const {
    return std::holds_alternative<std::shared_ptr<ChainObject>>(storage_);
  }

  // Field lookup on objects; nullptr when absent or not an object.
  const ChainValue* Find(const std::string& key) const;

 private:
  explicit ChainValue(Storage storage) : storage_(std::move(storage)) {
  }

  Storage storage_;
};

/*
  Typed transaction receipt an executor may build instead of a raw object.
  The provider handle, when present, is carried along but never serialized.
*/
struct TransactionReceipt {
  std::string                  hash;
  std::optional<std::string>   block_hash;
  mpz_class                    block_number;
  std::optional<std::uint64_t> transaction_index;
  std::optional<std::string>   from;
  std::optional<std::string>   to;
  std::optional<int>           status;
  std::optional<mpz_class>     gas_used;
  std::optional<mpz_class>     gas_price;
  std::optional<mpz_class>     effective_gas_price;
  std::optional<OpaqueHandle>  provider;
  ChainList                    logs;

  ChainValue ToChainValue() const;
};

} // namespace pulse::serialization
