#include "internal/execution/execution_context.hpp"

#include <cmath>
#include <utility>

#include "internal/util/errors.hpp"
#include "internal/util/overloaded.hpp"

namespace pulse::execution {

using serialization::ChainValue;
using util::Overloaded;

namespace {

constexpr unsigned long kPercentScale = 10000;

bool AllDigits(const std::string& s) {
  if (s.empty()) {
    return false;
  }
  for (char c : s) {
    if (c < '0' || c > '9') {
      return false;
    }
  }
  return true;
}

std::optional<mpz_class> ParseInteger(const std::string& text) {
  if (!AllDigits(text)) {
    return std::nullopt;
  }
  return mpz_class(text, 10);
}

mpz_class FieldAsInteger(const ChainValue& value, const std::string& field) {
  auto parsed = std::visit(Overloaded{
                               [](const mpz_class& n) -> std::optional<mpz_class> { return n; },
                               [](const std::string& s) { return ParseInteger(s); },
                               [](double d) -> std::optional<mpz_class> {
                                 if (!std::isfinite(d) || d < 0 || std::trunc(d) != d) {
                                   return std::nullopt;
                                 }
                                 return mpz_class(d);
                               },
                               [](const auto&) -> std::optional<mpz_class> { return std::nullopt; },
                           },
                           value.storage());
  if (!parsed) {
    throw util::InvalidArgument("previous node output field '" + field + "' is not an integer amount");
  }
  return *parsed;
}

} // namespace

std::optional<mpz_class> ParseUnits(const std::string& text, unsigned decimals) {
  const auto  dot      = text.find('.');
  std::string whole    = text.substr(0, dot);
  std::string fraction = dot == std::string::npos ? std::string{} : text.substr(dot + 1);

  if (whole.empty() && fraction.empty()) {
    return std::nullopt;
  }
  if ((!whole.empty() && !AllDigits(whole)) || (dot != std::string::npos && !fraction.empty() && !AllDigits(fraction))) {
    return std::nullopt;
  }
  if (fraction.size() > decimals) {
    return std::nullopt;
  }

  fraction.append(decimals - fraction.size(), '0');
  const auto digits = (whole.empty() ? std::string("0") : whole) + fraction;
  return mpz_class(digits, 10);
}

ExecutionContext::ExecutionContext(std::string automation_id, status::RunId run)
    : automation_id_(std::move(automation_id)), run_(std::move(run)) {
}

void ExecutionContext::Record(const model::Node& node, ChainValue output) {
  outputs_.insert_or_assign(node.id, std::move(output));
  previous_node_id_   = node.id;
  previous_node_kind_ = node.kind();
}

const ChainValue* ExecutionContext::OutputOf(const std::string& node_id) const {
  auto it = outputs_.find(node_id);
  return it == outputs_.end() ? nullptr : &it->second;
}

mpz_class ExecutionContext::ResolveAmount(const model::AmountSpec& amount) const {
  return std::visit(Overloaded{
                        [](const model::StaticAmount& a) -> mpz_class {
                          const std::string value = a.value.empty() ? "0" : a.value;
                          if (auto units = ParseUnits(value)) {
                            return *units;
                          }
                          throw util::InvalidArgument("invalid amount '" + a.value + "'");
                        },
                        [this](const model::PreviousOutputAmount& a) -> mpz_class {
                          if (!(a.percentage > 0.0 && a.percentage <= 100.0)) {
                            throw util::InvalidArgument("previous output percentage must be in (0, 100]");
                          }
                          if (!previous_node_id_) {
                            throw util::InvalidState("No previous node output available");
                          }
                          const auto* output = OutputOf(*previous_node_id_);
                          if (output == nullptr) {
                            throw util::InvalidState("Previous node " + *previous_node_id_ + " has no output");
                          }
                          const auto* field = output->Find(a.field);
                          if (field == nullptr || field->IsUndefined() || field->IsNull()) {
                            throw util::InvalidArgument("Previous node output does not have field: " + a.field);
                          }

                          const mpz_class value  = FieldAsInteger(*field, a.field);
                          const auto      factor = static_cast<unsigned long>(std::floor(a.percentage / 100.0 * kPercentScale));
                          mpz_class       scaled = value * factor;
                          mpz_tdiv_q_ui(scaled.get_mpz_t(), scaled.get_mpz_t(), kPercentScale);
                          return scaled;
                        },
                    },
                    amount);
}

} // namespace pulse::execution
