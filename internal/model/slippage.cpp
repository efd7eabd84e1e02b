#include "internal/model/slippage.hpp"

#include <cmath>
#include <string>

#include "internal/util/errors.hpp"

namespace pulse::model {

namespace {

constexpr double kPresetEpsilon = 1e-9;
constexpr long   kBasisPoints   = 10000;

}  // namespace

SlippageTolerance SlippageTolerance::FromDecimal(double decimal) {
  if (!std::isfinite(decimal) || decimal <= 0.0 || decimal >= 1.0) {
    throw util::InvalidArgument("slippage tolerance must be a decimal strictly between 0 and 1, got " + std::to_string(decimal));
  }
  return SlippageTolerance(decimal);
}

SlippageTolerance SlippageTolerance::FromPreset(Preset preset) {
  return SlippageTolerance(PresetValue(preset));
}

SlippageTolerance SlippageTolerance::Default() {
  return FromPreset(Preset::kOnePercent);
}

double SlippageTolerance::PresetValue(Preset preset) {
  switch (preset) {
    case Preset::kOnePercent:
      return 0.01;
    case Preset::kThreePercent:
      return 0.03;
    case Preset::kTenPercent:
      return 0.10;
  }
  return 0.01;
}

std::string_view SlippageTolerance::PresetLabel(Preset preset) {
  switch (preset) {
    case Preset::kOnePercent:
      return "1%";
    case Preset::kThreePercent:
      return "3%";
    case Preset::kTenPercent:
      return "10%";
  }
  return "";
}

std::optional<SlippageTolerance::Preset> SlippageTolerance::SelectedPreset() const {
  for (auto preset : kPresets) {
    if (std::fabs(decimal_ - PresetValue(preset)) < kPresetEpsilon) {
      return preset;
    }
  }
  return std::nullopt;
}

bool SlippageTolerance::IsSelected(Preset preset) const {
  const auto selected = SelectedPreset();
  return selected.has_value() && *selected == preset;
}

bool SlippageTolerance::IsCustom() const {
  return !SelectedPreset().has_value();
}

mpz_class MinimumAmountOut(const mpz_class& expected, const SlippageTolerance& tolerance) {
  const auto factor = static_cast<unsigned long>(std::floor((1.0 - tolerance.decimal()) * kBasisPoints));
  mpz_class  scaled = expected * factor;
  mpz_class  result;
  mpz_tdiv_q_ui(result.get_mpz_t(), scaled.get_mpz_t(), kBasisPoints);
  return result;
}

}  // namespace pulse::model
