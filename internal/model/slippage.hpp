#pragma once

#include <gmpxx.h>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace pulse::model {

/*
  Maximum adverse price movement accepted by a swap-like node.

  Always a decimal fraction strictly between 0 and 1. The value either
  matches one of the presets or is a custom decimal; enforcement happens
  in the chain executor, which receives MinimumAmountOut().
*/
class SlippageTolerance {
 public:
  enum class Preset : std::uint8_t {
    kOnePercent,
    kThreePercent,
    kTenPercent,
  };

  static constexpr std::array<Preset, 3> kPresets = {Preset::kOnePercent, Preset::kThreePercent, Preset::kTenPercent};

  static SlippageTolerance FromDecimal(double decimal);
  static SlippageTolerance FromPreset(Preset preset);
  static SlippageTolerance Default();

  static double           PresetValue(Preset preset);
  static std::string_view PresetLabel(Preset preset);

  double decimal() const {
    return decimal_;
  }

  std::optional<Preset> SelectedPreset() const;
  bool                  IsSelected(Preset preset) const;
  bool                  IsCustom() const;

  bool operator==(const SlippageTolerance& other) const {
    return decimal_ == other.decimal_;
  }

 private:
  explicit SlippageTolerance(double decimal) : decimal_(decimal) {
  }

  double decimal_;
};

// expected * floor((1 - tolerance) * 10000) / 10000, truncated.
mpz_class MinimumAmountOut(const mpz_class& expected, const SlippageTolerance& tolerance);

}  // namespace pulse::model
