// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Registry of the spectral quantities known to the line-of-sight
// composition. Quantities with other names may be stored in a
// Spectrum and take part in arithmetic but are rejected when slabs
// are composed.

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace specalg {

// How a quantity combines when slabs are merged side by side
enum class MergeRule
{
    sum,
    product,
    rejected, // Slit-convolved, cannot be merged
};

// How a quantity propagates through slabs along a line of sight
enum class SerialRule
{
    radiance,      // I = I1 T2 + I2
    transmittance, // T = T1 T2
    absorbance,    // A = A1 + A2
    dropped,
};

struct QuantityInfo
{
    std::string name {};
    // Whether the quantity has been convolved with an instrument slit
    bool convolved {};
    MergeRule merge_rule {};
    SerialRule serial_rule {};
    // Value of a slab that neither emits nor absorbs
    double transparent_value {};
    std::string default_unit {};
};

[[nodiscard]] auto isKnownQuantity(const std::string& name) -> bool;

// Throws ValueError for unknown quantities
[[nodiscard]] auto quantityInfo(const std::string& name) -> const QuantityInfo&;

[[nodiscard]] auto isConvolved(const std::string& name) -> bool;

// Neutral fill value, 0 for unknown quantities
[[nodiscard]] auto transparentValue(const std::string& name) -> double;

// Default unit, empty for unknown quantities
[[nodiscard]] auto defaultUnit(const std::string& name) -> std::string;

// Name of the quantity obtained by convolving a *_noslit quantity
// with a slit function, e.g. radiance_noslit -> radiance.
[[nodiscard]] auto convolvedCounterpart(const std::string& name)
  -> std::optional<std::string>;

[[nodiscard]] auto knownQuantities() -> std::vector<std::string>;

} // namespace specalg
