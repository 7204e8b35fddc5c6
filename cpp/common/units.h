// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Unit registry for spectral quantities and axes. A unit string is
// parsed into a product of registered symbols raised to integer
// powers, e.g. "mW/cm2/sr/nm" -> { mW: 1, cm: -2, sr: -1, nm: -1 }.
//
// Grammar:
//   - Exponents are written cm2, cm-1, cm^2 or cm**-1.
//   - Products are written with a space, '*' or '.', e.g. "W.m-2".
//   - Quotients are written with '/' and are left-associative.
//     Products bind tighter than quotients so that "mW/cm2 sr nm"
//     means mW/(cm2 sr nm).
//   - Parentheses group, "1" is the dimensionless unit.
//
// Registered symbols are m, g, s, K, sr, count, W, J, erg, Hz, photon
// and molecule, each of which may carry an SI prefix (P T G M k h da
// d c m u µ n p f). The registry is immutable and built once on
// first use.
//
// Two units are compatible if they have the same dimension. For
// spectral axes, units of length (wavelength) and inverse length
// (wavenumber) can also be converted into each other.

#pragma once

#include "constants.h"

#include <Eigen/Dense>
#include <map>
#include <string>

namespace specalg {

// Parsed compound unit: symbol (including prefix) -> power. Symbols
// with a zero power are not stored.
using UnitPowers = std::map<std::string, int>;

// Result of multiplying or dividing two units. If the product is
// dimensionless even though its symbols did not cancel (e.g. mW/W),
// the numerical factor is returned separately and must be multiplied
// into the values. The unit is then the empty string.
struct UnitProduct
{
    std::string unit {};
    double factor { 1.0 };
};

[[nodiscard]] auto parseUnit(const std::string& unit) -> UnitPowers;

// Canonical string representation: numerator symbols in alphabetical
// order followed by the denominator symbols in alphabetical order,
// e.g. "mW/(cm2 nm sr)". A dimensionless unit is "".
[[nodiscard]] auto formatUnit(const UnitPowers& powers) -> std::string;

[[nodiscard]] auto simplify(const std::string& unit) -> std::string;

// Whether two units describe the same dimension
[[nodiscard]] auto areCompatible(const std::string& unit_a,
                                 const std::string& unit_b) -> bool;

[[nodiscard]] auto isDimensionless(const std::string& unit) -> bool;

// Value of 1 from_unit expressed in to_unit. Throws UnitError if the
// units are not compatible.
[[nodiscard]] auto conversionFactor(const std::string& from_unit,
                                    const std::string& to_unit) -> double;

[[nodiscard]] auto convert(const double value,
                           const std::string& from_unit,
                           const std::string& to_unit) -> double;
[[nodiscard]] auto convert(const Eigen::ArrayXd& values,
                           const std::string& from_unit,
                           const std::string& to_unit) -> Eigen::ArrayXd;

// Whether the unit is a length (wavelength) or an inverse length
// (wavenumber). Throws UnitError otherwise.
[[nodiscard]] auto axisKind(const std::string& unit) -> AxisKind;

// Convert spectral axis values. If the unit kinds differ the
// conversion is reciprocal and the result runs in the opposite
// direction, which is left for the caller to sort out.
[[nodiscard]] auto convertAxis(const Eigen::ArrayXd& values,
                               const std::string& from_unit,
                               const std::string& to_unit) -> Eigen::ArrayXd;
[[nodiscard]] auto convertAxis(const double value,
                               const std::string& from_unit,
                               const std::string& to_unit) -> double;

[[nodiscard]] auto multiplyUnits(const std::string& unit_a,
                                 const std::string& unit_b) -> UnitProduct;
[[nodiscard]] auto divideUnits(const std::string& unit_a,
                               const std::string& unit_b) -> UnitProduct;

} // namespace specalg
