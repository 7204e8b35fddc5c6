// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Algebra of spectra. Every function returns a new spectrum and
// leaves its operands untouched. Functions acting on a single
// quantity take an optional quantity name. If it is omitted the
// spectrum must hold exactly one quantity, otherwise KeyError is
// thrown.
//
// Scalars may carry a unit. For addition the scalar is converted into
// the unit of the quantity. For multiplication the units are
// multiplied and the result simplified:
//
//   s.setUnit("radiance", "count");
//   s = s * Scalar { 100, "mW/cm2/sr/nm/count" };
//   // s.unit("radiance") == "mW/(cm2 nm sr)"

#pragma once

#include "spectrum.h"

namespace specalg {

// Keep the samples with low <= axis <= high. The bounds are given in
// unit (the axis unit if empty) and may be of the other unit-kind, in
// which case they swap roles. A missing bound does not limit the
// range. Throws ValueError if low > high and RangeError if no sample
// remains.
[[nodiscard]] auto crop(const Spectrum& spectrum,
                        const std::optional<double> low,
                        const std::optional<double> high,
                        const std::string& unit = "") -> Spectrum;

// Shift the axis by value. If unit is of the other unit-kind than the
// axis, the shift is applied in that space, e.g. a shift of 10 cm-1
// of a spectrum in nm. The quantities are not resampled.
[[nodiscard]] auto offset(const Spectrum& spectrum,
                          const double value,
                          const std::string& unit,
                          const std::optional<std::string>& new_name = {})
  -> Spectrum;

[[nodiscard]] auto addConstant(const Spectrum& spectrum,
                               const Scalar& value,
                               const std::optional<std::string>& quantity = {})
  -> Spectrum;

[[nodiscard]] auto multiply(const Spectrum& spectrum,
                            const Scalar& factor,
                            const std::optional<std::string>& quantity = {})
  -> Spectrum;

[[nodiscard]] auto divide(const Spectrum& spectrum,
                          const Scalar& divisor,
                          const std::optional<std::string>& quantity = {})
  -> Spectrum;

// Subtract a straight line running from left at the first axis sample
// to right at the last one:
//   out[i] = in[i] - (left + (right - left) (x[i] - x[0]) / (x[n-1] - x[0]))
// The two endpoints are converted into the unit of the quantity
// independently of each other.
[[nodiscard]] auto subBaseline(const Spectrum& spectrum,
                               const Scalar& left,
                               const Scalar& right,
                               const std::optional<std::string>& quantity = {})
  -> Spectrum;

// Spectrum holding only the named quantity
[[nodiscard]] auto extractQuantity(const Spectrum& spectrum,
                                   const std::string& quantity) -> Spectrum;
[[nodiscard]] auto radiance(const Spectrum& spectrum) -> Spectrum;
[[nodiscard]] auto radianceNoslit(const Spectrum& spectrum) -> Spectrum;
[[nodiscard]] auto transmittance(const Spectrum& spectrum) -> Spectrum;
[[nodiscard]] auto transmittanceNoslit(const Spectrum& spectrum) -> Spectrum;
[[nodiscard]] auto absorbance(const Spectrum& spectrum) -> Spectrum;

// Spectrum of the same homogeneous slab with another path length
// (cm). The current one is taken from conditions["path_length"].
// Absorbance scales linearly, transmittance follows as exp(-A) and
// radiance as S (1 - T) with a constant source function S. Emission
// and absorption coefficients are unchanged. Slit-convolved and
// unknown quantities cannot be rescaled and are dropped.
[[nodiscard]] auto rescalePathLength(const Spectrum& spectrum,
                                     const double new_length) -> Spectrum;

// Sum and difference of the single quantity of two spectra. The
// quantities must have the same name and compatible units. b is
// converted into the unit of a and both are resampled onto their
// common axis if needed.
[[nodiscard]] auto add(const Spectrum& a,
                       const Spectrum& b,
                       const ResampleRange range = ResampleRange::intersect)
  -> Spectrum;
[[nodiscard]] auto subtract(const Spectrum& a,
                            const Spectrum& b,
                            const ResampleRange range =
                              ResampleRange::intersect) -> Spectrum;

[[nodiscard]] auto operator+(const Spectrum& spectrum,
                             const Scalar& value) -> Spectrum;
[[nodiscard]] auto operator+(const Scalar& value,
                             const Spectrum& spectrum) -> Spectrum;
[[nodiscard]] auto operator-(const Spectrum& spectrum,
                             const Scalar& value) -> Spectrum;
[[nodiscard]] auto operator-(const Scalar& value,
                             const Spectrum& spectrum) -> Spectrum;
[[nodiscard]] auto operator-(const Spectrum& spectrum) -> Spectrum;
[[nodiscard]] auto operator*(const Spectrum& spectrum,
                             const Scalar& factor) -> Spectrum;
[[nodiscard]] auto operator*(const Scalar& factor,
                             const Spectrum& spectrum) -> Spectrum;
[[nodiscard]] auto operator/(const Spectrum& spectrum,
                             const Scalar& divisor) -> Spectrum;
auto operator+=(Spectrum& spectrum, const Scalar& value) -> Spectrum&;
auto operator-=(Spectrum& spectrum, const Scalar& value) -> Spectrum&;
auto operator*=(Spectrum& spectrum, const Scalar& factor) -> Spectrum&;
auto operator/=(Spectrum& spectrum, const Scalar& divisor) -> Spectrum&;

[[nodiscard]] auto operator+(const Spectrum& a, const Spectrum& b) -> Spectrum;
[[nodiscard]] auto operator-(const Spectrum& a, const Spectrum& b) -> Spectrum;
auto operator+=(Spectrum& a, const Spectrum& b) -> Spectrum&;
auto operator-=(Spectrum& a, const Spectrum& b) -> Spectrum&;

// The product or ratio of two spectra (e.g. of two radiances) is not
// a radiative operation. Use the line-of-sight composition instead.
auto operator*(const Spectrum& a, const Spectrum& b) -> Spectrum = delete;
auto operator/(const Spectrum& a, const Spectrum& b) -> Spectrum = delete;

} // namespace specalg
