// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Interpolation of spectra onto other axes and reconciliation of the
// axes of several spectra before they are combined. Any two-operand
// operation whose operands do not share an identical axis and unit
// goes through this module first.

#pragma once

#include "spectrum.h"

namespace specalg {

// Interpolate every quantity of a spectrum onto target_axis given in
// target_unit. The source axis is converted into target_unit and
// sorted into ascending order before interpolating, so the target may
// be of either unit-kind and direction. Target samples outside the
// source range are handled according to out_of_bounds.
[[nodiscard]] auto resample(
  const Spectrum& spectrum,
  const Eigen::ArrayXd& target_axis,
  const std::string& target_unit,
  const OutOfBounds out_of_bounds = OutOfBounds::nan,
  const Interpolation interpolation = Interpolation::linear) -> Spectrum;

// Whether two spectra have the same axis values in the same unit
[[nodiscard]] auto hasSameAxis(const Spectrum& a, const Spectrum& b) -> bool;

// Axis shared by a set of spectra, in the axis unit of the first
// one. If all spectra already share that axis it is returned
// unchanged. Otherwise the result is in ascending order:
//   full      - union of all samples
//   intersect - union of all samples restricted to the range covered
//               by every spectrum (RangeError if there is no overlap)
//   never     - ValueError, the axes must already be identical
[[nodiscard]] auto commonAxis(const std::vector<Spectrum>& spectra,
                              const ResampleRange range) -> Eigen::ArrayXd;

// Put all spectra on their common axis. Spectra already on it are
// returned as copies.
[[nodiscard]] auto reconcile(
  const std::vector<Spectrum>& spectra,
  const ResampleRange range,
  const OutOfBounds out_of_bounds = OutOfBounds::nan,
  const Interpolation interpolation = Interpolation::linear)
  -> std::vector<Spectrum>;

} // namespace specalg
