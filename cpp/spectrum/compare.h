// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Difference and tolerance based equality of two spectra. Both
// spectra are put on their common axis before comparing, so spectra
// sampled in different units or on different grids can be compared.

#pragma once

#include "spectrum.h"

namespace specalg {

// Pointwise difference or ratio of one quantity of two spectra
struct Diff
{
    Eigen::ArrayXd axis {};
    std::string axis_unit {};
    Eigen::ArrayXd values {};
    // Unit of values (empty for a ratio)
    std::string unit {};
};

struct CompareOptions
{
    // Relative and absolute tolerance. Pointwise: |a - b| <= atol +
    // rtol |b| (+ rtol max|b| with peak_floor). Integral: |int(a) -
    // int(b)| <= atol + rtol |int(b)|.
    double rtol { tol::compare_rtol };
    double atol {};
    // Pointwise mode also allows rtol times the largest |b| of the
    // quantity as an absolute error. Samples far below the peak, e.g.
    // the wings of a line, then compare by the scale of the spectrum.
    bool peak_floor { true };
    CompareMode mode { CompareMode::pointwise };
    ResampleRange resample { ResampleRange::intersect };
    // Report the largest deviation of each quantity
    bool verbose {};
};

// s1 - s2 on the common axis. The values of s2 are converted into the
// unit of s1. If no quantity is named, s1 must hold exactly one.
[[nodiscard]] auto getDiff(const Spectrum& s1,
                           const Spectrum& s2,
                           const std::optional<std::string>& quantity = {},
                           const ResampleRange range = ResampleRange::intersect)
  -> Diff;

// s1 / s2 on the common axis
[[nodiscard]] auto getRatio(const Spectrum& s1,
                            const Spectrum& s2,
                            const std::optional<std::string>& quantity = {},
                            const ResampleRange range =
                              ResampleRange::intersect) -> Diff;

// Root mean square of s1 - s2 normalized by the mean absolute value
// of s2. NaN samples are ignored.
[[nodiscard]] auto getResidual(const Spectrum& s1,
                               const Spectrum& s2,
                               const std::optional<std::string>& quantity = {},
                               const ResampleRange range =
                                 ResampleRange::intersect) -> double;

// Whether the selected quantities of two spectra agree within the
// tolerances. If no quantities are named all of them are compared and
// both spectra must hold the same set. Metadata (name, conditions) is
// ignored. Named quantities missing from either spectrum throw
// KeyError.
[[nodiscard]] auto compareWith(const Spectrum& s1,
                               const Spectrum& s2,
                               const std::vector<std::string>& quantities = {},
                               const CompareOptions& options = {}) -> bool;

// compareWith with the default options over all quantities
[[nodiscard]] auto operator==(const Spectrum& a, const Spectrum& b) -> bool;

} // namespace specalg
