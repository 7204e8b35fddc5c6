// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "slit.h"

#include "quantities.h"

#include <cmath>
#include <common/algorithm.h>
#include <common/errors.h>
#include <common/units.h>
#include <spdlog/spdlog.h>

namespace specalg {

// The kernel is evaluated up to this many FWHM from the center
constexpr double kernel_cutoff { 3.0 };

GaussianSlit::GaussianSlit(const double fwhm,
                           const std::string& unit,
                           const double shape)
  : fwhm { fwhm }, shape { shape }, width_unit { unit }
{
    if (fwhm <= 0.0 || shape <= 0.0) {
        throw ValueError { "slit FWHM and shape must be positive" };
    }
    static_cast<void>(axisKind(unit));
}

auto GaussianSlit::convolve(const Eigen::ArrayXd& axis,
                            const Eigen::ArrayXd& values) const
  -> Eigen::ArrayXd
{
    const int n { static_cast<int>(axis.size()) };
    if (n < 2) {
        return values;
    }
    // Trapezoidal quadrature weights of a nonuniform axis
    Eigen::ArrayXd weights(n);
    weights(0) = 0.5 * (axis(1) - axis(0));
    weights(n - 1) = 0.5 * (axis(n - 1) - axis(n - 2));
    for (int i { 1 }; i < n - 1; ++i) {
        weights(i) = 0.5 * (axis(i + 1) - axis(i - 1));
    }
    const double half_width { kernel_cutoff * fwhm };
    Eigen::ArrayXd result(n);
    for (int i {}; i < n; ++i) {
        const int first { binaryFindIdx(axis, axis(i) - half_width) };
        double sum {};
        double norm {};
        for (int j { first }; j < n && axis(j) <= axis(i) + half_width; ++j) {
            const double distance { std::abs(2.0 * (axis(j) - axis(i))
                                             / fwhm) };
            const double kernel { std::pow(2.0, -std::pow(distance, shape)) };
            sum += kernel * weights(j) * values(j);
            norm += kernel * weights(j);
        }
        // The kernel is renormalized where it is truncated by the edges
        // of the spectral range.
        result(i) = sum / norm;
    }
    return result;
}

auto applySlit(const Spectrum& spectrum, const SlitFunction& slit) -> Spectrum
{
    const Eigen::ArrayXd axis { spectrum.axisIn(slit.unit()) };
    const std::vector<int> order { ascendingOrder(axis) };
    const Eigen::ArrayXd sorted_axis { permute(axis, order) };
    Spectrum result { spectrum };
    int n_convolved {};
    for (const auto& name : spectrum.quantityNames()) {
        const auto convolved_name { convolvedCounterpart(name) };
        if (!convolved_name) {
            continue;
        }
        const Eigen::ArrayXd sorted_values { slit.convolve(
          sorted_axis, permute(spectrum.get(name), order)) };
        Eigen::ArrayXd values(sorted_values.size());
        for (int i {}; i < static_cast<int>(order.size()); ++i) {
            values(order[i]) = sorted_values(i);
        }
        result.setQuantity(convolved_name.value(), values, spectrum.unit(name));
        ++n_convolved;
    }
    if (n_convolved == 0) {
        spdlog::warn("no unconvolved quantity to apply the slit function to");
    }
    return result;
}

} // namespace specalg
