// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "resample.h"

#include "quantities.h"

#include <algorithm>
#include <cmath>
#include <common/algorithm.h>
#include <common/cubic_spline.h>
#include <common/errors.h>
#include <common/linear_spline.h>
#include <limits>
#include <spdlog/spdlog.h>

namespace specalg {

// Tolerance scale of an axis range. Values within tol::boundary of it
// count as the same point.
static auto rangeScale(const double x_min, const double x_max) -> double
{
    return std::max({ std::abs(x_min), std::abs(x_max), x_max - x_min });
}

static auto onSameAxis(const Spectrum& spectrum,
                       const Eigen::ArrayXd& axis,
                       const std::string& unit) -> bool
{
    return spectrum.axisUnit() == unit && spectrum.size() == axis.size()
           && (spectrum.axis() == axis).all();
}

auto resample(const Spectrum& spectrum,
              const Eigen::ArrayXd& target_axis,
              const std::string& target_unit,
              const OutOfBounds out_of_bounds,
              const Interpolation interpolation) -> Spectrum
{
    Spectrum result { target_axis, target_unit };
    result.name = spectrum.name;
    result.conditions = spectrum.conditions;

    // Source axis in the target unit, in ascending order
    const Eigen::ArrayXd source_axis { spectrum.axisIn(target_unit) };
    const std::vector<int> order { ascendingOrder(source_axis) };
    const Eigen::ArrayXd knots { permute(source_axis, order) };
    const double x_min { knots(0) };
    const double x_max { knots(knots.size() - 1) };
    const double slack { tol::boundary * rangeScale(x_min, x_max) };

    ArrayXb outside(target_axis.size());
    for (int i {}; i < static_cast<int>(target_axis.size()); ++i) {
        outside(i) =
          target_axis(i) < x_min - slack || target_axis(i) > x_max + slack;
    }
    if (outside.any()) {
        if (out_of_bounds == OutOfBounds::error) {
            throw RangeError { "target axis [" + std::to_string(
                                 target_axis.minCoeff())
                               + ", " + std::to_string(target_axis.maxCoeff())
                               + "] " + target_unit + " exceeds the range ["
                               + std::to_string(x_min) + ", "
                               + std::to_string(x_max) + "] of the spectrum" };
        }
        spdlog::debug("{} of {} target samples outside the spectral range",
                      outside.count(),
                      target_axis.size());
    }
    const Eigen::ArrayXd clamped = target_axis.max(x_min).min(x_max);

    for (const auto& quantity : spectrum.quantityNames()) {
        const Eigen::ArrayXd values { permute(spectrum.get(quantity), order) };
        Eigen::ArrayXd resampled(target_axis.size());
        if (knots.size() == 1) {
            resampled.setConstant(values(0));
        } else if (interpolation == Interpolation::cubic) {
            resampled = CubicSpline { knots, values }.eval(clamped);
        } else {
            resampled = LinearSpline { knots, values }.eval(clamped);
        }
        for (int i {}; i < static_cast<int>(resampled.size()); ++i) {
            if (!outside(i)) {
                continue;
            }
            switch (out_of_bounds) {
            case OutOfBounds::nan:
                resampled(i) = std::numeric_limits<double>::quiet_NaN();
                break;
            case OutOfBounds::transparent:
                resampled(i) = transparentValue(quantity);
                break;
            case OutOfBounds::clamp:
            case OutOfBounds::error:
                // Clamping already done by evaluating at the edge
                break;
            }
        }
        result.setQuantity(quantity, resampled, spectrum.unit(quantity));
    }
    return result;
}

auto hasSameAxis(const Spectrum& a, const Spectrum& b) -> bool
{
    return onSameAxis(a, b.axis(), b.axisUnit());
}

auto commonAxis(const std::vector<Spectrum>& spectra,
                const ResampleRange range) -> Eigen::ArrayXd
{
    if (spectra.empty()) {
        throw ValueError { "no spectra to build a common axis from" };
    }
    const Spectrum& first { spectra.front() };
    if (std::ranges::all_of(spectra, [&first](const Spectrum& spectrum) {
            return hasSameAxis(first, spectrum);
        })) {
        return first.axis();
    }
    if (range == ResampleRange::never) {
        throw ValueError { "spectra are sampled on different axes and "
                           "resampling is disabled" };
    }
    const std::string& unit { first.axisUnit() };
    std::vector<double> samples {};
    double lower { -std::numeric_limits<double>::infinity() };
    double upper { std::numeric_limits<double>::infinity() };
    for (const auto& spectrum : spectra) {
        const Eigen::ArrayXd axis { spectrum.axisIn(unit) };
        lower = std::max(lower, axis.minCoeff());
        upper = std::min(upper, axis.maxCoeff());
        for (const double x : axis) {
            samples.push_back(x);
        }
    }
    std::ranges::sort(samples);
    const double scale { rangeScale(samples.front(), samples.back()) };
    const double slack { tol::boundary * scale };
    if (range == ResampleRange::intersect && lower > upper + slack) {
        throw RangeError { "the spectral ranges do not overlap" };
    }
    std::vector<double> merged {};
    for (const double x : samples) {
        if (range == ResampleRange::intersect
            && (x < lower - slack || x > upper + slack)) {
            continue;
        }
        if (merged.empty() || x - merged.back() > tol::axis_merge * scale) {
            merged.push_back(x);
        }
    }
    if (merged.empty()) {
        throw RangeError { "the common spectral axis is empty" };
    }
    return Eigen::Map<const Eigen::ArrayXd>(merged.data(),
                                            static_cast<int>(merged.size()));
}

auto reconcile(const std::vector<Spectrum>& spectra,
               const ResampleRange range,
               const OutOfBounds out_of_bounds,
               const Interpolation interpolation) -> std::vector<Spectrum>
{
    const Eigen::ArrayXd axis { commonAxis(spectra, range) };
    const std::string& unit { spectra.front().axisUnit() };
    std::vector<Spectrum> result {};
    result.reserve(spectra.size());
    for (const auto& spectrum : spectra) {
        if (onSameAxis(spectrum, axis, unit)) {
            result.push_back(spectrum);
        } else {
            spdlog::debug("resampling {} onto {} common samples",
                          spectrum.name.empty() ? "spectrum" : spectrum.name,
                          axis.size());
            result.push_back(
              resample(spectrum, axis, unit, out_of_bounds, interpolation));
        }
    }
    return result;
}

} // namespace specalg
