// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "compare.h"

#include "operations.h"
#include "resample.h"

#include <cmath>
#include <common/algorithm.h>
#include <common/errors.h>
#include <common/io.h>
#include <limits>
#include <spdlog/spdlog.h>

namespace specalg {

// One quantity of two spectra on their common axis, in the unit of s1
static auto alignQuantity(const Spectrum& s1,
                          const Spectrum& s2,
                          const std::optional<std::string>& quantity,
                          const ResampleRange range)
  -> std::pair<Spectrum, Spectrum>
{
    const std::string name { s1.selectQuantity(quantity) };
    const Spectrum a { extractQuantity(s1, name) };
    Spectrum b { extractQuantity(s2, name) };
    b.convertUnit(name, s1.unit(name));
    std::vector<Spectrum> aligned { reconcile({ a, b }, range) };
    return { std::move(aligned.at(0)), std::move(aligned.at(1)) };
}

auto getDiff(const Spectrum& s1,
             const Spectrum& s2,
             const std::optional<std::string>& quantity,
             const ResampleRange range) -> Diff
{
    const auto [a, b] { alignQuantity(s1, s2, quantity, range) };
    const std::string name { a.selectQuantity() };
    return { a.axis(), a.axisUnit(), a.get(name) - b.get(name), a.unit(name) };
}

auto getRatio(const Spectrum& s1,
              const Spectrum& s2,
              const std::optional<std::string>& quantity,
              const ResampleRange range) -> Diff
{
    const auto [a, b] { alignQuantity(s1, s2, quantity, range) };
    const std::string name { a.selectQuantity() };
    return { a.axis(), a.axisUnit(), a.get(name) / b.get(name), "" };
}

auto getResidual(const Spectrum& s1,
                 const Spectrum& s2,
                 const std::optional<std::string>& quantity,
                 const ResampleRange range) -> double
{
    const auto [a, b] { alignQuantity(s1, s2, quantity, range) };
    const std::string name { a.selectQuantity() };
    const Eigen::ArrayXd& values_a { a.get(name) };
    const Eigen::ArrayXd& values_b { b.get(name) };
    double sum_sq {};
    double sum_abs {};
    int n_valid {};
    for (int i {}; i < static_cast<int>(values_a.size()); ++i) {
        if (std::isnan(values_a(i)) || std::isnan(values_b(i))) {
            continue;
        }
        sum_sq += (values_a(i) - values_b(i)) * (values_a(i) - values_b(i));
        sum_abs += std::abs(values_b(i));
        ++n_valid;
    }
    if (n_valid == 0) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return std::sqrt(sum_sq / n_valid) / (sum_abs / n_valid);
}

// Compare one quantity of two aligned spectra. Returns the largest
// deviation relative to the allowed one, which must not exceed 1.
static auto relativeDeviation(const Spectrum& a,
                              const Spectrum& b,
                              const std::string& name,
                              const CompareOptions& options) -> double
{
    const Eigen::ArrayXd& values_a { a.get(name) };
    const Eigen::ArrayXd& values_b { b.get(name) };
    if (options.mode == CompareMode::integral) {
        const std::vector<int> order { ascendingOrder(a.axis()) };
        const Eigen::ArrayXd axis { permute(a.axis(), order) };
        const double integral_a { trapezoid(axis, permute(values_a, order)) };
        const double integral_b { trapezoid(axis, permute(values_b, order)) };
        const double allowed { options.atol
                               + options.rtol * std::abs(integral_b) };
        const double deviation { std::abs(integral_a - integral_b) };
        return deviation == 0.0 ? 0.0 : deviation / allowed;
    }
    double peak {};
    if (options.peak_floor) {
        for (const double value : values_b) {
            if (!std::isnan(value)) {
                peak = std::max(peak, std::abs(value));
            }
        }
    }
    const double floor { options.atol + options.rtol * peak };
    double worst {};
    for (int i {}; i < static_cast<int>(values_a.size()); ++i) {
        const bool nan_a { std::isnan(values_a(i)) };
        const bool nan_b { std::isnan(values_b(i)) };
        if (nan_a && nan_b) {
            continue;
        }
        if (nan_a || nan_b) {
            return std::numeric_limits<double>::infinity();
        }
        const double deviation { std::abs(values_a(i) - values_b(i)) };
        if (deviation == 0.0) {
            continue;
        }
        const double allowed { floor + options.rtol * std::abs(values_b(i)) };
        worst = std::max(worst, deviation / allowed);
    }
    return worst;
}

auto compareWith(const Spectrum& s1,
                 const Spectrum& s2,
                 const std::vector<std::string>& quantities,
                 const CompareOptions& options) -> bool
{
    std::vector<std::string> names { quantities };
    if (names.empty()) {
        names = s1.quantityNames();
        if (names != s2.quantityNames()) {
            if (options.verbose) {
                spdlog::info("spectra hold different quantities");
            }
            return false;
        }
    } else {
        for (const auto& name : names) {
            static_cast<void>(s1.get(name));
            static_cast<void>(s2.get(name));
        }
    }
    bool equal { true };
    for (const auto& name : names) {
        const auto [a, b] { alignQuantity(s1, s2, name, options.resample) };
        const double deviation { relativeDeviation(a, b, name, options) };
        if (deviation > 1.0) {
            equal = false;
        }
        if (options.verbose) {
            spdlog::info("{}: largest deviation is {:.3g} times the {} "
                         "tolerance (rtol={}, atol={}, peak floor {})",
                         name,
                         deviation,
                         toString(options.mode),
                         options.rtol,
                         options.atol,
                         options.peak_floor ? "on" : "off");
        }
    }
    return equal;
}

auto operator==(const Spectrum& a, const Spectrum& b) -> bool
{
    return compareWith(a, b);
}

} // namespace specalg
