// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "linear_spline.h"

#include "algorithm.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace specalg {

// Threshold for determining if the knots are equally spaced, relative
// to the first step.
constexpr double equal_spacing_tol { 1e1
                                     * std::numeric_limits<double>::epsilon() };

LinearSpline::LinearSpline(const Eigen::ArrayXd& x_values,
                           const Eigen::ArrayXd& y_values)
  : knots { x_values }, values { y_values }
{
    if (knots.size() < 2 || knots.size() != values.size()) {
        throw std::invalid_argument {
            "linear spline requires at least two knots and as many values"
        };
    }
    if (knots(1) < knots(0)) {
        knots.reverseInPlace();
        values.reverseInPlace();
    }
    // Determine if the knots are equally spaced
    const double step0 { knots(1) - knots(0) };
    for (int i { 2 }; i < static_cast<int>(knots.size()); ++i) {
        const double step { knots(i) - knots(i - 1) };
        if (std::abs(step - step0) > equal_spacing_tol * std::abs(step0)) {
            equal_spacing = false;
            break;
        }
    }
    if (equal_spacing) {
        range = knots(knots.size() - 1) - knots(0);
    }
}

[[nodiscard]] auto LinearSpline::lookupIdx(const double x) const -> int
{
    const int last_segment { static_cast<int>(knots.size()) - 2 };
    int idx {};
    if (equal_spacing) {
        idx = static_cast<int>(std::floor(
          (x - knots(0)) / range * static_cast<double>(knots.size() - 1)));
    } else {
        idx = binaryFindIdx(knots, x);
    }
    return std::clamp(idx, 0, last_segment);
}

[[nodiscard]] auto LinearSpline::eval(const double x) const -> double
{
    const int idx { lookupIdx(x) };
    const double t { (x - knots(idx)) / (knots(idx + 1) - knots(idx)) };
    return std::lerp(values(idx), values(idx + 1), t);
}

[[nodiscard]] auto LinearSpline::eval(const Eigen::ArrayXd& x) const
  -> Eigen::ArrayXd
{
    Eigen::ArrayXd result(x.size());
    for (int i {}; i < static_cast<int>(x.size()); ++i) {
        result(i) = eval(x(i));
    }
    return result;
}

} // namespace specalg
