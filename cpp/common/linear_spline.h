// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// A simple class for generating and evaluating linear splines. This is
// the baseline interpolator of the resampling subsystem.
// Example usage:
//   LinearSpline spline { knots, values };
//   double val { spline.eval(3.7) };
// If the knots are equally spaced it has O(1) scaling, else O(log(N))
// scaling. Outside the knot range the first or last segment is
// extrapolated linearly.

#pragma once

#include <Eigen/Dense>

namespace specalg {

class LinearSpline
{
private:
    bool equal_spacing { true };
    double range {};
    Eigen::ArrayXd knots {};
    Eigen::ArrayXd values {};
    // Index of the segment containing x, limited to 0..N-2
    [[nodiscard]] auto lookupIdx(const double x) const -> int;

public:
    LinearSpline() = default;
    // Knots may be given in ascending or descending order. At least
    // two knots are required.
    LinearSpline(const Eigen::ArrayXd& x_values,
                 const Eigen::ArrayXd& y_values);
    [[nodiscard]] auto eval(const double x) const -> double;
    [[nodiscard]] auto eval(const Eigen::ArrayXd& x) const -> Eigen::ArrayXd;
    ~LinearSpline() = default;
};

} // namespace specalg
