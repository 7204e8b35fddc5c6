// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// General purpose math routines

#pragma once

#include "eigen.h"

#include <vector>

namespace specalg {

// Do a binary search to locate an index n such that x falls in the
// range list[n]...list[n+1]. The list must be in ascending order.
[[nodiscard]] auto binaryFindIdx(const Eigen::ArrayXd& list,
                                 const double x) -> int;

// Whether the values are strictly increasing or strictly decreasing
[[nodiscard]] auto isStrictlyMonotonic(const Eigen::ArrayXd& x) -> bool;

// Indices that sort x into ascending order
[[nodiscard]] auto ascendingOrder(const Eigen::ArrayXd& x)
  -> std::vector<int>;

// Reorder values according to a list of indices
[[nodiscard]] auto permute(const Eigen::ArrayXd& values,
                           const std::vector<int>& order) -> Eigen::ArrayXd;

// Integrate y over x using the trapezoidal rule. NaN segments are
// skipped.
[[nodiscard]] auto trapezoid(const Eigen::ArrayXd& x,
                             const Eigen::ArrayXd& y) -> double;

} // namespace specalg
