// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "algorithm.h"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace specalg {

[[nodiscard]] auto binaryFindIdx(const Eigen::ArrayXd& list,
                                 const double x) -> int
{
    int i_begin {};
    int i_end { static_cast<int>(list.size() - 1) };
    int i_mid {};
    if (x <= list(0)) {
        return i_begin;
    }
    if (x >= list(list.size() - 1)) {
        return i_end;
    }
    while (true) {
        i_mid = (i_begin + i_end) / 2;
        if (x < list(i_mid)) {
            i_end = i_mid - 1;
        } else if (x < list(i_mid + 1)) {
            return i_mid;
        } else {
            i_begin = i_mid + 1;
        }
    }
}

[[nodiscard]] auto isStrictlyMonotonic(const Eigen::ArrayXd& x) -> bool
{
    if (x.size() < 2) {
        return x.size() == 1 && std::isfinite(x(0));
    }
    const bool ascending { x(1) > x(0) };
    for (int i { 1 }; i < static_cast<int>(x.size()); ++i) {
        // NaN fails both comparisons
        if (ascending ? !(x(i) > x(i - 1)) : !(x(i) < x(i - 1))) {
            return false;
        }
    }
    return true;
}

[[nodiscard]] auto ascendingOrder(const Eigen::ArrayXd& x) -> std::vector<int>
{
    std::vector<int> order(x.size());
    std::iota(order.begin(), order.end(), 0);
    std::ranges::stable_sort(
      order, [&x](const int a, const int b) { return x(a) < x(b); });
    return order;
}

[[nodiscard]] auto permute(const Eigen::ArrayXd& values,
                           const std::vector<int>& order) -> Eigen::ArrayXd
{
    Eigen::ArrayXd result(order.size());
    for (int i {}; i < static_cast<int>(order.size()); ++i) {
        result(i) = values(order[i]);
    }
    return result;
}

[[nodiscard]] auto trapezoid(const Eigen::ArrayXd& x,
                             const Eigen::ArrayXd& y) -> double
{
    double sum {};
    for (int i { 1 }; i < static_cast<int>(x.size()); ++i) {
        const double segment { 0.5 * (y(i) + y(i - 1)) * (x(i) - x(i - 1)) };
        if (!std::isnan(segment)) {
            sum += segment;
        }
    }
    return sum;
}

} // namespace specalg
