// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "spectrum.h"

#include "operations.h"
#include "quantities.h"
#include "resample.h"

#include <common/algorithm.h>
#include <common/errors.h>
#include <common/units.h>
#include <cmath>
#include <limits>

namespace specalg {

static auto checkAxis(const Eigen::ArrayXd& axis) -> void
{
    if (axis.size() == 0) {
        throw ValueError { "spectral axis must have at least one sample" };
    }
    if (!isStrictlyMonotonic(axis)) {
        throw ValueError { "spectral axis must be strictly monotonic" };
    }
}

Spectrum::Spectrum(const Eigen::ArrayXd& axis, const std::string& axis_unit)
  : axis_values { axis }, axis_unit { axis_unit }
{
    checkAxis(axis_values);
    static_cast<void>(specalg::axisKind(axis_unit));
}

Spectrum::Spectrum(const Eigen::ArrayXd& axis,
                   const std::string& axis_unit,
                   const std::string& quantity,
                   const Eigen::ArrayXd& values,
                   const std::optional<std::string>& unit)
  : Spectrum { axis, axis_unit }
{
    setQuantity(quantity, values, unit ? *unit : defaultUnit(quantity));
}

auto Spectrum::axisKind() const -> AxisKind
{
    return specalg::axisKind(axis_unit);
}

auto Spectrum::axisIn(const std::string& unit) const -> Eigen::ArrayXd
{
    return convertAxis(axis_values, axis_unit, unit);
}

auto Spectrum::setAxis(const Eigen::ArrayXd& axis,
                       const std::string& unit) -> void
{
    if (axis.size() != axis_values.size()) {
        throw ValueError { "new axis has " + std::to_string(axis.size())
                           + " samples, expected "
                           + std::to_string(axis_values.size()) };
    }
    checkAxis(axis);
    static_cast<void>(specalg::axisKind(unit));
    axis_values = axis;
    axis_unit = unit;
}

auto Spectrum::setQuantity(const std::string& quantity,
                           const Eigen::ArrayXd& values,
                           const std::string& unit) -> void
{
    if (values.size() != axis_values.size()) {
        throw ValueError { quantity + " has " + std::to_string(values.size())
                           + " values but the axis has "
                           + std::to_string(axis_values.size())
                           + " samples" };
    }
    static_cast<void>(parseUnit(unit));
    quantities[quantity] = values;
    units[quantity] = unit;
}

auto Spectrum::removeQuantity(const std::string& quantity) -> void
{
    if (quantities.erase(quantity) == 0) {
        throw KeyError { "no quantity named " + quantity };
    }
    units.erase(quantity);
}

auto Spectrum::get(const std::string& quantity) const -> const Eigen::ArrayXd&
{
    const auto it { quantities.find(quantity) };
    if (it == quantities.end()) {
        throw KeyError { "no quantity named " + quantity + " in spectrum "
                         + (name.empty() ? "(unnamed)" : name) };
    }
    return it->second;
}

auto Spectrum::unit(const std::string& quantity) const -> const std::string&
{
    const auto it { units.find(quantity) };
    if (it == units.end()) {
        throw KeyError { "no quantity named " + quantity };
    }
    return it->second;
}

auto Spectrum::setUnit(const std::string& quantity,
                       const std::string& unit) -> void
{
    static_cast<void>(get(quantity));
    static_cast<void>(parseUnit(unit));
    units[quantity] = unit;
}

auto Spectrum::convertUnit(const std::string& quantity,
                           const std::string& unit) -> void
{
    Eigen::ArrayXd converted { convert(get(quantity), units[quantity], unit) };
    quantities[quantity] = std::move(converted);
    units[quantity] = unit;
}

auto Spectrum::has(const std::string& quantity) const -> bool
{
    return quantities.contains(quantity);
}

auto Spectrum::quantityNames() const -> std::vector<std::string>
{
    std::vector<std::string> names {};
    for (const auto& [quantity, values] : quantities) {
        names.push_back(quantity);
    }
    return names;
}

auto Spectrum::selectQuantity(const std::optional<std::string>& quantity) const
  -> std::string
{
    if (quantity) {
        static_cast<void>(get(quantity.value()));
        return quantity.value();
    }
    if (quantities.size() == 1) {
        return quantities.begin()->first;
    }
    if (quantities.empty()) {
        throw KeyError { "spectrum holds no quantities" };
    }
    std::string names {};
    for (const auto& [q, values] : quantities) {
        names += (names.empty() ? "" : ", ") + q;
    }
    throw KeyError { "spectrum holds several quantities (" + names
                     + "), name the one to operate on" };
}

auto Spectrum::integral(const std::optional<std::string>& quantity) const
  -> double
{
    const Eigen::ArrayXd& values { get(selectQuantity(quantity)) };
    const std::vector<int> order { ascendingOrder(axis_values) };
    return trapezoid(permute(axis_values, order), permute(values, order));
}

auto Spectrum::max(const std::optional<std::string>& quantity) const -> double
{
    const Eigen::ArrayXd& values { get(selectQuantity(quantity)) };
    double result { std::numeric_limits<double>::quiet_NaN() };
    for (const double value : values) {
        if (!std::isnan(value) && (std::isnan(result) || value > result)) {
            result = value;
        }
    }
    return result;
}

auto Spectrum::crop(const std::optional<double> low,
                    const std::optional<double> high,
                    const std::string& unit) -> Spectrum&
{
    *this = specalg::crop(*this, low, high, unit);
    return *this;
}

auto Spectrum::offset(const double value,
                      const std::string& unit,
                      const std::optional<std::string>& new_name) -> Spectrum&
{
    *this = specalg::offset(*this, value, unit, new_name);
    return *this;
}

auto Spectrum::resample(const Eigen::ArrayXd& target_axis,
                        const std::string& target_unit,
                        const OutOfBounds out_of_bounds,
                        const Interpolation interpolation) -> Spectrum&
{
    *this = specalg::resample(
      *this, target_axis, target_unit, out_of_bounds, interpolation);
    return *this;
}

auto Spectrum::subBaseline(const Scalar& left,
                           const Scalar& right,
                           const std::optional<std::string>& quantity)
  -> Spectrum&
{
    *this = specalg::subBaseline(*this, left, right, quantity);
    return *this;
}

auto Spectrum::rescalePathLength(const double new_length) -> Spectrum&
{
    *this = specalg::rescalePathLength(*this, new_length);
    return *this;
}

} // namespace specalg
