// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "operations.h"

#include "resample.h"

#include <cmath>
#include <common/errors.h>
#include <common/units.h>
#include <spdlog/spdlog.h>

namespace specalg {

// Value of a scalar in the unit of a quantity. A scalar without a
// unit is taken to be in that unit already.
static auto scalarIn(const Scalar& scalar, const std::string& unit) -> double
{
    return scalar.unit.empty() ? scalar.value
                               : convert(scalar.value, scalar.unit, unit);
}

// Copy of a spectrum with a subset of the samples
static auto selectSamples(const Spectrum& spectrum,
                          const std::vector<int>& indices) -> Spectrum
{
    const Eigen::ArrayXd axis = spectrum.axis()(indices);
    Spectrum result { axis, spectrum.axisUnit() };
    result.name = spectrum.name;
    result.conditions = spectrum.conditions;
    for (const auto& quantity : spectrum.quantityNames()) {
        const Eigen::ArrayXd values = spectrum.get(quantity)(indices);
        result.setQuantity(quantity, values, spectrum.unit(quantity));
    }
    return result;
}

auto crop(const Spectrum& spectrum,
          const std::optional<double> low,
          const std::optional<double> high,
          const std::string& unit) -> Spectrum
{
    if (low && high && low.value() > high.value()) {
        throw ValueError { "crop: lower bound " + std::to_string(low.value())
                           + " exceeds upper bound "
                           + std::to_string(high.value()) };
    }
    const std::string& axis_unit { spectrum.axisUnit() };
    const std::string& bound_unit { unit.empty() ? axis_unit : unit };
    std::optional<double> lower {};
    std::optional<double> upper {};
    if (axisKind(bound_unit) == spectrum.axisKind()) {
        if (low) {
            lower = convertAxis(low.value(), bound_unit, axis_unit);
        }
        if (high) {
            upper = convertAxis(high.value(), bound_unit, axis_unit);
        }
    } else {
        // Reciprocal conversion, the lower bound becomes the upper one
        if (high) {
            lower = convertAxis(high.value(), bound_unit, axis_unit);
        }
        if (low) {
            upper = convertAxis(low.value(), bound_unit, axis_unit);
        }
    }
    const Eigen::ArrayXd& axis { spectrum.axis() };
    const double slack { tol::boundary
                         * std::max(axis.abs().maxCoeff(),
                                    axis.maxCoeff() - axis.minCoeff()) };
    std::vector<int> indices {};
    for (int i {}; i < spectrum.size(); ++i) {
        if ((!lower || axis(i) >= lower.value() - slack)
            && (!upper || axis(i) <= upper.value() + slack)) {
            indices.push_back(i);
        }
    }
    if (indices.empty()) {
        throw RangeError { "crop: no samples left in the range ["
                           + (low ? std::to_string(low.value()) : "-inf")
                           + ", "
                           + (high ? std::to_string(high.value()) : "inf")
                           + "] " + bound_unit };
    }
    return selectSamples(spectrum, indices);
}

auto offset(const Spectrum& spectrum,
            const double value,
            const std::string& unit,
            const std::optional<std::string>& new_name) -> Spectrum
{
    const std::string& axis_unit { spectrum.axisUnit() };
    Eigen::ArrayXd axis {};
    if (axisKind(unit) == spectrum.axisKind()) {
        axis = spectrum.axis() + convertAxis(value, unit, axis_unit);
    } else {
        const Eigen::ArrayXd shifted = spectrum.axisIn(unit) + value;
        axis = convertAxis(shifted, unit, axis_unit);
    }
    Spectrum result { spectrum };
    result.setAxis(axis, axis_unit);
    if (new_name) {
        result.name = new_name.value();
    }
    return result;
}

auto addConstant(const Spectrum& spectrum,
                 const Scalar& value,
                 const std::optional<std::string>& quantity) -> Spectrum
{
    const std::string name { spectrum.selectQuantity(quantity) };
    const std::string& unit { spectrum.unit(name) };
    const double constant { scalarIn(value, unit) };
    Spectrum result { spectrum };
    result.setQuantity(name, spectrum.get(name) + constant, unit);
    return result;
}

auto multiply(const Spectrum& spectrum,
              const Scalar& factor,
              const std::optional<std::string>& quantity) -> Spectrum
{
    const std::string name { spectrum.selectQuantity(quantity) };
    Spectrum result { spectrum };
    if (factor.unit.empty()) {
        result.setQuantity(
          name, spectrum.get(name) * factor.value, spectrum.unit(name));
        return result;
    }
    const UnitProduct product { multiplyUnits(spectrum.unit(name),
                                              factor.unit) };
    result.setQuantity(name,
                       spectrum.get(name) * (factor.value * product.factor),
                       product.unit);
    return result;
}

auto divide(const Spectrum& spectrum,
            const Scalar& divisor,
            const std::optional<std::string>& quantity) -> Spectrum
{
    const std::string name { spectrum.selectQuantity(quantity) };
    Spectrum result { spectrum };
    if (divisor.unit.empty()) {
        result.setQuantity(
          name, spectrum.get(name) / divisor.value, spectrum.unit(name));
        return result;
    }
    const UnitProduct product { divideUnits(spectrum.unit(name),
                                            divisor.unit) };
    if (product.factor == 1.0) {
        result.setQuantity(
          name, spectrum.get(name) / divisor.value, product.unit);
    } else {
        const double factor { product.factor / divisor.value };
        result.setQuantity(name, spectrum.get(name) * factor, product.unit);
    }
    return result;
}

auto subBaseline(const Spectrum& spectrum,
                 const Scalar& left,
                 const Scalar& right,
                 const std::optional<std::string>& quantity) -> Spectrum
{
    const std::string name { spectrum.selectQuantity(quantity) };
    const std::string& unit { spectrum.unit(name) };
    const double left_value { scalarIn(left, unit) };
    const double right_value { scalarIn(right, unit) };
    const Eigen::ArrayXd& axis { spectrum.axis() };
    const auto n { axis.size() };
    Eigen::ArrayXd baseline(n);
    if (n == 1) {
        baseline(0) = left_value;
    } else {
        const double width { axis(n - 1) - axis(0) };
        for (int i {}; i < static_cast<int>(n); ++i) {
            baseline(i) =
              std::lerp(left_value, right_value, (axis(i) - axis(0)) / width);
        }
    }
    Spectrum result { spectrum };
    result.setQuantity(name, spectrum.get(name) - baseline, unit);
    return result;
}

auto extractQuantity(const Spectrum& spectrum,
                     const std::string& quantity) -> Spectrum
{
    Spectrum result { spectrum.axis(), spectrum.axisUnit() };
    result.name = spectrum.name;
    result.conditions = spectrum.conditions;
    result.setQuantity(
      quantity, spectrum.get(quantity), spectrum.unit(quantity));
    return result;
}

auto radiance(const Spectrum& spectrum) -> Spectrum
{
    return extractQuantity(spectrum, "radiance");
}

auto radianceNoslit(const Spectrum& spectrum) -> Spectrum
{
    return extractQuantity(spectrum, "radiance_noslit");
}

auto transmittance(const Spectrum& spectrum) -> Spectrum
{
    return extractQuantity(spectrum, "transmittance");
}

auto transmittanceNoslit(const Spectrum& spectrum) -> Spectrum
{
    return extractQuantity(spectrum, "transmittance_noslit");
}

auto absorbance(const Spectrum& spectrum) -> Spectrum
{
    return extractQuantity(spectrum, "absorbance");
}

auto rescalePathLength(const Spectrum& spectrum,
                       const double new_length) -> Spectrum
{
    const auto it { spectrum.conditions.find("path_length") };
    if (it == spectrum.conditions.end()
        || !std::holds_alternative<double>(it->second)) {
        throw ValueError { "rescaling requires a numerical path_length "
                           "in the conditions" };
    }
    const double old_length { std::get<double>(it->second) };
    if (old_length <= 0.0 || new_length < 0.0) {
        throw ValueError { "cannot rescale path length "
                           + std::to_string(old_length) + " cm to "
                           + std::to_string(new_length) + " cm" };
    }
    const double ratio { new_length / old_length };

    // Absorbance before and after rescaling, if any is available
    std::optional<Eigen::ArrayXd> old_absorbance {};
    if (spectrum.has("absorbance")) {
        old_absorbance = spectrum.get("absorbance");
    } else if (spectrum.has("transmittance_noslit")) {
        old_absorbance =
          Eigen::ArrayXd(-spectrum.get("transmittance_noslit").log());
    }

    Spectrum result { spectrum.axis(), spectrum.axisUnit() };
    result.name = spectrum.name;
    result.conditions = spectrum.conditions;
    result.conditions["path_length"] = new_length;
    for (const auto& name : spectrum.quantityNames()) {
        const Eigen::ArrayXd& values { spectrum.get(name) };
        const std::string& unit { spectrum.unit(name) };
        if (name == "absorbance") {
            result.setQuantity(name, values * ratio, unit);
        } else if (name == "transmittance_noslit") {
            result.setQuantity(
              name, (-old_absorbance.value() * ratio).exp(), unit);
        } else if (name == "abscoeff" || name == "emisscoeff") {
            result.setQuantity(name, values, unit);
        } else if (name == "radiance_noslit") {
            if (!old_absorbance) {
                throw ValueError { "rescaling radiance_noslit requires "
                                   "absorbance or transmittance_noslit" };
            }
            // I = S (1 - exp(-A)) with a constant source function S.
            // Where the slab is optically thin the ratio is linear.
            const Eigen::ArrayXd& A { old_absorbance.value() };
            Eigen::ArrayXd scale(A.size());
            for (int i {}; i < static_cast<int>(A.size()); ++i) {
                scale(i) = A(i) > 0.0 ? std::expm1(-A(i) * ratio)
                                          / std::expm1(-A(i))
                                      : ratio;
            }
            result.setQuantity(name, values * scale, unit);
        } else {
            spdlog::warn("{} cannot be rescaled to another path length and "
                         "is dropped",
                         name);
        }
    }
    return result;
}

// Operands of a spectrum-spectrum operation, with b converted into
// the unit of a and both on their common axis.
static auto alignOperands(const Spectrum& a,
                          const Spectrum& b,
                          const ResampleRange range,
                          const std::string& operation)
  -> std::pair<Spectrum, Spectrum>
{
    const std::string name_a { a.selectQuantity() };
    const std::string name_b { b.selectQuantity() };
    if (name_a != name_b) {
        throw ValueError { "cannot " + operation + " " + name_a + " and "
                           + name_b };
    }
    const Spectrum lhs { extractQuantity(a, name_a) };
    Spectrum rhs { extractQuantity(b, name_b) };
    rhs.convertUnit(name_b, a.unit(name_a));
    std::vector<Spectrum> aligned { reconcile({ lhs, rhs }, range) };
    return { std::move(aligned.at(0)), std::move(aligned.at(1)) };
}

auto add(const Spectrum& a,
         const Spectrum& b,
         const ResampleRange range) -> Spectrum
{
    auto [lhs, rhs] { alignOperands(a, b, range, "add") };
    const std::string name { lhs.selectQuantity() };
    lhs.setQuantity(name, lhs.get(name) + rhs.get(name), lhs.unit(name));
    return lhs;
}

auto subtract(const Spectrum& a,
              const Spectrum& b,
              const ResampleRange range) -> Spectrum
{
    auto [lhs, rhs] { alignOperands(a, b, range, "subtract") };
    const std::string name { lhs.selectQuantity() };
    lhs.setQuantity(name, lhs.get(name) - rhs.get(name), lhs.unit(name));
    return lhs;
}

auto operator+(const Spectrum& spectrum, const Scalar& value) -> Spectrum
{
    return addConstant(spectrum, value);
}

auto operator+(const Scalar& value, const Spectrum& spectrum) -> Spectrum
{
    return addConstant(spectrum, value);
}

auto operator-(const Spectrum& spectrum, const Scalar& value) -> Spectrum
{
    return addConstant(spectrum, Scalar { -value.value, value.unit });
}

auto operator-(const Scalar& value, const Spectrum& spectrum) -> Spectrum
{
    return addConstant(multiply(spectrum, -1.0), value);
}

auto operator-(const Spectrum& spectrum) -> Spectrum
{
    return multiply(spectrum, -1.0);
}

auto operator*(const Spectrum& spectrum, const Scalar& factor) -> Spectrum
{
    return multiply(spectrum, factor);
}

auto operator*(const Scalar& factor, const Spectrum& spectrum) -> Spectrum
{
    return multiply(spectrum, factor);
}

auto operator/(const Spectrum& spectrum, const Scalar& divisor) -> Spectrum
{
    return divide(spectrum, divisor);
}

auto operator+=(Spectrum& spectrum, const Scalar& value) -> Spectrum&
{
    spectrum = spectrum + value;
    return spectrum;
}

auto operator-=(Spectrum& spectrum, const Scalar& value) -> Spectrum&
{
    spectrum = spectrum - value;
    return spectrum;
}

auto operator*=(Spectrum& spectrum, const Scalar& factor) -> Spectrum&
{
    spectrum = spectrum * factor;
    return spectrum;
}

auto operator/=(Spectrum& spectrum, const Scalar& divisor) -> Spectrum&
{
    spectrum = spectrum / divisor;
    return spectrum;
}

auto operator+(const Spectrum& a, const Spectrum& b) -> Spectrum
{
    return add(a, b);
}

auto operator-(const Spectrum& a, const Spectrum& b) -> Spectrum
{
    return subtract(a, b);
}

auto operator+=(Spectrum& a, const Spectrum& b) -> Spectrum&
{
    a = add(a, b);
    return a;
}

auto operator-=(Spectrum& a, const Spectrum& b) -> Spectrum&
{
    a = subtract(a, b);
    return a;
}

} // namespace specalg
