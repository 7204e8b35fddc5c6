// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Spectral quantities sampled over a common spectral axis. A spectrum
// may hold several quantities at once (e.g. radiance_noslit and
// transmittance_noslit of the same slab), each with its own unit. The
// axis is strictly monotonic in either direction and is tagged with a
// wavelength or wavenumber unit.
//
// Spectra are values: copying a spectrum copies its arrays, and all
// free functions of the spectrum algebra (operations.h) return a new
// spectrum. The member functions crop, offset, resample, etc. are
// their in-place counterparts. They compute the result first and only
// then replace the contents of *this so that a failing call leaves the
// spectrum unmodified.

#pragma once

#include <common/constants.h>
#include <common/eigen.h>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace specalg {

// Metadata describing how a spectrum was produced, e.g. path_length
// (cm) or Tgas (K). It is not interpreted by the algebra except when
// slabs are composed.
using ConditionValue = std::variant<double, std::string>;
using Conditions = std::map<std::string, ConditionValue>;

// A number with an optional unit. An empty unit means the unit of
// whatever the scalar is combined with (for addition) or
// dimensionless (for multiplication).
struct Scalar
{
    double value {};
    std::string unit {};

    Scalar(const double value) : value { value } {}
    Scalar(const double value, const std::string& unit)
      : value { value }, unit { unit }
    {}
};

class Spectrum
{
private:
    Eigen::ArrayXd axis_values {};
    std::string axis_unit {};
    std::map<std::string, Eigen::ArrayXd> quantities {};
    std::map<std::string, std::string> units {};

public:
    // Label, e.g. for log messages
    std::string name {};
    Conditions conditions {};

    // Throws ValueError if the axis is empty or not strictly
    // monotonic, and UnitError if the unit is not a wavelength or
    // wavenumber unit.
    Spectrum(const Eigen::ArrayXd& axis, const std::string& axis_unit);
    // Spectrum holding one quantity. If no unit is given, the default
    // unit of the quantity is used.
    Spectrum(const Eigen::ArrayXd& axis,
             const std::string& axis_unit,
             const std::string& quantity,
             const Eigen::ArrayXd& values,
             const std::optional<std::string>& unit = {});

    [[nodiscard]] auto axis() const -> const Eigen::ArrayXd&
    {
        return axis_values;
    }
    [[nodiscard]] auto axisUnit() const -> const std::string&
    {
        return axis_unit;
    }
    [[nodiscard]] auto axisKind() const -> AxisKind;
    // Axis values converted to another unit (possibly of the other
    // unit-kind, in which case the direction is reversed).
    [[nodiscard]] auto axisIn(const std::string& unit) const -> Eigen::ArrayXd;
    [[nodiscard]] auto size() const -> int
    {
        return static_cast<int>(axis_values.size());
    }
    // Replace the axis values, keeping the quantities. The new axis
    // must have the same number of samples.
    auto setAxis(const Eigen::ArrayXd& axis, const std::string& unit) -> void;

    // Add or replace a quantity. Throws ValueError if the number of
    // values differs from the number of axis samples.
    auto setQuantity(const std::string& quantity,
                     const Eigen::ArrayXd& values,
                     const std::string& unit) -> void;
    auto removeQuantity(const std::string& quantity) -> void;
    // Throws KeyError if the quantity does not exist
    [[nodiscard]] auto get(const std::string& quantity) const
      -> const Eigen::ArrayXd&;
    [[nodiscard]] auto unit(const std::string& quantity) const
      -> const std::string&;
    // Relabel the unit of a quantity without touching the values,
    // e.g. when a detector signal is declared to be in counts.
    auto setUnit(const std::string& quantity, const std::string& unit) -> void;
    // Convert the values of a quantity into another unit
    auto convertUnit(const std::string& quantity, const std::string& unit)
      -> void;
    [[nodiscard]] auto has(const std::string& quantity) const -> bool;
    [[nodiscard]] auto quantityNames() const -> std::vector<std::string>;
    [[nodiscard]] auto nQuantities() const -> int
    {
        return static_cast<int>(quantities.size());
    }
    // Resolve the quantity an operation applies to. If no name is
    // given the spectrum must hold exactly one quantity, otherwise a
    // KeyError is thrown.
    [[nodiscard]] auto selectQuantity(
      const std::optional<std::string>& quantity = {}) const -> std::string;

    // Trapezoidal integral over the axis, in ascending axis
    // order. NaN segments are skipped.
    [[nodiscard]] auto integral(
      const std::optional<std::string>& quantity = {}) const -> double;
    // Largest value, ignoring NaN
    [[nodiscard]] auto max(
      const std::optional<std::string>& quantity = {}) const -> double;

    // In-place counterparts of the functions in operations.h and
    // resample.h
    auto crop(const std::optional<double> low,
              const std::optional<double> high,
              const std::string& unit = "") -> Spectrum&;
    auto offset(const double value,
                const std::string& unit,
                const std::optional<std::string>& new_name = {}) -> Spectrum&;
    auto resample(const Eigen::ArrayXd& target_axis,
                  const std::string& target_unit,
                  const OutOfBounds out_of_bounds = OutOfBounds::nan,
                  const Interpolation interpolation = Interpolation::linear)
      -> Spectrum&;
    auto subBaseline(const Scalar& left,
                     const Scalar& right,
                     const std::optional<std::string>& quantity = {})
      -> Spectrum&;
    auto rescalePathLength(const double new_length) -> Spectrum&;
};

} // namespace specalg
