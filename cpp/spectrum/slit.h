// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Interface to the instrument slit function. The spectrum algebra
// only needs to know which quantities are slit-convolved, so
// convolution is delegated to a SlitFunction implementation.

#pragma once

#include "spectrum.h"

namespace specalg {

class SlitFunction
{
public:
    // Convolve the given values sampled on an ascending axis (in the
    // unit returned by unit())
    [[nodiscard]] virtual auto convolve(const Eigen::ArrayXd& axis,
                                        const Eigen::ArrayXd& values) const
      -> Eigen::ArrayXd = 0;
    // Unit of the slit width
    [[nodiscard]] virtual auto unit() const -> const std::string& = 0;
    virtual ~SlitFunction() = default;
};

// Generalized Gaussian slit, 2^(-|2 d / fwhm|^shape). shape = 2 gives
// a Gaussian.
class GaussianSlit : public SlitFunction
{
private:
    double fwhm {};
    double shape {};
    std::string width_unit {};

public:
    GaussianSlit(const double fwhm,
                 const std::string& unit,
                 const double shape = 2.0);
    [[nodiscard]] auto convolve(const Eigen::ArrayXd& axis,
                                const Eigen::ArrayXd& values) const
      -> Eigen::ArrayXd override;
    [[nodiscard]] auto unit() const -> const std::string& override
    {
        return width_unit;
    }
};

// Convolve every *_noslit quantity with the slit function and store
// the result as the convolved counterpart (radiance_noslit ->
// radiance, transmittance_noslit -> transmittance). The axis is
// converted into the unit of the slit width for convolving but the
// result is on the original axis.
[[nodiscard]] auto applySlit(const Spectrum& spectrum,
                             const SlitFunction& slit) -> Spectrum;

} // namespace specalg
