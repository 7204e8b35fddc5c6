// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Class for storing all configuration parameters of the line-of-sight
// composition driver

#pragma once

#include <common/settings.h>

namespace specalg {

class SettingsLOS : public Settings
{
private:
    auto checkParameters() -> void override;

public:
    Setting<std::string> processing_version {
        { "processing_version" },
        {},
        "processing toolchain version"
    };

    struct
    {
        Setting<Composition> mode {
            { "composition", "mode" },
            Composition::serial,
            "serial: slabs are crossed one after the other, from the first\n"
            "(farthest from the observer) to the last\n"
            "parallel: slabs are observed side by side"
        };
        Setting<ResampleRange> resample {
            { "composition", "resample" },
            ResampleRange::intersect,
            "common axis of slabs with different axes: intersect, full or\n"
            "never (axes must be identical)"
        };
        Setting<OutOfBounds> out_of_bounds {
            { "composition", "out_of_bounds" },
            OutOfBounds::nan,
            "values of a slab outside its own range: nan, transparent,\n"
            "clamp or error"
        };
        Setting<Interpolation> interpolation {
            { "composition", "interpolation" },
            Interpolation::linear,
            "interpolation when resampling slabs: linear or cubic"
        };
    } composition;

    struct
    {
        Setting<double> rtol {
            { "compare", "rtol" },
            tol::compare_rtol,
            "relative tolerance for flagging slabs that duplicate another"
        };
    } compare;

    struct
    {
        Setting<std::optional<double>> low { { "crop", "low" },
                                             "lower bound of the result" };
        Setting<std::optional<double>> high { { "crop", "high" },
                                              "upper bound of the result" };
        Setting<std::string> unit {
            { "crop", "unit" },
            {},
            "unit of the crop bounds, default is [slabs][axis_unit]"
        };
    } crop;

    struct
    {
        Setting<std::string> axis_unit { { "slabs", "axis_unit" },
                                         "nm",
                                         "unit of the slab axes" };
        Setting<std::string> radiance_unit {
            { "slabs", "radiance_unit" },
            "mW/cm2/sr/nm",
            "unit of the unconvolved radiances"
        };
        Setting<std::vector<std::vector<double>>> axis {
            { "slabs", "axis" },
            {},
            "spectral axis of each slab. If only one is given it is shared\n"
            "by all slabs."
        };
        Setting<std::vector<std::vector<double>>> radiance_noslit {
            { "slabs", "radiance_noslit" },
            {},
            "unconvolved radiance of each slab (optional)"
        };
        Setting<std::vector<std::vector<double>>> transmittance_noslit {
            { "slabs", "transmittance_noslit" },
            {},
            "unconvolved transmittance of each slab (optional)"
        };
        Setting<std::vector<double>> path_length {
            { "slabs", "path_length" },
            {},
            "length of each slab, cm (optional)"
        };
        Setting<std::vector<std::string>> names {
            { "slabs", "names" },
            {},
            "label of each slab (optional)"
        };
    } slabs;

    struct
    {
        Setting<std::optional<double>> fwhm {
            { "slit", "fwhm" },
            "FWHM of the slit function. If given, the composed spectrum is\n"
            "convolved with it."
        };
        Setting<double> shape {
            { "slit", "shape" },
            2.0,
            "shape parameter of the generalized Gaussian slit. Default is a\n"
            "Gauss."
        };
        Setting<std::string> unit {
            { "slit", "unit" },
            {},
            "unit of the FWHM, default is [slabs][axis_unit]"
        };
    } slit;

    SettingsLOS() = default;
    SettingsLOS(const std::string& yaml_file) : Settings { yaml_file } {}
    auto scanKeys() -> void override;
    // Number of slabs defined in the configuration
    [[nodiscard]] auto nSlabs() const -> size_t;
    ~SettingsLOS() = default;
};

} // namespace specalg
