// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "settings_los.h"

#include <common/errors.h>

namespace specalg {

auto SettingsLOS::scanKeys() -> void
{
    scan(processing_version);

    scan(composition.mode);
    scan(composition.resample);
    scan(composition.out_of_bounds);
    scan(composition.interpolation);

    scan(compare.rtol);

    scan(crop.low);
    scan(crop.high);
    scan(crop.unit);

    scan(slabs.axis_unit);
    scan(slabs.radiance_unit);
    scan(slabs.axis);
    scan(slabs.radiance_noslit);
    scan(slabs.transmittance_noslit);
    scan(slabs.path_length);
    scan(slabs.names);

    scan(slit.fwhm);
    scan(slit.shape);
    scan(slit.unit);
}

auto SettingsLOS::nSlabs() const -> size_t
{
    return std::max(slabs.radiance_noslit.size(),
                    slabs.transmittance_noslit.size());
}

// Check that a table has one row per slab, each with as many values
// as the axis of that slab.
static auto checkTable(const std::string& key,
                       const std::vector<std::vector<double>>& table,
                       const std::vector<std::vector<double>>& axes,
                       const size_t n_slabs) -> void
{
    if (table.empty()) {
        return;
    }
    if (table.size() != n_slabs) {
        throw ValueError { key + " has " + std::to_string(table.size())
                           + " rows, expected " + std::to_string(n_slabs) };
    }
    for (size_t i_slab {}; i_slab < n_slabs; ++i_slab) {
        const auto& axis { axes.size() == 1 ? axes.front() : axes[i_slab] };
        if (table[i_slab].size() != axis.size()) {
            throw ValueError { key + ": slab " + std::to_string(i_slab)
                               + " has " + std::to_string(table[i_slab].size())
                               + " values but its axis has "
                               + std::to_string(axis.size()) };
        }
    }
}

auto SettingsLOS::checkParameters() -> void
{
    const size_t n_slabs { nSlabs() };
    if (n_slabs == 0) {
        throw ValueError { "[slabs] must contain radiance_noslit or "
                           "transmittance_noslit of at least one slab" };
    }
    if (slabs.axis.size() != 1 && slabs.axis.size() != n_slabs) {
        throw ValueError { "[slabs][axis] must contain one axis or one per "
                           "slab, found "
                           + std::to_string(slabs.axis.size()) };
    }
    checkTable("[slabs][radiance_noslit]",
               slabs.radiance_noslit,
               slabs.axis,
               n_slabs);
    checkTable("[slabs][transmittance_noslit]",
               slabs.transmittance_noslit,
               slabs.axis,
               n_slabs);
    if (!slabs.path_length.empty() && slabs.path_length.size() != n_slabs) {
        throw ValueError { "[slabs][path_length] must have one value per "
                           "slab" };
    }
    if (!slabs.names.empty() && slabs.names.size() != n_slabs) {
        throw ValueError { "[slabs][names] must have one entry per slab" };
    }
    if (compare.rtol < 0.0) {
        throw ValueError { "[compare][rtol] must not be negative" };
    }
    if (slit.fwhm && slit.fwhm.value() <= 0.0) {
        throw ValueError { "[slit][fwhm] must be positive" };
    }
    // Empty units default to the axis unit
    if (crop.unit.empty()) {
        crop.unit = std::string { slabs.axis_unit };
    }
    if (slit.unit.empty()) {
        slit.unit = std::string { slabs.axis_unit };
    }
}

} // namespace specalg
