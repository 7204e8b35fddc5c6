// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "driver.h"

#include "settings_los.h"
#include "slabs.h"

#include <common/io.h>
#include <common/timer.h>
#include <spdlog/spdlog.h>
#include <spectrum/compare.h>
#include <spectrum/operations.h>
#include <spectrum/resample.h>
#include <spectrum/slit.h>

namespace specalg {

static auto toArray(const std::vector<double>& values) -> Eigen::ArrayXd
{
    return Eigen::Map<const Eigen::ArrayXd>(values.data(),
                                            static_cast<int>(values.size()));
}

// Construct the slabs from the tables of the configuration
static auto buildSlabs(const SettingsLOS& settings) -> std::vector<Spectrum>
{
    const auto& config { settings.slabs };
    std::vector<Spectrum> slabs {};
    for (size_t i_slab {}; i_slab < settings.nSlabs(); ++i_slab) {
        const auto& axis { config.axis.size() == 1 ? config.axis.front()
                                                   : config.axis[i_slab] };
        Spectrum slab { toArray(axis), config.axis_unit };
        if (!config.radiance_noslit.empty()) {
            slab.setQuantity("radiance_noslit",
                             toArray(config.radiance_noslit[i_slab]),
                             config.radiance_unit);
        }
        if (!config.transmittance_noslit.empty()) {
            slab.setQuantity("transmittance_noslit",
                             toArray(config.transmittance_noslit[i_slab]),
                             "");
        }
        if (!config.path_length.empty()) {
            slab.conditions["path_length"] = config.path_length[i_slab];
        }
        slab.name = config.names.empty() ? "slab " + std::to_string(i_slab)
                                         : config.names[i_slab];
        spdlog::info("  {}: {} samples, {} to {} {}",
                     slab.name,
                     slab.size(),
                     slab.axis().minCoeff(),
                     slab.axis().maxCoeff(),
                     slab.axisUnit());
        slabs.push_back(std::move(slab));
    }
    return slabs;
}

// Warn about slabs identical to an earlier one, a likely mistake in
// the configuration.
static auto checkDuplicates(const std::vector<Spectrum>& slabs,
                            const double rtol) -> void
{
    CompareOptions options {};
    options.rtol = rtol;
    for (size_t i {}; i < slabs.size(); ++i) {
        for (size_t j {}; j < i; ++j) {
            if (hasSameAxis(slabs[i], slabs[j])
                && compareWith(slabs[i], slabs[j], {}, options)) {
                spdlog::warn(
                  "{} duplicates {}", slabs[i].name, slabs[j].name);
            }
        }
    }
}

static auto printSummary(const Spectrum& spectrum) -> void
{
    spdlog::info("Composed spectrum: {}", spectrum.name);
    spdlog::info("  axis: {} samples, {} to {} {}",
                 spectrum.size(),
                 spectrum.axis().minCoeff(),
                 spectrum.axis().maxCoeff(),
                 spectrum.axisUnit());
    for (const auto& quantity : spectrum.quantityNames()) {
        spdlog::info("  {:<21} integral {:12.5e}  max {:12.5e}  [{}]",
                     quantity,
                     spectrum.integral(quantity),
                     spectrum.max(quantity),
                     spectrum.unit(quantity));
    }
    for (const auto& [key, value] : spectrum.conditions) {
        if (std::holds_alternative<double>(value)) {
            spdlog::info("  {} = {}", key, std::get<double>(value));
        } else {
            spdlog::info("  {} = {}", key, std::get<std::string>(value));
        }
    }
}

auto driver(const SettingsLOS& settings) -> Spectrum
{
    // Set up loggers and print general information
    initLogging();
    printHeading("Specalg line-of-sight composition", false);
    printSystemInfo(SPECALG_PROJECT_VERSION,
                    SPECALG_GIT_COMMIT_ABBREV,
                    SPECALG_CMAKE_HOST_SYSTEM,
                    SPECALG_EXECUTABLE,
                    SPECALG_CXX_COMPILER,
                    SPECALG_CXX_COMPILER_FLAGS,
                    SPECALG_LIBRARIES);
    Timer timer {};
    timer.start();

    printHeading("Slabs");
    std::vector<Spectrum> slabs { buildSlabs(settings) };
    checkDuplicates(slabs, settings.compare.rtol);

    // Bring the slabs onto a common axis first so that the configured
    // interpolation is used. The composition then finds identical
    // axes.
    const auto& config { settings.composition };
    spdlog::info("Common axis: {}, out of bounds: {}, interpolation: {}",
                 toString(config.resample),
                 toString(config.out_of_bounds),
                 toString(config.interpolation));
    slabs = reconcile(
      slabs, config.resample, config.out_of_bounds, config.interpolation);

    printHeading("Composition");
    spdlog::info("Mode: {}", toString(config.mode));
    Spectrum result { config.mode == Composition::serial
                        ? serialSlabs(slabs, ResampleRange::never)
                        : mergeSlabs(slabs, ResampleRange::never) };

    if (settings.crop.low || settings.crop.high) {
        result.crop(settings.crop.low, settings.crop.high, settings.crop.unit);
        spdlog::info("Cropped to {} samples", result.size());
    }
    if (settings.slit.fwhm) {
        spdlog::info("Convolving with a slit of FWHM {} {} (shape {})",
                     settings.slit.fwhm.value(),
                     std::string { settings.slit.unit },
                     static_cast<double>(settings.slit.shape));
        const GaussianSlit slit { settings.slit.fwhm.value(),
                                  settings.slit.unit,
                                  settings.slit.shape };
        result = applySlit(result, slit);
    }

    printHeading("Summary");
    printSummary(result);
    timer.stop();
    spdlog::info("");
    spdlog::info("Total time: {:8.3f} s", timer.time());
    printHeading("Success");
    return result;
}

} // namespace specalg
