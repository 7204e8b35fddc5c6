// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "slabs.h"

#include <algorithm>
#include <cmath>
#include <common/errors.h>
#include <spdlog/spdlog.h>
#include <spectrum/quantities.h>
#include <spectrum/resample.h>
#include <utility>

namespace specalg {

static auto label(const Spectrum& slab) -> std::string
{
    return slab.name.empty() ? std::string { "<unnamed>" } : slab.name;
}

// Copy of a slab with only the quantities that can be composed
static auto composable(const Spectrum& slab) -> Spectrum
{
    Spectrum result { slab.axis(), slab.axisUnit() };
    result.name = slab.name;
    result.conditions = slab.conditions;
    for (const auto& quantity : slab.quantityNames()) {
        if (quantityInfo(quantity).convolved) {
            spdlog::warn("Slab {}: {} is slit-convolved and cannot be "
                         "composed, dropping it",
                         label(slab),
                         quantity);
            continue;
        }
        result.setQuantity(quantity, slab.get(quantity), slab.unit(quantity));
    }
    if (result.nQuantities() == 0) {
        throw ValueError { "slab " + label(slab)
                           + " holds no quantity that can be composed" };
    }
    return result;
}

// Conditions of a composition. Keys on which the slabs agree are
// kept, the others are set to "N/A". Path lengths are summed if
// requested and known for every slab.
static auto mergeConditions(const std::vector<Spectrum>& slabs,
                            const bool sum_path_length) -> Conditions
{
    Conditions result { slabs.front().conditions };
    for (size_t i_slab { 1 }; i_slab < slabs.size(); ++i_slab) {
        const Conditions& other { slabs[i_slab].conditions };
        for (auto& [key, value] : result) {
            const auto it { other.find(key) };
            if (it == other.end() || it->second != value) {
                value = std::string { "N/A" };
            }
        }
        for (const auto& [key, value] : other) {
            if (!result.contains(key)) {
                result[key] = std::string { "N/A" };
            }
        }
    }
    if (sum_path_length) {
        double total {};
        const bool all_known { std::ranges::all_of(
          slabs, [&total](const Spectrum& slab) {
              const auto it { slab.conditions.find("path_length") };
              if (it == slab.conditions.end()
                  || !std::holds_alternative<double>(it->second)) {
                  return false;
              }
              total += std::get<double>(it->second);
              return true;
          }) };
        if (all_known) {
            result["path_length"] = total;
        }
    }
    return result;
}

static auto hasExtinction(const Spectrum& slab) -> bool
{
    return slab.has("transmittance_noslit") || slab.has("absorbance");
}

static auto transmittanceOf(const Spectrum& slab) -> Eigen::ArrayXd
{
    if (slab.has("transmittance_noslit")) {
        return slab.get("transmittance_noslit");
    }
    return (-slab.get("absorbance")).exp();
}

static auto absorbanceOf(const Spectrum& slab) -> Eigen::ArrayXd
{
    if (slab.has("absorbance")) {
        return slab.get("absorbance");
    }
    return -slab.get("transmittance_noslit").log();
}

// Serial composition of two slabs, radiation going from upstream
// through downstream
static auto serialPair(const Spectrum& upstream_slab,
                       const Spectrum& downstream_slab,
                       const ResampleRange range,
                       const OutOfBounds out_of_bounds) -> Spectrum
{
    const auto aligned { reconcile(
      { composable(upstream_slab), composable(downstream_slab) },
      range,
      out_of_bounds) };
    const Spectrum& up { aligned.front() };
    Spectrum down { aligned.back() };
    for (const auto& quantity : down.quantityNames()) {
        if (up.has(quantity)) {
            down.convertUnit(quantity, up.unit(quantity));
        }
    }
    for (const Spectrum* slab : { &up, &std::as_const(down) }) {
        for (const auto& quantity : slab->quantityNames()) {
            if (quantityInfo(quantity).serial_rule == SerialRule::dropped) {
                spdlog::debug("Slab {}: {} is not propagated along the line "
                              "of sight",
                              label(*slab),
                              quantity);
            }
        }
    }

    Spectrum result { up.axis(), up.axisUnit() };
    result.name = label(upstream_slab) + " > " + label(downstream_slab);
    result.conditions = mergeConditions({ up, down }, true);
    if (up.has("radiance_noslit") && down.has("radiance_noslit")
        && hasExtinction(down)) {
        result.setQuantity("radiance_noslit",
                           up.get("radiance_noslit") * transmittanceOf(down)
                             + down.get("radiance_noslit"),
                           up.unit("radiance_noslit"));
    } else if (up.has("radiance_noslit") || down.has("radiance_noslit")) {
        spdlog::warn("{}: radiance_noslit requires the radiance of both "
                     "slabs and the transmittance of {}, dropping it",
                     result.name,
                     label(down));
    }
    if (hasExtinction(up) && hasExtinction(down)) {
        result.setQuantity("transmittance_noslit",
                           transmittanceOf(up) * transmittanceOf(down),
                           "");
        result.setQuantity(
          "absorbance", absorbanceOf(up) + absorbanceOf(down), "");
    }
    if (result.nQuantities() == 0) {
        throw ValueError { "serial composition " + result.name
                           + " produces no quantity" };
    }
    return result;
}

auto mergeSlabs(const std::vector<Spectrum>& slabs,
                const ResampleRange range,
                const OutOfBounds out_of_bounds) -> Spectrum
{
    if (slabs.empty()) {
        throw ValueError { "no slabs to merge" };
    }
    std::vector<Spectrum> filtered {};
    filtered.reserve(slabs.size());
    for (const auto& slab : slabs) {
        filtered.push_back(composable(slab));
    }
    // Quantities common to all slabs
    std::vector<std::string> common { filtered.front().quantityNames() };
    for (const auto& slab : filtered) {
        std::erase_if(common, [&slab](const std::string& quantity) {
            if (!slab.has(quantity)) {
                spdlog::debug("{} is missing from slab {}, dropping it",
                              quantity,
                              label(slab));
                return true;
            }
            return false;
        });
    }
    if (common.empty()) {
        throw ValueError { "merged slabs have no quantity in common" };
    }
    const auto aligned { reconcile(filtered, range, out_of_bounds) };

    const Spectrum& first { aligned.front() };
    Spectrum result { first.axis(), first.axisUnit() };
    for (const auto& quantity : common) {
        const std::string& unit { first.unit(quantity) };
        const bool product { quantityInfo(quantity).merge_rule
                             == MergeRule::product };
        Eigen::ArrayXd values { first.get(quantity) };
        for (size_t i_slab { 1 }; i_slab < aligned.size(); ++i_slab) {
            Spectrum slab { aligned[i_slab] };
            slab.convertUnit(quantity, unit);
            if (product) {
                values *= slab.get(quantity);
            } else {
                values += slab.get(quantity);
            }
        }
        result.setQuantity(quantity, values, unit);
    }
    for (size_t i_slab {}; i_slab < slabs.size(); ++i_slab) {
        result.name += (i_slab == 0 ? "" : " | ") + label(slabs[i_slab]);
    }
    result.conditions = mergeConditions(aligned, false);
    return result;
}

auto serialSlabs(const std::vector<Spectrum>& slabs,
                 const ResampleRange range,
                 const OutOfBounds out_of_bounds) -> Spectrum
{
    if (slabs.empty()) {
        throw ValueError { "no slabs to compose" };
    }
    Spectrum result { composable(slabs.front()) };
    for (size_t i_slab { 1 }; i_slab < slabs.size(); ++i_slab) {
        result = serialPair(result, slabs[i_slab], range, out_of_bounds);
    }
    return result;
}

auto operator>(const Spectrum& upstream, const Spectrum& downstream)
  -> SerialComposition
{
    return SerialComposition { serialPair(
      upstream, downstream, ResampleRange::intersect, OutOfBounds::nan) };
}

auto operator>(const Spectrum& upstream, const SerialComposition& downstream)
  -> SerialComposition
{
    return upstream > downstream.spectrum();
}

[[noreturn]] static auto throwChained(const SerialComposition& upstream)
  -> void
{
    throw ArithmeticError {
        "chained serial composition " + upstream.spectrum().name
        + " > ... is ambiguous, use serialSlabs({ a, b, c }), "
          "Spectrum { a > b } > c or a > (b > c)"
    };
}

auto operator>(const SerialComposition& upstream, const Spectrum&)
  -> SerialComposition
{
    throwChained(upstream);
}

auto operator>(const SerialComposition& upstream, const SerialComposition&)
  -> SerialComposition
{
    throwChained(upstream);
}

auto operator|(const Spectrum& a, const Spectrum& b) -> Spectrum
{
    return mergeSlabs({ a, b });
}

} // namespace specalg
