// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "quantities.h"

#include <common/errors.h>

#include <map>
#include <string_view>

namespace specalg {

static auto registry() -> const std::map<std::string, QuantityInfo>&
{
    static const std::map<std::string, QuantityInfo> quantities {
        { "radiance_noslit",
          { "radiance_noslit",
            false,
            MergeRule::sum,
            SerialRule::radiance,
            0.0,
            "mW/cm2/sr/nm" } },
        { "transmittance_noslit",
          { "transmittance_noslit",
            false,
            MergeRule::product,
            SerialRule::transmittance,
            1.0,
            "" } },
        { "absorbance",
          { "absorbance",
            false,
            MergeRule::sum,
            SerialRule::absorbance,
            0.0,
            "" } },
        { "abscoeff",
          { "abscoeff",
            false,
            MergeRule::sum,
            SerialRule::dropped,
            0.0,
            "cm-1" } },
        { "emisscoeff",
          { "emisscoeff",
            false,
            MergeRule::sum,
            SerialRule::dropped,
            0.0,
            "mW/cm3/sr/nm" } },
        { "radiance",
          { "radiance",
            true,
            MergeRule::rejected,
            SerialRule::dropped,
            0.0,
            "mW/cm2/sr/nm" } },
        { "transmittance",
          { "transmittance",
            true,
            MergeRule::rejected,
            SerialRule::dropped,
            1.0,
            "" } },
    };
    return quantities;
}

auto isKnownQuantity(const std::string& name) -> bool
{
    return registry().contains(name);
}

auto quantityInfo(const std::string& name) -> const QuantityInfo&
{
    const auto it { registry().find(name) };
    if (it == registry().end()) {
        throw ValueError { "unknown spectral quantity: " + name };
    }
    return it->second;
}

auto isConvolved(const std::string& name) -> bool
{
    return isKnownQuantity(name) && quantityInfo(name).convolved;
}

auto transparentValue(const std::string& name) -> double
{
    return isKnownQuantity(name) ? quantityInfo(name).transparent_value : 0.0;
}

auto defaultUnit(const std::string& name) -> std::string
{
    return isKnownQuantity(name) ? quantityInfo(name).default_unit : "";
}

auto convolvedCounterpart(const std::string& name)
  -> std::optional<std::string>
{
    constexpr std::string_view suffix { "_noslit" };
    if (!name.ends_with(suffix)) {
        return std::nullopt;
    }
    const std::string convolved { name.substr(0, name.size() - suffix.size()) };
    if (!isKnownQuantity(convolved)) {
        return std::nullopt;
    }
    return convolved;
}

auto knownQuantities() -> std::vector<std::string>
{
    std::vector<std::string> names {};
    for (const auto& [name, info] : registry()) {
        names.push_back(name);
    }
    return names;
}

} // namespace specalg
