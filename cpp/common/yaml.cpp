// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "yaml.h"

#include "io.h"

#include <algorithm>
#include <map>

// Mapping between the configuration strings and the policy enums
const std::map<std::string, specalg::Composition> composition_to_enum {
    { "serial", specalg::Composition::serial },
    { "parallel", specalg::Composition::parallel },
};

const std::map<std::string, specalg::ResampleRange> resample_to_enum {
    { "never", specalg::ResampleRange::never },
    { "intersect", specalg::ResampleRange::intersect },
    { "full", specalg::ResampleRange::full },
};

const std::map<std::string, specalg::OutOfBounds> out_of_bounds_to_enum {
    { "nan", specalg::OutOfBounds::nan },
    { "clamp", specalg::OutOfBounds::clamp },
    { "transparent", specalg::OutOfBounds::transparent },
    { "error", specalg::OutOfBounds::error },
};

const std::map<std::string, specalg::Interpolation> interpolation_to_enum {
    { "linear", specalg::Interpolation::linear },
    { "cubic", specalg::Interpolation::cubic },
};

const std::map<std::string, specalg::CompareMode> compare_mode_to_enum {
    { "pointwise", specalg::CompareMode::pointwise },
    { "integral", specalg::CompareMode::integral },
};

template <typename T>
static auto decodeEnum(const YAML::Node& node,
                       const std::map<std::string, T>& table,
                       const std::string& what) -> T
{
    try {
        return table.at(node.as<std::string>());
    } catch (const std::out_of_range&) {
        throw std::invalid_argument { "unknown " + what + ": "
                                      + node.as<std::string>() };
    }
}

template <typename T>
static auto enumToString(const std::map<std::string, T>& table,
                         const T value) -> std::string
{
    const auto it { std::ranges::find_if(
      table, [value](const auto& item) { return item.second == value; }) };
    return it->first;
}

namespace YAML {

auto convert<specalg::Composition>::decode(const Node& node,
                                           specalg::Composition& rhs) -> bool
{
    rhs = decodeEnum(node, composition_to_enum, "composition mode");
    return true;
}

auto convert<specalg::ResampleRange>::decode(const Node& node,
                                             specalg::ResampleRange& rhs)
  -> bool
{
    rhs = decodeEnum(node, resample_to_enum, "resample range");
    return true;
}

auto convert<specalg::OutOfBounds>::decode(const Node& node,
                                           specalg::OutOfBounds& rhs) -> bool
{
    rhs = decodeEnum(node, out_of_bounds_to_enum, "out-of-bounds policy");
    return true;
}

auto convert<specalg::Interpolation>::decode(const Node& node,
                                             specalg::Interpolation& rhs)
  -> bool
{
    rhs = decodeEnum(node, interpolation_to_enum, "interpolation");
    return true;
}

auto convert<specalg::CompareMode>::decode(const Node& node,
                                           specalg::CompareMode& rhs) -> bool
{
    rhs = decodeEnum(node, compare_mode_to_enum, "comparison mode");
    return true;
}

} // namespace YAML

namespace specalg {

auto toString(const Composition composition) -> std::string
{
    return enumToString(composition_to_enum, composition);
}

auto toString(const ResampleRange range) -> std::string
{
    return enumToString(resample_to_enum, range);
}

auto toString(const OutOfBounds policy) -> std::string
{
    return enumToString(out_of_bounds_to_enum, policy);
}

auto toString(const Interpolation interpolation) -> std::string
{
    return enumToString(interpolation_to_enum, interpolation);
}

auto toString(const CompareMode mode) -> std::string
{
    return enumToString(compare_mode_to_enum, mode);
}

auto operator<<(YAML::Emitter& out,
                const Composition composition) -> YAML::Emitter&
{
    out << toString(composition);
    return out;
}

auto operator<<(YAML::Emitter& out,
                const ResampleRange range) -> YAML::Emitter&
{
    out << toString(range);
    return out;
}

auto operator<<(YAML::Emitter& out, const OutOfBounds policy) -> YAML::Emitter&
{
    out << toString(policy);
    return out;
}

auto operator<<(YAML::Emitter& out,
                const Interpolation interpolation) -> YAML::Emitter&
{
    out << toString(interpolation);
    return out;
}

auto operator<<(YAML::Emitter& out, const CompareMode mode) -> YAML::Emitter&
{
    out << toString(mode);
    return out;
}

} // namespace specalg
