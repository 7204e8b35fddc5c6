// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Each user defined configuration parameter is stored in an instance
// of the Setting class. It is a templated class suitable for storing
// the values of primitive types as well as non-primitives such as
// vectors and strings. For a primitive type, the value is stored in
// the "value" field. A non-primitive inherits from the type it holds,
// so that a Setting<std::vector<double>> can be used directly as a
// vector (size(), range-for, ...).
//
// The yaml_keys field is the chain of node names used to find the
// parameter in a YAML configuration file. For instance, if the
// configuration file contains a section
//
//   composition:
//     mode: serial
//
// then yaml_keys = { "composition", "mode" }. The last item in
// yaml_keys is the name of the parameter stored.
//
// For primitive types the conversion operator allows writing
//
//   if (settings.compare.verbose) {
//
// instead of settings.compare.verbose.value.

#pragma once

#include "constants.h"

#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace specalg {

// Meta information about a setting. The actual value is defined in a
// child class.
template <typename T>
class SettingBase
{
public:
    std::vector<std::string> yaml_keys {};
    const std::string info {};
    std::string type {};

    // The default constructor defines an empty (unused) setting
    SettingBase() = default;
    SettingBase(const bool is_list,
                const std::vector<std::string>& yaml_keys,
                const std::string& info)
      : yaml_keys { yaml_keys }, info { info }
    {
        // String representation of the value type. Lists get the
        // suffix "list".
        const std::string suffix { is_list ? " list" : "" };
        if constexpr (std::is_same_v<T, bool>) {
            type = "boolean" + suffix;
        } else if constexpr (std::is_same_v<T, int>) {
            type = "integer" + suffix;
        } else if constexpr (std::is_same_v<T, size_t>) {
            type = "unsigned integer" + suffix;
        } else if constexpr (std::is_same_v<T, double>) {
            type = "double (float64)" + suffix;
        } else if constexpr (std::is_same_v<T, std::string>) {
            type = "string" + suffix;
        } else if constexpr (std::is_enum_v<T>) {
            type = "string" + suffix;
        } else {
            throw std::domain_error {
                "type not supported by the Setting class"
            };
        }
    }
    // Convert a list of YAML keys into a string [a][b]...
    [[nodiscard]] auto keyToStr() const -> std::string
    {
        std::stringstream s {};
        for (const auto& key : yaml_keys) {
            s << '[' << key << ']';
        }
        return s.str();
    }
    ~SettingBase() = default;
};

// Setting class for primitive types
template <typename T>
class Setting : public SettingBase<T>
{
public:
    T value {};

    Setting() = default;
    Setting(const std::vector<std::string>& yaml_keys,
            const T value,
            const std::string& info)
      : SettingBase<T> { false, yaml_keys, info }, value { value }
    {}

    // Shortcuts that allow to bypass referencing value directly
    operator T() const { return value; }
    auto operator=(const T& value) -> Setting<T>&
    {
        this->value = value;
        return *this;
    }

    ~Setting() = default;
};

// Setting holding a list of values
template <typename T>
class Setting<std::vector<T>>
  : public SettingBase<T>
  , public std::vector<T>
{
public:
    Setting() = default;
    Setting(const std::vector<std::string>& yaml_keys,
            const std::vector<T> value,
            const std::string& info)
      : SettingBase<T> { true, yaml_keys, info }, std::vector<T> { value }
    {}
    // Assignment acts on the std::vector base of the instance
    auto operator=(const std::vector<T>& value) -> Setting<std::vector<T>>&
    {
        std::vector<T>* base { this };
        *base = value;
        return *this;
    }
};

// Setting holding a table, e.g. one row of samples per slab
template <typename T>
class Setting<std::vector<std::vector<T>>>
  : public SettingBase<T>
  , public std::vector<std::vector<T>>
{
public:
    Setting() = default;
    Setting(const std::vector<std::string>& yaml_keys,
            const std::vector<std::vector<T>> value,
            const std::string& info)
      : SettingBase<T> { true, yaml_keys, info }
      , std::vector<std::vector<T>> { value }
    {}
    auto operator=(const std::vector<std::vector<T>>& value)
      -> Setting<std::vector<std::vector<T>>>&
    {
        std::vector<std::vector<T>>* base { this };
        *base = value;
        return *this;
    }
};

// Setting for std::optional<T>. Optional means that no reasonable
// default value exists, e.g. a crop bound. Leaving it unset disables
// the corresponding feature.
//
// The base class is called with just T so the string representation
// of the type is still that of T.
template <typename T>
class Setting<std::optional<T>>
  : public SettingBase<T>
  , public std::optional<T>
{
public:
    Setting() = default;
    Setting(const std::vector<std::string>& yaml_keys, const std::string& info)
      : SettingBase<T> { false, yaml_keys, info }, std::optional<T> {}
    {}
    auto operator=(const std::optional<T>& value) -> Setting<std::optional<T>>&
    {
        std::optional<T>* base { this };
        *base = value;
        return *this;
    }
};

// Setting for strings
template <>
class Setting<std::string>
  : public SettingBase<std::string>
  , public std::string
{
public:
    Setting() = default;
    Setting(const std::vector<std::string>& yaml_keys,
            const std::string value,
            const std::string& info)
      : SettingBase<std::string> { false, yaml_keys, info }
      , std::string { value }
    {}
    auto operator=(const std::string& value) -> Setting<std::string>&
    {
        std::string* base { this };
        *base = value;
        return *this;
    }
};

} // namespace specalg
