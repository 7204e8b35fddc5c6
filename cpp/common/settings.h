// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Defines an abstract class for storing all user defined
// configuration parameters. It is initialized using a YAML
// configuration file. The parameter values are defined in a derived
// class. Each configuration parameter is a Setting instance for which
// we define its YAML path, default value (omitted for
// Setting<std::optional<T>>), and an info string.
//
// class SettingsDerived : public Settings
// {
// public:
//     SettingsDerived(const std::string& yaml_file) : Settings { yaml_file } {}
//     struct
//     {
//         Setting<double> rtol { { "compare", "rtol" }, 1e-5, "description" };
//     } compare;
//     auto scanKeys() -> void override
//     {
//         scan(compare.rtol);
//     }
//     auto checkParameters() -> void override {}
// };
//
// Any newline symbols in the Setting info string are recognized by
// YAML::Emitter and are good for readability when printing the
// configuration.

#pragma once

#include "yaml.h"

#include <algorithm>

namespace specalg {

class Settings
{
private:
    // Whether to load or dump (for output) a YAML node in the scan function
    bool do_dump { false };
    // Check for unrecognized keywords
    auto unrecognizedKeywordCheck() const -> void;
    // Location of the current map, which equals the YAML keys of a
    // setting minus the last key. If it changes then a YAML::BeginMap
    // or YAML::EndMap must be inserted to YAML::Emitter.
    std::vector<std::string> cur_map_loc {};
    // An Emitter instance for converting the configuration into a string
    Emitter yaml_emitter {};
    // Feed a Setting instance into YAML::Emitter, inserting
    // YAML::BeginMap and YAML::EndMap where necessary.
    template <typename T>
    auto dump(Emitter& emitter, const Setting<T>& setting) -> void
    {
        const auto& keys { setting.yaml_keys };
        // Leaving one or more maps
        while (cur_map_loc.size() + 1 > keys.size()) {
            emitter << YAML::EndMap;
            cur_map_loc.pop_back();
        }
        for (int i { static_cast<int>(
               std::min(cur_map_loc.size(), keys.size() - 1) - 1) };
             i >= 0;
             --i) {
            if (cur_map_loc.at(i) != keys.at(i)) {
                emitter << YAML::EndMap;
                cur_map_loc.pop_back();
            }
        }
        // Entering one or more maps
        for (int i { static_cast<int>(cur_map_loc.size()) };
             i < static_cast<int>(keys.size() - 1);
             ++i) {
            cur_map_loc.push_back(keys.at(i));
            emitter << YAML::Key << cur_map_loc.back() << YAML::Value
                    << YAML::BeginMap;
        }
        emitter << setting;
    }

protected:
    // Full configuration as read from file
    YAML::Node config {};
    // Full configuration with default values
    YAML::Node default_config {};
    // Every key the scan function comes across, for recognizing
    // unknown keys later.
    std::vector<std::vector<std::string>> all_valid_keys {};
    // Search for invalid values of configuration parameters and
    // inconsistencies between parameters. Editing parameter values is
    // allowed.
    virtual auto checkParameters() -> void = 0;

public:
    Settings() = default;
    Settings(const std::string& yaml_file)
      : config { YAML::LoadFile(yaml_file) }
    {}
    Settings(const Settings& /* settings */) {};
    // Read input from a YAML configuration file and check parameters
    // for correctness.
    auto init() -> void;
    // Parse configuration given as a string instead of a file
    auto initFromString(const std::string& yaml) -> void;
    // The main function for processing YAML input. This is called in init.
    virtual auto scanKeys() -> void = 0;
    // Find a YAML node and either dump into a string or convert it
    // into a C++ data structure
    template <typename T>
    auto scan(Setting<T>& item)
    {
        if (do_dump) {
            dump(yaml_emitter, item);
            return;
        }
        if (item.yaml_keys.empty()) {
            return;
        }
        all_valid_keys.push_back(item.yaml_keys);
        YAML::Node node { YAML::Clone(config) };
        // If not found, leave the default value unmodified
        for (const auto& key : item.yaml_keys) {
            node = node[key];
            if (!node) {
                return;
            }
        }
        try {
            item = node.as<T>();
        } catch (const YAML::BadConversion&) {
            // Let the user know exactly which key failed to convert
            std::string str_value {};
            try {
                str_value = node.as<std::string>();
            } catch (const YAML::BadConversion&) {
                str_value = "(not a scalar)";
            }
            throw std::runtime_error { "cannot set " + item.keyToStr()
                                       + ", which is of type " + item.type
                                       + ", to the value " + str_value };
        }
    }
    // Convert current configuration into a string. If only the
    // default constructor was called, print the default
    // configuration.
    auto c_str(const bool verbose = true) -> const char*;
    // Return a clone of the configuration. If a configuration
    // variable was not set by the user, the default value is shown
    // instead.
    auto getConfig() const -> std::string;
    virtual ~Settings() = default;
};

} // namespace specalg
