// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Functions for formatting the output to stdout and for small string
// manipulations needed when reporting on spectra and units.

#pragma once

#include "constants.h"

#include <spdlog/pattern_formatter.h>
#include <string>
#include <vector>

namespace specalg {

// Define a new spdlog formatter flag. The primary purpose is to show
// labels such as [warning] for warnings but no label for regular
// (info) messages.
class specalg_formatter_flag : public spdlog::custom_flag_formatter
{
public:
    auto format(const spdlog::details::log_msg& log_msg,
                const std::tm&,
                spdlog::memory_buf_t& dest) -> void override;
    auto clone() const -> std::unique_ptr<custom_flag_formatter> override;
};

// Set up two loggers: one with a verbose pattern (mostly used
// throughout the code) and a plain one (clean pattern, i.e. prints
// just the message text).
auto initLogging() -> void;

// Print the name of a processing section. For example, the slab
// composition would start with
//
// ####################
// # Slab composition #
// ####################
auto printHeading(const std::string& heading,
                  const bool incl_empty_line = true) -> void;

// Print information about the host system and how the executable or
// library was built.
auto printSystemInfo(const std::string& project_version,
                     const std::string& git_commit,
                     const std::string& cmake_host_system,
                     const std::string& executable,
                     const std::string& compiler,
                     const std::string& compiler_flags,
                     const std::string& libraries) -> void;

auto splitString(const std::string& list,
                 const char delimiter) -> std::vector<std::string>;

// Convert the policy enums to strings suitable for displaying in
// output. These are the same strings as used in the configuration.
[[nodiscard]] auto toString(const Composition composition) -> std::string;
[[nodiscard]] auto toString(const ResampleRange range) -> std::string;
[[nodiscard]] auto toString(const OutOfBounds policy) -> std::string;
[[nodiscard]] auto toString(const Interpolation interpolation) -> std::string;
[[nodiscard]] auto toString(const CompareMode mode) -> std::string;

} // namespace specalg
