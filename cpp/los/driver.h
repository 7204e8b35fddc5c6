// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#pragma once

namespace specalg {

class SettingsLOS;
class Spectrum;

// Build the slabs defined in the configuration, compose them along
// the line of sight and optionally crop and convolve the result.
auto driver(const SettingsLOS& settings) -> Spectrum;

} // namespace specalg
