// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "driver.h"
#include "settings_los.h"

#include <iostream>
#include <spectrum/spectrum.h>

auto main(int argc, char* argv[]) -> int
{
    std::cout.precision(16);
    if (argc == 1) {
        // When called without an argument print the default
        // configuration.
        std::cout << "%YAML 1.2\n---\n"
                  << specalg::SettingsLOS {}.c_str() << '\n';
    } else {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        specalg::SettingsLOS settings { argv[1] };
        settings.init();
        specalg::driver(settings);
    }
    return 0;
}
