// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "timer.h"

namespace specalg {

auto Timer::start() -> void
{
    wall_timestamp = std::chrono::steady_clock::now();
}

auto Timer::stop() -> void
{
    total_wall_time +=
      std::chrono::duration_cast<std::chrono::duration<double>>(
        std::chrono::steady_clock::now() - wall_timestamp)
        .count();
}

[[nodiscard]] auto Timer::time() const -> double
{
    return total_wall_time;
}

} // namespace specalg
