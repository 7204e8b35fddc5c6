// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Wall clock timer. Repeated start/stop pairs accumulate.

#pragma once

#include <chrono>

namespace specalg {

class Timer
{
private:
    std::chrono::time_point<std::chrono::steady_clock> wall_timestamp;
    double total_wall_time {};

public:
    Timer() = default;
    auto start() -> void;
    auto stop() -> void;
    // Return total wall time in seconds
    [[nodiscard]] auto time() const -> double;
};

} // namespace specalg
