// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#pragma once

#include <Eigen/Dense>

// Boolean mask over an axis, e.g. the samples kept by a crop
using ArrayXb = Eigen::Array<bool, Eigen::Dynamic, 1>;
