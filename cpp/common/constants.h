// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#pragma once

namespace specalg {

namespace tol {

// Default relative tolerance when comparing two spectra
constexpr double compare_rtol { 1e-5 };
// Two axis samples closer than this (relative to the axis span) are
// considered the same point when building a common axis.
constexpr double axis_merge { 1e-12 };
// Relative slack allowed on crop and interpolation range boundaries
constexpr double boundary { 1e-12 };

} // namespace tol

// Unit-kind of a spectral axis. Wavelength and wavenumber are
// reciprocal and run in opposite directions for the same spectrum.
enum class AxisKind
{
    wavelength,
    wavenumber,
};

// What to do when a target axis sample lies outside the range of the
// spectrum being resampled.
enum class OutOfBounds
{
    nan,         // Fill with not-a-number
    clamp,       // Repeat the edge value
    transparent, // Fill with the quantity's neutral value (0 or 1)
    error,       // Throw RangeError
};

// How to construct the common axis of two or more spectra
enum class ResampleRange
{
    never,     // Axes must already be identical
    intersect, // Union of samples restricted to the overlapping range
    full,      // Union of all samples
};

enum class Interpolation
{
    linear,
    cubic, // Natural cubic spline
};

// Aggregation rule of the comparison engine
enum class CompareMode
{
    pointwise, // |a - b| <= atol + rtol |b| at every sample
    integral,  // |int(a) - int(b)| <= rtol |int(b)|
};

// Line-of-sight composition
enum class Composition
{
    serial,
    parallel,
};

} // namespace specalg
