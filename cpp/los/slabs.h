// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Composition of slabs along a line of sight. A slab is a spectrum of
// a homogeneous segment of gas, characterized by its unconvolved
// radiance and transmittance (or absorbance).
//
// Parallel composition (mergeSlabs, a | b) models slabs observed side
// by side. Their quantities add (transmittances multiply), so the
// result does not depend on the order of the slabs.
//
// Serial composition (serialSlabs, a > b) models radiation leaving
// slab a and then crossing slab b on its way to the observer:
//
//   I = I_a T_b + I_b,   T = T_a T_b,   A = A_a + A_b
//
// The order of the slabs matters. The binary operator returns a
// SerialComposition which converts to Spectrum. Chaining it as
// a > b > c throws ArithmeticError because it silently depends on the
// evaluation order of the comparison operators. Write one of
//
//   serialSlabs({ a, b, c })
//   Spectrum { a > b } > c
//   a > (b > c)
//
// instead. Slit-convolved quantities cannot be composed and are
// dropped with a warning. Quantities unknown to the registry
// (quantities.h) are rejected with ValueError.

#pragma once

#include <spectrum/spectrum.h>

namespace specalg {

// Result of a single serial composition a > b
class SerialComposition
{
private:
    Spectrum result;

public:
    explicit SerialComposition(Spectrum result) : result { std::move(result) }
    {}
    [[nodiscard]] auto spectrum() const -> const Spectrum& { return result; }
    operator Spectrum() const { return result; }
};

// Parallel composition of any number of slabs. The output holds the
// unconvolved quantities common to all slabs, on their common axis
// (in the axis unit of the first slab). out_of_bounds is applied
// where a slab does not cover the common axis, e.g. transparent for
// slabs that do not emit or absorb outside their own range.
[[nodiscard]] auto mergeSlabs(
  const std::vector<Spectrum>& slabs,
  const ResampleRange range = ResampleRange::intersect,
  const OutOfBounds out_of_bounds = OutOfBounds::nan) -> Spectrum;

// Serial composition of slabs ordered from the farthest to the one
// closest to the observer. Equivalent to composing them pairwise from
// left to right. path_length conditions are summed.
[[nodiscard]] auto serialSlabs(
  const std::vector<Spectrum>& slabs,
  const ResampleRange range = ResampleRange::intersect,
  const OutOfBounds out_of_bounds = OutOfBounds::nan) -> Spectrum;

[[nodiscard]] auto operator>(const Spectrum& upstream,
                             const Spectrum& downstream) -> SerialComposition;
[[nodiscard]] auto operator>(const Spectrum& upstream,
                             const SerialComposition& downstream)
  -> SerialComposition;
// Both throw ArithmeticError
auto operator>(const SerialComposition& upstream,
               const Spectrum& downstream) -> SerialComposition;
auto operator>(const SerialComposition& upstream,
               const SerialComposition& downstream) -> SerialComposition;

// Parallel composition of two slabs
[[nodiscard]] auto operator|(const Spectrum& a, const Spectrum& b) -> Spectrum;

} // namespace specalg
