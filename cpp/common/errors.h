// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Exceptions thrown by the spectrum algebra. All of them denote a
// violated precondition detected at the call site. None is transient
// and none is retried internally.

#pragma once

#include <stdexcept>
#include <string>

namespace specalg {

// Incompatible or unconvertible units (dimension mismatch) or a unit
// string that cannot be parsed.
class UnitError : public std::invalid_argument
{
public:
    explicit UnitError(const std::string& msg) : std::invalid_argument { msg }
    {}
};

// Crop or resample produced an empty or out-of-bounds axis, or the
// intersection of two axes is empty.
class RangeError : public std::out_of_range
{
public:
    explicit RangeError(const std::string& msg) : std::out_of_range { msg } {}
};

// An operation that requires a single quantity was invoked on a
// spectrum holding several without naming one, or a named quantity
// does not exist.
class KeyError : public std::out_of_range
{
public:
    explicit KeyError(const std::string& msg) : std::out_of_range { msg } {}
};

// Serial composition chained as a > b > c instead of being
// parenthesized or written with serialSlabs.
class ArithmeticError : public std::logic_error
{
public:
    explicit ArithmeticError(const std::string& msg) : std::logic_error { msg }
    {}
};

// Invalid operand combination, e.g. merging slit-convolved quantities
class ValueError : public std::invalid_argument
{
public:
    explicit ValueError(const std::string& msg)
      : std::invalid_argument { msg }
    {}
};

} // namespace specalg
