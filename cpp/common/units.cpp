// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "units.h"

#include "errors.h"

#include <array>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <vector>

namespace specalg {

// Exponents of the base dimensions: length, mass, time, temperature,
// solid angle, count.
using Dimension = std::array<int, 6>;

constexpr Dimension dimensionless {};
constexpr Dimension length { 1, 0, 0, 0, 0, 0 };
constexpr Dimension inverse_length { -1, 0, 0, 0, 0, 0 };

struct SymbolInfo
{
    // Value of one unit in SI (kg for mass)
    double scale {};
    Dimension dimension {};
};

static auto baseSymbols() -> const std::map<std::string, SymbolInfo>&
{
    static const std::map<std::string, SymbolInfo> symbols {
        { "m", { 1.0, { 1, 0, 0, 0, 0, 0 } } },
        { "g", { 1e-3, { 0, 1, 0, 0, 0, 0 } } },
        { "s", { 1.0, { 0, 0, 1, 0, 0, 0 } } },
        { "K", { 1.0, { 0, 0, 0, 1, 0, 0 } } },
        { "sr", { 1.0, { 0, 0, 0, 0, 1, 0 } } },
        { "count", { 1.0, { 0, 0, 0, 0, 0, 1 } } },
        { "photon", { 1.0, { 0, 0, 0, 0, 0, 1 } } },
        { "molecule", { 1.0, { 0, 0, 0, 0, 0, 1 } } },
        { "W", { 1.0, { 2, 1, -3, 0, 0, 0 } } },
        { "J", { 1.0, { 2, 1, -2, 0, 0, 0 } } },
        { "erg", { 1e-7, { 2, 1, -2, 0, 0, 0 } } },
        { "Hz", { 1.0, { 0, 0, -1, 0, 0, 0 } } },
    };
    return symbols;
}

static auto prefixes() -> const std::map<std::string, double>&
{
    static const std::map<std::string, double> prefix_table {
        { "P", 1e15 },  { "T", 1e12 },  { "G", 1e9 },  { "M", 1e6 },
        { "k", 1e3 },   { "h", 1e2 },   { "da", 1e1 }, { "d", 1e-1 },
        { "c", 1e-2 },  { "m", 1e-3 },  { "u", 1e-6 }, { "n", 1e-9 },
        { "p", 1e-12 }, { "f", 1e-15 },
        // Micro sign and Greek small letter mu (UTF-8)
        { "\xC2\xB5", 1e-6 },
        { "\xCE\xBC", 1e-6 },
    };
    return prefix_table;
}

static auto lookupSymbol(const std::string& symbol) -> SymbolInfo
{
    const auto& symbols { baseSymbols() };
    if (const auto it { symbols.find(symbol) }; it != symbols.end()) {
        return it->second;
    }
    for (const auto& [prefix, factor] : prefixes()) {
        if (symbol.size() > prefix.size() && symbol.starts_with(prefix)) {
            const auto it { symbols.find(symbol.substr(prefix.size())) };
            if (it != symbols.end()) {
                return { factor * it->second.scale, it->second.dimension };
            }
        }
    }
    throw UnitError { "unknown unit symbol: " + symbol };
}

// Add sign * b to a, dropping symbols whose power becomes zero
static auto combine(UnitPowers& a, const UnitPowers& b, const int sign) -> void
{
    for (const auto& [symbol, power] : b) {
        const int total { a[symbol] + sign * power };
        if (total == 0) {
            a.erase(symbol);
        } else {
            a[symbol] = total;
        }
    }
}

// Recursive descent parser for the grammar described in units.h
class UnitParser
{
private:
    const std::string& text;
    size_t pos {};

    [[noreturn]] auto fail(const std::string& msg) const -> void
    {
        throw UnitError { "cannot parse unit '" + text + "': " + msg };
    }
    [[nodiscard]] auto atEnd() const -> bool { return pos >= text.size(); }
    [[nodiscard]] auto peek() const -> char
    {
        return atEnd() ? '\0' : text[pos];
    }
    static auto isSymbolChar(const char c) -> bool
    {
        const auto uc { static_cast<unsigned char>(c) };
        return std::isalpha(uc) != 0 || uc >= 0x80;
    }
    static auto isDigit(const char c) -> bool
    {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    }
    auto skipSpaces() -> bool
    {
        const size_t start { pos };
        while (!atEnd() && text[pos] == ' ') {
            ++pos;
        }
        return pos != start;
    }

    // Optional exponent following a symbol or a parenthesized group
    auto exponent() -> int
    {
        bool marker { false };
        if (text.compare(pos, 2, "**") == 0) {
            pos += 2;
            marker = true;
        } else if (peek() == '^') {
            ++pos;
            marker = true;
        }
        const size_t sign_pos { pos };
        int sign { 1 };
        if (peek() == '-' || peek() == '+') {
            sign = peek() == '-' ? -1 : 1;
            ++pos;
        }
        if (!isDigit(peek())) {
            if (marker || pos != sign_pos) {
                fail("malformed exponent");
            }
            return 1;
        }
        const size_t digits_start { pos };
        while (isDigit(peek())) {
            ++pos;
        }
        return sign * std::stoi(text.substr(digits_start, pos - digits_start));
    }

    auto factor() -> UnitPowers
    {
        skipSpaces();
        if (atEnd()) {
            fail("unexpected end of string");
        }
        UnitPowers result {};
        if (peek() == '(') {
            ++pos;
            result = quotient();
            skipSpaces();
            if (peek() != ')') {
                fail("missing closing parenthesis");
            }
            ++pos;
            const int power { exponent() };
            for (auto& [symbol, p] : result) {
                p *= power;
            }
        } else if (isDigit(peek())) {
            const size_t start { pos };
            while (isDigit(peek())) {
                ++pos;
            }
            if (text.substr(start, pos - start) != "1") {
                fail("numerical factors are not allowed");
            }
        } else if (isSymbolChar(peek())) {
            const size_t start { pos };
            while (!atEnd() && isSymbolChar(text[pos])) {
                ++pos;
            }
            const std::string symbol { text.substr(start, pos - start) };
            static_cast<void>(lookupSymbol(symbol));
            combine(result, { { symbol, exponent() } }, 1);
        } else {
            fail(std::string { "unexpected character '" } + peek() + "'");
        }
        return result;
    }

    // Juxtaposition, '*' and '.'
    auto product() -> UnitPowers
    {
        UnitPowers result { factor() };
        while (true) {
            const bool had_space { skipSpaces() };
            const char c { peek() };
            if (c == '*' || c == '.') {
                ++pos;
                combine(result, factor(), 1);
            } else if (had_space
                       && (isSymbolChar(c) || isDigit(c) || c == '(')) {
                combine(result, factor(), 1);
            } else {
                return result;
            }
        }
    }

    auto quotient() -> UnitPowers
    {
        UnitPowers result { product() };
        skipSpaces();
        while (peek() == '/') {
            ++pos;
            combine(result, product(), -1);
            skipSpaces();
        }
        return result;
    }

public:
    explicit UnitParser(const std::string& text) : text { text } {}
    auto parse() -> UnitPowers
    {
        skipSpaces();
        if (atEnd()) {
            return {};
        }
        UnitPowers result { quotient() };
        skipSpaces();
        if (!atEnd()) {
            fail(std::string { "unexpected character '" } + peek() + "'");
        }
        return result;
    }
};

struct ResolvedUnit
{
    double scale { 1.0 };
    Dimension dimension {};
};

static auto resolve(const UnitPowers& powers) -> ResolvedUnit
{
    ResolvedUnit result {};
    for (const auto& [symbol, power] : powers) {
        const SymbolInfo info { lookupSymbol(symbol) };
        result.scale *= std::pow(info.scale, power);
        for (int i {}; i < static_cast<int>(result.dimension.size()); ++i) {
            result.dimension.at(i) += power * info.dimension.at(i);
        }
    }
    return result;
}

static auto resolve(const std::string& unit) -> ResolvedUnit
{
    return resolve(parseUnit(unit));
}

auto parseUnit(const std::string& unit) -> UnitPowers
{
    return UnitParser { unit }.parse();
}

auto formatUnit(const UnitPowers& powers) -> std::string
{
    // std::map keeps the symbols in alphabetical order
    std::vector<std::string> numerator {};
    std::vector<std::string> denominator {};
    for (const auto& [symbol, power] : powers) {
        const int abs_power { std::abs(power) };
        std::string term { symbol };
        if (abs_power != 1) {
            term += std::to_string(abs_power);
        }
        if (power > 0) {
            numerator.push_back(term);
        } else {
            denominator.push_back(term);
        }
    }
    const auto join { [](const std::vector<std::string>& terms) {
        std::string joined {};
        for (const auto& term : terms) {
            joined += (joined.empty() ? "" : " ") + term;
        }
        return joined;
    } };
    if (denominator.empty()) {
        return join(numerator);
    }
    const std::string num_str { numerator.empty() ? "1" : join(numerator) };
    if (denominator.size() == 1) {
        return num_str + '/' + denominator.front();
    }
    return num_str + "/(" + join(denominator) + ')';
}

auto simplify(const std::string& unit) -> std::string
{
    return formatUnit(parseUnit(unit));
}

auto areCompatible(const std::string& unit_a,
                   const std::string& unit_b) -> bool
{
    return resolve(unit_a).dimension == resolve(unit_b).dimension;
}

auto isDimensionless(const std::string& unit) -> bool
{
    return resolve(unit).dimension == dimensionless;
}

auto conversionFactor(const std::string& from_unit,
                      const std::string& to_unit) -> double
{
    if (from_unit == to_unit) {
        return 1.0;
    }
    const ResolvedUnit from { resolve(from_unit) };
    const ResolvedUnit to { resolve(to_unit) };
    if (from.dimension != to.dimension) {
        throw UnitError { "cannot convert '" + from_unit + "' to '" + to_unit
                          + "': incompatible dimensions" };
    }
    return from.scale / to.scale;
}

auto convert(const double value,
             const std::string& from_unit,
             const std::string& to_unit) -> double
{
    return value * conversionFactor(from_unit, to_unit);
}

auto convert(const Eigen::ArrayXd& values,
             const std::string& from_unit,
             const std::string& to_unit) -> Eigen::ArrayXd
{
    if (from_unit == to_unit) {
        return values;
    }
    return values * conversionFactor(from_unit, to_unit);
}

auto axisKind(const std::string& unit) -> AxisKind
{
    const Dimension dimension { resolve(unit).dimension };
    if (dimension == length) {
        return AxisKind::wavelength;
    }
    if (dimension == inverse_length) {
        return AxisKind::wavenumber;
    }
    throw UnitError { "'" + unit
                      + "' is neither a wavelength nor a wavenumber unit" };
}

auto convertAxis(const Eigen::ArrayXd& values,
                 const std::string& from_unit,
                 const std::string& to_unit) -> Eigen::ArrayXd
{
    const AxisKind from_kind { axisKind(from_unit) };
    const AxisKind to_kind { axisKind(to_unit) };
    if (from_unit == to_unit) {
        return values;
    }
    const double from_scale { resolve(from_unit).scale };
    const double to_scale { resolve(to_unit).scale };
    if (from_kind == to_kind) {
        return values * (from_scale / to_scale);
    }
    // Reciprocal in SI and then scaled into the target unit
    return 1.0 / (values * (from_scale * to_scale));
}

auto convertAxis(const double value,
                 const std::string& from_unit,
                 const std::string& to_unit) -> double
{
    return convertAxis(Eigen::ArrayXd::Constant(1, value), from_unit, to_unit)(
      0);
}

auto multiplyUnits(const std::string& unit_a,
                   const std::string& unit_b) -> UnitProduct
{
    UnitPowers powers { parseUnit(unit_a) };
    combine(powers, parseUnit(unit_b), 1);
    const ResolvedUnit resolved { resolve(powers) };
    if (!powers.empty() && resolved.dimension == dimensionless) {
        return { "", resolved.scale };
    }
    return { formatUnit(powers), 1.0 };
}

auto divideUnits(const std::string& unit_a,
                 const std::string& unit_b) -> UnitProduct
{
    UnitPowers powers { parseUnit(unit_a) };
    combine(powers, parseUnit(unit_b), -1);
    const ResolvedUnit resolved { resolve(powers) };
    if (!powers.empty() && resolved.dimension == dimensionless) {
        return { "", resolved.scale };
    }
    return { formatUnit(powers), 1.0 };
}

} // namespace specalg
