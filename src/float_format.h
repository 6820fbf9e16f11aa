// Copyright 2020 Ulf Adams
// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "ieee.h"
#include "to_decimal.h"

#include <string>

namespace realfloat {

//==================================================================================================
// FloatFormat
//==================================================================================================

enum class FormatKind {
    fixed,      // ddd.ddd
    scientific, // d.ddde[+-]nn
    generic,    // fixed if the exponent is within the thresholds, scientific otherwise
    shortest,   // fewest characters of fixed and scientific
};

// Literal strings printed instead of the digits for values which have none.
struct SpecialStrings
{
    std::string nan;
    std::string positive_infinity;
    std::string negative_infinity;
    std::string positive_zero;
    std::string negative_zero;
};

// Precision value meaning "as many digits as the shortest round-trip representation has".
constexpr int ShortestPrecision = -1;

// Describes how a float is rendered. Create with one of the builders below; all fields are plain
// data and may be modified afterwards.
struct FloatFormat
{
    FormatKind kind = FormatKind::generic;
    // Number of digits after the decimal point, or ShortestPrecision.
    // Only used by `fixed` and `scientific`.
    int precision = ShortestPrecision;
    char exponent_char = 'e';
    // Pad the exponent with zeros to exponent_width digits.
    bool zero_pad_exponent = false;
    // At most 3. ScientificZeroPaddedExponent<Float> sets the number of digits of the largest
    // decimal exponent of Float (2 for float, 3 for double). 0 selects that width for the type
    // being rendered.
    int exponent_width = 0;
    // Write '+' for non-negative exponents.
    bool explicit_exponent_sign = false;
    // `generic` uses fixed notation iff low_threshold <= e <= high_threshold, where e is the
    // position of the decimal point relative to the first significant digit
    // (i.e. value = 0.d1d2d3... * 10^e).
    int low_threshold = 0;
    int high_threshold = 7;
    IntervalBounds bounds = IntervalBounds::exclusive;
    SpecialStrings specials;
};

// Fixed point notation with exactly `precision` digits after the decimal point.
// Rounds half to even on the decimal digits of the shortest representation.
// Throws std::invalid_argument if precision < 0.
FloatFormat Fixed(int precision);

// Fixed point notation with the digits of the shortest representation.
FloatFormat FixedDefaultPrecision();

// Scientific notation with the digits of the shortest representation.
FloatFormat Scientific();

// Scientific notation with exactly `precision` digits after the decimal point.
// Throws std::invalid_argument if precision < 0.
FloatFormat Scientific(int precision);

// Scientific notation with the exponent padded to a fixed width (2 for float, 3 for double).
template <typename Float>
FloatFormat ScientificZeroPaddedExponent();

// Scientific notation, writing the exponent sign even if it is positive.
FloatFormat ScientificExplicitExponentSign();

// Fixed point notation for 0.1 <= |x| < 10^7, scientific notation otherwise.
FloatFormat Generic();

// Fixed point notation iff the decimal exponent lies within [low, high].
// Throws std::invalid_argument if low > high.
FloatFormat Generic(int low, int high);

// The shorter one of fixed point and scientific notation.
// Integers are written without a fractional part.
FloatFormat Shortest();

namespace impl {
FloatFormat ScientificZeroPaddedExponent(int exponent_digits);
} // namespace impl

template <>
inline FloatFormat ScientificZeroPaddedExponent<float>()
{
    return impl::ScientificZeroPaddedExponent(IEEE<float>::ExponentDigits10);
}

template <>
inline FloatFormat ScientificZeroPaddedExponent<double>()
{
    return impl::ScientificZeroPaddedExponent(IEEE<double>::ExponentDigits10);
}

//==================================================================================================
// Special values
//==================================================================================================

// Returns the literal to print instead of the digits of the given value, or null if the value
// is finite and non-zero.
template <typename Float>
inline const std::string* FindSpecialString(const SpecialStrings& specials, const Decomposed<Float>& decomposed)
{
    switch (decomposed.category)
    {
    case FloatCategory::nan:
        return &specials.nan;
    case FloatCategory::infinity:
        return decomposed.sign ? &specials.negative_infinity : &specials.positive_infinity;
    case FloatCategory::zero:
        return decomposed.sign ? &specials.negative_zero : &specials.positive_zero;
    case FloatCategory::finite:
        break;
    }

    return nullptr;
}

} // namespace realfloat
