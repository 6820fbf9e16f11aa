// Copyright 2020 Ulf Adams
// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "float_format.h"

#include <stdexcept>
#include <string>

using namespace realfloat;

static SpecialStrings MakeSpecialStrings(const std::string& zero)
{
    return {"NaN", "Infinity", "-Infinity", zero, "-" + zero};
}

static void CheckPrecision(int precision)
{
    if (precision < 0)
        throw std::invalid_argument("realfloat: precision must be non-negative, got " + std::to_string(precision));
}

FloatFormat realfloat::Fixed(int precision)
{
    CheckPrecision(precision);

    FloatFormat format;
    format.kind = FormatKind::fixed;
    format.precision = precision;
    format.specials = MakeSpecialStrings(precision == 0 ? "0" : "0." + std::string(static_cast<size_t>(precision), '0'));
    return format;
}

FloatFormat realfloat::FixedDefaultPrecision()
{
    FloatFormat format;
    format.kind = FormatKind::fixed;
    format.specials = MakeSpecialStrings("0.0");
    return format;
}

FloatFormat realfloat::Scientific()
{
    FloatFormat format;
    format.kind = FormatKind::scientific;
    format.specials = MakeSpecialStrings("0.0e0");
    return format;
}

FloatFormat realfloat::Scientific(int precision)
{
    CheckPrecision(precision);

    FloatFormat format;
    format.kind = FormatKind::scientific;
    format.precision = precision;
    format.specials = MakeSpecialStrings(precision == 0 ? "0e0" : "0." + std::string(static_cast<size_t>(precision), '0') + "e0");
    return format;
}

FloatFormat realfloat::impl::ScientificZeroPaddedExponent(int exponent_digits)
{
    FloatFormat format;
    format.kind = FormatKind::scientific;
    format.zero_pad_exponent = true;
    format.exponent_width = exponent_digits;
    format.specials = MakeSpecialStrings("0.0e" + std::string(static_cast<size_t>(exponent_digits), '0'));
    return format;
}

FloatFormat realfloat::ScientificExplicitExponentSign()
{
    FloatFormat format;
    format.kind = FormatKind::scientific;
    format.explicit_exponent_sign = true;
    format.specials = MakeSpecialStrings("0.0e+0");
    return format;
}

FloatFormat realfloat::Generic()
{
    return Generic(0, 7);
}

FloatFormat realfloat::Generic(int low, int high)
{
    if (low > high)
        throw std::invalid_argument("realfloat: invalid generic range [" + std::to_string(low) + ", " + std::to_string(high) + "]");

    FloatFormat format;
    format.kind = FormatKind::generic;
    format.low_threshold = low;
    format.high_threshold = high;
    format.specials = MakeSpecialStrings("0.0");
    return format;
}

FloatFormat realfloat::Shortest()
{
    FloatFormat format;
    format.kind = FormatKind::shortest;
    format.specials = {"NaN", "Inf", "-Inf", "0", "-0"};
    return format;
}
