// Copyright 2020 Ulf Adams
// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "float_format.h"
#include "ieee.h"
#include "to_decimal.h"

#include <string>

namespace realfloat {

// Appends the textual representation of value to out.
//
// Finite non-zero values are printed with the digits of their shortest round-trip decimal
// representation (or these digits rounded to the requested precision). NaN, infinities and zeros
// are printed as the literals found in format.specials.
void AppendFloat(std::string& out, const FloatFormat& format, float value);
void AppendDouble(std::string& out, const FloatFormat& format, double value);

std::string FormatFloat(const FloatFormat& format, float value);
std::string FormatDouble(const FloatFormat& format, double value);

// Equivalent to FormatFloat(Generic(), value).
// E.g. 12.345f => "12.345", 1.0e7f => "1.0e7", 0.01f => "1.0e-2".
std::string FloatDecimal(float value);

// Equivalent to FormatDouble(Generic(), value).
std::string DoubleDecimal(double value);

} // namespace realfloat
