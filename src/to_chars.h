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

// Maximum number of characters written in a single bounded append.
template <typename Float>
struct MaxLength
{
    // [0.]ddddddddd[.0], the padding zeros are appended separately
    static constexpr int Digits = IEEE<Float>::MaxDigits10 + 2;
    // d.dddddddddE+ddd
    static constexpr int Scientific = IEEE<Float>::MaxDigits10 + 8;
};

// Appends value.digits * 10^value.exponent, the shortest decimal of the finite non-zero number
// given by decomposed, to out, using the notation selected by format.kind.
// format.specials is not used here.
//
// `shortest` prints integers below 2^32 (float) or 2^64 (double) exactly, e.g. 2^60 as
// "1152921504606846976". Larger integers are printed as the shortest digits padded with zeros.
void RenderDecimal(std::string& out, const Decomposed<float>& decomposed, const DecimalValue<float>& value, const FloatFormat& format);
void RenderDecimal(std::string& out, const Decomposed<double>& decomposed, const DecimalValue<double>& value, const FloatFormat& format);

} // namespace realfloat
