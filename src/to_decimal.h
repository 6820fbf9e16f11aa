// Copyright 2020 Ulf Adams
// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "ieee.h"

#include <cstdint>

namespace realfloat {

// Whether a decimal lying exactly on the boundary of the rounding interval may be chosen.
//
// With `inclusive`, a boundary is acceptable iff the significand of the input is even, in which
// case round-to-nearest-even maps the boundary back onto the input. `exclusive` never accepts
// boundaries, which reproduces the output of the classic shortest-digit printers.
enum class IntervalBounds {
    exclusive,
    inclusive,
};

// The decimal number digits * 10^exponent.
template <typename Float>
struct DecimalValue
{
    using bits_type = typename IEEE<Float>::bits_type;

    bits_type digits; // 1 <= num_digits <= IEEE<Float>::MaxDigits10, no trailing zeros
    int32_t exponent;
};

// Computes the shortest decimal representation of the given finite, non-zero value which
// round-trips. If there are several shortest representations, the one closest to the exact value
// is returned. Ties are broken by choosing the even candidate.
//
// PRE: decomposed.category == FloatCategory::finite
DecimalValue<float> ShortestDecimal(const Decomposed<float>& decomposed, IntervalBounds bounds = IntervalBounds::exclusive);
DecimalValue<double> ShortestDecimal(const Decomposed<double>& decomposed, IntervalBounds bounds = IntervalBounds::exclusive);

// PRE: value is finite and non-zero. The sign is ignored.
template <typename Float>
inline DecimalValue<Float> ToDecimal(Float value, IntervalBounds bounds = IntervalBounds::exclusive)
{
    return ShortestDecimal(Decompose(value), bounds);
}

} // namespace realfloat
