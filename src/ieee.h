// Copyright 2020 Ulf Adams
// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <cassert>
#include <cstdint>
#include <cstring>
#include <limits>
#include <type_traits>

#ifndef REALFLOAT_ASSERT
#define REALFLOAT_ASSERT(X) assert(X)
#endif

namespace realfloat {

//==================================================================================================
//
//==================================================================================================

template <typename Dest, typename Source>
inline Dest ReinterpretBits(Source source)
{
    static_assert(sizeof(Dest) == sizeof(Source), "size mismatch");

    Dest dest;
    std::memcpy(&dest, &source, sizeof(Source));
    return dest;
}

namespace impl {

template <int Digits> struct BitsType;
template <> struct BitsType<24> { using type = uint32_t; };
template <> struct BitsType<53> { using type = uint64_t; };

} // namespace impl

// Layout of an IEEE-754 binary interchange format.
// Only binary32 (float) and binary64 (double) are supported.
template <typename Float>
struct IEEE
{
    static_assert(std::numeric_limits<Float>::is_iec559, "IEEE-754 implementation required");
    static_assert(std::numeric_limits<Float>::radix == 2, "binary format required");

    using value_type = Float;
    using bits_type = typename impl::BitsType<std::numeric_limits<Float>::digits>::type;

    static_assert(sizeof(bits_type) == sizeof(value_type), "unsupported floating-point type");

    static constexpr int       SignificandSize = std::numeric_limits<value_type>::digits; // = p   (includes the hidden bit)
    static constexpr int       ExponentSize    = static_cast<int>(sizeof(value_type)) * 8 - SignificandSize;
    static constexpr int       ExponentBias    = std::numeric_limits<value_type>::max_exponent - 1 + (SignificandSize - 1);
    static constexpr int       MaxIeeeExponent = (1 << ExponentSize) - 1;
    static constexpr int       MaxDigits10     = std::numeric_limits<value_type>::max_digits10;
    // Number of decimal digits of the largest decimal exponent (in magnitude) a finite value can have.
    static constexpr int       ExponentDigits10 = std::numeric_limits<value_type>::max_exponent10 >= 100 ? 3 : 2;
    static constexpr bits_type HiddenBit       = bits_type{1} << (SignificandSize - 1);
    static constexpr bits_type SignificandMask = HiddenBit - 1;
    static constexpr bits_type ExponentMask    = bits_type{static_cast<bits_type>(MaxIeeeExponent)} << (SignificandSize - 1);
    static constexpr bits_type SignMask        = ~(~bits_type{0} >> 1);

    bits_type bits;

    explicit IEEE(bits_type bits_) : bits(bits_) {}
    explicit IEEE(value_type value) : bits(ReinterpretBits<bits_type>(value)) {}

    bits_type PhysicalSignificand() const {
        return bits & SignificandMask;
    }

    bits_type PhysicalExponent() const {
        return (bits & ExponentMask) >> (SignificandSize - 1);
    }

    bool IsFinite() const {
        return (bits & ExponentMask) != ExponentMask;
    }

    bool IsInf() const {
        return (bits & ExponentMask) == ExponentMask && (bits & SignificandMask) == 0;
    }

    bool IsNaN() const {
        return (bits & ExponentMask) == ExponentMask && (bits & SignificandMask) != 0;
    }

    bool IsZero() const {
        return (bits & ~SignMask) == 0;
    }

    bool SignBit() const {
        return (bits & SignMask) != 0;
    }
};

//==================================================================================================
// Decompose
//==================================================================================================

enum class FloatCategory {
    zero,
    finite, // non-zero normal or subnormal
    infinity,
    nan,
};

// A value in the form (-1)^sign * significand * 2^exponent.
// For zeros, infinities and NaNs only the sign (and for NaN not even that) is meaningful.
template <typename Float>
struct Decomposed
{
    using bits_type = typename IEEE<Float>::bits_type;

    FloatCategory category;
    bool sign;
    bits_type significand; // includes the hidden bit for normal numbers
    int32_t exponent;
};

template <typename Float>
inline Decomposed<Float> Decompose(IEEE<Float> v)
{
    using Ieee = IEEE<Float>;

    const bool sign = v.SignBit();
    const auto ieee_significand = v.PhysicalSignificand();
    const auto ieee_exponent = static_cast<int32_t>(v.PhysicalExponent());

    if (ieee_exponent == Ieee::MaxIeeeExponent)
    {
        const auto category = ieee_significand == 0 ? FloatCategory::infinity : FloatCategory::nan;
        return {category, sign, 0, 0};
    }

    if (ieee_exponent == 0)
    {
        if (ieee_significand == 0)
            return {FloatCategory::zero, sign, 0, 0};

        // subnormal
        return {FloatCategory::finite, sign, ieee_significand, 1 - Ieee::ExponentBias};
    }

    return {FloatCategory::finite, sign, Ieee::HiddenBit | ieee_significand, ieee_exponent - Ieee::ExponentBias};
}

template <typename Float>
inline Decomposed<Float> Decompose(Float value)
{
    static_assert(std::is_floating_point<Float>::value, "floating-point type required");

    return Decompose(IEEE<Float>(value));
}

} // namespace realfloat
