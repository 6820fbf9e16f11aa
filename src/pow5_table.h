// Copyright 2020 Ulf Adams
// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <cstdint>

namespace realfloat {
namespace impl {

//==================================================================================================
//
//==================================================================================================

// Returns floor(x / 2^n).
//
// Technically, right-shift of negative integers is implementation defined...
// Should easily be optimized into SAR (or equivalent) instruction.
constexpr int32_t FloorDivPow2(int32_t x, int32_t n)
{
    return x < 0 ? ~(~x >> n) : (x >> n);
}

// Returns floor(log_2(5^e)) for 0 <= e <= 1764
constexpr int32_t FloorLog2Pow5(int32_t e)
{
    return FloorDivPow2(e * 1217359, 19);
}

// Returns floor(log_10(2^e)) for 0 <= e <= 1650
constexpr int32_t FloorLog10Pow2(int32_t e)
{
    return FloorDivPow2(e * 315653, 20);
}

// Returns floor(log_10(5^e)) for 0 <= e <= 2620
constexpr int32_t FloorLog10Pow5(int32_t e)
{
    return FloorDivPow2(e * 732923, 20);
}

struct Uint64x2 {
    uint64_t hi;
    uint64_t lo;
};

//==================================================================================================
// Compile-time generation of the power-of-5 multipliers
//==================================================================================================

// Unsigned integer with NumLimbs little-endian 32-bit limbs.
// Only what the table generation needs.
template <int NumLimbs>
struct BigUint
{
    uint32_t limbs[NumLimbs];
};

template <int NumLimbs>
constexpr void MulSmall(BigUint<NumLimbs>& x, uint32_t factor)
{
    uint64_t carry = 0;
    for (int i = 0; i < NumLimbs; ++i)
    {
        const uint64_t p = uint64_t{x.limbs[i]} * factor + carry;
        x.limbs[i] = static_cast<uint32_t>(p);
        carry = p >> 32;
    }
}

template <int NumLimbs>
constexpr void DivSmall(BigUint<NumLimbs>& x, uint32_t divisor)
{
    uint64_t rem = 0;
    for (int i = NumLimbs - 1; i >= 0; --i)
    {
        const uint64_t cur = (rem << 32) | x.limbs[i];
        x.limbs[i] = static_cast<uint32_t>(cur / divisor);
        rem = cur % divisor;
    }
}

// Returns floor(x / 2^shift) mod 2^128.
template <int NumLimbs>
constexpr Uint64x2 ExtractBits128(const BigUint<NumLimbs>& x, int32_t shift)
{
    const int32_t w = shift / 32;
    const int32_t b = shift % 32;

    uint32_t r[4] = {0, 0, 0, 0};
    for (int32_t i = 0; i < 4; ++i)
    {
        const uint64_t lo = (w + i < NumLimbs) ? x.limbs[w + i] : 0;
        const uint64_t hi = (w + i + 1 < NumLimbs) ? x.limbs[w + i + 1] : 0;
        r[i] = static_cast<uint32_t>(((hi << 32) | lo) >> b);
    }

    return {uint64_t{r[3]} << 32 | r[2], uint64_t{r[1]} << 32 | r[0]};
}

// Table of 128-bit approximations of 5^k for MinDecExp <= k <= MaxDecExp,
// normalized such that the most significant bit is set:
//
//      k >= 0:  floor(5^k / 2^(FloorLog2Pow5(k) + 1 - 128))
//      k <  0:  ceil(2^(FloorLog2Pow5(-k) + 1 + 127) / 5^-k)
//
template <int32_t MinDecExp, int32_t MaxDecExp>
struct Pow5Table
{
    static_assert(MinDecExp <= 0, "invalid range");
    static_assert(MaxDecExp >= 0, "invalid range");

    static constexpr int32_t Size = MaxDecExp - MinDecExp + 1;

    Uint64x2 entries[Size];

    constexpr const Uint64x2& operator[](int32_t k) const {
        return entries[k - MinDecExp];
    }
};

template <int32_t MinDecExp, int32_t MaxDecExp>
constexpr Pow5Table<MinDecExp, MaxDecExp> MakePow5Table()
{
    constexpr int32_t MaxAbsDecExp = -MinDecExp > MaxDecExp ? -MinDecExp : MaxDecExp;
    // Bit length of the largest intermediate: 5^MaxAbsDecExp * 2^128.
    constexpr int32_t MaxBits = FloorLog2Pow5(MaxAbsDecExp) + 1 + 128;
    constexpr int NumLimbs = MaxBits / 32 + 2;

    Pow5Table<MinDecExp, MaxDecExp> table{};

    // 5^k * 2^128, so that the extraction never shifts left.
    BigUint<NumLimbs> pow5{};
    pow5.limbs[4] = 1;
    for (int32_t k = 0; k <= MaxDecExp; ++k)
    {
        table.entries[k - MinDecExp] = ExtractBits128(pow5, FloorLog2Pow5(k) + 1);
        MulSmall(pow5, 5);
    }

    // floor(2^L / 5^n) with L large enough for all n, rounded up after truncation.
    // 5^n does not divide 2^L, so floor(...) + 1 == ceil(...).
    constexpr int32_t L = FloorLog2Pow5(-MinDecExp) + 1 + 127;
    BigUint<NumLimbs> inv{};
    inv.limbs[L / 32] = uint32_t{1} << (L % 32);
    for (int32_t n = 1; n <= -MinDecExp; ++n)
    {
        DivSmall(inv, 5);

        Uint64x2 e = ExtractBits128(inv, L - (FloorLog2Pow5(n) + 1 + 127));
        e.lo += 1;
        e.hi += (e.lo == 0) ? 1 : 0;
        table.entries[-n - MinDecExp] = e;
    }

    return table;
}

} // namespace impl
} // namespace realfloat
