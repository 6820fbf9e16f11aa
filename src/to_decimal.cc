// Copyright 2020 Ulf Adams
// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "to_decimal.h"
#include "pow5_table.h"

#include <cstdint>
#if defined(_MSC_VER) && defined(_M_X64)
#include <intrin.h>
#endif

using namespace realfloat;
using namespace realfloat::impl;

//==================================================================================================
//
//==================================================================================================

static inline uint32_t Lo32(uint64_t x)
{
    return static_cast<uint32_t>(x);
}

static inline uint32_t Hi32(uint64_t x)
{
    return static_cast<uint32_t>(x >> 32);
}

#if defined(__SIZEOF_INT128__)

static inline uint64_t MulShift(uint64_t m, const Uint64x2& mul, int32_t j)
{
    __extension__ using uint128_t = unsigned __int128;

    REALFLOAT_ASSERT(j >= 64 + 1);
    REALFLOAT_ASSERT(j <= 64 + 63);

    const uint128_t b0 = uint128_t{m} * mul.lo;
    const uint128_t b2 = uint128_t{m} * mul.hi;

    const int32_t shift = j - 64;
    return static_cast<uint64_t>((b2 + static_cast<uint64_t>(b0 >> 64)) >> shift);
}

#elif defined(_MSC_VER) && defined(_M_X64)

static inline uint64_t MulShift(uint64_t m, const Uint64x2& mul, int32_t j)
{
    REALFLOAT_ASSERT(j >= 64 + 1);
    REALFLOAT_ASSERT(j <= 64 + 63);

    uint64_t b0_hi;
    uint64_t b0_lo = _umul128(m, mul.lo, &b0_hi);
    uint64_t b2_hi;
    uint64_t b2_lo = _umul128(m, mul.hi, &b2_hi);
    static_cast<void>(b0_lo);

    // b2 + (b0 >> 64)
    _addcarry_u64(_addcarry_u64(0, b2_lo, b0_hi, &b2_lo), b2_hi, 0, &b2_hi);

    // For the __shiftright128 intrinsic, the shift value is always modulo 64.
    // Since (j - 64) % 64 = j, we can simply use j here.
    return __shiftright128(b2_lo, b2_hi, static_cast<unsigned char>(j));
}

#else

static inline Uint64x2 Mul128(uint64_t a, uint64_t b)
{
    const uint64_t b00 = uint64_t{Lo32(a)} * Lo32(b);
    const uint64_t b01 = uint64_t{Lo32(a)} * Hi32(b);
    const uint64_t b10 = uint64_t{Hi32(a)} * Lo32(b);
    const uint64_t b11 = uint64_t{Hi32(a)} * Hi32(b);

    const uint64_t mid1 = b10 + Hi32(b00);
    const uint64_t mid2 = b01 + Lo32(mid1);

    const uint64_t hi = b11 + Hi32(mid1) + Hi32(mid2);
    const uint64_t lo = Lo32(b00) | uint64_t{Lo32(mid2)} << 32;
    return {hi, lo};
}

static inline uint64_t ShiftRight128(uint64_t lo, uint64_t hi, int32_t n)
{
    REALFLOAT_ASSERT(n >= 1);
    REALFLOAT_ASSERT(n <= 63);

    const int32_t lshift = -n & 63;
    const int32_t rshift =  n;
    return (hi << lshift) | (lo >> rshift);
}

static inline uint64_t MulShift(uint64_t m, const Uint64x2& mul, int32_t j)
{
    REALFLOAT_ASSERT(j >= 64 + 1);
    REALFLOAT_ASSERT(j <= 64 + 63);

    auto b0 = Mul128(m, mul.lo);
    auto b2 = Mul128(m, mul.hi);

    // b2 + (b0 >> 64)
    b2.lo += b0.hi;
    b2.hi += b2.lo < b0.hi;

    return ShiftRight128(b2.lo, b2.hi, j - 64);
}

#endif

// Returns whether value is divisible by 5^e5
static inline bool MultipleOfPow5(uint64_t value, int32_t e5)
{
    struct MulCmp {
        uint64_t mul;
        uint64_t cmp;
    };

    static constexpr MulCmp Mod5[] = {
        {0x0000000000000001u, 0xFFFFFFFFFFFFFFFFu}, // 5^0
        {0xCCCCCCCCCCCCCCCDu, 0x3333333333333333u}, // 5^1
        {0x8F5C28F5C28F5C29u, 0x0A3D70A3D70A3D70u}, // 5^2
        {0x1CAC083126E978D5u, 0x020C49BA5E353F7Cu}, // 5^3
        {0xD288CE703AFB7E91u, 0x0068DB8BAC710CB2u}, // 5^4
        {0x5D4E8FB00BCBE61Du, 0x0014F8B588E368F0u}, // 5^5
        {0x790FB65668C26139u, 0x000431BDE82D7B63u}, // 5^6
        {0xE5032477AE8D46A5u, 0x0000D6BF94D5E57Au}, // 5^7
        {0xC767074B22E90E21u, 0x00002AF31DC46118u}, // 5^8
        {0x8E47CE423A2E9C6Du, 0x0000089705F4136Bu}, // 5^9
        {0x4FA7F60D3ED61F49u, 0x000001B7CDFD9D7Bu}, // 5^10
        {0x0FEE64690C913975u, 0x00000057F5FF85E5u}, // 5^11
        {0x3662E0E1CF503EB1u, 0x000000119799812Du}, // 5^12
        {0xA47A2CF9F6433FBDu, 0x0000000384B84D09u}, // 5^13
        {0x54186F653140A659u, 0x00000000B424DC35u}, // 5^14
        {0x7738164770402145u, 0x0000000024075F3Du}, // 5^15
        {0xE4A4D1417CD9A041u, 0x000000000734ACA5u}, // 5^16
        {0xC75429D9E5C5200Du, 0x000000000170EF54u}, // 5^17
        {0xC1773B91FAC10669u, 0x000000000049C977u}, // 5^18
        {0x26B172506559CE15u, 0x00000000000EC1E4u}, // 5^19
        {0xD489E3A9ADDEC2D1u, 0x000000000002F394u}, // 5^20
        {0x90E860BB892C8D5Du, 0x000000000000971Du}, // 5^21
        {0x502E79BF1B6F4F79u, 0x0000000000001E39u}, // 5^22
        {0xDCD618596BE30FE5u, 0x000000000000060Bu}, // 5^23
        {0x2C2AD1AB7BFA3661u, 0x0000000000000135u}, // 5^24
    };

    REALFLOAT_ASSERT(e5 >= 0);
    REALFLOAT_ASSERT(e5 <= 24);
    const auto m5 = Mod5[static_cast<unsigned>(e5)];

    return value * m5.mul <= m5.cmp;
}

// Returns whether value is divisible by 2^e2
static inline bool MultipleOfPow2(uint64_t value, int32_t e2)
{
    REALFLOAT_ASSERT(e2 >= 0);
    REALFLOAT_ASSERT(e2 <= 63);

    return (value & ((uint64_t{1} << e2) - 1)) == 0;
}

//==================================================================================================
// ShortestDecimal
//==================================================================================================

namespace {

template <typename Float>
struct DecimalTraits
{
    using Ieee = IEEE<Float>;

    static constexpr int32_t BitsPerPow5 = 128;

    // Range of the binary exponent after the interval has been scaled by 4.
    static constexpr int32_t MinE2 = 1 - Ieee::ExponentBias - 2;
    static constexpr int32_t MaxE2 = (Ieee::MaxIeeeExponent - 1) - Ieee::ExponentBias - 2;

    // Range of the powers of 5 required by MulPow5DivPow2.
    static constexpr int32_t MinDecExp = -(FloorLog10Pow2(MaxE2) - 1);
    static constexpr int32_t MaxDecExp = -(FloorLog10Pow5(-MinE2) - 1 + MinE2);

    // u, v, w < 2^(p + 2) < 5^24
    static_assert(Ieee::SignificandSize + 2 <= 55, "MultipleOfPow5 table too small");

    static const Pow5Table<MinDecExp, MaxDecExp>& Pow5()
    {
        static constexpr Pow5Table<MinDecExp, MaxDecExp> table = MakePow5Table<MinDecExp, MaxDecExp>();
        return table;
    }
};

} // namespace

template <typename Float>
static inline void MulPow5DivPow2(uint64_t u, uint64_t v, uint64_t w, int32_t e5, int32_t e2, uint64_t& a, uint64_t& b, uint64_t& c)
{
    using Traits = DecimalTraits<Float>;

    // j >= 121 and m has at most p + 2 <= 55 bits.
    // The product along with the subsequent shift therefore requires
    // 55 + 128 - 121 = 62 bits.

    const auto k = FloorLog2Pow5(e5) + 1 - Traits::BitsPerPow5;
    const auto j = e2 - k;
    REALFLOAT_ASSERT(j >= Traits::BitsPerPow5 - 7); // 121 - 64 = 57
    REALFLOAT_ASSERT(j <= Traits::BitsPerPow5 - 1); // 127 - 64 = 63

    REALFLOAT_ASSERT(e5 >= Traits::MinDecExp);
    REALFLOAT_ASSERT(e5 <= Traits::MaxDecExp);
    const Uint64x2& pow5 = Traits::Pow5()[e5];

    a = MulShift(u, pow5, j);
    b = MulShift(v, pow5, j);
    c = MulShift(w, pow5, j);
}

template <typename Float>
static inline DecimalValue<Float> ShortestDecimalImpl(const Decomposed<Float>& decomposed, IntervalBounds bounds)
{
    using Ieee = IEEE<Float>;
    using bits_type = typename Ieee::bits_type;

    REALFLOAT_ASSERT(decomposed.category == FloatCategory::finite);
    REALFLOAT_ASSERT(decomposed.significand != 0);

    //
    // Step 1:
    // Decode the floating point number, and unify normalized and subnormal cases.
    //

    const uint64_t m2 = decomposed.significand;
    int32_t e2 = decomposed.exponent;

    if /*unlikely*/ ((0 <= -e2 && -e2 < Ieee::SignificandSize) && MultipleOfPow2(m2, -e2))
    {
        // Since 2^(p-1) <= m2 < 2^p and 0 <= -e2 <= p-1:
        //  1 <= value = m2 / 2^-e2 < 2^p.
        // Since m2 is divisible by 2^-e2, value is an integer.
        // Move trailing zeros into the exponent.
        uint64_t digits = m2 >> -e2;
        int32_t e10 = 0;
        for (;;)
        {
            const uint64_t q = digits / 10;
            const uint32_t r = Lo32(digits) - 10 * Lo32(q); // = digits % 10
            if (r != 0)
                break;
            digits = q;
            ++e10;
        }

        return {static_cast<bits_type>(digits), e10};
    }

    const bool is_even = (m2 % 2) == 0;
    const bool accept_lower = is_even && bounds == IntervalBounds::inclusive;
    const bool accept_upper = is_even && bounds == IntervalBounds::inclusive;

    //
    // Step 2:
    // Determine the interval of valid decimal representations.
    //

    // The smallest normal number has the same spacing below it as above.
    const uint32_t lower_boundary_is_closer = (m2 == Ieee::HiddenBit && e2 > 1 - Ieee::ExponentBias);

    e2 -= 2;
    const uint64_t u = 4 * m2 - 2 + lower_boundary_is_closer;
    const uint64_t v = 4 * m2;
    const uint64_t w = 4 * m2 + 2;

    //
    // Step 3:
    // Convert to a decimal power base.
    //

    int32_t e10;

    bool za = false; // a[0, ..., i-1] == 0
    bool zb = false; // b[0, ..., i-1] == 0
    bool zc = false; // c[0, ..., i-1] == 0

    if (e2 >= 0)
    {
        // We need
        //  (a,b,c) = (u,v,w) * 2^e2
        // and we need to remove at least q' = log_10(2^e2) digits from the
        // scaled values a,b,c, i.e. we want to compute
        //  (a,b,c) = (u,v,w) * 2^e2 / 10^(q')
        //          = (u,v,w) * 2^e2 / 10^(e10)
        //          = (u,v,w) * 5^(-e10) / 2^(e10 - e2)
        //
        // However, to correctly round the result we need to know the value of
        // the last removed digit. We therefore remove only q = q' - 1 digits in
        // the first step and make sure that we execute the loop below at least
        // once and determine the correct value of the last removed digit.

        const int32_t q = FloorLog10Pow2(e2) - (e2 > 3); // == max(0, q' - 1)
        REALFLOAT_ASSERT(q >= 0);

        e10 = q;
        REALFLOAT_ASSERT(e10 >= 0);
        REALFLOAT_ASSERT(e10 - e2 <= 0);

        // Determine whether all the removed digits are 0.
        //
        // Z(x,e2,q) = (x * 2^e2) % 10^q == 0
        //           = p5(x) >= q
        //           = x % 5^q == 0

        if (q <= 24) // x < 2^55 < 5^24
        {
            za = MultipleOfPow5(u, q);
            zb = MultipleOfPow5(v, q);
            zc = MultipleOfPow5(w, q);
        }
    }
    else
    {
        // We need
        //  (a,b,c) = (u,v,w) * 2^e2 / 10^e2
        // and we need to remove at least q' = log_10(5^-e2) digits from the
        // scaled values a,b,c, i.e. we want to compute
        //  (a,b,c) = (u,v,w) * 2^e2 / 10^(e2 + q')
        //          = (u,v,w) * 2^e2 / 10^(e10),
        //          = (u,v,w) * 5^(-e10) / 2^(e10 - e2)

        const int32_t q = FloorLog10Pow5(-e2) - (-e2 > 1); // == max(0, q' - 1)
        REALFLOAT_ASSERT(q >= 0);

        e10 = q + e2;
        REALFLOAT_ASSERT(e10 < 0);
        REALFLOAT_ASSERT(e10 - e2 >= 0);

        // Determine whether all the removed digits are 0.
        //
        // Z(x,e2,q) = (x * 5^-e2) % 10^q == 0
        //           = p2(x) >= q
        //           = x % 2^q == 0

        if (q <= Ieee::SignificandSize + 2)
        {
            za = MultipleOfPow2(u, q);
            zb = MultipleOfPow2(v, q);
            zc = MultipleOfPow2(w, q);
        }
    }

    uint64_t aq;
    uint64_t bq;
    uint64_t cq;
    MulPow5DivPow2<Float>(u, v, w, -e10, e10 - e2, aq, bq, cq);

    //
    // Step 4:
    // Find the shortest decimal representation in the interval of valid representations.
    //

    cq -= !accept_upper && zc;

    // mask = 10^(number of digits removed),
    // i.e., (bq % mask) contains the actual digits removed from bq.
    // Since c < 2^62, which has 19 decimal digits, we remove at most 18 decimal digits.
    uint64_t mask = 1;

    uint64_t a = aq;
    uint64_t b = bq;
    uint64_t c = cq;

    if (a / 10000 < c / 10000) // 4
    {
        mask = 10000;
        a /= 10000;
        b /= 10000;
        c /= 10000;
        e10 += 4;
        if (a / 10000 < c / 10000) // 8
        {
            mask = 100000000;
            a /= 10000;
            b /= 10000;
            c /= 10000;
            e10 += 4;
            if (a / 10000 < c / 10000) // 12
            {
                mask = 1000000000000;
                a /= 10000;
                b /= 10000;
                c /= 10000;
                e10 += 4;
                if (a / 10000 < c / 10000) // 16
                {
                    mask = 10000000000000000;
                    a /= 10000;
                    b /= 10000;
                    c /= 10000;
                    e10 += 4;
                }
            }
        }
    }

    if (a / 100 < c / 100)
    {
        mask *= 100;
        a /= 100;
        b /= 100;
        c /= 100;
        e10 += 2;
    }

    if (a / 10 < c / 10)
    {
        mask *= 10;
        a /= 10;
        b /= 10;
        ++e10;
    }

    if /*likely*/ (!za && !zb)
    {
        const uint64_t br = bq - b * mask; // Digits removed from bq
        const uint64_t half = mask / 2;

        b += (a == b || br >= half);
    }
    else
    {
        // za currently determines whether the first q removed digits were all
        // 0's. Still need to check whether the digits removed in the loop above
        // are all 0's.
        const bool can_use_lower = accept_lower && za && (aq - a * mask == 0);
        if (can_use_lower)
        {
            // If the loop is executed at least once, we have a == b == c when
            // the loop terminates.
            // We only remove 0's from a, so ar and za don't change.
            REALFLOAT_ASSERT(a != 0);
            for (;;)
            {
                const uint64_t q = a / 10;
                const uint32_t r = Lo32(a) - 10 * Lo32(q); // = a % 10
                if (r != 0)
                    break;
                mask *= 10;
                a = q;
                b = q;
                ++e10;
            }
        }

        const uint64_t br = bq - b * mask; // Digits removed from bq
        const uint64_t half = mask / 2;

        // A return value of b is valid if and only if a != b or za == true.
        // A return value of b + 1 is valid if and only if b + 1 <= c.
        const bool round_up = (a == b && !can_use_lower) // out of range
            || (br > half)
            || (br == half && (!zb || b % 2 != 0));

        b += round_up;
    }

    REALFLOAT_ASSERT(b != 0);
    REALFLOAT_ASSERT(b < (Ieee::MaxDigits10 == 9 ? uint64_t{1000000000} : uint64_t{100000000000000000}));

    return {static_cast<bits_type>(b), e10};
}

DecimalValue<float> realfloat::ShortestDecimal(const Decomposed<float>& decomposed, IntervalBounds bounds)
{
    return ShortestDecimalImpl(decomposed, bounds);
}

DecimalValue<double> realfloat::ShortestDecimal(const Decomposed<double>& decomposed, IntervalBounds bounds)
{
    return ShortestDecimalImpl(decomposed, bounds);
}
