// Copyright 2020 Ulf Adams
// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "ieee.h"

#include <cstdint>
#include <cstring>

namespace realfloat {
namespace impl {

inline char* Utoa_2Digits(char* buf, uint32_t digits)
{
    static constexpr char Digits100[200] = {
        '0','0','0','1','0','2','0','3','0','4','0','5','0','6','0','7','0','8','0','9',
        '1','0','1','1','1','2','1','3','1','4','1','5','1','6','1','7','1','8','1','9',
        '2','0','2','1','2','2','2','3','2','4','2','5','2','6','2','7','2','8','2','9',
        '3','0','3','1','3','2','3','3','3','4','3','5','3','6','3','7','3','8','3','9',
        '4','0','4','1','4','2','4','3','4','4','4','5','4','6','4','7','4','8','4','9',
        '5','0','5','1','5','2','5','3','5','4','5','5','5','6','5','7','5','8','5','9',
        '6','0','6','1','6','2','6','3','6','4','6','5','6','6','6','7','6','8','6','9',
        '7','0','7','1','7','2','7','3','7','4','7','5','7','6','7','7','7','8','7','9',
        '8','0','8','1','8','2','8','3','8','4','8','5','8','6','8','7','8','8','8','9',
        '9','0','9','1','9','2','9','3','9','4','9','5','9','6','9','7','9','8','9','9',
    };

    REALFLOAT_ASSERT(digits <= 99);
    std::memcpy(buf, &Digits100[2*digits], 2*sizeof(char));
    return buf + 2;
}

inline char* Utoa_4Digits(char* buf, uint32_t digits)
{
    REALFLOAT_ASSERT(digits <= 9999);
    const uint32_t q = digits / 100;
    const uint32_t r = digits % 100;
    Utoa_2Digits(buf + 0, q);
    Utoa_2Digits(buf + 2, r);
    return buf + 4;
}

inline char* Utoa_8Digits(char* buf, uint32_t digits)
{
    REALFLOAT_ASSERT(digits <= 99999999);
    const uint32_t q = digits / 10000;
    const uint32_t r = digits % 10000;
    Utoa_4Digits(buf + 0, q);
    Utoa_4Digits(buf + 4, r);
    return buf + 8;
}

inline int DecimalLength(uint32_t v)
{
    REALFLOAT_ASSERT(v >= 1);

    if (v >= 1000000000) { return 10; }
    if (v >= 100000000) { return 9; }
    if (v >= 10000000) { return 8; }
    if (v >= 1000000) { return 7; }
    if (v >= 100000) { return 6; }
    if (v >= 10000) { return 5; }
    if (v >= 1000) { return 4; }
    if (v >= 100) { return 3; }
    if (v >= 10) { return 2; }
    return 1;
}

inline int DecimalLength(uint64_t v)
{
    REALFLOAT_ASSERT(v >= 1);

    if (v >= 10000000000000000000ull) { return 20; }
    if (v >= 1000000000000000000ull) { return 19; }
    if (v >= 100000000000000000ull) { return 18; }
    if (v >= 10000000000000000ull) { return 17; }
    if (v >= 1000000000000000ull) { return 16; }
    if (v >= 100000000000000ull) { return 15; }
    if (v >= 10000000000000ull) { return 14; }
    if (v >= 1000000000000ull) { return 13; }
    if (v >= 100000000000ull) { return 12; }
    if (v >= 10000000000ull) { return 11; }
    if (v >= 1000000000ull) { return 10; }
    if (v >= 100000000ull) { return 9; }
    if (v >= 10000000ull) { return 8; }
    if (v >= 1000000ull) { return 7; }
    if (v >= 100000ull) { return 6; }
    if (v >= 10000ull) { return 5; }
    if (v >= 1000ull) { return 4; }
    if (v >= 100ull) { return 3; }
    if (v >= 10ull) { return 2; }
    return 1;
}

inline void PrintDecimalDigits(char* buf, uint32_t output, int output_length)
{
    while (output >= 10000)
    {
        REALFLOAT_ASSERT(output_length > 4);
        const uint32_t q = output / 10000;
        const uint32_t r = output % 10000;
        output = q;
        output_length -= 4;
        Utoa_4Digits(buf + output_length, r);
    }

    if (output >= 100)
    {
        REALFLOAT_ASSERT(output_length > 2);
        const uint32_t q = output / 100;
        const uint32_t r = output % 100;
        output = q;
        output_length -= 2;
        Utoa_2Digits(buf + output_length, r);
    }

    if (output >= 10)
    {
        REALFLOAT_ASSERT(output_length == 2);
        Utoa_2Digits(buf, output);
    }
    else
    {
        REALFLOAT_ASSERT(output_length == 1);
        buf[0] = static_cast<char>('0' + output);
    }
}

inline void PrintDecimalDigits(char* buf, uint64_t output, int output_length)
{
    // We prefer 32-bit operations, even on 64-bit platforms.
    // We have at most 20 digits, and uint32_t can store 9 digits.
    // While output doesn't fit into uint32_t, we cut off 8 digits.
    while (static_cast<uint32_t>(output >> 32) != 0)
    {
        REALFLOAT_ASSERT(output_length > 8);
        const uint64_t q = output / 100000000;
        const uint32_t r = static_cast<uint32_t>(output % 100000000);
        output = q;
        output_length -= 8;
        Utoa_8Digits(buf + output_length, r);
    }

    REALFLOAT_ASSERT(output <= UINT32_MAX);
    uint32_t output2 = static_cast<uint32_t>(output);

    while (output2 >= 10000)
    {
        REALFLOAT_ASSERT(output_length > 4);
        const uint32_t q = output2 / 10000;
        const uint32_t r = output2 % 10000;
        output2 = q;
        output_length -= 4;
        Utoa_4Digits(buf + output_length, r);
    }

    if (output2 >= 100)
    {
        REALFLOAT_ASSERT(output_length > 2);
        const uint32_t q = output2 / 100;
        const uint32_t r = output2 % 100;
        output2 = q;
        output_length -= 2;
        Utoa_2Digits(buf + output_length, r);
    }

    if (output2 >= 10)
    {
        REALFLOAT_ASSERT(output_length == 2);
        Utoa_2Digits(buf, output2);
    }
    else
    {
        REALFLOAT_ASSERT(output_length == 1);
        buf[0] = static_cast<char>('0' + output2);
    }
}

// Writes the decimal exponent of a scientific representation.
// The magnitude is zero padded to at least min_width digits.
// PRE: abs(exponent) <= 999, min_width <= 3
inline char* WriteExponent(char* buf, int exponent, bool explicit_plus, int min_width)
{
    if (exponent < 0)
    {
        *buf++ = '-';
        exponent = -exponent;
    }
    else if (explicit_plus)
    {
        *buf++ = '+';
    }

    REALFLOAT_ASSERT(exponent <= 999);
    REALFLOAT_ASSERT(min_width <= 3);

    const uint32_t k = static_cast<uint32_t>(exponent);
    if (k >= 100 || min_width >= 3)
    {
        const uint32_t q = k / 10;
        const uint32_t r = k % 10;
        buf = Utoa_2Digits(buf, q);
        *buf++ = static_cast<char>('0' + r);
    }
    else if (k >= 10 || min_width == 2)
    {
        buf = Utoa_2Digits(buf, k);
    }
    else
    {
        *buf++ = static_cast<char>('0' + k);
    }

    return buf;
}

} // namespace impl
} // namespace realfloat
