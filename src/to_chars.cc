// Copyright 2020 Ulf Adams
// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "to_chars.h"
#include "format_digits.h"
#include "output_buffer.h"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <limits>
#include <string>

using namespace realfloat;
using namespace realfloat::impl;

//==================================================================================================
//
//==================================================================================================

namespace {

constexpr int MaxDigits = 17;

// The digits of a DecimalValue, most significant first.
struct DigitString
{
    char chars[MaxDigits];
    int length;
};

// The sequence (leading_zeros x '0') ++ head ++ (trailing_zeros x '0').
struct DigitRun
{
    int leading_zeros = 0;
    char head[MaxDigits + 1];
    int head_length = 0;
    int trailing_zeros = 0;

    int Length() const {
        return leading_zeros + head_length + trailing_zeros;
    }
};

} // namespace

template <typename UnsignedInt>
static inline DigitString MakeDigitString(UnsignedInt digits)
{
    DigitString d;
    d.length = DecimalLength(digits);
    PrintDecimalDigits(d.chars, digits, d.length);
    return d;
}

static inline void AppendZeros(std::string& out, int count)
{
    if (count > 0)
        out.append(static_cast<size_t>(count), '0');
}

// Appends the characters [first, last) of run.
static void AppendRange(std::string& out, const DigitRun& run, int first, int last)
{
    REALFLOAT_ASSERT(0 <= first);
    REALFLOAT_ASSERT(first <= last);
    REALFLOAT_ASSERT(last <= run.Length());

    const int head_first = run.leading_zeros;
    const int head_last = head_first + run.head_length;

    if (first < head_first)
    {
        const int n = std::min(last, head_first) - first;
        AppendZeros(out, n);
        first += n;
    }

    if (first < last && first < head_last)
    {
        const int n = std::min(last, head_last) - first;
        out.append(run.head + (first - head_first), static_cast<size_t>(n));
        first += n;
    }

    AppendZeros(out, last - first);
}

// Rounds the digit sequence (leading_zeros x '0') ++ d to its first `count` digits and stores the
// result in run. Sequences shorter than `count` are padded with zeros.
// Ties are rounded to an even last digit.
//
// Returns true if a carry propagated out of the first digit. The run then contains a '1'
// followed by `count` zeros.
static bool RoundDigits(DigitRun& run, const DigitString& d, int leading_zeros, int count)
{
    REALFLOAT_ASSERT(leading_zeros >= 0);
    REALFLOAT_ASSERT(count >= 0);

    const int n = d.length;

    run.leading_zeros = 0;
    run.head_length = 0;
    run.trailing_zeros = 0;

    if (count >= leading_zeros + n)
    {
        run.leading_zeros = leading_zeros;
        std::memcpy(run.head, d.chars, static_cast<size_t>(n));
        run.head_length = n;
        run.trailing_zeros = count - leading_zeros - n;
        return false;
    }

    if (count < leading_zeros)
    {
        // The first removed digit is a zero.
        run.leading_zeros = count;
        return false;
    }

    const int keep = count - leading_zeros; // 0 <= keep < n
    const int next = d.chars[keep] - '0';
    const bool rest_is_zero = std::all_of(d.chars + keep + 1, d.chars + n, [](char ch) { return ch == '0'; });
    const bool prev_is_even = keep == 0 || (d.chars[keep - 1] - '0') % 2 == 0;
    const bool round_up = next > 5 || (next == 5 && !(prev_is_even && rest_is_zero));

    run.leading_zeros = leading_zeros;
    std::memcpy(run.head, d.chars, static_cast<size_t>(keep));
    run.head_length = keep;

    if (!round_up)
        return false;

    int i = keep - 1;
    while (i >= 0 && run.head[i] == '9')
    {
        run.head[i] = '0';
        --i;
    }

    if (i >= 0)
    {
        ++run.head[i];
        return false;
    }

    // 99...9 + 1 = 100...0
    run.head[0] = '1';
    std::memset(run.head + 1, '0', static_cast<size_t>(keep));
    run.head_length = keep + 1;

    if (leading_zeros > 0)
    {
        // The carry is absorbed by the last leading zero.
        run.leading_zeros = leading_zeros - 1;
        return false;
    }

    return true;
}

//==================================================================================================
// Fixed
//==================================================================================================

template <typename Float>
static void AppendFixed(std::string& out, const DigitString& d, int32_t exponent, int precision)
{
    const int n = d.length;
    // Position of the decimal point relative to the first digit.
    const int point = n + exponent;

    if (precision == ShortestPrecision)
    {
        if (point <= 0)
        {
            // 0.[000]digits
            out += "0.";
            AppendZeros(out, -point);
            out.append(d.chars, static_cast<size_t>(n));
        }
        else if (point >= n)
        {
            // digits[000].0
            out.append(d.chars, static_cast<size_t>(n));
            AppendZeros(out, point - n);
            out += ".0";
        }
        else
        {
            // dig.its
            AppendBounded<MaxLength<Float>::Digits>(out, [&](char* buf) {
                std::memcpy(buf, d.chars, static_cast<size_t>(point));
                buf += point;
                *buf++ = '.';
                std::memcpy(buf, d.chars + point, static_cast<size_t>(n - point));
                return buf + (n - point);
            });
        }
        return;
    }

    REALFLOAT_ASSERT(precision >= 0);

    DigitRun run;
    if (point >= 0)
    {
        const bool carry = RoundDigits(run, d, 0, point + precision);
        const int int_digits = point + (carry ? 1 : 0);

        if (int_digits == 0)
            out.push_back('0');
        else
            AppendRange(out, run, 0, int_digits);

        if (precision > 0)
        {
            out.push_back('.');
            AppendRange(out, run, int_digits, int_digits + precision);
        }
    }
    else
    {
        // The value is < 1 and rounding cannot carry into the integer part:
        // a carry out of the digits is absorbed by one of the -point leading zeros.
        const bool carry = RoundDigits(run, d, -point, precision);
        REALFLOAT_ASSERT(!carry);
        static_cast<void>(carry);

        out.push_back('0');
        if (precision > 0)
        {
            out.push_back('.');
            AppendRange(out, run, 0, precision);
        }
    }
}

//==================================================================================================
// Scientific
//==================================================================================================

template <typename Float>
static int ExponentMinWidth(const FloatFormat& format)
{
    if (!format.zero_pad_exponent)
        return 1;
    if (format.exponent_width <= 0)
        return IEEE<Float>::ExponentDigits10;
    return std::min(format.exponent_width, 3);
}

template <typename Float>
static void AppendExponent(std::string& out, int exponent, const FloatFormat& format)
{
    const int min_width = ExponentMinWidth<Float>(format);

    AppendBounded<MaxLength<Float>::Scientific>(out, [&](char* buf) {
        *buf++ = format.exponent_char;
        return WriteExponent(buf, exponent, format.explicit_exponent_sign, min_width);
    });
}

template <typename Float>
static void AppendScientific(std::string& out, const DigitString& d, int32_t exponent, int precision, const FloatFormat& format)
{
    const int n = d.length;
    int scientific_exponent = n - 1 + exponent;

    if (precision == ShortestPrecision)
    {
        // d.igitsE+123
        const int min_width = ExponentMinWidth<Float>(format);

        AppendBounded<MaxLength<Float>::Scientific>(out, [&](char* buf) {
            *buf++ = d.chars[0];
            *buf++ = '.';
            if (n == 1)
            {
                *buf++ = '0';
            }
            else
            {
                std::memcpy(buf, d.chars + 1, static_cast<size_t>(n - 1));
                buf += n - 1;
            }
            *buf++ = format.exponent_char;
            return WriteExponent(buf, scientific_exponent, format.explicit_exponent_sign, min_width);
        });
        return;
    }

    REALFLOAT_ASSERT(precision >= 0);

    DigitRun run;
    if (RoundDigits(run, d, 0, precision + 1))
    {
        // 9.99e1 => 10.0e1 => 1.00e2
        ++scientific_exponent;
    }

    AppendRange(out, run, 0, 1);
    if (precision > 0)
    {
        out.push_back('.');
        AppendRange(out, run, 1, precision + 1);
    }

    AppendExponent<Float>(out, scientific_exponent, format);
}

//==================================================================================================
// Generic, Shortest
//==================================================================================================

template <typename Float>
static void AppendGeneric(std::string& out, const DigitString& d, int32_t exponent, const FloatFormat& format)
{
    // value = 0.digits * 10^point
    const int point = d.length + exponent;

    if (format.low_threshold <= point && point <= format.high_threshold)
        AppendFixed<Float>(out, d, exponent, ShortestPrecision);
    else
        AppendScientific<Float>(out, d, exponent, ShortestPrecision, format);
}

// Stores the integer part of the decomposed value in integer.
// Returns false if it does not fit into bits_type.
template <typename Float>
static bool IntegerPart(const Decomposed<Float>& decomposed, typename IEEE<Float>::bits_type& integer)
{
    using bits_type = typename IEEE<Float>::bits_type;

    constexpr int32_t Bits = std::numeric_limits<bits_type>::digits;

    const bits_type significand = decomposed.significand;
    const int32_t e2 = decomposed.exponent;

    if (e2 < 0)
    {
        integer = (-e2 < Bits) ? static_cast<bits_type>(significand >> -e2) : 0;
        return true;
    }

    if (e2 >= Bits || (e2 > 0 && (significand >> (Bits - e2)) != 0))
        return false;

    integer = static_cast<bits_type>(significand << e2);
    return true;
}

template <typename Float>
static void AppendShortest(std::string& out, const Decomposed<Float>& decomposed, const DigitString& d, int32_t exponent, const FloatFormat& format)
{
    using bits_type = typename IEEE<Float>::bits_type;

    const int n = d.length;

    // Use fixed notation iff it is not longer than scientific notation.
    const bool use_fixed = (exponent >= 0)
        ? (n + 2 >= exponent || (n == 1 && exponent <= 2))
        : (n + exponent >= -3 || (n == 1 && exponent >= -2));

    if (!use_fixed)
    {
        AppendScientific<Float>(out, d, exponent, ShortestPrecision, format);
    }
    else if (exponent >= 0)
    {
        bits_type integer = 0;
        if (IntegerPart(decomposed, integer) && integer != 0)
        {
            // The exact integer, not the shortest digits.
            AppendBounded<std::numeric_limits<bits_type>::digits10 + 1>(out, [&](char* buf) {
                const int length = DecimalLength(integer);
                PrintDecimalDigits(buf, integer, length);
                return buf + length;
            });
        }
        else
        {
            // digits[000]
            out.append(d.chars, static_cast<size_t>(n));
            AppendZeros(out, exponent);
        }
    }
    else
    {
        AppendFixed<Float>(out, d, exponent, ShortestPrecision);
    }
}

//==================================================================================================
// RenderDecimal
//==================================================================================================

template <typename Float>
static void RenderDecimalImpl(std::string& out, const Decomposed<Float>& decomposed, const DecimalValue<Float>& value, const FloatFormat& format)
{
    REALFLOAT_ASSERT(decomposed.category == FloatCategory::finite);

    const DigitString d = MakeDigitString(value.digits);

    if (decomposed.sign)
        out.push_back('-');

    switch (format.kind)
    {
    case FormatKind::fixed:
        AppendFixed<Float>(out, d, value.exponent, format.precision);
        break;
    case FormatKind::scientific:
        AppendScientific<Float>(out, d, value.exponent, format.precision, format);
        break;
    case FormatKind::generic:
        AppendGeneric<Float>(out, d, value.exponent, format);
        break;
    case FormatKind::shortest:
        AppendShortest<Float>(out, decomposed, d, value.exponent, format);
        break;
    }
}

void realfloat::RenderDecimal(std::string& out, const Decomposed<float>& decomposed, const DecimalValue<float>& value, const FloatFormat& format)
{
    RenderDecimalImpl(out, decomposed, value, format);
}

void realfloat::RenderDecimal(std::string& out, const Decomposed<double>& decomposed, const DecimalValue<double>& value, const FloatFormat& format)
{
    RenderDecimalImpl(out, decomposed, value, format);
}
