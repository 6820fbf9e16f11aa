// Copyright 2020 Ulf Adams
// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "realfloat.h"
#include "to_chars.h"

#include <string>

using namespace realfloat;

template <typename Float>
static inline void AppendFloating(std::string& out, const FloatFormat& format, Float value)
{
    const auto decomposed = Decompose(value);

    const std::string* special = FindSpecialString(format.specials, decomposed);
    if (special != nullptr)
    {
        out += *special;
        return;
    }

    const auto decimal = ShortestDecimal(decomposed, format.bounds);
    RenderDecimal(out, decomposed, decimal, format);
}

void realfloat::AppendFloat(std::string& out, const FloatFormat& format, float value)
{
    AppendFloating(out, format, value);
}

void realfloat::AppendDouble(std::string& out, const FloatFormat& format, double value)
{
    AppendFloating(out, format, value);
}

std::string realfloat::FormatFloat(const FloatFormat& format, float value)
{
    std::string str;
    AppendFloating(str, format, value);
    return str;
}

std::string realfloat::FormatDouble(const FloatFormat& format, double value)
{
    std::string str;
    AppendFloating(str, format, value);
    return str;
}

std::string realfloat::FloatDecimal(float value)
{
    static const FloatFormat format = Generic();
    return FormatFloat(format, value);
}

std::string realfloat::DoubleDecimal(double value)
{
    static const FloatFormat format = Generic();
    return FormatDouble(format, value);
}
