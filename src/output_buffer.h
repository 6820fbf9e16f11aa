// Copyright 2020 Ulf Adams
// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "ieee.h"

#include <cstddef>
#include <string>

namespace realfloat {
namespace impl {

// Appends the characters produced by writer to out.
// The writer is called as `char* writer(char* first)` and must write at most MaxLength characters
// starting at first. It returns one past the last character written.
template <int MaxLength, typename Writer>
inline void AppendBounded(std::string& out, Writer&& writer)
{
    static_assert(MaxLength > 0, "invalid length");

    const size_t pos = out.size();
    out.resize(pos + MaxLength);

    char* const first = &out[pos];
    char* const last = writer(first);
    REALFLOAT_ASSERT(last >= first);
    REALFLOAT_ASSERT(last - first <= MaxLength);

    out.resize(pos + static_cast<size_t>(last - first));
}

} // namespace impl
} // namespace realfloat
