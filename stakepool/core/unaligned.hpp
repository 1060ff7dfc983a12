// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#pragma once

#include <stakepool/core/byte_string.hpp>
#include <stakepool/core/config.hpp>

#include <algorithm>
#include <array>
#include <bit>
#include <type_traits>

STAKEPOOL_NAMESPACE_BEGIN

// Byte order is the host's, which config.hpp requires to be little endian

template <typename T>
    requires std::is_trivially_copyable_v<T>
[[nodiscard]] constexpr T unaligned_load(unsigned char const *const buf)
{
    std::array<unsigned char, sizeof(T)> data;
    std::copy_n(buf, sizeof(T), data.data());
    return std::bit_cast<T>(data);
}

template <typename T>
    requires std::is_trivially_copyable_v<T>
void unaligned_append(byte_string &out, T const &value)
{
    auto const data =
        std::bit_cast<std::array<unsigned char, sizeof(T)>>(value);
    out.append(data.data(), data.size());
}

STAKEPOOL_NAMESPACE_END
