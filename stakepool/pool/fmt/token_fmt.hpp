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

#include <stakepool/core/basic_formatter.hpp>
#include <stakepool/pool/token.hpp>

#include <quill/Quill.h>

template <typename Tag>
struct quill::copy_loggable<stakepool::pool::Amount<Tag>> : std::true_type
{
};

template <typename Tag>
struct fmt::formatter<stakepool::pool::Amount<Tag>>
    : public stakepool::BasicFormatter
{
    template <typename FormatContext>
    auto
    format(stakepool::pool::Amount<Tag> const &value, FormatContext &ctx) const
    {
        fmt::format_to(ctx.out(), "{}", value.value);
        return ctx.out();
    }
};
