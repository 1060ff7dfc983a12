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
#include <stakepool/pool/exchange_rate.hpp>
#include <stakepool/pool/fmt/token_fmt.hpp>

#include <quill/Quill.h>

template <>
struct quill::copy_loggable<stakepool::pool::ExchangeRate> : std::true_type
{
};

template <>
struct fmt::formatter<stakepool::pool::ExchangeRate>
    : public stakepool::BasicFormatter
{
    template <typename FormatContext>
    auto
    format(stakepool::pool::ExchangeRate const &r, FormatContext &ctx) const
    {
        if (!r.frozen) {
            fmt::format_to(ctx.out(), "ExchangeRate{{never updated}}");
            return ctx.out();
        }
        fmt::format_to(
            ctx.out(),
            "ExchangeRate{{"
            "Epoch={} "
            "Share Supply={} "
            "Base Balance={}"
            "}}",
            r.computed_in_epoch,
            r.share_supply,
            r.base_balance);
        return ctx.out();
    }
};
