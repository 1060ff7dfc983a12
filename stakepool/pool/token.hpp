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

#include <stakepool/core/checked_math.hpp>
#include <stakepool/core/result.hpp>
#include <stakepool/pool/config.hpp>

#include <boost/outcome/try.hpp>

#include <compare>
#include <cstdint>

STAKEPOOL_POOL_NAMESPACE_BEGIN

// A dimensionless scale factor. Multiplying an amount by it computes
// floor(amount * numerator / denominator).
struct Rational
{
    uint64_t numerator;
    uint64_t denominator;
};

// Token amounts in the smallest unit. The tag keeps amounts of different
// tokens from being mixed up; converting between them goes through the
// exchange rate.
template <typename Tag>
struct Amount
{
    uint64_t value{0};

    constexpr Amount() = default;

    constexpr explicit Amount(uint64_t const v) noexcept
        : value{v}
    {
    }

    friend constexpr auto
    operator<=>(Amount const &, Amount const &) noexcept = default;
};

struct BaseTokenTag;
struct ShareTokenTag;

// Amount of the staked base token
using BaseAmount = Amount<BaseTokenTag>;

// Amount of the pool-share token
using ShareAmount = Amount<ShareTokenTag>;

static_assert(sizeof(BaseAmount) == sizeof(uint64_t));
static_assert(sizeof(ShareAmount) == sizeof(uint64_t));

template <typename Tag>
Result<Amount<Tag>> checked_add(Amount<Tag> const x, Amount<Tag> const y)
{
    BOOST_OUTCOME_TRY(
        auto const sum, STAKEPOOL_NAMESPACE::checked_add(x.value, y.value));
    return Amount<Tag>{sum};
}

template <typename Tag>
Result<Amount<Tag>> checked_sub(Amount<Tag> const x, Amount<Tag> const y)
{
    BOOST_OUTCOME_TRY(
        auto const diff, STAKEPOOL_NAMESPACE::checked_sub(x.value, y.value));
    return Amount<Tag>{diff};
}

template <typename Tag>
Result<Amount<Tag>> checked_mul(Amount<Tag> const x, Rational const &r)
{
    BOOST_OUTCOME_TRY(
        auto const scaled,
        STAKEPOOL_NAMESPACE::checked_mul_div(
            x.value, r.numerator, r.denominator));
    return Amount<Tag>{scaled};
}

// The remainder is dropped; callers account for it separately.
template <typename Tag>
Result<Amount<Tag>> checked_div(Amount<Tag> const x, uint64_t const n)
{
    BOOST_OUTCOME_TRY(
        auto const quotient, STAKEPOOL_NAMESPACE::checked_div(x.value, n));
    return Amount<Tag>{quotient};
}

STAKEPOOL_POOL_NAMESPACE_END
