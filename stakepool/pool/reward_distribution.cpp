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

#include <stakepool/core/assert.h>
#include <stakepool/core/likely.h>
#include <stakepool/pool/pool_error.hpp>
#include <stakepool/pool/reward_distribution.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

STAKEPOOL_POOL_NAMESPACE_BEGIN

uint64_t RewardDistribution::sum_all() const noexcept
{
    // 4 * u32 always fits in u64
    return uint64_t{treasury_fee} + uint64_t{validation_fee} +
           uint64_t{developer_fee} + uint64_t{appreciation};
}

Rational RewardDistribution::treasury_fraction() const noexcept
{
    return Rational{.numerator = treasury_fee, .denominator = sum_all()};
}

Rational RewardDistribution::validation_fraction() const noexcept
{
    return Rational{.numerator = validation_fee, .denominator = sum_all()};
}

Rational RewardDistribution::developer_fraction() const noexcept
{
    return Rational{.numerator = developer_fee, .denominator = sum_all()};
}

Result<void> RewardDistribution::validate() const
{
    if (STAKEPOOL_UNLIKELY(sum_all() == 0)) {
        return PoolError::InvalidFeeAmount;
    }
    return outcome::success();
}

Result<Fees> RewardDistribution::split_reward(
    BaseAmount const amount, uint64_t const num_validators) const
{
    BOOST_OUTCOME_TRY(
        auto const treasury_amount,
        calculation(checked_mul(amount, treasury_fraction())));
    BOOST_OUTCOME_TRY(
        auto const developer_amount,
        calculation(checked_mul(amount, developer_fraction())));

    // The validation fee is split evenly; the remainder of the division is
    // not lost, it ends up in the appreciation remainder below.
    BOOST_OUTCOME_TRY(
        auto const validation_amount,
        calculation(checked_mul(amount, validation_fraction())));
    BOOST_OUTCOME_TRY(
        auto const reward_per_validator,
        calculation(checked_div(validation_amount, num_validators)));

    // Every fee is rounded down, so their sum never exceeds the amount.
    // Only overflow of the sum itself is reported as an error.
    BOOST_OUTCOME_TRY(
        auto const validation_paid,
        calculation(STAKEPOOL_NAMESPACE::checked_mul(
            reward_per_validator.value, num_validators)));
    BOOST_OUTCOME_TRY(
        auto const fees_subtotal,
        calculation(checked_add(treasury_amount, developer_amount)));
    BOOST_OUTCOME_TRY(
        auto const fees_total,
        calculation(checked_add(fees_subtotal, BaseAmount{validation_paid})));
    STAKEPOOL_ASSERT(
        fees_total <= amount, "fees must never exceed the split amount");

    return Fees{
        .treasury_amount = treasury_amount,
        .reward_per_validator = reward_per_validator,
        .developer_amount = developer_amount,
        .appreciation_amount = BaseAmount{amount.value - fees_total.value},
    };
}

STAKEPOOL_POOL_NAMESPACE_END
