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

#include <stakepool/pool/pool_error.hpp>
#include <stakepool/pool/reward_distribution.hpp>

#include <gtest/gtest.h>

#include <cstdint>

using namespace stakepool;
using namespace stakepool::pool;

namespace
{
    constexpr RewardDistribution WEIGHTS{
        .treasury_fee = 3,
        .validation_fee = 2,
        .developer_fee = 1,
        .appreciation = 0};
}

TEST(RewardDistribution, single_validator)
{
    auto const fees = WEIGHTS.split_reward(BaseAmount{600}, 1);
    ASSERT_FALSE(fees.has_error());
    EXPECT_EQ(
        fees.value(),
        (Fees{
            .treasury_amount = BaseAmount{300},
            .reward_per_validator = BaseAmount{200},
            .developer_amount = BaseAmount{100},
            .appreciation_amount = BaseAmount{0}}));
}

TEST(RewardDistribution, rounding_goes_to_appreciation)
{
    auto const fees = WEIGHTS.split_reward(BaseAmount{1000}, 4);
    ASSERT_FALSE(fees.has_error());
    EXPECT_EQ(
        fees.value(),
        (Fees{
            .treasury_amount = BaseAmount{500},
            .reward_per_validator = BaseAmount{83},
            .developer_amount = BaseAmount{166},
            .appreciation_amount = BaseAmount{2}}));
}

TEST(RewardDistribution, buckets_sum_to_amount)
{
    RewardDistribution const weights{
        .treasury_fee = 7,
        .validation_fee = 13,
        .developer_fee = 5,
        .appreciation = 75};
    for (uint64_t amount = 0; amount < 2'000; amount += 7) {
        for (uint64_t n = 1; n <= 9; ++n) {
            auto const fees = weights.split_reward(BaseAmount{amount}, n);
            ASSERT_FALSE(fees.has_error());
            auto const &f = fees.value();
            EXPECT_EQ(
                f.treasury_amount.value + f.developer_amount.value +
                    f.reward_per_validator.value * n +
                    f.appreciation_amount.value,
                amount);
        }
    }
}

TEST(RewardDistribution, validate)
{
    EXPECT_FALSE(WEIGHTS.validate().has_error());
    EXPECT_EQ(
        RewardDistribution{}.validate().assume_error(),
        PoolError::InvalidFeeAmount);
    EXPECT_EQ(WEIGHTS.sum_all(), 6);
}

TEST(RewardDistribution, zero_validators)
{
    EXPECT_EQ(
        WEIGHTS.split_reward(BaseAmount{100}, 0).assume_error(),
        PoolError::CalculationFailure);
}
