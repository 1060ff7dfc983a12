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

#include <stakepool/core/bytes.hpp>
#include <stakepool/pool/pool.hpp>
#include <stakepool/pool/pool_error.hpp>
#include <stakepool/pool/pool_state.hpp>

#include <gtest/gtest.h>

#include <cstdint>

using namespace stakepool;
using namespace stakepool::pool;

namespace
{
    Pubkey const MANAGER{0xA1};
    Pubkey const MAINTAINER{0xB1};
    Pubkey const STRANGER{0xC1};
    Pubkey const VALIDATOR_A{0x1001};
    Pubkey const VALIDATOR_B{0x1002};
    Pubkey const FEE_A{0x2001};
    Pubkey const FEE_B{0x2002};

    PoolConfig make_config()
    {
        return PoolConfig{
            .manager = MANAGER,
            .share_mint = Pubkey{0xD1},
            .fee_recipients =
                {.treasury_account = Pubkey{0xE1},
                 .developer_account = Pubkey{0xE2}},
            .reward_distribution =
                {.treasury_fee = 3,
                 .validation_fee = 2,
                 .developer_fee = 1,
                 .appreciation = 0},
            .max_validators = 4,
            .max_maintainers = 2,
        };
    }
}

struct Pool : public ::testing::Test
{
    PoolState state{StakePool::initialize(make_config()).value()};
    StakePool pool{state};

    void SetUp() override
    {
        ASSERT_FALSE(pool.add_maintainer(MANAGER, MAINTAINER).has_error());
        ASSERT_FALSE(
            pool.add_validator(MANAGER, VALIDATOR_A, FEE_A).has_error());
        ASSERT_FALSE(
            pool.add_validator(MANAGER, VALIDATOR_B, FEE_B).has_error());
    }

    Validator const &validator(Pubkey const &vote) const
    {
        return *state.validators.get(vote).value();
    }
};

TEST(PoolInit, layout)
{
    auto const state = StakePool::initialize(make_config());
    ASSERT_FALSE(state.has_error());
    EXPECT_EQ(state.value().validators.capacity(), 4);
    EXPECT_EQ(state.value().maintainers.capacity(), 2);
    EXPECT_TRUE(state.value().validators.empty());
    EXPECT_EQ(state.value().exchange_rate, ExchangeRate{});
    EXPECT_EQ(
        state.value().required_bytes(),
        358 + (8 + 4 * 121) + (8 + 2 * 32));
}

TEST(PoolInit, rejects_zero_weights)
{
    auto config = make_config();
    config.reward_distribution = RewardDistribution{};
    EXPECT_EQ(
        StakePool::initialize(config).assume_error(),
        PoolError::InvalidFeeAmount);
}

TEST_F(Pool, manager_gate)
{
    auto const before = state;
    EXPECT_EQ(
        pool.add_validator(STRANGER, Pubkey{0x1003}, FEE_A).assume_error(),
        PoolError::InvalidManager);
    EXPECT_EQ(
        pool.deactivate_validator(STRANGER, VALIDATOR_A).assume_error(),
        PoolError::InvalidManager);
    EXPECT_EQ(
        pool.add_maintainer(MAINTAINER, STRANGER).assume_error(),
        PoolError::InvalidManager);
    EXPECT_EQ(
        pool.change_reward_distribution(
                STRANGER, RewardDistribution{.appreciation = 1})
            .assume_error(),
        PoolError::InvalidManager);
    EXPECT_EQ(state, before);
}

TEST_F(Pool, maintainer_gate)
{
    auto const before = state;
    EXPECT_EQ(
        pool.stake_deposit(
                STRANGER, VALIDATOR_A, BaseAmount{10}, BaseAmount{10})
            .assume_error(),
        PoolError::InvalidMaintainer);
    EXPECT_EQ(
        pool.unstake(MANAGER, VALIDATOR_A, BaseAmount{10}).assume_error(),
        PoolError::InvalidMaintainer);
    EXPECT_EQ(state, before);
}

TEST_F(Pool, maintainers)
{
    EXPECT_EQ(
        pool.add_maintainer(MANAGER, MAINTAINER).assume_error(),
        PoolError::DuplicatedEntry);
    EXPECT_FALSE(pool.add_maintainer(MANAGER, STRANGER).has_error());
    EXPECT_EQ(
        pool.add_maintainer(MANAGER, Pubkey{0xC2}).assume_error(),
        PoolError::MaximumNumberOfAccountsExceeded);
    EXPECT_FALSE(pool.remove_maintainer(MANAGER, STRANGER).has_error());
    EXPECT_EQ(
        pool.remove_maintainer(MANAGER, STRANGER).assume_error(),
        PoolError::InvalidAccountMember);
}

TEST_F(Pool, change_reward_distribution)
{
    EXPECT_EQ(
        pool.change_reward_distribution(MANAGER, RewardDistribution{})
            .assume_error(),
        PoolError::InvalidFeeAmount);
    RewardDistribution const weights{
        .treasury_fee = 1,
        .validation_fee = 1,
        .developer_fee = 1,
        .appreciation = 7};
    EXPECT_FALSE(pool.change_reward_distribution(MANAGER, weights).has_error());
    EXPECT_EQ(state.reward_distribution, weights);
}

TEST_F(Pool, deposit)
{
    EXPECT_EQ(
        pool.deposit(BaseAmount{0}).assume_error(), PoolError::InvalidAmount);
    EXPECT_EQ(pool.deposit(BaseAmount{100}).value(), ShareAmount{100});
    EXPECT_EQ(state.metrics.deposit_amount.total, BaseAmount{100});
    EXPECT_EQ(state.metrics.deposit_amount.counts[0], 1);

    // Deposits use the rate frozen for the epoch
    ASSERT_FALSE(
        pool.update_exchange_rate(1, BaseAmount{200}, ShareAmount{100})
            .has_error());
    EXPECT_EQ(pool.deposit(BaseAmount{100}).value(), ShareAmount{50});
}

TEST_F(Pool, deposit_rounding_to_zero_shares)
{
    ASSERT_FALSE(
        pool.update_exchange_rate(1, BaseAmount{200}, ShareAmount{100})
            .has_error());
    auto const before = state;
    EXPECT_EQ(
        pool.deposit(BaseAmount{1}).assume_error(), PoolError::InvalidAmount);
    EXPECT_EQ(state, before);
    EXPECT_EQ(pool.deposit(BaseAmount{2}).value(), ShareAmount{1});
}

TEST_F(Pool, collect_before_first_freeze)
{
    auto const before = state;
    EXPECT_FALSE(state.exchange_rate.frozen);
    EXPECT_EQ(
        pool.collect_validator_fee(VALIDATOR_A, 0, BaseAmount{600})
            .assume_error(),
        PoolError::ExchangeRateNotUpdatedInThisEpoch);
    EXPECT_EQ(state, before);
}

TEST_F(Pool, first_freeze_in_epoch_zero)
{
    ASSERT_FALSE(
        pool.update_exchange_rate(0, BaseAmount{1000}, ShareAmount{1000})
            .has_error());
    EXPECT_TRUE(state.exchange_rate.frozen);
    EXPECT_EQ(state.exchange_rate.computed_in_epoch, 0);
    EXPECT_EQ(
        pool.update_exchange_rate(0, BaseAmount{5}, ShareAmount{5})
            .assume_error(),
        PoolError::ExchangeRateAlreadyUpToDate);
    EXPECT_FALSE(
        pool.collect_validator_fee(VALIDATOR_A, 0, BaseAmount{600})
            .has_error());
}

TEST_F(Pool, exchange_rate_ordering)
{
    EXPECT_EQ(
        pool.collect_validator_fee(VALIDATOR_A, 1, BaseAmount{600})
            .assume_error(),
        PoolError::ExchangeRateNotUpdatedInThisEpoch);

    ASSERT_FALSE(
        pool.update_exchange_rate(1, BaseAmount{1000}, ShareAmount{1000})
            .has_error());
    EXPECT_EQ(
        pool.update_exchange_rate(1, BaseAmount{5}, ShareAmount{5})
            .assume_error(),
        PoolError::ExchangeRateAlreadyUpToDate);
    EXPECT_EQ(state.exchange_rate.base_balance, BaseAmount{1000});

    EXPECT_FALSE(
        pool.collect_validator_fee(VALIDATOR_A, 1, BaseAmount{600})
            .has_error());
    EXPECT_EQ(
        pool.collect_validator_fee(VALIDATOR_A, 2, BaseAmount{600})
            .assume_error(),
        PoolError::ExchangeRateNotUpdatedInThisEpoch);
}

TEST_F(Pool, rewards_and_deposits_commute_within_epoch)
{
    ASSERT_FALSE(
        pool.update_exchange_rate(1, BaseAmount{1500}, ShareAmount{1000})
            .has_error());

    PoolState a_first = state;
    StakePool a_first_pool{a_first};
    ASSERT_FALSE(
        a_first_pool.collect_validator_fee(VALIDATOR_A, 1, BaseAmount{600})
            .has_error());
    auto const a_first_shares = a_first_pool.deposit(BaseAmount{300});
    ASSERT_FALSE(
        a_first_pool.collect_validator_fee(VALIDATOR_B, 1, BaseAmount{900})
            .has_error());

    PoolState b_first = state;
    StakePool b_first_pool{b_first};
    ASSERT_FALSE(
        b_first_pool.collect_validator_fee(VALIDATOR_B, 1, BaseAmount{900})
            .has_error());
    auto const b_first_shares = b_first_pool.deposit(BaseAmount{300});
    ASSERT_FALSE(
        b_first_pool.collect_validator_fee(VALIDATOR_A, 1, BaseAmount{600})
            .has_error());

    ASSERT_FALSE(a_first_shares.has_error());
    ASSERT_FALSE(b_first_shares.has_error());
    EXPECT_EQ(a_first_shares.value(), ShareAmount{200});
    EXPECT_EQ(a_first_shares.value(), b_first_shares.value());
    EXPECT_EQ(a_first, b_first);
    EXPECT_NE(a_first, state);
}

TEST_F(Pool, exchange_rate_counts_stake_and_credit)
{
    ASSERT_FALSE(
        pool.stake_deposit(
                MAINTAINER, VALIDATOR_A, BaseAmount{300}, BaseAmount{1000})
            .has_error());
    ASSERT_FALSE(
        pool.update_exchange_rate(1, BaseAmount{700}, ShareAmount{1000})
            .has_error());
    ASSERT_FALSE(
        pool.collect_validator_fee(VALIDATOR_A, 1, BaseAmount{600})
            .has_error());

    // 100 shares of credit for each of the two validators
    ASSERT_FALSE(
        pool.update_exchange_rate(2, BaseAmount{1300}, ShareAmount{1400})
            .has_error());
    EXPECT_EQ(
        state.exchange_rate,
        (ExchangeRate{
            .computed_in_epoch = 2,
            .share_supply = ShareAmount{1600},
            .base_balance = BaseAmount{1600}}));
}

TEST_F(Pool, collect_validator_fee)
{
    ASSERT_FALSE(
        pool.update_exchange_rate(1, BaseAmount{1000}, ShareAmount{1000})
            .has_error());

    auto const collected =
        pool.collect_validator_fee(VALIDATOR_A, 1, BaseAmount{600});
    ASSERT_FALSE(collected.has_error());
    EXPECT_EQ(collected.value().num_validators, 2);
    EXPECT_EQ(collected.value().fees.treasury_amount, BaseAmount{300});
    EXPECT_EQ(collected.value().fees.reward_per_validator, BaseAmount{100});
    EXPECT_EQ(collected.value().treasury_shares, ShareAmount{300});
    EXPECT_EQ(collected.value().developer_shares, ShareAmount{100});
    EXPECT_EQ(validator(VALIDATOR_A).fee_credit, ShareAmount{100});
    EXPECT_EQ(validator(VALIDATOR_B).fee_credit, ShareAmount{100});

    // Inactive validators earn nothing
    ASSERT_FALSE(pool.deactivate_validator(MANAGER, VALIDATOR_B).has_error());
    ASSERT_FALSE(
        pool.collect_validator_fee(VALIDATOR_B, 1, BaseAmount{600})
            .has_error());
    EXPECT_EQ(validator(VALIDATOR_A).fee_credit, ShareAmount{300});
    EXPECT_EQ(validator(VALIDATOR_B).fee_credit, ShareAmount{100});

    EXPECT_EQ(state.metrics.fee_treasury_base_total, BaseAmount{600});
    EXPECT_EQ(state.metrics.fee_validation_base_total, BaseAmount{400});
    EXPECT_EQ(state.metrics.fee_validation_share_total, ShareAmount{400});
}

TEST_F(Pool, collect_needs_active_validators)
{
    ASSERT_FALSE(
        pool.update_exchange_rate(1, BaseAmount{1000}, ShareAmount{1000})
            .has_error());
    ASSERT_FALSE(pool.deactivate_validator(MANAGER, VALIDATOR_A).has_error());
    ASSERT_FALSE(pool.deactivate_validator(MANAGER, VALIDATOR_B).has_error());
    auto const before = state;
    EXPECT_EQ(
        pool.collect_validator_fee(VALIDATOR_A, 1, BaseAmount{600})
            .assume_error(),
        PoolError::NoActiveValidators);
    EXPECT_EQ(
        pool.collect_validator_fee(STRANGER, 1, BaseAmount{600}).assume_error(),
        PoolError::InvalidAccountMember);
    EXPECT_EQ(state, before);
}

TEST_F(Pool, claim_validator_fee)
{
    ASSERT_FALSE(
        pool.update_exchange_rate(1, BaseAmount{1000}, ShareAmount{1000})
            .has_error());
    ASSERT_FALSE(
        pool.collect_validator_fee(VALIDATOR_A, 1, BaseAmount{600})
            .has_error());

    auto const claim = pool.claim_validator_fee(VALIDATOR_B);
    ASSERT_FALSE(claim.has_error());
    EXPECT_EQ(claim.value().fee_address, FEE_B);
    EXPECT_EQ(claim.value().amount, ShareAmount{100});
    EXPECT_EQ(validator(VALIDATOR_B).fee_credit, ShareAmount{0});
    EXPECT_EQ(
        pool.claim_validator_fee(VALIDATOR_B).assume_error(),
        PoolError::InvalidAmount);
}

TEST_F(Pool, stake_deposit_balances_validators)
{
    EXPECT_EQ(
        pool.stake_deposit(
                MAINTAINER, VALIDATOR_A, BaseAmount{0}, BaseAmount{10})
            .assume_error(),
        PoolError::InvalidAmount);
    EXPECT_EQ(
        pool.stake_deposit(
                MAINTAINER, VALIDATOR_A, BaseAmount{11}, BaseAmount{10})
            .assume_error(),
        PoolError::AmountExceedsReserve);

    EXPECT_EQ(
        pool.stake_deposit(
                MAINTAINER, VALIDATOR_A, BaseAmount{100}, BaseAmount{500})
            .value(),
        0);
    auto const before = state;
    EXPECT_EQ(
        pool.stake_deposit(
                MAINTAINER, VALIDATOR_A, BaseAmount{100}, BaseAmount{400})
            .assume_error(),
        PoolError::ValidatorWithLessStakeExists);
    EXPECT_EQ(state, before);

    EXPECT_EQ(
        pool.stake_deposit(
                MAINTAINER, VALIDATOR_B, BaseAmount{150}, BaseAmount{400})
            .value(),
        0);
    EXPECT_EQ(
        pool.stake_deposit(
                MAINTAINER, VALIDATOR_A, BaseAmount{100}, BaseAmount{250})
            .value(),
        1);
    EXPECT_EQ(validator(VALIDATOR_A).stake_accounts_balance, BaseAmount{200});
    EXPECT_EQ(
        validator(VALIDATOR_A).stake_seeds, (SeedRange{.begin = 0, .end = 2}));
}

TEST_F(Pool, stake_deposit_to_inactive)
{
    ASSERT_FALSE(pool.deactivate_validator(MANAGER, VALIDATOR_A).has_error());
    EXPECT_EQ(
        pool.stake_deposit(
                MAINTAINER, VALIDATOR_A, BaseAmount{10}, BaseAmount{10})
            .assume_error(),
        PoolError::StakeToInactiveValidator);

    // Inactive validators do not count when looking for the smallest one
    ASSERT_FALSE(
        pool.stake_deposit(
                MAINTAINER, VALIDATOR_B, BaseAmount{10}, BaseAmount{10})
            .has_error());
    EXPECT_FALSE(
        pool.stake_deposit(
                MAINTAINER, VALIDATOR_B, BaseAmount{10}, BaseAmount{10})
            .has_error());
}

TEST_F(Pool, merge_stake)
{
    EXPECT_EQ(
        pool.merge_stake(VALIDATOR_A).assume_error(),
        PoolError::WrongStakeState);
    ASSERT_FALSE(
        pool.stake_deposit(
                MAINTAINER, VALIDATOR_A, BaseAmount{10}, BaseAmount{100})
            .has_error());
    ASSERT_FALSE(
        pool.stake_deposit(
                MAINTAINER, VALIDATOR_B, BaseAmount{10}, BaseAmount{100})
            .has_error());
    ASSERT_FALSE(
        pool.stake_deposit(
                MAINTAINER, VALIDATOR_A, BaseAmount{10}, BaseAmount{100})
            .has_error());

    auto const merge = pool.merge_stake(VALIDATOR_A);
    ASSERT_FALSE(merge.has_error());
    EXPECT_EQ(merge.value().from_seed, 0);
    EXPECT_EQ(merge.value().to_seed, 1);
    EXPECT_EQ(
        validator(VALIDATOR_A).stake_seeds, (SeedRange{.begin = 1, .end = 2}));
    EXPECT_EQ(validator(VALIDATOR_A).stake_accounts_balance, BaseAmount{20});
}

TEST_F(Pool, unstake)
{
    ASSERT_FALSE(
        pool.stake_deposit(
                MAINTAINER, VALIDATOR_A, BaseAmount{100}, BaseAmount{100})
            .has_error());
    EXPECT_EQ(
        pool.unstake(MAINTAINER, VALIDATOR_A, BaseAmount{101}).assume_error(),
        PoolError::InvalidAmount);

    for (uint64_t seed = 0; seed < MAXIMUM_UNSTAKE_ACCOUNTS; ++seed) {
        EXPECT_EQ(
            pool.unstake(MAINTAINER, VALIDATOR_A, BaseAmount{10}).value(),
            seed);
    }
    EXPECT_EQ(
        pool.unstake(MAINTAINER, VALIDATOR_A, BaseAmount{10}).assume_error(),
        PoolError::MaxUnstakeAccountsReached);
    EXPECT_EQ(validator(VALIDATOR_A).unstake_accounts_balance, BaseAmount{30});
    EXPECT_EQ(validator(VALIDATOR_A).stake_accounts_balance, BaseAmount{100});
    EXPECT_EQ(validator(VALIDATOR_A).effective_stake_balance(), BaseAmount{70});
}

TEST_F(Pool, withdraw)
{
    ASSERT_FALSE(
        pool.stake_deposit(
                MAINTAINER, VALIDATOR_A, BaseAmount{100}, BaseAmount{150})
            .has_error());
    ASSERT_FALSE(
        pool.stake_deposit(
                MAINTAINER, VALIDATOR_B, BaseAmount{50}, BaseAmount{50})
            .has_error());
    ASSERT_FALSE(
        pool.update_exchange_rate(1, BaseAmount{0}, ShareAmount{150})
            .has_error());

    EXPECT_EQ(
        pool.withdraw(VALIDATOR_A, ShareAmount{0}).assume_error(),
        PoolError::InvalidAmount);
    EXPECT_EQ(
        pool.withdraw(VALIDATOR_B, ShareAmount{10}).assume_error(),
        PoolError::ValidatorWithMoreStakeExists);

    auto const out = pool.withdraw(VALIDATOR_A, ShareAmount{30});
    ASSERT_FALSE(out.has_error());
    EXPECT_EQ(out.value().shares_burned, ShareAmount{30});
    EXPECT_EQ(out.value().base_amount, BaseAmount{30});
    EXPECT_EQ(out.value().stake_seed, 0);
    EXPECT_EQ(validator(VALIDATOR_A).stake_accounts_balance, BaseAmount{70});
    EXPECT_EQ(state.metrics.withdraw_amount.count, 1);

    auto const before = state;
    EXPECT_EQ(
        pool.withdraw(VALIDATOR_A, ShareAmount{80}).assume_error(),
        PoolError::InvalidAmount);
    EXPECT_EQ(state, before);
}

TEST_F(Pool, withdraw_rounding_to_zero_base)
{
    ASSERT_FALSE(pool.stake_deposit(
                         MAINTAINER,
                         VALIDATOR_A,
                         BaseAmount{100},
                         BaseAmount{100})
                     .has_error());
    ASSERT_FALSE(
        pool.update_exchange_rate(1, BaseAmount{0}, ShareAmount{200})
            .has_error());

    auto const before = state;
    EXPECT_EQ(
        pool.withdraw(VALIDATOR_A, ShareAmount{1}).assume_error(),
        PoolError::InvalidAmount);
    EXPECT_EQ(state, before);
    EXPECT_EQ(
        pool.withdraw(VALIDATOR_A, ShareAmount{2}).value().base_amount,
        BaseAmount{1});
}

TEST_F(Pool, withdraw_inactive_stake)
{
    ASSERT_FALSE(
        pool.stake_deposit(
                MAINTAINER, VALIDATOR_A, BaseAmount{100}, BaseAmount{100})
            .has_error());
    ASSERT_FALSE(
        pool.unstake(MAINTAINER, VALIDATOR_A, BaseAmount{40}).has_error());

    auto const before = state;
    EXPECT_EQ(
        pool.withdraw_inactive_stake(
                VALIDATOR_A,
                {.stake_accounts_balance = BaseAmount{99},
                 .unstake_accounts_balance = BaseAmount{40},
                 .unstake_accounts_settled = false})
            .assume_error(),
        PoolError::ValidatorBalanceDecreased);
    EXPECT_EQ(state, before);

    // A donation is moved to the reserve, the tracked balance stays put
    EXPECT_EQ(
        pool.withdraw_inactive_stake(
                VALIDATOR_A,
                {.stake_accounts_balance = BaseAmount{103},
                 .unstake_accounts_balance = BaseAmount{40},
                 .unstake_accounts_settled = false})
            .value(),
        BaseAmount{3});
    EXPECT_EQ(validator(VALIDATOR_A).stake_accounts_balance, BaseAmount{100});

    // Settled unstake accounts are drained and their seeds retired
    EXPECT_EQ(
        pool.withdraw_inactive_stake(
                VALIDATOR_A,
                {.stake_accounts_balance = BaseAmount{100},
                 .unstake_accounts_balance = BaseAmount{40},
                 .unstake_accounts_settled = true})
            .value(),
        BaseAmount{40});
    EXPECT_EQ(validator(VALIDATOR_A).stake_accounts_balance, BaseAmount{60});
    EXPECT_EQ(validator(VALIDATOR_A).unstake_accounts_balance, BaseAmount{0});
    EXPECT_TRUE(validator(VALIDATOR_A).unstake_seeds.empty());
}

TEST_F(Pool, validator_removal_lifecycle)
{
    ASSERT_FALSE(
        pool.update_exchange_rate(1, BaseAmount{1000}, ShareAmount{1000})
            .has_error());
    ASSERT_FALSE(
        pool.stake_deposit(
                MAINTAINER, VALIDATOR_A, BaseAmount{100}, BaseAmount{1000})
            .has_error());
    ASSERT_FALSE(
        pool.collect_validator_fee(VALIDATOR_A, 1, BaseAmount{600})
            .has_error());

    EXPECT_EQ(
        pool.remove_validator(VALIDATOR_A).assume_error(),
        PoolError::ValidatorIsStillActive);

    ASSERT_FALSE(pool.deactivate_validator(MANAGER, VALIDATOR_A).has_error());
    // Deactivating twice is harmless
    EXPECT_FALSE(pool.deactivate_validator(MANAGER, VALIDATOR_A).has_error());
    EXPECT_EQ(
        pool.remove_validator(VALIDATOR_A).assume_error(),
        PoolError::ValidatorHasUnclaimedCredit);

    ASSERT_FALSE(pool.claim_validator_fee(VALIDATOR_A).has_error());
    EXPECT_EQ(
        pool.remove_validator(VALIDATOR_A).assume_error(),
        PoolError::ValidatorShouldHaveNoStakeAccounts);

    ASSERT_FALSE(
        pool.unstake(MAINTAINER, VALIDATOR_A, BaseAmount{100}).has_error());
    EXPECT_EQ(
        pool.withdraw_inactive_stake(
                VALIDATOR_A,
                {.stake_accounts_balance = BaseAmount{105},
                 .unstake_accounts_balance = BaseAmount{105},
                 .unstake_accounts_settled = true})
            .value(),
        BaseAmount{105});

    auto const removed = pool.remove_validator(VALIDATOR_A);
    ASSERT_FALSE(removed.has_error());
    EXPECT_EQ(removed.value().fee_address, FEE_A);
    EXPECT_FALSE(state.validators.contains(VALIDATOR_A));
    EXPECT_EQ(state.validators.size(), 1);
    EXPECT_EQ(
        pool.remove_validator(VALIDATOR_A).assume_error(),
        PoolError::InvalidAccountMember);
}

TEST_F(Pool, validator_capacity)
{
    EXPECT_EQ(
        pool.add_validator(MANAGER, VALIDATOR_A, FEE_A).assume_error(),
        PoolError::DuplicatedEntry);
    EXPECT_FALSE(
        pool.add_validator(MANAGER, Pubkey{0x1003}, FEE_A).has_error());
    EXPECT_FALSE(
        pool.add_validator(MANAGER, Pubkey{0x1004}, FEE_A).has_error());
    EXPECT_EQ(
        pool.add_validator(MANAGER, Pubkey{0x1005}, FEE_A).assume_error(),
        PoolError::MaximumNumberOfAccountsExceeded);
}
