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

#include <stakepool/core/result.hpp>
#include <stakepool/pool/account_map.hpp>
#include <stakepool/pool/config.hpp>
#include <stakepool/pool/pool_state.hpp>
#include <stakepool/pool/reward_distribution.hpp>
#include <stakepool/pool/token.hpp>
#include <stakepool/pool/validator.hpp>

#include <cstdint>

STAKEPOOL_POOL_NAMESPACE_BEGIN

/**
 * The operations of a pool on its state.
 *
 * The pool does not move tokens itself. Every operation validates its input
 * against the state, updates the bookkeeping, and returns what the caller
 * must transfer, mint or burn to match it. An operation that fails leaves
 * the state unchanged.
 */
class StakePool
{
    PoolState &state_;

public:
    StakePool(PoolState &);

    struct WithdrawOutcome
    {
        // Share tokens to burn from the withdrawer
        ShareAmount shares_burned;
        // Base tokens to split off into a stake account for the withdrawer
        BaseAmount base_amount;
        // Seed of the validator stake account the split comes from
        uint64_t stake_seed;
    };

    struct StakeMerge
    {
        uint64_t from_seed;
        uint64_t to_seed;
    };

    // Balances of a validator's stake accounts as observed on chain
    struct InactiveStakeObservation
    {
        // Stake accounts and unstake accounts together
        BaseAmount stake_accounts_balance;
        BaseAmount unstake_accounts_balance;
        // Whether the unstake accounts are fully deactivated and can be
        // drained into the reserve
        bool unstake_accounts_settled;
    };

    struct FeeCollection
    {
        Fees fees;
        // Share tokens to mint to the fee recipients
        ShareAmount treasury_shares;
        ShareAmount developer_shares;
        // Share tokens credited to each active validator
        ShareAmount validator_shares;
        uint64_t num_validators;
    };

    struct FeeClaim
    {
        Pubkey fee_address;
        ShareAmount amount;
    };

    static Result<PoolState> initialize(PoolConfig const &);

    PoolState const &state() const noexcept
    {
        return state_;
    }

    ////////////////
    // Depositors //
    ////////////////

    // Returns the share tokens to mint for a deposit of base tokens into the
    // reserve
    Result<ShareAmount> deposit(BaseAmount);

    // Withdrawals come out of the validator with the most stake
    Result<WithdrawOutcome> withdraw(Pubkey const &validator, ShareAmount);

    /////////////////
    // Maintainers //
    /////////////////

    // Moves base tokens from the reserve into a new stake account of the
    // validator with the least stake. Returns the seed of that account.
    Result<uint64_t> stake_deposit(
        Pubkey const &actor, Pubkey const &validator, BaseAmount,
        BaseAmount reserve_balance);

    // Starts deactivating stake of a validator into a new unstake account.
    // Returns the seed of that account.
    Result<uint64_t>
    unstake(Pubkey const &actor, Pubkey const &validator, BaseAmount);

    Result<StakeMerge> merge_stake(Pubkey const &validator);

    // Freezes the exchange rate for the epoch
    Result<void> update_exchange_rate(
        uint64_t epoch, BaseAmount reserve_balance,
        ShareAmount share_mint_supply);

    // Returns the base tokens to move from the validator's accounts into the
    // reserve
    Result<BaseAmount> withdraw_inactive_stake(
        Pubkey const &validator, InactiveStakeObservation const &);

    Result<FeeCollection> collect_validator_fee(
        Pubkey const &validator, uint64_t epoch, BaseAmount rewards);

    Result<FeeClaim> claim_validator_fee(Pubkey const &validator);

    /////////////
    // Manager //
    /////////////

    Result<void>
    change_reward_distribution(Pubkey const &actor, RewardDistribution const &);

    Result<void> add_validator(
        Pubkey const &actor, Pubkey const &vote, Pubkey const &fee_address);

    Result<void> deactivate_validator(Pubkey const &actor, Pubkey const &vote);

    // Anyone may remove a validator once it is deactivated and drained
    Result<Validator> remove_validator(Pubkey const &vote);

    Result<void> add_maintainer(Pubkey const &actor, Pubkey const &maintainer);

    Result<void>
    remove_maintainer(Pubkey const &actor, Pubkey const &maintainer);
};

STAKEPOOL_POOL_NAMESPACE_END
