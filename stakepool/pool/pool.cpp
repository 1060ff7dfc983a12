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
#include <stakepool/core/fmt/bytes_fmt.hpp>
#include <stakepool/core/likely.h>
#include <stakepool/pool/fmt/exchange_rate_fmt.hpp>
#include <stakepool/pool/fmt/token_fmt.hpp>
#include <stakepool/pool/pool.hpp>
#include <stakepool/pool/pool_error.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <utility>
#include <vector>

STAKEPOOL_POOL_ANONYMOUS_NAMESPACE_BEGIN

Result<BaseAmount> total_stake_accounts_balance(Validators const &validators)
{
    BaseAmount total{};
    for (auto const &e : validators.entries()) {
        BOOST_OUTCOME_TRY(
            total,
            calculation(checked_add(total, e.entry.stake_accounts_balance)));
    }
    return total;
}

Result<ShareAmount> total_fee_credit(Validators const &validators)
{
    ShareAmount total{};
    for (auto const &e : validators.entries()) {
        BOOST_OUTCOME_TRY(
            total, calculation(checked_add(total, e.entry.fee_credit)));
    }
    return total;
}

STAKEPOOL_POOL_ANONYMOUS_NAMESPACE_END

STAKEPOOL_POOL_NAMESPACE_BEGIN

StakePool::StakePool(PoolState &state)
    : state_{state}
{
}

Result<PoolState> StakePool::initialize(PoolConfig const &config)
{
    if (STAKEPOOL_UNLIKELY(config.version != POOL_VERSION)) {
        return PoolError::InvalidAccountInfo;
    }
    BOOST_OUTCOME_TRY(config.reward_distribution.validate());

    PoolState state{
        .version = config.version,
        .manager = config.manager,
        .share_mint = config.share_mint,
        .exchange_rate = ExchangeRate{},
        .bump_seeds = config.bump_seeds,
        .reward_distribution = config.reward_distribution,
        .fee_recipients = config.fee_recipients,
        .metrics = Metrics{},
        .validators = Validators{config.max_validators},
        .maintainers = Maintainers{config.max_maintainers},
    };
    LOG_INFO(
        "Initialized pool managed by {} with room for {} validators and {} "
        "maintainers ({} bytes)",
        state.manager,
        config.max_validators,
        config.max_maintainers,
        state.required_bytes());
    return state;
}

Result<ShareAmount> StakePool::deposit(BaseAmount const amount)
{
    if (STAKEPOOL_UNLIKELY(amount == BaseAmount{0})) {
        return PoolError::InvalidAmount;
    }
    BOOST_OUTCOME_TRY(
        auto const shares, state_.exchange_rate.exchange_to_shares(amount));
    if (STAKEPOOL_UNLIKELY(shares == ShareAmount{0})) {
        return PoolError::InvalidAmount;
    }

    Metrics metrics = state_.metrics;
    BOOST_OUTCOME_TRY(calculation(metrics.observe_deposit(amount)));

    state_.metrics = metrics;
    LOG_DEBUG("Deposit of {} mints {} shares", amount, shares);
    return shares;
}

Result<StakePool::WithdrawOutcome>
StakePool::withdraw(Pubkey const &validator, ShareAmount const shares)
{
    if (STAKEPOOL_UNLIKELY(shares == ShareAmount{0})) {
        return PoolError::InvalidAmount;
    }
    BOOST_OUTCOME_TRY(
        Validator const *const source, state_.validators.get(validator));

    // Withdrawing from the largest validator keeps the stake balanced
    BaseAmount const effective = source->effective_stake_balance();
    for (auto const &e : state_.validators.entries()) {
        if (STAKEPOOL_UNLIKELY(e.entry.effective_stake_balance() > effective)) {
            return PoolError::ValidatorWithMoreStakeExists;
        }
    }

    BOOST_OUTCOME_TRY(
        auto const amount, state_.exchange_rate.exchange_to_base(shares));
    if (STAKEPOOL_UNLIKELY(amount == BaseAmount{0} || amount > effective)) {
        return PoolError::InvalidAmount;
    }
    BOOST_OUTCOME_TRY(
        auto const stake_balance,
        calculation(checked_sub(source->stake_accounts_balance, amount)));

    Metrics metrics = state_.metrics;
    BOOST_OUTCOME_TRY(calculation(metrics.observe_withdraw(shares, amount)));

    BOOST_OUTCOME_TRY(Validator *const v, state_.validators.get_mut(validator));
    v->stake_accounts_balance = stake_balance;
    state_.metrics = metrics;

    LOG_DEBUG(
        "Withdrawal of {} shares takes {} from validator {}",
        shares,
        amount,
        validator);
    return WithdrawOutcome{
        .shares_burned = shares,
        .base_amount = amount,
        .stake_seed = v->stake_seeds.begin,
    };
}

Result<uint64_t> StakePool::stake_deposit(
    Pubkey const &actor, Pubkey const &validator, BaseAmount const amount,
    BaseAmount const reserve_balance)
{
    BOOST_OUTCOME_TRY(state_.check_maintainer(actor));
    if (STAKEPOOL_UNLIKELY(amount == BaseAmount{0})) {
        return PoolError::InvalidAmount;
    }
    if (STAKEPOOL_UNLIKELY(amount > reserve_balance)) {
        return PoolError::AmountExceedsReserve;
    }
    BOOST_OUTCOME_TRY(
        Validator const *const target, state_.validators.get(validator));
    if (STAKEPOOL_UNLIKELY(!target->active)) {
        return PoolError::StakeToInactiveValidator;
    }

    // New stake goes to the smallest active validator
    BaseAmount const effective = target->effective_stake_balance();
    for (auto const &e : iter_active(state_.validators)) {
        if (STAKEPOOL_UNLIKELY(e.entry.effective_stake_balance() < effective)) {
            return PoolError::ValidatorWithLessStakeExists;
        }
    }
    BOOST_OUTCOME_TRY(
        auto const stake_balance,
        calculation(checked_add(target->stake_accounts_balance, amount)));

    BOOST_OUTCOME_TRY(Validator *const v, state_.validators.get_mut(validator));
    uint64_t const seed = v->stake_seeds.end;
    ++v->stake_seeds.end;
    v->stake_accounts_balance = stake_balance;

    LOG_DEBUG(
        "Staked {} with validator {} in stake account {}",
        amount,
        validator,
        seed);
    return seed;
}

Result<uint64_t> StakePool::unstake(
    Pubkey const &actor, Pubkey const &validator, BaseAmount const amount)
{
    BOOST_OUTCOME_TRY(state_.check_maintainer(actor));
    if (STAKEPOOL_UNLIKELY(amount == BaseAmount{0})) {
        return PoolError::InvalidAmount;
    }
    BOOST_OUTCOME_TRY(
        Validator const *const source, state_.validators.get(validator));
    if (STAKEPOOL_UNLIKELY(amount > source->effective_stake_balance())) {
        return PoolError::InvalidAmount;
    }
    if (STAKEPOOL_UNLIKELY(
            source->unstake_seeds.size() >= MAXIMUM_UNSTAKE_ACCOUNTS)) {
        return PoolError::MaxUnstakeAccountsReached;
    }
    BOOST_OUTCOME_TRY(
        auto const unstake_balance,
        calculation(checked_add(source->unstake_accounts_balance, amount)));

    BOOST_OUTCOME_TRY(Validator *const v, state_.validators.get_mut(validator));
    uint64_t const seed = v->unstake_seeds.end;
    ++v->unstake_seeds.end;
    v->unstake_accounts_balance = unstake_balance;

    LOG_DEBUG(
        "Unstaking {} from validator {} in unstake account {}",
        amount,
        validator,
        seed);
    return seed;
}

Result<StakePool::StakeMerge> StakePool::merge_stake(Pubkey const &validator)
{
    BOOST_OUTCOME_TRY(Validator *const v, state_.validators.get_mut(validator));
    if (STAKEPOOL_UNLIKELY(v->stake_seeds.size() < 2)) {
        return PoolError::WrongStakeState;
    }
    StakeMerge const merge{
        .from_seed = v->stake_seeds.begin,
        .to_seed = v->stake_seeds.begin + 1,
    };
    ++v->stake_seeds.begin;
    return merge;
}

Result<void> StakePool::update_exchange_rate(
    uint64_t const epoch, BaseAmount const reserve_balance,
    ShareAmount const share_mint_supply)
{
    ExchangeRate const &current = state_.exchange_rate;
    if (STAKEPOOL_UNLIKELY(
            current.frozen && current.computed_in_epoch >= epoch)) {
        return PoolError::ExchangeRateAlreadyUpToDate;
    }

    // Unclaimed fee credit counts as shares in existence, since it is owed
    // and will be minted on claim
    BOOST_OUTCOME_TRY(
        auto const stake_balance,
        total_stake_accounts_balance(state_.validators));
    BOOST_OUTCOME_TRY(
        auto const base_balance,
        calculation(checked_add(reserve_balance, stake_balance)));
    BOOST_OUTCOME_TRY(auto const credit, total_fee_credit(state_.validators));
    BOOST_OUTCOME_TRY(
        auto const share_supply,
        calculation(checked_add(share_mint_supply, credit)));

    state_.exchange_rate = ExchangeRate{
        .computed_in_epoch = epoch,
        .share_supply = share_supply,
        .base_balance = base_balance,
        .frozen = true,
    };
    LOG_INFO("Froze {}", state_.exchange_rate);
    return outcome::success();
}

Result<BaseAmount> StakePool::withdraw_inactive_stake(
    Pubkey const &validator, InactiveStakeObservation const &observed)
{
    BOOST_OUTCOME_TRY(
        Validator const *const v, state_.validators.get(validator));
    if (STAKEPOOL_UNLIKELY(
            observed.stake_accounts_balance < v->stake_accounts_balance ||
            observed.unstake_accounts_balance < v->unstake_accounts_balance)) {
        LOG_WARNING(
            "Balance of validator {} decreased from {} to {}",
            validator,
            v->stake_accounts_balance,
            observed.stake_accounts_balance);
        return PoolError::ValidatorBalanceDecreased;
    }

    // Anything above the tracked balance was donated. It is withdrawn to the
    // reserve, where the next exchange rate update accounts for it.
    BOOST_OUTCOME_TRY(
        auto const donation,
        calculation(checked_sub(
            observed.stake_accounts_balance, v->stake_accounts_balance)));

    BaseAmount to_reserve = donation;
    Validator updated = *v;
    if (observed.unstake_accounts_settled && !v->unstake_seeds.empty()) {
        BOOST_OUTCOME_TRY(
            to_reserve,
            calculation(checked_add(to_reserve, v->unstake_accounts_balance)));
        BOOST_OUTCOME_TRY(
            updated.stake_accounts_balance,
            calculation(checked_sub(
                v->stake_accounts_balance, v->unstake_accounts_balance)));
        updated.unstake_accounts_balance = BaseAmount{0};
        updated.unstake_seeds.begin = updated.unstake_seeds.end;
    }

    BOOST_OUTCOME_TRY(
        Validator *const target, state_.validators.get_mut(validator));
    *target = updated;

    if (donation != BaseAmount{0}) {
        LOG_INFO(
            "Observed donation of {} to validator {}",
            donation,
            validator);
    }
    return to_reserve;
}

Result<StakePool::FeeCollection> StakePool::collect_validator_fee(
    Pubkey const &validator, uint64_t const epoch, BaseAmount const rewards)
{
    if (STAKEPOOL_UNLIKELY(!state_.exchange_rate.is_current(epoch))) {
        return PoolError::ExchangeRateNotUpdatedInThisEpoch;
    }
    if (STAKEPOOL_UNLIKELY(!state_.validators.contains(validator))) {
        return PoolError::InvalidAccountMember;
    }
    uint64_t const num_validators = count_active(state_.validators);
    if (STAKEPOOL_UNLIKELY(num_validators == 0)) {
        return PoolError::NoActiveValidators;
    }

    BOOST_OUTCOME_TRY(
        auto const fees,
        state_.reward_distribution.split_reward(rewards, num_validators));

    ExchangeRate const &rate = state_.exchange_rate;
    BOOST_OUTCOME_TRY(
        auto const treasury_shares,
        rate.exchange_to_shares(fees.treasury_amount));
    BOOST_OUTCOME_TRY(
        auto const developer_shares,
        rate.exchange_to_shares(fees.developer_amount));
    BOOST_OUTCOME_TRY(
        auto const validator_shares,
        rate.exchange_to_shares(fees.reward_per_validator));

    std::vector<ShareAmount> credits;
    credits.reserve(num_validators);
    for (auto const &e : iter_active(state_.validators)) {
        BOOST_OUTCOME_TRY(
            auto const credit,
            calculation(checked_add(e.entry.fee_credit, validator_shares)));
        credits.push_back(credit);
    }

    Metrics metrics = state_.metrics;
    BOOST_OUTCOME_TRY(calculation(metrics.observe_fee(
        fees,
        num_validators,
        treasury_shares,
        validator_shares,
        developer_shares)));

    size_t i = 0;
    for (auto &e : state_.validators.entries()) {
        if (e.entry.active) {
            e.entry.fee_credit = credits[i++];
        }
    }
    STAKEPOOL_ASSERT(i == credits.size());
    state_.metrics = metrics;

    LOG_INFO(
        "Collected {} in rewards of validator {} in epoch {}: treasury {}, "
        "developer {}, {} per validator, appreciation {}",
        rewards,
        validator,
        epoch,
        fees.treasury_amount,
        fees.developer_amount,
        fees.reward_per_validator,
        fees.appreciation_amount);
    return FeeCollection{
        .fees = fees,
        .treasury_shares = treasury_shares,
        .developer_shares = developer_shares,
        .validator_shares = validator_shares,
        .num_validators = num_validators,
    };
}

Result<StakePool::FeeClaim>
StakePool::claim_validator_fee(Pubkey const &validator)
{
    BOOST_OUTCOME_TRY(Validator *const v, state_.validators.get_mut(validator));
    if (STAKEPOOL_UNLIKELY(v->fee_credit == ShareAmount{0})) {
        return PoolError::InvalidAmount;
    }
    FeeClaim const claim{
        .fee_address = v->fee_address, .amount = v->fee_credit};
    v->fee_credit = ShareAmount{0};
    LOG_DEBUG(
        "Validator {} claimed {} shares to {}",
        validator,
        claim.amount,
        claim.fee_address);
    return claim;
}

Result<void> StakePool::change_reward_distribution(
    Pubkey const &actor, RewardDistribution const &distribution)
{
    BOOST_OUTCOME_TRY(state_.check_manager(actor));
    BOOST_OUTCOME_TRY(distribution.validate());
    state_.reward_distribution = distribution;
    LOG_INFO(
        "Reward distribution changed to treasury {}, validation {}, "
        "developer {}, appreciation {}",
        distribution.treasury_fee,
        distribution.validation_fee,
        distribution.developer_fee,
        distribution.appreciation);
    return outcome::success();
}

Result<void> StakePool::add_validator(
    Pubkey const &actor, Pubkey const &vote, Pubkey const &fee_address)
{
    BOOST_OUTCOME_TRY(state_.check_manager(actor));
    BOOST_OUTCOME_TRY(
        state_.validators.add(vote, Validator{.fee_address = fee_address}));
    LOG_INFO("Added validator {} paying fees to {}", vote, fee_address);
    return outcome::success();
}

Result<void>
StakePool::deactivate_validator(Pubkey const &actor, Pubkey const &vote)
{
    BOOST_OUTCOME_TRY(state_.check_manager(actor));
    BOOST_OUTCOME_TRY(Validator *const v, state_.validators.get_mut(vote));
    if (v->active) {
        v->active = false;
        LOG_INFO("Deactivated validator {}", vote);
    }
    return outcome::success();
}

Result<Validator> StakePool::remove_validator(Pubkey const &vote)
{
    BOOST_OUTCOME_TRY(Validator const *const v, state_.validators.get(vote));
    BOOST_OUTCOME_TRY(v->check_can_be_removed());
    BOOST_OUTCOME_TRY(auto removed, state_.validators.remove(vote));
    LOG_INFO("Removed validator {}", vote);
    return removed;
}

Result<void>
StakePool::add_maintainer(Pubkey const &actor, Pubkey const &maintainer)
{
    BOOST_OUTCOME_TRY(state_.check_manager(actor));
    BOOST_OUTCOME_TRY(state_.maintainers.add(maintainer, Empty{}));
    LOG_INFO("Added maintainer {}", maintainer);
    return outcome::success();
}

Result<void>
StakePool::remove_maintainer(Pubkey const &actor, Pubkey const &maintainer)
{
    BOOST_OUTCOME_TRY(state_.check_manager(actor));
    BOOST_OUTCOME_TRY(state_.maintainers.remove(maintainer));
    LOG_INFO("Removed maintainer {}", maintainer);
    return outcome::success();
}

STAKEPOOL_POOL_NAMESPACE_END
