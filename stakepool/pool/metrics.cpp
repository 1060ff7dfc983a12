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

#include <stakepool/pool/metrics.hpp>
#include <stakepool/pool/pool_error.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

STAKEPOOL_POOL_NAMESPACE_BEGIN

Result<void> BaseAmountHistogram::observe(BaseAmount const amount)
{
    BOOST_OUTCOME_TRY(total, calculation(checked_add(total, amount)));
    for (size_t i = 0; i < NUM_BUCKETS; ++i) {
        if (amount.value <= BUCKET_UPPER_BOUNDS[i]) {
            ++counts[i];
        }
    }
    return outcome::success();
}

Result<void>
WithdrawMetric::observe(ShareAmount const burned, BaseAmount const withdrawn)
{
    BOOST_OUTCOME_TRY(
        total_share_amount,
        calculation(checked_add(total_share_amount, burned)));
    BOOST_OUTCOME_TRY(
        total_base_amount,
        calculation(checked_add(total_base_amount, withdrawn)));
    ++count;
    return outcome::success();
}

Result<void> Metrics::observe_fee(
    Fees const &fees, uint64_t const num_validators,
    ShareAmount const treasury_shares, ShareAmount const validator_shares,
    ShareAmount const developer_shares)
{
    BOOST_OUTCOME_TRY(
        auto const validation_base,
        calculation(STAKEPOOL_NAMESPACE::checked_mul(
            fees.reward_per_validator.value, num_validators)));
    BOOST_OUTCOME_TRY(
        auto const validation_shares,
        calculation(STAKEPOOL_NAMESPACE::checked_mul(
            validator_shares.value, num_validators)));

    BOOST_OUTCOME_TRY(
        fee_treasury_base_total,
        calculation(
            checked_add(fee_treasury_base_total, fees.treasury_amount)));
    BOOST_OUTCOME_TRY(
        fee_validation_base_total,
        calculation(checked_add(
            fee_validation_base_total, BaseAmount{validation_base})));
    BOOST_OUTCOME_TRY(
        fee_developer_base_total,
        calculation(
            checked_add(fee_developer_base_total, fees.developer_amount)));
    BOOST_OUTCOME_TRY(
        appreciation_base_total,
        calculation(
            checked_add(appreciation_base_total, fees.appreciation_amount)));

    BOOST_OUTCOME_TRY(
        fee_treasury_share_total,
        calculation(checked_add(fee_treasury_share_total, treasury_shares)));
    BOOST_OUTCOME_TRY(
        fee_validation_share_total,
        calculation(checked_add(
            fee_validation_share_total, ShareAmount{validation_shares})));
    BOOST_OUTCOME_TRY(
        fee_developer_share_total,
        calculation(
            checked_add(fee_developer_share_total, developer_shares)));
    return outcome::success();
}

Result<void> Metrics::observe_deposit(BaseAmount const amount)
{
    return deposit_amount.observe(amount);
}

Result<void>
Metrics::observe_withdraw(ShareAmount const burned, BaseAmount const withdrawn)
{
    return withdraw_amount.observe(burned, withdrawn);
}

STAKEPOOL_POOL_NAMESPACE_END
