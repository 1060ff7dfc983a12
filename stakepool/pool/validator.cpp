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
#include <stakepool/pool/validator.hpp>

#include <boost/outcome/success_failure.hpp>

#include <algorithm>

STAKEPOOL_POOL_NAMESPACE_BEGIN

BaseAmount Validator::effective_stake_balance() const
{
    auto const balance =
        checked_sub(stake_accounts_balance, unstake_accounts_balance);
    STAKEPOOL_ASSERT(
        balance.has_value(),
        "unstake balance cannot exceed the validator's total stake balance");
    return balance.value();
}

Result<void> Validator::check_can_be_removed() const
{
    if (STAKEPOOL_UNLIKELY(active)) {
        return PoolError::ValidatorIsStillActive;
    }
    if (STAKEPOOL_UNLIKELY(fee_credit != ShareAmount{0})) {
        return PoolError::ValidatorHasUnclaimedCredit;
    }
    if (STAKEPOOL_UNLIKELY(stake_accounts_balance != BaseAmount{0})) {
        return PoolError::ValidatorShouldHaveNoStakeAccounts;
    }
    if (STAKEPOOL_UNLIKELY(unstake_accounts_balance != BaseAmount{0})) {
        return PoolError::ValidatorShouldHaveNoUnstakeAccounts;
    }
    return outcome::success();
}

uint64_t count_active(Validators const &validators)
{
    return static_cast<uint64_t>(std::ranges::count_if(
        validators.entries(),
        [](Validators::Entry const &e) { return e.entry.active; }));
}

STAKEPOOL_POOL_NAMESPACE_END
