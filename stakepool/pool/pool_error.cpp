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

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<stakepool::pool::PoolError>::mapping> const &
quick_status_code_from_enum<stakepool::pool::PoolError>::value_mappings()
{
    using stakepool::pool::PoolError;

    static std::initializer_list<mapping> const v = {
        {PoolError::Success, "success", {errc::success}},
        {PoolError::InvalidAmount, "invalid amount", {}},
        {PoolError::CalculationFailure,
         "calculation failed due to division by zero or overflow",
         {}},
        {PoolError::InvalidFeeAmount,
         "reward distribution weights are zero",
         {}},
        {PoolError::MaximumNumberOfAccountsExceeded,
         "maximum number of accounts exceeded",
         {}},
        {PoolError::DuplicatedEntry, "duplicated entry", {}},
        {PoolError::InvalidAccountMember, "account is not a member", {}},
        {PoolError::InvalidManager, "invalid manager", {}},
        {PoolError::InvalidMaintainer, "invalid maintainer", {}},
        {PoolError::InvalidPoolSize, "invalid pool size", {}},
        {PoolError::InvalidAccountInfo, "invalid account info", {}},
        {PoolError::NoActiveValidators, "no active validators", {}},
        {PoolError::AmountExceedsReserve, "amount exceeds reserve", {}},
        {PoolError::ExchangeRateAlreadyUpToDate,
         "exchange rate already updated in this epoch",
         {}},
        {PoolError::ExchangeRateNotUpdatedInThisEpoch,
         "exchange rate not yet updated in this epoch",
         {}},
        {PoolError::ValidatorBalanceDecreased,
         "validator balance decreased",
         {}},
        {PoolError::ValidatorWithMoreStakeExists,
         "a validator with more stake exists",
         {}},
        {PoolError::ValidatorWithLessStakeExists,
         "a validator with less stake exists",
         {}},
        {PoolError::StakeToInactiveValidator,
         "stake to inactive validator",
         {}},
        {PoolError::ValidatorIsStillActive, "validator is still active", {}},
        {PoolError::ValidatorHasUnclaimedCredit,
         "validator has unclaimed credit",
         {}},
        {PoolError::ValidatorShouldHaveNoStakeAccounts,
         "validator should have no stake accounts",
         {}},
        {PoolError::ValidatorShouldHaveNoUnstakeAccounts,
         "validator should have no unstake accounts",
         {}},
        {PoolError::MaxUnstakeAccountsReached,
         "maximum number of unstake accounts reached",
         {}},
        {PoolError::WrongStakeState, "wrong stake state", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
