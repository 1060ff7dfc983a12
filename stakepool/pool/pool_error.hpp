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

#include <stakepool/core/likely.h>
#include <stakepool/core/result.hpp>
#include <stakepool/pool/config.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

STAKEPOOL_POOL_NAMESPACE_BEGIN

enum class PoolError
{
    Success = 0,
    InvalidAmount,
    CalculationFailure,
    InvalidFeeAmount,
    MaximumNumberOfAccountsExceeded,
    DuplicatedEntry,
    InvalidAccountMember,
    InvalidManager,
    InvalidMaintainer,
    InvalidPoolSize,
    InvalidAccountInfo,
    NoActiveValidators,
    AmountExceedsReserve,
    ExchangeRateAlreadyUpToDate,
    ExchangeRateNotUpdatedInThisEpoch,
    ValidatorBalanceDecreased,
    ValidatorWithMoreStakeExists,
    ValidatorWithLessStakeExists,
    StakeToInactiveValidator,
    ValidatorIsStillActive,
    ValidatorHasUnclaimedCredit,
    ValidatorShouldHaveNoStakeAccounts,
    ValidatorShouldHaveNoUnstakeAccounts,
    MaxUnstakeAccountsReached,
    WrongStakeState,
};

// Arithmetic failures do not leave the token layer with their detail; the
// pool reports every one of them as CalculationFailure.
template <typename R>
R calculation(R res)
{
    if (STAKEPOOL_UNLIKELY(res.has_error())) {
        return PoolError::CalculationFailure;
    }
    return res;
}

STAKEPOOL_POOL_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<stakepool::pool::PoolError>
    : quick_status_code_from_enum_defaults<stakepool::pool::PoolError>
{
    static constexpr auto const domain_name = "Pool Error";
    static constexpr auto const domain_uuid =
        "a3d8e6f0-27c4-4b9e-9d51-0e7f3c2b81a6";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
