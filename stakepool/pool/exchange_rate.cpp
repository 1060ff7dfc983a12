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

#include <stakepool/core/likely.h>
#include <stakepool/pool/exchange_rate.hpp>
#include <stakepool/pool/pool_error.hpp>

#include <boost/outcome/try.hpp>

STAKEPOOL_POOL_NAMESPACE_BEGIN

Result<ShareAmount>
ExchangeRate::exchange_to_shares(BaseAmount const amount) const
{
    if (share_supply == ShareAmount{0} || base_balance == BaseAmount{0}) {
        return ShareAmount{amount.value};
    }

    // The rate has dimension share/base, while Rational is dimensionless, so
    // the result is rewrapped in the share type.
    Rational const rate{
        .numerator = share_supply.value, .denominator = base_balance.value};
    BOOST_OUTCOME_TRY(
        auto const scaled, calculation(checked_mul(amount, rate)));
    return ShareAmount{scaled.value};
}

Result<BaseAmount>
ExchangeRate::exchange_to_base(ShareAmount const amount) const
{
    if (STAKEPOOL_UNLIKELY(share_supply == ShareAmount{0})) {
        return PoolError::InvalidAmount;
    }

    Rational const rate{
        .numerator = base_balance.value, .denominator = share_supply.value};
    BOOST_OUTCOME_TRY(
        auto const scaled, calculation(checked_mul(amount, rate)));
    return BaseAmount{scaled.value};
}

STAKEPOOL_POOL_NAMESPACE_END
