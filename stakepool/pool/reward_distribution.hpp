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
#include <stakepool/pool/token.hpp>

#include <cstdint>

STAKEPOOL_POOL_NAMESPACE_BEGIN

// Result of RewardDistribution::split_reward. The four amounts sum to the
// input amount exactly.
struct Fees
{
    BaseAmount treasury_amount{};
    BaseAmount reward_per_validator{};
    BaseAmount developer_amount{};

    // Not a fee and not paid out; it stays in the pool and raises the value
    // of every share. Absorbs all rounding.
    BaseAmount appreciation_amount{};

    friend bool operator==(Fees const &, Fees const &) = default;
};

// How rewards are split among the parties, as a number of parts of the
// total. If every party has one part, they all get an equal share.
struct RewardDistribution
{
    uint32_t treasury_fee{0};
    uint32_t validation_fee{0};
    uint32_t developer_fee{0};
    uint32_t appreciation{0};

    uint64_t sum_all() const noexcept;

    Rational treasury_fraction() const noexcept;
    Rational validation_fraction() const noexcept;
    Rational developer_fraction() const noexcept;

    // Fails with InvalidFeeAmount if all weights are zero
    Result<void> validate() const;

    /**
     * Split `amount` into fees, sharing the validation fee equally among
     * `num_validators`. Every fee is rounded down; what rounding loses goes
     * to the appreciation remainder.
     */
    Result<Fees> split_reward(BaseAmount amount, uint64_t num_validators) const;

    friend bool
    operator==(RewardDistribution const &, RewardDistribution const &) =
        default;
};

// Share token accounts the treasury and developer fees are minted to
struct FeeRecipients
{
    Pubkey treasury_account{};
    Pubkey developer_account{};

    friend bool
    operator==(FeeRecipients const &, FeeRecipients const &) = default;
};

STAKEPOOL_POOL_NAMESPACE_END
