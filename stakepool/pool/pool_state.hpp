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
#include <stakepool/pool/exchange_rate.hpp>
#include <stakepool/pool/metrics.hpp>
#include <stakepool/pool/reward_distribution.hpp>
#include <stakepool/pool/validator.hpp>

#include <cstddef>
#include <cstdint>

STAKEPOOL_POOL_NAMESPACE_BEGIN

inline constexpr uint8_t POOL_VERSION = 0;

// Bump seeds of the addresses the pool derives for itself
struct BumpSeeds
{
    uint8_t reserve_account{0};
    uint8_t stake_authority{0};
    uint8_t mint_authority{0};
    uint8_t rewards_withdraw_authority{0};

    friend bool operator==(BumpSeeds const &, BumpSeeds const &) = default;
};

struct PoolConfig
{
    uint8_t version{POOL_VERSION};
    Pubkey manager{};
    Pubkey share_mint{};
    FeeRecipients fee_recipients{};
    RewardDistribution reward_distribution{};
    BumpSeeds bump_seeds{};
    uint32_t max_validators{0};
    uint32_t max_maintainers{0};
};

struct PoolState
{
    uint8_t version{POOL_VERSION};

    // May change the fee distribution and the validator and maintainer sets
    Pubkey manager{};

    // The share token mint; shares are minted to depositors and fee
    // recipients
    Pubkey share_mint{};

    ExchangeRate exchange_rate{};
    BumpSeeds bump_seeds{};
    RewardDistribution reward_distribution{};
    FeeRecipients fee_recipients{};
    Metrics metrics{};

    Validators validators{0};
    Maintainers maintainers{0};

    // version, manager, share mint, exchange rate, bump seeds, weights,
    // fee recipients, metrics
    static constexpr size_t HEADER_SIZE =
        1 + 32 + 32 + 3 * 8 + 1 + 4 + 4 * 4 + 2 * 32 + METRICS_CONSTANT_SIZE;

    static_assert(HEADER_SIZE == 358);

    static constexpr size_t required_bytes(
        size_t const max_validators, size_t const max_maintainers) noexcept
    {
        return HEADER_SIZE + Validators::required_bytes(max_validators) +
               Maintainers::required_bytes(max_maintainers);
    }

    size_t required_bytes() const noexcept
    {
        return required_bytes(validators.capacity(), maintainers.capacity());
    }

    Result<void> check_manager(Pubkey const &actor) const;

    Result<void> check_maintainer(Pubkey const &actor) const;

    friend bool operator==(PoolState const &, PoolState const &) = default;
};

STAKEPOOL_POOL_NAMESPACE_END
