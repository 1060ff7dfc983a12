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

#include <cstddef>
#include <cstdint>
#include <ranges>

STAKEPOOL_POOL_NAMESPACE_BEGIN

// A validator may have at most this many unstake accounts deactivating at
// the same time.
inline constexpr uint64_t MAXIMUM_UNSTAKE_ACCOUNTS = 3;

/**
 * Half open range [begin, end) of seeds of a validator's stake accounts.
 *
 * Opening a new account uses seed `end` and bumps it. Once the account with
 * seed `begin` is settled it is folded into the aggregate balance and
 * `begin` is bumped. Seeds are never reused.
 */
struct SeedRange
{
    uint64_t begin{0};
    uint64_t end{0};

    uint64_t size() const noexcept
    {
        return end - begin;
    }

    bool empty() const noexcept
    {
        return begin == end;
    }

    friend bool operator==(SeedRange const &, SeedRange const &) = default;
};

struct Validator
{
    // Fees in share tokens the validator is owed but has not claimed yet
    ShareAmount fee_credit{};

    // Share token account the fees are paid out to
    Pubkey fee_address{};

    SeedRange stake_seeds{};
    SeedRange unstake_seeds{};

    // Sum of the balances of the stake accounts and the unstake accounts
    BaseAmount stake_accounts_balance{};

    // Sum of the balances of the unstake accounts
    BaseAmount unstake_accounts_balance{};

    // New stake may only be deposited with active validators. Deactivation
    // is the first step of removal.
    bool active{true};

    // Balance of the stake accounts alone, excluding unstake accounts
    BaseAmount effective_stake_balance() const;

    Result<void> check_can_be_removed() const;

    friend bool operator==(Validator const &, Validator const &) = default;
};

// fee_credit 8, fee_address 32, two seed ranges 2 * 16, balances 2 * 8,
// active 1
inline constexpr size_t VALIDATOR_CONSTANT_SIZE = 89;

template <>
struct EntryConstantSize<Validator>
{
    static constexpr size_t SIZE = VALIDATOR_CONSTANT_SIZE;
};

using Validators = AccountMap<Validator>;
using Maintainers = AccountSet;

inline auto iter_active(Validators const &validators)
{
    return validators.entries() |
           std::views::filter([](Validators::Entry const &e) {
               return e.entry.active;
           });
}

uint64_t count_active(Validators const &);

STAKEPOOL_POOL_NAMESPACE_END
