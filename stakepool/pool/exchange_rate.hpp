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
#include <stakepool/pool/config.hpp>
#include <stakepool/pool/token.hpp>

#include <cstdint>

STAKEPOOL_POOL_NAMESPACE_BEGIN

/**
 * The rate at which base tokens and share tokens are exchanged.
 *
 * A deposit mints shares in proportion to the base tokens it adds, which
 * keeps the rate constant. A donation (observed rewards) adds base tokens
 * without minting, which raises the rate. Deposits and donations do not
 * commute, yet rewards are observed one validator at a time in no particular
 * order, and every observation is a donation plus a deposit of the fees.
 *
 * To make the outcome independent of that order, the rate is fixed for the
 * duration of an epoch. It is recomputed once at the start of each epoch
 * from the balances tracked by the pool, which exclude rewards that have not
 * been observed yet. Every deposit and donation within the epoch uses the
 * same rate, so they are equivalent to happening all at once at the start of
 * the epoch. Fee collection in an epoch is therefore blocked until the rate
 * has been updated in that epoch.
 */
struct ExchangeRate
{
    // The epoch in which the rate was last updated
    uint64_t computed_in_epoch{0};

    // Share tokens in existence at that time
    ShareAmount share_supply{};

    // Base tokens managed by the pool at that time, according to its own
    // bookkeeping
    BaseAmount base_balance{};

    // Set by the first update; until then computed_in_epoch is meaningless
    bool frozen{false};

    bool is_current(uint64_t const epoch) const noexcept
    {
        return frozen && computed_in_epoch == epoch;
    }

    // 1:1 while either side is zero, so the first depositor sets the rate
    Result<ShareAmount> exchange_to_shares(BaseAmount) const;

    // Fails with InvalidAmount when no shares exist
    Result<BaseAmount> exchange_to_base(ShareAmount) const;

    friend bool
    operator==(ExchangeRate const &, ExchangeRate const &) = default;
};

STAKEPOOL_POOL_NAMESPACE_END
