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
#include <stakepool/pool/reward_distribution.hpp>
#include <stakepool/pool/token.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>

STAKEPOOL_POOL_NAMESPACE_BEGIN

// Cumulative histogram of base token amounts: counts[i] is the number of
// observations less than or equal to BUCKET_UPPER_BOUNDS[i].
struct BaseAmountHistogram
{
    static constexpr size_t NUM_BUCKETS = 12;

    static constexpr std::array<uint64_t, NUM_BUCKETS> BUCKET_UPPER_BOUNDS = {
        1'000'000,
        3'000'000,
        10'000'000,
        30'000'000,
        100'000'000,
        300'000'000,
        1'000'000'000,
        3'000'000'000,
        10'000'000'000,
        30'000'000'000,
        100'000'000'000,
        std::numeric_limits<uint64_t>::max()};

    std::array<uint64_t, NUM_BUCKETS> counts{};

    // Sum of all observations
    BaseAmount total{};

    Result<void> observe(BaseAmount);

    friend bool
    operator==(BaseAmountHistogram const &, BaseAmountHistogram const &) =
        default;
};

struct WithdrawMetric
{
    ShareAmount total_share_amount{};
    BaseAmount total_base_amount{};
    uint64_t count{0};

    Result<void> observe(ShareAmount burned, BaseAmount withdrawn);

    friend bool operator==(WithdrawMetric const &, WithdrawMetric const &) =
        default;
};

/**
 * Counters for informational purposes only.
 *
 * Metrics are written and never read by pool logic. An external program can
 * load a snapshot of the pool state and export them.
 */
struct Metrics
{
    // Fees paid out, in base tokens at the time of collection
    BaseAmount fee_treasury_base_total{};
    BaseAmount fee_validation_base_total{};
    BaseAmount fee_developer_base_total{};

    // Rewards that increased the value of shares
    BaseAmount appreciation_base_total{};

    // Fees paid out, in share tokens
    ShareAmount fee_treasury_share_total{};
    ShareAmount fee_validation_share_total{};
    ShareAmount fee_developer_share_total{};

    BaseAmountHistogram deposit_amount{};
    WithdrawMetric withdraw_amount{};

    Result<void> observe_fee(
        Fees const &fees, uint64_t num_validators, ShareAmount treasury_shares,
        ShareAmount validator_shares, ShareAmount developer_shares);

    Result<void> observe_deposit(BaseAmount);

    Result<void> observe_withdraw(ShareAmount burned, BaseAmount withdrawn);

    friend bool operator==(Metrics const &, Metrics const &) = default;
};

// 7 totals, the histogram (12 counts and its total), the withdraw metric
inline constexpr size_t METRICS_CONSTANT_SIZE =
    7 * 8 + (BaseAmountHistogram::NUM_BUCKETS + 1) * 8 + 3 * 8;

static_assert(METRICS_CONSTANT_SIZE == 184);

STAKEPOOL_POOL_NAMESPACE_END
