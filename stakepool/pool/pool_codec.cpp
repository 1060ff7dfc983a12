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
#include <stakepool/core/byte_string.hpp>
#include <stakepool/core/bytes.hpp>
#include <stakepool/core/likely.h>
#include <stakepool/core/unaligned.hpp>
#include <stakepool/pool/account_map.hpp>
#include <stakepool/pool/pool_codec.hpp>
#include <stakepool/pool/pool_error.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>

STAKEPOOL_POOL_ANONYMOUS_NAMESPACE_BEGIN

template <typename T>
Result<T> decode_fixed(byte_string_view &enc)
{
    if (STAKEPOOL_UNLIKELY(enc.size() < sizeof(T))) {
        return PoolError::InvalidPoolSize;
    }
    T const value = unaligned_load<T>(enc.data());
    enc = enc.substr(sizeof(T));
    return value;
}

template <typename Tag>
Result<Amount<Tag>> decode_amount(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto const value, decode_fixed<uint64_t>(enc));
    return Amount<Tag>{value};
}

Result<bool> decode_bool(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto const b, decode_fixed<uint8_t>(enc));
    if (STAKEPOOL_UNLIKELY(b > 1)) {
        return PoolError::InvalidAccountInfo;
    }
    return b == 1;
}

Result<SeedRange> decode_seed_range(byte_string_view &enc)
{
    SeedRange range;
    BOOST_OUTCOME_TRY(range.begin, decode_fixed<uint64_t>(enc));
    BOOST_OUTCOME_TRY(range.end, decode_fixed<uint64_t>(enc));
    if (STAKEPOOL_UNLIKELY(range.begin > range.end)) {
        return PoolError::InvalidAccountInfo;
    }
    return range;
}

void encode_entry(byte_string &out, Validator const &v)
{
    out += encode_validator(v);
}

void encode_entry(byte_string &, Empty) {}

Result<void> decode_entry(byte_string_view &enc, Validator &v)
{
    BOOST_OUTCOME_TRY(v, decode_validator(enc));
    return outcome::success();
}

Result<void> decode_entry(byte_string_view &, Empty &)
{
    return outcome::success();
}

template <typename T>
void encode_account_map(byte_string &out, AccountMap<T> const &map)
{
    size_t const start = out.size();
    unaligned_append(out, static_cast<uint32_t>(map.size()));
    unaligned_append(out, map.capacity());
    for (auto const &e : map.entries()) {
        unaligned_append(out, e.pubkey);
        encode_entry(out, e.entry);
    }
    size_t const footprint = AccountMap<T>::required_bytes(map.capacity());
    out.resize(start + footprint, 0);
}

template <typename T>
Result<AccountMap<T>> decode_account_map(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto const length, decode_fixed<uint32_t>(enc));
    BOOST_OUTCOME_TRY(auto const max_entries, decode_fixed<uint32_t>(enc));
    if (STAKEPOOL_UNLIKELY(length > max_entries)) {
        return PoolError::InvalidAccountInfo;
    }
    size_t const body = AccountMap<T>::required_bytes(max_entries) -
                        AccountMap<T>::HEADER_SIZE;
    if (STAKEPOOL_UNLIKELY(enc.size() < body)) {
        return PoolError::InvalidPoolSize;
    }
    byte_string_view region = enc.substr(0, body);
    enc = enc.substr(body);

    AccountMap<T> map{max_entries};
    for (uint32_t i = 0; i < length; ++i) {
        BOOST_OUTCOME_TRY(auto const pubkey, decode_fixed<Pubkey>(region));
        T entry{};
        BOOST_OUTCOME_TRY(decode_entry(region, entry));
        if (STAKEPOOL_UNLIKELY(map.add(pubkey, entry).has_error())) {
            return PoolError::InvalidAccountInfo;
        }
    }
    if (STAKEPOOL_UNLIKELY(!std::ranges::all_of(
            region, [](unsigned char const c) { return c == 0; }))) {
        return PoolError::InvalidAccountInfo;
    }
    return map;
}

STAKEPOOL_POOL_ANONYMOUS_NAMESPACE_END

STAKEPOOL_POOL_NAMESPACE_BEGIN

byte_string encode_validator(Validator const &v)
{
    byte_string out;
    unaligned_append(out, v.fee_credit.value);
    unaligned_append(out, v.fee_address);
    unaligned_append(out, v.stake_seeds.begin);
    unaligned_append(out, v.stake_seeds.end);
    unaligned_append(out, v.unstake_seeds.begin);
    unaligned_append(out, v.unstake_seeds.end);
    unaligned_append(out, v.stake_accounts_balance.value);
    unaligned_append(out, v.unstake_accounts_balance.value);
    unaligned_append(out, static_cast<uint8_t>(v.active));
    STAKEPOOL_ASSERT(out.size() == VALIDATOR_CONSTANT_SIZE);
    return out;
}

Result<Validator> decode_validator(byte_string_view &enc)
{
    Validator v;
    BOOST_OUTCOME_TRY(v.fee_credit, decode_amount<ShareTokenTag>(enc));
    BOOST_OUTCOME_TRY(v.fee_address, decode_fixed<Pubkey>(enc));
    BOOST_OUTCOME_TRY(v.stake_seeds, decode_seed_range(enc));
    BOOST_OUTCOME_TRY(v.unstake_seeds, decode_seed_range(enc));
    BOOST_OUTCOME_TRY(
        v.stake_accounts_balance, decode_amount<BaseTokenTag>(enc));
    BOOST_OUTCOME_TRY(
        v.unstake_accounts_balance, decode_amount<BaseTokenTag>(enc));
    BOOST_OUTCOME_TRY(v.active, decode_bool(enc));
    if (STAKEPOOL_UNLIKELY(
            v.unstake_accounts_balance > v.stake_accounts_balance)) {
        return PoolError::InvalidAccountInfo;
    }
    return v;
}

byte_string encode_metrics(Metrics const &m)
{
    byte_string out;
    unaligned_append(out, m.fee_treasury_base_total.value);
    unaligned_append(out, m.fee_validation_base_total.value);
    unaligned_append(out, m.fee_developer_base_total.value);
    unaligned_append(out, m.appreciation_base_total.value);
    unaligned_append(out, m.fee_treasury_share_total.value);
    unaligned_append(out, m.fee_validation_share_total.value);
    unaligned_append(out, m.fee_developer_share_total.value);
    for (uint64_t const count : m.deposit_amount.counts) {
        unaligned_append(out, count);
    }
    unaligned_append(out, m.deposit_amount.total.value);
    unaligned_append(out, m.withdraw_amount.total_share_amount.value);
    unaligned_append(out, m.withdraw_amount.total_base_amount.value);
    unaligned_append(out, m.withdraw_amount.count);
    STAKEPOOL_ASSERT(out.size() == METRICS_CONSTANT_SIZE);
    return out;
}

Result<Metrics> decode_metrics(byte_string_view &enc)
{
    Metrics m;
    BOOST_OUTCOME_TRY(
        m.fee_treasury_base_total, decode_amount<BaseTokenTag>(enc));
    BOOST_OUTCOME_TRY(
        m.fee_validation_base_total, decode_amount<BaseTokenTag>(enc));
    BOOST_OUTCOME_TRY(
        m.fee_developer_base_total, decode_amount<BaseTokenTag>(enc));
    BOOST_OUTCOME_TRY(
        m.appreciation_base_total, decode_amount<BaseTokenTag>(enc));
    BOOST_OUTCOME_TRY(
        m.fee_treasury_share_total, decode_amount<ShareTokenTag>(enc));
    BOOST_OUTCOME_TRY(
        m.fee_validation_share_total, decode_amount<ShareTokenTag>(enc));
    BOOST_OUTCOME_TRY(
        m.fee_developer_share_total, decode_amount<ShareTokenTag>(enc));
    for (uint64_t &count : m.deposit_amount.counts) {
        BOOST_OUTCOME_TRY(count, decode_fixed<uint64_t>(enc));
    }
    BOOST_OUTCOME_TRY(m.deposit_amount.total, decode_amount<BaseTokenTag>(enc));
    BOOST_OUTCOME_TRY(
        m.withdraw_amount.total_share_amount,
        decode_amount<ShareTokenTag>(enc));
    BOOST_OUTCOME_TRY(
        m.withdraw_amount.total_base_amount, decode_amount<BaseTokenTag>(enc));
    BOOST_OUTCOME_TRY(m.withdraw_amount.count, decode_fixed<uint64_t>(enc));
    return m;
}

byte_string encode_pool_state(PoolState const &state)
{
    byte_string out;
    out.reserve(state.required_bytes());

    unaligned_append(out, state.version);
    unaligned_append(out, state.manager);
    unaligned_append(out, state.share_mint);

    unaligned_append(out, state.exchange_rate.computed_in_epoch);
    unaligned_append(out, state.exchange_rate.share_supply.value);
    unaligned_append(out, state.exchange_rate.base_balance.value);
    unaligned_append(out, static_cast<uint8_t>(state.exchange_rate.frozen));

    unaligned_append(out, state.bump_seeds.reserve_account);
    unaligned_append(out, state.bump_seeds.stake_authority);
    unaligned_append(out, state.bump_seeds.mint_authority);
    unaligned_append(out, state.bump_seeds.rewards_withdraw_authority);

    unaligned_append(out, state.reward_distribution.treasury_fee);
    unaligned_append(out, state.reward_distribution.validation_fee);
    unaligned_append(out, state.reward_distribution.developer_fee);
    unaligned_append(out, state.reward_distribution.appreciation);

    unaligned_append(out, state.fee_recipients.treasury_account);
    unaligned_append(out, state.fee_recipients.developer_account);

    out += encode_metrics(state.metrics);
    STAKEPOOL_ASSERT(out.size() == PoolState::HEADER_SIZE);

    encode_account_map(out, state.validators);
    encode_account_map(out, state.maintainers);
    STAKEPOOL_ASSERT(out.size() == state.required_bytes());
    return out;
}

Result<PoolState> decode_pool_state(byte_string_view enc)
{
    size_t const size = enc.size();
    PoolState state;

    BOOST_OUTCOME_TRY(state.version, decode_fixed<uint8_t>(enc));
    if (STAKEPOOL_UNLIKELY(state.version != POOL_VERSION)) {
        return PoolError::InvalidAccountInfo;
    }
    BOOST_OUTCOME_TRY(state.manager, decode_fixed<Pubkey>(enc));
    BOOST_OUTCOME_TRY(state.share_mint, decode_fixed<Pubkey>(enc));

    BOOST_OUTCOME_TRY(
        state.exchange_rate.computed_in_epoch, decode_fixed<uint64_t>(enc));
    BOOST_OUTCOME_TRY(
        state.exchange_rate.share_supply, decode_amount<ShareTokenTag>(enc));
    BOOST_OUTCOME_TRY(
        state.exchange_rate.base_balance, decode_amount<BaseTokenTag>(enc));
    BOOST_OUTCOME_TRY(state.exchange_rate.frozen, decode_bool(enc));

    BOOST_OUTCOME_TRY(
        state.bump_seeds.reserve_account, decode_fixed<uint8_t>(enc));
    BOOST_OUTCOME_TRY(
        state.bump_seeds.stake_authority, decode_fixed<uint8_t>(enc));
    BOOST_OUTCOME_TRY(
        state.bump_seeds.mint_authority, decode_fixed<uint8_t>(enc));
    BOOST_OUTCOME_TRY(
        state.bump_seeds.rewards_withdraw_authority,
        decode_fixed<uint8_t>(enc));

    BOOST_OUTCOME_TRY(
        state.reward_distribution.treasury_fee, decode_fixed<uint32_t>(enc));
    BOOST_OUTCOME_TRY(
        state.reward_distribution.validation_fee, decode_fixed<uint32_t>(enc));
    BOOST_OUTCOME_TRY(
        state.reward_distribution.developer_fee, decode_fixed<uint32_t>(enc));
    BOOST_OUTCOME_TRY(
        state.reward_distribution.appreciation, decode_fixed<uint32_t>(enc));
    if (STAKEPOOL_UNLIKELY(state.reward_distribution.validate().has_error())) {
        return PoolError::InvalidAccountInfo;
    }

    BOOST_OUTCOME_TRY(
        state.fee_recipients.treasury_account, decode_fixed<Pubkey>(enc));
    BOOST_OUTCOME_TRY(
        state.fee_recipients.developer_account, decode_fixed<Pubkey>(enc));

    BOOST_OUTCOME_TRY(state.metrics, decode_metrics(enc));

    BOOST_OUTCOME_TRY(state.validators, decode_account_map<Validator>(enc));
    BOOST_OUTCOME_TRY(state.maintainers, decode_account_map<Empty>(enc));

    if (STAKEPOOL_UNLIKELY(!enc.empty() || size != state.required_bytes())) {
        return PoolError::InvalidPoolSize;
    }
    return state;
}

STAKEPOOL_POOL_NAMESPACE_END
