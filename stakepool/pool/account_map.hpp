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

#include <stakepool/core/bytes.hpp>
#include <stakepool/core/likely.h>
#include <stakepool/core/result.hpp>
#include <stakepool/pool/config.hpp>
#include <stakepool/pool/pool_error.hpp>

#include <boost/outcome/success_failure.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

STAKEPOOL_POOL_NAMESPACE_BEGIN

// Identities (vote accounts, maintainers, fee recipients) are opaque 32 byte
// keys verified by the host.
using Pubkey = bytes32_t;

// Serialized size of a map value. Every value type stored in an AccountMap
// must specialize this.
template <typename T>
struct EntryConstantSize;

// Value type of a map that is used as a set
struct Empty
{
    friend constexpr bool operator==(Empty, Empty) noexcept = default;
};

template <>
struct EntryConstantSize<Empty>
{
    static constexpr size_t SIZE = 0;
};

/**
 * A map from public key to T with a capacity fixed at construction.
 *
 * The storage for all maximum_entries() entries is allocated up front, as the
 * map mirrors a region of an account whose size cannot change after it is
 * created. Adding beyond capacity is an expected failure, not a reason to
 * grow. Entry order carries no meaning: removal swaps the last entry into the
 * hole.
 */
template <typename T>
class AccountMap
{
public:
    struct Entry
    {
        Pubkey pubkey{};
        T entry{};

        friend bool operator==(Entry const &, Entry const &) = default;
    };

    // u32 length and u32 maximum_entries
    static constexpr size_t HEADER_SIZE = 8;
    static constexpr size_t ENTRY_SIZE =
        sizeof(Pubkey) + EntryConstantSize<T>::SIZE;

private:
    std::vector<Entry> storage_;
    size_t length_;

    AccountMap(uint32_t const maximum_entries, size_t const length)
        : storage_(maximum_entries)
        , length_{length}
    {
    }

    size_t find(Pubkey const &pubkey) const noexcept
    {
        auto const it = std::find_if(
            storage_.begin(),
            storage_.begin() + static_cast<std::ptrdiff_t>(length_),
            [&](Entry const &e) { return e.pubkey == pubkey; });
        return static_cast<size_t>(it - storage_.begin());
    }

public:
    explicit AccountMap(uint32_t const maximum_entries)
        : AccountMap{maximum_entries, 0}
    {
    }

    // All maximum_entries slots occupied by default entries. Used to reserve
    // the storage of a freshly created account.
    static AccountMap new_fill_default(uint32_t const maximum_entries)
    {
        return AccountMap{maximum_entries, maximum_entries};
    }

    size_t size() const noexcept
    {
        return length_;
    }

    bool empty() const noexcept
    {
        return length_ == 0;
    }

    uint32_t capacity() const noexcept
    {
        return static_cast<uint32_t>(storage_.size());
    }

    std::span<Entry const> entries() const noexcept
    {
        return {storage_.data(), length_};
    }

    std::span<Entry> entries() noexcept
    {
        return {storage_.data(), length_};
    }

    bool contains(Pubkey const &pubkey) const noexcept
    {
        return find(pubkey) != length_;
    }

    Result<void> add(Pubkey const &pubkey, T value)
    {
        if (STAKEPOOL_UNLIKELY(length_ == storage_.size())) {
            return PoolError::MaximumNumberOfAccountsExceeded;
        }
        if (STAKEPOOL_UNLIKELY(contains(pubkey))) {
            return PoolError::DuplicatedEntry;
        }
        storage_[length_] = Entry{.pubkey = pubkey, .entry = std::move(value)};
        ++length_;
        return outcome::success();
    }

    Result<T> remove(Pubkey const &pubkey)
    {
        size_t const idx = find(pubkey);
        if (STAKEPOOL_UNLIKELY(idx == length_)) {
            return PoolError::InvalidAccountMember;
        }
        size_t const last = length_ - 1;
        T removed = std::move(storage_[idx].entry);
        if (idx != last) {
            storage_[idx] = std::move(storage_[last]);
        }
        storage_[last] = Entry{};
        --length_;
        return removed;
    }

    Result<T const *> get(Pubkey const &pubkey) const
    {
        size_t const idx = find(pubkey);
        if (STAKEPOOL_UNLIKELY(idx == length_)) {
            return PoolError::InvalidAccountMember;
        }
        return &storage_[idx].entry;
    }

    Result<T *> get_mut(Pubkey const &pubkey)
    {
        size_t const idx = find(pubkey);
        if (STAKEPOOL_UNLIKELY(idx == length_)) {
            return PoolError::InvalidAccountMember;
        }
        return &storage_[idx].entry;
    }

    // Bytes needed to serialize a map holding up to max_entries
    static constexpr size_t required_bytes(size_t const max_entries) noexcept
    {
        return HEADER_SIZE + ENTRY_SIZE * max_entries;
    }

    // Number of entries that fit in a buffer of the given size
    static constexpr size_t maximum_entries(size_t const buffer_size) noexcept
    {
        if (buffer_size < HEADER_SIZE) {
            return 0;
        }
        return (buffer_size - HEADER_SIZE) / ENTRY_SIZE;
    }

    friend bool operator==(AccountMap const &lhs, AccountMap const &rhs)
    {
        return lhs.capacity() == rhs.capacity() &&
               std::ranges::equal(lhs.entries(), rhs.entries());
    }
};

// A set of public keys with a fixed capacity
using AccountSet = AccountMap<Empty>;

STAKEPOOL_POOL_NAMESPACE_END
