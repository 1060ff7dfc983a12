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

#include <stakepool/core/byte_string.hpp>
#include <stakepool/core/result.hpp>
#include <stakepool/pool/config.hpp>
#include <stakepool/pool/pool_state.hpp>

STAKEPOOL_POOL_NAMESPACE_BEGIN

// Serializes the state into exactly state.required_bytes() bytes
byte_string encode_pool_state(PoolState const &);

// Rejects a buffer whose size does not match the capacities it declares
// with InvalidPoolSize, and inconsistent content with InvalidAccountInfo
Result<PoolState> decode_pool_state(byte_string_view);

byte_string encode_validator(Validator const &);
Result<Validator> decode_validator(byte_string_view &);

byte_string encode_metrics(Metrics const &);
Result<Metrics> decode_metrics(byte_string_view &);

STAKEPOOL_POOL_NAMESPACE_END
