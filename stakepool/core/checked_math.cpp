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

#include <stakepool/core/checked_math.hpp>
#include <stakepool/core/int.hpp>
#include <stakepool/core/likely.h>

#include <boost/outcome/config.hpp>
// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/generic_code.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/generic_code.hpp>
#endif

STAKEPOOL_NAMESPACE_BEGIN

Result<uint64_t> checked_add(uint64_t const x, uint64_t const y)
{
    auto const res = intx::addc(x, y);
    if (STAKEPOOL_UNLIKELY(res.carry)) {
        return MathError::Overflow;
    }
    return res.value;
}

Result<uint64_t> checked_sub(uint64_t const x, uint64_t const y)
{
    auto const res = intx::subc(x, y);
    if (STAKEPOOL_UNLIKELY(res.carry)) {
        return MathError::Underflow;
    }
    return res.value;
}

Result<uint64_t> checked_mul(uint64_t const x, uint64_t const y)
{
    uint128_t const z = intx::umul(x, y);
    if (STAKEPOOL_UNLIKELY(z[1] != 0)) {
        return MathError::Overflow;
    }
    return z[0];
}

Result<uint64_t> checked_div(uint64_t const x, uint64_t const y)
{
    if (y == 0) {
        return MathError::DivisionByZero;
    }
    return x / y;
}

Result<uint64_t>
checked_mul_div(uint64_t const x, uint64_t const y, uint64_t const z)
{
    if (STAKEPOOL_UNLIKELY(z == 0)) {
        return MathError::DivisionByZero;
    }
    uint128_t const q = intx::umul(x, y) / uint128_t{z};
    if (STAKEPOOL_UNLIKELY(q[1] != 0)) {
        return MathError::Overflow;
    }
    return q[0];
}

STAKEPOOL_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<stakepool::MathError>::mapping> const &
quick_status_code_from_enum<stakepool::MathError>::value_mappings()
{
    using stakepool::MathError;

    static std::initializer_list<mapping> const v = {
        {MathError::Success, "success", {errc::success}},
        {MathError::Overflow, "overflow", {}},
        {MathError::Underflow, "underflow", {}},
        {MathError::DivisionByZero, "division by zero", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
