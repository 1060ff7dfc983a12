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

#include <stakepool/core/fmt/bytes_fmt.hpp>
#include <stakepool/core/likely.h>
#include <stakepool/pool/pool_error.hpp>
#include <stakepool/pool/pool_state.hpp>

#include <boost/outcome/success_failure.hpp>

#include <quill/Quill.h>

STAKEPOOL_POOL_NAMESPACE_BEGIN

Result<void> PoolState::check_manager(Pubkey const &actor) const
{
    if (STAKEPOOL_UNLIKELY(actor != manager)) {
        LOG_WARNING("Rejected manager operation from {}", actor);
        return PoolError::InvalidManager;
    }
    return outcome::success();
}

Result<void> PoolState::check_maintainer(Pubkey const &actor) const
{
    if (STAKEPOOL_UNLIKELY(!maintainers.contains(actor))) {
        LOG_WARNING("Rejected maintainer operation from {}", actor);
        return PoolError::InvalidMaintainer;
    }
    return outcome::success();
}

STAKEPOOL_POOL_NAMESPACE_END
