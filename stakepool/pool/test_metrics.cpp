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

#include <stakepool/pool/metrics.hpp>

#include <gtest/gtest.h>

#include <cstdint>

using namespace stakepool;
using namespace stakepool::pool;

TEST(Metrics, histogram_is_cumulative)
{
    BaseAmountHistogram h;
    EXPECT_FALSE(h.observe(BaseAmount{500'000}).has_error());
    EXPECT_FALSE(h.observe(BaseAmount{2'000'000}).has_error());
    EXPECT_FALSE(h.observe(BaseAmount{200'000'000'000}).has_error());

    EXPECT_EQ(h.counts[0], 1);
    EXPECT_EQ(h.counts[1], 2);
    EXPECT_EQ(h.counts[10], 2);
    EXPECT_EQ(h.counts[11], 3);
    EXPECT_EQ(h.total, BaseAmount{200'002'500'000});
}

TEST(Metrics, bucket_bound_is_inclusive)
{
    BaseAmountHistogram h;
    EXPECT_FALSE(h.observe(BaseAmount{1'000'000}).has_error());
    EXPECT_EQ(h.counts[0], 1);
}

TEST(Metrics, withdraw)
{
    Metrics m;
    EXPECT_FALSE(
        m.observe_withdraw(ShareAmount{10}, BaseAmount{12}).has_error());
    EXPECT_FALSE(m.observe_withdraw(ShareAmount{5}, BaseAmount{6}).has_error());
    EXPECT_EQ(m.withdraw_amount.count, 2);
    EXPECT_EQ(m.withdraw_amount.total_share_amount, ShareAmount{15});
    EXPECT_EQ(m.withdraw_amount.total_base_amount, BaseAmount{18});
}

TEST(Metrics, fee)
{
    Metrics m;
    Fees const fees{
        .treasury_amount = BaseAmount{500},
        .reward_per_validator = BaseAmount{83},
        .developer_amount = BaseAmount{166},
        .appreciation_amount = BaseAmount{2}};
    EXPECT_FALSE(
        m.observe_fee(
                fees, 4, ShareAmount{250}, ShareAmount{41}, ShareAmount{83})
            .has_error());
    EXPECT_EQ(m.fee_treasury_base_total, BaseAmount{500});
    EXPECT_EQ(m.fee_validation_base_total, BaseAmount{332});
    EXPECT_EQ(m.fee_developer_base_total, BaseAmount{166});
    EXPECT_EQ(m.appreciation_base_total, BaseAmount{2});
    EXPECT_EQ(m.fee_treasury_share_total, ShareAmount{250});
    EXPECT_EQ(m.fee_validation_share_total, ShareAmount{164});
    EXPECT_EQ(m.fee_developer_share_total, ShareAmount{83});
}
