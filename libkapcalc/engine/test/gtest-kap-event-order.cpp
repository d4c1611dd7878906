/********************************************************************
 * gtest-kap-event-order.cpp -- unit tests for event ordering       *
 * Copyright 2024 The KapCalc Authors                               *
 *                                                                  *
 * This program is free software; you can redistribute it and/or    *
 * modify it under the terms of the GNU General Public License as   *
 * published by the Free Software Foundation; either version 2 of   *
 * the License, or (at your option) any later version.              *
 *                                                                  *
 * This program is distributed in the hope that it will be useful,  *
 * but WITHOUT ANY WARRANTY; without even the implied warranty of   *
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the    *
 * GNU General Public License for more details.                     *
 *                                                                  *
 * You should have received a copy of the GNU General Public License*
 * along with this program; if not, contact:                        *
 *                                                                  *
 * Free Software Foundation           Voice:  +1-617-542-5942       *
 * 51 Franklin Street, Fifth Floor    Fax:    +1-617-542-2652       *
 * Boston, MA  02110-1301,  USA       gnu@gnu.org                   *
 *                                                                  *
 ********************************************************************/

#include <gtest/gtest.h>
#include <algorithm>
#include <stdexcept>
#include <vector>
#include "../kap-event-order.hpp"
#include "kap-test-events.hpp"

class KapEventOrderTest : public ::testing::Test
{
protected:
    KapEventOrderTest()
    {
        m_assets.add(make_asset("STOCK", KapAssetCategory::stock));
        m_assets.add(make_asset("BOND", KapAssetCategory::bond));
        m_assets.add(make_option("CALL", "STOCK", 'C'));
    }

    std::vector<std::string> kinds(const std::vector<KapEvent>& events)
    {
        std::vector<std::string> names;
        for (const auto& event : events)
            names.emplace_back(kap_event_kind_name(event));
        return names;
    }

    KapAssetTable m_assets;
};

TEST_F(KapEventOrderTest, test_groups_on_the_same_day)
{
    auto dividend = make_cash_flow("STOCK", "2023-05-02",
                                   KapCashFlowType::dividend_cash, "10");
    dividend.transaction_id = "T0";
    auto buy = make_trade("STOCK", "2023-05-02", KapTradeType::buy_long,
                          "100", "5000", "T1");
    auto exercise = make_lifecycle<KapOptionExerciseEvent>("CALL",
                                                           "2023-05-02", "1");
    exercise.transaction_id = "T2";
    auto split = make_split("STOCK", "2023-05-02", "2", "T3");
    std::vector<KapEvent> events{dividend, buy, exercise, split};
    kap_sort_events(events, m_assets);
    std::vector<std::string> expected{"CORP_SPLIT_FORWARD", "OPTION_EXERCISE",
                                      "TRADE_BUY_LONG", "DIVIDEND_CASH"};
    EXPECT_EQ(expected, kinds(events));
}

TEST_F(KapEventOrderTest, test_date_comes_first)
{
    auto late_split = make_split("STOCK", "2023-06-01", "2");
    auto early_dividend = make_cash_flow("STOCK", "2023-01-15",
                                         KapCashFlowType::dividend_cash, "1");
    std::vector<KapEvent> events{late_split, early_dividend};
    kap_sort_events(events, m_assets);
    EXPECT_EQ("2023-01-15", kap_event_base(events.front()).event_date);
}

TEST_F(KapEventOrderTest, test_transaction_id_within_group)
{
    auto sell = make_trade("STOCK", "2023-03-01", KapTradeType::sell_long,
                           "-5", "600", "B-200");
    auto buy = make_trade("STOCK", "2023-03-01", KapTradeType::buy_long,
                          "10", "1000", "B-100");
    std::vector<KapEvent> events{sell, buy};
    kap_sort_events(events, m_assets);
    EXPECT_EQ("B-100", kap_event_base(events[0]).transaction_id);
    EXPECT_EQ("B-200", kap_event_base(events[1]).transaction_id);
}

TEST_F(KapEventOrderTest, test_category_breaks_ties)
{
    auto bond = make_trade("BOND", "2023-03-01", KapTradeType::buy_long,
                           "1", "1000", "X");
    auto stock = make_trade("STOCK", "2023-03-01", KapTradeType::buy_long,
                            "1", "100", "X");
    auto lhs = kap_event_sort_key(bond, m_assets);
    auto rhs = kap_event_sort_key(stock, m_assets);
    EXPECT_TRUE(rhs < lhs);
    EXPECT_FALSE(lhs < rhs);
}

TEST_F(KapEventOrderTest, test_order_is_deterministic)
{
    std::vector<KapEvent> events;
    for (int i = 0; i < 6; ++i)
        events.push_back(make_cash_flow("STOCK", "2023-07-01",
                                        KapCashFlowType::dividend_cash,
                                        std::to_string(10 + i)));
    auto reversed = events;
    std::reverse(reversed.begin(), reversed.end());
    kap_sort_events(events, m_assets);
    kap_sort_events(reversed, m_assets);
    ASSERT_EQ(events.size(), reversed.size());
    for (size_t i = 0; i < events.size(); ++i)
        EXPECT_EQ(kap_event_base(events[i]).event_id,
                  kap_event_base(reversed[i]).event_id);
    EXPECT_EQ(KapNumeric(10),
              *kap_event_base(events.front()).gross_amount_foreign);
}

TEST_F(KapEventOrderTest, test_invalid_events)
{
    auto unknown = make_trade("NOPE", "2023-03-01", KapTradeType::buy_long,
                              "1", "1", "T");
    EXPECT_THROW(kap_event_sort_key(unknown, m_assets), std::invalid_argument);
    auto bad_date = make_trade("STOCK", "03/01/2023", KapTradeType::buy_long,
                               "1", "1", "T");
    EXPECT_THROW(kap_event_sort_key(bad_date, m_assets), std::invalid_argument);
    std::vector<KapEvent> events{bad_date};
    EXPECT_THROW(kap_sort_events(events, m_assets), std::invalid_argument);
}
