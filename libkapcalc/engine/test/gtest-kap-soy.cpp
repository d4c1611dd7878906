/********************************************************************
 * gtest-kap-soy.cpp -- unit tests for start-of-year lots           *
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
#include <stdexcept>
#include <vector>
#include "../kap-ledger.hpp"
#include "kap-test-events.hpp"

class KapSoyTest : public ::testing::Test
{
protected:
    KapSoyTest() : m_converter{m_ctx} {}

    KapAsset stock(const std::string& soy_quantity)
    {
        auto asset = make_asset("STOCK", KapAssetCategory::stock, soy_quantity);
        asset.soy_cost_basis = KapCostBasis{KapNumeric(2000), "EUR"};
        return asset;
    }

    std::vector<KapEvent> two_buys_one_sale()
    {
        return {make_trade("STOCK", "2022-03-01", KapTradeType::buy_long,
                           "10", "1000", "H1"),
                make_trade("STOCK", "2022-06-01", KapTradeType::buy_long,
                           "10", "1200", "H2"),
                make_trade("STOCK", "2022-09-01", KapTradeType::sell_long,
                           "-5", "700", "H3")};
    }

    KapNumericContext m_ctx;
    KapRateTableConverter m_converter;
};

TEST_F(KapSoyTest, test_fallback_without_history)
{
    auto asset = stock("20");
    KapLedger ledger{asset, m_converter, m_ctx};
    EXPECT_EQ(KapSoyOutcome::fallback,
              ledger.initialize_from_soy(asset, {}, 2023));
    ASSERT_EQ(1u, ledger.lots().size());
    const auto& lot = ledger.lots().front();
    EXPECT_EQ(KapDate(2022, 12, 31), lot.acquisition_date);
    EXPECT_EQ(KapNumeric(20), lot.quantity);
    EXPECT_EQ(KapNumeric(2000), lot.total_cost);
    EXPECT_EQ(KapNumeric(100), lot.unit_cost);
    EXPECT_EQ("SOY_FALLBACK_STOCK", lot.source_transaction_id);

    auto result = ledger.consume_long_lots_for_sale(
        make_trade("STOCK", "2023-04-01", KapTradeType::sell_long, "-20",
                   "2399", "T1"));
    ASSERT_TRUE(result);
    ASSERT_EQ(1u, result.value().size());
    const auto& record = result.value().front();
    EXPECT_EQ(KapNumeric(399), record.gross_gain_loss());
    EXPECT_EQ(KapDate(2022, 12, 31), record.acquisition_date());
}

TEST_F(KapSoyTest, test_reconstruction)
{
    auto asset = stock("15");
    KapLedger ledger{asset, m_converter, m_ctx};
    EXPECT_EQ(KapSoyOutcome::reconstructed,
              ledger.initialize_from_soy(asset, two_buys_one_sale(), 2023));
    ASSERT_EQ(2u, ledger.lots().size());
    EXPECT_EQ(KapNumeric(5), ledger.lots()[0].quantity);
    EXPECT_EQ(KapNumeric(500), ledger.lots()[0].total_cost);
    EXPECT_EQ(KapDate(2022, 3, 1), ledger.lots()[0].acquisition_date);
    EXPECT_EQ(KapNumeric(10), ledger.lots()[1].quantity);
    EXPECT_EQ(KapNumeric(1200), ledger.lots()[1].total_cost);
}

TEST_F(KapSoyTest, test_reconstruction_truncated_to_report)
{
    auto asset = stock("12");
    KapLedger ledger{asset, m_converter, m_ctx};
    EXPECT_EQ(KapSoyOutcome::reconstructed,
              ledger.initialize_from_soy(asset, two_buys_one_sale(), 2023));
    EXPECT_EQ(KapNumeric(12), ledger.long_quantity());
    ASSERT_EQ(2u, ledger.lots().size());
    EXPECT_EQ(KapNumeric(7), ledger.lots()[1].quantity);
    EXPECT_EQ(KapNumeric(840), ledger.lots()[1].total_cost);
}

TEST_F(KapSoyTest, test_short_history_falls_back)
{
    auto asset = stock("20");
    KapLedger ledger{asset, m_converter, m_ctx};
    EXPECT_EQ(KapSoyOutcome::fallback,
              ledger.initialize_from_soy(asset, two_buys_one_sale(), 2023));
    ASSERT_EQ(1u, ledger.lots().size());
    EXPECT_EQ(KapNumeric(20), ledger.long_quantity());
    EXPECT_EQ(KapNumeric(2000), ledger.lots().front().total_cost);
}

TEST_F(KapSoyTest, test_insufficient_replay_falls_back)
{
    auto asset = stock("10");
    std::vector<KapEvent> history{
        make_trade("STOCK", "2022-02-01", KapTradeType::sell_long, "-5",
                   "500", "H0"),
        make_trade("STOCK", "2022-03-01", KapTradeType::buy_long, "10",
                   "1000", "H1")};
    KapLedger ledger{asset, m_converter, m_ctx};
    EXPECT_EQ(KapSoyOutcome::fallback,
              ledger.initialize_from_soy(asset, history, 2023));
    EXPECT_EQ("SOY_FALLBACK_STOCK",
              ledger.lots().front().source_transaction_id);
}

TEST_F(KapSoyTest, test_no_position)
{
    auto asset = stock("0");
    KapLedger ledger{asset, m_converter, m_ctx};
    EXPECT_EQ(KapSoyOutcome::no_position,
              ledger.initialize_from_soy(asset, two_buys_one_sale(), 2023));
    EXPECT_TRUE(ledger.lots().empty());
    EXPECT_TRUE(ledger.short_lots().empty());

    auto unreported = make_asset("STOCK", KapAssetCategory::stock);
    EXPECT_EQ(KapSoyOutcome::no_position,
              ledger.initialize_from_soy(unreported, {}, 2023));
}

TEST_F(KapSoyTest, test_split_in_history)
{
    auto asset = stock("20");
    std::vector<KapEvent> history{
        make_trade("STOCK", "2022-03-01", KapTradeType::buy_long, "10",
                   "1000", "H1"),
        make_split("STOCK", "2022-08-01", "2")};
    KapLedger ledger{asset, m_converter, m_ctx};
    EXPECT_EQ(KapSoyOutcome::reconstructed,
              ledger.initialize_from_soy(asset, history, 2023));
    ASSERT_EQ(1u, ledger.lots().size());
    EXPECT_EQ(KapNumeric(50), ledger.lots().front().unit_cost);
    EXPECT_EQ(KapNumeric(1000), ledger.lots().front().total_cost);
}

TEST_F(KapSoyTest, test_events_in_tax_year_are_skipped)
{
    auto asset = stock("10");
    std::vector<KapEvent> history{
        make_trade("STOCK", "2022-03-01", KapTradeType::buy_long, "10",
                   "1000", "H1"),
        make_trade("STOCK", "2023-01-02", KapTradeType::buy_long, "10",
                   "1000", "H2")};
    KapLedger ledger{asset, m_converter, m_ctx};
    EXPECT_EQ(KapSoyOutcome::reconstructed,
              ledger.initialize_from_soy(asset, history, 2023));
    EXPECT_EQ(KapNumeric(10), ledger.long_quantity());
}

TEST_F(KapSoyTest, test_short_reconstruction)
{
    auto asset = stock("-10");
    std::vector<KapEvent> history{
        make_trade("STOCK", "2022-11-01", KapTradeType::sell_short_open, "-10",
                   "-1500", "S1")};
    KapLedger ledger{asset, m_converter, m_ctx};
    EXPECT_EQ(KapSoyOutcome::reconstructed,
              ledger.initialize_from_soy(asset, history, 2023));
    EXPECT_EQ(KapNumeric(-10), ledger.current_position_quantity());
    EXPECT_EQ(KapNumeric(1500), ledger.short_lots().front().total_proceeds);
}

TEST_F(KapSoyTest, test_short_fallback)
{
    auto asset = stock("-4");
    asset.soy_cost_basis = KapCostBasis{KapNumeric(-400), "EUR"};
    KapLedger ledger{asset, m_converter, m_ctx};
    EXPECT_EQ(KapSoyOutcome::fallback,
              ledger.initialize_from_soy(asset, {}, 2023));
    ASSERT_EQ(1u, ledger.short_lots().size());
    EXPECT_EQ("SOY_FALLBACK_SHORT_STOCK",
              ledger.short_lots().front().source_transaction_id);
    EXPECT_EQ(KapNumeric(400), ledger.short_lots().front().total_proceeds);
    EXPECT_EQ(KapNumeric(100), ledger.short_lots().front().unit_proceeds);
}

TEST_F(KapSoyTest, test_fallback_basis_conversion)
{
    auto asset = stock("20");
    asset.soy_cost_basis = KapCostBasis{KapNumeric(2200), "usd"};
    m_converter.set_rate("USD", KapDate(2023, 1, 1), KapNumeric(11, 1));
    KapLedger ledger{asset, m_converter, m_ctx};
    ledger.initialize_from_soy(asset, {}, 2023);
    EXPECT_EQ(KapNumeric(2000), ledger.lots().front().total_cost);

    asset.soy_cost_basis = KapCostBasis{KapNumeric(2200), "CHF"};
    ledger.initialize_from_soy(asset, {}, 2023);
    EXPECT_TRUE(ledger.lots().front().total_cost.is_zero());

    asset.soy_cost_basis.reset();
    ledger.initialize_from_soy(asset, {}, 2023);
    EXPECT_TRUE(ledger.lots().front().total_cost.is_zero());
    EXPECT_EQ(KapNumeric(20), ledger.long_quantity());
}

TEST_F(KapSoyTest, test_fund_type_taken_from_asset)
{
    auto fund = make_asset("FUND", KapAssetCategory::investment_fund, "0");
    KapLedger ledger{fund, m_converter, m_ctx};
    EXPECT_EQ(KapFundType::none, ledger.fund_type());
    fund.fund_type = KapFundType::mischfonds;
    ledger.initialize_from_soy(fund, {}, 2023);
    EXPECT_EQ(KapFundType::mischfonds, ledger.fund_type());
}
