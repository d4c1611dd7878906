/********************************************************************
 * gtest-kap-ledger.cpp -- unit tests for KapLedger                 *
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
#include "../kap-ledger.hpp"
#include "kap-test-events.hpp"

class KapLedgerTest : public ::testing::Test
{
protected:
    KapLedgerTest() :
        m_converter{m_ctx},
        m_stock{make_asset("STOCK", KapAssetCategory::stock)},
        m_ledger{m_stock, m_converter, m_ctx}
    {
    }

    void buy_two_lots()
    {
        m_ledger.add_long_lot(make_trade("STOCK", "2023-01-10",
                                         KapTradeType::buy_long, "10",
                                         "1001", "T1"));
        m_ledger.add_long_lot(make_trade("STOCK", "2023-02-10",
                                         KapTradeType::buy_long, "10",
                                         "1101", "T2"));
    }

    KapNumeric cents(const KapNumeric& n) { return m_ctx.quantize_amount(n); }

    KapNumericContext m_ctx;
    KapRateTableConverter m_converter;
    KapAsset m_stock;
    KapLedger m_ledger;
};

TEST_F(KapLedgerTest, test_fifo_sale)
{
    buy_two_lots();
    auto sale = make_trade("STOCK", "2023-06-01", KapTradeType::sell_long,
                           "-15", "1799", "T3");
    auto result = m_ledger.consume_long_lots_for_sale(sale);
    ASSERT_TRUE(result);
    const auto& records = result.value();
    ASSERT_EQ(2u, records.size());

    EXPECT_EQ(KapNumeric(10), records[0].quantity());
    EXPECT_EQ(KapNumeric(1001), records[0].total_cost_basis());
    EXPECT_EQ(KapNumeric(19833, 2), cents(records[0].gross_gain_loss()));
    EXPECT_EQ(KapDate(2023, 1, 10), records[0].acquisition_date());
    EXPECT_EQ(KapDate(2023, 6, 1), records[0].realization_date());
    EXPECT_EQ(142, *records[0].holding_period_days());
    EXPECT_EQ(KapTaxCategory::anlage_kap_aktien_gewinn,
              records[0].tax_category());
    EXPECT_EQ(KapRealizationType::long_position_sale,
              records[0].realization_type());
    EXPECT_EQ(sale.event_id, records[0].originating_event_id());

    EXPECT_EQ(KapNumeric(5), records[1].quantity());
    EXPECT_EQ(KapNumeric(5505, 1), records[1].total_cost_basis());
    EXPECT_EQ(KapNumeric(4917, 2), cents(records[1].gross_gain_loss()));
    EXPECT_EQ(KapNumeric(24750, 2),
              cents(records[0].gross_gain_loss() +
                    records[1].gross_gain_loss()));

    ASSERT_EQ(1u, m_ledger.lots().size());
    const auto& left = m_ledger.lots().front();
    EXPECT_EQ(KapNumeric(5), left.quantity);
    EXPECT_EQ(KapNumeric(1101, 1), left.unit_cost);
    EXPECT_EQ(KapNumeric(5505, 1), left.total_cost);
    EXPECT_EQ("T2", left.source_transaction_id);
    EXPECT_EQ(KapNumeric(5), m_ledger.current_position_quantity());
}

TEST_F(KapLedgerTest, test_sale_conserves_quantity)
{
    buy_two_lots();
    auto before = m_ledger.long_quantity();
    auto result = m_ledger.consume_long_lots_for_sale(
        make_trade("STOCK", "2023-06-01", KapTradeType::sell_long, "-12.5",
                   "1500", "T3"));
    ASSERT_TRUE(result);
    KapNumeric sold;
    for (const auto& record : result.value())
        sold += record.quantity();
    EXPECT_EQ(KapNumeric(125, 1), sold);
    EXPECT_EQ(before, sold + m_ledger.long_quantity());
}

TEST_F(KapLedgerTest, test_lots_kept_in_date_order)
{
    m_ledger.add_long_lot(make_trade("STOCK", "2023-03-01",
                                     KapTradeType::buy_long, "1", "30", "B"));
    m_ledger.add_long_lot(make_trade("STOCK", "2023-01-01",
                                     KapTradeType::buy_long, "1", "10", "C"));
    m_ledger.add_long_lot(make_trade("STOCK", "2023-03-01",
                                     KapTradeType::buy_long, "1", "20", "A"));
    ASSERT_EQ(3u, m_ledger.lots().size());
    EXPECT_EQ("C", m_ledger.lots()[0].source_transaction_id);
    EXPECT_EQ("A", m_ledger.lots()[1].source_transaction_id);
    EXPECT_EQ("B", m_ledger.lots()[2].source_transaction_id);
}

TEST_F(KapLedgerTest, test_insufficient_sale)
{
    buy_two_lots();
    auto sale = make_trade("STOCK", "2023-06-01", KapTradeType::sell_long,
                           "-25", "2500", "T3");
    auto result = m_ledger.consume_long_lots_for_sale(sale);
    ASSERT_FALSE(result);
    EXPECT_EQ(KapLedgerErrorKind::fatal, result.error().kind);
    EXPECT_TRUE(m_ledger.lots().empty());

    buy_two_lots();
    auto replayed = m_ledger.consume_long_lots_for_sale(sale,
                                                        KapReplayMode::replay);
    ASSERT_FALSE(replayed);
    EXPECT_EQ(KapLedgerErrorKind::replay_insufficient, replayed.error().kind);
}

TEST_F(KapLedgerTest, test_replay_produces_no_records)
{
    buy_two_lots();
    auto result = m_ledger.consume_long_lots_for_sale(
        make_trade("STOCK", "2023-06-01", KapTradeType::sell_long, "-5",
                   "600", "T3"), KapReplayMode::replay);
    ASSERT_TRUE(result);
    EXPECT_TRUE(result.value().empty());
    EXPECT_EQ(KapNumeric(15), m_ledger.long_quantity());
}

TEST_F(KapLedgerTest, test_ignored_trades)
{
    m_ledger.add_long_lot(make_trade("STOCK", "2023-01-10",
                                     KapTradeType::sell_long, "-1", "10",
                                     "T1"));
    m_ledger.add_long_lot(make_trade("STOCK", "2023-01-10",
                                     KapTradeType::buy_long, "-1", "10",
                                     "T2"));
    EXPECT_TRUE(m_ledger.lots().empty());
    EXPECT_THROW(m_ledger.add_long_lot(make_trade("STOCK", "2023-01-10",
                                                  KapTradeType::buy_long, "1",
                                                  "10", "")),
                 std::invalid_argument);
}

TEST_F(KapLedgerTest, test_lot_validation)
{
    KapDate date{2023, 1, 1};
    EXPECT_THROW(KapLot(date, KapNumeric(), KapNumeric(1), KapNumeric(1), "X",
                        m_ctx), std::invalid_argument);
    EXPECT_THROW(KapLot(date, KapNumeric(1), KapNumeric(-1), KapNumeric(1),
                        "X", m_ctx), std::invalid_argument);
    EXPECT_THROW(KapLot(date, KapNumeric(1), KapNumeric(1), KapNumeric(1), "",
                        m_ctx), std::invalid_argument);
    EXPECT_THROW(KapShortLot(date, KapNumeric(-2), KapNumeric(1),
                             KapNumeric(1), "X", m_ctx),
                 std::invalid_argument);
    KapLot lot{date, KapNumeric(3), KapNumeric(1), KapNumeric(5), "X", m_ctx};
    EXPECT_EQ(KapNumeric(5), lot.total_cost);
}

TEST_F(KapLedgerTest, test_short_position)
{
    m_ledger.add_short_lot(make_trade("STOCK", "2023-02-01",
                                      KapTradeType::sell_short_open, "-10",
                                      "-1000", "S1"));
    EXPECT_EQ(KapNumeric(10), m_ledger.short_quantity());
    EXPECT_EQ(KapNumeric(-10), m_ledger.current_position_quantity());
    auto result = m_ledger.consume_short_lots_for_cover(
        make_trade("STOCK", "2023-03-01", KapTradeType::buy_short_cover, "10",
                   "800", "S2"));
    ASSERT_TRUE(result);
    ASSERT_EQ(1u, result.value().size());
    const auto& record = result.value().front();
    EXPECT_EQ(KapRealizationType::short_position_cover,
              record.realization_type());
    EXPECT_EQ(KapNumeric(200), record.gross_gain_loss());
    EXPECT_FALSE(record.is_stillhalter_income());
    EXPECT_TRUE(m_ledger.short_lots().empty());
}

TEST_F(KapLedgerTest, test_split_keeps_totals)
{
    buy_two_lots();
    auto result = m_ledger.adjust_lots_for_split(
        make_split("STOCK", "2023-04-01", "2"));
    EXPECT_TRUE(result);
    ASSERT_EQ(2u, m_ledger.lots().size());
    EXPECT_EQ(KapNumeric(20), m_ledger.lots()[0].quantity);
    EXPECT_EQ(KapNumeric(1001), m_ledger.lots()[0].total_cost);
    EXPECT_EQ(KapNumeric(5005, 2), m_ledger.lots()[0].unit_cost);
    EXPECT_EQ(KapNumeric(1101), m_ledger.lots()[1].total_cost);
    EXPECT_EQ(KapNumeric(40), m_ledger.long_quantity());

    EXPECT_FALSE(m_ledger.adjust_lots_for_split(
                     make_split("STOCK", "2023-04-02", "0")));
    EXPECT_EQ(KapNumeric(40), m_ledger.long_quantity());
}

TEST_F(KapLedgerTest, test_split_leaves_gains_unchanged)
{
    buy_two_lots();
    KapLedger unsplit{m_stock, m_converter, m_ctx};
    unsplit.add_long_lot(make_trade("STOCK", "2023-01-10",
                                    KapTradeType::buy_long, "10", "1001",
                                    "T1"));
    unsplit.add_long_lot(make_trade("STOCK", "2023-02-10",
                                    KapTradeType::buy_long, "10", "1101",
                                    "T2"));
    m_ledger.adjust_lots_for_split(make_split("STOCK", "2023-04-01", "3"));

    auto split_sale = m_ledger.consume_long_lots_for_sale(
        make_trade("STOCK", "2023-06-01", KapTradeType::sell_long, "-60",
                   "2400", "T3"));
    auto plain_sale = unsplit.consume_long_lots_for_sale(
        make_trade("STOCK", "2023-06-01", KapTradeType::sell_long, "-20",
                   "2400", "T3"));
    ASSERT_TRUE(split_sale);
    ASSERT_TRUE(plain_sale);
    KapNumeric split_gain, plain_gain;
    for (const auto& record : split_sale.value())
        split_gain += record.gross_gain_loss();
    for (const auto& record : plain_sale.value())
        plain_gain += record.gross_gain_loss();
    EXPECT_EQ(cents(plain_gain), cents(split_gain));
    EXPECT_EQ(KapNumeric(298), cents(split_gain));
}

TEST_F(KapLedgerTest, test_split_drops_emptied_lots)
{
    m_ledger.add_long_lot(make_trade("STOCK", "2023-01-05",
                                     KapTradeType::buy_long, "0.00000001",
                                     "1", "T1"));
    m_ledger.add_long_lot(make_trade("STOCK", "2023-01-10",
                                     KapTradeType::buy_long, "10", "1000",
                                     "T2"));
    EXPECT_TRUE(m_ledger.adjust_lots_for_split(
                    make_split("STOCK", "2023-04-01", "0.1")));
    ASSERT_EQ(1u, m_ledger.lots().size());
    EXPECT_EQ("T2", m_ledger.lots().front().source_transaction_id);
    EXPECT_EQ(KapNumeric(1), m_ledger.long_quantity());
    EXPECT_EQ(KapNumeric(1000), m_ledger.lots().front().total_cost);

    auto result = m_ledger.consume_long_lots_for_sale(
        make_trade("STOCK", "2023-06-01", KapTradeType::sell_long, "-1",
                   "1100", "T3"));
    ASSERT_TRUE(result);
    ASSERT_EQ(1u, result.value().size());
    EXPECT_EQ(KapNumeric(1), result.value().front().quantity());
    EXPECT_EQ(KapNumeric(100), cents(result.value().front().gross_gain_loss()));
}

TEST_F(KapLedgerTest, test_cash_merger)
{
    buy_two_lots();
    KapCashMergerEvent merger;
    merger.asset_id = "STOCK";
    merger.event_date = "2023-09-01";
    merger.ca_action_id = "MERGE";
    merger.cash_per_share_eur = KapNumeric(120);
    merger.quantity_disposed = KapNumeric(20);
    auto records = m_ledger.consume_all_lots_for_cash_merger(merger);
    ASSERT_EQ(2u, records.size());
    EXPECT_EQ(KapRealizationType::cash_merger_proceeds,
              records[0].realization_type());
    EXPECT_EQ(KapNumeric(199), records[0].gross_gain_loss());
    EXPECT_EQ(KapNumeric(99), records[1].gross_gain_loss());
    EXPECT_TRUE(m_ledger.lots().empty());

    merger.cash_per_share_eur.reset();
    buy_two_lots();
    EXPECT_TRUE(m_ledger.consume_all_lots_for_cash_merger(merger).empty());
    EXPECT_EQ(KapNumeric(20), m_ledger.long_quantity());
}

TEST_F(KapLedgerTest, test_stock_dividend_lot)
{
    buy_two_lots();
    m_ledger.add_lot_for_stock_dividend(
        make_stock_dividend("STOCK", "2023-01-20", "2", "105", "SD1"));
    ASSERT_EQ(3u, m_ledger.lots().size());
    const auto& lot = m_ledger.lots()[1];
    EXPECT_EQ("SD1", lot.source_transaction_id);
    EXPECT_EQ(KapNumeric(210), lot.total_cost);
    EXPECT_EQ(KapDate(2023, 1, 20), lot.acquisition_date);

    auto unnamed = make_stock_dividend("STOCK", "2023-03-01", "1", "100", "");
    m_ledger.add_lot_for_stock_dividend(unnamed);
    EXPECT_EQ("STOCKDIV_" + unnamed.event_id.to_string(),
              m_ledger.lots().back().source_transaction_id);
}

TEST_F(KapLedgerTest, test_tax_free_stock_dividend)
{
    m_ledger.add_lot_for_stock_dividend(
        make_stock_dividend("STOCK", "2023-04-01", "2", "0", "SD0"));
    ASSERT_EQ(1u, m_ledger.lots().size());
    const auto& lot = m_ledger.lots().front();
    EXPECT_EQ(KapNumeric(2), lot.quantity);
    EXPECT_TRUE(lot.total_cost.is_zero());
    EXPECT_TRUE(lot.unit_cost.is_zero());

    auto result = m_ledger.consume_long_lots_for_sale(
        make_trade("STOCK", "2023-08-01", KapTradeType::sell_long, "-1",
                   "55", "T1"));
    ASSERT_TRUE(result);
    ASSERT_EQ(1u, result.value().size());
    const auto& record = result.value().front();
    EXPECT_TRUE(record.total_cost_basis().is_zero());
    EXPECT_EQ(KapNumeric(55), record.gross_gain_loss());
    EXPECT_EQ(KapNumeric(1), m_ledger.long_quantity());
}

TEST_F(KapLedgerTest, test_capital_repayment)
{
    buy_two_lots();
    auto excess = m_ledger.reduce_cost_basis_for_capital_repayment(KapNumeric(1500));
    EXPECT_TRUE(excess.is_zero());
    EXPECT_TRUE(m_ledger.lots()[0].total_cost.is_zero());
    EXPECT_TRUE(m_ledger.lots()[0].unit_cost.is_zero());
    EXPECT_EQ(KapNumeric(602), m_ledger.lots()[1].total_cost);
    EXPECT_EQ(KapNumeric(602, 1), m_ledger.lots()[1].unit_cost);

    excess = m_ledger.reduce_cost_basis_for_capital_repayment(KapNumeric(1000));
    EXPECT_EQ(KapNumeric(398), excess);
    EXPECT_TRUE(m_ledger.lots()[1].total_cost.is_zero());
    EXPECT_EQ(KapNumeric(20), m_ledger.long_quantity());
}

TEST_F(KapLedgerTest, test_option_consumption_needs_option)
{
    EXPECT_THROW(m_ledger.consume_long_option(KapNumeric(1)), std::logic_error);
    EXPECT_THROW(m_ledger.consume_short_option(KapNumeric(1)), std::logic_error);
}

TEST_F(KapLedgerTest, test_option_multiplier_default)
{
    auto option = make_option("CALL", "STOCK", 'C');
    option.multiplier.reset();
    KapLedger ledger{option, m_converter, m_ctx};
    ASSERT_TRUE(ledger.multiplier());
    EXPECT_EQ(KapNumeric(100), *ledger.multiplier());
    EXPECT_FALSE(m_ledger.multiplier());
}

TEST_F(KapLedgerTest, test_fund_sale_exemption)
{
    auto fund = make_asset("FUND", KapAssetCategory::investment_fund);
    fund.fund_type = KapFundType::aktienfonds;
    KapLedger ledger{fund, m_converter, m_ctx};
    ledger.add_long_lot(make_trade("FUND", "2022-05-01",
                                   KapTradeType::buy_long, "10", "1000", "F1"));
    ledger.add_long_lot(make_trade("FUND", "2022-06-01",
                                   KapTradeType::buy_long, "10", "3000", "F2"));
    auto result = ledger.consume_long_lots_for_sale(
        make_trade("FUND", "2023-05-01", KapTradeType::sell_long, "-20",
                   "4000", "F3"));
    ASSERT_TRUE(result);
    const auto& records = result.value();
    ASSERT_EQ(2u, records.size());
    EXPECT_EQ(KapTaxCategory::kap_inv_aktienfonds_gewinn_gross,
              records[0].tax_category());
    EXPECT_EQ(KapNumeric(1000), records[0].gross_gain_loss());
    EXPECT_EQ(KapNumeric(3, 1), *records[0].exemption_rate());
    EXPECT_EQ(KapNumeric(300), *records[0].exemption_amount());
    EXPECT_EQ(KapNumeric(700), records[0].net_gain_loss());
    EXPECT_EQ(KapNumeric(-1000), records[1].gross_gain_loss());
    EXPECT_EQ(KapNumeric(-700), records[1].net_gain_loss());
    EXPECT_EQ(KapFundType::aktienfonds, *records[1].fund_type());
}

TEST(KapRealized, test_classification)
{
    using TC = KapTaxCategory;
    auto cls = kap_classify_realization(KapAssetCategory::private_sale_asset,
                                        KapFundType::none, KapNumeric(50),
                                        365L);
    EXPECT_EQ(TC::section_23_taxable_gain, cls.category);
    EXPECT_TRUE(cls.section_23_taxable);
    cls = kap_classify_realization(KapAssetCategory::private_sale_asset,
                                   KapFundType::none, KapNumeric(-50), 10L);
    EXPECT_EQ(TC::section_23_taxable_loss, cls.category);
    cls = kap_classify_realization(KapAssetCategory::private_sale_asset,
                                   KapFundType::none, KapNumeric(50), 366L);
    EXPECT_EQ(TC::section_23_exempt_holding_period_met, cls.category);
    EXPECT_FALSE(cls.section_23_taxable);
    cls = kap_classify_realization(KapAssetCategory::option,
                                   KapFundType::none, KapNumeric(-1), 3L);
    EXPECT_EQ(TC::anlage_kap_termin_verlust, cls.category);
    cls = kap_classify_realization(KapAssetCategory::bond, KapFundType::none,
                                   KapNumeric(0), 3L);
    EXPECT_EQ(TC::anlage_kap_sonstige_kapitalertraege, cls.category);
    cls = kap_classify_realization(KapAssetCategory::investment_fund,
                                   KapFundType::none, KapNumeric(5), 3L);
    EXPECT_EQ(TC::kap_inv_sonstige_fonds_gewinn_gross, cls.category);
}

TEST(KapRealized, test_holding_period)
{
    EXPECT_EQ(365, *kap_holding_period_days(KapDate(2023, 1, 1),
                                             KapDate(2024, 1, 1)));
    EXPECT_FALSE(kap_holding_period_days(KapDate(2023, 1, 2),
                                         KapDate(2023, 1, 1)));
}

TEST(KapRealized, test_vorabpauschale)
{
    KapNumericContext ctx;
    auto item = kap_make_vorabpauschale("FUND", 2023, KapNumeric("100.55"),
                                        KapFundType::mischfonds, ctx);
    EXPECT_EQ(KapNumeric(15, 2), item.exemption_rate);
    EXPECT_EQ(KapNumeric(1508, 2), item.exemption_amount);
    EXPECT_EQ(KapNumeric(8547, 2), item.net_taxable_amount);
    EXPECT_EQ(KapTaxCategory::kap_inv_mischfonds_vorabpauschale_brutto,
              item.category);
}
