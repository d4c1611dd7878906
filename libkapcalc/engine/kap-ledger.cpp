/********************************************************************
 * kap-ledger.cpp -- per-asset FIFO lot ledger                      *
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

#include <algorithm>
#include <stdexcept>
#include <tuple>
#include "kap-ledger.hpp"
#include "kaplog.h"

static KapLogModule log_module = KAP_MOD_LEDGER;

/* Unconsumed remainders below this are rounding noise. */
static const KapNumeric quantity_tolerance{1, 10};
static const KapNumeric default_option_multiplier{100};

/* Largest acceptable difference between a lot's total and quantity x unit:
 * one digit above the coarser of the amount and per-unit precisions.
 */
static KapNumeric
lot_total_tolerance(const KapNumericContext& ctx)
{
    auto places = std::min(ctx.amount_places, ctx.unit_places) - 1;
    return KapNumeric(1, std::max(places, 0));
}

static void
validate_lot(const char* kind, const KapNumeric& qty, const KapNumeric& unit,
             const KapNumeric& total, const std::string& source_id,
             const KapNumericContext& ctx)
{
    if (qty <= 0)
        throw std::invalid_argument(std::string(kind) + " quantity " +
                                    qty.to_string() + " isn't positive.");
    if (unit.is_negative() || total.is_negative())
        throw std::invalid_argument(std::string(kind) + " " + source_id +
                                    " has a negative amount.");
    if (source_id.empty())
        throw std::invalid_argument(std::string(kind) +
                                    " requires a source transaction id.");
    auto expected = ctx.multiply(qty, unit);
    if (!expected.is_zero() &&
        (total - expected).abs() > lot_total_tolerance(ctx))
        PWARN("%s %s: total %s differs from quantity %s x unit %s = %s, "
              "keeping the total", kind, source_id.c_str(),
              total.to_string().c_str(), qty.to_string().c_str(),
              unit.to_string().c_str(), expected.to_string().c_str());
}

KapLot::KapLot(const KapDate& date, const KapNumeric& qty,
               const KapNumeric& unit, const KapNumeric& total,
               const std::string& source_id, const KapNumericContext& ctx) :
    acquisition_date{date}, quantity{qty}, unit_cost{unit}, total_cost{total},
    source_transaction_id{source_id}
{
    validate_lot("Lot", qty, unit, total, source_id, ctx);
}

KapShortLot::KapShortLot(const KapDate& date, const KapNumeric& qty,
                         const KapNumeric& unit, const KapNumeric& total,
                         const std::string& source_id,
                         const KapNumericContext& ctx) :
    opening_date{date}, quantity{qty}, unit_proceeds{unit},
    total_proceeds{total}, source_transaction_id{source_id}
{
    validate_lot("Short lot", qty, unit, total, source_id, ctx);
}

const char*
to_string(KapSoyOutcome outcome) noexcept
{
    switch (outcome)
    {
    case KapSoyOutcome::no_position: return "NO_POSITION";
    case KapSoyOutcome::reconstructed: return "RECONSTRUCTED";
    case KapSoyOutcome::fallback: return "FALLBACK";
    }
    return "UNKNOWN";
}

KapLedger::KapLedger(const KapAsset& asset,
                     const KapCurrencyConverter& converter,
                     KapNumericContext ctx) :
    m_asset_id{asset.id}, m_category{asset.category},
    m_fund_type{asset.fund_type}, m_converter{converter}, m_ctx{ctx}
{
    if (m_category == KapAssetCategory::investment_fund &&
        m_fund_type == KapFundType::none)
        PWARN("Fund %s has no fund type, reporting it as sonstige Fonds",
              m_asset_id.c_str());
    if (asset.multiplier && *asset.multiplier > 0)
        m_multiplier = asset.multiplier;
    else if (m_category == KapAssetCategory::option)
    {
        PWARN("Option %s has no valid multiplier, using %s",
              m_asset_id.c_str(),
              default_option_multiplier.to_string().c_str());
        m_multiplier = default_option_multiplier;
    }
}

void
KapLedger::insert_lot(KapLot lot)
{
    auto pos = std::upper_bound(m_lots.begin(), m_lots.end(), lot,
                                [](const KapLot& a, const KapLot& b) {
                                    return std::tie(a.acquisition_date,
                                                    a.source_transaction_id) <
                                        std::tie(b.acquisition_date,
                                                 b.source_transaction_id);
                                });
    m_lots.insert(pos, std::move(lot));
}

void
KapLedger::insert_short_lot(KapShortLot lot)
{
    auto pos = std::upper_bound(m_short_lots.begin(), m_short_lots.end(), lot,
                                [](const KapShortLot& a, const KapShortLot& b) {
                                    return std::tie(a.opening_date,
                                                    a.source_transaction_id) <
                                        std::tie(b.opening_date,
                                                 b.source_transaction_id);
                                });
    m_short_lots.insert(pos, std::move(lot));
}

void
KapLedger::add_long_lot(const KapTradeEvent& trade)
{
    if (trade.trade_type != KapTradeType::buy_long ||
        trade.quantity <= 0 || !trade.net_proceeds_or_cost_eur)
        return;
    if (trade.transaction_id.empty())
        throw std::invalid_argument("Buy " + trade.event_id.to_string() +
                                    " of asset " + m_asset_id +
                                    " has no transaction id.");
    auto qty = m_ctx.quantize_quantity(trade.quantity);
    if (qty.is_zero())
    {
        PWARN("Buy %s of asset %s has zero quantity at the quantity "
              "precision, no lot created", trade.transaction_id.c_str(),
              m_asset_id.c_str());
        return;
    }
    auto total = *trade.net_proceeds_or_cost_eur;
    insert_lot(KapLot(KapDate(trade.event_date), qty, m_ctx.divide(total, qty),
                      total, trade.transaction_id, m_ctx));
    DEBUG("Asset %s: long lot %s, %s @ %s", m_asset_id.c_str(),
          trade.transaction_id.c_str(), qty.to_string().c_str(),
          total.to_string().c_str());
}

void
KapLedger::add_short_lot(const KapTradeEvent& trade)
{
    if (trade.trade_type != KapTradeType::sell_short_open)
        return;
    if (!trade.quantity.is_negative())
        return;
    if (!trade.net_proceeds_or_cost_eur)
    {
        PERR("Short sale %s of asset %s has no EUR proceeds, no lot created",
             trade.transaction_id.c_str(), m_asset_id.c_str());
        return;
    }
    if (trade.transaction_id.empty())
        throw std::invalid_argument("Short sale " + trade.event_id.to_string() +
                                    " of asset " + m_asset_id +
                                    " has no transaction id.");
    auto qty = m_ctx.quantize_quantity(trade.quantity.abs());
    if (qty.is_zero())
    {
        PWARN("Short sale %s of asset %s has zero quantity at the quantity "
              "precision, no lot created", trade.transaction_id.c_str(),
              m_asset_id.c_str());
        return;
    }
    auto total = trade.net_proceeds_or_cost_eur->abs();
    insert_short_lot(KapShortLot(KapDate(trade.event_date), qty,
                                 m_ctx.divide(total, qty), total,
                                 trade.transaction_id, m_ctx));
}

KapRealizedGainLoss
KapLedger::make_record(const KapEventBase& event, const KapDate& acquired,
                       KapRealizationType type, const KapNumeric& quantity,
                       const KapNumeric& unit_cost,
                       const KapNumeric& unit_value,
                       const KapNumeric& total_cost,
                       const KapNumeric& total_value, bool short_side) const
{
    KapRealizationParams params;
    params.originating_event_id = event.event_id;
    params.asset_id = m_asset_id;
    params.category = m_category;
    params.acquisition_date = acquired;
    params.realization_date = KapDate(event.event_date);
    params.realization_type = type;
    params.quantity = quantity;
    params.unit_cost_basis = unit_cost;
    params.unit_realization_value = unit_value;
    params.total_cost_basis = total_cost;
    params.total_realization_value = total_value;
    params.gross_gain_loss = m_ctx.subtract(total_value, total_cost);
    params.holding_period_days =
        kap_holding_period_days(acquired, params.realization_date);
    auto cls = kap_classify_realization(m_category, m_fund_type,
                                        params.gross_gain_loss,
                                        params.holding_period_days);
    params.tax_category = cls.category;
    params.section_23_taxable = cls.section_23_taxable;
    params.stillhalter_income = short_side &&
        m_category == KapAssetCategory::option &&
        !params.gross_gain_loss.is_negative();
    params.fund_type = m_fund_type;
    return KapRealizedGainLoss(params, m_ctx);
}

KapLedgerResult<KapRealizedList>
KapLedger::consume_long_lots_for_sale(const KapTradeEvent& sale,
                                      KapReplayMode mode)
{
    KapRealizedList records;
    if (sale.trade_type != KapTradeType::sell_long ||
        !sale.quantity.is_negative() || !sale.net_proceeds_or_cost_eur)
        return records;

    auto to_realize = m_ctx.quantize_quantity(sale.quantity.abs());
    if (to_realize.is_zero())
        return records;
    auto proceeds = sale.net_proceeds_or_cost_eur->abs();
    auto unit_value = m_ctx.divide(proceeds, to_realize);
    auto available = long_quantity();
    auto type = m_category == KapAssetCategory::option ?
        KapRealizationType::option_trade_close_long :
        KapRealizationType::long_position_sale;

    auto remaining = to_realize;
    size_t exhausted = 0;
    for (auto& lot : m_lots)
    {
        if (remaining <= 0)
            break;
        KapNumeric slice;
        if (lot.quantity <= remaining)
        {
            slice = lot.quantity;
            ++exhausted;
        }
        else
        {
            slice = remaining;
            lot.quantity = m_ctx.subtract(lot.quantity, slice);
            lot.total_cost = m_ctx.multiply(lot.quantity, lot.unit_cost);
        }
        remaining = m_ctx.subtract(remaining, slice);
        if (mode == KapReplayMode::replay)
            continue;
        auto cost = m_ctx.multiply(slice, lot.unit_cost);
        auto value = m_ctx.multiply(slice, unit_value);
        records.push_back(make_record(sale, lot.acquisition_date, type, slice,
                                      lot.unit_cost, unit_value, cost, value,
                                      false));
    }
    m_lots.erase(m_lots.begin(), m_lots.begin() + exhausted);

    if (remaining.abs() > quantity_tolerance)
    {
        auto reason = "Insufficient long lots for sale " +
            (sale.transaction_id.empty() ? sale.event_id.to_string() :
             sale.transaction_id) + " of asset " + m_asset_id +
            ": required " + to_realize.to_string() + ", available " +
            available.to_string() + ", unmatched " + remaining.to_string();
        if (mode == KapReplayMode::replay)
            return KapLedgerError{KapLedgerErrorKind::replay_insufficient,
                                  reason};
        PERR("%s", reason.c_str());
        return KapLedgerError{KapLedgerErrorKind::fatal, reason};
    }
    return records;
}

KapLedgerResult<KapRealizedList>
KapLedger::consume_short_lots_for_cover(const KapTradeEvent& cover,
                                        KapReplayMode mode)
{
    KapRealizedList records;
    if (cover.trade_type != KapTradeType::buy_short_cover ||
        cover.quantity <= 0 || !cover.net_proceeds_or_cost_eur)
        return records;

    auto to_realize = m_ctx.quantize_quantity(cover.quantity);
    if (to_realize.is_zero())
        return records;
    auto unit_cost = m_ctx.divide(*cover.net_proceeds_or_cost_eur, to_realize);
    auto available = short_quantity();
    auto type = m_category == KapAssetCategory::option ?
        KapRealizationType::option_trade_close_short :
        KapRealizationType::short_position_cover;

    auto remaining = to_realize;
    size_t exhausted = 0;
    for (auto& lot : m_short_lots)
    {
        if (remaining <= 0)
            break;
        KapNumeric slice;
        if (lot.quantity <= remaining)
        {
            slice = lot.quantity;
            ++exhausted;
        }
        else
        {
            slice = remaining;
            lot.quantity = m_ctx.subtract(lot.quantity, slice);
            lot.total_proceeds = m_ctx.multiply(lot.quantity, lot.unit_proceeds);
        }
        remaining = m_ctx.subtract(remaining, slice);
        if (mode == KapReplayMode::replay)
            continue;
        auto cost = m_ctx.multiply(slice, unit_cost);
        auto value = m_ctx.multiply(slice, lot.unit_proceeds);
        records.push_back(make_record(cover, lot.opening_date, type, slice,
                                      unit_cost, lot.unit_proceeds, cost,
                                      value, true));
    }
    m_short_lots.erase(m_short_lots.begin(), m_short_lots.begin() + exhausted);

    if (remaining.abs() > quantity_tolerance)
    {
        auto reason = "Insufficient short lots for cover " +
            (cover.transaction_id.empty() ? cover.event_id.to_string() :
             cover.transaction_id) + " of asset " + m_asset_id +
            ": required " + to_realize.to_string() + ", available " +
            available.to_string() + ", unmatched " + remaining.to_string();
        if (mode == KapReplayMode::replay)
            return KapLedgerError{KapLedgerErrorKind::replay_insufficient,
                                  reason};
        PERR("%s", reason.c_str());
        return KapLedgerError{KapLedgerErrorKind::fatal, reason};
    }
    return records;
}

bool
KapLedger::adjust_lots_for_split(const KapSplitEvent& event)
{
    const auto& ratio = event.new_per_old;
    if (ratio <= 0)
    {
        PWARN("Split %s of asset %s has invalid ratio %s, lots unchanged",
              event.event_id.to_string().c_str(), m_asset_id.c_str(),
              ratio.to_string().c_str());
        return false;
    }
    PINFO("Applying split ratio %s to asset %s", ratio.to_string().c_str(),
          m_asset_id.c_str());

    auto split_unit = [this, &ratio](KapNumeric& qty, const KapNumeric& total,
                                     const std::string& source) {
        auto new_qty = m_ctx.quantize_quantity(m_ctx.multiply(qty, ratio));
        KapNumeric unit;
        if (new_qty.is_zero())
            PWARN("Lot %s of asset %s has no quantity left after the split, "
                  "dropping it with its basis of %s EUR", source.c_str(),
                  m_asset_id.c_str(), total.to_string().c_str());
        else
            unit = m_ctx.divide(total, new_qty);
        qty = new_qty;
        return unit;
    };
    for (auto& lot : m_lots)
        lot.unit_cost = split_unit(lot.quantity, lot.total_cost,
                                   lot.source_transaction_id);
    for (auto& lot : m_short_lots)
        lot.unit_proceeds = split_unit(lot.quantity, lot.total_proceeds,
                                       lot.source_transaction_id);

    auto emptied = [](const auto& lot) { return lot.quantity.is_zero(); };
    m_lots.erase(std::remove_if(m_lots.begin(), m_lots.end(), emptied),
                 m_lots.end());
    m_short_lots.erase(std::remove_if(m_short_lots.begin(), m_short_lots.end(),
                                      emptied),
                       m_short_lots.end());
    return true;
}

KapRealizedList
KapLedger::consume_all_lots_for_cash_merger(const KapCashMergerEvent& event)
{
    KapRealizedList records;
    if (!event.cash_per_share_eur)
    {
        PERR("Cash merger %s of asset %s has no cash amount per unit",
             event.event_id.to_string().c_str(), m_asset_id.c_str());
        return records;
    }
    if (m_lots.empty())
    {
        PINFO("Cash merger %s of asset %s, but no long lots",
              event.event_id.to_string().c_str(), m_asset_id.c_str());
        return records;
    }
    const auto& price = *event.cash_per_share_eur;
    for (const auto& lot : m_lots)
        records.push_back(make_record(event, lot.acquisition_date,
                                      KapRealizationType::cash_merger_proceeds,
                                      lot.quantity, lot.unit_cost, price,
                                      lot.total_cost,
                                      m_ctx.multiply(lot.quantity, price),
                                      false));
    m_lots.clear();
    PINFO("Cash merger %s closed all long lots of asset %s",
          event.event_id.to_string().c_str(), m_asset_id.c_str());
    return records;
}

void
KapLedger::add_lot_for_stock_dividend(const KapStockDividendEvent& event)
{
    if (event.quantity_new <= 0)
    {
        PINFO("Stock dividend %s of asset %s has no new units",
              event.event_id.to_string().c_str(), m_asset_id.c_str());
        return;
    }
    if (!event.fmv_per_new_share_eur)
    {
        PERR("Stock dividend %s of asset %s has no value per new unit",
             event.event_id.to_string().c_str(), m_asset_id.c_str());
        return;
    }
    if (m_category != KapAssetCategory::stock &&
        m_category != KapAssetCategory::investment_fund)
        PWARN("Stock dividend %s for asset %s of category %s",
              event.event_id.to_string().c_str(), m_asset_id.c_str(),
              to_string(m_category));

    auto qty = m_ctx.quantize_quantity(event.quantity_new);
    if (qty.is_zero())
    {
        PWARN("Stock dividend %s of asset %s has zero quantity at the "
              "quantity precision", event.event_id.to_string().c_str(),
              m_asset_id.c_str());
        return;
    }
    const auto& unit = *event.fmv_per_new_share_eur;
    std::string source = event.ca_action_id;
    if (source.empty())
        source = event.transaction_id;
    if (source.empty())
        source = "STOCKDIV_" + event.event_id.to_string();
    insert_lot(KapLot(KapDate(event.event_date), qty, unit,
                      m_ctx.multiply(qty, unit), source, m_ctx));
}

KapLedgerResult<KapConsumedLots>
KapLedger::consume_long_option(const KapNumeric& contracts)
{
    if (m_category != KapAssetCategory::option)
        throw std::logic_error("Long option consumption on asset " +
                               m_asset_id + " of category " +
                               to_string(m_category));
    auto to_consume = m_ctx.quantize_quantity(contracts);
    if (to_consume <= 0)
    {
        PWARN("Contracts to consume on %s must be positive, got %s",
              m_asset_id.c_str(), to_consume.to_string().c_str());
        return KapConsumedLots{};
    }

    KapConsumedLots consumed;
    auto remaining = to_consume;
    size_t exhausted = 0;
    for (auto& lot : m_lots)
    {
        if (remaining <= 0)
            break;
        KapNumeric slice;
        if (lot.quantity <= remaining)
        {
            slice = lot.quantity;
            ++exhausted;
        }
        else
        {
            slice = remaining;
            lot.quantity = m_ctx.subtract(lot.quantity, slice);
            lot.total_cost = m_ctx.multiply(lot.quantity, lot.unit_cost);
        }
        consumed.push_back({slice, lot.unit_cost, lot.acquisition_date,
                            lot.source_transaction_id});
        remaining = m_ctx.subtract(remaining, slice);
    }
    m_lots.erase(m_lots.begin(), m_lots.begin() + exhausted);
    if (remaining.abs() > quantity_tolerance)
    {
        auto reason = "Insufficient long option contracts on " + m_asset_id +
            ": required " + to_consume.to_string() + ", unmatched " +
            remaining.to_string();
        PERR("%s", reason.c_str());
        return KapLedgerError{KapLedgerErrorKind::fatal, reason};
    }
    DEBUG("Consumed %s long contracts of %s from %zu lots",
          to_consume.to_string().c_str(), m_asset_id.c_str(),
          consumed.size());
    return consumed;
}

KapLedgerResult<KapConsumedLots>
KapLedger::consume_short_option(const KapNumeric& contracts)
{
    if (m_category != KapAssetCategory::option)
        throw std::logic_error("Short option consumption on asset " +
                               m_asset_id + " of category " +
                               to_string(m_category));
    auto to_consume = m_ctx.quantize_quantity(contracts);
    if (to_consume <= 0)
    {
        PWARN("Contracts to consume on %s must be positive, got %s",
              m_asset_id.c_str(), to_consume.to_string().c_str());
        return KapConsumedLots{};
    }

    KapConsumedLots consumed;
    auto remaining = to_consume;
    size_t exhausted = 0;
    for (auto& lot : m_short_lots)
    {
        if (remaining <= 0)
            break;
        KapNumeric slice;
        if (lot.quantity <= remaining)
        {
            slice = lot.quantity;
            ++exhausted;
        }
        else
        {
            slice = remaining;
            lot.quantity = m_ctx.subtract(lot.quantity, slice);
            lot.total_proceeds = m_ctx.multiply(lot.quantity, lot.unit_proceeds);
        }
        consumed.push_back({slice, lot.unit_proceeds, lot.opening_date,
                            lot.source_transaction_id});
        remaining = m_ctx.subtract(remaining, slice);
    }
    m_short_lots.erase(m_short_lots.begin(), m_short_lots.begin() + exhausted);
    if (remaining.abs() > quantity_tolerance)
    {
        auto reason = "Insufficient short option contracts on " + m_asset_id +
            ": required " + to_consume.to_string() + ", unmatched " +
            remaining.to_string();
        PERR("%s", reason.c_str());
        return KapLedgerError{KapLedgerErrorKind::fatal, reason};
    }
    DEBUG("Consumed %s short contracts of %s from %zu lots",
          to_consume.to_string().c_str(), m_asset_id.c_str(),
          consumed.size());
    return consumed;
}

KapNumeric
KapLedger::reduce_cost_basis_for_capital_repayment(const KapNumeric& amount)
{
    if (amount <= 0 || m_lots.empty())
        return amount;
    auto remaining = amount;
    for (auto& lot : m_lots)
    {
        if (remaining <= 0)
            break;
        auto reduction = std::min(remaining, lot.total_cost);
        lot.total_cost = m_ctx.subtract(lot.total_cost, reduction);
        lot.unit_cost = lot.quantity > 0 ?
            m_ctx.divide(lot.total_cost, lot.quantity) : KapNumeric();
        remaining = m_ctx.subtract(remaining, reduction);
    }
    DEBUG("Capital repayment %s on %s leaves %s", amount.to_string().c_str(),
          m_asset_id.c_str(), remaining.to_string().c_str());
    return remaining;
}

KapNumeric
KapLedger::long_quantity() const
{
    KapNumeric total;
    for (const auto& lot : m_lots)
        total += lot.quantity;
    return total;
}

KapNumeric
KapLedger::short_quantity() const
{
    KapNumeric total;
    for (const auto& lot : m_short_lots)
        total += lot.quantity;
    return total;
}

KapNumeric
KapLedger::current_position_quantity() const
{
    return m_ctx.quantize_quantity(m_ctx.subtract(long_quantity(),
                                                  short_quantity()));
}
