/********************************************************************
 * kap-ledger-soy.cpp -- start-of-year lot initialization           *
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
#include <cctype>
#include <stdexcept>
#include "kap-ledger.hpp"
#include "kaplog.h"

static KapLogModule log_module = KAP_MOD_SOY;

/* Remainder tolerated when truncating the reconstructed lots. */
static const KapNumeric assignment_tolerance{1, 8};

static bool
is_eur(const std::string& currency)
{
    std::string upper{currency};
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c){ return std::toupper(c); });
    return upper == "EUR";
}

static void
check_replay_result(const KapLedgerError& error, const std::string& asset_id,
                    bool& inconsistent)
{
    if (error.kind == KapLedgerErrorKind::fatal)
        throw std::runtime_error(error.reason);
    PWARN("Replay of asset %s: %s", asset_id.c_str(), error.reason.c_str());
    inconsistent = true;
}

/* Apply one historical event. Returns false if the lots couldn't satisfy
 * it.
 */
bool
KapLedger::replay_event(const KapEvent& event)
{
    bool inconsistent = false;
    std::visit(
        [this, &inconsistent](const auto& ev) {
            using T = decltype(ev);
            if constexpr (is_same_decayed_v<T, KapTradeEvent>)
            {
                switch (ev.trade_type)
                {
                case KapTradeType::buy_long:
                    add_long_lot(ev);
                    break;
                case KapTradeType::sell_short_open:
                    add_short_lot(ev);
                    break;
                case KapTradeType::sell_long:
                {
                    auto result = consume_long_lots_for_sale(ev, KapReplayMode::replay);
                    if (!result)
                        check_replay_result(result.error(), m_asset_id,
                                            inconsistent);
                    break;
                }
                case KapTradeType::buy_short_cover:
                {
                    auto result = consume_short_lots_for_cover(ev, KapReplayMode::replay);
                    if (!result)
                        check_replay_result(result.error(), m_asset_id,
                                            inconsistent);
                    break;
                }
                }
            }
            else if constexpr (is_same_decayed_v<T, KapSplitEvent>)
                adjust_lots_for_split(ev);
            else if constexpr (is_same_decayed_v<T, KapStockDividendEvent>)
                add_lot_for_stock_dividend(ev);
            else
                DEBUG("Event %s doesn't change the lots, skipped",
                      ev.event_id.to_string().c_str());
        }, event);
    return !inconsistent;
}

void
KapLedger::keep_reconstructed_long(const std::vector<KapLot>& lots,
                                   KapNumeric quantity)
{
    for (const auto& lot : lots)
    {
        if (quantity <= 0)
            break;
        auto qty = std::min(lot.quantity, quantity);
        m_lots.emplace_back(lot.acquisition_date, qty, lot.unit_cost,
                            m_ctx.multiply(qty, lot.unit_cost),
                            lot.source_transaction_id, m_ctx);
        quantity -= qty;
    }
}

void
KapLedger::keep_reconstructed_short(const std::vector<KapShortLot>& lots,
                                    KapNumeric quantity)
{
    for (const auto& lot : lots)
    {
        if (quantity <= 0)
            break;
        auto qty = std::min(lot.quantity, quantity);
        m_short_lots.emplace_back(lot.opening_date, qty, lot.unit_proceeds,
                                  m_ctx.multiply(qty, lot.unit_proceeds),
                                  lot.source_transaction_id, m_ctx);
        quantity -= qty;
    }
}

/* The reported start of year cost basis (short positions: proceeds) in EUR,
 * zero if it's missing or can't be converted.
 */
KapNumeric
KapLedger::fallback_basis(const KapAsset& asset, int tax_year,
                          bool short_side) const
{
    if (!asset.soy_cost_basis || asset.soy_cost_basis->currency.empty())
    {
        PERR("Asset %s has no start of year cost basis, using zero",
             m_asset_id.c_str());
        return KapNumeric(0, m_ctx.amount_places);
    }
    auto amount = asset.soy_cost_basis->amount;
    if (short_side)
        amount = amount.abs();
    const auto& currency = asset.soy_cost_basis->currency;
    if (!is_eur(currency))
    {
        auto converted = m_converter.convert_to_eur(amount, currency,
                                                    KapDate(tax_year, 1, 1));
        if (!converted)
        {
            PERR("Asset %s: can't convert start of year cost basis %s %s, "
                 "using zero", m_asset_id.c_str(),
                 amount.to_string().c_str(), currency.c_str());
            return KapNumeric(0, m_ctx.amount_places);
        }
        amount = *converted;
    }
    if (amount.is_negative())
    {
        PWARN("Asset %s: start of year cost basis %s EUR is negative, "
              "using zero", m_asset_id.c_str(), amount.to_string().c_str());
        return KapNumeric(0, m_ctx.amount_places);
    }
    return amount;
}

void
KapLedger::add_fallback_long_lot(const KapAsset& asset,
                                 const KapNumeric& quantity, int tax_year)
{
    auto total = fallback_basis(asset, tax_year, false);
    m_lots.emplace_back(KapDate(tax_year - 1, 12, 31), quantity,
                        m_ctx.divide(total, quantity), total,
                        "SOY_FALLBACK_" + m_asset_id, m_ctx);
    PINFO("Asset %s: fallback lot of %s at %s EUR", m_asset_id.c_str(),
          quantity.to_string().c_str(), total.to_string().c_str());
}

void
KapLedger::add_fallback_short_lot(const KapAsset& asset,
                                  const KapNumeric& quantity, int tax_year)
{
    auto total = fallback_basis(asset, tax_year, true);
    m_short_lots.emplace_back(KapDate(tax_year - 1, 12, 31), quantity,
                              m_ctx.divide(total, quantity), total,
                              "SOY_FALLBACK_SHORT_" + m_asset_id, m_ctx);
    PINFO("Asset %s: fallback short lot of %s at %s EUR", m_asset_id.c_str(),
          quantity.to_string().c_str(), total.to_string().c_str());
}

KapSoyOutcome
KapLedger::initialize_from_soy(const KapAsset& asset,
                               const std::vector<KapEvent>& history,
                               int tax_year)
{
    ENTER("asset %s, %zu historical events, tax year %d", m_asset_id.c_str(),
          history.size(), tax_year);
    if (m_category == KapAssetCategory::investment_fund &&
        m_fund_type == KapFundType::none &&
        asset.fund_type != KapFundType::none)
    {
        PINFO("Fund %s takes fund type %s", m_asset_id.c_str(),
              to_string(asset.fund_type));
        m_fund_type = asset.fund_type;
    }

    m_lots.clear();
    m_short_lots.clear();
    KapDate year_start{tax_year, 1, 1};
    bool consistent = true;
    for (const auto& event : history)
    {
        const auto& base = kap_event_base(event);
        if (KapDate(base.event_date) >= year_start)
        {
            PWARN("Historical event %s of asset %s dated %s isn't before "
                  "tax year %d, skipped", base.event_id.to_string().c_str(),
                  m_asset_id.c_str(), base.event_date.c_str(), tax_year);
            continue;
        }
        if (!replay_event(event))
            consistent = false;
    }

    auto rebuilt_long = std::move(m_lots);
    auto rebuilt_short = std::move(m_short_lots);
    m_lots.clear();
    m_short_lots.clear();
    KapNumeric long_qty, short_qty;
    for (const auto& lot : rebuilt_long)
        long_qty += lot.quantity;
    for (const auto& lot : rebuilt_short)
        short_qty += lot.quantity;

    KapNumeric reported;
    if (!asset.soy_quantity)
        PWARN("Asset %s has no reported start of year quantity, assuming 0",
              m_asset_id.c_str());
    else
        reported = m_ctx.quantize_quantity(*asset.soy_quantity);
    PINFO("Asset %s: rebuilt long %s short %s, reported %s%s",
          m_asset_id.c_str(), long_qty.to_string().c_str(),
          short_qty.to_string().c_str(), reported.to_string().c_str(),
          consistent ? "" : ", replay inconsistent");

    if (reported.is_zero())
    {
        LEAVE("no position");
        return KapSoyOutcome::no_position;
    }

    bool use_fallback = !consistent;
    if (consistent && reported > 0 && long_qty >= reported &&
        short_qty.is_zero())
    {
        keep_reconstructed_long(rebuilt_long, reported);
        if ((long_quantity() - reported).abs() > assignment_tolerance)
            use_fallback = true;
    }
    else if (consistent && reported < 0 && short_qty >= reported.abs() &&
             long_qty.is_zero())
    {
        keep_reconstructed_short(rebuilt_short, reported.abs());
        if ((short_quantity() - reported.abs()).abs() > assignment_tolerance)
            use_fallback = true;
    }
    else
        use_fallback = true;

    if (!use_fallback)
    {
        LEAVE("reconstructed");
        return KapSoyOutcome::reconstructed;
    }

    m_lots.clear();
    m_short_lots.clear();
    PWARN("Asset %s: history doesn't account for the reported start of year "
          "quantity %s, using the reported cost basis", m_asset_id.c_str(),
          reported.to_string().c_str());
    if (reported > 0)
        add_fallback_long_lot(asset, reported, tax_year);
    else
        add_fallback_short_lot(asset, reported.abs(), tax_year);
    LEAVE("fallback");
    return KapSoyOutcome::fallback;
}
