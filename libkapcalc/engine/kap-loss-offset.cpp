/********************************************************************
 * kap-loss-offset.cpp -- loss offsetting and tax form lines        *
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
#include "kap-loss-offset.hpp"
#include "kaplog.h"

static KapLogModule log_module = KAP_MOD_LOSS;

namespace
{
/* Running totals; losses are kept as absolute values. */
struct KapPots
{
    KapNumeric stock_gains;
    KapNumeric stock_losses;
    KapNumeric derivative_gains;
    KapNumeric derivative_losses;
    KapNumeric other_income;
    KapNumeric other_losses;
    KapNumeric fund_income;
    KapNumeric section_23;
    KapNumeric foreign_tax;
    std::map<KapTaxCategory, KapNumeric> kap_inv;
};

void
split_gain_loss(const KapNumericContext& ctx, const KapNumeric& amount,
                KapNumeric& gains, KapNumeric& losses)
{
    if (amount > 0)
        gains = ctx.add(gains, amount);
    else
        losses = ctx.add(losses, amount.abs());
}
}

KapNumeric
KapLossOffsettingResult::form_line(KapTaxCategory category) const
{
    auto iter = form_lines.find(category);
    return iter == form_lines.end() ? KapNumeric() : iter->second;
}

KapLossOffsettingEngine::KapLossOffsettingEngine(const KapAssetLookup& assets,
                                                 KapNumericContext ctx,
                                                 int tax_year,
                                                 bool apply_derivative_cap,
                                                 KapNumeric derivative_cap) :
    m_assets{assets}, m_ctx{ctx}, m_tax_year{tax_year},
    m_apply_cap{apply_derivative_cap}, m_cap{derivative_cap.abs()}
{
}

KapLossOffsettingEngine::KapLossOffsettingEngine(const KapAssetLookup& assets,
                                                 const KapConfig& config,
                                                 int tax_year) :
    KapLossOffsettingEngine(assets, config.numeric_context(), tax_year,
                            config.apply_derivative_loss_cap(),
                            config.derivative_loss_cap())
{
}

KapLossOffsettingResult
KapLossOffsettingEngine::aggregate(const KapRealizedList& realized,
                                   const std::vector<KapEvent>& events,
                                   const std::vector<KapVorabpauschale>& vorabpauschale,
                                   const std::vector<KapCapitalRepaymentExcess>& excess) const
{
    ENTER("tax year %d: %zu records, %zu events, %zu Vorabpauschale items",
          m_tax_year, realized.size(), events.size(), vorabpauschale.size());
    const auto& ctx = m_ctx;
    KapPots pots;

    for (const auto& rgl : realized)
    {
        const auto& gross = rgl.gross_gain_loss();
        switch (rgl.category())
        {
        case KapAssetCategory::stock:
            split_gain_loss(ctx, gross, pots.stock_gains, pots.stock_losses);
            break;
        case KapAssetCategory::option:
        case KapAssetCategory::cfd:
            split_gain_loss(ctx, gross, pots.derivative_gains,
                            pots.derivative_losses);
            break;
        case KapAssetCategory::bond:
            split_gain_loss(ctx, gross, pots.other_income, pots.other_losses);
            break;
        case KapAssetCategory::investment_fund:
        {
            pots.fund_income = ctx.add(pots.fund_income, rgl.net_gain_loss());
            auto& line = pots.kap_inv[rgl.tax_category()];
            line = ctx.add(line, gross);
            break;
        }
        case KapAssetCategory::private_sale_asset:
            if (rgl.is_section_23_taxable())
                pots.section_23 = ctx.add(pots.section_23, gross);
            break;
        case KapAssetCategory::cash_balance:
        case KapAssetCategory::unknown:
            PWARN("Realized record of event %s for asset %s has category %s, "
                  "not reported", rgl.originating_event_id().to_string().c_str(),
                  rgl.asset_id().c_str(), to_string(rgl.category()));
            break;
        }
    }

    for (const auto& event : events)
    {
        const auto& base = kap_event_base(event);
        auto asset = m_assets.get_asset(base.asset_id);
        if (!asset)
        {
            PWARN("Event %s refers to unknown asset %s, skipped",
                  base.event_id.to_string().c_str(), base.asset_id.c_str());
            continue;
        }
        auto gross = base.gross_amount_eur.value_or(KapNumeric());
        std::visit(
            [&](const auto& ev) {
                using T = decltype(ev);
                if constexpr (is_same_decayed_v<T, KapCashFlowEvent>)
                {
                    switch (ev.flow_type)
                    {
                    case KapCashFlowType::dividend_cash:
                        if (asset->category == KapAssetCategory::stock &&
                            gross > 0)
                            pots.other_income = ctx.add(pots.other_income, gross);
                        break;
                    case KapCashFlowType::interest_received:
                        if (gross > 0)
                            pots.other_income = ctx.add(pots.other_income, gross);
                        break;
                    case KapCashFlowType::interest_paid_accrued:
                        if (!gross.is_zero())
                            pots.other_losses = ctx.add(pots.other_losses,
                                                        gross.abs());
                        break;
                    case KapCashFlowType::distribution_fund:
                    {
                        if (asset->category != KapAssetCategory::investment_fund)
                        {
                            PWARN("Fund distribution %s on asset %s of "
                                  "category %s, not reported",
                                  ev.event_id.to_string().c_str(),
                                  asset->id.c_str(), to_string(asset->category));
                            break;
                        }
                        KapNumeric exempt;
                        if (gross > 0)
                            exempt = ctx.multiply(gross,
                                                  kap_partial_exemption_rate(asset->fund_type));
                        auto net = ctx.quantize_amount(ctx.subtract(gross, exempt));
                        pots.fund_income = ctx.add(pots.fund_income, net);
                        if (ev.gross_amount_eur)
                        {
                            auto& line = pots.kap_inv[kap_inv_category(asset->fund_type,
                                                                       KapFundLine::distribution)];
                            line = ctx.add(line, gross);
                        }
                        break;
                    }
                    case KapCashFlowType::capital_repayment:
                        break;
                    }
                }
                else if constexpr (is_same_decayed_v<T, KapStockDividendEvent>)
                {
                    if (asset->category == KapAssetCategory::stock && gross > 0)
                        pots.other_income = ctx.add(pots.other_income, gross);
                }
                else if constexpr (is_same_decayed_v<T, KapWithholdingTaxEvent>)
                    pots.foreign_tax = ctx.add(pots.foreign_tax, gross.abs());
            }, event);
    }

    for (const auto& item : excess)
    {
        DEBUG("Capital repayment excess %s EUR of asset %s",
              item.amount.to_string().c_str(), item.asset_id.c_str());
        pots.other_income = ctx.add(pots.other_income, item.amount);
    }

    for (const auto& item : vorabpauschale)
    {
        if (item.tax_year != m_tax_year)
        {
            DEBUG("Vorabpauschale of %s for %d isn't for tax year %d",
                  item.asset_id.c_str(), item.tax_year, m_tax_year);
            continue;
        }
        pots.fund_income = ctx.add(pots.fund_income, item.net_taxable_amount);
        if (!item.gross_amount.is_zero())
        {
            auto& line = pots.kap_inv[item.category];
            line = ctx.add(line, item.gross_amount);
        }
    }

    KapLossOffsettingResult result;
    auto cents = [&ctx](const KapNumeric& n) { return ctx.quantize_amount(n); };
    auto& lines = result.form_lines;
    using TC = KapTaxCategory;
    lines[TC::anlage_kap_aktien_gewinn] = cents(pots.stock_gains);
    lines[TC::anlage_kap_aktien_verlust] = cents(pots.stock_losses);
    lines[TC::anlage_kap_termin_gewinn] = cents(pots.derivative_gains);
    lines[TC::anlage_kap_termin_verlust] = cents(pots.derivative_losses);
    lines[TC::anlage_kap_sonstige_kapitalertraege] = cents(pots.other_income);
    lines[TC::anlage_kap_sonstige_verluste] = cents(pots.other_losses);
    lines[TC::anlage_kap_foreign_tax_paid] = cents(pots.foreign_tax);

    /* Derivative losses stay out of the combined line. */
    auto combined = ctx.add(ctx.add(pots.stock_gains, pots.derivative_gains),
                            pots.other_income);
    combined = ctx.subtract(ctx.subtract(combined, pots.stock_losses),
                            pots.other_losses);
    lines[TC::anlage_kap_auslaendische_kapitalertraege_gesamt] = cents(combined);
    lines[TC::anlage_so_net_gain_loss] = cents(pots.section_23);
    for (const auto& [category, amount] : pots.kap_inv)
        lines[category] = cents(amount);

    result.net_stocks = cents(ctx.subtract(pots.stock_gains, pots.stock_losses));
    result.net_other_income = cents(ctx.subtract(pots.other_income,
                                                 pots.other_losses));
    result.net_section_23 = cents(pots.section_23);
    auto derivatives = ctx.subtract(pots.derivative_gains,
                                    pots.derivative_losses);
    result.net_derivatives_uncapped = cents(derivatives);
    if (m_apply_cap && derivatives.is_negative())
        result.net_derivatives_capped = cents(std::max(derivatives, -m_cap));
    else
        result.net_derivatives_capped = result.net_derivatives_uncapped;
    if (result.net_derivatives_capped != result.net_derivatives_uncapped)
        PINFO("Derivative loss %s EUR capped at %s EUR",
              result.net_derivatives_uncapped.to_string().c_str(),
              result.net_derivatives_capped.to_string().c_str());
    result.fund_income_net_taxable = cents(pots.fund_income);

    LEAVE("combined line %s EUR, fund income %s EUR",
          lines[TC::anlage_kap_auslaendische_kapitalertraege_gesamt].to_string().c_str(),
          result.fund_income_net_taxable.to_string().c_str());
    return result;
}
