/********************************************************************
 * kap-realized.cpp -- realized gain and loss records               *
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

#include <stdexcept>
#include <utility>
#include "kap-realized.hpp"

static constexpr long speculation_period_days = 365;

/* |gross| x rate in cents, and the result reduced towards zero by it. */
static std::pair<KapNumeric, KapNumeric>
apply_exemption(const KapNumeric& gross, const KapNumeric& rate,
                const KapNumericContext& ctx)
{
    auto amount = ctx.quantize_amount(gross.abs() * rate);
    auto net = gross.is_negative() ? gross + amount : gross - amount;
    return {amount, net};
}

KapRealizedGainLoss::KapRealizedGainLoss(const KapRealizationParams& params,
                                         const KapNumericContext& ctx) :
    m_params{params}, m_net_gain_loss{params.gross_gain_loss}
{
    if (m_params.quantity.is_negative())
        throw std::invalid_argument("Realized quantity " +
                                    m_params.quantity.to_string() +
                                    " of asset " + m_params.asset_id +
                                    " is negative.");
    if (m_params.category != KapAssetCategory::investment_fund)
        return;
    auto rate = kap_partial_exemption_rate(m_params.fund_type);
    auto [amount, net] = apply_exemption(m_params.gross_gain_loss, rate, ctx);
    m_exemption_rate = rate;
    m_exemption_amount = amount;
    m_net_gain_loss = net;
}

std::optional<KapFundType>
KapRealizedGainLoss::fund_type() const noexcept
{
    if (m_params.category != KapAssetCategory::investment_fund)
        return std::nullopt;
    return m_params.fund_type;
}

std::optional<long>
kap_holding_period_days(const KapDate& acquired, const KapDate& realized)
{
    if (realized < acquired)
        return std::nullopt;
    return acquired.days_until(realized);
}

KapClassification
kap_classify_realization(KapAssetCategory category, KapFundType fund_type,
                         const KapNumeric& gross,
                         std::optional<long> holding_days)
{
    using TC = KapTaxCategory;
    bool gain = !gross.is_negative();
    switch (category)
    {
    case KapAssetCategory::stock:
        return {gain ? TC::anlage_kap_aktien_gewinn :
                TC::anlage_kap_aktien_verlust, false};
    case KapAssetCategory::bond:
        return {gain ? TC::anlage_kap_sonstige_kapitalertraege :
                TC::anlage_kap_sonstige_verluste, false};
    case KapAssetCategory::option:
    case KapAssetCategory::cfd:
        return {gain ? TC::anlage_kap_termin_gewinn :
                TC::anlage_kap_termin_verlust, false};
    case KapAssetCategory::investment_fund:
        return {kap_inv_category(fund_type, KapFundLine::gain), false};
    case KapAssetCategory::private_sale_asset:
        if (holding_days && *holding_days <= speculation_period_days)
            return {gain ? TC::section_23_taxable_gain :
                    TC::section_23_taxable_loss, true};
        return {TC::section_23_exempt_holding_period_met, false};
    case KapAssetCategory::cash_balance:
    case KapAssetCategory::unknown:
        break;
    }
    return {TC::non_taxable_other, false};
}

KapVorabpauschale
kap_make_vorabpauschale(const std::string& asset_id, int tax_year,
                        const KapNumeric& gross, KapFundType fund_type,
                        const KapNumericContext& ctx)
{
    auto rate = kap_partial_exemption_rate(fund_type);
    auto [amount, net] = apply_exemption(gross, rate, ctx);
    return {asset_id, tax_year, gross, fund_type, rate, amount, net,
            kap_inv_category(fund_type, KapFundLine::vorabpauschale)};
}
