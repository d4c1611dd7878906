/********************************************************************
 * kap-enums.cpp -- enumerations shared by the engine               *
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

#include "kap-enums.hpp"

const char*
to_string(KapAssetCategory cat) noexcept
{
    switch (cat)
    {
    case KapAssetCategory::stock: return "STOCK";
    case KapAssetCategory::bond: return "BOND";
    case KapAssetCategory::investment_fund: return "INVESTMENT_FUND";
    case KapAssetCategory::option: return "OPTION";
    case KapAssetCategory::cfd: return "CFD";
    case KapAssetCategory::private_sale_asset: return "PRIVATE_SALE_ASSET";
    case KapAssetCategory::cash_balance: return "CASH_BALANCE";
    case KapAssetCategory::unknown: return "UNKNOWN";
    }
    return "UNKNOWN";
}

const char*
to_string(KapFundType type) noexcept
{
    switch (type)
    {
    case KapFundType::aktienfonds: return "AKTIENFONDS";
    case KapFundType::mischfonds: return "MISCHFONDS";
    case KapFundType::immobilienfonds: return "IMMOBILIENFONDS";
    case KapFundType::auslands_immobilienfonds: return "AUSLANDS_IMMOBILIENFONDS";
    case KapFundType::sonstige_fonds: return "SONSTIGE_FONDS";
    case KapFundType::none: return "NONE";
    }
    return "NONE";
}

const char*
to_string(KapRealizationType type) noexcept
{
    switch (type)
    {
    case KapRealizationType::long_position_sale: return "LONG_POSITION_SALE";
    case KapRealizationType::short_position_cover: return "SHORT_POSITION_COVER";
    case KapRealizationType::cash_merger_proceeds: return "CASH_MERGER_PROCEEDS";
    case KapRealizationType::option_expired_long: return "OPTION_EXPIRED_LONG";
    case KapRealizationType::option_expired_short: return "OPTION_EXPIRED_SHORT";
    case KapRealizationType::option_trade_close_long: return "OPTION_TRADE_CLOSE_LONG";
    case KapRealizationType::option_trade_close_short: return "OPTION_TRADE_CLOSE_SHORT";
    }
    return "UNKNOWN";
}

const char*
to_string(KapTaxCategory cat) noexcept
{
    using TC = KapTaxCategory;
    switch (cat)
    {
    case TC::anlage_kap_aktien_gewinn: return "ANLAGE_KAP_AKTIEN_GEWINN";
    case TC::anlage_kap_aktien_verlust: return "ANLAGE_KAP_AKTIEN_VERLUST";
    case TC::anlage_kap_termin_gewinn: return "ANLAGE_KAP_TERMIN_GEWINN";
    case TC::anlage_kap_termin_verlust: return "ANLAGE_KAP_TERMIN_VERLUST";
    case TC::anlage_kap_sonstige_kapitalertraege: return "ANLAGE_KAP_SONSTIGE_KAPITALERTRAEGE";
    case TC::anlage_kap_sonstige_verluste: return "ANLAGE_KAP_SONSTIGE_VERLUSTE";
    case TC::anlage_kap_auslaendische_kapitalertraege_gesamt: return "ANLAGE_KAP_AUSLAENDISCHE_KAPITALERTRAEGE_GESAMT";
    case TC::anlage_kap_foreign_tax_paid: return "ANLAGE_KAP_FOREIGN_TAX_PAID";
    case TC::kap_inv_aktienfonds_ausschuettung_gross: return "ANLAGE_KAP_INV_AKTIENFONDS_AUSSCHUETTUNG_GROSS";
    case TC::kap_inv_aktienfonds_gewinn_gross: return "ANLAGE_KAP_INV_AKTIENFONDS_GEWINN_GROSS";
    case TC::kap_inv_mischfonds_ausschuettung_gross: return "ANLAGE_KAP_INV_MISCHFONDS_AUSSCHUETTUNG_GROSS";
    case TC::kap_inv_mischfonds_gewinn_gross: return "ANLAGE_KAP_INV_MISCHFONDS_GEWINN_GROSS";
    case TC::kap_inv_immobilienfonds_ausschuettung_gross: return "ANLAGE_KAP_INV_IMMOBILIENFONDS_AUSSCHUETTUNG_GROSS";
    case TC::kap_inv_immobilienfonds_gewinn_gross: return "ANLAGE_KAP_INV_IMMOBILIENFONDS_GEWINN_GROSS";
    case TC::kap_inv_auslands_immobilienfonds_ausschuettung_gross: return "ANLAGE_KAP_INV_AUSLANDS_IMMOBILIENFONDS_AUSSCHUETTUNG_GROSS";
    case TC::kap_inv_auslands_immobilienfonds_gewinn_gross: return "ANLAGE_KAP_INV_AUSLANDS_IMMOBILIENFONDS_GEWINN_GROSS";
    case TC::kap_inv_sonstige_fonds_ausschuettung_gross: return "ANLAGE_KAP_INV_SONSTIGE_FONDS_AUSSCHUETTUNG_GROSS";
    case TC::kap_inv_sonstige_fonds_gewinn_gross: return "ANLAGE_KAP_INV_SONSTIGE_FONDS_GEWINN_GROSS";
    case TC::kap_inv_aktienfonds_vorabpauschale_brutto: return "ANLAGE_KAP_INV_AKTIENFONDS_VORABPAUSCHALE_BRUTTO";
    case TC::kap_inv_mischfonds_vorabpauschale_brutto: return "ANLAGE_KAP_INV_MISCHFONDS_VORABPAUSCHALE_BRUTTO";
    case TC::kap_inv_immobilienfonds_vorabpauschale_brutto: return "ANLAGE_KAP_INV_IMMOBILIENFONDS_VORABPAUSCHALE_BRUTTO";
    case TC::kap_inv_auslands_immobilienfonds_vorabpauschale_brutto: return "ANLAGE_KAP_INV_AUSLANDS_IMMOBILIENFONDS_VORABPAUSCHALE_BRUTTO";
    case TC::kap_inv_sonstige_fonds_vorabpauschale_brutto: return "ANLAGE_KAP_INV_SONSTIGE_FONDS_VORABPAUSCHALE_BRUTTO";
    case TC::section_23_taxable_gain: return "SECTION_23_ESTG_TAXABLE_GAIN";
    case TC::section_23_taxable_loss: return "SECTION_23_ESTG_TAXABLE_LOSS";
    case TC::section_23_exempt_holding_period_met: return "SECTION_23_ESTG_EXEMPT_HOLDING_PERIOD_MET";
    case TC::anlage_so_net_gain_loss: return "ANLAGE_SO_NET_GAIN_LOSS";
    case TC::non_taxable_other: return "NON_TAXABLE_OTHER";
    }
    return "UNKNOWN";
}

KapNumeric
kap_partial_exemption_rate(KapFundType type)
{
    switch (type)
    {
    case KapFundType::aktienfonds:
        return KapNumeric(30, 2);
    case KapFundType::mischfonds:
        return KapNumeric(15, 2);
    case KapFundType::immobilienfonds:
        return KapNumeric(60, 2);
    case KapFundType::auslands_immobilienfonds:
        return KapNumeric(80, 2);
    case KapFundType::sonstige_fonds:
    case KapFundType::none:
        break;
    }
    return KapNumeric(0, 2);
}

KapTaxCategory
kap_inv_category(KapFundType type, KapFundLine line) noexcept
{
    using TC = KapTaxCategory;
    static const TC table[][3] =
    {
        {TC::kap_inv_aktienfonds_ausschuettung_gross,
         TC::kap_inv_aktienfonds_gewinn_gross,
         TC::kap_inv_aktienfonds_vorabpauschale_brutto},
        {TC::kap_inv_mischfonds_ausschuettung_gross,
         TC::kap_inv_mischfonds_gewinn_gross,
         TC::kap_inv_mischfonds_vorabpauschale_brutto},
        {TC::kap_inv_immobilienfonds_ausschuettung_gross,
         TC::kap_inv_immobilienfonds_gewinn_gross,
         TC::kap_inv_immobilienfonds_vorabpauschale_brutto},
        {TC::kap_inv_auslands_immobilienfonds_ausschuettung_gross,
         TC::kap_inv_auslands_immobilienfonds_gewinn_gross,
         TC::kap_inv_auslands_immobilienfonds_vorabpauschale_brutto},
        {TC::kap_inv_sonstige_fonds_ausschuettung_gross,
         TC::kap_inv_sonstige_fonds_gewinn_gross,
         TC::kap_inv_sonstige_fonds_vorabpauschale_brutto},
    };
    auto row = static_cast<int>(type);
    if (type == KapFundType::none)
        row = static_cast<int>(KapFundType::sonstige_fonds);
    return table[row][static_cast<int>(line)];
}
