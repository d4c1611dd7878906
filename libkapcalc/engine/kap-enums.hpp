/********************************************************************
 * kap-enums.hpp -- enumerations shared by the engine               *
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

#ifndef __KAP_ENUMS_HPP__
#define __KAP_ENUMS_HPP__

#include "kap-numeric.hpp"

enum class KapAssetCategory
{
    stock,
    bond,
    investment_fund,
    option,
    cfd,
    private_sale_asset,
    cash_balance,
    unknown,
};

/** Investment fund classes of the German investment tax act; they set the
 * partial exemption (Teilfreistellung) rate.
 */
enum class KapFundType
{
    aktienfonds,
    mischfonds,
    immobilienfonds,
    auslands_immobilienfonds,
    sonstige_fonds,
    none,
};

enum class KapRealizationType
{
    long_position_sale,
    short_position_cover,
    cash_merger_proceeds,
    option_expired_long,
    option_expired_short,
    option_trade_close_long,
    option_trade_close_short,
};

/** Reporting lines of Anlage KAP, KAP-INV and SO. */
enum class KapTaxCategory
{
    anlage_kap_aktien_gewinn,
    anlage_kap_aktien_verlust,
    anlage_kap_termin_gewinn,
    anlage_kap_termin_verlust,
    anlage_kap_sonstige_kapitalertraege,
    anlage_kap_sonstige_verluste,
    anlage_kap_auslaendische_kapitalertraege_gesamt,
    anlage_kap_foreign_tax_paid,

    kap_inv_aktienfonds_ausschuettung_gross,
    kap_inv_aktienfonds_gewinn_gross,
    kap_inv_mischfonds_ausschuettung_gross,
    kap_inv_mischfonds_gewinn_gross,
    kap_inv_immobilienfonds_ausschuettung_gross,
    kap_inv_immobilienfonds_gewinn_gross,
    kap_inv_auslands_immobilienfonds_ausschuettung_gross,
    kap_inv_auslands_immobilienfonds_gewinn_gross,
    kap_inv_sonstige_fonds_ausschuettung_gross,
    kap_inv_sonstige_fonds_gewinn_gross,

    kap_inv_aktienfonds_vorabpauschale_brutto,
    kap_inv_mischfonds_vorabpauschale_brutto,
    kap_inv_immobilienfonds_vorabpauschale_brutto,
    kap_inv_auslands_immobilienfonds_vorabpauschale_brutto,
    kap_inv_sonstige_fonds_vorabpauschale_brutto,

    section_23_taxable_gain,
    section_23_taxable_loss,
    section_23_exempt_holding_period_met,
    anlage_so_net_gain_loss,

    non_taxable_other,
};

/** Which KAP-INV line family a fund amount belongs to. */
enum class KapFundLine
{
    distribution,
    gain,
    vorabpauschale,
};

const char* to_string(KapAssetCategory cat) noexcept;
const char* to_string(KapFundType type) noexcept;
const char* to_string(KapRealizationType type) noexcept;
const char* to_string(KapTaxCategory cat) noexcept;

/** Options and CFDs are netted in the derivative (Termingeschaefte) pot. */
inline bool
kap_is_derivative(KapAssetCategory cat) noexcept
{
    return cat == KapAssetCategory::option || cat == KapAssetCategory::cfd;
}

/**
 * Partial exemption rate for private investors: 30% for equity funds, 15%
 * for mixed funds, 60% for real estate funds, 80% for foreign real estate
 * funds and 0 otherwise.
 */
KapNumeric kap_partial_exemption_rate(KapFundType type);

/**
 * The KAP-INV line for an amount of a fund of the given type. Funds without
 * a type report on the "sonstige Fonds" lines.
 */
KapTaxCategory kap_inv_category(KapFundType type, KapFundLine line) noexcept;

#endif // __KAP_ENUMS_HPP__
