/********************************************************************
 * kap-loss-offset.hpp -- loss offsetting and tax form lines        *
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

#ifndef __KAP_LOSS_OFFSET_HPP__
#define __KAP_LOSS_OFFSET_HPP__

#include <map>
#include <vector>
#include "kap-asset.hpp"
#include "kap-config.hpp"
#include "kap-engine.hpp"
#include "kap-event.hpp"
#include "kap-realized.hpp"

/** Form line totals and conceptual net balances of one tax year. All
 * amounts are in EUR, rounded to the amount precision.
 */
struct KapLossOffsettingResult
{
    std::map<KapTaxCategory, KapNumeric> form_lines;

    KapNumeric net_stocks;
    KapNumeric net_other_income;
    KapNumeric net_derivatives_uncapped;
    /** Net derivative result with losses limited to the configured cap. */
    KapNumeric net_derivatives_capped;
    KapNumeric net_section_23;
    /** Fund gains, distributions and Vorabpauschale after partial
     * exemption. */
    KapNumeric fund_income_net_taxable;

    /** @return The total of a form line, zero if nothing was reported. */
    KapNumeric form_line(KapTaxCategory category) const;
};

/** @brief Aggregates a year's realized records and income events into the
 * lines of Anlage KAP, KAP-INV and SO.
 *
 * Stock losses offset stock gains only. Derivative losses are kept out of
 * the combined foreign income line and capped in the conceptual net.
 */
class KapLossOffsettingEngine
{
public:
    KapLossOffsettingEngine(const KapAssetLookup& assets, KapNumericContext ctx,
                            int tax_year, bool apply_derivative_cap = true,
                            KapNumeric derivative_cap = KapNumeric(20000));
    KapLossOffsettingEngine(const KapAssetLookup& assets,
                            const KapConfig& config, int tax_year);

    /**
     * Build the result from scratch. Events whose asset is unknown are
     * skipped with a warning; Vorabpauschale items of other years are
     * ignored.
     */
    KapLossOffsettingResult
    aggregate(const KapRealizedList& realized,
              const std::vector<KapEvent>& events,
              const std::vector<KapVorabpauschale>& vorabpauschale = {},
              const std::vector<KapCapitalRepaymentExcess>& excess = {}) const;

private:
    const KapAssetLookup& m_assets;
    KapNumericContext m_ctx;
    int m_tax_year;
    bool m_apply_cap;
    KapNumeric m_cap;
};

#endif // __KAP_LOSS_OFFSET_HPP__
