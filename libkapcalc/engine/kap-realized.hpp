/********************************************************************
 * kap-realized.hpp -- realized gain and loss records               *
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

#ifndef __KAP_REALIZED_HPP__
#define __KAP_REALIZED_HPP__

#include <optional>
#include <string>
#include "kap-date.hpp"
#include "kap-enums.hpp"
#include "kap-guid.hpp"
#include "kap-numeric.hpp"

/** Everything that goes into a realized gain or loss record. The derived
 * partial exemption figures are computed by the record itself.
 */
struct KapRealizationParams
{
    kap::GUID originating_event_id;
    std::string asset_id;
    KapAssetCategory category = KapAssetCategory::unknown;
    KapDate acquisition_date{1970, 1, 1};
    KapDate realization_date{1970, 1, 1};
    KapRealizationType realization_type = KapRealizationType::long_position_sale;
    KapNumeric quantity;
    KapNumeric unit_cost_basis;
    KapNumeric unit_realization_value;
    KapNumeric total_cost_basis;
    KapNumeric total_realization_value;
    KapNumeric gross_gain_loss;
    std::optional<long> holding_period_days;
    KapTaxCategory tax_category = KapTaxCategory::non_taxable_other;
    bool section_23_taxable = false;
    bool stillhalter_income = false;
    /** Only used for investment funds. */
    KapFundType fund_type = KapFundType::none;
};

/** @brief One realized slice of a lot.
 *
 * Records are immutable once constructed. All amounts are EUR. For
 * investment funds the partial exemption is applied to the gross result:
 * the exemption amount is |gross| x rate in cents and reduces gains and
 * losses alike.
 */
class KapRealizedGainLoss
{
public:
    /**
     * @exception std::invalid_argument if the quantity is negative.
     */
    KapRealizedGainLoss(const KapRealizationParams& params,
                        const KapNumericContext& ctx);

    const kap::GUID& originating_event_id() const noexcept { return m_params.originating_event_id; }
    const std::string& asset_id() const noexcept { return m_params.asset_id; }
    KapAssetCategory category() const noexcept { return m_params.category; }
    const KapDate& acquisition_date() const noexcept { return m_params.acquisition_date; }
    const KapDate& realization_date() const noexcept { return m_params.realization_date; }
    KapRealizationType realization_type() const noexcept { return m_params.realization_type; }
    const KapNumeric& quantity() const noexcept { return m_params.quantity; }
    const KapNumeric& unit_cost_basis() const noexcept { return m_params.unit_cost_basis; }
    const KapNumeric& unit_realization_value() const noexcept { return m_params.unit_realization_value; }
    const KapNumeric& total_cost_basis() const noexcept { return m_params.total_cost_basis; }
    const KapNumeric& total_realization_value() const noexcept { return m_params.total_realization_value; }
    const KapNumeric& gross_gain_loss() const noexcept { return m_params.gross_gain_loss; }
    const std::optional<long>& holding_period_days() const noexcept { return m_params.holding_period_days; }
    KapTaxCategory tax_category() const noexcept { return m_params.tax_category; }
    bool is_section_23_taxable() const noexcept { return m_params.section_23_taxable; }
    /** Private sales are always reported as speculative transactions. */
    bool is_within_speculation_period() const noexcept
    {
        return m_params.category == KapAssetCategory::private_sale_asset;
    }
    bool is_stillhalter_income() const noexcept { return m_params.stillhalter_income; }
    /** The fund type, rate and amount are only present for funds. */
    std::optional<KapFundType> fund_type() const noexcept;
    const std::optional<KapNumeric>& exemption_rate() const noexcept { return m_exemption_rate; }
    const std::optional<KapNumeric>& exemption_amount() const noexcept { return m_exemption_amount; }
    /** Gross result less the partial exemption; the gross for non-funds. */
    const KapNumeric& net_gain_loss() const noexcept { return m_net_gain_loss; }

private:
    KapRealizationParams m_params;
    std::optional<KapNumeric> m_exemption_rate;
    std::optional<KapNumeric> m_exemption_amount;
    KapNumeric m_net_gain_loss;
};

/** Tax classification of a realization. */
struct KapClassification
{
    KapTaxCategory category;
    bool section_23_taxable;
};

/**
 * Days between acquisition and realization, or nothing if the realization
 * precedes the acquisition.
 */
std::optional<long> kap_holding_period_days(const KapDate& acquired,
                                            const KapDate& realized);

/**
 * Classify the result of a sale or cover.
 *
 * Stocks report on the Aktien lines, bonds on the sonstige lines, options
 * and CFDs on the Termingeschaefte lines and funds on the KAP-INV gain line
 * of their type. Private sales held for at most 365 days are taxable under
 * section 23; longer or unknown holding periods are exempt.
 */
KapClassification kap_classify_realization(KapAssetCategory category,
                                           KapFundType fund_type,
                                           const KapNumeric& gross,
                                           std::optional<long> holding_days);

/** @brief Vorabpauschale (advance lump sum) of an accumulating fund.
 *
 * The gross amount is computed outside the engine; the item carries the
 * partial exemption the same way fund sales do.
 */
struct KapVorabpauschale
{
    std::string asset_id;
    int tax_year;
    KapNumeric gross_amount;
    KapFundType fund_type;
    KapNumeric exemption_rate;
    KapNumeric exemption_amount;
    KapNumeric net_taxable_amount;
    KapTaxCategory category;
};

/**
 * Build a Vorabpauschale item for a gross amount, applying the partial
 * exemption of the fund type.
 */
KapVorabpauschale kap_make_vorabpauschale(const std::string& asset_id,
                                          int tax_year,
                                          const KapNumeric& gross,
                                          KapFundType fund_type,
                                          const KapNumericContext& ctx);

#endif // __KAP_REALIZED_HPP__
