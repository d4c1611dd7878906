/********************************************************************
 * kap-asset.hpp -- asset master data and lookup                    *
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

#ifndef __KAP_ASSET_HPP__
#define __KAP_ASSET_HPP__

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "kap-enums.hpp"
#include "kap-numeric.hpp"

/** Start-of-year cost basis as reported by the broker, in the reporting
 * currency of the position.
 */
struct KapCostBasis
{
    KapNumeric amount;
    std::string currency;
};

/** @brief A resolved, classified instrument.
 *
 * Identity resolution and classification happen before the engine runs;
 * the engine only reads assets. Option fields are only meaningful for
 * category option, fund_type only for investment_fund.
 */
struct KapAsset
{
    std::string id;
    std::string symbol;
    std::string description;
    KapAssetCategory category = KapAssetCategory::unknown;
    std::string currency;
    std::optional<KapNumeric> multiplier;
    KapFundType fund_type = KapFundType::none;
    std::string underlying_asset_id;
    /** 'C' for calls, 'P' for puts. */
    std::optional<char> option_type;
    std::optional<KapNumeric> strike;
    std::optional<KapNumeric> soy_quantity;
    std::optional<KapCostBasis> soy_cost_basis;
    std::optional<KapNumeric> eoy_quantity;
};

/** Read access to the resolved assets of a run. */
class KapAssetLookup
{
public:
    virtual ~KapAssetLookup() = default;
    /** @return The asset or nullptr if the id is unknown. */
    virtual const KapAsset* get_asset(const std::string& id) const = 0;
    /** All asset ids, in a stable order. */
    virtual std::vector<std::string> asset_ids() const = 0;
};

/** In-memory asset lookup keyed by asset id. */
class KapAssetTable : public KapAssetLookup
{
public:
    KapAssetTable() = default;
    /**
     * Add an asset.
     * @exception std::invalid_argument if the id is empty or already
     * present, or an option type other than 'C' or 'P' is given.
     */
    void add(KapAsset asset);
    const KapAsset* get_asset(const std::string& id) const override;
    std::vector<std::string> asset_ids() const override;
    size_t size() const noexcept { return m_assets.size(); }
private:
    std::map<std::string, KapAsset> m_assets;
};

#endif // __KAP_ASSET_HPP__
