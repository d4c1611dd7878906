/********************************************************************
 * kap-asset.cpp -- asset master data and lookup                    *
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

#include "kap-asset.hpp"

void
KapAssetTable::add(KapAsset asset)
{
    if (asset.id.empty())
        throw std::invalid_argument("Asset without an id.");
    if (asset.option_type && *asset.option_type != 'C' &&
        *asset.option_type != 'P')
        throw std::invalid_argument("Option type of asset " + asset.id +
                                    " must be 'C' or 'P'.");
    auto id = asset.id;
    if (!m_assets.emplace(id, std::move(asset)).second)
        throw std::invalid_argument("Duplicate asset id " + id + ".");
}

const KapAsset*
KapAssetTable::get_asset(const std::string& id) const
{
    auto iter = m_assets.find(id);
    if (iter == m_assets.end())
        return nullptr;
    return &iter->second;
}

std::vector<std::string>
KapAssetTable::asset_ids() const
{
    std::vector<std::string> ids;
    ids.reserve(m_assets.size());
    for (const auto& entry : m_assets)
        ids.push_back(entry.first);
    return ids;
}
