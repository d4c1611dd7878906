/********************************************************************
 * kap-event-order.cpp -- deterministic ordering of financial events*
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
#include <tuple>
#include "kap-event-order.hpp"
#include "kaplog.h"

static KapLogModule log_module = KAP_MOD_ORDER;

bool
operator<(const KapEventSortKey& a, const KapEventSortKey& b)
{
    return std::tie(a.date, a.group, a.transaction_id, a.fields, a.event_id) <
        std::tie(b.date, b.group, b.transaction_id, b.fields, b.event_id);
}

KapEventSortKey
kap_event_sort_key(const KapEvent& event, const KapAssetLookup& assets)
{
    const auto& base = kap_event_base(event);
    KapDate date{1970, 1, 1};
    try
    {
        date = KapDate(base.event_date);
    }
    catch (const std::invalid_argument& err)
    {
        throw std::invalid_argument("Event " + base.event_id.to_string() +
                                    " (" + kap_event_kind_name(event) +
                                    ") has unparseable date: " + err.what());
    }

    auto asset = assets.get_asset(base.asset_id);
    if (!asset)
        throw std::invalid_argument("Event " + base.event_id.to_string() +
                                    " (" + kap_event_kind_name(event) +
                                    ") on " + base.event_date +
                                    " references unknown asset " +
                                    base.asset_id + ".");
    if (base.transaction_id.empty())
        PWARN("Event %s (%s) on %s lacks a transaction id",
              base.event_id.to_string().c_str(), kap_event_kind_name(event),
              base.event_date.c_str());

    auto category = static_cast<int>(asset->category);
    KapEventSortKey key{date, KapEventGroup::trade, base.transaction_id, {},
                        base.event_id};
    std::visit(
        [&key, asset, category](const auto& ev) {
            using T = decltype(ev);
            if constexpr (is_corporate_action_v<T>)
            {
                key.group = KapEventGroup::corporate_action;
                if (asset->symbol.empty())
                    PWARN("Asset %s of corporate action %s lacks a symbol",
                          asset->id.c_str(), ev.event_id.to_string().c_str());
                key.fields = {asset->symbol, ev.ca_action_id, ev.description};
            }
            else if constexpr (is_option_lifecycle_v<T>)
            {
                key.group = KapEventGroup::option_lifecycle;
                key.fields = {category};
            }
            else if constexpr (is_same_decayed_v<T, KapTradeEvent> ||
                               is_same_decayed_v<T, KapCurrencyConversionEvent>)
            {
                key.group = KapEventGroup::trade;
                key.fields = {category};
            }
            else
            {
                static_assert(is_same_decayed_v<T, KapCashFlowEvent> ||
                              is_same_decayed_v<T, KapWithholdingTaxEvent> ||
                              is_same_decayed_v<T, KapFeeEvent>,
                              "Unhandled event kind");
                key.group = KapEventGroup::cash;
                key.fields = {category,
                              ev.gross_amount_foreign.value_or(KapNumeric())};
            }
        }, event);
    return key;
}

void
kap_sort_keyed_events(std::vector<KapKeyedEvent>& keyed)
{
    std::sort(keyed.begin(), keyed.end(),
              [](const KapKeyedEvent& a, const KapKeyedEvent& b) {
                  return a.first < b.first;
              });
}

void
kap_sort_events(std::vector<KapEvent>& events, const KapAssetLookup& assets)
{
    std::vector<KapKeyedEvent> keyed;
    keyed.reserve(events.size());
    for (auto& event : events)
    {
        auto key = kap_event_sort_key(event, assets);
        keyed.emplace_back(std::move(key), std::move(event));
    }
    kap_sort_keyed_events(keyed);
    events.clear();
    for (auto& entry : keyed)
        events.push_back(std::move(entry.second));
}
