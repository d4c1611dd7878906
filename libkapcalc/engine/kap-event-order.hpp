/********************************************************************
 * kap-event-order.hpp -- deterministic ordering of financial events*
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

#ifndef __KAP_EVENT_ORDER_HPP__
#define __KAP_EVENT_ORDER_HPP__

#include <string>
#include <utility>
#include <variant>
#include <vector>
#include "kap-asset.hpp"
#include "kap-date.hpp"
#include "kap-event.hpp"

/** Processing precedence of event kinds on the same day: corporate actions
 * change the lots that trades consume, and option exercises precede the
 * stock trades they produce.
 */
enum class KapEventGroup
{
    corporate_action = 0,
    option_lifecycle = 1,
    trade = 2,
    cash = 3,
};

using KapSortField = std::variant<std::string, int, KapNumeric>;

/** @brief Total order of financial events.
 *
 * Keys compare by date, then group, then broker transaction id, then the
 * kind-specific fields, then the event id. Two distinct events never compare
 * equal.
 */
struct KapEventSortKey
{
    KapDate date;
    KapEventGroup group;
    std::string transaction_id;
    std::vector<KapSortField> fields;
    kap::GUID event_id;
};

bool operator<(const KapEventSortKey& a, const KapEventSortKey& b);

/**
 * Compute the sort key of an event.
 *
 * @exception std::invalid_argument if the event date can't be parsed or the
 * event's asset is unknown.
 */
KapEventSortKey kap_event_sort_key(const KapEvent& event,
                                   const KapAssetLookup& assets);

/** An event paired with its precomputed sort key. */
using KapKeyedEvent = std::pair<KapEventSortKey, KapEvent>;

/** Sort events whose keys were computed with kap_event_sort_key(). */
void kap_sort_keyed_events(std::vector<KapKeyedEvent>& keyed);

/**
 * Sort events by their keys. Computes each key once.
 *
 * @exception std::invalid_argument as kap_event_sort_key().
 */
void kap_sort_events(std::vector<KapEvent>& events,
                     const KapAssetLookup& assets);

#endif // __KAP_EVENT_ORDER_HPP__
