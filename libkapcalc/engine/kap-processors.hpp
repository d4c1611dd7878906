/********************************************************************
 * kap-processors.hpp                                               *
 * option lifecycle and corporate action handling                   *
 *                                                                  *
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

#ifndef __KAP_PROCESSORS_HPP__
#define __KAP_PROCESSORS_HPP__

#include <map>
#include <stdexcept>
#include <string>
#include "kap-asset.hpp"
#include "kap-event.hpp"
#include "kap-guid.hpp"
#include "kap-ledger.hpp"

/** A calculation run can't produce correct results. */
class KapCalculationError : public std::runtime_error
{
public:
    explicit KapCalculationError(const std::string& what) :
        std::runtime_error(what) {}
};

/** Premium of an exercised or assigned option, waiting for the stock trade
 * the exercise or assignment produced. The premium is what was paid for
 * exercised long contracts or received for assigned short ones.
 */
struct KapPendingOptionAdjustment
{
    KapNumeric premium;
    std::string option_asset_id;
    char option_type;
};

using KapPendingAdjustments = std::map<kap::GUID, KapPendingOptionAdjustment>;

/** State shared by the event processors during one run. */
struct KapProcessorContext
{
    const KapAssetLookup& assets;
    KapPendingAdjustments& pending;
};

/**
 * Apply a trade to its asset's ledger. A stock trade produced by an option
 * exercise or assignment first has its cost or proceeds adjusted by the
 * option premium: calls add the premium, puts subtract it.
 *
 * @return The realized records of sales and covers.
 * @exception KapCalculationError if the trade's option link is broken or
 * the ledger can't cover a sale.
 */
KapRealizedList kap_process_trade(const KapTradeEvent& trade,
                                  KapLedger& ledger,
                                  KapProcessorContext& context);

/**
 * Consume the exercised long contracts and store the premium paid for the
 * resulting stock trade.
 * @exception KapCalculationError if the option has no underlying or the
 * contracts aren't held.
 */
void kap_process_option_exercise(const KapOptionExerciseEvent& event,
                                 KapLedger& ledger,
                                 KapProcessorContext& context);

/**
 * Consume the assigned short contracts and store the premium received for
 * the resulting stock trade.
 * @exception KapCalculationError as kap_process_option_exercise().
 */
void kap_process_option_assignment(const KapOptionAssignmentEvent& event,
                                   KapLedger& ledger,
                                   KapProcessorContext& context);

/**
 * Close expiring contracts at zero value, long contracts first. Writing an
 * option that expires is Stillhalter income.
 * @return The realized records; none if neither side holds the contracts.
 */
KapRealizedList kap_process_option_expiration(const KapOptionExpirationEvent& event,
                                              KapLedger& ledger);

#endif // __KAP_PROCESSORS_HPP__
