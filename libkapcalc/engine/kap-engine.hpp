/********************************************************************
 * kap-engine.hpp -- tax-year driver for the FIFO engine            *
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

#ifndef __KAP_ENGINE_HPP__
#define __KAP_ENGINE_HPP__

#include <map>
#include <string>
#include <vector>
#include "kap-asset.hpp"
#include "kap-currency.hpp"
#include "kap-event.hpp"
#include "kap-ledger.hpp"
#include "kap-processors.hpp"

/** Part of a capital repayment exceeding the cost basis of the position;
 * it is taxed as other capital income.
 */
struct KapCapitalRepaymentExcess
{
    kap::GUID event_id;
    std::string asset_id;
    KapDate date;
    KapNumeric amount;
};

struct KapCalculationResult
{
    KapRealizedList realized;
    /** The tax year's events in processing order. */
    std::vector<KapEvent> current_year_events;
    std::vector<KapCapitalRepaymentExcess> capital_repayment_excess;
    /** Assets whose computed year end position differs from the report. */
    int eoy_mismatch_count = 0;
    /** Events dated after the tax year, which are ignored. */
    size_t later_event_count = 0;
};

/** @brief Runs the FIFO calculation of one tax year.
 *
 * run() sorts the events, rebuilds the start of year lots of every non-cash
 * asset from the events before the year, applies the year's events in
 * order and compares the resulting positions with the reported year end
 * quantities.
 *
 * The asset lookup and the converter must outlive the engine.
 */
class KapCalculationEngine
{
public:
    KapCalculationEngine(const KapAssetLookup& assets,
                         const KapCurrencyConverter& converter,
                         KapNumericContext ctx, int tax_year);

    /**
     * Calculate the tax year. Earlier results and ledgers are discarded.
     *
     * @exception KapCalculationError if the tax year is invalid, an event
     * has an unknown asset or an unparseable date, a start of year
     * reconstruction fails, an option link is broken or a ledger can't
     * cover a current year event.
     */
    KapCalculationResult run(std::vector<KapEvent> events);
    /**
     * Compare every ledger's position with the reported year end quantity.
     * Mismatches are logged.
     * @return The number of mismatching assets.
     */
    int reconcile_end_of_year() const;
    /** @return The ledger of an asset or nullptr. */
    const KapLedger* ledger(const std::string& asset_id) const;
    int tax_year() const noexcept { return m_tax_year; }

private:
    using HistoryMap = std::map<std::string, std::vector<KapEvent>>;
    HistoryMap partition(std::vector<KapEvent>& events,
                         KapCalculationResult& result) const;
    void seed_ledgers(HistoryMap& history);
    void dispatch(KapCalculationResult& result);

    const KapAssetLookup& m_assets;
    const KapCurrencyConverter& m_converter;
    KapNumericContext m_ctx;
    int m_tax_year;
    std::map<std::string, KapLedger> m_ledgers;
    KapPendingAdjustments m_pending;
};

#endif // __KAP_ENGINE_HPP__
