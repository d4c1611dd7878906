/********************************************************************
 * kap-engine.cpp -- tax-year driver for the FIFO engine            *
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
#include <iterator>
#include <optional>
#include <utility>
#include "kap-engine.hpp"
#include "kap-event-order.hpp"
#include "kaplog.h"

static KapLogModule log_module = KAP_MOD_ENGINE;

namespace
{
/* Applies one current year event to the ledgers. Every event kind has its
 * own overload so that std::visit rejects a kind without one.
 */
class KapEventDispatcher
{
public:
    KapEventDispatcher(std::map<std::string, KapLedger>& ledgers,
                       KapProcessorContext& context,
                       KapCalculationResult& result) :
        m_ledgers{ledgers}, m_context{context}, m_result{result} {}

    void operator()(const KapTradeEvent& ev)
    {
        if (auto ledger = ledger_for(ev, "trade"))
            append(kap_process_trade(ev, *ledger, m_context));
    }
    void operator()(const KapSplitEvent& ev)
    {
        if (auto ledger = ledger_for(ev, "split"))
            ledger->adjust_lots_for_split(ev);
    }
    void operator()(const KapCashMergerEvent& ev)
    {
        if (auto ledger = ledger_for(ev, "cash merger"))
            append(ledger->consume_all_lots_for_cash_merger(ev));
    }
    void operator()(const KapStockMergerEvent& ev)
    {
        PWARN("Stock merger %s of asset %s into %s: transferring lots isn't "
              "supported, the ledger is unchanged",
              ev.event_id.to_string().c_str(), ev.asset_id.c_str(),
              ev.new_asset_id.c_str());
    }
    void operator()(const KapStockDividendEvent& ev)
    {
        if (auto ledger = ledger_for(ev, "stock dividend"))
            ledger->add_lot_for_stock_dividend(ev);
    }
    void operator()(const KapExpireDividendRightsEvent& ev)
    {
        PWARN("Corporate action %s (%s) of asset %s has no lot effect",
              ev.event_id.to_string().c_str(),
              ev.ca_action_id.c_str(), ev.asset_id.c_str());
    }
    void operator()(const KapOptionExerciseEvent& ev)
    {
        if (auto ledger = ledger_for(ev, "option exercise"))
            kap_process_option_exercise(ev, *ledger, m_context);
    }
    void operator()(const KapOptionAssignmentEvent& ev)
    {
        if (auto ledger = ledger_for(ev, "option assignment"))
            kap_process_option_assignment(ev, *ledger, m_context);
    }
    void operator()(const KapOptionExpirationEvent& ev)
    {
        auto ledger = ledger_for(ev, "option expiration");
        if (!ledger)
            return;
        if (ledger->category() != KapAssetCategory::option)
        {
            PERR("Expiration %s refers to asset %s of category %s",
                 ev.event_id.to_string().c_str(), ev.asset_id.c_str(),
                 to_string(ledger->category()));
            return;
        }
        append(kap_process_option_expiration(ev, *ledger));
    }
    void operator()(const KapCashFlowEvent& ev)
    {
        if (ev.flow_type != KapCashFlowType::capital_repayment)
        {
            DEBUG("%s %s needs no ledger", to_string(ev.flow_type),
                  ev.event_id.to_string().c_str());
            return;
        }
        auto ledger = ledger_for(ev, "capital repayment");
        if (!ledger)
            return;
        auto amount = ev.gross_amount_eur.value_or(KapNumeric());
        PINFO("Capital repayment %s EUR on asset %s",
              amount.to_string().c_str(), ev.asset_id.c_str());
        auto excess = ledger->reduce_cost_basis_for_capital_repayment(amount);
        if (excess > 0)
        {
            PINFO("Capital repayment %s exceeds the cost basis by %s EUR",
                  ev.event_id.to_string().c_str(),
                  excess.to_string().c_str());
            m_result.capital_repayment_excess.push_back(
                {ev.event_id, ev.asset_id, KapDate(ev.event_date), excess});
        }
    }
    void operator()(const KapWithholdingTaxEvent& ev)
    {
        DEBUG("Withholding tax %s needs no ledger",
              ev.event_id.to_string().c_str());
    }
    void operator()(const KapFeeEvent& ev)
    {
        DEBUG("Fee %s needs no ledger", ev.event_id.to_string().c_str());
    }
    void operator()(const KapCurrencyConversionEvent& ev)
    {
        DEBUG("Currency conversion %s %s -> %s needs no ledger",
              ev.event_id.to_string().c_str(), ev.from_currency.c_str(),
              ev.to_currency.c_str());
    }

private:
    KapLedger* ledger_for(const KapEventBase& ev, const char* kind)
    {
        auto iter = m_ledgers.find(ev.asset_id);
        if (iter != m_ledgers.end())
            return &iter->second;
        PWARN("The %s %s of asset %s needs a ledger but the asset has none, "
              "skipped", kind, ev.event_id.to_string().c_str(),
              ev.asset_id.c_str());
        return nullptr;
    }
    void append(KapRealizedList&& records)
    {
        std::move(records.begin(), records.end(),
                  std::back_inserter(m_result.realized));
    }

    std::map<std::string, KapLedger>& m_ledgers;
    KapProcessorContext& m_context;
    KapCalculationResult& m_result;
};
}

KapCalculationEngine::KapCalculationEngine(const KapAssetLookup& assets,
                                           const KapCurrencyConverter& converter,
                                           KapNumericContext ctx,
                                           int tax_year) :
    m_assets{assets}, m_converter{converter}, m_ctx{ctx}, m_tax_year{tax_year}
{
}

KapCalculationEngine::HistoryMap
KapCalculationEngine::partition(std::vector<KapEvent>& events,
                                KapCalculationResult& result) const
{
    std::optional<KapDate> year_start, year_end;
    try
    {
        year_start = KapDate(m_tax_year, 1, 1);
        year_end = KapDate(m_tax_year, 12, 31);
    }
    catch (const std::invalid_argument& err)
    {
        throw KapCalculationError("Invalid tax year " +
                                  std::to_string(m_tax_year) + ": " +
                                  err.what());
    }

    std::vector<KapKeyedEvent> current;
    std::map<std::string, std::vector<KapKeyedEvent>> history;
    for (auto& event : events)
    {
        std::optional<KapEventSortKey> key;
        try
        {
            key = kap_event_sort_key(event, m_assets);
        }
        catch (const std::invalid_argument& err)
        {
            throw KapCalculationError(err.what());
        }
        if (key->date < *year_start)
        {
            bool replayable = std::holds_alternative<KapTradeEvent>(event) ||
                std::holds_alternative<KapSplitEvent>(event) ||
                std::holds_alternative<KapStockDividendEvent>(event);
            if (replayable)
            {
                auto asset_id = kap_event_base(event).asset_id;
                history[asset_id].emplace_back(std::move(*key),
                                               std::move(event));
            }
        }
        else if (key->date <= *year_end)
            current.emplace_back(std::move(*key), std::move(event));
        else
            ++result.later_event_count;
    }
    if (result.later_event_count)
        PINFO("Ignored %zu events after tax year %d",
              result.later_event_count, m_tax_year);

    kap_sort_keyed_events(current);
    result.current_year_events.clear();
    for (auto& entry : current)
        result.current_year_events.push_back(std::move(entry.second));

    HistoryMap sorted_history;
    for (auto& [asset_id, keyed] : history)
    {
        kap_sort_keyed_events(keyed);
        auto& list = sorted_history[asset_id];
        for (auto& entry : keyed)
            list.push_back(std::move(entry.second));
    }
    PINFO("%zu current year events, historical events for %zu assets",
          result.current_year_events.size(), sorted_history.size());
    return sorted_history;
}

void
KapCalculationEngine::seed_ledgers(HistoryMap& history)
{
    static const std::vector<KapEvent> no_history;
    m_ledgers.clear();
    for (const auto& asset_id : m_assets.asset_ids())
    {
        auto asset = m_assets.get_asset(asset_id);
        if (!asset || asset->category == KapAssetCategory::cash_balance)
            continue;
        auto iter = m_ledgers.try_emplace(asset_id, *asset, m_converter,
                                          m_ctx).first;
        auto hist = history.find(asset_id);
        const auto& events = hist == history.end() ? no_history : hist->second;
        try
        {
            auto outcome = iter->second.initialize_from_soy(*asset, events,
                                                            m_tax_year);
            DEBUG("Asset %s start of year: %s", asset_id.c_str(),
                  to_string(outcome));
        }
        catch (const std::exception& err)
        {
            PERR("Start of year lots of asset %s: %s", asset_id.c_str(),
                 err.what());
            throw KapCalculationError("Start of year reconstruction of asset " +
                                      asset_id + " failed: " + err.what());
        }
    }
    PINFO("Seeded %zu ledgers", m_ledgers.size());
}

void
KapCalculationEngine::dispatch(KapCalculationResult& result)
{
    KapProcessorContext context{m_assets, m_pending};
    KapEventDispatcher dispatcher{m_ledgers, context, result};
    for (const auto& event : result.current_year_events)
    {
        try
        {
            std::visit(dispatcher, event);
        }
        catch (const KapCalculationError& err)
        {
            PERR("%s", err.what());
            throw;
        }
        catch (const std::exception& err)
        {
            const auto& base = kap_event_base(event);
            PERR("Event %s (%s) of asset %s: %s",
                 base.event_id.to_string().c_str(),
                 kap_event_kind_name(event), base.asset_id.c_str(),
                 err.what());
            throw KapCalculationError(std::string("Event ") +
                                      base.event_id.to_string() + " (" +
                                      kap_event_kind_name(event) +
                                      ") failed: " + err.what());
        }
    }
    if (!m_pending.empty())
        PWARN("%zu option premiums were never applied to a stock trade",
              m_pending.size());
}

KapCalculationResult
KapCalculationEngine::run(std::vector<KapEvent> events)
{
    ENTER("tax year %d, %zu events", m_tax_year, events.size());
    KapCalculationResult result;
    m_pending.clear();
    auto history = partition(events, result);
    seed_ledgers(history);
    dispatch(result);
    result.eoy_mismatch_count = reconcile_end_of_year();
    LEAVE("%zu realized records, %d year end mismatches",
          result.realized.size(), result.eoy_mismatch_count);
    return result;
}

int
KapCalculationEngine::reconcile_end_of_year() const
{
    auto tolerance = m_ctx.comparison_tolerance();
    int mismatches = 0;
    for (const auto& asset_id : m_assets.asset_ids())
    {
        auto asset = m_assets.get_asset(asset_id);
        if (!asset || asset->category == KapAssetCategory::cash_balance)
            continue;
        KapNumeric computed;
        if (auto ledger = this->ledger(asset_id))
            computed = ledger->current_position_quantity();
        else if (asset->soy_quantity && !asset->soy_quantity->is_zero())
            PWARN("Asset %s had a start of year position but no ledger",
                  asset_id.c_str());

        if (asset->eoy_quantity)
        {
            if ((computed - *asset->eoy_quantity).abs() > tolerance)
            {
                PERR("Year end mismatch for %s (%s): computed %s, reported %s",
                     asset->description.c_str(), asset_id.c_str(),
                     computed.to_string().c_str(),
                     asset->eoy_quantity->to_string().c_str());
                ++mismatches;
            }
        }
        else if (computed.abs() > tolerance)
        {
            PERR("Year end mismatch for %s (%s): computed %s, but no year end "
                 "position is reported", asset->description.c_str(),
                 asset_id.c_str(), computed.to_string().c_str());
            ++mismatches;
        }
    }
    if (mismatches)
        PERR("%d assets don't match their reported year end positions",
             mismatches);
    return mismatches;
}

const KapLedger*
KapCalculationEngine::ledger(const std::string& asset_id) const
{
    auto iter = m_ledgers.find(asset_id);
    return iter == m_ledgers.end() ? nullptr : &iter->second;
}
