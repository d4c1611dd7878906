/********************************************************************
 * kap-processors.cpp                                               *
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

#include <algorithm>
#include <cctype>
#include <sstream>
#include "kap-processors.hpp"
#include "kaplog.h"

static KapLogModule log_module = KAP_MOD_PROCESS;

/* Broker codes marking a stock trade that an assignment (A) or exercise
 * (Ex) produced.
 */
static bool
has_exercise_code(const std::string& notes)
{
    std::istringstream codes{notes};
    std::string code;
    while (std::getline(codes, code, ';'))
    {
        code.erase(std::remove_if(code.begin(), code.end(),
                                  [](unsigned char c){ return std::isspace(c); }),
                   code.end());
        std::transform(code.begin(), code.end(), code.begin(),
                       [](unsigned char c){ return std::toupper(c); });
        if (code == "A" || code == "EX")
            return true;
    }
    return false;
}

static std::string
trade_label(const KapTradeEvent& trade)
{
    return trade.transaction_id.empty() ? trade.event_id.to_string() :
        trade.transaction_id;
}

static KapTradeEvent
adjust_for_option_premium(const KapTradeEvent& trade,
                          KapProcessorContext& context)
{
    const auto& option_event_id = *trade.related_option_event_id;
    auto iter = context.pending.find(option_event_id);
    if (iter == context.pending.end())
        throw KapCalculationError("Stock trade " + trade_label(trade) +
                                  " is linked to option event " +
                                  option_event_id.to_string() +
                                  " which left no premium to apply.");
    const auto& adjustment = iter->second;
    auto option = context.assets.get_asset(adjustment.option_asset_id);
    if (!option || option->category != KapAssetCategory::option)
        throw KapCalculationError("Premium for stock trade " +
                                  trade_label(trade) + " comes from asset " +
                                  adjustment.option_asset_id +
                                  " which isn't an option.");
    if (option->underlying_asset_id != trade.asset_id)
        throw KapCalculationError("Stock trade " + trade_label(trade) +
                                  " of asset " + trade.asset_id +
                                  " is linked to option " + option->id +
                                  " on underlying " +
                                  option->underlying_asset_id + ".");
    if (!trade.net_proceeds_or_cost_eur)
        throw KapCalculationError("Stock trade " + trade_label(trade) +
                                  " has no EUR value to adjust.");

    /* A long call or a short put buys the stock, a short call or a long put
     * sells it. Call premiums raise the cost or proceeds, put premiums lower
     * them.
     */
    auto delta = adjustment.option_type == 'C' ? adjustment.premium :
        -adjustment.premium;
    KapTradeEvent adjusted{trade};
    adjusted.net_proceeds_or_cost_eur = *trade.net_proceeds_or_cost_eur + delta;
    PINFO("Stock trade %s %s: %s EUR adjusted by %s EUR premium of option %s",
          trade_label(trade).c_str(), to_string(trade.trade_type),
          trade.net_proceeds_or_cost_eur->to_string().c_str(),
          delta.to_string().c_str(), option->id.c_str());
    context.pending.erase(iter);
    return adjusted;
}

static KapRealizedList
realized_or_throw(KapLedgerResult<KapRealizedList>&& result)
{
    if (!result)
        throw KapCalculationError(result.error().reason);
    return std::move(result.value());
}

KapRealizedList
kap_process_trade(const KapTradeEvent& trade, KapLedger& ledger,
                  KapProcessorContext& context)
{
    auto asset = context.assets.get_asset(trade.asset_id);
    bool is_stock = asset && asset->category == KapAssetCategory::stock;
    const KapTradeEvent* effective = &trade;
    KapTradeEvent adjusted;
    if (is_stock && trade.related_option_event_id)
    {
        adjusted = adjust_for_option_premium(trade, context);
        effective = &adjusted;
    }
    else if (is_stock && has_exercise_code(trade.notes_codes))
        PERR("Stock trade %s has exercise or assignment code '%s' but no "
             "option link, the premium isn't applied",
             trade_label(trade).c_str(), trade.notes_codes.c_str());

    switch (effective->trade_type)
    {
    case KapTradeType::buy_long:
        ledger.add_long_lot(*effective);
        break;
    case KapTradeType::sell_short_open:
        ledger.add_short_lot(*effective);
        break;
    case KapTradeType::sell_long:
        return realized_or_throw(ledger.consume_long_lots_for_sale(*effective));
    case KapTradeType::buy_short_cover:
        return realized_or_throw(ledger.consume_short_lots_for_cover(*effective));
    }
    return KapRealizedList{};
}

/* The option asset of a lifecycle event, or nullptr if it can't take part
 * in a premium adjustment.
 */
static const KapAsset*
lifecycle_option(const KapOptionLifecycleBase& event,
                 KapProcessorContext& context, const char* action)
{
    auto option = context.assets.get_asset(event.asset_id);
    if (!option || option->category != KapAssetCategory::option)
    {
        PERR("%s %s refers to asset %s which isn't an option", action,
             event.event_id.to_string().c_str(), event.asset_id.c_str());
        return nullptr;
    }
    if (option->underlying_asset_id.empty())
        throw KapCalculationError(std::string(action) + " " +
                                  event.event_id.to_string() + ": option " +
                                  option->id + " has no underlying asset.");
    if (!option->option_type || (*option->option_type != 'C' &&
                                 *option->option_type != 'P'))
    {
        PERR("%s %s: option %s is neither a call nor a put", action,
             event.event_id.to_string().c_str(), option->id.c_str());
        return nullptr;
    }
    return option;
}

static void
store_premium(const KapOptionLifecycleBase& event, const KapAsset& option,
              KapLedgerResult<KapConsumedLots>&& result,
              const KapNumericContext& ctx, KapProcessorContext& context)
{
    if (!result)
        throw KapCalculationError(result.error().reason);
    KapNumeric premium;
    for (const auto& lot : result.value())
        premium = ctx.add(premium, ctx.multiply(lot.quantity, lot.unit_value));
    context.pending[event.event_id] = {premium, option.id, *option.option_type};
    PINFO("Option %s event %s: premium %s EUR waits for the stock trade",
          option.id.c_str(), event.event_id.to_string().c_str(),
          premium.to_string().c_str());
}

void
kap_process_option_exercise(const KapOptionExerciseEvent& event,
                            KapLedger& ledger, KapProcessorContext& context)
{
    auto option = lifecycle_option(event, context, "Exercise");
    if (!option)
        return;
    store_premium(event, *option,
                  ledger.consume_long_option(event.quantity_contracts),
                  ledger.context(), context);
}

void
kap_process_option_assignment(const KapOptionAssignmentEvent& event,
                              KapLedger& ledger, KapProcessorContext& context)
{
    auto option = lifecycle_option(event, context, "Assignment");
    if (!option)
        return;
    store_premium(event, *option,
                  ledger.consume_short_option(event.quantity_contracts),
                  ledger.context(), context);
}

KapRealizedList
kap_process_option_expiration(const KapOptionExpirationEvent& event,
                              KapLedger& ledger)
{
    KapRealizedList records;
    const auto& contracts = event.quantity_contracts;
    const auto& ctx = ledger.context();
    auto long_held = ledger.long_quantity();
    auto short_held = ledger.short_quantity();

    std::optional<KapConsumedLots> consumed;
    bool short_side = false;
    if (long_held >= contracts)
    {
        auto result = ledger.consume_long_option(contracts);
        if (result)
            consumed = std::move(result.value());
        else
            PWARN("Expiration %s as long position: %s",
                  event.event_id.to_string().c_str(),
                  result.error().reason.c_str());
    }
    if (!consumed && short_held >= contracts)
    {
        auto result = ledger.consume_short_option(contracts);
        if (result)
        {
            consumed = std::move(result.value());
            short_side = true;
        }
        else
            PWARN("Expiration %s as short position: %s",
                  event.event_id.to_string().c_str(),
                  result.error().reason.c_str());
    }
    if (!consumed)
    {
        PERR("Expiration %s of %s contracts of %s: neither long (%s) nor "
             "short (%s) holdings cover it, nothing realized",
             event.event_id.to_string().c_str(),
             contracts.to_string().c_str(), ledger.asset_id().c_str(),
             long_held.to_string().c_str(), short_held.to_string().c_str());
        return records;
    }

    KapDate expired{event.event_date};
    for (const auto& lot : *consumed)
    {
        KapRealizationParams params;
        params.originating_event_id = event.event_id;
        params.asset_id = ledger.asset_id();
        params.category = KapAssetCategory::option;
        params.acquisition_date = lot.lot_date;
        params.realization_date = expired;
        params.realization_type = short_side ?
            KapRealizationType::option_expired_short :
            KapRealizationType::option_expired_long;
        params.quantity = lot.quantity;
        params.unit_cost_basis = short_side ? KapNumeric() : lot.unit_value;
        params.unit_realization_value = short_side ? lot.unit_value : KapNumeric();
        params.total_cost_basis = ctx.multiply(lot.quantity, params.unit_cost_basis);
        params.total_realization_value =
            ctx.multiply(lot.quantity, params.unit_realization_value);
        params.gross_gain_loss = ctx.subtract(params.total_realization_value,
                                              params.total_cost_basis);
        params.holding_period_days = kap_holding_period_days(lot.lot_date,
                                                             expired);
        auto cls = kap_classify_realization(KapAssetCategory::option,
                                            KapFundType::none,
                                            params.gross_gain_loss,
                                            params.holding_period_days);
        params.tax_category = cls.category;
        params.section_23_taxable = cls.section_23_taxable;
        params.stillhalter_income = short_side &&
            !params.gross_gain_loss.is_negative();
        records.emplace_back(params, ctx);
    }
    PINFO("Expiration %s: %zu %s lots of %s expired worthless",
          event.event_id.to_string().c_str(), records.size(),
          short_side ? "short" : "long", ledger.asset_id().c_str());
    return records;
}
