/********************************************************************
 * kap-event.cpp -- financial event records                         *
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

#include "kap-event.hpp"

const KapEventBase&
kap_event_base(const KapEvent& event)
{
    return std::visit([](const auto& ev) -> const KapEventBase& { return ev; },
                      event);
}

const char*
kap_event_kind_name(const KapEvent& event)
{
    return std::visit(
        [](const auto& ev) -> const char* {
            using T = decltype(ev);
            if constexpr (is_same_decayed_v<T, KapTradeEvent>)
                return to_string(ev.trade_type);
            else if constexpr (is_same_decayed_v<T, KapSplitEvent>)
                return "CORP_SPLIT_FORWARD";
            else if constexpr (is_same_decayed_v<T, KapCashMergerEvent>)
                return "CORP_MERGER_CASH";
            else if constexpr (is_same_decayed_v<T, KapStockMergerEvent>)
                return "CORP_MERGER_STOCK";
            else if constexpr (is_same_decayed_v<T, KapStockDividendEvent>)
                return "CORP_STOCK_DIVIDEND";
            else if constexpr (is_same_decayed_v<T, KapExpireDividendRightsEvent>)
                return "CORP_EXPIRE_DIVIDEND_RIGHTS";
            else if constexpr (is_same_decayed_v<T, KapOptionExerciseEvent>)
                return "OPTION_EXERCISE";
            else if constexpr (is_same_decayed_v<T, KapOptionAssignmentEvent>)
                return "OPTION_ASSIGNMENT";
            else if constexpr (is_same_decayed_v<T, KapOptionExpirationEvent>)
                return "OPTION_EXPIRATION_WORTHLESS";
            else if constexpr (is_same_decayed_v<T, KapCashFlowEvent>)
                return to_string(ev.flow_type);
            else if constexpr (is_same_decayed_v<T, KapWithholdingTaxEvent>)
                return "WITHHOLDING_TAX";
            else if constexpr (is_same_decayed_v<T, KapFeeEvent>)
                return "FEE_TRANSACTION";
            else
            {
                static_assert(is_same_decayed_v<T, KapCurrencyConversionEvent>,
                              "Unhandled event kind");
                return "CURRENCY_CONVERSION";
            }
        }, event);
}

const char*
to_string(KapTradeType type) noexcept
{
    switch (type)
    {
    case KapTradeType::buy_long: return "TRADE_BUY_LONG";
    case KapTradeType::sell_long: return "TRADE_SELL_LONG";
    case KapTradeType::sell_short_open: return "TRADE_SELL_SHORT_OPEN";
    case KapTradeType::buy_short_cover: return "TRADE_BUY_SHORT_COVER";
    }
    return "TRADE";
}

const char*
to_string(KapCashFlowType type) noexcept
{
    switch (type)
    {
    case KapCashFlowType::dividend_cash: return "DIVIDEND_CASH";
    case KapCashFlowType::capital_repayment: return "CAPITAL_REPAYMENT";
    case KapCashFlowType::distribution_fund: return "DISTRIBUTION_FUND";
    case KapCashFlowType::interest_received: return "INTEREST_RECEIVED";
    case KapCashFlowType::interest_paid_accrued: return "INTEREST_PAID_STUECKZINSEN";
    }
    return "CASH_FLOW";
}
