/********************************************************************
 * kap-event.hpp -- financial event records                         *
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

#ifndef __KAP_EVENT_HPP__
#define __KAP_EVENT_HPP__

#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include "kap-guid.hpp"
#include "kap-numeric.hpp"

/** @brief Fields common to every financial event.
 *
 * Amounts are as enriched before the engine runs: gross_amount_eur is the
 * EUR value of the event where one applies.
 */
struct KapEventBase
{
    std::string asset_id;
    /** Event date as reported, "YYYY-MM-DD". */
    std::string event_date;
    kap::GUID event_id = kap::GUID::create_random();
    std::optional<KapNumeric> gross_amount_foreign;
    std::string local_currency;
    std::optional<KapNumeric> gross_amount_eur;
    std::string transaction_id;
    std::string description;
    std::string notes_codes;
};

enum class KapTradeType
{
    buy_long,
    sell_long,
    sell_short_open,
    buy_short_cover,
};

struct KapTradeEvent : public KapEventBase
{
    KapTradeType trade_type = KapTradeType::buy_long;
    /** Units or contracts; positive for buys, negative for sells. */
    KapNumeric quantity;
    KapNumeric price;
    KapNumeric commission;
    /** Total EUR cost of a buy or net EUR proceeds of a sale, commission
     * included.
     */
    std::optional<KapNumeric> net_proceeds_or_cost_eur;
    /** Set on stock trades that result from an option exercise or
     * assignment.
     */
    std::optional<kap::GUID> related_option_event_id;
};

struct KapCorporateActionBase : public KapEventBase
{
    std::string ca_action_id;
};

/** Forward split; new_per_old is 2 for a 2-for-1 split. */
struct KapSplitEvent : public KapCorporateActionBase
{
    KapNumeric new_per_old;
};

/** Acquisition of the position for cash. */
struct KapCashMergerEvent : public KapCorporateActionBase
{
    std::optional<KapNumeric> cash_per_share_eur;
    KapNumeric quantity_disposed;
};

struct KapStockMergerEvent : public KapCorporateActionBase
{
    std::string new_asset_id;
    KapNumeric new_per_old;
};

struct KapStockDividendEvent : public KapCorporateActionBase
{
    KapNumeric quantity_new;
    std::optional<KapNumeric> fmv_per_new_share_eur;
};

struct KapExpireDividendRightsEvent : public KapCorporateActionBase
{
};

struct KapOptionLifecycleBase : public KapEventBase
{
    KapNumeric quantity_contracts;
};

struct KapOptionExerciseEvent : public KapOptionLifecycleBase {};
struct KapOptionAssignmentEvent : public KapOptionLifecycleBase {};
struct KapOptionExpirationEvent : public KapOptionLifecycleBase {};

enum class KapCashFlowType
{
    dividend_cash,
    capital_repayment,
    distribution_fund,
    interest_received,
    interest_paid_accrued,
};

/** Dividends, fund distributions, interest and capital repayments. */
struct KapCashFlowEvent : public KapEventBase
{
    KapCashFlowType flow_type = KapCashFlowType::dividend_cash;
    std::string source_country;
};

struct KapWithholdingTaxEvent : public KapEventBase
{
    std::optional<kap::GUID> taxed_income_event_id;
    std::string source_country;
};

struct KapFeeEvent : public KapEventBase
{
};

struct KapCurrencyConversionEvent : public KapEventBase
{
    std::string from_currency;
    KapNumeric from_amount;
    std::string to_currency;
    KapNumeric to_amount;
    std::optional<KapNumeric> exchange_rate;
};

/** The closed set of event kinds. Code that dispatches on the kind must
 * handle all of them.
 */
using KapEvent = std::variant<KapTradeEvent,
                              KapSplitEvent,
                              KapCashMergerEvent,
                              KapStockMergerEvent,
                              KapStockDividendEvent,
                              KapExpireDividendRightsEvent,
                              KapOptionExerciseEvent,
                              KapOptionAssignmentEvent,
                              KapOptionExpirationEvent,
                              KapCashFlowEvent,
                              KapWithholdingTaxEvent,
                              KapFeeEvent,
                              KapCurrencyConversionEvent>;

template <typename T, typename U>
struct is_same_decayed
{
    static constexpr bool value = std::is_same_v<std::decay_t<T>,
                                                 std::decay_t<U>>;
};

template <typename T, typename U> inline constexpr bool
is_same_decayed_v = is_same_decayed<T, U>::value;

template <typename T> inline constexpr bool
is_corporate_action_v =
    std::is_base_of_v<KapCorporateActionBase, std::decay_t<T>>;

template <typename T> inline constexpr bool
is_option_lifecycle_v =
    std::is_base_of_v<KapOptionLifecycleBase, std::decay_t<T>>;

const KapEventBase& kap_event_base(const KapEvent& event);
/** Name of the event kind for log messages, e.g. "TRADE_BUY_LONG". */
const char* kap_event_kind_name(const KapEvent& event);
const char* to_string(KapTradeType type) noexcept;
const char* to_string(KapCashFlowType type) noexcept;

#endif // __KAP_EVENT_HPP__
