/********************************************************************
 * kap-ledger.hpp -- per-asset FIFO lot ledger                      *
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

#ifndef __KAP_LEDGER_HPP__
#define __KAP_LEDGER_HPP__

#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "kap-asset.hpp"
#include "kap-currency.hpp"
#include "kap-date.hpp"
#include "kap-event.hpp"
#include "kap-numeric.hpp"
#include "kap-realized.hpp"

/** @brief An open long position acquired in one transaction.
 *
 * @exception std::invalid_argument from the constructor if the quantity
 * isn't positive, a cost is negative or the source id is empty.
 */
struct KapLot
{
    KapLot(const KapDate& date, const KapNumeric& qty, const KapNumeric& unit,
           const KapNumeric& total, const std::string& source_id,
           const KapNumericContext& ctx);

    KapDate acquisition_date;
    KapNumeric quantity;
    KapNumeric unit_cost;
    KapNumeric total_cost;
    std::string source_transaction_id;
};

/** @brief An open short position; the quantity shorted is positive. */
struct KapShortLot
{
    KapShortLot(const KapDate& date, const KapNumeric& qty,
                const KapNumeric& unit, const KapNumeric& total,
                const std::string& source_id, const KapNumericContext& ctx);

    KapDate opening_date;
    KapNumeric quantity;
    KapNumeric unit_proceeds;
    KapNumeric total_proceeds;
    std::string source_transaction_id;
};

/** Part of an option lot consumed by an exercise, assignment or
 * expiration. unit_value is the premium paid per contract of a long lot or
 * received per contract of a short one.
 */
struct KapConsumedLot
{
    KapNumeric quantity;
    KapNumeric unit_value;
    KapDate lot_date;
    std::string source_transaction_id;
};

enum class KapLedgerErrorKind
{
    /** The position can't satisfy a current year event; the run must stop. */
    fatal,
    /** The position can't satisfy a historical event; the start of year
     * reconstruction is unreliable.
     */
    replay_insufficient,
};

struct KapLedgerError
{
    KapLedgerErrorKind kind;
    std::string reason;
};

/** Either the value of a ledger operation or the reason it failed. */
template <typename T>
class KapLedgerResult
{
public:
    KapLedgerResult(T value) : m_result{std::move(value)} {}
    KapLedgerResult(KapLedgerError error) : m_result{std::move(error)} {}
    explicit operator bool() const noexcept
    {
        return std::holds_alternative<T>(m_result);
    }
    /** @exception std::bad_variant_access if the operation failed. */
    T& value() { return std::get<T>(m_result); }
    const T& value() const { return std::get<T>(m_result); }
    /** @exception std::bad_variant_access if the operation succeeded. */
    const KapLedgerError& error() const
    {
        return std::get<KapLedgerError>(m_result);
    }
private:
    std::variant<T, KapLedgerError> m_result;
};

using KapRealizedList = std::vector<KapRealizedGainLoss>;
using KapConsumedLots = std::vector<KapConsumedLot>;

/** Historical replay runs the ledger without producing records. */
enum class KapReplayMode
{
    live,
    replay,
};

enum class KapSoyOutcome
{
    /** The reported start of year quantity is zero. */
    no_position,
    /** The lots rebuilt from history cover the reported quantity. */
    reconstructed,
    /** One synthetic lot carries the reported quantity and cost basis. */
    fallback,
};

const char* to_string(KapSoyOutcome outcome) noexcept;

/** @brief FIFO lot ledger of one asset.
 *
 * Long and short lots are kept ordered by (date, source transaction id),
 * the order in which they are consumed. A partially consumed lot keeps its
 * unit cost and has its total recomputed from the remaining quantity.
 *
 * The ledger holds a reference to the currency converter, which must
 * outlive it; it is used to convert a start of year cost basis reported in
 * a foreign currency.
 */
class KapLedger
{
public:
    /**
     * Create an empty ledger for asset. Options without a valid multiplier
     * get 100. Funds without a fund type are treated as sonstige Fonds.
     */
    KapLedger(const KapAsset& asset, const KapCurrencyConverter& converter,
              KapNumericContext ctx);

    const std::string& asset_id() const noexcept { return m_asset_id; }
    KapAssetCategory category() const noexcept { return m_category; }
    KapFundType fund_type() const noexcept { return m_fund_type; }
    const std::optional<KapNumeric>& multiplier() const noexcept { return m_multiplier; }
    const KapNumericContext& context() const noexcept { return m_ctx; }
    const std::vector<KapLot>& lots() const noexcept { return m_lots; }
    const std::vector<KapShortLot>& short_lots() const noexcept { return m_short_lots; }

    /**
     * Open a long lot from a buy. Trades that aren't buys or lack a positive
     * quantity or a net cost are ignored.
     * @exception std::invalid_argument if the trade has no transaction id.
     */
    void add_long_lot(const KapTradeEvent& trade);
    /**
     * Open a short lot from a short sale. Trades that aren't short opens or
     * lack a negative quantity or net proceeds are ignored.
     * @exception std::invalid_argument if the trade has no transaction id.
     */
    void add_short_lot(const KapTradeEvent& trade);
    /**
     * Consume long lots oldest first for a sale and return one record per
     * consumed lot slice. In replay mode no records are produced.
     *
     * If the lots don't cover the sale the error is fatal in live mode and
     * replay_insufficient in replay mode; the lots that were available are
     * consumed either way.
     */
    KapLedgerResult<KapRealizedList>
    consume_long_lots_for_sale(const KapTradeEvent& sale,
                               KapReplayMode mode = KapReplayMode::live);
    /** The short side counterpart of consume_long_lots_for_sale(). */
    KapLedgerResult<KapRealizedList>
    consume_short_lots_for_cover(const KapTradeEvent& cover,
                                 KapReplayMode mode = KapReplayMode::live);
    /**
     * Multiply every lot quantity by the split ratio keeping the totals.
     * Lots whose quantity rounds to zero are removed.
     * @return false if the ratio isn't positive; the lots are unchanged.
     */
    bool adjust_lots_for_split(const KapSplitEvent& event);
    /** Dispose of all long lots at the cash price of the merger. */
    KapRealizedList consume_all_lots_for_cash_merger(const KapCashMergerEvent& event);
    /** Add a lot for the new units of a stock dividend at their value. */
    void add_lot_for_stock_dividend(const KapStockDividendEvent& event);
    /**
     * Consume long option lots for an exercise or expiration.
     * @exception std::logic_error if this isn't an option ledger.
     */
    KapLedgerResult<KapConsumedLots> consume_long_option(const KapNumeric& contracts);
    /**
     * Consume short option lots for an assignment or expiration.
     * @exception std::logic_error if this isn't an option ledger.
     */
    KapLedgerResult<KapConsumedLots> consume_short_option(const KapNumeric& contracts);
    /**
     * Reduce the cost basis of the long lots oldest first by a tax free
     * capital repayment. No lot's cost goes below zero.
     * @return The part of the repayment that couldn't be applied.
     */
    KapNumeric reduce_cost_basis_for_capital_repayment(const KapNumeric& amount);
    KapNumeric long_quantity() const;
    KapNumeric short_quantity() const;
    /** Long minus short quantity at the quantity precision. */
    KapNumeric current_position_quantity() const;

    /**
     * Establish the lots held at the start of tax_year.
     *
     * history holds the asset's trades, splits and stock dividends dated
     * before the tax year, in processing order. They are replayed and the
     * result is kept if it covers the asset's reported start of year
     * quantity; otherwise a single fallback lot dated the last day of the
     * prior year carries the reported quantity and cost basis.
     *
     * @exception std::runtime_error if the replay fails fatally.
     * @exception std::invalid_argument if a historical event is malformed.
     */
    KapSoyOutcome initialize_from_soy(const KapAsset& asset,
                                      const std::vector<KapEvent>& history,
                                      int tax_year);

private:
    KapRealizedGainLoss make_record(const KapEventBase& event,
                                    const KapDate& acquired,
                                    KapRealizationType type,
                                    const KapNumeric& quantity,
                                    const KapNumeric& unit_cost,
                                    const KapNumeric& unit_value,
                                    const KapNumeric& total_cost,
                                    const KapNumeric& total_value,
                                    bool short_side) const;
    bool replay_event(const KapEvent& event);
    void keep_reconstructed_long(const std::vector<KapLot>& lots, KapNumeric quantity);
    void keep_reconstructed_short(const std::vector<KapShortLot>& lots, KapNumeric quantity);
    KapNumeric fallback_basis(const KapAsset& asset, int tax_year, bool short_side) const;
    void add_fallback_long_lot(const KapAsset& asset, const KapNumeric& quantity, int tax_year);
    void add_fallback_short_lot(const KapAsset& asset, const KapNumeric& quantity, int tax_year);
    void insert_lot(KapLot lot);
    void insert_short_lot(KapShortLot lot);

    std::string m_asset_id;
    KapAssetCategory m_category;
    KapFundType m_fund_type;
    std::optional<KapNumeric> m_multiplier;
    const KapCurrencyConverter& m_converter;
    KapNumericContext m_ctx;
    std::vector<KapLot> m_lots;
    std::vector<KapShortLot> m_short_lots;
};

#endif // __KAP_LEDGER_HPP__
