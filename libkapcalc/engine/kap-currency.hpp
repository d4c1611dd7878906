/********************************************************************
 * kap-currency.hpp -- conversion of foreign amounts to EUR         *
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

#ifndef __KAP_CURRENCY_HPP__
#define __KAP_CURRENCY_HPP__

#include <map>
#include <optional>
#include <string>
#include <utility>
#include "kap-date.hpp"
#include "kap-numeric.hpp"

/** Converts foreign currency amounts to EUR, the reporting currency. */
class KapCurrencyConverter
{
public:
    virtual ~KapCurrencyConverter() = default;
    /**
     * @return The EUR amount, or std::nullopt if the amount can't be
     * converted. Failures are logged by the implementation.
     */
    virtual std::optional<KapNumeric>
    convert_to_eur(const KapNumeric& amount, const std::string& currency,
                   const KapDate& date) const = 0;
};

/** @brief Converter over a table of daily reference rates.
 *
 * Rates are quoted as foreign currency units per EUR, the way the ECB
 * publishes them, so the EUR amount is amount / rate.
 */
class KapRateTableConverter : public KapCurrencyConverter
{
public:
    explicit KapRateTableConverter(KapNumericContext ctx) : m_ctx{ctx} {}
    /** Record the rate of currency on date, replacing an earlier one. */
    void set_rate(const std::string& currency, const KapDate& date,
                  const KapNumeric& rate);
    std::optional<KapNumeric>
    convert_to_eur(const KapNumeric& amount, const std::string& currency,
                   const KapDate& date) const override;
private:
    using RateKey = std::pair<std::string, std::string>;
    KapNumericContext m_ctx;
    std::map<RateKey, KapNumeric> m_rates;
};

#endif // __KAP_CURRENCY_HPP__
