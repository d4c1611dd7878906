/********************************************************************
 * kap-currency.cpp -- conversion of foreign amounts to EUR         *
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
#include "kap-currency.hpp"
#include "kaplog.h"

static KapLogModule log_module = KAP_MOD_CURRENCY;

static std::string
normalize_currency(const std::string& currency)
{
    std::string upper{currency};
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c){ return std::toupper(c); });
    return upper;
}

void
KapRateTableConverter::set_rate(const std::string& currency,
                                const KapDate& date, const KapNumeric& rate)
{
    m_rates[{normalize_currency(currency), date.to_string()}] = rate;
}

std::optional<KapNumeric>
KapRateTableConverter::convert_to_eur(const KapNumeric& amount,
                                      const std::string& currency,
                                      const KapDate& date) const
{
    auto code = normalize_currency(currency);
    if (code.empty())
    {
        PWARN("Currency missing for amount %s on %s",
              amount.to_string().c_str(), date.to_string().c_str());
        return std::nullopt;
    }
    if (amount.is_zero())
        return KapNumeric(0, 2);
    if (code == "EUR")
        return amount;

    auto iter = m_rates.find({code, date.to_string()});
    if (iter == m_rates.end())
    {
        PERR("No exchange rate for %s on %s, can't convert %s",
             code.c_str(), date.to_string().c_str(),
             amount.to_string().c_str());
        return std::nullopt;
    }
    if (iter->second <= 0)
    {
        PERR("Exchange rate %s for %s on %s is not positive",
             iter->second.to_string().c_str(), code.c_str(),
             date.to_string().c_str());
        return std::nullopt;
    }
    return m_ctx.divide(amount, iter->second);
}
