/********************************************************************
 * kap-date.cpp -- calendar dates for tax events                    *
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

#include <sstream>
#include <locale>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/regex.hpp>

#include "kap-date.hpp"

using Date = boost::gregorian::date;
using Month = boost::gregorian::greg_month;

class KapDateImpl
{
public:
    KapDateImpl(const int year, const int month, const int day);
    KapDateImpl(const std::string& str);

    ymd year_month_day() const;
    std::string format(const char* format) const;
    long days_until(const KapDateImpl& other) const;
private:
    Date m_greg;

    friend bool operator<(const KapDateImpl&, const KapDateImpl&);
    friend bool operator>(const KapDateImpl&, const KapDateImpl&);
    friend bool operator==(const KapDateImpl&, const KapDateImpl&);
    friend bool operator<=(const KapDateImpl&, const KapDateImpl&);
    friend bool operator>=(const KapDateImpl&, const KapDateImpl&);
    friend bool operator!=(const KapDateImpl&, const KapDateImpl&);
};

/* Member function definitions for KapDateImpl.
 */
KapDateImpl::KapDateImpl(const int year, const int month, const int day) :
    m_greg(boost::gregorian::not_a_date_time)
{
    try
    {
        m_greg = Date(year, static_cast<Month>(month), day);
    }
    catch (const std::out_of_range& err)
    {
        throw std::invalid_argument(err.what());
    }
}

KapDateImpl::KapDateImpl(const std::string& str) :
    m_greg(boost::gregorian::not_a_date_time)
{
    static const boost::regex iso_date("[ \\t]*(?<YEAR>[0-9]{4})-(?<MONTH>[0-9]{1,2})-(?<DAY>[0-9]{1,2})[ \\t]*");
    boost::smatch what;
    if (!boost::regex_match(str, what, iso_date))
        throw std::invalid_argument("Value '" + str + "' can't be parsed into a date.");
    try
    {
        m_greg = Date(std::stoi(what.str("YEAR")),
                      static_cast<Month>(std::stoi(what.str("MONTH"))),
                      std::stoi(what.str("DAY")));
    }
    catch (const std::out_of_range& err)
    {
        throw std::invalid_argument("Value '" + str + "' is not a valid date: " + err.what());
    }
}

ymd
KapDateImpl::year_month_day() const
{
    auto boost_ymd = m_greg.year_month_day();
    return {boost_ymd.year, boost_ymd.month.as_number(), boost_ymd.day};
}

std::string
KapDateImpl::format(const char* format) const
{
    using Facet = boost::gregorian::date_facet;
    std::stringstream ss;
    //The stream destructor frees the facet, so it must be heap-allocated.
    auto output_facet(new Facet(format));
    ss.imbue(std::locale(std::locale(), output_facet));
    ss << m_greg;
    return ss.str();
}

long
KapDateImpl::days_until(const KapDateImpl& other) const
{
    return (other.m_greg - m_greg).days();
}

bool operator<(const KapDateImpl& a, const KapDateImpl& b) { return a.m_greg < b.m_greg; }
bool operator>(const KapDateImpl& a, const KapDateImpl& b) { return a.m_greg > b.m_greg; }
bool operator==(const KapDateImpl& a, const KapDateImpl& b) { return a.m_greg == b.m_greg; }
bool operator<=(const KapDateImpl& a, const KapDateImpl& b) { return a.m_greg <= b.m_greg; }
bool operator>=(const KapDateImpl& a, const KapDateImpl& b) { return a.m_greg >= b.m_greg; }
bool operator!=(const KapDateImpl& a, const KapDateImpl& b) { return a.m_greg != b.m_greg; }

/* KapDate */
KapDate::KapDate(int year, int month, int day) :
m_impl(new KapDateImpl(year, month, day)) {}
KapDate::KapDate(const std::string& str) :
m_impl(new KapDateImpl(str)) {}
KapDate::KapDate(const KapDate& a) :
m_impl(new KapDateImpl(*a.m_impl)) {}
KapDate::KapDate(KapDate&&) = default;
KapDate::~KapDate() = default;

KapDate&
KapDate::operator=(const KapDate& a)
{
    m_impl.reset(new KapDateImpl(*a.m_impl));
    return *this;
}
KapDate&
KapDate::operator=(KapDate&&) = default;

std::string
KapDate::format(const char* format) const
{
    return m_impl->format(format);
}

std::string
KapDate::to_string() const
{
    return m_impl->format("%Y-%m-%d");
}

ymd
KapDate::year_month_day() const
{
    return m_impl->year_month_day();
}

long
KapDate::days_until(const KapDate& other) const
{
    return m_impl->days_until(*other.m_impl);
}

bool operator<(const KapDate& a, const KapDate& b) { return *(a.m_impl) < *(b.m_impl); }
bool operator>(const KapDate& a, const KapDate& b) { return *(a.m_impl) > *(b.m_impl); }
bool operator==(const KapDate& a, const KapDate& b) { return *(a.m_impl) == *(b.m_impl); }
bool operator<=(const KapDate& a, const KapDate& b) { return *(a.m_impl) <= *(b.m_impl); }
bool operator>=(const KapDate& a, const KapDate& b) { return *(a.m_impl) >= *(b.m_impl); }
bool operator!=(const KapDate& a, const KapDate& b) { return *(a.m_impl) != *(b.m_impl); }
