/********************************************************************
 * kap-date.hpp -- calendar dates for tax events                    *
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

#ifndef __KAP_DATE_HPP__
#define __KAP_DATE_HPP__

#include <memory>
#include <string>

typedef struct
{
    int year;  //1400-9999
    int month; //1-12
    int day; //1-31
} ymd;

class KapDateImpl;

/** KapCalc Date class
 *
 * A calendar day without time of day or timezone, as used for trade,
 * settlement and corporate action dates. Lots are ordered by these dates.
 *
 * The represented date is limited to the period between 1400 and 9999 CE.
 */
class KapDate
{
    public:
        /** Construct a KapDate representing the given year, month, and day in
         * the proleptic Gregorian calendar.
         *
         * @param year The year in the Common Era.
         * @param month The month, where 1 is January and 12 is December.
         * @param day The day of the month, beginning with 1.
         * @exception std::invalid_argument if any of the components is out
         * of range.
         */
        KapDate(int year, int month, int day);
        /** Construct a KapDate by parsing an ISO 8601 "YYYY-MM-DD" string,
         * the format in which brokers report event dates.
         *
         * @param str The string to be interpreted.
         * @exception std::invalid_argument if the string isn't an ISO date or
         * names a day that doesn't exist.
         */
        explicit KapDate(const std::string& str);
        /** Copy constructor.
         */
        KapDate(const KapDate&);
        /** Move constructor.
         */
        KapDate(KapDate&&);
        /** Default destructor.
         */
        ~KapDate();
        /** Copy assignment operator.
         */
        KapDate& operator=(const KapDate&);
        /** Move assignment operator.
         */
        KapDate& operator=(KapDate&&);
        /** Get the year, month, and day from the date as a ymd.
         *  @return ymd struct
         */
        ymd year_month_day() const;
        /** Format the KapDate into a std::string
         *  @param format A cstr describing the way the date is presented.
         *  Code letters preceded with % stand in for arguments; consult the
         *  boost::date_time documentation.
         */
        std::string format(const char* format) const;
        /** The ISO 8601 representation "YYYY-MM-DD". */
        std::string to_string() const;
        /** Number of days from this date to other; negative if other is
         * earlier.
         */
        long days_until(const KapDate& other) const;

private:
    std::unique_ptr<KapDateImpl> m_impl;

    friend bool operator<(const KapDate&, const KapDate&);
    friend bool operator>(const KapDate&, const KapDate&);
    friend bool operator==(const KapDate&, const KapDate&);
    friend bool operator<=(const KapDate&, const KapDate&);
    friend bool operator>=(const KapDate&, const KapDate&);
    friend bool operator!=(const KapDate&, const KapDate&);
};

/**@{
 *  Standard comparison operators working on KapDate objects.
 */
bool operator<(const KapDate& a, const KapDate& b);
bool operator>(const KapDate& a, const KapDate& b);
bool operator==(const KapDate& a, const KapDate& b);
bool operator<=(const KapDate& a, const KapDate& b);
bool operator>=(const KapDate& a, const KapDate& b);
bool operator!=(const KapDate& a, const KapDate& b);
/**@}*/

#endif // __KAP_DATE_HPP__
