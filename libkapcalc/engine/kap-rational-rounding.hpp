/********************************************************************
 * kap-rational-rounding.hpp                                        *
 * rounding policies for decimal conversion                         *
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

#ifndef __KAP_RATIONAL_ROUNDING_HPP__
#define __KAP_RATIONAL_ROUNDING_HPP__

#include <stdexcept>
#include <string>
#include <boost/multiprecision/cpp_int.hpp>

/** Mantissa type for KapNumeric. */
using KapInt = boost::multiprecision::cpp_int;

/** Absolute value of a mantissa. */
inline KapInt
abs_value(const KapInt& val)
{
    return val < 0 ? KapInt(-val) : val;
}

enum class RoundType
{
    floor,
    ceiling,
    truncate,
    promote,
    half_down,
    half_up,
    bankers,
    never,
};

template <RoundType rt>
struct RT2T
{
    RoundType value = rt;
};

/* Rounding policies for KapNumeric::convert and convert_sigfigs. The exact
 * result of a conversion is quot + rem / div, where quot is the quotient
 * truncated toward zero and rem carries the sign of the dividend. Each
 * policy decides whether quot is moved one step away from zero.
 */
namespace kap_rounding
{
/* Sign of the exact quotient. quot may be zero, so it comes from rem. */
inline int
direction(const KapInt& rem, const KapInt& div)
{
    return (rem < 0) == (div < 0) ? 1 : -1;
}

inline KapInt
away_from_zero(const KapInt& quot, const KapInt& rem, const KapInt& div)
{
    return quot + direction(rem, div);
}

/* Compare the discarded fraction |rem/div| with one half. */
inline int
compare_to_half(const KapInt& rem, const KapInt& div)
{
    KapInt twice = abs_value(rem) * 2;
    KapInt whole = abs_value(div);
    return twice < whole ? -1 : (twice > whole ? 1 : 0);
}
}

inline KapInt
round(const KapInt& quot, const KapInt&, const KapInt& rem,
      RT2T<RoundType::truncate>)
{
    return quot;
}

inline KapInt
round(const KapInt& quot, const KapInt& div, const KapInt& rem,
      RT2T<RoundType::never>)
{
    if (rem != 0)
        throw std::domain_error("Rounding required when 'never round' specified.");
    return quot;
}

inline KapInt
round(const KapInt& quot, const KapInt& div, const KapInt& rem,
      RT2T<RoundType::floor>)
{
    if (rem == 0 || kap_rounding::direction(rem, div) > 0)
        return quot;
    return kap_rounding::away_from_zero(quot, rem, div);
}

inline KapInt
round(const KapInt& quot, const KapInt& div, const KapInt& rem,
      RT2T<RoundType::ceiling>)
{
    if (rem == 0 || kap_rounding::direction(rem, div) < 0)
        return quot;
    return kap_rounding::away_from_zero(quot, rem, div);
}

inline KapInt
round(const KapInt& quot, const KapInt& div, const KapInt& rem,
      RT2T<RoundType::promote>)
{
    if (rem == 0)
        return quot;
    return kap_rounding::away_from_zero(quot, rem, div);
}

inline KapInt
round(const KapInt& quot, const KapInt& div, const KapInt& rem,
      RT2T<RoundType::half_down>)
{
    if (rem == 0 || kap_rounding::compare_to_half(rem, div) <= 0)
        return quot;
    return kap_rounding::away_from_zero(quot, rem, div);
}

inline KapInt
round(const KapInt& quot, const KapInt& div, const KapInt& rem,
      RT2T<RoundType::half_up>)
{
    if (rem == 0 || kap_rounding::compare_to_half(rem, div) < 0)
        return quot;
    return kap_rounding::away_from_zero(quot, rem, div);
}

/* Ties go to the even neighbour. */
inline KapInt
round(const KapInt& quot, const KapInt& div, const KapInt& rem,
      RT2T<RoundType::bankers>)
{
    if (rem == 0)
        return quot;
    auto half = kap_rounding::compare_to_half(rem, div);
    if (half < 0 || (half == 0 && quot % 2 == 0))
        return quot;
    return kap_rounding::away_from_zero(quot, rem, div);
}

/** Map a RoundType to the name used in configuration files
 * ("half-up", "bankers", ...) and back. round_type_from_string throws
 * std::invalid_argument for an unknown name.
 */
const char* round_type_to_string(RoundType rt) noexcept;
RoundType round_type_from_string(const std::string& str);

#endif //__KAP_RATIONAL_ROUNDING_HPP__
