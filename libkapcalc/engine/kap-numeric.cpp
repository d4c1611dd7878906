/********************************************************************
 * kap-numeric.cpp -- exact decimal arithmetic for tax amounts      *
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

#include <cstdint>
#include <algorithm>
#include <sstream>
#include <boost/regex.hpp>

#include "kap-numeric.hpp"

static const int max_exponent{4096};

static const struct
{
    RoundType type;
    const char* name;
} round_type_names[] =
{
    {RoundType::floor, "floor"},
    {RoundType::ceiling, "ceiling"},
    {RoundType::truncate, "truncate"},
    {RoundType::promote, "promote"},
    {RoundType::half_down, "half-down"},
    {RoundType::half_up, "half-up"},
    {RoundType::bankers, "bankers"},
    {RoundType::never, "never"},
};

const char*
round_type_to_string(RoundType rt) noexcept
{
    for (const auto& entry : round_type_names)
        if (entry.type == rt)
            return entry.name;
    return "unknown";
}

RoundType
round_type_from_string(const std::string& str)
{
    for (const auto& entry : round_type_names)
        if (str == entry.name)
            return entry.type;
    throw std::invalid_argument("Unknown rounding mode '" + str + "'.");
}

/* Runtime selection of the rounding policy templates. */
static KapInt
round_runtime(const KapInt& num, const KapInt& den, const KapInt& rem,
              RoundType rt)
{
    switch (rt)
    {
    case RoundType::floor:
        return round(num, den, rem, RT2T<RoundType::floor>());
    case RoundType::ceiling:
        return round(num, den, rem, RT2T<RoundType::ceiling>());
    case RoundType::truncate:
        return round(num, den, rem, RT2T<RoundType::truncate>());
    case RoundType::promote:
        return round(num, den, rem, RT2T<RoundType::promote>());
    case RoundType::half_down:
        return round(num, den, rem, RT2T<RoundType::half_down>());
    case RoundType::half_up:
        return round(num, den, rem, RT2T<RoundType::half_up>());
    case RoundType::bankers:
        return round(num, den, rem, RT2T<RoundType::bankers>());
    case RoundType::never:
        return round(num, den, rem, RT2T<RoundType::never>());
    }
    throw std::invalid_argument("Invalid rounding mode.");
}

KapNumeric::KapNumeric(int64_t num, int scale) : m_num(num), m_scale(scale)
{
    if (scale < 0)
        throw std::invalid_argument("Attempt to construct a KapNumeric with a negative scale.");
}

KapNumeric::KapNumeric(KapInt num, int scale) :
    m_num(std::move(num)), m_scale(scale)
{
    if (scale < 0)
        throw std::invalid_argument("Attempt to construct a KapNumeric with a negative scale.");
}

using boost::regex;
using boost::smatch;
using boost::regex_match;
KapNumeric::KapNumeric(const std::string& str) : m_num(0), m_scale(0)
{
    static const std::string sign_frag("([-+]?)");
    static const std::string int_frag("([0-9]*)");
    static const std::string frac_frag("(?:\\.([0-9]*))?");
    static const std::string exp_frag("(?:[eE]([-+]?[0-9]+))?");
    static const regex decimal("[ \\t]*" + sign_frag + int_frag + frac_frag +
                               exp_frag + "[ \\t]*");
    smatch m;
    if (!regex_match(str, m, decimal) ||
        (m[2].length() == 0 && m[3].length() == 0))
    {
        std::ostringstream msg;
        msg << "String " << str << " contains no recognizable decimal number.";
        throw std::invalid_argument(msg.str());
    }
    auto digits = m[2].str() + m[3].str();
    // cpp_int reads a leading 0 as an octal prefix.
    auto first = digits.find_first_not_of('0');
    digits = (first == std::string::npos) ? "0" : digits.substr(first);

    int exponent{0};
    if (m[4].matched)
    {
        auto exp_str = m[4].str();
        auto exp_digits = exp_str.find_first_not_of("+-");
        if (exp_str.size() - exp_digits > 6)
            throw std::invalid_argument("Exponent out of range in " + str);
        exponent = std::stoi(exp_str);
        if (exponent > max_exponent || exponent < -max_exponent)
            throw std::invalid_argument("Exponent out of range in " + str);
    }

    m_num = KapInt(digits.c_str());
    if (m[1].str() == "-")
        m_num = -m_num;
    m_scale = static_cast<int>(m[3].length()) - exponent;
    if (m_scale < 0)
    {
        m_num *= pow10(-m_scale);
        m_scale = 0;
    }
}

KapInt
KapNumeric::pow10(int exp)
{
    if (exp < 0)
        throw std::invalid_argument("Negative power of ten requested.");
    KapInt result = boost::multiprecision::pow(KapInt(10),
                                               static_cast<unsigned>(exp));
    return result;
}

KapNumeric
KapNumeric::operator-() const
{
    KapNumeric b(*this);
    b.m_num = -b.m_num;
    return b;
}

KapNumeric
KapNumeric::abs() const
{
    if (m_num < 0)
        return -*this;
    return *this;
}

KapNumeric
KapNumeric::reduce(int min_scale) const
{
    KapNumeric b(*this);
    while (b.m_scale > min_scale && b.m_num % 10 == 0)
    {
        b.m_num /= 10;
        --b.m_scale;
    }
    return b;
}

KapNumeric::round_param
KapNumeric::prepare_conversion(int places) const
{
    if (places < 0)
        throw std::invalid_argument("Attempt to convert a KapNumeric to a negative number of places.");
    if (places >= m_scale)
    {
        KapInt num = m_num * pow10(places - m_scale);
        return {num, KapInt(1), KapInt(0)};
    }
    KapInt den = pow10(m_scale - places);
    KapInt num = m_num / den;
    KapInt rem = m_num % den;
    return {num, den, rem};
}

KapNumeric
KapNumeric::convert(int places, RoundType rt) const
{
    auto params = prepare_conversion(places);
    if (params.rem == 0)
        return KapNumeric(params.num, places);
    return KapNumeric(round_runtime(params.num, params.den, params.rem, rt),
                      places);
}

unsigned int
KapNumeric::digits() const
{
    if (m_num == 0)
        return 0;
    KapInt abs_num = abs_value(m_num);
    return static_cast<unsigned int>(abs_num.str().size());
}

int
KapNumeric::sigfigs_drop(unsigned figs) const
{
    return static_cast<int>(digits()) - static_cast<int>(figs);
}

KapNumeric
KapNumeric::convert_sigfigs(unsigned int figs, RoundType rt) const
{
    switch (rt)
    {
    case RoundType::floor:
        return convert_sigfigs<RoundType::floor>(figs);
    case RoundType::ceiling:
        return convert_sigfigs<RoundType::ceiling>(figs);
    case RoundType::truncate:
        return convert_sigfigs<RoundType::truncate>(figs);
    case RoundType::promote:
        return convert_sigfigs<RoundType::promote>(figs);
    case RoundType::half_down:
        return convert_sigfigs<RoundType::half_down>(figs);
    case RoundType::half_up:
        return convert_sigfigs<RoundType::half_up>(figs);
    case RoundType::bankers:
        return convert_sigfigs<RoundType::bankers>(figs);
    case RoundType::never:
        return convert_sigfigs<RoundType::never>(figs);
    }
    throw std::invalid_argument("Invalid rounding mode.");
}

std::string
KapNumeric::to_string() const
{
    KapInt abs_num = abs_value(m_num);
    auto digits = abs_num.str();
    if (m_scale > 0)
    {
        auto width = static_cast<size_t>(m_scale) + 1;
        if (digits.size() < width)
            digits.insert(0, width - digits.size(), '0');
        digits.insert(digits.size() - m_scale, ".");
    }
    if (m_num < 0)
        digits.insert(0, "-");
    return digits;
}

int
KapNumeric::cmp(const KapNumeric& b) const
{
    int result;
    if (m_scale == b.m_scale)
        result = m_num.compare(b.m_num);
    else if (m_scale < b.m_scale)
    {
        KapInt scaled = m_num * pow10(b.m_scale - m_scale);
        result = scaled.compare(b.m_num);
    }
    else
    {
        KapInt scaled = b.m_num * pow10(m_scale - b.m_scale);
        result = m_num.compare(scaled);
    }
    return result < 0 ? -1 : (result > 0 ? 1 : 0);
}

void
KapNumeric::operator+=(const KapNumeric& b)
{
    *this = *this + b;
}

void
KapNumeric::operator-=(const KapNumeric& b)
{
    *this = *this - b;
}

void
KapNumeric::operator*=(const KapNumeric& b)
{
    *this = *this * b;
}

KapNumeric
operator+(const KapNumeric& a, const KapNumeric& b)
{
    if (a.m_scale == b.m_scale)
        return KapNumeric(KapInt(a.m_num + b.m_num), a.m_scale);
    if (a.m_scale < b.m_scale)
    {
        KapInt num = a.m_num * KapNumeric::pow10(b.m_scale - a.m_scale) + b.m_num;
        return KapNumeric(num, b.m_scale);
    }
    KapInt num = a.m_num + b.m_num * KapNumeric::pow10(a.m_scale - b.m_scale);
    return KapNumeric(num, a.m_scale);
}

KapNumeric
operator-(const KapNumeric& a, const KapNumeric& b)
{
    return a + (-b);
}

KapNumeric
operator*(const KapNumeric& a, const KapNumeric& b)
{
    return KapNumeric(KapInt(a.m_num * b.m_num), a.m_scale + b.m_scale);
}

std::ostream&
operator<<(std::ostream& s, const KapNumeric& n)
{
    return s << n.to_string();
}

/* KapNumericContext */

KapNumeric
KapNumericContext::apply(const KapNumeric& n) const
{
    return n.convert_sigfigs(precision, rounding);
}

KapNumeric
KapNumericContext::add(const KapNumeric& a, const KapNumeric& b) const
{
    return apply(a + b);
}

KapNumeric
KapNumericContext::subtract(const KapNumeric& a, const KapNumeric& b) const
{
    return apply(a - b);
}

KapNumeric
KapNumericContext::multiply(const KapNumeric& a, const KapNumeric& b) const
{
    return apply(a * b);
}

KapNumeric
KapNumericContext::divide(const KapNumeric& a, const KapNumeric& b) const
{
    if (b.is_zero())
        throw std::underflow_error("Attempt to divide by zero.");
    auto ideal_scale = std::max(a.scale() - b.scale(), 0);
    if (a.is_zero())
        return KapNumeric(0, ideal_scale);

    /* Scale the dividend so that the integer quotient has at least precision
     * digits, then round once, dividing by the divisor and the dropped
     * power of ten together so that no digit is lost to truncation.
     */
    auto extra = static_cast<int>(precision + b.digits()) + 1;
    KapInt dividend = a.num() * KapNumeric::pow10(extra);
    KapInt divisor = b.num();
    if (divisor < 0)
    {
        dividend = -dividend;
        divisor = -divisor;
    }
    KapInt quotient = dividend / divisor;
    auto qdigits = static_cast<int>(KapNumeric(quotient, 0).digits());
    auto drop = std::max(qdigits - static_cast<int>(precision), 0);
    KapInt den = divisor * KapNumeric::pow10(drop);
    KapInt num = dividend / den;
    KapInt rem = dividend % den;
    KapInt rounded = (rem == 0) ? num : round_runtime(num, den, rem, rounding);
    auto scale = a.scale() + extra - b.scale() - drop;
    if (scale < 0)
    {
        KapInt shifted = rounded * KapNumeric::pow10(-scale);
        return KapNumeric(shifted, 0);
    }
    return KapNumeric(rounded, scale).reduce(ideal_scale);
}

KapNumeric
KapNumericContext::quantize_amount(const KapNumeric& n) const
{
    return n.convert(amount_places, rounding);
}

KapNumeric
KapNumericContext::quantize_unit(const KapNumeric& n) const
{
    return n.convert(unit_places, rounding);
}

KapNumeric
KapNumericContext::quantize_quantity(const KapNumeric& n) const
{
    return n.convert(quantity_places, rounding);
}

KapNumeric
KapNumericContext::comparison_tolerance() const
{
    return KapNumeric(1, static_cast<int>(precision / 2));
}

void
KapNumericContext::validate() const
{
    if (precision == 0)
        throw std::invalid_argument("Numeric precision must be at least one digit.");
    if (amount_places < 0 || unit_places < 0 || quantity_places < 0)
        throw std::invalid_argument("Decimal place counts must not be negative.");
}
