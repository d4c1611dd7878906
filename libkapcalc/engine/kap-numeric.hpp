/********************************************************************
 * kap-numeric.hpp -- exact decimal arithmetic for tax amounts      *
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

#ifndef __KAP_NUMERIC_HPP__
#define __KAP_NUMERIC_HPP__

#include <cstdint>
#include <string>
#include <iostream>
#include "kap-rational-rounding.hpp"

/** @brief Arbitrary precision decimal number for amounts, prices and
 * quantities.
 *
 * A KapNumeric is an integer mantissa and a non-negative decimal scale; its
 * value is num * 10^-scale. Addition, subtraction and multiplication are
 * exact. There is no division operator: division can produce an unbounded
 * number of digits so it is only available through KapNumericContext, which
 * rounds the quotient to the context's precision.
 *
 * Errors: Errors are signalled by exceptions as follows:
 * * A string that isn't a decimal number will raise std::invalid_argument.
 * * Division by zero will raise a std::underflow_error.
 * * A negative scale or place count will raise std::invalid_argument.
 * * Rounding with RoundType::never when rounding is required will raise a
 * std::domain_error.
 */
class KapNumeric
{
public:
    /**
     * Default constructor provides the zero value.
     */
    KapNumeric() : m_num(0), m_scale(0) {}
    /**
     * Integer constructor. Not explicit so that integer literals can be used
     * in comparisons and arithmetic.
     */
    KapNumeric(int64_t num) : m_num(num), m_scale(0) {}
    /**
     * Mantissa and scale constructor: KapNumeric(12345, 2) is 123.45.
     *
     * \param num The mantissa.
     * \param scale The number of decimal places, must not be negative.
     */
    KapNumeric(int64_t num, int scale);
    KapNumeric(KapInt num, int scale);
    /**
     * String constructor.
     *
     * Accepts an optional sign, digits with an optional decimal point and an
     * optional exponent, e.g. "-12.50", ".5", "1e-10". Surrounding whitespace
     * is ignored. Anything else raises std::invalid_argument.
     */
    explicit KapNumeric(const std::string& str);
    KapNumeric(const KapNumeric& rhs) = default;
    KapNumeric(KapNumeric&& rhs) = default;
    KapNumeric& operator=(const KapNumeric& rhs) = default;
    KapNumeric& operator=(KapNumeric&& rhs) = default;
    ~KapNumeric() = default;

    /**
     * Accessor for the mantissa.
     */
    const KapInt& num() const noexcept { return m_num; }
    /**
     * Accessor for the number of decimal places.
     */
    int scale() const noexcept { return m_scale; }
    /**
     * @return A KapNumeric with the opposite sign.
     */
    KapNumeric operator-() const;
    /**
     * @return -this if this < 0 else this.
     */
    KapNumeric abs() const;
    bool is_zero() const noexcept { return m_num == 0; }
    bool is_negative() const noexcept { return m_num < 0; }
    /**
     * Remove trailing zeroes from the fraction without going below
     * min_scale decimal places. The value is unchanged.
     */
    KapNumeric reduce(int min_scale = 0) const;
    /**
     * Quantize to a fixed number of decimal places. If rounding is necessary
     * use the indicated template specialization. For example, to use half-up
     * rounding to cents you'd call bar = foo.convert<RoundType::half_up>(2).
     * If you specify RoundType::never this will throw std::domain_error if
     * rounding is required.
     *
     * \param places The number of decimal places of the result.
     * \return A new KapNumeric with exactly places decimal places.
     */
    template <RoundType RT>
    KapNumeric convert(int places) const
    {
        auto params = prepare_conversion(places);
        if (params.rem == 0)
            return KapNumeric(params.num, places);
        return KapNumeric(round(params.num, params.den,
                                params.rem, RT2T<RT>()), places);
    }
    /** Runtime dispatch of convert<RT>(). */
    KapNumeric convert(int places, RoundType rt) const;
    /**
     * Round to the specified number of significant digits. A value that
     * already has no more than figs digits is returned unchanged.
     *
     * @param figs The number of significant digits to keep.
     */
    template <RoundType RT>
    KapNumeric convert_sigfigs(unsigned int figs) const
    {
        auto drop = sigfigs_drop(figs);
        if (drop <= 0)
            return *this;
        KapInt den = pow10(drop);
        KapInt num = m_num / den;
        KapInt rem = m_num % den;
        KapInt rounded = round(num, den, rem, RT2T<RT>());
        if (drop <= m_scale)
            return KapNumeric(rounded, m_scale - drop);
        KapInt shifted = rounded * pow10(drop - m_scale);
        return KapNumeric(shifted, 0);
    }
    /** Runtime dispatch of convert_sigfigs<RT>(). */
    KapNumeric convert_sigfigs(unsigned int figs, RoundType rt) const;
    /**
     * Number of significant digits in the mantissa; 0 for zero.
     */
    unsigned int digits() const;
    /**
     * Return the plain decimal representation with exactly scale() decimal
     * places and no exponent, e.g. "-0.05".
     */
    std::string to_string() const;

    /** Compare function
     *  @param b KapNumeric to compare to.
     *  @return -1 if this < b, 0 if ==, 1 if this > b.
     */
    int cmp(const KapNumeric& b) const;

    void operator+=(const KapNumeric& b);
    void operator-=(const KapNumeric& b);
    void operator*=(const KapNumeric& b);

    /** @return 10^exp as a KapInt. */
    static KapInt pow10(int exp);

private:
    struct round_param
    {
        KapInt num;
        KapInt den;
        KapInt rem;
    };
    /* Number of trailing mantissa digits to drop to keep figs sigfigs. */
    int sigfigs_drop(unsigned figs) const;
    /* Calculates a round_param struct to pass to a rounding function that will
     * finish computing a KapNumeric with the new scale.
     */
    round_param prepare_conversion(int places) const;

    KapInt m_num;
    int m_scale;

    friend KapNumeric operator+(const KapNumeric& a, const KapNumeric& b);
    friend KapNumeric operator-(const KapNumeric& a, const KapNumeric& b);
    friend KapNumeric operator*(const KapNumeric& a, const KapNumeric& b);
};

/**
 * \defgroup kap_numeric_arithmetic_operators
 * @{
 * Exact arithmetic operators. The result's scale is the larger scale of the
 * operands for + and -, and the sum of the scales for *.
 */
KapNumeric operator+(const KapNumeric& a, const KapNumeric& b);
KapNumeric operator-(const KapNumeric& a, const KapNumeric& b);
KapNumeric operator*(const KapNumeric& a, const KapNumeric& b);
/** @} */

std::ostream& operator<<(std::ostream& s, const KapNumeric& n);

/**
 * @return -1 if a < b, 0 if a == b, 1 if a > b.
 */
inline int cmp(const KapNumeric& a, const KapNumeric& b) { return a.cmp(b); }

/**
 * \defgroup kap_numeric_comparison_operators
 * @{
 * Standard comparison operators; values compare equal regardless of scale,
 * so 1.50 == 1.5.
 */
inline bool operator<(const KapNumeric& a, const KapNumeric& b) { return cmp(a, b) < 0; }
inline bool operator>(const KapNumeric& a, const KapNumeric& b) { return cmp(a, b) > 0; }
inline bool operator==(const KapNumeric& a, const KapNumeric& b) { return cmp(a, b) == 0; }
inline bool operator<=(const KapNumeric& a, const KapNumeric& b) { return cmp(a, b) <= 0; }
inline bool operator>=(const KapNumeric& a, const KapNumeric& b) { return cmp(a, b) >= 0; }
inline bool operator!=(const KapNumeric& a, const KapNumeric& b) { return cmp(a, b) != 0; }
/** @} */

/** @brief Precision and rounding settings for a calculation run.
 *
 * Every operation whose result must respect the working precision goes
 * through a context. One context is created per run and passed by value to
 * the ledgers and engines; nothing reads numeric settings from global state.
 */
struct KapNumericContext
{
    /** Significant digits kept by add, subtract, multiply and divide. */
    unsigned int precision = 28;
    RoundType rounding = RoundType::half_up;
    /** Decimal places of monetary totals. */
    int amount_places = 2;
    /** Decimal places of per-unit prices and costs. */
    int unit_places = 6;
    /** Decimal places of quantities. */
    int quantity_places = 8;

    /** Round n to the context precision. */
    KapNumeric apply(const KapNumeric& n) const;
    KapNumeric add(const KapNumeric& a, const KapNumeric& b) const;
    KapNumeric subtract(const KapNumeric& a, const KapNumeric& b) const;
    KapNumeric multiply(const KapNumeric& a, const KapNumeric& b) const;
    /**
     * Divide a by b, rounding the quotient to precision significant digits
     * with the context rounding. Trailing zeroes are removed down to the
     * scale a.scale() - b.scale() (at least 0), so 10 / 4 is 2.5 and
     * 1001 / 10 is 100.1.
     *
     * @exception std::underflow_error if b is zero.
     */
    KapNumeric divide(const KapNumeric& a, const KapNumeric& b) const;

    KapNumeric quantize_amount(const KapNumeric& n) const;
    KapNumeric quantize_unit(const KapNumeric& n) const;
    KapNumeric quantize_quantity(const KapNumeric& n) const;

    /** 10^-(precision / 2), the tolerance for comparing computed values. */
    KapNumeric comparison_tolerance() const;
    /**
     * Check that the settings are usable.
     * @exception std::invalid_argument if precision is 0 or a place count is
     * negative.
     */
    void validate() const;
};

#endif // __KAP_NUMERIC_HPP__
