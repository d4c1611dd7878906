/********************************************************************
 * gtest-kap-numeric.cpp -- unit tests for KapNumeric               *
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

#include <gtest/gtest.h>
#include <stdexcept>
#include "../kap-numeric.hpp"

TEST(kapnumeric_constructors, test_default_constructor)
{
    KapNumeric value;
    EXPECT_EQ(value.num(), 0);
    EXPECT_EQ(value.scale(), 0);
    EXPECT_TRUE(value.is_zero());
}

TEST(kapnumeric_constructors, test_scale_constructor)
{
    KapNumeric value(12345, 2);
    EXPECT_EQ(value.num(), 12345);
    EXPECT_EQ(value.scale(), 2);
    EXPECT_EQ("123.45", value.to_string());
    EXPECT_THROW(KapNumeric throw_val(1, -1), std::invalid_argument);
}

TEST(kapnumeric_constructors, test_string_constructor)
{
    EXPECT_EQ("-12.50", KapNumeric("-12.50").to_string());
    EXPECT_EQ("0.5", KapNumeric(".5").to_string());
    EXPECT_EQ("0.0000000001", KapNumeric("1e-10").to_string());
    EXPECT_EQ("1500", KapNumeric("1.5e3").to_string());
    EXPECT_EQ("0.007", KapNumeric(" 0.007 ").to_string());
    EXPECT_THROW(KapNumeric("12,50"), std::invalid_argument);
    EXPECT_THROW(KapNumeric("abc"), std::invalid_argument);
    EXPECT_THROW(KapNumeric("."), std::invalid_argument);
}

TEST(kapnumeric_operators, test_comparison_ignores_scale)
{
    EXPECT_EQ(KapNumeric(1001, 1), KapNumeric("100.100"));
    EXPECT_LT(KapNumeric(-5, 2), KapNumeric(0));
    EXPECT_GT(KapNumeric(2), KapNumeric(19999, 4));
    EXPECT_TRUE(KapNumeric(-3).is_negative());
    EXPECT_EQ(KapNumeric(3), KapNumeric(-3).abs());
}

TEST(kapnumeric_operators, test_exact_arithmetic)
{
    KapNumeric a(1001, 1), b(55, 1);
    EXPECT_EQ(KapNumeric(1056, 1), a + b);
    EXPECT_EQ(KapNumeric(946, 1), a - b);
    EXPECT_EQ(KapNumeric(55055, 2), a * b);
    a += b;
    EXPECT_EQ(KapNumeric(1056, 1), a);
    a -= KapNumeric(56, 1);
    EXPECT_EQ(KapNumeric(100), a);
}

TEST(kapnumeric_conversion, test_convert_half_up)
{
    EXPECT_EQ("0.13", KapNumeric("0.125").convert<RoundType::half_up>(2).to_string());
    EXPECT_EQ("-0.13", KapNumeric("-0.125").convert<RoundType::half_up>(2).to_string());
    EXPECT_EQ("0.12", KapNumeric("0.1249").convert<RoundType::half_up>(2).to_string());
    EXPECT_EQ("5.00", KapNumeric(5).convert<RoundType::half_up>(2).to_string());
}

TEST(kapnumeric_conversion, test_convert_other_modes)
{
    KapNumeric value("2.345");
    EXPECT_EQ("2.34", value.convert<RoundType::bankers>(2).to_string());
    EXPECT_EQ("2.34", value.convert<RoundType::truncate>(2).to_string());
    EXPECT_EQ("2.35", value.convert<RoundType::ceiling>(2).to_string());
    EXPECT_EQ("-2.35", (-value).convert<RoundType::floor>(2).to_string());
    EXPECT_EQ("2.35", value.convert(2, RoundType::half_up).to_string());
    EXPECT_THROW(value.convert<RoundType::never>(2), std::domain_error);
    EXPECT_NO_THROW(value.convert<RoundType::never>(4));
}

TEST(kapnumeric_conversion, test_sigfigs_and_reduce)
{
    KapNumeric value("123.456789");
    EXPECT_EQ(9u, value.digits());
    EXPECT_EQ("123.457", value.convert_sigfigs<RoundType::half_up>(6).to_string());
    EXPECT_EQ("123.456789", value.convert_sigfigs<RoundType::half_up>(12).to_string());
    EXPECT_EQ("12.5", KapNumeric("12.5000").reduce().to_string());
    EXPECT_EQ("12.50", KapNumeric("12.5000").reduce(2).to_string());
}

TEST(kapnumeric_context, test_divide)
{
    KapNumericContext ctx;
    EXPECT_EQ("2.5", ctx.divide(KapNumeric(10), KapNumeric(4)).to_string());
    EXPECT_EQ("100.1", ctx.divide(KapNumeric(1001), KapNumeric(10)).to_string());
    EXPECT_EQ(KapNumeric("0.3333333333333333333333333333"),
              ctx.divide(KapNumeric(1), KapNumeric(3)));
    EXPECT_EQ(KapNumeric("119.9333333333333333333333333"),
              ctx.divide(KapNumeric(1799), KapNumeric(15)));
    EXPECT_EQ(KapNumeric("-0.5"), ctx.divide(KapNumeric(1), KapNumeric(-2)));
    EXPECT_THROW(ctx.divide(KapNumeric(1), KapNumeric()), std::underflow_error);
}

TEST(kapnumeric_context, test_precision_limits_products)
{
    KapNumericContext ctx;
    ctx.precision = 5;
    EXPECT_EQ(KapNumeric("1.2346"), ctx.multiply(KapNumeric("1.23456"), KapNumeric(1)));
    EXPECT_EQ(KapNumeric("123460"), ctx.add(KapNumeric(123456), KapNumeric(0)));
}

TEST(kapnumeric_context, test_quantize)
{
    KapNumericContext ctx;
    EXPECT_EQ("198.33", ctx.quantize_amount(KapNumeric("198.3333333")).to_string());
    EXPECT_EQ("49.17", ctx.quantize_amount(KapNumeric("49.1666666")).to_string());
    EXPECT_EQ("119.933333", ctx.quantize_unit(KapNumeric("119.93333333")).to_string());
    EXPECT_EQ("0.12345679", ctx.quantize_quantity(KapNumeric("0.123456789")).to_string());
    ctx.rounding = RoundType::bankers;
    EXPECT_EQ("0.12", ctx.quantize_amount(KapNumeric("0.125")).to_string());
}

TEST(kapnumeric_context, test_validate)
{
    KapNumericContext ctx;
    EXPECT_NO_THROW(ctx.validate());
    EXPECT_EQ(KapNumeric(1, 14), ctx.comparison_tolerance());
    ctx.precision = 0;
    EXPECT_THROW(ctx.validate(), std::invalid_argument);
    ctx.precision = 28;
    ctx.unit_places = -1;
    EXPECT_THROW(ctx.validate(), std::invalid_argument);
}

TEST(kapnumeric_context, test_round_type_names)
{
    EXPECT_EQ(RoundType::half_up, round_type_from_string("half-up"));
    EXPECT_EQ(RoundType::bankers, round_type_from_string("bankers"));
    EXPECT_STREQ("half-up", round_type_to_string(RoundType::half_up));
    EXPECT_THROW(round_type_from_string("nearest"), std::invalid_argument);
}
