#include <catch2/catch.hpp>

#include "../src/realfloat.h"

#include "test_util.h"

#include <limits>
#include <stdexcept>
#include <string>

using namespace realfloat;

//==================================================================================================
// Generic
//==================================================================================================

TEST_CASE("Generic - float")
{
    CHECK(FloatDecimal(12.345f) == "12.345");
    CHECK(FloatDecimal(1.0f) == "1.0");
    CHECK(FloatDecimal(-1.5f) == "-1.5");
    CHECK(FloatDecimal(1.0e23f) == "1.0e23");
    CHECK(FloatDecimal(0.1f) == "0.1");
    CHECK(FloatDecimal(0.01f) == "1.0e-2");
    CHECK(FloatDecimal(1234567.0f) == "1234567.0");
    CHECK(FloatDecimal(1.0e7f) == "1.0e7");
    CHECK(FloatDecimal(std::numeric_limits<float>::max()) == "3.4028235e38");
    CHECK(FloatDecimal(std::numeric_limits<float>::denorm_min()) == "1.0e-45");
}

TEST_CASE("Generic - double")
{
    CHECK(DoubleDecimal(0.1) == "0.1");
    CHECK(DoubleDecimal(1.0e7) == "1.0e7");
    CHECK(DoubleDecimal(1234567.0) == "1234567.0");
    CHECK(DoubleDecimal(0.01) == "1.0e-2");
    CHECK(DoubleDecimal(5.0e-324) == "5.0e-324");
    CHECK(DoubleDecimal(std::numeric_limits<double>::max()) == "1.7976931348623157e308");
    CHECK(DoubleDecimal(-std::numeric_limits<double>::min()) == "-2.2250738585072014e-308");
    CHECK(DoubleDecimal(123456.789) == "123456.789");
}

TEST_CASE("Generic - boundary policy")
{
    // The exact value of 1e23 is a boundary of the rounding interval of the nearest double.
    CHECK(DoubleDecimal(1.0e23) == "9.999999999999999e22");

    FloatFormat format = Generic();
    format.bounds = IntervalBounds::inclusive;
    CHECK(FormatDouble(format, 1.0e23) == "1.0e23");
}

TEST_CASE("Generic - special values")
{
    CHECK(FloatDecimal(0.0f) == "0.0");
    CHECK(FloatDecimal(-0.0f) == "-0.0");
    CHECK(DoubleDecimal(-0.0) == "-0.0");
    CHECK(DoubleDecimal(std::numeric_limits<double>::infinity()) == "Infinity");
    CHECK(DoubleDecimal(-std::numeric_limits<double>::infinity()) == "-Infinity");
    CHECK(DoubleDecimal(std::numeric_limits<double>::quiet_NaN()) == "NaN");
    CHECK(DoubleDecimal(-std::numeric_limits<double>::quiet_NaN()) == "NaN");
    CHECK(FloatDecimal(std::numeric_limits<float>::quiet_NaN()) == "NaN");
}

TEST_CASE("Generic - thresholds")
{
    const FloatFormat format = Generic(-3, 21);
    CHECK(FormatDouble(format, 1.0e-4) == "0.0001");
    CHECK(FormatDouble(format, 1.0e-5) == "1.0e-5");
    CHECK(FormatDouble(format, 1.0e20) == "100000000000000000000.0");
    CHECK(FormatDouble(format, 1.0e21) == "1.0e21");

    // A single point
    const FloatFormat one = Generic(1, 1);
    CHECK(FormatDouble(one, 1.5) == "1.5");
    CHECK(FormatDouble(one, 15.0) == "1.5e1");
    CHECK(FormatDouble(one, 0.15) == "1.5e-1");

    CHECK_THROWS_AS(Generic(1, 0), std::invalid_argument);
}

//==================================================================================================
// Fixed
//==================================================================================================

TEST_CASE("Fixed - shortest digits")
{
    const FloatFormat format = FixedDefaultPrecision();
    CHECK(FormatFloat(format, 0.012345f) == "0.012345");
    CHECK(FormatDouble(format, 1.0e-5) == "0.00001");
    CHECK(FormatDouble(format, 1.0e21) == "1000000000000000000000.0");
    CHECK(FormatDouble(format, 123456.789) == "123456.789");
    CHECK(FormatDouble(format, -2.5) == "-2.5");
    CHECK(FormatDouble(format, 0.0) == "0.0");
    CHECK(FormatDouble(format, -0.0) == "-0.0");
}

TEST_CASE("Fixed - precision")
{
    CHECK(FormatFloat(Fixed(1), 0.012345f) == "0.0");
    CHECK(FormatFloat(Fixed(10), 0.012345f) == "0.0123450000");
    CHECK(FormatFloat(Fixed(2), 12.345f) == "12.34");
    CHECK(FormatFloat(Fixed(0), 12.345f) == "12");
    CHECK(FormatDouble(Fixed(5), 123.456) == "123.45600");
    CHECK(FormatDouble(Fixed(1), 1.0e10) == "10000000000.0");
    CHECK(FormatDouble(Fixed(1), -0.012) == "-0.0");
}

TEST_CASE("Fixed - rounds half to even on the decimal digits")
{
    CHECK(FormatDouble(Fixed(0), 0.5) == "0");
    CHECK(FormatDouble(Fixed(0), 1.5) == "2");
    CHECK(FormatDouble(Fixed(0), 2.5) == "2");
    CHECK(FormatDouble(Fixed(0), 3.5) == "4");
    CHECK(FormatDouble(Fixed(0), 0.51) == "1");
    CHECK(FormatDouble(Fixed(1), 0.25) == "0.2");
    CHECK(FormatDouble(Fixed(1), 0.35) == "0.4");
    // The shortest digits of 2.675 are "2675", the binary value is slightly below.
    CHECK(FormatDouble(Fixed(2), 2.675) == "2.68");
}

TEST_CASE("Fixed - carry")
{
    CHECK(FormatDouble(Fixed(1), 0.96) == "1.0");
    CHECK(FormatDouble(Fixed(2), 0.0096) == "0.01");
    CHECK(FormatDouble(Fixed(2), 9.995) == "10.00");
    CHECK(FormatDouble(Fixed(0), 9.5) == "10");
    CHECK(FormatDouble(Fixed(0), 99.9) == "100");
    CHECK(FormatDouble(Fixed(3), 0.0009996) == "0.001");
}

TEST_CASE("Fixed - special values")
{
    CHECK(FormatDouble(Fixed(0), 0.0) == "0");
    CHECK(FormatDouble(Fixed(0), -0.0) == "-0");
    CHECK(FormatDouble(Fixed(3), 0.0) == "0.000");
    CHECK(FormatDouble(Fixed(3), -0.0) == "-0.000");
    CHECK(FormatFloat(Fixed(3), std::numeric_limits<float>::infinity()) == "Infinity");
    CHECK(FormatFloat(Fixed(3), -std::numeric_limits<float>::infinity()) == "-Infinity");
    CHECK(FormatFloat(Fixed(3), std::numeric_limits<float>::quiet_NaN()) == "NaN");

    CHECK_THROWS_AS(Fixed(-1), std::invalid_argument);
}

//==================================================================================================
// Scientific
//==================================================================================================

TEST_CASE("Scientific")
{
    const FloatFormat format = Scientific();
    CHECK(FormatFloat(format, 12.345f) == "1.2345e1");
    CHECK(FormatDouble(format, 1.0) == "1.0e0");
    CHECK(FormatDouble(format, -0.001) == "-1.0e-3");
    CHECK(FormatDouble(format, 5.0e-324) == "5.0e-324");
    CHECK(FormatDouble(format, 0.0) == "0.0e0");
    CHECK(FormatDouble(format, -0.0) == "-0.0e0");
    CHECK(FormatDouble(format, std::numeric_limits<double>::infinity()) == "Infinity");
}

TEST_CASE("Scientific - precision")
{
    CHECK(FormatDouble(Scientific(2), 12.345) == "1.23e1");
    CHECK(FormatDouble(Scientific(1), 9.99) == "1.0e1");
    CHECK(FormatDouble(Scientific(0), 1.0) == "1e0");
    CHECK(FormatDouble(Scientific(3), 123456.0) == "1.235e5");
    CHECK(FormatDouble(Scientific(5), 1.5) == "1.50000e0");
    CHECK(FormatDouble(Scientific(0), 0.0) == "0e0");
    CHECK(FormatDouble(Scientific(2), 0.0) == "0.00e0");

    CHECK_THROWS_AS(Scientific(-1), std::invalid_argument);
}

TEST_CASE("Scientific - zero padded exponent")
{
    const FloatFormat single = ScientificZeroPaddedExponent<float>();
    CHECK(FormatFloat(single, 1.0e-5f) == "1.0e-05");
    CHECK(FormatFloat(single, 1.0e30f) == "1.0e30");
    CHECK(FormatFloat(single, 0.0f) == "0.0e00");
    CHECK(FormatFloat(single, -0.0f) == "-0.0e00");

    const FloatFormat dbl = ScientificZeroPaddedExponent<double>();
    CHECK(FormatDouble(dbl, 1.0e5) == "1.0e005");
    CHECK(FormatDouble(dbl, 1.0e-300) == "1.0e-300");
    CHECK(FormatDouble(dbl, 0.0) == "0.0e000");
    CHECK(FormatDouble(dbl, -0.0) == "-0.0e000");
}

TEST_CASE("Scientific - zero padded exponent keeps the width of the builder")
{
    // The width is part of the format, not of the rendered type.
    const FloatFormat single = ScientificZeroPaddedExponent<float>();
    CHECK(FormatDouble(single, 0.0) == "0.0e00");
    CHECK(FormatDouble(single, 1.0) == "1.0e00");
    CHECK(FormatDouble(single, 1.0e-5) == "1.0e-05");
    CHECK(FormatDouble(single, 1.0e300) == "1.0e300");

    const FloatFormat dbl = ScientificZeroPaddedExponent<double>();
    CHECK(FormatFloat(dbl, 0.0f) == "0.0e000");
    CHECK(FormatFloat(dbl, 1.0f) == "1.0e000");
    CHECK(FormatFloat(dbl, 1.0e30f) == "1.0e030");

    // Without an explicit width the rendered type decides.
    FloatFormat format = Scientific();
    format.zero_pad_exponent = true;
    CHECK(FormatFloat(format, 1.0e5f) == "1.0e05");
    CHECK(FormatDouble(format, 1.0e5) == "1.0e005");

    format = Scientific(2);
    format.zero_pad_exponent = true;
    format.exponent_width = 2;
    CHECK(FormatDouble(format, 12.345) == "1.23e01");
}

TEST_CASE("Scientific - explicit exponent sign")
{
    const FloatFormat format = ScientificExplicitExponentSign();
    CHECK(FormatDouble(format, 1.0e5) == "1.0e+5");
    CHECK(FormatDouble(format, 1.0e-5) == "1.0e-5");
    CHECK(FormatDouble(format, 1.0) == "1.0e+0");
    CHECK(FormatDouble(format, 0.0) == "0.0e+0");
    CHECK(FormatDouble(format, -0.0) == "-0.0e+0");

    FloatFormat padded = ScientificZeroPaddedExponent<double>();
    padded.explicit_exponent_sign = true;
    CHECK(FormatDouble(padded, 1.0e300) == "1.0e+300");
    CHECK(FormatDouble(padded, 1.0e3) == "1.0e+003");
}

TEST_CASE("Scientific - exponent character")
{
    FloatFormat format = Scientific();
    format.exponent_char = 'E';
    CHECK(FormatFloat(format, 12.345f) == "1.2345E1");

    format = Scientific(2);
    format.exponent_char = 'x';
    CHECK(FormatDouble(format, 12.345) == "1.23x1");
}

//==================================================================================================
// Shortest
//==================================================================================================

TEST_CASE("Shortest")
{
    const FloatFormat format = Shortest();
    CHECK(FormatDouble(format, 1.0) == "1");
    CHECK(FormatDouble(format, -7.0) == "-7");
    CHECK(FormatDouble(format, 100.0) == "100");
    CHECK(FormatDouble(format, 1000.0) == "1000");
    CHECK(FormatDouble(format, 12000.0) == "12000");
    CHECK(FormatDouble(format, 12300000.0) == "12300000");
    CHECK(FormatDouble(format, 1.0e7) == "1.0e7");
    CHECK(FormatDouble(format, 1.0e21) == "1.0e21");
    CHECK(FormatDouble(format, 123.456) == "123.456");
    CHECK(FormatDouble(format, 0.001) == "0.001");
    CHECK(FormatDouble(format, 0.0001) == "0.0001");
    CHECK(FormatDouble(format, 0.0012) == "0.0012");
    CHECK(FormatDouble(format, 0.00012) == "0.00012");
    CHECK(FormatDouble(format, 1.0e-5) == "1.0e-5");
    CHECK(FormatDouble(format, 1.5e-5) == "1.5e-5");
    CHECK(FormatDouble(format, 1.25e-7) == "1.25e-7");
}

TEST_CASE("Shortest - integers are printed exactly")
{
    const FloatFormat format = Shortest();

    // Shortest digits 1152921504606847 * 10^3
    CHECK(FormatDouble(format, 1152921504606846976.0) == "1152921504606846976");
    CHECK(FormatDouble(format, -1152921504606846976.0) == "-1152921504606846976");
    // 2^64 - 2048
    CHECK(FormatDouble(format, 18446744073709549568.0) == "18446744073709549568");
    CHECK(FormatDouble(format, 1099511627776.0) == "1099511627776");

    // Shortest digits 12345679 * 10^1
    CHECK(FormatFloat(format, 123456792.0f) == "123456792");
    // 2^32 - 256
    CHECK(FormatFloat(format, 4294967040.0f) == "4294967040");
    CHECK(FormatFloat(format, 1000.0f) == "1000");

    // Integers which do not fit into 64 (32) bits are printed as the shortest digits followed by
    // zeros.
    CHECK(FormatDouble(format, 1180591620717411303424.0) == "1180591620717411300000");
    CHECK(FormatFloat(format, 1099511627776.0f) == "1099511600000");
}

TEST_CASE("Shortest - special values")
{
    const FloatFormat format = Shortest();
    CHECK(FormatDouble(format, 0.0) == "0");
    CHECK(FormatDouble(format, -0.0) == "-0");
    CHECK(FormatDouble(format, std::numeric_limits<double>::infinity()) == "Inf");
    CHECK(FormatDouble(format, -std::numeric_limits<double>::infinity()) == "-Inf");
    CHECK(FormatFloat(format, std::numeric_limits<float>::quiet_NaN()) == "NaN");
}

//==================================================================================================
// Output buffer
//==================================================================================================

TEST_CASE("Append - appends to the existing contents")
{
    std::string str = "x = ";
    AppendDouble(str, Generic(), 0.5);
    CHECK(str == "x = 0.5");

    str += ", y = ";
    AppendFloat(str, Scientific(), -1.0e-10f);
    CHECK(str == "x = 0.5, y = -1.0e-10");

    str += ", z = ";
    AppendDouble(str, Fixed(30), 1.0e-20);
    CHECK(str == "x = 0.5, y = -1.0e-10, z = 0.000000000000000000010000000000");

    str += ", w = ";
    AppendDouble(str, Generic(), std::numeric_limits<double>::quiet_NaN());
    CHECK(str == "x = 0.5, y = -1.0e-10, z = 0.000000000000000000010000000000, w = NaN");
}

TEST_CASE("Append - long outputs")
{
    std::string str;
    AppendDouble(str, FixedDefaultPrecision(), std::numeric_limits<double>::max());
    CHECK(str == "17976931348623157" + std::string(292, '0') + ".0");

    str.clear();
    AppendDouble(str, FixedDefaultPrecision(), -std::numeric_limits<double>::denorm_min());
    CHECK(str.size() == 1 + 2 + 323 + 1);
    CHECK(str.compare(0, 4, "-0.0") == 0);
    CHECK(str.back() == '5');
}

//==================================================================================================
// Custom special strings
//==================================================================================================

TEST_CASE("SpecialStrings - can be replaced")
{
    FloatFormat format = Generic();
    format.specials.nan = "nan";
    format.specials.positive_infinity = "+inf";
    format.specials.negative_infinity = "-inf";
    format.specials.positive_zero = "zero";
    format.specials.negative_zero = "minus zero";

    CHECK(FormatDouble(format, std::numeric_limits<double>::quiet_NaN()) == "nan");
    CHECK(FormatDouble(format, std::numeric_limits<double>::infinity()) == "+inf");
    CHECK(FormatDouble(format, -std::numeric_limits<double>::infinity()) == "-inf");
    CHECK(FormatDouble(format, 0.0) == "zero");
    CHECK(FormatDouble(format, -0.0) == "minus zero");
    CHECK(FormatDouble(format, 2.0) == "2.0");
}
