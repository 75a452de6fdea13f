// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// It is licensed under the BSD license; see the file LICENSE.txt
// SPDX: BSD-3-Clause

#include <gtest/gtest.h>

#include <tfilm/tfilm.h>
#include <tfilm/util/color.h>
#include <tfilm/util/math.h>
#include <tfilm/util/print.h>
#include <tfilm/util/pstd.h>

#include <double-conversion/double-conversion.h>

#include <cmath>
#include <sstream>
#include <string>
#include <vector>

using namespace tfilm;

TEST(StringPrintf, Basics) {
    EXPECT_EQ(StringPrintf("Hello, world"), "Hello, world");
    EXPECT_EQ(StringPrintf("x = %d", 5), "x = 5");
    EXPECT_EQ(StringPrintf("%f, %f, %f", 1., 1.5, -8.125), "1, 1.5, -8.125");
    EXPECT_DEATH(StringPrintf("not enough %s"), "Check failed:");
}

TEST(StringPrintf, FancyPctS) {
    EXPECT_EQ(StringPrintf("%s", false), "false");
    EXPECT_EQ(StringPrintf("%s", true), "true");
    EXPECT_EQ(StringPrintf("%s", RGB(1, 0.5, -0.25)), "[ 1 0.5 -0.25 ]");

    std::string s = "string";
    EXPECT_EQ(StringPrintf("%d %s", 1, s), "1 string");

    std::vector<int> v = {1, 2, 3, 4};
    EXPECT_EQ(StringPrintf("%s", v), "[ 1, 2, 3, 4 ]");

    pstd::array<int, 3> a = {7, -1, 0};
    EXPECT_EQ(StringPrintf("%s", a), "[ 7, -1, 0 ]");
}

TEST(StringPrintf, FancyPctD) {
    EXPECT_EQ(StringPrintf("%d", 1u), "1");
    EXPECT_EQ(StringPrintf("%d", 0xffffffffu), "4294967295");

    // > 4G
    EXPECT_EQ(StringPrintf("%d", size_t(100000000000)), "100000000000");

    uint64_t ubig = ~0ull;
    EXPECT_EQ(StringPrintf("%d", ubig), "18446744073709551615");

    int64_t ibig = ubig >> 1;
    EXPECT_EQ(StringPrintf("%d", ibig), "9223372036854775807");
}

TEST(StringPrintf, Precision) {
    double_conversion::StringToDoubleConverter floatParser(
        double_conversion::StringToDoubleConverter::ALLOW_HEX,
        0. /* empty string value */, 0. /* junk string value */,
        nullptr /* infinity symbol */, nullptr /* NaN symbol */);

    std::string pi = StringPrintf("%f", float(Pi));
    int length;
    float val = floatParser.StringToFloat(pi.data(), pi.size(), &length);
    EXPECT_NE(0, length);
    EXPECT_EQ(val, float(Pi));

    std::string e = StringPrintf("%f", std::exp(1.));
    double dval = floatParser.StringToDouble(e.data(), e.size(), &length);
    EXPECT_NE(0, length);
    EXPECT_EQ(dval, std::exp(1.));
}

TEST(OperatorLeftShiftPrint, Basics) {
    std::ostringstream os;
    os << RGB(0, 1.25, -9.25);
    EXPECT_EQ("[ 0 1.25 -9.25 ]", os.str());
}
