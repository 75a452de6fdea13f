// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// It is licensed under the BSD license; see the file LICENSE.txt
// SPDX: BSD-3-Clause

#include <gtest/gtest.h>

#include <tfilm/tfilm.h>
#include <tfilm/filters.h>
#include <tfilm/paramdict.h>
#include <tfilm/util/math.h>
#include <tfilm/util/pstd.h>

#include <cmath>

using namespace tfilm;

TEST(Sinc, ZeroHandling) {
    Float x = 0;
    Float prev = 1;
    for (int i = 0; i < 10000; ++i) {
        Float cur = Sinc(x);
        EXPECT_LE(cur, prev);
        x = std::nextafter(x, Infinity);
        prev = cur;
    }
}

TEST(Filter, Box) {
    BoxFilter box;
    FilterHandle filter = &box;
    EXPECT_TRUE(filter.IsBox());
    EXPECT_TRUE(filter.IsNarrowBox());
    EXPECT_EQ(0.5, filter.Radius());
    EXPECT_EQ(1, filter.Evaluate(0.25));
    EXPECT_EQ(1, filter.Evaluate(-0.5));
    EXPECT_EQ(0, filter.Evaluate(0.75));
    EXPECT_EQ(1, filter.TapCount());
    EXPECT_EQ(0, filter.BorderSize());

    BoxFilter wide(1.5);
    filter = &wide;
    EXPECT_TRUE(filter.IsBox());
    EXPECT_FALSE(filter.IsNarrowBox());
    EXPECT_EQ(3, filter.TapCount());
    EXPECT_EQ(1, filter.BorderSize());
}

TEST(Filter, Triangle) {
    TriangleFilter tri(1.5);
    FilterHandle filter = &tri;
    EXPECT_FALSE(filter.IsBox());
    EXPECT_FLOAT_EQ(1, filter.Evaluate(0));
    EXPECT_FLOAT_EQ(1.f / 3.f, filter.Evaluate(1));
    EXPECT_FLOAT_EQ(1.f / 3.f, filter.Evaluate(-1));
    EXPECT_EQ(0, filter.Evaluate(1.5));
    EXPECT_EQ(0, filter.Evaluate(2));
    // The exact half-integer radius must not pick up a fourth tap.
    EXPECT_EQ(3, filter.TapCount());
    EXPECT_EQ(1, filter.BorderSize());
}

TEST(Filter, Gaussian) {
    GaussianFilter gauss(2, 0.5);
    FilterHandle filter = &gauss;
    EXPECT_EQ(4, filter.TapCount());
    EXPECT_EQ(2, filter.BorderSize());
    EXPECT_EQ(0, filter.Evaluate(2));
    EXPECT_GT(filter.Evaluate(0), filter.Evaluate(0.5));
    EXPECT_EQ(filter.Evaluate(0.7), filter.Evaluate(-0.7));
}

TEST(Filter, Mitchell) {
    MitchellFilter mitchell(2);
    FilterHandle filter = &mitchell;
    EXPECT_NEAR(0, filter.Evaluate(2), 1e-4);
    // B = C = 1/3 at the origin: (6 - 2B) / 6.
    EXPECT_FLOAT_EQ((6 - 2.f / 3.f) / 6, filter.Evaluate(0));
}

TEST(Filter, LanczosSinc) {
    LanczosSincFilter sinc(3, 3);
    FilterHandle filter = &sinc;
    EXPECT_FLOAT_EQ(1, filter.Evaluate(0));
    EXPECT_NEAR(0, filter.Evaluate(1), 1e-6);
    EXPECT_EQ(0, filter.Evaluate(3.5));
    EXPECT_EQ(6, filter.TapCount());
    EXPECT_EQ(3, filter.BorderSize());
}

TEST(Filter, Function) {
    FunctionFilter f(1, [](Float x) { return 1 - std::abs(x); });
    FilterHandle filter = &f;
    EXPECT_FALSE(filter.IsBox());
    EXPECT_EQ(1, filter.Evaluate(0));
    EXPECT_EQ(0, filter.Evaluate(1.25));
}

TEST(Filter, Create) {
    pstd::pmr::polymorphic_allocator<pstd::byte> alloc;

    ParameterDictionary dict;
    dict.AddFloat("sigma", {1.f});
    FilterHandle filter = FilterHandle::Create("gaussian", dict, nullptr, alloc);
    ASSERT_TRUE(filter.Is<GaussianFilter>());
    EXPECT_EQ(1, filter.Cast<GaussianFilter>()->Sigma());
    EXPECT_EQ(4, filter.Radius());

    ParameterDictionary triDict;
    FilterHandle tri = FilterHandle::Create("triangle", triDict, nullptr, alloc);
    ASSERT_TRUE(tri.Is<TriangleFilter>());
    EXPECT_EQ(1, tri.Radius());

    ParameterDictionary boxDict;
    boxDict.AddFloat("radius", {1.5f});
    FilterHandle box = FilterHandle::Create("box", boxDict, nullptr, alloc);
    EXPECT_TRUE(box.IsBox());
    EXPECT_EQ(1.5, box.Radius());

    alloc.delete_object(filter.Cast<GaussianFilter>());
    alloc.delete_object(tri.Cast<TriangleFilter>());
    alloc.delete_object(box.Cast<BoxFilter>());
}

TEST(Filter, CreateErrors) {
    pstd::pmr::polymorphic_allocator<pstd::byte> alloc;
    ParameterDictionary dict;
    EXPECT_EXIT(FilterHandle::Create("lanczos", dict, nullptr, alloc),
                ::testing::ExitedWithCode(1), "filter type unknown");

    ParameterDictionary misspelled;
    misspelled.AddFloat("sgima", {1.f});
    EXPECT_EXIT(FilterHandle::Create("gaussian", misspelled, nullptr, alloc),
                ::testing::ExitedWithCode(1), "unused parameter");

    ParameterDictionary negative;
    negative.AddFloat("radius", {-1.f});
    EXPECT_EXIT(FilterHandle::Create("triangle", negative, nullptr, alloc),
                ::testing::ExitedWithCode(1), "must be positive");
}
