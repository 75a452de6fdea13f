// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// It is licensed under the BSD license; see the file LICENSE.txt
// SPDX: BSD-3-Clause

#include <gtest/gtest.h>

#include <tfilm/tfilm.h>
#include <tfilm/filters.h>
#include <tfilm/paramdict.h>
#include <tfilm/transientblock.h>
#include <tfilm/util/arraynd.h>
#include <tfilm/util/color.h>
#include <tfilm/util/float.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <random>
#include <vector>

using namespace tfilm;

static std::vector<double> channelSums(const ArrayND<Float> &raw) {
    int nc = raw.Shape().back();
    std::vector<double> sums(nc, 0.);
    int64_t i = 0;
    for (Float v : raw)
        sums[i++ % nc] += v;
    return sums;
}

TEST(TransientBlock, EndToEnd) {
    BoxFilter box;
    TransientBlock block({4, 4, 3}, {&box}, 3);

    const Float position[2] = {1.5f, 2.5f};
    const Float values[2] = {2, 1};
    EXPECT_TRUE(block.Put(position, 1.5f, values));

    ArrayND<Float> image = block.Develop();
    EXPECT_EQ(std::vector<int>({4, 4, 3, 2}), image.Shape());
    for (int x = 0; x < 4; ++x)
        for (int y = 0; y < 4; ++y)
            for (int t = 0; t < 3; ++t) {
                bool hit = (x == 1 && y == 2 && t == 1);
                EXPECT_EQ(hit ? 2 : 0, image(x, y, t, 0));
                EXPECT_EQ(hit ? 1 : 0, image(x, y, t, 1));
            }
}

TEST(TransientBlock, Conservation) {
    BoxFilter box;
    TransientBlock block({8, 6, 5}, {&box}, 3);

    std::mt19937 rng(1);
    std::uniform_real_distribution<float> u(0.f, 1.f);
    double expected[2] = {0, 0};
    const int nSamples = 500;
    for (int i = 0; i < nSamples; ++i) {
        const Float c[3] = {8 * u(rng), 6 * u(rng), 5 * u(rng)};
        const Float v[2] = {Float(i % 4) * 0.25f, 1.5f};
        block.Put(c, v);
        expected[0] += v[0];
        expected[1] += v[1];
    }

    std::vector<double> sums = channelSums(block.Develop(false, true));
    EXPECT_EQ(expected[0], sums[0]);
    EXPECT_EQ(expected[1], sums[1]);
    EXPECT_EQ(nSamples, sums[2]);
}

TEST(TransientBlock, NormalizedConservation) {
    TriangleFilter tri(1.5);
    GaussianFilter gauss(2, 0.5);
    TransientBlock block({10, 10, 10}, {&tri, &tri, &gauss}, 2, true, true);

    // Interior samples distribute a total weight of one.
    const Float c[3] = {4.3f, 5.5f, 6.8f};
    const Float v[1] = {3};
    block.Put(c, v);

    std::vector<double> sums = channelSums(block.Develop(false, true));
    EXPECT_NEAR(3, sums[0], 1e-5);
    EXPECT_NEAR(1, sums[1], 1e-5);
}

TEST(TransientBlock, TriangleWeights) {
    TriangleFilter tri(1.5);
    const Float c[1] = {2.5f};
    const Float v[1] = {3};

    TransientBlock block({5}, {&tri}, 2);
    EXPECT_EQ(1, block.Geometry().MaxBorderSize(0));
    block.Put(c, v);
    ArrayND<Float> raw = block.Develop(false, true);
    EXPECT_EQ(std::vector<int>({7, 2}), raw.Shape());
    // Logical cells 1, 2, 3 are buffer cells 2, 3, 4.
    EXPECT_EQ(0, raw(1, 1));
    EXPECT_FLOAT_EQ(1.f / 3.f, raw(2, 1));
    EXPECT_FLOAT_EQ(1, raw(3, 1));
    EXPECT_FLOAT_EQ(1.f / 3.f, raw(4, 1));
    EXPECT_EQ(0, raw(5, 1));
    EXPECT_FLOAT_EQ(1, raw(2, 0));
    EXPECT_FLOAT_EQ(3, raw(3, 0));

    TransientBlock normalized({5}, {&tri}, 2, true, true);
    normalized.Put(c, v);
    raw = normalized.Develop(false, true);
    EXPECT_FLOAT_EQ(0.2f, raw(2, 1));
    EXPECT_FLOAT_EQ(0.6f, raw(3, 1));
    EXPECT_FLOAT_EQ(0.2f, raw(4, 1));

    ArrayND<Float> image = normalized.Develop();
    EXPECT_EQ(std::vector<int>({5, 1}), image.Shape());
    EXPECT_EQ(0, image(0, 0));
    EXPECT_FLOAT_EQ(3, image(1, 0));
    EXPECT_FLOAT_EQ(3, image(2, 0));
    EXPECT_FLOAT_EQ(3, image(3, 0));
    EXPECT_EQ(0, image(4, 0));
}

TEST(TransientBlock, WideBox) {
    BoxFilter box(1);
    TransientBlock block({4}, {&box}, 2);
    const Float c[1] = {1.5f};
    const Float v[1] = {1};
    block.Put(c, v);

    ArrayND<Float> image = block.Develop();
    EXPECT_EQ(0, image(0, 0));
    EXPECT_EQ(1, image(1, 0));
    EXPECT_EQ(1, image(2, 0));
    EXPECT_EQ(0, image(3, 0));
    EXPECT_EQ(2, channelSums(block.Develop(false, true))[1]);
}

TEST(TransientBlock, OrderIndependence) {
    TriangleFilter tri(1.5);
    GaussianFilter gauss(2, 0.5);
    const FilterHandle filters[3] = {&tri, &tri, &gauss};
    const int dims[3] = {6, 5, 8};

    std::mt19937 rng(7);
    std::uniform_real_distribution<float> u(-1.f, 9.f);
    SampleBatch batch(3, 3);
    for (int i = 0; i < 300; ++i) {
        const Float c[3] = {u(rng), u(rng), u(rng)};
        const Float v[3] = {u(rng), 1, Float(i % 7)};
        batch.Add(c, v, i % 5 != 0);
    }
    EXPECT_EQ(300u, batch.size());

    TransientBlock forward(dims, filters, 4);
    for (size_t i = 0; i < batch.size(); ++i)
        EXPECT_EQ(batch.Active(i), forward.Put(batch.Coords(i), batch.Values(i),
                                               batch.Active(i)));

    TransientBlock backward(dims, filters, 4);
    for (size_t i = batch.size(); i > 0; --i)
        backward.Put(batch.Coords(i - 1), batch.Values(i - 1), batch.Active(i - 1));

    TransientBlock parallel(dims, filters, 4);
    parallel.PutBatch(batch);

    ArrayND<Float> a = forward.Develop(false, true);
    ArrayND<Float> b = backward.Develop(false, true);
    ArrayND<Float> c = parallel.Develop(false, true);
    ASSERT_EQ(a.Shape(), b.Shape());
    ASSERT_EQ(a.Shape(), c.Shape());
    for (int64_t i = 0; i < a.size(); ++i) {
        Float tol = 1e-5f * std::max<Float>(1, std::abs(a.begin()[i]));
        EXPECT_NEAR(a.begin()[i], b.begin()[i], tol);
        EXPECT_NEAR(a.begin()[i], c.begin()[i], tol);
    }
}

TEST(TransientBlock, BatchPositionTime) {
    BoxFilter box;
    TransientBlock block({4, 4, 3}, {&box}, 3);

    SampleBatch batch(3, 2);
    const Float position[2] = {1.5f, 2.5f};
    const Float values[2] = {2, 1};
    batch.Add(position, 1.5f, values);
    batch.Add(position, 2.5f, values, false);
    EXPECT_EQ(3u, batch.Coords(0).size());
    EXPECT_EQ(1.5f, batch.Coords(0)[2]);
    EXPECT_FALSE(batch.Active(1));

    block.PutBatch(batch);
    ArrayND<Float> image = block.Develop();
    EXPECT_EQ(2, image(1, 2, 1, 0));
    EXPECT_EQ(1, image(1, 2, 1, 1));
    EXPECT_EQ(0, image(1, 2, 2, 0));
}

TEST(TransientBlock, InactiveAndOutOfBounds) {
    BoxFilter box;
    TransientBlock block({4, 4}, {&box}, 2);
    const Float v[1] = {5};

    const Float inside[2] = {1, 1};
    EXPECT_FALSE(block.Put(inside, v, false));

    const Float outside[2] = {-0.5f, 1};
    EXPECT_TRUE(block.Put(outside, v));
    const Float beyond[2] = {2, 4};
    EXPECT_TRUE(block.Put(beyond, v));

    for (Float value : block.Develop(false, true))
        EXPECT_EQ(0, value);
}

TEST(TransientBlock, FarAndNaNSamples) {
    BoxFilter box;
    TriangleFilter tri(1.5);
    const Float v[2] = {1, 2};
    const Float distant[3] = {3e9f, -3e9f, 1e30f};
    const Float nonFinite[3] = {std::numeric_limits<Float>::quiet_NaN(), Infinity,
                                -Infinity};

    // All-box blocks take the single-cell path, triangles the separable one.
    TransientBlock boxBlock({4, 4, 3}, {&box}, 3);
    TransientBlock triBlock({4, 4, 3}, {&tri}, 3);
    for (TransientBlock *block : {&boxBlock, &triBlock}) {
        for (Float x : distant) {
            const Float position[2] = {x, 1.5f};
            EXPECT_TRUE(block->Put(position, 1.5f, v));
            const Float late[2] = {1.5f, 1.5f};
            EXPECT_TRUE(block->Put(late, x, v));
        }
        for (Float x : nonFinite) {
            const Float position[2] = {1.5f, x};
            EXPECT_TRUE(block->Put(position, 1.5f, v));
            EXPECT_FALSE(block->Put(position, 1.5f, v, false));
        }
        for (Float value : block->Develop(false, true))
            EXPECT_EQ(0, value);
    }
}

TEST(TransientBlock, ZeroWeightDevelopsToZero) {
    TriangleFilter tri(1);
    TransientBlock block({6}, {&tri}, 3);
    const Float c[1] = {1.5f};
    const Float v[2] = {4, -2};
    block.Put(c, v);

    ArrayND<Float> image = block.Develop();
    for (int x = 0; x < 6; ++x) {
        bool touched = (x == 1);
        EXPECT_EQ(touched ? 4 : 0, image(x, 0));
        EXPECT_EQ(touched ? -2 : 0, image(x, 1));
        EXPECT_FALSE(std::isnan(image(x, 0)));
    }
}

TEST(TransientBlock, CropShape) {
    GaussianFilter gauss(2, 0.5);
    TransientBlock block({4, 5, 3}, {&gauss}, 4);

    ArrayND<Float> raw = block.Develop(false, true);
    ArrayND<Float> image = block.Develop();
    EXPECT_EQ(std::vector<int>({8, 9, 7, 4}), raw.Shape());
    EXPECT_EQ(std::vector<int>({4, 5, 3, 3}), image.Shape());
    for (int i = 0; i < 3; ++i)
        EXPECT_EQ(raw.Shape()[i] - 2 * block.Geometry().MaxBorderSize(i),
                  image.Shape()[i]);
    EXPECT_EQ(8 * 9 * 7 * 4, block.BufferSize());
}

TEST(TransientBlock, ProgressiveShrink) {
    BoxFilter box;
    GaussianFilter wide(8, 2), narrow(2, 0.5);
    const int dims[3] = {4, 4, 6};
    const Float position[2] = {1.5f, 2.5f};
    const Float v[1] = {7};

    TransientBlock block(dims, {&box, &box, &wide}, 2);
    int64_t size = block.BufferSize();
    block.Put(position, 3.5f, v);

    const FilterHandle narrowFilters[3] = {&box, &box, &narrow};
    block.Configure(dims, narrowFilters);
    EXPECT_EQ(size, block.BufferSize());
    EXPECT_EQ(6, block.Geometry().OriginShift(2));
    // Reconfiguration clears previous samples.
    for (Float value : block.Develop(false, true))
        EXPECT_EQ(0, value);

    block.Put(position, 3.5f, v);
    TransientBlock fresh(dims, narrowFilters, 2);
    fresh.Put(position, 3.5f, v);

    ArrayND<Float> a = block.Develop();
    ArrayND<Float> b = fresh.Develop();
    ASSERT_EQ(a.Shape(), b.Shape());
    for (int64_t i = 0; i < a.size(); ++i)
        EXPECT_FLOAT_EQ(b.begin()[i], a.begin()[i]);

    for (int t = 0; t < 6; ++t) {
        bool touched = (t >= 2 && t <= 4);
        EXPECT_FLOAT_EQ(touched ? 7 : 0, a(1, 2, t, 0));
    }
}

TEST(TransientBlock, ShrunkBorderStaysEmpty) {
    BoxFilter box;
    GaussianFilter wide(8, 2), narrow(2, 0.5);
    const int dims[3] = {4, 4, 6};
    const FilterHandle narrowFilters[3] = {&box, &box, &narrow};

    TransientBlock block(dims, {&box, &box, &wide}, 2);
    block.Configure(dims, narrowFilters);
    ASSERT_EQ(6, block.Geometry().WindowStart(2));

    // Buffer-local time 6.5: the support spans raw cells 5..8, but cell 5
    // lies in the border the narrow filter no longer uses.
    const Float position[2] = {1.5f, 2.5f};
    const Float v[1] = {1};
    block.Put(position, -1, v);

    ArrayND<Float> raw = block.Develop(false, true);
    EXPECT_EQ(0, raw(1, 2, 5, 1));
    EXPECT_GT(raw(1, 2, 6, 1), 0);
    EXPECT_GT(raw(1, 2, 7, 1), 0);
}

TEST(TransientBlock, Offset) {
    BoxFilter box;
    TransientBlock block({4, 4}, {&box}, 2);
    const int offset[2] = {2, 0};
    block.SetOffset(offset);
    EXPECT_EQ(2, block.Offset(0));

    const Float c[2] = {3.5f, 1.5f};
    const Float v[1] = {1};
    block.Put(c, v);
    ArrayND<Float> image = block.Develop();
    EXPECT_EQ(1, image(1, 1, 0));
    EXPECT_EQ(0, image(3, 1, 0));
}

TEST(TransientBlock, TransferCurve) {
    BoxFilter box;
    TransientBlock block({2}, {&box}, 3);
    const Float c[1] = {0.5f};
    const Float v[2] = {0.5f, 0.001f};
    block.Put(c, v);

    ArrayND<Float> image = block.Develop(true);
    EXPECT_FLOAT_EQ(LinearToSRGBFull(0.5f), image(0, 0));
    EXPECT_FLOAT_EQ(LinearToSRGBFull(0.001f), image(0, 1));
    EXPECT_EQ(0, image(1, 0));
}

TEST(TransientBlock, Clear) {
    BoxFilter box;
    TransientBlock block({3}, {&box}, 2);
    const Float c[1] = {1};
    const Float v[1] = {1};
    block.Put(c, v);
    block.Clear();
    for (Float value : block.Develop(false, true))
        EXPECT_EQ(0, value);
}

TEST(TransientBlock, InvalidValuesStillAccumulate) {
    BoxFilter box;
    TransientBlock block({2}, {&box}, 2, true, false, true, true);
    const Float c[1] = {0.5f};
    const Float v[1] = {-1};
    block.Put(c, v);
    EXPECT_EQ(-1, block.Develop()(0, 0));
}

TEST(TransientBlock, Create) {
    pstd::pmr::polymorphic_allocator<pstd::byte> alloc;
    BoxFilter box;
    TriangleFilter tri(1.5);
    const FilterHandle filters[3] = {&box, &box, &tri};

    ParameterDictionary dict;
    dict.AddInt("dimensions", {4, 4, 3});
    dict.AddInt("channelcount", {3});
    dict.AddBool("normalize", {true});
    dict.AddInt("offset", {0, 0, 1});
    TransientBlock *block = TransientBlock::Create(dict, filters, nullptr, alloc);

    EXPECT_EQ(3, block->NumDimensions());
    EXPECT_EQ(3, block->ChannelCount());
    EXPECT_TRUE(block->Normalize());
    EXPECT_TRUE(block->UseBorder());
    EXPECT_EQ(1, block->Offset(2));
    EXPECT_EQ(1, block->Geometry().MaxBorderSize(2));
    EXPECT_EQ(0, block->Geometry().MaxBorderSize(0));

    alloc.delete_object(block);
}

TEST(TransientBlock, ConfigurationErrors) {
    BoxFilter box;
    pstd::pmr::polymorphic_allocator<pstd::byte> alloc;
    const int dims[3] = {4, 4, 3};
    const FilterHandle two[2] = {&box, &box};
    const FilterHandle one[1] = {&box};

    EXPECT_EXIT(TransientBlock(dims, one, 0), ::testing::ExitedWithCode(1),
                "at least one channel");
    EXPECT_EXIT(TransientBlock(dims, two, 3), ::testing::ExitedWithCode(1),
                "2 filters were provided");

    ParameterDictionary noDims;
    noDims.AddInt("channelcount", {3});
    EXPECT_EXIT(TransientBlock::Create(noDims, one, nullptr, alloc),
                ::testing::ExitedWithCode(1), "dimensions");

    TransientBlock block(dims, one, 3);
    const int offset[2] = {1, 1};
    EXPECT_EXIT(block.SetOffset(offset), ::testing::ExitedWithCode(1),
                "offset values provided");
}
