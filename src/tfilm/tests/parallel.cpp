// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// It is licensed under the BSD license; see the file LICENSE.txt
// SPDX: BSD-3-Clause

#include <gtest/gtest.h>

#include <tfilm/tfilm.h>
#include <tfilm/util/parallel.h>

#include <atomic>
#include <vector>

using namespace tfilm;

TEST(Parallel, Basics) {
    std::atomic<int> counter{0};
    ParallelFor(0, 1000, [&](int64_t) { ++counter; });
    EXPECT_EQ(1000, counter);

    counter = 0;
    ParallelFor(10, 1000, [&](int64_t start, int64_t end) {
        for (int64_t i = start; i < end; ++i)
            ++counter;
    });
    EXPECT_EQ(990, counter);
}

TEST(Parallel, DoNothing) {
    std::atomic<int> counter{0};
    ParallelFor(0, 0, [&](int64_t) { ++counter; });
    EXPECT_EQ(0, counter);
}

TEST(AtomicDouble, ConcurrentAdd) {
    AtomicDouble sum;
    ParallelFor(0, 10000, [&](int64_t i) { sum.Add(0.5); });
    EXPECT_EQ(5000., double(sum));

    sum = 2.;
    EXPECT_EQ(2., double(sum));
}

TEST(AtomicDouble, Copyable) {
    std::vector<AtomicDouble> v(4, AtomicDouble(1.5));
    v[2].Add(1);
    EXPECT_EQ(1.5, double(v[0]));
    EXPECT_EQ(2.5, double(v[2]));
}
