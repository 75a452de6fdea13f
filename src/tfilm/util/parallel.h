// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// It is licensed under the BSD license; see the file LICENSE.txt
// SPDX: BSD-3-Clause

#if defined(_MSC_VER)
#define NOMINMAX
#pragma once
#endif

#ifndef TFILM_UTIL_PARALLEL_H
#define TFILM_UTIL_PARALLEL_H

// util/parallel.h*
#include <tfilm/tfilm.h>

#include <tfilm/util/float.h>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

namespace tfilm {

// Parallel Declarations
class AtomicDouble {
  public:
    // AtomicDouble Public Methods
    explicit AtomicDouble(double v = 0) { bits = FloatToBits(v); }

    AtomicDouble(const AtomicDouble &a) { bits = a.bits.load(); }
    AtomicDouble &operator=(const AtomicDouble &a) {
        bits = a.bits.load();
        return *this;
    }

    operator double() const { return BitsToFloat(bits); }

    double operator=(double v) {
        bits = FloatToBits(v);
        return v;
    }

    void Add(double v) {
        uint64_t oldBits = bits, newBits;
        do {
            newBits = FloatToBits(BitsToFloat(oldBits) + v);
        } while (!bits.compare_exchange_weak(oldBits, newBits));
    }

    std::string ToString() const;

  private:
    // AtomicDouble Private Data
    std::atomic<uint64_t> bits;
};

class Barrier {
  public:
    explicit Barrier(int n) : numToBlock(n), numToExit(n) {}

    Barrier(const Barrier &) = delete;
    Barrier &operator=(const Barrier &) = delete;

    // All block. Returns true to only one thread (which should delete the
    // barrier).
    bool Block();

  private:
    std::mutex mutex;
    std::condition_variable cv;
    int numToBlock, numToExit;
};

void ParallelFor(int64_t start, int64_t end, std::function<void(int64_t, int64_t)> func);

inline void ParallelFor(int64_t start, int64_t end, std::function<void(int64_t)> func) {
    ParallelFor(start, end, [&func](int64_t start, int64_t end) {
        for (int64_t i = start; i < end; ++i)
            func(i);
    });
}

extern thread_local int ThreadIndex;

int AvailableCores();
int RunningThreads();

void ParallelInit(int nThreads = -1);
void ParallelCleanup();

}  // namespace tfilm

#endif  // TFILM_UTIL_PARALLEL_H
