// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// It is licensed under the BSD license; see the file LICENSE.txt
// SPDX: BSD-3-Clause

#if defined(_MSC_VER)
#define NOMINMAX
#pragma once
#endif

#ifndef TFILM_UTIL_ARRAYND_H
#define TFILM_UTIL_ARRAYND_H

// util/arraynd.h*
#include <tfilm/tfilm.h>

#include <tfilm/util/check.h>
#include <tfilm/util/print.h>
#include <tfilm/util/pstd.h>

#include <absl/types/span.h>

#include <algorithm>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <vector>

namespace tfilm {

// ArrayND is a dense row-major array with an arbitrary number of axes;
// the last axis varies fastest.
template <typename T>
class ArrayND {
  public:
    using value_type = T;
    using iterator = value_type *;
    using const_iterator = const value_type *;
    using allocator_type = pstd::pmr::polymorphic_allocator<pstd::byte>;

    ArrayND(allocator_type allocator = {}) : allocator(allocator) {}
    ArrayND(std::vector<int> shape, allocator_type allocator = {})
        : shape(std::move(shape)), allocator(allocator) {
        int64_t n = computeSize(this->shape);
        values = allocator.allocate_object<T>(n);
        for (int64_t i = 0; i < n; ++i)
            allocator.construct(values + i);
    }
    ArrayND(std::vector<int> shape, T def, allocator_type allocator = {})
        : ArrayND(std::move(shape), allocator) {
        std::fill(begin(), end(), def);
    }
    ArrayND(const ArrayND &a, allocator_type allocator = {})
        : ArrayND(a.shape, allocator) {
        std::copy(a.begin(), a.end(), begin());
    }

    ~ArrayND() { release(); }

    ArrayND(ArrayND &&a, allocator_type allocator = {})
        : shape(a.shape), allocator(allocator) {
        if (allocator == a.allocator) {
            values = a.values;
            a.shape.clear();
            a.values = nullptr;
        } else {
            int64_t n = computeSize(shape);
            values = allocator.allocate_object<T>(n);
            for (int64_t i = 0; i < n; ++i)
                allocator.construct(values + i, a.values[i]);
        }
    }
    ArrayND &operator=(const ArrayND &a) = delete;

    ArrayND &operator=(ArrayND &&other) {
        if (allocator == other.allocator) {
            pstd::swap(shape, other.shape);
            pstd::swap(values, other.values);
        } else {
            release();
            shape = other.shape;
            int64_t n = computeSize(shape);
            values = allocator.allocate_object<T>(n);
            for (int64_t i = 0; i < n; ++i)
                allocator.construct(values + i, other.values[i]);
        }
        return *this;
    }

    T &operator[](absl::Span<const int> index) { return values[Offset(index)]; }
    const T &operator[](absl::Span<const int> index) const {
        return values[Offset(index)];
    }

    template <typename... Args>
    T &operator()(Args... index) {
        const int idx[] = {int(index)...};
        return (*this)[absl::MakeConstSpan(idx)];
    }
    template <typename... Args>
    const T &operator()(Args... index) const {
        const int idx[] = {int(index)...};
        return (*this)[absl::MakeConstSpan(idx)];
    }

    int64_t Offset(absl::Span<const int> index) const {
        CHECK_EQ(index.size(), shape.size());
        int64_t offset = 0;
        for (size_t i = 0; i < shape.size(); ++i) {
            DCHECK(index[i] >= 0 && index[i] < shape[i]);
            offset = offset * shape[i] + index[i];
        }
        return offset;
    }

    int64_t size() const { return computeSize(shape); }
    int NumDimensions() const { return shape.size(); }
    const std::vector<int> &Shape() const { return shape; }

    iterator begin() { return values; }
    iterator end() { return begin() + size(); }
    const_iterator begin() const { return values; }
    const_iterator end() const { return begin() + size(); }

    operator absl::Span<T>() { return absl::Span<T>(values, size()); }
    operator absl::Span<const T>() const { return absl::Span<const T>(values, size()); }

    std::string ToString() const {
        std::string s = StringPrintf("[ ArrayND shape: %s values: [ ", shape);
        for (int64_t i = 0; i < size(); ++i)
            s += StringPrintf("%s ", values[i]);
        return s + "] ]";
    }

  private:
    static int64_t computeSize(const std::vector<int> &shape) {
        if (shape.empty())
            return 0;
        int64_t n = 1;
        for (int d : shape)
            n *= d;
        return n;
    }

    void release() {
        int64_t n = computeSize(shape);
        for (int64_t i = 0; i < n; ++i)
            allocator.destroy(values + i);
        if (values)
            allocator.deallocate_object(values, n);
        values = nullptr;
    }

    std::vector<int> shape;
    allocator_type allocator;
    T *values = nullptr;
};

}  // namespace tfilm

#endif  // TFILM_UTIL_ARRAYND_H
