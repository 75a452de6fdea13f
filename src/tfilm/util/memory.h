// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// It is licensed under the BSD license; see the file LICENSE.txt
// SPDX: BSD-3-Clause

#if defined(_MSC_VER)
#define NOMINMAX
#pragma once
#endif

#ifndef TFILM_UTIL_MEMORY_H
#define TFILM_UTIL_MEMORY_H

// util/memory.h*
#include <tfilm/tfilm.h>

#include <cstddef>

namespace tfilm {

#ifndef TFILM_L1_CACHE_LINE_SIZE
#define TFILM_L1_CACHE_LINE_SIZE 64
#endif

// Memory Declarations
void *AllocAligned(size_t size);
template <typename T>
T *AllocAligned(size_t count) {
    return (T *)AllocAligned(count * sizeof(T));
}

void FreeAligned(void *);

}  // namespace tfilm

#endif  // TFILM_UTIL_MEMORY_H
