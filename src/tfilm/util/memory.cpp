// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// It is licensed under the BSD license; see the file LICENSE.txt
// SPDX: BSD-3-Clause

// util/memory.cpp*
#include <tfilm/util/memory.h>

#include <stdlib.h>

namespace tfilm {

// Memory Allocation Functions
void *AllocAligned(size_t size) {
    void *ptr;
    if (posix_memalign(&ptr, TFILM_L1_CACHE_LINE_SIZE, size) != 0)
        ptr = nullptr;
    return ptr;
}

void FreeAligned(void *ptr) {
    if (ptr == nullptr)
        return;
    free(ptr);
}

}  // namespace tfilm
