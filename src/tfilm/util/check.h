// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// It is licensed under the BSD license; see the file LICENSE.txt
// SPDX: BSD-3-Clause

#if defined(_MSC_VER)
#define NOMINMAX
#pragma once
#endif

#ifndef TFILM_UTIL_CHECK_H
#define TFILM_UTIL_CHECK_H

#include <tfilm/tfilm.h>

#include <tfilm/util/log.h>

#include <functional>
#include <string>
#include <vector>

namespace tfilm {

#define CHECK(x) !(!(x) && (LOG_FATAL("Check failed: %s", #x), true))

#define CHECK_IMPL(a, b, op)                                                  \
    do {                                                                      \
        auto va = a;                                                          \
        auto vb = b;                                                          \
        if (!(va op vb))                                                      \
            LOG_FATAL("Check failed: %s " #op " %s with %s = %s, %s = %s", #a, \
                      #b, #a, va, #b, vb);                                    \
    } while (false) /* swallow semicolon */

#define CHECK_EQ(a, b) CHECK_IMPL(a, b, ==)
#define CHECK_NE(a, b) CHECK_IMPL(a, b, !=)
#define CHECK_GT(a, b) CHECK_IMPL(a, b, >)
#define CHECK_GE(a, b) CHECK_IMPL(a, b, >=)
#define CHECK_LT(a, b) CHECK_IMPL(a, b, <)
#define CHECK_LE(a, b) CHECK_IMPL(a, b, <=)

#ifndef NDEBUG

#define DCHECK(x) CHECK(x)
#define DCHECK_EQ(a, b) CHECK_EQ(a, b)
#define DCHECK_NE(a, b) CHECK_NE(a, b)
#define DCHECK_GT(a, b) CHECK_GT(a, b)
#define DCHECK_GE(a, b) CHECK_GE(a, b)
#define DCHECK_LT(a, b) CHECK_LT(a, b)
#define DCHECK_LE(a, b) CHECK_LE(a, b)

#else

#define DCHECK(x)
#define DCHECK_EQ(a, b)
#define DCHECK_NE(a, b)
#define DCHECK_GT(a, b)
#define DCHECK_GE(a, b)
#define DCHECK_LT(a, b)
#define DCHECK_LE(a, b)

#endif

// CheckCallbackScope registers a callback whose result is printed if a
// CHECK fails while the scope is alive.
class CheckCallbackScope {
  public:
    CheckCallbackScope(std::function<std::string(void)> callback);
    ~CheckCallbackScope();

    CheckCallbackScope(const CheckCallbackScope &) = delete;
    CheckCallbackScope &operator=(const CheckCallbackScope &) = delete;

    static void Fail();

  private:
    static std::vector<std::function<std::string(void)>> callbacks;
};

}  // namespace tfilm

#endif  // TFILM_UTIL_CHECK_H
