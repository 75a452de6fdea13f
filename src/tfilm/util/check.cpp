// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// It is licensed under the BSD license; see the file LICENSE.txt
// SPDX: BSD-3-Clause

#include <tfilm/util/check.h>

#include <cstdio>
#include <cstdlib>

#include <execinfo.h>
#include <unistd.h>

namespace tfilm {

void CheckCallbackScope::Fail() {
    // Print the stack trace
    void *callstack[32];
    int frames = backtrace(callstack, TFILM_ARRAYSIZE(callstack));
    backtrace_symbols_fd(callstack, frames, STDERR_FILENO);
    fprintf(stderr, "\n");

    std::string message;
    for (auto iter = callbacks.rbegin(); iter != callbacks.rend(); ++iter)
        message += (*iter)();
    fprintf(stderr, "%s\n\n", message.c_str());

    abort();
}

std::vector<std::function<std::string(void)>> CheckCallbackScope::callbacks;

CheckCallbackScope::CheckCallbackScope(std::function<std::string(void)> callback) {
    callbacks.push_back(std::move(callback));
}

CheckCallbackScope::~CheckCallbackScope() {
    CHECK_GT(callbacks.size(), 0);
    callbacks.pop_back();
}

}  // namespace tfilm
