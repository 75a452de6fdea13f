// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// It is licensed under the BSD license; see the file LICENSE.txt
// SPDX: BSD-3-Clause

#if defined(_MSC_VER)
#define NOMINMAX
#pragma once
#endif

#ifndef TFILM_UTIL_ERROR_H
#define TFILM_UTIL_ERROR_H

// util/error.h*

#include <tfilm/tfilm.h>

#include <tfilm/util/print.h>

#include <string>

namespace tfilm {

// FileLoc records where a configuration value came from, e.g. the scene
// description line that declared a film or filter.
struct FileLoc {
    FileLoc() = default;
    FileLoc(std::string filename) : filename(std::move(filename)) {}

    std::string ToString() const;

    std::string filename;
    int line = 1, column = 0;
};

void Warning(const FileLoc *loc, const char *message);

template <typename... Args>
inline void Warning(const char *fmt, Args &&... args) {
    Warning(nullptr, StringPrintf(fmt, std::forward<Args>(args)...).c_str());
}

template <typename... Args>
inline void Warning(const FileLoc *loc, const char *fmt, Args &&... args) {
    Warning(loc, StringPrintf(fmt, std::forward<Args>(args)...).c_str());
}

void Error(const FileLoc *loc, const char *message);

template <typename... Args>
inline void Error(const char *fmt, Args &&... args) {
    Error(nullptr, StringPrintf(fmt, std::forward<Args>(args)...).c_str());
}

template <typename... Args>
inline void Error(const FileLoc *loc, const char *fmt, Args &&... args) {
    Error(loc, StringPrintf(fmt, std::forward<Args>(args)...).c_str());
}

[[noreturn]] void ErrorExit(const FileLoc *loc, const char *message);

template <typename... Args>
[[noreturn]] inline void ErrorExit(const char *fmt, Args &&... args) {
    ErrorExit(nullptr, StringPrintf(fmt, std::forward<Args>(args)...).c_str());
}

template <typename... Args>
[[noreturn]] inline void ErrorExit(const FileLoc *loc, const char *fmt,
                                   Args &&... args) {
    ErrorExit(loc, StringPrintf(fmt, std::forward<Args>(args)...).c_str());
}

}  // namespace tfilm

#endif  // TFILM_UTIL_ERROR_H
