// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// It is licensed under the BSD license; see the file LICENSE.txt
// SPDX: BSD-3-Clause

#if defined(_MSC_VER)
#define NOMINMAX
#pragma once
#endif

#ifndef TFILM_UTIL_ARGS_H
#define TFILM_UTIL_ARGS_H

// util/args.h*
#include <tfilm/tfilm.h>

#include <tfilm/util/print.h>

#include <cctype>
#include <functional>
#include <string>

namespace tfilm {
namespace {

// Downcase the string and remove any '-' or '_' characters; thus we can be
// a little flexible in what we match for argument names.
std::string normalizeArg(const std::string &str) {
    std::string ret;
    for (unsigned char c : str) {
        if (c != '_' && c != '-')
            ret += std::tolower(c);
    }
    return ret;
}

bool initArg(const std::string &str, int *ptr) {
    if (str.empty() || (!std::isdigit(str[0]) && str[0] != '-'))
        return false;
    *ptr = std::stoi(str);
    return true;
}

bool initArg(const std::string &str, float *ptr) {
    if (str.empty() || (!std::isdigit(str[0]) && str[0] != '-' && str[0] != '.'))
        return false;
    *ptr = std::stof(str);
    return true;
}

bool initArg(const std::string &str, std::string *ptr) {
    if (str.empty())
        return false;
    *ptr = str;
    return true;
}

bool initArg(const std::string &str, bool *ptr) {
    if (normalizeArg(str) == "false") {
        *ptr = false;
        return true;
    } else if (normalizeArg(str) == "true") {
        *ptr = true;
        return true;
    }
    return false;
}

bool matchPrefix(const std::string &str, const std::string &prefix) {
    if (prefix.size() > str.size())
        return false;
    for (size_t i = 0; i < prefix.size(); ++i)
        if (prefix[i] != str[i])
            return false;
    return true;
}

template <typename T>
bool enable(T ptr) {
    return false;
}

bool enable(bool *ptr) {
    *ptr = true;
    return true;
}

}  // namespace

// T needs to be a pointer to one of the types initArg() handles.
template <typename T>
bool ParseArg(char ***argv, const std::string &name, T out,
              std::function<void(std::string)> onError) {
    std::string arg = **argv;

    // Strip either one or two leading dashes.
    if (arg.size() > 1 && arg[1] == '-')
        arg = arg.substr(2);
    else
        arg = arg.substr(1);

    if (matchPrefix(normalizeArg(arg), normalizeArg(name + '='))) {
        // --arg=value
        *argv += 1;
        std::string value = arg.substr(name.size() + 1);
        if (!initArg(value, out)) {
            onError(StringPrintf("invalid value \"%s\" for %s argument", value, name));
            return false;
        }
        return true;
    } else if (normalizeArg(arg) == normalizeArg(name)) {
        // --arg <value>, except for bool arguments, which are set to true
        // without expecting another argument.
        *argv += 1;
        if (enable(out))
            return true;

        if (**argv == nullptr) {
            onError(StringPrintf("missing value after %s argument", arg));
            return false;
        }
        if (!initArg(**argv, out)) {
            onError(StringPrintf("invalid value \"%s\" for %s argument", **argv, name));
            return false;
        }
        *argv += 1;
        return true;
    } else
        return false;
}

}  // namespace tfilm

#endif  // TFILM_UTIL_ARGS_H
