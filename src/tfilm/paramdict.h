// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// It is licensed under the BSD license; see the file LICENSE.txt
// SPDX: BSD-3-Clause

#if defined(_MSC_VER)
#define NOMINMAX
#pragma once
#endif

#ifndef TFILM_PARAMDICT_H
#define TFILM_PARAMDICT_H

// paramdict.h*
#include <tfilm/tfilm.h>

#include <tfilm/util/error.h>

#include <cstdint>
#include <string>
#include <vector>

namespace tfilm {

template <typename T>
struct ParameterItem {
    // ParameterItem Public Methods
    ParameterItem(const std::string &name, std::vector<T> values)
        : name(name), values(std::move(values)) {}

    // ParameterItem Data
    std::string name;
    std::vector<T> values;
    mutable bool lookedUp = false;
};

// ParameterDictionary holds the named, typed parameters that configure a
// filter, a block or a film. Every lookup marks the parameter as used so
// that ReportUnused() can flag misspelled or mistyped parameters.
class ParameterDictionary {
  public:
    // ParameterDictionary Public Methods
    ParameterDictionary() = default;
    explicit ParameterDictionary(FileLoc loc) : loc(std::move(loc)) {}

    void AddFloat(const std::string &name, std::vector<Float> values);
    void AddInt(const std::string &name, std::vector<int> values);
    void AddBool(const std::string &name, std::vector<bool> values);
    void AddString(const std::string &name, std::vector<std::string> values);

    Float GetOneFloat(const std::string &name, Float def) const;
    int GetOneInt(const std::string &name, int def) const;
    bool GetOneBool(const std::string &name, bool def) const;
    std::string GetOneString(const std::string &name, const std::string &def) const;

    std::vector<Float> GetFloatArray(const std::string &name) const;
    std::vector<int> GetIntArray(const std::string &name) const;
    std::vector<std::string> GetStringArray(const std::string &name) const;

    void ReportUnused() const;

    const FileLoc *Loc() const { return loc.filename.empty() ? nullptr : &loc; }

    std::string ToString() const;

  private:
    // ParameterDictionary Private Data
    FileLoc loc;
    std::vector<ParameterItem<Float>> floats;
    std::vector<ParameterItem<int>> ints;
    std::vector<ParameterItem<uint8_t>> bools;
    std::vector<ParameterItem<std::string>> strings;
};

}  // namespace tfilm

#endif  // TFILM_PARAMDICT_H
