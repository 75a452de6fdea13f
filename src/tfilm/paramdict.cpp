// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// It is licensed under the BSD license; see the file LICENSE.txt
// SPDX: BSD-3-Clause

// paramdict.cpp*
#include <tfilm/paramdict.h>

#include <tfilm/util/print.h>

namespace tfilm {

template <typename T>
static void addParameter(const std::string &name, std::vector<T> values,
                         std::vector<ParameterItem<T>> &vec) {
    for (auto &item : vec) {
        if (item.name == name) {
            Warning("%s: parameter redefined", name);
            item.values = std::move(values);
            item.lookedUp = false;
            return;
        }
    }
    vec.push_back(ParameterItem<T>(name, std::move(values)));
}

template <typename T>
static const ParameterItem<T> *lookup(const std::string &name,
                                      const std::vector<ParameterItem<T>> &vec) {
    for (const auto &item : vec)
        if (item.name == name) {
            item.lookedUp = true;
            return &item;
        }
    return nullptr;
}

template <typename T>
static T lookupOne(const std::string &name, T def,
                   const std::vector<ParameterItem<T>> &vec, const FileLoc *loc) {
    const ParameterItem<T> *item = lookup(name, vec);
    if (!item || item->values.empty())
        return def;
    if (item->values.size() > 1)
        ErrorExit(loc, "\"%s\": expected a single value but %d were provided.", name,
                  item->values.size());
    return item->values[0];
}

// ParameterDictionary Method Definitions
void ParameterDictionary::AddFloat(const std::string &name, std::vector<Float> values) {
    addParameter(name, std::move(values), floats);
}

void ParameterDictionary::AddInt(const std::string &name, std::vector<int> values) {
    addParameter(name, std::move(values), ints);
}

void ParameterDictionary::AddBool(const std::string &name, std::vector<bool> values) {
    addParameter(name, std::vector<uint8_t>(values.begin(), values.end()), bools);
}

void ParameterDictionary::AddString(const std::string &name,
                                    std::vector<std::string> values) {
    addParameter(name, std::move(values), strings);
}

Float ParameterDictionary::GetOneFloat(const std::string &name, Float def) const {
    return lookupOne(name, def, floats, Loc());
}

int ParameterDictionary::GetOneInt(const std::string &name, int def) const {
    return lookupOne(name, def, ints, Loc());
}

bool ParameterDictionary::GetOneBool(const std::string &name, bool def) const {
    return lookupOne(name, uint8_t(def), bools, Loc()) != 0;
}

std::string ParameterDictionary::GetOneString(const std::string &name,
                                              const std::string &def) const {
    return lookupOne(name, def, strings, Loc());
}

std::vector<Float> ParameterDictionary::GetFloatArray(const std::string &name) const {
    const ParameterItem<Float> *item = lookup(name, floats);
    return item ? item->values : std::vector<Float>();
}

std::vector<int> ParameterDictionary::GetIntArray(const std::string &name) const {
    const ParameterItem<int> *item = lookup(name, ints);
    return item ? item->values : std::vector<int>();
}

std::vector<std::string> ParameterDictionary::GetStringArray(
    const std::string &name) const {
    const ParameterItem<std::string> *item = lookup(name, strings);
    return item ? item->values : std::vector<std::string>();
}

template <typename T>
static void checkUnused(const std::vector<ParameterItem<T>> &vec, const FileLoc *loc) {
    for (const auto &item : vec)
        if (!item.lookedUp)
            ErrorExit(loc, "\"%s\": unused parameter.", item.name);
}

void ParameterDictionary::ReportUnused() const {
    checkUnused(floats, Loc());
    checkUnused(ints, Loc());
    checkUnused(bools, Loc());
    checkUnused(strings, Loc());
}

static std::string toString(Float v) {
    return StringPrintf("%f", v);
}
static std::string toString(int v) {
    return StringPrintf("%d", v);
}
static std::string toString(uint8_t v) {
    return v ? "true" : "false";
}
static std::string toString(const std::string &v) {
    return "\"" + v + "\"";
}

template <typename T>
static std::string toString(const char *type, const std::vector<ParameterItem<T>> &vec) {
    std::string ret;
    for (const auto &item : vec) {
        ret += StringPrintf("\"%s %s\" [ ", type, item.name);
        for (const T &v : item.values)
            ret += toString(v) + ' ';
        ret += "] ";
    }
    return ret;
}

std::string ParameterDictionary::ToString() const {
    return "[ ParameterDictionary " + toString("float", floats) +
           toString("integer", ints) + toString("bool", bools) +
           toString("string", strings) + "]";
}

}  // namespace tfilm
