// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// It is licensed under the BSD license; see the file LICENSE.txt
// SPDX: BSD-3-Clause

#if defined(_MSC_VER)
#define NOMINMAX
#pragma once
#endif

#ifndef TFILM_UTIL_TAGGEDPTR_H
#define TFILM_UTIL_TAGGEDPTR_H

// util/taggedptr.h*
#include <tfilm/tfilm.h>

#include <tfilm/util/check.h>
#include <tfilm/util/print.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>

namespace tfilm {

namespace detail {

template <typename Enable, typename T, typename... Ts>
struct TypeIndexHelper_impl;

template <typename T, typename... Ts>
struct TypeIndexHelper_impl<void, T, T, Ts...> {
    static constexpr size_t value = 1;
};

template <typename T, typename U, typename... Ts>
struct TypeIndexHelper_impl<
    typename std::enable_if_t<std::is_base_of<U, T>::value && !std::is_same<T, U>::value>,
    T, U, Ts...> {
    static constexpr size_t value = 1;
};

template <typename T, typename U, typename... Ts>
struct TypeIndexHelper_impl<typename std::enable_if_t<!std::is_base_of<U, T>::value &&
                                                      !std::is_same<T, U>::value>,
                            T, U, Ts...> {
    static constexpr size_t value = 1 + TypeIndexHelper_impl<void, T, Ts...>::value;
};

// Given a target type and a list of types, TypeIndexHelper gives the
// 1-based index of the type in the list; it fails to compile if the
// target type doesn't appear in the list.
template <typename T, typename... Ts>
class TypeIndexHelper : public TypeIndexHelper_impl<void, T, Ts...> {};

}  // namespace detail

// TaggedPointer stores a pointer to one of a fixed set of types, keeping
// the type's index in the pointer's unused low bits. Based on/extracted
// from DiscriminatedPtr in Facebook's folly library.
template <typename... Ts>
class TaggedPointer {
  public:
    TaggedPointer() = default;

    template <typename T>
    TaggedPointer(T *ptr) {
        uintptr_t iptr = reinterpret_cast<uintptr_t>(ptr);
        // Reminder: if this CHECK hits, it's likely that the class
        // involved needs an alignas(8).
        CHECK_EQ(iptr & ptrMask, iptr);
        constexpr uint16_t type = TypeIndex<T>();
        bits = iptr | ((uintptr_t)type << tagShift);
    }

    TaggedPointer(std::nullptr_t np) {}

    TaggedPointer(const TaggedPointer &t) { bits = t.bits; }
    TaggedPointer &operator=(const TaggedPointer &t) {
        bits = t.bits;
        return *this;
    }

    template <typename T>
    bool Is() const {
        return Tag() == TypeIndex<T>();
    }

    explicit operator bool() const { return (bits & ptrMask) != 0; }

    template <typename T>
    T *Cast() {
        CHECK(Is<T>());
        return reinterpret_cast<T *>(ptr());
    }
    template <typename T>
    const T *Cast() const {
        CHECK(Is<T>());
        return reinterpret_cast<const T *>(ptr());
    }

    uint16_t Tag() const { return uint16_t((bits & tagMask) >> tagShift); }
    static constexpr uint16_t MaxTag() { return sizeof...(Ts); }

    template <typename T>
    static constexpr uint16_t TypeIndex() {
        return uint16_t(detail::TypeIndexHelper<T, Ts...>::value);
    }

    std::string ToString() const {
        return StringPrintf("[ TaggedPointer ptr: 0x%p tag: %d ]", ptr(), Tag());
    }

    bool operator==(const TaggedPointer &tp) const { return bits == tp.bits; }
    bool operator!=(const TaggedPointer &tp) const { return bits != tp.bits; }

    void *ptr() { return reinterpret_cast<void *>(bits & ptrMask); }
    const void *ptr() const { return reinterpret_cast<const void *>(bits & ptrMask); }

  private:
    static_assert(sizeof(uintptr_t) == 8, "Expected uintptr_t to be 64 bits");

    static constexpr bool useLowBits = sizeof...(Ts) < 7;  // 0 used for null
    static constexpr int tagShift = useLowBits ? 0 : 48;
    static constexpr uint64_t tagMask =
        useLowBits ? 0x7 : (((1ull << 16) - 1) << tagShift);
    static constexpr uint64_t ptrMask = ~tagMask;

    uintptr_t bits = 0;
};

}  // namespace tfilm

#endif  // TFILM_UTIL_TAGGEDPTR_H
