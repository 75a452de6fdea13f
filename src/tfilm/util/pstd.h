// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// It is licensed under the BSD license; see the file LICENSE.txt
// SPDX: BSD-3-Clause

#ifndef TFILM_UTIL_PSTD_H
#define TFILM_UTIL_PSTD_H

#include <tfilm/util/check.h>

#include <cstddef>
#include <initializer_list>
#include <new>
#include <utility>

namespace pstd {

template <typename T>
inline void swap(T &a, T &b) {
    T tmp = std::move(a);
    a = std::move(b);
    b = std::move(tmp);
}

template <typename T, int N>
class array {
  public:
    using value_type = T;
    using iterator = value_type *;
    using const_iterator = const value_type *;
    using size_t = std::size_t;

    array() = default;
    array(std::initializer_list<T> v) {
        size_t i = 0;
        for (const T &val : v)
            values[i++] = val;
        for (; i < N; ++i)
            values[i] = T{};
    }

    void fill(const T &v) {
        for (int i = 0; i < N; ++i)
            values[i] = v;
    }

    bool operator==(const array<T, N> &a) const {
        for (int i = 0; i < N; ++i)
            if (values[i] != a.values[i])
                return false;
        return true;
    }
    bool operator!=(const array<T, N> &a) const { return !(*this == a); }

    iterator begin() { return values; }
    iterator end() { return values + N; }
    const_iterator begin() const { return values; }
    const_iterator end() const { return values + N; }

    size_t size() const { return N; }

    T &operator[](size_t i) { return values[i]; }
    const T &operator[](size_t i) const { return values[i]; }

    T *data() { return values; }
    const T *data() const { return values; }

  private:
    T values[N] = {};
};

namespace pmr {

class memory_resource {
    static constexpr size_t max_align = alignof(std::max_align_t);

  public:
    virtual ~memory_resource();
    void *allocate(size_t bytes, size_t alignment = max_align) {
        return do_allocate(bytes, alignment);
    }
    void deallocate(void *p, size_t bytes, size_t alignment = max_align) {
        return do_deallocate(p, bytes, alignment);
    }
    bool is_equal(const memory_resource &other) const noexcept {
        return do_is_equal(other);
    }

  private:
    virtual void *do_allocate(size_t bytes, size_t alignment) = 0;
    virtual void do_deallocate(void *p, size_t bytes, size_t alignment) = 0;
    virtual bool do_is_equal(const memory_resource &other) const noexcept = 0;
};

inline bool operator==(const memory_resource &a, const memory_resource &b) noexcept {
    return a.is_equal(b);
}

inline bool operator!=(const memory_resource &a, const memory_resource &b) noexcept {
    return !(a == b);
}

// global memory resources
memory_resource *new_delete_resource() noexcept;
memory_resource *set_default_resource(memory_resource *r) noexcept;
memory_resource *get_default_resource() noexcept;

template <class Tp = byte>
class polymorphic_allocator {
  public:
    using value_type = Tp;

    polymorphic_allocator() noexcept { memoryResource = get_default_resource(); }
    polymorphic_allocator(memory_resource *r) : memoryResource(r) {}
    polymorphic_allocator(const polymorphic_allocator &other) = default;
    template <class U>
    polymorphic_allocator(const polymorphic_allocator<U> &other) noexcept
        : memoryResource(other.resource()) {}

    polymorphic_allocator &operator=(const polymorphic_allocator &rhs) = delete;

    // member functions
    [[nodiscard]] Tp *allocate(size_t n) {
        return static_cast<Tp *>(resource()->allocate(n * sizeof(Tp), alignof(Tp)));
    }
    void deallocate(Tp *p, size_t n) { resource()->deallocate(p, n); }

    void *allocate_bytes(size_t nbytes, size_t alignment = alignof(std::max_align_t)) {
        return resource()->allocate(nbytes, alignment);
    }
    void deallocate_bytes(void *p, size_t nbytes,
                          size_t alignment = alignof(std::max_align_t)) {
        return resource()->deallocate(p, nbytes, alignment);
    }
    template <class T>
    T *allocate_object(size_t n = 1) {
        return static_cast<T *>(allocate_bytes(n * sizeof(T), alignof(T)));
    }
    template <class T>
    void deallocate_object(T *p, size_t n = 1) {
        deallocate_bytes(p, n * sizeof(T), alignof(T));
    }
    template <class T, class... Args>
    T *new_object(Args &&... args) {
        // NOTE: this doesn't handle constructors that throw exceptions...
        T *p = allocate_object<T>();
        construct(p, std::forward<Args>(args)...);
        return p;
    }
    template <class T>
    void delete_object(T *p) {
        destroy(p);
        deallocate_object(p);
    }

    template <class T, class... Args>
    void construct(T *p, Args &&... args) {
        ::new ((void *)p) T(std::forward<Args>(args)...);
    }

    template <class T>
    void destroy(T *p) {
        p->~T();
    }

    memory_resource *resource() const { return memoryResource; }

  private:
    memory_resource *memoryResource;
};

template <class T1, class T2>
bool operator==(const polymorphic_allocator<T1> &a,
                const polymorphic_allocator<T2> &b) noexcept {
    return a.resource() == b.resource();
}

template <class T1, class T2>
bool operator!=(const polymorphic_allocator<T1> &a,
                const polymorphic_allocator<T2> &b) noexcept {
    return !(a == b);
}

}  // namespace pmr

}  // namespace pstd

#endif  // TFILM_UTIL_PSTD_H
