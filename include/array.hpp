#ifndef __LOX_ARRAY_HPP
#define __LOX_ARRAY_HPP

#include <cstdlib>
#include <new>
#include <type_traits>
#include <utility>

#include "base.hpp"

namespace lox {

// Dynamic array type. This is used as a lightweight alternative to std::vector
// for bytecode, constant pools, arena slot tables and capture lists. Indexing
// is unchecked.
template<typename t>
struct dyn_array {
    u32 capacity;
    u32 size;
    t* data;

    dyn_array()
        : capacity{16}
        , size{0}
        , data{(t*)malloc(sizeof(t)*capacity)} {
    }
    dyn_array(const dyn_array<t>& other)
        : capacity{other.capacity}
        , size{other.size}
        , data{(t*)malloc(other.capacity*sizeof(t))} {
        for (u32 i = 0; i < size; ++i) {
            new(&data[i]) t{other[i]};
        }
    }
    dyn_array(dyn_array<t>&& other)
        : capacity{other.capacity}
        , size{other.size}
        , data{other.data} {
        other.capacity = 0;
        other.size = 0;
        other.data = nullptr;
    }
    ~dyn_array() {
        clear();
        free(data);
    }
    dyn_array& operator= (const dyn_array<t>& other) {
        if (this == &other) {
            return *this;
        }
        clear();
        free(data);
        capacity = other.capacity;
        size = other.size;
        data = (t*)malloc(capacity*sizeof(t));
        for (u32 i = 0; i < size; ++i) {
            new(&data[i]) t{other[i]};
        }
        return *this;
    }
    dyn_array& operator= (dyn_array<t>&& other) {
        std::swap(capacity, other.capacity);
        std::swap(size, other.size);
        std::swap(data, other.data);
        return *this;
    }

    void ensure_capacity(u32 min_cap) {
        if (capacity >= min_cap) {
            return;
        }
        auto new_cap = capacity == 0 ? 16 : capacity;
        while (new_cap < min_cap) {
            new_cap *= 2;
        }
        if constexpr (std::is_trivially_copyable<t>::value) {
            data = (t*)realloc(data, new_cap*sizeof(t));
        } else {
            auto old_data = data;
            data = (t*)malloc(new_cap*sizeof(t));
            for (u32 i = 0; i < size; ++i) {
                new(&data[i]) t{std::move(old_data[i])};
                old_data[i].~t();
            }
            free(old_data);
        }
        capacity = new_cap;
    }
    // item may be an element of this array, so it is copied out before the
    // buffer can move
    void push_back(const t& item) {
        t tmp{item};
        ensure_capacity(size + 1);
        new(&data[size]) t{std::move(tmp)};
        ++size;
    }
    void push_back(t&& item) {
        t tmp{std::move(item)};
        ensure_capacity(size + 1);
        new(&data[size]) t{std::move(tmp)};
        ++size;
    }
    // undefined on an empty array
    void pop_back() {
        --size;
        data[size].~t();
    }
    // insert at position i, shifting later elements up by one
    void insert(u32 i, const t& item) {
        push_back(item);
        for (u32 j = size - 1; j > i; --j) {
            std::swap(data[j], data[j-1]);
        }
    }

    void resize(u32 new_size) {
        ensure_capacity(new_size);
        for (u32 i = size; i < new_size; ++i) {
            new(&data[i]) t;
        }
        for (u32 i = new_size; i < size; ++i) {
            data[i].~t();
        }
        size = new_size;
    }
    void clear() {
        for (u32 i = 0; i < size; ++i) {
            data[i].~t();
        }
        size = 0;
    }

    inline t& operator[](u32 i) {
        return data[i];
    }
    inline const t& operator[](u32 i) const {
        return data[i];
    }

    t* begin() {
        return data;
    }
    t* end() {
        return data + size;
    }
    const t* begin() const {
        return data;
    }
    const t* end() const {
        return data + size;
    }
};

}

#endif
