#ifndef __LOX_TABLE_HPP
#define __LOX_TABLE_HPP

#include "base.hpp"

namespace lox {

static const float REHASH_THRESHOLD = 0.3;

/// hash table. uses linear probing. K must have a hash<K> specialization.
template <typename K, typename T> class table {
private:
    // hash table entry
    struct entry {
        const K key;
        T val;

        entry(const K& k, const T& v) : key{k}, val{v} { }
    };

    u32 cap;
    u32 threshold;
    u32 size;
    entry **array;

    // increase the capacity by a factor of 2. this involves recomputing all hashes
    void increase_cap() {
        auto *prev = array;
        auto old_cap = cap;

        // initialize a new array
        cap *= 2;
        threshold = (u32)(REHASH_THRESHOLD * cap);
        size = 0;
        array = new entry*[cap];
        for (u32 i =0; i < cap; ++i) {
            array[i] = nullptr;
        }

        // insert the old data, deleting old entries as we go
        for (u32 i=0; i<old_cap; ++i) {
            if (prev[i] != nullptr) {
                insert(prev[i]->key, prev[i]->val);
                delete prev[i];
            }
        }
        delete[] prev;
    }

    // index of the entry for k, or of the empty bucket where it would go
    u32 probe(const K& k) const {
        u32 i = hash<K>(k) % cap;
        while (array[i] != nullptr && !(array[i]->key == k)) {
            i = (i+1) % cap;
        }
        return i;
    }

public:
    table(u32 init_cap=32)
        : cap{init_cap}
        , threshold{(u32)(REHASH_THRESHOLD * init_cap)}
        , size{0}
        , array{new entry*[init_cap]} {
        for (u32 i =0; i < init_cap; ++i) {
            array[i] = nullptr;
        }
    }
    table(const table<K,T>& src) = delete;
    table<K,T>& operator=(const table<K,T>& src) = delete;
    ~table() {
        for (u32 i=0; i < cap; ++i) {
            if (array[i] != nullptr)
                delete array[i];
        }
        delete[] array;
    }

    u32 get_size() const {
        return size;
    }

    // insert/overwrite a new entry
    T& insert(const K& k, T v) {
        if (size >= threshold) {
            increase_cap();
        }
        auto i = probe(k);
        if (array[i] == nullptr) {
            ++size;
            array[i] = new entry{k, v};
        } else {
            array[i]->val = v;
        }
        return array[i]->val;
    }

    // returns std::nullopt when no object is associated to the key. The load
    // factor guarantees probing always reaches an empty bucket.
    optional<T> get(const K& k) const {
        auto i = probe(k);
        if (array[i] == nullptr) {
            return std::nullopt;
        }
        return array[i]->val;
    }

    bool has_key(const K& k) const {
        return array[probe(k)] != nullptr;
    }
};

}

#endif
