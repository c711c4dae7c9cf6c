// memory.hpp -- generation-tagged arenas and the weak references into them
#ifndef __LOX_MEMORY_HPP
#define __LOX_MEMORY_HPP

#include "array.hpp"
#include "base.hpp"
#include "log.hpp"

#include <string>

namespace lox {

// Every heap-resident object lives in a slot of a heap_arena. A slot is never
// freed back to the system while the arena lives; when its object is
// reclaimed, the slot's generation is bumped and the slot is put on a free
// list. A weak reference records the generation it was created with, so a
// reference to a reclaimed object can always be detected, even after the slot
// has been reused.

template<typename T> class heap_arena;

// Non-owning reference to an object in a heap_arena. This is a plain
// aggregate so that it can be stored inside the value union.
template<typename T>
struct gc_ref {
    heap_arena<T>* arena;
    u32 slot;
    u32 generation;

    // get temporary access to the referent. Returns nullptr if the referent
    // has been reclaimed. The pointer stays valid until the referent is
    // reclaimed.
    T* upgrade() const {
        return arena == nullptr ? nullptr : arena->get(slot, generation);
    }
    // same as upgrade, but a reclaimed referent is an invariant violation
    T& unwrap_upgrade() const {
        auto res = upgrade();
        if (res == nullptr) {
            if (arena == nullptr) {
                fatal("memory", "Upgrade of a null reference.");
            }
            arena->dangling(*this);
        }
        return *res;
    }
    bool alive() const {
        return upgrade() != nullptr;
    }

    // identity comparison: same slot and same generation
    bool operator==(const gc_ref<T>& other) const {
        return arena == other.arena
            && slot == other.slot
            && generation == other.generation;
    }
    bool operator!=(const gc_ref<T>& other) const {
        return !(*this == other);
    }
};

template<typename T>
class heap_arena {
private:
    struct arena_slot {
        u32 generation;
        bool live;
        T obj;
    };

    // slots are allocated individually so that their addresses are stable
    dyn_array<arena_slot*> slots;
    dyn_array<u32> free_slots;
    u32 num_live = 0;
    // used in log messages
    const char* kind;
    logger* log;
    bool trace;

    void log_info(const string& msg) {
        if (trace && log != nullptr) {
            log->log_info("memory", msg);
        }
    }

public:
    heap_arena(const char* kind, logger* log=nullptr, bool trace=false,
            u32 init_cap=64)
        : kind{kind}
        , log{log}
        , trace{trace} {
        slots.ensure_capacity(init_cap);
    }
    heap_arena(const heap_arena&) = delete;
    heap_arena& operator=(const heap_arena&) = delete;
    ~heap_arena() {
        for (auto s : slots) {
            delete s;
        }
    }

    // move an object into the arena
    gc_ref<T> add(T obj) {
        u32 i;
        if (free_slots.size > 0) {
            i = free_slots[free_slots.size - 1];
            free_slots.pop_back();
            slots[i]->obj = std::move(obj);
            slots[i]->live = true;
        } else {
            i = slots.size;
            slots.push_back(new arena_slot{0, true, std::move(obj)});
        }
        ++num_live;
        log_info(string{"allocated "} + kind + " slot " + std::to_string(i)
                + " (generation " + std::to_string(slots[i]->generation)
                + ")");
        return gc_ref<T>{this, i, slots[i]->generation};
    }

    // Destroy the referent and invalidate every reference to it. Reclaiming
    // an object that is already gone is an invariant violation.
    void reclaim(const gc_ref<T>& ref) {
        if (ref.arena != this || get(ref.slot, ref.generation) == nullptr) {
            dangling(ref);
        }
        auto s = slots[ref.slot];
        // reset the object so that anything it owns is released now
        s->obj = T{};
        s->live = false;
        ++s->generation;
        free_slots.push_back(ref.slot);
        --num_live;
        log_info(string{"reclaimed "} + kind + " slot "
                + std::to_string(ref.slot));
    }

    // look up a slot. Returns nullptr on a generation mismatch.
    T* get(u32 slot, u32 generation) {
        if (slot >= slots.size) {
            return nullptr;
        }
        auto s = slots[slot];
        if (!s->live || s->generation != generation) {
            return nullptr;
        }
        return &s->obj;
    }

    // report a reference that no longer resolves
    [[noreturn]] void dangling(const gc_ref<T>& ref) {
        auto msg = string{"Reference to reclaimed "} + kind + " (slot "
            + std::to_string(ref.slot) + ", generation "
            + std::to_string(ref.generation) + ").";
        if (log != nullptr) {
            log->log_error("memory", msg);
        }
        fatal("memory", msg);
    }

    u32 live_count() const {
        return num_live;
    }
    u32 slot_count() const {
        return slots.size;
    }
};

struct value;
struct function;
struct upvalue_cell;

// Interface used by a collector to discover the references held by a value.
// Weak references do not keep their referent alive. An owned cell is kept
// alive by the value visiting it, and its contents must be traced in turn.
class gc_visitor {
public:
    virtual ~gc_visitor() = default;
    virtual void visit_weak_function(const gc_ref<function>& ref) = 0;
    virtual void visit_weak_value(const gc_ref<value>& ref) = 0;
    virtual void visit_owned_cell(const upvalue_cell& cell) = 0;
};

}

#endif
