#ifndef __LOX_ALLOCATOR_HPP
#define __LOX_ALLOCATOR_HPP

#include "config.h"

#include "base.hpp"
#include "log.hpp"
#include "memory.hpp"
#include "obj.hpp"
#include "values.hpp"

namespace lox {

struct alloc_config {
    // initial number of slots reserved in each arena
    u32 init_slots = 64;
    // log allocation, reclamation and upvalue promotion as info messages
    bool trace = LOX_TRACE_ALLOC;
};

// The allocator holds the canonical storage for every heap-resident value and
// function. Everything else (closures, UpvaluePtrs, capture lists) refers to
// that storage through weak references, so reclaiming is only ever decided
// here, by whoever drives the collector.
class allocator {
private:
    logger* log;
    alloc_config config;
    heap_arena<value> values;
    heap_arena<function> functions;

public:
    // log may be null
    allocator(logger* log=nullptr, const alloc_config& config=alloc_config{});
    allocator(const allocator&) = delete;
    allocator& operator=(const allocator&) = delete;

    // Store a value in a fresh heap slot. An UpvaluePtr is stored as its
    // referent so that no heap slot ever holds an UpvaluePtr.
    gc_ref<value> add_value(const value& v);
    // Hand a finished function over to the allocator
    gc_ref<function> add_function(function&& f);

    // destroy a referent, invalidating every reference to it
    void reclaim(const gc_ref<value>& ref);
    void reclaim(const gc_ref<function>& ref);

    u32 live_values() const;
    u32 live_functions() const;

    logger* get_logger() const;
    bool tracing() const;
    // log an info message if tracing is on
    void trace_info(const string& message) const;
};

}

#endif
