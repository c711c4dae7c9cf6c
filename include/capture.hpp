// capture.hpp -- closure creation and access to captured variables
#ifndef __LOX_CAPTURE_HPP
#define __LOX_CAPTURE_HPP

#include "allocator.hpp"
#include "array.hpp"
#include "base.hpp"
#include "values.hpp"

namespace lox {

// NOTE: (Open and Closed Upvalues). The first time a local is captured, its
// stack slot is turned into an OpenUpvalue around a fresh cell, and a heap
// slot holding the same OpenUpvalue is allocated. Closures capture weak
// references to the heap slot, so every closure over the variable, as well as
// the frame itself, goes through the one cell. When the frame ends, the heap
// slot's content is replaced in place by the cell's current value. Existing
// weak references are not touched; they simply see the promoted value from
// then on.

// a captured stack slot whose frame is still live
struct open_upvalue {
    stack_address pos;
    // heap slot holding the OpenUpvalue for pos
    gc_ref<value> ref;
};

// The parts of the VM state closure capture works on
struct capture_state {
    allocator* alloc;
    dyn_array<value> stack;
    // open upvalues, sorted by stack position
    dyn_array<open_upvalue> open_upvals;

    capture_state(allocator* alloc);
};

// Open an upvalue for the stack slot at pos, or return the existing one.
gc_ref<value> capture_local(capture_state* S, stack_address pos);

// Instantiate a closure over fun for a frame whose locals start at bp.
// enclosing is the closure currently executing; it may only be null when fun
// captures nothing from beyond the current frame.
value make_closure(capture_state* S,
        stack_address bp,
        const value* enclosing,
        const gc_ref<function>& fun);

// close every open upvalue at or above min_addr. Used when a frame returns or
// a block with captured locals ends.
void close_upvalues(capture_state* S, stack_address min_addr);

// read/write a stack slot. Captured slots are accessed through their cell.
value get_local(const capture_state* S, stack_address pos);
void set_local(capture_state* S, stack_address pos, const value& v);

// read the ith captured variable of a closure
value get_upvalue(const value& closure, local_address i);
// write the ith captured variable. While open, the write goes to the shared
// cell. Once closed, the promoted slot is overwritten.
void set_upvalue(const value& closure, local_address i, const value& v);
// an UpvaluePtr to the ith captured variable's storage, e.g. for in-place
// numeric updates through vupdate_number
value upvalue_ref(const value& closure, local_address i);

}

#endif
