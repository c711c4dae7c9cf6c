// obj.hpp -- compiled functions and their upvalue descriptors
#ifndef __LOX_OBJ_HPP
#define __LOX_OBJ_HPP

#include "array.hpp"
#include "base.hpp"
#include "bytes.hpp"
#include "strings.hpp"

namespace lox {

// Describes one variable captured by a function. If is_local is set, index is
// a local slot of the immediately enclosing frame. Otherwise it is an index
// into the enclosing closure's own capture list.
struct upvalue_desc {
    local_address index;
    bool is_local;

    bool operator==(const upvalue_desc& other) const;
    bool operator!=(const upvalue_desc& other) const;
};

// A compiled function, as emitted by the compiler. Functions are handed to the
// allocator once complete and never change afterwards.
struct function {
    interned_string name{nullptr, 0};
    u32 arity = 0;
    code_chunk chunk;
    // upvalues captured when a closure over this function is created, in the
    // order of the resulting capture list
    dyn_array<upvalue_desc> upvalues;

    // add an upvalue descriptor, reusing an existing identical one. Returns
    // its index.
    local_address add_upvalue(local_address index, bool is_local);

    string stringify() const;
};

// Compare name text, arity, chunk and upvalue descriptors. This is test
// tooling; the language itself never compares functions this way.
bool deep_eq(const function& a, const function& b);

}

#endif
