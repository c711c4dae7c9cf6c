#include "obj.hpp"

namespace lox {

bool upvalue_desc::operator==(const upvalue_desc& other) const {
    return index == other.index && is_local == other.is_local;
}

bool upvalue_desc::operator!=(const upvalue_desc& other) const {
    return !(*this == other);
}

local_address function::add_upvalue(local_address index, bool is_local) {
    upvalue_desc u{index, is_local};
    for (u32 i = 0; i < upvalues.size; ++i) {
        if (upvalues[i] == u) {
            return i;
        }
    }
    if (upvalues.size > max_local_address) {
        fatal("obj", "Too many upvalues in function " + stringify() + ".");
    }
    upvalues.push_back(u);
    return upvalues.size - 1;
}

string function::stringify() const {
    if (name.table == nullptr) {
        return "<fn>";
    }
    return "<fn " + name.to_owned() + ">";
}

bool deep_eq(const function& a, const function& b) {
    if (a.name.table == nullptr || b.name.table == nullptr) {
        if (a.name.table != b.name.table) {
            return false;
        }
    } else if (*a.name != *b.name) {
        return false;
    }
    if (a.arity != b.arity || a.upvalues.size != b.upvalues.size) {
        return false;
    }
    for (u32 i = 0; i < a.upvalues.size; ++i) {
        if (a.upvalues[i] != b.upvalues[i]) {
            return false;
        }
    }
    return deep_eq(a.chunk, b.chunk);
}

}
