#include "capture.hpp"

#include "obj.hpp"

namespace lox {

capture_state::capture_state(allocator* alloc)
    : alloc{alloc} {
}

static void check_stack_pos(const capture_state* S, stack_address pos) {
    if (pos >= S->stack.size) {
        fatal("capture", "Stack address " + std::to_string(pos)
                + " is outside the stack (size "
                + std::to_string(S->stack.size) + ").");
    }
}

static const gc_ref<value>& captured_ref(const value& closure, local_address i) {
    if (!vis_function(closure)) {
        fatal("capture", "Upvalue access on non-closure "
                + v_debug_string(closure) + ".");
    }
    auto& captures = vcaptures(closure);
    if (i >= captures.size) {
        fatal("capture", "Upvalue index " + std::to_string(i)
                + " out of range for " + v_debug_string(closure) + ".");
    }
    return captures[i];
}

gc_ref<value> capture_local(capture_state* S, stack_address pos) {
    check_stack_pos(S, pos);
    // find the insertion point, reusing an existing upvalue for pos
    u32 i = 0;
    for (; i < S->open_upvals.size; ++i) {
        if (S->open_upvals[i].pos == pos) {
            return S->open_upvals[i].ref;
        } else if (S->open_upvals[i].pos > pos) {
            break;
        }
    }

    auto cell = vbox_open_upvalue(vresolve(S->stack[pos]));
    S->stack[pos] = cell;
    auto ref = S->alloc->add_value(cell);
    S->open_upvals.insert(i, open_upvalue{pos, ref});
    S->alloc->trace_info("opened upvalue for stack address "
            + std::to_string(pos) + " in slot " + std::to_string(ref.slot));
    return ref;
}

value make_closure(capture_state* S,
        stack_address bp,
        const value* enclosing,
        const gc_ref<function>& fun) {
    auto& f = fun.unwrap_upgrade();
    auto captures = std::make_shared<capture_list>();
    captures->ensure_capacity(f.upvalues.size);
    for (auto& u : f.upvalues) {
        if (u.is_local) {
            captures->push_back(capture_local(S, bp + u.index));
        } else {
            if (enclosing == nullptr) {
                fatal("capture", "Function " + f.stringify()
                        + " captures an upvalue but has no enclosing closure.");
            }
            captures->push_back(captured_ref(*enclosing, u.index));
        }
    }
    return vbox_closure(fun, captures);
}

void close_upvalues(capture_state* S, stack_address min_addr) {
    u32 i = S->open_upvals.size;
    while (i > 0) {
        auto& u = S->open_upvals[i-1];
        if (u.pos < min_addr) {
            break;
        }
        auto& slot = u.ref.unwrap_upgrade();
        if (!vis_open_upvalue(slot)) {
            fatal("capture", "Open upvalue for stack address "
                    + std::to_string(u.pos) + " holds "
                    + v_debug_string(slot) + ".");
        }
        // promote: the heap slot now holds the variable itself
        auto val = vcell(slot).val;
        slot = val;
        S->stack[u.pos] = val;
        S->alloc->trace_info("closed upvalue for stack address "
                + std::to_string(u.pos) + " in slot "
                + std::to_string(u.ref.slot));
        S->open_upvals.pop_back();
        --i;
    }
}

value get_local(const capture_state* S, stack_address pos) {
    check_stack_pos(S, pos);
    return vresolve(S->stack[pos]);
}

void set_local(capture_state* S, stack_address pos, const value& v) {
    check_stack_pos(S, pos);
    auto& slot = S->stack[pos];
    if (vis_open_upvalue(slot)) {
        vcell(slot).val = vresolve(v);
    } else {
        slot = vresolve(v);
    }
}

value get_upvalue(const value& closure, local_address i) {
    return vresolve(captured_ref(closure, i).unwrap_upgrade());
}

void set_upvalue(const value& closure, local_address i, const value& v) {
    auto& slot = captured_ref(closure, i).unwrap_upgrade();
    if (vis_open_upvalue(slot)) {
        vcell(slot).val = vresolve(v);
    } else {
        slot = vresolve(v);
    }
}

value upvalue_ref(const value& closure, local_address i) {
    return vbox_upvalue_ptr(captured_ref(closure, i));
}

}
