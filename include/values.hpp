// values.hpp -- the runtime value representation and utility functions for
// working with values

#ifndef __LOX_VALUES_HPP
#define __LOX_VALUES_HPP

#include "array.hpp"
#include "base.hpp"
#include "memory.hpp"
#include "strings.hpp"

namespace lox {

// value tags. Every switch over a value_tag must name all of them.
enum value_tag : u8 {
    TAG_NUMBER,
    TAG_BOOL,
    TAG_NIL,
    TAG_STRING,
    // a function together with the variables it captured
    TAG_CLOSURE,
    // a closed (heap-promoted) captured variable
    TAG_UPVALUE_PTR,
    // a captured variable whose frame is still live
    TAG_OPEN_UPVALUE
};

struct function;
struct upvalue_cell;
struct value;

// A closure's captured references, index-aligned with the upvalue list of its
// function. Fixed once the closure is created.
typedef dyn_array<gc_ref<value>> capture_list;

// Runtime values. Scalars and strings are stored inline. Closures and
// UpvaluePtrs only hold weak references into the allocator, so no value ever
// owns heap storage. The one exception is the cell of an open upvalue, which
// is shared by the frame slot and the heap slot closures point to.
struct value {
    value_tag tag;
    union {
        f64 num;                // TAG_NUMBER
        bool b;                 // TAG_BOOL
        interned_string str;    // TAG_STRING
        gc_ref<function> fun;   // TAG_CLOSURE
        gc_ref<value> ptr;      // TAG_UPVALUE_PTR
    } datum;
    // TAG_CLOSURE only. Shared between all copies of the closure.
    shared_ptr<const capture_list> captures;
    // TAG_OPEN_UPVALUE only
    shared_ptr<upvalue_cell> cell;

    // default constructed values are nil
    value()
        : tag{TAG_NIL} {
        datum.num = 0;
    }

    // Only Number, Bool, Nil and String values can be equal. Reference-like
    // values (closures and upvalues) are never equal to anything, including
    // themselves.
    bool operator==(const value& v) const;
    bool operator!=(const value& v) const;
};

// Interior-mutable storage for a captured variable while its frame is live.
// Every holder observes writes to val.
struct upvalue_cell {
    value val;
};

// type information
inline value_tag vtag(const value& v) {
    return v.tag;
}
inline bool vis_number(const value& v) {
    return v.tag == TAG_NUMBER;
}
inline bool vis_bool(const value& v) {
    return v.tag == TAG_BOOL;
}
inline bool vis_nil(const value& v) {
    return v.tag == TAG_NIL;
}
inline bool vis_string(const value& v) {
    return v.tag == TAG_STRING;
}
inline bool vis_function(const value& v) {
    return v.tag == TAG_CLOSURE;
}
inline bool vis_upvalue_ptr(const value& v) {
    return v.tag == TAG_UPVALUE_PTR;
}
inline bool vis_open_upvalue(const value& v) {
    return v.tag == TAG_OPEN_UPVALUE;
}

// name of the variant, e.g. "Number"
const char* vtag_name(value_tag tag);

// Only nil and false are falsey. In particular 0 and "" are truthy.
inline bool vfalsey(const value& v) {
    return v.tag == TAG_NIL
        || (v.tag == TAG_BOOL && !v.datum.b);
}
inline bool vtruthy(const value& v) {
    return !vfalsey(v);
}

// creating values
inline value vbox_number(f64 n) {
    value res;
    res.tag = TAG_NUMBER;
    res.datum.num = n;
    return res;
}
inline value vbox_bool(bool b) {
    value res;
    res.tag = TAG_BOOL;
    res.datum.b = b;
    return res;
}
inline value vbox_nil() {
    return value{};
}
inline value vbox_string(interned_string s) {
    value res;
    res.tag = TAG_STRING;
    res.datum.str = s;
    return res;
}
value vbox_closure(gc_ref<function> fun, shared_ptr<const capture_list> captures);
// The referent must be live and must not itself be an UpvaluePtr. Breaking
// either rule is an invariant violation.
value vbox_upvalue_ptr(gc_ref<value> ref);
value vbox_open_upvalue(shared_ptr<upvalue_cell> cell);
// creates a fresh cell holding initial
value vbox_open_upvalue(const value& initial);

// accessing the contents of a value. These do not check the tag.
inline f64 vnumber(const value& v) {
    return v.datum.num;
}
inline bool vbool(const value& v) {
    return v.datum.b;
}
inline interned_string vstring(const value& v) {
    return v.datum.str;
}
inline const gc_ref<function>& vfunction(const value& v) {
    return v.datum.fun;
}
inline const capture_list& vcaptures(const value& v) {
    return *v.captures;
}
inline const gc_ref<value>& vupvalue_ref(const value& v) {
    return v.datum.ptr;
}
inline upvalue_cell& vcell(const value& v) {
    return *v.cell;
}

// convert a value to its display string. Upvalues display as the value they
// hold.
string v_to_string(const value& v);
// like v_to_string, but shows the variant, e.g. Bool(true). Never fails, even
// on reclaimed references.
string v_debug_string(const value& v);

// Follow one level of UpvaluePtr indirection. Anything else is returned as is.
value vderef(const value& v);
// The value a read of v observes: the referent of an UpvaluePtr or the
// content of an open upvalue cell.
value vresolve(const value& v);

// Overwrite a number in place. Writes tunnel through UpvaluePtr, so this
// reaches the real storage of a closed variable. Every other variant,
// including an open upvalue, is left untouched. Returns true on success.
bool vupdate_number(value& v, f64 n);

// coercions. These report failures through err (which may be null) rather
// than raising errors, so the VM can turn them into language-level errors.
// Only the number coercion looks through UpvaluePtr.
optional<f64> vto_number(const value& v, fault* err);
const bool* vto_bool(const value& v, fault* err);
bool* vto_bool(value& v, fault* err);
optional<interned_string> vto_string(const value& v, fault* err);

// report the references held by v to a collector
void vtrace(const value& v, gc_visitor* visitor);

// Structural comparison for test tooling. Agrees with == on scalars and
// strings; closures compare by deep equality of their functions and of the
// values they captured (a reclaimed capture only matches another reclaimed
// one), and upvalues by deep equality of their contents.
bool vdeep_eq(const value& a, const value& b);

}

#endif
