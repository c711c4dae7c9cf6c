// base.hpp -- common definitions and error handling code for lox

#ifndef __LOX_BASE_HPP
#define __LOX_BASE_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <iostream>

namespace lox {

/// aliases imported from std
template<class T> using optional = std::optional<T>;
using string = std::string;

template<class T> using shared_ptr = std::shared_ptr<T>;
template<class T> using unique_ptr = std::unique_ptr<T>;

/// integer/float typedefs by bitwidth
typedef uint8_t u8;
typedef uint16_t u16;
typedef uint32_t u32;
typedef uint64_t u64;

typedef int8_t i8;
typedef int16_t i16;
typedef int32_t i32;
typedef int64_t i64;

// we assume we have 64-bit double
static_assert(sizeof(double) == 8);
typedef double f64;

// this is implemented for std::string and unsigned integers
template<typename T> u64 hash(const T& v);
template<> u64 hash<string>(const string& v);
template<> u64 hash<uint64_t>(const uint64_t& v);
template<> u64 hash<uint32_t>(const uint32_t& v);

// naming convention: you can do arithmetic on types whose names end in
// _address, but should not on types that end in _id.

// absolute addresses on the stack
typedef u32 stack_address;
// indexes stack values in the current call frame as well as upvalues
typedef u8 local_address;
// addresses in bytecode
typedef u32 code_address;
// used to identify constant values
typedef u16 constant_id;
// used to identify interned strings
typedef u32 symbol_id;

constexpr u64 max_local_address = 255;
constexpr u64 max_constant_id = 65535;

// Used to track debugging information. Line 0 means the location is unknown
// (e.g. for bytecode generated internally).
struct source_loc {
    int line = 0;
    int col = 0;
    bool operator==(const source_loc& other) const;
    bool operator!=(const source_loc& other) const;
};

// Recoverable errors. Operations that can fail on user data (e.g. type
// mismatches in coercions) fill one of these in and report failure to the
// caller, which decides how to surface it as a language-level error.
struct fault {
    bool happened = false;
    source_loc origin;
    string subsystem;
    string message;
};
inline void set_fault(fault* f,
        const source_loc& origin,
        const string& subsystem,
        const string& message) {
    f->happened = true;
    f->origin = origin;
    f->subsystem = subsystem;
    f->message = message;
}
inline void set_fault(fault* f,
        const string& subsystem,
        const string& message) {
    set_fault(f, source_loc{}, subsystem, message);
}

inline void emit_error(std::ostream* out, const fault& err) {
    auto& origin = err.origin;
    (*out) << "[" + err.subsystem + "] Error at line " << origin.line
           << ", col " << origin.col << ":\n\t"
           << err.message << '\n';
}

// Thrown when an internal invariant of the runtime is broken, e.g. a weak
// reference is upgraded after its referent was reclaimed. These always
// indicate a bug in the compiler, the closure capture logic or the collector.
// Nothing in the runtime catches them.
class invariant_violation : public std::exception {
    string formatted;

public:
    const string subsystem;
    const string message;

    invariant_violation(const string& subsystem, const string& message);

    const char* what() const noexcept override {
        return formatted.c_str();
    }
};

// raise an invariant_violation
[[noreturn]] void fatal(const string& subsystem, const string& message);

}

#endif
