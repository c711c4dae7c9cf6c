// bytecode definitions
#ifndef __LOX_BYTES_HPP
#define __LOX_BYTES_HPP

#include "array.hpp"
#include "base.hpp"
#include "values.hpp"

namespace lox {


/// instruction opcodes

// note: whenever an instruction uses a value on the stack, that value is popped
// off unless otherwise specified. Multi-byte operands are little-endian.

enum OPCODES : u8 {
    // constant SHORT, push the SHORTth constant
    OP_CONSTANT,
    // nil, push nil
    OP_NIL,
    // true, push true
    OP_TRUE,
    // false, push false
    OP_FALSE,
    // pop, pop one element off the top of the stack
    OP_POP,

    // get-local BYTE, push the BYTEth local of the current frame
    OP_GET_LOCAL,
    // set-local BYTE, set the BYTEth local to the top of the stack (not popped)
    OP_SET_LOCAL,
    // get-global SHORT, push the global named by constant SHORT
    OP_GET_GLOBAL,
    // define-global SHORT, bind the global named by constant SHORT
    OP_DEFINE_GLOBAL,
    // set-global SHORT, assign an existing global (not popped)
    OP_SET_GLOBAL,
    // get-upvalue BYTE, push the BYTEth captured variable of the current
    // closure
    OP_GET_UPVALUE,
    // set-upvalue BYTE, assign the BYTEth captured variable (not popped)
    OP_SET_UPVALUE,

    // comparison and arithmetic. stack arguments ->[b] a
    OP_EQUAL,
    OP_GREATER,
    OP_LESS,
    OP_ADD,
    OP_SUBTRACT,
    OP_MULTIPLY,
    OP_DIVIDE,
    OP_NOT,
    OP_NEGATE,

    // print, print the top of the stack
    OP_PRINT,

    // jump SHORT, add SHORT to the pc
    OP_JUMP,
    // jump-if-false SHORT, add SHORT to the pc if the top of the stack is
    // falsey (not popped)
    OP_JUMP_IF_FALSE,
    // loop SHORT, subtract SHORT from the pc
    OP_LOOP,
    // call BYTE, call the function BYTE+1 slots from the top with BYTE
    // arguments
    OP_CALL,
    // closure SHORT, instantiate the function in constant SHORT, capturing
    // variables according to its upvalue list
    OP_CLOSURE,
    // close-upvalue, close the upvalue at the top of the stack and pop it
    OP_CLOSE_UPVALUE,
    // return, return from the current function
    OP_RETURN
};

// gives the width of an instruction + its operands in bytes
u8 instr_width(u8 instr);

// associates instructions starting at start_addr with a source location
struct code_info {
    code_address start_addr;
    source_loc loc;
};

// bytecode together with its constants and source locations
struct code_chunk {
    dyn_array<u8> code;
    dyn_array<value> constants;
    // sorted by start_addr
    dyn_array<code_info> source_info;

    u8 read_byte(code_address where) const;
    u16 read_short(code_address where) const;

    void write_byte(u8 data);
    void write_byte(u8 data, code_address where);
    void write_short(u16 data);
    void write_short(u16 data, code_address where);

    // The compiler is responsible for staying under max_constant_id
    // constants. Exceeding it is an invariant violation.
    constant_id add_constant(const value& v);
    const value& get_constant(constant_id id) const;

    // set the source location for code written from here on
    void add_source_loc(const source_loc& s);
    // source location of the instruction at addr
    source_loc location_of(code_address addr) const;
};

// Compare two chunks field by field. Constants are compared with vdeep_eq.
// Intended for compiler tests.
bool deep_eq(const code_chunk& a, const code_chunk& b);

// human-readable listing of a chunk, one instruction per line
string disassemble(const code_chunk& chunk, const string& header);

}

#endif
