#include "bytes.hpp"

#include "obj.hpp"

#include <iomanip>
#include <sstream>

namespace lox {

u8 instr_width(u8 instr) {
    switch (instr) {
    case OP_NIL:
    case OP_TRUE:
    case OP_FALSE:
    case OP_POP:
    case OP_EQUAL:
    case OP_GREATER:
    case OP_LESS:
    case OP_ADD:
    case OP_SUBTRACT:
    case OP_MULTIPLY:
    case OP_DIVIDE:
    case OP_NOT:
    case OP_NEGATE:
    case OP_PRINT:
    case OP_CLOSE_UPVALUE:
    case OP_RETURN:
        return 1;
    case OP_GET_LOCAL:
    case OP_SET_LOCAL:
    case OP_GET_UPVALUE:
    case OP_SET_UPVALUE:
    case OP_CALL:
        return 2;
    case OP_CONSTANT:
    case OP_GET_GLOBAL:
    case OP_DEFINE_GLOBAL:
    case OP_SET_GLOBAL:
    case OP_JUMP:
    case OP_JUMP_IF_FALSE:
    case OP_LOOP:
    case OP_CLOSURE:
        return 3;
    default:
        // unknown opcodes are skipped one byte at a time
        return 1;
    }
}

u8 code_chunk::read_byte(code_address where) const {
    return code[where];
}

u16 code_chunk::read_short(code_address where) const {
    u16 lo = code[where];
    u16 hi = code[where + 1];
    return (hi << 8) | lo;
}

void code_chunk::write_byte(u8 data) {
    code.push_back(data);
}

void code_chunk::write_byte(u8 data, code_address where) {
    code[where] = data;
}

void code_chunk::write_short(u16 data) {
    u8 lo = data & 255;
    u8 hi = (data >> 8) & 255;
    write_byte(lo);
    write_byte(hi);
}

void code_chunk::write_short(u16 data, code_address where) {
    u8 lo = data & 255;
    u8 hi = (data >> 8) & 255;
    code[where] = lo;
    code[where + 1] = hi;
}

constant_id code_chunk::add_constant(const value& v) {
    if (constants.size > max_constant_id) {
        fatal("bytes", "Too many constants in one chunk.");
    }
    auto id = constants.size;
    constants.push_back(v);
    return id;
}

const value& code_chunk::get_constant(constant_id id) const {
    if (id >= constants.size) {
        fatal("bytes", "Constant id " + std::to_string(id) + " out of range.");
    }
    return constants[id];
}

void code_chunk::add_source_loc(const source_loc& s) {
    if (source_info.size > 0) {
        auto& last = source_info[source_info.size - 1];
        if (last.loc == s) {
            return;
        }
        // no code was emitted since the last location, so replace it
        if (last.start_addr == code.size) {
            last.loc = s;
            return;
        }
    }
    source_info.push_back(code_info{code.size, s});
}

source_loc code_chunk::location_of(code_address addr) const {
    for (u32 i = source_info.size; i > 0; --i) {
        if (source_info[i-1].start_addr <= addr) {
            return source_info[i-1].loc;
        }
    }
    return source_loc{};
}

bool deep_eq(const code_chunk& a, const code_chunk& b) {
    if (a.code.size != b.code.size
            || a.constants.size != b.constants.size
            || a.source_info.size != b.source_info.size) {
        return false;
    }
    for (u32 i = 0; i < a.code.size; ++i) {
        if (a.code[i] != b.code[i]) {
            return false;
        }
    }
    for (u32 i = 0; i < a.constants.size; ++i) {
        if (!vdeep_eq(a.constants[i], b.constants[i])) {
            return false;
        }
    }
    for (u32 i = 0; i < a.source_info.size; ++i) {
        if (a.source_info[i].start_addr != b.source_info[i].start_addr
                || a.source_info[i].loc != b.source_info[i].loc) {
            return false;
        }
    }
    return true;
}

static const char* op_name(u8 instr) {
    switch (instr) {
    case OP_CONSTANT:      return "constant";
    case OP_NIL:           return "nil";
    case OP_TRUE:          return "true";
    case OP_FALSE:         return "false";
    case OP_POP:           return "pop";
    case OP_GET_LOCAL:     return "get-local";
    case OP_SET_LOCAL:     return "set-local";
    case OP_GET_GLOBAL:    return "get-global";
    case OP_DEFINE_GLOBAL: return "define-global";
    case OP_SET_GLOBAL:    return "set-global";
    case OP_GET_UPVALUE:   return "get-upvalue";
    case OP_SET_UPVALUE:   return "set-upvalue";
    case OP_EQUAL:         return "equal";
    case OP_GREATER:       return "greater";
    case OP_LESS:          return "less";
    case OP_ADD:           return "add";
    case OP_SUBTRACT:      return "subtract";
    case OP_MULTIPLY:      return "multiply";
    case OP_DIVIDE:        return "divide";
    case OP_NOT:           return "not";
    case OP_NEGATE:        return "negate";
    case OP_PRINT:         return "print";
    case OP_JUMP:          return "jump";
    case OP_JUMP_IF_FALSE: return "jump-if-false";
    case OP_LOOP:          return "loop";
    case OP_CALL:          return "call";
    case OP_CLOSURE:       return "closure";
    case OP_CLOSE_UPVALUE: return "close-upvalue";
    case OP_RETURN:        return "return";
    default:               return nullptr;
    }
}

static void disassemble_instr(const code_chunk& chunk, code_address i,
        std::ostream& out) {
    auto instr = chunk.read_byte(i);
    auto name = op_name(instr);
    if (name == nullptr) {
        out << "<unrecognized opcode: " << (i32)instr << ">";
        return;
    }
    out << name;
    auto width = instr_width(instr);
    if (i + width > chunk.code.size) {
        out << " <truncated>";
        return;
    }
    switch (instr) {
    case OP_JUMP:
    case OP_JUMP_IF_FALSE:
        out << " " << chunk.read_short(i+1) << "    ; -> "
            << i + width + chunk.read_short(i+1);
        return;
    case OP_LOOP:
        out << " " << chunk.read_short(i+1) << "    ; -> "
            << (i64)(i + width) - chunk.read_short(i+1);
        return;
    default:
        break;
    }
    if (width == 2) {
        out << " " << (i32)chunk.read_byte(i+1);
    } else if (width == 3) {
        auto id = chunk.read_short(i+1);
        out << " " << id;
        if (id < chunk.constants.size) {
            auto& c = chunk.constants[id];
            out << "    ; " << (vis_string(c) ? v_debug_string(c) : v_to_string(c));
            if (instr == OP_CLOSURE && vis_function(c)) {
                auto& f = vfunction(c).unwrap_upgrade();
                for (auto& u : f.upvalues) {
                    out << "\n        | " << (u.is_local ? "local " : "upvalue ")
                        << (i32)u.index;
                }
            }
        }
    }
}

string disassemble(const code_chunk& chunk, const string& header) {
    std::ostringstream os;
    os << "; " << header << '\n';
    for (code_address i = 0; i < chunk.code.size;
            i += instr_width(chunk.code[i])) {
        os << std::setw(4) << std::setfill('0') << i << ' ';
        os << std::setw(4) << std::setfill(' ') << chunk.location_of(i).line
           << ' ';
        disassemble_instr(chunk, i, os);
        os << '\n';
    }
    return os.str();
}

}
