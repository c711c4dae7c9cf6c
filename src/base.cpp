#include "base.hpp"

namespace lox {

bool source_loc::operator==(const source_loc& other) const {
    return this->line == other.line
        && this->col == other.col;
}

bool source_loc::operator!=(const source_loc& other) const {
    return !(*this == other);
}

invariant_violation::invariant_violation(const string& subsystem,
        const string& message)
    : formatted{"[" + subsystem + "] invariant violation:\n\t" + message}
    , subsystem{subsystem}
    , message{message} {
}

void fatal(const string& subsystem, const string& message) {
    throw invariant_violation{subsystem, message};
}

// Hashes for std::string and integers use FNV-1a
template<> u64 hash<string>(const string& s) {
    static const u64 prime = 0x100000001b3;
    u64 res = 0xcbf29ce484222325;
    for (u32 i=0; i<s.length(); ++i) {
        res ^= (u8)s[i];
        res *= prime;
    }
    return res;
}

template<> u64 hash<u64>(const u64& u) {
    static const u64 prime = 0x100000001b3;
    u64 res = 0xcbf29ce484222325;
    auto bytes = u;
    for (int i = 0; i < 8; ++i) {
        res ^= (bytes & 0xff);
        res *= prime;
        bytes = bytes >> 8;
    }
    return res;
}

template<> u64 hash<u32>(const u32& u) {
    static const u64 prime = 0x100000001b3;
    u64 res = 0xcbf29ce484222325;
    auto bytes = u;
    for (int i = 0; i < 4; ++i) {
        res ^= (bytes & 0xff);
        res *= prime;
        bytes = bytes >> 8;
    }
    return res;
}

}
