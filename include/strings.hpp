// strings.hpp -- the string intern table and the handles it hands out
#ifndef __LOX_STRINGS_HPP
#define __LOX_STRINGS_HPP

#include "array.hpp"
#include "base.hpp"
#include "table.hpp"

namespace lox {

class string_table;

// Non-owning handle to a string stored in a string_table. The table must
// outlive every handle it produces. This is a plain aggregate so that it can
// live inside the value union.
struct interned_string {
    const string_table* table;
    symbol_id id;

    // dereference to the interned text
    const string& operator*() const;
    const string* operator->() const;
    // copy out the interned text
    string to_owned() const;

    // handles from the same table compare by id. Handles from different
    // tables fall back to comparing text.
    bool operator==(const interned_string& other) const;
    bool operator!=(const interned_string& other) const;
};

// Every distinct string gets exactly one entry, so equal text always yields
// equal handles. Entries are never evicted.
class string_table {
private:
    table<string,symbol_id> by_name;
    // pointers here b/c string itself is not trivially copyable, and we hand
    // out references to the text
    dyn_array<string*> by_id;

public:
    string_table() = default;
    string_table(const string_table&) = delete;
    string_table& operator=(const string_table&) = delete;
    ~string_table();

    interned_string intern(const string& str);
    // look up a string without interning it
    optional<interned_string> find(const string& str) const;
    bool is_internal(const string& str) const;

    // id must have been produced by this table
    const string& text(symbol_id id) const;
    u32 size() const;
};

}

#endif
