#include "strings.hpp"

namespace lox {

const string& interned_string::operator*() const {
    return table->text(id);
}

const string* interned_string::operator->() const {
    return &table->text(id);
}

string interned_string::to_owned() const {
    return table->text(id);
}

bool interned_string::operator==(const interned_string& other) const {
    if (table == other.table) {
        return id == other.id;
    }
    return **this == *other;
}

bool interned_string::operator!=(const interned_string& other) const {
    return !(*this == other);
}

string_table::~string_table() {
    for (auto x : by_id) {
        delete x;
    }
}

interned_string string_table::intern(const string& str) {
    auto v = by_name.get(str);
    if (v.has_value()) {
        return interned_string{this, *v};
    }
    if (by_id.size == (u32)-1) {
        fatal("strings", "String table exhausted.");
    }
    symbol_id id = by_id.size;
    by_id.push_back(new string{str});
    by_name.insert(str, id);
    return interned_string{this, id};
}

optional<interned_string> string_table::find(const string& str) const {
    auto v = by_name.get(str);
    if (!v.has_value()) {
        return std::nullopt;
    }
    return interned_string{this, *v};
}

bool string_table::is_internal(const string& str) const {
    return by_name.has_key(str);
}

const string& string_table::text(symbol_id id) const {
    if (id >= by_id.size) {
        fatal("strings", "Interned string id " + std::to_string(id)
                + " was not produced by this table.");
    }
    return *by_id[id];
}

u32 string_table::size() const {
    return by_id.size;
}

}
