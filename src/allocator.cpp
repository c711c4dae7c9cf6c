#include "allocator.hpp"

namespace lox {

allocator::allocator(logger* log, const alloc_config& config)
    : log{log}
    , config{config}
    , values{"value", log, config.trace, config.init_slots}
    , functions{"function", log, config.trace, config.init_slots} {
}

gc_ref<value> allocator::add_value(const value& v) {
    return values.add(vderef(v));
}

gc_ref<function> allocator::add_function(function&& f) {
    return functions.add(std::move(f));
}

void allocator::reclaim(const gc_ref<value>& ref) {
    values.reclaim(ref);
}

void allocator::reclaim(const gc_ref<function>& ref) {
    functions.reclaim(ref);
}

u32 allocator::live_values() const {
    return values.live_count();
}

u32 allocator::live_functions() const {
    return functions.live_count();
}

logger* allocator::get_logger() const {
    return log;
}

bool allocator::tracing() const {
    return config.trace && log != nullptr;
}

void allocator::trace_info(const string& message) const {
    if (tracing()) {
        log->log_info("memory", message);
    }
}

}
