#include "log.hpp"

namespace lox {

logger::logger(std::ostream* err_out, std::ostream* info_out)
    : err_out{err_out}
    , info_out{info_out} {
}

void logger::log_fault(const fault& err) {
    log_error(err.origin, err.subsystem, err.message);
}

static void print_loc(std::ostream* out, const source_loc& origin) {
    (*out) << "line " << origin.line << ", col " << origin.col;
}

static void write_entry(std::ostream* out,
        const char* level,
        const source_loc* origin,
        const string& subsystem,
        const string& message) {
    if (out == nullptr) {
        return;
    }
    (*out) << level << ' ' << subsystem;
    if (origin != nullptr) {
        (*out) << ": ";
        print_loc(out, *origin);
    }
    (*out) << ":\n\t" << message << '\n';
}

void logger::log_error(const source_loc& origin,
        const string& subsystem,
        const string& message) {
    ++num_errors;
    write_entry(err_out, "[ERROR]", &origin, subsystem, message);
}

void logger::log_error(const string& subsystem,
        const string& message) {
    ++num_errors;
    write_entry(err_out, "[ERROR]", nullptr, subsystem, message);
}

void logger::log_warning(const source_loc& origin,
        const string& subsystem,
        const string& message) {
    ++num_warnings;
    write_entry(err_out, "[WARNING]", &origin, subsystem, message);
}

void logger::log_warning(const string& subsystem,
        const string& message) {
    ++num_warnings;
    write_entry(err_out, "[WARNING]", nullptr, subsystem, message);
}

void logger::log_info(const source_loc& origin,
        const string& subsystem,
        const string& message) {
    write_entry(info_out, "[INFO]", &origin, subsystem, message);
}

void logger::log_info(const string& subsystem,
        const string& message) {
    write_entry(info_out, "[INFO]", nullptr, subsystem, message);
}

u32 logger::error_count() const {
    return num_errors;
}

u32 logger::warning_count() const {
    return num_warnings;
}

}
