// log.hpp -- diagnostics for the value core and whatever embeds it
#ifndef __LOX_LOG_HPP
#define __LOX_LOG_HPP

#include "base.hpp"

namespace lox {

class logger {
private:
    std::ostream* err_out;
    std::ostream* info_out;
    // counted even when the corresponding stream is null
    u32 num_errors = 0;
    u32 num_warnings = 0;

public:
    // info_out and err_out must be externally managed and ensured to outlive
    // the logger. They may be null, in which case messages are simply ignored.
    logger(std::ostream* err_out, std::ostream* info_out);

    // All log messages accept an optional source_loc

    // this logs a fault (as an error)
    void log_fault(const fault& err);
    // an error goes to err_out and indicates a stoppage of control flow
    void log_error(const source_loc& origin,
            const string& subsystem,
            const string& message);
    void log_error(const string& subsystem, const string& message);

    // a warning goes to err_out but is not considered fatal
    void log_warning(const string& subsystem, const string& message);
    void log_warning(const source_loc& origin,
            const string& subsystem,
            const string& message);

    // info messages are logged to info_out
    void log_info(const string& subsystem, const string& message);
    void log_info(const source_loc& origin,
            const string& subsystem,
            const string& message);

    u32 error_count() const;
    u32 warning_count() const;
};

}

#endif
