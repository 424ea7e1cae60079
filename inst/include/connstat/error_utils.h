#ifndef CONNSTAT_ERROR_UTILS_H
#define CONNSTAT_ERROR_UTILS_H

#include <cstdarg>
#include <cstddef>
#include <cstdio>
#include <cstring>

#include <R.h>
#include <Rinternals.h>
#include <R_ext/Error.h>

// Location prefix for messages raised from the R entry points
#define LOC_INFO __FILE__, __LINE__

namespace connstat {

/**
 * @brief Raises an R error "In <file> (line <n>): <message>"
 *
 * Does not return. The message is formatted into fixed buffers first so
 * that nothing needs destructing when Rf_error jumps back to R.
 */
inline void report_error(const char* file, int line, const char* format, ...) {
    constexpr size_t loc_size = 1024;
    constexpr size_t msg_size = 7168;
    char location[loc_size];
    char message[msg_size];

    int loc_len = std::snprintf(location, loc_size, "In %s (line %d): ", file, line);
    if (loc_len < 0 || static_cast<size_t>(loc_len) >= loc_size) {
        Rf_error("Error location string truncated");
    }

    va_list args;
    va_start(args, format);
    int msg_len = std::vsnprintf(message, msg_size, format, args);
    va_end(args);
    if (msg_len < 0) {
        Rf_error("Error message could not be formatted");
    }
    if (static_cast<size_t>(msg_len) >= msg_size) {
        // keep the truncated message rather than losing it
        msg_len = static_cast<int>(msg_size) - 1;
    }

    char final_message[loc_size + msg_size];
    std::memcpy(final_message, location, static_cast<size_t>(loc_len));
    std::memcpy(final_message + loc_len, message, static_cast<size_t>(msg_len) + 1);

    Rf_error("%s", final_message);
}

} // namespace connstat

#define REPORT_ERROR(...) connstat::report_error(LOC_INFO, __VA_ARGS__)

#endif // CONNSTAT_ERROR_UTILS_H
