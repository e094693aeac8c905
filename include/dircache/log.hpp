#pragma once

namespace dircache {

/// Enable or disable log_debug() output (off by default).
void set_verbose(bool verbose);
bool verbose();

void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

/// Only printed when verbose mode is on.
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

}  // namespace dircache
