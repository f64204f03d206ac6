#pragma once

namespace bulkcp {

/// Enable or disable log_info output (set from -v/--verbose).
void set_verbose_logging(bool enabled);
bool verbose_logging();

/// Informational message to stdout, only when verbose logging is enabled.
void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

/// Always printed to stderr with a WARNING: prefix.
void log_warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

/// Always printed to stderr with an ERROR: prefix.
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

}  // namespace bulkcp
