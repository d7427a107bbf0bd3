#pragma once

namespace objgate {

/// printf-style logging. Info goes to stdout, warnings and errors to stderr.
/// objgate-migrate redirects both streams to the configured log file.
void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

/// Only emitted when verbose logging is enabled.
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

void set_verbose_logging(bool enabled);
bool verbose_logging();

}  // namespace objgate
