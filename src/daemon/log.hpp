#pragma once

#include <format>
#include <string>

// stderr logging. Info lines only appear when verbose is enabled;
// warnings and errors are always printed.
namespace logging {

void set_verbose(bool verbose);
bool verbose();

void write(const char* level, const std::string& msg);

} // namespace logging

template <typename... Args>
void log_info(std::format_string<Args...> fmt, Args&&... args) {
    if (!logging::verbose()) return;
    logging::write("info", std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void log_warn(std::format_string<Args...> fmt, Args&&... args) {
    logging::write("warn", std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void log_error(std::format_string<Args...> fmt, Args&&... args) {
    logging::write("error", std::format(fmt, std::forward<Args>(args)...));
}
