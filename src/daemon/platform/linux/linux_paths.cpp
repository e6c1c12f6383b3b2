#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <unistd.h>

namespace platform {

namespace {

std::string xdg_dir(const char* var, const char* home_fallback) {
    const char* xdg = std::getenv(var);
    if (xdg && *xdg) return std::string(xdg) + "/inkwell";
    const char* home = std::getenv("HOME");
    if (!home || !*home) return {};
    return std::string(home) + home_fallback + "/inkwell";
}

} // namespace

std::string config_dir() {
    return xdg_dir("XDG_CONFIG_HOME", "/.config");
}

std::string data_dir() {
    return xdg_dir("XDG_DATA_HOME", "/.local/share");
}

std::string ipc_endpoint() {
    if (const char* over = std::getenv("INKWELL_SOCKET"); over && *over) return over;
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg && *xdg) return std::string(xdg) + "/inkwell.sock";
    return "/tmp/inkwell-" + std::to_string(::getuid()) + ".sock";
}

} // namespace platform
