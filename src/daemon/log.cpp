#include "log.hpp"

#include <atomic>
#include <mutex>
#include <print>

namespace logging {

namespace {
std::atomic<bool> g_verbose{false};
std::mutex g_write_mu;
} // namespace

void set_verbose(bool verbose) {
    g_verbose.store(verbose, std::memory_order_relaxed);
}

bool verbose() {
    return g_verbose.load(std::memory_order_relaxed);
}

void write(const char* level, const std::string& msg) {
    // Worker threads and the event loop both log; keep lines whole.
    std::lock_guard lock(g_write_mu);
    std::println(stderr, "[inkwell] {}: {}", level, msg);
}

} // namespace logging
