#pragma once

#include "error.hpp"

#include <expected>

namespace platform {

// Detaches from the controlling terminal. Returns only in the daemon
// process; the launching process exits.
std::expected<void, Error> daemonize();

} // namespace platform
