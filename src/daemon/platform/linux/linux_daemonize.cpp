#include "platform/daemonizer.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace platform {

std::expected<void, Error> daemonize() {
    pid_t pid = fork();
    if (pid < 0) {
        return std::unexpected(make_error(ErrorCode::InvalidState,
                                          std::string("fork() failed: ") + std::strerror(errno)));
    }
    if (pid > 0) _exit(0);

    if (setsid() < 0) {
        return std::unexpected(make_error(ErrorCode::InvalidState,
                                          std::string("setsid() failed: ") + std::strerror(errno)));
    }

    // Fork again so the daemon can never reacquire a controlling terminal
    pid = fork();
    if (pid < 0) {
        return std::unexpected(make_error(ErrorCode::InvalidState,
                                          std::string("fork() failed: ") + std::strerror(errno)));
    }
    if (pid > 0) _exit(0);

    int devnull = ::open("/dev/null", O_RDWR | O_CLOEXEC);
    if (devnull >= 0) {
        ::dup2(devnull, STDIN_FILENO);
        ::dup2(devnull, STDOUT_FILENO);
        ::dup2(devnull, STDERR_FILENO);
        if (devnull > STDERR_FILENO) ::close(devnull);
    }
    return {};
}

} // namespace platform
