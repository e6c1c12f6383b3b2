#include "platform/linux/unix_socket_client.hpp"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

UnixSocketClient::UnixSocketClient() = default;

UnixSocketClient::~UnixSocketClient() {
    close();
}

bool UnixSocketClient::connect(const std::string& endpoint) {
    sockaddr_un addr{};
    if (endpoint.size() >= sizeof(addr.sun_path)) return false;

    close();
    fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd_ < 0) return false;

    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, endpoint.c_str(), sizeof(addr.sun_path) - 1);

    if (::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(fd_);
        fd_ = -1;
        return false;
    }
    return true;
}

bool UnixSocketClient::send(const nlohmann::json& cmd) {
    if (fd_ < 0) return false;
    std::string msg = cmd.dump() + "\n";
    size_t off = 0;
    while (off < msg.size()) {
        ssize_t sent = ::send(fd_, msg.data() + off, msg.size() - off, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        off += static_cast<size_t>(sent);
    }
    return true;
}

RecvStatus UnixSocketClient::recv(nlohmann::json& response, int timeout_ms) {
    if (fd_ < 0) return RecvStatus::Closed;

    pollfd pfd{.fd = fd_, .events = POLLIN, .revents = 0};

    // A previous recv may have buffered more than one line.
    while (buf_.find('\n') == std::string::npos) {
        int ret = ::poll(&pfd, 1, timeout_ms);
        if (ret < 0 && errno == EINTR) continue;
        if (ret == 0) return RecvStatus::Timeout;
        if (ret < 0) return RecvStatus::Closed;

        char tmp[4096];
        ssize_t n = ::recv(fd_, tmp, sizeof(tmp), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return RecvStatus::Closed;
        buf_.append(tmp, static_cast<size_t>(n));
    }

    auto pos = buf_.find('\n');
    response = nlohmann::json::parse(buf_.substr(0, pos), nullptr, false);
    buf_.erase(0, pos + 1);
    return response.is_discarded() ? RecvStatus::Malformed : RecvStatus::Ok;
}

void UnixSocketClient::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    buf_.clear();
}
