#include "platform/linux/linux_event_loop.hpp"

#include "log.hpp"
#include "platform/platform_paths.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <unistd.h>

LinuxEventLoop::LinuxEventLoop(Config config)
    : config_(std::move(config)),
      recorder_(config_.audio.sample_rate, config_.audio.max_seconds),
      core_(config_, engine_, recorder_, ipc_server_,
            [this]() {
                uint64_t val = 1;
                if (::write(worker_event_fd_, &val, sizeof(val)) < 0) {
                    log_error("eventfd write failed: {}", std::strerror(errno));
                }
            }) {}

LinuxEventLoop::~LinuxEventLoop() {
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (worker_event_fd_ >= 0) ::close(worker_event_fd_);
}

bool LinuxEventLoop::init() {
    // Before anything can spawn a worker that writes to it
    worker_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (worker_event_fd_ < 0) {
        log_error("eventfd failed: {}", std::strerror(errno));
        return false;
    }

    auto data = platform::data_dir();
    auto history_path = data.empty()
        ? (std::filesystem::temp_directory_path() / "inkwell" / "history.db").string()
        : data + "/history.db";
    if (!core_.init(history_path)) return false;

    auto ipc_path = platform::ipc_endpoint();
    if (!ipc_server_.start(ipc_path)) return false;
    log_info("IPC listening on {}", ipc_path);

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        log_error("epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        log_error("signalfd failed: {}", std::strerror(errno));
        return false;
    }

    auto add_fd = [this](int fd) {
        epoll_event ev{.events = EPOLLIN, .data = {.fd = fd}};
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) < 0) {
            log_error("epoll_ctl add {} failed: {}", fd, std::strerror(errno));
            return false;
        }
        return true;
    };

    if (!add_fd(signal_fd_) || !add_fd(ipc_server_.server_fd()) || !add_fd(worker_event_fd_)) {
        return false;
    }

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            log_error("epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) > 0) {
                    log_info("received signal {}, shutting down", info.ssi_signo);
                }
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == ipc_server_.server_fd()) {
                int client_fd = ipc_server_.accept_client();
                if (client_fd >= 0) {
                    epoll_event ev{.events = EPOLLIN, .data = {.fd = client_fd}};
                    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev) < 0) {
                        log_warn("epoll_ctl add client failed: {}", std::strerror(errno));
                        ipc_server_.close_client(client_fd);
                    }
                }
                continue;
            }

            if (fd == worker_event_fd_) {
                uint64_t val;
                if (::read(worker_event_fd_, &val, sizeof(val)) > 0) {
                    core_.on_job_complete();
                }
                continue;
            }

            handle_client(fd);
        }
    }

    core_.shutdown();
    ipc_server_.stop();
}

void LinuxEventLoop::handle_client(int fd) {
    std::vector<nlohmann::json> cmds;
    auto status = ipc_server_.read_commands(fd, cmds);
    if (status == IpcServer::ReadStatus::Closed) {
        drop_client(fd);
        return;
    }

    for (const auto& cmd : cmds) {
        if (auto response = core_.handle_command(fd, cmd)) {
            ipc_server_.send_response(fd, *response);
        }
    }
}

void LinuxEventLoop::drop_client(int fd) {
    epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
    core_.remove_waiting_client(fd);
    ipc_server_.close_client(fd);
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}
