#pragma once

#include "config.hpp"
#include "daemon_core.hpp"
#include "inference/whisper_engine.hpp"
#include "platform/linux/pipewire_recorder.hpp"
#include "platform/linux/unix_socket_server.hpp"

#include <atomic>
#include <string>

class LinuxEventLoop {
public:
    explicit LinuxEventLoop(Config config);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();
    void request_stop();

private:
    void handle_client(int fd);
    void drop_client(int fd);

    Config config_;

    // Platform implementations (constructed before core_)
    WhisperEngine engine_;
    PipeWireRecorder recorder_;
    UnixSocketServer ipc_server_;

    // Portable business logic
    DaemonCore core_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int worker_event_fd_ = -1;

    std::atomic<bool> running_{false};
};
