#pragma once

#include "error.hpp"

#include <filesystem>

class SessionObserver {
public:
    virtual ~SessionObserver() = default;
    virtual void session_did_start() {}
    virtual void session_did_complete(const std::filesystem::path& /*audio_path*/) {}
    virtual void session_did_cancel() {}
    virtual void session_did_fail(const Error& /*error*/) {}
};
