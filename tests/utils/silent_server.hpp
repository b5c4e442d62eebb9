#pragma once

#include <string>

namespace test_utils {

// TCP listener on 127.0.0.1 that never accepts. The kernel completes the
// handshake from the backlog, so clients connect, send, and then wait for a
// reply that never comes.
class SilentServer {
public:
    SilentServer();
    ~SilentServer();

    SilentServer(const SilentServer&) = delete;
    SilentServer& operator=(const SilentServer&) = delete;

    int port() const { return port_; }
    std::string baseUrl() const { return "http://127.0.0.1:" + std::to_string(port_); }

private:
    int fd_ = -1;
    int port_ = 0;
};

} // namespace test_utils
