#pragma once
#include <string>

namespace mycelium::ipc {

// Listening Unix domain socket for bridge peers. Accepted fds are
// non-blocking and owned by the caller.
class SocketServer {
public:
    explicit SocketServer(const std::string& socket_path);
    ~SocketServer();

    // Non-copyable
    SocketServer(const SocketServer&) = delete;
    SocketServer& operator=(const SocketServer&) = delete;

    // Initialize and bind socket
    bool init();

    // Get server fd for event loop
    int get_server_fd() const { return server_fd_; }

    // Accept new connection, returns client fd or -1 when none is pending
    int accept_connection();

    // Cleanup
    void stop();

    // Get socket path
    const std::string& socket_path() const { return socket_path_; }

private:
    std::string socket_path_;
    int server_fd_ = -1;
};

// Connect to a listening bridge socket. Returns a non-blocking fd or -1.
int connect_unix(const std::string& socket_path);

} // namespace mycelium::ipc
