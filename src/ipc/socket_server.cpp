#include "ipc/socket_server.hpp"
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace mycelium::ipc {

namespace {

bool fill_address(const std::string& path, sockaddr_un& addr) {
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    if (path.size() >= sizeof(addr.sun_path)) {
        spdlog::error("Socket path too long: {}", path);
        return false;
    }
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    return true;
}

bool set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    return fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

} // anonymous namespace

SocketServer::SocketServer(const std::string& socket_path)
    : socket_path_(socket_path) {}

SocketServer::~SocketServer() {
    stop();
}

bool SocketServer::init() {
    sockaddr_un addr;
    if (!fill_address(socket_path_, addr)) {
        return false;
    }

    // Remove a stale socket file from a previous run
    unlink(socket_path_.c_str());

    server_fd_ = socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        spdlog::error("Failed to create socket: {}", strerror(errno));
        return false;
    }

    if (bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        spdlog::error("Failed to bind socket {}: {}", socket_path_, strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (listen(server_fd_, 16) < 0) {
        spdlog::error("Failed to listen on socket: {}", strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        unlink(socket_path_.c_str());
        return false;
    }

    spdlog::info("Bridge socket listening on {}", socket_path_);
    return true;
}

int SocketServer::accept_connection() {
    if (server_fd_ < 0) {
        return -1;
    }

    int client_fd = accept4(server_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (client_fd < 0) {
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            spdlog::error("Failed to accept connection: {}", strerror(errno));
        }
        return -1;
    }

    spdlog::debug("Accepted bridge connection (fd={})", client_fd);
    return client_fd;
}

void SocketServer::stop() {
    if (server_fd_ >= 0) {
        close(server_fd_);
        server_fd_ = -1;
        unlink(socket_path_.c_str());
        spdlog::debug("Bridge socket {} closed", socket_path_);
    }
}

int connect_unix(const std::string& socket_path) {
    sockaddr_un addr;
    if (!fill_address(socket_path, addr)) {
        return -1;
    }

    int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        spdlog::error("Failed to create socket: {}", strerror(errno));
        return -1;
    }

    if (connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        spdlog::error("Failed to connect to {}: {}", socket_path, strerror(errno));
        close(fd);
        return -1;
    }

    if (!set_nonblocking(fd)) {
        spdlog::error("Failed to make bridge fd non-blocking: {}", strerror(errno));
        close(fd);
        return -1;
    }

    return fd;
}

} // namespace mycelium::ipc
