#include "ipc/control_plane.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iostream>

#ifdef __linux__
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#endif

namespace puv::ipc {

namespace {

std::string firstLine(const std::string& s) {
    const auto end = s.find_first_of("\r\n");
    return end == std::string::npos ? s : s.substr(0, end);
}

}  // namespace

UnixControlServer::~UnixControlServer() {
    stop();
}

bool UnixControlServer::start(const std::string& socket_path, Handler handler, std::string& error) {
    stop();
#ifdef __linux__
    sockaddr_un addr{};
    if (socket_path.empty() || socket_path.size() >= sizeof(addr.sun_path)) {
        error = "control socket path empty or too long: " + socket_path;
        return false;
    }

    const int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) {
        error = std::string("control socket: ") + std::strerror(errno);
        return false;
    }
    ::unlink(socket_path.c_str());
    addr.sun_family = AF_UNIX;
    std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", socket_path.c_str());
    if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 || listen(fd, 8) < 0) {
        error = "control socket bind/listen on " + socket_path + ": " + std::strerror(errno);
        close(fd);
        return false;
    }

    socket_path_ = socket_path;
    handler_ = std::move(handler);
    listen_fd_ = fd;
    running_.store(true);
    thread_ = std::thread(&UnixControlServer::serveLoop, this);
    error.clear();
    return true;
#else
    (void)socket_path;
    (void)handler;
    error = "UnixControlServer requires Linux";
    return false;
#endif
}

void UnixControlServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
#ifdef __linux__
    if (listen_fd_ >= 0) {
        shutdown(listen_fd_, SHUT_RDWR);
    }
#endif
    if (thread_.joinable()) {
        thread_.join();
    }
#ifdef __linux__
    if (listen_fd_ >= 0) {
        close(listen_fd_);
        listen_fd_ = -1;
    }
    ::unlink(socket_path_.c_str());
#endif
}

std::string UnixControlServer::dispatch(const std::string& request) {
    if (!handler_) {
        return "ERR no-handler\n";
    }
    try {
        return handler_(request);
    } catch (const std::exception& e) {
        std::cerr << "[control] handler failed for '" << request << "': " << e.what() << '\n';
        return std::string("ERR ") + e.what() + "\n";
    }
}

void UnixControlServer::serveLoop() {
#ifdef __linux__
    while (running_.load()) {
        const int client_fd = accept(listen_fd_, nullptr, nullptr);
        if (client_fd < 0) {
            if (running_.load() && errno == EINTR) {
                continue;
            }
            break;
        }

        std::string request;
        char buf[512];
        while (request.find('\n') == std::string::npos && request.size() < 4096) {
            const ssize_t n = recv(client_fd, buf, sizeof(buf), 0);
            if (n <= 0) {
                break;
            }
            request.append(buf, static_cast<std::size_t>(n));
        }

        const std::string line = firstLine(request);
        const std::string reply = line.empty() ? std::string("ERR empty\n") : dispatch(line);
        if (send(client_fd, reply.data(), reply.size(), MSG_NOSIGNAL) < 0) {
            std::cerr << "[control] reply failed: " << std::strerror(errno) << '\n';
        }
        close(client_fd);
    }
#endif
}

bool unixControlRequest(const std::string& socket_path, const std::string& request, std::string& response, std::string& error) {
#ifdef __linux__
    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) {
        error = "socket failed";
        return false;
    }
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", socket_path.c_str());
    if (connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        error = "connect to " + socket_path + " failed: " + std::strerror(errno);
        close(fd);
        return false;
    }
    const std::string line = (!request.empty() && request.back() == '\n') ? request : request + "\n";
    if (send(fd, line.data(), line.size(), MSG_NOSIGNAL) < 0) {
        error = "send failed";
        close(fd);
        return false;
    }
    response.clear();
    char buf[2048];
    while (true) {
        const ssize_t n = recv(fd, buf, sizeof(buf), 0);
        if (n < 0) {
            error = "recv failed";
            close(fd);
            return false;
        }
        if (n == 0) {
            break;
        }
        response.append(buf, static_cast<std::size_t>(n));
    }
    close(fd);
    error.clear();
    return true;
#else
    (void)socket_path;
    (void)request;
    (void)response;
    error = "unixControlRequest requires Linux";
    return false;
#endif
}

}  // namespace puv::ipc
