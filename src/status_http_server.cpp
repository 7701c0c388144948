#include "status_http_server.h"

#include "NanoLogCpp17.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

using namespace NanoLog::LogLevels;

namespace {
constexpr unsigned kWorkerCount = 2;
constexpr std::size_t kMaxPendingConnections = 128;

std::string build_response(int code, const char *reason, const std::string &body, const std::string &content_type) {
    std::string resp;
    resp += "HTTP/1.1 " + std::to_string(code) + " " + reason + "\r\n";
    resp += "Content-Type: " + content_type + "\r\n";
    resp += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    resp += "Connection: close\r\n\r\n";
    resp += body;
    return resp;
}
}

void StatusHttpServer::route(const std::string &path, std::string content_type, Handler handler) {
    routes_[path] = Route{std::move(content_type), std::move(handler)};
}

bool StatusHttpServer::start(int port) {
    if (running_.exchange(true)) return false;

    listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (listen_fd_ < 0) {
        NANO_LOG(ERROR, "%s", "status server: failed to create socket");
        running_ = false;
        return false;
    }

    int opt = 1;
    setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(static_cast<uint16_t>(port));

    if (bind(listen_fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
        NANO_LOG(ERROR, "status server: failed to bind port %d: %s", port, std::strerror(errno));
        ::close(listen_fd_);
        listen_fd_ = -1;
        running_ = false;
        return false;
    }
    if (listen(listen_fd_, 64) < 0) {
        NANO_LOG(ERROR, "%s", "status server: listen() failed");
        ::close(listen_fd_);
        listen_fd_ = -1;
        running_ = false;
        return false;
    }

    accept_thread_ = std::thread(&StatusHttpServer::accept_loop, this);
    for (unsigned i = 0; i < kWorkerCount; ++i) {
        workers_.emplace_back(&StatusHttpServer::worker_loop, this);
    }
    NANO_LOG(NOTICE, "status server listening on port %d", port);
    return true;
}

void StatusHttpServer::stop() {
    if (!running_.exchange(false)) return;
    if (listen_fd_ >= 0) {
        ::shutdown(listen_fd_, SHUT_RDWR);
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
    {
        std::lock_guard lk(q_mu_);
    }
    q_cv_.notify_all();
    if (accept_thread_.joinable()) accept_thread_.join();
    for (auto &t : workers_) {
        if (t.joinable()) t.join();
    }
    workers_.clear();
    std::lock_guard lk(q_mu_);
    while (!conn_q_.empty()) {
        ::close(conn_q_.front());
        conn_q_.pop();
    }
    NANO_LOG(NOTICE, "%s", "status server stopped");
}

void StatusHttpServer::accept_loop() {
    while (running_.load()) {
        sockaddr_in cli{};
        socklen_t len = sizeof(cli);
        int fd = ::accept(listen_fd_, reinterpret_cast<sockaddr *>(&cli), &len);
        if (fd < 0) {
            if (!running_.load()) break;
            continue;
        }
        std::lock_guard lk(q_mu_);
        if (conn_q_.size() < kMaxPendingConnections) {
            conn_q_.push(fd);
            q_cv_.notify_one();
        } else {
            ::close(fd);
        }
    }
}

std::string StatusHttpServer::respond(const std::string &request) const {
    auto pos = request.find(' ');
    auto pos2 = pos == std::string::npos ? std::string::npos : request.find(' ', pos + 1);
    if (pos == std::string::npos || pos2 == std::string::npos) {
        return build_response(400, "Bad Request", "bad request\n", "text/plain");
    }
    auto method = request.substr(0, pos);
    auto path = request.substr(pos + 1, pos2 - pos - 1);
    path = path.substr(0, path.find('?'));
    if (method != "GET") {
        return build_response(405, "Method Not Allowed", "method not allowed\n", "text/plain");
    }
    auto it = routes_.find(path);
    if (it == routes_.end()) {
        return build_response(404, "Not Found", "not found\n", "text/plain");
    }
    try {
        return build_response(200, "OK", it->second.handler(), it->second.content_type);
    } catch (const std::exception &e) {
        NANO_LOG(ERROR, "status server: handler for %s failed: %s", path.c_str(), e.what());
        return build_response(500, "Internal Server Error", "internal error\n", "text/plain");
    }
}

void StatusHttpServer::worker_loop() {
    while (running_.load()) {
        int fd = -1;
        {
            std::unique_lock lk(q_mu_);
            q_cv_.wait(lk, [&] { return !running_.load() || !conn_q_.empty(); });
            if (!running_.load()) break;
            fd = conn_q_.front();
            conn_q_.pop();
        }

        char buf[2048]{};
        ssize_t n = ::recv(fd, buf, sizeof(buf) - 1, 0);
        std::string resp = n > 0 ? respond(std::string(buf, buf + n))
                                 : build_response(400, "Bad Request", "bad request\n", "text/plain");
        ::send(fd, resp.data(), resp.size(), MSG_NOSIGNAL);
        ::shutdown(fd, SHUT_RDWR);
        ::close(fd);
    }
}
