#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

// Minimal GET-only HTTP/1.1 server for scheduler introspection. Routes must be
// registered before start().
class StatusHttpServer {
public:
    using Handler = std::function<std::string()>;

    void route(const std::string &path, std::string content_type, Handler handler);
    bool start(int port);
    void stop();
    bool running() const { return running_.load(); }

private:
    struct Route {
        std::string content_type;
        Handler handler;
    };

    void accept_loop();
    void worker_loop();
    std::string respond(const std::string &request) const;

    std::atomic<bool> running_{false};
    std::map<std::string, Route> routes_;
    int listen_fd_{-1};

    std::thread accept_thread_;
    std::vector<std::thread> workers_;

    std::mutex q_mu_;
    std::condition_variable q_cv_;
    std::queue<int> conn_q_;
};
