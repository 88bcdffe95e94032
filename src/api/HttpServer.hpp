#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "api/Router.hpp"

namespace cfe::api {

struct Endpoint {
    std::string address;
    std::uint16_t port;
};

// Blocking HTTP/1.1 server: a fixed pool of workers all accept() on one
// listening socket and serve one request per connection.
class HttpServer {
public:
    struct CorsConfig {
        bool enabled{false};
        std::string origin;
    };

    // Requests larger than this (headers plus body) are answered with 413.
    static constexpr std::size_t kMaxRequestBytes = 4U * 1024U * 1024U;

    HttpServer(Endpoint endpoint, std::size_t threadCount);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    void start();
    void stop();
    void wait();

    void setCorsConfig(CorsConfig config);

private:
    void workerLoop(std::size_t workerId);
    void handleClient(int clientFd);
    std::optional<Request> readRequest(int clientFd, bool& tooLarge) const;
    void writeResponse(int clientFd, const Response& response) const;

    Endpoint endpoint_;
    std::size_t threadCount_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    int serverFd_ = -1;
    Router router_{};
    CorsConfig corsConfig_{};
};

}  // namespace cfe::api
